#include "tmbdd/tm.hpp"
#include "tmbdd/errors.hpp"

namespace tmbdd {

StateRef StateGraph::NewState() {
  nodes_.emplace_back();
  defined_.push_back(false);
  return static_cast<StateRef>(nodes_.size() - 1);
}

StateRef StateGraph::Make(const StateSpec& spec) {
  StateRef state = NewState();
  Define(state, spec);
  return state;
}

void StateGraph::Define(StateRef state, const StateSpec& spec) {
  if (state < 0 || state >= static_cast<StateRef>(nodes_.size())) {
    throw InvalidTransitionError("Cannot define unknown state #" + std::to_string(state));
  }
  if (defined_[state]) {
    throw RedefinitionError("State defined twice: " + nodes_[state].name +
                            " (redefined as " + spec.name + ")");
  }

  Node node;
  node.name = spec.name;
  for (int sym = 0; sym < 2; ++sym) {
    const auto& move = sym ? spec.move1 : spec.move0;
    const auto& next = sym ? spec.next1 : spec.next0;
    const auto& write = sym ? spec.write1 : spec.write0;

    std::optional<Move> m = move ? move : spec.move;
    std::optional<StateRef> n = next ? next : spec.next;
    int w = write ? *write : (spec.write ? *spec.write : sym);

    std::string where = spec.name + " on " + std::to_string(sym);
    if (!m || (*m != Move::L && *m != Move::R)) {
      throw InvalidTransitionError("Missing or invalid move in " + where);
    }
    if (w != 0 && w != 1) {
      throw InvalidTransitionError("Invalid write symbol " + std::to_string(w) + " in " + where);
    }
    if (!n || (*n != kHalt && (*n < 0 || *n >= static_cast<StateRef>(nodes_.size())))) {
      throw InvalidTransitionError("Missing or invalid next state in " + where);
    }
    node.on[sym] = {w, *m, *n};
  }

  nodes_[state] = std::move(node);
  defined_[state] = true;
}

void StateGraph::Clone(StateRef state, StateRef other) {
  if (other == kHalt || !IsDefined(other)) {
    throw InvalidTransitionError("Cannot clone from an undefined state");
  }
  const Node& src = nodes_[other];
  StateSpec spec(src.name);
  spec.On0(src.on[0].move, src.on[0].next).Write0(src.on[0].write);
  spec.On1(src.on[1].move, src.on[1].next).Write1(src.on[1].write);
  Define(state, spec);
}

void StateGraph::Retarget(StateRef state, int symbol, StateRef next) {
  Check(state);
  nodes_[state].on[symbol ? 1 : 0].next = next;
}

bool StateGraph::IsDefined(StateRef state) const {
  return state >= 0 && state < static_cast<StateRef>(nodes_.size()) && defined_[state];
}

const Transition& StateGraph::Get(StateRef state, int symbol) const {
  Check(state);
  return nodes_[state].on[symbol ? 1 : 0];
}

const std::string& StateGraph::Name(StateRef state) const {
  Check(state);
  return nodes_[state].name;
}

void StateGraph::Check(StateRef state) const {
  if (state == kHalt) {
    throw InvalidTransitionError("HALT has no transitions");
  }
  if (!IsDefined(state)) {
    throw InvalidTransitionError("Read of undefined state #" + std::to_string(state));
  }
}

std::string StateName(const StateGraph& graph, StateRef state) {
  if (state == kHalt) return "HALT";
  return graph.Name(state);
}

char MoveChar(Move m) {
  return m == Move::L ? 'L' : 'R';
}

}  // namespace tmbdd
