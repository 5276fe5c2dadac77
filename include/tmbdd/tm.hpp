#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tmbdd {

//=============================================================================
// Two-symbol Turing machine states
//=============================================================================

enum class Move { L, R };

// States live in an arena and are addressed by index, so a state can be
// handed out before it is defined (cyclic graphs, forward references).
using StateRef = int;
constexpr StateRef kHalt = -1;

struct Transition {
  int write = 0;
  Move move = Move::R;
  StateRef next = kHalt;

  bool operator==(const Transition& other) const {
    return write == other.write && move == other.move && next == other.next;
  }
};

// Arguments for StateGraph::Define. The scalar fields apply to both symbols
// unless the per-symbol field is set. An unset write leaves the symbol as
// it was read.
struct StateSpec {
  explicit StateSpec(std::string n) : name(std::move(n)) {}

  StateSpec& Moves(Move m) { move = m; return *this; }
  StateSpec& Next(StateRef s) { next = s; return *this; }
  StateSpec& Write(int w) { write = w; return *this; }
  StateSpec& On0(Move m, StateRef s) { move0 = m; next0 = s; return *this; }
  StateSpec& On1(Move m, StateRef s) { move1 = m; next1 = s; return *this; }
  StateSpec& Next0(StateRef s) { next0 = s; return *this; }
  StateSpec& Next1(StateRef s) { next1 = s; return *this; }
  StateSpec& Write0(int w) { write0 = w; return *this; }
  StateSpec& Write1(int w) { write1 = w; return *this; }

  std::string name;
  std::optional<Move> move, move0, move1;
  std::optional<StateRef> next, next0, next1;
  std::optional<int> write, write0, write1;
};

class StateGraph {
public:
  // Allocate an undefined state.
  StateRef NewState();

  // Allocate and define in one go.
  StateRef Make(const StateSpec& spec);

  // Finalize a state. Throws RedefinitionError if already defined and
  // InvalidTransitionError on a malformed spec.
  void Define(StateRef state, const StateSpec& spec);

  // Copy the transition function of an already-defined state onto `state`.
  void Clone(StateRef state, StateRef other);

  // Rewire one branch of a defined state; used by minimization only.
  void Retarget(StateRef state, int symbol, StateRef next);

  bool IsDefined(StateRef state) const;
  const Transition& Get(StateRef state, int symbol) const;
  const std::string& Name(StateRef state) const;

  size_t size() const { return nodes_.size(); }

private:
  struct Node {
    std::string name;
    Transition on[2];
  };

  void Check(StateRef state) const;

  std::vector<Node> nodes_;
  std::vector<bool> defined_;
};

// Printable name of a state, "HALT" for kHalt.
std::string StateName(const StateGraph& graph, StateRef state);

char MoveChar(Move m);

}  // namespace tmbdd
