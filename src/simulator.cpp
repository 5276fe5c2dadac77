#include "tmbdd/simulator.hpp"
#include "tmbdd/errors.hpp"
#include "tmbdd/optimizer.hpp"

#include <algorithm>
#include <ostream>
#include <set>
#include <sstream>

namespace tmbdd {

Machine::Machine(const ProgramFactory& factory, const MachineOptions& options) {
  BuilderConfig config;
  config.branch_mode = options.branch_mode;
  config.optimize_cfg = options.optimize_cfg;

  // Pass 1: only the order of the top-level subprogram is kept.
  config.pc_bits = options.speculative_pc_bits;
  int order = 0;
  {
    MachineBuilder probe(config);
    order = probe.Top(factory(probe))->order;
  }

  // Pass 2: the real build.
  config.pc_bits = order;
  builder_ = std::make_unique<MachineBuilder>(config);
  top_ = builder_->Top(factory(*builder_));
  if (top_->order != order) {
    throw SizeMismatchError("pc_bits does not match calculated top order: " +
                            std::to_string(top_->order) + " vs " + std::to_string(order));
  }

  builder_->graph().Clone(builder_->DispatchRoot(), top_->entry);
  entry_ = builder_->DispatchOrder(order, false);
  Reset();
}

int Machine::Compress() {
  int rounds = tmbdd::Compress(builder_->graph(), entry_);
  Reset();
  return rounds;
}

std::vector<StateRef> Machine::Reachable() const {
  return tmbdd::Reachable(builder_->graph(), entry_);
}

void Machine::PrintMachine(std::ostream& os) const {
  const StateGraph& graph = builder_->graph();
  std::vector<StateRef> states = Reachable();
  std::stable_sort(states.begin(), states.end(), [&](StateRef a, StateRef b) {
    return graph.Name(a) < graph.Name(b);
  });

  for (StateRef state : states) {
    os << graph.Name(state) << " =";
    for (int sym = 0; sym < 2; ++sym) {
      const Transition& t = graph.Get(state, sym);
      os << ' ' << t.write << ' ' << MoveChar(t.move) << ' ' << StateName(graph, t.next);
    }
    os << "\n";
  }
}

void Machine::PrintSubs(std::ostream& os) const {
  std::vector<SubroutinePtr> stack = {top_};
  std::set<int> seen;
  while (!stack.empty()) {
    SubroutinePtr sub = stack.back();
    stack.pop_back();
    if (!seen.insert(sub->id).second) continue;

    os << "\nNAME: " << sub->name << " ORDER: " << sub->order << "\n";
    for (const auto& [offset, child] : sub->child_map) {
      std::string padded = offset;
      padded.resize(std::max<size_t>(padded.size(), sub->order), ' ');
      os << "    " << padded << " -> " << child->name << "\n";
      stack.push_back(child);
    }
  }
}

void Machine::Reset() {
  tape_.assign(1, 0);
  origin_ = 1;
  head_ = -1;
  state_ = entry_;
  steps_ = 0;

  trace_width_ = 0;
  for (StateRef state : Reachable()) {
    trace_width_ = std::max(trace_width_, builder_->graph().Name(state).size());
  }
}

bool Machine::Step() {
  if (Halted()) return false;

  long long index = head_ + origin_;
  const Transition& t = builder_->graph().Get(state_, tape_[index]);
  tape_[index] = static_cast<uint8_t>(t.write);

  if (t.move == Move::L) {
    --head_;
    if (head_ + origin_ < 0) {
      tape_.push_front(0);
      ++origin_;
    }
  } else {
    ++head_;
    if (head_ + origin_ >= static_cast<long long>(tape_.size())) {
      tape_.push_back(0);
    }
  }

  state_ = t.next;
  ++steps_;
  return !Halted();
}

RunResult Machine::Run(long long max_steps) {
  while (!Halted() && steps_ < max_steps) {
    Step();
  }

  RunResult result;
  result.halted = Halted();
  result.steps = steps_;
  result.hit_limit = !result.halted;
  return result;
}

int Machine::Cell(long long pos) const {
  long long index = pos + origin_;
  if (index < 0 || index >= static_cast<long long>(tape_.size())) return 0;
  return tape_[index];
}

uint64_t Machine::ProgramCounter() const {
  uint64_t pc = 0;
  for (int i = 0; i < pc_bits(); ++i) {
    pc = (pc << 1) | static_cast<uint64_t>(Cell(i));
  }
  return pc;
}

uint64_t Machine::RegisterValue(const std::string& name) const {
  const Register* reg = builder_->FindRegister(name);
  if (!reg) {
    throw UndefinedSymbolError("register", name, 0);
  }

  long long end = static_cast<long long>(tape_.size()) - origin_;
  long long pos = pc_bits() + 2;
  for (int k = 0;; ++k) {
    if (Cell(pos) != 1) {
      // Registers from k on have not been initialised yet.
      for (long long p = pos; p < end; ++p) {
        if (Cell(p) != 0) {
          throw SemanticError("Malformed register region at cell " + std::to_string(pos) +
                              " reading " + name);
        }
      }
      return 0;
    }
    ++pos;
    uint64_t value = 0;
    while (Cell(pos) == 1) {
      ++value;
      ++pos;
    }
    ++pos;  // terminator
    if (k == reg->index) return value;
  }
}

std::string Machine::TraceLine() const {
  std::ostringstream os;
  std::string name = StateName(builder_->graph(), state_);
  name.resize(std::max(trace_width_, name.size()), ' ');
  os << name << ' ';

  long long first = -origin_;
  long long last = static_cast<long long>(tape_.size()) - origin_;
  for (long long pos = first; pos < last; ++pos) {
    if (pos == head_) {
      os << '[' << Cell(pos) << ']';
    } else {
      os << ' ' << Cell(pos);
    }
  }
  return os.str();
}

}  // namespace tmbdd
