#pragma once

#include "tmbdd/codegen.hpp"
#include "tmbdd/tm.hpp"

#include <cstdint>
#include <deque>
#include <functional>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace tmbdd {

// Builds the program body against a builder. Called once per pass, so it
// must be deterministic.
using ProgramFactory = std::function<SubroutinePtr(MachineBuilder&)>;

struct MachineOptions {
  BranchMode branch_mode = BranchMode::kPatch;
  bool optimize_cfg = true;
  bool compress = true;  // applied by CompileProgram; Machine itself never compresses implicitly
  int speculative_pc_bits = 64;
};

// Result of running a machine
struct RunResult {
  bool halted;
  long long steps;
  bool hit_limit;
};

// A finished machine plus a simulator for it.
//
// Construction runs the factory twice: once with a speculative PC width to
// learn the size of the top-level subprogram, then again with the exact
// width. The tape is blank except for what the machine writes; the head
// starts on the scratch cell left of the PC.
class Machine {
public:
  Machine(const ProgramFactory& factory, const MachineOptions& options = {});

  Machine(Machine&&) = default;
  Machine& operator=(Machine&&) = default;

  // Merge equivalent states; resets the simulation. Returns the number of
  // rounds that did work.
  int Compress();

  std::vector<StateRef> Reachable() const;
  size_t state_count() const { return Reachable().size(); }

  // "NAME = w0 D0 NEXT0 w1 D1 NEXT1" per reachable state, sorted by name.
  void PrintMachine(std::ostream& os) const;

  // Subprogram tree, each subprogram once.
  void PrintSubs(std::ostream& os) const;

  // Step-by-step execution
  void Reset();
  bool Step();  // returns false once halted
  RunResult Run(long long max_steps);
  bool Halted() const { return state_ == kHalt; }
  long long Steps() const { return steps_; }

  uint64_t ProgramCounter() const;
  uint64_t RegisterValue(const std::string& name) const;
  int Cell(long long pos) const;
  long long head() const { return head_; }
  StateRef state() const { return state_; }

  // Current state name and the visited part of the tape, head in brackets.
  std::string TraceLine() const;

  int pc_bits() const { return builder_->config().pc_bits; }
  const MachineBuilder& builder() const { return *builder_; }
  const SubroutinePtr& top() const { return top_; }

private:
  std::unique_ptr<MachineBuilder> builder_;
  SubroutinePtr top_;
  StateRef entry_ = kHalt;

  StateRef state_ = kHalt;
  std::deque<uint8_t> tape_;
  long long origin_ = 0;  // tape_[pos + origin_] is cell pos
  long long head_ = -1;
  long long steps_ = 0;
  size_t trace_width_ = 0;
};

}  // namespace tmbdd
