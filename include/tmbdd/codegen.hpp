#pragma once

#include "tmbdd/memo.hpp"
#include "tmbdd/tm.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace tmbdd {

//=============================================================================
// Compiled units
//=============================================================================

struct Subroutine;
using SubroutinePtr = std::shared_ptr<const Subroutine>;

// Offset bit prefix (MSB first, relative to the parent) -> child.
using ChildMap = std::map<std::string, SubroutinePtr>;

// A compiled subprogram: an internal node of the program BDD.
//
// It occupies 2^order program counter values and may sit at any offset
// aligned to its size. The entry state is entered with the head on the first
// PC bit the subprogram owns (on the guard cell for order 0).
struct Subroutine {
  int id = 0;  // unique within one builder
  StateRef entry = kHalt;
  int order = 0;
  std::string name;
  ChildMap child_map;
  bool is_decrement = false;  // resumes at PC+1 on failure, PC+2 on success
};

struct Register {
  std::string name;
  int index = 0;
  SubroutinePtr inc;
  SubroutinePtr dec;
  SubroutinePtr init;
};

// Zero-width marker inside an operation sequence.
struct Label {
  std::string name;
};

// Branch to a Label of the same sequence; takes one slot.
struct Goto {
  std::string name;
};

using Part = std::variant<SubroutinePtr, Label, Goto>;

enum class BranchMode {
  kPatch,  // overwrite the fewest low PC bits that reach the target
  kAdder,  // add the relative offset to the subprogram's PC bits
};

struct BuilderConfig {
  int pc_bits = 0;
  BranchMode branch_mode = BranchMode::kPatch;
  bool optimize_cfg = true;
};

//=============================================================================
// Builder context
//=============================================================================

// Owns the state graph, the memo tables and the register / label counters
// for one build of one machine.
//
// Tape layout: a scratch cell at -1, the PC at [0, pc_bits) MSB first, a
// guard "0 0" at pc_bits and pc_bits + 1, then the registers. Register k is
// "1 1^n 0" (header, value, terminator).
class MachineBuilder {
public:
  explicit MachineBuilder(const BuilderConfig& config);

  const BuilderConfig& config() const { return config_; }
  StateGraph& graph() { return graph_; }
  const StateGraph& graph() const { return graph_; }

  // Dispatch. The root is left undefined until the machine driver clones
  // the top-level entry into it.
  StateRef DispatchRoot();
  StateRef DispatchOrder(int order, bool carry);
  StateRef NextState();
  StateRef NextState2();

  // Leaf subprograms.
  SubroutinePtr Noop(int order);
  SubroutinePtr Halt();
  SubroutinePtr Jump(const std::string& bits);
  SubroutinePtr JumpAdd(const std::string& delta_bits);

  // Register primitives (primitives.cpp).
  const Register& GetRegister(const std::string& name);
  const Register* FindRegister(const std::string& name) const;
  const std::vector<std::string>& register_names() const { return register_names_; }
  SubroutinePtr RegIncr(int index);
  SubroutinePtr RegDecr(int index);
  SubroutinePtr RegInit(int index);

  // Lay out a sequence of parts into one aligned subprogram. Memoized by
  // name and part shapes.
  SubroutinePtr MakeSub(const std::vector<Part>& parts, const std::string& name);

  // Zero `source`, adding its previous value into every target.
  SubroutinePtr Transfer(const Register& source, const std::vector<Register>& targets = {});

  // Register initialisation, the program, then halt.
  SubroutinePtr Top(const SubroutinePtr& program);

  // Memoize an arbitrary subprogram construction (procedure instances).
  template <typename Build>
  SubroutinePtr Memoize(const std::string& op, const std::string& args, Build&& build) {
    return subs_.Get(op, args, std::forward<Build>(build));
  }

  std::string Gensym();

private:
  enum class Core { kIncr, kDecr, kInit };

  struct RewindStates {
    StateRef run = kHalt;
    StateRef zero = kHalt;
  };

  SubroutinePtr NewSubroutine(StateRef entry, int order, const std::string& name,
                              ChildMap child_map = {}, bool is_decrement = false);

  SubroutinePtr Layout(std::vector<Part> parts, const std::string& name);
  SubroutinePtr Branch(uint64_t from, uint64_t to, int order);
  StateRef Dispatcher(const ChildMap& children, const std::string& name,
                      int order, const std::string& prefix);
  StateRef AdderStep(const std::string& delta_bits, int bit, bool carry);

  static const char* CoreName(Core core);
  SubroutinePtr RegisterLeaf(Core core, int index);
  StateRef SkipChain(int count, Core core);
  StateRef CoreEntry(Core core);
  StateRef IncrCore();
  StateRef DecrCore();
  StateRef InitCore();
  const RewindStates& Rewind(bool skip);

  BuilderConfig config_;
  StateGraph graph_;

  Memo<StateRef> states_;
  Memo<SubroutinePtr> subs_;
  Memo<Register> registers_;
  Memo<RewindStates> rewinds_;

  std::vector<std::string> register_names_;
  int next_sub_id_ = 0;
  int next_label_ = 0;
};

// Binary string of `num` in exactly `bits` digits, MSB first.
std::string MakeBits(uint64_t num, int bits);

}  // namespace tmbdd
