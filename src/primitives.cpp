#include "tmbdd/codegen.hpp"
#include "tmbdd/errors.hpp"

namespace tmbdd {

// Register primitives.
//
// A leaf primitive is entered on the first guard cell. It walks right past
// index + 1 zero cells (the second guard cell and the terminators of the
// registers before it), runs a core on the header of its register, and
// rewinds to the PC's last bit. The rewind is index-free: inside the register
// region "0 0" only occurs at the guard and past the last register.

const char* MachineBuilder::CoreName(Core core) {
  switch (core) {
    case Core::kIncr: return "incr";
    case Core::kDecr: return "decr";
    case Core::kInit: return "init";
  }
  return "?";
}

const Register& MachineBuilder::GetRegister(const std::string& name) {
  return registers_.Get("register", name, [&] {
    Register reg;
    reg.name = name;
    reg.index = static_cast<int>(register_names_.size());
    register_names_.push_back(name);
    reg.inc = RegIncr(reg.index);
    reg.dec = RegDecr(reg.index);
    reg.init = RegInit(reg.index);
    return reg;
  });
}

const Register* MachineBuilder::FindRegister(const std::string& name) const {
  return registers_.Find("register", name);
}

SubroutinePtr MachineBuilder::RegIncr(int index) {
  return RegisterLeaf(Core::kIncr, index);
}

SubroutinePtr MachineBuilder::RegDecr(int index) {
  return RegisterLeaf(Core::kDecr, index);
}

SubroutinePtr MachineBuilder::RegInit(int index) {
  return RegisterLeaf(Core::kInit, index);
}

SubroutinePtr MachineBuilder::RegisterLeaf(Core core, int index) {
  std::string op = CoreName(core);
  return subs_.Get(op, std::to_string(index), [&] {
    std::string name = op + "." + std::to_string(index);
    StateRef entry = graph_.Make(StateSpec(name).Moves(Move::R).Next(SkipChain(index + 1, core)));
    return NewSubroutine(entry, 0, name, {}, core == Core::kDecr);
  });
}

// Moves right until `count` zero cells have been passed, then runs the core.
StateRef MachineBuilder::SkipChain(int count, Core core) {
  std::string op = CoreName(core);
  return states_.Get("skip", op + "," + std::to_string(count), [&] {
    if (count == 0) return CoreEntry(core);
    StateRef self = graph_.NewState();
    StateRef next = SkipChain(count - 1, core);
    graph_.Define(self, StateSpec(op + ".skip" + std::to_string(count))
                            .On0(Move::R, next)
                            .On1(Move::R, self));
    return self;
  });
}

StateRef MachineBuilder::CoreEntry(Core core) {
  return states_.Get("core", CoreName(core), [&] {
    switch (core) {
      case Core::kIncr: return IncrCore();
      case Core::kDecr: return DecrCore();
      case Core::kInit: return InitCore();
    }
    throw Error("Unknown register core");
  });
}

// Walk to the terminator, turn it into a 1, then shift the rest of the
// register region right by one carrying the displaced symbol. A carried 0
// landing on a 0 is the new end of the region.
StateRef MachineBuilder::IncrCore() {
  StateRef run = graph_.NewState();
  StateRef shift0 = graph_.NewState();
  StateRef shift1 = graph_.NewState();
  StateRef rewind = Rewind(false).run;

  graph_.Define(run, StateSpec("incr.run")
                         .On0(Move::R, shift0).Write0(1)
                         .On1(Move::R, run));
  graph_.Define(shift0, StateSpec("incr.shift0")
                            .On0(Move::L, rewind)
                            .On1(Move::R, shift1).Write1(0));
  graph_.Define(shift1, StateSpec("incr.shift1")
                            .On0(Move::R, shift0).Write0(1)
                            .On1(Move::R, shift1));
  return run;
}

// If the value is zero, rewind to PC+1. Otherwise clear the header (leaving
// the unique inner "0 0" marker), seek the end of the region and shift it
// left by one until the marker is consumed, then rewind to PC+2.
StateRef MachineBuilder::DecrCore() {
  StateRef test = graph_.NewState();
  StateRef mark = graph_.NewState();
  StateRef seek_run = graph_.NewState();
  StateRef seek_zero = graph_.NewState();
  StateRef shift0 = graph_.NewState();
  StateRef shift1 = graph_.NewState();
  StateRef check = graph_.NewState();
  StateRef fail = Rewind(false).run;
  StateRef done = Rewind(true).zero;

  StateRef entry = graph_.Make(StateSpec("decr.header").Moves(Move::R).Next(test));
  graph_.Define(test, StateSpec("decr.test").On0(Move::L, fail).On1(Move::L, mark));
  graph_.Define(mark, StateSpec("decr.mark").Write(0).Moves(Move::R).Next(seek_run));
  graph_.Define(seek_run, StateSpec("decr.seek.run")
                              .On0(Move::R, seek_zero)
                              .On1(Move::R, seek_run));
  graph_.Define(seek_zero, StateSpec("decr.seek.zero")
                               .On0(Move::L, shift0)
                               .On1(Move::R, seek_run));
  graph_.Define(shift0, StateSpec("decr.shift0")
                            .Write(0)
                            .On0(Move::L, check)
                            .On1(Move::L, shift1));
  graph_.Define(shift1, StateSpec("decr.shift1")
                            .Write(1)
                            .On0(Move::L, check)
                            .On1(Move::L, shift1));
  // A 0 left of a 0 can only be the marker's neighbour.
  graph_.Define(check, StateSpec("decr.shift0.check")
                           .Write(0)
                           .On0(Move::L, done)
                           .On1(Move::L, shift1));
  return entry;
}

// Registers below this one are initialised and the rest of the tape is
// blank, so the header is the first cell past the skip chain.
StateRef MachineBuilder::InitCore() {
  return graph_.Make(StateSpec("init.set").Write(1).Moves(Move::L).Next(Rewind(false).run));
}

const MachineBuilder::RewindStates& MachineBuilder::Rewind(bool skip) {
  return rewinds_.Get("rewind", skip ? "2" : "1", [&] {
    std::string name = skip ? "rewind2" : "rewind";
    RewindStates states;
    states.run = graph_.NewState();
    states.zero = graph_.NewState();
    StateRef target = skip ? NextState2() : NextState();
    graph_.Define(states.run, StateSpec(name + ".run")
                                  .On0(Move::L, states.zero)
                                  .On1(Move::L, states.run));
    graph_.Define(states.zero, StateSpec(name + ".zero")
                                   .On0(Move::L, target)
                                   .On1(Move::L, states.run));
    return states;
  });
}

}  // namespace tmbdd
