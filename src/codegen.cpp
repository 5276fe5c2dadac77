#include "tmbdd/codegen.hpp"
#include "tmbdd/errors.hpp"
#include "tmbdd/optimizer.hpp"

#include <algorithm>

namespace tmbdd {

namespace {

// Branches whose offsets differ only in this many low bits keep a minimal patch.
constexpr int kShortBranchBits = 2;

uint64_t Mask(int bits) {
  return bits >= 64 ? ~uint64_t{0} : (uint64_t{1} << bits) - 1;
}

int LowestSetBit(uint64_t value) {
  int bit = 0;
  while (!(value & 1)) {
    value >>= 1;
    ++bit;
  }
  return bit;
}

uint64_t PartSize(const Part& part) {
  if (std::holds_alternative<Goto>(part)) return 1;
  return uint64_t{1} << std::get<SubroutinePtr>(part)->order;
}

// Identity of a part for the makesub memo key.
std::string ShapeKey(const Part& part) {
  if (auto* label = std::get_if<Label>(&part)) return "L:" + label->name;
  if (auto* jump = std::get_if<Goto>(&part)) return "G:" + jump->name;
  return "S:" + std::to_string(std::get<SubroutinePtr>(part)->id);
}

}  // namespace

std::string MakeBits(uint64_t num, int bits) {
  if (bits < 64 && (num >> bits) != 0) {
    throw Error(std::to_string(num) + " does not fit in " + std::to_string(bits) + " bits");
  }
  std::string out(bits, '0');
  for (int i = 0; i < bits; ++i) {
    if ((num >> i) & 1) out[bits - 1 - i] = '1';
  }
  return out;
}

MachineBuilder::MachineBuilder(const BuilderConfig& config) : config_(config) {}

SubroutinePtr MachineBuilder::NewSubroutine(StateRef entry, int order, const std::string& name,
                                            ChildMap child_map, bool is_decrement) {
  auto sub = std::make_shared<Subroutine>();
  sub->id = next_sub_id_++;
  sub->entry = entry;
  sub->order = order;
  sub->name = name;
  sub->child_map = std::move(child_map);
  sub->is_decrement = is_decrement;
  return sub;
}

std::string MachineBuilder::Gensym() {
  return "L" + std::to_string(++next_label_);
}

//=============================================================================
// Dispatch and carry chain
//=============================================================================

StateRef MachineBuilder::DispatchRoot() {
  return states_.Get("dispatchroot", "", [&] { return graph_.NewState(); });
}

// Entered with the head `order` cells left of the PC's last bit. With carry
// set, the bit under the head is incremented and the carry propagated; the
// chain ends one cell left of the MSB and steps back onto it into dispatch.
StateRef MachineBuilder::DispatchOrder(int order, bool carry) {
  // Carry out of the PC's top bit is dropped.
  if (carry && order == config_.pc_bits) return DispatchOrder(order, false);
  std::string args = std::to_string(order) + (carry ? ",1" : ",0");
  return states_.Get("dispatch_order", args, [&] {
    if (order == config_.pc_bits) {
      return graph_.Make(StateSpec("!ENTRY").Moves(Move::R).Next(DispatchRoot()));
    }
    if (order > config_.pc_bits) {
      throw SizeMismatchError("Subprogram of order " + std::to_string(order) +
                              " exceeds pc_bits=" + std::to_string(config_.pc_bits));
    }
    std::string name = "dispatch." + std::to_string(order);
    if (carry) {
      return graph_.Make(StateSpec(name + ".carry")
                             .Moves(Move::L)
                             .Write0(1).Next0(DispatchOrder(order + 1, false))
                             .Write1(0).Next1(DispatchOrder(order + 1, true)));
    }
    return graph_.Make(StateSpec(name).Moves(Move::L).Next(DispatchOrder(order + 1, false)));
  });
}

// PC += 1, entered on the PC's last bit.
StateRef MachineBuilder::NextState() {
  return DispatchOrder(0, true);
}

// PC += 2, entered on the PC's last bit.
StateRef MachineBuilder::NextState2() {
  return states_.Get("nextstate2", "", [&] {
    return graph_.Make(StateSpec("nextstate2").Moves(Move::L).Next(DispatchOrder(1, true)));
  });
}

//=============================================================================
// Leaf subprograms
//=============================================================================

SubroutinePtr MachineBuilder::Noop(int order) {
  return subs_.Get("noop", std::to_string(order), [&] {
    std::string name = "noop." + std::to_string(order);
    StateRef reverse = graph_.Make(StateSpec(name).Moves(Move::L).Next(DispatchOrder(order, true)));
    return NewSubroutine(reverse, order, name);
  });
}

SubroutinePtr MachineBuilder::Halt() {
  return subs_.Get("halt", "", [&] { return NewSubroutine(kHalt, 0, "halt"); });
}

// Overwrites the low bits of the PC with `bits` and dispatches again.
SubroutinePtr MachineBuilder::Jump(const std::string& bits) {
  return subs_.Get("jump", bits, [&] {
    int width = static_cast<int>(bits.size());
    StateRef step = DispatchOrder(width, false);
    for (int i = width - 1; i >= 0; --i) {
      step = graph_.Make(StateSpec("jump." + bits + "." + std::to_string(i + 1))
                             .Moves(Move::L)
                             .Write(bits[width - 1 - i] == '1' ? 1 : 0)
                             .Next(step));
    }
    StateRef entry = graph_.Make(StateSpec("jump." + bits + ".0").Moves(Move::L).Next(step));
    return NewSubroutine(entry, 0, "jump." + bits);
  });
}

// Adds `delta_bits` to the low PC bits, dropping the carry out of the top.
SubroutinePtr MachineBuilder::JumpAdd(const std::string& delta_bits) {
  return subs_.Get("jump_add", delta_bits, [&] {
    StateRef entry = graph_.Make(StateSpec("add." + delta_bits)
                                     .Moves(Move::L)
                                     .Next(AdderStep(delta_bits, 0, false)));
    return NewSubroutine(entry, 0, "add." + delta_bits);
  });
}

StateRef MachineBuilder::AdderStep(const std::string& delta_bits, int bit, bool carry) {
  std::string args = delta_bits + "," + std::to_string(bit) + (carry ? ",1" : ",0");
  return states_.Get("adder_step", args, [&] {
    int width = static_cast<int>(delta_bits.size());
    if (bit == width) return DispatchOrder(width, false);
    int addend = (delta_bits[width - 1 - bit] == '1' ? 1 : 0) + (carry ? 1 : 0);
    int sum0 = addend;
    int sum1 = addend + 1;
    return graph_.Make(StateSpec("add." + delta_bits + "." + std::to_string(bit) + (carry ? "c" : ""))
                           .Moves(Move::L)
                           .Write0(sum0 & 1).Next0(AdderStep(delta_bits, bit + 1, sum0 > 1))
                           .Write1(sum1 & 1).Next1(AdderStep(delta_bits, bit + 1, sum1 > 1)));
  });
}

//=============================================================================
// Subprogram layout
//=============================================================================

SubroutinePtr MachineBuilder::MakeSub(const std::vector<Part>& parts, const std::string& name) {
  std::string key = name;
  for (const auto& part : parts) {
    key += ' ';
    key += ShapeKey(part);
  }
  return subs_.Get("makesub", key, [&] { return Layout(parts, name); });
}

SubroutinePtr MachineBuilder::Layout(std::vector<Part> parts, const std::string& name) {
  if (parts.empty()) {
    throw EmptySubprogramError("Empty subprogram: " + name);
  }
  if (config_.optimize_cfg) {
    parts = ThreadGotos(parts);
  }

  // Assign offsets; every part starts aligned to its own size.
  std::map<std::string, uint64_t> label_offsets;
  std::vector<Part> placed;
  uint64_t offset = 0;

  auto pad = [&](uint64_t size) {
    while (offset % size) {
      int noop_order = LowestSetBit(offset);
      placed.push_back(Noop(noop_order));
      offset += uint64_t{1} << noop_order;
    }
  };

  for (const auto& part : parts) {
    if (auto* label = std::get_if<Label>(&part)) {
      label_offsets[label->name] = offset;
      continue;
    }
    uint64_t size = PartSize(part);
    pad(size);
    placed.push_back(part);
    offset += size;
  }

  // A label past the last part still needs a slot of its own to land on.
  bool label_at_end = std::any_of(label_offsets.begin(), label_offsets.end(),
                                  [&](const auto& entry) { return entry.second == offset; });
  if (label_at_end || offset == 0) {
    placed.push_back(Noop(0));
    offset += 1;
  }

  int order = 0;
  while (offset > (uint64_t{1} << order)) ++order;
  while (offset < (uint64_t{1} << order)) {
    int noop_order = LowestSetBit(offset);
    placed.push_back(Noop(noop_order));
    offset += uint64_t{1} << noop_order;
  }

  // Resolve branches and build the offset -> child map.
  ChildMap child_map;
  offset = 0;
  for (const auto& part : placed) {
    SubroutinePtr child;
    if (auto* jump = std::get_if<Goto>(&part)) {
      auto it = label_offsets.find(jump->name);
      if (it == label_offsets.end()) {
        throw UnresolvedLabelError(jump->name, name);
      }
      child = Branch(offset, it->second, order);
    } else {
      child = std::get<SubroutinePtr>(part);
    }
    child_map[MakeBits(offset >> child->order, order - child->order)] = child;
    offset += uint64_t{1} << child->order;
  }

  StateRef entry = Dispatcher(child_map, name, order, "");
  return NewSubroutine(entry, order, name, std::move(child_map));
}

SubroutinePtr MachineBuilder::Branch(uint64_t from, uint64_t to, int order) {
  if (config_.branch_mode == BranchMode::kAdder) {
    return JumpAdd(MakeBits((to - from) & Mask(order), order));
  }
  // Short branches patch only the bits below the common prefix of the two
  // offsets. Longer ones patch all `order` bits, so every far branch to the
  // same slot of same-shaped subprograms is one shared subroutine.
  int width = 0;
  while (width < 64 && (from >> width) != (to >> width)) ++width;
  if (width > kShortBranchBits) width = order;
  return Jump(MakeBits(to & Mask(width), width));
}

// Decision tree over the PC bits below `prefix`. Identical sub-maps share
// nodes, which is what keeps the state count proportional to the number of
// distinct subprogram shapes.
StateRef MachineBuilder::Dispatcher(const ChildMap& children, const std::string& name,
                                    int order, const std::string& prefix) {
  auto hit = children.find(prefix);
  if (hit != children.end()) return hit->second->entry;
  if (static_cast<int>(prefix.size()) >= order) {
    throw Error("Dispatch map of " + name + " does not cover prefix " + prefix);
  }

  std::string key = name;
  for (auto it = children.lower_bound(prefix);
       it != children.end() && it->first.compare(0, prefix.size(), prefix) == 0; ++it) {
    key += ' ' + it->first.substr(prefix.size()) + '=' + std::to_string(it->second->id);
  }

  return states_.Get("dispatcher", key, [&] {
    StateRef zero = Dispatcher(children, name, order, prefix + '0');
    StateRef one = Dispatcher(children, name, order, prefix + '1');
    return graph_.Make(StateSpec(name + "[" + prefix + "]").Moves(Move::R).Next0(zero).Next1(one));
  });
}

//=============================================================================
// Composite subprograms
//=============================================================================

SubroutinePtr MachineBuilder::Transfer(const Register& source, const std::vector<Register>& targets) {
  std::string args = source.name;
  for (const auto& target : targets) args += "," + target.name;

  return subs_.Get("transfer", args, [&] {
    std::vector<Part> parts = {Label{"again"}, source.dec, Goto{"zero"}};
    for (const auto& target : targets) {
      if (target.index == source.index) {
        throw SemanticError("transfer(" + args + ") adds a register into itself");
      }
      parts.push_back(target.inc);
    }
    parts.push_back(Goto{"again"});
    parts.push_back(Label{"zero"});
    return MakeSub(parts, "transfer(" + args + ")");
  });
}

SubroutinePtr MachineBuilder::Top(const SubroutinePtr& program) {
  std::vector<Part> parts;
  if (!register_names_.empty()) {
    std::vector<Part> inits;
    for (size_t i = 0; i < register_names_.size(); ++i) {
      inits.push_back(RegInit(static_cast<int>(i)));
    }
    parts.push_back(MakeSub(inits, "init"));
  }
  parts.push_back(program);
  parts.push_back(Halt());
  return MakeSub(parts, "top");
}

}  // namespace tmbdd
