#include <gtest/gtest.h>
#include "tmbdd/codegen.hpp"
#include "tmbdd/errors.hpp"

namespace tmbdd {
namespace {

BuilderConfig Config(int pc_bits, BranchMode mode = BranchMode::kPatch, bool cfg = true) {
  BuilderConfig config;
  config.pc_bits = pc_bits;
  config.branch_mode = mode;
  config.optimize_cfg = cfg;
  return config;
}

// Follow the dispatch tree of `sub` along `bits` and return where it lands.
StateRef Walk(const StateGraph& graph, const SubroutinePtr& sub, const std::string& bits) {
  StateRef state = sub->entry;
  for (char c : bits) state = graph.Get(state, c == '1' ? 1 : 0).next;
  return state;
}

TEST(MemoTest, BuildsOnce) {
  Memo<int> memo;
  int calls = 0;
  auto build = [&] { return ++calls; };

  EXPECT_EQ(memo.Get("op", "a", build), 1);
  EXPECT_EQ(memo.Get("op", "a", build), 1);
  EXPECT_EQ(memo.Get("op", "b", build), 2);
  EXPECT_EQ(calls, 2);
  ASSERT_NE(memo.Find("op", "a"), nullptr);
  EXPECT_EQ(*memo.Find("op", "a"), 1);
  EXPECT_EQ(memo.Find("other", "a"), nullptr);
}

TEST(MemoTest, ReentryIsACycle) {
  Memo<int> memo;
  try {
    memo.Get("instantiate", "f(x)", [&] {
      return memo.Get("instantiate", "f(x)", [] { return 1; });
    });
    FAIL() << "expected CycleDetectedError";
  } catch (const CycleDetectedError& e) {
    EXPECT_EQ(e.op(), "instantiate");
    EXPECT_EQ(e.args(), "f(x)");
    EXPECT_NE(std::string(e.what()).find("f(x)"), std::string::npos);
  }

  // The failed build leaves nothing behind.
  EXPECT_EQ(memo.Find("instantiate", "f(x)"), nullptr);
  EXPECT_EQ(memo.Get("instantiate", "f(x)", [] { return 5; }), 5);
}

TEST(CodegenTest, MakeBits) {
  EXPECT_EQ(MakeBits(5, 4), "0101");
  EXPECT_EQ(MakeBits(1, 1), "1");
  EXPECT_EQ(MakeBits(0, 0), "");
  EXPECT_THROW(MakeBits(4, 2), Error);
}

TEST(CodegenTest, LeavesAreShared) {
  MachineBuilder b(Config(8));
  EXPECT_EQ(b.Noop(2), b.Noop(2));
  EXPECT_EQ(b.Noop(2)->order, 2);
  EXPECT_EQ(b.Halt()->entry, kHalt);
  EXPECT_EQ(b.Halt()->order, 0);
  EXPECT_EQ(b.NextState(), b.DispatchOrder(0, true));
}

TEST(CodegenTest, DispatchBeyondPcWidthThrows) {
  MachineBuilder b(Config(2));
  EXPECT_NO_THROW(b.DispatchOrder(2, false));
  EXPECT_THROW(b.DispatchOrder(3, false), SizeMismatchError);
  EXPECT_THROW(b.Noop(3), SizeMismatchError);
}

TEST(CodegenTest, CarryOutOfTopBitReentersDispatch) {
  MachineBuilder b(Config(2));
  StateRef entry = b.DispatchOrder(2, false);
  EXPECT_EQ(b.DispatchOrder(2, true), entry);
  EXPECT_EQ(b.graph().Get(b.DispatchOrder(1, true), 1).next, entry);
  EXPECT_EQ(StateName(b.graph(), entry), "!ENTRY");
}

TEST(CodegenTest, RegistersAreAllocatedInOrder) {
  MachineBuilder b(Config(8));
  Register x = b.GetRegister("x");
  Register y = b.GetRegister("y");

  EXPECT_EQ(x.index, 0);
  EXPECT_EQ(y.index, 1);
  EXPECT_EQ(b.GetRegister("x").index, 0);
  EXPECT_EQ(b.GetRegister("x").inc, x.inc);
  EXPECT_EQ(y.inc->name, "incr.1");
  EXPECT_EQ(y.dec->name, "decr.1");
  EXPECT_EQ(y.init->name, "init.1");
  EXPECT_TRUE(y.dec->is_decrement);
  EXPECT_FALSE(y.inc->is_decrement);
  EXPECT_EQ(y.inc->order, 0);

  EXPECT_EQ(b.register_names(), (std::vector<std::string>{"x", "y"}));
  ASSERT_NE(b.FindRegister("y"), nullptr);
  EXPECT_EQ(b.FindRegister("y")->index, 1);
  EXPECT_EQ(b.FindRegister("z"), nullptr);
}

TEST(CodegenTest, LayoutAlignsAndPadsToPowerOfTwo) {
  MachineBuilder b(Config(8));
  Register x = b.GetRegister("x");
  SubroutinePtr sub = b.MakeSub({x.inc, b.Noop(2)}, "aligned");

  // inc at 0, padding at 1 and 2-3, the order-2 noop at 4-7
  EXPECT_EQ(sub->order, 3);
  ASSERT_EQ(sub->child_map.size(), 4u);
  EXPECT_EQ(sub->child_map.at("000"), x.inc);
  EXPECT_EQ(sub->child_map.at("001"), b.Noop(0));
  EXPECT_EQ(sub->child_map.at("01"), b.Noop(1));
  EXPECT_EQ(sub->child_map.at("1"), b.Noop(2));
}

TEST(CodegenTest, LabelAtEndGetsASlot) {
  MachineBuilder b(Config(8));
  Register x = b.GetRegister("x");
  SubroutinePtr sub = b.MakeSub({x.inc, Label{"end"}}, "tail");

  EXPECT_EQ(sub->order, 1);
  EXPECT_EQ(sub->child_map.at("1"), b.Noop(0));
}

TEST(CodegenTest, MakeSubIsMemoized) {
  MachineBuilder b(Config(8));
  Register x = b.GetRegister("x");
  SubroutinePtr first = b.MakeSub({x.inc, x.inc}, "twice");
  EXPECT_EQ(b.MakeSub({x.inc, x.inc}, "twice"), first);
  EXPECT_NE(b.MakeSub({x.inc, x.inc}, "other"), first);
  EXPECT_NE(b.MakeSub({x.inc, x.dec}, "twice"), first);
}

TEST(CodegenTest, EmptyAndUnresolved) {
  MachineBuilder b(Config(8));
  Register x = b.GetRegister("x");
  EXPECT_THROW(b.MakeSub({}, "empty"), EmptySubprogramError);

  try {
    b.MakeSub({x.inc, Goto{"nowhere"}}, "broken");
    FAIL() << "expected UnresolvedLabelError";
  } catch (const UnresolvedLabelError& e) {
    EXPECT_EQ(e.label(), "nowhere");
  }
}

TEST(CodegenTest, PatchBranchWritesFewestBits) {
  MachineBuilder b(Config(8, BranchMode::kPatch, false));
  Register x = b.GetRegister("x");

  // Goto at 3 back to 0 differs in both low bits.
  SubroutinePtr loop = b.MakeSub({Label{"top"}, x.inc, x.inc, x.inc, Goto{"top"}}, "loop");
  EXPECT_EQ(loop->order, 2);
  EXPECT_EQ(loop->child_map.at("11")->name, "jump.00");

  // Goto at 2 to 3 only needs the last bit.
  SubroutinePtr skip = b.MakeSub({x.inc, x.inc, Goto{"end"}, Label{"end"}}, "skip");
  EXPECT_EQ(skip->child_map.at("10")->name, "jump.1");
}

TEST(CodegenTest, FarPatchBranchRewritesWholeOrder) {
  MachineBuilder b(Config(8, BranchMode::kPatch, false));
  Register x = b.GetRegister("x");

  std::vector<Part> parts = {Goto{"far"}, x.inc, x.inc, x.inc, x.inc, Goto{"near"}, x.inc,
                             Label{"near"}, Label{"far"}};
  parts.insert(parts.end(), 9, x.inc);
  SubroutinePtr sub = b.MakeSub(parts, "spread");
  ASSERT_EQ(sub->order, 4);

  // 0 -> 7 differs in three bits, so all four are written.
  EXPECT_EQ(sub->child_map.at("0000")->name, "jump.0111");
  // 5 -> 7 stays a two-bit patch.
  EXPECT_EQ(sub->child_map.at("0101")->name, "jump.11");
}

TEST(CodegenTest, AdderBranchAddsRelativeOffset) {
  MachineBuilder b(Config(8, BranchMode::kAdder, false));
  Register x = b.GetRegister("x");
  SubroutinePtr loop = b.MakeSub({Label{"top"}, x.inc, x.inc, x.inc, Goto{"top"}}, "loop");

  // (0 - 3) mod 4
  EXPECT_EQ(loop->child_map.at("11")->name, "add.01");
}

TEST(CodegenTest, DispatchTreeReachesEveryChild) {
  MachineBuilder b(Config(8));
  Register x = b.GetRegister("x");
  Register y = b.GetRegister("y");
  SubroutinePtr sub = b.MakeSub({x.inc, y.dec, Goto{"end"}, b.Noop(1), y.inc, Label{"end"}},
                                "tree");

  // Every PC value below the subprogram is claimed by exactly one child.
  for (uint64_t pc = 0; pc < (uint64_t{1} << sub->order); ++pc) {
    std::string bits = MakeBits(pc, sub->order);
    int owners = 0;
    for (size_t len = 0; len <= bits.size(); ++len) {
      auto it = sub->child_map.find(bits.substr(0, len));
      if (it == sub->child_map.end()) continue;
      ++owners;
      EXPECT_EQ(Walk(b.graph(), sub, it->first), it->second->entry) << bits;
    }
    EXPECT_EQ(owners, 1) << bits;
  }
}

TEST(CodegenTest, IdenticalSubtreesShareDispatchStates) {
  MachineBuilder b(Config(8));
  Register x = b.GetRegister("x");
  SubroutinePtr sub = b.MakeSub({x.inc, x.dec, x.inc, x.dec}, "repeat");

  // "0x" and "1x" hold the same children, so both branches of the root meet.
  StateRef root = sub->entry;
  EXPECT_EQ(b.graph().Get(root, 0).next, b.graph().Get(root, 1).next);
}

TEST(CodegenTest, TransferNamesAndMemo) {
  MachineBuilder b(Config(8));
  Register x = b.GetRegister("x");
  Register y = b.GetRegister("y");
  Register z = b.GetRegister("z");

  SubroutinePtr t = b.Transfer(x, {y, z});
  EXPECT_EQ(t->name, "transfer(x,y,z)");
  EXPECT_EQ(b.Transfer(x, {y, z}), t);
  EXPECT_EQ(b.Transfer(x)->name, "transfer(x)");
  EXPECT_THROW(b.Transfer(x, {y, x}), SemanticError);
}

TEST(CodegenTest, MemoizeDetectsRecursion) {
  MachineBuilder b(Config(8));
  EXPECT_THROW(b.Memoize("instantiate", "f()", [&] {
    return b.Memoize("instantiate", "f()", [&] { return b.Halt(); });
  }), CycleDetectedError);
}

TEST(CodegenTest, TopWrapsInitProgramAndHalt) {
  MachineBuilder b(Config(8));
  Register x = b.GetRegister("x");
  SubroutinePtr top = b.Top(b.MakeSub({x.inc}, "main"));

  EXPECT_EQ(top->name, "top");
  ASSERT_EQ(top->child_map.size(), 3u);
  EXPECT_EQ(top->child_map.at("00")->name, "init");
  EXPECT_EQ(top->child_map.at("01")->name, "main");
  EXPECT_EQ(top->child_map.at("10"), b.Halt());
  EXPECT_EQ(top->child_map.at("11"), b.Noop(0));
}

TEST(CodegenTest, GensymIsUnique) {
  MachineBuilder b(Config(8));
  std::string first = b.Gensym();
  EXPECT_NE(first, b.Gensym());
}

}  // namespace
}  // namespace tmbdd
