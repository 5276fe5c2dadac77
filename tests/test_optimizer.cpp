#include <gtest/gtest.h>
#include "tmbdd/codegen.hpp"
#include "tmbdd/optimizer.hpp"

namespace tmbdd {
namespace {

std::vector<std::string> Render(const std::vector<Part>& parts) {
  std::vector<std::string> out;
  for (const auto& part : parts) {
    if (auto* label = std::get_if<Label>(&part)) {
      out.push_back("L:" + label->name);
    } else if (auto* jump = std::get_if<Goto>(&part)) {
      out.push_back("G:" + jump->name);
    } else {
      out.push_back(std::get<SubroutinePtr>(part)->name);
    }
  }
  return out;
}

class ThreadGotosTest : public ::testing::Test {
protected:
  ThreadGotosTest() : b_(MakeConfig()) {
    x_ = b_.GetRegister("x");
  }

  static BuilderConfig MakeConfig() {
    BuilderConfig config;
    config.pc_bits = 8;
    return config;
  }

  MachineBuilder b_;
  Register x_;
};

TEST_F(ThreadGotosTest, ThreadsChains) {
  auto out = ThreadGotos({Goto{"a"}, x_.inc, Label{"a"}, Goto{"b"}, x_.dec, Label{"b"}, x_.init});
  EXPECT_EQ(Render(out), (std::vector<std::string>{
      "G:b", "incr.0", "L:a", "G:b", "decr.0", "L:b", "init.0"}));
}

TEST_F(ThreadGotosTest, DropsFallThrough) {
  auto out = ThreadGotos({x_.inc, Goto{"end"}, Label{"end"}, x_.init});
  EXPECT_EQ(Render(out), (std::vector<std::string>{"incr.0", "L:end", "init.0"}));
}

TEST_F(ThreadGotosTest, KeepsDecrementFailureSlot) {
  std::vector<Part> parts = {x_.dec, Goto{"end"}, Label{"end"}, x_.inc};
  EXPECT_EQ(Render(ThreadGotos(parts)), Render(parts));

  std::vector<Part> labelled = {x_.dec, Label{"mid"}, Goto{"end"}, Label{"end"}, x_.inc};
  EXPECT_EQ(Render(ThreadGotos(labelled)), Render(labelled));
}

TEST_F(ThreadGotosTest, GotoCycleTerminates) {
  auto out = ThreadGotos({Label{"a"}, Goto{"b"}, Label{"b"}, Goto{"a"}});
  EXPECT_EQ(Render(out), (std::vector<std::string>{"L:a", "L:b", "G:a"}));
}

TEST_F(ThreadGotosTest, UnknownLabelLeftForLayout) {
  std::vector<Part> parts = {Goto{"nowhere"}, x_.inc};
  EXPECT_EQ(Render(ThreadGotos(parts)), Render(parts));
}

TEST(ReachableTest, DepthFirstWithoutHalt) {
  StateGraph graph;
  StateRef a = graph.NewState();
  StateRef b = graph.Make(StateSpec("b").Moves(Move::R).Next(kHalt));
  StateRef c = graph.Make(StateSpec("c").Moves(Move::L).Next(a));
  graph.Define(a, StateSpec("a").On0(Move::R, b).On1(Move::R, c));
  graph.Make(StateSpec("unreachable").Moves(Move::R).Next(a));

  EXPECT_EQ(Reachable(graph, a), (std::vector<StateRef>{a, b, c}));
  EXPECT_TRUE(Reachable(graph, kHalt).empty());
}

TEST(CompressTest, MergesEquivalentStates) {
  StateGraph graph;
  StateRef b1 = graph.Make(StateSpec("b1").Moves(Move::R).Write(1).Next(kHalt));
  StateRef b2 = graph.Make(StateSpec("b2").Moves(Move::R).Write(1).Next(kHalt));
  StateRef entry = graph.Make(StateSpec("a").On0(Move::L, b1).On1(Move::L, b2));

  EXPECT_EQ(Reachable(graph, entry).size(), 3u);
  EXPECT_EQ(Compress(graph, entry), 1);
  EXPECT_EQ(graph.Get(entry, 0).next, graph.Get(entry, 1).next);
  EXPECT_EQ(Reachable(graph, entry).size(), 2u);

  EXPECT_EQ(Compress(graph, entry), 0);
}

TEST(CompressTest, MergesIntoEntry) {
  StateGraph graph;
  StateRef loop = graph.NewState();
  StateRef entry = graph.Make(StateSpec("entry").Moves(Move::R).Next(loop));
  graph.Define(loop, StateSpec("loop").Moves(Move::R).Next(loop));

  StateRef before = entry;
  Compress(graph, entry);
  EXPECT_EQ(entry, before);
  EXPECT_EQ(Reachable(graph, entry), (std::vector<StateRef>{entry}));
}

TEST(CompressTest, CascadesOverRounds) {
  // d1/d2 are equal, which only then makes c1/c2 equal.
  StateGraph graph;
  StateRef d1 = graph.Make(StateSpec("d1").Moves(Move::R).Next(kHalt));
  StateRef d2 = graph.Make(StateSpec("d2").Moves(Move::R).Next(kHalt));
  StateRef c1 = graph.Make(StateSpec("c1").Moves(Move::L).Next(d1));
  StateRef c2 = graph.Make(StateSpec("c2").Moves(Move::L).Next(d2));
  StateRef entry = graph.Make(StateSpec("entry").On0(Move::R, c1).On1(Move::R, c2));

  EXPECT_EQ(Compress(graph, entry), 2);
  EXPECT_EQ(Reachable(graph, entry).size(), 3u);
}

}  // namespace
}  // namespace tmbdd
