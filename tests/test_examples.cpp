#include <gtest/gtest.h>
#include "tmbdd/hlcompiler.hpp"
#include "tmbdd/parser.hpp"

#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>

namespace tmbdd {
namespace {

// Read a .nql file from the examples directory
std::string ReadFile(const std::string& path) {
  std::ifstream ifs(path);
  if (!ifs) throw std::runtime_error("Cannot open: " + path);
  std::stringstream buf;
  buf << ifs.rdbuf();
  return buf.str();
}

// Compile and run an example, then check every global it declares.
void VerifyExample(const std::string& path, const std::map<std::string, uint64_t>& expected,
                   const MachineOptions& options = {}) {
  Program prog = Parse(ReadFile(path));
  ASSERT_EQ(prog.globals.size(), expected.size()) << path;

  Machine machine = CompileProgram(prog, options);
  RunResult result = machine.Run(100000000);
  ASSERT_TRUE(result.halted) << path << (result.hit_limit ? " (HIT STEP LIMIT)" : "");

  for (const auto& [name, value] : expected) {
    EXPECT_EQ(machine.RegisterValue(GlobalRegisterName(name)), value)
        << path << ": " << name;
  }
}

TEST(ExampleTest, Squares) {
  VerifyExample(TMBDD_EXAMPLES_DIR "/squares.nql", {{"a", 4}, {"b", 9}});
}

TEST(ExampleTest, SquaresWithAdderBranches) {
  MachineOptions options;
  options.branch_mode = BranchMode::kAdder;
  options.optimize_cfg = false;
  VerifyExample(TMBDD_EXAMPLES_DIR "/squares.nql", {{"a", 4}, {"b", 9}}, options);
}

TEST(ExampleTest, Arithmetic) {
  VerifyExample(TMBDD_EXAMPLES_DIR "/arithmetic.nql",
                {{"a", 7}, {"b", 4}, {"c", 0}, {"d", 21},
                 {"e", 3}, {"f", 3}, {"g", 0}, {"h", 9}});
}

TEST(ExampleTest, Triangle) {
  VerifyExample(TMBDD_EXAMPLES_DIR "/triangle.nql", {{"n", 0}, {"s", 10}});
}

TEST(ExampleTest, Clamp) {
  VerifyExample(TMBDD_EXAMPLES_DIR "/clamp.nql", {{"a", 3}, {"b", 24}});
}

TEST(ExampleTest, CompressionNeverGrowsTheMachine) {
  Program prog = Parse(ReadFile(TMBDD_EXAMPLES_DIR "/triangle.nql"));
  MachineOptions raw;
  raw.compress = false;
  Machine uncompressed = CompileProgram(prog, raw);
  Machine compressed = CompileProgram(prog);
  EXPECT_LE(compressed.state_count(), uncompressed.state_count());
  EXPECT_EQ(compressed.pc_bits(), uncompressed.pc_bits());
}

}  // namespace
}  // namespace tmbdd
