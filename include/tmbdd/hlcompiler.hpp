#pragma once

#include "tmbdd/ast.hpp"
#include "tmbdd/codegen.hpp"
#include "tmbdd/simulator.hpp"

#include <map>
#include <string>
#include <vector>

namespace tmbdd {

class ProgramCompiler;

// Lowers one procedure body to a flat sequence of parts.
//
// Scratch registers ("tmp.N") are handed out per procedure and always given
// back at zero, so every procedure shares the same small pool. None may be
// in use across a call.
class SubEmitter {
public:
  SubEmitter(ProgramCompiler& compiler, std::map<std::string, std::string> params);

  void EmitStmt(const Stmt& stmt);

  // Adds the value of `expr` into `out`, which the caller has zeroed.
  void EmitNat(const NatExpr& expr, const Register& out);

  // Jumps to `label` when the test holds, XOR `invert`; falls through
  // otherwise. Leaves every scratch register at zero on both paths.
  void EmitTest(const BoolExpr& expr, const std::string& label, bool invert);

  void EmitTransfer(const Register& source, const std::vector<Register>& targets = {});
  void EmitInc(const Register& reg) { parts_.push_back(reg.inc); }
  void EmitDec(const Register& reg) { parts_.push_back(reg.dec); }
  void EmitNoop();
  void EmitHalt();
  void EmitLabel(const std::string& label) { parts_.push_back(Label{label}); }
  void EmitGoto(const std::string& label) { parts_.push_back(Goto{label}); }
  void EmitReturn();
  void CloseReturn();
  void EmitCall(const std::string& proc, const std::vector<std::string>& args, int line);

  const Register& Resolve(const std::string& name, int line);
  Register GetTemp();
  void PutTemp(const Register& reg);
  std::string Gensym();

  const std::vector<Part>& parts() const { return parts_; }

private:
  ProgramCompiler& compiler_;
  MachineBuilder& builder_;
  std::map<std::string, std::string> params_;  // parameter -> register name

  int scratch_next_ = 0;
  std::vector<Register> scratch_used_;
  std::vector<Register> scratch_free_;

  std::vector<Part> parts_;
  std::string return_label_;
};

// Instantiates procedures of a parsed program against one builder.
class ProgramCompiler {
public:
  ProgramCompiler(const Program& program, MachineBuilder& builder);

  // One subprogram per (procedure, argument registers). A procedure that
  // needs its own instance while building it raises CycleDetectedError.
  SubroutinePtr Instantiate(const std::string& name, const std::vector<std::string>& args,
                            int line = 0);

  // main(), ending in halt.
  SubroutinePtr Main();

  const Program& program() const { return program_; }
  MachineBuilder& builder() { return builder_; }

private:
  const Program& program_;
  MachineBuilder& builder_;
};

// Register name backing a global variable.
std::string GlobalRegisterName(const std::string& name);

// Build a finished machine for `program`, compressed unless disabled.
Machine CompileProgram(const Program& program, const MachineOptions& options = {});

}  // namespace tmbdd
