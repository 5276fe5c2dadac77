#include "tmbdd/hlcompiler.hpp"
#include "tmbdd/errors.hpp"

#include <algorithm>

namespace tmbdd {

namespace {

// Which outcomes of a comparison take the jump.
struct CompareJumps {
  bool lt;
  bool eq;
  bool gt;
};

CompareJumps JumpsFor(CmpOp op) {
  switch (op) {
    case CmpOp::Lt: return {true, false, false};
    case CmpOp::Le: return {true, true, false};
    case CmpOp::Gt: return {false, false, true};
    case CmpOp::Ge: return {false, true, true};
    case CmpOp::Eq: return {false, true, false};
    case CmpOp::Ne: return {true, false, true};
  }
  throw Error("Unknown comparison operator");
}

std::string InstanceName(const std::string& name, const std::vector<std::string>& args) {
  std::string out = name + "(";
  for (size_t i = 0; i < args.size(); ++i) {
    if (i) out += ",";
    out += args[i];
  }
  return out + ")";
}

//=============================================================================
// Expression lowering
//=============================================================================

class NatLowering {
public:
  NatLowering(SubEmitter& emit, const Register& out, int line)
      : emit_(emit), out_(out), line_(line) {}

  void operator()(const Lit& lit) {
    for (uint64_t i = 0; i < lit.value; ++i) emit_.EmitInc(out_);
  }

  // Drain into out and a scratch register, then restore from the scratch.
  void operator()(const Reg& reg) {
    Register save = emit_.GetTemp();
    Register source = emit_.Resolve(reg.name, line_);
    emit_.EmitTransfer(source, {out_, save});
    emit_.EmitTransfer(save, {source});
    emit_.PutTemp(save);
  }

  void operator()(const Add& add) {
    Binary(*add.lhs, *add.rhs, [&](const Register& lhs, const Register& rhs) {
      emit_.EmitTransfer(lhs, {out_});
      emit_.EmitTransfer(rhs, {out_});
    });
  }

  void operator()(const Monus& monus) {
    Binary(*monus.lhs, *monus.rhs, [&](const Register& lhs, const Register& rhs) {
      std::string loop = emit_.Gensym();
      std::string done = emit_.Gensym();
      emit_.EmitTransfer(lhs, {out_});
      emit_.EmitLabel(loop);
      emit_.EmitDec(rhs);
      emit_.EmitGoto(done);
      emit_.EmitDec(out_);
      emit_.EmitNoop();
      emit_.EmitGoto(loop);
      emit_.EmitLabel(done);
    });
  }

  // Repeated addition; lhs counts down, rhs is restored each round.
  void operator()(const Mul& mul) {
    Binary(*mul.lhs, *mul.rhs, [&](const Register& lhs, const Register& rhs) {
      Register save = emit_.GetTemp();
      std::string again = emit_.Gensym();
      std::string done = emit_.Gensym();
      emit_.EmitLabel(again);
      emit_.EmitDec(lhs);
      emit_.EmitGoto(done);
      emit_.EmitTransfer(rhs, {save, out_});
      emit_.EmitTransfer(save, {rhs});
      emit_.EmitGoto(again);
      emit_.EmitLabel(done);
      emit_.EmitTransfer(rhs);
      emit_.PutTemp(save);
    });
  }

  // The divisor is re-evaluated for every quotient unit.
  void operator()(const Div& div) {
    Register dividend = emit_.GetTemp();
    Register divisor = emit_.GetTemp();
    std::string loop_quotient = emit_.Gensym();
    std::string loop_divisor = emit_.Gensym();
    std::string exhausted = emit_.Gensym();
    std::string full_divisor = emit_.Gensym();

    emit_.EmitNat(*div.lhs, dividend);

    emit_.EmitLabel(loop_quotient);
    emit_.EmitNat(*div.rhs, divisor);
    emit_.EmitLabel(loop_divisor);
    emit_.EmitDec(divisor);
    emit_.EmitGoto(full_divisor);
    emit_.EmitDec(dividend);
    emit_.EmitGoto(exhausted);
    emit_.EmitGoto(loop_divisor);
    emit_.EmitLabel(full_divisor);

    emit_.EmitInc(out_);
    emit_.EmitGoto(loop_quotient);
    emit_.EmitLabel(exhausted);
    emit_.EmitTransfer(divisor);

    emit_.PutTemp(dividend);
    emit_.PutTemp(divisor);
  }

private:
  template <typename Op>
  void Binary(const NatExpr& lhs_expr, const NatExpr& rhs_expr, Op op) {
    Register lhs = emit_.GetTemp();
    emit_.EmitNat(lhs_expr, lhs);
    Register rhs = emit_.GetTemp();
    emit_.EmitNat(rhs_expr, rhs);
    op(lhs, rhs);
    emit_.PutTemp(lhs);
    emit_.PutTemp(rhs);
  }

  SubEmitter& emit_;
  const Register& out_;
  int line_;
};

class TestLowering {
public:
  TestLowering(SubEmitter& emit, const std::string& label, bool invert)
      : emit_(emit), label_(label), invert_(invert) {}

  // Count both sides down together; whichever runs out first decides.
  void operator()(const Compare& cmp) {
    CompareJumps jumps = JumpsFor(cmp.op);

    Register lhs = emit_.GetTemp();
    emit_.EmitNat(*cmp.lhs, lhs);
    Register rhs = emit_.GetTemp();
    emit_.EmitNat(*cmp.rhs, rhs);

    std::string monus = emit_.Gensym();
    std::string not_less = emit_.Gensym();
    std::string is_less = emit_.Gensym();
    std::string no_jump = emit_.Gensym();
    auto target = [&](bool taken) { return taken != invert_ ? label_ : no_jump; };

    emit_.EmitLabel(monus);
    emit_.EmitDec(rhs);
    emit_.EmitGoto(not_less);
    emit_.EmitDec(lhs);
    emit_.EmitGoto(is_less);
    emit_.EmitGoto(monus);

    emit_.EmitLabel(not_less);
    if (jumps.eq != jumps.gt) {
      emit_.EmitDec(lhs);
      emit_.EmitGoto(target(jumps.eq));
    }
    emit_.EmitTransfer(lhs);
    emit_.EmitGoto(target(jumps.gt));

    emit_.EmitLabel(is_less);
    emit_.EmitTransfer(rhs);
    emit_.EmitGoto(target(jumps.lt));

    emit_.EmitLabel(no_jump);

    emit_.PutTemp(lhs);
    emit_.PutTemp(rhs);
  }

  void operator()(const Not& n) {
    emit_.EmitTest(*n.operand, label_, !invert_);
  }

  void operator()(const And& a) {
    if (invert_) {
      emit_.EmitTest(*a.lhs, label_, true);
      emit_.EmitTest(*a.rhs, label_, true);
    } else {
      std::string skip = emit_.Gensym();
      emit_.EmitTest(*a.lhs, skip, true);
      emit_.EmitTest(*a.rhs, label_, false);
      emit_.EmitLabel(skip);
    }
  }

  void operator()(const Or& o) {
    if (invert_) {
      std::string skip = emit_.Gensym();
      emit_.EmitTest(*o.lhs, skip, false);
      emit_.EmitTest(*o.rhs, label_, true);
      emit_.EmitLabel(skip);
    } else {
      emit_.EmitTest(*o.lhs, label_, false);
      emit_.EmitTest(*o.rhs, label_, false);
    }
  }

private:
  SubEmitter& emit_;
  const std::string& label_;
  bool invert_;
};

//=============================================================================
// Statement lowering
//=============================================================================

class StmtLowering {
public:
  StmtLowering(SubEmitter& emit, int line) : emit_(emit), line_(line) {}

  void operator()(const Assign& assign) {
    Register temp = emit_.GetTemp();
    emit_.EmitNat(*assign.value, temp);
    Register target = emit_.Resolve(assign.target, line_);
    emit_.EmitTransfer(target);
    emit_.EmitTransfer(temp, {target});
    emit_.PutTemp(temp);
  }

  void operator()(const While& loop) {
    std::string exit = emit_.Gensym();
    std::string again = emit_.Gensym();
    emit_.EmitLabel(again);
    emit_.EmitTest(*loop.cond, exit, true);
    emit_.EmitStmt(*loop.body);
    emit_.EmitGoto(again);
    emit_.EmitLabel(exit);
  }

  void operator()(const IfThen& branch) {
    std::string l_else = emit_.Gensym();
    std::string l_then = emit_.Gensym();
    emit_.EmitTest(*branch.cond, l_else, true);
    emit_.EmitStmt(*branch.then_body);
    emit_.EmitGoto(l_then);
    emit_.EmitLabel(l_else);
    if (branch.else_body) emit_.EmitStmt(*branch.else_body);
    emit_.EmitLabel(l_then);
  }

  void operator()(const Call& call) {
    std::vector<std::string> regs;
    for (const auto& arg : call.args) {
      regs.push_back(emit_.Resolve(arg, line_).name);
    }
    emit_.EmitCall(call.proc, regs, line_);
  }

  void operator()(const Return&) {
    emit_.EmitReturn();
  }

  void operator()(const Block& block) {
    for (const auto& stmt : block.body) emit_.EmitStmt(*stmt);
  }

private:
  SubEmitter& emit_;
  int line_;
};

}  // namespace

std::string GlobalRegisterName(const std::string& name) {
  return "g." + name;
}

//=============================================================================
// SubEmitter
//=============================================================================

SubEmitter::SubEmitter(ProgramCompiler& compiler, std::map<std::string, std::string> params)
    : compiler_(compiler), builder_(compiler.builder()), params_(std::move(params)) {}

void SubEmitter::EmitStmt(const Stmt& stmt) {
  std::visit(StmtLowering(*this, stmt.line), stmt.node);
}

void SubEmitter::EmitNat(const NatExpr& expr, const Register& out) {
  std::visit(NatLowering(*this, out, expr.line), expr.node);
}

void SubEmitter::EmitTest(const BoolExpr& expr, const std::string& label, bool invert) {
  std::visit(TestLowering(*this, label, invert), expr.node);
}

void SubEmitter::EmitTransfer(const Register& source, const std::vector<Register>& targets) {
  parts_.push_back(builder_.Transfer(source, targets));
}

void SubEmitter::EmitNoop() {
  parts_.push_back(builder_.Noop(0));
}

void SubEmitter::EmitHalt() {
  parts_.push_back(builder_.Halt());
}

void SubEmitter::EmitReturn() {
  if (return_label_.empty()) return_label_ = Gensym();
  EmitGoto(return_label_);
}

void SubEmitter::CloseReturn() {
  if (!return_label_.empty()) EmitLabel(return_label_);
}

void SubEmitter::EmitCall(const std::string& proc, const std::vector<std::string>& args, int line) {
  if (!scratch_used_.empty()) {
    throw Error(std::to_string(line) + ": Call to " + proc + " with scratch registers live");
  }
  parts_.push_back(compiler_.Instantiate(proc, args, line));
}

const Register& SubEmitter::Resolve(const std::string& name, int line) {
  auto it = params_.find(name);
  if (it != params_.end()) return builder_.GetRegister(it->second);
  if (compiler_.program().HasGlobal(name)) return builder_.GetRegister(GlobalRegisterName(name));
  throw UndefinedSymbolError("register", name, line);
}

Register SubEmitter::GetTemp() {
  Register reg;
  if (!scratch_free_.empty()) {
    reg = scratch_free_.back();
    scratch_free_.pop_back();
  } else {
    reg = builder_.GetRegister("tmp." + std::to_string(++scratch_next_));
  }
  scratch_used_.push_back(reg);
  return reg;
}

void SubEmitter::PutTemp(const Register& reg) {
  auto it = std::find_if(scratch_used_.begin(), scratch_used_.end(),
                         [&](const Register& used) { return used.index == reg.index; });
  if (it == scratch_used_.end()) {
    throw Error("Scratch register " + reg.name + " returned twice");
  }
  scratch_used_.erase(it);
  scratch_free_.push_back(reg);
}

std::string SubEmitter::Gensym() {
  return builder_.Gensym();
}

//=============================================================================
// ProgramCompiler
//=============================================================================

ProgramCompiler::ProgramCompiler(const Program& program, MachineBuilder& builder)
    : program_(program), builder_(builder) {}

SubroutinePtr ProgramCompiler::Instantiate(const std::string& name,
                                           const std::vector<std::string>& args, int line) {
  const ProcDef* def = program_.FindProc(name);
  if (!def) {
    throw UndefinedSymbolError("procedure", name, line);
  }
  if (def->params.size() != args.size()) {
    throw SemanticError(std::to_string(line) + ": " + name + " takes " +
                        std::to_string(def->params.size()) + " arguments, got " +
                        std::to_string(args.size()));
  }

  std::string instance = InstanceName(name, args);
  return builder_.Memoize("instantiate", instance, [&] {
    std::map<std::string, std::string> params;
    for (size_t i = 0; i < args.size(); ++i) params[def->params[i]] = args[i];

    SubEmitter emit(*this, std::move(params));
    emit.EmitStmt(*def->body);
    emit.CloseReturn();
    if (name == "main") emit.EmitHalt();
    return builder_.MakeSub(emit.parts(), instance);
  });
}

SubroutinePtr ProgramCompiler::Main() {
  const ProcDef* def = program_.FindProc("main");
  if (!def) {
    throw UndefinedSymbolError("procedure", "main", 0);
  }
  if (!def->params.empty()) {
    throw SemanticError(std::to_string(def->line) + ": main takes no parameters");
  }
  // Globals get the lowest register indices, in declaration order.
  for (const auto& global : program_.globals) {
    builder_.GetRegister(GlobalRegisterName(global.name));
  }
  return Instantiate("main", {}, def->line);
}

Machine CompileProgram(const Program& program, const MachineOptions& options) {
  Machine machine(
      [&program](MachineBuilder& builder) {
        ProgramCompiler compiler(program, builder);
        return compiler.Main();
      },
      options);
  if (options.compress) machine.Compress();
  return machine;
}

}  // namespace tmbdd
