#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace tmbdd {

//=============================================================================
// Natural-number expressions
//=============================================================================

struct NatExpr;
using NatPtr = std::shared_ptr<const NatExpr>;

// Integer literal: 0, 1, 42
struct Lit {
  uint64_t value;
};

// Register read: x, count
struct Reg {
  std::string name;
};

struct Add {
  NatPtr lhs;
  NatPtr rhs;
};

// Subtraction clamped at zero
struct Monus {
  NatPtr lhs;
  NatPtr rhs;
};

struct Mul {
  NatPtr lhs;
  NatPtr rhs;
};

// Floor division; dividing by zero never terminates
struct Div {
  NatPtr lhs;
  NatPtr rhs;
};

struct NatExpr {
  std::variant<Lit, Reg, Add, Monus, Mul, Div> node;
  int line = 0;
};

//=============================================================================
// Tests
//=============================================================================

struct BoolExpr;
using BoolPtr = std::shared_ptr<const BoolExpr>;

enum class CmpOp { Lt, Le, Gt, Ge, Eq, Ne };

struct Compare {
  CmpOp op;
  NatPtr lhs;
  NatPtr rhs;
};

struct Not {
  BoolPtr operand;
};

struct And {
  BoolPtr lhs;
  BoolPtr rhs;
};

struct Or {
  BoolPtr lhs;
  BoolPtr rhs;
};

struct BoolExpr {
  std::variant<Compare, Not, And, Or> node;
  int line = 0;
};

//=============================================================================
// Statements
//=============================================================================

struct Stmt;
using StmtPtr = std::shared_ptr<const Stmt>;

// x = expr;
struct Assign {
  std::string target;
  NatPtr value;
};

struct While {
  BoolPtr cond;
  StmtPtr body;
};

// else_body is null when there is no else branch
struct IfThen {
  BoolPtr cond;
  StmtPtr then_body;
  StmtPtr else_body;
};

// f(a, b); arguments are register names, passed by reference
struct Call {
  std::string proc;
  std::vector<std::string> args;
};

struct Return {};

struct Block {
  std::vector<StmtPtr> body;
};

struct Stmt {
  std::variant<Assign, While, IfThen, Call, Return, Block> node;
  int line = 0;
};

//=============================================================================
// Program
//=============================================================================

struct ProcDef {
  std::string name;
  std::vector<std::string> params;
  StmtPtr body;
  int line = 0;
};

struct GlobalReg {
  std::string name;
  int line = 0;
};

struct Program {
  std::vector<GlobalReg> globals;
  std::vector<ProcDef> procs;

  const ProcDef* FindProc(const std::string& name) const {
    for (const auto& proc : procs) {
      if (proc.name == name) return &proc;
    }
    return nullptr;
  }

  bool HasGlobal(const std::string& name) const {
    for (const auto& global : globals) {
      if (global.name == name) return true;
    }
    return false;
  }
};

// Helper constructors
inline NatPtr make_lit(uint64_t v, int line = 0) {
  return std::make_shared<NatExpr>(NatExpr{Lit{v}, line});
}
inline NatPtr make_reg(const std::string& n, int line = 0) {
  return std::make_shared<NatExpr>(NatExpr{Reg{n}, line});
}
inline NatPtr make_add(NatPtr l, NatPtr r, int line = 0) {
  return std::make_shared<NatExpr>(NatExpr{Add{std::move(l), std::move(r)}, line});
}
inline NatPtr make_monus(NatPtr l, NatPtr r, int line = 0) {
  return std::make_shared<NatExpr>(NatExpr{Monus{std::move(l), std::move(r)}, line});
}
inline NatPtr make_mul(NatPtr l, NatPtr r, int line = 0) {
  return std::make_shared<NatExpr>(NatExpr{Mul{std::move(l), std::move(r)}, line});
}
inline NatPtr make_div(NatPtr l, NatPtr r, int line = 0) {
  return std::make_shared<NatExpr>(NatExpr{Div{std::move(l), std::move(r)}, line});
}

inline BoolPtr make_compare(CmpOp op, NatPtr l, NatPtr r, int line = 0) {
  return std::make_shared<BoolExpr>(BoolExpr{Compare{op, std::move(l), std::move(r)}, line});
}
inline BoolPtr make_not(BoolPtr e, int line = 0) {
  return std::make_shared<BoolExpr>(BoolExpr{Not{std::move(e)}, line});
}
inline BoolPtr make_and(BoolPtr l, BoolPtr r, int line = 0) {
  return std::make_shared<BoolExpr>(BoolExpr{And{std::move(l), std::move(r)}, line});
}
inline BoolPtr make_or(BoolPtr l, BoolPtr r, int line = 0) {
  return std::make_shared<BoolExpr>(BoolExpr{Or{std::move(l), std::move(r)}, line});
}

inline StmtPtr make_assign(const std::string& target, NatPtr value, int line = 0) {
  return std::make_shared<Stmt>(Stmt{Assign{target, std::move(value)}, line});
}
inline StmtPtr make_while(BoolPtr cond, StmtPtr body, int line = 0) {
  return std::make_shared<Stmt>(Stmt{While{std::move(cond), std::move(body)}, line});
}
inline StmtPtr make_if(BoolPtr cond, StmtPtr then_body, StmtPtr else_body = nullptr, int line = 0) {
  return std::make_shared<Stmt>(
      Stmt{IfThen{std::move(cond), std::move(then_body), std::move(else_body)}, line});
}
inline StmtPtr make_call(const std::string& proc, std::vector<std::string> args, int line = 0) {
  return std::make_shared<Stmt>(Stmt{Call{proc, std::move(args)}, line});
}
inline StmtPtr make_return(int line = 0) {
  return std::make_shared<Stmt>(Stmt{Return{}, line});
}
inline StmtPtr make_block(std::vector<StmtPtr> body, int line = 0) {
  return std::make_shared<Stmt>(Stmt{Block{std::move(body)}, line});
}

}  // namespace tmbdd
