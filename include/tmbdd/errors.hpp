#pragma once

#include <stdexcept>
#include <string>

namespace tmbdd {

// Base class for every compilation failure. All of these abort the current
// build; nothing is recovered locally.
class Error : public std::runtime_error {
public:
  explicit Error(const std::string& message) : std::runtime_error(message) {}
};

// A state node was finalized twice.
class RedefinitionError : public Error {
public:
  using Error::Error;
};

// Bad move/write/next during finalization, or reading an undefined node.
class InvalidTransitionError : public Error {
public:
  using Error::Error;
};

// A memoized construction was re-entered while its first call is pending.
class CycleDetectedError : public Error {
public:
  CycleDetectedError(const std::string& op, const std::string& args)
      : Error("Cycle in BDD build order: " + op + "(" + args + ")"),
        op_(op), args_(args) {}

  const std::string& op() const { return op_; }
  const std::string& args() const { return args_; }

private:
  std::string op_;
  std::string args_;
};

// A Goto names a label absent from its own operation sequence.
class UnresolvedLabelError : public Error {
public:
  UnresolvedLabelError(const std::string& label, const std::string& subprogram)
      : Error("Unresolved label '" + label + "' in " + subprogram),
        label_(label) {}

  const std::string& label() const { return label_; }

private:
  std::string label_;
};

// makesub was given nothing to lay out.
class EmptySubprogramError : public Error {
public:
  using Error::Error;
};

// Unknown procedure or global register. line is 0 when unknown.
class UndefinedSymbolError : public Error {
public:
  UndefinedSymbolError(const std::string& kind, const std::string& name, int line)
      : Error((line > 0 ? std::to_string(line) + ": " : std::string()) +
              "Undefined " + kind + ": " + name),
        name_(name), line_(line) {}

  const std::string& name() const { return name_; }
  int line() const { return line_; }

private:
  std::string name_;
  int line_;
};

// The fixpoint rebuild produced a program whose order differs from pc_bits.
class SizeMismatchError : public Error {
public:
  using Error::Error;
};

// Syntax errors from the surface language parser.
class ParseError : public Error {
public:
  ParseError(const std::string& message, int line, int column)
      : Error(std::to_string(line) + ":" + std::to_string(column) + ": " + message),
        line_(line), column_(column) {}

  int line() const { return line_; }
  int column() const { return column_; }

private:
  int line_;
  int column_;
};

// Well-formed input that cannot be compiled (arity mismatch, duplicate
// definitions, self-transfer, malformed tape on readback).
class SemanticError : public Error {
public:
  using Error::Error;
};

}  // namespace tmbdd
