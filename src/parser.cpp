#include "tmbdd/parser.hpp"
#include "tmbdd/errors.hpp"

#include <cctype>
#include <set>

namespace tmbdd {

namespace {

class Lexer {
public:
  enum class Tok {
    Eof, Ident, Number,
    LBrace, RBrace, LParen, RParen,
    Comma, Semicolon, Equals, DoubleEquals,
    Plus, Minus, Star, Slash, Lt, Le, Gt, Ge, Ne,
    Bang, AndAnd, OrOr,
  };

  struct Token {
    Tok type;
    std::string text;
    int line, col;
  };

  explicit Lexer(const std::string& src) : src_(src), pos_(0), line_(1), col_(1) {}

  Token Next() {
    SkipWS();
    if (pos_ >= src_.size()) return {Tok::Eof, "end of input", line_, col_};

    int l = line_, c = col_;
    char ch = src_[pos_];

    if (ch == '{') { Adv(); return {Tok::LBrace, "{", l, c}; }
    if (ch == '}') { Adv(); return {Tok::RBrace, "}", l, c}; }
    if (ch == '(') { Adv(); return {Tok::LParen, "(", l, c}; }
    if (ch == ')') { Adv(); return {Tok::RParen, ")", l, c}; }
    if (ch == ',') { Adv(); return {Tok::Comma, ",", l, c}; }
    if (ch == ';') { Adv(); return {Tok::Semicolon, ";", l, c}; }
    if (ch == '+') { Adv(); return {Tok::Plus, "+", l, c}; }
    if (ch == '-') { Adv(); return {Tok::Minus, "-", l, c}; }
    if (ch == '*') { Adv(); return {Tok::Star, "*", l, c}; }
    if (ch == '/') { Adv(); return {Tok::Slash, "/", l, c}; }

    if (ch == '=' && Peek(1) == '=') { Adv(); Adv(); return {Tok::DoubleEquals, "==", l, c}; }
    if (ch == '=') { Adv(); return {Tok::Equals, "=", l, c}; }
    if (ch == '!' && Peek(1) == '=') { Adv(); Adv(); return {Tok::Ne, "!=", l, c}; }
    if (ch == '!') { Adv(); return {Tok::Bang, "!", l, c}; }
    if (ch == '<' && Peek(1) == '=') { Adv(); Adv(); return {Tok::Le, "<=", l, c}; }
    if (ch == '<') { Adv(); return {Tok::Lt, "<", l, c}; }
    if (ch == '>' && Peek(1) == '=') { Adv(); Adv(); return {Tok::Ge, ">=", l, c}; }
    if (ch == '>') { Adv(); return {Tok::Gt, ">", l, c}; }
    if (ch == '&' && Peek(1) == '&') { Adv(); Adv(); return {Tok::AndAnd, "&&", l, c}; }
    if (ch == '|' && Peek(1) == '|') { Adv(); Adv(); return {Tok::OrOr, "||", l, c}; }

    if (std::isdigit(static_cast<unsigned char>(ch))) return ReadNum();
    if (std::isalpha(static_cast<unsigned char>(ch))) return ReadIdent();

    throw ParseError(std::string("Unexpected character '") + ch + "'", l, c);
  }

  Token Peek() {
    size_t p = pos_; int li = line_, co = col_;
    Token t = Next();
    pos_ = p; line_ = li; col_ = co;
    return t;
  }

private:
  void Adv() {
    if (pos_ < src_.size()) {
      if (src_[pos_] == '\n') { ++line_; col_ = 1; }
      else { ++col_; }
      ++pos_;
    }
  }

  char Peek(int offset) {
    return (pos_ + offset < src_.size()) ? src_[pos_ + offset] : '\0';
  }

  void SkipWS() {
    while (pos_ < src_.size()) {
      char c = src_[pos_];
      if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
        Adv();
      } else if (c == '/' && Peek(1) == '*') {
        int l = line_, co = col_;
        Adv(); Adv();
        while (pos_ < src_.size() && !(src_[pos_] == '*' && Peek(1) == '/')) Adv();
        if (pos_ >= src_.size()) throw ParseError("Unterminated comment", l, co);
        Adv(); Adv();
      } else {
        break;
      }
    }
  }

  Token ReadNum() {
    int l = line_, c = col_;
    std::string v;
    while (pos_ < src_.size() && std::isdigit(static_cast<unsigned char>(src_[pos_]))) {
      v += src_[pos_]; Adv();
    }
    return {Tok::Number, v, l, c};
  }

  Token ReadIdent() {
    int l = line_, c = col_;
    std::string v;
    while (pos_ < src_.size() &&
           (std::isalnum(static_cast<unsigned char>(src_[pos_])) || src_[pos_] == '_')) {
      v += src_[pos_]; Adv();
    }
    return {Tok::Ident, v, l, c};
  }

  const std::string& src_;
  size_t pos_;
  int line_, col_;
};

const std::set<std::string> kReserved = {"while", "proc", "global", "if", "else", "return"};

// An expression before its type is known: exactly one of nat/test is set.
struct ParsedExpr {
  NatPtr nat;
  BoolPtr test;
  int line, col;
};

class Parser {
public:
  explicit Parser(const std::string& src) : lex_(src) {}

  Program ParseProgram() {
    Program prog;
    std::set<std::string> names;

    while (lex_.Peek().type != Lexer::Tok::Eof) {
      auto t = lex_.Peek();
      if (IsKeyword(t, "global")) {
        lex_.Next();
        auto name = ExpectIdent();
        Expect(Lexer::Tok::Semicolon);
        Declare(names, name);
        prog.globals.push_back({name.text, name.line});
      } else if (IsKeyword(t, "proc")) {
        lex_.Next();
        auto name = ExpectIdent();
        ProcDef proc;
        proc.name = name.text;
        proc.line = name.line;
        proc.params = ParseArgList();
        std::set<std::string> seen;
        for (const auto& param : proc.params) {
          if (!seen.insert(param).second) {
            throw SemanticError(std::to_string(name.line) + ": Duplicate parameter " + param +
                                " in " + proc.name);
          }
        }
        proc.body = ParseBlock();
        Declare(names, name);
        prog.procs.push_back(std::move(proc));
      } else {
        throw ParseError("Expected 'global' or 'proc', got '" + t.text + "'", t.line, t.col);
      }
    }
    return prog;
  }

private:
  static bool IsKeyword(const Lexer::Token& t, const char* word) {
    return t.type == Lexer::Tok::Ident && t.text == word;
  }

  void Declare(std::set<std::string>& names, const Lexer::Token& name) {
    if (!names.insert(name.text).second) {
      throw SemanticError(std::to_string(name.line) + ": Redefinition of " + name.text);
    }
  }

  std::vector<std::string> ParseArgList() {
    std::vector<std::string> args;
    Expect(Lexer::Tok::LParen);
    if (lex_.Peek().type != Lexer::Tok::RParen) {
      args.push_back(ExpectIdent().text);
      while (lex_.Peek().type == Lexer::Tok::Comma) {
        lex_.Next();
        args.push_back(ExpectIdent().text);
      }
    }
    Expect(Lexer::Tok::RParen);
    return args;
  }

  StmtPtr ParseBlock() {
    auto open = Expect(Lexer::Tok::LBrace);
    std::vector<StmtPtr> body;
    while (lex_.Peek().type != Lexer::Tok::RBrace) {
      if (lex_.Peek().type == Lexer::Tok::Eof) {
        auto t = lex_.Peek();
        throw ParseError("Unexpected end of input in block", t.line, t.col);
      }
      body.push_back(ParseStmt());
    }
    Expect(Lexer::Tok::RBrace);
    return make_block(std::move(body), open.line);
  }

  StmtPtr ParseStmt() {
    auto t = lex_.Peek();

    if (t.type == Lexer::Tok::LBrace) return ParseBlock();

    if (IsKeyword(t, "while")) {
      lex_.Next();
      Expect(Lexer::Tok::LParen);
      auto cond = RequireBool(ParseExpr());
      Expect(Lexer::Tok::RParen);
      return make_while(cond, ParseBlock(), t.line);
    }

    if (IsKeyword(t, "if")) {
      lex_.Next();
      Expect(Lexer::Tok::LParen);
      auto cond = RequireBool(ParseExpr());
      Expect(Lexer::Tok::RParen);
      auto then_body = ParseBlock();
      StmtPtr else_body;
      if (IsKeyword(lex_.Peek(), "else")) {
        lex_.Next();
        else_body = ParseBlock();
      }
      return make_if(cond, then_body, else_body, t.line);
    }

    if (IsKeyword(t, "return")) {
      lex_.Next();
      Expect(Lexer::Tok::Semicolon);
      return make_return(t.line);
    }

    auto name = ExpectIdent();
    if (lex_.Peek().type == Lexer::Tok::Equals) {
      lex_.Next();
      auto value = RequireNat(ParseExpr());
      Expect(Lexer::Tok::Semicolon);
      return make_assign(name.text, value, name.line);
    }
    if (lex_.Peek().type == Lexer::Tok::LParen) {
      auto args = ParseArgList();
      Expect(Lexer::Tok::Semicolon);
      return make_call(name.text, std::move(args), name.line);
    }

    auto u = lex_.Peek();
    throw ParseError("Expected '=' or '(' after " + name.text + ", got '" + u.text + "'",
                     u.line, u.col);
  }

  //---------------------------------------------------------------------------
  // Expressions, lowest precedence first
  //---------------------------------------------------------------------------

  ParsedExpr ParseExpr() {
    auto t = lex_.Peek();
    if (t.type == Lexer::Tok::Bang) {
      lex_.Next();
      auto operand = RequireBool(ParseExpr());
      return Test(make_not(operand, t.line), t);
    }
    return ParseOr();
  }

  ParsedExpr ParseOr() {
    auto left = ParseAnd();
    while (lex_.Peek().type == Lexer::Tok::OrOr) {
      auto op = lex_.Next();
      auto right = ParseAnd();
      left = Test(make_or(RequireBool(left), RequireBool(right), op.line), left);
    }
    return left;
  }

  ParsedExpr ParseAnd() {
    auto left = ParseRel();
    while (lex_.Peek().type == Lexer::Tok::AndAnd) {
      auto op = lex_.Next();
      auto right = ParseRel();
      left = Test(make_and(RequireBool(left), RequireBool(right), op.line), left);
    }
    return left;
  }

  ParsedExpr ParseRel() {
    auto left = ParseAdd();
    CmpOp op = CmpOp::Lt;
    if (!RelOp(lex_.Peek().type, &op)) return left;

    auto tok = lex_.Next();
    auto right = ParseAdd();
    auto result = Test(make_compare(op, RequireNat(left), RequireNat(right), tok.line), left);

    CmpOp ignored = CmpOp::Lt;
    auto next = lex_.Peek();
    if (RelOp(next.type, &ignored)) {
      throw ParseError("Relational operators are not associative", next.line, next.col);
    }
    return result;
  }

  ParsedExpr ParseAdd() {
    auto left = ParseMul();
    while (lex_.Peek().type == Lexer::Tok::Plus || lex_.Peek().type == Lexer::Tok::Minus) {
      auto op = lex_.Next();
      auto right = ParseMul();
      auto l = RequireNat(left);
      auto r = RequireNat(right);
      left = Nat(op.type == Lexer::Tok::Plus ? make_add(l, r, op.line) : make_monus(l, r, op.line),
                 left);
    }
    return left;
  }

  ParsedExpr ParseMul() {
    auto left = ParsePrimary();
    while (lex_.Peek().type == Lexer::Tok::Star || lex_.Peek().type == Lexer::Tok::Slash) {
      auto op = lex_.Next();
      auto right = ParsePrimary();
      auto l = RequireNat(left);
      auto r = RequireNat(right);
      left = Nat(op.type == Lexer::Tok::Star ? make_mul(l, r, op.line) : make_div(l, r, op.line),
                 left);
    }
    return left;
  }

  ParsedExpr ParsePrimary() {
    auto t = lex_.Next();

    if (t.type == Lexer::Tok::Number) {
      uint64_t value = 0;
      for (char c : t.text) {
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (value > (UINT64_MAX - digit) / 10) {
          throw ParseError("Integer literal out of range: " + t.text, t.line, t.col);
        }
        value = value * 10 + digit;
      }
      return Nat(make_lit(value, t.line), t);
    }

    if (t.type == Lexer::Tok::Ident) {
      if (kReserved.count(t.text)) {
        throw ParseError("Unexpected reserved word '" + t.text + "'", t.line, t.col);
      }
      return Nat(make_reg(t.text, t.line), t);
    }

    if (t.type == Lexer::Tok::LParen) {
      auto inner = ParseExpr();
      Expect(Lexer::Tok::RParen);
      inner.line = t.line;
      inner.col = t.col;
      return inner;
    }

    throw ParseError("Unexpected token in expression: '" + t.text + "'", t.line, t.col);
  }

  static bool RelOp(Lexer::Tok type, CmpOp* op) {
    switch (type) {
      case Lexer::Tok::Lt: *op = CmpOp::Lt; return true;
      case Lexer::Tok::Le: *op = CmpOp::Le; return true;
      case Lexer::Tok::Gt: *op = CmpOp::Gt; return true;
      case Lexer::Tok::Ge: *op = CmpOp::Ge; return true;
      case Lexer::Tok::DoubleEquals: *op = CmpOp::Eq; return true;
      case Lexer::Tok::Ne: *op = CmpOp::Ne; return true;
      default: return false;
    }
  }

  template <typename Pos>
  static ParsedExpr Nat(NatPtr e, const Pos& pos) {
    return {std::move(e), nullptr, pos.line, pos.col};
  }

  template <typename Pos>
  static ParsedExpr Test(BoolPtr e, const Pos& pos) {
    return {nullptr, std::move(e), pos.line, pos.col};
  }

  static NatPtr RequireNat(const ParsedExpr& e) {
    if (!e.nat) throw ParseError("Expected a number, got a test", e.line, e.col);
    return e.nat;
  }

  static BoolPtr RequireBool(const ParsedExpr& e) {
    if (!e.test) throw ParseError("Expected a test, got a number", e.line, e.col);
    return e.test;
  }

  Lexer::Token ExpectIdent() {
    auto t = lex_.Next();
    if (t.type != Lexer::Tok::Ident) {
      throw ParseError("Expected identifier, got '" + t.text + "'", t.line, t.col);
    }
    if (kReserved.count(t.text)) {
      throw ParseError("Reserved word '" + t.text + "' used as identifier", t.line, t.col);
    }
    return t;
  }

  Lexer::Token Expect(Lexer::Tok type) {
    auto t = lex_.Next();
    if (t.type != type) {
      throw ParseError("Unexpected token '" + t.text + "'", t.line, t.col);
    }
    return t;
  }

  Lexer lex_;
};

}  // namespace

Program Parse(const std::string& source) {
  Parser parser(source);
  return parser.ParseProgram();
}

}  // namespace tmbdd
