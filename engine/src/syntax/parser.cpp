#include "syntax/parser.h"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <utility>
#include <vector>

#include <fmt/format.h>

namespace analysis_sandbox {

namespace {

const std::set<std::string>& Keywords() {
  static const std::set<std::string> keywords = {
      "False", "None", "True", "and", "as", "assert", "async", "await",
      "break", "class", "continue", "def", "del", "elif", "else", "except",
      "finally", "for", "from", "global", "if", "import", "in", "is",
      "lambda", "nonlocal", "not", "or", "pass", "raise", "return", "try",
      "while", "with", "yield",
  };
  return keywords;
}

bool IsKeyword(const std::string& word) {
  return Keywords().count(word) > 0;
}

bool IsAugAssignOp(const std::string& op) {
  static const std::set<std::string> ops = {
      "+=", "-=", "*=", "/=", "//=", "%=", "@=", "&=", "|=", "^=", ">>=", "<<=", "**=",
  };
  return ops.count(op) > 0;
}

struct ParseError : std::runtime_error {
  ParseError(const std::string& message, int l, int c)
      : std::runtime_error(message), line(l), column(c) {}
  int line;
  int column;
};

SourcePos PosOf(const Token& tok) {
  return SourcePos{tok.line, tok.column};
}

SyntaxNode MakeCompound(CompoundKind kind, SourcePos pos, std::string label = "",
                        std::vector<SyntaxNode> children = {}) {
  auto node = std::make_unique<CompoundNode>();
  node->kind = kind;
  node->label = std::move(label);
  node->children = std::move(children);
  node->pos = pos;
  return SyntaxNode(std::move(node));
}

const CompoundNode* AsCompound(const SyntaxNode& node) {
  if (auto* c = std::get_if<std::unique_ptr<CompoundNode>>(&node)) {
    return c->get();
  }
  return nullptr;
}

// Human-readable name used in "cannot assign to ..." messages
const char* DescribeForAssignment(const CompoundNode& node) {
  switch (node.kind) {
    case CompoundKind::kCompare: return "comparison";
    case CompoundKind::kLambda: return "lambda";
    case CompoundKind::kIfExp: return "conditional expression";
    case CompoundKind::kNamedExpr: return "named expression";
    case CompoundKind::kComprehension: return "comprehension";
    case CompoundKind::kDict: return "dict literal";
    case CompoundKind::kSet: return "set display";
    case CompoundKind::kAwait: return "await expression";
    case CompoundKind::kYield: return "yield expression";
    case CompoundKind::kFormattedString: return "f-string expression";
    default: return "expression";
  }
}

// Incremental line/column lookup inside a string token body
class BodyCursor {
 public:
  explicit BodyCursor(const Token& tok)
      : tok_(tok), line_(tok.body_line), column_(tok.body_column) {}

  SourcePos At(size_t target) {
    if (target < index_) {
      index_ = 0;
      line_ = tok_.body_line;
      column_ = tok_.body_column;
    }
    for (; index_ < target && index_ < tok_.body.size(); ++index_) {
      if (tok_.body[index_] == '\n') {
        line_++;
        column_ = 1;
      } else {
        column_++;
      }
    }
    return SourcePos{line_, column_};
  }

 private:
  const Token& tok_;
  size_t index_ = 0;
  int line_;
  int column_;
};

class Parser {
 public:
  Parser(std::vector<Token> tokens, int depth) : toks_(std::move(tokens)), depth_(depth) {}

  SyntaxNode ParseFile();

 private:
  struct Scope {
    bool in_function = false;
    bool in_async = false;
    bool in_loop = false;
  };

  class NestingGuard {
   public:
    explicit NestingGuard(Parser& parser) : parser_(parser) {
      if (++parser_.depth_ > kMaxNestingDepth) {
        --parser_.depth_;
        parser_.Fail("expression too deeply nested");
      }
    }
    ~NestingGuard() { --parser_.depth_; }

   private:
    Parser& parser_;
  };

  // Token access
  const Token& Cur() const { return toks_[pos_]; }
  const Token& PeekTok(size_t ahead = 1) const {
    return toks_[std::min(pos_ + ahead, toks_.size() - 1)];
  }
  const Token& Next() {
    const Token& tok = toks_[pos_];
    if (pos_ + 1 < toks_.size()) pos_++;
    return tok;
  }
  bool AtOp(const char* op) const { return Cur().IsOp(op); }
  bool AtKeyword(const char* kw) const { return Cur().IsName(kw); }
  bool AcceptOp(const char* op) {
    if (!AtOp(op)) return false;
    Next();
    return true;
  }
  bool AcceptKeyword(const char* kw) {
    if (!AtKeyword(kw)) return false;
    Next();
    return true;
  }
  bool AtStatementEnd() const {
    return Cur().type == TokenType::kNewline || Cur().type == TokenType::kEndMarker || AtOp(";");
  }
  bool AtComprehension() const {
    return AtKeyword("for") || (AtKeyword("async") && PeekTok().IsName("for"));
  }
  bool StartsExpression() const;

  [[noreturn]] void Fail(const std::string& message) const {
    throw ParseError(message, Cur().line, Cur().column);
  }
  [[noreturn]] void FailAt(const std::string& message, SourcePos pos) const {
    throw ParseError(message, pos.line, pos.column);
  }
  void ExpectOp(const char* op);
  std::string ExpectName();
  std::string ParseDottedName();

  // Statements
  void ParseStatement(std::vector<SyntaxNode>& out);
  void ParseSimpleStatements(std::vector<SyntaxNode>& out);
  void ParseBlock(std::vector<SyntaxNode>& body, const char* what, const Token& header);
  SyntaxNode ParseSmallStatement();
  SyntaxNode ParseExprStatement();
  SyntaxNode ParseImport();
  SyntaxNode ParseImportFrom();
  SyntaxNode ParseIf();
  SyntaxNode ParseElse(CompoundKind kind);
  SyntaxNode ParseWhile();
  SyntaxNode ParseFor(const Token& start, bool is_async);
  SyntaxNode ParseTry();
  SyntaxNode ParseWith(const Token& start, bool is_async);
  void ParseWithItem(std::vector<SyntaxNode>& out);
  SyntaxNode ParseFunctionDef(std::vector<SyntaxNode> decorators, const Token& start, bool is_async);
  SyntaxNode ParseClassDef(std::vector<SyntaxNode> decorators, const Token& start);
  SyntaxNode ParseDecorated();
  SyntaxNode ParseAsync();
  void ParseParameters(std::vector<SyntaxNode>& out, const char* closer, bool annotations);

  void CheckAssignTarget(const SyntaxNode& node, const char* verb) const;
  void CheckAugTarget(const SyntaxNode& node) const;

  // Expressions
  SyntaxNode ParseTestListStarExpr();
  SyntaxNode ParseExprList();
  SyntaxNode ParseTestOrStar(bool allow_named);
  SyntaxNode ParseNamedExprTest();
  SyntaxNode ParseTest();
  SyntaxNode ParseLambda();
  SyntaxNode ParseOrTest();
  SyntaxNode ParseAndTest();
  SyntaxNode ParseNotTest();
  SyntaxNode ParseComparison();
  SyntaxNode ParseExpr() { return ParseBinaryLevel(0); }
  SyntaxNode ParseBinaryLevel(size_t level);
  SyntaxNode ParseFactor();
  SyntaxNode ParsePower();
  SyntaxNode ParseAwaitPrimary();
  SyntaxNode ParsePrimary();
  void ParseCallArguments(std::vector<SyntaxNode>& args);
  SyntaxNode ParseSubscriptList();
  SyntaxNode ParseSubscript();
  SyntaxNode ParseAtom();
  SyntaxNode ParseParenthesized();
  SyntaxNode ParseListDisplay();
  SyntaxNode ParseBraceDisplay();
  SyntaxNode ParseComprehension(const char* label, std::vector<SyntaxNode> elements, SourcePos pos);
  SyntaxNode ParseYieldExpr();

  // Strings and f-strings
  SyntaxNode ParseStrings();
  void ScanFormatBody(const Token& tok, BodyCursor& cursor, size_t& i, bool in_spec,
                      std::vector<SyntaxNode>& out, int nesting);
  void ParseReplacementField(const Token& tok, BodyCursor& cursor, size_t& i,
                             std::vector<SyntaxNode>& out, int nesting);
  SyntaxNode ParseFieldExpression(const std::string& text, SourcePos pos);
  SyntaxNode ParseWrappedExpression();

  std::vector<Token> toks_;
  size_t pos_ = 0;
  int depth_;
  Scope scope_;
};

bool Parser::StartsExpression() const {
  const Token& t = Cur();
  switch (t.type) {
    case TokenType::kNumber:
    case TokenType::kString:
      return true;
    case TokenType::kName:
      return !IsKeyword(t.text) || t.text == "not" || t.text == "lambda" || t.text == "await" ||
             t.text == "None" || t.text == "True" || t.text == "False";
    case TokenType::kOp:
      return t.text == "(" || t.text == "[" || t.text == "{" || t.text == "-" || t.text == "+" ||
             t.text == "~" || t.text == "*" || t.text == "...";
    default:
      return false;
  }
}

void Parser::ExpectOp(const char* op) {
  if (AcceptOp(op)) {
    return;
  }
  if (std::string(op) == ":") {
    Fail("expected ':'");
  }
  if ((std::string(op) == ")" || std::string(op) == "]" || std::string(op) == "}") &&
      StartsExpression()) {
    Fail("invalid syntax. Perhaps you forgot a comma?");
  }
  Fail(Cur().type == TokenType::kEndMarker ? "unexpected EOF while parsing" : "invalid syntax");
}

std::string Parser::ExpectName() {
  const Token& t = Cur();
  if (t.type != TokenType::kName || IsKeyword(t.text)) {
    Fail("invalid syntax");
  }
  Next();
  return t.text;
}

std::string Parser::ParseDottedName() {
  std::string name = ExpectName();
  while (AcceptOp(".")) {
    name += ".";
    name += ExpectName();
  }
  return name;
}

// ---------------------------------------------------------------------------
// Statements
// ---------------------------------------------------------------------------

SyntaxNode Parser::ParseFile() {
  std::vector<SyntaxNode> body;
  while (Cur().type != TokenType::kEndMarker) {
    if (Cur().type == TokenType::kNewline) {
      Next();
      continue;
    }
    ParseStatement(body);
  }
  return MakeCompound(CompoundKind::kModule, SourcePos{1, 1}, "", std::move(body));
}

void Parser::ParseStatement(std::vector<SyntaxNode>& out) {
  const Token& t = Cur();
  if (t.type == TokenType::kIndent) {
    Fail("unexpected indent");
  }
  if (t.type == TokenType::kName) {
    if (t.text == "if") {
      out.push_back(ParseIf());
      return;
    }
    if (t.text == "while") {
      out.push_back(ParseWhile());
      return;
    }
    if (t.text == "for") {
      const Token start = t;
      out.push_back(ParseFor(start, false));
      return;
    }
    if (t.text == "try") {
      out.push_back(ParseTry());
      return;
    }
    if (t.text == "with") {
      const Token start = t;
      out.push_back(ParseWith(start, false));
      return;
    }
    if (t.text == "def") {
      const Token start = t;
      out.push_back(ParseFunctionDef({}, start, false));
      return;
    }
    if (t.text == "class") {
      const Token start = t;
      out.push_back(ParseClassDef({}, start));
      return;
    }
    if (t.text == "async") {
      out.push_back(ParseAsync());
      return;
    }
  }
  if (AtOp("@")) {
    out.push_back(ParseDecorated());
    return;
  }
  ParseSimpleStatements(out);
}

void Parser::ParseSimpleStatements(std::vector<SyntaxNode>& out) {
  while (true) {
    out.push_back(ParseSmallStatement());
    if (!AcceptOp(";")) break;
    if (Cur().type == TokenType::kNewline) break;
  }
  if (Cur().type != TokenType::kNewline) {
    Fail("invalid syntax");
  }
  Next();
}

void Parser::ParseBlock(std::vector<SyntaxNode>& body, const char* what, const Token& header) {
  ExpectOp(":");
  if (Cur().type != TokenType::kNewline) {
    ParseSimpleStatements(body);
    return;
  }
  Next();
  if (Cur().type != TokenType::kIndent) {
    Fail(fmt::format("expected an indented block after {} on line {}", what, header.line));
  }
  Next();
  while (Cur().type != TokenType::kDedent && Cur().type != TokenType::kEndMarker) {
    if (Cur().type == TokenType::kNewline) {
      Next();
      continue;
    }
    ParseStatement(body);
  }
  if (Cur().type == TokenType::kDedent) {
    Next();
  }
}

SyntaxNode Parser::ParseSmallStatement() {
  const Token& t = Cur();
  const SourcePos pos = PosOf(t);
  if (t.type != TokenType::kName) {
    return ParseExprStatement();
  }

  if (t.text == "pass") {
    Next();
    return MakeCompound(CompoundKind::kPass, pos);
  }
  if (t.text == "break") {
    if (!scope_.in_loop) Fail("'break' outside loop");
    Next();
    return MakeCompound(CompoundKind::kBreak, pos);
  }
  if (t.text == "continue") {
    if (!scope_.in_loop) Fail("'continue' not properly in loop");
    Next();
    return MakeCompound(CompoundKind::kContinue, pos);
  }
  if (t.text == "return") {
    if (!scope_.in_function) Fail("'return' outside function");
    Next();
    std::vector<SyntaxNode> children;
    if (!AtStatementEnd()) {
      children.push_back(ParseTestListStarExpr());
    }
    return MakeCompound(CompoundKind::kReturn, pos, "", std::move(children));
  }
  if (t.text == "raise") {
    Next();
    std::vector<SyntaxNode> children;
    if (!AtStatementEnd()) {
      children.push_back(ParseTest());
      if (AcceptKeyword("from")) {
        children.push_back(ParseTest());
      }
    }
    return MakeCompound(CompoundKind::kRaise, pos, "", std::move(children));
  }
  if (t.text == "global" || t.text == "nonlocal") {
    const bool is_global = t.text == "global";
    if (!is_global && !scope_.in_function) {
      Fail("nonlocal declaration not allowed at module level");
    }
    Next();
    std::string names = ExpectName();
    while (AcceptOp(",")) {
      names += "," + ExpectName();
    }
    return MakeCompound(is_global ? CompoundKind::kGlobal : CompoundKind::kNonlocal, pos, names);
  }
  if (t.text == "del") {
    Next();
    SyntaxNode targets = ParseExprList();
    CheckAssignTarget(targets, "delete");
    std::vector<SyntaxNode> children;
    children.push_back(std::move(targets));
    return MakeCompound(CompoundKind::kDelete, pos, "", std::move(children));
  }
  if (t.text == "assert") {
    Next();
    std::vector<SyntaxNode> children;
    children.push_back(ParseTest());
    if (AcceptOp(",")) {
      children.push_back(ParseTest());
    }
    return MakeCompound(CompoundKind::kAssert, pos, "", std::move(children));
  }
  if (t.text == "import") {
    return ParseImport();
  }
  if (t.text == "from") {
    return ParseImportFrom();
  }
  return ParseExprStatement();
}

SyntaxNode Parser::ParseImport() {
  auto node = std::make_unique<ImportNode>();
  node->pos = PosOf(Next());
  do {
    ImportAlias alias;
    alias.name = ParseDottedName();
    if (AcceptKeyword("as")) {
      alias.asname = ExpectName();
    }
    node->names.push_back(std::move(alias));
  } while (AcceptOp(","));
  return SyntaxNode(std::move(node));
}

SyntaxNode Parser::ParseImportFrom() {
  auto node = std::make_unique<ImportFromNode>();
  node->pos = PosOf(Next());

  while (AtOp(".") || AtOp("...")) {
    node->level += static_cast<int>(Next().text.size());
  }
  if (!AtKeyword("import")) {
    node->module = ParseDottedName();
  } else if (node->level == 0) {
    Fail("invalid syntax");
  }
  if (!AcceptKeyword("import")) {
    Fail("invalid syntax");
  }

  if (AtOp("*")) {
    if (scope_.in_function) {
      Fail("import * only allowed at module level");
    }
    Next();
    node->names.push_back(ImportAlias{"*", ""});
    return SyntaxNode(std::move(node));
  }

  const bool parenthesized = AcceptOp("(");
  while (true) {
    if (parenthesized && AtOp(")")) break;
    ImportAlias alias;
    alias.name = ExpectName();
    if (AcceptKeyword("as")) {
      alias.asname = ExpectName();
    }
    node->names.push_back(std::move(alias));
    if (!AcceptOp(",")) break;
    if (!parenthesized && AtStatementEnd()) {
      Fail("trailing comma not allowed without surrounding parentheses");
    }
  }
  if (parenthesized) {
    ExpectOp(")");
  }
  if (node->names.empty()) {
    Fail("invalid syntax");
  }
  return SyntaxNode(std::move(node));
}

SyntaxNode Parser::ParseExprStatement() {
  const Token start = Cur();
  const SourcePos pos = PosOf(start);

  SyntaxNode first = AtKeyword("yield") ? ParseYieldExpr() : ParseTestListStarExpr();

  if (AtOp(":")) {
    const CompoundNode* c = AsCompound(first);
    if (c && c->kind == CompoundKind::kTuple) {
      Fail("only single target (not tuple) can be annotated");
    }
    const bool simple = std::holds_alternative<NameNode>(first) ||
                        std::holds_alternative<std::unique_ptr<AttributeNode>>(first) ||
                        (c && c->kind == CompoundKind::kSubscript);
    if (!simple) {
      Fail("illegal target for annotation");
    }
    Next();
    std::vector<SyntaxNode> children;
    children.push_back(std::move(first));
    children.push_back(ParseTest());
    if (AcceptOp("=")) {
      children.push_back(AtKeyword("yield") ? ParseYieldExpr() : ParseTestListStarExpr());
    }
    return MakeCompound(CompoundKind::kAnnAssign, pos, "", std::move(children));
  }

  if (Cur().type == TokenType::kOp && IsAugAssignOp(Cur().text)) {
    CheckAugTarget(first);
    std::string op = Next().text;
    std::vector<SyntaxNode> children;
    children.push_back(std::move(first));
    children.push_back(AtKeyword("yield") ? ParseYieldExpr() : ParseTestListStarExpr());
    return MakeCompound(CompoundKind::kAugAssign, pos, op, std::move(children));
  }

  if (AtOp("=")) {
    std::vector<SyntaxNode> parts;
    parts.push_back(std::move(first));
    while (AcceptOp("=")) {
      parts.push_back(AtKeyword("yield") ? ParseYieldExpr() : ParseTestListStarExpr());
    }
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
      CheckAssignTarget(parts[i], "assign to");
    }
    return MakeCompound(CompoundKind::kAssign, pos, "", std::move(parts));
  }

  const CompoundNode* c = AsCompound(first);
  if (c && c->kind == CompoundKind::kStarred) {
    FailAt("can't use starred expression here", c->pos);
  }

  if (!AtStatementEnd()) {
    auto* name = std::get_if<NameNode>(&first);
    if (name && (name->id == "print" || name->id == "exec") && StartsExpression()) {
      FailAt(fmt::format("Missing parentheses in call to '{}'. Did you mean {}(...)?",
                         name->id, name->id),
             pos);
    }
  }

  std::vector<SyntaxNode> children;
  children.push_back(std::move(first));
  return MakeCompound(CompoundKind::kExprStmt, pos, "", std::move(children));
}

SyntaxNode Parser::ParseIf() {
  const Token kw = Next();
  std::vector<SyntaxNode> children;
  children.push_back(ParseNamedExprTest());
  ParseBlock(children, "'if' statement", kw);

  while (AtKeyword("elif")) {
    const Token elif = Next();
    std::vector<SyntaxNode> branch;
    branch.push_back(ParseNamedExprTest());
    ParseBlock(branch, "'elif' statement", elif);
    children.push_back(MakeCompound(CompoundKind::kIf, PosOf(elif), "elif", std::move(branch)));
  }
  if (AtKeyword("else")) {
    children.push_back(ParseElse(CompoundKind::kIf));
  }
  return MakeCompound(CompoundKind::kIf, PosOf(kw), "", std::move(children));
}

SyntaxNode Parser::ParseElse(CompoundKind kind) {
  const Token kw = Next();
  std::vector<SyntaxNode> body;
  ParseBlock(body, "'else' statement", kw);
  return MakeCompound(kind, PosOf(kw), "else", std::move(body));
}

SyntaxNode Parser::ParseWhile() {
  const Token kw = Next();
  std::vector<SyntaxNode> children;
  children.push_back(ParseNamedExprTest());

  const Scope saved = scope_;
  scope_.in_loop = true;
  ParseBlock(children, "'while' statement", kw);
  scope_ = saved;

  if (AtKeyword("else")) {
    children.push_back(ParseElse(CompoundKind::kWhile));
  }
  return MakeCompound(CompoundKind::kWhile, PosOf(kw), "", std::move(children));
}

SyntaxNode Parser::ParseFor(const Token& start, bool is_async) {
  Next();  // 'for'
  std::vector<SyntaxNode> children;
  children.push_back(ParseExprList());
  CheckAssignTarget(children.back(), "assign to");
  if (!AcceptKeyword("in")) {
    Fail("invalid syntax");
  }
  children.push_back(ParseTestListStarExpr());

  const Scope saved = scope_;
  scope_.in_loop = true;
  ParseBlock(children, "'for' statement", start);
  scope_ = saved;

  if (AtKeyword("else")) {
    children.push_back(ParseElse(CompoundKind::kFor));
  }
  return MakeCompound(CompoundKind::kFor, PosOf(start), is_async ? "async" : "",
                      std::move(children));
}

SyntaxNode Parser::ParseTry() {
  const Token kw = Next();
  std::vector<SyntaxNode> children;
  ParseBlock(children, "'try' statement", kw);

  bool has_plain = false;
  bool has_star = false;
  bool saw_bare = false;
  while (AtKeyword("except")) {
    const Token ex = Next();
    if (saw_bare) {
      FailAt("default 'except:' must be last", PosOf(ex));
    }
    const bool star = AcceptOp("*");
    (star ? has_star : has_plain) = true;
    if (has_star && has_plain) {
      FailAt("cannot have both 'except' and 'except*' on the same 'try'", PosOf(ex));
    }

    std::vector<SyntaxNode> handler;
    std::string name;
    if (AtOp(":")) {
      if (star) Fail("expected one or more exception types");
      saw_bare = true;
    } else {
      handler.push_back(ParseTest());
      if (AtOp(",")) {
        Fail("multiple exception types must be parenthesized");
      }
      if (AcceptKeyword("as")) {
        name = ExpectName();
      }
    }
    ParseBlock(handler, "'except' statement", ex);
    children.push_back(MakeCompound(CompoundKind::kExceptHandler, PosOf(ex),
                                    star ? "*" + name : name, std::move(handler)));
  }

  const bool has_handler = has_plain || has_star;
  if (!has_handler && !AtKeyword("finally")) {
    Fail("expected 'except' or 'finally' block");
  }
  if (has_handler && AtKeyword("else")) {
    children.push_back(ParseElse(CompoundKind::kTry));
  }
  if (AtKeyword("finally")) {
    const Token fin = Next();
    std::vector<SyntaxNode> body;
    ParseBlock(body, "'finally' statement", fin);
    children.push_back(MakeCompound(CompoundKind::kTry, PosOf(fin), "finally", std::move(body)));
  }
  return MakeCompound(CompoundKind::kTry, PosOf(kw), "", std::move(children));
}

SyntaxNode Parser::ParseWith(const Token& start, bool is_async) {
  Next();  // 'with'
  std::vector<SyntaxNode> children;

  bool parsed = false;
  if (AtOp("(")) {
    // Parenthesized item list; falls back to an ordinary expression on failure
    const size_t save = pos_;
    std::vector<SyntaxNode> items;
    try {
      Next();
      while (!AtOp(")")) {
        ParseWithItem(items);
        if (!AcceptOp(",")) break;
      }
      ExpectOp(")");
      if (items.empty() || !AtOp(":")) {
        Fail("invalid syntax");
      }
      children = std::move(items);
      parsed = true;
    } catch (const ParseError&) {
      pos_ = save;
    }
  }
  if (!parsed) {
    do {
      ParseWithItem(children);
    } while (AcceptOp(","));
  }

  ParseBlock(children, "'with' statement", start);
  return MakeCompound(CompoundKind::kWith, PosOf(start), is_async ? "async" : "",
                      std::move(children));
}

void Parser::ParseWithItem(std::vector<SyntaxNode>& out) {
  out.push_back(ParseTest());
  if (AcceptKeyword("as")) {
    SyntaxNode target = ParseExpr();
    CheckAssignTarget(target, "assign to");
    out.push_back(std::move(target));
  }
}

SyntaxNode Parser::ParseFunctionDef(std::vector<SyntaxNode> decorators, const Token& start,
                                    bool is_async) {
  Next();  // 'def'
  const std::string name = ExpectName();
  std::vector<SyntaxNode> children = std::move(decorators);

  if (!AtOp("(")) {
    Fail("expected '('");
  }
  Next();
  ParseParameters(children, ")", true);
  ExpectOp(")");
  if (AcceptOp("->")) {
    children.push_back(ParseTest());
  }

  const Scope saved = scope_;
  scope_ = Scope{true, is_async, false};
  ParseBlock(children, "function definition", start);
  scope_ = saved;

  return MakeCompound(CompoundKind::kFunctionDef, PosOf(start),
                      is_async ? "async " + name : name, std::move(children));
}

SyntaxNode Parser::ParseClassDef(std::vector<SyntaxNode> decorators, const Token& start) {
  Next();  // 'class'
  const std::string name = ExpectName();
  std::vector<SyntaxNode> children = std::move(decorators);

  if (AcceptOp("(")) {
    ParseCallArguments(children);
    ExpectOp(")");
  }

  const Scope saved = scope_;
  scope_ = Scope{};
  ParseBlock(children, "class definition", start);
  scope_ = saved;

  return MakeCompound(CompoundKind::kClassDef, PosOf(start), name, std::move(children));
}

SyntaxNode Parser::ParseDecorated() {
  const Token start = Cur();
  std::vector<SyntaxNode> decorators;
  while (AtOp("@")) {
    const Token at = Next();
    std::vector<SyntaxNode> expr;
    expr.push_back(ParseNamedExprTest());
    if (Cur().type != TokenType::kNewline) {
      Fail("invalid syntax");
    }
    Next();
    decorators.push_back(MakeCompound(CompoundKind::kDecorator, PosOf(at), "", std::move(expr)));
  }

  if (AtKeyword("def")) {
    return ParseFunctionDef(std::move(decorators), start, false);
  }
  if (AtKeyword("class")) {
    return ParseClassDef(std::move(decorators), start);
  }
  if (AtKeyword("async") && PeekTok().IsName("def")) {
    Next();
    return ParseFunctionDef(std::move(decorators), start, true);
  }
  Fail("invalid syntax");
}

SyntaxNode Parser::ParseAsync() {
  const Token start = Next();  // 'async'
  if (AtKeyword("def")) {
    return ParseFunctionDef({}, start, true);
  }
  if (AtKeyword("for")) {
    if (!scope_.in_async) FailAt("'async for' outside async function", PosOf(start));
    return ParseFor(start, true);
  }
  if (AtKeyword("with")) {
    if (!scope_.in_async) FailAt("'async with' outside async function", PosOf(start));
    return ParseWith(start, true);
  }
  Fail("invalid syntax");
}

void Parser::ParseParameters(std::vector<SyntaxNode>& out, const char* closer, bool annotations) {
  std::set<std::string> seen;
  bool seen_default = false;
  bool seen_star = false;
  bool seen_kwargs = false;
  bool seen_slash = false;
  bool bare_star_pending = false;
  size_t count = 0;

  auto add_param = [&](const std::string& name, const std::string& label, SourcePos pos,
                       std::vector<SyntaxNode> parts) {
    if (!seen.insert(name).second) {
      FailAt(fmt::format("duplicate argument '{}' in function definition", name), pos);
    }
    out.push_back(MakeCompound(CompoundKind::kParameter, pos, label, std::move(parts)));
    count++;
  };
  auto annotation = [&](std::vector<SyntaxNode>& parts) {
    if (annotations && AcceptOp(":")) {
      parts.push_back(ParseTest());
    }
  };

  while (!AtOp(closer)) {
    if (seen_kwargs) {
      Fail("arguments cannot follow var-keyword argument");
    }
    const SourcePos pos = PosOf(Cur());

    if (AcceptOp("/")) {
      if (seen_slash) Fail("/ may appear only once");
      if (seen_star) Fail("/ must be ahead of *");
      if (count == 0) Fail("at least one argument must precede /");
      seen_slash = true;
    } else if (AcceptOp("**")) {
      std::string name = ExpectName();
      std::vector<SyntaxNode> parts;
      annotation(parts);
      add_param(name, "**" + name, pos, std::move(parts));
      seen_kwargs = true;
    } else if (AcceptOp("*")) {
      if (seen_star) Fail("* argument may appear only once");
      seen_star = true;
      if (AtOp(",") || AtOp(closer)) {
        bare_star_pending = true;
      } else {
        std::string name = ExpectName();
        std::vector<SyntaxNode> parts;
        annotation(parts);
        add_param(name, "*" + name, pos, std::move(parts));
      }
    } else {
      std::string name = ExpectName();
      std::vector<SyntaxNode> parts;
      annotation(parts);
      if (AcceptOp("=")) {
        parts.push_back(ParseTest());
        seen_default = true;
      } else if (seen_default && !seen_star) {
        FailAt("parameter without a default follows parameter with a default", pos);
      }
      add_param(name, name, pos, std::move(parts));
      bare_star_pending = false;
    }

    if (!AcceptOp(",")) break;
  }

  if (bare_star_pending) {
    Fail("named arguments must follow bare *");
  }
}

void Parser::CheckAssignTarget(const SyntaxNode& node, const char* verb) const {
  const SourcePos pos = PositionOf(node);
  if (std::holds_alternative<NameNode>(node) ||
      std::holds_alternative<std::unique_ptr<AttributeNode>>(node)) {
    return;
  }
  if (auto* constant = std::get_if<ConstantNode>(&node)) {
    const std::string& text = constant->text;
    if (text == "True" || text == "False" || text == "None" || text == "...") {
      FailAt(fmt::format("cannot {} {}", verb, text == "..." ? "ellipsis" : text), pos);
    }
    FailAt(fmt::format("cannot {} literal", verb), pos);
  }
  if (std::holds_alternative<std::unique_ptr<CallNode>>(node)) {
    FailAt(fmt::format("cannot {} function call", verb), pos);
  }
  const CompoundNode* c = AsCompound(node);
  if (!c) {
    FailAt(fmt::format("cannot {} expression", verb), pos);
  }
  switch (c->kind) {
    case CompoundKind::kSubscript:
      return;
    case CompoundKind::kTuple:
    case CompoundKind::kList:
    case CompoundKind::kStarred:
      for (const auto& child : c->children) {
        CheckAssignTarget(child, verb);
      }
      return;
    default:
      FailAt(fmt::format("cannot {} {}", verb, DescribeForAssignment(*c)), pos);
  }
}

void Parser::CheckAugTarget(const SyntaxNode& node) const {
  if (std::holds_alternative<NameNode>(node) ||
      std::holds_alternative<std::unique_ptr<AttributeNode>>(node)) {
    return;
  }
  const CompoundNode* c = AsCompound(node);
  if (c && c->kind == CompoundKind::kSubscript) {
    return;
  }
  FailAt("illegal expression for augmented assignment", PositionOf(node));
}

// ---------------------------------------------------------------------------
// Expressions
// ---------------------------------------------------------------------------

SyntaxNode Parser::ParseTestListStarExpr() {
  const SourcePos pos = PosOf(Cur());
  SyntaxNode first = ParseTestOrStar(false);
  if (!AtOp(",")) {
    return first;
  }
  std::vector<SyntaxNode> items;
  items.push_back(std::move(first));
  while (AcceptOp(",")) {
    if (!StartsExpression()) break;
    items.push_back(ParseTestOrStar(false));
  }
  return MakeCompound(CompoundKind::kTuple, pos, "", std::move(items));
}

SyntaxNode Parser::ParseExprList() {
  const SourcePos pos = PosOf(Cur());
  auto item = [this]() -> SyntaxNode {
    if (AtOp("*")) {
      const SourcePos star = PosOf(Next());
      std::vector<SyntaxNode> inner;
      inner.push_back(ParseExpr());
      return MakeCompound(CompoundKind::kStarred, star, "*", std::move(inner));
    }
    return ParseExpr();
  };

  SyntaxNode first = item();
  if (!AtOp(",")) {
    return first;
  }
  std::vector<SyntaxNode> items;
  items.push_back(std::move(first));
  while (AcceptOp(",")) {
    if (!StartsExpression()) break;
    items.push_back(item());
  }
  return MakeCompound(CompoundKind::kTuple, pos, "", std::move(items));
}

SyntaxNode Parser::ParseTestOrStar(bool allow_named) {
  if (AtOp("*")) {
    const SourcePos pos = PosOf(Next());
    std::vector<SyntaxNode> inner;
    inner.push_back(ParseExpr());
    return MakeCompound(CompoundKind::kStarred, pos, "*", std::move(inner));
  }
  return allow_named ? ParseNamedExprTest() : ParseTest();
}

SyntaxNode Parser::ParseNamedExprTest() {
  if (Cur().type == TokenType::kName && PeekTok().IsOp(":=")) {
    const Token target = Cur();
    if (IsKeyword(target.text)) {
      Fail(fmt::format("cannot use assignment expressions with {}", target.text));
    }
    Next();
    Next();
    std::vector<SyntaxNode> children;
    children.push_back(NameNode{target.text, PosOf(target)});
    children.push_back(ParseTest());
    return MakeCompound(CompoundKind::kNamedExpr, PosOf(target), target.text, std::move(children));
  }
  return ParseTest();
}

SyntaxNode Parser::ParseTest() {
  NestingGuard guard(*this);
  if (AtKeyword("lambda")) {
    return ParseLambda();
  }
  const SourcePos pos = PosOf(Cur());
  SyntaxNode body = ParseOrTest();
  if (!AtKeyword("if")) {
    return body;
  }
  Next();
  std::vector<SyntaxNode> children;
  children.push_back(std::move(body));
  children.push_back(ParseOrTest());
  if (!AcceptKeyword("else")) {
    Fail("expected 'else' after 'if' expression");
  }
  children.push_back(ParseTest());
  return MakeCompound(CompoundKind::kIfExp, pos, "", std::move(children));
}

SyntaxNode Parser::ParseLambda() {
  const Token kw = Next();
  std::vector<SyntaxNode> children;
  ParseParameters(children, ":", false);
  ExpectOp(":");
  children.push_back(ParseTest());
  return MakeCompound(CompoundKind::kLambda, PosOf(kw), "", std::move(children));
}

SyntaxNode Parser::ParseOrTest() {
  const SourcePos pos = PosOf(Cur());
  SyntaxNode first = ParseAndTest();
  if (!AtKeyword("or")) {
    return first;
  }
  std::vector<SyntaxNode> items;
  items.push_back(std::move(first));
  while (AcceptKeyword("or")) {
    items.push_back(ParseAndTest());
  }
  return MakeCompound(CompoundKind::kBoolOp, pos, "or", std::move(items));
}

SyntaxNode Parser::ParseAndTest() {
  const SourcePos pos = PosOf(Cur());
  SyntaxNode first = ParseNotTest();
  if (!AtKeyword("and")) {
    return first;
  }
  std::vector<SyntaxNode> items;
  items.push_back(std::move(first));
  while (AcceptKeyword("and")) {
    items.push_back(ParseNotTest());
  }
  return MakeCompound(CompoundKind::kBoolOp, pos, "and", std::move(items));
}

SyntaxNode Parser::ParseNotTest() {
  if (!AtKeyword("not")) {
    return ParseComparison();
  }
  NestingGuard guard(*this);
  const SourcePos pos = PosOf(Next());
  std::vector<SyntaxNode> children;
  children.push_back(ParseNotTest());
  return MakeCompound(CompoundKind::kUnaryOp, pos, "not", std::move(children));
}

SyntaxNode Parser::ParseComparison() {
  const SourcePos pos = PosOf(Cur());
  SyntaxNode first = ParseExpr();

  std::vector<SyntaxNode> items;
  std::string ops;
  while (true) {
    std::string op;
    const Token& t = Cur();
    if (t.type == TokenType::kOp &&
        (t.text == "<" || t.text == ">" || t.text == "==" || t.text == ">=" ||
         t.text == "<=" || t.text == "!=")) {
      op = Next().text;
    } else if (t.IsName("in")) {
      Next();
      op = "in";
    } else if (t.IsName("not") && PeekTok().IsName("in")) {
      Next();
      Next();
      op = "not in";
    } else if (t.IsName("is")) {
      Next();
      op = AcceptKeyword("not") ? "is not" : "is";
    } else {
      break;
    }
    if (items.empty()) {
      items.push_back(std::move(first));
    }
    ops += ops.empty() ? op : "," + op;
    items.push_back(ParseExpr());
  }

  if (items.empty()) {
    return first;
  }
  return MakeCompound(CompoundKind::kCompare, pos, ops, std::move(items));
}

SyntaxNode Parser::ParseBinaryLevel(size_t level) {
  static const std::vector<std::vector<std::string>> kLevels = {
      {"|"}, {"^"}, {"&"}, {"<<", ">>"}, {"+", "-"}, {"*", "/", "%", "//", "@"},
  };
  if (level == kLevels.size()) {
    return ParseFactor();
  }

  const auto& ops = kLevels[level];
  auto at_level_op = [&]() {
    return Cur().type == TokenType::kOp &&
           std::find(ops.begin(), ops.end(), Cur().text) != ops.end();
  };

  const SourcePos pos = PosOf(Cur());
  SyntaxNode first = ParseBinaryLevel(level + 1);
  if (!at_level_op()) {
    return first;
  }

  // Same-precedence chains are kept flat
  std::vector<SyntaxNode> items;
  items.push_back(std::move(first));
  std::string label;
  while (at_level_op()) {
    label += label.empty() ? Next().text : " " + Next().text;
    items.push_back(ParseBinaryLevel(level + 1));
  }
  return MakeCompound(CompoundKind::kBinOp, pos, label, std::move(items));
}

SyntaxNode Parser::ParseFactor() {
  if (AtOp("+") || AtOp("-") || AtOp("~")) {
    NestingGuard guard(*this);
    const Token op = Next();
    std::vector<SyntaxNode> children;
    children.push_back(ParseFactor());
    return MakeCompound(CompoundKind::kUnaryOp, PosOf(op), op.text, std::move(children));
  }
  return ParsePower();
}

SyntaxNode Parser::ParsePower() {
  const SourcePos pos = PosOf(Cur());
  SyntaxNode base = ParseAwaitPrimary();
  if (!AtOp("**")) {
    return base;
  }
  NestingGuard guard(*this);
  Next();
  std::vector<SyntaxNode> children;
  children.push_back(std::move(base));
  children.push_back(ParseFactor());
  return MakeCompound(CompoundKind::kBinOp, pos, "**", std::move(children));
}

SyntaxNode Parser::ParseAwaitPrimary() {
  if (!AtKeyword("await")) {
    return ParsePrimary();
  }
  if (!scope_.in_function) {
    Fail("'await' outside function");
  }
  if (!scope_.in_async) {
    Fail("'await' outside async function");
  }
  NestingGuard guard(*this);
  const SourcePos pos = PosOf(Next());
  std::vector<SyntaxNode> children;
  children.push_back(ParsePrimary());
  return MakeCompound(CompoundKind::kAwait, pos, "", std::move(children));
}

SyntaxNode Parser::ParsePrimary() {
  const SourcePos start = PosOf(Cur());
  SyntaxNode node = ParseAtom();

  int trailers = 0;
  while (true) {
    if (AtOp("(")) {
      Next();
      auto call = std::make_unique<CallNode>();
      call->pos = start;
      call->func = std::move(node);
      ParseCallArguments(call->args);
      ExpectOp(")");
      node = SyntaxNode(std::move(call));
    } else if (AtOp("[")) {
      Next();
      std::vector<SyntaxNode> children;
      children.push_back(std::move(node));
      children.push_back(ParseSubscriptList());
      ExpectOp("]");
      node = MakeCompound(CompoundKind::kSubscript, start, "", std::move(children));
    } else if (AtOp(".")) {
      Next();
      const Token& name = Cur();
      if (name.type != TokenType::kName || IsKeyword(name.text)) {
        Fail("invalid syntax");
      }
      auto attr = std::make_unique<AttributeNode>();
      attr->pos = PosOf(name);
      attr->attr = name.text;
      attr->value = std::move(node);
      Next();
      node = SyntaxNode(std::move(attr));
    } else {
      break;
    }
    if (++trailers > kMaxNestingDepth) {
      Fail("expression too deeply nested");
    }
  }
  return node;
}

void Parser::ParseCallArguments(std::vector<SyntaxNode>& args) {
  bool seen_keyword = false;
  bool seen_kw_unpack = false;
  std::set<std::string> keywords;

  while (!AtOp(")")) {
    const Token& t = Cur();
    const SourcePos pos = PosOf(t);

    if (AcceptOp("**")) {
      std::vector<SyntaxNode> inner;
      inner.push_back(ParseTest());
      args.push_back(MakeCompound(CompoundKind::kStarred, pos, "**", std::move(inner)));
      seen_kw_unpack = true;
    } else if (AcceptOp("*")) {
      if (seen_kw_unpack) {
        FailAt("iterable argument unpacking follows keyword argument unpacking", pos);
      }
      std::vector<SyntaxNode> inner;
      inner.push_back(ParseTest());
      args.push_back(MakeCompound(CompoundKind::kStarred, pos, "*", std::move(inner)));
    } else if (t.type == TokenType::kName && !IsKeyword(t.text) && PeekTok().IsOp("=")) {
      const std::string name = t.text;
      if (!keywords.insert(name).second) {
        FailAt(fmt::format("keyword argument repeated: {}", name), pos);
      }
      Next();
      Next();
      std::vector<SyntaxNode> inner;
      inner.push_back(ParseTest());
      args.push_back(MakeCompound(CompoundKind::kKeyword, pos, name, std::move(inner)));
      seen_keyword = true;
    } else {
      if (seen_kw_unpack) {
        FailAt("positional argument follows keyword argument unpacking", pos);
      }
      if (seen_keyword) {
        FailAt("positional argument follows keyword argument", pos);
      }
      SyntaxNode value = ParseNamedExprTest();
      if (AtComprehension()) {
        std::vector<SyntaxNode> elements;
        elements.push_back(std::move(value));
        SyntaxNode genexp = ParseComprehension("genexp", std::move(elements), pos);
        if (!args.empty() || (AtOp(",") && !PeekTok().IsOp(")"))) {
          FailAt("Generator expression must be parenthesized", pos);
        }
        args.push_back(std::move(genexp));
      } else {
        args.push_back(std::move(value));
      }
    }

    if (!AcceptOp(",")) break;
  }
}

SyntaxNode Parser::ParseSubscriptList() {
  const SourcePos pos = PosOf(Cur());
  std::vector<SyntaxNode> items;
  items.push_back(ParseSubscript());
  bool tuple = false;
  while (AcceptOp(",")) {
    tuple = true;
    if (AtOp("]")) break;
    items.push_back(ParseSubscript());
  }
  if (!tuple) {
    return std::move(items.front());
  }
  return MakeCompound(CompoundKind::kTuple, pos, "", std::move(items));
}

SyntaxNode Parser::ParseSubscript() {
  if (AtOp("*")) {
    return ParseTestOrStar(false);
  }
  const SourcePos pos = PosOf(Cur());
  std::vector<SyntaxNode> parts;
  if (!AtOp(":")) {
    SyntaxNode lower = ParseNamedExprTest();
    if (!AtOp(":")) {
      return lower;
    }
    parts.push_back(std::move(lower));
  }
  Next();  // ':'
  if (!AtOp(":") && !AtOp(",") && !AtOp("]")) {
    parts.push_back(ParseTest());
  }
  if (AcceptOp(":") && !AtOp(",") && !AtOp("]")) {
    parts.push_back(ParseTest());
  }
  return MakeCompound(CompoundKind::kSlice, pos, "", std::move(parts));
}

SyntaxNode Parser::ParseAtom() {
  const Token& t = Cur();
  const SourcePos pos = PosOf(t);
  switch (t.type) {
    case TokenType::kName:
      if (t.text == "True" || t.text == "False" || t.text == "None") {
        Next();
        return ConstantNode{t.text, pos};
      }
      if (IsKeyword(t.text)) {
        Fail("invalid syntax");
      }
      Next();
      return NameNode{t.text, pos};
    case TokenType::kNumber:
      Next();
      return ConstantNode{t.text, pos};
    case TokenType::kString:
      return ParseStrings();
    case TokenType::kOp:
      if (t.text == "(") return ParseParenthesized();
      if (t.text == "[") return ParseListDisplay();
      if (t.text == "{") return ParseBraceDisplay();
      if (t.text == "...") {
        Next();
        return ConstantNode{"...", pos};
      }
      break;
    case TokenType::kIndent:
      Fail("unexpected indent");
    case TokenType::kEndMarker:
      Fail("unexpected EOF while parsing");
    default:
      break;
  }
  Fail("invalid syntax");
}

SyntaxNode Parser::ParseParenthesized() {
  const SourcePos pos = PosOf(Next());
  if (AcceptOp(")")) {
    return MakeCompound(CompoundKind::kTuple, pos);
  }
  if (AtKeyword("yield")) {
    SyntaxNode y = ParseYieldExpr();
    ExpectOp(")");
    return y;
  }

  SyntaxNode first = ParseTestOrStar(true);
  if (AtComprehension()) {
    std::vector<SyntaxNode> elements;
    elements.push_back(std::move(first));
    SyntaxNode genexp = ParseComprehension("genexp", std::move(elements), pos);
    ExpectOp(")");
    return genexp;
  }
  if (!AtOp(",")) {
    ExpectOp(")");
    const CompoundNode* c = AsCompound(first);
    if (c && c->kind == CompoundKind::kStarred) {
      FailAt("cannot use starred expression here", c->pos);
    }
    return first;
  }

  std::vector<SyntaxNode> items;
  items.push_back(std::move(first));
  while (AcceptOp(",")) {
    if (AtOp(")")) break;
    items.push_back(ParseTestOrStar(true));
  }
  ExpectOp(")");
  return MakeCompound(CompoundKind::kTuple, pos, "", std::move(items));
}

SyntaxNode Parser::ParseListDisplay() {
  const SourcePos pos = PosOf(Next());
  std::vector<SyntaxNode> items;
  if (AcceptOp("]")) {
    return MakeCompound(CompoundKind::kList, pos);
  }

  items.push_back(ParseTestOrStar(true));
  if (AtComprehension()) {
    SyntaxNode comp = ParseComprehension("list", std::move(items), pos);
    ExpectOp("]");
    return comp;
  }
  while (AcceptOp(",")) {
    if (AtOp("]")) break;
    items.push_back(ParseTestOrStar(true));
  }
  ExpectOp("]");
  return MakeCompound(CompoundKind::kList, pos, "", std::move(items));
}

SyntaxNode Parser::ParseBraceDisplay() {
  const SourcePos pos = PosOf(Next());
  if (AcceptOp("}")) {
    return MakeCompound(CompoundKind::kDict, pos);
  }

  std::vector<SyntaxNode> items;
  bool is_dict = false;
  bool unpacked = false;

  if (AtOp("**")) {
    const SourcePos star = PosOf(Next());
    std::vector<SyntaxNode> inner;
    inner.push_back(ParseExpr());
    items.push_back(MakeCompound(CompoundKind::kStarred, star, "**", std::move(inner)));
    is_dict = true;
    unpacked = true;
  } else {
    items.push_back(ParseTestOrStar(true));
    if (AcceptOp(":")) {
      items.push_back(ParseTest());
      is_dict = true;
    }
  }

  if (AtComprehension()) {
    if (unpacked) {
      Fail("dict unpacking cannot be used in dict comprehension");
    }
    SyntaxNode comp = ParseComprehension(is_dict ? "dict" : "set", std::move(items), pos);
    ExpectOp("}");
    return comp;
  }

  while (AcceptOp(",")) {
    if (AtOp("}")) break;
    if (is_dict) {
      if (AtOp("**")) {
        const SourcePos star = PosOf(Next());
        std::vector<SyntaxNode> inner;
        inner.push_back(ParseExpr());
        items.push_back(MakeCompound(CompoundKind::kStarred, star, "**", std::move(inner)));
      } else {
        items.push_back(ParseTest());
        ExpectOp(":");
        items.push_back(ParseTest());
      }
    } else {
      items.push_back(ParseTestOrStar(true));
    }
  }
  ExpectOp("}");
  return MakeCompound(is_dict ? CompoundKind::kDict : CompoundKind::kSet, pos, "",
                      std::move(items));
}

SyntaxNode Parser::ParseComprehension(const char* label, std::vector<SyntaxNode> elements,
                                      SourcePos pos) {
  std::vector<SyntaxNode> children = std::move(elements);
  while (AtComprehension()) {
    const SourcePos clause_pos = PosOf(Cur());
    const bool is_async = AcceptKeyword("async");
    Next();  // 'for'

    std::vector<SyntaxNode> clause;
    clause.push_back(ParseExprList());
    CheckAssignTarget(clause.back(), "assign to");
    if (!AcceptKeyword("in")) {
      Fail("invalid syntax");
    }
    clause.push_back(ParseOrTest());
    while (AcceptKeyword("if")) {
      clause.push_back(ParseOrTest());
    }
    children.push_back(MakeCompound(CompoundKind::kFor, clause_pos, is_async ? "async" : "",
                                    std::move(clause)));
  }
  return MakeCompound(CompoundKind::kComprehension, pos, label, std::move(children));
}

SyntaxNode Parser::ParseYieldExpr() {
  const Token kw = Next();
  if (!scope_.in_function) {
    FailAt("'yield' outside function", PosOf(kw));
  }
  std::vector<SyntaxNode> children;
  std::string label;
  if (AcceptKeyword("from")) {
    label = "from";
    children.push_back(ParseTest());
  } else if (StartsExpression()) {
    children.push_back(ParseTestListStarExpr());
  }
  return MakeCompound(CompoundKind::kYield, PosOf(kw), label, std::move(children));
}

// ---------------------------------------------------------------------------
// Strings
// ---------------------------------------------------------------------------

SyntaxNode Parser::ParseStrings() {
  const SourcePos pos = PosOf(Cur());
  bool any_format = false;
  bool any_bytes = false;
  bool any_text = false;
  std::string text;
  std::vector<SyntaxNode> fields;

  while (Cur().type == TokenType::kString) {
    const Token tok = Next();
    const bool is_bytes = tok.prefix.find('b') != std::string::npos;
    (is_bytes ? any_bytes : any_text) = true;
    if (any_bytes && any_text) {
      FailAt("cannot mix bytes and nonbytes literals", PosOf(tok));
    }
    if (tok.prefix.find('f') != std::string::npos) {
      any_format = true;
      BodyCursor cursor(tok);
      size_t i = 0;
      ScanFormatBody(tok, cursor, i, false, fields, 0);
    }
    text += text.empty() ? tok.text : " " + tok.text;
  }

  if (!any_format) {
    return ConstantNode{text, pos};
  }
  return MakeCompound(CompoundKind::kFormattedString, pos, "", std::move(fields));
}

void Parser::ScanFormatBody(const Token& tok, BodyCursor& cursor, size_t& i, bool in_spec,
                            std::vector<SyntaxNode>& out, int nesting) {
  const std::string& s = tok.body;
  const bool raw = tok.prefix.find('r') != std::string::npos;

  while (i < s.size()) {
    const char c = s[i];
    if (c == '\\' && !raw && i + 1 < s.size()) {
      if (s[i + 1] == 'N' && i + 2 < s.size() && s[i + 2] == '{') {
        // \N{NAME} escape; its braces are not a replacement field
        size_t close = s.find('}', i + 3);
        i = close == std::string::npos ? s.size() : close + 1;
        continue;
      }
      if (s[i + 1] != '{' && s[i + 1] != '}') {
        i += 2;
        continue;
      }
      i++;
      continue;
    }
    if (c == '{') {
      if (!in_spec && i + 1 < s.size() && s[i + 1] == '{') {
        i += 2;
        continue;
      }
      ParseReplacementField(tok, cursor, i, out, nesting);
      continue;
    }
    if (c == '}') {
      if (in_spec) {
        return;
      }
      if (i + 1 < s.size() && s[i + 1] == '}') {
        i += 2;
        continue;
      }
      FailAt("f-string: single '}' is not allowed", cursor.At(i));
    }
    i++;
  }
}

void Parser::ParseReplacementField(const Token& tok, BodyCursor& cursor, size_t& i,
                                   std::vector<SyntaxNode>& out, int nesting) {
  const std::string& s = tok.body;
  const size_t open = i;
  if (nesting >= 2) {
    FailAt("f-string: expressions nested too deeply", cursor.At(open));
  }

  i++;  // '{'
  const size_t expr_start = i;
  size_t expr_end = std::string::npos;
  int depth = 0;

  while (i < s.size()) {
    const char c = s[i];
    if (c == '\'' || c == '"') {
      const bool triple = i + 2 < s.size() && s[i + 1] == c && s[i + 2] == c;
      const std::string quote(triple ? 3 : 1, c);
      size_t close = s.find(quote, i + quote.size());
      if (close == std::string::npos) {
        FailAt("f-string: unterminated string", cursor.At(i));
      }
      i = close + quote.size();
      continue;
    }
    if (c == '(' || c == '[' || c == '{') {
      depth++;
    } else if (c == ')' || c == ']') {
      depth--;
    } else if (c == '}') {
      if (depth == 0) break;
      depth--;
    } else if (depth == 0) {
      if (c == '#') {
        FailAt("f-string expression part cannot include '#'", cursor.At(i));
      }
      if (c == '!') {
        if (i + 1 < s.size() && s[i + 1] == '=') {
          i += 2;
          continue;
        }
        break;
      }
      if (c == ':') break;
      if (c == '=') {
        if (i + 1 < s.size() && s[i + 1] == '=') {
          i += 2;
          continue;
        }
        const char prev = i > expr_start ? s[i - 1] : '\0';
        if (prev != '=' && prev != '!' && prev != '<' && prev != '>') {
          size_t k = i + 1;
          while (k < s.size() && (s[k] == ' ' || s[k] == '\t')) k++;
          if (k < s.size() && (s[k] == '}' || s[k] == '!' || s[k] == ':')) {
            // Self-documenting "{expr=}"
            expr_end = i;
            i = k;
            break;
          }
        }
      }
    }
    i++;
  }

  if (i >= s.size()) {
    FailAt("f-string: expecting '}'", cursor.At(open));
  }
  if (expr_end == std::string::npos) {
    expr_end = i;
  }

  const std::string text = s.substr(expr_start, expr_end - expr_start);
  if (text.find_first_not_of(" \t\r\n\f") == std::string::npos) {
    FailAt("f-string: empty expression not allowed", cursor.At(open));
  }
  const SourcePos expr_pos = cursor.At(expr_start);
  out.push_back(ParseFieldExpression(text, expr_pos));

  if (s[i] == '!') {
    i++;
    if (i >= s.size() || (s[i] != 's' && s[i] != 'r' && s[i] != 'a')) {
      FailAt("f-string: invalid conversion character: expected 's', 'r', or 'a'",
             cursor.At(std::min(i, s.size())));
    }
    i++;
  }
  if (i < s.size() && s[i] == ':') {
    i++;
    ScanFormatBody(tok, cursor, i, true, out, nesting + 1);
  }
  if (i >= s.size() || s[i] != '}') {
    FailAt("f-string: expecting '}'", cursor.At(open));
  }
  i++;
}

SyntaxNode Parser::ParseFieldExpression(const std::string& text, SourcePos pos) {
  // Field expressions are tokenized as if parenthesized, so they may span lines
  Lexer lexer("(" + text + ")", pos.line - 1, pos.column - 2);
  std::vector<Token> tokens;
  SyntaxErrorInfo err;
  if (!lexer.Tokenize(tokens, &err)) {
    throw ParseError("f-string: " + err.message, err.line, err.column);
  }
  Parser sub(std::move(tokens), depth_ + 1);
  sub.scope_ = scope_;
  return sub.ParseWrappedExpression();
}

SyntaxNode Parser::ParseWrappedExpression() {
  SyntaxNode node = ParseAtom();
  if (Cur().type == TokenType::kNewline) {
    Next();
  }
  if (Cur().type != TokenType::kEndMarker) {
    Fail("f-string: invalid syntax");
  }
  return node;
}

}  // namespace

bool ParseModule(const std::string& source, SyntaxNode& out, SyntaxErrorInfo* error_out) {
  std::vector<Token> tokens;
  Lexer lexer(source);
  if (!lexer.Tokenize(tokens, error_out)) {
    return false;
  }

  try {
    Parser parser(std::move(tokens), 0);
    out = parser.ParseFile();
    return true;
  } catch (const ParseError& e) {
    if (error_out) {
      error_out->message = e.what();
      error_out->line = e.line;
      error_out->column = e.column;
    }
    return false;
  }
}

}  // namespace analysis_sandbox
