#pragma once

#include <functional>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace analysis_sandbox {

struct SourcePos {
  int line = 0;
  int column = 0;
};

/**
 * Syntax node types.
 *
 * The validator only distinguishes names, constants, calls, attribute
 * access and imports. Every other construct is a CompoundNode tagged with
 * its kind; its children are kept in source order.
 */
struct NameNode {
  std::string id;
  SourcePos pos;
};

struct ConstantNode {
  std::string text;  // Raw literal text
  SourcePos pos;
};

struct CallNode;
struct AttributeNode;
struct ImportNode;
struct ImportFromNode;
struct CompoundNode;

/**
 * Syntax tree variant.
 */
using SyntaxNode = std::variant<
    NameNode,
    ConstantNode,
    std::unique_ptr<CallNode>,
    std::unique_ptr<AttributeNode>,
    std::unique_ptr<ImportNode>,
    std::unique_ptr<ImportFromNode>,
    std::unique_ptr<CompoundNode>>;

struct CallNode {
  SyntaxNode func;
  std::vector<SyntaxNode> args;  // Positional, keyword and starred, in order
  SourcePos pos;
};

struct AttributeNode {
  SyntaxNode value;
  std::string attr;
  SourcePos pos;
};

struct ImportAlias {
  std::string name;    // Dotted module path or imported member
  std::string asname;  // Empty if no alias
};

struct ImportNode {
  std::vector<ImportAlias> names;
  SourcePos pos;
};

struct ImportFromNode {
  std::string module;  // Empty for "from . import x"
  int level = 0;       // Number of leading dots
  std::vector<ImportAlias> names;
  SourcePos pos;
};

enum class CompoundKind {
  kModule,
  // Statements
  kExprStmt,
  kAssign,
  kAugAssign,
  kAnnAssign,
  kDelete,
  kPass,
  kBreak,
  kContinue,
  kReturn,
  kRaise,
  kAssert,
  kGlobal,
  kNonlocal,
  kIf,
  kWhile,
  kFor,
  kTry,
  kExceptHandler,
  kWith,
  kFunctionDef,
  kClassDef,
  kParameter,
  kDecorator,
  // Expressions
  kLambda,
  kBoolOp,
  kBinOp,
  kUnaryOp,
  kCompare,
  kIfExp,
  kNamedExpr,
  kAwait,
  kYield,
  kSubscript,
  kSlice,
  kTuple,
  kList,
  kDict,
  kSet,
  kComprehension,
  kStarred,
  kKeyword,
  kFormattedString,
};

struct CompoundNode {
  CompoundKind kind;
  std::string label;  // Operator, definition name, keyword name, etc.
  std::vector<SyntaxNode> children;
  SourcePos pos;
};

const char* CompoundKindToString(CompoundKind kind);

/**
 * Position of any node.
 */
SourcePos PositionOf(const SyntaxNode& node);

/**
 * Preorder walk: the node itself, then its children left to right.
 * The visitor returns false to stop the walk; Walk returns false if it
 * was stopped.
 */
using NodeVisitor = std::function<bool(const SyntaxNode&)>;
bool Walk(const SyntaxNode& root, const NodeVisitor& visit);

/**
 * Compact S-expression dump, used by tests and diagnostics.
 */
std::string DumpTree(const SyntaxNode& node);

}  // namespace analysis_sandbox
