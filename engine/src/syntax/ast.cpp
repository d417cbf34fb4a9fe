#include "syntax/ast.h"

#include <fmt/format.h>

namespace analysis_sandbox {

const char* CompoundKindToString(CompoundKind kind) {
  switch (kind) {
    case CompoundKind::kModule: return "Module";
    case CompoundKind::kExprStmt: return "Expr";
    case CompoundKind::kAssign: return "Assign";
    case CompoundKind::kAugAssign: return "AugAssign";
    case CompoundKind::kAnnAssign: return "AnnAssign";
    case CompoundKind::kDelete: return "Delete";
    case CompoundKind::kPass: return "Pass";
    case CompoundKind::kBreak: return "Break";
    case CompoundKind::kContinue: return "Continue";
    case CompoundKind::kReturn: return "Return";
    case CompoundKind::kRaise: return "Raise";
    case CompoundKind::kAssert: return "Assert";
    case CompoundKind::kGlobal: return "Global";
    case CompoundKind::kNonlocal: return "Nonlocal";
    case CompoundKind::kIf: return "If";
    case CompoundKind::kWhile: return "While";
    case CompoundKind::kFor: return "For";
    case CompoundKind::kTry: return "Try";
    case CompoundKind::kExceptHandler: return "ExceptHandler";
    case CompoundKind::kWith: return "With";
    case CompoundKind::kFunctionDef: return "FunctionDef";
    case CompoundKind::kClassDef: return "ClassDef";
    case CompoundKind::kParameter: return "Parameter";
    case CompoundKind::kDecorator: return "Decorator";
    case CompoundKind::kLambda: return "Lambda";
    case CompoundKind::kBoolOp: return "BoolOp";
    case CompoundKind::kBinOp: return "BinOp";
    case CompoundKind::kUnaryOp: return "UnaryOp";
    case CompoundKind::kCompare: return "Compare";
    case CompoundKind::kIfExp: return "IfExp";
    case CompoundKind::kNamedExpr: return "NamedExpr";
    case CompoundKind::kAwait: return "Await";
    case CompoundKind::kYield: return "Yield";
    case CompoundKind::kSubscript: return "Subscript";
    case CompoundKind::kSlice: return "Slice";
    case CompoundKind::kTuple: return "Tuple";
    case CompoundKind::kList: return "List";
    case CompoundKind::kDict: return "Dict";
    case CompoundKind::kSet: return "Set";
    case CompoundKind::kComprehension: return "Comprehension";
    case CompoundKind::kStarred: return "Starred";
    case CompoundKind::kKeyword: return "Keyword";
    case CompoundKind::kFormattedString: return "FormattedString";
  }
  return "Unknown";
}

SourcePos PositionOf(const SyntaxNode& node) {
  return std::visit(
      [](auto&& arg) -> SourcePos {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, NameNode> || std::is_same_v<T, ConstantNode>) {
          return arg.pos;
        } else {
          return arg->pos;
        }
      },
      node);
}

bool Walk(const SyntaxNode& root, const NodeVisitor& visit) {
  if (!visit(root)) {
    return false;
  }
  return std::visit(
      [&visit](auto&& arg) -> bool {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, NameNode> || std::is_same_v<T, ConstantNode>) {
          return true;
        } else if constexpr (std::is_same_v<T, std::unique_ptr<CallNode>>) {
          if (!Walk(arg->func, visit)) return false;
          for (const auto& child : arg->args) {
            if (!Walk(child, visit)) return false;
          }
          return true;
        } else if constexpr (std::is_same_v<T, std::unique_ptr<AttributeNode>>) {
          return Walk(arg->value, visit);
        } else if constexpr (std::is_same_v<T, std::unique_ptr<ImportNode>> ||
                             std::is_same_v<T, std::unique_ptr<ImportFromNode>>) {
          return true;
        } else if constexpr (std::is_same_v<T, std::unique_ptr<CompoundNode>>) {
          for (const auto& child : arg->children) {
            if (!Walk(child, visit)) return false;
          }
          return true;
        } else {
          static_assert(sizeof(T) == 0, "Unknown type in SyntaxNode variant");
        }
      },
      root);
}

namespace {

std::string DumpAliases(const std::vector<ImportAlias>& names) {
  std::string out;
  for (const auto& alias : names) {
    out += " ";
    out += alias.name;
    if (!alias.asname.empty()) {
      out += " as " + alias.asname;
    }
  }
  return out;
}

}  // namespace

std::string DumpTree(const SyntaxNode& node) {
  return std::visit(
      [](auto&& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, NameNode>) {
          return arg.id;
        } else if constexpr (std::is_same_v<T, ConstantNode>) {
          return arg.text;
        } else if constexpr (std::is_same_v<T, std::unique_ptr<CallNode>>) {
          std::string out = "(Call " + DumpTree(arg->func);
          for (const auto& a : arg->args) {
            out += " " + DumpTree(a);
          }
          return out + ")";
        } else if constexpr (std::is_same_v<T, std::unique_ptr<AttributeNode>>) {
          return fmt::format("(Attribute {} {})", DumpTree(arg->value), arg->attr);
        } else if constexpr (std::is_same_v<T, std::unique_ptr<ImportNode>>) {
          return "(Import" + DumpAliases(arg->names) + ")";
        } else if constexpr (std::is_same_v<T, std::unique_ptr<ImportFromNode>>) {
          return fmt::format("(ImportFrom {}{}{})", std::string(arg->level, '.'), arg->module,
                             DumpAliases(arg->names));
        } else if constexpr (std::is_same_v<T, std::unique_ptr<CompoundNode>>) {
          std::string out = "(";
          out += CompoundKindToString(arg->kind);
          if (!arg->label.empty()) {
            out += ":" + arg->label;
          }
          for (const auto& child : arg->children) {
            out += " " + DumpTree(child);
          }
          return out + ")";
        } else {
          static_assert(sizeof(T) == 0, "Unknown type in SyntaxNode variant");
        }
      },
      node);
}

}  // namespace analysis_sandbox
