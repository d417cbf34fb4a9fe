#pragma once

#include <string>
#include <vector>

namespace analysis_sandbox {

/**
 * Position-carrying parse failure.
 * Line and column are 1-based; 0 means unknown.
 */
struct SyntaxErrorInfo {
  std::string message;
  int line = 0;
  int column = 0;

  std::string ToString() const;
};

enum class TokenType {
  kName,
  kNumber,
  kString,
  kOp,
  kNewline,
  kIndent,
  kDedent,
  kEndMarker
};

struct Token {
  TokenType type;
  std::string text;    // Raw source text (empty for NEWLINE/INDENT/DEDENT/END)
  int line = 0;
  int column = 0;

  // String tokens only
  std::string prefix;  // Lowercased prefix, e.g. "f", "rb"
  std::string body;    // Contents between the quotes
  int body_line = 0;
  int body_column = 0;

  bool Is(TokenType t, const char* s) const { return type == t && text == s; }
  bool IsOp(const char* s) const { return Is(TokenType::kOp, s); }
  bool IsName(const char* s) const { return Is(TokenType::kName, s); }
};

/**
 * Tokenizer for the Python-like analysis language.
 *
 * Produces INDENT/DEDENT/NEWLINE tokens the way the reference tokenizer does:
 * blank and comment-only lines are skipped, newlines inside brackets are
 * ignored, and backslash continuations join lines.
 */
class Lexer {
 public:
  explicit Lexer(const std::string& source, int line_offset = 0, int column_offset = 0);

  bool Tokenize(std::vector<Token>& out, SyntaxErrorInfo* error_out = nullptr);

  // Maximum indentation depth before the input is rejected
  static constexpr size_t kMaxIndentDepth = 100;

 private:
  bool LexString(const std::string& prefix, int start_line, int start_col,
                 std::vector<Token>& out, SyntaxErrorInfo* error_out);
  bool LexNumber(std::vector<Token>& out, SyntaxErrorInfo* error_out);
  bool LexOperator(std::vector<Token>& out, SyntaxErrorInfo* error_out);
  bool HandleIndentation(std::vector<Token>& out, SyntaxErrorInfo* error_out);

  bool Fail(SyntaxErrorInfo* error_out, const std::string& message, int line, int column);

  int Column() const {
    return static_cast<int>(pos_ - line_start_) + 1 + (line_ == first_line_ ? col_offset_ : 0);
  }
  bool AtEnd() const { return pos_ >= src_.size(); }
  char Peek(size_t ahead = 0) const {
    return pos_ + ahead < src_.size() ? src_[pos_ + ahead] : '\0';
  }

  std::string src_;
  size_t pos_ = 0;
  size_t line_start_ = 0;
  int line_ = 1;
  int first_line_ = 1;
  int col_offset_ = 0;

  std::vector<int> indents_;
  struct OpenBracket {
    char ch;
    int line;
    int column;
  };
  std::vector<OpenBracket> brackets_;
  bool at_line_start_ = true;
};

}  // namespace analysis_sandbox
