#include "syntax/lexer.h"

#include <cctype>
#include <cstring>

#include <fmt/format.h>

namespace analysis_sandbox {

namespace {

bool IsIdentStart(char c) {
  unsigned char u = static_cast<unsigned char>(c);
  return std::isalpha(u) || c == '_' || u >= 0x80;
}

bool IsIdentChar(char c) {
  unsigned char u = static_cast<unsigned char>(c);
  return std::isalnum(u) || c == '_' || u >= 0x80;
}

bool IsStringPrefix(const std::string& lowered) {
  static const char* const kPrefixes[] = {"r", "u", "b", "f", "br", "rb", "fr", "rf"};
  for (const char* p : kPrefixes) {
    if (lowered == p) return true;
  }
  return false;
}

std::string Lowered(const std::string& s) {
  std::string out = s;
  for (auto& c : out) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

// Longest-match operator table
const char* const kOps3[] = {"**=", "//=", ">>=", "<<=", "...", nullptr};
const char* const kOps2[] = {"**", "//", ">>", "<<", "<=", ">=", "==", "!=", "->", ":=",
                             "+=", "-=", "*=", "/=", "%=", "&=", "|=", "^=", "@=", nullptr};
const char kOps1[] = "+-*/%@&|^~<>()[]{},:;.=";

char MatchingOpen(char close) {
  switch (close) {
    case ')': return '(';
    case ']': return '[';
    case '}': return '{';
  }
  return '\0';
}

}  // namespace

std::string SyntaxErrorInfo::ToString() const {
  if (line > 0) {
    return fmt::format("{} (line {}, column {})", message, line, column);
  }
  return message;
}

Lexer::Lexer(const std::string& source, int line_offset, int column_offset)
    : src_(source), line_(1 + line_offset), first_line_(1 + line_offset),
      col_offset_(column_offset) {
  indents_.push_back(0);
}

bool Lexer::Fail(SyntaxErrorInfo* error_out, const std::string& message, int line, int column) {
  if (error_out) {
    error_out->message = message;
    error_out->line = line;
    error_out->column = column;
  }
  return false;
}

bool Lexer::HandleIndentation(std::vector<Token>& out, SyntaxErrorInfo* error_out) {
  while (true) {
    int width = 0;
    while (!AtEnd()) {
      char c = Peek();
      if (c == ' ') {
        width++;
      } else if (c == '\t') {
        width = (width / 8 + 1) * 8;
      } else if (c == '\f') {
        width = 0;
      } else {
        break;
      }
      pos_++;
    }

    if (AtEnd()) {
      return true;
    }

    char c = Peek();
    if (c == '#') {
      while (!AtEnd() && Peek() != '\n' && Peek() != '\r') pos_++;
      continue;  // the newline is consumed below on the next pass
    }
    if (c == '\n' || c == '\r') {
      if (c == '\r' && Peek(1) == '\n') pos_++;
      pos_++;
      line_++;
      line_start_ = pos_;
      continue;
    }

    // A continuation on an otherwise blank line still starts the logical
    // line, so its indentation is the width measured so far
    at_line_start_ = false;
    if (width > indents_.back()) {
      if (indents_.size() > kMaxIndentDepth) {
        return Fail(error_out, "too many levels of indentation", line_, Column());
      }
      indents_.push_back(width);
      out.push_back(Token{TokenType::kIndent, "", line_, 1});
    } else if (width < indents_.back()) {
      while (width < indents_.back()) {
        indents_.pop_back();
        out.push_back(Token{TokenType::kDedent, "", line_, Column()});
      }
      if (width != indents_.back()) {
        return Fail(error_out, "unindent does not match any outer indentation level",
                    line_, Column());
      }
    }
    return true;
  }
}

bool Lexer::Tokenize(std::vector<Token>& out, SyntaxErrorInfo* error_out) {
  out.clear();

  while (true) {
    if (at_line_start_ && brackets_.empty()) {
      if (!HandleIndentation(out, error_out)) {
        return false;
      }
      at_line_start_ = false;
    }
    if (AtEnd()) {
      break;
    }

    char c = Peek();
    int line = line_;
    int col = Column();

    if (c == ' ' || c == '\t' || c == '\f') {
      pos_++;
      continue;
    }

    if (c == '#') {
      while (!AtEnd() && Peek() != '\n' && Peek() != '\r') pos_++;
      continue;
    }

    if (c == '\\') {
      if (Peek(1) == '\n' || Peek(1) == '\r') {
        pos_++;
        if (Peek() == '\r' && Peek(1) == '\n') pos_++;
        pos_++;
        line_++;
        line_start_ = pos_;
        if (AtEnd()) {
          return Fail(error_out, "unexpected EOF while parsing", line_, Column());
        }
        continue;
      }
      return Fail(error_out, "unexpected character after line continuation character", line, col);
    }

    if (c == '\n' || c == '\r') {
      if (brackets_.empty()) {
        out.push_back(Token{TokenType::kNewline, "", line, col});
        at_line_start_ = true;
      }
      if (c == '\r' && Peek(1) == '\n') pos_++;
      pos_++;
      line_++;
      line_start_ = pos_;
      continue;
    }

    if (IsIdentStart(c)) {
      size_t start = pos_;
      while (!AtEnd() && IsIdentChar(Peek())) pos_++;
      std::string word = src_.substr(start, pos_ - start);
      if ((Peek() == '\'' || Peek() == '"') && IsStringPrefix(Lowered(word))) {
        if (!LexString(Lowered(word), line, col, out, error_out)) {
          return false;
        }
        // Keep the raw prefix in the token text
        out.back().text = word + out.back().text;
        continue;
      }
      out.push_back(Token{TokenType::kName, std::move(word), line, col});
      continue;
    }

    if (std::isdigit(static_cast<unsigned char>(c)) ||
        (c == '.' && std::isdigit(static_cast<unsigned char>(Peek(1))))) {
      if (!LexNumber(out, error_out)) {
        return false;
      }
      continue;
    }

    if (c == '\'' || c == '"') {
      if (!LexString("", line, col, out, error_out)) {
        return false;
      }
      continue;
    }

    if (!LexOperator(out, error_out)) {
      return false;
    }
  }

  if (!brackets_.empty()) {
    const auto& open = brackets_.back();
    return Fail(error_out, fmt::format("'{}' was never closed", open.ch), open.line, open.column);
  }

  if (!out.empty() && out.back().type != TokenType::kNewline &&
      out.back().type != TokenType::kDedent && out.back().type != TokenType::kIndent) {
    out.push_back(Token{TokenType::kNewline, "", line_, Column()});
  }
  while (indents_.size() > 1) {
    indents_.pop_back();
    out.push_back(Token{TokenType::kDedent, "", line_, Column()});
  }
  out.push_back(Token{TokenType::kEndMarker, "", line_, Column()});
  return true;
}

bool Lexer::LexString(const std::string& prefix, int start_line, int start_col,
                      std::vector<Token>& out, SyntaxErrorInfo* error_out) {
  const char quote = Peek();
  const bool triple = Peek(1) == quote && Peek(2) == quote;
  const size_t open_len = triple ? 3 : 1;
  const size_t token_start = pos_;

  pos_ += open_len;
  const size_t body_start = pos_;
  const int body_line = line_;
  const int body_col = Column();

  while (true) {
    if (AtEnd()) {
      if (triple) {
        return Fail(error_out, "unterminated triple-quoted string literal", start_line, start_col);
      }
      return Fail(error_out,
                  fmt::format("unterminated string literal (detected at line {})", line_),
                  start_line, start_col);
    }

    char c = Peek();
    if (c == '\\') {
      pos_++;
      if (AtEnd()) continue;
      char escaped = Peek();
      pos_++;
      if (escaped == '\r' && Peek() == '\n') pos_++;
      if (escaped == '\n' || escaped == '\r') {
        line_++;
        line_start_ = pos_;
      }
      continue;
    }

    if (c == '\n' || c == '\r') {
      if (!triple) {
        return Fail(error_out,
                    fmt::format("unterminated string literal (detected at line {})", line_),
                    start_line, start_col);
      }
      if (c == '\r' && Peek(1) == '\n') pos_++;
      pos_++;
      line_++;
      line_start_ = pos_;
      continue;
    }

    if (c == quote) {
      if (!triple) {
        break;
      }
      if (Peek(1) == quote && Peek(2) == quote) {
        break;
      }
    }
    pos_++;
  }

  const size_t body_end = pos_;
  pos_ += open_len;

  Token tok{TokenType::kString, src_.substr(token_start, pos_ - token_start), start_line, start_col};
  tok.prefix = prefix;
  tok.body = src_.substr(body_start, body_end - body_start);
  tok.body_line = body_line;
  tok.body_column = body_col;
  out.push_back(std::move(tok));
  return true;
}

bool Lexer::LexNumber(std::vector<Token>& out, SyntaxErrorInfo* error_out) {
  const size_t start = pos_;
  const int line = line_;
  const int col = Column();

  auto read_digits = [this](auto pred) {
    size_t n = 0;
    while (!AtEnd() && (pred(Peek()) || Peek() == '_')) {
      pos_++;
      n++;
    }
    return n;
  };
  auto is_dec = [](char ch) { return std::isdigit(static_cast<unsigned char>(ch)) != 0; };

  char c0 = Peek();
  char c1 = static_cast<char>(std::tolower(static_cast<unsigned char>(Peek(1))));
  if (c0 == '0' && (c1 == 'x' || c1 == 'o' || c1 == 'b')) {
    pos_ += 2;
    size_t n = 0;
    if (c1 == 'x') {
      n = read_digits([](char ch) { return std::isxdigit(static_cast<unsigned char>(ch)) != 0; });
    } else if (c1 == 'o') {
      n = read_digits([](char ch) { return ch >= '0' && ch <= '7'; });
    } else {
      n = read_digits([](char ch) { return ch == '0' || ch == '1'; });
    }
    if (n == 0) {
      return Fail(error_out, "invalid number literal", line, col);
    }
  } else {
    read_digits(is_dec);
    if (Peek() == '.') {
      pos_++;
      read_digits(is_dec);
    }
    if (Peek() == 'e' || Peek() == 'E') {
      size_t save = pos_;
      pos_++;
      if (Peek() == '+' || Peek() == '-') pos_++;
      if (read_digits(is_dec) == 0) {
        pos_ = save;
        return Fail(error_out, "invalid decimal literal", line, col);
      }
    }
    if (Peek() == 'j' || Peek() == 'J') {
      pos_++;
    }
  }

  if (!AtEnd() && IsIdentStart(Peek())) {
    return Fail(error_out, "invalid decimal literal", line, col);
  }

  out.push_back(Token{TokenType::kNumber, src_.substr(start, pos_ - start), line, col});
  return true;
}

bool Lexer::LexOperator(std::vector<Token>& out, SyntaxErrorInfo* error_out) {
  const int line = line_;
  const int col = Column();

  for (const char* const* table : {kOps3, kOps2}) {
    for (size_t i = 0; table[i] != nullptr; ++i) {
      size_t len = std::strlen(table[i]);
      if (src_.compare(pos_, len, table[i]) == 0) {
        out.push_back(Token{TokenType::kOp, table[i], line, col});
        pos_ += len;
        return true;
      }
    }
  }

  char c = Peek();
  if (c == '\0' || std::strchr(kOps1, c) == nullptr) {
    return Fail(error_out, fmt::format("invalid character '{}'", c), line, col);
  }

  if (c == '(' || c == '[' || c == '{') {
    brackets_.push_back(OpenBracket{c, line, col});
  } else if (c == ')' || c == ']' || c == '}') {
    if (brackets_.empty()) {
      return Fail(error_out, fmt::format("unmatched '{}'", c), line, col);
    }
    if (brackets_.back().ch != MatchingOpen(c)) {
      return Fail(error_out,
                  fmt::format("closing parenthesis '{}' does not match opening parenthesis '{}'",
                              c, brackets_.back().ch),
                  line, col);
    }
    brackets_.pop_back();
  }

  out.push_back(Token{TokenType::kOp, std::string(1, c), line, col});
  pos_++;
  return true;
}

}  // namespace analysis_sandbox
