#include "validator/fences.h"

#include <cctype>

namespace analysis_sandbox {

namespace {

constexpr const char* kFence = "```";

bool IsTagChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '+' || c == '-' ||
         c == '.';
}

// Position just past an opening fence's line, or npos if `at` is not an opener
size_t OpenerBodyStart(const std::string& text, size_t at) {
  size_t i = at + 3;
  while (i < text.size() && IsTagChar(text[i])) i++;
  while (i < text.size() && (text[i] == ' ' || text[i] == '\t' || text[i] == '\r')) i++;
  if (i < text.size() && text[i] == '\n') {
    return i + 1;
  }
  return std::string::npos;
}

// Closing fence: ``` at the start of a line (or right after the opener)
size_t FindCloser(const std::string& text, size_t body_start) {
  size_t pos = body_start;
  while ((pos = text.find(kFence, pos)) != std::string::npos) {
    if (pos == body_start || text[pos - 1] == '\n') {
      return pos;
    }
    pos += 3;
  }
  return std::string::npos;
}

}  // namespace

std::string Trim(const std::string& s) {
  const char* ws = " \t\r\n\f\v";
  size_t begin = s.find_first_not_of(ws);
  if (begin == std::string::npos) {
    return "";
  }
  size_t end = s.find_last_not_of(ws);
  return s.substr(begin, end - begin + 1);
}

std::vector<std::string> ExtractCodeBlocks(const std::string& text) {
  std::vector<std::string> blocks;

  size_t pos = 0;
  while ((pos = text.find(kFence, pos)) != std::string::npos) {
    size_t body_start = OpenerBodyStart(text, pos);
    if (body_start == std::string::npos) {
      pos += 3;
      continue;
    }
    size_t close = FindCloser(text, body_start);
    if (close == std::string::npos) {
      break;
    }
    blocks.push_back(Trim(text.substr(body_start, close - body_start)));
    pos = close + 3;
  }

  if (blocks.empty()) {
    blocks.push_back(Trim(text));
  }
  return blocks;
}

std::string Sanitize(const std::string& code) {
  return ExtractCodeBlocks(code).front();
}

}  // namespace analysis_sandbox
