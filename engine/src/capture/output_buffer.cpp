#include "capture/output_buffer.h"

#include <algorithm>

#include <fmt/format.h>

namespace analysis_sandbox {

namespace {

bool IsContinuationByte(unsigned char c) {
  return (c & 0xC0) == 0x80;
}

// Length of the longest prefix that does not end inside a UTF-8 sequence
size_t Utf8SafeLength(const std::string& s) {
  size_t end = s.size();
  size_t back = 0;
  while (back < 4 && back < end && IsContinuationByte(s[end - 1 - back])) {
    back++;
  }
  if (back == end) {
    return end;
  }
  const unsigned char lead = s[end - 1 - back];
  size_t expected = 1;
  if ((lead & 0xE0) == 0xC0) {
    expected = 2;
  } else if ((lead & 0xF0) == 0xE0) {
    expected = 3;
  } else if ((lead & 0xF8) == 0xF0) {
    expected = 4;
  }
  if (expected > 1 && back + 1 < expected) {
    return end - 1 - back;
  }
  return end;
}

}  // namespace

std::string TruncationMarker(size_t max_bytes) {
  return fmt::format("\n\n[Output truncated - exceeded {} bytes]", max_bytes);
}

OutputBuffer::OutputBuffer(size_t max_bytes) : max_bytes_(max_bytes) {}

void OutputBuffer::Append(const char* data, size_t size) {
  const size_t room = max_bytes_ > data_.size() ? max_bytes_ - data_.size() : 0;
  const size_t take = std::min(room, size);
  data_.append(data, take);
  dropped_ += size - take;
}

std::string OutputBuffer::Text() const {
  if (!truncated()) {
    return data_;
  }
  std::string text = data_.substr(0, Utf8SafeLength(data_));
  text += TruncationMarker(max_bytes_);
  return text;
}

}  // namespace analysis_sandbox
