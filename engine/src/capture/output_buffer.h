#pragma once

#include <cstddef>
#include <string>

namespace analysis_sandbox {

/**
 * Bounded capture of a byte stream.
 *
 * Bytes past the cap are counted and dropped; the caller keeps draining its
 * source. Text() appends the truncation marker when anything was dropped.
 */
class OutputBuffer {
 public:
  explicit OutputBuffer(size_t max_bytes);

  void Append(const char* data, size_t size);
  void Append(const std::string& data) { Append(data.data(), data.size()); }

  bool truncated() const { return dropped_ > 0; }
  size_t total_bytes() const { return data_.size() + dropped_; }
  size_t max_bytes() const { return max_bytes_; }

  // Raw captured bytes, without the marker
  const std::string& data() const { return data_; }

  // Captured text, cut back to a UTF-8 boundary and marked when truncated
  std::string Text() const;

 private:
  size_t max_bytes_;
  size_t dropped_ = 0;
  std::string data_;
};

/**
 * Marker appended to truncated output.
 */
std::string TruncationMarker(size_t max_bytes);

}  // namespace analysis_sandbox
