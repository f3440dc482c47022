#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace chunkwise_core {

/**
 * @class OverflowSplitter
 * @brief Breaks a block that is over the embedding budget into smaller pieces.
 *
 * The first attempt uses overlapping code point windows of `window_chars` so
 * neighbouring pieces share context. When that cannot produce more than one
 * piece (for example a window that already covers the text in code points but
 * not in bytes), it falls back to a non-overlapping split into pieces of at
 * most `window_chars` bytes, cut on code point boundaries. The fallback always
 * makes progress.
 */
class OverflowSplitter {
 public:
  OverflowSplitter(size_t window_chars, double overlap_percent);

  std::vector<std::string> split(std::string_view text) const;

  // Consecutive pieces of at most max_bytes each (one code point minimum)
  static std::vector<std::string> hard_split(std::string_view text, size_t max_bytes);

  size_t window_chars() const {
    return window_chars_;
  }
  size_t overlap_chars() const {
    return overlap_chars_;
  }

 private:
  size_t window_chars_;
  size_t overlap_chars_;
};

}  // namespace chunkwise_core
