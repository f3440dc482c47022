#include "chunkwise_core/chunking/overflow_splitter.hpp"

#include <cmath>

#include "chunkwise_core/chunking/text_chunker.hpp"
#include "chunkwise_core/types/chunk.hpp"
#include "chunkwise_core/utils/text_utils.hpp"

namespace chunkwise_core {

OverflowSplitter::OverflowSplitter(size_t window_chars, double overlap_percent)
    : window_chars_(window_chars), overlap_chars_(0) {
  if (window_chars_ == 0) {
    throw ChunkingError("Overflow window must be greater than 0");
  }
  if (overlap_percent > 0.0) {
    overlap_chars_ = static_cast<size_t>(std::llround(static_cast<double>(window_chars_) * overlap_percent));
  }
  if (overlap_chars_ >= window_chars_) {
    overlap_chars_ = window_chars_ / 4;
  }
}

std::vector<std::string> OverflowSplitter::split(std::string_view text) const {
  std::vector<std::string> pieces =
      TextChunker::chunk_text_with_overlap(text, window_chars_, overlap_chars_);
  if (pieces.size() > 1) {
    return pieces;
  }
  return hard_split(text, window_chars_);
}

std::vector<std::string> OverflowSplitter::hard_split(std::string_view text, size_t max_bytes) {
  std::vector<std::string> out;
  if (text.empty() || max_bytes == 0) {
    out.emplace_back(text);
    return out;
  }

  const std::string valid = text_utils::ensure_valid_utf8(text);
  std::string_view rest(valid);
  while (!rest.empty()) {
    size_t length = text_utils::utf8_prefix_length(rest, max_bytes);
    out.emplace_back(rest.substr(0, length));
    rest.remove_prefix(length);
  }
  return out;
}

}  // namespace chunkwise_core
