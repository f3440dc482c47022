#include "chunkwise_core/chunking/text_chunker.hpp"

#include <algorithm>

#include "chunkwise_core/utils/text_utils.hpp"

namespace chunkwise_core {

namespace {

std::vector<std::string> window_split(std::string_view raw_text, size_t chunk_size, size_t step) {
  std::vector<std::string> out;
  if (raw_text.empty()) {
    return out;
  }

  const std::string text = text_utils::ensure_valid_utf8(raw_text);
  const std::vector<size_t> offsets = text_utils::code_point_offsets(text);
  const size_t code_points = offsets.size() - 1;

  for (size_t start = 0; start < code_points; start += step) {
    size_t end = std::min(start + chunk_size, code_points);

    std::string piece = text.substr(offsets[start], offsets[end] - offsets[start]);
    if (!text_utils::is_blank(piece)) {
      out.push_back(std::move(piece));
    }

    if (end >= code_points) {
      break;
    }
  }
  return out;
}

}  // namespace

std::vector<std::string> TextChunker::chunk_text(std::string_view text, size_t chunk_size) {
  if (chunk_size == 0) {
    chunk_size = DEFAULT_CHUNK_SIZE;
  }
  return window_split(text, chunk_size, chunk_size);
}

std::vector<std::string> TextChunker::chunk_text_with_overlap(std::string_view text,
                                                              size_t chunk_size,
                                                              size_t overlap) {
  if (chunk_size == 0) {
    chunk_size = DEFAULT_CHUNK_SIZE;
  }
  if (overlap >= chunk_size) {
    overlap = chunk_size / 4;
  }
  return window_split(text, chunk_size, chunk_size - overlap);
}

}  // namespace chunkwise_core
