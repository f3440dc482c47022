#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace chunkwise_core {

/**
 * @class TextChunker
 * @brief Fixed-size window splitter for unstructured plain text.
 *
 * Windows are measured in UTF-8 code points so multi-byte characters are
 * never cut in half. Pieces that contain only whitespace are dropped.
 */
class TextChunker {
 public:
  static constexpr size_t DEFAULT_CHUNK_SIZE = 1000;

  /**
   * @brief Slices text into consecutive, non-overlapping windows.
   * @param chunk_size Window length in code points; 0 selects DEFAULT_CHUNK_SIZE.
   */
  static std::vector<std::string> chunk_text(std::string_view text, size_t chunk_size);

  /**
   * @brief Slices text into windows that share `overlap` code points with their predecessor.
   *
   * The window advances by chunk_size - overlap. An overlap that would stall
   * the window (overlap >= chunk_size) is clamped to chunk_size / 4. Stops as
   * soon as a window reaches the end of the input.
   */
  static std::vector<std::string> chunk_text_with_overlap(std::string_view text,
                                                          size_t chunk_size,
                                                          size_t overlap);
};

}  // namespace chunkwise_core
