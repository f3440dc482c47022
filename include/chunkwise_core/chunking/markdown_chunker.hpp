#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "chunkwise_core/types/chunk.hpp"

namespace chunkwise_core {

/**
 * @class MarkdownChunker
 * @brief Splits markdown into section-tagged blocks without breaking its structure.
 *
 * The input is scanned line by line. Headings start a new block and become
 * its section label. Fenced code blocks and table-like regions (lines with two
 * or more pipes) are never split. Everything else is flushed either at a blank
 * line once the block reaches the soft budget (min_tokens * chars_per_token),
 * or at the last blank line once it reaches the hard budget
 * (max_tokens * chars_per_token).
 *
 * Blocks are trimmed and whitespace-only blocks are discarded. Blocks seen
 * before any heading are labelled "Document".
 */
class MarkdownChunker {
 public:
  static constexpr const char* DEFAULT_SECTION = "Document";

  explicit MarkdownChunker(ChunkOptions options = {});

  std::vector<StructuralChunk> chunk(std::string_view markdown) const;

  // Text of each block, for callers that do not need the section labels
  std::vector<std::string> chunk_texts(std::string_view markdown) const;

  const ChunkOptions& options() const {
    return options_;
  }

 private:
  ChunkOptions options_;
};

// Convenience wrappers over MarkdownChunker
std::vector<std::string> chunk_markdown(std::string_view markdown);
std::vector<std::string> chunk_markdown_with_options(std::string_view markdown,
                                                     const ChunkOptions& options);

}  // namespace chunkwise_core
