#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

#include "chunkwise_core/types/chunk.hpp"

namespace chunkwise_core {

// Caller-supplied identity of the document whose chunks are being wrapped
struct ChunkAddress {
  std::string doc_id;
  std::string file_id;
  std::string source;
  std::chrono::system_clock::time_point created_at;
};

/**
 * @class MetadataWrapper
 * @brief Prepends addressable front-matter to every chunk of a document.
 *
 * Each output looks like:
 *
 *   ---
 *   doc_id: <doc_id>
 *   file_id: <file_id>
 *   source: "<source>"
 *   section: "<section>"
 *   chunk_index: <n>
 *   created_at: <RFC 3339 UTC>
 *   ---
 *
 *   <body>
 *
 * The estimated token count of the whole string (front-matter included) never
 * exceeds budget.safe_token_budget(). Blocks that would are handed to an
 * OverflowSplitter and the pieces are processed before the next block, in
 * order, through a work queue. chunk_index starts at 0 and increases by one per
 * emitted chunk across the whole document.
 */
class MetadataWrapper {
 public:
  // Longest source/section value written to the front-matter
  static constexpr size_t MAX_METADATA_VALUE_BYTES = 200;

  explicit MetadataWrapper(ChunkOptions options = {}, EmbeddingBudget budget = {});

  std::vector<WrappedChunk> wrap(const std::vector<StructuralChunk>& chunks,
                                 const ChunkAddress& address) const;

  // Runs the markdown chunker with this wrapper's options, then wraps the result
  std::vector<WrappedChunk> wrap_markdown(std::string_view markdown,
                                          const ChunkAddress& address) const;

  // Front-matter overhead in tokens, rounded up, for a block under `section`
  size_t estimate_metadata_tokens(const ChunkAddress& address, std::string_view section) const;

  // Trims, collapses newlines to spaces and turns double quotes into single quotes
  static std::string sanitize_metadata_value(std::string_view value);

  const EmbeddingBudget& budget() const {
    return budget_;
  }

 private:
  ChunkOptions options_;
  EmbeddingBudget budget_;
};

std::vector<std::string> wrap_markdown_with_metadata(std::string_view markdown,
                                                     const ChunkAddress& address);

}  // namespace chunkwise_core
