#pragma once

#include <cstddef>
#include <exception>
#include <string>

namespace chunkwise_core {

class ChunkingError : public std::exception {
 public:
  explicit ChunkingError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Section-tagged block produced by the markdown chunker, before metadata is attached
struct StructuralChunk {
  std::string section;
  std::string text;
};

struct ChunkOptions {
  // --- Token-based goals ---
  size_t max_tokens = 1200;
  size_t min_tokens = 800;

  // --- Heuristic for conversion ---
  size_t chars_per_token = 4;
  double overlap_percent = 0.10;

  size_t max_chars() const {
    return max_tokens * chars_per_token;
  }
  size_t min_chars() const {
    return min_tokens * chars_per_token;
  }

  // Throws ChunkingError when the budgets cannot drive the chunkers
  void validate() const;
};

struct EmbeddingBudget {
  size_t max_embedding_tokens = 7000;
  size_t metadata_token_buffer = 200;

  size_t safe_token_budget() const {
    if (metadata_token_buffer >= max_embedding_tokens) {
      return max_embedding_tokens;
    }
    return max_embedding_tokens - metadata_token_buffer;
  }
};

// Final, addressable unit handed to the embedding collaborator.
// `text` is the front-matter block followed by `body`.
struct WrappedChunk {
  int chunk_index;
  std::string section;
  std::string body;
  std::string text;
};

}  // namespace chunkwise_core
