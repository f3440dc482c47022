#include "chunkwise_core/chunking/metadata_wrapper.hpp"

#include <deque>
#include <iterator>
#include <sstream>

#include "chunkwise_core/chunking/markdown_chunker.hpp"
#include "chunkwise_core/chunking/overflow_splitter.hpp"
#include "chunkwise_core/chunking/token_estimator.hpp"
#include "chunkwise_core/types/processed_file.hpp"
#include "chunkwise_core/utils/text_utils.hpp"

namespace chunkwise_core {

namespace {

// Ten digits, wide enough that the estimate covers any real index
constexpr long long PLACEHOLDER_CHUNK_INDEX = 9'999'999'999LL;

// A window narrower than this cannot always hold one UTF-8 code point
constexpr size_t MIN_WINDOW_BYTES = 4;

struct FrontMatterFields {
  std::string doc_id;
  std::string file_id;
  std::string source;
  std::string created_at;
};

std::string capped_value(std::string_view value) {
  std::string sanitized =
      text_utils::ensure_valid_utf8(MetadataWrapper::sanitize_metadata_value(value));
  sanitized.resize(text_utils::utf8_prefix_length(sanitized, MetadataWrapper::MAX_METADATA_VALUE_BYTES));
  return sanitized;
}

std::string section_value(std::string_view section) {
  std::string value = capped_value(section);
  if (value.empty()) {
    value = MarkdownChunker::DEFAULT_SECTION;
  }
  return value;
}

FrontMatterFields make_fields(const ChunkAddress& address) {
  return {.doc_id = MetadataWrapper::sanitize_metadata_value(address.doc_id),
          .file_id = MetadataWrapper::sanitize_metadata_value(address.file_id),
          .source = capped_value(address.source),
          .created_at = format_rfc3339_utc(address.created_at)};
}

std::string format_front_matter(const FrontMatterFields& fields,
                                const std::string& section,
                                long long chunk_index) {
  std::ostringstream ss;
  ss << "---\n"
     << "doc_id: " << fields.doc_id << "\n"
     << "file_id: " << fields.file_id << "\n"
     << "source: \"" << fields.source << "\"\n"
     << "section: \"" << section << "\"\n"
     << "chunk_index: " << chunk_index << "\n"
     << "created_at: " << fields.created_at << "\n"
     << "---\n\n";
  return ss.str();
}

}  // namespace

MetadataWrapper::MetadataWrapper(ChunkOptions options, EmbeddingBudget budget)
    : options_(options), budget_(budget) {
  options_.validate();
  if (options_.overlap_percent < 0.0) {
    options_.overlap_percent = 0.0;
  }
  if (budget_.max_embedding_tokens == 0) {
    throw ChunkingError("max_embedding_tokens must be greater than 0");
  }
}

std::string MetadataWrapper::sanitize_metadata_value(std::string_view value) {
  std::string sanitized;
  sanitized.reserve(value.size());
  std::string_view trimmed = text_utils::trim(value);
  for (size_t i = 0; i < trimmed.size(); ++i) {
    const char c = trimmed[i];
    if (c == '\r' && i + 1 < trimmed.size() && trimmed[i + 1] == '\n') {
      continue;
    }
    if (c == '\n' || c == '\r') {
      sanitized += ' ';
    } else if (c == '"') {
      sanitized += '\'';
    } else {
      sanitized += c;
    }
  }
  return sanitized;
}

size_t MetadataWrapper::estimate_metadata_tokens(const ChunkAddress& address,
                                                 std::string_view section) const {
  const std::string front_matter =
      format_front_matter(make_fields(address), section_value(section), PLACEHOLDER_CHUNK_INDEX);
  return estimate_token_count_ceil(front_matter, options_.chars_per_token);
}

std::vector<WrappedChunk> MetadataWrapper::wrap(const std::vector<StructuralChunk>& chunks,
                                                const ChunkAddress& address) const {
  std::vector<WrappedChunk> wrapped;
  if (chunks.empty()) {
    return wrapped;
  }

  const FrontMatterFields fields = make_fields(address);
  const size_t safe_budget = budget_.safe_token_budget();
  int chunk_index = 0;

  for (const auto& chunk : chunks) {
    const std::string section = section_value(chunk.section);
    const size_t metadata_tokens = estimate_token_count_ceil(
        format_front_matter(fields, section, PLACEHOLDER_CHUNK_INDEX), options_.chars_per_token);

    if (metadata_tokens >= safe_budget ||
        (safe_budget - metadata_tokens) * options_.chars_per_token < MIN_WINDOW_BYTES) {
      throw ChunkingError("Front-matter for document '" + fields.doc_id + "' (" +
                          std::to_string(metadata_tokens) +
                          " tokens) leaves no room in the embedding budget of " +
                          std::to_string(safe_budget) + " tokens");
    }

    const size_t body_budget = safe_budget - metadata_tokens;
    const OverflowSplitter splitter(body_budget * options_.chars_per_token,
                                    options_.overlap_percent);

    std::deque<std::string> queue;
    queue.push_back(text_utils::ensure_valid_utf8(chunk.text));

    while (!queue.empty()) {
      std::string part = std::move(queue.front());
      queue.pop_front();

      if (text_utils::is_blank(part)) {
        continue;
      }

      if (estimate_token_count(part, options_.chars_per_token) > body_budget) {
        std::vector<std::string> pieces = splitter.split(part);
        if (pieces.size() <= 1) {
          throw ChunkingError("Overflow split made no progress on a block of " +
                              std::to_string(part.size()) + " bytes in section '" + section + "'");
        }
        // Pieces go ahead of everything still queued so document order is kept
        queue.insert(queue.begin(), std::make_move_iterator(pieces.begin()),
                     std::make_move_iterator(pieces.end()));
        continue;
      }

      std::string text = format_front_matter(fields, section, chunk_index) + part;
      wrapped.push_back({.chunk_index = chunk_index,
                         .section = section,
                         .body = std::move(part),
                         .text = std::move(text)});
      ++chunk_index;
    }
  }
  return wrapped;
}

std::vector<WrappedChunk> MetadataWrapper::wrap_markdown(std::string_view markdown,
                                                         const ChunkAddress& address) const {
  return wrap(MarkdownChunker(options_).chunk(markdown), address);
}

std::vector<std::string> wrap_markdown_with_metadata(std::string_view markdown,
                                                     const ChunkAddress& address) {
  std::vector<std::string> out;
  for (auto& chunk : MetadataWrapper().wrap_markdown(markdown, address)) {
    out.push_back(std::move(chunk.text));
  }
  return out;
}

}  // namespace chunkwise_core
