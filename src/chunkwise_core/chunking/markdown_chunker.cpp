#include "chunkwise_core/chunking/markdown_chunker.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

#include "chunkwise_core/utils/text_utils.hpp"

namespace chunkwise_core {

namespace {

struct FenceState {
  bool open = false;
  char marker = 0;
};

// Toggles the fence state on ``` / ~~~ lines. A fence only closes on the marker that opened it.
void update_fence(std::string_view trimmed, FenceState& fence) {
  if (trimmed.size() < 3) {
    return;
  }
  const char c = trimmed[0];
  if ((c != '`' && c != '~') || trimmed[1] != c || trimmed[2] != c) {
    return;
  }
  if (!fence.open) {
    fence.open = true;
    fence.marker = c;
  } else if (fence.marker == c) {
    fence.open = false;
  }
}

// ATX heading: 1-6 '#' followed by whitespace or end of line. Returns the title.
std::optional<std::string> heading_title(std::string_view trimmed) {
  size_t level = 0;
  while (level < trimmed.size() && trimmed[level] == '#') {
    ++level;
  }
  if (level == 0 || level > 6) {
    return std::nullopt;
  }
  if (level < trimmed.size() && !std::isspace(static_cast<unsigned char>(trimmed[level]))) {
    return std::nullopt;
  }

  std::string_view title = text_utils::trim(trimmed.substr(level));

  // Optional closing sequence: "## Title ##"
  size_t end = title.size();
  while (end > 0 && title[end - 1] == '#') {
    --end;
  }
  if (end < title.size() && (end == 0 || std::isspace(static_cast<unsigned char>(title[end - 1])))) {
    title = text_utils::trim(title.substr(0, end));
  }
  return std::string(title);
}

bool looks_like_table_row(std::string_view line) {
  return std::count(line.begin(), line.end(), '|') >= 2;
}

class BlockAccumulator {
 public:
  explicit BlockAccumulator(std::vector<StructuralChunk>& out) : out_(out) {}

  void append(const std::string& line, bool split_candidate, const std::string& active_section) {
    if (lines_.empty()) {
      section_ = active_section;
    }
    lines_.push_back(line);
    length_ += line.size() + 1;
    if (split_candidate) {
      last_blank_index_ = static_cast<long>(lines_.size()) - 1;
    }
  }

  void flush() {
    std::string text(text_utils::trim(text_utils::join_lines(lines_)));
    if (!text.empty()) {
      std::string section = section_.empty() ? MarkdownChunker::DEFAULT_SECTION : section_;
      out_.push_back({.section = std::move(section), .text = std::move(text)});
    }
    lines_.clear();
    length_ = 0;
    section_.clear();
    last_blank_index_ = -1;
  }

  // Flushes everything up to and including the last blank line (or everything when there is
  // none) and keeps accumulating the rest under the same section.
  void split_at_last_blank() {
    size_t split_index = lines_.size();
    if (last_blank_index_ >= 0) {
      split_index = static_cast<size_t>(last_blank_index_) + 1;
    }

    std::vector<std::string> remainder(lines_.begin() + static_cast<long>(split_index), lines_.end());
    lines_.resize(split_index);
    std::string section = section_;
    flush();

    lines_ = std::move(remainder);
    for (const auto& line : lines_) {
      length_ += line.size() + 1;
    }
    if (!lines_.empty()) {
      section_ = std::move(section);
    }
  }

  size_t length() const {
    return length_;
  }
  bool empty() const {
    return lines_.empty();
  }

 private:
  std::vector<StructuralChunk>& out_;
  std::vector<std::string> lines_;
  size_t length_ = 0;
  std::string section_;
  long last_blank_index_ = -1;
};

}  // namespace

MarkdownChunker::MarkdownChunker(ChunkOptions options) : options_(options) {
  options_.validate();
}

std::vector<StructuralChunk> MarkdownChunker::chunk(std::string_view markdown) const {
  std::vector<StructuralChunk> chunks;
  if (text_utils::is_blank(markdown)) {
    return chunks;
  }

  const size_t max_chars = options_.max_chars();
  const size_t min_chars = options_.min_chars();

  BlockAccumulator block(chunks);
  std::string active_section;
  FenceState fence;
  bool in_table = false;

  for (const std::string& line : text_utils::split_lines(markdown)) {
    const std::string_view trimmed = text_utils::trim(line);
    const bool blank = trimmed.empty();

    update_fence(trimmed, fence);

    if (!fence.open) {
      if (auto title = heading_title(trimmed)) {
        // The finished block keeps the section it was started under
        if (!block.empty()) {
          block.flush();
        }
        active_section = std::move(*title);
        block.append(line, false, active_section);
        continue;
      }

      if (!blank && looks_like_table_row(line)) {
        in_table = true;
      } else if (blank) {
        in_table = false;
      }
    }

    block.append(line, blank && !fence.open, active_section);

    if (fence.open || in_table) {
      continue;
    }

    if (block.length() >= max_chars) {
      block.split_at_last_blank();
      continue;
    }

    if (block.length() >= min_chars && blank) {
      block.flush();
    }
  }

  if (!block.empty()) {
    block.flush();
  }
  return chunks;
}

std::vector<std::string> MarkdownChunker::chunk_texts(std::string_view markdown) const {
  std::vector<std::string> texts;
  for (auto& chunk : chunk(markdown)) {
    texts.push_back(std::move(chunk.text));
  }
  return texts;
}

std::vector<std::string> chunk_markdown(std::string_view markdown) {
  return MarkdownChunker().chunk_texts(markdown);
}

std::vector<std::string> chunk_markdown_with_options(std::string_view markdown,
                                                     const ChunkOptions& options) {
  return MarkdownChunker(options).chunk_texts(markdown);
}

}  // namespace chunkwise_core
