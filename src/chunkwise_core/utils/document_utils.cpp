#include "chunkwise_core/utils/document_utils.hpp"

#include <cctype>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <vector>

#include "chunkwise_core/chunking/token_estimator.hpp"
#include "chunkwise_core/errors.hpp"
#include "chunkwise_core/utils/text_utils.hpp"

namespace chunkwise_core {

namespace {
bool starts_with(std::string_view text, std::string_view prefix) {
  return text.substr(0, prefix.size()) == prefix;
}
bool ends_with(std::string_view text, std::string_view suffix) {
  return text.size() >= suffix.size() && text.substr(text.size() - suffix.size()) == suffix;
}
}  // namespace

FileMetadata generate_file_metadata(const ProcessedFile& file) {
  return {.id = file.id,
          .filename = file.filename,
          .extension = std::filesystem::path(file.filename).extension().string(),
          .size = file.original_size,
          .content_hash = file.content_hash,
          .processed_at = file.processed_at,
          .chunk_count = file.chunks.size(),
          .token_count = estimate_token_count(file.markdown)};
}

SourceType get_source_type(const std::string& filename) {
  if (starts_with(filename, "text-") && ends_with(filename, ".txt")) {
    return SourceType::Text;
  }
  if (starts_with(filename, "website-")) {
    return SourceType::Website;
  }
  return SourceType::File;
}

std::string generate_stored_filename(const std::string& owner_id,
                                     const std::string& original_filename) {
  return owner_id + "-" + std::filesystem::path(original_filename).filename().string();
}

std::string parse_stored_filename(const std::string& stored_filename, const std::string& owner_id) {
  const std::string prefix = owner_id + "-";
  if (starts_with(stored_filename, prefix)) {
    return stored_filename.substr(prefix.size());
  }
  return stored_filename;
}

std::string generate_document_id(const std::string& owner_id,
                                 const std::string& filename,
                                 int chunk_index) {
  return generate_stored_filename(owner_id, filename) + "-" + std::to_string(chunk_index);
}

void validate_filename(const std::string& filename) {
  if (text_utils::is_blank(filename)) {
    throw ValidationError("filename cannot be empty");
  }
  if (filename.find("..") != std::string::npos) {
    throw ValidationError("filename cannot contain path traversal sequences");
  }
  for (char c : std::string_view("/\\:*?\"<>|")) {
    if (filename.find(c) != std::string::npos) {
      throw ValidationError(std::string("filename contains invalid character: ") + c);
    }
  }
}

std::string format_file_size(std::uint64_t bytes) {
  constexpr std::uint64_t unit = 1024;
  if (bytes < unit) {
    return std::to_string(bytes) + " B";
  }

  std::uint64_t div = unit;
  int exp = 0;
  for (std::uint64_t n = bytes / unit; n >= unit; n /= unit) {
    div *= unit;
    exp++;
  }

  std::ostringstream ss;
  ss << std::fixed << std::setprecision(1) << static_cast<double>(bytes) / static_cast<double>(div)
     << " " << "KMGTPE"[exp] << "B";
  return ss.str();
}

std::string clean_markdown(std::string_view markdown) {
  std::vector<std::string> cleaned;
  bool last_was_empty = false;

  for (auto& line : text_utils::split_lines(markdown)) {
    if (text_utils::is_blank(line)) {
      if (!last_was_empty) {
        cleaned.emplace_back();
        last_was_empty = true;
      }
    } else {
      cleaned.push_back(std::move(line));
      last_was_empty = false;
    }
  }
  return text_utils::join_lines(cleaned);
}

std::string extract_title(std::string_view markdown) {
  for (const auto& line : text_utils::split_lines(markdown)) {
    std::string_view trimmed = text_utils::trim(line);
    if (starts_with(trimmed, "# ")) {
      return std::string(text_utils::trim(trimmed.substr(1)));
    }
  }
  return "";
}

size_t count_words(std::string_view text) {
  size_t words = 0;
  bool in_word = false;
  for (char c : text) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      in_word = false;
    } else if (!in_word) {
      in_word = true;
      words++;
    }
  }
  return words;
}

std::string truncate_text(const std::string& text, size_t max_length) {
  if (text.size() <= max_length) {
    return text;
  }
  if (max_length <= 3) {
    return "...";
  }
  return text.substr(0, max_length - 3) + "...";
}

}  // namespace chunkwise_core
