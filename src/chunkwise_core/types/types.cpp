#include <ctime>
#include <iomanip>
#include <sstream>

#include "chunkwise_core/types/chunk.hpp"
#include "chunkwise_core/types/processed_file.hpp"

namespace chunkwise_core {

void ChunkOptions::validate() const {
  if (chars_per_token == 0) {
    throw ChunkingError("chars_per_token must be greater than 0");
  }
  if (max_tokens == 0) {
    throw ChunkingError("max_tokens must be greater than 0");
  }
}

std::string to_string(SourceType type) {
  switch (type) {
    case SourceType::Text:
      return "text";
    case SourceType::Website:
      return "website";
    default:
      return "file";
  }
}

SourceType source_type_from_string(const std::string& str) {
  if (str == "text")
    return SourceType::Text;
  if (str == "website")
    return SourceType::Website;
  return SourceType::File;
}

std::string format_rfc3339_utc(std::chrono::system_clock::time_point time_point) {
  std::time_t seconds = std::chrono::system_clock::to_time_t(time_point);
  std::tm utc{};
  gmtime_r(&seconds, &utc);

  std::ostringstream ss;
  ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
  return ss.str();
}

void to_json(nlohmann::json& j, const ProcessedFile& file) {
  j = nlohmann::json{{"id", file.id},
                     {"filename", file.filename},
                     {"original_size", file.original_size},
                     {"content_hash", file.content_hash},
                     {"chunk_count", file.chunks.size()},
                     {"chunks", file.chunks},
                     {"processed_at", format_rfc3339_utc(file.processed_at)}};
}

void to_json(nlohmann::json& j, const FileMetadata& metadata) {
  j = nlohmann::json{{"id", metadata.id},
                     {"filename", metadata.filename},
                     {"extension", metadata.extension},
                     {"size", metadata.size},
                     {"hash", metadata.content_hash},
                     {"processed_at", format_rfc3339_utc(metadata.processed_at)},
                     {"chunk_count", metadata.chunk_count},
                     {"token_count", metadata.token_count}};
}

}  // namespace chunkwise_core
