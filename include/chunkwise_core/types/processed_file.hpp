#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace chunkwise_core {

// Where a processed document came from, derived from its stored filename
enum class SourceType { Text, Website, File };

// Conversion utilities
std::string to_string(SourceType type);
SourceType source_type_from_string(const std::string& str);

struct ProcessedFile {
  std::string id;
  std::string filename;
  std::uint64_t original_size;
  std::string content_hash;
  std::string markdown;
  std::vector<std::string> chunks;
  std::chrono::system_clock::time_point processed_at;
};

// Summary of a ProcessedFile suitable for listings and API responses
struct FileMetadata {
  std::string id;
  std::string filename;
  std::string extension;
  std::uint64_t size;
  std::string content_hash;
  std::chrono::system_clock::time_point processed_at;
  size_t chunk_count;
  size_t token_count;
};

// RFC 3339 UTC timestamp with second precision, e.g. 2024-05-01T12:00:00Z
std::string format_rfc3339_utc(std::chrono::system_clock::time_point time_point);

void to_json(nlohmann::json& j, const ProcessedFile& file);
void to_json(nlohmann::json& j, const FileMetadata& metadata);

}  // namespace chunkwise_core
