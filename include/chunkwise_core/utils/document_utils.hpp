#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "chunkwise_core/types/processed_file.hpp"

namespace chunkwise_core {

FileMetadata generate_file_metadata(const ProcessedFile& file);

// "text-*.txt" -> Text, "website-*" -> Website, anything else -> File
SourceType get_source_type(const std::string& filename);

// Stored uploads are named "<owner_id>-<basename>" so different owners never collide
std::string generate_stored_filename(const std::string& owner_id, const std::string& original_filename);
std::string parse_stored_filename(const std::string& stored_filename, const std::string& owner_id);

std::string generate_document_id(const std::string& owner_id,
                                 const std::string& filename,
                                 int chunk_index);

/**
 * @brief Rejects names that are empty, contain "..", or contain path
 *        separators or other reserved characters.
 * @throw ValidationError describing the first problem found.
 */
void validate_filename(const std::string& filename);

// 512 -> "512 B", 1536 -> "1.5 KB", 10485760 -> "10.0 MB"
std::string format_file_size(std::uint64_t bytes);

// Collapses runs of blank lines into a single empty line
std::string clean_markdown(std::string_view markdown);

// Text of the first level-one heading, or "" when there is none
std::string extract_title(std::string_view markdown);

size_t count_words(std::string_view text);

// Cuts text to max_length bytes, replacing the tail with "..." when it was longer
std::string truncate_text(const std::string& text, size_t max_length);

}  // namespace chunkwise_core
