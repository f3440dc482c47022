#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace chunkwise_core::text_utils {

// Strips ASCII whitespace from both ends
std::string_view trim(std::string_view text);

bool is_blank(std::string_view text);

std::string to_lower(std::string_view text);

// Returns text unchanged when it is valid UTF-8, otherwise a copy with every
// invalid sequence replaced by U+FFFD
std::string ensure_valid_utf8(std::string_view text);

// Byte offset of every code point in a valid UTF-8 string, followed by text.size()
std::vector<size_t> code_point_offsets(const std::string& text);

// Largest prefix length <= max_bytes that ends on a code point boundary.
// Always covers at least one code point when text is non-empty.
size_t utf8_prefix_length(std::string_view text, size_t max_bytes);

std::vector<std::string> split_lines(std::string_view text);

std::string join_lines(const std::vector<std::string>& lines);

}  // namespace chunkwise_core::text_utils
