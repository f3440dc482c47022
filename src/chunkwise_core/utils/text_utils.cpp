#include "chunkwise_core/utils/text_utils.hpp"

#include <utf8.h>

#include <algorithm>
#include <cctype>
#include <iterator>

namespace chunkwise_core::text_utils {

namespace {
bool is_space(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}
}  // namespace

std::string_view trim(std::string_view text) {
  size_t start = 0;
  while (start < text.size() && is_space(text[start])) {
    ++start;
  }
  size_t end = text.size();
  while (end > start && is_space(text[end - 1])) {
    --end;
  }
  return text.substr(start, end - start);
}

bool is_blank(std::string_view text) {
  return std::all_of(text.begin(), text.end(), is_space);
}

std::string to_lower(std::string_view text) {
  std::string lowered(text);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered;
}

std::string ensure_valid_utf8(std::string_view text) {
  if (utf8::is_valid(text.begin(), text.end())) {
    return std::string(text);
  }
  std::string repaired;
  repaired.reserve(text.size());
  utf8::replace_invalid(text.begin(), text.end(), std::back_inserter(repaired));
  return repaired;
}

std::vector<size_t> code_point_offsets(const std::string& text) {
  std::vector<size_t> offsets;
  offsets.reserve(text.size() + 1);
  for (auto it = text.begin(); it != text.end(); utf8::next(it, text.end())) {
    offsets.push_back(static_cast<size_t>(it - text.begin()));
  }
  offsets.push_back(text.size());
  return offsets;
}

size_t utf8_prefix_length(std::string_view text, size_t max_bytes) {
  if (text.size() <= max_bytes) {
    return text.size();
  }

  auto it = text.begin();
  auto last_fit = text.begin();
  while (it != text.end()) {
    utf8::next(it, text.end());
    if (static_cast<size_t>(it - text.begin()) > max_bytes) {
      break;
    }
    last_fit = it;
  }

  if (last_fit == text.begin()) {
    // A single code point wider than max_bytes still has to move forward
    auto first = text.begin();
    utf8::next(first, text.end());
    return static_cast<size_t>(first - text.begin());
  }
  return static_cast<size_t>(last_fit - text.begin());
}

std::vector<std::string> split_lines(std::string_view text) {
  std::vector<std::string> lines;
  size_t start = 0;
  while (true) {
    size_t newline = text.find('\n', start);
    if (newline == std::string_view::npos) {
      lines.emplace_back(text.substr(start));
      break;
    }
    lines.emplace_back(text.substr(start, newline - start));
    start = newline + 1;
  }
  return lines;
}

std::string join_lines(const std::vector<std::string>& lines) {
  std::string joined;
  for (size_t i = 0; i < lines.size(); ++i) {
    if (i > 0) {
      joined += '\n';
    }
    joined += lines[i];
  }
  return joined;
}

}  // namespace chunkwise_core::text_utils
