#include "chunkwise_core/chunking/token_estimator.hpp"

namespace chunkwise_core {

size_t estimate_token_count(std::string_view text, size_t chars_per_token) {
  if (chars_per_token == 0) {
    chars_per_token = DEFAULT_CHARS_PER_TOKEN;
  }
  return text.size() / chars_per_token;
}

size_t estimate_token_count_ceil(std::string_view text, size_t chars_per_token) {
  if (chars_per_token == 0) {
    chars_per_token = DEFAULT_CHARS_PER_TOKEN;
  }
  return (text.size() + chars_per_token - 1) / chars_per_token;
}

}  // namespace chunkwise_core
