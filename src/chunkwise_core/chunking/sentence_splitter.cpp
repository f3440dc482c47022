#include "chunkwise_core/chunking/sentence_splitter.hpp"

#include "chunkwise_core/utils/text_utils.hpp"

namespace chunkwise_core {

namespace {
bool is_terminator(char c) {
  return c == '.' || c == '!' || c == '?';
}
}  // namespace

std::vector<std::string> split_on_sentences(std::string_view text) {
  std::vector<std::string> sentences;
  size_t sentence_start = 0;

  for (size_t i = 0; i < text.size(); ++i) {
    if (!is_terminator(text[i])) {
      continue;
    }

    bool boundary = false;
    if (i + 1 == text.size()) {
      boundary = true;
    } else if ((text[i + 1] == ' ' || text[i + 1] == '\n') && i + 2 < text.size()) {
      boundary = text[i + 2] >= 'A' && text[i + 2] <= 'Z';
    }

    if (boundary) {
      sentences.emplace_back(text_utils::trim(text.substr(sentence_start, i + 1 - sentence_start)));
      sentence_start = i + 1;
    }
  }

  std::string_view remainder = text_utils::trim(text.substr(sentence_start));
  if (!remainder.empty()) {
    sentences.emplace_back(remainder);
  }
  return sentences;
}

}  // namespace chunkwise_core
