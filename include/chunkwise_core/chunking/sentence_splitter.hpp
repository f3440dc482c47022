#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace chunkwise_core {

// Heuristic sentence segmentation: '.', '!' or '?' followed by a space or newline and then
// an uppercase ASCII letter ends a sentence. Abbreviations and decimals mostly survive.
std::vector<std::string> split_on_sentences(std::string_view text);

}  // namespace chunkwise_core
