#pragma once

#include <cstddef>
#include <string_view>

namespace chunkwise_core {

static constexpr size_t DEFAULT_CHARS_PER_TOKEN = 4;

/**
 * @brief Approximates the number of model tokens in a piece of text.
 *
 * This is a byte-length heuristic, not a tokenizer. Every budget check in the
 * chunking pipeline goes through it, so comparisons stay consistent even
 * though absolute counts are approximate. A chars_per_token of 0 falls back
 * to DEFAULT_CHARS_PER_TOKEN.
 */
size_t estimate_token_count(std::string_view text,
                            size_t chars_per_token = DEFAULT_CHARS_PER_TOKEN);

// Same heuristic rounded up; used for overhead that must never be under-counted
size_t estimate_token_count_ceil(std::string_view text,
                                 size_t chars_per_token = DEFAULT_CHARS_PER_TOKEN);

}  // namespace chunkwise_core
