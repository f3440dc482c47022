#pragma once

#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "chunkwise_core/services/document_processor.hpp"

namespace chunkwise_cli {

class Config {
 public:
  std::string markitdown_url;
  int request_timeout_seconds;

  // Processing limits
  std::uint64_t max_file_bytes;
  size_t max_text_bytes;
  size_t text_chunk_size;

  // Chunking budgets
  size_t max_tokens;
  size_t min_tokens;
  size_t chars_per_token;
  double overlap_percent;
  size_t max_embedding_tokens;
  size_t metadata_token_buffer;

  std::string upload_directory;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename +
                               "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    if (!json_config.is_object()) {
      throw std::runtime_error("config must be a JSON object");
    }

    Config config;
    try {
      config.markitdown_url =
          json_config.value("markitdown_url", std::string("http://localhost:8000"));
      config.request_timeout_seconds = json_config.value("request_timeout_seconds", 60);

      config.max_file_bytes = json_config.value("max_file_bytes", std::uint64_t{10 * 1024 * 1024});
      config.max_text_bytes = json_config.value("max_text_bytes", size_t{200000});
      config.text_chunk_size = json_config.value("text_chunk_size", size_t{1000});

      config.max_tokens = json_config.value("max_tokens", size_t{1200});
      config.min_tokens = json_config.value("min_tokens", size_t{800});
      config.chars_per_token = json_config.value("chars_per_token", size_t{4});
      config.overlap_percent = json_config.value("overlap_percent", 0.10);
      config.max_embedding_tokens = json_config.value("max_embedding_tokens", size_t{7000});
      config.metadata_token_buffer = json_config.value("metadata_token_buffer", size_t{200});

      config.upload_directory =
          json_config.value("upload_directory", std::string("./data/uploads"));
    } catch (const nlohmann::json::exception& e) {
      throw std::runtime_error(std::string("Invalid config value: ") + e.what());
    }

    config.validate();
    return config;
  }

  chunkwise_core::ProcessorOptions processor_options() const {
    chunkwise_core::ProcessorOptions options;
    options.max_file_bytes = max_file_bytes;
    options.max_text_bytes = max_text_bytes;
    options.text_chunk_size = text_chunk_size;
    options.chunk_options = {.max_tokens = max_tokens,
                             .min_tokens = min_tokens,
                             .chars_per_token = chars_per_token,
                             .overlap_percent = overlap_percent};
    options.embedding_budget = {.max_embedding_tokens = max_embedding_tokens,
                                .metadata_token_buffer = metadata_token_buffer};
    return options;
  }

 private:
  void validate() const {
    if (markitdown_url.empty()) {
      throw std::runtime_error("markitdown_url cannot be empty");
    }
    if (request_timeout_seconds <= 0) {
      throw std::runtime_error("request_timeout_seconds must be greater than 0");
    }
    if (max_file_bytes == 0) {
      throw std::runtime_error("max_file_bytes must be greater than 0");
    }
    if (max_text_bytes == 0) {
      throw std::runtime_error("max_text_bytes must be greater than 0");
    }
    if (text_chunk_size == 0) {
      throw std::runtime_error("text_chunk_size must be greater than 0");
    }
    if (max_tokens == 0 || chars_per_token == 0) {
      throw std::runtime_error("max_tokens and chars_per_token must be greater than 0");
    }
    if (metadata_token_buffer >= max_embedding_tokens) {
      throw std::runtime_error("metadata_token_buffer must be smaller than max_embedding_tokens");
    }
    if (upload_directory.empty()) {
      throw std::runtime_error("upload_directory cannot be empty");
    }
  }
};

}  // namespace chunkwise_cli
