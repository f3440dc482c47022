#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <istream>
#include <memory>
#include <string>

namespace chunkwise_core {

// An upload as received from a client: a declared name and size plus a way to open its bytes
struct UploadedFile {
  std::string filename;
  std::uint64_t size = 0;
  std::function<std::unique_ptr<std::istream>()> open;

  // Reads lazily from disk; size is taken from the filesystem
  static UploadedFile from_path(const std::filesystem::path& path);

  // Serves an in-memory buffer
  static UploadedFile from_bytes(const std::string& filename, std::string data);
};

}  // namespace chunkwise_core
