#include "chunkwise_core/services/file_store.hpp"

#include <fstream>
#include <iostream>
#include <system_error>

#include "chunkwise_core/utils/document_utils.hpp"

namespace chunkwise_core {

namespace fs = std::filesystem;

fs::path FileStore::save(const UploadedFile& file,
                         const fs::path& directory,
                         const std::string& prefix) {
  const std::string basename = fs::path(file.filename).filename().string();
  validate_filename(basename);

  std::error_code ec;
  fs::create_directories(directory, ec);
  if (ec) {
    throw FileStoreError("failed to create directory " + directory.string() + ": " + ec.message());
  }

  const fs::path destination = directory / generate_stored_filename(prefix, basename);

  std::unique_ptr<std::istream> source = file.open ? file.open() : nullptr;
  if (!source || !*source) {
    throw FileStoreError("failed to open uploaded file: " + file.filename);
  }

  {
    std::ofstream out(destination, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw FileStoreError("failed to create file: " + destination.string());
    }

    char buffer[64 * 1024];
    while (*source && out) {
      source->read(buffer, sizeof(buffer));
      const std::streamsize count = source->gcount();
      if (count <= 0) {
        break;
      }
      out.write(buffer, count);
    }
    out.flush();

    if (source->bad() || !out) {
      out.close();
      fs::remove(destination, ec);
      throw FileStoreError("failed to write file: " + destination.string());
    }
  }

  std::cout << "FileStore: saved " << destination << std::endl;
  return destination;
}

void FileStore::remove(const fs::path& path) {
  std::error_code ec;
  fs::remove(path, ec);
  if (ec && ec != std::errc::no_such_file_or_directory) {
    throw FileStoreError("failed to delete file " + path.string() + ": " + ec.message());
  }
}

}  // namespace chunkwise_core
