#pragma once

#include <filesystem>
#include <string>

#include "chunkwise_core/types/uploaded_file.hpp"

namespace chunkwise_core {

class FileStoreError : public std::exception {
 public:
  explicit FileStoreError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * @class FileStore
 * @brief Keeps raw uploaded bytes on disk, namespaced by a caller prefix.
 */
class FileStore {
 public:
  /**
   * @brief Writes the upload to `<directory>/<prefix>-<basename>`.
   *
   * The directory is created when missing. A partially written file is
   * removed before the error is reported.
   *
   * @return The path of the stored file.
   * @throw ValidationError if the basename is not a valid filename.
   * @throw FileStoreError if the upload cannot be read or the file cannot be written.
   */
  static std::filesystem::path save(const UploadedFile& file,
                                    const std::filesystem::path& directory,
                                    const std::string& prefix);

  // Deletes a stored file. A file that is already gone is not an error.
  static void remove(const std::filesystem::path& path);
};

}  // namespace chunkwise_core
