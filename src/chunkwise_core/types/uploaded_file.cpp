#include "chunkwise_core/types/uploaded_file.hpp"

#include <fstream>
#include <sstream>

namespace chunkwise_core {

UploadedFile UploadedFile::from_path(const std::filesystem::path& path) {
  UploadedFile file;
  file.filename = path.filename().string();
  file.size = std::filesystem::file_size(path);
  file.open = [path]() -> std::unique_ptr<std::istream> {
    return std::make_unique<std::ifstream>(path, std::ios::binary);
  };
  return file;
}

UploadedFile UploadedFile::from_bytes(const std::string& filename, std::string data) {
  UploadedFile file;
  file.filename = filename;
  file.size = data.size();
  auto shared_data = std::make_shared<const std::string>(std::move(data));
  file.open = [shared_data]() -> std::unique_ptr<std::istream> {
    return std::make_unique<std::istringstream>(*shared_data);
  };
  return file;
}

}  // namespace chunkwise_core
