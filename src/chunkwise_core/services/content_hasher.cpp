#include "chunkwise_core/services/content_hasher.hpp"

#include <iomanip>
#include <sstream>

namespace chunkwise_core {

ContentHasher::ContentHasher() : mdctx_(EVP_MD_CTX_new()) {
  if (!mdctx_) {
    throw HashingError("Failed to create EVP context for hashing");
  }
  if (EVP_DigestInit_ex(mdctx_.get(), EVP_sha256(), nullptr) != 1) {
    throw HashingError("Failed to initialize SHA256 digest");
  }
}

void ContentHasher::update(std::string_view bytes) {
  if (finalized_) {
    throw HashingError("SHA256 digest already finalized");
  }
  if (bytes.empty()) {
    return;
  }
  if (EVP_DigestUpdate(mdctx_.get(), bytes.data(), bytes.size()) != 1) {
    throw HashingError("Failed to update SHA256 digest");
  }
}

std::string ContentHasher::hex_digest() {
  if (finalized_) {
    throw HashingError("SHA256 digest already finalized");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;
  if (EVP_DigestFinal_ex(mdctx_.get(), hash, &hash_len) != 1) {
    throw HashingError("Failed to finalize SHA256 digest");
  }
  finalized_ = true;

  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }
  return ss.str();
}

std::string ContentHasher::sha256_hex(std::string_view content) {
  ContentHasher hasher;
  hasher.update(content);
  return hasher.hex_digest();
}

}  // namespace chunkwise_core
