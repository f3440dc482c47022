#pragma once

#include <exception>
#include <memory>
#include <string>
#include <string_view>

#include <openssl/evp.h>

namespace chunkwise_core {

class HashingError : public std::exception {
 public:
  explicit HashingError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * @class ContentHasher
 * @brief Incremental SHA-256 so content can be hashed while it is being read.
 *
 * Feed bytes with update() as they arrive and call hex_digest() once at the
 * end. The hasher cannot be reused after hex_digest().
 */
class ContentHasher {
 public:
  ContentHasher();

  ContentHasher(const ContentHasher&) = delete;
  ContentHasher& operator=(const ContentHasher&) = delete;

  void update(std::string_view bytes);

  // Lowercase hex SHA-256 of everything passed to update()
  std::string hex_digest();

  // One-shot helper
  static std::string sha256_hex(std::string_view content);

 private:
  struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const {
      EVP_MD_CTX_free(ctx);
    }
  };

  std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> mdctx_;
  bool finalized_ = false;
};

}  // namespace chunkwise_core
