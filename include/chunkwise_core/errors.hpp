#pragma once

#include <exception>
#include <string>

namespace chunkwise_core {

// Base for every failure surfaced by the document processing pipeline
class ProcessingError : public std::exception {
 public:
  explicit ProcessingError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Bad caller input: oversized, empty, unsupported or unindexable. Never retried.
class ValidationError : public ProcessingError {
 public:
  explicit ValidationError(const std::string& message) : ProcessingError(message) {}
};

// Failure reported by (or while talking to) the conversion service.
// status_code is 0 when no HTTP response was received.
class ConverterError : public ProcessingError {
 public:
  explicit ConverterError(const std::string& message, long status_code = 0)
      : ProcessingError(message), status_code_(status_code) {}

  long status_code() const noexcept {
    return status_code_;
  }

 private:
  long status_code_;
};

}  // namespace chunkwise_core
