#include "chunkwise_core/utils/uuid.hpp"

#include <openssl/rand.h>

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace chunkwise_core {

std::string generate_uuid_v4() {
  unsigned char bytes[16];
  if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
    throw std::runtime_error("Failed to generate random bytes for UUID using RAND_bytes.");
  }

  bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);  // version 4
  bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);  // RFC 4122 variant

  std::stringstream ss;
  for (int i = 0; i < 16; i++) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      ss << '-';
    }
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(bytes[i]);
  }
  return ss.str();
}

}  // namespace chunkwise_core
