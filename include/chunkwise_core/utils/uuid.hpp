#pragma once

#include <string>

namespace chunkwise_core {

// Random (version 4) UUID in canonical 8-4-4-4-12 lowercase hex form
std::string generate_uuid_v4();

}  // namespace chunkwise_core
