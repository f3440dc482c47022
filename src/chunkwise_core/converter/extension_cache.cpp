#include "chunkwise_core/converter/extension_cache.hpp"

#include <algorithm>
#include <mutex>

namespace chunkwise_core {

void ExtensionCache::ensure_loaded(const Loader& loader) {
  {
    std::shared_lock<std::shared_mutex> read_lock(mutex_);
    if (!extensions_.empty()) {
      return;
    }
  }

  std::unique_lock<std::shared_mutex> write_lock(mutex_);
  // Another caller may have filled the cache while we waited for the write lock
  if (!extensions_.empty()) {
    return;
  }

  std::vector<std::string> loaded = loader();
  extensions_ = std::unordered_set<std::string>(loaded.begin(), loaded.end());
}

bool ExtensionCache::contains(const std::string& extension) const {
  std::shared_lock<std::shared_mutex> read_lock(mutex_);
  return extensions_.count(extension) > 0;
}

std::vector<std::string> ExtensionCache::snapshot() const {
  std::vector<std::string> extensions;
  {
    std::shared_lock<std::shared_mutex> read_lock(mutex_);
    extensions.assign(extensions_.begin(), extensions_.end());
  }
  std::sort(extensions.begin(), extensions.end());
  return extensions;
}

bool ExtensionCache::is_loaded() const {
  std::shared_lock<std::shared_mutex> read_lock(mutex_);
  return !extensions_.empty();
}

void ExtensionCache::invalidate() {
  std::unique_lock<std::shared_mutex> write_lock(mutex_);
  extensions_.clear();
}

}  // namespace chunkwise_core
