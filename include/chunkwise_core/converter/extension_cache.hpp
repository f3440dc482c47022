#pragma once

#include <functional>
#include <shared_mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace chunkwise_core {

/**
 * @class ExtensionCache
 * @brief Lazily populated set of file extensions accepted by the conversion service.
 *
 * Lifecycle: empty on construction, populated by the first ensure_loaded()
 * call, kept until invalidate(). Readers share a lock; the first caller to see
 * an empty cache takes the exclusive lock and re-checks before running the
 * loader, so concurrent first callers fetch only once. An empty result from
 * the loader leaves the cache empty and the next call fetches again.
 * Loader exceptions propagate to the caller and leave the cache untouched.
 */
class ExtensionCache {
 public:
  using Loader = std::function<std::vector<std::string>()>;

  ExtensionCache() = default;

  ExtensionCache(const ExtensionCache&) = delete;
  ExtensionCache& operator=(const ExtensionCache&) = delete;

  void ensure_loaded(const Loader& loader);

  bool contains(const std::string& extension) const;

  // Sorted copy of the cached extensions
  std::vector<std::string> snapshot() const;

  bool is_loaded() const;

  void invalidate();

 private:
  mutable std::shared_mutex mutex_;
  std::unordered_set<std::string> extensions_;
};

}  // namespace chunkwise_core
