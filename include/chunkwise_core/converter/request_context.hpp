#pragma once

#include <atomic>
#include <chrono>
#include <memory>

namespace chunkwise_core {

/**
 * @brief Deadline and cancellation for one outbound call.
 *
 * Copies share the same cancellation flag, so a context handed to a worker
 * can be cancelled from the thread that created it. A zero timeout means the
 * client's own default applies.
 */
class RequestContext {
 public:
  RequestContext() : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

  static RequestContext with_timeout(std::chrono::milliseconds timeout) {
    RequestContext ctx;
    ctx.timeout_ = timeout;
    return ctx;
  }

  void cancel() const {
    cancelled_->store(true);
  }
  bool is_cancelled() const {
    return cancelled_->load();
  }

  std::chrono::milliseconds timeout() const {
    return timeout_;
  }

 private:
  std::chrono::milliseconds timeout_{0};
  std::shared_ptr<std::atomic<bool>> cancelled_;
};

}  // namespace chunkwise_core
