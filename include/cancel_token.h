// include/cancel_token.h
#ifndef CANCEL_TOKEN_H
#define CANCEL_TOKEN_H

#include <atomic>

namespace TvBridge {

/**
 * Cooperative cancellation flag shared between a foreground controller and
 * a worker. CommandExecutor polls it while a child is running and kills the
 * child's process group once it is set.
 */
class CancelToken {
private:
    std::atomic<bool> cancelled_{false};

public:
    void cancel() {
        cancelled_.store(true, std::memory_order_release);
    }

    bool is_cancelled() const {
        return cancelled_.load(std::memory_order_acquire);
    }

    void reset() {
        cancelled_.store(false, std::memory_order_release);
    }
};

} // namespace TvBridge

#endif // CANCEL_TOKEN_H
