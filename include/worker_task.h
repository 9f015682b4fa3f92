// include/worker_task.h
// Cancellable background unit of work with a future-delivered result

#ifndef WORKER_TASK_H
#define WORKER_TASK_H

#include <syslog.h>
#include <atomic>
#include <exception>
#include <future>
#include <stdexcept>
#include <string>
#include <thread>
#include "cancel_token.h"

namespace TvBridge {

/**
 * Runs execute() on its own thread once. The result (or the exception the
 * body threw) arrives through the future returned by start().
 *
 * stop() sets the cancel token and joins. The token is passed to every
 * bridge invocation, so a running child is killed within one poll slice.
 * Derived classes must call stop() from their destructor: the thread calls
 * back into the derived execute().
 */
template <typename Result>
class WorkerTask {
private:
    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> started_{false};
    std::string name_;

protected:
    CancelToken cancel_;

    virtual Result execute(const CancelToken& cancel) = 0;

public:
    explicit WorkerTask(std::string name) : name_(std::move(name)) {}
    virtual ~WorkerTask() = default;

    WorkerTask(const WorkerTask&) = delete;
    WorkerTask& operator=(const WorkerTask&) = delete;

    /**
     * @throws std::logic_error when called a second time
     */
    std::future<Result> start() {
        if (started_.exchange(true)) {
            throw std::logic_error("worker task '" + name_ + "' already started");
        }

        std::promise<Result> promise;
        std::future<Result> future = promise.get_future();

        running_ = true;
        thread_ = std::thread([this, p = std::move(promise)]() mutable {
            try {
                p.set_value(execute(cancel_));
            } catch (const std::exception& e) {
                syslog(LOG_ERR, "Worker task '%s' failed: %s", name_.c_str(), e.what());
                p.set_exception(std::current_exception());
            } catch (...) {
                syslog(LOG_ERR, "Worker task '%s' failed", name_.c_str());
                p.set_exception(std::current_exception());
            }
            running_ = false;
        });

        syslog(LOG_DEBUG, "Started worker task '%s'", name_.c_str());
        return future;
    }

    // Request cancellation without waiting
    void cancel() {
        cancel_.cancel();
    }

    void stop() {
        cancel_.cancel();
        if (thread_.joinable()) {
            thread_.join();
            syslog(LOG_DEBUG, "Stopped worker task '%s'", name_.c_str());
        }
    }

    bool is_running() const {
        return running_;
    }

    bool is_cancelled() const {
        return cancel_.is_cancelled();
    }

    const std::string& name() const {
        return name_;
    }
};

} // namespace TvBridge

#endif // WORKER_TASK_H
