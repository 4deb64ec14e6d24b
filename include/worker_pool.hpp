#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace v2n {

/*
  CancellationToken

  Copyable handle on a shared cancel flag. Work items poll cancelled()
  between units of work; sleep_for() wakes early once cancel() is called.
*/
class CancellationToken {
public:
    CancellationToken();

    void cancel();
    bool cancelled() const;

    // Returns false when woken by cancellation
    bool sleep_for(std::chrono::milliseconds duration) const;

private:
    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        bool cancelled = false;
    };
    std::shared_ptr<State> state_;
};

class OperationCancelled : public std::runtime_error {
public:
    OperationCancelled() : std::runtime_error("Operation cancelled") {}
};

/*
  Fixed-size pool of worker threads draining a FIFO queue.

  shutdown(true) discards queued work that has not started; their futures
  report std::future_error (broken promise). Running tasks always finish.
*/
class WorkerPool {
public:
    WorkerPool(std::string name, size_t threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    template <typename F>
    auto submit(F&& task) -> std::future<std::invoke_result_t<F>> {
        using Result = std::invoke_result_t<F>;
        auto packaged = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(task));
        auto future = packaged->get_future();
        enqueue([packaged]() { (*packaged)(); });
        return future;
    }

    void shutdown(bool discard_pending = false);

    size_t size() const { return threads_.size(); }

private:
    void enqueue(std::function<void()> job);
    void run();

    std::string name_;
    std::vector<std::thread> threads_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<std::function<void()>> queue_;
    bool shutdown_ = false;
};

} // namespace v2n
