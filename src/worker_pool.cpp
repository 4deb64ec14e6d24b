#include "worker_pool.hpp"
#include <iostream>

namespace v2n {

CancellationToken::CancellationToken() : state_(std::make_shared<State>()) {}

void CancellationToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->cancelled = true;
    }
    state_->cv.notify_all();
}

bool CancellationToken::cancelled() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

bool CancellationToken::sleep_for(std::chrono::milliseconds duration) const {
    std::unique_lock<std::mutex> lock(state_->mutex);
    return !state_->cv.wait_for(lock, duration, [this] { return state_->cancelled; });
}

WorkerPool::WorkerPool(std::string name, size_t threads) : name_(std::move(name)) {
    if (threads == 0) {
        threads = 1;
    }
    threads_.reserve(threads);
    for (size_t i = 0; i < threads; ++i) {
        threads_.emplace_back(&WorkerPool::run, this);
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

void WorkerPool::enqueue(std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_) {
            throw std::runtime_error("WorkerPool '" + name_ + "' is shut down");
        }
        queue_.push(std::move(job));
    }
    cv_.notify_one();
}

void WorkerPool::shutdown(bool discard_pending) {
    std::queue<std::function<void()>> discarded;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = true;
        if (discard_pending) {
            std::swap(discarded, queue_);
        }
    }
    cv_.notify_all();

    if (!discarded.empty()) {
        std::cout << "[" << name_ << "] Discarding " << discarded.size() << " pending task(s)" << std::endl;
    }

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

void WorkerPool::run() {
    for (;;) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return shutdown_ || !queue_.empty(); });
            if (queue_.empty()) {
                return;
            }
            job = std::move(queue_.front());
            queue_.pop();
        }
        // packaged_task stores any exception in the future
        job();
    }
}

} // namespace v2n
