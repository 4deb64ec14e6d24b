#include "decoder_pool.hpp"

namespace v2n {

DecoderPool::DecoderPool(std::string video_path, size_t max_handles)
    : video_path_(std::move(video_path)),
      max_handles_(max_handles == 0 ? 1 : max_handles) {}

std::shared_ptr<cv::VideoCapture> DecoderPool::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !idle_.empty() || live_handles_ < max_handles_; });

    if (!idle_.empty()) {
        auto capture = std::move(idle_.back());
        idle_.pop_back();
        return wrap(capture.release());
    }

    ++live_handles_;
    lock.unlock();

    auto capture = std::make_unique<cv::VideoCapture>(video_path_);
    if (!capture->isOpened()) {
        {
            std::lock_guard<std::mutex> rollback_lock(mutex_);
            --live_handles_;
        }
        cv_.notify_one();
        throw VideoOpenError("Failed to open video: " + video_path_);
    }
    return wrap(capture.release());
}

size_t DecoderPool::live_handles() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return live_handles_;
}

size_t DecoderPool::idle_handles() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return idle_.size();
}

std::shared_ptr<cv::VideoCapture> DecoderPool::wrap(cv::VideoCapture* capture) {
    std::weak_ptr<DecoderPool> weak_self = shared_from_this();
    return std::shared_ptr<cv::VideoCapture>(capture, [weak_self](cv::VideoCapture* released) {
        if (auto self = weak_self.lock()) {
            self->release(released);
            return;
        }
        delete released;
    });
}

void DecoderPool::release(cv::VideoCapture* capture) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        idle_.emplace_back(capture);
    }
    cv_.notify_one();
}

} // namespace v2n
