#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <opencv2/opencv.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace v2n {

class VideoOpenError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/*
  DecoderPool

  Hands out exclusively-owned cv::VideoCapture handles on one video file.

  - A capture handle is NOT safe for concurrent seeks; never share one.
  - acquire() reuses an idle handle, opens a new one while below
    max_handles, and otherwise blocks until a lease is returned.
  - The returned shared_ptr is the lease: its deleter puts the handle
    back, on every exit path. If the pool is gone the handle is closed.

  Must be owned by a shared_ptr (leases hold a weak reference).
*/
class DecoderPool : public std::enable_shared_from_this<DecoderPool> {
public:
    DecoderPool(std::string video_path, size_t max_handles);

    std::shared_ptr<cv::VideoCapture> acquire();

    const std::string& video_path() const { return video_path_; }
    size_t live_handles() const;
    size_t idle_handles() const;

private:
    std::shared_ptr<cv::VideoCapture> wrap(cv::VideoCapture* capture);
    void release(cv::VideoCapture* capture);

    std::string video_path_;
    size_t max_handles_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::unique_ptr<cv::VideoCapture>> idle_;
    size_t live_handles_ = 0;
};

} // namespace v2n
