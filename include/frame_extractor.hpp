#pragma once

#include "decoder_pool.hpp"
#include "note_types.hpp"
#include "worker_pool.hpp"
#include <opencv2/opencv.hpp>
#include <memory>
#include <string>

namespace v2n {

// Throws PipelineError(VideoUnavailable) when the file cannot be opened
VideoInfo probe_video(const std::string& video_path);

class FrameExtractor {
public:
    FrameExtractor(std::shared_ptr<DecoderPool> decoders, const FrameConfig& config, std::string output_dir);
    ~FrameExtractor();

    // Finds the sharpest frame near target_seconds and writes it to frame_path(index).
    // Never throws for decode problems; those come back as FrameFailure.
    FrameResult extract(size_t index, double target_seconds, const CancellationToken& cancel) const;

    // Variance of the Laplacian over the grayscale image
    static double sharpness(const cv::Mat& frame);

    // Timestamp of the frame just read: the decoder's reported position when it has
    // one, the requested index otherwise. Seeks on inter-coded streams may land off target.
    static double landed_seconds(double position_msec, int requested_index, double fps);

    static std::string frame_path(const std::string& output_dir, size_t index);

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace v2n
