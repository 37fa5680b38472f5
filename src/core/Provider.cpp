#include "posecast/core/Provider.h"

namespace posecast {

void LatestFrameSlot::publish(SkeletonFrame frame) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (frame_) ++superseded_;
    frame_ = std::move(frame);
    ++published_;
}

std::optional<SkeletonFrame> LatestFrameSlot::take() {
    std::lock_guard<std::mutex> lock(mtx_);
    std::optional<SkeletonFrame> out;
    out.swap(frame_);
    return out;
}

uint64_t LatestFrameSlot::published() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return published_;
}

uint64_t LatestFrameSlot::superseded() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return superseded_;
}

} // namespace posecast
