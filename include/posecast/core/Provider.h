#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include "Types.h"

namespace posecast {

// Source of already-computed skeleton samples (pose-estimation backend, replay, ...).
class ISkeletonProvider {
public:
    virtual ~ISkeletonProvider() = default;

    // Throws ResourceError if the source cannot be opened.
    virtual void start() = 0;
    virtual void stop() = 0;

    // Non-blocking; the newest frame not yet handed out, or nullopt.
    virtual std::optional<SkeletonFrame> getLatest() = 0;
};

// Capacity-one handoff with overwrite semantics: a newer frame replaces an unconsumed one.
class LatestFrameSlot {
public:
    void publish(SkeletonFrame frame);
    std::optional<SkeletonFrame> take();

    uint64_t published() const;
    uint64_t superseded() const;   // frames overwritten before anyone took them

private:
    mutable std::mutex mtx_;
    std::optional<SkeletonFrame> frame_;
    uint64_t published_ = 0;
    uint64_t superseded_ = 0;
};

} // namespace posecast
