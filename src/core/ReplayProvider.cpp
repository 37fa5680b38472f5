#include "posecast/core/ReplayProvider.h"
#include "posecast/core/Errors.h"
#include <posecast/logging.hpp>
#include <algorithm>
#include <chrono>
#include <limits>
#include <fstream>

namespace posecast {

// gaps longer than this in a recording are shortened during playback
static constexpr int64_t kMaxReplayGapMs = 1000;
// pause between two passes of a looped recording, at least one 60 Hz frame
static constexpr int64_t kMinLoopGapMs = 16;

ReplayProvider::ReplayProvider(std::string path, bool loop)
    : path_(std::move(path)), loop_(loop) {}

ReplayProvider::~ReplayProvider() {
    stop();
}

std::vector<SkeletonFrame> ReplayProvider::readJsonl(const std::string& path, size_t* skipped) {
    std::vector<SkeletonFrame> out;
    size_t bad = 0;
    std::ifstream ifs(path);
    std::string line;
    size_t line_no = 0;
    while (std::getline(ifs, line)) {
        ++line_no;
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
        try {
            out.push_back(skeletonFrameFromJson(nlohmann::ordered_json::parse(line)));
        } catch (const nlohmann::json::exception& e) {
            ++bad;
            qCWarning(lcProvider) << "Skipping malformed replay line" << line_no
                                  << "in" << QString::fromStdString(path) << ":" << e.what();
        }
    }
    if (skipped) *skipped = bad;
    return out;
}

void ReplayProvider::start() {
    if (worker_.joinable()) return;

    std::ifstream probe(path_);
    if (!probe.is_open()) {
        throw ResourceError("Cannot open replay file: " + path_);
    }
    probe.close();

    frames_ = readJsonl(path_);
    if (frames_.empty()) {
        throw ResourceError("Replay file holds no valid frame: " + path_);
    }
    {
        std::lock_guard<std::mutex> lock(mtx_);
        stop_requested_ = false;
    }
    finished_ = false;
    qCInfo(lcProvider) << "Replaying" << frames_.size() << "frames from" << QString::fromStdString(path_)
                       << (loop_ ? "(looping)" : "");
    worker_ = std::thread(&ReplayProvider::playback, this);
}

void ReplayProvider::stop() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        stop_requested_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
        qCInfo(lcProvider) << "Replay stopped; published=" << slot_.published()
                           << "superseded=" << slot_.superseded();
    }
}

std::optional<SkeletonFrame> ReplayProvider::getLatest() {
    return slot_.take();
}

// Waits gap_ms unless stop() is requested first. Returns false on stop.
bool ReplayProvider::pause(int64_t gap_ms) {
    std::unique_lock<std::mutex> lock(mtx_);
    return !cv_.wait_for(lock, std::chrono::milliseconds(gap_ms), [this] { return stop_requested_; });
}

void ReplayProvider::playback() {
    const int64_t first_ts = frames_.front().ts_ms;
    const int64_t span = std::max<int64_t>(0, frames_.back().ts_ms - first_ts);
    // one average frame gap between passes; a zero-length recording still waits
    const int64_t loop_gap = std::clamp<int64_t>(
        frames_.size() > 1 ? span / static_cast<int64_t>(frames_.size() - 1) : 0,
        kMinLoopGapMs, kMaxReplayGapMs);

    int64_t offset = 0;
    int64_t last_emitted = std::numeric_limits<int64_t>::min();
    bool first_pass = true;

    while (true) {
        if (!first_pass && !pause(loop_gap)) return;
        int64_t prev_ts = first_ts;
        for (const auto& recorded : frames_) {
            const int64_t gap = std::clamp<int64_t>(recorded.ts_ms - prev_ts, 0, kMaxReplayGapMs);
            prev_ts = recorded.ts_ms;
            if (!pause(gap)) return;

            // out-of-order lines are held at the last timestamp handed out
            SkeletonFrame frame = recorded;
            frame.ts_ms = std::max(recorded.ts_ms + offset, last_emitted);
            last_emitted = frame.ts_ms;
            slot_.publish(std::move(frame));
        }
        if (!loop_) break;
        // next pass starts loop_gap after the last frame, matching the wait above
        offset = last_emitted + loop_gap - first_ts;
        first_pass = false;
    }
    finished_ = true;
}

} // namespace posecast
