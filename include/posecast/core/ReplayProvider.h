#pragma once
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "Provider.h"

namespace posecast {

/* Plays back recorded wire frames (.jsonl, one frame per line) at their recorded
*  cadence on a background thread, publishing into a LatestFrameSlot.
*
*  @note - blank lines are skipped, malformed lines are logged and skipped
*  @note - with loop == true timestamps keep increasing across repetitions
*/
class ReplayProvider : public ISkeletonProvider {
public:
    explicit ReplayProvider(std::string path, bool loop = true);
    ~ReplayProvider() override;

    // Throws ResourceError if the file is missing or holds no valid frame.
    void start() override;
    void stop() override;
    std::optional<SkeletonFrame> getLatest() override;

    size_t frameCount() const { return frames_.size(); }
    bool finished() const { return finished_; }
    uint64_t publishedCount() const { return slot_.published(); }

    // parses the whole file; invalid lines are skipped
    static std::vector<SkeletonFrame> readJsonl(const std::string& path, size_t* skipped = nullptr);

private:
    void playback();
    bool pause(int64_t gap_ms);

    std::string path_;
    bool loop_;
    std::vector<SkeletonFrame> frames_;
    LatestFrameSlot slot_;

    std::thread worker_;
    std::mutex mtx_;
    std::condition_variable cv_;
    bool stop_requested_ = false;
    std::atomic<bool> finished_{false};
};

} // namespace posecast
