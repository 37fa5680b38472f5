#pragma once
// 采集线程：CaptureLoop 跑在独立 QThread 上，外部通过投递命令控制

#include <QtCore/QThread>
#include <chrono>
#include <functional>
#include <memory>

#include "posecast/capture/capture_loop.hpp"

namespace posecast {

enum class CommandResult {
    COMPLETED = 0,
    TIMED_OUT,      // not acknowledged within the timeout; it may still run later
    NOT_RUNNING     // worker thread not started or already gone
};

const char* toString(CommandResult r);

/* Hosts a CaptureLoop (and its transport) on a dedicated QThread.
*
*  Control requests from other threads (stop, seating update, anything else) are
*  posted to the loop thread and executed between ticks; the caller blocks for the
*  acknowledgment up to a timeout. Posting from the loop thread itself runs inline.
*/
class CaptureWorker {
public:
    CaptureWorker(std::shared_ptr<ISkeletonProvider> provider,
                  std::unique_ptr<SkeletonTransport> transport,
                  LoopOptions options);
    ~CaptureWorker();

    CaptureWorker(const CaptureWorker&) = delete;
    CaptureWorker& operator=(const CaptureWorker&) = delete;

    // Launches the thread and starts the loop there. Startup errors (ResourceError,
    // ConfigurationError) are rethrown here; ResourceError also if startup is not
    // acknowledged within timeout.
    void start(std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

    // Idempotent. Stops the loop (transport closed, provider stopped) and joins the thread.
    CommandResult stop(std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

    CommandResult updateSeatingLayout(SeatingLayoutPtr layout,
                                      std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

    // Runs command on the loop thread between two ticks. An exception thrown by the
    // command is rethrown to the caller.
    CommandResult post(std::function<void(CaptureLoop&)> command, std::chrono::milliseconds timeout);

    bool isRunning() const;
    CaptureLoop* loop() const { return loop_; }

private:
    QThread thread_;
    CaptureLoop* loop_ = nullptr;   // lives on thread_, deleted once the thread has finished
    bool stopped_ = false;
};

} // namespace posecast
