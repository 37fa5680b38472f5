#pragma once
// 采集主循环：取帧 -> 元数据合并 -> 发送，固定间隔

#include <QtCore/QObject>
#include <QtCore/QTimer>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "posecast/core/Provider.h"
#include "posecast/core/SeatingLayout.h"
#include "posecast/core/Types.h"
#include "posecast/transport/skeleton_transport.hpp"

namespace posecast {

struct LoopOptions {
    std::chrono::milliseconds interval{16};    // wait after every tick
    std::string calibration_file;              // optional, best-effort
    MetaMap static_metadata = MetaMap::object();
    SeatingLayoutPtr seating;                  // nullptr: no seating enrichment
};

/* Single-threaded capture -> enrich -> transmit loop.
*
*  Idle -> Started -> Running -> Stopped. Stopped is terminal, stop() is idempotent.
*  Every tick takes the newest frame (if any), enriches it and hands it to the
*  transport, then waits exactly `interval` before the next tick no matter how long
*  the tick took. A tick without a new frame sends nothing.
*
*  All methods must be called on the thread owning this object; other threads go
*  through CaptureWorker.
*/
class CaptureLoop : public QObject {
    Q_OBJECT
public:
    enum class State {
        IDLE = 0,
        STARTED,
        RUNNING,
        STOPPED
    };

    // Takes ownership of the transport (re-parented to this loop).
    CaptureLoop(std::shared_ptr<ISkeletonProvider> provider,
                std::unique_ptr<SkeletonTransport> transport,
                LoopOptions options,
                QObject* parent=nullptr);
    ~CaptureLoop() override;

    // Starts the provider, opens the transport and loads calibration.
    // ResourceError / ConfigurationError propagate; the loop then stays IDLE.
    void start();

    // Begins ticking on this thread's event loop; starts first when still IDLE.
    void run();

    void stop();

    // Swapped atomically; nullptr disables seating enrichment.
    void updateSeatingLayout(SeatingLayoutPtr layout);
    SeatingLayoutPtr seatingLayout() const;

    // frame metadata <- calibration <- static metadata <- "seating" report
    SkeletonFrame enrich(SkeletonFrame frame) const;

    // One cycle without the wait. True if a frame was handed to and accepted by the transport.
    bool tick();

    State state() const { return state_; }
    const MetaMap& calibration() const { return calibration_; }

    uint64_t framesSent() const { return frames_sent_; }
    uint64_t framesDropped() const { return frames_dropped_; }
    uint64_t idleTicks() const { return idle_ticks_; }

private slots:
    void onTimer();

private:
    std::shared_ptr<ISkeletonProvider> provider_;
    SkeletonTransport* transport_ = nullptr;   // child of this
    LoopOptions options_;
    SeatingLayoutPtr seating_;                 // std::atomic_load / std::atomic_store only
    MetaMap calibration_ = MetaMap::object();

    State state_ = State::IDLE;
    QTimer timer_;

    uint64_t frames_sent_ = 0;
    uint64_t frames_dropped_ = 0;
    uint64_t idle_ticks_ = 0;
};

const char* toString(CaptureLoop::State s);

} // namespace posecast
