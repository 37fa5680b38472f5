#include <posecast/capture/capture_loop.hpp>
#include <posecast/core/Errors.h>
#include <posecast/core/MetadataLoader.h>
#include <posecast/logging.hpp>

namespace posecast {

// debug summary every N sent frames
static constexpr uint64_t kStatsEvery = 300;

const char* toString(CaptureLoop::State s) {
    switch (s) {
        case CaptureLoop::State::IDLE:    return "IDLE";
        case CaptureLoop::State::STARTED: return "STARTED";
        case CaptureLoop::State::RUNNING: return "RUNNING";
        case CaptureLoop::State::STOPPED: return "STOPPED";
    }
    return "UNKNOWN";
}

CaptureLoop::CaptureLoop(std::shared_ptr<ISkeletonProvider> provider,
                         std::unique_ptr<SkeletonTransport> transport,
                         LoopOptions options,
                         QObject* parent)
    : QObject(parent),
    provider_(std::move(provider)),
    options_(std::move(options)),
    timer_(this)
{
    transport_ = transport.release();
    transport_->setParent(this);
    std::atomic_store(&seating_, options_.seating);

    timer_.setSingleShot(true);
    timer_.setTimerType(Qt::PreciseTimer);
    connect(&timer_, &QTimer::timeout, this, &CaptureLoop::onTimer);
}

CaptureLoop::~CaptureLoop() {
    stop();
}

void CaptureLoop::start() {
    if (state_ != State::IDLE) return;
    qCInfo(lcCapture) << "Starting capture loop, interval" << options_.interval.count() << "ms";

    provider_->start();
    try {
        transport_->open();
    } catch (const Error&) {
        provider_->stop();
        throw;
    }

    if (!options_.calibration_file.empty()) {
        qCInfo(lcCapture) << "Loading calibration file from" << QString::fromStdString(options_.calibration_file);
        calibration_ = loadCalibration(options_.calibration_file);
    }
    state_ = State::STARTED;
}

void CaptureLoop::run() {
    if (state_ == State::IDLE) start();
    if (state_ != State::STARTED) {
        qCWarning(lcCapture) << "run() ignored in state" << toString(state_);
        return;
    }
    state_ = State::RUNNING;
    timer_.start(options_.interval);
}

void CaptureLoop::stop() {
    if (state_ == State::STOPPED) return;
    const bool was_active = state_ != State::IDLE;
    state_ = State::STOPPED;
    timer_.stop();

    if (was_active) {
        qCInfo(lcCapture) << "Stopping capture loop; sent=" << frames_sent_
                          << "dropped=" << frames_dropped_ << "idle ticks=" << idle_ticks_;
        transport_->close();
        provider_->stop();
    }
}

void CaptureLoop::updateSeatingLayout(SeatingLayoutPtr layout) {
    if (layout) {
        qCInfo(lcCapture) << "Seating layout updated:" << layout->size() << "seats";
    } else {
        qCInfo(lcCapture) << "Seating layout cleared; seating metadata disabled";
    }
    std::atomic_store(&seating_, std::move(layout));
}

SeatingLayoutPtr CaptureLoop::seatingLayout() const {
    return std::atomic_load(&seating_);
}

SkeletonFrame CaptureLoop::enrich(SkeletonFrame frame) const {
    MetaMap merged = frame.metadata.is_object() ? std::move(frame.metadata) : MetaMap::object();
    for (auto it = calibration_.begin(); it != calibration_.end(); ++it) {
        merged[it.key()] = it.value();
    }
    for (auto it = options_.static_metadata.begin(); it != options_.static_metadata.end(); ++it) {
        merged[it.key()] = it.value();
    }
    frame.metadata = std::move(merged);

    // evaluated against the merged metadata so calibration may supply frame_dimensions
    const SeatingLayoutPtr layout = seatingLayout();
    std::optional<SeatOccupancyReport> report;
    if (layout) report = layout->evaluate(frame);
    if (report) {
        frame.metadata["seating"] = report->toJson();
    } else {
        frame.metadata.erase("seating");
    }
    return frame;
}

bool CaptureLoop::tick() {
    std::optional<SkeletonFrame> frame;
    try {
        frame = provider_->getLatest();
    } catch (const TransientIOError& e) {
        qCWarning(lcCapture) << "Frame read failed, dropping:" << e.what();
        ++frames_dropped_;
        return false;
    }
    if (!frame) {
        ++idle_ticks_;
        return false;
    }

    const SkeletonFrame enriched = enrich(std::move(*frame));
    if (!transport_->send(enriched)) {
        ++frames_dropped_;
        return false;
    }
    if (++frames_sent_ % kStatsEvery == 0) {
        qCDebug(lcCapture) << "sent=" << frames_sent_ << "dropped=" << frames_dropped_
                           << "idle ticks=" << idle_ticks_;
    }
    return true;
}

void CaptureLoop::onTimer() {
    if (state_ != State::RUNNING) return;
    try {
        tick();
    } catch (const std::exception& e) {
        // the loop stays alive; the frame of this tick is lost
        ++frames_dropped_;
        qCCritical(lcCapture) << "Tick failed, frame dropped:" << e.what();
    }
    if (state_ == State::RUNNING) timer_.start(options_.interval);
}

} // namespace posecast
