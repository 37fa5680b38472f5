#include <posecast/capture/capture_worker.hpp>
#include <posecast/core/Errors.h>
#include <posecast/logging.hpp>

#include <QtCore/QMetaObject>
#include <algorithm>
#include <future>

namespace posecast {

const char* toString(CommandResult r) {
    switch (r) {
        case CommandResult::COMPLETED:   return "COMPLETED";
        case CommandResult::TIMED_OUT:   return "TIMED_OUT";
        case CommandResult::NOT_RUNNING: return "NOT_RUNNING";
    }
    return "UNKNOWN";
}

CaptureWorker::CaptureWorker(std::shared_ptr<ISkeletonProvider> provider,
                             std::unique_ptr<SkeletonTransport> transport,
                             LoopOptions options)
{
    thread_.setObjectName(QStringLiteral("posecast-capture"));
    loop_ = new CaptureLoop(std::move(provider), std::move(transport), std::move(options));
    loop_->moveToThread(&thread_);
}

CaptureWorker::~CaptureWorker() {
    stop();
    if (thread_.isRunning()) {
        qCWarning(lcCapture) << "Capture thread still busy, waiting for it to finish";
        thread_.quit();
        thread_.wait();
    }
    delete loop_;   // thread finished (or never started): safe from here
}

void CaptureWorker::start(std::chrono::milliseconds timeout) {
    if (thread_.isRunning() || stopped_) {
        qCWarning(lcCapture) << "CaptureWorker::start ignored (already started)";
        return;
    }
    thread_.start();

    CommandResult r = CommandResult::NOT_RUNNING;
    try {
        r = post([](CaptureLoop& loop) { loop.run(); }, timeout);
    } catch (const Error& e) {
        qCCritical(lcCapture) << "Capture loop failed to start:" << e.what();
        thread_.quit();
        thread_.wait();
        stopped_ = true;
        throw;
    }
    if (r != CommandResult::COMPLETED) {
        stop(timeout);
        throw ResourceError(std::string("Capture loop start not acknowledged: ") + toString(r));
    }
    qCInfo(lcCapture) << "Capture thread running";
}

CommandResult CaptureWorker::stop(std::chrono::milliseconds timeout) {
    if (stopped_) return CommandResult::COMPLETED;
    stopped_ = true;
    if (!thread_.isRunning()) {
        loop_->stop();   // never started: loop still belongs to no running thread
        return CommandResult::COMPLETED;
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    CommandResult r = post([](CaptureLoop& loop) { loop.stop(); }, timeout);
    thread_.quit();

    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (!thread_.wait(static_cast<unsigned long>(std::max<long long>(left.count(), 0)))) {
        qCWarning(lcCapture) << "Capture thread did not finish within" << timeout.count() << "ms";
        return CommandResult::TIMED_OUT;
    }
    if (r != CommandResult::COMPLETED) {
        qCWarning(lcCapture) << "Stop request result:" << toString(r);
    }
    return r;
}

CommandResult CaptureWorker::updateSeatingLayout(SeatingLayoutPtr layout, std::chrono::milliseconds timeout) {
    CommandResult r = post([layout](CaptureLoop& loop) { loop.updateSeatingLayout(layout); }, timeout);
    if (r != CommandResult::COMPLETED) {
        qCWarning(lcCapture) << "Seating update not acknowledged:" << toString(r);
    }
    return r;
}

CommandResult CaptureWorker::post(std::function<void(CaptureLoop&)> command, std::chrono::milliseconds timeout) {
    if (!thread_.isRunning()) return CommandResult::NOT_RUNNING;

    if (QThread::currentThread() == &thread_) {
        command(*loop_);
        return CommandResult::COMPLETED;
    }

    auto done = std::make_shared<std::promise<void>>();
    std::future<void> ack = done->get_future();
    CaptureLoop* loop = loop_;

    const bool queued = QMetaObject::invokeMethod(loop_, [loop, done, command = std::move(command)]() {
        try {
            command(*loop);
            done->set_value();
        } catch (...) {
            // handed to the waiting caller
            done->set_exception(std::current_exception());
        }
    }, Qt::QueuedConnection);
    if (!queued) return CommandResult::NOT_RUNNING;

    if (ack.wait_for(timeout) != std::future_status::ready) {
        return CommandResult::TIMED_OUT;
    }
    ack.get();
    return CommandResult::COMPLETED;
}

bool CaptureWorker::isRunning() const {
    return thread_.isRunning() && !stopped_;
}

} // namespace posecast
