#pragma once
#include <QtCore/QCoreApplication>
#include <QtCore/QElapsedTimer>
#include <QtCore/QThread>

#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <random>
#include <string>
#include <vector>

#include "posecast/core/Errors.h"
#include "posecast/core/Provider.h"
#include "posecast/transport/skeleton_transport.hpp"

namespace posecast {
namespace test {

// Pumps the Qt event loop until pred() holds or timeout_ms elapses.
inline bool spinUntil(const std::function<bool()>& pred, int timeout_ms = 3000) {
    QElapsedTimer t;
    t.start();
    while (!pred()) {
        if (t.elapsed() > timeout_ms) return false;
        QCoreApplication::processEvents(QEventLoop::AllEvents, 10);
        QThread::msleep(1);
    }
    return true;
}

// Unique scratch directory, removed with the object.
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() / ("posecast_test_" + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    std::string file(const std::string& name) const { return (path_ / name).string(); }
    std::string write(const std::string& name, const std::string& content) const {
        const std::string p = file(name);
        std::ofstream(p) << content;
        return p;
    }

private:
    std::filesystem::path path_;
};

inline SkeletonFrame makeFrame(int64_t ts, MetaMap meta = MetaMap::object()) {
    SkeletonFrame f;
    f.ts_ms = ts;
    Joint hips;
    hips.name = "hips";
    hips.position = cv::Point3f(0.f, 1.f, 2.f);
    f.setJoint(hips);
    f.metadata = std::move(meta);
    return f;
}

// Scripted provider: frames are queued by the test, getLatest drains newest-first like a slot.
class FakeProvider : public ISkeletonProvider {
public:
    void start() override {
        if (fail_start) throw ResourceError("fake provider unavailable");
        ++starts;
    }
    void stop() override { ++stops; order.push_back("provider.stop"); }
    std::optional<SkeletonFrame> getLatest() override {
        if (fail_next) {
            fail_next = false;
            throw TransientIOError("fake read failure");
        }
        return slot.take();
    }

    LatestFrameSlot slot;
    bool fail_start = false;
    bool fail_next = false;
    int starts = 0;
    int stops = 0;
    std::vector<std::string> order;   // shared with FakeTransport when both are wired
};

// Records every frame it is asked to send.
class FakeTransport : public SkeletonTransport {
public:
    explicit FakeTransport(std::vector<std::string>* order = nullptr) : order_(order) {}

    void open() override {
        if (fail_open) throw ResourceError("fake transport bind failure");
        open_ = true;
    }
    bool send(const SkeletonFrame& frame) override {
        std::lock_guard<std::mutex> lock(mtx);
        if (!open_ || refuse) return markDropped();
        sent.push_back(frame);
        return markSent();
    }
    void close() override {
        open_ = false;
        ++closes;
        if (order_) order_->push_back("transport.close");
    }
    bool isOpen() const override { return open_; }

    size_t sentSize() {
        std::lock_guard<std::mutex> lock(mtx);
        return sent.size();
    }

    std::mutex mtx;
    std::vector<SkeletonFrame> sent;
    bool fail_open = false;
    bool refuse = false;
    int closes = 0;

private:
    std::vector<std::string>* order_;
    bool open_ = false;
};

} // namespace test
} // namespace posecast
