#include <catch2/catch.hpp>

#include "posecast/capture/capture_worker.hpp"
#include "test_support.hpp"

#include <atomic>
#include <memory>

using namespace posecast;
using posecast::test::FakeProvider;
using posecast::test::FakeTransport;

namespace {

LoopOptions fastLoop() {
    LoopOptions opts;
    opts.interval = std::chrono::milliseconds(2);
    return opts;
}

} // namespace

TEST_CASE("worker streams frames from its own thread", "[worker]") {
    auto provider = std::make_shared<FakeProvider>();
    auto t = std::make_unique<FakeTransport>();
    FakeTransport* transport = t.get();

    CaptureWorker worker(provider, std::move(t), fastLoop());
    worker.start();
    REQUIRE(worker.isRunning());

    provider->slot.publish(test::makeFrame(7));
    REQUIRE(test::spinUntil([&] { return transport->sentSize() == 1; }));

    REQUIRE(worker.stop() == CommandResult::COMPLETED);
    REQUIRE_FALSE(worker.isRunning());
    REQUIRE(transport->closes == 1);
    REQUIRE(provider->stops == 1);

    REQUIRE(worker.stop() == CommandResult::COMPLETED);   // idempotent
    REQUIRE(transport->closes == 1);
}

TEST_CASE("startup errors are rethrown to the caller", "[worker]") {
    auto provider = std::make_shared<FakeProvider>();
    provider->fail_start = true;
    CaptureWorker worker(provider, std::make_unique<FakeTransport>(), fastLoop());

    REQUIRE_THROWS_AS(worker.start(), ResourceError);
    REQUIRE_FALSE(worker.isRunning());
    REQUIRE(worker.stop() == CommandResult::COMPLETED);
}

TEST_CASE("commands run on the loop thread and are acknowledged", "[worker]") {
    CaptureWorker worker(std::make_shared<FakeProvider>(), std::make_unique<FakeTransport>(), fastLoop());

    SECTION("before start nothing is listening") {
        REQUIRE(worker.post([](CaptureLoop&) {}, std::chrono::milliseconds(100)) == CommandResult::NOT_RUNNING);
    }

    SECTION("while running") {
        worker.start();
        std::atomic<bool> on_loop_thread{false};
        QThread* caller = QThread::currentThread();
        const CommandResult r = worker.post([&](CaptureLoop& loop) {
            on_loop_thread = QThread::currentThread() == loop.thread() && QThread::currentThread() != caller;
        }, std::chrono::milliseconds(1000));
        REQUIRE(r == CommandResult::COMPLETED);
        REQUIRE(on_loop_thread.load());

        // posting from inside a command runs inline instead of deadlocking
        CommandResult nested = CommandResult::TIMED_OUT;
        worker.post([&](CaptureLoop&) {
            nested = worker.post([](CaptureLoop&) {}, std::chrono::milliseconds(10));
        }, std::chrono::milliseconds(1000));
        REQUIRE(nested == CommandResult::COMPLETED);

        SECTION("a busy loop times out the wait") {
            auto release = std::make_shared<std::atomic<bool>>(false);
            // occupy the loop thread, then wait on a second command
            QMetaObject::invokeMethod(worker.loop(), [release] {
                while (!*release) QThread::msleep(1);
            }, Qt::QueuedConnection);
            const CommandResult busy = worker.post([](CaptureLoop&) {}, std::chrono::milliseconds(50));
            *release = true;
            REQUIRE(busy == CommandResult::TIMED_OUT);
        }

        SECTION("exceptions inside a command reach the caller") {
            REQUIRE_THROWS_AS(worker.post([](CaptureLoop&) { throw ValidationError("bad"); },
                                          std::chrono::milliseconds(1000)),
                              ValidationError);
            REQUIRE(worker.isRunning());
        }

        REQUIRE(worker.stop(std::chrono::milliseconds(2000)) == CommandResult::COMPLETED);
    }
}

TEST_CASE("seating updates reach the running loop", "[worker]") {
    auto provider = std::make_shared<FakeProvider>();
    auto t = std::make_unique<FakeTransport>();
    FakeTransport* transport = t.get();
    CaptureWorker worker(provider, std::move(t), fastLoop());
    worker.start();

    SeatRegion only{"seat-01", 0.0, 0.0, 1.0, 1.0};
    auto layout = std::make_shared<const SeatingLayout>(std::vector<SeatRegion>{only});
    REQUIRE(worker.updateSeatingLayout(layout) == CommandResult::COMPLETED);
    REQUIRE(worker.loop()->seatingLayout() == layout);

    MetaMap meta;
    meta["root_center_normalized"] = {{"x", 0.5}, {"y", 0.5}};
    provider->slot.publish(test::makeFrame(1, meta));
    REQUIRE(test::spinUntil([&] { return transport->sentSize() == 1; }));
    {
        std::lock_guard<std::mutex> lock(transport->mtx);
        REQUIRE(transport->sent[0].metadata["seating"]["activeSeatId"] == "seat-01");
    }

    REQUIRE(worker.updateSeatingLayout(nullptr) == CommandResult::COMPLETED);
    REQUIRE_FALSE(worker.loop()->seatingLayout());
    worker.stop();
    REQUIRE(worker.updateSeatingLayout(layout) == CommandResult::NOT_RUNNING);
}
