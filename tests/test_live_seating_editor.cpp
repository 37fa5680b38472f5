#include <catch2/catch.hpp>

#include "posecast/core/Errors.h"
#include "posecast/editor/LiveSeatingEditor.h"
#include "test_support.hpp"

#include <opencv2/core.hpp>

using namespace posecast;
using PT = PointerEvent::Type;

namespace {

constexpr int kTab = 9;
constexpr int kDelete = 127;
constexpr int kBackspace = 8;

// editor on a 1000x1000 frame that records every emitted layout
struct EditorRig {
    std::vector<SeatingLayoutPtr> emitted;
    LiveSeatingEditor editor;

    EditorRig() : editor([this](SeatingLayoutPtr l) { emitted.push_back(std::move(l)); }) {
        editor.setFrameSize(1000, 1000);
    }
    void drag(int x0, int y0, int x1, int y1) {
        editor.handlePointerEvent({PT::DOWN, x0, y0});
        editor.handlePointerEvent({PT::MOVE, (x0 + x1) / 2, (y0 + y1) / 2});
        editor.handlePointerEvent({PT::MOVE, x1, y1});
        editor.handlePointerEvent({PT::UP, x1, y1});
    }
    void create(int x0, int y0, int x1, int y1) {
        editor.handleKeyEvent('n');
        drag(x0, y0, x1, y1);
    }
};

SeatingLayoutPtr layoutOf(std::vector<SeatRegion> seats) {
    return std::make_shared<const SeatingLayout>(std::move(seats));
}

} // namespace

TEST_CASE("editor starts disabled and ignores input", "[editor]") {
    EditorRig rig;
    rig.editor.setLayout(layoutOf({{"a", 0.1, 0.1, 0.3, 0.3}}));
    REQUIRE_FALSE(rig.editor.enabled());
    REQUIRE(std::holds_alternative<editor::Disabled>(rig.editor.mode()));

    rig.drag(200, 200, 600, 600);
    rig.editor.handleKeyEvent(kDelete);
    rig.editor.handleKeyEvent('n');
    REQUIRE(rig.emitted.empty());
    REQUIRE(rig.editor.seats().size() == 1);
    REQUIRE(rig.editor.seats()[0].x_min == Approx(0.1));
}

TEST_CASE("toggle switches between disabled and idle", "[editor]") {
    EditorRig rig;
    rig.editor.handleKeyEvent('e');
    REQUIRE(std::holds_alternative<editor::Idle>(rig.editor.mode()));
    rig.editor.handleKeyEvent('E');
    REQUIRE_FALSE(rig.editor.enabled());

    SECTION("leaving edit mode cancels a pending create") {
        rig.editor.handleKeyEvent('e');
        rig.editor.handleKeyEvent('n');
        REQUIRE(std::holds_alternative<editor::PendingCreate>(rig.editor.mode()));
        rig.editor.handleKeyEvent('e');
        rig.editor.handleKeyEvent('e');
        REQUIRE(std::holds_alternative<editor::Idle>(rig.editor.mode()));
    }

    SECTION("leaving edit mode mid-drag discards the drag") {
        rig.editor.setLayout(layoutOf({{"a", 0.1, 0.1, 0.3, 0.3}}));
        rig.editor.handleKeyEvent('e');
        rig.editor.handlePointerEvent({PT::DOWN, 200, 200});
        rig.editor.handlePointerEvent({PT::MOVE, 500, 500});
        REQUIRE(std::holds_alternative<editor::MoveDrag>(rig.editor.mode()));
        rig.editor.handleKeyEvent('e');
        REQUIRE(rig.editor.seats()[0].x_min == Approx(0.1));
        rig.editor.handlePointerEvent({PT::UP, 500, 500});
        REQUIRE(rig.emitted.empty());
    }

    SECTION("an abandoned drag on another seat keeps the previous selection") {
        rig.editor.setLayout(layoutOf({{"a", 0.1, 0.1, 0.3, 0.3}, {"b", 0.5, 0.5, 0.7, 0.7}}));
        rig.editor.handleKeyEvent('e');
        REQUIRE(rig.editor.selectedIndex() == std::optional<size_t>(0));
        rig.editor.handlePointerEvent({PT::DOWN, 600, 600});
        REQUIRE(rig.editor.selectedIndex() == std::optional<size_t>(1));
        rig.editor.handlePointerEvent({PT::MOVE, 650, 650});
        rig.editor.handleKeyEvent('e');
        REQUIRE(rig.editor.selectedIndex() == std::optional<size_t>(0));
        REQUIRE(rig.editor.seats()[1].x_min == Approx(0.5));
        REQUIRE(rig.editor.statusMessage() == "Editing finished (press 'E' to edit)");
    }
}

TEST_CASE("dragging a seat body moves it and keeps it inside the frame", "[editor]") {
    EditorRig rig;
    rig.editor.setLayout(layoutOf({{"a", 0.1, 0.1, 0.3, 0.4}}));
    rig.editor.handleKeyEvent('e');

    rig.drag(200, 250, 300, 350);
    REQUIRE(rig.emitted.size() == 1);
    const SeatRegion moved = rig.emitted[0]->seats()[0];
    REQUIRE(moved.x_min == Approx(0.2));
    REQUIRE(moved.y_min == Approx(0.2));
    REQUIRE(moved.width() == Approx(0.2));
    REQUIRE(moved.height() == Approx(0.3));
    REQUIRE(std::holds_alternative<editor::Idle>(rig.editor.mode()));

    rig.drag(300, 350, 2000, -500);
    const SeatRegion clamped = rig.editor.seats()[0];
    REQUIRE(clamped.x_max == Approx(1.0));
    REQUIRE(clamped.y_min == Approx(0.0));
    REQUIRE(clamped.width() == Approx(0.2));
    REQUIRE(clamped.height() == Approx(0.3));
}

TEST_CASE("pointer-down outside every seat is ignored", "[editor]") {
    EditorRig rig;
    rig.editor.setLayout(layoutOf({{"a", 0.1, 0.1, 0.3, 0.3}}));
    rig.editor.handleKeyEvent('e');
    rig.drag(800, 800, 900, 900);
    REQUIRE(rig.emitted.empty());
    REQUIRE(std::holds_alternative<editor::Idle>(rig.editor.mode()));
}

TEST_CASE("corner drags resize without collapsing the seat", "[editor]") {
    EditorRig rig;
    rig.editor.setLayout(layoutOf({{"a", 0.2, 0.2, 0.5, 0.5}}));
    rig.editor.handleKeyEvent('e');

    SECTION("bottom-right grows") {
        rig.editor.handlePointerEvent({PT::DOWN, 495, 495});
        REQUIRE(std::get<editor::ResizeDrag>(rig.editor.mode()).corner == editor::Corner::RB);
        rig.editor.handlePointerEvent({PT::MOVE, 700, 800});
        rig.editor.handlePointerEvent({PT::UP, 700, 800});
        const SeatRegion s = rig.emitted.back()->seats()[0];
        REQUIRE(s.x_min == Approx(0.2));
        REQUIRE(s.x_max == Approx(0.7));
        REQUIRE(s.y_max == Approx(0.8));
    }

    SECTION("top-left pushed past the opposite corner stops at the minimum extent") {
        rig.editor.handlePointerEvent({PT::DOWN, 205, 205});
        REQUIRE(std::get<editor::ResizeDrag>(rig.editor.mode()).corner == editor::Corner::LT);
        rig.editor.handlePointerEvent({PT::MOVE, 900, 900});
        rig.editor.handlePointerEvent({PT::UP, 900, 900});
        const SeatRegion s = rig.emitted.back()->seats()[0];
        REQUIRE(s.width() >= LiveSeatingEditor::kMinExtent - 1e-9);
        REQUIRE(s.height() >= LiveSeatingEditor::kMinExtent - 1e-9);
        REQUIRE(s.x_max == Approx(0.5));
    }

    SECTION("every corner respects the minimum extent") {
        struct Case { editor::Corner corner; cv::Point to; };
        const std::vector<Case> cases = {
            {editor::Corner::RT, {0, 1000}},
            {editor::Corner::LB, {1000, 0}},
            {editor::Corner::RB, {-100, -100}},
            {editor::Corner::LT, {2000, 2000}},
        };
        for (const Case& c : cases) {
            const SeatRegion s0 = rig.editor.seats()[0];
            const int l = int(s0.x_min * 1000), r = int(s0.x_max * 1000);
            const int t = int(s0.y_min * 1000), b = int(s0.y_max * 1000);
            cv::Point grab;
            switch (c.corner) {
                case editor::Corner::LT: grab = {l + 2, t + 2}; break;
                case editor::Corner::RT: grab = {r - 2, t + 2}; break;
                case editor::Corner::LB: grab = {l + 2, b - 2}; break;
                case editor::Corner::RB: grab = {r - 2, b - 2}; break;
            }
            rig.editor.handlePointerEvent({PT::DOWN, grab.x, grab.y});
            REQUIRE(std::get<editor::ResizeDrag>(rig.editor.mode()).corner == c.corner);
            rig.editor.handlePointerEvent({PT::MOVE, c.to.x, c.to.y});
            rig.editor.handlePointerEvent({PT::UP, c.to.x, c.to.y});

            const SeatRegion s = rig.editor.seats()[0];
            REQUIRE(s.width() >= LiveSeatingEditor::kMinExtent - 1e-9);
            REQUIRE(s.height() >= LiveSeatingEditor::kMinExtent - 1e-9);
            REQUIRE(s.x_min >= 0.0);
            REQUIRE(s.y_min >= 0.0);
            REQUIRE(s.x_max <= 1.0);
            REQUIRE(s.y_max <= 1.0);
        }
        REQUIRE(rig.emitted.size() == cases.size());
    }
}

TEST_CASE("creating a seat by drag", "[editor]") {
    EditorRig rig;
    rig.editor.handleKeyEvent('e');

    rig.create(100, 100, 300, 300);
    REQUIRE(rig.emitted.size() == 1);
    REQUIRE(rig.emitted[0]);
    const SeatRegion s = rig.emitted[0]->seats()[0];
    REQUIRE(s.seat_id == "seat-01");
    REQUIRE(s.x_min == Approx(0.1));
    REQUIRE(s.y_min == Approx(0.1));
    REQUIRE(s.x_max == Approx(0.3));
    REQUIRE(s.y_max == Approx(0.3));
    REQUIRE(rig.editor.selectedIndex() == std::optional<size_t>(0));
    REQUIRE(std::holds_alternative<editor::Idle>(rig.editor.mode()));

    SECTION("dragging backwards gives the same rectangle") {
        rig.create(600, 600, 400, 400);
        const SeatRegion b = rig.editor.seats().back();
        REQUIRE(b.seat_id == "seat-02");
        REQUIRE(b.x_min == Approx(0.4));
        REQUIRE(b.x_max == Approx(0.6));
        REQUIRE(rig.editor.selectedIndex() == std::optional<size_t>(1));
    }

    SECTION("a drag below the pixel threshold commits nothing") {
        rig.create(500, 500, 507, 700);
        REQUIRE(rig.editor.statusMessage() == "Seat too small, discarded");
        REQUIRE(rig.emitted.size() == 1);
        REQUIRE(rig.editor.seats().size() == 1);
        REQUIRE(std::holds_alternative<editor::Idle>(rig.editor.mode()));
    }

    SECTION("ids skip those already in use") {
        rig.editor.setLayout(layoutOf({{"seat-01", 0.0, 0.0, 0.1, 0.1}, {"seat-03", 0.2, 0.2, 0.3, 0.3}}));
        rig.create(500, 500, 600, 600);
        REQUIRE(rig.editor.seats().back().seat_id == "seat-02");
        rig.create(700, 700, 800, 800);
        REQUIRE(rig.editor.seats().back().seat_id == "seat-04");
    }

    SECTION("the preview rectangle follows the pointer") {
        rig.editor.handleKeyEvent('n');
        rig.editor.handlePointerEvent({PT::DOWN, 10, 20});
        rig.editor.handlePointerEvent({PT::MOVE, 110, 220});
        const auto& drag = std::get<editor::CreatingDrag>(rig.editor.mode());
        REQUIRE(drag.anchor == cv::Point(10, 20));
        REQUIRE(drag.current == cv::Point(110, 220));
    }
}

TEST_CASE("delete, clear and selection cycling", "[editor]") {
    EditorRig rig;
    rig.editor.setLayout(layoutOf({
        {"a", 0.0, 0.0, 0.2, 0.2}, {"b", 0.3, 0.0, 0.5, 0.2}, {"c", 0.6, 0.0, 0.8, 0.2}}));
    rig.editor.handleKeyEvent('e');
    REQUIRE(rig.editor.selectedIndex() == std::optional<size_t>(0));

    rig.editor.handleKeyEvent(kTab);
    rig.editor.handleKeyEvent(kTab);
    REQUIRE(rig.editor.selectedIndex() == std::optional<size_t>(2));
    rig.editor.handleKeyEvent(kTab);
    REQUIRE(rig.editor.selectedIndex() == std::optional<size_t>(0));

    SECTION("deleting the last seat in the list clamps the selection") {
        rig.editor.handleKeyEvent(kTab);
        rig.editor.handleKeyEvent(kTab);
        rig.editor.handleKeyEvent(kDelete);
        REQUIRE(rig.editor.seats().size() == 2);
        REQUIRE(rig.editor.selectedIndex() == std::optional<size_t>(1));
        REQUIRE(rig.emitted.back()->size() == 2);
    }

    SECTION("deleting every seat emits none, then adding one emits a single seat") {
        rig.editor.handleKeyEvent(kDelete);
        rig.editor.handleKeyEvent(kBackspace);
        rig.editor.handleKeyEvent(kDelete);
        REQUIRE(rig.editor.seats().empty());
        REQUIRE_FALSE(rig.editor.selectedIndex());
        REQUIRE(rig.emitted.size() == 3);
        REQUIRE(rig.emitted.back() == nullptr);

        rig.editor.handleKeyEvent(kDelete);   // nothing left to delete
        rig.editor.handleKeyEvent(kTab);
        REQUIRE(rig.emitted.size() == 3);

        rig.create(100, 100, 200, 200);
        REQUIRE(rig.emitted.back());
        REQUIRE(rig.emitted.back()->size() == 1);
    }

    SECTION("clear removes everything and emits none") {
        rig.editor.handleKeyEvent('c');
        REQUIRE(rig.editor.seats().empty());
        REQUIRE_FALSE(rig.editor.selectedIndex());
        REQUIRE(rig.emitted.size() == 1);
        REQUIRE(rig.emitted.back() == nullptr);
    }
}

TEST_CASE("a rejected layout rolls the edit back", "[editor]") {
    bool reject = false;
    std::vector<SeatingLayoutPtr> accepted;
    LiveSeatingEditor ed([&](SeatingLayoutPtr layout) {
        if (reject) throw ValidationError("rejected by holder");
        accepted.push_back(std::move(layout));
    });
    ed.setFrameSize(1000, 1000);
    ed.setLayout(layoutOf({{"a", 0.1, 0.1, 0.3, 0.3}, {"b", 0.5, 0.5, 0.7, 0.7}}));
    ed.handleKeyEvent('e');

    ed.handlePointerEvent({PT::DOWN, 200, 200});
    ed.handlePointerEvent({PT::UP, 400, 400});
    REQUIRE(accepted.size() == 1);
    REQUIRE(ed.seats()[0].x_min == Approx(0.3));

    reject = true;
    ed.handlePointerEvent({PT::DOWN, 600, 600});
    ed.handlePointerEvent({PT::UP, 800, 800});
    REQUIRE(ed.seats()[1].x_min == Approx(0.5));      // move undone
    REQUIRE(ed.selectedIndex() == std::optional<size_t>(0));

    ed.handleKeyEvent('c');
    REQUIRE(ed.seats().size() == 2);                  // clear undone
    REQUIRE(ed.seats()[0].x_min == Approx(0.3));      // last accepted state kept
    REQUIRE(accepted.size() == 1);
}

TEST_CASE("render draws onto the frame and adopts its size", "[editor]") {
    EditorRig rig;
    rig.editor.setLayout(layoutOf({{"a", 0.25, 0.25, 0.75, 0.75}}));
    rig.editor.handleKeyEvent('e');

    cv::Mat frame(200, 400, CV_8UC3, cv::Scalar::all(0));
    rig.editor.render(frame);
    REQUIRE(cv::countNonZero(frame.reshape(1)) > 0);

    // after rendering a 400x200 frame, pixel (100, 50) is the seat's top-left corner
    rig.editor.handlePointerEvent({PT::DOWN, 102, 52});
    REQUIRE(std::holds_alternative<editor::ResizeDrag>(rig.editor.mode()));

    cv::Mat empty;
    rig.editor.render(empty);   // no-op
    REQUIRE(empty.empty());
}
