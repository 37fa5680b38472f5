#pragma once
#include <opencv2/core.hpp>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "posecast/core/SeatingLayout.h"

namespace posecast {

namespace editor {

enum class Corner { LT, RT, LB, RB };

struct Disabled {};
struct Idle {};
struct MoveDrag {
    size_t     index = 0;
    cv::Point  start_px;
    SeatRegion start;          // seat as it was at pointer-down
};
struct ResizeDrag {
    size_t index = 0;
    Corner corner = Corner::RB;
};
struct PendingCreate {};
struct CreatingDrag {
    cv::Point anchor;
    cv::Point current;
};

} // namespace editor

// Exactly one of these at a time; everything but Disabled counts as enabled.
using EditorMode = std::variant<editor::Disabled, editor::Idle, editor::MoveDrag,
                                editor::ResizeDrag, editor::PendingCreate, editor::CreatingDrag>;

struct PointerEvent {
    enum class Type { DOWN, MOVE, UP };
    Type type = Type::MOVE;
    int x = 0;     // pixels
    int y = 0;
};

// Receives each committed layout; nullptr once the last seat is gone.
using LayoutCallback = std::function<void(SeatingLayoutPtr)>;

/* 预览窗口内的座位编辑器
*
*  Seats are kept normalized ([0,1]) and mapped to pixels with the size of the frame
*  last rendered (or set through setFrameSize). Keys while enabled:
*    e/E toggle, Tab next seat, Delete/Backspace delete, n/N new seat, c/C clear.
*
*  Every committed mutation builds a fresh SeatingLayout and hands it to the
*  callback. If that fails with ValidationError the seats and selection return to
*  the last state that was emitted successfully.
*/
class LiveSeatingEditor {
public:
    static constexpr int    kHandleRadius = 12;     // px, corner pick distance
    static constexpr double kMinExtent = 0.02;      // normalized, per axis
    static constexpr int    kMinCreatePixels = 8;   // per axis

    explicit LiveSeatingEditor(LayoutCallback callback = {});

    // Replaces the editable seats without emitting; cancels any drag.
    void setLayout(const SeatingLayoutPtr& layout);
    void setFrameSize(int width, int height);

    // Draws seats, handles, help or status text onto frame (BGR) and adopts its size.
    void render(cv::Mat& frame);

    void handlePointerEvent(const PointerEvent& ev);
    void handleKeyEvent(int key);

    const std::vector<SeatRegion>& seats() const { return seats_; }
    std::optional<size_t> selectedIndex() const { return selected_; }
    const EditorMode& mode() const { return mode_; }
    bool enabled() const { return !std::holds_alternative<editor::Disabled>(mode_); }
    const std::string& statusMessage() const { return status_; }

private:
    void toggle();
    void cycleSelection();
    void deleteSelected();
    void beginCreate();
    void clearAll();

    void startDrag(int x, int y);
    void updateDrag(int x, int y);
    void finishCreate(const editor::CreatingDrag& drag, int x, int y);

    void emitLayout();
    std::string nextSeatId() const;

    // pixel rectangle of a seat at the current frame size
    cv::Rect seatPixels(const SeatRegion& s) const;
    std::optional<std::pair<size_t, std::optional<editor::Corner>>> pick(int x, int y) const;

    LayoutCallback callback_;
    std::vector<SeatRegion> seats_;
    std::optional<size_t> selected_;
    EditorMode mode_ = editor::Disabled{};

    // last state handed out successfully (rollback target)
    std::vector<SeatRegion> committed_seats_;
    std::optional<size_t> committed_selected_;

    int frame_w_ = 1;
    int frame_h_ = 1;
    std::string status_ = "Press 'E' to edit seats";
};

const char* modeName(const EditorMode& mode);

} // namespace posecast
