#include "posecast/editor/LiveSeatingEditor.h"
#include "posecast/core/Errors.h"
#include "posecast/logging.hpp"

#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <set>

namespace posecast {

using namespace editor;

namespace {

constexpr int kKeyTab = 9;
constexpr int kKeyBackspace = 8;
constexpr int kKeyDelete = 127;

const cv::Scalar kSeatColor(64, 160, 0);
const cv::Scalar kSelectedColor(255, 200, 0);
const cv::Scalar kHandleColor(0, 255, 255);
const cv::Scalar kPreviewColor(200, 200, 200);
const cv::Scalar kTextColor(255, 255, 255);

double clampd(double v, double lo, double hi) {
    return std::max(lo, std::min(hi, v));
}

// Drags are meaningful only while the mouse is held; they do not survive other keys.
bool isDragging(const EditorMode& m) {
    return std::holds_alternative<MoveDrag>(m)
        || std::holds_alternative<ResizeDrag>(m)
        || std::holds_alternative<CreatingDrag>(m);
}

} // namespace

const char* modeName(const EditorMode& mode) {
    switch (mode.index()) {
        case 0: return "Disabled";
        case 1: return "Idle";
        case 2: return "MoveDrag";
        case 3: return "ResizeDrag";
        case 4: return "PendingCreate";
        case 5: return "CreatingDrag";
    }
    return "Unknown";
}

LiveSeatingEditor::LiveSeatingEditor(LayoutCallback callback)
    : callback_(std::move(callback)) {}

void LiveSeatingEditor::setLayout(const SeatingLayoutPtr& layout) {
    seats_.clear();
    if (layout) seats_ = layout->seats();
    selected_ = seats_.empty() ? std::nullopt : std::optional<size_t>(0);
    committed_seats_ = seats_;
    committed_selected_ = selected_;
    if (isDragging(mode_) || std::holds_alternative<PendingCreate>(mode_)) mode_ = Idle{};
}

void LiveSeatingEditor::setFrameSize(int width, int height) {
    frame_w_ = std::max(1, width);
    frame_h_ = std::max(1, height);
}

// ==================== keys ===========================

void LiveSeatingEditor::handleKeyEvent(int key) {
    if (key < 0) return;
    if (key == 'e' || key == 'E') {
        toggle();
        return;
    }
    if (!enabled() || isDragging(mode_)) return;

    switch (key) {
        case kKeyTab:       cycleSelection(); break;
        case kKeyDelete:
        case kKeyBackspace: deleteSelected(); break;
        case 'n': case 'N': beginCreate();    break;
        case 'c': case 'C': clearAll();       break;
        default: break;
    }
}

void LiveSeatingEditor::toggle() {
    if (!enabled()) {
        mode_ = Idle{};
        status_ = "Editing enabled";
        qCInfo(lcEditor) << "Seat editing enabled";
        return;
    }
    // an uncommitted drag leaves no trace, selection included
    if (std::holds_alternative<MoveDrag>(mode_) || std::holds_alternative<ResizeDrag>(mode_)) {
        seats_ = committed_seats_;
        selected_ = committed_selected_;
    }
    mode_ = Disabled{};
    status_ = "Editing finished (press 'E' to edit)";
    qCInfo(lcEditor) << "Seat editing disabled";
}

void LiveSeatingEditor::cycleSelection() {
    if (seats_.empty()) return;
    selected_ = selected_ ? (*selected_ + 1) % seats_.size() : 0;
}

void LiveSeatingEditor::deleteSelected() {
    if (!selected_ || *selected_ >= seats_.size()) return;
    qCInfo(lcEditor) << "Removed seat" << QString::fromStdString(seats_[*selected_].seat_id);
    seats_.erase(seats_.begin() + static_cast<std::ptrdiff_t>(*selected_));
    if (seats_.empty()) selected_.reset();
    else                selected_ = std::min(*selected_, seats_.size() - 1);
    emitLayout();
}

void LiveSeatingEditor::beginCreate() {
    mode_ = PendingCreate{};
    status_ = "New seat: drag with the left button";
}

void LiveSeatingEditor::clearAll() {
    if (seats_.empty()) return;
    seats_.clear();
    selected_.reset();
    status_ = "All seats removed";
    emitLayout();
}

// ==================== pointer ===========================

void LiveSeatingEditor::handlePointerEvent(const PointerEvent& ev) {
    if (!enabled()) return;

    if (std::holds_alternative<PendingCreate>(mode_)) {
        if (ev.type == PointerEvent::Type::DOWN) {
            mode_ = CreatingDrag{cv::Point(ev.x, ev.y), cv::Point(ev.x, ev.y)};
        }
        return;
    }
    if (auto* create = std::get_if<CreatingDrag>(&mode_)) {
        if (ev.type == PointerEvent::Type::MOVE) {
            create->current = cv::Point(ev.x, ev.y);
        } else if (ev.type == PointerEvent::Type::UP) {
            const CreatingDrag drag = *create;
            mode_ = Idle{};
            finishCreate(drag, ev.x, ev.y);
        }
        return;
    }

    switch (ev.type) {
        case PointerEvent::Type::DOWN:
            if (std::holds_alternative<Idle>(mode_)) startDrag(ev.x, ev.y);
            break;
        case PointerEvent::Type::MOVE:
            updateDrag(ev.x, ev.y);
            break;
        case PointerEvent::Type::UP:
            if (std::holds_alternative<MoveDrag>(mode_) || std::holds_alternative<ResizeDrag>(mode_)) {
                updateDrag(ev.x, ev.y);
                mode_ = Idle{};
                emitLayout();
            }
            break;
    }
}

void LiveSeatingEditor::startDrag(int x, int y) {
    auto hit = pick(x, y);
    if (!hit) return;
    const size_t idx = hit->first;
    selected_ = idx;
    if (hit->second) {
        mode_ = ResizeDrag{idx, *hit->second};
    } else {
        mode_ = MoveDrag{idx, cv::Point(x, y), seats_[idx]};
    }
}

void LiveSeatingEditor::updateDrag(int x, int y) {
    if (const auto* mv = std::get_if<MoveDrag>(&mode_)) {
        SeatRegion& seat = seats_[mv->index];
        const double w = mv->start.x_max - mv->start.x_min;
        const double h = mv->start.y_max - mv->start.y_min;
        const double dx = double(x - mv->start_px.x) / frame_w_;
        const double dy = double(y - mv->start_px.y) / frame_h_;
        seat.x_min = clampd(mv->start.x_min + dx, 0.0, 1.0 - w);
        seat.y_min = clampd(mv->start.y_min + dy, 0.0, 1.0 - h);
        seat.x_max = seat.x_min + w;
        seat.y_max = seat.y_min + h;
        return;
    }
    if (const auto* rs = std::get_if<ResizeDrag>(&mode_)) {
        SeatRegion& seat = seats_[rs->index];
        const double nx = double(x) / frame_w_;
        const double ny = double(y) / frame_h_;
        const bool left = rs->corner == Corner::LT || rs->corner == Corner::LB;
        const bool top  = rs->corner == Corner::LT || rs->corner == Corner::RT;
        if (left) seat.x_min = clampd(nx, 0.0, seat.x_max - kMinExtent);
        else      seat.x_max = clampd(nx, seat.x_min + kMinExtent, 1.0);
        if (top)  seat.y_min = clampd(ny, 0.0, seat.y_max - kMinExtent);
        else      seat.y_max = clampd(ny, seat.y_min + kMinExtent, 1.0);
    }
}

void LiveSeatingEditor::finishCreate(const CreatingDrag& drag, int x, int y) {
    if (std::abs(x - drag.anchor.x) < kMinCreatePixels || std::abs(y - drag.anchor.y) < kMinCreatePixels) {
        status_ = "Seat too small, discarded";
        return;
    }
    const auto [x1, x2] = std::minmax(drag.anchor.x, x);
    const auto [y1, y2] = std::minmax(drag.anchor.y, y);

    SeatRegion seat;
    seat.seat_id = nextSeatId();
    seat.x_min = clampd(double(x1) / frame_w_, 0.0, 1.0 - kMinExtent);
    seat.x_max = clampd(double(x2) / frame_w_, seat.x_min + kMinExtent, 1.0);
    seat.y_min = clampd(double(y1) / frame_h_, 0.0, 1.0 - kMinExtent);
    seat.y_max = clampd(double(y2) / frame_h_, seat.y_min + kMinExtent, 1.0);

    qCInfo(lcEditor) << "Added seat" << QString::fromStdString(seat.seat_id);
    seats_.push_back(std::move(seat));
    selected_ = seats_.size() - 1;
    status_ = "Seat added";
    emitLayout();
}

// ==================== emission ===========================

void LiveSeatingEditor::emitLayout() {
    try {
        SeatingLayoutPtr layout;
        if (!seats_.empty()) layout = std::make_shared<const SeatingLayout>(seats_);
        if (callback_) callback_(layout);
    } catch (const ValidationError& e) {
        qCCritical(lcEditor) << "Layout rejected, reverting edit:" << e.what();
        seats_ = committed_seats_;
        selected_ = committed_selected_;
        status_ = "Edit rejected";
        return;
    }
    committed_seats_ = seats_;
    committed_selected_ = selected_;
}

std::string LiveSeatingEditor::nextSeatId() const {
    std::set<std::string> used;
    for (const auto& s : seats_) used.insert(s.seat_id);
    char buf[32];
    for (int i = 1;; ++i) {
        std::snprintf(buf, sizeof(buf), "seat-%02d", i);
        if (!used.count(buf)) return buf;
    }
}

// ==================== geometry / drawing ===========================

cv::Rect LiveSeatingEditor::seatPixels(const SeatRegion& s) const {
    const int x1 = int(s.x_min * frame_w_);
    const int y1 = int(s.y_min * frame_h_);
    const int x2 = int(s.x_max * frame_w_);
    const int y2 = int(s.y_max * frame_h_);
    return cv::Rect(cv::Point(x1, y1), cv::Point(x2, y2));
}

std::optional<std::pair<size_t, std::optional<Corner>>> LiveSeatingEditor::pick(int x, int y) const {
    const int r = kHandleRadius;
    for (size_t i = 0; i < seats_.size(); ++i) {
        const cv::Rect px = seatPixels(seats_[i]);
        const int x1 = px.x, y1 = px.y, x2 = px.x + px.width, y2 = px.y + px.height;
        if (x < x1 || x > x2 || y < y1 || y > y2) continue;

        const bool near_l = std::abs(x - x1) <= r, near_r = std::abs(x - x2) <= r;
        const bool near_t = std::abs(y - y1) <= r, near_b = std::abs(y - y2) <= r;
        if (near_l && near_t) return std::make_pair(i, std::optional<Corner>(Corner::LT));
        if (near_r && near_t) return std::make_pair(i, std::optional<Corner>(Corner::RT));
        if (near_l && near_b) return std::make_pair(i, std::optional<Corner>(Corner::LB));
        if (near_r && near_b) return std::make_pair(i, std::optional<Corner>(Corner::RB));
        return std::make_pair(i, std::optional<Corner>());
    }
    return std::nullopt;
}

void LiveSeatingEditor::render(cv::Mat& frame) {
    if (frame.empty()) return;
    setFrameSize(frame.cols, frame.rows);

    const bool on = enabled();
    for (size_t i = 0; i < seats_.size(); ++i) {
        const bool sel = on && selected_ && *selected_ == i;
        const cv::Scalar color = sel ? kSelectedColor : kSeatColor;
        const cv::Rect px = seatPixels(seats_[i]);
        cv::rectangle(frame, px, color, 2);
        cv::putText(frame, seats_[i].seat_id, {px.x + 4, px.y + 18},
                    cv::FONT_HERSHEY_SIMPLEX, 0.5, color, 1, cv::LINE_AA);
        if (sel) {
            for (const cv::Point& c : {px.tl(), cv::Point(px.br().x, px.y),
                                       cv::Point(px.x, px.br().y), px.br()}) {
                cv::circle(frame, c, kHandleRadius / 2, kHandleColor, 1, cv::LINE_AA);
            }
        }
    }

    std::vector<std::string> lines;
    if (on) {
        lines.push_back(std::string("Edit [") + modeName(mode_) + "]: drag seat to move, drag corner to resize");
        lines.push_back("Tab: next / Del: delete / N: new / C: clear all / E: done");
    } else {
        lines.push_back(status_);
    }
    for (size_t i = 0; i < lines.size(); ++i) {
        cv::putText(frame, lines[i], {10, 24 + int(i) * 20},
                    cv::FONT_HERSHEY_SIMPLEX, 0.5, kTextColor, 1, cv::LINE_AA);
    }

    if (const auto* create = std::get_if<CreatingDrag>(&mode_)) {
        cv::rectangle(frame, create->anchor, create->current, kPreviewColor, 1, cv::LINE_AA);
    }
}

} // namespace posecast
