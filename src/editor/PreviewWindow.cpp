#include "posecast/editor/PreviewWindow.h"
#include "posecast/core/Errors.h"
#include "posecast/logging.hpp"

#include <opencv2/highgui.hpp>
#include <opencv2/imgproc.hpp>

namespace posecast {

static constexpr int kKeyEsc = 27;

PreviewWindow::PreviewWindow(PreviewOptions options, LiveSeatingEditor& editor, std::function<void()> on_quit)
    : options_(std::move(options)), editor_(editor), on_quit_(std::move(on_quit)) {}

PreviewWindow::~PreviewWindow() {
    stop();
}

void PreviewWindow::start() {
    if (running_) return;
    if (options_.camera >= 0) {
        if (!cap_.open(options_.camera)) {
            throw ResourceError("Unable to open camera " + std::to_string(options_.camera));
        }
        cap_.set(cv::CAP_PROP_FRAME_WIDTH,  options_.width);
        cap_.set(cv::CAP_PROP_FRAME_HEIGHT, options_.height);
        qCInfo(lcApp) << "Preview camera" << options_.camera << "opened";
    } else {
        qCInfo(lcApp) << "Preview without camera, using a blank" << options_.width << "x" << options_.height << "canvas";
    }
    running_ = true;
    thread_ = std::thread(&PreviewWindow::loop, this);
}

void PreviewWindow::stop() {
    running_ = false;
    if (thread_.joinable()) thread_.join();
    if (cap_.isOpened()) cap_.release();
}

int PreviewWindow::normalizeKey(int raw) {
    if (raw < 0) return -1;
    // GTK and Qt highgui backends report Delete as extended codes
    if (raw == 0xFFFF || raw == 0x2E0000) return 127;
    if (raw > 0xFF) return -1;
    return raw;
}

void PreviewWindow::onMouse(int event, int x, int y, int, void* userdata) {
    auto* self = static_cast<PreviewWindow*>(userdata);
    PointerEvent ev;
    ev.x = x;
    ev.y = y;
    switch (event) {
        case cv::EVENT_LBUTTONDOWN: ev.type = PointerEvent::Type::DOWN; break;
        case cv::EVENT_LBUTTONUP:   ev.type = PointerEvent::Type::UP;   break;
        case cv::EVENT_MOUSEMOVE:   ev.type = PointerEvent::Type::MOVE; break;
        default: return;
    }
    self->editor_.handlePointerEvent(ev);
}

cv::Mat PreviewWindow::nextFrame() {
    cv::Mat frame;
    if (cap_.isOpened()) {
        if (cap_.read(frame) && !frame.empty()) {
            if (read_failing_) qCInfo(lcApp) << "Camera frames are back";
            read_failing_ = false;
            return frame;
        }
        if (!read_failing_) qCWarning(lcApp) << "Camera read failed, showing a blank frame";
        read_failing_ = true;
    }
    return cv::Mat(options_.height, options_.width, CV_8UC3, cv::Scalar(32, 32, 32));
}

void PreviewWindow::loop() {
    const std::string& win = options_.window_name;
    cv::namedWindow(win, cv::WINDOW_NORMAL);
    cv::setMouseCallback(win, &PreviewWindow::onMouse, this);

    while (running_) {
        cv::Mat vis = nextFrame();
        editor_.render(vis);
        cv::imshow(win, vis);

        const int raw = cv::waitKeyEx(15);   // mouse callbacks fire inside
        const int key = normalizeKey(raw);
        if (key == kKeyEsc || key == 'q' || key == 'Q') {
            qCInfo(lcApp) << "Preview closed by user";
            running_ = false;
            if (on_quit_) on_quit_();
            break;
        }
        if (key >= 0) editor_.handleKeyEvent(key);
    }
    cv::destroyWindow(win);
}

} // namespace posecast
