#pragma once
#include <opencv2/videoio.hpp>
#include <atomic>
#include <functional>
#include <string>
#include <thread>

#include "LiveSeatingEditor.h"

namespace posecast {

struct PreviewOptions {
    std::string window_name = "Pose Capture Preview";
    int camera = -1;      // <0: blank canvas
    int width  = 1280;
    int height = 720;
};

/* OpenCV preview on its own thread: grabs camera frames (or a blank canvas), lets
*  the LiveSeatingEditor draw over them and feeds it mouse and key events.
*  q / ESC invokes on_quit.
*
*  @note - the editor is touched only from the preview thread once start() returned
*/
class PreviewWindow {
public:
    PreviewWindow(PreviewOptions options, LiveSeatingEditor& editor, std::function<void()> on_quit = {});
    ~PreviewWindow();

    PreviewWindow(const PreviewWindow&) = delete;
    PreviewWindow& operator=(const PreviewWindow&) = delete;

    // Opens the camera on the calling thread. Throws ResourceError if it cannot be opened.
    void start();
    void stop();
    bool running() const { return running_; }

    // waitKeyEx codes -> editor key codes (Delete as 127); -1 for keys the editor ignores
    static int normalizeKey(int raw);

private:
    void loop();
    cv::Mat nextFrame();
    static void onMouse(int event, int x, int y, int flags, void* userdata);

    PreviewOptions options_;
    LiveSeatingEditor& editor_;
    std::function<void()> on_quit_;

    cv::VideoCapture cap_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    bool read_failing_ = false;
};

} // namespace posecast
