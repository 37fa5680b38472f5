/*
*   Name:  seating_editor
*   Usage: seating_editor [image|--camera N] [output.json] [existing.json]
*   ==========================================================================================
*   Offline seating layout authoring over a still image (or one camera snapshot).
*   Uses the same editor as the live preview; S saves the layout, ESC quits.
*/
#include <opencv2/opencv.hpp>
#include <QtCore/QCoreApplication>

#include "posecast/core/Errors.h"
#include "posecast/core/SeatingLayout.h"
#include "posecast/editor/LiveSeatingEditor.h"
#include "posecast/editor/PreviewWindow.h"
#include "posecast/logging.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>

using namespace posecast;

static void onMouse(int e, int x, int y, int, void* ud) {
    auto* ed = static_cast<LiveSeatingEditor*>(ud);
    PointerEvent ev{PointerEvent::Type::MOVE, x, y};
    if      (e == cv::EVENT_LBUTTONDOWN) ev.type = PointerEvent::Type::DOWN;
    else if (e == cv::EVENT_LBUTTONUP)   ev.type = PointerEvent::Type::UP;
    else if (e != cv::EVENT_MOUSEMOVE)   return;
    ed->handlePointerEvent(ev);
}

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);   // qCInfo output
    installLogging(false);

    std::string img_path = "data/samples/seating.jpg";
    int camera = -1;
    int argi = 1;
    if (argc > 2 && std::string(argv[1]) == "--camera") {
        camera = std::atoi(argv[2]);
        argi = 3;
    } else if (argc > 1) {
        img_path = argv[1];
        argi = 2;
    }
    std::string out_json = argc > argi ? argv[argi] : "config/seats.json";
    std::string existing = argc > argi + 1 ? argv[argi + 1] : out_json;

    cv::Mat img;
    if (camera >= 0) {
        cv::VideoCapture cap(camera);
        if (!cap.isOpened() || !cap.read(img)) {
            std::cerr << "Failed to grab a snapshot from camera " << camera << "\n";
            return 1;
        }
    } else {
        img = cv::imread(img_path);
    }
    if (img.empty()) {
        std::cerr << "Failed to read: " << img_path << "\n";
        return 1;
    }

    // S saves whatever the editor last committed
    SeatingLayoutPtr current;
    LiveSeatingEditor editor([&current](SeatingLayoutPtr layout) { current = std::move(layout); });
    if (std::filesystem::exists(existing)) {
        try {
            current = std::make_shared<const SeatingLayout>(SeatingLayout::loadFromFile(existing));
            editor.setLayout(current);
            std::cout << "Loaded " << current->size() << " seats from " << existing << "\n";
        } catch (const ConfigurationError& e) {
            std::cerr << "Ignoring " << existing << ": " << e.what() << "\n";
        }
    }
    editor.handleKeyEvent('e');

    std::cout << "==========================================\n"
              << "   Seating Layout Editor\n"
              << "==========================================\n"
              << "Usage: " << argv[0] << " [image|--camera N] [output.json] [existing.json]\n\n"
              << "Instructions:\n"
              << "  Drag seat       - Move seat\n"
              << "  Drag corner     - Resize seat\n"
              << "  N + drag        - Add a new seat\n"
              << "  TAB             - Select next seat\n"
              << "  DELETE          - Remove selected seat\n"
              << "  C               - Remove all seats\n"
              << "  S               - Save seats to JSON file and exit\n"
              << "  ESC             - Exit without saving\n"
              << "Output: " << out_json << "\n"
              << "==========================================\n";

    const std::string win = "seating_editor";
    cv::namedWindow(win, cv::WINDOW_NORMAL);
    cv::setMouseCallback(win, onMouse, &editor);

    while (true) {
        cv::Mat vis = img.clone();
        editor.render(vis);
        cv::imshow(win, vis);
        const int k = PreviewWindow::normalizeKey(cv::waitKeyEx(30));
        if (k == 's' || k == 'S') {
            if (!current) {
                std::cerr << "No seats to save\n";
                continue;
            }
            if (current->saveToFile(out_json)) {
                std::cout << "Saved seats to " << out_json << " (" << current->size() << " seats)\n";
            } else {
                std::cerr << "Failed to save seats to " << out_json << "\n";
            }
            break;
        } else if (k == 27) {
            break;  // ESC
        } else if (k != 'e' && k != 'E' && k >= 0) {
            editor.handleKeyEvent(k);   // editing stays on in this tool
        }
    }
    return 0;
}
