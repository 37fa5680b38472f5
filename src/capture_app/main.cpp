/*
*   Name:  pose_capture
*   Usage: pose_capture [--config config/posecast.yml] [--replay frames.jsonl] [--transport ws|udp]
*                       [--endpoint host:port[/path]] [--preview] ...   (see --help)
*   ==========================================================================================
*   Streams skeleton frames (enriched with calibration, static metadata and seat occupancy)
*   to a WebSocket subscriber or a UDP receiver. --preview opens the live seating editor.
*/
#include <QtCore/QCoreApplication>
#include <QtCore/QMetaObject>
#include <QtCore/QTimer>

#include <posecast/capture/capture_worker.hpp>
#include <posecast/core/Config.h>
#include <posecast/core/Errors.h>
#include <posecast/core/MetadataLoader.h>
#include <posecast/core/ReplayProvider.h>
#include <posecast/core/SeatingLayout.h>
#include <posecast/editor/LiveSeatingEditor.h>
#include <posecast/editor/PreviewWindow.h>
#include <posecast/logging.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

using namespace posecast;

namespace {

std::atomic<bool> g_interrupted{false};

void onSignal(int) { g_interrupted = true; }

void printUsage(const char* prog) {
    std::cout << "Usage: " << prog << " [options]\n"
              << "  --config <file.yml>        YAML config (flags below override it)\n"
              << "  --transport ws|udp         transport kind (default ws)\n"
              << "  --endpoint <endpoint>      ws: [ws://]host:port[/path], udp: host:port\n"
              << "  --frame-interval <sec>     seconds between loop ticks (default 1/60)\n"
              << "  --calibration <file.json>  calibration merged into frame metadata\n"
              << "  --metadata <file.json>     static metadata merged after calibration\n"
              << "  --seating-config <file>    seating layout json\n"
              << "  --replay <file.jsonl>      recorded frames used as the pose source\n"
              << "  --no-loop                  play the recording once\n"
              << "  --preview                  open the preview with the live seating editor\n"
              << "  --preview-window <name>    preview window title\n"
              << "  --camera <index>           camera shown in the preview (default: none)\n"
              << "  --image-width <px>         preview canvas width\n"
              << "  --image-height <px>        preview canvas height\n"
              << "  --debug                    verbose logging\n"
              << "  --help                     show this message\n";
}

// first pass: --config / --help only
std::string findConfigArg(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) return argv[i + 1];
    }
    return {};
}

// Throws ConfigurationError on an unknown flag or a missing / malformed value.
void applyArgs(int argc, char** argv, CaptureConfig& cfg) {
    auto value = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) throw ConfigurationError("Missing value for " + flag);
        return argv[++i];
    };
    auto number = [&](int& i, const std::string& flag) -> double {
        const std::string v = value(i, flag);
        try {
            return std::stod(v);
        } catch (const std::exception&) {
            throw ConfigurationError("Invalid number for " + flag + ": " + v);
        }
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if        (arg == "--config") {         // already loaded
            ++i;
        } else if (arg == "--transport") {
            cfg.transport = value(i, arg);
        } else if (arg == "--endpoint") {
            cfg.endpoint = value(i, arg);
        } else if (arg == "--frame-interval") {
            cfg.frame_interval = number(i, arg);
        } else if (arg == "--calibration") {
            cfg.calibration = value(i, arg);
        } else if (arg == "--metadata") {
            cfg.metadata = value(i, arg);
        } else if (arg == "--seating-config") {
            cfg.seating_config = value(i, arg);
        } else if (arg == "--replay") {
            cfg.replay = value(i, arg);
        } else if (arg == "--no-loop") {
            cfg.replay_loop = false;
        } else if (arg == "--preview") {
            cfg.preview = true;
        } else if (arg == "--preview-window") {
            cfg.preview_window = value(i, arg);
        } else if (arg == "--camera") {
            cfg.camera = static_cast<int>(number(i, arg));
        } else if (arg == "--image-width") {
            cfg.image_width = static_cast<int>(number(i, arg));
        } else if (arg == "--image-height") {
            cfg.image_height = static_cast<int>(number(i, arg));
        } else if (arg == "--debug") {
            cfg.debug = true;
        } else {
            throw ConfigurationError("Unknown argument: " + arg);
        }
    }
}

// missing file: seating disabled with a warning; malformed: ConfigurationError
SeatingLayoutPtr loadSeating(const std::string& path) {
    if (path.empty()) return nullptr;
    if (!std::filesystem::exists(path)) {
        qCWarning(lcSeating) << "Seating config" << QString::fromStdString(path)
                             << "not found; seat occupancy disabled";
        return nullptr;
    }
    auto layout = std::make_shared<const SeatingLayout>(SeatingLayout::loadFromFile(path));
    qCInfo(lcSeating) << "Loaded" << layout->size() << "seats from" << QString::fromStdString(path);
    return layout;
}

} // namespace

int main(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == "--help" || std::string(argv[i]) == "-h") {
            printUsage(argv[0]);
            return 0;
        }
    }

    QCoreApplication app(argc, argv);

    CaptureConfig cfg;
    SeatingLayoutPtr seating;
    MetaMap static_meta = MetaMap::object();
    try {
        const std::string config_path = findConfigArg(argc, argv);
        if (!config_path.empty()) cfg = CaptureConfig::fromYaml(config_path);
        applyArgs(argc, argv, cfg);
        installLogging(cfg.debug);
        cfg.validate();
        if (cfg.replay.empty()) {
            throw ConfigurationError("No pose source configured (use --replay <file.jsonl>)");
        }
        seating = loadSeating(cfg.seating_config);
        if (!cfg.metadata.empty()) static_meta = loadStaticMetadata(cfg.metadata);
    } catch (const ConfigurationError& e) {
        std::cerr << "[Main] Configuration error: " << e.what() << "\n";
        printUsage(argv[0]);
        return 2;
    }

    LoopOptions opts;
    opts.interval = std::chrono::milliseconds(
        std::max<long long>(1, static_cast<long long>(cfg.frame_interval * 1000.0 + 0.5)));
    opts.calibration_file = cfg.calibration;
    opts.static_metadata = std::move(static_meta);
    opts.seating = seating;

    const auto control_timeout = std::chrono::milliseconds(cfg.control_timeout_ms);
    auto provider = std::make_shared<ReplayProvider>(cfg.replay, cfg.replay_loop);

    std::unique_ptr<CaptureWorker> worker;
    try {
        worker = std::make_unique<CaptureWorker>(provider, makeTransport(cfg), std::move(opts));
        worker->start(control_timeout);
    } catch (const Error& e) {
        qCCritical(lcApp) << "Failed to start capture:" << e.what();
        return 1;
    }
    qCInfo(lcApp) << "Streaming" << QString::fromStdString(cfg.replay) << "via"
                  << QString::fromStdString(cfg.transport) << QString::fromStdString(cfg.endpoint);

    LiveSeatingEditor editor([&worker, control_timeout](SeatingLayoutPtr layout) {
        worker->updateSeatingLayout(std::move(layout), control_timeout);
    });
    editor.setLayout(seating);

    std::unique_ptr<PreviewWindow> preview;
    if (cfg.preview) {
        PreviewOptions popts;
        popts.window_name = cfg.preview_window;
        popts.camera = cfg.camera;
        popts.width = cfg.image_width;
        popts.height = cfg.image_height;
        preview = std::make_unique<PreviewWindow>(popts, editor, [] {
            QMetaObject::invokeMethod(QCoreApplication::instance(), "quit", Qt::QueuedConnection);
        });
        try {
            preview->start();
        } catch (const ResourceError& e) {
            qCCritical(lcApp) << "Failed to open preview:" << e.what();
            worker->stop(control_timeout);
            return 1;
        }
    }

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    // SIGINT / end of a one-shot replay -> leave the event loop
    QTimer watchdog;
    QObject::connect(&watchdog, &QTimer::timeout, &app, [&]() {
        if (g_interrupted) {
            qCInfo(lcApp) << "Interrupted, shutting down";
            app.quit();
        } else if (!cfg.replay_loop && provider->finished()) {
            qCInfo(lcApp) << "Replay finished";
            app.quit();
        }
    });
    watchdog.start(100);

    const int rc = app.exec();

    if (preview) preview->stop();
    const CommandResult stopped = worker->stop(control_timeout);
    if (stopped != CommandResult::COMPLETED) {
        qCWarning(lcApp) << "Capture loop stop:" << toString(stopped);
    }
    qCInfo(lcApp) << "Bye";
    return rc;
}
