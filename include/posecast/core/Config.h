#pragma once
#include <cstdint>
#include <string>

namespace posecast {

enum class TransportKind {
    WEBSOCKET,
    UDP
};

// host:port[/path]; path is normalized ("" or "/segment[/...]", no trailing slash)
struct Endpoint {
    std::string host;
    uint16_t    port = 0;
    std::string path;
};

// pose_capture running config (load from posecast.yml, then overridden by CLI flags)
struct CaptureConfig {
    // ===================== fields ===================== //

    std::string transport      = "ws";                  // "ws" | "udp"
    std::string endpoint       = "0.0.0.0:9000/pose";   // ws: [ws://]host:port[/path]; udp: host:port
    double      frame_interval = 1.0 / 60.0;            // seconds between loop ticks

    std::string calibration;       // optional calibration json (merged into meta)
    std::string metadata;          // optional static metadata json (merged after calibration)
    std::string seating_config;    // optional seating layout json

    std::string replay;            // recorded frames (.jsonl) played back as the pose source
    bool        replay_loop = true;

    // preview / live seating editor
    bool        preview = false;
    std::string preview_window = "Pose Capture Preview";
    int         camera = -1;       // <0: blank canvas instead of a camera feed
    int         image_width  = 1280;
    int         image_height = 720;

    int         control_timeout_ms = 5000; // stop / seating update acknowledgment bound
    bool        debug = false;

    // ===================== methods ===================== //

    // Throws ConfigurationError if the file cannot be read or a value has the wrong type.
    static CaptureConfig fromYaml(const std::string& yaml_path);

    // Throws ConfigurationError on an unknown transport or a non-positive interval.
    void validate() const;

    TransportKind transportKind() const;
};

// Throws ConfigurationError on malformed input.
Endpoint parseWebSocketEndpoint(const std::string& text);
Endpoint parseUdpEndpoint(const std::string& text);

// "", "/", "pose/", "//pose" -> "", "", "/pose", "/pose"
std::string normalizePath(const std::string& path);

} // namespace posecast
