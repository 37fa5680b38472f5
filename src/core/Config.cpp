#include "posecast/core/Config.h"
#include "posecast/core/Errors.h"
#include <yaml-cpp/yaml.h>
#include <cctype>

namespace posecast {

static void try_get(const YAML::Node& n, const char* key, std::string& v) { if (n[key]) v = n[key].as<std::string>(); }
static void try_get(const YAML::Node& n, const char* key, int& v)         { if (n[key]) v = n[key].as<int>(); }
static void try_get(const YAML::Node& n, const char* key, double& v)      { if (n[key]) v = n[key].as<double>(); }
static void try_get(const YAML::Node& n, const char* key, bool& v)        { if (n[key]) v = n[key].as<bool>(); }

CaptureConfig CaptureConfig::fromYaml(const std::string& yaml_path) {
    CaptureConfig c;
    YAML::Node r;
    try {
        r = YAML::LoadFile(yaml_path);
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Failed to load YAML " + yaml_path + ": " + e.what());
    }
    if (r.IsNull()) return c;   // empty file keeps defaults
    if (!r.IsMap()) {
        throw ConfigurationError("Config root must be a mapping: " + yaml_path);
    }

    try {
        try_get(r, "transport",      c.transport);
        try_get(r, "endpoint",       c.endpoint);
        try_get(r, "frame_interval", c.frame_interval);

        try_get(r, "calibration",    c.calibration);
        try_get(r, "metadata",       c.metadata);
        try_get(r, "seating_config", c.seating_config);

        try_get(r, "replay",         c.replay);
        try_get(r, "replay_loop",    c.replay_loop);

        try_get(r, "preview",        c.preview);
        try_get(r, "preview_window", c.preview_window);
        try_get(r, "camera",         c.camera);
        try_get(r, "image_width",    c.image_width);
        try_get(r, "image_height",   c.image_height);

        try_get(r, "control_timeout_ms", c.control_timeout_ms);
        try_get(r, "debug",          c.debug);
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Invalid value in " + yaml_path + ": " + e.what());
    }
    return c;
}

void CaptureConfig::validate() const {
    transportKind();
    if (!(frame_interval > 0.0)) {
        throw ConfigurationError("frame_interval must be > 0");
    }
    if (control_timeout_ms <= 0) {
        throw ConfigurationError("control_timeout_ms must be > 0");
    }
    if (preview && (image_width <= 0 || image_height <= 0)) {
        throw ConfigurationError("image_width / image_height must be > 0");
    }
}

TransportKind CaptureConfig::transportKind() const {
    if (transport == "ws")  return TransportKind::WEBSOCKET;
    if (transport == "udp") return TransportKind::UDP;
    throw ConfigurationError("Unsupported transport type '" + transport + "' (expected ws or udp)");
}

// ==================== endpoints ===========================

std::string normalizePath(const std::string& path) {
    // rebuild from non-empty segments: leading '/', no repeated or trailing '/'
    std::string out;
    size_t i = 0;
    while (i < path.size()) {
        size_t j = path.find('/', i);
        if (j == std::string::npos) j = path.size();
        if (j > i) out += "/" + path.substr(i, j - i);
        i = j + 1;
    }
    return out;
}

static uint16_t parsePort(const std::string& text, const std::string& endpoint, bool allow_zero) {
    if (text.empty()) {
        throw ConfigurationError("Endpoint '" + endpoint + "' has no port");
    }
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw ConfigurationError("Endpoint '" + endpoint + "' has a non-numeric port");
        }
    }
    if (text.size() > 5) {
        throw ConfigurationError("Endpoint '" + endpoint + "' port out of range");
    }
    const long port = std::stol(text);
    if (port > 65535 || (port == 0 && !allow_zero)) {
        throw ConfigurationError("Endpoint '" + endpoint + "' port out of range");
    }
    return static_cast<uint16_t>(port);
}

Endpoint parseWebSocketEndpoint(const std::string& text) {
    std::string rest = text;
    if (rest.rfind("ws://", 0) == 0) {
        rest = rest.substr(5);
    } else if (rest.find("://") != std::string::npos) {
        throw ConfigurationError("WebSocket endpoint '" + text + "' must use the ws:// scheme");
    }

    Endpoint ep;
    const auto slash = rest.find('/');
    const std::string authority = rest.substr(0, slash);
    if (slash != std::string::npos) ep.path = normalizePath(rest.substr(slash));

    const auto colon = authority.rfind(':');
    if (colon == std::string::npos) {
        throw ConfigurationError("WebSocket endpoint '" + text + "' must be host:port[/path]");
    }
    ep.host = authority.substr(0, colon);
    if (ep.host.empty()) ep.host = "0.0.0.0";
    ep.port = parsePort(authority.substr(colon + 1), text, true);
    return ep;
}

Endpoint parseUdpEndpoint(const std::string& text) {
    const auto colon = text.rfind(':');
    if (colon == std::string::npos) {
        throw ConfigurationError("UDP endpoint must be in host:port format");
    }
    Endpoint ep;
    ep.host = text.substr(0, colon);
    if (ep.host.empty()) ep.host = "127.0.0.1";
    ep.port = parsePort(text.substr(colon + 1), text, false);
    return ep;
}

} // namespace posecast
