#include "posecast/core/SeatingLayout.h"
#include "posecast/core/Errors.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <set>

using nlohmann::json;

namespace posecast {

// ==================== SeatOccupancyReport ===========================

MetaMap SeatOccupancyReport::toJson() const {
    MetaMap o;
    if (active_seat_id) o["activeSeatId"] = *active_seat_id;
    else                o["activeSeatId"] = nullptr;
    o["confidence"] = confidence;

    MetaMap arr = MetaMap::array();
    for (const auto& s : seats) {
        MetaMap e;
        e["id"] = s.id;
        e["occupied"] = s.occupied;
        e["bounds"] = {
            {"xMin", s.bounds.x_min}, {"xMax", s.bounds.x_max},
            {"yMin", s.bounds.y_min}, {"yMax", s.bounds.y_max}
        };
        arr.push_back(std::move(e));
    }
    o["seats"] = std::move(arr);
    return o;
}

// ==================== SeatingLayout ===========================

SeatingLayout::SeatingLayout(std::vector<SeatRegion> seats) {
    if (seats.empty()) {
        throw ValidationError("SeatingLayout requires at least one seat");
    }
    std::set<std::string> seen;
    for (const auto& s : seats) {
        if (s.seat_id.empty()) {
            throw ValidationError("Seat id must not be empty");
        }
        if (!seen.insert(s.seat_id).second) {
            throw ValidationError("Duplicate seat id detected: " + s.seat_id);
        }
    }
    seats_ = std::move(seats);
}

const SeatRegion* SeatingLayout::resolve(double x, double y) const {
    for (const auto& s : seats_) {
        if (s.contains(x, y)) return &s;
    }
    return nullptr;
}

std::optional<SeatOccupancyReport> SeatingLayout::evaluate(const SkeletonFrame& frame) const {
    auto root = extractNormalizedRoot(frame.metadata);
    if (!root) return std::nullopt;

    SeatOccupancyReport report;
    const SeatRegion* hit = resolve(root->x, root->y);
    if (hit) {
        report.active_seat_id = hit->seat_id;
        report.confidence = seatConfidence(*hit, root->x, root->y);
    }
    report.seats.reserve(seats_.size());
    for (const auto& s : seats_) {
        report.seats.push_back({s.seat_id, hit == &s, s});
    }
    return report;
}

json SeatingLayout::toJson() const {
    json root;
    root["seats"] = json::array();
    for (const auto& s : seats_) {
        json j;
        j["id"] = s.seat_id;
        j["bounds"] = {
            {"xMin", s.x_min}, {"xMax", s.x_max},
            {"yMin", s.y_min}, {"yMax", s.y_max}
        };
        root["seats"].push_back(std::move(j));
    }
    return root;
}

static double boundFromJson(const json& bounds, const char* key, const std::string& seat_id) {
    if (!bounds.contains(key) || !bounds[key].is_number()) {
        throw ConfigurationError("Invalid bounds for seat '" + seat_id + "': missing numeric '" + key + "'");
    }
    return bounds[key].get<double>();
}

SeatingLayout SeatingLayout::fromJson(const json& root) {
    if (!root.is_object()) {
        throw ConfigurationError("Seating config root must be an object");
    }
    if (!root.contains("seats") || !root["seats"].is_array()) {
        throw ConfigurationError("Seating config must contain a 'seats' array");
    }

    std::vector<SeatRegion> seats;
    for (const auto& raw : root["seats"]) {
        if (!raw.is_object()) {
            throw ConfigurationError("Seat entry must be an object");
        }
        // id 允许是字符串或整数；id 为空时再看 seatId（兼容别名）
        auto idText = [&raw](const char* key) -> std::string {
            auto it = raw.find(key);
            if (it == raw.end()) return {};
            if (it->is_string())          return it->get<std::string>();
            if (it->is_number_integer())  return std::to_string(it->get<long long>());
            return {};
        };
        std::string seat_id = idText("id");
        if (seat_id.empty()) seat_id = idText("seatId");
        if (seat_id.empty()) {
            throw ConfigurationError("Seat entry missing 'id'");
        }

        if (!raw.contains("bounds") || !raw["bounds"].is_object()) {
            throw ConfigurationError("Seat '" + seat_id + "' missing 'bounds'");
        }
        const json& b = raw["bounds"];
        SeatRegion seat;
        seat.seat_id = seat_id;
        seat.x_min = boundFromJson(b, "xMin", seat_id);
        seat.x_max = boundFromJson(b, "xMax", seat_id);
        seat.y_min = boundFromJson(b, "yMin", seat_id);
        seat.y_max = boundFromJson(b, "yMax", seat_id);
        if (seat.x_min >= seat.x_max || seat.y_min >= seat.y_max) {
            throw ConfigurationError("Seat '" + seat_id + "' has non-positive bounds");
        }
        seats.push_back(std::move(seat));
    }

    try {
        return SeatingLayout(std::move(seats));
    } catch (const ValidationError& e) {
        throw ConfigurationError(e.what());
    }
}

SeatingLayout SeatingLayout::loadFromFile(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw ConfigurationError("Cannot open seating config: " + path);
    }
    json root;
    try {
        ifs >> root;
    } catch (const json::exception& e) {
        throw ConfigurationError("Failed to parse seating config " + path + ": " + e.what());
    }
    return fromJson(root);
}

bool SeatingLayout::saveToFile(const std::string& path) const {
    std::ofstream ofs(path);
    if (!ofs.is_open()) return false;
    ofs << toJson().dump(2);
    return static_cast<bool>(ofs);
}

// ==================== helpers ===========================

double seatConfidence(const SeatRegion& seat, double x, double y) {
    const double w = seat.width();
    const double h = seat.height();
    if (w <= 0.0 || h <= 0.0) return 0.0;

    const double margin_x = std::min(x - seat.x_min, seat.x_max - x);
    const double margin_y = std::min(y - seat.y_min, seat.y_max - y);
    if (margin_x < 0.0 || margin_y < 0.0) return 0.0;

    const double normalized = std::min(margin_x / (w * 0.5), margin_y / (h * 0.5));
    return std::clamp(normalized, 0.0, 1.0);
}

static std::optional<double> numberField(const MetaMap& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number()) return std::nullopt;
    return it->get<double>();
}

std::optional<cv::Point2d> extractNormalizedRoot(const MetaMap& metadata) {
    if (!metadata.is_object()) return std::nullopt;

    auto root = metadata.find("root_center_normalized");
    if (root != metadata.end() && root->is_object()) {
        auto x = numberField(*root, "x");
        auto y = numberField(*root, "y");
        if (x && y) return cv::Point2d(*x, *y);
    }

    auto pixel = metadata.find("root_center_pixel");
    auto dims  = metadata.find("frame_dimensions");
    if (pixel == metadata.end() || dims == metadata.end()
        || !pixel->is_object() || !dims->is_object()) {
        return std::nullopt;
    }
    auto px = numberField(*pixel, "x");
    auto py = numberField(*pixel, "y");
    auto fw = numberField(*dims, "width");
    auto fh = numberField(*dims, "height");
    if (!px || !py || !fw || !fh || *fw == 0.0 || *fh == 0.0) return std::nullopt;
    return cv::Point2d(*px / *fw, *py / *fh);
}

} // namespace posecast
