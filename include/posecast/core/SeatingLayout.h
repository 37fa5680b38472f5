#pragma once
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "Types.h"

namespace posecast {

// 座位区域：归一化坐标 [0,1] 下的矩形
struct SeatRegion {
    std::string seat_id;
    double x_min = 0.0;
    double y_min = 0.0;
    double x_max = 0.0;
    double y_max = 0.0;

    // boundaries inclusive
    bool contains(double x, double y) const {
        return x_min <= x && x <= x_max && y_min <= y && y <= y_max;
    }
    double width() const  { return x_max > x_min ? x_max - x_min : 0.0; }
    double height() const { return y_max > y_min ? y_max - y_min : 0.0; }
};

struct SeatOccupancy {
    std::string id;
    bool occupied = false;
    SeatRegion bounds;
};

// Result of matching one frame's root point against a layout.
struct SeatOccupancyReport {
    std::optional<std::string> active_seat_id;
    double confidence = 0.0;            // 0~1
    std::vector<SeatOccupancy> seats;   // every seat, in layout order

    // {"activeSeatId": string|null, "confidence", "seats":[{id, occupied, bounds}]}
    MetaMap toJson() const;
};

/* Ordered, id-unique, non-empty collection of seats. Immutable once built; an edit
*  produces a new instance. Overlapping seats are allowed: resolve() returns the
*  earliest-registered seat containing the point.
*/
class SeatingLayout {
public:
    // Throws ValidationError on an empty list, an empty id or a repeated id.
    explicit SeatingLayout(std::vector<SeatRegion> seats);

    const std::vector<SeatRegion>& seats() const { return seats_; }
    size_t size() const { return seats_.size(); }

    // first seat (insertion order) containing (x, y); nullptr if none
    const SeatRegion* resolve(double x, double y) const;

    // nullopt when the frame metadata carries no usable root point
    std::optional<SeatOccupancyReport> evaluate(const SkeletonFrame& frame) const;

    // {"seats":[{"id", "bounds":{"xMin","xMax","yMin","yMax"}}]}
    nlohmann::json toJson() const;

    // Throws ConfigurationError on structural or bound violations.
    static SeatingLayout fromJson(const nlohmann::json& root);
    static SeatingLayout loadFromFile(const std::string& path);

    // writes toJson() indented by 2; false if the file cannot be written
    bool saveToFile(const std::string& path) const;

private:
    std::vector<SeatRegion> seats_;
};

using SeatingLayoutPtr = std::shared_ptr<const SeatingLayout>;

// Distance-to-edge score: 1 at the center, 0 on (or outside) the boundary.
double seatConfidence(const SeatRegion& seat, double x, double y);

// root_center_normalized{x,y}, else root_center_pixel{x,y} / frame_dimensions{width,height}
std::optional<cv::Point2d> extractNormalizedRoot(const MetaMap& metadata);

} // namespace posecast
