#pragma once
#include <opencv2/core.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace posecast {

// Frame metadata keeps insertion order so the wire layout stays fixed.
using MetaMap = nlohmann::ordered_json;

// 单个关节
struct Joint {
    std::string name;
    cv::Point3f position;               // camera/world position from the provider
    std::optional<cv::Vec4f> rotation;  // (x, y, z, w); absent == identity, sent as null
    float confidence = 1.f;             // 0~1
};

// One timestamped skeleton sample.
struct SkeletonFrame {
    std::map<std::string, Joint> joints;  // name -> joint, names unique
    int64_t ts_ms = 0;                    // non-decreasing per provider
    MetaMap metadata = MetaMap::object(); // calibration / seating / root_center_* ...

    // Inserts or replaces the joint under j.name.
    void setJoint(Joint j) {
        auto name = j.name;
        joints[name] = std::move(j);
    }
};

/* Wire layout, one JSON object per frame:
{
   timestamp,
   joints: [ { name, position{x,y,z}, rotation{x,y,z,w}|null, confidence } ],
   meta: { ... }                          // only when metadata is non-empty
}
*/
nlohmann::ordered_json skeletonFrameToJson(const SkeletonFrame& frame);

// Compact single-line dump of skeletonFrameToJson().
std::string skeletonFrameToWire(const SkeletonFrame& frame);

// Parses one wire object back into a frame. Throws nlohmann::json::exception on
// structural errors (missing timestamp, joint without name or position).
SkeletonFrame skeletonFrameFromJson(const nlohmann::ordered_json& j);

} // namespace posecast
