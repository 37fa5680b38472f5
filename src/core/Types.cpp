#include "posecast/core/Types.h"

namespace posecast {

nlohmann::ordered_json skeletonFrameToJson(const SkeletonFrame& frame) {
    nlohmann::ordered_json root;
    root["timestamp"] = frame.ts_ms;

    nlohmann::ordered_json joints = nlohmann::ordered_json::array();
    for (const auto& kv : frame.joints) {
        const Joint& j = kv.second;
        nlohmann::ordered_json o;
        o["name"] = kv.first;
        o["position"] = {
            {"x", j.position.x}, {"y", j.position.y}, {"z", j.position.z}
        };
        if (j.rotation) {
            const cv::Vec4f& q = *j.rotation;
            o["rotation"] = {
                {"x", q[0]}, {"y", q[1]}, {"z", q[2]}, {"w", q[3]}
            };
        } else {
            o["rotation"] = nullptr;
        }
        o["confidence"] = j.confidence;
        joints.push_back(std::move(o));
    }
    root["joints"] = std::move(joints);

    if (frame.metadata.is_object() && !frame.metadata.empty()) {
        root["meta"] = frame.metadata;
    }
    return root;
}

std::string skeletonFrameToWire(const SkeletonFrame& frame) {
    return skeletonFrameToJson(frame).dump();
}

SkeletonFrame skeletonFrameFromJson(const nlohmann::ordered_json& j) {
    SkeletonFrame frame;
    frame.ts_ms = j.at("timestamp").get<int64_t>();

    if (j.contains("joints")) {
        for (const auto& o : j.at("joints")) {
            Joint joint;
            joint.name = o.at("name").get<std::string>();
            const auto& p = o.at("position");
            joint.position = cv::Point3f(p.at("x").get<float>(),
                                         p.at("y").get<float>(),
                                         p.at("z").get<float>());
            if (o.contains("rotation") && o["rotation"].is_object()) {
                const auto& q = o["rotation"];
                joint.rotation = cv::Vec4f(q.at("x").get<float>(), q.at("y").get<float>(),
                                           q.at("z").get<float>(), q.at("w").get<float>());
            }
            joint.confidence = o.value("confidence", 1.f);
            frame.setJoint(std::move(joint));
        }
    }

    if (j.contains("meta") && j["meta"].is_object()) {
        frame.metadata = j["meta"];
    }
    return frame;
}

} // namespace posecast
