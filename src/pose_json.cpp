#include "pose_json.hpp"
#include <iostream>

namespace handpose {

using json = nlohmann::json;

namespace {

Compass string_to_compass(const std::string& s) {
    if (s == "RIGHT") return Compass::RIGHT;
    if (s == "DOWN") return Compass::DOWN;
    if (s == "LEFT") return Compass::LEFT;
    if (s == "UP") return Compass::UP;
    return Compass::NONE;
}

Point point_from(const json& j) {
    return Point(j.value("x", 0), j.value("y", 0));
}

} // namespace

std::string direction_source_to_string(DirectionSource s) {
    switch (s) {
        case DirectionSource::FINGERTIP: return "fingertip";
        case DirectionSource::ROTATED_RECT: return "rotated_rect";
        default: return "none";
    }
}

DirectionSource string_to_direction_source(const std::string& s) {
    if (s == "fingertip") return DirectionSource::FINGERTIP;
    if (s == "rotated_rect") return DirectionSource::ROTATED_RECT;
    return DirectionSource::NONE;
}

void to_json(json& j, const Point& p) {
    j = json{{"x", p.x}, {"y", p.y}};
}

void to_json(json& j, const Vec2& v) {
    j = json{{"x", v.x}, {"y", v.y}};
}

void to_json(json& j, const PoseResult& pose) {
    j = pose_to_json(pose, true);
}

void to_json(json& j, const DetectionStats& stats) {
    j = json{
        {"frames_processed", stats.frames_processed},
        {"hands_detected", stats.hands_detected},
        {"fingertip_directions", stats.fingertip_directions},
        {"rotated_rect_directions", stats.rotated_rect_directions},
        {"avg_process_time_ms", stats.avg_process_time_ms},
        {"last_detection_timestamp", stats.last_detection_timestamp},
        {"stage_ms", {
            {"segmentation", stats.segmentation_ms},
            {"refinement", stats.refinement_ms},
            {"contours", stats.contours_ms},
            {"orientation", stats.orientation_ms},
            {"gesture", stats.gesture_ms}
        }}
    };
}

json pose_to_json(const PoseResult& pose, bool include_contour) {
    json j;
    j["found"] = pose.found();
    j["center"] = pose.center ? json(*pose.center) : json(nullptr);
    j["raw_center"] = pose.raw_center ? json(*pose.raw_center) : json(nullptr);
    j["contour_area"] = pose.contour_area;
    j["contour_size"] = pose.contour.size();
    j["direction"] = pose.direction ? json(*pose.direction) : json(nullptr);
    j["fingertip"] = pose.fingertip ? json(*pose.fingertip) : json(nullptr);
    j["direction_source"] = direction_source_to_string(pose.direction_source);
    j["angle_deg"] = pose.angle_deg ? json(*pose.angle_deg) : json(nullptr);
    j["compass"] = orientation::compass_to_string(pose.compass);
    j["gesture"] = gesture_to_string(pose.gesture);
    j["finger_gaps"] = pose.finger_gaps;

    if (include_contour) {
        j["contour"] = json::array();
        for (const auto& p : pose.contour) {
            j["contour"].push_back(json::array({p.x, p.y}));
        }
    }
    return j;
}

bool pose_from_json(const std::string& json_str, PoseResult& pose) {
    try {
        const json j = json::parse(json_str);
        PoseResult parsed;

        if (j.contains("center") && j["center"].is_object()) parsed.center = point_from(j["center"]);
        if (j.contains("raw_center") && j["raw_center"].is_object()) parsed.raw_center = point_from(j["raw_center"]);
        if (j.contains("fingertip") && j["fingertip"].is_object()) parsed.fingertip = point_from(j["fingertip"]);
        if (j.contains("direction") && j["direction"].is_object()) {
            parsed.direction = Vec2(j["direction"].value("x", 0.0), j["direction"].value("y", 0.0));
        }
        if (j.contains("angle_deg") && j["angle_deg"].is_number()) {
            parsed.angle_deg = j["angle_deg"].get<double>();
        }

        parsed.contour_area = j.value("contour_area", 0.0);
        parsed.direction_source = string_to_direction_source(j.value("direction_source", std::string("none")));
        parsed.compass = string_to_compass(j.value("compass", std::string("NONE")));
        parsed.gesture = string_to_gesture(j.value("gesture", std::string("unknown")));
        parsed.finger_gaps = j.value("finger_gaps", 0);

        if (j.contains("contour") && j["contour"].is_array()) {
            for (const auto& p : j["contour"]) {
                if (p.is_array() && p.size() == 2) {
                    parsed.contour.emplace_back(p[0].get<int>(), p[1].get<int>());
                }
            }
        }

        pose = std::move(parsed);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[Pose] JSON parse error: " << e.what() << "\n";
        return false;
    }
}

} // namespace handpose
