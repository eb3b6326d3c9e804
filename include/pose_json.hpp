#pragma once

#include "hand_pose.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace handpose {

// nlohmann::json ADL hooks
void to_json(nlohmann::json& j, const Point& p);
void to_json(nlohmann::json& j, const Vec2& v);
void to_json(nlohmann::json& j, const PoseResult& pose);
void to_json(nlohmann::json& j, const DetectionStats& stats);

// Pose as JSON; the contour is only listed when asked for
nlohmann::json pose_to_json(const PoseResult& pose, bool include_contour = false);

// Parse a pose written by pose_to_json / to_json
bool pose_from_json(const std::string& json_str, PoseResult& pose);

std::string direction_source_to_string(DirectionSource s);
DirectionSource string_to_direction_source(const std::string& s);

} // namespace handpose
