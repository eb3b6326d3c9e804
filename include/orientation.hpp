#pragma once

#include "contour_geometry.hpp"
#include "hand_pose_config.hpp"
#include <cstddef>
#include <deque>
#include <optional>
#include <string>

namespace handpose {

// Which strategy produced a direction
enum class DirectionSource {
    NONE,
    FINGERTIP,      // convexity defects
    ROTATED_RECT    // minimum-area rectangle
};

// Four-way direction label (image coordinates, y down)
enum class Compass {
    NONE,
    RIGHT,
    DOWN,
    LEFT,
    UP
};

struct DirectionEstimate {
    Vec2 direction;                 // unit length
    double angle_deg{0.0};          // atan2(y, x) in [0, 360)
    DirectionSource source{DirectionSource::NONE};
    std::optional<Point> fingertip; // Strategy A only
};

namespace orientation {

// Strategy A: fingertip from convexity defects near the top of the hand
std::optional<DirectionEstimate> estimate_from_fingertip(const Contour& contour,
                                                         double contour_area,
                                                         const Point& center,
                                                         const DetectorConfig& config);

// Strategy B: long axis of the minimum-area rectangle
std::optional<DirectionEstimate> estimate_from_rotated_rect(const Contour& contour);

// Strategy A, then Strategy B
std::optional<DirectionEstimate> estimate_direction(const Contour& contour,
                                                    double contour_area,
                                                    const Point& center,
                                                    const DetectorConfig& config);

// Wrap into [0, 360)
double normalize_degrees(double deg);

Compass compass_from_angle(double deg);

std::string compass_to_string(Compass c);

} // namespace orientation

// Arithmetic mean over the last N angles
class AngleSmoother {
public:
    explicit AngleSmoother(size_t history);

    double push(double deg);
    void reset() { history_.clear(); }
    size_t size() const { return history_.size(); }
    void set_history(size_t history);

private:
    size_t capacity_;
    std::deque<double> history_;
};

} // namespace handpose
