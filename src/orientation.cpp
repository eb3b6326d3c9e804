#include "orientation.hpp"
#include <algorithm>
#include <cmath>
#include <vector>

namespace handpose {
namespace orientation {

namespace {

std::optional<DirectionEstimate> make_estimate(double dx, double dy, DirectionSource source) {
    const double len = std::sqrt(dx * dx + dy * dy);
    if (len <= 0.0) {
        return std::nullopt;
    }

    DirectionEstimate est;
    est.direction = Vec2(dx / len, dy / len);
    est.angle_deg = normalize_degrees(std::atan2(dy, dx) * 180.0 / constants::kPi);
    est.source = source;
    return est;
}

} // namespace

double normalize_degrees(double deg) {
    double a = std::fmod(deg, 360.0);
    if (a < 0.0) a += 360.0;
    if (a >= 360.0) a -= 360.0;
    return a;
}

Compass compass_from_angle(double deg) {
    const double a = normalize_degrees(deg);
    if (a > 315.0 || a <= 45.0) return Compass::RIGHT;
    if (a <= 135.0) return Compass::DOWN;
    if (a <= 225.0) return Compass::LEFT;
    return Compass::UP;
}

std::string compass_to_string(Compass c) {
    switch (c) {
        case Compass::RIGHT: return "RIGHT";
        case Compass::DOWN:  return "DOWN";
        case Compass::LEFT:  return "LEFT";
        case Compass::UP:    return "UP";
        default:             return "NONE";
    }
}

std::optional<DirectionEstimate> estimate_from_fingertip(const Contour& contour,
                                                         double contour_area,
                                                         const Point& center,
                                                         const DetectorConfig& config) {
    if (contour_area <= config.fingertip_min_area) {
        return std::nullopt;
    }

    const std::vector<int> hull = geometry::convex_hull_indices(contour);
    if (hull.size() < 3) {
        return std::nullopt;
    }

    const auto defects = geometry::convexity_defects(contour, hull, config.min_defect_depth);
    if (!defects) {
        return std::nullopt;
    }

    const auto extremes = geometry::extreme_points(contour);
    if (!extremes) {
        return std::nullopt;
    }

    // Sharp gaps near the top of the hand bound the raised fingers
    std::vector<Point> candidates;
    for (const auto& d : *defects) {
        const Point& start = contour[d.start_index];
        const Point& end = contour[d.end_index];
        const Point& far = contour[d.far_index];

        if (geometry::far_angle(start, end, far) > config.fingertip_max_angle) continue;

        if (start.distance(extremes->top) < config.fingertip_top_radius) candidates.push_back(start);
        if (end.distance(extremes->top) < config.fingertip_top_radius) candidates.push_back(end);
    }

    // Convex blobs and blunt gaps: farthest extreme point
    if (candidates.empty()) {
        candidates = {extremes->top, extremes->bottom, extremes->left, extremes->right};
    }

    Point tip = candidates.front();
    double best = tip.distance(center);
    for (size_t i = 1; i < candidates.size(); i++) {
        const double dist = candidates[i].distance(center);
        if (dist > best) {
            best = dist;
            tip = candidates[i];
        }
    }

    auto est = make_estimate(tip.x - center.x, tip.y - center.y, DirectionSource::FINGERTIP);
    if (est) {
        est->fingertip = tip;
    }
    return est;
}

std::optional<DirectionEstimate> estimate_from_rotated_rect(const Contour& contour) {
    const auto rect = geometry::min_area_rect(contour);
    if (!rect) {
        return std::nullopt;
    }

    double theta = rect->angle_deg;
    if (rect->width < rect->height) {
        theta += 90.0;
    }

    const double rad = theta * constants::kPi / 180.0;
    auto est = make_estimate(std::cos(rad), std::sin(rad), DirectionSource::ROTATED_RECT);
    if (est) {
        est->angle_deg = normalize_degrees(theta);
    }
    return est;
}

std::optional<DirectionEstimate> estimate_direction(const Contour& contour,
                                                    double contour_area,
                                                    const Point& center,
                                                    const DetectorConfig& config) {
    if (auto est = estimate_from_fingertip(contour, contour_area, center, config)) {
        return est;
    }
    return estimate_from_rotated_rect(contour);
}

} // namespace orientation

AngleSmoother::AngleSmoother(size_t history) : capacity_(std::max<size_t>(1, history)) {}

void AngleSmoother::set_history(size_t history) {
    capacity_ = std::max<size_t>(1, history);
    while (history_.size() > capacity_) {
        history_.pop_front();
    }
}

double AngleSmoother::push(double deg) {
    history_.push_back(deg);
    while (history_.size() > capacity_) {
        history_.pop_front();
    }

    double sum = 0.0;
    for (double a : history_) sum += a;
    return sum / static_cast<double>(history_.size());
}

} // namespace handpose
