#include "centroid_tracker.hpp"
#include <algorithm>

namespace handpose {

CentroidTracker::CentroidTracker(double min_area, size_t history)
    : min_area_(min_area), capacity_(std::max<size_t>(1, history)) {}

void CentroidTracker::set_history(size_t history) {
    capacity_ = std::max<size_t>(1, history);
    while (history_.size() > capacity_) {
        history_.pop_front();
    }
}

std::optional<Contour> CentroidTracker::select_largest(const camera::Mask& clean_mask, double* area_out) const {
    std::vector<Contour> contours = geometry::find_contours(clean_mask);

    int best = -1;
    double best_area = 0.0;
    for (size_t i = 0; i < contours.size(); i++) {
        const double area = geometry::contour_area(contours[i]);
        if (area < min_area_) continue;
        // Strictly larger, so the earliest contour in raster order wins ties
        if (best < 0 || area > best_area) {
            best = static_cast<int>(i);
            best_area = area;
        }
    }

    if (best < 0) {
        return std::nullopt;
    }
    if (area_out) *area_out = best_area;
    return std::move(contours[best]);
}

Point CentroidTracker::push(const Point& raw) {
    history_.push_back(raw);
    while (history_.size() > capacity_) {
        history_.pop_front();
    }

    long long sx = 0, sy = 0;
    for (const auto& p : history_) {
        sx += p.x;
        sy += p.y;
    }
    const long long n = static_cast<long long>(history_.size());
    return Point(static_cast<int>(sx / n), static_cast<int>(sy / n));
}

std::optional<Extraction> CentroidTracker::extract(const camera::Mask& clean_mask) {
    double area = 0.0;
    std::optional<Contour> contour = select_largest(clean_mask, &area);
    if (!contour) {
        return std::nullopt;
    }

    const std::optional<Point> raw = geometry::centroid(*contour);
    if (!raw) {
        return std::nullopt;
    }

    Extraction result;
    result.contour = std::move(*contour);
    result.area = area;
    result.raw_center = *raw;
    result.center = push(*raw);
    return result;
}

} // namespace handpose
