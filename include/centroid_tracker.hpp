#pragma once

#include "contour_geometry.hpp"
#include "frame.hpp"
#include <cstddef>
#include <deque>
#include <optional>

namespace handpose {

// Largest hand blob of a frame
struct Extraction {
    Contour contour;
    double area{0.0};
    Point raw_center;   // centroid of this frame
    Point center;       // mean of the recent raw centroids
};

// Picks the largest contour above the area floor and smooths its centroid
// over the last few frames.
class CentroidTracker {
public:
    CentroidTracker(double min_area, size_t history);

    std::optional<Extraction> extract(const camera::Mask& clean_mask);

    // Largest qualifying contour without touching the history
    std::optional<Contour> select_largest(const camera::Mask& clean_mask, double* area_out = nullptr) const;

    // Push a raw centroid and return the smoothed one
    Point push(const Point& raw);

    void reset() { history_.clear(); }
    size_t size() const { return history_.size(); }

    void set_min_area(double min_area) { min_area_ = min_area; }
    void set_history(size_t history);

private:
    double min_area_;
    size_t capacity_;
    std::deque<Point> history_;
};

} // namespace handpose
