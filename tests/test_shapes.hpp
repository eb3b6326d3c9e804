#pragma once

// Synthetic silhouettes shared by the test suites

#include "contour_geometry.hpp"
#include "frame.hpp"
#include <algorithm>
#include <cmath>
#include <utility>
#include <vector>

namespace test_shapes {

using Polygon = std::vector<std::pair<double, double>>;

constexpr double kPi = 3.14159265358979323846;

// Skin tone well inside both preset HSV ranges: HSV(12, 116, 220)
constexpr uint8_t kSkinR = 220;
constexpr uint8_t kSkinG = 160;
constexpr uint8_t kSkinB = 120;

// Scanline fill sampling pixel centers, even-odd rule
template <typename Plot>
void fill_polygon(const Polygon& poly, int width, int height, Plot plot) {
    for (int y = 0; y < height; y++) {
        const double yc = y + 0.5;
        std::vector<double> xs;
        for (size_t i = 0; i < poly.size(); i++) {
            const auto& a = poly[i];
            const auto& b = poly[(i + 1) % poly.size()];
            if ((a.second <= yc && yc < b.second) || (b.second <= yc && yc < a.second)) {
                xs.push_back(a.first + (yc - a.second) * (b.first - a.first) / (b.second - a.second));
            }
        }
        std::sort(xs.begin(), xs.end());
        for (size_t i = 0; i + 1 < xs.size(); i += 2) {
            const int x0 = std::max(0, static_cast<int>(std::ceil(xs[i] - 0.5)));
            const int x1 = std::min(width - 1, static_cast<int>(std::floor(xs[i + 1] - 0.5)));
            for (int x = x0; x <= x1; x++) plot(x, y);
        }
    }
}

inline void fill_mask(handpose::camera::Mask& mask, const Polygon& poly) {
    fill_polygon(poly, static_cast<int>(mask.width), static_cast<int>(mask.height),
                 [&mask](int x, int y) { mask.at(x, y) = 255; });
}

inline void fill_frame(handpose::camera::Frame& frame, const Polygon& poly,
                       uint8_t r = kSkinR, uint8_t g = kSkinG, uint8_t b = kSkinB) {
    fill_polygon(poly, static_cast<int>(frame.width), static_cast<int>(frame.height),
                 [&](int x, int y) { frame.set_rgb(x, y, r, g, b); });
}

inline void fill_rect(handpose::camera::Frame& frame, int x, int y, int w, int h,
                      uint8_t r = kSkinR, uint8_t g = kSkinG, uint8_t b = kSkinB) {
    for (int dy = 0; dy < h; dy++) {
        for (int dx = 0; dx < w; dx++) {
            frame.set_rgb(x + dx, y + dy, r, g, b);
        }
    }
}

inline void fill_rect(handpose::camera::Mask& mask, int x, int y, int w, int h) {
    for (int dy = 0; dy < h; dy++) {
        for (int dx = 0; dx < w; dx++) {
            mask.at(x + dx, y + dy) = 255;
        }
    }
}

// Palm with one raised finger; the finger points straight up
inline Polygon pointer_hand(double dx = 0.0, double dy = 0.0) {
    Polygon p = {{311, 142}, {325, 142}, {325, 215}, {353, 180},
                 {353, 300}, {283, 300}, {283, 245}, {311, 225}};
    for (auto& v : p) {
        v.first += dx;
        v.second += dy;
    }
    return p;
}

// Convex blob of 5000 px2 centered on (320, 240), apex at (320, 140)
inline Polygon sharp_pentagon() {
    return {{320, 140}, {345, 250}, {345, 295}, {295, 295}, {295, 250}};
}

inline Polygon ellipse(double cx, double cy, double a, double b, double deg, int n = 360) {
    Polygon p;
    const double th = deg * kPi / 180.0;
    for (int k = 0; k < n; k++) {
        const double t = 2.0 * kPi * k / n;
        p.emplace_back(cx + a * std::cos(t) * std::cos(th) - b * std::sin(t) * std::sin(th),
                       cy + a * std::cos(t) * std::sin(th) + b * std::sin(t) * std::cos(th));
    }
    return p;
}

inline handpose::Point rounded(double x, double y) {
    return handpose::Point(static_cast<int>(std::lround(x)), static_cast<int>(std::lround(y)));
}

inline handpose::Contour to_contour(const Polygon& poly) {
    handpose::Contour c;
    for (const auto& v : poly) c.push_back(rounded(v.first, v.second));
    return c;
}

// Palm with n fingers fanned upward, 24 degrees apart, traced right to left
inline handpose::Contour finger_fan(int n) {
    const double cx = 200, cy = 220, big_r = 110, small_r = 45, spacing = 24;
    handpose::Contour c;
    c.push_back(rounded(cx - 70, cy + 80));
    c.push_back(rounded(cx + 70, cy + 80));
    c.push_back(rounded(cx + 70, cy));

    auto angle_of = [&](int i) { return 270.0 + (i - (n - 1) / 2.0) * spacing; };
    for (int i = n - 1; i >= 0; i--) {
        const double a = angle_of(i) * kPi / 180.0;
        c.push_back(rounded(cx + big_r * std::cos(a), cy + big_r * std::sin(a)));
        if (i > 0) {
            const double m = (angle_of(i) + angle_of(i - 1)) * 0.5 * kPi / 180.0;
            c.push_back(rounded(cx + small_r * std::cos(m), cy + small_r * std::sin(m)));
        }
    }

    c.push_back(rounded(cx - 70, cy));
    return c;
}

// Rounded fist with three narrow slits: three sharp gaps on a solid shape
inline handpose::Contour slit_dome() {
    const double cx = 200, cy = 200, big_r = 100, apex_r = 30, half_width = 1.5;
    const double slits[3] = {225.0, 270.0, 315.0};

    std::vector<double> angles;
    for (int a = 180; a <= 360; a += 15) angles.push_back(a);
    for (double s : slits) {
        angles.push_back(s - half_width);
        angles.push_back(s + half_width);
    }
    std::sort(angles.begin(), angles.end());

    handpose::Contour c;
    c.push_back(rounded(cx + big_r, cy + 60));
    c.push_back(rounded(cx - big_r, cy + 60));
    for (double a : angles) {
        const bool apex = std::find(std::begin(slits), std::end(slits), a) != std::end(slits);
        const double r = apex ? apex_r : big_r;
        const double rad = a * kPi / 180.0;
        c.push_back(rounded(cx + r * std::cos(rad), cy + r * std::sin(rad)));
    }
    return c;
}

// Angular distance modulo 180 degrees
inline double axis_difference(double a, double b) {
    double d = std::fmod(std::abs(a - b), 180.0);
    return std::min(d, 180.0 - d);
}

} // namespace test_shapes
