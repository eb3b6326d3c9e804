#pragma once

#include "frame.hpp"
#include <optional>
#include <vector>

namespace handpose
{

    // Represents a 2D pixel coordinate
    struct Point
    {
        int x;
        int y;

        Point() : x(0), y(0) {}
        Point(int x_, int y_) : x(x_), y(y_) {}

        // Distance to another point
        double distance(const Point &other) const;

        bool operator==(const Point &other) const { return x == other.x && y == other.y; }
        bool operator!=(const Point &other) const { return !(*this == other); }
    };

    // Arithmetic for averaging
    inline Point operator+(const Point &a, const Point &b)
    {
        return Point(a.x + b.x, a.y + b.y);
    }
    inline Point operator/(const Point &a, float val)
    {
        return Point(static_cast<int>(a.x / val), static_cast<int>(a.y / val));
    }

    // Real-valued 2D vector (directions)
    struct Vec2
    {
        double x;
        double y;

        Vec2() : x(0.0), y(0.0) {}
        Vec2(double x_, double y_) : x(x_), y(y_) {}

        double length() const;
    };

    // Boundary pixels in trace order
    using Contour = std::vector<Point>;

    // Spatial moments of a closed polygon
    struct Moments
    {
        double m00{0.0};
        double m10{0.0};
        double m01{0.0};
    };

    // First occurrence (in contour order) of each extreme
    struct ExtremePoints
    {
        Point top;
        Point bottom;
        Point left;
        Point right;
    };

    // Concavity between two consecutive hull vertices
    struct ConvexityDefect
    {
        int start_index;  // hull vertex
        int end_index;    // next hull vertex
        int far_index;    // deepest contour point between them
        double depth;     // distance from far point to the hull edge (px)
    };

    // Minimum-area bounding rectangle
    struct RotatedRect
    {
        double center_x{0.0};
        double center_y{0.0};
        double width{0.0};     // side along angle_deg
        double height{0.0};
        double angle_deg{0.0}; // [0, 90)
    };

    namespace geometry
    {
        // Outer borders of all 8-connected foreground components, one per
        // component, ordered by the raster position of each component's first pixel
        std::vector<Contour> find_contours(const camera::Mask &mask);

        // Absolute shoelace area of the closed polygon
        double contour_area(const Contour &contour);

        // Polygon moments, sign-normalized so that m00 >= 0
        Moments contour_moments(const Contour &contour);

        // m10/m00, m01/m00 truncated; nullopt when m00 == 0
        std::optional<Point> centroid(const Contour &contour);

        std::optional<ExtremePoints> extreme_points(const Contour &contour);

        // Indices into points of the convex hull (monotonic chain).
        // Collinear and duplicate points are dropped.
        std::vector<int> convex_hull_indices(const std::vector<Point> &points);

        // Area of the polygon formed by the hull vertices
        double hull_area(const Contour &contour, const std::vector<int> &hull);

        // nullopt when a hull index is out of range. Empty when the hull has
        // fewer than 3 vertices or the contour fewer than 4 points.
        std::optional<std::vector<ConvexityDefect>> convexity_defects(const Contour &contour,
                                                                      const std::vector<int> &hull,
                                                                      double min_depth);

        // Angle at far in triangle (start, end, far), radians. A degenerate
        // side yields pi.
        double far_angle(const Point &start, const Point &end, const Point &far);

        // nullopt with fewer than two distinct points
        std::optional<RotatedRect> min_area_rect(const Contour &contour);
    }

} // namespace handpose
