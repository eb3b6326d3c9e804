#include "contour_geometry.hpp"
#include "hand_pose_config.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <queue>

namespace handpose
{

    double Point::distance(const Point &other) const
    {
        const double dx = x - other.x;
        const double dy = y - other.y;
        return std::sqrt(dx * dx + dy * dy);
    }

    double Vec2::length() const
    {
        return std::sqrt(x * x + y * y);
    }

    namespace geometry
    {

        namespace
        {
            // Neighbour offsets, counterclockwise on screen starting east
            // 0=E 1=NE 2=N 3=NW 4=W 5=SW 6=S 7=SE
            const int kDx[8] = {1, 1, 0, -1, -1, -1, 0, 1};
            const int kDy[8] = {0, -1, -1, -1, 0, 1, 1, 1};

            int direction_of(const Point &from, const Point &to)
            {
                const int dx = to.x - from.x;
                const int dy = to.y - from.y;
                for (int d = 0; d < 8; d++)
                {
                    if (kDx[d] == dx && kDy[d] == dy)
                        return d;
                }
                return 0;
            }

            bool is_foreground(const camera::Mask &mask, int x, int y)
            {
                if (x < 0 || y < 0 || x >= static_cast<int>(mask.width) || y >= static_cast<int>(mask.height))
                    return false;
                return mask.at(static_cast<uint32_t>(x), static_cast<uint32_t>(y)) != 0;
            }

            // Border following from the first raster pixel of a component
            Contour trace_outer_border(const camera::Mask &mask, const Point &start)
            {
                Contour contour;

                // Clockwise search from the west neighbour, which is background
                int first_dir = -1;
                for (int k = 0; k < 8; k++)
                {
                    const int d = (4 - k + 8) % 8;
                    if (is_foreground(mask, start.x + kDx[d], start.y + kDy[d]))
                    {
                        first_dir = d;
                        break;
                    }
                }

                if (first_dir < 0)
                {
                    contour.push_back(start); // isolated pixel
                    return contour;
                }

                const Point first(start.x + kDx[first_dir], start.y + kDy[first_dir]);
                Point prev = first;
                Point current = start;

                while (true)
                {
                    // Counterclockwise search starting just after the previous pixel
                    const int back = direction_of(current, prev);
                    Point next = current;
                    for (int k = 1; k <= 8; k++)
                    {
                        const int d = (back + k) % 8;
                        if (is_foreground(mask, current.x + kDx[d], current.y + kDy[d]))
                        {
                            next = Point(current.x + kDx[d], current.y + kDy[d]);
                            break;
                        }
                    }

                    contour.push_back(current);

                    if (next == start && current == first)
                        break;

                    prev = current;
                    current = next;
                }

                return contour;
            }

            long long cross(const Point &o, const Point &a, const Point &b)
            {
                const long long dx1 = a.x - o.x;
                const long long dy1 = a.y - o.y;
                const long long dx2 = b.x - o.x;
                const long long dy2 = b.y - o.y;
                return dx1 * dy2 - dy1 * dx2;
            }

            double signed_area(const std::vector<Point> &poly)
            {
                double area = 0.0;
                for (size_t i = 0; i < poly.size(); i++)
                {
                    const size_t j = (i + 1) % poly.size();
                    area += static_cast<double>(poly[i].x) * poly[j].y;
                    area -= static_cast<double>(poly[j].x) * poly[i].y;
                }
                return area / 2.0;
            }
        } // namespace

        std::vector<Contour> find_contours(const camera::Mask &mask)
        {
            std::vector<Contour> contours;
            if (mask.empty())
                return contours;

            const uint32_t width = mask.width;
            const uint32_t height = mask.height;
            std::vector<bool> visited(static_cast<size_t>(width) * height, false);

            // Flood fill labels each component; its first raster pixel starts the trace
            for (uint32_t y = 0; y < height; y++)
            {
                for (uint32_t x = 0; x < width; x++)
                {
                    const size_t idx = static_cast<size_t>(y) * width + x;
                    if (mask.data[idx] == 0 || visited[idx])
                        continue;

                    std::queue<Point> queue;
                    queue.push(Point(static_cast<int>(x), static_cast<int>(y)));
                    visited[idx] = true;

                    while (!queue.empty())
                    {
                        const Point p = queue.front();
                        queue.pop();

                        // Check 8-connected neighbors
                        for (int dy = -1; dy <= 1; dy++)
                        {
                            for (int dx = -1; dx <= 1; dx++)
                            {
                                if (dx == 0 && dy == 0)
                                    continue;

                                const int nx = p.x + dx;
                                const int ny = p.y + dy;
                                if (nx >= 0 && nx < static_cast<int>(width) && ny >= 0 && ny < static_cast<int>(height))
                                {
                                    const size_t nidx = static_cast<size_t>(ny) * width + nx;
                                    if (mask.data[nidx] != 0 && !visited[nidx])
                                    {
                                        visited[nidx] = true;
                                        queue.push(Point(nx, ny));
                                    }
                                }
                            }
                        }
                    }

                    contours.push_back(trace_outer_border(mask, Point(static_cast<int>(x), static_cast<int>(y))));
                }
            }

            return contours;
        }

        double contour_area(const Contour &contour)
        {
            return std::abs(signed_area(contour));
        }

        Moments contour_moments(const Contour &contour)
        {
            Moments m;
            const size_t n = contour.size();
            if (n == 0)
                return m;

            double a00 = 0.0, a10 = 0.0, a01 = 0.0;
            for (size_t i = 0; i < n; i++)
            {
                const Point &p0 = contour[(i + n - 1) % n];
                const Point &p1 = contour[i];
                const double dxy = static_cast<double>(p0.x) * p1.y - static_cast<double>(p1.x) * p0.y;
                a00 += dxy;
                a10 += dxy * (p0.x + p1.x);
                a01 += dxy * (p0.y + p1.y);
            }

            m.m00 = a00 * 0.5;
            m.m10 = a10 / 6.0;
            m.m01 = a01 / 6.0;

            // Orientation independent
            if (m.m00 < 0.0)
            {
                m.m00 = -m.m00;
                m.m10 = -m.m10;
                m.m01 = -m.m01;
            }
            return m;
        }

        std::optional<Point> centroid(const Contour &contour)
        {
            const Moments m = contour_moments(contour);
            if (m.m00 == 0.0)
                return std::nullopt;
            return Point(static_cast<int>(m.m10 / m.m00), static_cast<int>(m.m01 / m.m00));
        }

        std::optional<ExtremePoints> extreme_points(const Contour &contour)
        {
            if (contour.empty())
                return std::nullopt;

            ExtremePoints e;
            e.top = e.bottom = e.left = e.right = contour.front();
            for (const auto &p : contour)
            {
                if (p.y < e.top.y)
                    e.top = p;
                if (p.y > e.bottom.y)
                    e.bottom = p;
                if (p.x < e.left.x)
                    e.left = p;
                if (p.x > e.right.x)
                    e.right = p;
            }
            return e;
        }

        std::vector<int> convex_hull_indices(const std::vector<Point> &points)
        {
            std::vector<int> order(points.size());
            std::iota(order.begin(), order.end(), 0);

            std::sort(order.begin(), order.end(), [&points](int a, int b)
                      {
                          if (points[a].x != points[b].x)
                              return points[a].x < points[b].x;
                          if (points[a].y != points[b].y)
                              return points[a].y < points[b].y;
                          return a < b;
                      });
            order.erase(std::unique(order.begin(), order.end(), [&points](int a, int b)
                                    { return points[a] == points[b]; }),
                        order.end());
            if (order.size() < 3)
                return order;

            std::vector<int> lower;
            lower.reserve(order.size());
            for (int idx : order)
            {
                while (lower.size() >= 2 &&
                       cross(points[lower[lower.size() - 2]], points[lower.back()], points[idx]) <= 0)
                {
                    lower.pop_back();
                }
                lower.push_back(idx);
            }

            std::vector<int> upper;
            upper.reserve(order.size());
            for (auto it = order.rbegin(); it != order.rend(); ++it)
            {
                while (upper.size() >= 2 &&
                       cross(points[upper[upper.size() - 2]], points[upper.back()], points[*it]) <= 0)
                {
                    upper.pop_back();
                }
                upper.push_back(*it);
            }

            // Concatenate lower and upper (omit last of each because it repeats start point)
            lower.pop_back();
            upper.pop_back();
            lower.insert(lower.end(), upper.begin(), upper.end());
            return lower;
        }

        double hull_area(const Contour &contour, const std::vector<int> &hull)
        {
            std::vector<Point> poly;
            poly.reserve(hull.size());
            for (int idx : hull)
            {
                if (idx < 0 || idx >= static_cast<int>(contour.size()))
                    return 0.0;
                poly.push_back(contour[idx]);
            }
            return std::abs(signed_area(poly));
        }

        std::optional<std::vector<ConvexityDefect>> convexity_defects(const Contour &contour,
                                                                      const std::vector<int> &hull,
                                                                      double min_depth)
        {
            const int n = static_cast<int>(contour.size());
            for (int idx : hull)
            {
                if (idx < 0 || idx >= n)
                    return std::nullopt;
            }

            std::vector<ConvexityDefect> defects;
            if (hull.size() < 3 || n < 4)
                return defects;

            // Hull vertices in contour order
            std::vector<int> sorted = hull;
            std::sort(sorted.begin(), sorted.end());

            for (size_t k = 0; k < sorted.size(); k++)
            {
                const int s = sorted[k];
                const int e = sorted[(k + 1) % sorted.size()];
                const Point &ps = contour[s];
                const Point &pe = contour[e];

                const double ex = pe.x - ps.x;
                const double ey = pe.y - ps.y;
                const double edge_len = std::sqrt(ex * ex + ey * ey);

                int far = -1;
                double best = -1.0;
                for (int j = (s + 1) % n; j != e; j = (j + 1) % n)
                {
                    const Point &p = contour[j];
                    double dist;
                    if (edge_len > 0.0)
                        dist = std::abs(ex * (p.y - ps.y) - ey * (p.x - ps.x)) / edge_len;
                    else
                        dist = p.distance(ps);

                    if (dist > best)
                    {
                        best = dist;
                        far = j;
                    }
                }

                if (far >= 0 && best > min_depth)
                {
                    defects.push_back(ConvexityDefect{s, e, far, best});
                }
            }

            return defects;
        }

        double far_angle(const Point &start, const Point &end, const Point &far)
        {
            const double a = start.distance(end);
            const double b = far.distance(start);
            const double c = end.distance(far);

            if (b < constants::kDegenerateSide || c < constants::kDegenerateSide)
                return constants::kPi;

            double cos_angle = (b * b + c * c - a * a) / (2.0 * b * c);
            cos_angle = std::max(-1.0, std::min(1.0, cos_angle));
            return std::acos(cos_angle);
        }

        std::optional<RotatedRect> min_area_rect(const Contour &contour)
        {
            const std::vector<int> hull = convex_hull_indices(contour);
            if (hull.size() < 2)
                return std::nullopt;

            std::optional<RotatedRect> best;
            double best_area = 0.0;

            // Rotating calipers: one side of the optimum lies on a hull edge
            for (size_t i = 0; i < hull.size(); i++)
            {
                const Point &p0 = contour[hull[i]];
                const Point &p1 = contour[hull[(i + 1) % hull.size()]];
                const double len = p0.distance(p1);
                if (len <= 0.0)
                    continue;

                const double ux = (p1.x - p0.x) / len;
                const double uy = (p1.y - p0.y) / len;

                double u_min = 0.0, u_max = 0.0, v_min = 0.0, v_max = 0.0;
                bool first = true;
                for (int idx : hull)
                {
                    const double px = contour[idx].x - p0.x;
                    const double py = contour[idx].y - p0.y;
                    const double u = px * ux + py * uy;
                    const double v = -px * uy + py * ux;
                    if (first)
                    {
                        u_min = u_max = u;
                        v_min = v_max = v;
                        first = false;
                    }
                    else
                    {
                        u_min = std::min(u_min, u);
                        u_max = std::max(u_max, u);
                        v_min = std::min(v_min, v);
                        v_max = std::max(v_max, v);
                    }
                }

                const double w = u_max - u_min;
                const double h = v_max - v_min;
                const double area = w * h;
                if (!best || area < best_area)
                {
                    const double uc = (u_min + u_max) * 0.5;
                    const double vc = (v_min + v_max) * 0.5;

                    RotatedRect rect;
                    rect.center_x = p0.x + uc * ux - vc * uy;
                    rect.center_y = p0.y + uc * uy + vc * ux;
                    rect.width = w;
                    rect.height = h;
                    rect.angle_deg = std::atan2(uy, ux) * 180.0 / constants::kPi;
                    best = rect;
                    best_area = area;
                }
            }

            if (!best)
                return std::nullopt;

            // Normalize into [0, 90); each quarter turn swaps the sides
            RotatedRect &r = *best;
            while (r.angle_deg < 0.0)
            {
                r.angle_deg += 90.0;
                std::swap(r.width, r.height);
            }
            while (r.angle_deg >= 90.0)
            {
                r.angle_deg -= 90.0;
                std::swap(r.width, r.height);
            }
            return best;
        }

    } // namespace geometry

} // namespace handpose
