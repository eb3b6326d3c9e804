#include "hand_pose.hpp"
#include "hand_pose_simd.hpp"
#include "mask_ops.hpp"
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <iostream>

namespace handpose
{

    namespace
    {
        using Clock = std::chrono::steady_clock;

        double elapsed_ms(Clock::time_point since)
        {
            return std::chrono::duration<double, std::milli>(Clock::now() - since).count();
        }

        void finish_frame(DetectionStats &stats, const PoseResult &result,
                          const camera::Frame &frame, Clock::time_point start)
        {
            if (result.found())
            {
                stats.hands_detected++;
                stats.last_detection_timestamp = frame.timestamp_ns;
            }
            if (result.direction_source == DirectionSource::FINGERTIP)
                stats.fingertip_directions++;
            else if (result.direction_source == DirectionSource::ROTATED_RECT)
                stats.rotated_rect_directions++;

            const double process_time = elapsed_ms(start);

            // Running average
            stats.avg_process_time_ms =
                (stats.avg_process_time_ms * (stats.frames_processed - 1) + process_time) /
                stats.frames_processed;
        }

        void log_config(const char *tag, const DetectorConfig &config)
        {
            std::cerr << tag << " Initialized\n";
            std::cerr << "  Skin HSV range: H[" << config.skin.hue_min << "-" << config.skin.hue_max
                      << "] S[" << config.skin.sat_min << "-" << config.skin.sat_max
                      << "] V[" << config.skin.val_min << "-" << config.skin.val_max << "]\n";
            std::cerr << "  Background model: " << (config.background.enabled ? "on" : "off")
                      << " (learning " << config.background.learning_window << " frames)\n";
            std::cerr << "  SIMD support: " << (simd::is_neon_available() ? "NEON" : "Scalar") << "\n";
        }
    } // namespace

    // HandPoseDetector implementation
    HandPoseDetector::HandPoseDetector()
        : HandPoseDetector(DetectorConfig::pointer())
    {
    }

    HandPoseDetector::HandPoseDetector(const DetectorConfig &config)
        : config_(DetectorConfig::pointer()),
          segmenter_(config_),
          tracker_(config_.min_contour_area, static_cast<size_t>(config_.centroid_history))
    {
        if (!init(config))
        {
            std::cerr << "[HandPose] Falling back to default configuration\n";
        }
    }

    HandPoseDetector::~HandPoseDetector() {}

    bool HandPoseDetector::init(const DetectorConfig &config)
    {
        // Validate configuration
        if (!config.validate())
        {
            std::cerr << "[HandPose] ERROR: Invalid configuration\n";
            return false;
        }

        config_ = config;
        segmenter_.set_config(config_);
        tracker_.set_min_area(config_.min_contour_area);
        tracker_.set_history(static_cast<size_t>(config_.centroid_history));

        if (config_.verbose)
        {
            log_config("[HandPose]", config_);
        }
        return true;
    }

    void HandPoseDetector::recalibrate()
    {
        segmenter_.reset();
        tracker_.reset();

        if (config_.verbose)
        {
            std::cerr << "[HandPose] Background model and history reset\n";
        }
    }

    bool HandPoseDetector::calibrate_skin(const camera::Frame &frame, const camera::Rect &roi)
    {
        if (!segmenter_.calibrate_skin(frame, roi))
            return false;
        config_.skin = segmenter_.skin_range();
        return true;
    }

    PoseResult HandPoseDetector::process(const camera::Frame &frame, const camera::Mask *exclusion)
    {
        const auto start_time = Clock::now();
        PoseResult result;

        if (!frame.is_valid())
        {
            if (config_.verbose)
            {
                std::cerr << "[HandPose] Skipping invalid frame\n";
            }
            return result;
        }

        stats_.frames_processed++;

        // Step 1: skin and motion segmentation
        auto stage_start = Clock::now();
        const camera::Mask mask = segmenter_.segment(frame, exclusion);
        stats_.segmentation_ms = elapsed_ms(stage_start);

        // Step 2: clean the mask
        stage_start = Clock::now();
        last_mask_ = refine_mask(mask, config_);
        stats_.refinement_ms = elapsed_ms(stage_start);

        // Step 3: largest contour and smoothed centroid
        stage_start = Clock::now();
        std::optional<Extraction> extraction = tracker_.extract(last_mask_);
        stats_.contours_ms = elapsed_ms(stage_start);

        stats_.orientation_ms = 0.0;
        stats_.gesture_ms = 0.0;

        if (!extraction)
        {
            finish_frame(stats_, result, frame, start_time);
            return result;
        }

        result.center = extraction->center;
        result.raw_center = extraction->raw_center;
        result.contour_area = extraction->area;
        result.contour = std::move(extraction->contour);

        // Step 4: direction, fingertip first
        stage_start = Clock::now();
        const auto estimate = orientation::estimate_direction(result.contour, result.contour_area,
                                                              *result.center, config_);
        if (estimate)
        {
            result.direction = estimate->direction;
            result.direction_source = estimate->source;
            result.fingertip = estimate->fingertip;
            result.angle_deg = estimate->angle_deg;
        }
        stats_.orientation_ms = elapsed_ms(stage_start);

        // Step 5: gesture
        if (config_.enable_gesture)
        {
            stage_start = Clock::now();
            const GestureResult g = classify_gesture(result.contour, config_);
            result.gesture = g.gesture;
            result.finger_gaps = g.finger_gaps;
            stats_.gesture_ms = elapsed_ms(stage_start);
        }

        finish_frame(stats_, result, frame, start_time);

        if (config_.verbose)
        {
            std::cerr << "[HandPose] Area:" << result.contour_area
                      << " Center:(" << result.center->x << "," << result.center->y << ")"
                      << " Source:" << (result.direction_source == DirectionSource::FINGERTIP ? "fingertip"
                                        : result.direction_source == DirectionSource::ROTATED_RECT ? "rect"
                                                                                                   : "none")
                      << " Gaps:" << result.finger_gaps
                      << " Gesture:" << gesture_to_string(result.gesture)
                      << " (Seg:" << stats_.segmentation_ms
                      << " Ref:" << stats_.refinement_ms
                      << " Cont:" << stats_.contours_ms
                      << " Ori:" << stats_.orientation_ms
                      << " Gest:" << stats_.gesture_ms << " ms)\n";
        }

        return result;
    }

    // OrientationDetector implementation
    OrientationDetector::OrientationDetector()
        : OrientationDetector(DetectorConfig::orientation())
    {
    }

    OrientationDetector::OrientationDetector(const DetectorConfig &config)
        : config_(DetectorConfig::orientation()),
          segmenter_(config_),
          tracker_(config_.min_contour_area, 1),
          smoother_(static_cast<size_t>(config_.angle_history))
    {
        if (!init(config))
        {
            std::cerr << "[Orientation] Falling back to default configuration\n";
        }
    }

    OrientationDetector::~OrientationDetector() {}

    bool OrientationDetector::init(const DetectorConfig &config)
    {
        if (!config.validate())
        {
            std::cerr << "[Orientation] ERROR: Invalid configuration\n";
            return false;
        }

        config_ = config;
        // Skin only, raw centroid
        config_.background.enabled = false;
        config_.centroid_history = 1;

        segmenter_.set_config(config_);
        tracker_.set_min_area(config_.min_contour_area);
        tracker_.set_history(1);
        smoother_.set_history(static_cast<size_t>(config_.angle_history));

        if (config_.verbose)
        {
            log_config("[Orientation]", config_);
        }
        return true;
    }

    void OrientationDetector::recalibrate()
    {
        segmenter_.reset();
        tracker_.reset();
        smoother_.reset();
    }

    bool OrientationDetector::calibrate_skin(const camera::Frame &frame, const camera::Rect &roi)
    {
        if (!segmenter_.calibrate_skin(frame, roi))
            return false;
        config_.skin = segmenter_.skin_range();
        return true;
    }

    PoseResult OrientationDetector::process(const camera::Frame &frame, const camera::Mask *exclusion)
    {
        const auto start_time = Clock::now();
        PoseResult result;

        if (!frame.is_valid())
        {
            return result;
        }

        stats_.frames_processed++;

        auto stage_start = Clock::now();
        const camera::Mask mask = segmenter_.segment(frame, exclusion);
        stats_.segmentation_ms = elapsed_ms(stage_start);

        stage_start = Clock::now();
        last_mask_ = refine_mask(mask, config_);
        stats_.refinement_ms = elapsed_ms(stage_start);

        stage_start = Clock::now();
        std::optional<Extraction> extraction = tracker_.extract(last_mask_);
        stats_.contours_ms = elapsed_ms(stage_start);

        stats_.orientation_ms = 0.0;
        stats_.gesture_ms = 0.0;

        if (!extraction)
        {
            finish_frame(stats_, result, frame, start_time);
            return result;
        }

        result.center = extraction->center;
        result.raw_center = extraction->raw_center;
        result.contour_area = extraction->area;
        result.contour = std::move(extraction->contour);

        stage_start = Clock::now();
        const auto estimate = orientation::estimate_from_rotated_rect(result.contour);
        if (estimate)
        {
            const double smoothed = smoother_.push(estimate->angle_deg);
            const double rad = smoothed * constants::kPi / 180.0;
            result.direction = Vec2(std::cos(rad), std::sin(rad));
            result.direction_source = DirectionSource::ROTATED_RECT;
            result.angle_deg = orientation::normalize_degrees(smoothed);
            result.compass = orientation::compass_from_angle(smoothed);
        }
        stats_.orientation_ms = elapsed_ms(stage_start);

        if (config_.enable_gesture)
        {
            stage_start = Clock::now();
            const GestureResult g = classify_gesture(result.contour, config_);
            result.gesture = g.gesture;
            result.finger_gaps = g.finger_gaps;
            stats_.gesture_ms = elapsed_ms(stage_start);
        }

        finish_frame(stats_, result, frame, start_time);

        if (config_.verbose)
        {
            std::cerr << "[Orientation] Area:" << result.contour_area;
            if (result.angle_deg)
            {
                std::cerr << " Angle:" << *result.angle_deg
                          << " " << orientation::compass_to_string(result.compass);
            }
            std::cerr << "\n";
        }

        return result;
    }

    // LockedPoseDetector implementation
    LockedPoseDetector::LockedPoseDetector(std::unique_ptr<PoseDetector> inner)
        : inner_(std::move(inner))
    {
    }

    PoseResult LockedPoseDetector::process(const camera::Frame &frame, const camera::Mask *exclusion)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!inner_)
            return PoseResult();
        return inner_->process(frame, exclusion);
    }

    void LockedPoseDetector::recalibrate()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (inner_)
            inner_->recalibrate();
    }

    DetectionStats LockedPoseDetector::stats() const
    {
        std::unique_lock<std::mutex> lock(mutex_);
        return inner_ ? inner_->stats() : DetectionStats();
    }

    // Utility functions
    namespace utils
    {

        void draw_point(camera::Frame &frame, const Point &point, int radius,
                        uint8_t r, uint8_t g, uint8_t b)
        {
            for (int dy = -radius; dy <= radius; dy++)
            {
                for (int dx = -radius; dx <= radius; dx++)
                {
                    if (dx * dx + dy * dy <= radius * radius)
                    {
                        const int x = point.x + dx;
                        const int y = point.y + dy;
                        if (x >= 0 && y >= 0)
                            frame.set_rgb(static_cast<uint32_t>(x), static_cast<uint32_t>(y), r, g, b);
                    }
                }
            }
        }

        void draw_line(camera::Frame &frame, const Point &from, const Point &to,
                       uint8_t r, uint8_t g, uint8_t b)
        {
            int x0 = from.x;
            int y0 = from.y;
            const int dx = std::abs(to.x - x0);
            const int dy = -std::abs(to.y - y0);
            const int sx = x0 < to.x ? 1 : -1;
            const int sy = y0 < to.y ? 1 : -1;
            int err = dx + dy;

            while (true)
            {
                if (x0 >= 0 && y0 >= 0)
                    frame.set_rgb(static_cast<uint32_t>(x0), static_cast<uint32_t>(y0), r, g, b);
                if (x0 == to.x && y0 == to.y)
                    break;
                const int e2 = 2 * err;
                if (e2 >= dy)
                {
                    err += dy;
                    x0 += sx;
                }
                if (e2 <= dx)
                {
                    err += dx;
                    y0 += sy;
                }
            }
        }

        void draw_contour(camera::Frame &frame, const Contour &contour,
                          uint8_t r, uint8_t g, uint8_t b)
        {
            if (contour.empty())
                return;
            for (size_t i = 0; i < contour.size(); i++)
            {
                draw_line(frame, contour[i], contour[(i + 1) % contour.size()], r, g, b);
            }
        }

        void draw_pose(camera::Frame &frame, const PoseResult &pose, int arrow_length)
        {
            if (!pose.found())
                return;

            draw_contour(frame, pose.contour, 0, 255, 0);

            if (pose.direction)
            {
                const Point tip(pose.center->x + static_cast<int>(std::lround(pose.direction->x * arrow_length)),
                                pose.center->y + static_cast<int>(std::lround(pose.direction->y * arrow_length)));
                draw_line(frame, *pose.center, tip, 255, 0, 255);
            }
            if (pose.fingertip)
            {
                draw_point(frame, *pose.fingertip, 4, 255, 255, 0);
            }
            draw_point(frame, *pose.center, 5, 255, 0, 0);
        }

    } // namespace utils

} // namespace handpose
