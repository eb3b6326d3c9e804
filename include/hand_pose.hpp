#pragma once

#include "centroid_tracker.hpp"
#include "contour_geometry.hpp"
#include "frame.hpp"
#include "gesture_classifier.hpp"
#include "hand_pose_config.hpp"
#include "orientation.hpp"
#include "segmenter.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>

namespace handpose
{

    // Per-frame output of a pose detector
    struct PoseResult
    {
        std::optional<Point> center;     // smoothed hand center
        std::optional<Point> raw_center; // centroid of this frame
        Contour contour;                 // empty when no hand
        double contour_area{0.0};

        std::optional<Vec2> direction;   // unit length
        std::optional<Point> fingertip;
        DirectionSource direction_source{DirectionSource::NONE};
        std::optional<double> angle_deg; // [0, 360)
        Compass compass{Compass::NONE};  // orientation variant only

        Gesture gesture{Gesture::UNKNOWN};
        int finger_gaps{0};

        bool found() const { return center.has_value(); }
    };

    // Common interface of the detector variants
    class PoseDetector
    {
    public:
        virtual ~PoseDetector() = default;

        // Process one frame. The optional exclusion mask zeroes regions
        // (e.g. faces) out of the segmentation.
        virtual PoseResult process(const camera::Frame &frame,
                                   const camera::Mask *exclusion = nullptr) = 0;

        // Forget the learned background and all temporal history
        virtual void recalibrate() = 0;

        virtual DetectionStats stats() const = 0;
    };

    // Full pipeline: skin + motion segmentation, centroid smoothing,
    // fingertip / rotated-rect direction and gesture
    class HandPoseDetector : public PoseDetector
    {
    public:
        HandPoseDetector();
        explicit HandPoseDetector(const DetectorConfig &config);
        ~HandPoseDetector() override;

        // Apply a configuration; rejected (and unchanged) when invalid
        bool init(const DetectorConfig &config);

        PoseResult process(const camera::Frame &frame,
                           const camera::Mask *exclusion = nullptr) override;

        void recalibrate() override;

        DetectionStats stats() const override { return stats_; }
        void reset_stats() { stats_.reset(); }

        const DetectorConfig &get_config() const { return config_; }

        // Sample skin color from a region of interest
        bool calibrate_skin(const camera::Frame &frame, const camera::Rect &roi);

        // Refined mask of the last processed frame
        const camera::Mask &last_mask() const { return last_mask_; }

    private:
        DetectorConfig config_;
        DetectionStats stats_;
        SkinSegmenter segmenter_;
        CentroidTracker tracker_;
        camera::Mask last_mask_;

        // Disable copy
        HandPoseDetector(const HandPoseDetector &) = delete;
        HandPoseDetector &operator=(const HandPoseDetector &) = delete;
    };

    // Orientation-only variant: skin segmentation without background model,
    // rotated-rect direction smoothed over recent angles, compass label
    class OrientationDetector : public PoseDetector
    {
    public:
        OrientationDetector();
        explicit OrientationDetector(const DetectorConfig &config);
        ~OrientationDetector() override;

        bool init(const DetectorConfig &config);

        PoseResult process(const camera::Frame &frame,
                           const camera::Mask *exclusion = nullptr) override;

        void recalibrate() override;

        DetectionStats stats() const override { return stats_; }
        void reset_stats() { stats_.reset(); }

        const DetectorConfig &get_config() const { return config_; }

        bool calibrate_skin(const camera::Frame &frame, const camera::Rect &roi);

        const camera::Mask &last_mask() const { return last_mask_; }

    private:
        DetectorConfig config_;
        DetectionStats stats_;
        SkinSegmenter segmenter_;
        CentroidTracker tracker_;
        AngleSmoother smoother_;
        camera::Mask last_mask_;

        OrientationDetector(const OrientationDetector &) = delete;
        OrientationDetector &operator=(const OrientationDetector &) = delete;
    };

    // Serializes access to a detector shared between threads
    class LockedPoseDetector : public PoseDetector
    {
    public:
        explicit LockedPoseDetector(std::unique_ptr<PoseDetector> inner);

        PoseResult process(const camera::Frame &frame,
                           const camera::Mask *exclusion = nullptr) override;

        void recalibrate() override;

        // Copy of the statistics taken under the lock
        DetectionStats stats() const override;

    private:
        std::unique_ptr<PoseDetector> inner_;
        mutable std::mutex mutex_;
    };

    // Overlay drawing on RGB/BGR frames
    namespace utils
    {
        // Draw filled disc
        void draw_point(camera::Frame &frame, const Point &point, int radius,
                        uint8_t r, uint8_t g, uint8_t b);

        // Bresenham line
        void draw_line(camera::Frame &frame, const Point &from, const Point &to,
                       uint8_t r, uint8_t g, uint8_t b);

        // Closed polyline through the contour points
        void draw_contour(camera::Frame &frame, const Contour &contour,
                          uint8_t r, uint8_t g, uint8_t b);

        // Contour, center, fingertip and a direction arrow of the given length
        void draw_pose(camera::Frame &frame, const PoseResult &pose, int arrow_length = 60);
    }

} // namespace handpose
