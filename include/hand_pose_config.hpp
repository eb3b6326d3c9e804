#pragma once

#include <cstdint>
#include <string>

namespace handpose {

// Named constants for better readability
namespace constants {
    constexpr double kPi = 3.14159265358979323846;
    constexpr double kDegenerateSide = 1e-6;   // law-of-cosines side length treated as zero
    constexpr int kMotionOpenKernel = 3;       // motion mask cleanup: open
    constexpr int kMotionCloseKernel = 5;      // motion mask cleanup: close
    constexpr float kBackgroundVarMin = 4.0f;
    constexpr float kBackgroundVarMax = 75.0f;
    constexpr int kCalibrationHueTolerance = 10;
    constexpr int kCalibrationSatValTolerance = 30;
} // namespace constants

// Inclusive HSV range, OpenCV scaling (H 0-179, S/V 0-255)
struct SkinRange {
    int hue_min{0};
    int hue_max{30};
    int sat_min{30};
    int sat_max{255};
    int val_min{60};
    int val_max{255};
};

// Adaptive background model parameters
struct BackgroundConfig {
    bool enabled{true};
    int learning_window{30};     // frames before the motion mask is trusted
    int history{200};            // running statistic window
    float var_threshold{25.0f};  // squared distance / variance for foreground
    float var_init{15.0f};       // variance assigned on first observation
    int motion_threshold{200};   // binarization level of the cleaned motion mask
};

// Configuration for hand pose estimation
struct DetectorConfig {
    SkinRange skin;
    BackgroundConfig background;

    // Mask refinement
    int morph_kernel_size{5};
    int erode_iterations{1};
    int dilate_iterations{3};
    int blur_kernel_size{5};
    int rethreshold_level{60};   // pixel > level => 255; 0 keeps any blurred coverage

    // Contour & centroid
    double min_contour_area{3000.0};
    int centroid_history{5};

    // Fingertip strategy
    double fingertip_min_area{3000.0};          // contour must be larger to try defects
    double fingertip_max_angle{constants::kPi / 2.5};
    double fingertip_top_radius{50.0};          // px from topmost contour point
    double min_defect_depth{3.0};               // px, shallower defects are tracing noise

    // Gesture
    bool enable_gesture{true};
    double gesture_max_angle{constants::kPi / 2.0};
    double thumbs_up_solidity{0.9};

    // Orientation-only variant
    int angle_history{5};

    bool verbose{false};        // Enable verbose logging

    // Presets for the two detector variants
    static DetectorConfig pointer();
    static DetectorConfig orientation();

    // Load from / save to "key value" text file
    [[nodiscard]] bool load_from_file(const std::string& path);
    bool save_to_file(const std::string& path) const;

    // Validation
    [[nodiscard]] bool validate() const noexcept;
};

// Detection statistics
struct DetectionStats {
    uint64_t frames_processed{0};
    uint64_t hands_detected{0};
    uint64_t fingertip_directions{0};
    uint64_t rotated_rect_directions{0};
    double avg_process_time_ms{0.0};
    uint64_t last_detection_timestamp{0};

    // Per-stage timing of the last frame
    double segmentation_ms{0.0};
    double refinement_ms{0.0};
    double contours_ms{0.0};
    double orientation_ms{0.0};
    double gesture_ms{0.0};

    void reset() noexcept {
        frames_processed = 0;
        hands_detected = 0;
        fingertip_directions = 0;
        rotated_rect_directions = 0;
        avg_process_time_ms = 0.0;
        last_detection_timestamp = 0;
        segmentation_ms = 0.0;
        refinement_ms = 0.0;
        contours_ms = 0.0;
        orientation_ms = 0.0;
        gesture_ms = 0.0;
    }
};

} // namespace handpose
