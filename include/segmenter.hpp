#pragma once

#include "background_model.hpp"
#include "frame.hpp"
#include "hand_pose_config.hpp"
#include <vector>

namespace handpose {

// HSV skin threshold, gated by the adaptive background model and an
// optional exclusion mask.
class SkinSegmenter {
public:
    SkinSegmenter();
    explicit SkinSegmenter(const DetectorConfig& config);

    void set_config(const DetectorConfig& config);
    const SkinRange& skin_range() const { return config_.skin; }

    // Returns an empty mask for an invalid frame
    camera::Mask segment(const camera::Frame& frame, const camera::Mask* exclusion = nullptr);

    // Skin mask of the last segment() call, before motion and exclusion gating
    const camera::Mask& last_skin_mask() const { return skin_mask_; }

    // Replace the skin bounds with the HSV extent of a region, widened
    // by the calibration tolerances
    bool calibrate_skin(const camera::Frame& frame, const camera::Rect& roi);

    // Drop the learned background
    void reset();

    const BackgroundModel& background() const { return background_; }

private:
    DetectorConfig config_;
    BackgroundModel background_;

    // Reused across frames
    std::vector<uint8_t> hsv_buffer_;
    camera::Mask skin_mask_;
    camera::Mask motion_mask_;

    void convert_frame_to_hsv(const camera::Frame& frame);
};

} // namespace handpose
