#pragma once

#include "frame.hpp"
#include "hand_pose_config.hpp"
#include <cstdint>
#include <vector>

namespace handpose {

// Single-Gaussian-per-pixel adaptive background statistic.
// Every apply() both classifies the frame and folds it into the model.
class BackgroundModel {
public:
    BackgroundModel();
    explicit BackgroundModel(const BackgroundConfig& config);

    void set_config(const BackgroundConfig& config) { config_ = config; }
    const BackgroundConfig& config() const { return config_; }

    // Classify and learn. Writes 255 for foreground, 0 for background.
    // A frame of another size restarts the model.
    bool apply(const camera::Frame& frame, camera::Mask& foreground);

    // Forget everything learned so far
    void reset();

    uint64_t frames_seen() const { return frames_seen_; }

    // True once the motion mask may be trusted
    bool is_trained() const {
        return frames_seen_ >= static_cast<uint64_t>(config_.learning_window);
    }

private:
    BackgroundConfig config_;
    std::vector<float> mean_;      // 3 per pixel, in the frame's channel order
    std::vector<float> variance_;  // 1 per pixel
    uint32_t width_{0};
    uint32_t height_{0};
    uint64_t frames_seen_{0};
};

} // namespace handpose
