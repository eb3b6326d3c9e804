#include "segmenter.hpp"
#include "hand_pose_simd.hpp"
#include "mask_ops.hpp"
#include <algorithm>
#include <iostream>

namespace handpose {

SkinSegmenter::SkinSegmenter() : config_(), background_(config_.background) {}

SkinSegmenter::SkinSegmenter(const DetectorConfig& config)
    : config_(config), background_(config.background) {}

void SkinSegmenter::set_config(const DetectorConfig& config) {
    config_ = config;
    background_.set_config(config.background);
}

void SkinSegmenter::reset() {
    background_.reset();
}

void SkinSegmenter::convert_frame_to_hsv(const camera::Frame& frame) {
    const size_t pixel_count = static_cast<size_t>(frame.width) * frame.height;
    if (hsv_buffer_.size() != pixel_count * 3) {
        hsv_buffer_.resize(pixel_count * 3);
    }

    const simd::ChannelOrder order = (frame.format == camera::PixelFormat::BGR888)
                                         ? simd::ChannelOrder::BGR
                                         : simd::ChannelOrder::RGB;

    // Row by row so padded strides are skipped
    for (uint32_t y = 0; y < frame.height; y++) {
        simd::convert_to_hsv(&frame.data[static_cast<size_t>(y) * frame.stride],
                             &hsv_buffer_[static_cast<size_t>(y) * frame.width * 3],
                             frame.width, order);
    }
}

camera::Mask SkinSegmenter::segment(const camera::Frame& frame, const camera::Mask* exclusion) {
    if (!frame.is_valid()) {
        return camera::Mask();
    }

    const uint32_t pixel_count = frame.width * frame.height;

    // Step 1-2: HSV and inclusive skin range
    convert_frame_to_hsv(frame);
    if (!skin_mask_.same_size(frame.width, frame.height) || skin_mask_.data.size() != pixel_count) {
        skin_mask_ = camera::Mask(frame.width, frame.height);
    }
    simd::create_range_mask_simd(hsv_buffer_.data(), skin_mask_.data.data(), pixel_count,
                                 config_.skin.hue_min, config_.skin.hue_max,
                                 config_.skin.sat_min, config_.skin.sat_max,
                                 config_.skin.val_min, config_.skin.val_max);

    camera::Mask mask = skin_mask_;

    // Step 3: motion gating, only once the model has seen enough frames
    if (config_.background.enabled) {
        // apply() restarts the model on a size change, so trust is judged after it
        if (background_.apply(frame, motion_mask_) &&
            background_.frames_seen() > static_cast<uint64_t>(config_.background.learning_window)) {
            camera::Mask motion = mask_ops::open(motion_mask_, constants::kMotionOpenKernel);
            motion = mask_ops::close(motion, constants::kMotionCloseKernel);
            mask_ops::threshold(motion, config_.background.motion_threshold);
            mask_ops::bitwise_and(mask, motion);
        }
    }

    // Step 4: exclusion regions (faces)
    if (exclusion != nullptr) {
        if (!mask_ops::bitwise_and(mask, *exclusion) && config_.verbose) {
            std::cerr << "[Segmenter] Ignoring exclusion mask of size " << exclusion->width
                      << "x" << exclusion->height << " for frame " << frame.width << "x"
                      << frame.height << "\n";
        }
    }

    return mask;
}

bool SkinSegmenter::calibrate_skin(const camera::Frame& frame, const camera::Rect& roi) {
    if (!frame.is_valid()) {
        return false;
    }

    const int x0 = std::max(0, roi.x);
    const int y0 = std::max(0, roi.y);
    const int x1 = std::min(static_cast<int>(frame.width), roi.x + roi.width);
    const int y1 = std::min(static_cast<int>(frame.height), roi.y + roi.height);
    if (x0 >= x1 || y0 >= y1) {
        return false;
    }

    const simd::ChannelOrder order = (frame.format == camera::PixelFormat::BGR888)
                                         ? simd::ChannelOrder::BGR
                                         : simd::ChannelOrder::RGB;

    int h_min = 179, h_max = 0;
    int s_min = 255, s_max = 0;
    int v_min = 255, v_max = 0;

    std::vector<uint8_t> hsv_row(static_cast<size_t>(x1 - x0) * 3);
    for (int y = y0; y < y1; y++) {
        simd::convert_to_hsv(&frame.data[static_cast<size_t>(y) * frame.stride + x0 * 3],
                             hsv_row.data(), static_cast<uint32_t>(x1 - x0), order);
        for (int i = 0; i < x1 - x0; i++) {
            const int h = hsv_row[i * 3];
            const int s = hsv_row[i * 3 + 1];
            const int v = hsv_row[i * 3 + 2];
            h_min = std::min(h_min, h);
            h_max = std::max(h_max, h);
            s_min = std::min(s_min, s);
            s_max = std::max(s_max, s);
            v_min = std::min(v_min, v);
            v_max = std::max(v_max, v);
        }
    }

    // Add some tolerance
    config_.skin.hue_min = std::max(0, h_min - constants::kCalibrationHueTolerance);
    config_.skin.hue_max = std::min(179, h_max + constants::kCalibrationHueTolerance);
    config_.skin.sat_min = std::max(0, s_min - constants::kCalibrationSatValTolerance);
    config_.skin.sat_max = std::min(255, s_max + constants::kCalibrationSatValTolerance);
    config_.skin.val_min = std::max(0, v_min - constants::kCalibrationSatValTolerance);
    config_.skin.val_max = std::min(255, v_max + constants::kCalibrationSatValTolerance);

    if (config_.verbose) {
        std::cerr << "[Segmenter] Calibrated skin: H[" << config_.skin.hue_min
                  << "-" << config_.skin.hue_max << "] S[" << config_.skin.sat_min
                  << "-" << config_.skin.sat_max << "] V[" << config_.skin.val_min
                  << "-" << config_.skin.val_max << "]\n";
    }

    return true;
}

} // namespace handpose
