#include "background_model.hpp"
#include <algorithm>

namespace handpose {

BackgroundModel::BackgroundModel() : config_() {}

BackgroundModel::BackgroundModel(const BackgroundConfig& config) : config_(config) {}

void BackgroundModel::reset() {
    mean_.clear();
    variance_.clear();
    width_ = 0;
    height_ = 0;
    frames_seen_ = 0;
}

bool BackgroundModel::apply(const camera::Frame& frame, camera::Mask& foreground) {
    if (!frame.is_valid()) {
        return false;
    }

    if (frame.width != width_ || frame.height != height_) {
        reset();
    }

    const size_t pixel_count = static_cast<size_t>(frame.width) * frame.height;
    if (!foreground.same_size(frame.width, frame.height) || foreground.data.size() != pixel_count) {
        foreground = camera::Mask(frame.width, frame.height);
    }

    // First observation seeds the statistic
    if (frames_seen_ == 0) {
        width_ = frame.width;
        height_ = frame.height;
        mean_.resize(pixel_count * 3);
        variance_.assign(pixel_count, config_.var_init);
        for (uint32_t y = 0; y < frame.height; y++) {
            const uint8_t* row = &frame.data[static_cast<size_t>(y) * frame.stride];
            for (uint32_t x = 0; x < frame.width; x++) {
                const size_t p = static_cast<size_t>(y) * frame.width + x;
                mean_[p * 3] = row[x * 3];
                mean_[p * 3 + 1] = row[x * 3 + 1];
                mean_[p * 3 + 2] = row[x * 3 + 2];
            }
        }
        std::fill(foreground.data.begin(), foreground.data.end(), 0);
        frames_seen_ = 1;
        return true;
    }

    const uint64_t window = std::min<uint64_t>(frames_seen_ + 1,
                                               static_cast<uint64_t>(std::max(1, config_.history)));
    const float alpha = 1.0f / static_cast<float>(window);

    for (uint32_t y = 0; y < frame.height; y++) {
        const uint8_t* row = &frame.data[static_cast<size_t>(y) * frame.stride];
        for (uint32_t x = 0; x < frame.width; x++) {
            const size_t p = static_cast<size_t>(y) * frame.width + x;
            float* mean = &mean_[p * 3];

            const float d0 = row[x * 3] - mean[0];
            const float d1 = row[x * 3 + 1] - mean[1];
            const float d2 = row[x * 3 + 2] - mean[2];
            const float dist2 = d0 * d0 + d1 * d1 + d2 * d2;

            float& var = variance_[p];
            foreground.data[p] = (dist2 > config_.var_threshold * var) ? 255 : 0;

            mean[0] += alpha * d0;
            mean[1] += alpha * d1;
            mean[2] += alpha * d2;
            var += alpha * (dist2 - var);
            var = std::min(constants::kBackgroundVarMax, std::max(constants::kBackgroundVarMin, var));
        }
    }

    frames_seen_++;
    return true;
}

} // namespace handpose
