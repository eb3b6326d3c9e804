#include "mask_ops.hpp"
#include "hand_pose_simd.hpp"
#include <algorithm>
#include <cmath>
#include <vector>

namespace handpose {
namespace mask_ops {

namespace {

using camera::Mask;

// Out-of-image taps are dropped from the window, which is the same as
// padding with 255 for min and with 0 for max.
template <typename Select>
Mask rect_filter(const Mask& src, int kernel_size, Select select) {
    const int w = static_cast<int>(src.width);
    const int h = static_cast<int>(src.height);
    const int r = kernel_size / 2;

    Mask tmp(src.width, src.height);
    Mask dst(src.width, src.height);

    // Horizontal pass
    for (int y = 0; y < h; y++) {
        const uint8_t* row = &src.data[static_cast<size_t>(y) * w];
        uint8_t* out = &tmp.data[static_cast<size_t>(y) * w];
        for (int x = 0; x < w; x++) {
            const int x0 = std::max(0, x - r);
            const int x1 = std::min(w - 1, x + r);
            uint8_t v = row[x0];
            for (int i = x0 + 1; i <= x1; i++) v = select(v, row[i]);
            out[x] = v;
        }
    }

    // Vertical pass
    for (int y = 0; y < h; y++) {
        const int y0 = std::max(0, y - r);
        const int y1 = std::min(h - 1, y + r);
        uint8_t* out = &dst.data[static_cast<size_t>(y) * w];
        for (int x = 0; x < w; x++) {
            uint8_t v = tmp.data[static_cast<size_t>(y0) * w + x];
            for (int i = y0 + 1; i <= y1; i++) {
                v = select(v, tmp.data[static_cast<size_t>(i) * w + x]);
            }
            out[x] = v;
        }
    }

    return dst;
}

uint8_t select_min(uint8_t a, uint8_t b) { return a < b ? a : b; }
uint8_t select_max(uint8_t a, uint8_t b) { return a > b ? a : b; }

int reflect_101(int p, int n) {
    if (n == 1) return 0;
    while (p < 0 || p >= n) {
        p = (p < 0) ? -p : 2 * n - 2 - p;
    }
    return p;
}

// 5x5 binomial kernel in fixed point (weights sum to 256)
Mask blur_binomial5(const Mask& src) {
    static const int kWeights[5] = {1, 4, 6, 4, 1};
    const int w = static_cast<int>(src.width);
    const int h = static_cast<int>(src.height);

    std::vector<int> tmp(static_cast<size_t>(w) * h);
    for (int y = 0; y < h; y++) {
        const uint8_t* row = &src.data[static_cast<size_t>(y) * w];
        for (int x = 0; x < w; x++) {
            int s = 0;
            for (int k = -2; k <= 2; k++) {
                s += kWeights[k + 2] * row[reflect_101(x + k, w)];
            }
            tmp[static_cast<size_t>(y) * w + x] = s;
        }
    }

    Mask dst(src.width, src.height);
    for (int y = 0; y < h; y++) {
        for (int x = 0; x < w; x++) {
            int s = 0;
            for (int k = -2; k <= 2; k++) {
                s += kWeights[k + 2] * tmp[static_cast<size_t>(reflect_101(y + k, h)) * w + x];
            }
            dst.data[static_cast<size_t>(y) * w + x] = static_cast<uint8_t>((s + 128) >> 8);
        }
    }
    return dst;
}

Mask blur_sampled(const Mask& src, int kernel_size) {
    const int r = kernel_size / 2;
    const double sigma = 0.3 * ((kernel_size - 1) * 0.5 - 1.0) + 0.8;

    std::vector<double> kernel(kernel_size);
    double sum = 0.0;
    for (int i = 0; i < kernel_size; i++) {
        const double d = i - r;
        kernel[i] = std::exp(-(d * d) / (2.0 * sigma * sigma));
        sum += kernel[i];
    }
    for (auto& k : kernel) k /= sum;

    const int w = static_cast<int>(src.width);
    const int h = static_cast<int>(src.height);

    std::vector<double> tmp(static_cast<size_t>(w) * h);
    for (int y = 0; y < h; y++) {
        const uint8_t* row = &src.data[static_cast<size_t>(y) * w];
        for (int x = 0; x < w; x++) {
            double s = 0.0;
            for (int k = -r; k <= r; k++) {
                s += kernel[k + r] * row[reflect_101(x + k, w)];
            }
            tmp[static_cast<size_t>(y) * w + x] = s;
        }
    }

    Mask dst(src.width, src.height);
    for (int y = 0; y < h; y++) {
        for (int x = 0; x < w; x++) {
            double s = 0.0;
            for (int k = -r; k <= r; k++) {
                s += kernel[k + r] * tmp[static_cast<size_t>(reflect_101(y + k, h)) * w + x];
            }
            const long v = std::lround(s);
            dst.data[static_cast<size_t>(y) * w + x] = static_cast<uint8_t>(std::min(255L, std::max(0L, v)));
        }
    }
    return dst;
}

} // namespace

Mask erode(const Mask& src, int kernel_size, int iterations) {
    Mask out = src;
    if (src.empty() || kernel_size <= 1) return out;
    for (int i = 0; i < iterations; i++) {
        out = rect_filter(out, kernel_size, select_min);
    }
    return out;
}

Mask dilate(const Mask& src, int kernel_size, int iterations) {
    Mask out = src;
    if (src.empty() || kernel_size <= 1) return out;
    for (int i = 0; i < iterations; i++) {
        out = rect_filter(out, kernel_size, select_max);
    }
    return out;
}

Mask open(const Mask& src, int kernel_size) {
    return dilate(erode(src, kernel_size), kernel_size);
}

Mask close(const Mask& src, int kernel_size) {
    return erode(dilate(src, kernel_size), kernel_size);
}

Mask gaussian_blur(const Mask& src, int kernel_size) {
    if (src.empty() || kernel_size <= 1) return src;
    if (kernel_size == 5) return blur_binomial5(src);
    return blur_sampled(src, kernel_size);
}

void threshold(Mask& mask, int level) noexcept {
    for (auto& v : mask.data) {
        v = (static_cast<int>(v) > level) ? 255 : 0;
    }
}

bool bitwise_and(Mask& dst, const Mask& other) {
    if (!other.same_size(dst.width, dst.height) || other.data.size() != dst.data.size()) {
        return false;
    }
    simd::bitwise_and_simd(dst.data.data(), other.data.data(),
                           static_cast<uint32_t>(dst.data.size()));
    return true;
}

} // namespace mask_ops

camera::Mask refine_mask(const camera::Mask& mask, const DetectorConfig& config) {
    camera::Mask out = mask_ops::erode(mask, config.morph_kernel_size, config.erode_iterations);
    out = mask_ops::dilate(out, config.morph_kernel_size, config.dilate_iterations);
    out = mask_ops::gaussian_blur(out, config.blur_kernel_size);
    mask_ops::threshold(out, config.rethreshold_level);
    return out;
}

} // namespace handpose
