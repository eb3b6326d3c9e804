#include "hand_pose_simd.hpp"
#include <algorithm>

#if defined(__ARM_NEON) || defined(__ARM_NEON__)
#include <arm_neon.h>
#define HANDPOSE_HAS_NEON 1
#else
#define HANDPOSE_HAS_NEON 0
#endif

namespace handpose {
namespace simd {

bool is_neon_available() noexcept {
#if HANDPOSE_HAS_NEON
    return true;
#else
    return false;
#endif
}

void convert_to_hsv(const uint8_t* __restrict src,
                    uint8_t* __restrict hsv,
                    uint32_t pixel_count,
                    ChannelOrder order) noexcept {
    const int r_off = (order == ChannelOrder::RGB) ? 0 : 2;
    const int b_off = 2 - r_off;

    for (uint32_t i = 0; i < pixel_count; ++i) {
        const uint32_t idx = i * 3;
        const int r = src[idx + r_off];
        const int g = src[idx + 1];
        const int b = src[idx + b_off];

        const int cmax = std::max({r, g, b});
        const int cmin = std::min({r, g, b});
        const int delta = cmax - cmin;

        // Hue in degrees, halved and rounded into 0-179
        int h = 0;
        if (delta > 0) {
            float deg;
            if (cmax == r) {
                deg = 60.0f * static_cast<float>(g - b) / delta;
            } else if (cmax == g) {
                deg = 60.0f * static_cast<float>(b - r) / delta + 120.0f;
            } else {
                deg = 60.0f * static_cast<float>(r - g) / delta + 240.0f;
            }
            if (deg < 0.0f) deg += 360.0f;
            h = static_cast<int>(deg * 0.5f + 0.5f);
            if (h >= 180) h -= 180;
        }

        const int s = (cmax == 0) ? 0 : (255 * delta + cmax / 2) / cmax;

        hsv[idx] = static_cast<uint8_t>(h);
        hsv[idx + 1] = static_cast<uint8_t>(s);
        hsv[idx + 2] = static_cast<uint8_t>(cmax);
    }
}

#if HANDPOSE_HAS_NEON

void create_range_mask_simd(const uint8_t* __restrict hsv,
                            uint8_t* __restrict mask,
                            uint32_t pixel_count,
                            int hue_min, int hue_max,
                            int sat_min, int sat_max,
                            int val_min, int val_max) noexcept {
    // Process 16 pixels at a time
    constexpr uint32_t kVectorSize = 16;
    const uint32_t vector_iterations = pixel_count / kVectorSize;
    const uint32_t remainder = pixel_count % kVectorSize;

    const uint8x16_t h_min_vec = vdupq_n_u8(static_cast<uint8_t>(hue_min));
    const uint8x16_t h_max_vec = vdupq_n_u8(static_cast<uint8_t>(hue_max));
    const uint8x16_t s_min_vec = vdupq_n_u8(static_cast<uint8_t>(sat_min));
    const uint8x16_t s_max_vec = vdupq_n_u8(static_cast<uint8_t>(sat_max));
    const uint8x16_t v_min_vec = vdupq_n_u8(static_cast<uint8_t>(val_min));
    const uint8x16_t v_max_vec = vdupq_n_u8(static_cast<uint8_t>(val_max));

    for (uint32_t i = 0; i < vector_iterations; ++i) {
        // Load HSV values (deinterleave)
        const uint8x16x3_t px = vld3q_u8(hsv + i * kVectorSize * 3);

        const uint8x16_t h_ok = vandq_u8(vcgeq_u8(px.val[0], h_min_vec), vcleq_u8(px.val[0], h_max_vec));
        const uint8x16_t s_ok = vandq_u8(vcgeq_u8(px.val[1], s_min_vec), vcleq_u8(px.val[1], s_max_vec));
        const uint8x16_t v_ok = vandq_u8(vcgeq_u8(px.val[2], v_min_vec), vcleq_u8(px.val[2], v_max_vec));

        // Comparison lanes are already 0x00 / 0xFF
        vst1q_u8(mask + i * kVectorSize, vandq_u8(vandq_u8(h_ok, s_ok), v_ok));
    }

    if (remainder > 0) {
        scalar::create_range_mask(hsv + vector_iterations * kVectorSize * 3,
                                  mask + vector_iterations * kVectorSize,
                                  remainder,
                                  hue_min, hue_max, sat_min, sat_max, val_min, val_max);
    }
}

void bitwise_and_simd(uint8_t* __restrict dst,
                      const uint8_t* __restrict other,
                      uint32_t count) noexcept {
    constexpr uint32_t kVectorSize = 16;
    const uint32_t vector_iterations = count / kVectorSize;

    for (uint32_t i = 0; i < vector_iterations; ++i) {
        uint8_t* d = dst + i * kVectorSize;
        vst1q_u8(d, vandq_u8(vld1q_u8(d), vld1q_u8(other + i * kVectorSize)));
    }

    const uint32_t done = vector_iterations * kVectorSize;
    if (done < count) {
        scalar::bitwise_and(dst + done, other + done, count - done);
    }
}

#else // No NEON support

void create_range_mask_simd(const uint8_t* __restrict hsv,
                            uint8_t* __restrict mask,
                            uint32_t pixel_count,
                            int hue_min, int hue_max,
                            int sat_min, int sat_max,
                            int val_min, int val_max) noexcept {
    scalar::create_range_mask(hsv, mask, pixel_count, hue_min, hue_max, sat_min, sat_max, val_min, val_max);
}

void bitwise_and_simd(uint8_t* __restrict dst,
                      const uint8_t* __restrict other,
                      uint32_t count) noexcept {
    scalar::bitwise_and(dst, other, count);
}

#endif

// Scalar implementations
namespace scalar {

void create_range_mask(const uint8_t* __restrict hsv,
                       uint8_t* __restrict mask,
                       uint32_t pixel_count,
                       int hue_min, int hue_max,
                       int sat_min, int sat_max,
                       int val_min, int val_max) noexcept {
    for (uint32_t i = 0; i < pixel_count; ++i) {
        const uint32_t idx = i * 3;
        const int h = hsv[idx];
        const int s = hsv[idx + 1];
        const int v = hsv[idx + 2];

        const bool in_range = (h >= hue_min && h <= hue_max &&
                               s >= sat_min && s <= sat_max &&
                               v >= val_min && v <= val_max);

        mask[i] = in_range ? 255 : 0;
    }
}

void bitwise_and(uint8_t* __restrict dst,
                 const uint8_t* __restrict other,
                 uint32_t count) noexcept {
    for (uint32_t i = 0; i < count; ++i) {
        dst[i] &= other[i];
    }
}

} // namespace scalar

} // namespace simd
} // namespace handpose
