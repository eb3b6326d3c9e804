#pragma once

#include <cstdint>

namespace handpose {
namespace simd {

// Channel order of packed 3-channel input
enum class ChannelOrder { RGB, BGR };

// Packed 3-channel color to OpenCV-scaled HSV (H 0-179, S/V 0-255)
void convert_to_hsv(const uint8_t* __restrict src,
                    uint8_t* __restrict hsv,
                    uint32_t pixel_count,
                    ChannelOrder order) noexcept;

// Inclusive per-channel range test on packed HSV, writes 255/0
// Uses ARM NEON intrinsics when available
void create_range_mask_simd(const uint8_t* __restrict hsv,
                            uint8_t* __restrict mask,
                            uint32_t pixel_count,
                            int hue_min, int hue_max,
                            int sat_min, int sat_max,
                            int val_min, int val_max) noexcept;

// dst[i] &= other[i]
void bitwise_and_simd(uint8_t* __restrict dst,
                      const uint8_t* __restrict other,
                      uint32_t count) noexcept;

// Check if SIMD is available at runtime
[[nodiscard]] bool is_neon_available() noexcept;

// Fallback scalar implementations
namespace scalar {
    void create_range_mask(const uint8_t* __restrict hsv,
                           uint8_t* __restrict mask,
                           uint32_t pixel_count,
                           int hue_min, int hue_max,
                           int sat_min, int sat_max,
                           int val_min, int val_max) noexcept;

    void bitwise_and(uint8_t* __restrict dst,
                     const uint8_t* __restrict other,
                     uint32_t count) noexcept;
} // namespace scalar

} // namespace simd
} // namespace handpose
