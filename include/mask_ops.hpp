#pragma once

#include "frame.hpp"
#include "hand_pose_config.hpp"

namespace handpose {

// Binary mask primitives. All operations keep the input size.
namespace mask_ops {

// Square-kernel erosion; pixels outside the image count as foreground
camera::Mask erode(const camera::Mask& src, int kernel_size, int iterations = 1);

// Square-kernel dilation; pixels outside the image count as background
camera::Mask dilate(const camera::Mask& src, int kernel_size, int iterations = 1);

// Erode then dilate
camera::Mask open(const camera::Mask& src, int kernel_size);

// Dilate then erode
camera::Mask close(const camera::Mask& src, int kernel_size);

// Separable Gaussian blur with reflect-101 borders (odd kernel size)
camera::Mask gaussian_blur(const camera::Mask& src, int kernel_size);

// pixel > level => 255, else 0
void threshold(camera::Mask& mask, int level) noexcept;

// dst &= other; sizes must match
bool bitwise_and(camera::Mask& dst, const camera::Mask& other);

} // namespace mask_ops

// Erode, dilate, blur and re-threshold as configured
camera::Mask refine_mask(const camera::Mask& mask, const DetectorConfig& config);

} // namespace handpose
