#pragma once

#include "contour_geometry.hpp"
#include "hand_pose_config.hpp"
#include <string>

namespace handpose
{

    // Hand gesture types
    enum class Gesture
    {
        UNKNOWN,
        CLOSED_FIST, // No finger gaps
        POINTING,    // One gap: index finger raised
        VICTORY,     // Two gaps: index and middle finger
        OPEN_PALM,   // Four or more gaps
        THUMBS_UP    // Three gaps on a compact (solid) silhouette
    };

    struct GestureResult
    {
        Gesture gesture{Gesture::UNKNOWN};
        int finger_gaps{0};   // defects with a far-vertex angle within the limit
        double solidity{0.0}; // contour area / hull area
    };

    // Count sharp convexity defects and map the count to a gesture
    GestureResult classify_gesture(const Contour &contour, const DetectorConfig &config);

    // Gesture name string conversion
    std::string gesture_to_string(Gesture g);
    Gesture string_to_gesture(const std::string &s);

} // namespace handpose
