#include "hand_pose_config.hpp"
#include <fstream>
#include <sstream>
#include <iostream>

namespace handpose {

namespace {

bool valid_range(int lo, int hi, int max_value) {
    return lo >= 0 && hi <= max_value && lo <= hi;
}

bool valid_kernel(int k) {
    return k >= 1 && (k % 2) == 1;
}

} // namespace

DetectorConfig DetectorConfig::pointer() {
    return DetectorConfig{};
}

DetectorConfig DetectorConfig::orientation() {
    DetectorConfig config;
    config.skin.hue_min = 0;
    config.skin.hue_max = 20;
    config.skin.sat_min = 48;
    config.skin.sat_max = 255;
    config.skin.val_min = 80;
    config.skin.val_max = 255;
    config.background.enabled = false;
    config.dilate_iterations = 2;
    config.rethreshold_level = 0;
    config.centroid_history = 1;
    config.enable_gesture = false;
    return config;
}

bool DetectorConfig::validate() const noexcept {
    if (!valid_range(skin.hue_min, skin.hue_max, 179)) return false;
    if (!valid_range(skin.sat_min, skin.sat_max, 255)) return false;
    if (!valid_range(skin.val_min, skin.val_max, 255)) return false;
    if (background.learning_window < 0 || background.history < 1) return false;
    if (background.var_threshold <= 0.0f || background.var_init <= 0.0f) return false;
    if (background.motion_threshold < 0 || background.motion_threshold > 254) return false;
    if (!valid_kernel(morph_kernel_size) || !valid_kernel(blur_kernel_size)) return false;
    if (erode_iterations < 0 || dilate_iterations < 0) return false;
    if (rethreshold_level < 0 || rethreshold_level > 254) return false;
    if (min_contour_area < 0.0 || fingertip_min_area < 0.0) return false;
    if (centroid_history < 1 || angle_history < 1) return false;
    if (fingertip_max_angle <= 0.0 || fingertip_max_angle > constants::kPi) return false;
    if (gesture_max_angle <= 0.0 || gesture_max_angle > constants::kPi) return false;
    if (fingertip_top_radius <= 0.0 || min_defect_depth < 0.0) return false;
    if (thumbs_up_solidity < 0.0 || thumbs_up_solidity > 1.0) return false;
    return true;
}

bool DetectorConfig::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[Config] Failed to open: " << path << "\n";
        return false;
    }

    std::string line;
    int line_no = 0;
    while (std::getline(file, line)) {
        line_no++;
        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') continue;

        std::istringstream iss(line);
        std::string key;
        if (!(iss >> key)) continue;

        if (key == "hue_min") iss >> skin.hue_min;
        else if (key == "hue_max") iss >> skin.hue_max;
        else if (key == "sat_min") iss >> skin.sat_min;
        else if (key == "sat_max") iss >> skin.sat_max;
        else if (key == "val_min") iss >> skin.val_min;
        else if (key == "val_max") iss >> skin.val_max;
        else if (key == "background") iss >> background.enabled;
        else if (key == "learning_window") iss >> background.learning_window;
        else if (key == "background_history") iss >> background.history;
        else if (key == "var_threshold") iss >> background.var_threshold;
        else if (key == "var_init") iss >> background.var_init;
        else if (key == "motion_threshold") iss >> background.motion_threshold;
        else if (key == "morph_kernel_size") iss >> morph_kernel_size;
        else if (key == "erode_iterations") iss >> erode_iterations;
        else if (key == "dilate_iterations") iss >> dilate_iterations;
        else if (key == "blur_kernel_size") iss >> blur_kernel_size;
        else if (key == "rethreshold_level") iss >> rethreshold_level;
        else if (key == "min_contour_area") iss >> min_contour_area;
        else if (key == "centroid_history") iss >> centroid_history;
        else if (key == "fingertip_min_area") iss >> fingertip_min_area;
        else if (key == "fingertip_max_angle") iss >> fingertip_max_angle;
        else if (key == "fingertip_top_radius") iss >> fingertip_top_radius;
        else if (key == "min_defect_depth") iss >> min_defect_depth;
        else if (key == "enable_gesture") iss >> enable_gesture;
        else if (key == "gesture_max_angle") iss >> gesture_max_angle;
        else if (key == "thumbs_up_solidity") iss >> thumbs_up_solidity;
        else if (key == "angle_history") iss >> angle_history;
        else if (key == "verbose") iss >> verbose;
        else {
            std::cerr << "[Config] " << path << ":" << line_no << ": unknown key '" << key << "'\n";
            continue;
        }

        if (iss.fail()) {
            std::cerr << "[Config] " << path << ":" << line_no << ": bad value for '" << key << "'\n";
            return false;
        }
    }

    if (!validate()) {
        std::cerr << "[Config] Invalid configuration in " << path << "\n";
        return false;
    }
    return true;
}

bool DetectorConfig::save_to_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        std::cerr << "[Config] Failed to save to: " << path << "\n";
        return false;
    }

    file.precision(10);
    file << "# Hand Pose Configuration\n";
    file << "# HSV Skin Range (H 0-179, S/V 0-255)\n";
    file << "hue_min " << skin.hue_min << "\n";
    file << "hue_max " << skin.hue_max << "\n";
    file << "sat_min " << skin.sat_min << "\n";
    file << "sat_max " << skin.sat_max << "\n";
    file << "val_min " << skin.val_min << "\n";
    file << "val_max " << skin.val_max << "\n";
    file << "\n# Background Model\n";
    file << "background " << background.enabled << "\n";
    file << "learning_window " << background.learning_window << "\n";
    file << "background_history " << background.history << "\n";
    file << "var_threshold " << background.var_threshold << "\n";
    file << "var_init " << background.var_init << "\n";
    file << "motion_threshold " << background.motion_threshold << "\n";
    file << "\n# Mask Refinement\n";
    file << "morph_kernel_size " << morph_kernel_size << "\n";
    file << "erode_iterations " << erode_iterations << "\n";
    file << "dilate_iterations " << dilate_iterations << "\n";
    file << "blur_kernel_size " << blur_kernel_size << "\n";
    file << "rethreshold_level " << rethreshold_level << "\n";
    file << "\n# Contour & Orientation\n";
    file << "min_contour_area " << min_contour_area << "\n";
    file << "centroid_history " << centroid_history << "\n";
    file << "fingertip_min_area " << fingertip_min_area << "\n";
    file << "fingertip_max_angle " << fingertip_max_angle << "\n";
    file << "fingertip_top_radius " << fingertip_top_radius << "\n";
    file << "min_defect_depth " << min_defect_depth << "\n";
    file << "angle_history " << angle_history << "\n";
    file << "\n# Gesture\n";
    file << "enable_gesture " << enable_gesture << "\n";
    file << "gesture_max_angle " << gesture_max_angle << "\n";
    file << "thumbs_up_solidity " << thumbs_up_solidity << "\n";
    file << "\nverbose " << verbose << "\n";

    return static_cast<bool>(file);
}

} // namespace handpose
