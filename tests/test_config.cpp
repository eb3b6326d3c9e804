#include <gtest/gtest.h>
#include "hand_pose_config.hpp"
#include <cstdio>
#include <fstream>
#include <string>

using namespace handpose;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        path = ::testing::TempDir() + "handpose_config_test.txt";
    }

    void TearDown() override {
        std::remove(path.c_str());
    }

    void write(const std::string& text) {
        std::ofstream out(path);
        out << text;
    }

    std::string path;
};

TEST_F(ConfigTest, PresetsAreValid) {
    EXPECT_TRUE(DetectorConfig{}.validate());
    EXPECT_TRUE(DetectorConfig::pointer().validate());
    EXPECT_TRUE(DetectorConfig::orientation().validate());

    DetectorConfig orientation = DetectorConfig::orientation();
    EXPECT_FALSE(orientation.background.enabled);
    EXPECT_FALSE(orientation.enable_gesture);
    EXPECT_EQ(orientation.skin.hue_max, 20);
    EXPECT_EQ(orientation.skin.sat_min, 48);
    EXPECT_EQ(orientation.skin.val_min, 80);
}

TEST_F(ConfigTest, InvalidValues) {
    DetectorConfig config;
    config.morph_kernel_size = 4;
    EXPECT_FALSE(config.validate());

    config = DetectorConfig{};
    config.blur_kernel_size = 0;
    EXPECT_FALSE(config.validate());

    config = DetectorConfig{};
    config.skin.hue_max = 200;
    EXPECT_FALSE(config.validate());

    config = DetectorConfig{};
    config.skin.sat_min = 100;
    config.skin.sat_max = 50;
    EXPECT_FALSE(config.validate());

    config = DetectorConfig{};
    config.thumbs_up_solidity = 1.5;
    EXPECT_FALSE(config.validate());

    config = DetectorConfig{};
    config.centroid_history = 0;
    EXPECT_FALSE(config.validate());

    config = DetectorConfig{};
    config.fingertip_max_angle = 4.0;
    EXPECT_FALSE(config.validate());
}

TEST_F(ConfigTest, SaveAndLoad) {
    DetectorConfig saved = DetectorConfig::orientation();
    saved.skin.hue_max = 25;
    saved.background.var_threshold = 16.5f;
    saved.min_contour_area = 4500.0;
    saved.angle_history = 7;
    saved.verbose = true;
    ASSERT_TRUE(saved.save_to_file(path));

    DetectorConfig loaded;
    ASSERT_TRUE(loaded.load_from_file(path));
    EXPECT_EQ(loaded.skin.hue_max, 25);
    EXPECT_EQ(loaded.skin.sat_min, 48);
    EXPECT_FALSE(loaded.background.enabled);
    EXPECT_FLOAT_EQ(loaded.background.var_threshold, 16.5f);
    EXPECT_DOUBLE_EQ(loaded.min_contour_area, 4500.0);
    EXPECT_EQ(loaded.centroid_history, 1);
    EXPECT_EQ(loaded.angle_history, 7);
    EXPECT_EQ(loaded.rethreshold_level, 0);
    EXPECT_FALSE(loaded.enable_gesture);
    EXPECT_TRUE(loaded.verbose);
    EXPECT_NEAR(loaded.fingertip_max_angle, saved.fingertip_max_angle, 1e-8);
    EXPECT_NEAR(loaded.gesture_max_angle, saved.gesture_max_angle, 1e-8);
}

TEST_F(ConfigTest, CommentsAndUnknownKeys) {
    write("# tuned for a dim room\n"
          "\n"
          "val_min 40\n"
          "exposure 12\n"
          "centroid_history 3\n");

    DetectorConfig config;
    ASSERT_TRUE(config.load_from_file(path));
    EXPECT_EQ(config.skin.val_min, 40);
    EXPECT_EQ(config.centroid_history, 3);
    // Untouched keys keep their values
    EXPECT_EQ(config.skin.hue_max, 30);
}

TEST_F(ConfigTest, BadValue) {
    write("hue_min abc\n");
    DetectorConfig config;
    EXPECT_FALSE(config.load_from_file(path));
}

TEST_F(ConfigTest, LoadedConfigMustValidate) {
    write("morph_kernel_size 6\n");
    DetectorConfig config;
    EXPECT_FALSE(config.load_from_file(path));
}

TEST_F(ConfigTest, MissingFile) {
    DetectorConfig config;
    EXPECT_FALSE(config.load_from_file("/nonexistent/handpose.conf"));
}

TEST(DetectionStatsTest, Reset) {
    DetectionStats stats;
    stats.frames_processed = 12;
    stats.hands_detected = 4;
    stats.avg_process_time_ms = 3.5;
    stats.gesture_ms = 0.2;
    stats.reset();
    EXPECT_EQ(stats.frames_processed, 0u);
    EXPECT_EQ(stats.hands_detected, 0u);
    EXPECT_DOUBLE_EQ(stats.avg_process_time_ms, 0.0);
    EXPECT_DOUBLE_EQ(stats.gesture_ms, 0.0);
}

// Main function
int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
