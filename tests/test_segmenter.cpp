#include <gtest/gtest.h>
#include "background_model.hpp"
#include "hand_pose_simd.hpp"
#include "segmenter.hpp"
#include "test_shapes.hpp"
#include <vector>

using namespace handpose;
using namespace handpose::camera;

namespace {

std::vector<uint8_t> hsv_of(uint8_t r, uint8_t g, uint8_t b) {
    const uint8_t rgb[3] = {r, g, b};
    std::vector<uint8_t> hsv(3);
    simd::convert_to_hsv(rgb, hsv.data(), 1, simd::ChannelOrder::RGB);
    return hsv;
}

} // namespace

// Test HSV conversion on reference colors
TEST(HsvTest, ReferenceColors) {
    EXPECT_EQ(hsv_of(255, 0, 0), (std::vector<uint8_t>{0, 255, 255}));
    EXPECT_EQ(hsv_of(0, 255, 0), (std::vector<uint8_t>{60, 255, 255}));
    EXPECT_EQ(hsv_of(0, 0, 255), (std::vector<uint8_t>{120, 255, 255}));
    EXPECT_EQ(hsv_of(128, 128, 128), (std::vector<uint8_t>{0, 0, 128}));
    EXPECT_EQ(hsv_of(0, 0, 0), (std::vector<uint8_t>{0, 0, 0}));
    EXPECT_EQ(hsv_of(220, 160, 120), (std::vector<uint8_t>{12, 116, 220}));
}

TEST(HsvTest, ChannelOrder) {
    const uint8_t bgr[3] = {120, 160, 220};
    uint8_t hsv[3];
    simd::convert_to_hsv(bgr, hsv, 1, simd::ChannelOrder::BGR);
    EXPECT_EQ(hsv[0], 12);
    EXPECT_EQ(hsv[1], 116);
    EXPECT_EQ(hsv[2], 220);
}

TEST(HsvTest, RangeMaskInclusive) {
    // 20 pixels so the vector path and the scalar tail both run
    std::vector<uint8_t> hsv(20 * 3, 0);
    for (int i = 0; i < 20; i++) {
        hsv[i * 3] = static_cast<uint8_t>(i * 2);  // hue 0..38
        hsv[i * 3 + 1] = 30;
        hsv[i * 3 + 2] = 255;
    }
    std::vector<uint8_t> mask(20);
    simd::create_range_mask_simd(hsv.data(), mask.data(), 20, 0, 30, 30, 255, 60, 255);
    for (int i = 0; i < 20; i++) {
        EXPECT_EQ(mask[i], i * 2 <= 30 ? 255 : 0) << "pixel " << i;
    }

    std::vector<uint8_t> scalar_mask(20);
    simd::scalar::create_range_mask(hsv.data(), scalar_mask.data(), 20, 0, 30, 30, 255, 60, 255);
    EXPECT_EQ(mask, scalar_mask);
}

class SegmenterTest : public ::testing::Test {
protected:
    void SetUp() override {
        frame = Frame::create(160, 120);
        config = DetectorConfig::pointer();
        config.background.enabled = false;
    }

    Frame frame;
    DetectorConfig config;
};

TEST_F(SegmenterTest, SkinRectangle) {
    test_shapes::fill_rect(frame, 30, 20, 40, 30);
    SkinSegmenter seg(config);

    Mask mask = seg.segment(frame);
    ASSERT_TRUE(mask.same_size(160, 120));
    EXPECT_EQ(mask.count_nonzero(), 1200u);
    EXPECT_EQ(mask.at(30, 20), 255);
    EXPECT_EQ(mask.at(29, 20), 0);
}

TEST_F(SegmenterTest, NonSkinIsRejected) {
    test_shapes::fill_rect(frame, 30, 20, 40, 30, 40, 90, 200); // blue
    SkinSegmenter seg(config);
    EXPECT_EQ(seg.segment(frame).count_nonzero(), 0u);
}

TEST_F(SegmenterTest, BgrFrame) {
    Frame bgr = Frame::create(160, 120, PixelFormat::BGR888);
    test_shapes::fill_rect(bgr, 30, 20, 40, 30);
    SkinSegmenter seg(config);
    EXPECT_EQ(seg.segment(bgr).count_nonzero(), 1200u);
}

TEST_F(SegmenterTest, InvalidFrameGivesEmptyMask) {
    SkinSegmenter seg(config);
    EXPECT_TRUE(seg.segment(Frame()).empty());

    Frame truncated = frame;
    truncated.data.resize(100);
    EXPECT_TRUE(seg.segment(truncated).empty());
}

TEST_F(SegmenterTest, ExclusionMask) {
    test_shapes::fill_rect(frame, 30, 20, 40, 30);
    SkinSegmenter seg(config);

    Mask exclusion = utils::make_exclusion_mask(160, 120, {Rect(30, 20, 20, 30)}, 0);
    Mask mask = seg.segment(frame, &exclusion);
    EXPECT_EQ(mask.count_nonzero(), 600u);
    EXPECT_EQ(seg.last_skin_mask().count_nonzero(), 1200u);
    EXPECT_EQ(mask.at(35, 25), 0);
    EXPECT_EQ(mask.at(60, 25), 255);
}

TEST_F(SegmenterTest, WrongSizeExclusionIsIgnored) {
    test_shapes::fill_rect(frame, 30, 20, 40, 30);
    SkinSegmenter seg(config);

    Mask exclusion(80, 60, 0);
    EXPECT_EQ(seg.segment(frame, &exclusion).count_nonzero(), 1200u);
}

TEST_F(SegmenterTest, StaticSceneIsLearnedAfterWindow) {
    config.background.enabled = true;
    config.background.learning_window = 3;
    test_shapes::fill_rect(frame, 30, 20, 40, 30);
    SkinSegmenter seg(config);

    // Until the model has seen the window, the motion mask is not applied
    for (int i = 0; i < 3; i++) {
        EXPECT_EQ(seg.segment(frame).count_nonzero(), 1200u) << "frame " << i;
    }
    EXPECT_EQ(seg.background().frames_seen(), 3u);

    // A hand that never moves becomes background
    EXPECT_EQ(seg.segment(frame).count_nonzero(), 0u);
}

TEST_F(SegmenterTest, MovingHandPassesMotionGate) {
    config.background.enabled = true;
    config.background.learning_window = 3;
    SkinSegmenter seg(config);

    for (int i = 0; i < 3; i++) {
        EXPECT_EQ(seg.segment(frame).count_nonzero(), 0u);
    }

    test_shapes::fill_rect(frame, 30, 20, 40, 30);
    EXPECT_EQ(seg.segment(frame).count_nonzero(), 1200u);
}

TEST_F(SegmenterTest, ResetRestartsLearning) {
    config.background.enabled = true;
    config.background.learning_window = 2;
    test_shapes::fill_rect(frame, 30, 20, 40, 30);
    SkinSegmenter seg(config);

    seg.segment(frame);
    seg.segment(frame);
    EXPECT_EQ(seg.segment(frame).count_nonzero(), 0u);

    seg.reset();
    EXPECT_EQ(seg.background().frames_seen(), 0u);
    EXPECT_EQ(seg.segment(frame).count_nonzero(), 1200u);
}

TEST_F(SegmenterTest, ResolutionChangeRestartsLearning) {
    config.background.enabled = true;
    config.background.learning_window = 2;
    test_shapes::fill_rect(frame, 30, 20, 40, 30);
    SkinSegmenter seg(config);

    for (int i = 0; i < 3; i++) {
        seg.segment(frame);
    }
    ASSERT_TRUE(seg.background().is_trained());

    // The first frame at the new size only seeds the model
    Frame larger = Frame::create(320, 240);
    test_shapes::fill_rect(larger, 60, 40, 40, 30);
    EXPECT_EQ(seg.segment(larger).count_nonzero(), 1200u);
    EXPECT_EQ(seg.background().frames_seen(), 1u);
    EXPECT_EQ(seg.segment(larger).count_nonzero(), 1200u);
}

TEST_F(SegmenterTest, CalibrateSkin) {
    test_shapes::fill_rect(frame, 10, 10, 20, 20, 200, 100, 50); // HSV(10, 191, 200)
    SkinSegmenter seg(config);

    ASSERT_TRUE(seg.calibrate_skin(frame, Rect(10, 10, 20, 20)));
    const SkinRange& skin = seg.skin_range();
    EXPECT_EQ(skin.hue_min, 0);
    EXPECT_EQ(skin.hue_max, 20);
    EXPECT_EQ(skin.sat_min, 161);
    EXPECT_EQ(skin.sat_max, 221);
    EXPECT_EQ(skin.val_min, 170);
    EXPECT_EQ(skin.val_max, 230);

    EXPECT_EQ(seg.segment(frame).count_nonzero(), 400u);
}

TEST_F(SegmenterTest, CalibrateSkinOutsideFrame) {
    SkinSegmenter seg(config);
    EXPECT_FALSE(seg.calibrate_skin(frame, Rect(500, 500, 10, 10)));
    EXPECT_FALSE(seg.calibrate_skin(frame, Rect(10, 10, 0, 10)));
    EXPECT_FALSE(seg.calibrate_skin(Frame(), Rect(0, 0, 10, 10)));
}

TEST(BackgroundModelTest, SizeChangeRestarts) {
    BackgroundModel model(BackgroundConfig{});
    Mask fg;

    Frame a = Frame::create(32, 24);
    ASSERT_TRUE(model.apply(a, fg));
    ASSERT_TRUE(model.apply(a, fg));
    EXPECT_EQ(model.frames_seen(), 2u);

    Frame b = Frame::create(16, 12);
    ASSERT_TRUE(model.apply(b, fg));
    EXPECT_EQ(model.frames_seen(), 1u);
    EXPECT_TRUE(fg.same_size(16, 12));
    EXPECT_EQ(fg.count_nonzero(), 0u);

    EXPECT_FALSE(model.apply(Frame(), fg));
}

TEST(BackgroundModelTest, SmallNoiseStaysBackground) {
    BackgroundModel model(BackgroundConfig{});
    Mask fg;

    Frame f = Frame::create(8, 8);
    for (int i = 0; i < 5; i++) {
        std::fill(f.data.begin(), f.data.end(), static_cast<uint8_t>(100 + (i % 2) * 4));
        ASSERT_TRUE(model.apply(f, fg));
        EXPECT_EQ(fg.count_nonzero(), 0u) << "frame " << i;
    }

    std::fill(f.data.begin(), f.data.end(), 250);
    ASSERT_TRUE(model.apply(f, fg));
    EXPECT_EQ(fg.count_nonzero(), 64u);
}

// Main function
int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
