#include <gtest/gtest.h>

#include <limits>

#include "roadwatch/detection_intake.hpp"
#include "test_helpers.hpp"

using namespace roadwatch;
using namespace roadwatch::test;

TEST(DetectionIntake, AppliesPerClassThresholds) {
    PipelineConfig cfg;
    cfg.vehicle_confidence = 0.5f;
    cfg.helmet_confidence = 0.4f;
    DetectionIntake intake(cfg);

    Frame f = make_frame(1, {vehicle(10, 10, 50, 50, "car", 0.49f), vehicle(100, 10, 50, 50, "car", 0.5f),
                             helmet(200, 10, 20, 20, 0.45f), helmet(300, 10, 20, 20, 0.3f)});
    FrameObservations obs = intake.normalize(f);

    ASSERT_EQ(obs.vehicles.size(), 1u);
    EXPECT_FLOAT_EQ(obs.vehicles[0].bbox.x, 100.0f);
    ASSERT_EQ(obs.helmets.size(), 1u);
    EXPECT_EQ(obs.dropped_low_confidence, 2);
    EXPECT_EQ(obs.dropped_malformed, 0);
}

TEST(DetectionIntake, DropsMalformedBoxes) {
    DetectionIntake intake(PipelineConfig{});
    const float nan = std::numeric_limits<float>::quiet_NaN();

    Frame f = make_frame(1, {vehicle(10, 10, 0, 50), vehicle(10, 10, 50, -5), vehicle(nan, 10, 50, 50),
                             vehicle(10, 10, 50, 50, "car", 1.5f), vehicle(2000, 900, 50, 50),
                             vehicle(10, 10, 50, 50)});
    FrameObservations obs = intake.normalize(f);

    EXPECT_EQ(obs.vehicles.size(), 1u);
    EXPECT_EQ(obs.dropped_malformed, 5);
}

TEST(DetectionIntake, ClipsBoxesToFrame) {
    DetectionIntake intake(PipelineConfig{});
    FrameObservations obs = intake.normalize(make_frame(1, {vehicle(1250, 700, 60, 40)}));

    ASSERT_EQ(obs.vehicles.size(), 1u);
    EXPECT_FLOAT_EQ(obs.vehicles[0].bbox.width, 30.0f);
    EXPECT_FLOAT_EQ(obs.vehicles[0].bbox.height, 20.0f);
}

TEST(DetectionIntake, KeepsBoxesWhenFrameSizeUnknown) {
    DetectionIntake intake(PipelineConfig{});
    FrameObservations obs = intake.normalize(make_frame(1, {vehicle(5000, 5000, 60, 40)}, 0, 0));
    EXPECT_EQ(obs.vehicles.size(), 1u);
}

TEST(DetectionIntake, PicksMostConfidentColoredLight) {
    DetectionIntake intake(PipelineConfig{});
    Frame f = make_frame(1, {light(TrafficLightColor::GREEN, 0.6f), light(TrafficLightColor::RED, 0.8f),
                             light(TrafficLightColor::UNKNOWN, 0.95f)});
    FrameObservations obs = intake.normalize(f);

    EXPECT_EQ(obs.traffic_lights.size(), 3u);
    EXPECT_EQ(obs.light.color, TrafficLightColor::RED);
    EXPECT_FLOAT_EQ(obs.light.confidence, 0.8f);
}

TEST(DetectionIntake, ClassifiesLightCropWithoutColor) {
    DetectionIntake intake(PipelineConfig{});
    Detection lit = light(TrafficLightColor::UNKNOWN, 0.8f);
    lit.crop = cv::Mat(20, 20, CV_8UC3, cv::Scalar(0, 0, 255));
    Detection dark = light(TrafficLightColor::UNKNOWN, 0.9f);
    dark.crop = cv::Mat(20, 20, CV_8UC3, cv::Scalar(0, 0, 0));

    FrameObservations obs = intake.normalize(make_frame(1, {lit, dark}));

    EXPECT_EQ(obs.light.color, TrafficLightColor::RED);
    EXPECT_FLOAT_EQ(obs.light.confidence, 0.8f);
    ASSERT_EQ(obs.traffic_lights.size(), 2u);
    EXPECT_EQ(obs.traffic_lights[1].light_color, TrafficLightColor::UNKNOWN);
}

TEST(DetectionIntake, DetectorColorWinsOverCrop) {
    DetectionIntake intake(PipelineConfig{});
    Detection d = light(TrafficLightColor::GREEN, 0.7f);
    d.crop = cv::Mat(20, 20, CV_8UC3, cv::Scalar(0, 0, 255));

    FrameObservations obs = intake.normalize(make_frame(1, {d}));
    EXPECT_EQ(obs.light.color, TrafficLightColor::GREEN);
}

TEST(DetectionIntake, NoLightGivesUnknownState) {
    DetectionIntake intake(PipelineConfig{});
    FrameObservations obs = intake.normalize(make_frame(1, {light(TrafficLightColor::RED, 0.1f)}));
    EXPECT_EQ(obs.light.color, TrafficLightColor::UNKNOWN);
    EXPECT_FLOAT_EQ(obs.light.confidence, 0.0f);
}

TEST(VehicleType, MapsDetectorLabels) {
    EXPECT_EQ(vehicle_type_from_label("Motorbike"), VehicleType::MOTORCYCLE);
    EXPECT_EQ(vehicle_type_from_label("bicycle"), VehicleType::BICYCLE);
    EXPECT_EQ(vehicle_type_from_label("truck"), VehicleType::TRUCK);
    EXPECT_EQ(vehicle_type_from_label("tractor"), VehicleType::UNKNOWN);
    EXPECT_TRUE(is_two_wheeler(VehicleType::MOTORCYCLE));
    EXPECT_FALSE(is_two_wheeler(VehicleType::CAR));
}
