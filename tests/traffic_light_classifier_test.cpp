#include <gtest/gtest.h>

#include <opencv2/core.hpp>

#include "roadwatch/traffic_light_classifier.hpp"

using namespace roadwatch;

TEST(TrafficLightClassifier, SolidColors) {
    TrafficLightClassifier classifier;

    TrafficLightState red = classifier.classify(cv::Mat(20, 20, CV_8UC3, cv::Scalar(0, 0, 255)));
    EXPECT_EQ(red.color, TrafficLightColor::RED);
    EXPECT_FLOAT_EQ(red.confidence, 1.0f);

    EXPECT_EQ(classifier.classify(cv::Mat(20, 20, CV_8UC3, cv::Scalar(0, 255, 0))).color,
              TrafficLightColor::GREEN);
    EXPECT_EQ(classifier.classify(cv::Mat(20, 20, CV_8UC3, cv::Scalar(0, 255, 255))).color,
              TrafficLightColor::YELLOW);
}

TEST(TrafficLightClassifier, DominantColorShareIsConfidence) {
    cv::Mat roi(20, 20, CV_8UC3, cv::Scalar(0, 0, 0));
    roi(cv::Rect(0, 0, 20, 15)).setTo(cv::Scalar(0, 0, 255));
    roi(cv::Rect(0, 15, 20, 5)).setTo(cv::Scalar(0, 255, 0));

    TrafficLightState s = TrafficLightClassifier().classify(roi);
    EXPECT_EQ(s.color, TrafficLightColor::RED);
    EXPECT_NEAR(s.confidence, 0.75f, 1e-4);
}

TEST(TrafficLightClassifier, DarkOrEmptyCropIsUnknown) {
    TrafficLightClassifier classifier;
    EXPECT_EQ(classifier.classify(cv::Mat()).color, TrafficLightColor::UNKNOWN);
    EXPECT_EQ(classifier.classify(cv::Mat(20, 20, CV_8UC3, cv::Scalar(0, 0, 0))).color, TrafficLightColor::UNKNOWN);
    EXPECT_EQ(classifier.classify(cv::Mat(20, 20, CV_8UC1, cv::Scalar(255))).color, TrafficLightColor::UNKNOWN);
}

TEST(TrafficLightClassifier, FewLitPixelsAreUnknown) {
    cv::Mat roi(100, 100, CV_8UC3, cv::Scalar(0, 0, 0));
    roi.at<cv::Vec3b>(0, 0) = cv::Vec3b(0, 0, 255);
    EXPECT_EQ(TrafficLightClassifier().classify(roi).color, TrafficLightColor::UNKNOWN);
}
