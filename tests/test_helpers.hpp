#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "roadwatch/config.hpp"
#include "roadwatch/detection_intake.hpp"
#include "roadwatch/rule_context.hpp"
#include "roadwatch/track_association.hpp"
#include "roadwatch/types.hpp"
#include "roadwatch/violation_line.hpp"

namespace roadwatch {
namespace test {

Detection vehicle(float x, float y, float w, float h, const std::string& label = "car", float conf = 0.9f);
Detection person(float x, float y, float w, float h, float conf = 0.9f);
Detection helmet(float x, float y, float w, float h, float conf = 0.9f);
Detection plate(float x, float y, float w, float h, float conf = 0.8f);
Detection light(TrafficLightColor color, float conf = 0.9f);

Frame make_frame(int64_t index, std::vector<Detection> detections, int width = 1280, int height = 720,
                 double fps = 25.0);

// Stop line at y=320 across a 1280 px frame, tolerance 15.
PipelineConfig config_with_line();

// Vehicle track with one observation per listed frame, boxes shifted by `step` px in y per frame.
Track moving_track(int id, const std::vector<int64_t>& frames, const cv::Rect2f& first, float step,
                   VehicleType type = VehicleType::CAR);

// Owns everything a FrameContext refers to, for driving one rule directly.
struct RuleHarness {
    explicit RuleHarness(const PipelineConfig& cfg) : line(cfg) {}

    FrameContext at(int64_t frame_index) {
        obs.frame_index = frame_index;
        obs.timestamp_sec = static_cast<double>(frame_index) / 25.0;
        return FrameContext{obs, table, line, person_ids};
    }

    FrameObservations obs;
    TrackTable table;
    ViolationLineEngine line;
    std::vector<int> person_ids;
};

}  // namespace test
}  // namespace roadwatch
