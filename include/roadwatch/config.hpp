#pragma once

#include <string>

#include "roadwatch/types.hpp"

namespace roadwatch {

// Read-only knobs consumed by one stream's pipeline.
struct PipelineConfig {
    double fps{25.0};                     // nominal frame rate of the stream

    // Detection intake gates
    float vehicle_confidence{0.5f};
    float person_confidence{0.5f};
    float helmet_confidence{0.4f};
    float traffic_light_confidence{0.3f};
    float plate_confidence{0.3f};

    // Track association
    float track_affinity_floor{0.3f};     // minimum IoU for a match
    int max_missed_frames{5};             // misses before a track is marked lost
    int lost_retention_frames{10};        // frames a lost track is kept before purge

    // Violation line
    bool has_configured_line{false};
    ViolationLine line{};                 // used when has_configured_line
    float line_tolerance{15.0f};
    int line_warmup_frames{50};
    float stopped_motion_px{2.0f};
    int line_min_samples{3};
    float fallback_line_ratio{0.75f};
    int light_lag_frames{3};

    // Speed
    double speed_limit_kmph{40.0};
    double max_plausible_kmph{200.0};
    double pixel_to_meter_ratio{0.05};
    int speed_window{5};                  // observations used per estimate
    int speed_confirmation_frames{3};

    // Helmet
    float rider_containment{0.6f};
    float head_region_ratio{0.3f};
    float helmet_overlap{0.3f};
    int helmet_confirmation_frames{5};

    // Plate
    std::string plate_pattern{"^[A-Z]{2}[0-9]{1,2}[A-Z]{1,3}[0-9]{4}$"};
    float ocr_confidence{0.3f};
    int plate_stable_frames{3};
    int plate_search_frames{30};          // 0 disables missing-plate events
};

struct AppConfig {
    std::string detections_path{"detections.jsonl"};
    std::string events_path{"violations.jsonl"};
    int queue_size{8};
    int decode_workers{2};
    PipelineConfig pipeline{};
};

AppConfig parse_args(int argc, char** argv);

// Throws std::invalid_argument on values the pipeline cannot work with.
void validate(const PipelineConfig& cfg);

// Parses "x1,y1,x2,y2". Throws std::invalid_argument on malformed input.
ViolationLine parse_line(const std::string& text, float tolerance);

}  // namespace roadwatch
