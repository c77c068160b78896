#pragma once

#include <cstdint>
#include <deque>
#include <optional>
#include <vector>

#include "roadwatch/config.hpp"
#include "roadwatch/detection_intake.hpp"
#include "roadwatch/track_association.hpp"
#include "roadwatch/types.hpp"

namespace roadwatch {

enum class LineSide { NONE, BEFORE, AFTER };

// Owns the stream's stop line and the recent traffic light history.
//
// The line is either configured or derived once from where stopped vehicles
// queue during the warm-up window. Once established it never changes.
class ViolationLineEngine {
public:
    explicit ViolationLineEngine(const PipelineConfig& cfg);

    // Feeds one frame: records the light state and, while no line exists,
    // samples stopped vehicles among the tracks updated this frame.
    void observe(const FrameObservations& obs, const TrackTable& table,
                 const std::vector<int>& updated_vehicle_ids);

    bool has_line() const { return line_.has_value(); }
    const ViolationLine& line() const { return *line_; }
    bool derived() const { return derived_; }

    // BEFORE / AFTER outside the tolerance band, NONE inside it.
    LineSide classify(const cv::Point2f& p) const;

    // Intersection of segment a->b with the line, accepted when it falls on
    // the line segment extended by the tolerance at both ends.
    std::optional<cv::Point2f> crossing_point(const cv::Point2f& a, const cv::Point2f& b) const;

    TrafficLightState light_at(int64_t frame_index) const;
    bool confidently(const TrafficLightState& s, TrafficLightColor color) const;

    // Most recent confident light state strictly before frame_index within the
    // lag window, or unknown.
    TrafficLightState recent_confident_light(int64_t frame_index) const;

    int lag_frames() const { return lag_frames_; }
    size_t sample_count() const { return samples_.size(); }

private:
    void try_establish(int64_t frame_index);
    std::optional<ViolationLine> fit_from_samples() const;

    PipelineConfig cfg_;
    std::optional<ViolationLine> line_;
    bool derived_{false};

    int frames_seen_{0};
    int frame_width_{0};
    int frame_height_{0};
    std::deque<cv::Point2f> samples_;
    std::optional<cv::Rect2f> light_box_;

    int lag_frames_;
    std::deque<std::pair<int64_t, TrafficLightState>> light_history_;
};

}  // namespace roadwatch
