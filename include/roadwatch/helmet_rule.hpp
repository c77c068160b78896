#pragma once

#include <map>
#include <optional>
#include <vector>

#include "roadwatch/config.hpp"
#include "roadwatch/rule_context.hpp"

namespace roadwatch {

// Person box counts as a rider of the vehicle box when it is mostly inside it
// or sits on top of it.
bool is_rider(const cv::Rect2f& person, const cv::Rect2f& vehicle, float containment);

// True when a helmet box overlaps the head region of the rider.
bool wears_helmet(const cv::Rect2f& rider, const std::vector<Detection>& helmets,
                  float head_region_ratio, float min_overlap);

class HelmetRule {
public:
    explicit HelmetRule(const PipelineConfig& cfg);

    ViolationKind kind() const { return ViolationKind::HELMET; }

    std::optional<ViolationEvent> evaluate(const Track& track, const FrameContext& ctx);
    void prune(const TrackTable& table) { prune_states(streaks_, table); }

private:
    float rider_containment_;
    float head_region_ratio_;
    float helmet_overlap_;
    int confirmation_frames_;
    std::map<int, int> streaks_;  // consecutive frames with a bare-headed rider
};

}  // namespace roadwatch
