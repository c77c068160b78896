#pragma once

#include <map>
#include <optional>

#include "roadwatch/config.hpp"
#include "roadwatch/rule_context.hpp"

namespace roadwatch {

constexpr double kMpsToKmph = 3.6;

// Speed over the last `window` observations of the track, in km/h.
// No estimate with fewer than max(2, window) observations or a zero interval.
std::optional<double> estimate_speed_kmph(const Track& track, int window,
                                          double pixel_to_meter_ratio, double fps);

class SpeedRule {
public:
    explicit SpeedRule(const PipelineConfig& cfg);

    ViolationKind kind() const { return ViolationKind::SPEED; }

    std::optional<ViolationEvent> evaluate(const Track& track, const FrameContext& ctx);
    void prune(const TrackTable& table) { prune_states(streaks_, table); }

private:
    int window_;
    double ratio_;
    double fps_;
    double limit_kmph_;
    double max_plausible_kmph_;
    int confirmation_frames_;
    std::map<int, int> streaks_;  // consecutive over-limit estimates per track
};

}  // namespace roadwatch
