#pragma once

#include <cstdint>
#include <map>
#include <optional>

#include "roadwatch/rule_context.hpp"

namespace roadwatch {

// Flags a vehicle whose reference point moves from the before side to the
// after side of the stop line while the light is red.
//
// A crossing seen while the light state is unknown is kept pending for the
// lag window, so a red state reported a few frames late still counts. This is
// the only rule that keeps evaluating lost tracks.
class RedLightRule {
public:
    ViolationKind kind() const { return ViolationKind::RED_LIGHT; }

    std::optional<ViolationEvent> evaluate(const Track& track, const FrameContext& ctx);
    void prune(const TrackTable& table) { prune_states(states_, table); }

private:
    struct Crossing {
        int64_t frame_index{0};
        cv::Point2f point;
        float distance{0.0f};
        cv::Rect2f bbox;
    };

    struct State {
        bool initialized{false};
        LineSide side{LineSide::NONE};
        cv::Point2f last_before;
        std::optional<Crossing> pending;
    };

    std::optional<Crossing> track_side(const Track& track, const FrameContext& ctx, State& st);
    ViolationEvent build(const Track& track, const FrameContext& ctx, const Crossing& c,
                         const TrafficLightState& light) const;

    std::map<int, State> states_;
};

}  // namespace roadwatch
