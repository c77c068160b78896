#pragma once

#include <vector>

#include "roadwatch/detection_intake.hpp"
#include "roadwatch/track_association.hpp"
#include "roadwatch/types.hpp"
#include "roadwatch/violation_line.hpp"

namespace roadwatch {

// Everything a rule may read while evaluating one track at one frame.
struct FrameContext {
    const FrameObservations& obs;
    const TrackTable& tracks;
    const ViolationLineEngine& line;
    const std::vector<int>& person_ids;  // person tracks observed this frame
};

inline bool observed_now(const Track& track, const FrameContext& ctx) {
    return track.last_seen_frame == ctx.obs.frame_index;
}

inline ViolationEvent make_event(const Track& track, ViolationKind kind, const FrameContext& ctx) {
    ViolationEvent ev;
    ev.track_id = track.id;
    ev.kind = kind;
    ev.frame_index = ctx.obs.frame_index;
    ev.timestamp_sec = ctx.obs.timestamp_sec;
    ev.bbox = track.last().bbox;
    ev.confidence = track.last().confidence;
    return ev;
}

// Drops per-track rule state for tracks that were purged from the table.
template <typename StateMap>
void prune_states(StateMap& states, const TrackTable& table) {
    for (auto it = states.begin(); it != states.end();) {
        if (table.find(it->first) == nullptr) {
            it = states.erase(it);
        } else {
            ++it;
        }
    }
}

}  // namespace roadwatch
