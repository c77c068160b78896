#include "roadwatch/red_light_rule.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace roadwatch {

std::optional<RedLightRule::Crossing> RedLightRule::track_side(const Track& track, const FrameContext& ctx,
                                                               State& st) {
    const auto& history = track.observations;
    if (!st.initialized) {
        st.initialized = true;
        if (history.size() >= 2) {
            const cv::Point2f prev = reference_point(history[history.size() - 2].bbox);
            st.side = ctx.line.classify(prev);
            if (st.side == LineSide::BEFORE) st.last_before = prev;
        }
    }

    const cv::Point2f p = reference_point(track.last().bbox);
    const LineSide now = ctx.line.classify(p);
    if (now == LineSide::BEFORE) {
        st.side = LineSide::BEFORE;
        st.last_before = p;
        return std::nullopt;
    }
    if (now != LineSide::AFTER) return std::nullopt;  // inside the band keeps the previous side

    const LineSide was = st.side;
    st.side = LineSide::AFTER;
    if (was != LineSide::BEFORE) return std::nullopt;

    auto hit = ctx.line.crossing_point(st.last_before, p);
    if (!hit) return std::nullopt;
    return Crossing{ctx.obs.frame_index, *hit, ctx.line.line().signed_distance(p), track.last().bbox};
}

ViolationEvent RedLightRule::build(const Track& track, const FrameContext& ctx, const Crossing& c,
                                   const TrafficLightState& light) const {
    ViolationEvent ev = make_event(track, kind(), ctx);
    ev.bbox = c.bbox;
    ev.metric = c.distance;
    ev.confidence = std::min(ev.confidence, light.confidence);
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << "crossed at (" << c.point.x << "," << c.point.y
        << ") frame " << c.frame_index << " light " << light_color_to_string(light.color) << " "
        << std::setprecision(2) << light.confidence;
    ev.detail = oss.str();
    return ev;
}

std::optional<ViolationEvent> RedLightRule::evaluate(const Track& track, const FrameContext& ctx) {
    if (!ctx.line.has_line()) return std::nullopt;
    State& st = states_[track.id];
    const int64_t frame = ctx.obs.frame_index;
    const TrafficLightState light = ctx.line.light_at(frame);

    if (st.pending) {
        const Crossing pending = *st.pending;
        if (ctx.line.confidently(light, TrafficLightColor::RED)) {
            st.pending.reset();
            return build(track, ctx, pending, light);
        }
        if (light.color != TrafficLightColor::UNKNOWN && ctx.line.confidently(light, light.color)) {
            st.pending.reset();  // light resolved to green or yellow
        } else if (frame - pending.frame_index >= ctx.line.lag_frames()) {
            st.pending.reset();
        }
    }

    if (!observed_now(track, ctx)) return std::nullopt;
    auto crossing = track_side(track, ctx, st);
    if (!crossing) return std::nullopt;

    if (ctx.line.confidently(light, TrafficLightColor::RED)) {
        return build(track, ctx, *crossing, light);
    }
    if (ctx.line.confidently(light, TrafficLightColor::GREEN) ||
        ctx.line.confidently(light, TrafficLightColor::YELLOW)) {
        return std::nullopt;
    }

    // Light unknown at the crossing frame: fall back to the lag window
    const TrafficLightState recent = ctx.line.recent_confident_light(frame);
    if (recent.color == TrafficLightColor::RED) {
        return build(track, ctx, *crossing, recent);
    }
    if (recent.color == TrafficLightColor::UNKNOWN && ctx.line.lag_frames() > 0) {
        st.pending = crossing;
    }
    return std::nullopt;
}

}  // namespace roadwatch
