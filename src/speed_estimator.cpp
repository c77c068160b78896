#include "roadwatch/speed_estimator.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace roadwatch {

std::optional<double> estimate_speed_kmph(const Track& track, int window,
                                          double pixel_to_meter_ratio, double fps) {
    const size_t needed = static_cast<size_t>(std::max(2, window));
    const auto& history = track.observations;
    if (history.size() < needed || fps <= 0.0) return std::nullopt;

    const Observation& first = history[history.size() - needed];
    const Observation& last = history.back();
    const int64_t frames = last.frame_index - first.frame_index;
    if (frames <= 0) return std::nullopt;

    const cv::Point2f d = reference_point(last.bbox) - reference_point(first.bbox);
    const double pixels = std::sqrt(static_cast<double>(d.x) * d.x + static_cast<double>(d.y) * d.y);
    const double meters = pixels * pixel_to_meter_ratio;
    const double seconds = static_cast<double>(frames) / fps;
    return meters / seconds * kMpsToKmph;
}

SpeedRule::SpeedRule(const PipelineConfig& cfg)
    : window_(cfg.speed_window),
      ratio_(cfg.pixel_to_meter_ratio),
      fps_(cfg.fps),
      limit_kmph_(cfg.speed_limit_kmph),
      max_plausible_kmph_(cfg.max_plausible_kmph),
      confirmation_frames_(std::max(1, cfg.speed_confirmation_frames)) {}

std::optional<ViolationEvent> SpeedRule::evaluate(const Track& track, const FrameContext& ctx) {
    if (!observed_now(track, ctx)) return std::nullopt;

    const auto kmph = estimate_speed_kmph(track, window_, ratio_, fps_);
    if (!kmph) return std::nullopt;
    if (*kmph > max_plausible_kmph_) {
        // Association glitch rather than motion; neither counts nor resets
        std::cerr << "[WARN] Track " << track.id << " implausible speed " << *kmph
                  << " km/h at frame " << ctx.obs.frame_index << ", ignored" << std::endl;
        return std::nullopt;
    }

    int& streak = streaks_[track.id];
    if (*kmph <= limit_kmph_) {
        streak = 0;
        return std::nullopt;
    }
    if (++streak < confirmation_frames_) return std::nullopt;

    ViolationEvent ev = make_event(track, kind(), ctx);
    ev.metric = *kmph;
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << *kmph << " km/h over " << limit_kmph_ << " km/h limit";
    ev.detail = oss.str();
    return ev;
}

}  // namespace roadwatch
