#include "roadwatch/helmet_rule.hpp"

#include <algorithm>
#include <sstream>

namespace roadwatch {

bool is_rider(const cv::Rect2f& person, const cv::Rect2f& vehicle, float containment) {
    if (person.area() <= 0.0f) return false;
    const cv::Rect2f inter = person & vehicle;
    if (!inter.empty() && inter.area() / person.area() >= containment) return true;

    // Seated rider: feet inside the upper half of the vehicle, torso above it
    const float bottom = person.y + person.height;
    const bool feet_on_vehicle = bottom >= vehicle.y && bottom <= vehicle.y + vehicle.height * 0.5f;
    const float overlap_x = std::min(person.x + person.width, vehicle.x + vehicle.width) -
                            std::max(person.x, vehicle.x);
    return feet_on_vehicle && overlap_x > 0.0f && overlap_x / person.width >= containment;
}

bool wears_helmet(const cv::Rect2f& rider, const std::vector<Detection>& helmets,
                  float head_region_ratio, float min_overlap) {
    const cv::Rect2f head(rider.x, rider.y, rider.width, rider.height * head_region_ratio);
    for (const auto& helmet : helmets) {
        if (helmet.bbox.area() <= 0.0f) continue;
        const cv::Rect2f inter = helmet.bbox & head;
        if (!inter.empty() && inter.area() / helmet.bbox.area() >= min_overlap) return true;
    }
    return false;
}

HelmetRule::HelmetRule(const PipelineConfig& cfg)
    : rider_containment_(cfg.rider_containment),
      head_region_ratio_(cfg.head_region_ratio),
      helmet_overlap_(cfg.helmet_overlap),
      confirmation_frames_(std::max(1, cfg.helmet_confirmation_frames)) {}

std::optional<ViolationEvent> HelmetRule::evaluate(const Track& track, const FrameContext& ctx) {
    if (!is_two_wheeler(track.vehicle_type) || !observed_now(track, ctx)) return std::nullopt;

    const cv::Rect2f& vehicle = track.last().bbox;
    std::vector<int> bare_heads;
    bool any_rider = false;
    for (int pid : ctx.person_ids) {
        const Track* person = ctx.tracks.find(pid);
        if (person == nullptr || !is_rider(person->last().bbox, vehicle, rider_containment_)) continue;
        any_rider = true;
        if (!wears_helmet(person->last().bbox, ctx.obs.helmets, head_region_ratio_, helmet_overlap_)) {
            bare_heads.push_back(pid);
        }
    }

    int& streak = streaks_[track.id];
    if (!any_rider || bare_heads.empty()) {
        streak = 0;
        return std::nullopt;
    }
    if (++streak < confirmation_frames_) return std::nullopt;

    ViolationEvent ev = make_event(track, kind(), ctx);
    ev.metric = streak;
    std::ostringstream oss;
    oss << "riders without helmet:";
    for (int pid : bare_heads) oss << " " << pid;
    ev.detail = oss.str();
    return ev;
}

}  // namespace roadwatch
