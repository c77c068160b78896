#include "roadwatch/violation_line.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <map>

#include <opencv2/imgproc.hpp>

namespace roadwatch {

namespace {
constexpr float kSpanMargin = 50.0f;
// Sample buffer holds at most this many times line_min_samples points
constexpr size_t kSampleCapFactor = 8;
}  // namespace

ViolationLineEngine::ViolationLineEngine(const PipelineConfig& cfg)
    : cfg_(cfg), lag_frames_(std::max(0, cfg.light_lag_frames)) {
    if (cfg_.has_configured_line) {
        line_ = cfg_.line;
        line_->tolerance = cfg_.line_tolerance;
    }
}

void ViolationLineEngine::observe(const FrameObservations& obs, const TrackTable& table,
                                  const std::vector<int>& updated_vehicle_ids) {
    light_history_.emplace_back(obs.frame_index, obs.light);
    while (light_history_.size() > static_cast<size_t>(lag_frames_) + 1) {
        light_history_.pop_front();
    }

    if (line_) return;

    frames_seen_++;
    frame_width_ = std::max(frame_width_, obs.width);
    frame_height_ = std::max(frame_height_, obs.height);
    if (!obs.traffic_lights.empty()) {
        auto best = std::max_element(obs.traffic_lights.begin(), obs.traffic_lights.end(),
                                     [](const Detection& a, const Detection& b) {
                                         return a.confidence < b.confidence;
                                     });
        light_box_ = best->bbox;
    }

    for (int id : updated_vehicle_ids) {
        const Track* track = table.find(id);
        if (track == nullptr || track->observations.size() < 2) continue;
        const auto& obs_list = track->observations;
        const cv::Point2f a = reference_point(obs_list[obs_list.size() - 2].bbox);
        const cv::Point2f b = reference_point(obs_list.back().bbox);
        const cv::Point2f d = b - a;
        if (std::sqrt(d.dot(d)) <= cfg_.stopped_motion_px) {
            samples_.push_back(b);
        }
    }
    const size_t cap = kSampleCapFactor * static_cast<size_t>(std::max(2, cfg_.line_min_samples));
    while (samples_.size() > cap) {
        samples_.pop_front();
    }

    if (frames_seen_ >= cfg_.line_warmup_frames) {
        try_establish(obs.frame_index);
    }
}

std::optional<ViolationLine> ViolationLineEngine::fit_from_samples() const {
    if (static_cast<int>(samples_.size()) < std::max(2, cfg_.line_min_samples)) return std::nullopt;

    // Densest horizontal band of stopped reference points
    const float band = std::max(1.0f, cfg_.line_tolerance);
    std::map<int, std::vector<cv::Point2f>> bands;
    for (const auto& p : samples_) {
        bands[static_cast<int>(std::floor(p.y / band))].push_back(p);
    }

    const float light_y = light_box_ ? light_box_->y + light_box_->height : 0.0f;
    int best_key = bands.begin()->first;
    for (const auto& entry : bands) {
        const size_t count = entry.second.size();
        const size_t best_count = bands[best_key].size();
        if (count > best_count) {
            best_key = entry.first;
        } else if (count == best_count && light_box_ && entry.first != best_key) {
            const float d_entry = std::fabs((entry.first + 0.5f) * band - light_y);
            const float d_best = std::fabs((best_key + 0.5f) * band - light_y);
            if (d_entry < d_best) best_key = entry.first;
        }
    }
    const std::vector<cv::Point2f>& cluster = bands[best_key];
    if (static_cast<int>(cluster.size()) < cfg_.line_min_samples) return std::nullopt;

    float min_x = cluster.front().x;
    float max_x = cluster.front().x;
    float mean_y = 0.0f;
    for (const auto& p : cluster) {
        min_x = std::min(min_x, p.x);
        max_x = std::max(max_x, p.x);
        mean_y += p.y;
    }
    mean_y /= static_cast<float>(cluster.size());

    float x_begin = min_x - kSpanMargin;
    float x_end = max_x + kSpanMargin;
    if (frame_width_ > 0) {
        x_begin = 0.0f;
        x_end = static_cast<float>(frame_width_);
    }

    ViolationLine line;
    line.tolerance = cfg_.line_tolerance;
    // Queued vehicles wait just before the line; the line sits at the queue front.
    const float offset = cfg_.line_tolerance;

    cv::Vec4f fit;
    bool sloped = false;
    if (max_x - min_x > 1.0f) {
        cv::fitLine(cluster, fit, cv::DIST_L2, 0, 0.01, 0.01);
        sloped = std::fabs(fit[0]) >= 0.5f;
    }
    if (sloped) {
        const float slope = fit[1] / fit[0];
        line.p1 = cv::Point2f(x_begin, fit[3] + (x_begin - fit[2]) * slope + offset);
        line.p2 = cv::Point2f(x_end, fit[3] + (x_end - fit[2]) * slope + offset);
    } else {
        line.p1 = cv::Point2f(x_begin, mean_y + offset);
        line.p2 = cv::Point2f(x_end, mean_y + offset);
    }
    return line;
}

void ViolationLineEngine::try_establish(int64_t frame_index) {
    std::optional<ViolationLine> fitted = fit_from_samples();
    if (!fitted && frame_height_ > 0) {
        const float y = static_cast<float>(frame_height_) * cfg_.fallback_line_ratio;
        const float width = static_cast<float>(frame_width_);
        ViolationLine fallback;
        fallback.p1 = cv::Point2f(std::min(kSpanMargin, width * 0.5f), y);
        fallback.p2 = cv::Point2f(std::max(width - kSpanMargin, width * 0.5f + 1.0f), y);
        fallback.tolerance = cfg_.line_tolerance;
        fitted = fallback;
        std::cerr << "[WARN] Not enough stopped vehicles (" << samples_.size()
                  << ") to derive the stop line; using fallback at y=" << y << std::endl;
    }
    if (!fitted) return;  // frame size unknown, keep sampling

    line_ = fitted;
    derived_ = true;
    samples_.clear();
    std::cout << "[INFO] Stop line established at frame " << frame_index << ": ("
              << line_->p1.x << "," << line_->p1.y << ")-(" << line_->p2.x << "," << line_->p2.y
              << ") tolerance " << line_->tolerance << std::endl;
}

LineSide ViolationLineEngine::classify(const cv::Point2f& p) const {
    if (!line_) return LineSide::NONE;
    const float d = line_->signed_distance(p);
    if (d < -line_->tolerance) return LineSide::BEFORE;
    if (d > line_->tolerance) return LineSide::AFTER;
    return LineSide::NONE;
}

std::optional<cv::Point2f> ViolationLineEngine::crossing_point(const cv::Point2f& a,
                                                               const cv::Point2f& b) const {
    if (!line_) return std::nullopt;
    const float da = line_->signed_distance(a);
    const float db = line_->signed_distance(b);
    if (da == db || (da > 0.0f) == (db > 0.0f)) return std::nullopt;

    const float t = da / (da - db);
    const cv::Point2f hit = a + (b - a) * t;

    const float len = line_->length();
    const cv::Point2f dir = (line_->p2 - line_->p1) * (1.0f / len);
    const float along = (hit - line_->p1).dot(dir);
    if (along < -line_->tolerance || along > len + line_->tolerance) return std::nullopt;
    return hit;
}

TrafficLightState ViolationLineEngine::light_at(int64_t frame_index) const {
    for (auto it = light_history_.rbegin(); it != light_history_.rend(); ++it) {
        if (it->first == frame_index) return it->second;
    }
    return TrafficLightState{};
}

bool ViolationLineEngine::confidently(const TrafficLightState& s, TrafficLightColor color) const {
    return s.color == color && s.confidence >= cfg_.traffic_light_confidence;
}

TrafficLightState ViolationLineEngine::recent_confident_light(int64_t frame_index) const {
    for (auto it = light_history_.rbegin(); it != light_history_.rend(); ++it) {
        if (it->first >= frame_index) continue;
        if (frame_index - it->first > lag_frames_) break;
        if (it->second.color != TrafficLightColor::UNKNOWN &&
            it->second.confidence >= cfg_.traffic_light_confidence) {
            return it->second;
        }
    }
    return TrafficLightState{};
}

}  // namespace roadwatch
