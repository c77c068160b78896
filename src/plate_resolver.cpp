#include "roadwatch/plate_resolver.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>

namespace roadwatch {

namespace {
// Plates sit in the lower part of the vehicle box
constexpr float kPlateAnchorRatio = 0.75f;
}  // namespace

const char* plate_outcome_to_string(PlateOutcome o) {
    switch (o) {
        case PlateOutcome::VALID: return "valid";
        case PlateOutcome::INVALID_FORMAT: return "invalid_format";
        case PlateOutcome::UNREADABLE: return "unreadable";
        case PlateOutcome::MISSING: return "missing";
    }
    return "unreadable";
}

std::string normalize_plate_text(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());
    for (char c : raw) {
        const unsigned char u = static_cast<unsigned char>(c);
        if (std::isalnum(u)) out.push_back(static_cast<char>(std::toupper(u)));
    }
    return out;
}

PlateValidator::PlateValidator(const std::string& pattern, float min_ocr_confidence)
    : pattern_(pattern), min_ocr_confidence_(min_ocr_confidence) {}

bool PlateValidator::matches(const std::string& normalized) const {
    return std::regex_match(normalized, pattern_);
}

PlateOutcome PlateValidator::check(const OcrResult& result) const {
    const std::string text = normalize_plate_text(result.text);
    if (text.empty() || result.confidence < min_ocr_confidence_) return PlateOutcome::UNREADABLE;
    return matches(text) ? PlateOutcome::VALID : PlateOutcome::INVALID_FORMAT;
}

PlateResolver::PlateResolver(const PipelineConfig& cfg, OcrEngine* ocr)
    : validator_(cfg.plate_pattern, cfg.ocr_confidence),
      ocr_(ocr),
      stable_frames_(std::max(1, cfg.plate_stable_frames)),
      search_frames_(cfg.plate_search_frames) {}

std::optional<std::string> PlateResolver::plate_for(int track_id) const {
    auto it = states_.find(track_id);
    if (it == states_.end() || it->second.text.empty()) return std::nullopt;
    return it->second.text;
}

std::optional<size_t> PlateResolver::nearest_plate(const cv::Rect2f& vehicle, const FrameContext& ctx) const {
    const cv::Point2f anchor(vehicle.x + vehicle.width * 0.5f, vehicle.y + vehicle.height * kPlateAnchorRatio);
    std::optional<size_t> best;
    float best_dist = 0.0f;
    const auto& plates = ctx.obs.plates;
    for (size_t i = 0; i < plates.size(); ++i) {
        const cv::Point2f c = center_of(plates[i].bbox);
        if (!vehicle.contains(c)) continue;
        const cv::Point2f d = c - anchor;
        const float dist = std::sqrt(d.dot(d));
        if (!best || dist < best_dist ||
            (dist == best_dist && plates[i].confidence > plates[*best].confidence)) {
            best = i;
            best_dist = dist;
        }
    }
    return best;
}

std::optional<ViolationEvent> PlateResolver::evaluate(const Track& track, const FrameContext& ctx) {
    if (!observed_now(track, ctx)) return std::nullopt;
    if (static_cast<int>(track.observations.size()) < stable_frames_) return std::nullopt;

    State& st = states_[track.id];
    if (st.resolved) return std::nullopt;

    const auto plate_index = nearest_plate(track.last().bbox, ctx);
    if (!plate_index) {
        st.frames_without_plate++;
        if (search_frames_ <= 0 || st.frames_without_plate < search_frames_) return std::nullopt;
        st.resolved = true;
        ViolationEvent ev = make_event(track, kind(), ctx);
        ev.metric = 0.0;
        ev.detail = plate_outcome_to_string(PlateOutcome::MISSING);
        return ev;
    }
    if (ocr_ == nullptr) return std::nullopt;

    const Detection& plate = ctx.obs.plates[*plate_index];
    OcrResult result;
    try {
        result = ocr_->recognize(ctx.obs.frame_index, plate.bbox);
    } catch (const OcrUnavailableError&) {
        throw;
    } catch (const std::exception& e) {
        std::cerr << "[WARN] OCR error on track " << track.id << " frame " << ctx.obs.frame_index
                  << ": " << e.what() << std::endl;
        return std::nullopt;
    }
    if (result.status == OcrResult::Status::FAILED) {
        std::cerr << "[WARN] OCR gave no result for track " << track.id << " frame "
                  << ctx.obs.frame_index << std::endl;
        return std::nullopt;
    }

    const PlateOutcome outcome = validator_.check(result);
    st.resolved = true;
    st.text = normalize_plate_text(result.text);
    if (outcome == PlateOutcome::VALID) return std::nullopt;

    ViolationEvent ev = make_event(track, kind(), ctx);
    ev.confidence = std::min(plate.confidence, track.last().confidence);
    ev.metric = result.confidence;
    ev.detail = std::string(plate_outcome_to_string(outcome)) + (st.text.empty() ? "" : ": " + st.text);
    ev.plate_text = st.text;
    return ev;
}

}  // namespace roadwatch
