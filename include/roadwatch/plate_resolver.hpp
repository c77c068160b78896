#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <regex>
#include <stdexcept>
#include <string>

#include "roadwatch/config.hpp"
#include "roadwatch/rule_context.hpp"

namespace roadwatch {

struct OcrResult {
    enum class Status { OK, FAILED };

    Status status{Status::FAILED};  // FAILED: timeout or transient error, no evidence
    std::string text;
    float confidence{0.0f};
};

// Raised by an OCR collaborator that will not recover; ends the stream.
class OcrUnavailableError : public std::runtime_error {
public:
    explicit OcrUnavailableError(const std::string& what) : std::runtime_error(what) {}
};

// External OCR collaborator, keyed by the plate detection's box.
class OcrEngine {
public:
    virtual ~OcrEngine() = default;
    virtual OcrResult recognize(int64_t frame_index, const cv::Rect2f& plate_box) = 0;
};

enum class PlateOutcome { VALID, INVALID_FORMAT, UNREADABLE, MISSING };

const char* plate_outcome_to_string(PlateOutcome o);

// Uppercases and drops everything that is not A-Z or 0-9.
std::string normalize_plate_text(const std::string& raw);

class PlateValidator {
public:
    PlateValidator(const std::string& pattern, float min_ocr_confidence);

    PlateOutcome check(const OcrResult& result) const;
    bool matches(const std::string& normalized) const;

private:
    std::regex pattern_;
    float min_ocr_confidence_;
};

// Binds a plate to each stable vehicle track once and reports invalid,
// unreadable and missing plates. `ocr` is not owned and may be null, in which
// case only missing plates are reported.
class PlateResolver {
public:
    PlateResolver(const PipelineConfig& cfg, OcrEngine* ocr);

    ViolationKind kind() const { return ViolationKind::PLATE; }

    std::optional<ViolationEvent> evaluate(const Track& track, const FrameContext& ctx);
    void prune(const TrackTable& table) { prune_states(states_, table); }

    // Normalized text of a valid or invalid plate read for the track.
    std::optional<std::string> plate_for(int track_id) const;

private:
    struct State {
        bool resolved{false};
        int frames_without_plate{0};
        std::string text;
    };

    std::optional<size_t> nearest_plate(const cv::Rect2f& vehicle, const FrameContext& ctx) const;

    PlateValidator validator_;
    OcrEngine* ocr_;
    int stable_frames_;
    int search_frames_;
    std::map<int, State> states_;
};

}  // namespace roadwatch
