#pragma once

#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>

#include "roadwatch/plate_resolver.hpp"
#include "roadwatch/types.hpp"

namespace roadwatch {

struct PlateReading {
    cv::Rect2f box;
    OcrResult result;
};

// One frame's detector output plus the OCR readings of its plate detections.
struct FrameBundle {
    Frame frame;
    std::vector<PlateReading> plates;
};

// Parses one JSONL line (a roadwatch.proto.FrameRecord). Throws
// std::runtime_error on malformed JSON or unknown detection classes.
FrameBundle parse_frame_record(const std::string& line, double fps);

// Line reader over a recorded detector output file. next_line() may be called
// from several threads; each line gets the next sequence number.
class DetectionSource {
public:
    explicit DetectionSource(const std::string& path);

    bool next_line(int64_t& sequence, std::string& line);
    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::ifstream in_;
    int64_t sequence_{0};
    std::mutex mu_;
};

// OcrEngine answering from the readings recorded alongside the current frame.
class RecordedOcr : public OcrEngine {
public:
    void set_frame(int64_t frame_index, std::vector<PlateReading> readings);
    OcrResult recognize(int64_t frame_index, const cv::Rect2f& plate_box) override;

private:
    int64_t frame_index_{-1};
    std::vector<PlateReading> readings_;
};

}  // namespace roadwatch
