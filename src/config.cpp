#include "roadwatch/config.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace roadwatch {

static bool arg_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

ViolationLine parse_line(const std::string& text, float tolerance) {
    std::vector<float> values;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        try {
            size_t used = 0;
            values.push_back(std::stof(item, &used));
            if (used != item.size()) throw std::invalid_argument(item);
        } catch (const std::exception&) {
            throw std::invalid_argument("line coordinate is not a number: '" + item + "'");
        }
    }
    if (values.size() != 4) {
        throw std::invalid_argument("line must be x1,y1,x2,y2, got '" + text + "'");
    }
    ViolationLine line;
    line.p1 = cv::Point2f(values[0], values[1]);
    line.p2 = cv::Point2f(values[2], values[3]);
    line.tolerance = tolerance;
    if (line.length() <= 0.0f) {
        throw std::invalid_argument("line endpoints must differ");
    }
    return line;
}

void validate(const PipelineConfig& cfg) {
    if (cfg.fps <= 0.0) throw std::invalid_argument("fps must be positive");
    if (cfg.pixel_to_meter_ratio <= 0.0) throw std::invalid_argument("pixel_to_meter_ratio must be positive");
    if (cfg.speed_limit_kmph <= 0.0) throw std::invalid_argument("speed_limit_kmph must be positive");
    if (cfg.speed_window < 2) throw std::invalid_argument("speed_window needs at least 2 observations");
    if (cfg.speed_confirmation_frames < 1 || cfg.helmet_confirmation_frames < 1) {
        throw std::invalid_argument("confirmation windows must be at least 1 frame");
    }
    if (cfg.max_missed_frames < 0 || cfg.lost_retention_frames < 0) {
        throw std::invalid_argument("track retention values must not be negative");
    }
    if (cfg.line_tolerance < 0.0f) throw std::invalid_argument("line_tolerance must not be negative");
    if (cfg.track_affinity_floor < 0.0f || cfg.track_affinity_floor > 1.0f) {
        throw std::invalid_argument("track_affinity_floor must be within [0,1]");
    }
    try {
        std::regex probe(cfg.plate_pattern);
        (void)probe;
    } catch (const std::regex_error& e) {
        throw std::invalid_argument("invalid plate pattern '" + cfg.plate_pattern + "': " + e.what());
    }
}

AppConfig parse_args(int argc, char** argv) {
    AppConfig cfg;
    PipelineConfig& p = cfg.pipeline;
    std::string line_text;

    // Environment first, flags override
    if (const char* env = std::getenv("ROADWATCH_DETECTIONS")) cfg.detections_path = env;
    if (const char* env = std::getenv("ROADWATCH_EVENTS")) cfg.events_path = env;
    if (const char* env = std::getenv("ROADWATCH_FPS")) p.fps = std::atof(env);
    if (const char* env = std::getenv("ROADWATCH_SPEED_LIMIT")) p.speed_limit_kmph = std::atof(env);
    if (const char* env = std::getenv("ROADWATCH_PLATE_PATTERN")) p.plate_pattern = env;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        auto next = [&](int offset = 1) -> const char* {
            if (i + offset < argc) return argv[i + offset];
            return nullptr;
        };

        if (arg_eq(arg, "--detections") && next()) {
            cfg.detections_path = next();
            i++;
        } else if (arg_eq(arg, "--events") && next()) {
            cfg.events_path = next();
            i++;
        } else if (arg_eq(arg, "--fps") && next()) {
            p.fps = std::atof(next());
            i++;
        } else if (arg_eq(arg, "--speed-limit") && next()) {
            p.speed_limit_kmph = std::atof(next());
            i++;
        } else if (arg_eq(arg, "--vehicle-conf") && next()) {
            p.vehicle_confidence = static_cast<float>(std::atof(next()));
            i++;
        } else if (arg_eq(arg, "--helmet-conf") && next()) {
            p.helmet_confidence = static_cast<float>(std::atof(next()));
            i++;
        } else if (arg_eq(arg, "--light-conf") && next()) {
            p.traffic_light_confidence = static_cast<float>(std::atof(next()));
            i++;
        } else if (arg_eq(arg, "--line") && next()) {
            line_text = next();
            i++;
        } else if (arg_eq(arg, "--line-tolerance") && next()) {
            p.line_tolerance = static_cast<float>(std::atof(next()));
            i++;
        } else if (arg_eq(arg, "--px-to-m") && next()) {
            p.pixel_to_meter_ratio = std::atof(next());
            i++;
        } else if (arg_eq(arg, "--plate-pattern") && next()) {
            p.plate_pattern = next();
            i++;
        } else if (arg_eq(arg, "--affinity") && next()) {
            p.track_affinity_floor = static_cast<float>(std::atof(next()));
            i++;
        } else if (arg_eq(arg, "--helmet-window") && next()) {
            p.helmet_confirmation_frames = std::atoi(next());
            i++;
        } else if (arg_eq(arg, "--speed-window") && next()) {
            p.speed_window = std::atoi(next());
            i++;
        } else if (arg_eq(arg, "--queue") && next()) {
            cfg.queue_size = std::atoi(next());
            i++;
        } else if (arg_eq(arg, "--workers") && next()) {
            cfg.decode_workers = std::atoi(next());
            i++;
        } else if (arg_eq(arg, "--help")) {
            std::cout << "Usage: roadwatch [--detections <jsonl>] [--events <jsonl>] [--fps <float>]\n"
                      << "                 [--speed-limit <kmph>] [--vehicle-conf <t>] [--helmet-conf <t>]\n"
                      << "                 [--light-conf <t>] [--line x1,y1,x2,y2] [--line-tolerance <px>]\n"
                      << "                 [--px-to-m <ratio>] [--plate-pattern <regex>] [--affinity <iou>]\n"
                      << "                 [--helmet-window <frames>] [--speed-window <obs>] [--queue <n>]\n"
                      << "                 [--workers <n>]\n";
            std::exit(0);
        } else {
            std::cerr << "[WARN] Ignoring unknown argument: " << arg << std::endl;
        }
    }

    p.line.tolerance = p.line_tolerance;
    if (!line_text.empty()) {
        p.line = parse_line(line_text, p.line_tolerance);
        p.has_configured_line = true;
    }
    if (cfg.queue_size < 1) cfg.queue_size = 1;
    if (cfg.decode_workers < 1) cfg.decode_workers = 1;
    return cfg;
}

}  // namespace roadwatch
