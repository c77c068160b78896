#pragma once

#include <atomic>
#include <mutex>
#include <string>

#include "roadwatch/types.hpp"

namespace roadwatch {

// Appends violation events as JSON lines (roadwatch.proto.ViolationRecord).
class EventPublisher {
public:
    explicit EventPublisher(const std::string& path);

    void publish(const ViolationEvent& event);
    int published() const { return published_; }

    static std::string to_json(const ViolationEvent& event);

private:
    std::string path_;
    std::mutex mu_;
    std::atomic<int> published_{0};
};

}  // namespace roadwatch
