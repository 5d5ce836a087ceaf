#pragma once

#include <chrono>
#include <string>
#include <map>

namespace phasecloud {
namespace core {

/**
 * Named stopwatch used for per-stage timing logs
 */
class Timer {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    void start(const std::string& name = "default") {
        startTimes_[name] = Clock::now();
    }

    /**
     * Milliseconds since start(name), 0 if never started
     */
    double stop(const std::string& name = "default") {
        auto endTime = Clock::now();
        auto it = startTimes_.find(name);
        if (it != startTimes_.end()) {
            auto duration = std::chrono::duration_cast<std::chrono::microseconds>(endTime - it->second);
            startTimes_.erase(it);
            return duration.count() / 1000.0;
        }
        return 0.0;
    }

    double elapsed(const std::string& name = "default") const {
        auto now = Clock::now();
        auto it = startTimes_.find(name);
        if (it != startTimes_.end()) {
            auto duration = std::chrono::duration_cast<std::chrono::microseconds>(now - it->second);
            return duration.count() / 1000.0;
        }
        return 0.0;
    }

private:
    std::map<std::string, TimePoint> startTimes_;
};

} // namespace core
} // namespace phasecloud
