#pragma once

#include <chrono>
#include <limits>
#include <optional>

// Wall-clock budget for a job. Default-constructed means "no deadline".
class Deadline {
public:
    Deadline() = default;

    static Deadline after_seconds(int secs) {
        Deadline d;
        if (secs > 0) d.at_ = std::chrono::steady_clock::now() + std::chrono::seconds(secs);
        return d;
    }

    bool bounded() const { return at_.has_value(); }

    // Milliseconds left, -1 when unbounded, 0 once expired. Saturates at INT_MAX.
    int remaining_ms() const {
        if (!at_) return -1;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            *at_ - std::chrono::steady_clock::now()).count();
        if (left <= 0) return 0;
        if (left >= std::numeric_limits<int>::max()) return std::numeric_limits<int>::max();
        return static_cast<int>(left);
    }

private:
    std::optional<std::chrono::steady_clock::time_point> at_;
};
