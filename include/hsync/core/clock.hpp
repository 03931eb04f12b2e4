#pragma once

#include "hsync/core/result.hpp"

#include <atomic>
#include <chrono>
#include <string>

namespace hsync::core {

/// UTC instant with millisecond resolution; all record and outbox timestamps use it.
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

/**
 * @brief Source of "now" for stores, outbox and coordinator
 *
 * Injected everywhere time matters so tests can step time explicitly
 * (backoff windows, last-writer-wins ordering).
 */
class Clock {
public:
    virtual ~Clock() = default;
    virtual Timestamp now() const = 0;
};

class SystemClock : public Clock {
public:
    Timestamp now() const override {
        return std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
    }
};

/**
 * @brief Clock that only moves when told to
 */
class ManualClock : public Clock {
public:
    explicit ManualClock(Timestamp start = Timestamp{std::chrono::milliseconds{1700000000000}})
        : now_ms_(start.time_since_epoch().count()) {}

    Timestamp now() const override {
        return Timestamp{std::chrono::milliseconds{now_ms_.load()}};
    }

    void set(Timestamp t) { now_ms_.store(t.time_since_epoch().count()); }

    template<typename Rep, typename Period>
    void advance(std::chrono::duration<Rep, Period> delta) {
        now_ms_ += std::chrono::duration_cast<std::chrono::milliseconds>(delta).count();
    }

private:
    std::atomic<long long> now_ms_;
};

/// Render as "YYYY-MM-DDTHH:MM:SS.mmmZ".
std::string to_iso8601(Timestamp t);

/**
 * @brief Parse an ISO 8601 UTC timestamp
 *
 * Accepts an optional fractional part (truncated to milliseconds) and a
 * trailing "Z", "+00:00" or any other "+HH:MM" / "-HH:MM" offset, which is
 * folded into UTC. A missing offset is read as UTC.
 */
Result<Timestamp> parse_iso8601(const std::string& text);

} // namespace hsync::core
