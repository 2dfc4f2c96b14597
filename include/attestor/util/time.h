// ATTESTOR - Time Utilities
// Copyright (c) 2024 ATTESTOR Developers
// MIT License
//
// The protocol never accepts time from callers. Every deadline is checked
// against a Clock owned by the engine; tests drive a ManualClock.

#ifndef ATTESTOR_UTIL_TIME_H
#define ATTESTOR_UTIL_TIME_H

#include <atomic>
#include <cstdint>
#include <string>

namespace attestor {
namespace util {

/// Get current Unix timestamp in seconds
int64_t GetTime();

// ============================================================================
// Clock
// ============================================================================

/// Source of the trusted "now" (Unix seconds)
class Clock {
public:
    virtual ~Clock() = default;
    virtual int64_t Now() const = 0;
};

/// Wall-clock time
class SystemClock : public Clock {
public:
    int64_t Now() const override { return GetTime(); }
};

/// Clock that only moves when told to
class ManualClock : public Clock {
public:
    explicit ManualClock(int64_t start = 0) : now_(start) {}

    int64_t Now() const override { return now_.load(); }

    void Set(int64_t timestamp) { now_.store(timestamp); }
    void Advance(int64_t seconds) { now_.fetch_add(seconds); }

private:
    std::atomic<int64_t> now_;
};

// ============================================================================
// Formatting
// ============================================================================

/// Format Unix seconds as ISO 8601 UTC (e.g., "2024-01-15T10:30:00Z")
std::string FormatISO8601(int64_t timestamp);

/// Format seconds as "1d 2h 3m 4s" (zero components omitted)
std::string FormatDuration(int64_t seconds);

} // namespace util
} // namespace attestor

#endif // ATTESTOR_UTIL_TIME_H
