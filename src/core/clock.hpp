#pragma once

#include <atomic>
#include <chrono>
#include "time_utils.hpp"

// Source of wall-clock time for every scheduling decision. Injected so that
// quota months, schedule windows and backoff can be driven deterministically.
class Clock {
public:
    virtual ~Clock() = default;
    virtual TimePoint now() const = 0;
};

class SystemClock : public Clock {
public:
    TimePoint now() const override { return std::chrono::system_clock::now(); }
};

// Clock that only moves when told to.
class ManualClock : public Clock {
public:
    explicit ManualClock(TimePoint start) : now_(start.time_since_epoch().count()) {}

    TimePoint now() const override {
        return TimePoint(TimePoint::duration(now_.load()));
    }

    void set(TimePoint t) { now_.store(t.time_since_epoch().count()); }

    template <typename Rep, typename Period>
    void advance(std::chrono::duration<Rep, Period> d) {
        now_.fetch_add(std::chrono::duration_cast<TimePoint::duration>(d).count());
    }

private:
    std::atomic<TimePoint::rep> now_;
};
