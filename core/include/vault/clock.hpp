#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace vault {

/// Source of the substrate's notion of "now", in unix seconds.
class Clock {
public:
    virtual ~Clock() = default;
    virtual int64_t now() const = 0;
};

class SystemClock : public Clock {
public:
    int64_t now() const override {
        return std::chrono::duration_cast<std::chrono::seconds>(
                   std::chrono::system_clock::now().time_since_epoch())
            .count();
    }
};

/// Clock that only moves when told to.
class ManualClock : public Clock {
public:
    explicit ManualClock(int64_t start) : now_(start) {}

    int64_t now() const override { return now_.load(); }
    void advance(int64_t seconds) { now_.fetch_add(seconds); }

private:
    std::atomic<int64_t> now_;
};

} // namespace vault
