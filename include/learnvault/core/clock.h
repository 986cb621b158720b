#pragma once

#include <chrono>
#include <mutex>

namespace learnvault {

class Clock {
public:
    virtual ~Clock() = default;

    // Thread-safe. Monotonic time for interval decisions.
    virtual std::chrono::steady_clock::time_point Now() const = 0;

    // Thread-safe. Wall time for reporting only.
    virtual std::chrono::system_clock::time_point WallNow() const = 0;
};

// Process clock backed by std::chrono; lives for the whole program.
const Clock& SystemClock();

// A clock that only moves when told to. Both timelines advance together.
class ManualClock final : public Clock {
public:
    ManualClock();

    std::chrono::steady_clock::time_point Now() const override;
    std::chrono::system_clock::time_point WallNow() const override;

    // Thread-safe
    void Advance(std::chrono::milliseconds d);

private:
    mutable std::mutex mu_;
    std::chrono::steady_clock::time_point steady_;
    std::chrono::system_clock::time_point wall_;
};

} // namespace learnvault
