#include <learnvault/core/clock.h>

namespace learnvault {
namespace {

class RealClock final : public Clock {
public:
    std::chrono::steady_clock::time_point Now() const override { return std::chrono::steady_clock::now(); }
    std::chrono::system_clock::time_point WallNow() const override { return std::chrono::system_clock::now(); }
};

} // namespace

const Clock& SystemClock() {
    static const RealClock clock;
    return clock;
}

ManualClock::ManualClock()
    : steady_(std::chrono::steady_clock::now()), wall_(std::chrono::system_clock::now()) {}

std::chrono::steady_clock::time_point ManualClock::Now() const {
    std::lock_guard<std::mutex> lk(mu_);
    return steady_;
}

std::chrono::system_clock::time_point ManualClock::WallNow() const {
    std::lock_guard<std::mutex> lk(mu_);
    return wall_;
}

void ManualClock::Advance(std::chrono::milliseconds d) {
    std::lock_guard<std::mutex> lk(mu_);
    steady_ += d;
    wall_ += d;
}

} // namespace learnvault
