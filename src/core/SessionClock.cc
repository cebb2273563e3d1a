#include "keepsake/core/SessionClock.hh"

namespace keepsake {

void SessionClock::tick(float dt) {
    if (paused_ || dt <= 0.0f) {
        return;
    }
    runningSeconds_ += dt;
}

void SessionClock::reset(std::chrono::milliseconds offset) {
    offset_ = offset;
    runningSeconds_ = 0.0;
}

std::chrono::milliseconds SessionClock::elapsed() const {
    auto running = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::duration<double>(runningSeconds_));
    return offset_ + running;
}

} // namespace keepsake
