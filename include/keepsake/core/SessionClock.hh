#pragma once

#include <chrono>

namespace keepsake {

/// Frame-driven session timer. elapsed() is the offset restored from a
/// resumed save plus the time ticked since.
class SessionClock {
  public:
    void tick(float dt);

    void pause() { paused_ = true; }
    void resume() { paused_ = false; }
    bool paused() const { return paused_; }

    /// Restart from `offset` (zero for a fresh session).
    void reset(std::chrono::milliseconds offset = std::chrono::milliseconds{0});

    std::chrono::milliseconds offset() const { return offset_; }
    std::chrono::milliseconds elapsed() const;

  private:
    std::chrono::milliseconds offset_{0};
    double runningSeconds_ = 0.0;
    bool paused_ = false;
};

} // namespace keepsake
