#include "FrameClock.h"
#include <cmath>

SteadyFrameClock::SteadyFrameClock()
    : origin_(clock::now()), last_(origin_) {
}

double SteadyFrameClock::elapsed(double /*requested_dt*/) {
    const auto t = clock::now();
    const double seconds = std::chrono::duration<double>(t - last_).count();
    last_ = t;
    return seconds;
}

double SteadyFrameClock::now() const {
    return std::chrono::duration<double>(clock::now() - origin_).count();
}

double ReplayFrameClock::elapsed(double requested_dt) {
    const double dt = (std::isfinite(requested_dt) && requested_dt > 0.0) ? requested_dt : 0.0;
    now_ += dt;
    return dt;
}

std::unique_ptr<FrameClock> make_steady_clock() {
    return std::make_unique<SteadyFrameClock>();
}

std::unique_ptr<FrameClock> make_replay_clock() {
    return std::make_unique<ReplayFrameClock>();
}
