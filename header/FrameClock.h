#pragma once
#include <chrono>
#include <memory>

// Time source consulted once per frame. The engine clamps whatever it reports.
class FrameClock {
public:
    virtual ~FrameClock() = default;

    // Seconds since the previous call. requested_dt is the caller's nominal frame delta.
    virtual double elapsed(double requested_dt) = 0;

    // Monotonic seconds since the clock was created (the engine builds its clock at construction),
    // not calendar time. Drives time-varying pointer effects.
    virtual double now() const = 0;
};

// Production clock: measures real time between frames
class SteadyFrameClock : public FrameClock {
public:
    SteadyFrameClock();

    double elapsed(double requested_dt) override;
    double now() const override;

private:
    using clock = std::chrono::steady_clock;
    clock::time_point origin_;
    clock::time_point last_;
};

// Reproducible clock: every frame lasts exactly what the caller asked for
class ReplayFrameClock : public FrameClock {
public:
    explicit ReplayFrameClock(double start_time = 0.0) : now_(start_time) {}

    double elapsed(double requested_dt) override;
    double now() const override { return now_; }

private:
    double now_;
};

std::unique_ptr<FrameClock> make_steady_clock();
std::unique_ptr<FrameClock> make_replay_clock();
