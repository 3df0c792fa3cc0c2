#pragma once

#include <atomic>
#include <condition_variable>
#include <mutex>

#include "Events.h"
#include "SimulationLoop.h"

namespace ringsim {

// Cancellable wait used for real-time pacing. wait() returns false when the
// wait was cut short by cancel(); a cancelled delay stays cancelled until
// reset().
class Delay {
public:
    virtual ~Delay() = default;
    virtual bool wait(double seconds) = 0;
    virtual void cancel() = 0;
    virtual void reset() = 0;
};

// Returns immediately. Batch runs and tests.
class NoDelay : public Delay {
public:
    bool wait(double) override { return !cancelled_.load(); }
    void cancel() override { cancelled_.store(true); }
    void reset() override { cancelled_.store(false); }

    bool isCancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

// Sleeps on a condition variable so cancel() from another thread wakes it.
class SteadyClockDelay : public Delay {
public:
    bool wait(double seconds) override;
    void cancel() override;
    void reset() override;

private:
    std::mutex m_;
    std::condition_variable cv_;
    bool cancelled_ = false;
};

struct DriverOptions {
    // >1 runs faster than real time. Must be positive.
    double speedMultiplier = 1.0;

    // false: step back to back (batch mode), no waits at all.
    bool realtime = true;

    // Extra pacing on top of the tick rate, in simulated seconds.
    double introPause_s = 3.0;
    double countInterval_s = 1.0;
    double pausedPoll_s = 0.05;
};

// ============================================================
// Real-time wrapper around SimulationLoop::step().
//
// The driver never touches fight state: it decides only when the next step
// happens. Batch and real-time runs of the same seed therefore produce the
// same event stream. pause(), resume() and stop() may be called from any
// thread; stop() takes effect at the next tick boundary.
// ============================================================
class RealTimeDriver : private EventSink {
public:
    // Throws std::invalid_argument for a non-positive speed multiplier.
    RealTimeDriver(SimulationLoop& loop, Delay& delay, const DriverOptions& options = DriverOptions{});

    RealTimeDriver(const RealTimeDriver&) = delete;
    RealTimeDriver& operator=(const RealTimeDriver&) = delete;

    // Runs until the fight is over or stop() is called. Returns the number of
    // steps taken by this call.
    int run();

    void pause() { paused_.store(true); }
    void resume() { paused_.store(false); }
    void stop();

    bool isPaused() const { return paused_.load(); }
    bool isStopped() const { return stopped_.load(); }
    const DriverOptions& options() const noexcept { return opts_; }

    // Wall-clock seconds the driver waits for the given simulated seconds.
    double wallSeconds(double simSeconds) const { return simSeconds / opts_.speedMultiplier; }

private:
    void onEvent(const FightEvent& e) override;
    bool pace(double simSeconds);

    SimulationLoop& loop_;
    Delay& delay_;
    DriverOptions opts_;

    std::atomic<bool> paused_{false};
    std::atomic<bool> stopped_{false};

    // Extra simulated seconds requested by events of the last step.
    double pending_s_ = 0.0;
};

} // namespace ringsim
