#include "RealTimeDriver.h"

#include <chrono>
#include <cmath>
#include <stdexcept>

namespace ringsim {

// ============================================================
// SteadyClockDelay
// ============================================================

bool SteadyClockDelay::wait(double seconds) {
    std::unique_lock<std::mutex> lock(m_);
    if (cancelled_) return false;
    if (!std::isfinite(seconds) || seconds <= 0.0) return true;

    const auto span = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(seconds));
    cv_.wait_for(lock, span, [this] { return cancelled_; });
    return !cancelled_;
}

void SteadyClockDelay::cancel() {
    {
        std::lock_guard<std::mutex> lock(m_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

void SteadyClockDelay::reset() {
    std::lock_guard<std::mutex> lock(m_);
    cancelled_ = false;
}

// ============================================================
// RealTimeDriver
// ============================================================

RealTimeDriver::RealTimeDriver(SimulationLoop& loop, Delay& delay, const DriverOptions& options)
    : loop_(loop), delay_(delay), opts_(options) {
    if (!std::isfinite(opts_.speedMultiplier) || opts_.speedMultiplier <= 0.0) {
        throw std::invalid_argument("DriverOptions.speedMultiplier must be positive");
    }
    loop_.addSink(this);
}

void RealTimeDriver::stop() {
    stopped_.store(true);
    delay_.cancel();
}

void RealTimeDriver::onEvent(const FightEvent& e) {
    switch (e.type) {
        case EventType::FightStart:
            pending_s_ += opts_.introPause_s;
            break;
        case EventType::Count:
            pending_s_ += opts_.countInterval_s;
            break;
        default:
            break;
    }
}

bool RealTimeDriver::pace(double simSeconds) {
    if (!opts_.realtime) return true;
    return delay_.wait(wallSeconds(simSeconds));
}

int RealTimeDriver::run() {
    int steps = 0;
    const double tick = loop_.options().tickRate_s;

    while (!stopped_.load()) {
        if (paused_.load()) {
            // Paused: only the wall clock moves.
            if (!delay_.wait(opts_.pausedPoll_s)) break;
            continue;
        }

        pending_s_ = 0.0;
        const bool more = loop_.step();
        ++steps;
        if (!more) break;

        if (!pace(tick + pending_s_)) break;
    }
    return steps;
}

} // namespace ringsim
