/*
 * File: src/bridge_backoff.hpp
 * Project: Print Telemetry Bridge
 * Purpose: Reconnect backoff: exponential from a floor, capped, with jitter
 * Notes:
 *  - Snapshot and status files are only ever replaced via include/atomic_write.hpp
 *  - Nominal durations never decrease within a failure streak
 *  - Malformed frames are skipped; the session never drops on bad data
 * Last updated: 2026-10-16
 */

#pragma once
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <random>

class Backoff
{
public:
    using duration = std::chrono::milliseconds;

private:
    duration floor_;
    duration ceiling_;
    double jitter_;
    std::uint32_t failures_ = 0;
    duration nominal_;
    std::mt19937_64 rng_;

public:
    // jitter is the fraction of the nominal wait that may be shaved off, [0,1];
    // the floor is at least 1 ms
    Backoff(duration floor, duration ceiling, double jitter, std::uint64_t seed = std::random_device{}())
        : floor_(std::max(floor, duration{1})), ceiling_(std::max(floor_, ceiling)), jitter_(std::clamp(jitter, 0.0, 1.0)),
          nominal_(floor_), rng_(seed)
    {
    }

    // Registers one more consecutive failure and returns the wait before the next attempt
    duration next()
    {
        ++failures_;
        if (failures_ > 1)
        {
            // doubling, saturating at the ceiling
            nominal_ = nominal_ >= ceiling_ / 2 ? ceiling_ : std::min(ceiling_, nominal_ * 2);
        }
        else
        {
            nominal_ = floor_;
        }
        std::uniform_real_distribution<double> shave(0.0, jitter_);
        auto cut = static_cast<double>(nominal_.count()) * shave(rng_);
        return nominal_ - duration{static_cast<duration::rep>(cut)};
    }

    // Successful connect: back to the floor
    void reset()
    {
        failures_ = 0;
        nominal_ = floor_;
    }

    std::uint32_t failures() const { return failures_; }
    duration nominal() const { return nominal_; }
    duration floor() const { return floor_; }
    duration ceiling() const { return ceiling_; }
};
