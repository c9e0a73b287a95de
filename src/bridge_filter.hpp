/*
 * File: src/bridge_filter.hpp
 * Project: Print Telemetry Bridge
 * Purpose: Change filter: suppress republishing of records that only jitter
 * Notes:
 *  - Snapshot and status files are only ever replaced via include/atomic_write.hpp
 *  - A single field over tolerance republishes the whole record
 *  - Malformed frames are skipped; the session never drops on bad data
 * Last updated: 2026-10-16
 */

#pragma once
#include <cmath>
#include <optional>

#include "common/print_record.hpp"

// Absolute tolerances per field class; a change must be strictly greater to count
struct ChangeTolerances
{
    double progress = 0.5;    // percent
    double temperature = 0.5; // degC, nozzle and bed
    double layer = 0.0;       // layer and total_layers
    double time = 1.0;        // seconds, elapsed and remaining
    double filament = 1.0;    // mm
};

inline bool exceeds(double a, double b, double tol)
{
    return std::fabs(a - b) > tol;
}

inline bool differs_beyond(const PrintRecord &a, const PrintRecord &b, const ChangeTolerances &t)
{
    return exceeds(a.progress, b.progress, t.progress) ||
           exceeds(static_cast<double>(a.layer), static_cast<double>(b.layer), t.layer) ||
           exceeds(static_cast<double>(a.total_layers), static_cast<double>(b.total_layers), t.layer) ||
           exceeds(static_cast<double>(a.elapsed), static_cast<double>(b.elapsed), t.time) ||
           exceeds(static_cast<double>(a.remaining), static_cast<double>(b.remaining), t.time) ||
           exceeds(a.nozzle_temp, b.nozzle_temp, t.temperature) ||
           exceeds(a.bed_temp, b.bed_temp, t.temperature) ||
           exceeds(a.used_filament, b.used_filament, t.filament) ||
           a.filename != b.filename ||
           a.image_url != b.image_url;
}

class ChangeFilter
{
    ChangeTolerances tol_;
    std::optional<PrintRecord> last_;

public:
    explicit ChangeFilter(ChangeTolerances tol = {}) : tol_(tol) {}

    // true when nothing was published yet or any field moved past its tolerance
    bool differs(const PrintRecord &candidate) const
    {
        return !last_ || differs_beyond(candidate, *last_, tol_);
    }

    // On true the candidate becomes the last published record
    bool should_publish(const PrintRecord &candidate)
    {
        if (!differs(candidate))
            return false;
        last_ = candidate;
        return true;
    }

    // Records a publish that bypassed the tolerance check
    void accept(const PrintRecord &published) { last_ = published; }

    void reset() { last_.reset(); }

    const std::optional<PrintRecord> &last_published() const { return last_; }
    const ChangeTolerances &tolerances() const { return tol_; }
};
