/*
 * File: src/bridge_sanitize.hpp
 * Project: Print Telemetry Bridge
 * Purpose: Raw printer frame -> canonical PrintRecord (validate, convert, clamp)
 * Notes:
 *  - Snapshot and status files are only ever replaced via include/atomic_write.hpp
 *  - Pure: no I/O, never throws on field data
 *  - Malformed frames are skipped; the session never drops on bad data
 * Last updated: 2026-10-16
 */

#pragma once
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <initializer_list>
#include <limits>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/print_record.hpp"

// Plausible physical ranges; out-of-range values are clamped, not rejected
struct RecordBounds
{
    static constexpr double progress_min = 0.0;
    static constexpr double progress_max = 100.0;
    static constexpr double temp_min = -40.0;
    static constexpr double nozzle_temp_max = 500.0;
    static constexpr double bed_temp_max = 200.0;
    static constexpr double filament_max = 1e9; // mm
};

// -------- field conversions --------

inline std::optional<double> parse_number_text(const std::string &s)
{
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos)
        return std::nullopt;
    auto e = s.find_last_not_of(" \t\r\n");
    std::string t = s.substr(b, e - b + 1);
    char *end = nullptr;
    double v = std::strtod(t.c_str(), &end);
    if (end != t.c_str() + t.size())
        return std::nullopt;
    if (!std::isfinite(v))
        return std::nullopt;
    return v;
}

// Numbers and numeric strings; bools, NaN and Inf are rejected
inline std::optional<double> to_finite_double(const nlohmann::json &v)
{
    if (v.is_number_integer())
        return v.is_number_unsigned() ? static_cast<double>(v.get<std::uint64_t>())
                                      : static_cast<double>(v.get<std::int64_t>());
    if (v.is_number_float())
    {
        double d = v.get<double>();
        if (!std::isfinite(d))
            return std::nullopt;
        return d;
    }
    if (v.is_string())
        return parse_number_text(v.get_ref<const std::string &>());
    return std::nullopt;
}

// Fractions truncate toward zero; magnitudes beyond int64 saturate
inline std::optional<std::int64_t> to_int64(const nlohmann::json &v)
{
    constexpr auto hi = std::numeric_limits<std::int64_t>::max();
    constexpr auto lo = std::numeric_limits<std::int64_t>::min();
    if (v.is_number_unsigned())
    {
        auto u = v.get<std::uint64_t>();
        return u > static_cast<std::uint64_t>(hi) ? hi : static_cast<std::int64_t>(u);
    }
    if (v.is_number_integer())
        return v.get<std::int64_t>();
    auto d = to_finite_double(v);
    if (!d)
        return std::nullopt;
    double t = std::trunc(*d);
    if (t >= 9.2233720368547758e18)
        return hi;
    if (t <= -9.2233720368547758e18)
        return lo;
    return static_cast<std::int64_t>(t);
}

inline std::optional<std::string> to_text(const nlohmann::json &v)
{
    if (v.is_string())
        return v.get<std::string>();
    if (v.is_number())
        return v.dump();
    return std::nullopt;
}

inline std::string base_name(const std::string &path)
{
    auto p = path.find_last_of('/');
    return p == std::string::npos ? path : path.substr(p + 1);
}

// First present, convertible key wins. null counts as absent. A present
// value that does not convert is reported in `rejected`.
template <typename T, typename Convert>
inline bool take_field(const nlohmann::json &raw, std::initializer_list<const char *> keys,
                       Convert convert, T &out, const char *field,
                       std::vector<std::string> *rejected)
{
    bool seen = false;
    for (const char *k : keys)
    {
        auto it = raw.find(k);
        if (it == raw.end() || it->is_null())
            continue;
        seen = true;
        if (auto v = convert(*it))
        {
            out = static_cast<T>(*v);
            return true;
        }
    }
    if (seen && rejected)
        rejected->emplace_back(field);
    return false;
}

// Missing or invalid fields fall back to `previous`, else zero/empty.
// Published documents are accepted as input, so sanitize(record_to_json(r), p) == r.
inline PrintRecord sanitize(const nlohmann::json &raw, const std::optional<PrintRecord> &previous,
                            std::vector<std::string> *rejected = nullptr)
{
    PrintRecord r = previous ? *previous : PrintRecord{};

    if (raw.is_object())
    {
        take_field(raw, {"progress", "printProgress"}, to_finite_double, r.progress, "progress", rejected);
        take_field(raw, {"layer"}, to_int64, r.layer, "layer", rejected);
        take_field(raw, {"totalLayer", "TotalLayer", "total_layers"}, to_int64, r.total_layers, "total_layers", rejected);
        take_field(raw, {"time", "printJobTime", "elapsed"}, to_int64, r.elapsed, "elapsed", rejected);
        take_field(raw, {"remainingTime", "printLeftTime", "remaining"}, to_int64, r.remaining, "remaining", rejected);
        take_field(raw, {"nozzleTemp", "nozzle_temp"}, to_finite_double, r.nozzle_temp, "nozzle_temp", rejected);
        take_field(raw, {"bedTemp", "bedTemp0", "bed_temp"}, to_finite_double, r.bed_temp, "bed_temp", rejected);
        take_field(raw, {"usedMaterial", "usedMaterialLength", "used_filament"}, to_finite_double, r.used_filament, "used_filament", rejected);
        take_field(raw, {"printFileName", "filename"}, to_text, r.filename, "filename", rejected);
        take_field(raw, {"image_url"}, to_text, r.image_url, "image_url", rejected);
    }

    r.progress = std::clamp(r.progress, RecordBounds::progress_min, RecordBounds::progress_max);
    r.layer = std::max<std::int64_t>(0, r.layer);
    r.total_layers = std::max(r.layer, r.total_layers);
    r.elapsed = std::max<std::int64_t>(0, r.elapsed);
    r.remaining = std::max<std::int64_t>(0, r.remaining);
    r.nozzle_temp = std::clamp(r.nozzle_temp, RecordBounds::temp_min, RecordBounds::nozzle_temp_max);
    r.bed_temp = std::clamp(r.bed_temp, RecordBounds::temp_min, RecordBounds::bed_temp_max);
    r.used_filament = std::clamp(r.used_filament, 0.0, RecordBounds::filament_max);
    r.filename = base_name(r.filename);
    return r;
}
