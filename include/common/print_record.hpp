/*
 * File: include/common/print_record.hpp
 * Project: Print Telemetry Bridge
 * Purpose: Canonical print telemetry record and its JSON wire form
 * Notes:
 *  - Snapshot and status files are only ever replaced via include/atomic_write.hpp
 *  - Every field is validated or a last-known-good fallback
 *  - Malformed frames are skipped; the session never drops on bad data
 * Last updated: 2026-10-16
 */

#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>


struct PrintRecord {
double progress = 0.0;          // percent, [0,100]
std::int64_t layer = 0;
std::int64_t total_layers = 0;  // >= layer
std::int64_t elapsed = 0;       // seconds
std::int64_t remaining = 0;     // seconds
double nozzle_temp = 0.0;       // degC
double bed_temp = 0.0;          // degC
double used_filament = 0.0;     // mm
std::string filename;
std::string image_url;
};


inline bool operator==(const PrintRecord& a, const PrintRecord& b){
return a.progress == b.progress && a.layer == b.layer && a.total_layers == b.total_layers &&
       a.elapsed == b.elapsed && a.remaining == b.remaining &&
       a.nozzle_temp == b.nozzle_temp && a.bed_temp == b.bed_temp &&
       a.used_filament == b.used_filament && a.filename == b.filename && a.image_url == b.image_url;
}
inline bool operator!=(const PrintRecord& a, const PrintRecord& b){ return !(a == b); }


// Outgoing publish payload; key set is fixed
inline nlohmann::json record_to_json(const PrintRecord& r){
using nlohmann::json;
return json{
{"progress", r.progress},
{"layer", r.layer},
{"total_layers", r.total_layers},
{"elapsed", r.elapsed},
{"remaining", r.remaining},
{"filename", r.filename},
{"nozzle_temp", r.nozzle_temp},
{"bed_temp", r.bed_temp},
{"used_filament", r.used_filament},
{"image_url", r.image_url}
};
}


// Latest published record, readable from any thread
class RecordStore {
mutable std::mutex m_;
std::optional<PrintRecord> latest_;
std::uint64_t updates_{0};
public:
void set(PrintRecord r){ std::scoped_lock lk(m_); latest_ = std::move(r); ++updates_; }
std::optional<PrintRecord> get() const { std::scoped_lock lk(m_); return latest_; }
std::uint64_t updates() const { std::scoped_lock lk(m_); return updates_; }
};
