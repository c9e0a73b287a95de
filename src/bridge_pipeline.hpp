/*
 * File: src/bridge_pipeline.hpp
 * Project: Print Telemetry Bridge
 * Purpose: Frame text -> parse -> sanitize -> change filter -> rate limit -> publish
 * Notes:
 *  - Snapshot and status files are only ever replaced via include/atomic_write.hpp
 *  - No transport here; StreamSession feeds frames and cadence ticks
 *  - Malformed frames are skipped; the session never drops on bad data
 * Last updated: 2026-10-16
 */

#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/print_record.hpp"
#include "bridge_filter.hpp"
#include "bridge_log.hpp"
#include "bridge_publish.hpp"
#include "bridge_sanitize.hpp"

enum class FrameResult
{
    published,
    suppressed, // within tolerance of the last published record
    deferred,   // changed, held until the publish interval has elapsed
    parse_error,
    ignored     // valid JSON but not an object
};

struct PipelineStats
{
    std::uint64_t frames = 0;
    std::uint64_t parse_errors = 0;
    std::uint64_t ignored = 0;
    std::uint64_t published = 0;
    std::uint64_t suppressed = 0;
    std::uint64_t field_fallbacks = 0;
};

inline std::string frame_preview(const std::string &text, std::size_t n = 120)
{
    return text.size() <= n ? text : text.substr(0, n) + "...";
}

class FramePipeline
{
public:
    using clock = std::chrono::steady_clock;

private:
    ChangeFilter filter_;
    std::shared_ptr<Publisher> publisher_;
    clock::duration min_gap_;
    std::optional<PrintRecord> current_;  // newest sanitized record, the fallback source
    std::optional<PrintRecord> deferred_;
    std::optional<clock::time_point> last_publish_;
    std::string image_url_;
    bool force_next_ = false;
    PipelineStats stats_;

public:
    FramePipeline(std::shared_ptr<Publisher> publisher, ChangeTolerances tol, clock::duration min_gap)
        : filter_(tol), publisher_(std::move(publisher)), min_gap_(min_gap)
    {
    }

    FrameResult on_text(const std::string &text, clock::time_point now)
    {
        ++stats_.frames;
        auto j = nlohmann::json::parse(text, nullptr, false);
        if (j.is_discarded())
        {
            ++stats_.parse_errors;
            log_warn("ParseError: skipping non-JSON frame: ", frame_preview(text));
            return FrameResult::parse_error;
        }
        if (!j.is_object())
        {
            ++stats_.ignored;
            log_debug("ignoring non-object frame: ", frame_preview(text));
            return FrameResult::ignored;
        }
        return on_frame(j, now);
    }

    FrameResult on_frame(const nlohmann::json &raw, clock::time_point now)
    {
        std::vector<std::string> rejected;
        auto rec = sanitize(raw, current_, &rejected);
        if (!rejected.empty())
        {
            stats_.field_fallbacks += rejected.size();
            std::string names;
            for (const auto &r : rejected)
                names += (names.empty() ? "" : ",") + r;
            log_debug("invalid fields kept last good value: ", names);
        }
        rec.image_url = image_url_;
        current_ = rec;
        return consider(rec, now);
    }

    // Cadence tick: flush a rate-limited record, or push a forced one
    void on_tick(clock::time_point now)
    {
        if (force_next_ && !deferred_ && current_)
            deferred_ = current_;
        if (deferred_ && gap_elapsed(now))
        {
            auto r = std::move(*deferred_);
            deferred_.reset();
            publish(r, now);
        }
    }

    // New image reference; with force the next record goes out even if unchanged
    void attach_image(const std::string &url, bool force)
    {
        image_url_ = url;
        if (current_)
            current_->image_url = url;
        if (deferred_)
            deferred_->image_url = url;
        force_next_ = force_next_ || force;
    }

    const std::optional<PrintRecord> &current() const { return current_; }
    const std::optional<PrintRecord> &last_published() const { return filter_.last_published(); }
    bool has_deferred() const { return deferred_.has_value(); }
    const std::string &image_url() const { return image_url_; }
    const PipelineStats &stats() const { return stats_; }

private:
    bool gap_elapsed(clock::time_point now) const
    {
        return !last_publish_ || now - *last_publish_ >= min_gap_;
    }

    FrameResult consider(const PrintRecord &rec, clock::time_point now)
    {
        if (!force_next_ && !filter_.differs(rec))
        {
            // back within tolerance: whatever was held is stale
            deferred_.reset();
            ++stats_.suppressed;
            return FrameResult::suppressed;
        }
        if (!gap_elapsed(now))
        {
            deferred_ = rec;
            return FrameResult::deferred;
        }
        deferred_.reset();
        publish(rec, now);
        return FrameResult::published;
    }

    void publish(const PrintRecord &rec, clock::time_point now)
    {
        filter_.accept(rec);
        last_publish_ = now;
        force_next_ = false;
        ++stats_.published;
        log_info("Published: ", record_to_json(rec).dump());
        try
        {
            publisher_->publish(rec);
        }
        catch (const std::exception &e)
        {
            log_warn("publish failed: ", e.what());
        }
    }
};
