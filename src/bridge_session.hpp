/*
 * File: src/bridge_session.hpp
 * Project: Print Telemetry Bridge
 * Purpose: Printer stream session: connect, receive loop, reconnect with backoff,
 *          snapshot cadence and shutdown
 * Notes:
 *  - Snapshot and status files are only ever replaced via include/atomic_write.hpp
 *  - All state is touched on the io_context thread only; stop() posts onto it
 *  - WebSocket ping/pong keepalive enabled on the device stream
 * Last updated: 2026-10-16
 */

#pragma once
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "common/endpoint.hpp"
#include "bridge_backoff.hpp"
#include "bridge_config.hpp"
#include "bridge_log.hpp"
#include "bridge_pipeline.hpp"
#include "bridge_publish.hpp"
#include "bridge_snapshot.hpp"

namespace websocket = boost::beast::websocket;

enum class SessionPhase
{
    disconnected,
    connecting,
    connected,
    backoff,
    stopped
};

inline const char *to_string(SessionPhase p)
{
    switch (p)
    {
    case SessionPhase::disconnected:
        return "disconnected";
    case SessionPhase::connecting:
        return "connecting";
    case SessionPhase::connected:
        return "connected";
    case SessionPhase::backoff:
        return "backoff";
    case SessionPhase::stopped:
        return "stopped";
    }
    return "?";
}

struct SessionState
{
    SessionPhase phase = SessionPhase::disconnected;
    std::uint32_t consecutive_failures = 0;
    std::chrono::milliseconds backoff{0}; // nominal, before jitter
    std::chrono::milliseconds last_wait{0};
    std::optional<std::chrono::steady_clock::time_point> last_fetch;
    bool fetch_in_flight = false;
    std::uint64_t connections = 0;
    std::uint64_t fetches_ok = 0;
    std::uint64_t fetches_failed = 0;
    std::uint64_t fetches_skipped = 0;
};

class StreamSession : public std::enable_shared_from_this<StreamSession>
{
public:
    using clock = std::chrono::steady_clock;
    using PhaseObserver = std::function<void(SessionPhase)>;
    using FetchObserver = std::function<void(const FetchOutcome &)>;
    static constexpr std::size_t max_frame_bytes = 1 << 20;
    static constexpr std::chrono::seconds connect_timeout{10};

private:
    struct Conn
    {
        websocket::stream<boost::beast::tcp_stream> ws;
        boost::beast::flat_buffer buffer;
        explicit Conn(boost::asio::io_context &ioc) : ws(ioc) {}
    };

    boost::asio::io_context &ioc_;
    BridgeConfig cfg_;
    Endpoint ep_;
    boost::asio::ip::tcp::resolver resolver_;
    boost::asio::steady_timer backoff_timer_;
    boost::asio::steady_timer tick_timer_;
    std::shared_ptr<Conn> conn_;
    std::shared_ptr<SnapshotFetch> fetch_;
    Backoff backoff_;
    FramePipeline pipeline_;
    SessionState state_;
    std::vector<PhaseObserver> phase_observers_;
    std::vector<FetchObserver> fetch_observers_;
    std::string last_stream_error_;
    std::string last_fetch_error_;
    std::string job_filename_;
    double last_progress_ = 0.0;
    bool started_ = false;
    bool stopping_ = false;

public:
    StreamSession(boost::asio::io_context &ioc, BridgeConfig cfg, std::shared_ptr<Publisher> publisher,
                  std::uint64_t seed = std::random_device{}())
        : ioc_(ioc),
          cfg_(std::move(cfg)),
          ep_(parse_endpoint(cfg_.stream_url)),
          resolver_(ioc),
          backoff_timer_(ioc),
          tick_timer_(ioc),
          backoff_(std::chrono::duration_cast<Backoff::duration>(cfg_.backoff_floor),
                   std::chrono::duration_cast<Backoff::duration>(cfg_.backoff_ceiling),
                   cfg_.backoff_jitter, seed),
          pipeline_(std::move(publisher), cfg_.tolerances,
                    std::chrono::duration_cast<clock::duration>(cfg_.publish_interval))
    {
        state_.backoff = backoff_.floor();
    }

    // Observers are registered before start()
    void on_phase(PhaseObserver f) { phase_observers_.push_back(std::move(f)); }
    void on_fetch(FetchObserver f) { fetch_observers_.push_back(std::move(f)); }

    void start()
    {
        auto self = shared_from_this();
        boost::asio::post(ioc_, [self]
                          { self->do_start(); });
    }

    // Safe from any thread, idempotent
    void stop()
    {
        auto self = shared_from_this();
        boost::asio::post(ioc_, [self]
                          { self->do_stop(); });
    }

    const SessionState &state() const { return state_; }
    const FramePipeline &pipeline() const { return pipeline_; }
    const BridgeConfig &config() const { return cfg_; }

private:
    void set_phase(SessionPhase p)
    {
        if (state_.phase == p)
            return;
        log_debug("session ", to_string(state_.phase), " -> ", to_string(p));
        state_.phase = p;
        for (auto &f : phase_observers_)
            f(p);
    }

    void do_start()
    {
        if (started_ || stopping_)
            return;
        started_ = true;
        if (cfg_.snapshots_enabled())
        {
            std::error_code ec;
            if (std::filesystem::exists(cfg_.local_image_path, ec))
                pipeline_.attach_image(cfg_.exposed_image_path, false);
        }
        schedule_tick();
        connect();
    }

    void do_stop()
    {
        if (stopping_)
            return;
        stopping_ = true;
        backoff_timer_.cancel();
        tick_timer_.cancel();
        resolver_.cancel();
        if (fetch_)
            fetch_->cancel();
        close_connection();
        set_phase(SessionPhase::stopped);
        log_info("session stopped (", state_.connections, " connections, ",
                 pipeline_.stats().frames, " frames, ", pipeline_.stats().published, " published)");
    }

    void close_connection()
    {
        if (!conn_)
            return;
        boost::beast::error_code ignored;
        auto &sock = boost::beast::get_lowest_layer(conn_->ws).socket();
        sock.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
        sock.close(ignored);
        conn_.reset();
    }

    // -------- connection lifecycle --------

    void connect()
    {
        if (stopping_)
            return;
        set_phase(SessionPhase::connecting);
        auto c = std::make_shared<Conn>(ioc_);
        conn_ = c;
        auto self = shared_from_this();
        resolver_.async_resolve(ep_.host, ep_.port,
                                [self, c](boost::beast::error_code ec, boost::asio::ip::tcp::resolver::results_type results)
                                {
            if (c != self->conn_ || self->stopping_) return;
            if (ec) return self->on_transport_error("resolve " + self->ep_.host, ec);
            self->on_resolve(c, results); });
    }

    void on_resolve(const std::shared_ptr<Conn> &c, const boost::asio::ip::tcp::resolver::results_type &results)
    {
        auto self = shared_from_this();
        boost::beast::get_lowest_layer(c->ws).expires_after(connect_timeout);
        boost::beast::get_lowest_layer(c->ws).async_connect(results, [self, c](boost::beast::error_code ec, auto)
                                                            {
            if (c != self->conn_ || self->stopping_) return;
            if (ec) return self->on_transport_error("connect", ec);
            self->on_tcp_connected(c); });
    }

    void on_tcp_connected(const std::shared_ptr<Conn> &c)
    {
        // websocket manages its own timeouts from here on
        boost::beast::get_lowest_layer(c->ws).expires_never();
        websocket::stream_base::timeout opt{};
        opt.handshake_timeout = std::chrono::duration_cast<websocket::stream_base::duration>(connect_timeout);
        opt.idle_timeout = std::chrono::duration_cast<websocket::stream_base::duration>(cfg_.ping_interval * 2);
        opt.keep_alive_pings = true;
        c->ws.set_option(opt);
        c->ws.read_message_max(max_frame_bytes);
        auto self = shared_from_this();
        c->ws.async_handshake(ep_.host_header(), ep_.target, [self, c](boost::beast::error_code ec)
                              {
            if (c != self->conn_ || self->stopping_) return;
            if (ec) return self->on_transport_error("handshake", ec);
            self->on_connected(c); });
    }

    void on_connected(const std::shared_ptr<Conn> &c)
    {
        if (backoff_.failures() > 0)
            log_info("WebSocket connected to ", cfg_.stream_url, " after ", backoff_.failures(), " failed attempts");
        else
            log_info("WebSocket connected to ", cfg_.stream_url);
        backoff_.reset();
        state_.consecutive_failures = 0;
        state_.backoff = backoff_.nominal();
        last_stream_error_.clear();
        ++state_.connections;
        set_phase(SessionPhase::connected);
        read_loop(c);
    }

    void read_loop(const std::shared_ptr<Conn> &c)
    {
        auto self = shared_from_this();
        c->ws.async_read(c->buffer, [self, c](boost::beast::error_code ec, std::size_t)
                         {
            if (c != self->conn_ || self->stopping_) return;
            if (ec) return self->on_transport_error("read", ec);
            auto text = boost::beast::buffers_to_string(c->buffer.data());
            c->buffer.consume(c->buffer.size());
            self->on_frame(text);
            self->read_loop(c); });
    }

    // Any connection-level failure: drop the connection and wait before retrying.
    // A failure streak is logged once; identical repeats go to debug.
    void on_transport_error(const std::string &what, boost::beast::error_code ec)
    {
        if (stopping_)
            return;
        bool was_connected = state_.phase == SessionPhase::connected;
        close_connection();
        if (was_connected)
            set_phase(SessionPhase::disconnected);

        std::string msg = what + ": " + ec.message();
        auto wait = backoff_.next();
        state_.consecutive_failures = backoff_.failures();
        state_.backoff = backoff_.nominal();
        state_.last_wait = wait;
        if (msg != last_stream_error_)
            log_warn("WebSocket ", cfg_.stream_url, " error (", msg, "); reconnecting with backoff");
        else
            log_debug("WebSocket ", cfg_.stream_url, " still failing (", msg, "), attempt ",
                      backoff_.failures());
        last_stream_error_ = msg;
        log_debug("reconnecting in ", wait.count(), " ms");

        set_phase(SessionPhase::backoff);
        auto self = shared_from_this();
        backoff_timer_.expires_after(wait);
        backoff_timer_.async_wait([self](boost::beast::error_code ec)
                                  {
            if (ec == boost::asio::error::operation_aborted || self->stopping_) return;
            self->connect(); });
    }

    // -------- frames, cadence, snapshots --------

    void on_frame(const std::string &text)
    {
        auto now = clock::now();
        pipeline_.on_text(text, now);
        track_job(now);
        maybe_fetch(now, false);
    }

    // New job filename forces a snapshot; progress falling to zero re-arms it
    void track_job(clock::time_point now)
    {
        const auto &cur = pipeline_.current();
        if (!cur)
            return;
        if (last_progress_ > 0 && cur->progress == 0)
            job_filename_.clear();
        last_progress_ = cur->progress;
        if (!cur->filename.empty() && cur->filename != job_filename_)
        {
            job_filename_ = cur->filename;
            log_info("print job: ", job_filename_);
            maybe_fetch(now, true);
        }
    }

    void schedule_tick()
    {
        auto self = shared_from_this();
        tick_timer_.expires_after(std::chrono::duration_cast<clock::duration>(cfg_.publish_interval));
        tick_timer_.async_wait([self](boost::beast::error_code ec)
                               {
            if (ec == boost::asio::error::operation_aborted || self->stopping_) return;
            self->on_tick();
            self->schedule_tick(); });
    }

    void on_tick()
    {
        if (state_.phase != SessionPhase::connected)
            return;
        auto now = clock::now();
        pipeline_.on_tick(now);
        maybe_fetch(now, false);
    }

    // At most one fetch in flight; a trigger during one is skipped
    void maybe_fetch(clock::time_point now, bool force)
    {
        if (!cfg_.snapshots_enabled() || stopping_)
            return;
        if (!force && state_.last_fetch &&
            now - *state_.last_fetch < std::chrono::duration_cast<clock::duration>(cfg_.snapshot_interval))
            return;
        if (fetch_)
        {
            // the running fetch counts as this trigger's attempt
            ++state_.fetches_skipped;
            log_debug("snapshot already in flight; ", force ? "job" : "cadence", " trigger skipped");
            return;
        }

        state_.last_fetch = now;
        state_.fetch_in_flight = true;
        SnapshotRequest req;
        req.url = cfg_.snapshot_url;
        req.destination = cfg_.local_image_path;
        req.max_bytes = cfg_.max_image_bytes;
        req.allowed_content_types = cfg_.image_content_types;
        req.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(cfg_.fetch_timeout);
        auto self = shared_from_this();
        fetch_ = start_snapshot_fetch(ioc_, std::move(req), [self](const FetchOutcome &o)
                                      { self->on_fetch_done(o); });
    }

    void on_fetch_done(const FetchOutcome &o)
    {
        fetch_.reset();
        state_.fetch_in_flight = false;
        for (auto &f : fetch_observers_)
            f(o);
        if (o.error == FetchError::cancelled)
            return;
        if (o.ok())
        {
            ++state_.fetches_ok;
            log_info("Image downloaded and saved (", o.bytes, " bytes)");
            last_fetch_error_.clear();
            pipeline_.attach_image(cfg_.exposed_image_path, true);
            return;
        }
        ++state_.fetches_failed;
        std::string key = std::string(to_string(o.error)) + ": " + o.detail;
        if (key != last_fetch_error_)
            log_warn("snapshot ", key, "; keeping previous image");
        else
            log_debug("snapshot ", key, " (repeat)");
        last_fetch_error_ = key;
    }
};
