/*
 * File: src/bridge_publish.hpp
 * Project: Print Telemetry Bridge
 * Purpose: Publish sinks: hub topic over WebSocket, status file, record store
 * Notes:
 *  - Snapshot and status files are only ever replaced via include/atomic_write.hpp
 *  - Publishing never blocks the session and failed publishes are not retried
 *  - Hub envelope: {"topic": ..., "payload": ...}
 * Last updated: 2026-10-16
 */

#pragma once
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <deque>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "atomic_write.hpp"
#include "common/endpoint.hpp"
#include "common/print_record.hpp"
#include "bridge_log.hpp"

namespace websocket = boost::beast::websocket;

class Publisher
{
public:
    virtual ~Publisher() = default;
    virtual void publish(const PrintRecord &r) = 0;
    virtual std::string name() const = 0;
};

// Latest record for read-only access by the host
class RecordStorePublisher : public Publisher
{
    std::shared_ptr<RecordStore> store_;

public:
    explicit RecordStorePublisher(std::shared_ptr<RecordStore> s) : store_(std::move(s)) {}
    void publish(const PrintRecord &r) override { store_->set(r); }
    std::string name() const override { return "record-store"; }
};

// Last published document, replaced atomically
class StatusFilePublisher : public Publisher
{
    std::filesystem::path path_;

public:
    explicit StatusFilePublisher(std::filesystem::path p) : path_(std::move(p)) {}
    void publish(const PrintRecord &r) override { write_atomic(path_, record_to_json(r).dump()); }
    std::string name() const override { return "status-file " + path_.string(); }
};

// Sends {"topic","payload"} envelopes to a WebSocket hub. Connects on demand;
// while connecting only the newest envelope is kept.
class HubPublisher : public Publisher, public std::enable_shared_from_this<HubPublisher>
{
    // one per connection attempt; stale handlers compare against conn_
    struct Conn
    {
        websocket::stream<boost::beast::tcp_stream> ws;
        boost::beast::flat_buffer rbuf;
        std::string inflight;
        explicit Conn(boost::asio::io_context &ioc) : ws(ioc) {}
    };
    static constexpr std::size_t max_queue = 16;

    boost::asio::io_context &ioc_;
    Endpoint ep_;
    std::string topic_;
    boost::asio::ip::tcp::resolver resolver_;
    std::shared_ptr<Conn> conn_;
    std::deque<std::string> queue_;
    std::optional<std::string> pending_;
    bool connecting_ = false;
    bool open_ = false;
    bool writing_ = false;
    bool stopped_ = false;
    std::string last_error_;
    std::uint64_t dropped_ = 0;

public:
    HubPublisher(boost::asio::io_context &ioc, const std::string &url, std::string topic)
        : ioc_(ioc), ep_(parse_endpoint(url)), topic_(std::move(topic)), resolver_(ioc)
    {
    }

    void publish(const PrintRecord &r) override
    {
        std::string msg = nlohmann::json{{"topic", topic_}, {"payload", record_to_json(r)}}.dump();
        auto self = shared_from_this();
        boost::asio::post(ioc_, [self, msg = std::move(msg)]() mutable
                          { self->enqueue(std::move(msg)); });
    }

    std::string name() const override { return "hub " + ep_.host + ":" + ep_.port + ep_.target; }

    void stop()
    {
        auto self = shared_from_this();
        boost::asio::post(ioc_, [self]
                          {
            self->stopped_ = true;
            self->resolver_.cancel();
            if (self->conn_)
                boost::beast::get_lowest_layer(self->conn_->ws).close();
            self->conn_.reset();
            self->queue_.clear();
            self->pending_.reset(); });
    }

    bool is_open() const { return open_; }
    std::uint64_t dropped() const { return dropped_; }

private:
    void enqueue(std::string msg)
    {
        if (stopped_)
            return;
        if (!open_)
        {
            pending_ = std::move(msg);
            if (!connecting_)
                connect();
            return;
        }
        while (queue_.size() >= max_queue)
        {
            queue_.pop_front();
            ++dropped_;
        }
        queue_.push_back(std::move(msg));
        write_next();
    }

    void connect()
    {
        connecting_ = true;
        auto c = std::make_shared<Conn>(ioc_);
        conn_ = c;
        auto self = shared_from_this();
        resolver_.async_resolve(ep_.host, ep_.port,
                                [self, c](boost::beast::error_code ec, boost::asio::ip::tcp::resolver::results_type results)
                                {
            if (c != self->conn_) return;
            if (ec) return self->fail("resolve", ec);
            boost::beast::get_lowest_layer(c->ws).expires_after(std::chrono::seconds(5));
            boost::beast::get_lowest_layer(c->ws).async_connect(results, [self, c](boost::beast::error_code ec, auto)
                                                                {
                if (c != self->conn_) return;
                if (ec) return self->fail("connect", ec);
                boost::beast::get_lowest_layer(c->ws).expires_never();
                c->ws.set_option(websocket::stream_base::timeout::suggested(boost::beast::role_type::client));
                c->ws.async_handshake(self->ep_.host_header(), self->ep_.target, [self, c](boost::beast::error_code ec)
                                      {
                    if (c != self->conn_) return;
                    if (ec) return self->fail("handshake", ec);
                    self->on_open(); }); }); });
    }

    void on_open()
    {
        connecting_ = false;
        open_ = true;
        if (!last_error_.empty())
            log_info("hub connected again: ", name());
        else
            log_info("hub connected: ", name());
        last_error_.clear();
        if (pending_)
        {
            queue_.push_back(std::move(*pending_));
            pending_.reset();
        }
        read_loop();
        write_next();
    }

    void write_next()
    {
        if (writing_ || queue_.empty() || !open_)
            return;
        writing_ = true;
        auto c = conn_;
        c->inflight = std::move(queue_.front());
        queue_.pop_front();
        auto self = shared_from_this();
        c->ws.text(true);
        c->ws.async_write(boost::asio::buffer(c->inflight), [self, c](boost::beast::error_code ec, std::size_t)
                          {
            if (c != self->conn_) return;
            self->writing_ = false;
            if (ec) return self->fail("write", ec);
            self->write_next(); });
    }

    // Hub fan-out echoes everything back; drain and discard
    void read_loop()
    {
        auto c = conn_;
        auto self = shared_from_this();
        c->ws.async_read(c->rbuf, [self, c](boost::beast::error_code ec, std::size_t)
                         {
            if (c != self->conn_) return;
            if (ec) return self->fail("read", ec);
            c->rbuf.consume(c->rbuf.size());
            self->read_loop(); });
    }

    void fail(const char *what, boost::beast::error_code ec)
    {
        if (stopped_)
            return;
        std::string msg = std::string(what) + ": " + ec.message();
        if (msg != last_error_)
            log_warn("hub ", name(), " unavailable (", msg, "); records dropped until it reconnects");
        else
            log_debug("hub ", name(), " still unavailable (", msg, ")");
        last_error_ = msg;
        if (conn_)
        {
            boost::beast::error_code ignored;
            boost::beast::get_lowest_layer(conn_->ws).socket().close(ignored);
        }
        conn_.reset();
        connecting_ = false;
        open_ = false;
        writing_ = false;
        dropped_ += queue_.size() + (pending_ ? 1 : 0);
        queue_.clear();
        pending_.reset();
    }
};

// Fan-out; a failing sink is logged and skipped
class PublisherSet : public Publisher
{
    std::vector<std::shared_ptr<Publisher>> sinks_;

public:
    void add(std::shared_ptr<Publisher> p) { sinks_.push_back(std::move(p)); }
    bool empty() const { return sinks_.empty(); }
    std::size_t size() const { return sinks_.size(); }

    void publish(const PrintRecord &r) override
    {
        for (auto &s : sinks_)
        {
            try
            {
                s->publish(r);
            }
            catch (const std::exception &e)
            {
                log_warn("publish to ", s->name(), " failed: ", e.what());
            }
        }
    }

    std::string name() const override { return "publisher-set"; }
};
