/*
 * File: src/bridge_snapshot.hpp
 * Project: Print Telemetry Bridge
 * Purpose: Bounded, streamed snapshot download with atomic file replacement
 * Notes:
 *  - Snapshot and status files are only ever replaced via include/atomic_write.hpp
 *  - Content type gated on the header; body counted chunk by chunk
 *  - Every failure leaves the previous snapshot file untouched
 * Last updated: 2026-10-16
 */

#pragma once
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include <cctype>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <limits>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "atomic_write.hpp"
#include "common/endpoint.hpp"

namespace http = boost::beast::http;

enum class FetchError
{
    none,
    unsupported_content_type,
    size_exceeded,
    transport_error, // resolve/connect/timeout/reset, non-2xx, empty body
    storage_error,   // temp file create/write/rename
    cancelled
};

inline const char *to_string(FetchError e)
{
    switch (e)
    {
    case FetchError::none:
        return "ok";
    case FetchError::unsupported_content_type:
        return "UnsupportedContentType";
    case FetchError::size_exceeded:
        return "SizeExceeded";
    case FetchError::transport_error:
        return "FetchTransportError";
    case FetchError::storage_error:
        return "StorageError";
    case FetchError::cancelled:
        return "Cancelled";
    }
    return "?";
}

struct FetchOutcome
{
    FetchError error = FetchError::none;
    std::string detail;
    std::uint64_t bytes = 0;
    unsigned status = 0;
    std::string content_type;

    bool ok() const { return error == FetchError::none; }
};

struct SnapshotRequest
{
    std::string url;
    std::filesystem::path destination;
    std::uint64_t max_bytes = 5 * 1024 * 1024;
    std::set<std::string> allowed_content_types{"image/png", "image/jpeg", "image/jpg"};
    std::chrono::milliseconds timeout{5000}; // per network operation
};

// "Image/PNG; charset=x" -> "image/png"
inline std::string media_type(boost::beast::string_view header)
{
    std::string s(header.data(), header.size());
    s = s.substr(0, s.find(';'));
    auto b = s.find_first_not_of(" \t");
    if (b == std::string::npos)
        return {};
    auto e = s.find_last_not_of(" \t");
    s = s.substr(b, e - b + 1);
    for (auto &c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

// One GET. Lives until its handler has run; the handler is called exactly once.
class SnapshotFetch : public std::enable_shared_from_this<SnapshotFetch>
{
public:
    using Handler = std::function<void(const FetchOutcome &)>;
    static constexpr std::size_t chunk_bytes = 64 * 1024;

private:
    boost::asio::ip::tcp::resolver resolver_;
    boost::beast::tcp_stream stream_;
    boost::beast::flat_buffer buffer_;
    http::request<http::empty_body> request_;
    http::response_parser<http::buffer_body> parser_;
    std::vector<char> chunk_;
    std::unique_ptr<AtomicFileWriter> out_;
    SnapshotRequest req_;
    Endpoint ep_;
    Handler handler_;
    FetchOutcome outcome_;
    bool cancelled_ = false;
    bool done_ = false;

public:
    SnapshotFetch(boost::asio::io_context &ioc, SnapshotRequest req, Handler h)
        : resolver_(ioc), stream_(ioc), chunk_(chunk_bytes), req_(std::move(req)), handler_(std::move(h))
    {
        parser_.body_limit((std::numeric_limits<std::uint64_t>::max)());
    }

    void run()
    {
        auto self = shared_from_this();
        try
        {
            ep_ = parse_endpoint(req_.url);
        }
        catch (const std::invalid_argument &e)
        {
            std::string what = e.what();
            return boost::asio::post(stream_.get_executor(), [self, what]
                                     { self->finish(FetchError::transport_error, what); });
        }
        resolver_.async_resolve(ep_.host, ep_.port,
                                [self](boost::beast::error_code ec, boost::asio::ip::tcp::resolver::results_type results)
                                { self->on_resolve(ec, results); });
    }

    // Safe from any thread; the handler sees FetchError::cancelled
    void cancel()
    {
        auto self = shared_from_this();
        boost::asio::post(stream_.get_executor(), [self]
                          {
            if (self->done_) return;
            self->cancelled_ = true;
            self->resolver_.cancel();
            self->stream_.cancel(); });
    }

private:
    bool stopped()
    {
        if (cancelled_)
            finish(FetchError::cancelled, "fetch cancelled");
        return done_;
    }

    void on_resolve(boost::beast::error_code ec, boost::asio::ip::tcp::resolver::results_type results)
    {
        if (stopped())
            return;
        if (ec)
            return finish(FetchError::transport_error, "resolve " + ep_.host + ": " + ec.message());
        auto self = shared_from_this();
        stream_.expires_after(req_.timeout);
        stream_.async_connect(results, [self](boost::beast::error_code ec, auto)
                              { self->on_connect(ec); });
    }

    void on_connect(boost::beast::error_code ec)
    {
        if (stopped())
            return;
        if (ec)
            return finish(FetchError::transport_error, "connect " + ep_.host + ":" + ep_.port + ": " + ec.message());
        request_ = {http::verb::get, ep_.target, 11};
        request_.set(http::field::host, ep_.host_header());
        request_.set(http::field::user_agent, "print-bridge/" BOOST_BEAST_VERSION_STRING);
        request_.set(http::field::accept, "image/*");
        auto self = shared_from_this();
        stream_.expires_after(req_.timeout);
        http::async_write(stream_, request_, [self](boost::beast::error_code ec, std::size_t)
                          { self->on_write(ec); });
    }

    void on_write(boost::beast::error_code ec)
    {
        if (stopped())
            return;
        if (ec)
            return finish(FetchError::transport_error, "send request: " + ec.message());
        auto self = shared_from_this();
        stream_.expires_after(req_.timeout);
        http::async_read_header(stream_, buffer_, parser_, [self](boost::beast::error_code ec, std::size_t)
                                { self->on_header(ec); });
    }

    void on_header(boost::beast::error_code ec)
    {
        if (stopped())
            return;
        if (ec)
            return finish(FetchError::transport_error, "read header: " + ec.message());

        auto &res = parser_.get();
        outcome_.status = res.result_int();
        outcome_.content_type = media_type(res[http::field::content_type]);
        if (outcome_.status < 200 || outcome_.status >= 300)
            return finish(FetchError::transport_error, "HTTP " + std::to_string(outcome_.status));

        // A missing Content-Type is let through; a declared one must be allowed
        if (!outcome_.content_type.empty() && !req_.allowed_content_types.count(outcome_.content_type))
            return finish(FetchError::unsupported_content_type, "content type '" + outcome_.content_type + "'");

        if (auto len = parser_.content_length(); len && *len > req_.max_bytes)
            return finish(FetchError::size_exceeded, "declared length " + std::to_string(*len) +
                                                         " exceeds " + std::to_string(req_.max_bytes));
        if (parser_.is_done())
            return finish(FetchError::transport_error, "empty body");

        try
        {
            out_ = std::make_unique<AtomicFileWriter>(req_.destination);
        }
        catch (const std::exception &e)
        {
            return finish(FetchError::storage_error, e.what());
        }
        read_chunk();
    }

    void read_chunk()
    {
        parser_.get().body().data = chunk_.data();
        parser_.get().body().size = chunk_.size();
        auto self = shared_from_this();
        stream_.expires_after(req_.timeout);
        http::async_read_some(stream_, buffer_, parser_, [self](boost::beast::error_code ec, std::size_t)
                              { self->on_chunk(ec); });
    }

    void on_chunk(boost::beast::error_code ec)
    {
        if (stopped())
            return;
        if (ec == http::error::need_buffer)
            ec = {};
        if (ec)
            return finish(FetchError::transport_error, "read body: " + ec.message());

        std::size_t got = chunk_.size() - parser_.get().body().size;
        outcome_.bytes += got;
        if (outcome_.bytes > req_.max_bytes)
            return finish(FetchError::size_exceeded, "body exceeds " + std::to_string(req_.max_bytes) + " bytes");
        try
        {
            out_->write(chunk_.data(), got);
            if (parser_.is_done())
            {
                if (outcome_.bytes == 0)
                    return finish(FetchError::transport_error, "empty body");
                out_->commit();
                out_.reset();
                return finish(FetchError::none, {});
            }
        }
        catch (const std::exception &e)
        {
            return finish(FetchError::storage_error, e.what());
        }
        read_chunk();
    }

    void finish(FetchError err, std::string detail)
    {
        if (done_)
            return;
        done_ = true;
        out_.reset(); // uncommitted temp file is removed
        boost::beast::error_code ignored;
        stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
        stream_.close();
        outcome_.error = err;
        outcome_.detail = std::move(detail);
        auto h = std::move(handler_);
        handler_ = nullptr;
        if (h)
            h(outcome_);
    }
};

inline std::shared_ptr<SnapshotFetch> start_snapshot_fetch(boost::asio::io_context &ioc, SnapshotRequest req,
                                                           SnapshotFetch::Handler h)
{
    auto f = std::make_shared<SnapshotFetch>(ioc, std::move(req), std::move(h));
    f->run();
    return f;
}
