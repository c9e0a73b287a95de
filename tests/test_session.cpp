/*
 * File: tests/test_session.cpp
 * Project: Print Telemetry Bridge
 * Purpose: Stream session against loopback printer endpoints
 * Notes:
 *  - Snapshot and status files are only ever replaced via include/atomic_write.hpp
 *  - The io_context runs on the test thread; servers run on their own threads
 * Last updated: 2026-10-16
 */

#include <catch2/catch_all.hpp>
#include "bridge_session.hpp"
#include "test_servers.hpp"

#include <algorithm>

using namespace std::chrono_literals;
using test_net::WsServer;

namespace
{
struct RecordingPublisher : Publisher
{
    std::vector<PrintRecord> records;
    void publish(const PrintRecord &r) override { records.push_back(r); }
    std::string name() const override { return "recording"; }
};

BridgeConfig quick_config(const std::string &ws_url)
{
    BridgeConfig c;
    c.stream_url = ws_url;
    c.publish_interval = BridgeConfig::seconds{0.1};
    c.backoff_floor = BridgeConfig::seconds{0.05};
    c.backoff_ceiling = BridgeConfig::seconds{0.2};
    c.backoff_jitter = 0.0;
    c.ping_interval = BridgeConfig::seconds{5.0};
    return c;
}

void send_text(WsServer::stream &ws, const std::string &text)
{
    boost::beast::error_code ec;
    ws.text(true);
    ws.write(boost::asio::buffer(text), ec);
}

// Blocks until the client goes away
void hold_open(WsServer::stream &ws)
{
    boost::beast::flat_buffer b;
    boost::beast::error_code ec;
    while (!ec)
        ws.read(b, ec);
}

bool in_order(const std::vector<SessionPhase> &seen, const std::vector<SessionPhase> &want)
{
    auto it = seen.begin();
    for (auto p : want)
    {
        it = std::find(it, seen.end(), p);
        if (it == seen.end())
            return false;
        ++it;
    }
    return true;
}
} // namespace

TEST_CASE("dropped stream reconnects through backoff")
{
    WsServer srv([](WsServer::stream &ws)
                 {
        send_text(ws, R"({"progress": 10, "nozzleTemp": 200})");
        std::this_thread::sleep_for(50ms); });

    boost::asio::io_context ioc;
    auto sink = std::make_shared<RecordingPublisher>();
    auto session = std::make_shared<StreamSession>(ioc, quick_config(srv.url()), sink, 1);
    std::vector<SessionPhase> phases;
    int connected = 0;
    StreamSession *s = session.get();
    session->on_phase([&, s](SessionPhase p)
                      {
        phases.push_back(p);
        if (p == SessionPhase::connected && ++connected == 2)
            s->stop(); });
    session->start();

    REQUIRE(test_net::run_until(ioc, [&]
                                { return !phases.empty() && phases.back() == SessionPhase::stopped; },
                                10000ms));
    REQUIRE(in_order(phases, {SessionPhase::connecting, SessionPhase::connected, SessionPhase::disconnected,
                              SessionPhase::backoff, SessionPhase::connecting, SessionPhase::connected,
                              SessionPhase::stopped}));
    REQUIRE(session->state().connections == 2);
    REQUIRE(session->state().consecutive_failures == 0);
    REQUIRE_FALSE(sink->records.empty());
    REQUIRE(sink->records.front().progress == 10.0);
    REQUIRE(srv.connections() >= 2);
}

TEST_CASE("stop during backoff ends promptly")
{
    auto cfg = quick_config("ws://127.0.0.1:" + std::to_string(test_net::closed_port()) + "/");
    cfg.backoff_floor = BridgeConfig::seconds{10.0};
    cfg.backoff_ceiling = BridgeConfig::seconds{60.0};

    boost::asio::io_context ioc;
    auto session = std::make_shared<StreamSession>(ioc, cfg, std::make_shared<RecordingPublisher>(), 2);
    StreamSession *s = session.get();
    std::optional<std::chrono::steady_clock::time_point> asked, done;
    session->on_phase([&, s](SessionPhase p)
                      {
        if (p == SessionPhase::backoff && !asked)
        {
            asked = std::chrono::steady_clock::now();
            s->stop();
        }
        if (p == SessionPhase::stopped)
            done = std::chrono::steady_clock::now(); });
    session->start();

    auto t0 = std::chrono::steady_clock::now();
    REQUIRE_NOTHROW(ioc.run_for(5s));
    REQUIRE(asked);
    REQUIRE(done);
    REQUIRE(*done - *asked < 500ms);
    // nothing left pending once stopped
    REQUIRE(std::chrono::steady_clock::now() - t0 < 3s);
    REQUIRE(session->state().phase == SessionPhase::stopped);
    REQUIRE(session->state().consecutive_failures == 1);
}

TEST_CASE("consecutive failures grow the wait up to the ceiling")
{
    auto cfg = quick_config("ws://127.0.0.1:" + std::to_string(test_net::closed_port()) + "/");
    cfg.backoff_floor = BridgeConfig::seconds{0.02};
    cfg.backoff_ceiling = BridgeConfig::seconds{0.08};

    boost::asio::io_context ioc;
    auto session = std::make_shared<StreamSession>(ioc, cfg, std::make_shared<RecordingPublisher>(), 3);
    StreamSession *s = session.get();
    std::vector<std::chrono::milliseconds> nominal;
    session->on_phase([&, s](SessionPhase p)
                      {
        if (p != SessionPhase::backoff)
            return;
        nominal.push_back(s->state().backoff);
        if (nominal.size() == 6)
            s->stop(); });
    session->start();

    REQUIRE(test_net::run_until(ioc, [&]
                                { return session->state().phase == SessionPhase::stopped; },
                                10000ms));
    REQUIRE(nominal.size() == 6);
    REQUIRE(std::is_sorted(nominal.begin(), nominal.end()));
    REQUIRE(nominal[1] == 2 * nominal[0]);
    REQUIRE(nominal.back() == *std::max_element(nominal.begin(), nominal.end()));
    REQUIRE(nominal[4] == nominal[5]);
    REQUIRE(session->state().consecutive_failures == 6);
}

TEST_CASE("malformed frames do not drop the connection")
{
    WsServer srv([](WsServer::stream &ws)
                 {
        send_text(ws, "{not json");
        send_text(ws, "[]");
        send_text(ws, R"({"progress": 33, "bedTemp": 60})");
        hold_open(ws); });

    boost::asio::io_context ioc;
    auto sink = std::make_shared<RecordingPublisher>();
    auto session = std::make_shared<StreamSession>(ioc, quick_config(srv.url()), sink, 4);
    std::vector<SessionPhase> phases;
    session->on_phase([&](SessionPhase p)
                      { phases.push_back(p); });
    session->start();

    REQUIRE(test_net::run_until(ioc, [&]
                                { return !sink->records.empty(); },
                                5000ms));
    session->stop();
    test_net::run_until(ioc, [&]
                        { return session->state().phase == SessionPhase::stopped; },
                        2000ms);

    REQUIRE(sink->records.back().progress == 33.0);
    REQUIRE(session->pipeline().stats().parse_errors == 1);
    REQUIRE(session->pipeline().stats().ignored == 1);
    REQUIRE(session->state().connections == 1);
    REQUIRE(std::find(phases.begin(), phases.end(), SessionPhase::disconnected) == phases.end());
}

TEST_CASE("new print job fetches a snapshot and republishes with its reference")
{
    auto dir = test_net::temp_dir("session");
    const std::string png = std::string("\x89PNG\r\n\x1a\n", 8) + std::string(4000, 'p');
    test_net::RawHttpServer cam({test_net::RawHttpServer::head(200, "image/png", png.size()), png});
    WsServer srv([](WsServer::stream &ws)
                 {
        send_text(ws, R"({"printProgress": 5, "printFileName": "/usr/data/gcodes/benchy.gcode"})");
        hold_open(ws); });

    auto cfg = quick_config(srv.url());
    cfg.snapshot_url = cam.url();
    cfg.local_image_path = (dir / "print.png").string();
    cfg.exposed_image_path = "/local/ender_v3ke/print.png";

    boost::asio::io_context ioc;
    auto sink = std::make_shared<RecordingPublisher>();
    auto session = std::make_shared<StreamSession>(ioc, cfg, sink, 5);
    std::vector<FetchOutcome> fetches;
    session->on_fetch([&](const FetchOutcome &o)
                      { fetches.push_back(o); });
    session->start();

    REQUIRE(test_net::run_until(ioc, [&]
                                { return !sink->records.empty() && !sink->records.back().image_url.empty(); },
                                5000ms));
    session->stop();
    test_net::run_until(ioc, [&]
                        { return session->state().phase == SessionPhase::stopped; },
                        2000ms);

    REQUIRE(fetches.size() == 1);
    REQUIRE(fetches[0].ok());
    REQUIRE(test_net::read_file(dir / "print.png") == png);
    REQUIRE(sink->records.front().image_url.empty());
    REQUIRE(sink->records.back().image_url == "/local/ender_v3ke/print.png");
    REQUIRE(sink->records.back().filename == "benchy.gcode");
    REQUIRE(session->state().fetches_ok == 1);
    std::filesystem::remove_all(dir);
}

TEST_CASE("rejected snapshot keeps the old file and publishing goes on")
{
    auto dir = test_net::temp_dir("session");
    test_net::write_file(dir / "print.png", "old");
    std::string html = "<html>no</html>";
    test_net::RawHttpServer cam({test_net::RawHttpServer::head(200, "text/html", html.size()), html});
    WsServer srv([](WsServer::stream &ws)
                 {
        send_text(ws, R"({"progress": 50, "printFileName": "cube.gcode"})");
        hold_open(ws); });

    auto cfg = quick_config(srv.url());
    cfg.snapshot_url = cam.url();
    cfg.local_image_path = (dir / "print.png").string();

    boost::asio::io_context ioc;
    auto sink = std::make_shared<RecordingPublisher>();
    auto session = std::make_shared<StreamSession>(ioc, cfg, sink, 6);
    std::vector<FetchOutcome> fetches;
    session->on_fetch([&](const FetchOutcome &o)
                      { fetches.push_back(o); });
    session->start();

    REQUIRE(test_net::run_until(ioc, [&]
                                { return !fetches.empty(); },
                                5000ms));
    session->stop();
    test_net::run_until(ioc, [&]
                        { return session->state().phase == SessionPhase::stopped; },
                        2000ms);

    REQUIRE(fetches[0].error == FetchError::unsupported_content_type);
    REQUIRE(test_net::read_file(dir / "print.png") == "old");
    REQUIRE(session->state().fetches_failed == 1);
    REQUIRE_FALSE(sink->records.empty());
    REQUIRE(sink->records.back().progress == 50.0);
    std::filesystem::remove_all(dir);
}

TEST_CASE("triggers during a running fetch are skipped")
{
    auto dir = test_net::temp_dir("session");
    const std::string png = std::string("\x89PNG\r\n\x1a\n", 8) + std::string(8000, 's');
    // ~1 s download: 9 chunks, 120 ms apart
    test_net::RawHttpServer cam({test_net::RawHttpServer::head(200, "image/png", png.size()), png, 1000, 120ms});
    WsServer srv([](WsServer::stream &ws)
                 {
        send_text(ws, R"({"printProgress": 5, "printFileName": "slow.gcode"})");
        for (int i = 0; i < 20; ++i)
        {
            std::this_thread::sleep_for(50ms);
            send_text(ws, R"({"printProgress": )" + std::to_string(5 + i) + "}");
        }
        hold_open(ws); });

    auto cfg = quick_config(srv.url());
    cfg.publish_interval = BridgeConfig::seconds{0.05};
    cfg.snapshot_interval = BridgeConfig::seconds{0.1};
    cfg.snapshot_url = cam.url();
    cfg.local_image_path = (dir / "print.png").string();

    boost::asio::io_context ioc;
    auto session = std::make_shared<StreamSession>(ioc, cfg, std::make_shared<RecordingPublisher>(), 7);
    std::vector<FetchOutcome> fetches;
    session->on_fetch([&](const FetchOutcome &o)
                      { fetches.push_back(o); });
    session->start();

    REQUIRE(test_net::run_until(ioc, [&]
                                { return session->state().fetches_skipped >= 1; },
                                5000ms));
    // the first download is still running and nothing else was started
    REQUIRE(session->state().fetch_in_flight);
    REQUIRE(fetches.empty());
    REQUIRE(session->state().fetches_ok + session->state().fetches_failed == 0);

    REQUIRE(test_net::run_until(ioc, [&]
                                { return !fetches.empty(); },
                                5000ms));
    session->stop();
    test_net::run_until(ioc, [&]
                        { return session->state().phase == SessionPhase::stopped; },
                        2000ms);

    REQUIRE(fetches.front().ok());
    REQUIRE(session->state().fetches_ok == 1);
    REQUIRE(test_net::read_file(dir / "print.png") == png);
    std::filesystem::remove_all(dir);
}

TEST_CASE("snapshot is refreshed on the cadence without a job change")
{
    auto dir = test_net::temp_dir("session");
    const std::string png = std::string("\x89PNG\r\n\x1a\n", 8) + std::string(2000, 'c');
    test_net::RawHttpServer cam({test_net::RawHttpServer::head(200, "image/png", png.size()), png});
    WsServer srv([](WsServer::stream &ws)
                 {
        send_text(ws, R"({"printProgress": 40, "printFileName": "steady.gcode"})");
        hold_open(ws); });

    auto cfg = quick_config(srv.url());
    cfg.publish_interval = BridgeConfig::seconds{0.05};
    cfg.snapshot_interval = BridgeConfig::seconds{0.3};
    cfg.snapshot_url = cam.url();
    cfg.local_image_path = (dir / "print.png").string();

    boost::asio::io_context ioc;
    auto session = std::make_shared<StreamSession>(ioc, cfg, std::make_shared<RecordingPublisher>(), 8);
    std::vector<std::chrono::steady_clock::time_point> done_at;
    session->on_fetch([&](const FetchOutcome &o)
                      {
        if (o.ok())
            done_at.push_back(std::chrono::steady_clock::now()); });
    session->start();

    REQUIRE(test_net::run_until(ioc, [&]
                                { return done_at.size() >= 2; },
                                5000ms));
    session->stop();
    test_net::run_until(ioc, [&]
                        { return session->state().phase == SessionPhase::stopped; },
                        2000ms);

    // one frame, one job: the second download came from the interval alone
    REQUIRE(session->pipeline().stats().frames == 1);
    REQUIRE(done_at[1] - done_at[0] >= 200ms);
    REQUIRE(cam.connections() >= 2);
    std::filesystem::remove_all(dir);
}
