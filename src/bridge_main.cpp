/*
 * File: src/bridge_main.cpp
 * Project: Print Telemetry Bridge
 * Purpose: Main bridge binary: printer stream -> sanitized records -> sinks
 * Notes:
 *  - Snapshot and status files are only ever replaced via include/atomic_write.hpp
 *  - Exit 2 on configuration errors; otherwise runs until SIGINT/SIGTERM
 *  - WebSocket ping/pong keepalive enabled on the device stream
 * Last updated: 2026-10-16
 */

#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <optional>
#include <boost/asio.hpp>
#include "bridge_config.hpp"
#include "bridge_log.hpp"
#include "bridge_publish.hpp"
#include "bridge_session.hpp"

int main(int argc, char **argv)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--help" || a == "-h")
        {
            std::cout << config_usage(argv[0]);
            return 0;
        }
    }

    BridgeConfig cfg;
    try
    {
        cfg = load_config(argc, argv);
    }
    catch (const ConfigError &e)
    {
        std::cerr << "config error: " << e.what() << "\n"
                  << config_usage(argv[0]);
        return 2;
    }

    Logger::instance().set_level(cfg.log_level);
    if (!cfg.log_file.empty())
    {
        try
        {
            Logger::instance().open_file(cfg.log_file);
        }
        catch (const std::exception &e)
        {
            std::cerr << "WARN: " << e.what() << "; logging to stderr only\n";
        }
    }

    // Ensure the snapshot folder exists
    if (cfg.snapshots_enabled())
    {
        auto dir = std::filesystem::path(cfg.local_image_path).parent_path();
        std::error_code ec;
        if (!dir.empty())
            std::filesystem::create_directories(dir, ec);
        if (ec)
            log_warn("failed to ensure ", dir.string(), ": ", ec.message());
    }
    else
    {
        log_info("PRINTER_SNAPSHOT_URL not set; snapshots disabled");
    }

    boost::asio::io_context ioc{1};

    auto sinks = std::make_shared<PublisherSet>();
    std::shared_ptr<HubPublisher> hub;
    if (!cfg.hub_url.empty())
    {
        hub = std::make_shared<HubPublisher>(ioc, cfg.hub_url, cfg.hub_topic);
        sinks->add(hub);
    }
    if (!cfg.status_file.empty())
        sinks->add(std::make_shared<StatusFilePublisher>(cfg.status_file));
    if (sinks->empty())
        log_warn("no hub or status file configured; published records are only logged");

    auto session = std::make_shared<StreamSession>(ioc, cfg, sinks);

    // Stop on SIGINT/SIGTERM; wind-down is bounded by a deadline
    std::optional<std::chrono::steady_clock::time_point> deadline;
    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code &ec, int sig)
                       {
        if (ec) return;
        log_info("Shutting down (signal ", sig, ")...");
        session->stop();
        if (hub) hub->stop();
        deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3); });

    log_info("print bridge: stream=", cfg.stream_url,
             " snapshot=", cfg.snapshots_enabled() ? cfg.snapshot_url : std::string("off"),
             " publish_interval=", cfg.publish_interval.count(), "s");
    session->start();
    while (!ioc.stopped())
    {
        ioc.run_for(std::chrono::milliseconds(250));
        if (deadline && std::chrono::steady_clock::now() > *deadline)
            ioc.stop();
    }
    return 0;
}
