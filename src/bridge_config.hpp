/*
 * File: src/bridge_config.hpp
 * Project: Print Telemetry Bridge
 * Purpose: Bridge configuration from .env file, environment and argv
 * Notes:
 *  - Snapshot and status files are only ever replaced via include/atomic_write.hpp
 *  - Read once at start; invalid or missing required settings throw ConfigError
 *  - Malformed frames are skipped; the session never drops on bad data
 * Last updated: 2026-10-16
 */

#pragma once
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <map>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "common/endpoint.hpp"
#include "bridge_filter.hpp"
#include "bridge_log.hpp"

struct ConfigError : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

struct BridgeConfig
{
    using seconds = std::chrono::duration<double>;

    std::string stream_url;                  // ws://printer:9999/
    std::string snapshot_url;                // empty: snapshots disabled
    std::string local_image_path{"www/ender_v3ke/print.png"};
    std::string exposed_image_path{"/local/ender_v3ke/print.png"};
    seconds publish_interval{2.0};
    seconds snapshot_interval{30.0};
    std::uint64_t max_image_bytes{5 * 1024 * 1024};
    std::set<std::string> image_content_types{"image/png", "image/jpeg", "image/jpg"};
    seconds fetch_timeout{5.0};
    seconds backoff_floor{1.0};
    seconds backoff_ceiling{60.0};
    double backoff_jitter{0.2};
    seconds ping_interval{20.0};
    ChangeTolerances tolerances;
    std::string hub_url;                     // empty: no hub sink
    std::string hub_topic{"ender_v3ke/status"};
    std::string status_file;                 // empty: no status file
    std::string log_file;                    // empty: stderr only
    LogLevel log_level{LogLevel::info};

    bool snapshots_enabled() const { return !snapshot_url.empty(); }
};

// One row per setting: CLI flag, environment name
struct ConfigKey
{
    const char *flag;
    const char *env;
    const char *help;
};

inline const std::vector<ConfigKey> &config_keys()
{
    static const std::vector<ConfigKey> keys{
        {"--ws", "PRINTER_WS_URL", "printer telemetry stream (ws://host:port/path), required"},
        {"--snapshot", "PRINTER_SNAPSHOT_URL", "printer image url (http://...), empty disables"},
        {"--image-path", "LOCAL_IMAGE_PATH", "local snapshot file"},
        {"--image-ref", "EXPOSED_IMAGE_PATH", "image reference published as image_url"},
        {"--publish-interval", "PUBLISH_INTERVAL", "seconds between publishes / cadence tick"},
        {"--snapshot-interval", "SNAPSHOT_INTERVAL", "seconds between snapshot fetches"},
        {"--max-image-bytes", "MAX_IMAGE_BYTES", "snapshot size bound"},
        {"--image-types", "IMAGE_CONTENT_TYPES", "comma separated allowed content types"},
        {"--fetch-timeout", "SNAPSHOT_TIMEOUT", "seconds per snapshot network operation"},
        {"--backoff-floor", "BACKOFF_FLOOR", "first reconnect wait, seconds"},
        {"--backoff-ceiling", "BACKOFF_CEILING", "longest reconnect wait, seconds"},
        {"--backoff-jitter", "BACKOFF_JITTER", "fraction of the wait randomized, 0..1"},
        {"--ping-interval", "WS_PING_INTERVAL", "websocket keepalive ping, seconds"},
        {"--tol-progress", "TOL_PROGRESS", "progress change tolerance, percent"},
        {"--tol-temperature", "TOL_TEMPERATURE", "temperature change tolerance, degC"},
        {"--tol-layer", "TOL_LAYER", "layer count change tolerance"},
        {"--tol-time", "TOL_TIME", "elapsed/remaining change tolerance, seconds"},
        {"--tol-filament", "TOL_FILAMENT", "used filament change tolerance, mm"},
        {"--hub", "HUB_URL", "pub/sub hub (ws://...), empty disables"},
        {"--topic", "HUB_TOPIC", "hub topic"},
        {"--status-file", "STATUS_FILE", "write each published record here"},
        {"--log-file", "LOG_FILE", "append log lines here"},
        {"--log-level", "LOG_LEVEL", "debug|info|warn|error"},
    };
    return keys;
}

inline std::string config_usage(const std::string &prog)
{
    std::ostringstream oss;
    oss << "usage: " << prog << " [--env-file PATH] [options]\n";
    for (const auto &k : config_keys())
        oss << "  " << k.flag << " <v>  (" << k.env << ") " << k.help << "\n";
    return oss.str();
}

inline std::string trim(const std::string &s)
{
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos)
        return {};
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

// KEY=VALUE lines; blank lines and # comments skipped, surrounding quotes stripped
inline std::map<std::string, std::string> parse_env_file(std::istream &in)
{
    std::map<std::string, std::string> out;
    std::string line;
    while (std::getline(in, line))
    {
        auto s = trim(line);
        if (s.empty() || s[0] == '#')
            continue;
        auto eq = s.find('=');
        if (eq == std::string::npos)
            continue;
        auto key = trim(s.substr(0, eq));
        auto val = trim(s.substr(eq + 1));
        if (val.size() >= 2 && (val.front() == '"' || val.front() == '\'') && val.back() == val.front())
            val = val.substr(1, val.size() - 2);
        if (!key.empty())
            out[key] = val;
    }
    return out;
}

using EnvLookup = std::function<const char *(const char *)>;

// Settings keyed by environment name. Precedence: argv > environment > .env file
inline std::map<std::string, std::string> collect_settings(const std::vector<std::string> &args,
                                                           const EnvLookup &getenv_fn)
{
    std::string env_file = ".env";
    std::map<std::string, std::string> from_args;
    for (std::size_t i = 0; i < args.size(); ++i)
    {
        const auto &a = args[i];
        if (a == "--env-file" && i + 1 < args.size())
        {
            env_file = args[++i];
            continue;
        }
        const ConfigKey *hit = nullptr;
        for (const auto &k : config_keys())
            if (a == k.flag)
                hit = &k;
        if (!hit)
            throw ConfigError("unknown option: " + a);
        if (i + 1 >= args.size())
            throw ConfigError("missing value for " + a);
        from_args[hit->env] = args[++i];
    }

    std::map<std::string, std::string> settings;
    {
        std::ifstream f(env_file);
        if (f)
            settings = parse_env_file(f);
    }
    for (const auto &k : config_keys())
    {
        if (const char *v = getenv_fn(k.env))
            settings[k.env] = v;
    }
    for (auto &[k, v] : from_args)
        settings[k] = v;
    return settings;
}

inline double parse_double_setting(const std::string &name, const std::string &v)
{
    std::size_t used = 0;
    double d = 0;
    try
    {
        d = std::stod(v, &used);
    }
    catch (const std::exception &)
    {
        throw ConfigError(name + ": not a number: '" + v + "'");
    }
    if (used != v.size() || !std::isfinite(d))
        throw ConfigError(name + ": not a number: '" + v + "'");
    return d;
}

inline void require_url(const std::string &name, const std::string &url, const char *scheme)
{
    Endpoint ep;
    try
    {
        ep = parse_endpoint(url);
    }
    catch (const std::invalid_argument &e)
    {
        throw ConfigError(name + ": " + e.what());
    }
    if (ep.scheme != scheme)
        throw ConfigError(name + ": unsupported scheme '" + ep.scheme + "' (expected " + scheme + "://)");
}

inline BridgeConfig config_from_settings(const std::map<std::string, std::string> &s)
{
    BridgeConfig c;
    auto get = [&](const char *k) -> const std::string *
    {
        auto it = s.find(k);
        return (it == s.end() || trim(it->second).empty()) ? nullptr : &it->second;
    };
    auto positive = [&](const char *k, BridgeConfig::seconds &out)
    {
        if (auto v = get(k))
        {
            double d = parse_double_setting(k, trim(*v));
            if (d <= 0)
                throw ConfigError(std::string(k) + " must be positive");
            // timers run in whole milliseconds; anything shorter would spin
            if (std::chrono::duration_cast<std::chrono::milliseconds>(BridgeConfig::seconds{d}).count() < 1)
                throw ConfigError(std::string(k) + " must be at least 0.001 seconds");
            out = BridgeConfig::seconds{d};
        }
    };
    auto tolerance = [&](const char *k, double &out)
    {
        if (auto v = get(k))
        {
            double d = parse_double_setting(k, trim(*v));
            if (d < 0)
                throw ConfigError(std::string(k) + " must not be negative");
            out = d;
        }
    };

    auto ws = get("PRINTER_WS_URL");
    if (!ws)
        throw ConfigError("PRINTER_WS_URL (--ws) is required");
    c.stream_url = trim(*ws);
    require_url("PRINTER_WS_URL", c.stream_url, "ws");

    if (auto v = get("PRINTER_SNAPSHOT_URL"))
    {
        c.snapshot_url = trim(*v);
        require_url("PRINTER_SNAPSHOT_URL", c.snapshot_url, "http");
    }
    if (auto v = get("LOCAL_IMAGE_PATH"))
        c.local_image_path = trim(*v);
    if (auto v = get("EXPOSED_IMAGE_PATH"))
        c.exposed_image_path = trim(*v);

    positive("PUBLISH_INTERVAL", c.publish_interval);
    positive("SNAPSHOT_INTERVAL", c.snapshot_interval);
    positive("SNAPSHOT_TIMEOUT", c.fetch_timeout);
    positive("BACKOFF_FLOOR", c.backoff_floor);
    positive("BACKOFF_CEILING", c.backoff_ceiling);
    positive("WS_PING_INTERVAL", c.ping_interval);
    if (c.backoff_ceiling < c.backoff_floor)
        throw ConfigError("BACKOFF_CEILING must not be below BACKOFF_FLOOR");

    if (auto v = get("MAX_IMAGE_BYTES"))
    {
        auto t = trim(*v);
        bool digits = !t.empty() && t.find_first_not_of("0123456789") == std::string::npos;
        std::uint64_t n = 0;
        if (digits)
        {
            try
            {
                n = std::stoull(t);
            }
            catch (const std::out_of_range &)
            {
                throw ConfigError("MAX_IMAGE_BYTES out of range: '" + t + "'");
            }
        }
        if (!digits || n < 1)
            throw ConfigError("MAX_IMAGE_BYTES must be a positive integer");
        c.max_image_bytes = n;
    }
    if (auto v = get("IMAGE_CONTENT_TYPES"))
    {
        c.image_content_types.clear();
        std::istringstream in(*v);
        std::string item;
        while (std::getline(in, item, ','))
        {
            item = trim(item);
            for (auto &ch : item)
                ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
            if (!item.empty())
                c.image_content_types.insert(item);
        }
        if (c.image_content_types.empty())
            throw ConfigError("IMAGE_CONTENT_TYPES is empty");
    }
    if (auto v = get("BACKOFF_JITTER"))
    {
        c.backoff_jitter = parse_double_setting("BACKOFF_JITTER", trim(*v));
        if (c.backoff_jitter < 0 || c.backoff_jitter > 1)
            throw ConfigError("BACKOFF_JITTER must be within [0,1]");
    }

    tolerance("TOL_PROGRESS", c.tolerances.progress);
    tolerance("TOL_TEMPERATURE", c.tolerances.temperature);
    tolerance("TOL_LAYER", c.tolerances.layer);
    tolerance("TOL_TIME", c.tolerances.time);
    tolerance("TOL_FILAMENT", c.tolerances.filament);

    if (auto v = get("HUB_URL"))
    {
        c.hub_url = trim(*v);
        require_url("HUB_URL", c.hub_url, "ws");
    }
    if (auto v = get("HUB_TOPIC"))
        c.hub_topic = trim(*v);
    if (auto v = get("STATUS_FILE"))
        c.status_file = trim(*v);
    if (auto v = get("LOG_FILE"))
        c.log_file = trim(*v);
    if (auto v = get("LOG_LEVEL"))
    {
        auto l = parse_log_level(trim(*v));
        if (!l)
            throw ConfigError("LOG_LEVEL: unknown level '" + *v + "'");
        c.log_level = *l;
    }
    return c;
}

inline BridgeConfig load_config(int argc, char **argv)
{
    std::vector<std::string> args(argv + 1, argv + argc);
    return config_from_settings(collect_settings(args, [](const char *k) { return std::getenv(k); }));
}
