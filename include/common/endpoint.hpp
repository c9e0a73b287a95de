/*
 * File: include/common/endpoint.hpp
 * Project: Print Telemetry Bridge
 * Purpose: Minimal ws:// and http:// URL splitting
 * Notes:
 *  - Snapshot and status files are only ever replaced via include/atomic_write.hpp
 *  - Only plaintext schemes; there is no TLS in the stack
 *  - Malformed frames are skipped; the session never drops on bad data
 * Last updated: 2026-10-16
 */

#pragma once
#include <cctype>
#include <stdexcept>
#include <string>


struct Endpoint
{
    std::string scheme; // "ws" or "http"
    std::string host;
    std::string port;
    std::string target; // path + query, at least "/"

    // Host header value; IPv6 literals bracketed, port only when non-default
    std::string host_header() const
    {
        std::string h = host.find(':') == std::string::npos ? host : "[" + host + "]";
        return port == "80" ? h : h + ":" + port;
    }
};

// expect scheme://host[:port][/path]
inline Endpoint parse_endpoint(const std::string &url)
{
    Endpoint ep;
    auto scheme_pos = url.find("://");
    if (scheme_pos == std::string::npos || scheme_pos == 0)
        throw std::invalid_argument("missing scheme in url: " + url);
    ep.scheme = url.substr(0, scheme_pos);
    for (auto &c : ep.scheme)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    auto rest = url.substr(scheme_pos + 3);
    auto slash = rest.find('/');
    std::string hp = (slash == std::string::npos) ? rest : rest.substr(0, slash);
    ep.target = (slash == std::string::npos) ? "/" : rest.substr(slash);

    if (!hp.empty() && hp.front() == '[')
    {
        // [v6addr]:port
        auto close = hp.find(']');
        if (close == std::string::npos)
            throw std::invalid_argument("bad ipv6 host in url: " + url);
        ep.host = hp.substr(1, close - 1);
        if (close + 1 < hp.size() && hp[close + 1] == ':')
            ep.port = hp.substr(close + 2);
    }
    else
    {
        auto colon = hp.find(':');
        ep.host = hp.substr(0, colon);
        if (colon != std::string::npos)
            ep.port = hp.substr(colon + 1);
    }
    if (ep.host.empty())
        throw std::invalid_argument("missing host in url: " + url);
    if (ep.port.empty())
        ep.port = "80"; // default
    for (char c : ep.port)
        if (c < '0' || c > '9')
            throw std::invalid_argument("bad port in url: " + url);
    return ep;
}
