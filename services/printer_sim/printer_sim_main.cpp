/*
 * File: services/printer_sim/printer_sim_main.cpp
 * Project: Print Telemetry Bridge
 * Purpose: Development printer simulator: telemetry WebSocket + snapshot HTTP
 * Notes:
 *  - Snapshot and status files are only ever replaced via include/atomic_write.hpp
 *  - Frames carry a random subset of fields, like the real device
 *  - WebSocket ping/pong keepalive handled by beast on both ends
 * Last updated: 2026-10-16
 */

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <csignal>
#include <cstdint>
#include <deque>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <random>
#include <set>
#include <sstream>
#include <string>

using json = nlohmann::json;
namespace http = boost::beast::http;
namespace websocket = boost::beast::websocket;
using tcp = boost::asio::ip::tcp;

// 1x1 PNG served when no --image is given
static const unsigned char k_tiny_png[] = {
    0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A, 0x00, 0x00, 0x00, 0x0D, 0x49, 0x48, 0x44, 0x52,
    0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x01, 0x08, 0x06, 0x00, 0x00, 0x00, 0x1F, 0x15, 0xC4,
    0x89, 0x00, 0x00, 0x00, 0x0D, 0x49, 0x44, 0x41, 0x54, 0x78, 0x9C, 0x63, 0x00, 0x01, 0x00, 0x00,
    0x05, 0x00, 0x01, 0x0D, 0x0A, 0x2D, 0xB4, 0x00, 0x00, 0x00, 0x00, 0x49, 0x45, 0x4E, 0x44, 0xAE,
    0x42, 0x60, 0x82};

// Advances a fake print job one step per frame
class SimPrinter
{
    std::mt19937 rng_{std::random_device{}()};
    double progress_ = 0;
    int layer_ = 0;
    int total_ = 240;
    long elapsed_ = 0;
    double filament_ = 0;
    int job_ = 1;

public:
    json next_frame(bool partial)
    {
        progress_ += 0.25;
        if (progress_ > 100)
        {
            progress_ = 0;
            layer_ = 0;
            elapsed_ = 0;
            filament_ = 0;
            ++job_;
        }
        layer_ = static_cast<int>(total_ * progress_ / 100.0);
        elapsed_ += 2;
        filament_ += 4.2;
        std::normal_distribution<double> jitter(0.0, 0.3);
        json full{
            {"printProgress", progress_},
            {"layer", layer_},
            {"TotalLayer", total_},
            {"printJobTime", elapsed_},
            {"printLeftTime", progress_ > 0 ? static_cast<long>(elapsed_ * (100 - progress_) / progress_) : 0},
            {"nozzleTemp", 210.0 + jitter(rng_)},
            {"bedTemp0", 60.0 + jitter(rng_)},
            {"usedMaterialLength", static_cast<long>(filament_)},
            {"printFileName", "/usr/data/printer_data/gcodes/job_" + std::to_string(job_) + ".gcode"}};
        if (!partial)
            return full;
        json sub = json::object();
        std::bernoulli_distribution keep(0.5);
        for (auto &[k, v] : full.items())
            if (keep(rng_))
                sub[k] = v;
        return sub;
    }
};

class SimWsServer
{
    struct Session : std::enable_shared_from_this<Session>
    {
        websocket::stream<tcp::socket> ws;
        boost::beast::flat_buffer buffer;
        std::deque<std::string> out;
        SimWsServer &server;
        Session(tcp::socket &&s, SimWsServer &sv) : ws(std::move(s)), server(sv) {}
        void run()
        {
            ws.set_option(websocket::stream_base::timeout::suggested(boost::beast::role_type::server));
            auto self = shared_from_this();
            ws.async_accept([self](boost::beast::error_code ec)
                            {
                if (ec) return;
                self->server.sessions_.insert(self);
                std::cerr << "[printer_sim] client connected (" << self->server.sessions_.size() << ")\n";
                self->do_read(); });
        }
        void do_read()
        {
            auto self = shared_from_this();
            ws.async_read(buffer, [self](boost::beast::error_code ec, std::size_t)
                          {
                if (ec) { self->server.sessions_.erase(self); return; }
                self->buffer.consume(self->buffer.size());
                self->do_read(); });
        }
        void send(const std::string &s)
        {
            out.push_back(s);
            if (out.size() == 1)
                do_write();
        }
        void do_write()
        {
            auto self = shared_from_this();
            ws.text(true);
            ws.async_write(boost::asio::buffer(out.front()), [self](boost::beast::error_code ec, std::size_t)
                           {
                if (ec) { self->server.sessions_.erase(self); return; }
                self->out.pop_front();
                if (!self->out.empty()) self->do_write(); });
        }
    };

    tcp::acceptor acceptor_;
    tcp::socket socket_;
    std::set<std::shared_ptr<Session>> sessions_;

public:
    SimWsServer(boost::asio::io_context &ioc, tcp::endpoint ep) : acceptor_(ioc), socket_(ioc)
    {
        acceptor_.open(ep.protocol());
        acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
        acceptor_.bind(ep);
        acceptor_.listen(boost::asio::socket_base::max_listen_connections);
        do_accept();
    }
    void broadcast(const std::string &msg)
    {
        for (auto &s : sessions_)
            s->send(msg);
    }

private:
    void do_accept()
    {
        acceptor_.async_accept(socket_, [this](boost::beast::error_code ec)
                               {
            if (!ec) std::make_shared<Session>(std::move(socket_), *this)->run();
            do_accept(); });
    }
};

class SimHttpServer
{
    struct Session : std::enable_shared_from_this<Session>
    {
        tcp::socket socket;
        boost::beast::flat_buffer buffer;
        http::request<http::string_body> req;
        const std::string &image;
        const std::string &content_type;
        Session(tcp::socket &&s, const std::string &img, const std::string &ct)
            : socket(std::move(s)), image(img), content_type(ct) {}
        void run()
        {
            auto self = shared_from_this();
            http::async_read(socket, buffer, req, [self](boost::beast::error_code ec, std::size_t)
                             { if (!ec) self->handle(); });
        }
        void handle()
        {
            auto res = std::make_shared<http::response<http::string_body>>(http::status::ok, req.version());
            res->set(http::field::server, "printer-sim");
            if (req.target() == "/health")
            {
                res->set(http::field::content_type, "application/json");
                res->body() = json{{"status", "ok"}}.dump();
            }
            else
            {
                res->set(http::field::content_type, content_type);
                res->body() = image;
            }
            res->prepare_payload();
            auto self = shared_from_this();
            http::async_write(socket, *res, [self, res](boost::beast::error_code, std::size_t)
                              {
                boost::system::error_code ignored;
                self->socket.shutdown(tcp::socket::shutdown_send, ignored); });
        }
    };

    tcp::acceptor acceptor_;
    tcp::socket socket_;
    std::string image_;
    std::string content_type_;

public:
    SimHttpServer(boost::asio::io_context &ioc, tcp::endpoint ep, std::string image, std::string ct)
        : acceptor_(ioc), socket_(ioc), image_(std::move(image)), content_type_(std::move(ct))
    {
        acceptor_.open(ep.protocol());
        acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
        acceptor_.bind(ep);
        acceptor_.listen(boost::asio::socket_base::max_listen_connections);
        do_accept();
    }

private:
    void do_accept()
    {
        acceptor_.async_accept(socket_, [this](boost::beast::error_code ec)
                               {
            if (!ec) std::make_shared<Session>(std::move(socket_), image_, content_type_)->run();
            do_accept(); });
    }
};

int main(int argc, char **argv)
{
    try
    {
        std::string ws_bind = "0.0.0.0:9999";
        std::string http_bind = "0.0.0.0:8081";
        std::string image_path;
        int period_ms = 1000;
        int noise = 0; // every Nth frame is malformed; 0 = never

        for (int i = 1; i < argc; ++i)
        {
            std::string a = argv[i];
            if (a == "--ws" && i + 1 < argc)
                ws_bind = argv[++i];
            else if (a == "--http" && i + 1 < argc)
                http_bind = argv[++i];
            else if (a == "--image" && i + 1 < argc)
                image_path = argv[++i];
            else if (a == "--period" && i + 1 < argc)
                period_ms = std::stoi(argv[++i]);
            else if (a == "--noise" && i + 1 < argc)
                noise = std::stoi(argv[++i]);
        }
        auto split = [](const std::string &s)
        { auto p=s.find(":"); return std::pair{s.substr(0,p), static_cast<unsigned short>(std::stoi(s.substr(p+1)))}; };
        auto [ws_host, ws_port] = split(ws_bind);
        auto [http_host, http_port] = split(http_bind);

        std::string image(reinterpret_cast<const char *>(k_tiny_png), sizeof(k_tiny_png));
        std::string content_type = "image/png";
        if (!image_path.empty())
        {
            std::ifstream f(image_path, std::ios::binary);
            if (!f)
                throw std::runtime_error("failed to open image " + image_path);
            std::ostringstream ss;
            ss << f.rdbuf();
            image = ss.str();
            auto ext = image_path.substr(image_path.find_last_of('.') + 1);
            if (ext == "jpg" || ext == "jpeg")
                content_type = "image/jpeg";
        }

        boost::asio::io_context ioc{1};
        SimWsServer ws{ioc, tcp::endpoint{boost::asio::ip::make_address(ws_host), ws_port}};
        SimHttpServer web{ioc, tcp::endpoint{boost::asio::ip::make_address(http_host), http_port}, image, content_type};

        SimPrinter printer;
        boost::asio::steady_timer tick(ioc);
        std::uint64_t n = 0;
        std::function<void()> schedule = [&]
        {
            tick.expires_after(std::chrono::milliseconds(period_ms));
            tick.async_wait([&](boost::beast::error_code ec)
                            {
                if (ec) return;
                ++n;
                if (noise > 0 && n % static_cast<std::uint64_t>(noise) == 0)
                    ws.broadcast("{not json");
                else
                    ws.broadcast(printer.next_frame(n % 5 != 0).dump());
                schedule(); });
        };
        schedule();

        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code &, int)
                           { ioc.stop(); });

        std::cout << "printer_sim ws=" << ws_bind << " http=" << http_bind << " period=" << period_ms << "ms\n";
        ioc.run();
        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "printer_sim error: " << e.what() << "\n";
        return 1;
    }
}
