#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/signal_set.hpp>
#include <asio/steady_timer.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <system_error>

#include "filepipe/server/config.hpp"
#include "filepipe/server/filesystem.hpp"
#include "filepipe/server/session.hpp"

namespace filepipe::server
{

    // Single threaded readiness loop. Each iteration runs at most one queued
    // action per session, then waits for socket readiness and services it.
    // Waiting only blocks when no session has queued actions.
    class Server
    {
    public:
        explicit Server(ServerConfig config);
        ~Server();

        Server(const Server &) = delete;
        Server &operator=(const Server &) = delete;

        // Blocks until stop() is called or SIGINT/SIGTERM arrives.
        void run();

        // Safe to call from any thread.
        void stop();

        std::uint16_t port() const;
        std::size_t connection_count() const noexcept { return connections_.size(); }

    private:
        struct Connection
        {
            Connection(asio::ip::tcp::socket s, std::uint64_t id, std::string peer, const Filesystem &filesystem,
                       SessionLimits limits);

            asio::ip::tcp::socket socket;
            Session session;
            asio::steady_timer settle_timer;
            bool read_armed{false};
            bool write_armed{false};
            bool settle_armed{false};
        };

        void arm_accept();
        void arm_waits();
        void run_pending_actions();
        bool has_pending_actions() const noexcept;

        void on_acceptable(const std::error_code &ec);
        void on_readable(std::uint64_t id, const std::error_code &ec);
        void on_writable(std::uint64_t id, const std::error_code &ec);
        void on_settle_timeout(std::uint64_t id, const std::error_code &ec);

        void close_connection(std::uint64_t id, const std::string &reason);
        void shutdown();

        ServerConfig config_;
        SessionLimits limits_;
        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        asio::signal_set signals_;

        Filesystem filesystem_;
        std::map<std::uint64_t, std::unique_ptr<Connection>> connections_;
        std::uint64_t next_id_{1};
        bool accept_armed_{false};
        bool stopping_{false};
    };

} // namespace filepipe::server
