#include "filepipe/server/server.hpp"

#include <asio/buffer.hpp>
#include <asio/error.hpp>
#include <asio/ip/address.hpp>
#include <asio/post.hpp>

#include <chrono>
#include <csignal>
#include <stdexcept>
#include <vector>

#include <spdlog/spdlog.h>

namespace filepipe::server
{

    namespace
    {

        // How long a transfer whose last bytes look like the start of a cancel
        // sentinel waits for the rest of it before completing.
        constexpr auto kSettleGrace = std::chrono::milliseconds(250);

        class SocketSink : public OutputSink
        {
        public:
            explicit SocketSink(asio::ip::tcp::socket &socket) : socket_(socket) {}

            std::size_t write_some(std::span<const std::uint8_t> data) override
            {
                std::error_code ec;
                const auto written = socket_.write_some(asio::buffer(data.data(), data.size()), ec);
                if (ec == asio::error::would_block || ec == asio::error::try_again)
                {
                    return 0;
                }
                if (ec)
                {
                    throw std::system_error(ec);
                }
                return written;
            }

        private:
            asio::ip::tcp::socket &socket_;
        };

        bool is_would_block(const std::error_code &ec)
        {
            return ec == asio::error::would_block || ec == asio::error::try_again;
        }

        std::string describe_peer(const asio::ip::tcp::socket &socket)
        {
            std::error_code ec;
            const auto endpoint = socket.remote_endpoint(ec);
            if (ec)
            {
                return "unknown";
            }
            return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
        }

    } // namespace

    Server::Connection::Connection(asio::ip::tcp::socket s, std::uint64_t id, std::string peer,
                                   const Filesystem &filesystem, SessionLimits limits)
        : socket(std::move(s)),
          session(id, std::move(peer), filesystem, limits),
          settle_timer(socket.get_executor())
    {
    }

    Server::Server(ServerConfig config)
        : config_(std::move(config)),
          limits_{config_.control_buffer_size, config_.max_file_block_size},
          acceptor_(io_context_),
          signals_(io_context_),
          filesystem_(config_.root)
    {
        if (limits_.control_buffer_size == 0 || limits_.max_file_block_size == 0)
        {
            throw std::invalid_argument("Buffer sizes must be greater than zero");
        }

        const auto address = asio::ip::make_address(config_.address);
        const asio::ip::tcp::endpoint endpoint(address, config_.port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();
        acceptor_.non_blocking(true);

        spdlog::info("Listening on {}:{} with root {}", config_.address, port(), filesystem_.root().string());

        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        signals_.async_wait([this](const std::error_code &ec, int signal)
                            {
            if (!ec)
            {
                spdlog::info("Signal {} received, shutting down", signal);
                stopping_ = true;
            } });
    }

    Server::~Server()
    {
        shutdown();
    }

    std::uint16_t Server::port() const
    {
        return acceptor_.local_endpoint().port();
    }

    void Server::stop()
    {
        asio::post(io_context_, [this]
                   { stopping_ = true; });
    }

    void Server::run()
    {
        spdlog::info("Server event loop running");
        while (!stopping_)
        {
            run_pending_actions();
            arm_accept();
            arm_waits();

            if (io_context_.stopped())
            {
                io_context_.restart();
            }
            if (!has_pending_actions())
            {
                io_context_.run_one();
            }
            io_context_.poll();
        }
        shutdown();
        spdlog::info("Server event loop stopped");
    }

    void Server::run_pending_actions()
    {
        std::vector<std::pair<std::uint64_t, std::string>> failed;
        for (auto &[id, connection] : connections_)
        {
            if (!connection->session.has_pending_actions())
            {
                continue;
            }
            try
            {
                connection->session.execute_next_action();
            }
            catch (const std::exception &ex)
            {
                failed.emplace_back(id, ex.what());
            }
        }
        for (const auto &[id, reason] : failed)
        {
            close_connection(id, reason);
        }
    }

    bool Server::has_pending_actions() const noexcept
    {
        for (const auto &[id, connection] : connections_)
        {
            if (connection->session.has_pending_actions())
            {
                return true;
            }
        }
        return false;
    }

    void Server::arm_accept()
    {
        if (accept_armed_ || !acceptor_.is_open())
        {
            return;
        }
        accept_armed_ = true;
        acceptor_.async_wait(asio::ip::tcp::acceptor::wait_read, [this](const std::error_code &ec)
                             { on_acceptable(ec); });
    }

    void Server::arm_waits()
    {
        for (auto &[id, connection] : connections_)
        {
            const auto connection_id = id;
            if (!connection->read_armed)
            {
                connection->read_armed = true;
                connection->socket.async_wait(asio::ip::tcp::socket::wait_read,
                                              [this, connection_id](const std::error_code &ec)
                                              { on_readable(connection_id, ec); });
            }
            if (connection->session.has_pending_output() && !connection->write_armed)
            {
                connection->write_armed = true;
                connection->socket.async_wait(asio::ip::tcp::socket::wait_write,
                                              [this, connection_id](const std::error_code &ec)
                                              { on_writable(connection_id, ec); });
            }
            if (connection->session.completion_pending() && !connection->settle_armed)
            {
                connection->settle_armed = true;
                connection->settle_timer.expires_after(kSettleGrace);
                connection->settle_timer.async_wait([this, connection_id](const std::error_code &ec)
                                                    { on_settle_timeout(connection_id, ec); });
            }
        }
    }

    void Server::on_acceptable(const std::error_code &ec)
    {
        accept_armed_ = false;
        if (ec == asio::error::operation_aborted)
        {
            return;
        }
        if (ec)
        {
            spdlog::error("Accept error: {}", ec.message());
            return;
        }

        for (;;)
        {
            asio::ip::tcp::socket socket(io_context_);
            std::error_code accept_ec;
            acceptor_.accept(socket, accept_ec);
            if (is_would_block(accept_ec))
            {
                break;
            }
            if (accept_ec)
            {
                spdlog::error("Accept error: {}", accept_ec.message());
                break;
            }
            socket.non_blocking(true);
            auto peer = describe_peer(socket);
            const auto id = next_id_++;
            connections_.emplace(id, std::make_unique<Connection>(std::move(socket), id, peer, filesystem_, limits_));
            spdlog::info("[{}] Accepted new connection (id {}, {} open)", peer, id, connections_.size());
        }
    }

    void Server::on_readable(std::uint64_t id, const std::error_code &ec)
    {
        auto it = connections_.find(id);
        if (it == connections_.end())
        {
            return;
        }
        auto &connection = *it->second;
        connection.read_armed = false;
        if (ec == asio::error::operation_aborted)
        {
            return;
        }
        if (ec)
        {
            close_connection(id, ec.message());
            return;
        }

        std::vector<std::uint8_t> buffer(connection.session.read_capacity());
        std::error_code read_ec;
        const auto received = connection.socket.read_some(asio::buffer(buffer), read_ec);
        if (is_would_block(read_ec))
        {
            return;
        }
        if (read_ec == asio::error::eof)
        {
            close_connection(id, "peer closed the connection");
            return;
        }
        if (read_ec)
        {
            close_connection(id, read_ec.message());
            return;
        }

        try
        {
            connection.session.on_bytes_received(std::span<const std::uint8_t>(buffer.data(), received));
            if (connection.settle_armed)
            {
                // Fresh bytes restart the grace period, or end it when the transfer resolved.
                connection.settle_timer.cancel();
            }
        }
        catch (const std::exception &ex)
        {
            close_connection(id, ex.what());
        }
    }

    void Server::on_writable(std::uint64_t id, const std::error_code &ec)
    {
        auto it = connections_.find(id);
        if (it == connections_.end())
        {
            return;
        }
        auto &connection = *it->second;
        connection.write_armed = false;
        if (ec == asio::error::operation_aborted)
        {
            return;
        }
        if (ec)
        {
            close_connection(id, ec.message());
            return;
        }

        SocketSink sink(connection.socket);
        try
        {
            const auto sent = connection.session.flush_output(sink);
            spdlog::debug("[{}] Sent {} bytes", connection.session.peer(), sent);
        }
        catch (const std::system_error &ex)
        {
            close_connection(id, ex.what());
        }
    }

    void Server::on_settle_timeout(std::uint64_t id, const std::error_code &ec)
    {
        auto it = connections_.find(id);
        if (it == connections_.end())
        {
            return;
        }
        auto &connection = *it->second;
        connection.settle_armed = false;
        if (ec == asio::error::operation_aborted || !connection.session.completion_pending())
        {
            return;
        }

        try
        {
            connection.session.settle_pending_completion();
        }
        catch (const std::exception &ex)
        {
            close_connection(id, ex.what());
        }
    }

    void Server::close_connection(std::uint64_t id, const std::string &reason)
    {
        auto it = connections_.find(id);
        if (it == connections_.end())
        {
            return;
        }
        auto &connection = *it->second;
        spdlog::info("[{}] Closing connection: {}", connection.session.peer(), reason);
        connection.session.abandon_transfer();

        std::error_code ignored;
        connection.socket.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
        connection.socket.close(ignored);
        connection.settle_timer.cancel();
        connections_.erase(it);
    }

    void Server::shutdown()
    {
        std::error_code ignored;
        acceptor_.close(ignored);
        signals_.cancel(ignored);
        while (!connections_.empty())
        {
            close_connection(connections_.begin()->first, "server shutting down");
        }
    }

} // namespace filepipe::server
