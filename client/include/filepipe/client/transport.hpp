#pragma once

#include <asio.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "filepipe/client/logger.hpp"
#include "filepipe/client/progress.hpp"
#include "filepipe/protocol.hpp"
#include "filepipe/status.hpp"

namespace filepipe::client
{

    // Trace of one exchange with the server.
    struct ActionResult
    {
        bool ok{false};
        bool not_connected{false};
        std::optional<std::string> server_response;
        std::optional<std::string> send_error;
        std::optional<std::string> read_error;

        // Error when the server never answered.
        Status status() const noexcept;

        // "server response: X, client send: Y, client read: Z", or "Client not connected".
        std::string describe() const;
    };

    struct TransportLimits
    {
        std::size_t buffer_size{1024};
        std::size_t file_block_size{65535};
    };

    // Synchronous client side of the protocol. Every call sends one frame and
    // consumes exactly one response, oldest first.
    class ClientTransport
    {
    public:
        ClientTransport(TransportLimits limits, Logger logger);
        ~ClientTransport();

        ClientTransport(const ClientTransport &) = delete;
        ClientTransport &operator=(const ClientTransport &) = delete;

        // Closes an existing connection first.
        ActionResult connect(const std::string &host, std::uint16_t port);
        void close();
        bool is_connected() const noexcept { return socket_.is_open(); }

        const TransportLimits &limits() const noexcept { return limits_; }

        ActionResult set_file_block_size();
        ActionResult test_connection();
        ActionResult echo(const nlohmann::json &value);
        ActionResult set_file_info(const protocol::FileInfo &info);
        ActionResult clear_file_info();

        // StartSend followed by the raw file bytes. The result carries the
        // terminal status; `ok` is false for CANCELED.
        ActionResult send_file(const std::filesystem::path &source, std::uint64_t size,
                               TransferProgress *progress = nullptr, TransferObserver *observer = nullptr);

        // Honored at the next chunk boundary. Safe from any thread.
        void request_cancel_transfer() noexcept { cancel_transfer_ = true; }
        void request_cancel_all() noexcept { cancel_all_ = true; }
        void reset_cancellation() noexcept;
        bool cancel_all_requested() const noexcept { return cancel_all_; }

    private:
        ActionResult run_action(const protocol::Action &action);
        ActionResult not_connected_result() const;
        bool send_frame(const protocol::Action &action, ActionResult &result);
        bool send_bytes(const void *data, std::size_t size, ActionResult &result);

        // Blocks until at least one response frame is available and pops it.
        bool next_response(ActionResult &result);
        void receive_responses();

        TransportLimits limits_;
        Logger logger_;
        asio::io_context io_context_;
        asio::ip::tcp::socket socket_;
        std::vector<std::uint8_t> inbound_;
        std::deque<std::string> responses_;
        std::atomic<bool> cancel_transfer_{false};
        std::atomic<bool> cancel_all_{false};
    };

} // namespace filepipe::client
