#include "filepipe/client/transport.hpp"

#include <asio/connect.hpp>
#include <asio/write.hpp>

#include <stdexcept>
#include <system_error>

#include "filepipe/framing.hpp"

namespace filepipe::client
{

    namespace
    {

        constexpr const char *kConnectionTestValue = "Hello world";

    } // namespace

    Status ActionResult::status() const noexcept
    {
        return server_response ? status_from_text(*server_response) : Status::Error;
    }

    std::string ActionResult::describe() const
    {
        if (not_connected)
        {
            return "Client not connected";
        }
        std::string text;
        const auto append = [&text](const char *label, const std::optional<std::string> &value)
        {
            if (!value)
            {
                return;
            }
            if (!text.empty())
            {
                text += ", ";
            }
            text += label;
            text += *value;
        };
        append("server response: ", server_response);
        append("client send: ", send_error);
        append("client read: ", read_error);
        return text;
    }

    ClientTransport::ClientTransport(TransportLimits limits, Logger logger)
        : limits_(limits),
          logger_(std::move(logger)),
          socket_(io_context_)
    {
        if (limits_.buffer_size == 0 || limits_.file_block_size == 0)
        {
            throw std::invalid_argument("Buffer sizes must be greater than zero");
        }
    }

    ClientTransport::~ClientTransport()
    {
        close();
    }

    ActionResult ClientTransport::connect(const std::string &host, std::uint16_t port)
    {
        close();

        ActionResult result;
        std::error_code ec;
        asio::ip::tcp::resolver resolver(io_context_);
        const auto endpoints = resolver.resolve(host, std::to_string(port), ec);
        if (!ec)
        {
            asio::connect(socket_, endpoints, ec);
        }
        if (ec)
        {
            std::error_code ignored;
            socket_.close(ignored);
            result.send_error = "Could not connect to " + host + ":" + std::to_string(port) + ": " + ec.message();
            logger_.error("connect", *result.send_error);
            return result;
        }

        result.ok = true;
        logger_.log("connect", "Connected to ", host, ':', port);
        return result;
    }

    void ClientTransport::close()
    {
        inbound_.clear();
        responses_.clear();
        if (!socket_.is_open())
        {
            return;
        }
        std::error_code ignored;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
        socket_.close(ignored);
        logger_.debug("connect", "Connection closed");
    }

    void ClientTransport::reset_cancellation() noexcept
    {
        cancel_transfer_ = false;
        cancel_all_ = false;
    }

    ActionResult ClientTransport::set_file_block_size()
    {
        return run_action(protocol::SetFileBlockSizeAction{limits_.file_block_size});
    }

    ActionResult ClientTransport::test_connection()
    {
        auto result = echo(kConnectionTestValue);
        result.ok = result.server_response && *result.server_response == nlohmann::json(kConnectionTestValue).dump();
        return result;
    }

    ActionResult ClientTransport::echo(const nlohmann::json &value)
    {
        auto result = run_action(protocol::EchoAction{value});
        result.ok = result.server_response.has_value();
        return result;
    }

    ActionResult ClientTransport::set_file_info(const protocol::FileInfo &info)
    {
        return run_action(protocol::SetMetaAction{info});
    }

    ActionResult ClientTransport::clear_file_info()
    {
        return run_action(protocol::ClearFileInfoAction{});
    }

    ActionResult ClientTransport::run_action(const protocol::Action &action)
    {
        if (!is_connected())
        {
            return not_connected_result();
        }
        ActionResult result;
        if (!send_frame(action, result) || !next_response(result))
        {
            return result;
        }
        result.ok = result.status() == Status::Ok;
        return result;
    }

    ActionResult ClientTransport::not_connected_result() const
    {
        ActionResult result;
        result.not_connected = true;
        result.send_error = "Client not connected";
        return result;
    }

    bool ClientTransport::send_frame(const protocol::Action &action, ActionResult &result)
    {
        logger_.log("action", "Sending action ", protocol::to_string(protocol::kind_of(action)));
        const auto frame = protocol::encode_frame(protocol::encode_action(action));
        return send_bytes(frame.data(), frame.size(), result);
    }

    bool ClientTransport::send_bytes(const void *data, std::size_t size, ActionResult &result)
    {
        std::error_code ec;
        asio::write(socket_, asio::buffer(data, size), ec);
        if (ec)
        {
            result.send_error = ec.message();
            logger_.error("send", "Send failed: ", ec.message());
            return false;
        }
        return true;
    }

    bool ClientTransport::next_response(ActionResult &result)
    {
        if (responses_.empty())
        {
            try
            {
                receive_responses();
            }
            catch (const std::system_error &ex)
            {
                result.read_error = ex.code().message();
                logger_.error("read", "Read failed: ", ex.code().message());
                return false;
            }
        }
        result.server_response = std::move(responses_.front());
        responses_.pop_front();
        return true;
    }

    void ClientTransport::receive_responses()
    {
        std::vector<std::uint8_t> buffer(limits_.buffer_size);
        const auto take_frames = [this]
        {
            while (auto frame = protocol::take_frame(inbound_))
            {
                logger_.log("response", "Server response: ", *frame);
                responses_.push_back(std::move(*frame));
            }
        };

        while (responses_.empty())
        {
            const auto received = socket_.read_some(asio::buffer(buffer));
            inbound_.insert(inbound_.end(), buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(received));
            take_frames();
        }

        // Drain whatever else is already buffered without blocking.
        socket_.non_blocking(true);
        std::error_code ec;
        for (;;)
        {
            const auto received = socket_.read_some(asio::buffer(buffer), ec);
            if (ec)
            {
                break;
            }
            inbound_.insert(inbound_.end(), buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(received));
        }
        socket_.non_blocking(false);
        take_frames();

        if (ec != asio::error::would_block && ec != asio::error::try_again)
        {
            // Reported by the next blocking read.
            logger_.warn("read", "Connection ended while draining responses: ", ec.message());
        }
    }

} // namespace filepipe::client
