#include "filepipe/client/transport.hpp"

#include <algorithm>
#include <fstream>
#include <vector>

#include "filepipe/framing.hpp"

namespace filepipe::client
{

    ActionResult ClientTransport::send_file(const std::filesystem::path &source, std::uint64_t size,
                                            TransferProgress *progress, TransferObserver *observer)
    {
        if (!is_connected())
        {
            return not_connected_result();
        }

        std::ifstream in(source, std::ios::binary);
        if (!in.is_open())
        {
            ActionResult result;
            result.send_error = "Could not open file " + source.string();
            logger_.error("transfer", *result.send_error);
            return result;
        }

        auto result = run_action(protocol::StartSendAction{});
        if (!result.ok)
        {
            logger_.warn("transfer", "Server refused to start transfer of ", source.string(), ": ", result.describe());
            return result;
        }
        result.server_response.reset();

        if (progress)
        {
            progress->start_time = TransferProgress::Clock::now();
            progress->current_file_name = source.filename().string();
            progress->file_size = size;
            progress->bytes_sent = 0;
        }
        if (observer && progress)
        {
            observer->on_progress(*progress);
        }

        std::vector<char> buffer(limits_.file_block_size);
        std::uint64_t sent = 0;
        logger_.log("transfer", "Sending ", source.string(), " (", size, " bytes)");
        while (sent < size)
        {
            if (cancel_transfer_ || cancel_all_)
            {
                logger_.warn("transfer", "Canceling transfer of ", source.string(), " after ", sent, " bytes");
                if (!send_bytes(protocol::kCancelSentinel.data(), protocol::kCancelSentinel.size(), result))
                {
                    return result;
                }
                break;
            }

            const auto count = static_cast<std::size_t>(std::min<std::uint64_t>(buffer.size(), size - sent));
            in.read(buffer.data(), static_cast<std::streamsize>(count));
            const auto read_count = static_cast<std::size_t>(in.gcount());
            if (read_count == 0)
            {
                // The file shrank below its declared size; make the server drop the partial copy.
                result.send_error = "Could not read " + source.string() + " at offset " + std::to_string(sent);
                logger_.error("transfer", *result.send_error);
                if (send_bytes(protocol::kCancelSentinel.data(), protocol::kCancelSentinel.size(), result) &&
                    next_response(result))
                {
                    logger_.warn("transfer", "Server answered ", *result.server_response);
                }
                return result;
            }

            if (!send_bytes(buffer.data(), read_count, result))
            {
                return result;
            }
            sent += read_count;

            if (progress)
            {
                progress->bytes_sent = sent;
            }
            if (observer)
            {
                if (progress)
                {
                    observer->on_progress(*progress);
                }
                observer->yield();
            }
        }
        // A cancel that came in after the last chunk applies to nothing.
        cancel_transfer_ = false;

        if (!next_response(result))
        {
            return result;
        }
        result.ok = result.status() == Status::Ok;
        logger_.log("transfer", "Transfer of ", source.string(), " finished: ", *result.server_response);
        return result;
    }

} // namespace filepipe::client
