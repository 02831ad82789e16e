#include "filepipe/server/session.hpp"

#include <algorithm>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "filepipe/framing.hpp"

namespace filepipe::server
{

    Session::Session(std::uint64_t id, std::string peer, const Filesystem &filesystem, SessionLimits limits)
        : id_(id),
          peer_(std::move(peer)),
          filesystem_(filesystem),
          limits_(limits),
          file_block_size_(limits.max_file_block_size)
    {
        inbound_.reserve(limits_.control_buffer_size);
    }

    Session::~Session()
    {
        abandon_transfer();
    }

    std::size_t Session::read_capacity() const noexcept
    {
        return state_ == SessionState::ReceivingFile ? file_block_size_ : limits_.control_buffer_size;
    }

    void Session::on_bytes_received(std::span<const std::uint8_t> data)
    {
        if (data.empty())
        {
            return;
        }
        if (state_ == SessionState::ReceivingFile)
        {
            on_file_bytes(data);
        }
        else
        {
            on_control_bytes(data);
        }
    }

    void Session::on_control_bytes(std::span<const std::uint8_t> data)
    {
        // Cancel bytes that outlived their transfer can never start a frame.
        if (inbound_.empty())
        {
            const auto stray = leading_cancel_bytes(data);
            if (stray > 0)
            {
                spdlog::debug("[{}] Dropping {} stray cancel bytes", peer_, stray);
                data = data.subspan(stray);
            }
        }
        inbound_.insert(inbound_.end(), data.begin(), data.end());
        while (auto body = protocol::take_frame(inbound_))
        {
            spdlog::debug("[{}] Parsing frame '{}'", peer_, *body);
            try
            {
                auto action = protocol::decode_action(*body);
                spdlog::info("[{}] New queued action {}", peer_, protocol::to_string(protocol::kind_of(action)));
                actions_.push_back(std::move(action));
            }
            catch (const protocol::ProtocolError &ex)
            {
                spdlog::warn("[{}] Could not parse frame into an action, dropping: {}", peer_, ex.what());
                respond(std::string("ERROR: ") + ex.what());
            }
        }
    }

    void Session::on_file_bytes(std::span<const std::uint8_t> data)
    {
        if (completion_pending_)
        {
            resolve_pending_completion(data);
            return;
        }
        if (sentinel_received(data))
        {
            cancel_transfer();
            return;
        }

        auto &descriptor = *descriptor_;
        if (descriptor.received == 0)
        {
            spdlog::info("[{}] Starting to receive file {}", peer_, descriptor.destination.string());
        }

        const auto remaining = descriptor.size - descriptor.received;
        const auto take = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, data.size()));
        const auto written = data.first(take);
        file_.write(reinterpret_cast<const char *>(written.data()), static_cast<std::streamsize>(take));
        if (!file_)
        {
            throw std::runtime_error("Failed to write to " + descriptor.destination.string());
        }
        descriptor.received += take;

        const auto tail = trailing_cancel_bytes(written);
        trailing_cancel_bytes_ = tail == take ? trailing_cancel_bytes_ + tail : tail;

        if (descriptor.received < descriptor.size)
        {
            return;
        }
        if (trailing_cancel_bytes_ == 0)
        {
            finish_transfer();
            if (take < data.size())
            {
                spdlog::debug("[{}] {} bytes past the declared size handed back to the frame parser", peer_,
                              data.size() - take);
                on_control_bytes(data.subspan(take));
            }
            return;
        }

        // The last bytes may be the head of a sentinel that started before the
        // declared size was reached; hold the status until that is settled.
        completion_pending_ = true;
        trailing_cancel_bytes_ = std::min(trailing_cancel_bytes_, protocol::kCancelSentinel.size() - 1);
        spdlog::debug("[{}] Declared size reached on {} cancel bytes, completion pending", peer_,
                      trailing_cancel_bytes_);
        if (take < data.size())
        {
            resolve_pending_completion(data.subspan(take));
        }
    }

    void Session::resolve_pending_completion(std::span<const std::uint8_t> data)
    {
        const auto cancel_bytes = leading_cancel_bytes(data);
        trailing_cancel_bytes_ += cancel_bytes;
        if (trailing_cancel_bytes_ >= protocol::kCancelSentinel.size())
        {
            cancel_transfer();
            if (cancel_bytes < data.size())
            {
                on_control_bytes(data.subspan(cancel_bytes));
            }
            return;
        }
        if (cancel_bytes == data.size())
        {
            return;
        }
        finish_transfer();
        on_control_bytes(data.subspan(cancel_bytes));
    }

    void Session::settle_pending_completion()
    {
        if (!completion_pending_)
        {
            return;
        }
        spdlog::debug("[{}] No cancel followed the declared size, completing", peer_);
        finish_transfer();
    }

    std::size_t Session::leading_cancel_bytes(std::span<const std::uint8_t> data)
    {
        const auto it = std::find_if(data.begin(), data.end(), [](std::uint8_t byte)
                                     { return byte != protocol::kCancelSentinel.front(); });
        return static_cast<std::size_t>(it - data.begin());
    }

    std::size_t Session::trailing_cancel_bytes(std::span<const std::uint8_t> data)
    {
        const auto it = std::find_if(data.rbegin(), data.rend(), [](std::uint8_t byte)
                                     { return byte != protocol::kCancelSentinel.front(); });
        return static_cast<std::size_t>(it - data.rbegin());
    }

    bool Session::sentinel_received(std::span<const std::uint8_t> data)
    {
        // The window carries the tail of earlier reads so a sentinel split across
        // two reads is still recognized.
        constexpr auto kSentinelSize = protocol::kCancelSentinel.size();
        std::vector<std::uint8_t> tail(sentinel_window_);
        const auto fresh = std::min(data.size(), kSentinelSize);
        tail.insert(tail.end(), data.end() - static_cast<std::ptrdiff_t>(fresh), data.end());
        const bool found = protocol::ends_with_sentinel(tail);

        const auto keep = std::min(tail.size(), kSentinelSize - 1);
        sentinel_window_.assign(tail.end() - static_cast<std::ptrdiff_t>(keep), tail.end());
        return found;
    }

    void Session::finish_transfer()
    {
        const auto destination = descriptor_->destination;
        file_.close();
        state_ = SessionState::Control;
        descriptor_.reset();
        reset_cancel_tracking();
        if (file_.fail())
        {
            filesystem_.remove_partial(destination);
            throw std::runtime_error("Failed to flush " + destination.string());
        }
        spdlog::info("[{}] File {} successfully received", peer_, destination.string());
        respond(Status::Ok);
    }

    void Session::cancel_transfer()
    {
        const auto destination = descriptor_->destination;
        file_.close();
        state_ = SessionState::Control;
        descriptor_.reset();
        reset_cancel_tracking();
        filesystem_.remove_partial(destination);
        spdlog::warn("[{}] File transfer canceled for {}, file removed", peer_, destination.string());
        respond(Status::Canceled);
    }

    void Session::abandon_transfer()
    {
        if (state_ != SessionState::ReceivingFile)
        {
            return;
        }
        file_.close();
        state_ = SessionState::Control;
        reset_cancel_tracking();
        if (descriptor_)
        {
            filesystem_.remove_partial(descriptor_->destination);
            spdlog::warn("[{}] File {} was still open, closed and removed", peer_, descriptor_->destination.string());
            descriptor_.reset();
        }
    }

    void Session::reset_cancel_tracking()
    {
        sentinel_window_.clear();
        trailing_cancel_bytes_ = 0;
        completion_pending_ = false;
    }

    std::size_t Session::flush_output(OutputSink &sink)
    {
        if (outbound_.empty())
        {
            return 0;
        }
        const auto accepted = std::min(sink.write_some(outbound_), outbound_.size());
        outbound_.erase(outbound_.begin(), outbound_.begin() + static_cast<std::ptrdiff_t>(accepted));
        return accepted;
    }

    void Session::respond(std::string_view text)
    {
        const auto frame = protocol::encode_text_frame(text);
        outbound_.insert(outbound_.end(), frame.begin(), frame.end());
    }

    void Session::respond(Status status)
    {
        respond(to_string(status));
    }

} // namespace filepipe::server
