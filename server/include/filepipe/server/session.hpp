#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <fstream>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "filepipe/protocol.hpp"
#include "filepipe/server/filesystem.hpp"
#include "filepipe/status.hpp"

namespace filepipe::server
{

    struct SessionLimits
    {
        std::size_t control_buffer_size{1024};
        std::size_t max_file_block_size{65535};
    };

    // Transport the outbound buffer is flushed into. Implementations accept any
    // prefix of `data`, including none, and throw std::system_error on failure.
    class OutputSink
    {
    public:
        virtual ~OutputSink() = default;

        virtual std::size_t write_some(std::span<const std::uint8_t> data) = 0;
    };

    struct FileDescriptor
    {
        std::filesystem::path destination;
        std::uint64_t size{};
        std::optional<std::string> hash{};
        std::uint64_t received{};
    };

    enum class SessionState : std::uint8_t
    {
        Control,
        ReceivingFile
    };

    // Per-connection protocol state. Owned and driven by a single thread; the
    // session never touches a socket itself.
    class Session
    {
    public:
        Session(std::uint64_t id, std::string peer, const Filesystem &filesystem, SessionLimits limits);
        ~Session();

        Session(const Session &) = delete;
        Session &operator=(const Session &) = delete;

        std::uint64_t id() const noexcept { return id_; }
        const std::string &peer() const noexcept { return peer_; }
        SessionState state() const noexcept { return state_; }
        std::size_t file_block_size() const noexcept { return file_block_size_; }
        const std::optional<FileDescriptor> &file_descriptor() const noexcept { return descriptor_; }

        // Upper bound for the next socket read: the negotiated chunk size while a
        // file is streaming, the control buffer size otherwise.
        std::size_t read_capacity() const noexcept;

        // Throws when bytes of an active transfer cannot be written to disk.
        void on_bytes_received(std::span<const std::uint8_t> data);

        bool has_pending_actions() const noexcept { return !actions_.empty(); }
        std::size_t pending_action_count() const noexcept { return actions_.size(); }

        // Runs the oldest queued action and appends its status frame.
        void execute_next_action();

        bool has_pending_output() const noexcept { return !outbound_.empty(); }
        std::span<const std::uint8_t> pending_output() const noexcept { return outbound_; }

        // One send attempt; keeps whatever the sink did not accept.
        std::size_t flush_output(OutputSink &sink);

        // True once every declared byte has arrived but the last of them could
        // still be the start of a cancel sentinel.
        bool completion_pending() const noexcept { return completion_pending_; }

        // Completes a pending transfer when no further bytes arrived in time.
        void settle_pending_completion();

        // Closes and deletes a destination left open by an interrupted transfer.
        void abandon_transfer();

    private:
        void on_control_bytes(std::span<const std::uint8_t> data);
        void on_file_bytes(std::span<const std::uint8_t> data);
        bool sentinel_received(std::span<const std::uint8_t> data);
        void resolve_pending_completion(std::span<const std::uint8_t> data);
        void reset_cancel_tracking();
        static std::size_t leading_cancel_bytes(std::span<const std::uint8_t> data);
        static std::size_t trailing_cancel_bytes(std::span<const std::uint8_t> data);
        void finish_transfer();
        void cancel_transfer();

        void handle_echo(const protocol::EchoAction &action);
        void handle_set_meta(const protocol::SetMetaAction &action);
        void handle_start_send();
        void handle_clear_file_info();
        void handle_set_file_block_size(const protocol::SetFileBlockSizeAction &action);

        void respond(std::string_view text);
        void respond(Status status);

        std::uint64_t id_;
        std::string peer_;
        const Filesystem &filesystem_;
        SessionLimits limits_;

        std::vector<std::uint8_t> inbound_;
        std::vector<std::uint8_t> outbound_;
        std::deque<protocol::Action> actions_;

        SessionState state_{SessionState::Control};
        std::optional<FileDescriptor> descriptor_;
        std::ofstream file_;
        std::size_t file_block_size_;
        std::vector<std::uint8_t> sentinel_window_;
        std::size_t trailing_cancel_bytes_{0};
        bool completion_pending_{false};
    };

} // namespace filepipe::server
