#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "filepipe/client/config.hpp"
#include "filepipe/client/logger.hpp"
#include "filepipe/client/progress.hpp"
#include "filepipe/client/transport.hpp"

namespace filepipe::client
{

    // One queued transfer, persisted as "source -> destination".
    struct FileEntry
    {
        std::filesystem::path source;
        std::string destination;

        std::string to_string() const;
    };

    // Throws std::runtime_error when the separator or either side is missing.
    FileEntry parse_file_entry(const std::string &text);

    enum class SendOutcome : std::uint8_t
    {
        Sent,
        Failed,
        Canceled
    };

    std::string_view to_string(SendOutcome outcome) noexcept;

    struct FileReport
    {
        FileEntry entry;
        SendOutcome outcome{SendOutcome::Failed};
        ActionResult result;
    };

    struct BatchReport
    {
        ActionResult connection;
        std::optional<ActionResult> block_size;
        std::vector<FileReport> files;
        bool canceled{false};

        std::size_t count(SendOutcome outcome) const noexcept;
    };

    // Sends a list of files over one connection, stopping early when the whole
    // batch is canceled.
    class BatchSender
    {
    public:
        BatchSender(ClientTransport &transport, Logger logger, bool hash_files = false);

        BatchReport send(const Endpoint &endpoint, const std::vector<FileEntry> &entries,
                         TransferObserver *observer = nullptr);

    private:
        FileReport send_one(const FileEntry &entry, TransferProgress &progress, TransferObserver *observer);

        ClientTransport &transport_;
        Logger logger_;
        bool hash_files_;
    };

} // namespace filepipe::client
