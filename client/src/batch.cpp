#include "filepipe/client/batch.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>

#include "filepipe/crypto.hpp"

namespace filepipe::client
{

    namespace
    {

        constexpr std::string_view kEntrySeparator = " -> ";

        std::string trim(const std::string &input)
        {
            const auto begin = input.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
            {
                return "";
            }
            const auto end = input.find_last_not_of(" \t\r\n");
            return input.substr(begin, end - begin + 1);
        }

    } // namespace

    std::string FileEntry::to_string() const
    {
        return source.string() + std::string(kEntrySeparator) + destination;
    }

    FileEntry parse_file_entry(const std::string &text)
    {
        const auto separator = text.find(kEntrySeparator);
        if (separator == std::string::npos)
        {
            throw std::runtime_error("Expected file entry format 'source -> destination', got '" + text + "'");
        }
        FileEntry entry{trim(text.substr(0, separator)), trim(text.substr(separator + kEntrySeparator.size()))};
        if (entry.source.empty() || entry.destination.empty())
        {
            throw std::runtime_error("File entry needs both a source and a destination: '" + text + "'");
        }
        return entry;
    }

    std::string_view to_string(SendOutcome outcome) noexcept
    {
        switch (outcome)
        {
        case SendOutcome::Sent:
            return "SENT";
        case SendOutcome::Failed:
            return "FAILED";
        case SendOutcome::Canceled:
            return "CANCELED";
        }
        return "UNKNOWN";
    }

    std::size_t BatchReport::count(SendOutcome outcome) const noexcept
    {
        return static_cast<std::size_t>(std::count_if(files.begin(), files.end(), [outcome](const FileReport &report)
                                                      { return report.outcome == outcome; }));
    }

    BatchSender::BatchSender(ClientTransport &transport, Logger logger, bool hash_files)
        : transport_(transport),
          logger_(std::move(logger)),
          hash_files_(hash_files)
    {
    }

    BatchReport BatchSender::send(const Endpoint &endpoint, const std::vector<FileEntry> &entries,
                                  TransferObserver *observer)
    {
        BatchReport report;
        transport_.reset_cancellation();

        report.connection = transport_.connect(endpoint.host, endpoint.port);
        if (!report.connection.ok)
        {
            return report;
        }

        auto block_size = transport_.set_file_block_size();
        if (!block_size.ok)
        {
            logger_.warn("batch", "Could not set file block size: ", block_size.describe());
        }
        report.block_size = std::move(block_size);

        TransferProgress progress;
        progress.file_count = entries.size();
        for (std::size_t index = 0; index < entries.size(); ++index)
        {
            if (transport_.cancel_all_requested())
            {
                logger_.warn("batch", "Batch canceled, ", entries.size() - index, " files not sent");
                report.canceled = true;
                break;
            }
            progress.current_file_count = index + 1;
            report.files.push_back(send_one(entries[index], progress, observer));
        }
        if (transport_.cancel_all_requested())
        {
            report.canceled = true;
        }

        transport_.reset_cancellation();
        transport_.close();
        logger_.log("batch", "Batch finished: ", report.count(SendOutcome::Sent), " sent, ",
                    report.count(SendOutcome::Failed), " failed, ", report.count(SendOutcome::Canceled), " canceled");
        return report;
    }

    FileReport BatchSender::send_one(const FileEntry &entry, TransferProgress &progress, TransferObserver *observer)
    {
        FileReport report{entry, SendOutcome::Failed, {}};

        std::error_code ec;
        const auto size = std::filesystem::file_size(entry.source, ec);
        if (ec || !std::filesystem::is_regular_file(entry.source))
        {
            report.result.send_error = "Could not read file " + entry.source.string() +
                                       (ec ? ": " + ec.message() : std::string(": not a regular file"));
            logger_.error("batch", *report.result.send_error);
            return report;
        }

        protocol::FileInfo info{entry.destination, std::nullopt, size};
        if (hash_files_)
        {
            try
            {
                info.hash = crypto::hash_file(entry.source);
            }
            catch (const std::exception &ex)
            {
                logger_.warn("batch", "Sending ", entry.source.string(), " without hash: ", ex.what());
            }
        }

        report.result = transport_.set_file_info(info);
        if (!report.result.ok)
        {
            logger_.error("batch", "Could not set file info for ", entry.to_string(), ": ", report.result.describe());
            return report;
        }

        report.result = transport_.send_file(entry.source, size, &progress, observer);
        if (report.result.ok)
        {
            report.outcome = SendOutcome::Sent;
        }
        else if (!report.result.send_error && report.result.status() == Status::Canceled)
        {
            report.outcome = SendOutcome::Canceled;
        }
        logger_.log("batch", entry.to_string(), ": ", to_string(report.outcome), " (", report.result.describe(), ")");
        return report;
    }

} // namespace filepipe::client
