#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "filepipe/client/batch.hpp"
#include "filepipe/client/config.hpp"
#include "filepipe/client/logger.hpp"
#include "filepipe/client/progress.hpp"
#include "filepipe/client/settings_store.hpp"
#include "filepipe/client/transport.hpp"
#include "filepipe/version.hpp"

namespace
{

    std::atomic<int> interrupt_count{0};

    void on_interrupt(int /*signal*/)
    {
        interrupt_count.fetch_add(1);
    }

    void print_usage(const char *program_name)
    {
        std::cout << "filepipe client " << filepipe::version() << "\n"
                  << "Usage: " << program_name
                  << " [<host>:<port>] [--send <source> <destination>]... [--config <FILE>] [--log <FILE>] "
                     "[--log-level <LEVEL>] [--hash] [--save]\n"
                  << "Without --send the files queued in the settings file are sent. Ctrl-C once cancels the "
                     "current file, twice cancels the batch.\n";
    }

    // Prints a progress line and turns Ctrl-C presses into cancellation requests.
    class ConsoleObserver : public filepipe::client::TransferObserver
    {
    public:
        explicit ConsoleObserver(filepipe::client::ClientTransport &transport) : transport_(transport) {}

        void on_progress(const filepipe::client::TransferProgress &progress) override
        {
            std::cout << "\r" << progress.to_string() << std::flush;
        }

        void yield() override
        {
            const auto presses = interrupt_count.load();
            if (presses == handled_)
            {
                return;
            }
            handled_ = presses;
            if (presses == 1)
            {
                std::cout << "\nCanceling current file, press Ctrl-C again to cancel all" << std::endl;
                transport_.request_cancel_transfer();
            }
            else
            {
                std::cout << "\nCanceling all files" << std::endl;
                transport_.request_cancel_all();
            }
        }

    private:
        filepipe::client::ClientTransport &transport_;
        int handled_{0};
    };

} // namespace

int main(int argc, char *argv[])
{
    using namespace filepipe::client;

    try
    {
        const auto config = parse_arguments(argc, argv);
        SettingsStore store(config.settings_path);
        auto &settings = store.settings();

        const auto level = spdlog::level::from_str(config.log_level.value_or(settings.log_level));
        Logger logger(config.log_path, level);
        logger.log("info", "filepipe client ", filepipe::version(), " using settings ", store.path().string());

        std::vector<FileEntry> entries;
        const bool queued_from_settings = config.sends.empty();
        if (queued_from_settings)
        {
            for (const auto &text : settings.files)
            {
                try
                {
                    entries.push_back(parse_file_entry(text));
                }
                catch (const std::runtime_error &ex)
                {
                    std::cerr << "Skipping queued file: " << ex.what() << std::endl;
                }
            }
        }
        else
        {
            for (const auto &[source, destination] : config.sends)
            {
                entries.push_back(FileEntry{source, destination});
            }
        }

        std::optional<Endpoint> endpoint = config.endpoint;
        if (!endpoint && !settings.servers.empty())
        {
            endpoint = parse_endpoint(settings.servers.front());
        }
        if (!endpoint)
        {
            std::cerr << "ERROR: no server given and none stored in " << store.path().string() << std::endl;
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }
        if (entries.empty())
        {
            std::cout << "Nothing to send" << std::endl;
            return EXIT_SUCCESS;
        }

        if (config.save_settings)
        {
            store.add_server(endpoint->to_string());
            for (const auto &entry : entries)
            {
                store.add_file(entry.to_string());
            }
            store.save();
        }

        ClientTransport transport(TransportLimits{settings.buffer_size, settings.file_block_size}, logger);
        ConsoleObserver observer(transport);
        std::signal(SIGINT, on_interrupt);

        BatchSender sender(transport, logger, config.hash_files);
        const auto report = sender.send(*endpoint, entries, &observer);
        std::signal(SIGINT, SIG_DFL);
        std::cout << std::endl;

        if (!report.connection.ok)
        {
            std::cerr << "ERROR: " << report.connection.describe() << std::endl;
            return EXIT_FAILURE;
        }
        if (report.block_size && !report.block_size->ok)
        {
            std::cout << "Could not set file block size: " << report.block_size->describe() << std::endl;
        }

        for (const auto &file : report.files)
        {
            std::cout << to_string(file.outcome) << ' ' << file.entry.to_string();
            if (file.outcome != SendOutcome::Sent)
            {
                std::cout << " (" << file.result.describe() << ')';
            }
            std::cout << std::endl;
            if (file.outcome == SendOutcome::Sent)
            {
                store.remove_file(file.entry.to_string());
            }
        }
        if (report.canceled)
        {
            std::cout << "Batch canceled" << std::endl;
        }
        if (queued_from_settings || config.save_settings)
        {
            store.save();
        }

        return report.count(SendOutcome::Sent) == entries.size() ? EXIT_SUCCESS : EXIT_FAILURE;
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }
}
