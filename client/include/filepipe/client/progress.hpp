#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace filepipe::client
{

    struct TransferProgress
    {
        using Clock = std::chrono::steady_clock;

        std::size_t current_file_count{1};
        std::size_t file_count{1};
        std::string current_file_name;
        std::uint64_t file_size{};
        std::uint64_t bytes_sent{};
        Clock::time_point start_time{Clock::now()};

        std::chrono::duration<double> elapsed(Clock::time_point now = Clock::now()) const;

        // Bytes per second; nullopt until more than two seconds have elapsed.
        std::optional<double> speed(Clock::time_point now = Clock::now()) const;

        // (file_size - bytes_sent) / speed, under the same two second rule.
        std::optional<std::chrono::seconds> projected_remaining(Clock::time_point now = Clock::now()) const;

        // "(1/3) files - name [1.50 KiB/2.00 KiB, 0:00:03/0:00:01, 512 B/s]"
        std::string to_string(Clock::time_point now = Clock::now()) const;

        static std::string human_readable_size(double size, int decimal_places = 2);
    };

    // Host UI hooks called by the transport between chunks.
    class TransferObserver
    {
    public:
        virtual ~TransferObserver() = default;

        virtual void on_progress(const TransferProgress &progress) = 0;

        // Gives the host a chance to process input, e.g. to request cancellation.
        virtual void yield() {}
    };

} // namespace filepipe::client
