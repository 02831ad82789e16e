#include "filepipe/client/progress.hpp"

#include <array>
#include <iomanip>
#include <sstream>

namespace filepipe::client
{

    namespace
    {

        constexpr double kProjectionDelaySeconds = 2.0;

        std::string format_duration(std::chrono::seconds duration)
        {
            const auto total = duration.count();
            std::ostringstream out;
            out << total / 3600 << ':' << std::setw(2) << std::setfill('0') << (total / 60) % 60 << ':'
                << std::setw(2) << std::setfill('0') << total % 60;
            return out.str();
        }

    } // namespace

    std::chrono::duration<double> TransferProgress::elapsed(Clock::time_point now) const
    {
        return now - start_time;
    }

    std::optional<double> TransferProgress::speed(Clock::time_point now) const
    {
        const auto seconds = elapsed(now).count();
        if (seconds <= kProjectionDelaySeconds)
        {
            return std::nullopt;
        }
        return static_cast<double>(bytes_sent) / seconds;
    }

    std::optional<std::chrono::seconds> TransferProgress::projected_remaining(Clock::time_point now) const
    {
        const auto current = speed(now);
        if (!current || *current <= 0.0)
        {
            return std::nullopt;
        }
        const auto remaining = file_size > bytes_sent ? file_size - bytes_sent : 0;
        return std::chrono::seconds(static_cast<std::int64_t>(static_cast<double>(remaining) / *current));
    }

    std::string TransferProgress::to_string(Clock::time_point now) const
    {
        const auto current_speed = speed(now);
        const auto remaining = projected_remaining(now);
        const auto spent = std::chrono::duration_cast<std::chrono::seconds>(elapsed(now));

        std::ostringstream out;
        out << '(' << current_file_count << '/' << file_count << ") files - " << current_file_name << " ["
            << human_readable_size(static_cast<double>(bytes_sent)) << '/'
            << human_readable_size(static_cast<double>(file_size)) << ", " << format_duration(spent) << '/'
            << (remaining ? format_duration(*remaining) : std::string("N/A s")) << ", "
            << (current_speed ? human_readable_size(*current_speed, 0) : std::string("N/A B")) << "/s]";
        return out.str();
    }

    std::string TransferProgress::human_readable_size(double size, int decimal_places)
    {
        static constexpr std::array<const char *, 6> kUnits{"B", "KiB", "MiB", "GiB", "TiB", "PiB"};
        std::size_t unit = 0;
        while (size >= 1024.0 && unit + 1 < kUnits.size())
        {
            size /= 1024.0;
            ++unit;
        }
        std::ostringstream out;
        out << std::fixed << std::setprecision(decimal_places) << size << ' ' << kUnits[unit];
        return out.str();
    }

} // namespace filepipe::client
