#include "filepipe/status.hpp"

#include <array>

namespace filepipe
{

    namespace
    {
        struct StatusDescription
        {
            Status status;
            std::string_view label;
        };

        constexpr std::array<StatusDescription, 5> kDescriptions{{
            {Status::Ok, "OK"},
            {Status::Canceled, "CANCELED"},
            {Status::Error, "ERROR"},
            {Status::HashOk, "HASH_OK"},
            {Status::HashBad, "HASH_BAD"},
        }};
    } // namespace

    std::string_view to_string(Status status) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.status == status)
            {
                return entry.label;
            }
        }
        return "ERROR";
    }

    Status status_from_text(std::string_view text) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.label == text)
            {
                return entry.status;
            }
        }
        return Status::Error;
    }

} // namespace filepipe
