/**
 * filepipe - Status vocabulary carried by text response frames.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace filepipe
{

    enum class Status : std::uint8_t
    {
        Ok = 0,
        Canceled = 1,
        Error = 2,
        HashOk = 3,
        HashBad = 4
    };

    std::string_view to_string(Status status) noexcept;

    // Free-form text that is not one of the known tokens is an error.
    Status status_from_text(std::string_view text) noexcept;

} // namespace filepipe
