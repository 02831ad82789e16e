/**
 * filepipe - Delimiter-terminated framing helpers.
 *
 * Control frames and status responses end with a single 0x17 byte. JSON bodies
 * escape every control character, so the delimiter never occurs inside a JSON
 * frame. Status text is sanitized before framing for the same reason.
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace filepipe::protocol
{

    inline constexpr std::uint8_t kDelimiter = 0x17;

    // Appended by the client to the last chunk it sends for a canceled transfer.
    inline constexpr std::array<std::uint8_t, 4> kCancelSentinel{0x18, 0x18, 0x18, 0x18};

    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message);

    std::vector<std::uint8_t> encode_text_frame(std::string_view text);

    // Removes the first complete frame from the front of `buffer` and returns its body
    // without the delimiter. Returns nullopt and leaves `buffer` untouched when no
    // delimiter has arrived yet.
    std::optional<std::string> take_frame(std::vector<std::uint8_t> &buffer);

    bool ends_with_sentinel(std::span<const std::uint8_t> data) noexcept;

} // namespace filepipe::protocol
