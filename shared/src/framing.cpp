#include "filepipe/framing.hpp"

#include <algorithm>
#include <stdexcept>

namespace filepipe::protocol
{

    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message)
    {
        const auto text = message.dump();
        if (text.find(static_cast<char>(kDelimiter)) != std::string::npos)
        {
            throw std::logic_error("JSON body contains an unescaped frame delimiter");
        }
        std::vector<std::uint8_t> frame;
        frame.reserve(text.size() + 1);
        frame.insert(frame.end(), text.begin(), text.end());
        frame.push_back(kDelimiter);
        return frame;
    }

    std::vector<std::uint8_t> encode_text_frame(std::string_view text)
    {
        std::vector<std::uint8_t> frame;
        frame.reserve(text.size() + 1);
        for (const char ch : text)
        {
            const auto byte = static_cast<std::uint8_t>(ch);
            frame.push_back(byte == kDelimiter ? static_cast<std::uint8_t>('?') : byte);
        }
        frame.push_back(kDelimiter);
        return frame;
    }

    std::optional<std::string> take_frame(std::vector<std::uint8_t> &buffer)
    {
        const auto end = std::find(buffer.begin(), buffer.end(), kDelimiter);
        if (end == buffer.end())
        {
            return std::nullopt;
        }
        std::string body(buffer.begin(), end);
        buffer.erase(buffer.begin(), end + 1);
        return body;
    }

    bool ends_with_sentinel(std::span<const std::uint8_t> data) noexcept
    {
        if (data.size() < kCancelSentinel.size())
        {
            return false;
        }
        return std::equal(kCancelSentinel.begin(), kCancelSentinel.end(),
                          data.end() - static_cast<std::ptrdiff_t>(kCancelSentinel.size()));
    }

} // namespace filepipe::protocol
