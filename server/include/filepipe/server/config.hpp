#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace filepipe::server
{

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{4040};
        std::size_t control_buffer_size{1024};
        std::size_t max_file_block_size{65535};
        std::filesystem::path root{"./"};
        std::string log_level{"info"};
        std::optional<std::filesystem::path> log_file;
    };

} // namespace filepipe::server
