#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace filepipe::client
{

    struct Endpoint
    {
        std::string host;
        std::uint16_t port{};

        std::string to_string() const;
    };

    // Parses "host:port". Throws std::runtime_error on a malformed value.
    Endpoint parse_endpoint(const std::string &text);

    struct ClientConfig
    {
        std::optional<Endpoint> endpoint;
        std::filesystem::path settings_path{"client-config.json"};
        std::vector<std::pair<std::filesystem::path, std::string>> sends;
        std::optional<std::filesystem::path> log_path;
        std::optional<std::string> log_level;
        bool hash_files{false};
        bool save_settings{false};
    };

    ClientConfig parse_arguments(int argc, char *argv[]);

} // namespace filepipe::client
