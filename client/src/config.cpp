#include "filepipe/client/config.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>

namespace filepipe::client
{

    std::string Endpoint::to_string() const
    {
        return host + ":" + std::to_string(port);
    }

    Endpoint parse_endpoint(const std::string &text)
    {
        const auto colon_pos = text.rfind(':');
        if (colon_pos == std::string::npos || colon_pos == 0 || colon_pos + 1 == text.size())
        {
            throw std::runtime_error("Expected endpoint format host:port, got '" + text + "'");
        }
        Endpoint endpoint;
        endpoint.host = text.substr(0, colon_pos);
        const auto port_string = text.substr(colon_pos + 1);
        std::size_t consumed = 0;
        unsigned long port = 0;
        try
        {
            port = std::stoul(port_string, &consumed);
        }
        catch (const std::logic_error &)
        {
            throw std::runtime_error("Invalid port '" + port_string + "'");
        }
        if (consumed != port_string.size() || port == 0 || port > 65535)
        {
            throw std::runtime_error("Invalid port '" + port_string + "'");
        }
        endpoint.port = static_cast<std::uint16_t>(port);
        return endpoint;
    }

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        ClientConfig config;
        int index = 1;

        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--config")
            {
                if (index >= argc)
                {
                    throw std::runtime_error("--config requires a file path");
                }
                config.settings_path = std::filesystem::path(argv[index++]);
            }
            else if (arg == "--send")
            {
                if (index + 1 >= argc)
                {
                    throw std::runtime_error("--send requires a source file and a destination path");
                }
                std::filesystem::path source(argv[index++]);
                std::string destination = argv[index++];
                config.sends.emplace_back(std::move(source), std::move(destination));
            }
            else if (arg == "--log")
            {
                if (index >= argc)
                {
                    throw std::runtime_error("--log requires a file path");
                }
                config.log_path = std::filesystem::path(argv[index++]);
            }
            else if (arg == "--log-level")
            {
                if (index >= argc)
                {
                    throw std::runtime_error("--log-level requires a value");
                }
                config.log_level = std::string(argv[index++]);
            }
            else if (arg == "--hash")
            {
                config.hash_files = true;
            }
            else if (arg == "--save")
            {
                config.save_settings = true;
            }
            else if (!arg.empty() && arg.front() != '-' && !config.endpoint)
            {
                config.endpoint = parse_endpoint(arg);
            }
            else
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
        }

        return config;
    }

} // namespace filepipe::client
