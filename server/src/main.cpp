#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "filepipe/server/server.hpp"
#include "filepipe/version.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{

    void print_usage(const char *program_name)
    {
        std::cout << "filepipe server " << filepipe::version() << "\n"
                  << "Usage: " << program_name
                  << " [--address <ADDRESS>] [--port <PORT>] [--root <ROOT>] [--buffer-size <BYTES>] "
                     "[--file-block-size <BYTES>] [--log-level <LEVEL>] [--log <FILE>]\n";
    }

    std::optional<std::string> read_option(int &index, int argc, char *argv[])
    {
        if (index + 1 >= argc)
        {
            return std::nullopt;
        }
        ++index;
        return std::string(argv[index]);
    }

} // namespace

int main(int argc, char *argv[])
{
    using filepipe::server::Server;
    using filepipe::server::ServerConfig;

    ServerConfig config;

    try
    {
        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];
            if (arg == "--help" || arg == "-h")
            {
                print_usage(argv[0]);
                return EXIT_SUCCESS;
            }
            if (arg != "--port" && arg != "--root" && arg != "--address" && arg != "--buffer-size" &&
                arg != "--file-block-size" && arg != "--log-level" && arg != "--log")
            {
                std::cerr << "Unknown argument: " << arg << std::endl;
                print_usage(argv[0]);
                return EXIT_FAILURE;
            }
            auto value = read_option(i, argc, argv);
            if (!value)
            {
                std::cerr << "Missing value for " << arg << std::endl;
                print_usage(argv[0]);
                return EXIT_FAILURE;
            }

            if (arg == "--port")
            {
                const auto port = std::stoul(*value);
                if (port == 0 || port > 65535)
                {
                    std::cerr << "Port must be between 1 and 65535" << std::endl;
                    return EXIT_FAILURE;
                }
                config.port = static_cast<std::uint16_t>(port);
            }
            else if (arg == "--root")
            {
                config.root = std::filesystem::path(*value);
            }
            else if (arg == "--address")
            {
                config.address = *value;
            }
            else if (arg == "--buffer-size")
            {
                config.control_buffer_size = static_cast<std::size_t>(std::stoul(*value));
            }
            else if (arg == "--file-block-size")
            {
                config.max_file_block_size = static_cast<std::size_t>(std::stoul(*value));
            }
            else if (arg == "--log-level")
            {
                config.log_level = *value;
            }
            else
            {
                config.log_file = std::filesystem::path(*value);
            }
        }
    }
    catch (const std::logic_error &ex)
    {
        std::cerr << "Invalid numeric argument: " << ex.what() << std::endl;
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    if (config.root.empty())
    {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    try
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (config.log_file)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file->string(), true));
        }
        auto logger = std::make_shared<spdlog::logger>("server", sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::from_str(config.log_level));
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
        spdlog::info("Starting filepipe server {} on {}:{}", filepipe::version(), config.address, config.port);

        Server server(std::move(config));
        server.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Server failed: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
