#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "filepipe/client/batch.hpp"
#include "filepipe/client/config.hpp"
#include "filepipe/client/logger.hpp"
#include "filepipe/client/progress.hpp"
#include "filepipe/client/settings_store.hpp"
#include "filepipe/client/transport.hpp"

using namespace filepipe;
using namespace filepipe::client;

namespace
{

    std::filesystem::path fresh_dir(const std::string &name)
    {
        const auto dir = std::filesystem::temp_directory_path() / name;
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
        std::filesystem::create_directories(dir);
        return dir;
    }

    void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    void test_settings_created_with_defaults()
    {
        const auto dir = fresh_dir("filepipe_settings_defaults");
        const auto path = dir / "client-config.json";

        SettingsStore store(path);
        assert(store.recreated());
        assert(std::filesystem::exists(path));
        assert(store.settings().buffer_size == 1024);
        assert(store.settings().file_block_size == 65535);

        nlohmann::json json;
        {
            std::ifstream in(path);
            in >> json;
        }
        assert(json.at("client_buffsize") == 1024);
        assert(json.at("client_file_block_size") == 65535);
        assert(json.at("files").empty());
        assert(json.at("servers").empty());

        cleanup_path(dir);
    }

    void test_settings_roundtrip()
    {
        const auto dir = fresh_dir("filepipe_settings_roundtrip");
        const auto path = dir / "client-config.json";
        {
            SettingsStore store(path);
            store.settings().buffer_size = 2048;
            store.settings().log_level = "debug";
            store.add_file("a.txt -> remote/a.txt");
            store.add_file("b.txt -> remote/b.txt");
            store.add_file("a.txt -> remote/a.txt");
            store.add_server("localhost:4040");
            store.save();
        }

        SettingsStore reloaded(path);
        assert(!reloaded.recreated());
        assert(reloaded.settings().buffer_size == 2048);
        assert(reloaded.settings().log_level == "debug");
        assert(reloaded.settings().files.size() == 2);
        assert(reloaded.settings().servers == std::vector<std::string>{"localhost:4040"});

        reloaded.remove_file("a.txt -> remote/a.txt");
        assert(reloaded.settings().files == std::vector<std::string>{"b.txt -> remote/b.txt"});

        cleanup_path(dir);
    }

    void test_corrupt_settings_moved_aside()
    {
        const auto dir = fresh_dir("filepipe_settings_corrupt");
        const auto path = dir / "client-config.json";
        {
            std::ofstream out(path);
            out << "{ this is not json";
        }

        SettingsStore store(path);
        assert(store.recreated());
        auto backup = path;
        backup += ".old";
        assert(std::filesystem::exists(backup));
        {
            std::ifstream in(backup);
            const std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
            assert(content == "{ this is not json");
        }
        assert(store.settings().buffer_size == 1024);

        {
            std::ofstream out(path, std::ios::trunc);
            out << R"({"client_buffsize": "large"})";
        }
        store.load();
        assert(store.recreated());
        assert(store.settings().buffer_size == 1024);

        cleanup_path(dir);
    }

    void test_progress_projection()
    {
        TransferProgress progress;
        progress.current_file_count = 2;
        progress.file_count = 3;
        progress.current_file_name = "data.bin";
        progress.file_size = 4096;
        progress.bytes_sent = 1024;
        const auto start = progress.start_time;

        const auto early = start + std::chrono::seconds(2);
        assert(!progress.speed(early).has_value());
        assert(!progress.projected_remaining(early).has_value());
        assert(progress.to_string(early) == "(2/3) files - data.bin [1.00 KiB/4.00 KiB, 0:00:02/N/A s, N/A B/s]");

        const auto later = start + std::chrono::seconds(4);
        assert(progress.speed(later).has_value());
        assert(*progress.speed(later) == 256.0);
        assert(progress.projected_remaining(later) == std::chrono::seconds(12));
        assert(progress.to_string(later) == "(2/3) files - data.bin [1.00 KiB/4.00 KiB, 0:00:04/0:00:12, 256 B/s]");
    }

    void test_human_readable_size()
    {
        assert(TransferProgress::human_readable_size(0) == "0.00 B");
        assert(TransferProgress::human_readable_size(1536) == "1.50 KiB");
        assert(TransferProgress::human_readable_size(3.0 * 1024 * 1024, 0) == "3 MiB");
    }

    void test_file_entries()
    {
        const auto entry = parse_file_entry("local/file.txt -> remote/dir/file.txt");
        assert(entry.source == std::filesystem::path("local/file.txt"));
        assert(entry.destination == "remote/dir/file.txt");
        assert(entry.to_string() == "local/file.txt -> remote/dir/file.txt");

        for (const std::string bad : {"no separator", " -> remote", "local -> "})
        {
            bool caught = false;
            try
            {
                (void)parse_file_entry(bad);
            }
            catch (const std::runtime_error &)
            {
                caught = true;
            }
            assert(caught);
        }
    }

    void test_endpoints_and_arguments()
    {
        const auto endpoint = parse_endpoint("127.0.0.1:4040");
        assert(endpoint.host == "127.0.0.1");
        assert(endpoint.port == 4040);
        assert(endpoint.to_string() == "127.0.0.1:4040");

        for (const std::string bad : {"nohost", ":4040", "host:", "host:0", "host:70000", "host:12ab"})
        {
            bool caught = false;
            try
            {
                (void)parse_endpoint(bad);
            }
            catch (const std::runtime_error &)
            {
                caught = true;
            }
            assert(caught);
        }

        std::vector<std::string> args = {"filepipe-client", "example.org:5000", "--send", "a.bin", "dest/a.bin",
                                         "--send", "b.bin", "dest/b.bin", "--hash", "--save", "--config",
                                         "custom.json", "--log-level", "debug"};
        std::vector<char *> argv;
        for (auto &arg : args)
        {
            argv.push_back(arg.data());
        }
        const auto config = parse_arguments(static_cast<int>(argv.size()), argv.data());
        assert(config.endpoint.has_value());
        assert(config.endpoint->host == "example.org");
        assert(config.endpoint->port == 5000);
        assert(config.sends.size() == 2);
        assert(config.sends[1].first == std::filesystem::path("b.bin"));
        assert(config.sends[1].second == "dest/b.bin");
        assert(config.hash_files);
        assert(config.save_settings);
        assert(config.settings_path == std::filesystem::path("custom.json"));
        assert(config.log_level == std::optional<std::string>("debug"));
    }

    void test_action_result_description()
    {
        ActionResult result;
        result.server_response = "File 'x' already exists";
        assert(result.status() == Status::Error);
        assert(result.describe() == "server response: File 'x' already exists");

        result.read_error = "End of file";
        assert(result.describe() == "server response: File 'x' already exists, client read: End of file");

        ActionResult silent;
        assert(silent.status() == Status::Error);
        assert(silent.describe().empty());
    }

    void test_transport_requires_connection()
    {
        ClientTransport transport(TransportLimits{}, Logger(std::nullopt));
        assert(!transport.is_connected());

        const auto echo = transport.echo("hi");
        assert(!echo.ok);
        assert(echo.not_connected);
        assert(echo.describe() == "Client not connected");
        assert(transport.set_file_info(protocol::FileInfo{.dest_path = "x", .hash = std::nullopt, .size = 1}).not_connected);
        assert(transport.send_file("missing.bin", 1).not_connected);
        assert(transport.clear_file_info().not_connected);

        transport.request_cancel_all();
        assert(transport.cancel_all_requested());
        transport.reset_cancellation();
        assert(!transport.cancel_all_requested());
    }

} // namespace

void run_client_component_tests()
{
    test_settings_created_with_defaults();
    test_settings_roundtrip();
    test_corrupt_settings_moved_aside();
    test_progress_projection();
    test_human_readable_size();
    test_file_entries();
    test_endpoints_and_arguments();
    test_action_result_description();
    test_transport_requires_connection();
}
