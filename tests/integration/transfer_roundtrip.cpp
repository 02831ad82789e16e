#include <cassert>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "filepipe/client/batch.hpp"
#include "filepipe/client/logger.hpp"
#include "filepipe/client/transport.hpp"
#include "filepipe/server/server.hpp"

using namespace filepipe;

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

    std::filesystem::path write_file(const std::filesystem::path &path, const std::string &content)
    {
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path;
    }

    std::string read_file(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    // Runs a server on an ephemeral loopback port for the lifetime of the object.
    class ServerFixture
    {
    public:
        explicit ServerFixture(const std::filesystem::path &root)
            : server_(make_config(root)),
              port_(server_.port()),
              thread_([this]
                      { server_.run(); })
        {
        }

        ~ServerFixture()
        {
            server_.stop();
            thread_.join();
        }

        std::uint16_t port() const noexcept { return port_; }

    private:
        static server::ServerConfig make_config(const std::filesystem::path &root)
        {
            server::ServerConfig config;
            config.address = "127.0.0.1";
            config.port = 0;
            config.root = root;
            return config;
        }

        server::Server server_;
        std::uint16_t port_;
        std::thread thread_;
    };

    // Cancels once a given file of the batch starts streaming.
    class CancelingObserver : public client::TransferObserver
    {
    public:
        CancelingObserver(client::ClientTransport &transport, std::size_t file_number, bool cancel_all)
            : transport_(transport), file_number_(file_number), cancel_all_(cancel_all)
        {
        }

        void on_progress(const client::TransferProgress &progress) override
        {
            ++progress_calls;
            if (progress.current_file_count == file_number_ && !fired_)
            {
                fired_ = true;
                if (cancel_all_)
                {
                    transport_.request_cancel_all();
                }
                else
                {
                    transport_.request_cancel_transfer();
                }
            }
        }

        std::size_t progress_calls{0};

    private:
        client::ClientTransport &transport_;
        std::size_t file_number_;
        bool cancel_all_;
        bool fired_{false};
    };

    // Requests a per-file cancel only after the first file's last chunk went out.
    class LateCancelObserver : public client::TransferObserver
    {
    public:
        explicit LateCancelObserver(client::ClientTransport &transport) : transport_(transport) {}

        void on_progress(const client::TransferProgress &progress) override
        {
            last_file_done_ = progress.current_file_count == 1 && progress.bytes_sent == progress.file_size;
        }

        void yield() override
        {
            if (last_file_done_ && !fired_)
            {
                fired_ = true;
                transport_.request_cancel_transfer();
            }
        }

    private:
        client::ClientTransport &transport_;
        bool last_file_done_{false};
        bool fired_{false};
    };

    void test_echo_over_socket(std::uint16_t port)
    {
        client::ClientTransport transport(client::TransportLimits{}, client::Logger(std::nullopt));
        assert(transport.connect("127.0.0.1", port).ok);
        assert(transport.test_connection().ok);

        assert(transport.echo("hi").server_response == std::optional<std::string>("\"hi\""));
        assert(transport.echo(42).server_response == std::optional<std::string>("42"));
        assert(transport.echo(nullptr).server_response == std::optional<std::string>("null"));

        // Reconnecting replaces the previous connection.
        assert(transport.connect("127.0.0.1", port).ok);
        assert(transport.is_connected());
        assert(transport.set_file_block_size().ok);
        transport.close();
        assert(!transport.is_connected());
        assert(transport.echo("late").not_connected);
    }

    void test_send_and_cancel(std::uint16_t port, const std::filesystem::path &source_dir,
                              const std::filesystem::path &root)
    {
        client::ClientTransport transport(client::TransportLimits{.buffer_size = 1024, .file_block_size = 4},
                                          client::Logger(std::nullopt));
        assert(transport.connect("127.0.0.1", port).ok);
        assert(transport.set_file_block_size().ok);

        const auto hello = write_file(source_dir / "hello.txt", "hello");
        assert(transport.set_file_info(protocol::FileInfo{.dest_path = "a/b.txt", .hash = std::nullopt, .size = 5}).ok);
        client::TransferProgress progress;
        const auto sent = transport.send_file(hello, 5, &progress);
        assert(sent.ok);
        assert(sent.status() == Status::Ok);
        assert(progress.bytes_sent == 5);
        assert(read_file(root / "a" / "b.txt") == "hello");

        const auto big = write_file(source_dir / "big.txt", std::string(64, 'z'));
        assert(transport.set_file_info(protocol::FileInfo{.dest_path = "big.txt", .hash = std::nullopt, .size = 64}).ok);
        transport.request_cancel_transfer();
        const auto canceled = transport.send_file(big, 64);
        assert(!canceled.ok);
        assert(canceled.status() == Status::Canceled);
        assert(!std::filesystem::exists(root / "big.txt"));

        // Existing destination is refused before any byte is sent.
        assert(transport.set_file_info(protocol::FileInfo{.dest_path = "a/b.txt", .hash = std::nullopt, .size = 5}).ok);
        const auto refused = transport.send_file(hello, 5);
        assert(!refused.ok);
        assert(refused.server_response.has_value());
        assert(refused.status() == Status::Error);
        assert(read_file(root / "a" / "b.txt") == "hello");
        assert(transport.clear_file_info().ok);

        // The connection keeps serving after a cancellation.
        assert(transport.test_connection().ok);
    }

    void test_batch_with_one_canceled(std::uint16_t port, const std::filesystem::path &source_dir,
                                      const std::filesystem::path &root)
    {
        const auto first = write_file(source_dir / "first.txt", "first file");
        const auto second = write_file(source_dir / "second.txt", std::string(1000, 's'));
        const std::vector<client::FileEntry> entries = {
            {first, "batch/first.txt"},
            {source_dir / "missing.txt", "batch/missing.txt"},
            {second, "batch/second.txt"},
        };

        client::ClientTransport transport(client::TransportLimits{.buffer_size = 1024, .file_block_size = 100},
                                          client::Logger(std::nullopt));
        CancelingObserver observer(transport, 3, false);
        client::BatchSender sender(transport, client::Logger(std::nullopt));
        const auto report = sender.send(client::Endpoint{"127.0.0.1", port}, entries, &observer);

        assert(report.connection.ok);
        assert(report.block_size && report.block_size->ok);
        assert(!report.canceled);
        assert(report.files.size() == 3);
        assert(report.files[0].outcome == client::SendOutcome::Sent);
        assert(report.files[1].outcome == client::SendOutcome::Failed);
        assert(report.files[1].result.send_error.has_value());
        assert(report.files[2].outcome == client::SendOutcome::Canceled);
        assert(report.count(client::SendOutcome::Sent) == 1);
        assert(observer.progress_calls > 0);

        assert(read_file(root / "batch" / "first.txt") == "first file");
        assert(!std::filesystem::exists(root / "batch" / "second.txt"));
        assert(!transport.is_connected());
        assert(!transport.cancel_all_requested());
    }

    void test_batch_cancel_all(std::uint16_t port, const std::filesystem::path &source_dir,
                               const std::filesystem::path &root)
    {
        const auto one = write_file(source_dir / "one.txt", std::string(500, '1'));
        const auto two = write_file(source_dir / "two.txt", "two");
        const std::vector<client::FileEntry> entries = {
            {one, "all/one.txt"},
            {two, "all/two.txt"},
        };

        client::ClientTransport transport(client::TransportLimits{.buffer_size = 1024, .file_block_size = 50},
                                          client::Logger(std::nullopt));
        CancelingObserver observer(transport, 1, true);
        client::BatchSender sender(transport, client::Logger(std::nullopt), false);
        const auto report = sender.send(client::Endpoint{"127.0.0.1", port}, entries, &observer);

        assert(report.canceled);
        assert(report.files.size() == 1);
        assert(report.files[0].outcome == client::SendOutcome::Canceled);
        assert(!std::filesystem::exists(root / "all" / "one.txt"));
        assert(!std::filesystem::exists(root / "all" / "two.txt"));
    }

    void test_cancel_after_last_chunk_spares_next_file(std::uint16_t port, const std::filesystem::path &source_dir,
                                                       const std::filesystem::path &root)
    {
        const auto first = write_file(source_dir / "late1.txt", std::string(40, 'a'));
        const auto second = write_file(source_dir / "late2.txt", std::string(40, 'b'));
        const std::vector<client::FileEntry> entries = {
            {first, "late/one.txt"},
            {second, "late/two.txt"},
        };

        client::ClientTransport transport(client::TransportLimits{.buffer_size = 1024, .file_block_size = 16},
                                          client::Logger(std::nullopt));
        LateCancelObserver observer(transport);
        client::BatchSender sender(transport, client::Logger(std::nullopt));
        const auto report = sender.send(client::Endpoint{"127.0.0.1", port}, entries, &observer);

        assert(report.files.size() == 2);
        assert(report.files[0].outcome == client::SendOutcome::Sent);
        assert(report.files[1].outcome == client::SendOutcome::Sent);
        assert(read_file(root / "late" / "one.txt") == std::string(40, 'a'));
        assert(read_file(root / "late" / "two.txt") == std::string(40, 'b'));
    }

    void test_unreachable_server(const std::filesystem::path &source_dir)
    {
        client::ClientTransport transport(client::TransportLimits{}, client::Logger(std::nullopt));
        client::BatchSender sender(transport, client::Logger(std::nullopt));
        const std::vector<client::FileEntry> entries = {{write_file(source_dir / "x.txt", "x"), "x.txt"}};

        // Port 1 on loopback is not expected to accept connections.
        const auto report = sender.send(client::Endpoint{"127.0.0.1", 1}, entries);
        assert(!report.connection.ok);
        assert(report.connection.send_error.has_value());
        assert(report.files.empty());
    }

} // namespace

int main()
{
    try
    {
        const auto root = fresh_dir("filepipe_integration_root");
        const auto source_dir = fresh_dir("filepipe_integration_sources");
        {
            ServerFixture fixture(root);
            test_echo_over_socket(fixture.port());
            test_send_and_cancel(fixture.port(), source_dir, root);
            test_batch_with_one_canceled(fixture.port(), source_dir, root);
            test_batch_cancel_all(fixture.port(), source_dir, root);
            test_cancel_after_last_chunk_spares_next_file(fixture.port(), source_dir, root);
        }
        test_unreachable_server(source_dir);

        std::error_code ec;
        std::filesystem::remove_all(root, ec);
        std::filesystem::remove_all(source_dir, ec);
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}
