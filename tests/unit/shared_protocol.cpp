#include <algorithm>
#include <array>
#include <cassert>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <span>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "filepipe/crypto.hpp"
#include "filepipe/framing.hpp"
#include "filepipe/protocol.hpp"
#include "filepipe/status.hpp"

using namespace filepipe;
using namespace filepipe::protocol;

void run_server_component_tests();
void run_client_component_tests();

namespace
{

    std::vector<std::uint8_t> bytes_of(const std::string &text)
    {
        return std::vector<std::uint8_t>(text.begin(), text.end());
    }

    void test_action_wire_format()
    {
        const auto json = encode_action(SetMetaAction{.file = FileInfo{
                                                          .dest_path = "a/b.txt",
                                                          .hash = std::string("abcd"),
                                                          .size = 5,
                                                      }});
        assert(json.at("action") == 2);
        assert(json.at("data").at("dest_path") == "a/b.txt");
        assert(json.at("data").at("hash") == "abcd");
        assert(json.at("data").at("size") == 5);

        const auto start = encode_action(StartSendAction{});
        assert(start.at("action") == 3);
        assert(start.at("data").is_null());

        assert(encode_action(EchoAction{.value = "hi"}).at("action") == 1);
        assert(encode_action(ClearFileInfoAction{}).at("action") == 4);
        assert(encode_action(SetFileBlockSizeAction{.block_size = 100}).at("data") == 100);
    }

    void test_decode_actions()
    {
        const auto echo = decode_action(R"({"action": 1, "data": {"nested": [1, 2]}})");
        assert(kind_of(echo) == ActionKind::Echo);
        assert(std::get<EchoAction>(echo).value.at("nested").size() == 2);

        const auto meta = decode_action(R"({"action": 2, "data": {"dest_path": "x/y.bin", "hash": null, "size": 0}})");
        const auto &file = std::get<SetMetaAction>(meta).file;
        assert(file.dest_path == "x/y.bin");
        assert(!file.hash.has_value());
        assert(file.size == 0);

        assert(kind_of(decode_action(R"({"action": 3, "data": null})")) == ActionKind::StartSend);
        assert(kind_of(decode_action(R"({"action": 4})")) == ActionKind::ClearFileInfo);
        const auto block = decode_action(R"({"action": 5, "data": 4096})");
        assert(std::get<SetFileBlockSizeAction>(block).block_size == 4096);
    }

    void test_decode_rejects_malformed()
    {
        const std::vector<std::string> bad_frames = {
            "not json",
            "[1, 2, 3]",
            R"({"data": null})",
            R"({"action": "1", "data": null})",
            R"({"action": 99, "data": null})",
            R"({"action": 2, "data": {"dest_path": "a", "size": -1}})",
            R"({"action": 2, "data": {"size": 3}})",
            R"({"action": 3, "data": "unexpected"})",
            R"({"action": 5, "data": 0})",
            R"({"action": 5, "data": "big"})",
            "{\"action\": 1, \"data\": \"\xff\xfe\"}",
        };
        for (const auto &frame : bad_frames)
        {
            bool caught = false;
            try
            {
                (void)decode_action(frame);
            }
            catch (const ProtocolError &)
            {
                caught = true;
            }
            assert(caught);
        }
    }

    void test_framing()
    {
        const auto frame = encode_frame(encode_action(EchoAction{.value = "\x17 inside"}));
        assert(frame.back() == kDelimiter);
        assert(std::count(frame.begin(), frame.end(), kDelimiter) == 1);

        std::vector<std::uint8_t> buffer(frame.begin(), frame.end() - 3);
        assert(!take_frame(buffer).has_value());
        assert(buffer.size() == frame.size() - 3);
        buffer.insert(buffer.end(), frame.end() - 3, frame.end());

        const auto second = bytes_of("OK\x17" "CANCELED\x17" "partial");
        buffer.insert(buffer.end(), second.begin(), second.end());

        const auto body = take_frame(buffer);
        assert(body.has_value());
        const auto echo = decode_action(*body);
        assert(std::get<EchoAction>(echo).value == "\x17 inside");
        assert(take_frame(buffer) == std::optional<std::string>("OK"));
        assert(take_frame(buffer) == std::optional<std::string>("CANCELED"));
        assert(!take_frame(buffer).has_value());
        assert(buffer == bytes_of("partial"));
    }

    void test_text_frames()
    {
        const auto frame = encode_text_frame("bad\x17text");
        assert(frame == bytes_of("bad?text\x17"));
        assert(encode_text_frame("") == std::vector<std::uint8_t>{kDelimiter});
    }

    void test_sentinel_detection()
    {
        std::vector<std::uint8_t> data = bytes_of("ab");
        data.insert(data.end(), kCancelSentinel.begin(), kCancelSentinel.end());
        assert(ends_with_sentinel(data));
        data.push_back('c');
        assert(!ends_with_sentinel(data));
        const std::array<std::uint8_t, 3> short_tail{0x18, 0x18, 0x18};
        assert(!ends_with_sentinel(short_tail));
    }

    void test_status_vocabulary()
    {
        assert(to_string(Status::Ok) == "OK");
        assert(to_string(Status::Canceled) == "CANCELED");
        assert(to_string(Status::HashOk) == "HASH_OK");
        assert(to_string(Status::HashBad) == "HASH_BAD");
        assert(status_from_text("OK") == Status::Ok);
        assert(status_from_text("CANCELED") == Status::Canceled);
        assert(status_from_text("Destination file path cannot be absolute") == Status::Error);
        assert(status_from_text("ok") == Status::Error);
    }

    void test_action_labels()
    {
        assert(to_string(ActionKind::SetMeta) == "SET_META");
        assert(action_kind_from_int(5) == ActionKind::SetFileBlockSize);
        assert(!action_kind_from_int(0).has_value());
        assert(!action_kind_from_int(6).has_value());
    }

    void test_crypto()
    {
        std::istringstream empty;
        assert(crypto::hash_stream(empty) == "0e5751c026e543b2e8ab2eb06099daa1d1e5df47778f7787faab45cdf12fe3a8");

        std::istringstream stream(std::string("\xDE\xAD\xBE\xEF", 4));
        const auto stream_hash = crypto::hash_stream(stream);
        assert(stream_hash.size() == 64);

        const auto file_path = std::filesystem::temp_directory_path() / "filepipe_crypto_test.bin";
        {
            std::ofstream file(file_path, std::ios::binary);
            file.write("\xDE\xAD\xBE\xEF", 4);
        }
        assert(crypto::hash_file(file_path) == stream_hash);
        std::filesystem::remove(file_path);

        bool caught = false;
        try
        {
            (void)crypto::hash_file(file_path);
        }
        catch (const std::runtime_error &)
        {
            caught = true;
        }
        assert(caught);
    }

} // namespace

int main()
{
    try
    {
        test_action_wire_format();
        test_decode_actions();
        test_decode_rejects_malformed();
        test_framing();
        test_text_frames();
        test_sentinel_detection();
        test_status_vocabulary();
        test_action_labels();
        test_crypto();
        run_server_component_tests();
        run_client_component_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}
