/**
 * filepipe - Shared protocol schema and serialization helpers.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>

namespace filepipe::protocol
{

    enum class ActionKind : std::uint8_t
    {
        Echo = 1,
        SetMeta = 2,
        StartSend = 3,
        ClearFileInfo = 4,
        SetFileBlockSize = 5
    };

    std::string_view to_string(ActionKind kind) noexcept;
    std::optional<ActionKind> action_kind_from_int(std::int64_t value) noexcept;

    constexpr std::int64_t to_int(ActionKind kind) noexcept
    {
        return static_cast<std::int64_t>(kind);
    }

    class ProtocolError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    struct ActionEnvelope
    {
        ActionKind action{ActionKind::Echo};
        nlohmann::json data{};
    };

    void to_json(nlohmann::json &json, const ActionEnvelope &envelope);
    void from_json(const nlohmann::json &json, ActionEnvelope &envelope);

    struct FileInfo
    {
        std::string dest_path;
        std::optional<std::string> hash{};
        std::uint64_t size{};
    };

    void to_json(nlohmann::json &json, const FileInfo &info);
    void from_json(const nlohmann::json &json, FileInfo &info);

    struct EchoAction
    {
        nlohmann::json value{};
    };

    struct SetMetaAction
    {
        FileInfo file;
    };

    struct StartSendAction
    {
    };

    struct ClearFileInfoAction
    {
    };

    struct SetFileBlockSizeAction
    {
        std::uint64_t block_size{};
    };

    using Action = std::variant<EchoAction, SetMetaAction, StartSendAction, ClearFileInfoAction,
                                SetFileBlockSizeAction>;

    ActionKind kind_of(const Action &action) noexcept;

    ActionEnvelope to_envelope(const Action &action);

    // Throws ProtocolError when the payload does not match the action tag.
    Action from_envelope(const ActionEnvelope &envelope);

    nlohmann::json encode_action(const Action &action);

    // Decodes one frame body (delimiter already stripped). Any UTF-8, JSON or schema
    // problem is reported as ProtocolError.
    Action decode_action(std::string_view frame_body);

} // namespace filepipe::protocol
