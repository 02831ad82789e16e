#include "filepipe/protocol.hpp"

#include <array>
#include <type_traits>

namespace filepipe::protocol
{

    namespace
    {

        struct ActionMapping
        {
            ActionKind kind;
            std::string_view label;
        };

        constexpr std::array<ActionMapping, 5> kActionMappings{{
            {ActionKind::Echo, "ECHO"},
            {ActionKind::SetMeta, "SET_META"},
            {ActionKind::StartSend, "START_SEND"},
            {ActionKind::ClearFileInfo, "CLEAR_FILE_INFO"},
            {ActionKind::SetFileBlockSize, "SET_FILE_BLOCK_SIZE"},
        }};

        void expect_no_payload(const ActionEnvelope &envelope)
        {
            if (!envelope.data.is_null())
            {
                throw ProtocolError(std::string(to_string(envelope.action)) + " does not take data");
            }
        }

    } // namespace

    std::string_view to_string(ActionKind kind) noexcept
    {
        for (const auto &mapping : kActionMappings)
        {
            if (mapping.kind == kind)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<ActionKind> action_kind_from_int(std::int64_t value) noexcept
    {
        for (const auto &mapping : kActionMappings)
        {
            if (to_int(mapping.kind) == value)
            {
                return mapping.kind;
            }
        }
        return std::nullopt;
    }

    void to_json(nlohmann::json &json, const ActionEnvelope &envelope)
    {
        json = {
            {"action", to_int(envelope.action)},
            {"data", envelope.data},
        };
    }

    void from_json(const nlohmann::json &json, ActionEnvelope &envelope)
    {
        if (!json.is_object())
        {
            throw ProtocolError("Frame is not a JSON object");
        }
        const auto &action = json.at("action");
        if (!action.is_number_integer())
        {
            throw ProtocolError("Field 'action' must be an integer");
        }
        const auto value = action.get<std::int64_t>();
        auto kind = action_kind_from_int(value);
        if (!kind)
        {
            throw ProtocolError("Unknown action: " + std::to_string(value));
        }
        envelope.action = *kind;
        envelope.data = json.value("data", nlohmann::json{});
    }

    void to_json(nlohmann::json &json, const FileInfo &info)
    {
        json = {
            {"dest_path", info.dest_path},
            {"hash", info.hash ? nlohmann::json(*info.hash) : nlohmann::json{}},
            {"size", info.size},
        };
    }

    void from_json(const nlohmann::json &json, FileInfo &info)
    {
        if (!json.is_object())
        {
            throw ProtocolError("File info must be a JSON object");
        }
        const auto &dest = json.at("dest_path");
        if (!dest.is_string())
        {
            throw ProtocolError("Field 'dest_path' must be a string");
        }
        info.dest_path = dest.get<std::string>();

        const auto &size = json.at("size");
        if (!size.is_number_unsigned())
        {
            throw ProtocolError("Field 'size' must be a non-negative integer");
        }
        info.size = size.get<std::uint64_t>();

        if (auto it = json.find("hash"); it != json.end() && !it->is_null())
        {
            if (!it->is_string())
            {
                throw ProtocolError("Field 'hash' must be a string or null");
            }
            info.hash = it->get<std::string>();
        }
        else
        {
            info.hash.reset();
        }
    }

    ActionKind kind_of(const Action &action) noexcept
    {
        return std::visit(
            [](const auto &value)
            {
                using T = std::decay_t<decltype(value)>;
                if constexpr (std::is_same_v<T, EchoAction>)
                {
                    return ActionKind::Echo;
                }
                else if constexpr (std::is_same_v<T, SetMetaAction>)
                {
                    return ActionKind::SetMeta;
                }
                else if constexpr (std::is_same_v<T, StartSendAction>)
                {
                    return ActionKind::StartSend;
                }
                else if constexpr (std::is_same_v<T, ClearFileInfoAction>)
                {
                    return ActionKind::ClearFileInfo;
                }
                else
                {
                    return ActionKind::SetFileBlockSize;
                }
            },
            action);
    }

    ActionEnvelope to_envelope(const Action &action)
    {
        ActionEnvelope envelope;
        envelope.action = kind_of(action);
        if (const auto *echo = std::get_if<EchoAction>(&action))
        {
            envelope.data = echo->value;
        }
        else if (const auto *meta = std::get_if<SetMetaAction>(&action))
        {
            envelope.data = meta->file;
        }
        else if (const auto *block = std::get_if<SetFileBlockSizeAction>(&action))
        {
            envelope.data = block->block_size;
        }
        return envelope;
    }

    Action from_envelope(const ActionEnvelope &envelope)
    {
        switch (envelope.action)
        {
        case ActionKind::Echo:
            return EchoAction{.value = envelope.data};
        case ActionKind::SetMeta:
            return SetMetaAction{.file = envelope.data.get<FileInfo>()};
        case ActionKind::StartSend:
            expect_no_payload(envelope);
            return StartSendAction{};
        case ActionKind::ClearFileInfo:
            expect_no_payload(envelope);
            return ClearFileInfoAction{};
        case ActionKind::SetFileBlockSize:
            if (!envelope.data.is_number_unsigned() || envelope.data.get<std::uint64_t>() == 0)
            {
                throw ProtocolError("SET_FILE_BLOCK_SIZE requires a positive integer");
            }
            return SetFileBlockSizeAction{.block_size = envelope.data.get<std::uint64_t>()};
        }
        throw ProtocolError("Unhandled action");
    }

    nlohmann::json encode_action(const Action &action)
    {
        return nlohmann::json(to_envelope(action));
    }

    Action decode_action(std::string_view frame_body)
    {
        try
        {
            const auto json = nlohmann::json::parse(frame_body.begin(), frame_body.end());
            return from_envelope(json.get<ActionEnvelope>());
        }
        catch (const ProtocolError &)
        {
            throw;
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw ProtocolError(ex.what());
        }
    }

} // namespace filepipe::protocol
