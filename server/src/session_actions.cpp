#include "filepipe/server/session.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace filepipe::server
{

    void Session::execute_next_action()
    {
        if (actions_.empty())
        {
            return;
        }
        const auto action = std::move(actions_.front());
        actions_.pop_front();

        switch (protocol::kind_of(action))
        {
        case protocol::ActionKind::Echo:
            handle_echo(std::get<protocol::EchoAction>(action));
            break;
        case protocol::ActionKind::SetMeta:
            handle_set_meta(std::get<protocol::SetMetaAction>(action));
            break;
        case protocol::ActionKind::StartSend:
            handle_start_send();
            break;
        case protocol::ActionKind::ClearFileInfo:
            handle_clear_file_info();
            break;
        case protocol::ActionKind::SetFileBlockSize:
            handle_set_file_block_size(std::get<protocol::SetFileBlockSizeAction>(action));
            break;
        }
    }

    void Session::handle_echo(const protocol::EchoAction &action)
    {
        const auto text = action.value.dump();
        spdlog::info("[{}] [ECHO] {}", peer_, text);
        respond(text);
    }

    void Session::handle_set_meta(const protocol::SetMetaAction &action)
    {
        if (state_ == SessionState::ReceivingFile)
        {
            spdlog::warn("[{}] [SET_META] Rejected, currently receiving file", peer_);
            respond("Cannot set file metadata, currently receiving file");
            return;
        }
        try
        {
            FileDescriptor descriptor{
                .destination = filesystem_.resolve_destination(action.file.dest_path),
                .size = action.file.size,
                .hash = action.file.hash,
                .received = 0,
            };
            spdlog::info("[{}] [SET_META] dest={} size={} hash={}", peer_, descriptor.destination.string(),
                         descriptor.size, descriptor.hash.value_or("-"));
            descriptor_ = std::move(descriptor);
            respond(Status::Ok);
        }
        catch (const FilesystemError &fs)
        {
            spdlog::warn("[{}] [SET_META] Could not set file info: {}", peer_, fs.what());
            respond(fs.what());
        }
        catch (const std::exception &ex)
        {
            spdlog::error("[{}] [SET_META] {}", peer_, ex.what());
            respond(ex.what());
        }
    }

    void Session::handle_start_send()
    {
        if (state_ == SessionState::ReceivingFile)
        {
            spdlog::warn("[{}] [START_SEND] Rejected, currently receiving file", peer_);
            respond("Cannot start file transmission, currently receiving file");
            return;
        }
        if (!descriptor_)
        {
            spdlog::warn("[{}] [START_SEND] Rejected, no file info set", peer_);
            respond("Cannot start file transmission, no file info set");
            return;
        }
        try
        {
            file_ = filesystem_.open_exclusive(descriptor_->destination);
        }
        catch (const FilesystemError &fs)
        {
            spdlog::warn("[{}] [START_SEND] Could not prepare to receive file: {}", peer_, fs.what());
            respond(fs.what());
            return;
        }
        catch (const std::exception &ex)
        {
            spdlog::error("[{}] [START_SEND] {}", peer_, ex.what());
            respond(ex.what());
            return;
        }

        state_ = SessionState::ReceivingFile;
        reset_cancel_tracking();
        descriptor_->received = 0;
        spdlog::info("[{}] [START_SEND] Prepared to receive {} bytes into {}", peer_, descriptor_->size,
                     descriptor_->destination.string());
        respond(Status::Ok);

        if (descriptor_->size == 0)
        {
            finish_transfer();
        }
    }

    void Session::handle_clear_file_info()
    {
        if (state_ == SessionState::ReceivingFile)
        {
            spdlog::warn("[{}] [CLEAR_FILE_INFO] Cannot clear file info, file is still open", peer_);
            respond("Cannot clear file info, file is still open");
            return;
        }
        descriptor_.reset();
        spdlog::info("[{}] [CLEAR_FILE_INFO] OK", peer_);
        respond(Status::Ok);
    }

    void Session::handle_set_file_block_size(const protocol::SetFileBlockSizeAction &action)
    {
        file_block_size_ = static_cast<std::size_t>(
            std::min<std::uint64_t>(action.block_size, limits_.max_file_block_size));
        spdlog::info("[{}] [SET_FILE_BLOCK_SIZE] File block size set to {}", peer_, file_block_size_);
        respond(Status::Ok);
    }

} // namespace filepipe::server
