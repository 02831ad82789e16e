#include "filepipe/server/filesystem.hpp"

#include <system_error>

namespace filepipe::server
{

    FilesystemError::FilesystemError(std::string message)
        : std::runtime_error(std::move(message)) {}

    Filesystem::Filesystem(std::filesystem::path root) : base_(std::move(root))
    {
        std::filesystem::create_directories(base_);
        base_ = std::filesystem::absolute(base_).lexically_normal();
    }

    const std::filesystem::path &Filesystem::root() const noexcept
    {
        return base_;
    }

    std::filesystem::path Filesystem::resolve_destination(const std::string &requested) const
    {
        if (requested.empty())
        {
            throw FilesystemError("Destination file path cannot be empty");
        }
        const std::filesystem::path relative(requested);
        if (relative.is_absolute() || relative.has_root_directory() || relative.has_root_name())
        {
            throw FilesystemError("Destination file path cannot be absolute");
        }

        std::filesystem::path sanitized = base_;
        bool has_component = false;
        for (const auto &part : relative)
        {
            const auto part_string = part.generic_string();
            if (part_string.empty() || part_string == ".")
            {
                continue;
            }
            if (part_string == "..")
            {
                throw FilesystemError("Destination file path cannot leave the root directory");
            }
            sanitized /= part;
            has_component = true;
        }
        if (!has_component)
        {
            throw FilesystemError("Destination file path must name a file");
        }
        return sanitized;
    }

    std::ofstream Filesystem::open_exclusive(const std::filesystem::path &path) const
    {
        std::error_code ec;
        if (std::filesystem::exists(path, ec))
        {
            throw FilesystemError("File '" + path.filename().string() + "' already exists");
        }

        const auto parent = path.parent_path();
        if (!parent.empty())
        {
            std::filesystem::create_directories(parent, ec);
            if (ec)
            {
                throw FilesystemError("Could not create directory '" + parent.string() + "': " + ec.message());
            }
        }

        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file.is_open())
        {
            throw FilesystemError("Could not open '" + path.string() + "' for writing");
        }
        return file;
    }

    bool Filesystem::remove_partial(const std::filesystem::path &path) const noexcept
    {
        std::error_code ec;
        return std::filesystem::remove(path, ec) && !ec;
    }

} // namespace filepipe::server
