#pragma once

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

namespace filepipe::server
{

    class FilesystemError : public std::runtime_error
    {
    public:
        explicit FilesystemError(std::string message);
    };

    class Filesystem
    {
    public:
        explicit Filesystem(std::filesystem::path root);

        const std::filesystem::path &root() const noexcept;

        // Maps a client supplied relative destination onto the storage root.
        // Absolute paths and `..` components are rejected.
        std::filesystem::path resolve_destination(const std::string &requested) const;

        // Creates missing parent directories and opens `path` for writing. Fails when
        // the path already exists.
        std::ofstream open_exclusive(const std::filesystem::path &path) const;

        bool remove_partial(const std::filesystem::path &path) const noexcept;

    private:
        std::filesystem::path base_;
    };

} // namespace filepipe::server
