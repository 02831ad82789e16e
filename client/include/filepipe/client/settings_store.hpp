#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace filepipe::client
{

    struct ClientSettings
    {
        std::size_t buffer_size{1024};
        std::size_t file_block_size{65535};
        std::string log_level{"info"};
        std::vector<std::string> files;
        std::vector<std::string> servers;
    };

    void to_json(nlohmann::json &json, const ClientSettings &settings);
    void from_json(const nlohmann::json &json, ClientSettings &settings);

    // JSON settings file. A missing file is created with defaults; a file that
    // cannot be parsed is moved aside to "<name>.old" and replaced by defaults.
    class SettingsStore
    {
    public:
        explicit SettingsStore(std::filesystem::path path);

        const std::filesystem::path &path() const noexcept { return path_; }
        ClientSettings &settings() noexcept { return settings_; }
        const ClientSettings &settings() const noexcept { return settings_; }

        // True when the last load() found no usable file.
        bool recreated() const noexcept { return recreated_; }

        void load();

        // Throws std::runtime_error when the file cannot be written.
        void save() const;

        void add_file(const std::string &entry);
        void remove_file(const std::string &entry);
        void add_server(const std::string &entry);

    private:
        void reset_to_defaults();

        std::filesystem::path path_;
        ClientSettings settings_;
        bool recreated_{false};
    };

} // namespace filepipe::client
