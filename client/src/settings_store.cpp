#include "filepipe/client/settings_store.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace filepipe::client
{

    void to_json(nlohmann::json &json, const ClientSettings &settings)
    {
        json = nlohmann::json{{"client_buffsize", settings.buffer_size},
                              {"client_file_block_size", settings.file_block_size},
                              {"log_level", settings.log_level},
                              {"files", settings.files},
                              {"servers", settings.servers}};
    }

    void from_json(const nlohmann::json &json, ClientSettings &settings)
    {
        if (!json.is_object())
        {
            throw std::runtime_error("Settings must be a JSON object");
        }
        const ClientSettings defaults;
        settings.buffer_size = json.value("client_buffsize", defaults.buffer_size);
        settings.file_block_size = json.value("client_file_block_size", defaults.file_block_size);
        settings.log_level = json.value("log_level", defaults.log_level);
        settings.files = json.value("files", defaults.files);
        settings.servers = json.value("servers", defaults.servers);
        if (settings.buffer_size == 0 || settings.file_block_size == 0)
        {
            throw std::runtime_error("Buffer sizes must be greater than zero");
        }
    }

    SettingsStore::SettingsStore(std::filesystem::path path) : path_(std::move(path))
    {
        load();
    }

    void SettingsStore::load()
    {
        recreated_ = false;
        if (!std::filesystem::exists(path_))
        {
            reset_to_defaults();
            return;
        }

        try
        {
            std::ifstream in(path_);
            if (!in.is_open())
            {
                throw std::runtime_error("Could not open " + path_.string());
            }
            nlohmann::json json;
            in >> json;
            settings_ = json.get<ClientSettings>();
        }
        catch (const std::exception &ex)
        {
            std::cerr << "Could not load configuration, creating new: " << ex.what() << std::endl;
            auto backup = path_;
            backup += ".old";
            std::error_code ec;
            std::filesystem::rename(path_, backup, ec);
            if (ec)
            {
                std::cerr << "Could not move " << path_.string() << " aside: " << ec.message() << std::endl;
            }
            reset_to_defaults();
        }
    }

    void SettingsStore::save() const
    {
        const auto dir = path_.parent_path();
        if (!dir.empty())
        {
            std::error_code ec;
            std::filesystem::create_directories(dir, ec);
        }
        std::ofstream out(path_, std::ios::trunc);
        if (!out.is_open())
        {
            throw std::runtime_error("Could not write settings to " + path_.string());
        }
        out << nlohmann::json(settings_).dump(4);
    }

    void SettingsStore::add_file(const std::string &entry)
    {
        if (std::find(settings_.files.begin(), settings_.files.end(), entry) == settings_.files.end())
        {
            settings_.files.push_back(entry);
        }
    }

    void SettingsStore::remove_file(const std::string &entry)
    {
        settings_.files.erase(std::remove(settings_.files.begin(), settings_.files.end(), entry),
                              settings_.files.end());
    }

    void SettingsStore::add_server(const std::string &entry)
    {
        if (std::find(settings_.servers.begin(), settings_.servers.end(), entry) == settings_.servers.end())
        {
            settings_.servers.push_back(entry);
        }
    }

    void SettingsStore::reset_to_defaults()
    {
        settings_ = ClientSettings{};
        recreated_ = true;
        save();
    }

} // namespace filepipe::client
