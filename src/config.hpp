#ifndef CONFIG_HPP
#define CONFIG_HPP

//internal
#include <string>
#include <fstream>
#include <filesystem>
#include <stdexcept>

//external
#include <boost/json.hpp>
#include <boost/log/trivial.hpp>
#include <magic_enum.hpp>

namespace json = boost::json;

namespace taxid::config
{
    // Path to the json config
    inline const std::string default_config_path{"../config.json"};

    inline std::string log_file_path{"taxid.log"};
    inline bool console_log_enabled{false};
    // Records with lower severity are filtered out
    inline boost::log::trivial::severity_level log_severity{boost::log::trivial::info};

    inline void init(const std::string& config_path = default_config_path)
    {
        std::ifstream config_file{config_path};

        if (!config_file.is_open())
        {
            throw std::invalid_argument{
                "Config file was not found at the specified path: " + 
                std::filesystem::absolute(config_path).string()};
        }
        
        std::string config_data;
        size_t config_file_size = std::filesystem::file_size(config_path);
        config_data.resize(config_file_size);

        config_file.read(config_data.data(), config_file_size);
        json::object config_json = json::parse(config_data).as_object();
        
        // Initialize config variables with values from json
        log_file_path = config_json.at("log_file_path").as_string();
        console_log_enabled = config_json.at("console_log_enabled").as_bool();

        const json::string& severity_name = config_json.at("log_severity").as_string();
        auto severity = magic_enum::enum_cast<boost::log::trivial::severity_level>(
            std::string_view{severity_name.data(), severity_name.size()});

        if (!severity)
        {
            throw std::invalid_argument{
                "Unknown log severity in the config: " + std::string{severity_name}};
        }

        log_severity = *severity;
    }
}

#endif
