#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace qm::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<ConnectionSourceConfig> {
    static Node encode(const ConnectionSourceConfig& rhs) {
        Node node;
        node["env_var"] = rhs.env_var;
        node["json_file"] = rhs.json_file.string();
        return node;
    }

    static bool decode(const Node& node, ConnectionSourceConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.env_var = node["env_var"].as<std::string>("INTEGRATION_TESTING_CONFIG");
        rhs.json_file = node["json_file"].as<std::string>("config.json");
        return true;
    }
};

template<>
struct convert<FixturesConfig> {
    static Node encode(const FixturesConfig& rhs) {
        Node node;
        node["data_dir"] = rhs.data_dir.string();
        node["small_file"] = rhs.small_file;
        node["small_file_v2"] = rhs.small_file_v2;
        return node;
    }

    static bool decode(const Node& node, FixturesConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.data_dir = node["data_dir"].as<std::string>(".");
        rhs.small_file = node["small_file"].as<std::string>("smalltest.pdf");
        rhs.small_file_v2 = node["small_file_v2"].as<std::string>("smalltestV2.pdf");
        return true;
    }
};

template<>
struct convert<UsersConfig> {
    static Node encode(const UsersConfig& rhs) {
        Node node;
        node["name_prefix"] = rhs.name_prefix;
        node["delete_created_user"] = rhs.delete_created_user;
        node["force_delete"] = rhs.force_delete;
        return node;
    }

    static bool decode(const Node& node, UsersConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.name_prefix = node["name_prefix"].as<std::string>("IT App User - ");
        rhs.delete_created_user = node["delete_created_user"].as<bool>(true);
        rhs.force_delete = node["force_delete"].as<bool>(true);
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["quartermaster"] = to_std_string(spdlog::level::to_string_view(rhs.quartermaster));
        node["session"]       = to_std_string(spdlog::level::to_string_view(rhs.session));
        node["scope"]         = to_std_string(spdlog::level::to_string_view(rhs.scope));
        node["commands"]      = to_std_string(spdlog::level::to_string_view(rhs.commands));
        node["remote"]        = to_std_string(spdlog::level::to_string_view(rhs.remote));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.quartermaster = spdlog::level::from_str(node["quartermaster"].as<std::string>("info"));
        rhs.session = spdlog::level::from_str(node["session"].as<std::string>("info"));
        rhs.scope = spdlog::level::from_str(node["scope"].as<std::string>("info"));
        rhs.commands = spdlog::level::from_str(node["commands"].as<std::string>("info"));
        rhs.remote = spdlog::level::from_str(node["remote"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("debug"));
        if (const auto sub = node["subsystem_levels"]) rhs.subsystem_levels = sub.as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        if (const auto dir = node["log_dir"]) rhs.log_dir = dir.as<std::string>();
        if (const auto levels = node["levels"]) rhs.levels = levels.as<LogLevelsConfig>();
        return true;
    }
};

}
