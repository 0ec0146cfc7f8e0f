#pragma once

#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>

namespace qm::config {

struct ConnectionSourceConfig {
    std::string env_var = "INTEGRATION_TESTING_CONFIG";
    std::filesystem::path json_file = "config.json";
};

struct FixturesConfig {
    std::filesystem::path data_dir = ".";
    std::string small_file = "smalltest.pdf";
    std::string small_file_v2 = "smalltestV2.pdf";
};

struct UsersConfig {
    std::string name_prefix = "IT App User - ";
    bool delete_created_user = true;
    bool force_delete = true;   // owned content goes with the user
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum quartermaster = spdlog::level::info;   // Run start/end, fatal run errors
    spdlog::level::level_enum session       = spdlog::level::info;   // Client handles, shared user
    spdlog::level::level_enum scope         = spdlog::level::info;   // Scope entry/exit, drains, leaks
    spdlog::level::level_enum commands      = spdlog::level::info;   // Every execute and dispose
    spdlog::level::level_enum remote        = spdlog::level::warn;   // Collaborator diagnostics
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir = std::filesystem::temp_directory_path() / "quartermaster";
    LogLevelsConfig levels;
};

struct Config {
    ConnectionSourceConfig connection;
    FixturesConfig fixtures;
    UsersConfig users;
    LoggingConfig logging;
};

// Relative paths inside the file resolve against the file's directory.
Config loadConfig(const std::filesystem::path& path);

}
