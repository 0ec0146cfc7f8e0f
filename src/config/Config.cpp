#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <yaml-cpp/yaml.h>
#include <stdexcept>

namespace qm::config {

static std::filesystem::path resolveAgainst(const std::filesystem::path& base, const std::filesystem::path& p) {
    if (p.empty() || p.is_absolute()) return p;
    return (base / p).lexically_normal();
}

Config loadConfig(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path))
        throw std::runtime_error("Harness config file not found: " + path.string());

    Config cfg;
    const YAML::Node root = YAML::LoadFile(path.string());

    if (auto node = root["connection"]) YAML::convert<ConnectionSourceConfig>::decode(node, cfg.connection);
    if (auto node = root["fixtures"]) YAML::convert<FixturesConfig>::decode(node, cfg.fixtures);
    if (auto node = root["users"]) YAML::convert<UsersConfig>::decode(node, cfg.users);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    const auto base = std::filesystem::absolute(path).parent_path();
    cfg.fixtures.data_dir = resolveAgainst(base, cfg.fixtures.data_dir);
    cfg.connection.json_file = resolveAgainst(base, cfg.connection.json_file);
    cfg.logging.log_dir = resolveAgainst(base, cfg.logging.log_dir);

    return cfg;
}

}
