#pragma once

#include "config/Config.hpp"

#include <mutex>

namespace qm::config {

class ConfigRegistry {
public:
    // An empty path keeps the built-in defaults.
    static void init(const std::filesystem::path& path = {});
    static const Config& get();

    [[nodiscard]] static bool isInitialized() { return initialized_; }

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
    static inline std::once_flag init_flag_;
};

} // namespace qm::config
