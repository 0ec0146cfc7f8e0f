#pragma once

#include "config/Config.hpp"
#include "config/ConnectionConfig.hpp"
#include "remote/Session.hpp"

#include <memory>
#include <optional>
#include <gtest/gtest.h>

namespace qm::lifecycle { class LifecycleController; }
namespace qm::resources { class Resources; }

namespace qm::harness {

/**
 * Process-wide run scope. Register it with ::testing::AddGlobalTestEnvironment();
 * SetUp() starts the run, TearDown() ends it. A run that cannot start is a fatal
 * failure, so no test body executes against a half-built session.
 *
 * Only one environment may be registered at a time; fixtures reach it through
 * instance().
 */
class IntegrationEnvironment : public ::testing::Environment {
public:
    // Connection settings are loaded from config.connection when the run starts.
    IntegrationEnvironment(remote::SessionFactory sessionFactory, config::Config config);

    IntegrationEnvironment(remote::SessionFactory sessionFactory, config::ConnectionConfig connection, config::Config config);

    ~IntegrationEnvironment() override;

    void SetUp() override;
    void TearDown() override;

    static IntegrationEnvironment& instance();

    [[nodiscard]] lifecycle::LifecycleController& controller() const { return *controller_; }
    [[nodiscard]] resources::Resources& resources() const { return *resources_; }
    [[nodiscard]] const config::Config& config() const { return config_; }

private:
    config::Config config_;
    std::optional<config::ConnectionConfig> connection_;
    std::unique_ptr<lifecycle::LifecycleController> controller_;
    std::unique_ptr<resources::Resources> resources_;

    static inline IntegrationEnvironment* active_ = nullptr;
};

}
