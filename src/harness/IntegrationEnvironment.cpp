#include "harness/IntegrationEnvironment.hpp"
#include "lifecycle/LifecycleController.hpp"
#include "resources/Resources.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

using namespace qm::harness;

IntegrationEnvironment::IntegrationEnvironment(remote::SessionFactory sessionFactory, config::Config config)
    : config_(std::move(config)),
      controller_(std::make_unique<lifecycle::LifecycleController>(std::move(sessionFactory), config_.users)),
      resources_(std::make_unique<resources::Resources>(*controller_, config_.fixtures)) {
    if (active_) throw std::runtime_error("[IntegrationEnvironment] An integration environment is already registered");
    active_ = this;
}

IntegrationEnvironment::IntegrationEnvironment(remote::SessionFactory sessionFactory, config::ConnectionConfig connection,
                                               config::Config config)
    : IntegrationEnvironment(std::move(sessionFactory), std::move(config)) {
    connection_ = std::move(connection);
}

IntegrationEnvironment::~IntegrationEnvironment() {
    if (active_ == this) active_ = nullptr;
}

IntegrationEnvironment& IntegrationEnvironment::instance() {
    if (!active_) throw std::runtime_error("[IntegrationEnvironment] No integration environment registered");
    return *active_;
}

void IntegrationEnvironment::SetUp() {
    try {
        if (connection_) controller_->startRun(*connection_);
        else controller_->startRun(config_.connection);
    } catch (const std::exception& e) {
        log::Registry::quartermaster()->critical("[IntegrationEnvironment] Unable to start integration run: {}", e.what());
        FAIL() << "Unable to start integration run: " << e.what();
    }
}

void IntegrationEnvironment::TearDown() {
    controller_->endRun();
}
