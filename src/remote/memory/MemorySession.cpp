#include "remote/memory/MemorySession.hpp"
#include "remote/memory/MemoryBackend.hpp"
#include "remote/memory/MemoryClient.hpp"
#include "config/ConnectionConfig.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

using namespace qm::remote;
using namespace qm::remote::memory;

MemorySession::MemorySession(std::shared_ptr<MemoryBackend> backend, const config::ConnectionConfig& config)
    : backend_(std::move(backend)) {
    if (!backend_) throw std::runtime_error("[MemorySession] Backend is null");
    backend_->authenticate(config);
    log::Registry::remote()->debug("[MemorySession] Authenticated enterprise {}", config.enterprise_id);
}

std::shared_ptr<Client> MemorySession::adminClient() {
    return std::make_shared<MemoryClient>(backend_, backend_->adminId());
}

std::shared_ptr<Client> MemorySession::userClient(const std::string& userId) {
    backend_->issueUserToken(userId);
    return std::make_shared<MemoryClient>(backend_, userId);
}

SessionFactory MemorySession::factory(const std::shared_ptr<MemoryBackend>& backend) {
    return [backend](const config::ConnectionConfig& config) -> std::unique_ptr<Session> {
        return std::make_unique<MemorySession>(backend, config);
    };
}
