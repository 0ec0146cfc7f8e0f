#pragma once

#include "remote/Session.hpp"

#include <memory>

namespace qm::remote::memory {

class MemoryBackend;

// Authenticates against a MemoryBackend on construction.
class MemorySession final : public Session {
public:
    MemorySession(std::shared_ptr<MemoryBackend> backend, const config::ConnectionConfig& config);

    std::shared_ptr<Client> adminClient() override;
    std::shared_ptr<Client> userClient(const std::string& userId) override;

    static SessionFactory factory(const std::shared_ptr<MemoryBackend>& backend);

private:
    std::shared_ptr<MemoryBackend> backend_;
};

}
