#pragma once

#include <memory>
#include <string>

namespace qm::remote { class Client; }

namespace qm::lifecycle {

// Built once at run start; only handed out as const afterwards.
class SessionState {
public:
    SessionState(std::shared_ptr<remote::Client> adminClient, std::shared_ptr<remote::Client> userClient,
                 std::string userId, bool userCreated);

    [[nodiscard]] remote::Client& adminClient() const { return *adminClient_; }
    [[nodiscard]] remote::Client& userClient() const { return *userClient_; }
    [[nodiscard]] const std::string& userId() const { return userId_; }

    // True when the run created the shared user and therefore owns its deletion.
    [[nodiscard]] bool userCreated() const { return userCreated_; }

private:
    const std::shared_ptr<remote::Client> adminClient_, userClient_;
    const std::string userId_;
    const bool userCreated_;
};

}
