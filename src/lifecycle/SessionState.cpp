#include "lifecycle/SessionState.hpp"

#include <stdexcept>

using namespace qm::lifecycle;

SessionState::SessionState(std::shared_ptr<remote::Client> adminClient, std::shared_ptr<remote::Client> userClient,
                           std::string userId, const bool userCreated)
    : adminClient_(std::move(adminClient)),
      userClient_(std::move(userClient)),
      userId_(std::move(userId)),
      userCreated_(userCreated) {
    if (!adminClient_) throw std::runtime_error("[SessionState] Admin client is null");
    if (!userClient_) throw std::runtime_error("[SessionState] User client is null");
    if (userId_.empty()) throw std::runtime_error("[SessionState] User id is empty");
}
