#include "lifecycle/ClientRouter.hpp"
#include "lifecycle/SessionState.hpp"

using namespace qm::lifecycle;
using namespace qm::commands;

qm::remote::Client& ClientRouter::resolve(const AccessLevel level) const {
    switch (level) {
        case AccessLevel::Admin: return session_.adminClient();
        case AccessLevel::User: return session_.userClient();
        default: return session_.userClient();
    }
}
