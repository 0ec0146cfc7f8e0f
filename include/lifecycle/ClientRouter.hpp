#pragma once

#include "commands/Command.hpp"

namespace qm::remote { class Client; }

namespace qm::lifecycle {

class SessionState;

class ClientRouter {
public:
    explicit ClientRouter(const SessionState& session) : session_(session) {}

    // Admin -> admin client; User and anything unrecognised -> user client.
    [[nodiscard]] remote::Client& resolve(commands::AccessLevel level) const;
    [[nodiscard]] remote::Client& resolve(const commands::Command& command) const { return resolve(command.accessLevel()); }

private:
    const SessionState& session_;
};

}
