#pragma once

#include <string>

namespace qm::remote { class Client; }

namespace qm::commands {

using ResourceId = std::string;

// Which credentialed client runs a command.
enum class AccessLevel { Admin, User };

// Which lifetime owns a reversible command once it has run.
enum class Scope { Test, Class };

std::string to_string(const AccessLevel& level);
std::string to_string(const Scope& scope);

class Command {
public:
    explicit Command(const AccessLevel accessLevel = AccessLevel::User) : accessLevel_(accessLevel) {}
    virtual ~Command() = default;

    [[nodiscard]] AccessLevel accessLevel() const { return accessLevel_; }

    // Short label for logs, e.g. "create folder".
    [[nodiscard]] virtual std::string name() const = 0;

    virtual ResourceId execute(remote::Client& client) = 0;

private:
    const AccessLevel accessLevel_;
};

// One-way work (plain deletes). Executed, never tracked.
class CleanupCommand : public Command {
public:
    using Command::Command;
};

// Work that leaves something behind and knows how to take it back.
class DisposableCommand : public Command {
public:
    explicit DisposableCommand(const Scope scope = Scope::Test, const AccessLevel accessLevel = AccessLevel::User)
        : Command(accessLevel), scope_(scope) {}

    [[nodiscard]] Scope scope() const { return scope_; }

    virtual void dispose(remote::Client& client) = 0;

private:
    const Scope scope_;
};

}
