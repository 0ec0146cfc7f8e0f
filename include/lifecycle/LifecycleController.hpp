#pragma once

#include "commands/Command.hpp"
#include "config/Config.hpp"
#include "remote/Session.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace qm::config { struct ConnectionConfig; }

namespace qm::lifecycle {

class SessionState;
class ClientRouter;
class ScopeStack;

enum class LifecycleState { Uninitialized, RunActive, ClassActive, TestActive, TornDown };

std::string to_string(const LifecycleState& state);

/**
 * Drives the three nested lifetimes of an integration run:
 *
 *   Uninitialized -> RunActive -> (ClassActive -> TestActive -> ClassActive)* -> RunActive -> TornDown
 *
 * startRun() builds the session (admin + user clients, shared user) once. Every
 * class and test start allocates a fresh stack; the matching end drains it newest
 * first. Transitions out of order throw std::runtime_error.
 *
 * Failure policy: run start, execute and drain failures propagate untouched. The
 * only swallowed failure is deleting the run's own user in endRun(), which is
 * logged on the session logger.
 */
class LifecycleController {
public:
    explicit LifecycleController(remote::SessionFactory sessionFactory, config::UsersConfig users = {});
    ~LifecycleController();

    LifecycleController(const LifecycleController&) = delete;
    LifecycleController& operator=(const LifecycleController&) = delete;

    void startRun(const config::ConnectionConfig& connection);
    void startRun(const config::ConnectionSourceConfig& source);
    void endRun();

    void startClass();
    void endClass();

    void startTest();
    void endTest();

    // Runs the command with the client its access level calls for and tracks it
    // on the stack of its scope. Nothing is tracked when execute throws.
    commands::ResourceId execute(const std::shared_ptr<commands::DisposableCommand>& command);

    // Runs one-way work; never tracked.
    commands::ResourceId execute(commands::CleanupCommand& command);

    [[nodiscard]] LifecycleState state() const { return state_; }
    [[nodiscard]] const SessionState& session() const;
    [[nodiscard]] const ClientRouter& router() const;

    // Entries currently tracked for a scope (0 when that scope is not open).
    [[nodiscard]] std::size_t pending(commands::Scope scope) const;
    [[nodiscard]] std::vector<commands::ResourceId> pendingResources(commands::Scope scope) const;

private:
    remote::SessionFactory sessionFactory_;
    config::UsersConfig users_;
    LifecycleState state_{LifecycleState::Uninitialized};

    std::unique_ptr<remote::Session> remoteSession_;
    std::unique_ptr<const SessionState> session_;
    std::unique_ptr<ClientRouter> router_;

    std::unique_ptr<ScopeStack> classStack_, testStack_;

    void requireState(LifecycleState expected, std::string_view transition) const;
    void requireOpenScope(commands::Scope scope, std::string_view what) const;
    [[nodiscard]] const std::unique_ptr<ScopeStack>& stackFor(commands::Scope scope) const;

    // Leftovers (failed drain, scope never closed) are logged and dropped, never carried into the next scope.
    static void discardStack(std::unique_ptr<ScopeStack>& slot);
    static void resetStack(std::unique_ptr<ScopeStack>& slot, commands::Scope scope);

    void deleteRunUser(remote::Client& admin, const std::string& userId) const;
};

}
