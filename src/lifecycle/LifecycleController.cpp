#include "lifecycle/LifecycleController.hpp"
#include "lifecycle/SessionState.hpp"
#include "lifecycle/ClientRouter.hpp"
#include "lifecycle/ScopeStack.hpp"
#include "config/ConnectionConfig.hpp"
#include "remote/Client.hpp"
#include "log/Registry.hpp"
#include "util/naming.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <stdexcept>

using namespace qm::lifecycle;
using namespace qm::commands;

std::string qm::lifecycle::to_string(const LifecycleState& state) {
    switch (state) {
        case LifecycleState::Uninitialized: return "uninitialized";
        case LifecycleState::RunActive: return "run active";
        case LifecycleState::ClassActive: return "class active";
        case LifecycleState::TestActive: return "test active";
        case LifecycleState::TornDown: return "torn down";
        default: return "unknown";
    }
}

LifecycleController::LifecycleController(remote::SessionFactory sessionFactory, config::UsersConfig users)
    : sessionFactory_(std::move(sessionFactory)), users_(std::move(users)) {
    if (!sessionFactory_) throw std::runtime_error("[LifecycleController] Session factory is empty");
}

LifecycleController::~LifecycleController() = default;

// ---------- Run

void LifecycleController::startRun(const config::ConnectionSourceConfig& source) {
    requireState(LifecycleState::Uninitialized, "start run");
    startRun(config::ConnectionConfig::load(source));
}

void LifecycleController::startRun(const config::ConnectionConfig& connection) {
    requireState(LifecycleState::Uninitialized, "start run");
    log::Registry::quartermaster()->info("[LifecycleController] Starting run for enterprise {}", connection.enterprise_id);

    auto remoteSession = sessionFactory_(connection);
    if (!remoteSession) throw std::runtime_error("[LifecycleController] Session factory returned no session");

    const auto admin = remoteSession->adminClient();
    if (!admin) throw std::runtime_error("[LifecycleController] Session returned no admin client");

    std::string userId;
    bool userCreated = false;

    if (connection.hasUserId()) {
        userId = *connection.user_id;
        log::Registry::session()->info("[LifecycleController] Using configured user {}", userId);
    } else {
        const auto user = admin->createEnterpriseUser(remote::model::UserRequest{
            .name = users_.name_prefix + util::generateUUIDv4(),
            .login = {},
            .is_platform_access_only = true
        });
        userId = user.id;
        userCreated = true;
        log::Registry::session()->info("[LifecycleController] Created run user {} ({})", user.id, user.name);
    }

    try {
        session_ = std::make_unique<const SessionState>(admin, remoteSession->userClient(userId), userId, userCreated);
    } catch (const std::exception& e) {
        log::Registry::quartermaster()->critical("[LifecycleController] Run start failed: {}", e.what());
        if (userCreated) deleteRunUser(*admin, userId);
        throw;
    }

    remoteSession_ = std::move(remoteSession);
    router_ = std::make_unique<ClientRouter>(*session_);
    state_ = LifecycleState::RunActive;
    log::Registry::quartermaster()->info("[LifecycleController] Run started (admin {}, user {})",
                                         session_->adminClient().principal(), userId);
}

void LifecycleController::endRun() {
    if (state_ == LifecycleState::Uninitialized) {
        log::Registry::quartermaster()->warn("[LifecycleController] Run ended before it started; nothing to tear down");
        state_ = LifecycleState::TornDown;
        return;
    }
    if (state_ == LifecycleState::TornDown) {
        log::Registry::quartermaster()->warn("[LifecycleController] Run already torn down");
        return;
    }

    if (state_ != LifecycleState::RunActive)
        log::Registry::quartermaster()->warn("[LifecycleController] Ending run while {}", to_string(state_));

    discardStack(testStack_);
    discardStack(classStack_);

    if (session_->userCreated()) {
        if (users_.delete_created_user) deleteRunUser(session_->adminClient(), session_->userId());
        else log::Registry::session()->info("[LifecycleController] Keeping run user {}", session_->userId());
    }

    state_ = LifecycleState::TornDown;
    log::Registry::quartermaster()->info("[LifecycleController] Run torn down");
}

void LifecycleController::deleteRunUser(remote::Client& admin, const std::string& userId) const {
    try {
        admin.deleteEnterpriseUser(userId, false, users_.force_delete);
        log::Registry::session()->info("[LifecycleController] Deleted run user {}", userId);
    } catch (const std::exception& e) {
        // fails while the user still owns content
        log::Registry::session()->error("[LifecycleController] Failed to delete run user {}: {}", userId, e.what());
    }
}

// ---------- Class / test scopes

void LifecycleController::startClass() {
    requireState(LifecycleState::RunActive, "start class");
    discardStack(testStack_);
    resetStack(classStack_, Scope::Class);
    state_ = LifecycleState::ClassActive;
    log::Registry::scope()->debug("[LifecycleController] Class scope opened");
}

void LifecycleController::endClass() {
    requireState(LifecycleState::ClassActive, "end class");
    state_ = LifecycleState::RunActive;
    classStack_->drain(*router_);
    classStack_.reset();
    log::Registry::scope()->debug("[LifecycleController] Class scope closed");
}

void LifecycleController::startTest() {
    requireState(LifecycleState::ClassActive, "start test");
    resetStack(testStack_, Scope::Test);
    state_ = LifecycleState::TestActive;
    log::Registry::scope()->debug("[LifecycleController] Test scope opened");
}

void LifecycleController::endTest() {
    requireState(LifecycleState::TestActive, "end test");
    state_ = LifecycleState::ClassActive;
    testStack_->drain(*router_);
    testStack_.reset();
    log::Registry::scope()->debug("[LifecycleController] Test scope closed");
}

void LifecycleController::discardStack(std::unique_ptr<ScopeStack>& slot) {
    if (slot && !slot->empty()) {
        log::Registry::scope()->warn("[LifecycleController] Discarding {} undisposed {}-scoped resource(s): {}",
                                     slot->size(), to_string(slot->scope()), fmt::join(slot->pendingResources(), ", "));
    }
    slot.reset();
}

void LifecycleController::resetStack(std::unique_ptr<ScopeStack>& slot, const Scope scope) {
    discardStack(slot);
    slot = std::make_unique<ScopeStack>(scope);
}

// ---------- Execution

ResourceId LifecycleController::execute(const std::shared_ptr<DisposableCommand>& command) {
    if (!command) throw std::runtime_error("[LifecycleController] Cannot execute a null command");
    requireOpenScope(command->scope(), command->name());

    auto& client = router_->resolve(*command);
    log::Registry::commands()->debug("[LifecycleController] Executing {} ({}-scoped) as {}", command->name(),
                                     to_string(command->scope()), to_string(command->accessLevel()));

    auto resourceId = command->execute(client);
    stackFor(command->scope())->push(command, resourceId);
    return resourceId;
}

ResourceId LifecycleController::execute(CleanupCommand& command) {
    if (!router_ || state_ == LifecycleState::TornDown)
        throw std::runtime_error("[LifecycleController] Cannot run " + command.name() + " while " + to_string(state_));

    log::Registry::commands()->debug("[LifecycleController] Executing {} as {} (untracked)", command.name(),
                                     to_string(command.accessLevel()));
    return command.execute(router_->resolve(command));
}

// ---------- Accessors

const SessionState& LifecycleController::session() const {
    if (!session_) throw std::runtime_error("[LifecycleController] Session accessed before run start");
    return *session_;
}

const ClientRouter& LifecycleController::router() const {
    if (!router_) throw std::runtime_error("[LifecycleController] Router accessed before run start");
    return *router_;
}

std::size_t LifecycleController::pending(const Scope scope) const {
    const auto& slot = stackFor(scope);
    return slot ? slot->size() : 0;
}

std::vector<ResourceId> LifecycleController::pendingResources(const Scope scope) const {
    const auto& slot = stackFor(scope);
    return slot ? slot->pendingResources() : std::vector<ResourceId>{};
}

// ---------- Guards

void LifecycleController::requireState(const LifecycleState expected, const std::string_view transition) const {
    if (state_ != expected)
        throw std::runtime_error(fmt::format("[LifecycleController] Cannot {} while {} (expected {})",
                                             transition, to_string(state_), to_string(expected)));
}

void LifecycleController::requireOpenScope(const Scope scope, const std::string_view what) const {
    const bool open = scope == Scope::Test
        ? state_ == LifecycleState::TestActive
        : state_ == LifecycleState::ClassActive || state_ == LifecycleState::TestActive;
    if (!open)
        throw std::runtime_error(fmt::format("[LifecycleController] Cannot run {}-scoped {} while {}",
                                             to_string(scope), what, to_string(state_)));
}

const std::unique_ptr<ScopeStack>& LifecycleController::stackFor(const Scope scope) const {
    return scope == Scope::Test ? testStack_ : classStack_;
}
