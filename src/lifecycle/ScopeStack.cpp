#include "lifecycle/ScopeStack.hpp"
#include "lifecycle/ClientRouter.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

using namespace qm::lifecycle;
using namespace qm::commands;

void ScopeStack::push(std::shared_ptr<DisposableCommand> command, ResourceId resourceId) {
    if (!command) throw std::runtime_error("[ScopeStack] Cannot push a null command");
    if (command->scope() != scope_)
        throw std::runtime_error("[ScopeStack] " + to_string(command->scope()) + "-scoped command pushed onto "
                                 + to_string(scope_) + " stack");

    log::Registry::scope()->debug("[ScopeStack] {}: tracking {} -> {} (depth {})",
                                  to_string(scope_), command->name(), resourceId, entries_.size() + 1);
    entries_.push_back(Entry{std::move(command), std::move(resourceId)});
}

void ScopeStack::drain(const ClientRouter& router) {
    const auto total = entries_.size();
    if (total > 0) log::Registry::scope()->debug("[ScopeStack] Draining {} {}-scoped resource(s)", total, to_string(scope_));

    while (!entries_.empty()) {
        const auto& entry = entries_.back();

        try {
            entry.command->dispose(router.resolve(*entry.command));
        } catch (const std::exception& e) {
            log::Registry::scope()->error("[ScopeStack] Failed to dispose {} -> {}: {} ({} resource(s) left undisposed)",
                                          entry.command->name(), entry.resourceId, e.what(), entries_.size());
            throw;
        }

        log::Registry::commands()->debug("[ScopeStack] Disposed {} -> {} as {}", entry.command->name(),
                                         entry.resourceId, to_string(entry.command->accessLevel()));
        entries_.pop_back();
    }
}

std::vector<ResourceId> ScopeStack::pendingResources() const {
    std::vector<ResourceId> ids;
    ids.reserve(entries_.size());
    for (const auto& e : entries_) ids.push_back(e.resourceId);
    return ids;
}
