#pragma once

#include "commands/Command.hpp"

#include <memory>
#include <string>
#include <vector>

namespace qm::lifecycle {

class ClientRouter;

// LIFO ledger of the reversible commands one scope instance has run.
class ScopeStack {
public:
    struct Entry {
        std::shared_ptr<commands::DisposableCommand> command;
        commands::ResourceId resourceId;
    };

    explicit ScopeStack(commands::Scope scope) : scope_(scope) {}

    [[nodiscard]] commands::Scope scope() const { return scope_; }
    [[nodiscard]] std::size_t size() const { return entries_.size(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }

    void push(std::shared_ptr<commands::DisposableCommand> command, commands::ResourceId resourceId);

    // Disposes and pops until empty, newest first. A failing dispose is rethrown
    // and stops the drain; the failing entry and everything below it stay put.
    void drain(const ClientRouter& router);

    // Resource ids, oldest first.
    [[nodiscard]] std::vector<commands::ResourceId> pendingResources() const;

private:
    commands::Scope scope_;
    std::vector<Entry> entries_;
};

}
