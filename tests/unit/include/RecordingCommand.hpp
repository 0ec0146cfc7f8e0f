#pragma once

#include "commands/Command.hpp"
#include "remote/Client.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace qm::test {

using Journal = std::vector<std::string>;

// Writes "execute <label> as <principal>" / "dispose <label> as <principal>" to a shared journal.
class RecordingCommand final : public commands::DisposableCommand {
public:
    RecordingCommand(std::string label, std::shared_ptr<Journal> journal,
                     const commands::Scope scope = commands::Scope::Test,
                     const commands::AccessLevel accessLevel = commands::AccessLevel::User)
        : DisposableCommand(scope, accessLevel), label_(std::move(label)), journal_(std::move(journal)) {}

    [[nodiscard]] std::string name() const override { return "record " + label_; }

    commands::ResourceId execute(remote::Client& client) override {
        if (failExecute_) throw std::runtime_error("execute failed: " + label_);
        journal_->push_back("execute " + label_ + " as " + client.principal());
        return label_;
    }

    void dispose(remote::Client& client) override {
        if (failDispose_) throw std::runtime_error("dispose failed: " + label_);
        journal_->push_back("dispose " + label_ + " as " + client.principal());
    }

    RecordingCommand& failOnExecute() { failExecute_ = true; return *this; }
    RecordingCommand& failOnDispose() { failDispose_ = true; return *this; }

private:
    std::string label_;
    std::shared_ptr<Journal> journal_;
    bool failExecute_ = false, failDispose_ = false;
};

class RecordingCleanup final : public commands::CleanupCommand {
public:
    RecordingCleanup(std::string label, std::shared_ptr<Journal> journal,
                     const commands::AccessLevel accessLevel = commands::AccessLevel::User)
        : CleanupCommand(accessLevel), label_(std::move(label)), journal_(std::move(journal)) {}

    [[nodiscard]] std::string name() const override { return "cleanup " + label_; }

    commands::ResourceId execute(remote::Client& client) override {
        journal_->push_back("cleanup " + label_ + " as " + client.principal());
        return label_;
    }

private:
    std::string label_;
    std::shared_ptr<Journal> journal_;
};

inline std::shared_ptr<RecordingCommand> makeRecording(const std::string& label, const std::shared_ptr<Journal>& journal,
                                                       const commands::Scope scope = commands::Scope::Test,
                                                       const commands::AccessLevel accessLevel = commands::AccessLevel::User) {
    return std::make_shared<RecordingCommand>(label, journal, scope, accessLevel);
}

}
