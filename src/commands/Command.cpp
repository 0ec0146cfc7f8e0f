#include "commands/Command.hpp"

std::string qm::commands::to_string(const AccessLevel& level) {
    switch (level) {
        case AccessLevel::Admin: return "admin";
        case AccessLevel::User: return "user";
        default: return "unknown";
    }
}

std::string qm::commands::to_string(const Scope& scope) {
    switch (scope) {
        case Scope::Test: return "test";
        case Scope::Class: return "class";
        default: return "unknown";
    }
}
