#pragma once

#include <stdexcept>
#include <string>

namespace qm::remote {

// Failure reported by the remote service (or a stand-in for it).
class ApiError : public std::runtime_error {
public:
    ApiError(const int status, std::string code, const std::string& message)
        : std::runtime_error("[" + std::to_string(status) + " " + code + "] " + message),
          status_(status), code_(std::move(code)) {}

    [[nodiscard]] int status() const { return status_; }
    [[nodiscard]] const std::string& code() const { return code_; }

    static ApiError NotFound(const std::string& what) { return {404, "not_found", what + " not found"}; }
    static ApiError Forbidden(const std::string& what) { return {403, "access_denied_insufficient_permissions", what}; }
    static ApiError Conflict(const std::string& what) { return {409, "item_name_in_use", what}; }
    static ApiError Unauthorized(const std::string& what) { return {401, "unauthorized", what}; }

private:
    int status_;
    std::string code_;
};

}
