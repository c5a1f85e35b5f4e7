#pragma once

#include <string>
#include <string_view>

namespace auditpipe {

enum class AccountStatus {
    ACTIVE,
    BLOCKED
};

[[nodiscard]] inline constexpr std::string_view account_status_to_string(AccountStatus s) {
    switch (s) {
        case AccountStatus::ACTIVE:  return "active";
        case AccountStatus::BLOCKED: return "blocked";
    }
    return "active";
}

/**
 * @brief Account side effects available to auto-responses
 *
 * Both operations are idempotent: blocking a blocked account or raising a
 * score that is already above the floor leaves the account unchanged.
 * Failures throw.
 */
class IAccountStore {
public:
    virtual ~IAccountStore() = default;

    virtual void set_account_status(const std::string& user_id, AccountStatus status) = 0;

    // risk_score = max(risk_score, floor)
    virtual void raise_risk_score(const std::string& user_id, int floor) = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace auditpipe
