#include "dispatch/pg_account_store.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace auditpipe {

namespace {

constexpr const char* kSetStatus =
    "UPDATE core.users SET status = $2, updated_at = NOW() "
    "WHERE id::text = $1 AND status IS DISTINCT FROM $2";

constexpr const char* kRaiseRiskScore =
    "UPDATE core.users SET risk_score = GREATEST(COALESCE(risk_score, 0), $2::int), "
    "updated_at = NOW() "
    "WHERE id::text = $1 AND COALESCE(risk_score, 0) < $2::int";

} // anonymous namespace

PgAccountStore::PgAccountStore(std::shared_ptr<ConnectionPool> pool)
    : pool_(std::move(pool)) {}

void PgAccountStore::run(const char* sql, const DbParams& params) {
    auto conn = pool_->acquire();
    if (!conn) {
        throw std::runtime_error(std::format("Account store '{}' unavailable: no database connection",
            pool_->name()));
    }
    const auto result = (*conn)->execute_params(sql, params);
    if (!result.success) {
        if (!(*conn)->is_connected()) conn->discard();
        throw std::runtime_error(std::format("Account update failed: {}",
            utils::trim(result.error_message)));
    }
}

void PgAccountStore::set_account_status(const std::string& user_id, AccountStatus status) {
    run(kSetStatus, {user_id, std::string(account_status_to_string(status))});
}

void PgAccountStore::raise_risk_score(const std::string& user_id, int floor) {
    run(kRaiseRiskScore, {user_id, std::to_string(floor)});
}

} // namespace auditpipe
