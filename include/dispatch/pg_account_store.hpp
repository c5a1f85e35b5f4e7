#pragma once

#include "dispatch/iaccount_store.hpp"
#include "db/connection_pool.hpp"

#include <memory>

namespace auditpipe {

/**
 * @brief Account store on core.users
 */
class PgAccountStore : public IAccountStore {
public:
    explicit PgAccountStore(std::shared_ptr<ConnectionPool> pool);

    void set_account_status(const std::string& user_id, AccountStatus status) override;
    void raise_risk_score(const std::string& user_id, int floor) override;

    [[nodiscard]] std::string name() const override { return "postgresql:core.users"; }

private:
    void run(const char* sql, const DbParams& params);

    std::shared_ptr<ConnectionPool> pool_;
};

} // namespace auditpipe
