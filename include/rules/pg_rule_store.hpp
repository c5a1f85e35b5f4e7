#pragma once

#include "rules/irule_store.hpp"
#include "db/connection_pool.hpp"

#include <memory>

namespace auditpipe {

/**
 * @brief Rules from compliance.compliance_rules (is_active = true)
 *
 * Each row is rendered to JSON by the server and parsed with
 * RuleLoader::load_from_json().
 */
class PgRuleStore : public IRuleStore {
public:
    explicit PgRuleStore(std::shared_ptr<ConnectionPool> pool);

    RuleLoader::LoadResult list_active_rules() override;
    std::string name() const override { return "postgresql:compliance.compliance_rules"; }

private:
    std::shared_ptr<ConnectionPool> pool_;
};

} // namespace auditpipe
