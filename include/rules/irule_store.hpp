#pragma once

#include "rules/rule_loader.hpp"

#include <string>

namespace auditpipe {

/**
 * @brief Source of compliance rules ("list active rules")
 *
 * Every call returns a full replacement snapshot. Failures are reported in
 * the result, never thrown.
 */
class IRuleStore {
public:
    virtual ~IRuleStore() = default;

    [[nodiscard]] virtual RuleLoader::LoadResult list_active_rules() = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace auditpipe
