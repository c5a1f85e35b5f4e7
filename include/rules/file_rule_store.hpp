#pragma once

#include "rules/irule_store.hpp"

#include <string>

namespace auditpipe {

// Rules from a TOML file, re-read on every call
class FileRuleStore : public IRuleStore {
public:
    explicit FileRuleStore(std::string path);

    RuleLoader::LoadResult list_active_rules() override;
    std::string name() const override { return "file:" + path_; }

private:
    std::string path_;
};

} // namespace auditpipe
