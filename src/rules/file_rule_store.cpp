#include "rules/file_rule_store.hpp"

namespace auditpipe {

FileRuleStore::FileRuleStore(std::string path)
    : path_(std::move(path)) {}

RuleLoader::LoadResult FileRuleStore::list_active_rules() {
    return RuleLoader::load_from_file(path_);
}

} // namespace auditpipe
