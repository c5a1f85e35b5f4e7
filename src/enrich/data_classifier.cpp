#include "enrich/data_classifier.hpp"
#include "core/event_codec.hpp"
#include "core/utils.hpp"

namespace auditpipe {

namespace {

std::vector<std::string> lowered(const std::vector<std::string>& words) {
    std::vector<std::string> out;
    out.reserve(words.size());
    for (const auto& w : words) {
        if (!w.empty()) out.push_back(utils::to_lower(w));
    }
    return out;
}

bool contains_any(std::string_view text, const std::vector<std::string>& keywords) {
    for (const auto& kw : keywords) {
        if (text.find(kw) != std::string_view::npos) return true;
    }
    return false;
}

} // anonymous namespace

DataClassifier::DataClassifier() : DataClassifier(Config{}) {}

DataClassifier::DataClassifier(Config config)
    : personal_(lowered(config.personal_keywords)),
      sensitive_(lowered(config.sensitive_keywords)) {}

std::vector<std::string> DataClassifier::default_personal_keywords() {
    return {"curp", "rfc", "email", "phone", "address",
            "name", "birth", "ssn", "passport", "license"};
}

std::vector<std::string> DataClassifier::default_sensitive_keywords() {
    return {"account", "card", "balance", "transaction", "payment",
            "credit", "loan", "score", "income", "salary"};
}

DataClassifier::Classification DataClassifier::classify(const AuditEvent& event) const {
    return classify(EventCodec::to_json(event, /*include_pipeline_fields=*/false));
}

DataClassifier::Classification DataClassifier::classify(const JsonValue& wire) const {
    Classification result;
    scan(wire, result);
    return result;
}

void DataClassifier::scan(const JsonValue& node, Classification& out) const {
    if (out.personal && out.sensitive) return;

    if (node.is_object()) {
        for (const auto& [key, value] : node.items()) {
            check_text(key, out);
            scan(value, out);
            if (out.personal && out.sensitive) return;
        }
    } else if (node.is_array()) {
        for (size_t i = 0; i < node.size(); ++i) {
            scan(node[i], out);
            if (out.personal && out.sensitive) return;
        }
    } else if (node.is_string()) {
        check_text(node.get<std::string>(), out);
    }
}

void DataClassifier::check_text(std::string_view text, Classification& out) const {
    const std::string lower = utils::to_lower(text);
    if (!out.personal && contains_any(lower, personal_)) out.personal = true;
    if (!out.sensitive && contains_any(lower, sensitive_)) out.sensitive = true;
}

} // namespace auditpipe
