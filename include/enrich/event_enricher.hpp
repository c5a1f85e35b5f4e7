#pragma once

#include "core/types.hpp"
#include "enrich/data_classifier.hpp"

#include <string>

namespace auditpipe {

/**
 * @brief Stamps a raw event with identity, timestamp, retention class and
 *        data-sensitivity flags.
 *
 * Pure apart from the clock and the UUID generator.
 */
class EventEnricher {
public:
    struct Config {
        std::string server_id;
        std::string environment = "development";
        DataClassifier::Config classifier;
    };

    EventEnricher();
    explicit EventEnricher(Config config);

    /**
     * @brief Reject events missing eventType, eventCategory or description.
     * @throws ValidationError
     */
    static void validate(const AuditEvent& event);

    /**
     * @brief Validate, then fill identity, retention and sensitivity fields.
     *
     * Caller-supplied complianceFlags are discarded; the pipeline owns them.
     * @throws ValidationError
     */
    [[nodiscard]] AuditEvent enrich(AuditEvent raw) const;

private:
    Config config_;
    DataClassifier classifier_;
};

} // namespace auditpipe
