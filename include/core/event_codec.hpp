#pragma once

#include "core/json.hpp"
#include "core/types.hpp"

namespace auditpipe {

/**
 * @brief AuditEvent <-> camelCase wire form (JSON).
 *
 * The wire form is what callers POST, what rule conditions address by dotted
 * path, and what the stores persist. Absent optionals are omitted.
 */
class EventCodec {
public:
    enum class Source {
        CALLER,     // untrusted input: pipeline-owned fields are ignored
        STORED      // a record written by this pipeline
    };

    /**
     * @param include_pipeline_fields When false, omits the fields the pipeline
     *        computes (complianceFlags, personal/sensitive flags, serverId,
     *        environment, recordedAt).
     */
    [[nodiscard]] static JsonValue to_json(const AuditEvent& event,
                                           bool include_pipeline_fields = true);

    /**
     * @brief Decode a wire object.
     * @throws ValidationError when the input is not an object or a field has
     *         the wrong type or an unknown enumeration value
     */
    [[nodiscard]] static AuditEvent from_json(const JsonValue& json, Source source);

    [[nodiscard]] static JsonValue violation_to_json(const Violation& violation);
};

} // namespace auditpipe
