#pragma once

#include "core/types.hpp"

namespace auditpipe {

/**
 * @brief Default retention period (years) per event category.
 *
 * Applied only when the caller does not supply retentionYears.
 */
class RetentionPolicy {
public:
    [[nodiscard]] static constexpr int default_years(EventCategory category) noexcept {
        switch (category) {
            case EventCategory::FINANCIAL_TRANSACTION: return 10;
            case EventCategory::CREDIT_INQUIRY:        return 6;
            case EventCategory::KYC:                   return 7;
            case EventCategory::COMPLIANCE:            return 10;
            case EventCategory::SECURITY:              return 7;
            case EventCategory::AUTHENTICATION:        return 3;
            case EventCategory::DATA_ACCESS:           return 7;
            case EventCategory::PRIVACY:               return 7;
            case EventCategory::FRAUD_DETECTION:       return 10;
            default:                                   return kFallbackYears;
        }
    }

    static constexpr int kFallbackYears = 5;
};

} // namespace auditpipe
