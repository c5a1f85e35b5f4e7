#pragma once

#include "db/idb_connection.hpp"

#include <memory>
#include <string>

namespace auditpipe {

/**
 * @brief Opens connections for ConnectionPool
 *
 * The audit, rule and account stores share one pool, so one factory serves
 * all three. Tests substitute an in-memory factory.
 */
class IConnectionFactory {
public:
    virtual ~IConnectionFactory() = default;

    /**
     * @param connection_string Backend-specific connection string
     * @return New connection, or nullptr on failure
     */
    [[nodiscard]] virtual std::unique_ptr<IDbConnection> create(
        const std::string& connection_string) = 0;
};

} // namespace auditpipe
