#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace auditpipe {

/**
 * @brief Result of one statement
 *
 * Owns its data (copied out of the native result handle). SQL NULL cells are
 * std::nullopt.
 */
struct DbResultSet {
    bool success = false;
    std::string error_message;

    // For SELECT / RETURNING
    std::vector<std::string> column_names;
    std::vector<std::vector<std::optional<std::string>>> rows;

    // For DML
    uint64_t affected_rows = 0;

    bool has_rows = false;
};

// Positional statement parameters ($1, $2, ...); std::nullopt binds SQL NULL
using DbParams = std::vector<std::optional<std::string>>;

/**
 * @brief Abstract database connection
 *
 * Wraps a single native connection handle. Implementations are not
 * thread-safe; thread safety comes from the pool.
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    [[nodiscard]] virtual DbResultSet execute(const std::string& sql) = 0;

    /**
     * @brief Execute with out-of-line parameters (text format)
     */
    [[nodiscard]] virtual DbResultSet execute_params(const std::string& sql,
                                                     const DbParams& params) = 0;

    /**
     * @brief Check if the connection is healthy
     * @param health_check_query SQL to run (e.g., "SELECT 1")
     */
    [[nodiscard]] virtual bool is_healthy(const std::string& health_check_query) = 0;

    [[nodiscard]] virtual bool is_connected() const = 0;

    virtual void close() = 0;
};

} // namespace auditpipe
