#pragma once

#include "db/idb_connection.hpp"
#include "db/iconnection_factory.hpp"

#include <libpq-fe.h>
#include <string>

namespace auditpipe {

/**
 * @brief PostgreSQL connection implementing IDbConnection
 *
 * All libpq calls are encapsulated here. Sessions run with TimeZone=UTC so
 * timestamptz values come back in a form utils::parse_timestamp() reads.
 */
class PgConnection : public IDbConnection {
public:
    /**
     * @brief Construct from existing PGconn* (takes ownership)
     */
    explicit PgConnection(PGconn* conn);
    ~PgConnection() override;

    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;

    DbResultSet execute(const std::string& sql) override;
    DbResultSet execute_params(const std::string& sql, const DbParams& params) override;
    bool is_healthy(const std::string& health_check_query) override;
    bool is_connected() const override;
    void close() override;

private:
    DbResultSet consume(PGresult* res);

    PGconn* conn_;
};

/**
 * @brief Creates PgConnection instances using PQconnectdb
 */
class PgConnectionFactory : public IConnectionFactory {
public:
    std::unique_ptr<IDbConnection> create(const std::string& connection_string) override;
};

} // namespace auditpipe
