#include "db/postgresql/pg_connection.hpp"
#include "core/utils.hpp"

#include <cstring>
#include <format>

namespace auditpipe {

// ============================================================================
// PgConnection
// ============================================================================

PgConnection::PgConnection(PGconn* conn)
    : conn_(conn) {}

PgConnection::~PgConnection() {
    close();
}

DbResultSet PgConnection::execute(const std::string& sql) {
    if (!conn_) {
        DbResultSet result;
        result.error_message = "Connection is closed";
        return result;
    }
    return consume(PQexec(conn_, sql.c_str()));
}

DbResultSet PgConnection::execute_params(const std::string& sql, const DbParams& params) {
    if (!conn_) {
        DbResultSet result;
        result.error_message = "Connection is closed";
        return result;
    }

    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& p : params) {
        values.push_back(p ? p->c_str() : nullptr);
    }

    PGresult* res = PQexecParams(conn_, sql.c_str(),
        static_cast<int>(values.size()),
        nullptr,            // server infers types
        values.data(),
        nullptr, nullptr,   // text format
        0);
    return consume(res);
}

DbResultSet PgConnection::consume(PGresult* res) {
    DbResultSet result;
    if (!res) {
        result.error_message = PQerrorMessage(conn_);
        return result;
    }

    const ExecStatusType status = PQresultStatus(res);
    if (status == PGRES_TUPLES_OK) {
        result.success = true;
        result.has_rows = true;

        const int ncols = PQnfields(res);
        for (int i = 0; i < ncols; ++i) {
            result.column_names.emplace_back(PQfname(res, i));
        }

        const int nrows = PQntuples(res);
        result.rows.reserve(static_cast<size_t>(nrows));
        for (int i = 0; i < nrows; ++i) {
            std::vector<std::optional<std::string>> row;
            row.reserve(static_cast<size_t>(ncols));
            for (int j = 0; j < ncols; ++j) {
                if (PQgetisnull(res, i, j)) {
                    row.emplace_back(std::nullopt);
                } else {
                    row.emplace_back(std::string(PQgetvalue(res, i, j),
                        static_cast<size_t>(PQgetlength(res, i, j))));
                }
            }
            result.rows.push_back(std::move(row));
        }
    } else if (status == PGRES_COMMAND_OK) {
        result.success = true;
        const char* affected = PQcmdTuples(res);
        if (affected && std::strlen(affected) > 0) {
            result.affected_rows = utils::parse_int<uint64_t>(affected);
        }
    } else {
        const char* msg = PQresultErrorMessage(res);
        result.error_message = (msg && *msg) ? msg : PQerrorMessage(conn_);
    }

    PQclear(res);
    return result;
}

bool PgConnection::is_healthy(const std::string& health_check_query) {
    if (!conn_ || PQstatus(conn_) != CONNECTION_OK) {
        return false;
    }

    PGresult* res = PQexec(conn_, health_check_query.c_str());
    if (!res) {
        return false;
    }

    const ExecStatusType status = PQresultStatus(res);
    PQclear(res);
    return status == PGRES_TUPLES_OK || status == PGRES_COMMAND_OK;
}

bool PgConnection::is_connected() const {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

void PgConnection::close() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

// ============================================================================
// PgConnectionFactory
// ============================================================================

std::unique_ptr<IDbConnection> PgConnectionFactory::create(
    const std::string& connection_string) {

    PGconn* conn = PQconnectdb(connection_string.c_str());

    if (!conn) {
        utils::log::error("Failed to allocate PGconn");
        return nullptr;
    }

    if (PQstatus(conn) != CONNECTION_OK) {
        utils::log::error(std::format("PostgreSQL connect failed: {}", PQerrorMessage(conn)));
        PQfinish(conn);
        return nullptr;
    }

    auto pg = std::make_unique<PgConnection>(conn);
    const auto tz = pg->execute("SET TIME ZONE 'UTC'");
    if (!tz.success) {
        utils::log::warn(std::format("Could not set session time zone: {}", tz.error_message));
    }
    return pg;
}

} // namespace auditpipe
