#include "db/postgresql/pg_connection.hpp"
#include "core/utils.hpp"
#include <cstring>
#include <format>

namespace pgtenant {

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
        DbResultSet rs;
        rs.error_message = "Connection is null";
        return rs;
    }
    return consume_result(PQexec(conn_, sql.c_str()));
}

DbResultSet PgConnection::execute(const std::string& sql, const std::vector<std::string>& params) {
    if (!conn_) {
        DbResultSet rs;
        rs.error_message = "Connection is null";
        return rs;
    }

    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& p : params) {
        values.push_back(p.c_str());
    }

    // Text-format parameters, server infers types
    PGresult* res = PQexecParams(conn_, sql.c_str(), static_cast<int>(values.size()),
                                 nullptr, values.data(), nullptr, nullptr, 0);
    return consume_result(res);
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

    return (status == PGRES_TUPLES_OK || status == PGRES_COMMAND_OK);
}

bool PgConnection::is_connected() const {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

bool PgConnection::in_transaction() const {
    if (!conn_) return false;
    const PGTransactionStatusType ts = PQtransactionStatus(conn_);
    return ts == PQTRANS_INTRANS || ts == PQTRANS_INERROR;
}

void PgConnection::close() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

DbResultSet PgConnection::consume_result(PGresult* res) {
    if (!res) {
        DbResultSet rs;
        rs.error_message = PQerrorMessage(conn_);
        return rs;
    }

    const ExecStatusType status = PQresultStatus(res);

    if (status == PGRES_TUPLES_OK) {
        auto result = process_tuples_result(res);
        PQclear(res);
        return result;
    }

    if (status == PGRES_COMMAND_OK || status == PGRES_EMPTY_QUERY) {
        auto result = process_command_result(res);
        PQclear(res);
        return result;
    }

    // Error case
    DbResultSet result;
    result.error_message = PQresultErrorMessage(res);
    if (const char* state = PQresultErrorField(res, PG_DIAG_SQLSTATE)) {
        result.sql_state = state;
    }
    PQclear(res);
    return result;
}

DbResultSet PgConnection::process_tuples_result(PGresult* res) {
    DbResultSet result;
    result.success = true;
    result.has_rows = true;

    const int ncols = PQnfields(res);
    for (int i = 0; i < ncols; i++) {
        result.column_names.push_back(PQfname(res, i));
    }

    const int nrows = PQntuples(res);
    result.rows.reserve(nrows);

    for (int i = 0; i < nrows; i++) {
        std::vector<std::string> row;
        row.reserve(ncols);
        for (int j = 0; j < ncols; j++) {
            const char* val = PQgetvalue(res, i, j);
            row.push_back(val ? val : "");
        }
        result.rows.push_back(std::move(row));
    }

    return result;
}

DbResultSet PgConnection::process_command_result(PGresult* res) {
    DbResultSet result;
    result.success = true;
    result.has_rows = false;

    const char* affected = PQcmdTuples(res);
    if (affected && std::strlen(affected) > 0) {
        result.affected_rows = std::stoull(affected);
    }

    return result;
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
        utils::log::error(std::format("Failed to connect: {}", PQerrorMessage(conn)));
        PQfinish(conn);
        return nullptr;
    }

    return std::make_unique<PgConnection>(conn);
}

} // namespace pgtenant
