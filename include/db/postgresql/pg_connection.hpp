#pragma once

#include "db/idb_connection.hpp"
#include "db/iconnection_factory.hpp"
#include <libpq-fe.h>
#include <string>
#include <vector>

namespace pgtenant {

/**
 * @brief One libpq session
 *
 * Owns the PGconn*. Parameterized statements go through PQexecParams, so
 * search_path values and tenant identifiers travel as parameters. Transaction
 * state comes from PQtransactionStatus.
 */
class PgConnection : public IDbConnection {
public:
    explicit PgConnection(PGconn* conn);     // Takes ownership

    ~PgConnection() override;

    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;

    DbResultSet execute(const std::string& sql) override;
    DbResultSet execute(const std::string& sql, const std::vector<std::string>& params) override;
    bool is_healthy(const std::string& health_check_query) override;
    bool is_connected() const override;
    bool in_transaction() const override;
    void close() override;

private:
    /**
     * @brief Convert a PGresult into a DbResultSet and free it
     */
    DbResultSet consume_result(PGresult* res);

    DbResultSet process_tuples_result(PGresult* res);
    DbResultSet process_command_result(PGresult* res);

    PGconn* conn_;
};

// PQconnectdb; nullptr (and a logged error) when the server refuses
class PgConnectionFactory : public IConnectionFactory {
public:
    std::unique_ptr<IDbConnection> create(const std::string& connection_string) override;
};

} // namespace pgtenant
