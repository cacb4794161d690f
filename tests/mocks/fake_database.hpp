#pragma once

#include "db/iconnection_factory.hpp"
#include "db/idb_connection.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <format>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace pgtenant::testing {

/**
 * @brief In-memory stand-in for one PostgreSQL database
 *
 * Understands the statement shapes the library issues: search_path
 * current_setting/set_config, BEGIN/COMMIT/ROLLBACK, savepoints, CREATE/DROP SCHEMA,
 * pg_namespace and pg_tables existence checks, CREATE TABLE, INSERT ... VALUES, SELECT ... FROM ... [WHERE] [ORDER BY]
 * [LIMIT]. Unqualified table names resolve through the connection's
 * search_path like PostgreSQL does. Writes inside a transaction are undone
 * on rollback, and so is a session search_path change; ROLLBACK TO unwinds
 * back to its savepoint the same way.
 */
class FakeDatabase {
public:
    struct Table {
        std::vector<std::string> columns;
        std::vector<std::vector<std::string>> rows;
        std::optional<size_t> primary_key;
    };

    struct Fault {
        std::string needle;                     // Case-sensitive substring of the statement
        std::optional<std::string> schema;      // Only when this schema heads search_path
        std::string message{"injected failure"};
        std::string sql_state{"XX000"};
        int pass_first = 0;                     // Let this many matches through first
        int remaining = -1;                     // Failures left; -1 = unlimited
    };

    static constexpr const char* kDefaultSearchPath = "\"$user\", public";

    FakeDatabase() { schemas_["public"]; }

    void add_fault(Fault fault) {
        std::lock_guard lock(mutex_);
        faults_.push_back(std::move(fault));
    }

    void clear_faults() {
        std::lock_guard lock(mutex_);
        faults_.clear();
    }

    [[nodiscard]] bool schema_exists(const std::string& schema) const {
        std::lock_guard lock(mutex_);
        return schemas_.contains(schema);
    }

    [[nodiscard]] bool table_exists(const std::string& schema, const std::string& table) const {
        std::lock_guard lock(mutex_);
        const auto it = schemas_.find(schema);
        return it != schemas_.end() && it->second.contains(table);
    }

    [[nodiscard]] std::vector<std::vector<std::string>> rows(const std::string& schema,
                                                             const std::string& table) const {
        std::lock_guard lock(mutex_);
        const auto it = schemas_.find(schema);
        if (it == schemas_.end()) return {};
        const auto t = it->second.find(table);
        return t == it->second.end() ? std::vector<std::vector<std::string>>{} : t->second.rows;
    }

    [[nodiscard]] std::vector<std::string> schema_names() const {
        std::lock_guard lock(mutex_);
        std::vector<std::string> names;
        for (const auto& [name, tables] : schemas_) names.push_back(name);
        return names;
    }

    std::atomic<int> connections_opened{0};
    std::atomic<int> connections_closed{0};
    std::atomic<bool> refuse_connections{false};
    std::chrono::microseconds statement_delay{0};

private:
    friend class FakeConnection;

    using Schema = std::map<std::string, Table>;

    mutable std::mutex mutex_;
    std::map<std::string, Schema> schemas_;
    std::vector<Fault> faults_;
};

/**
 * @brief One session against a FakeDatabase
 */
class FakeConnection : public IDbConnection {
public:
    explicit FakeConnection(std::shared_ptr<FakeDatabase> db) : db_(std::move(db)) {
        db_->connections_opened.fetch_add(1);
    }

    ~FakeConnection() override { close(); }

    DbResultSet execute(const std::string& sql) override { return run(sql, {}); }

    DbResultSet execute(const std::string& sql, const std::vector<std::string>& params) override {
        return run(sql, params);
    }

    bool is_healthy(const std::string& query) override {
        return connected_ && execute(query).success;
    }

    bool is_connected() const override { return connected_; }

    bool in_transaction() const override { return in_txn_; }

    void close() override {
        if (connected_) {
            connected_ = false;
            db_->connections_closed.fetch_add(1);
        }
    }

    // Simulate the server dropping the session
    void kill() { close(); }

    [[nodiscard]] const std::string& search_path() const { return search_path_; }
    [[nodiscard]] const std::vector<std::string>& statements() const { return log_; }

private:
    using Rows = std::vector<std::vector<std::string>>;

    static DbResultSet error(std::string message, std::string sql_state = "XX000") {
        DbResultSet rs;
        rs.success = false;
        rs.error_message = std::move(message);
        rs.sql_state = std::move(sql_state);
        return rs;
    }

    static DbResultSet ok_command(uint64_t affected = 0) {
        DbResultSet rs;
        rs.success = true;
        rs.affected_rows = affected;
        return rs;
    }

    static DbResultSet ok_rows(std::vector<std::string> columns, Rows rows) {
        DbResultSet rs;
        rs.success = true;
        rs.has_rows = true;
        rs.column_names = std::move(columns);
        rs.rows = std::move(rows);
        return rs;
    }

    // ---- Text helpers ------------------------------------------------------

    static std::string trim(const std::string& s) {
        const auto b = s.find_first_not_of(" \t\r\n");
        if (b == std::string::npos) return {};
        const auto e = s.find_last_not_of(" \t\r\n");
        return s.substr(b, e - b + 1);
    }

    static std::string unquote(const std::string& raw) {
        auto s = trim(raw);
        if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
            s = s.substr(1, s.size() - 2);
        }
        return s;
    }

    // Split on sep outside single quotes, double quotes and parentheses
    static std::vector<std::string> split_top_level(const std::string& s, char sep) {
        std::vector<std::string> parts;
        std::string current;
        int depth = 0;
        bool in_single = false;
        bool in_double = false;
        for (const char c : s) {
            if (c == '\'' && !in_double) in_single = !in_single;
            else if (c == '"' && !in_single) in_double = !in_double;
            else if (!in_single && !in_double) {
                if (c == '(') ++depth;
                else if (c == ')') --depth;
                else if (c == sep && depth == 0) {
                    parts.push_back(current);
                    current.clear();
                    continue;
                }
            }
            current += c;
        }
        parts.push_back(current);
        return parts;
    }

    static std::string strip_comments(const std::string& sql) {
        std::string out;
        bool in_single = false;
        for (size_t i = 0; i < sql.size(); ++i) {
            const char c = sql[i];
            if (c == '\'') in_single = !in_single;
            if (!in_single && c == '-' && i + 1 < sql.size() && sql[i + 1] == '-') {
                while (i < sql.size() && sql[i] != '\n') ++i;
                out += '\n';
                continue;
            }
            out += c;
        }
        return out;
    }

    std::vector<std::string> path_schemas() const {
        std::vector<std::string> result;
        for (const auto& part : split_top_level(search_path_, ',')) {
            auto name = unquote(part);
            if (!name.empty() && name != "$user") result.push_back(std::move(name));
        }
        return result;
    }

    static std::optional<int64_t> epoch_ms(const std::string& iso) {
        std::tm tm{};
        int ms = 0;
        if (std::sscanf(iso.c_str(), "%d-%d-%dT%d:%d:%d.%dZ", &tm.tm_year, &tm.tm_mon,
                        &tm.tm_mday, &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &ms) < 6) {
            return std::nullopt;
        }
        tm.tm_year -= 1900;
        tm.tm_mon -= 1;
        return static_cast<int64_t>(::timegm(&tm)) * 1000 + ms;
    }

    std::string value_of(const std::string& raw, const std::vector<std::string>& params) const {
        const auto v = trim(raw);
        if (v.size() > 1 && v[0] == '$') {
            const auto idx = static_cast<size_t>(std::stoul(v.substr(1)));
            return idx >= 1 && idx <= params.size() ? params[idx - 1] : std::string{};
        }
        if (v.size() >= 2 && v.front() == '\'' && v.back() == '\'') {
            std::string s;
            for (size_t i = 1; i + 1 < v.size(); ++i) {
                s += v[i];
                if (v[i] == '\'' && v[i + 1] == '\'') ++i;
            }
            return s;
        }
        if (v == "NULL" || v == "null") return {};
        return v;
    }

    // ---- Name resolution (caller holds db mutex) ---------------------------

    struct TableName {
        std::optional<std::string> schema;
        std::string table;
    };

    static TableName parse_table_name(const std::string& raw) {
        const auto parts = split_top_level(raw, '.');
        if (parts.size() == 2) return {unquote(parts[0]), unquote(parts[1])};
        return {std::nullopt, unquote(raw)};
    }

    FakeDatabase::Table* find_table(const TableName& name) {
        if (name.schema) {
            const auto s = db_->schemas_.find(*name.schema);
            if (s == db_->schemas_.end()) return nullptr;
            const auto t = s->second.find(name.table);
            return t == s->second.end() ? nullptr : &t->second;
        }
        for (const auto& schema : path_schemas()) {
            const auto s = db_->schemas_.find(schema);
            if (s == db_->schemas_.end()) continue;
            const auto t = s->second.find(name.table);
            if (t != s->second.end()) return &t->second;
        }
        return nullptr;
    }

    std::optional<std::string> creation_schema(const TableName& name) const {
        if (name.schema) return name.schema;
        for (const auto& schema : path_schemas()) {
            if (db_->schemas_.contains(schema)) return schema;
        }
        return std::nullopt;
    }

    // ---- Execution ---------------------------------------------------------

    DbResultSet run(const std::string& sql, const std::vector<std::string>& params) {
        if (!connected_) {
            return error("server closed the connection unexpectedly", "08006");
        }
        if (db_->statement_delay.count() > 0) {
            std::this_thread::sleep_for(db_->statement_delay);
        }
        log_.push_back(sql);

        std::lock_guard lock(db_->mutex_);

        std::vector<std::string> statements;
        for (auto& part : split_top_level(strip_comments(sql), ';')) {
            auto stmt = trim(part);
            if (!stmt.empty()) statements.push_back(std::move(stmt));
        }
        if (statements.empty()) {
            return ok_command();
        }

        // A multi-statement batch outside a transaction is one implicit transaction
        const bool implicit = !in_txn_ && statements.size() > 1;
        const auto undo_mark = undo_.size();

        DbResultSet last;
        for (const auto& stmt : statements) {
            last = run_statement(stmt, params);
            if (!last.success) {
                if (implicit || !in_txn_) {
                    rollback_to(undo_mark);
                } else {
                    txn_failed_ = true;
                }
                return last;
            }
        }
        if (!in_txn_) {
            undo_.clear();
        }
        return last;
    }

    // Innermost savepoint with this name
    std::optional<size_t> find_savepoint(const std::string& name) const {
        for (size_t i = savepoints_.size(); i-- > 0;) {
            if (savepoints_[i].first == name) return i;
        }
        return std::nullopt;
    }

    DbResultSet savepoint_error(const std::string& name) const {
        if (!in_txn_) {
            return error("savepoints can only be used in transaction blocks", "25P01");
        }
        return error(std::format("savepoint \"{}\" does not exist", name), "3B001");
    }

    void rollback_to(size_t mark) {
        while (undo_.size() > mark) {
            undo_.back()();
            undo_.pop_back();
        }
    }

    std::optional<DbResultSet> injected(const std::string& stmt) {
        const auto path = path_schemas();
        const std::string head = path.empty() ? std::string{} : path.front();
        for (auto& f : db_->faults_) {
            if (f.remaining == 0) continue;
            if (stmt.find(f.needle) == std::string::npos) continue;
            if (f.schema && *f.schema != head) continue;
            if (f.pass_first > 0) {
                --f.pass_first;
                continue;
            }
            if (f.remaining > 0) --f.remaining;
            return error(f.message, f.sql_state);
        }
        return std::nullopt;
    }

    DbResultSet run_statement(const std::string& stmt, const std::vector<std::string>& params) {
        static const auto icase = std::regex::icase | std::regex::ECMAScript;
        static const std::regex re_begin(R"(^(BEGIN|START TRANSACTION)$)", icase);
        static const std::regex re_commit(R"(^(COMMIT|END)$)", icase);
        static const std::regex re_rollback(R"(^(ROLLBACK|ABORT)$)", icase);
        static const std::regex re_savepoint(R"(^SAVEPOINT\s+(\w+)$)", icase);
        static const std::regex re_rollback_to(R"(^ROLLBACK\s+TO\s+(SAVEPOINT\s+)?(\w+)$)", icase);
        static const std::regex re_release(R"(^RELEASE\s+(SAVEPOINT\s+)?(\w+)$)", icase);
        static const std::regex re_show_path(
            R"(^SELECT\s+(pg_catalog\.)?current_setting\('search_path'\)$)", icase);
        static const std::regex re_set_path(
            R"(^SELECT\s+(pg_catalog\.)?set_config\('search_path',\s*(\$\d+|'[^']*'),\s*(true|false)\)$)", icase);
        static const std::regex re_select_literal(R"(^SELECT\s+(\d+)$)", icase);
        static const std::regex re_namespace(
            R"(^SELECT\s+1\s+FROM\s+pg_catalog\.pg_namespace\s+WHERE\s+nspname\s*=\s*(\$\d+|'[^']*')$)", icase);
        static const std::regex re_tables(
            R"(^SELECT\s+1\s+FROM\s+pg_catalog\.pg_tables\s+WHERE\s+schemaname\s*=\s*(\$\d+|'[^']*')\s+AND\s+tablename\s*=\s*(\$\d+|'[^']*')$)", icase);
        static const std::regex re_create_schema(
            R"(^CREATE\s+SCHEMA\s+(IF\s+NOT\s+EXISTS\s+)?("[^"]+"|\w+)$)", icase);
        static const std::regex re_drop_schema(
            R"(^DROP\s+SCHEMA\s+(IF\s+EXISTS\s+)?("[^"]+"|\w+)(\s+CASCADE)?$)", icase);
        static const std::regex re_create_table(
            R"(^CREATE\s+TABLE\s+(IF\s+NOT\s+EXISTS\s+)?((?:"[^"]+"|\w+)(?:\.(?:"[^"]+"|\w+))?)\s*\(([\s\S]*)\)$)", icase);
        static const std::regex re_create_index(R"(^CREATE\s+(UNIQUE\s+)?INDEX\b)", icase);
        static const std::regex re_insert(
            R"(^INSERT\s+INTO\s+((?:"[^"]+"|\w+)(?:\.(?:"[^"]+"|\w+))?)\s*\(([^)]*)\)\s*VALUES\s*\(([\s\S]*)\)(\s+RETURNING\s+(\w+))?$)", icase);
        static const std::regex re_select(
            R"(^SELECT\s+([\s\S]+?)\s+FROM\s+((?:"[^"]+"|\w+)(?:\.(?:"[^"]+"|\w+))?)(?:\s+WHERE\s+([\s\S]+?))?(?:\s+ORDER\s+BY\s+(\w+)(\s+DESC)?)?(?:\s+LIMIT\s+(\d+))?$)", icase);

        std::smatch m;

        // Transaction control is evaluated before faults and the aborted check
        if (std::regex_match(stmt, re_begin)) {
            if (in_txn_) return ok_command();       // PostgreSQL only warns
            in_txn_ = true;
            txn_failed_ = false;
            undo_.clear();
            savepoints_.clear();
            return ok_command();
        }
        if (std::regex_match(stmt, re_commit) || std::regex_match(stmt, re_rollback)) {
            const bool commit = std::regex_match(stmt, re_commit) && !txn_failed_;
            if (!commit) rollback_to(0);
            undo_.clear();
            savepoints_.clear();
            in_txn_ = false;
            txn_failed_ = false;
            return ok_command();
        }
        if (std::regex_match(stmt, m, re_rollback_to)) {
            const auto sp = find_savepoint(m[2].str());
            if (!sp) return savepoint_error(m[2].str());
            rollback_to(savepoints_[*sp].second);
            savepoints_.resize(*sp + 1);
            txn_failed_ = false;
            return ok_command();
        }
        if (in_txn_ && txn_failed_) {
            return error("current transaction is aborted, commands ignored until end of transaction block",
                         "25P02");
        }
        if (auto fault = injected(stmt)) {
            return *fault;
        }

        if (std::regex_match(stmt, m, re_savepoint)) {
            if (!in_txn_) {
                return error("SAVEPOINT can only be used in transaction blocks", "25P01");
            }
            savepoints_.emplace_back(m[1].str(), undo_.size());
            return ok_command();
        }
        if (std::regex_match(stmt, m, re_release)) {
            const auto sp = find_savepoint(m[2].str());
            if (!sp) return savepoint_error(m[2].str());
            savepoints_.resize(*sp);        // Its writes now belong to the enclosing level
            return ok_command();
        }

        if (std::regex_match(stmt, re_show_path)) {
            return ok_rows({"current_setting"}, {{search_path_}});
        }
        if (std::regex_match(stmt, m, re_set_path)) {
            const auto previous = search_path_;
            search_path_ = value_of(m[2].str(), params);
            undo_.push_back([this, previous] { search_path_ = previous; });
            return ok_rows({"set_config"}, {{search_path_}});
        }
        if (std::regex_match(stmt, m, re_select_literal)) {
            return ok_rows({"?column?"}, {{m[1].str()}});
        }
        if (std::regex_match(stmt, m, re_namespace)) {
            const bool found = db_->schemas_.contains(value_of(m[1].str(), params));
            return ok_rows({"?column?"}, found ? Rows{{"1"}} : Rows{});
        }
        if (std::regex_match(stmt, m, re_tables)) {
            const auto s = db_->schemas_.find(value_of(m[1].str(), params));
            const bool found = s != db_->schemas_.end() &&
                               s->second.contains(value_of(m[2].str(), params));
            return ok_rows({"?column?"}, found ? Rows{{"1"}} : Rows{});
        }
        if (std::regex_match(stmt, m, re_create_schema)) {
            const auto name = unquote(m[2].str());
            if (db_->schemas_.contains(name)) {
                if (m[1].matched) return ok_command();
                return error(std::format("schema \"{}\" already exists", name), "42P06");
            }
            db_->schemas_[name];
            undo_.push_back([this, name] { db_->schemas_.erase(name); });
            return ok_command();
        }
        if (std::regex_match(stmt, m, re_drop_schema)) {
            const auto name = unquote(m[2].str());
            const auto it = db_->schemas_.find(name);
            if (it == db_->schemas_.end()) {
                if (m[1].matched) return ok_command();
                return error(std::format("schema \"{}\" does not exist", name), "3F000");
            }
            if (!it->second.empty() && !m[3].matched) {
                return error(std::format("cannot drop schema {} because other objects depend on it", name),
                             "2BP01");
            }
            auto saved = std::move(it->second);
            db_->schemas_.erase(it);
            undo_.push_back([this, name, saved = std::move(saved)]() mutable {
                db_->schemas_[name] = std::move(saved);
            });
            return ok_command();
        }
        if (std::regex_match(stmt, m, re_create_table)) {
            return create_table(m[2].str(), m[3].str(), m[1].matched);
        }
        if (std::regex_search(stmt, re_create_index)) {
            return ok_command();
        }
        if (std::regex_match(stmt, m, re_insert)) {
            return insert(m[1].str(), m[2].str(), m[3].str(),
                          m[5].matched ? std::optional<std::string>(m[5].str()) : std::nullopt, params);
        }
        if (std::regex_match(stmt, m, re_select)) {
            return select(m[1].str(), m[2].str(), m[3].matched ? m[3].str() : std::string{},
                          m[4].matched ? m[4].str() : std::string{}, m[5].matched,
                          m[6].matched ? std::optional<size_t>(std::stoul(m[6].str())) : std::nullopt,
                          params);
        }
        return error(std::format("syntax error: fake database cannot run \"{}\"", stmt), "42601");
    }

    DbResultSet create_table(const std::string& raw_name, const std::string& defs, bool if_not_exists) {
        const auto name = parse_table_name(raw_name);
        const auto schema = creation_schema(name);
        if (!schema) {
            return error("no schema has been selected to create in", "3F000");
        }
        if (!db_->schemas_.contains(*schema)) {
            return error(std::format("schema \"{}\" does not exist", *schema), "3F000");
        }
        auto& tables = db_->schemas_[*schema];
        if (tables.contains(name.table)) {
            if (if_not_exists) return ok_command();
            return error(std::format("relation \"{}\" already exists", name.table), "42P07");
        }

        FakeDatabase::Table table;
        for (const auto& def : split_top_level(defs, ',')) {
            const auto d = trim(def);
            if (d.empty()) continue;
            std::string upper = d;
            std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);
            if (upper.starts_with("PRIMARY") || upper.starts_with("UNIQUE") ||
                upper.starts_with("CONSTRAINT") || upper.starts_with("FOREIGN")) {
                continue;
            }
            const auto space = d.find_first_of(" \t\n");
            table.columns.push_back(unquote(d.substr(0, space)));
            if (upper.find("PRIMARY KEY") != std::string::npos) {
                table.primary_key = table.columns.size() - 1;
            }
        }
        tables.emplace(name.table, std::move(table));
        const auto s = *schema;
        const auto t = name.table;
        undo_.push_back([this, s, t] {
            const auto it = db_->schemas_.find(s);
            if (it != db_->schemas_.end()) it->second.erase(t);
        });
        return ok_command();
    }

    DbResultSet insert(const std::string& raw_name, const std::string& cols, const std::string& vals,
                       const std::optional<std::string>& returning,
                       const std::vector<std::string>& params) {
        const auto name = parse_table_name(raw_name);
        auto* table = find_table(name);
        if (!table) {
            return error(std::format("relation \"{}\" does not exist", name.table), "42P01");
        }

        const auto col_list = split_top_level(cols, ',');
        const auto val_list = split_top_level(vals, ',');
        if (col_list.size() != val_list.size()) {
            return error("INSERT has more target columns than expressions", "42601");
        }

        std::vector<std::string> row(table->columns.size());
        for (size_t i = 0; i < col_list.size(); ++i) {
            const auto col = unquote(col_list[i]);
            const auto it = std::find(table->columns.begin(), table->columns.end(), col);
            if (it == table->columns.end()) {
                return error(std::format("column \"{}\" does not exist", col), "42703");
            }
            row[static_cast<size_t>(it - table->columns.begin())] = value_of(val_list[i], params);
        }

        if (table->primary_key) {
            const auto pk = *table->primary_key;
            for (const auto& existing : table->rows) {
                if (existing[pk] == row[pk]) {
                    return error("duplicate key value violates unique constraint", "23505");
                }
            }
        }

        table->rows.push_back(row);
        undo_.push_back([this, name, row] {
            if (auto* t = find_table(name)) {
                const auto it = std::find(t->rows.begin(), t->rows.end(), row);
                if (it != t->rows.end()) t->rows.erase(it);
            }
        });

        if (returning) {
            const auto it = std::find(table->columns.begin(), table->columns.end(), *returning);
            const auto value = it == table->columns.end()
                ? std::to_string(table->rows.size())
                : row[static_cast<size_t>(it - table->columns.begin())];
            return ok_rows({*returning}, {{value}});
        }
        return ok_command(1);
    }

    DbResultSet select(const std::string& items, const std::string& raw_name, const std::string& where,
                       const std::string& order_by, bool desc, std::optional<size_t> limit,
                       const std::vector<std::string>& params) {
        static const std::regex re_cond(R"(^\s*("?\w+"?)\s*=\s*(\$\d+|'[^']*'|\d+)\s*$)");
        static const std::regex re_and(R"(\s+AND\s+)", std::regex::icase);
        static const std::regex re_extract(R"(extract\(epoch\s+FROM\s+(\w+)\))", std::regex::icase);

        const auto name = parse_table_name(raw_name);
        auto* table = find_table(name);
        if (!table) {
            return error(std::format("relation \"{}\" does not exist", name.table), "42P01");
        }
        auto column_index = [&](const std::string& col) -> std::optional<size_t> {
            const auto it = std::find(table->columns.begin(), table->columns.end(), unquote(col));
            if (it == table->columns.end()) return std::nullopt;
            return static_cast<size_t>(it - table->columns.begin());
        };

        // WHERE: conjunction of col = value
        std::vector<std::pair<size_t, std::string>> conditions;
        if (!where.empty()) {
            std::sregex_token_iterator it(where.begin(), where.end(), re_and, -1);
            for (; it != std::sregex_token_iterator(); ++it) {
                const std::string cond = *it;
                std::smatch cm;
                if (!std::regex_match(cond, cm, re_cond)) {
                    return error(std::format("fake database cannot evaluate \"{}\"", cond), "42601");
                }
                const auto idx = column_index(cm[1].str());
                if (!idx) return error(std::format("column {} does not exist", cm[1].str()), "42703");
                conditions.emplace_back(*idx, value_of(cm[2].str(), params));
            }
        }

        Rows matched;
        for (const auto& row : table->rows) {
            bool ok = true;
            for (const auto& [idx, value] : conditions) {
                if (row[idx] != value) { ok = false; break; }
            }
            if (ok) matched.push_back(row);
        }

        if (!order_by.empty()) {
            const auto idx = column_index(order_by);
            if (!idx) return error(std::format("column {} does not exist", order_by), "42703");
            std::stable_sort(matched.begin(), matched.end(), [&](const auto& a, const auto& b) {
                return desc ? a[*idx] > b[*idx] : a[*idx] < b[*idx];
            });
        }
        if (limit && matched.size() > *limit) {
            matched.resize(*limit);
        }

        // Projection
        const auto trimmed = trim(items);
        if (trimmed == "*") {
            return ok_rows(table->columns, std::move(matched));
        }
        std::string upper = trimmed;
        std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);
        if (upper == "COUNT(*)") {
            return ok_rows({"count"}, {{std::to_string(matched.size())}});
        }

        std::vector<std::string> names;
        std::vector<std::function<std::string(const std::vector<std::string>&)>> getters;
        for (const auto& item : split_top_level(trimmed, ',')) {
            std::smatch em;
            if (std::regex_search(item, em, re_extract)) {
                const auto idx = column_index(em[1].str());
                if (!idx) return error(std::format("column {} does not exist", em[1].str()), "42703");
                names.push_back("extract");
                getters.push_back([i = *idx](const auto& row) {
                    const auto ms = epoch_ms(row[i]);
                    return ms ? std::to_string(*ms) : std::string{"0"};
                });
                continue;
            }
            const auto idx = column_index(item);
            if (!idx) return error(std::format("column {} does not exist", trim(item)), "42703");
            names.push_back(unquote(item));
            getters.push_back([i = *idx](const auto& row) { return row[i]; });
        }

        Rows out;
        out.reserve(matched.size());
        for (const auto& row : matched) {
            std::vector<std::string> projected;
            for (const auto& get : getters) projected.push_back(get(row));
            out.push_back(std::move(projected));
        }
        return ok_rows(std::move(names), std::move(out));
    }

    std::shared_ptr<FakeDatabase> db_;
    bool connected_ = true;
    bool in_txn_ = false;
    bool txn_failed_ = false;
    std::string search_path_{FakeDatabase::kDefaultSearchPath};
    std::vector<std::function<void()>> undo_;
    std::vector<std::pair<std::string, size_t>> savepoints_;    // Name, undo mark
    std::vector<std::string> log_;
};

/**
 * @brief Factory handing out FakeConnections; remembers the last one created
 */
class FakeConnectionFactory : public IConnectionFactory {
public:
    explicit FakeConnectionFactory(std::shared_ptr<FakeDatabase> db) : db_(std::move(db)) {}

    std::unique_ptr<IDbConnection> create(const std::string&) override {
        if (db_->refuse_connections.load()) {
            return nullptr;
        }
        auto conn = std::make_unique<FakeConnection>(db_);
        std::lock_guard lock(mutex_);
        created_.push_back(conn.get());
        return conn;
    }

    [[nodiscard]] size_t total_created() const {
        std::lock_guard lock(mutex_);
        return created_.size();
    }

private:
    std::shared_ptr<FakeDatabase> db_;
    mutable std::mutex mutex_;
    std::vector<FakeConnection*> created_;
};

} // namespace pgtenant::testing
