#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "errors.hpp"
#include <sqlite3.h>
#include <unordered_map>

namespace tether {

class db_error : public tether_error {
public:
    explicit db_error(const std::string& msg) : tether_error(msg) {}
};

class database {
public:
    explicit database(const std::string& path);
    ~database();

    // Non-copyable
    database(const database&) = delete;
    database& operator=(const database&) = delete;

    // Moveable
    database(database&& other) noexcept;
    database& operator=(database&& other) noexcept;

    // Schema management
    void create_table(const table_schema& schema);
    /// Creates the table, or adds any column the existing table lacks.
    void ensure_table(const table_schema& schema);
    bool table_exists(const std::string& name) const;

    // Returns map of column_name -> SQL_TYPE (uppercase)
    std::unordered_map<std::string, std::string> get_table_info(const std::string& table) const;

    // CRUD operations
    primary_key_t insert(const std::string& table,
                         const std::vector<std::pair<std::string, column_value_t>>& values);

    void update(const std::string& table,
                primary_key_t id,
                const std::vector<std::pair<std::string, column_value_t>>& values);

    void remove(const std::string& table, primary_key_t id);

    // Query - returns rows as vector of column maps
    using row_t = std::unordered_map<std::string, column_value_t>;
    std::vector<row_t> query(const std::string& sql,
                             const std::vector<column_value_t>& params = {});

    // Execute SQL with optional params; returns the number of rows changed
    size_t execute(const std::string& sql,
                   const std::vector<column_value_t>& params = {});

    // Transaction support
    void begin_transaction();
    void commit();
    void rollback();
    bool is_in_transaction() const;

    // Savepoints (nested transactions)
    std::string savepoint();
    void release(const std::string& name);
    void rollback_to(const std::string& name);

    const std::string& path() const { return path_; }

    // Raw access (use sparingly)
    sqlite3* handle() const { return db_; }

private:
    sqlite3* db_ = nullptr;
    std::string path_;
    uint64_t savepoint_counter_ = 0;

    void bind_value(sqlite3_stmt* stmt, int index, const column_value_t& value);
    column_value_t extract_column(sqlite3_stmt* stmt, int index);
    sqlite3_stmt* prepare(const std::string& sql, const char* what);
};

// RAII transaction guard. Becomes a savepoint when a transaction is already open.
class transaction {
public:
    explicit transaction(database& db);
    ~transaction();

    transaction(const transaction&) = delete;
    transaction& operator=(const transaction&) = delete;

    void commit();
    void rollback();

    bool is_nested() const { return !savepoint_.empty(); }

private:
    database& db_;
    std::string savepoint_;
    bool completed_ = false;
};

} // namespace tether

#endif // __cplusplus
