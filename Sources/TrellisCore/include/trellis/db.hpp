#pragma once

#include "types.hpp"
#include <sqlite3.h>
#include <stdexcept>
#include <unordered_map>

namespace trellis {

class db_error : public std::runtime_error {
public:
    explicit db_error(const std::string& msg) : std::runtime_error(msg) {}
};

/// Double-quote an SQL identifier ("order" -> "\"order\"").
std::string quote_identifier(const std::string& name);

/// Thin wrapper over one SQLite connection. Everything the mapping core
/// demands from relational storage goes through here.
class database {
public:
    enum class transaction_mode {
        deferred,   ///< BEGIN: lock taken on first read/write (query batches)
        immediate   ///< BEGIN IMMEDIATE: write lock up front (operation batches)
    };

    explicit database(const std::string& path);
    ~database();

    // Non-copyable, non-movable: owned through std::unique_ptr by the store
    database(const database&) = delete;
    database& operator=(const database&) = delete;

    // Schema management
    void create_table(const table_schema& schema);
    /// Creates the table unless one with that name exists. Returns true if created.
    bool ensure_table(const table_schema& schema);
    bool table_exists(const std::string& name) const;

    // Returns map of column_name -> SQL_TYPE (uppercase)
    std::unordered_map<std::string, std::string> get_table_info(const std::string& table) const;

    // CRUD operations, rows are keyed by the text `id` column
    void insert(const std::string& table,
                const std::vector<std::pair<std::string, column_value_t>>& values);

    /// Returns the number of rows changed (0 when no row has that id).
    int update(const std::string& table,
               const std::string& id,
               const std::vector<std::pair<std::string, column_value_t>>& values);

    int remove(const std::string& table, const std::string& id);

    // Query - returns rows as vector of column maps
    using row_t = std::unordered_map<std::string, column_value_t>;
    std::vector<row_t> query(const std::string& sql,
                             const std::vector<column_value_t>& params = {});

    // Transaction support
    void begin_transaction(transaction_mode mode = transaction_mode::immediate);
    void commit();
    void rollback();
    bool is_in_transaction() const;

    // Execute SQL with optional params (for INSERT/UPDATE/DELETE without return)
    void execute(const std::string& sql,
                 const std::vector<column_value_t>& params = {});

    const std::string& path() const { return path_; }

private:
    sqlite3* db_ = nullptr;
    std::string path_;

    void bind_value(sqlite3_stmt* stmt, int index, const column_value_t& value);
    column_value_t extract_column(sqlite3_stmt* stmt, int index);
};

// RAII transaction guard
class transaction {
public:
    explicit transaction(database& db,
                         database::transaction_mode mode = database::transaction_mode::immediate);
    ~transaction();

    transaction(const transaction&) = delete;
    transaction& operator=(const transaction&) = delete;

    void commit();

private:
    database& db_;
    bool completed_ = false;
};

} // namespace trellis
