#pragma once

#include "db.hpp"
#include "log.hpp"
#include "operations.hpp"
#include "processor.hpp"
#include "query.hpp"
#include "schema.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace trellis {

struct configuration {
    /// Database file path. Use ":memory:" for in-memory database.
    std::string path = ":memory:";

    /// Create missing tables for every registered type when the store opens.
    bool auto_migrate = true;

    /// Log level applied on open. nullopt leaves the current level alone.
    std::optional<log_level> log;
};

/// A schema registry bound to one SQLite connection.
///
/// While open, the store owns the connection and a processor built for that
/// connection; closing discards both, including every compiled mapping.
class store {
public:
    explicit store(schema_registry schema, configuration config = {});
    ~store();

    store(const store&) = delete;
    store& operator=(const store&) = delete;
    store(store&&) = delete;
    store& operator=(store&&) = delete;

    void open();
    void close();
    bool is_open() const { return processor_ != nullptr; }

    void reopen();

    /// Swaps in a new registry and reopens. Tables for new types are created
    /// when auto_migrate is set; existing tables are not altered.
    void upgrade(schema_registry schema);

    /// Returns the number of tables created.
    int migrate();

    std::vector<record> update(const std::vector<record_operation>& operations);
    std::vector<query_result> query(const std::vector<query_expression>& expressions);

    /// JSON forms of update() and query(). A batch of exactly one returns the
    /// bare result, otherwise an array.
    nlohmann::json update_json(const std::string& text);
    nlohmann::json query_json(const std::string& text);

    /// Deletes every row of `type`'s table.
    void clear_records(const std::string& type);

    const schema_registry& schema() const { return schema_; }
    const configuration& config() const { return config_; }
    database& db();

private:
    schema_registry schema_;
    configuration config_;
    std::unique_ptr<database> db_;
    std::unique_ptr<processor> processor_;

    processor& require_open();
};

} // namespace trellis
