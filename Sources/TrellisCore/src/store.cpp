#include "trellis/store.hpp"
#include "trellis/errors.hpp"
#include "trellis/migrator.hpp"
#include "trellis/wire.hpp"

namespace trellis {

// Single definition of the global log level (declared extern in log.hpp).
std::atomic<log_level> g_log_level{log_level::off};

store::store(schema_registry schema, configuration config)
    : schema_(std::move(schema)), config_(std::move(config)) {
    open();
}

store::~store() {
    close();
}

void store::open() {
    if (is_open()) return;
    if (config_.log) {
        set_log_level(*config_.log);
    }

    auto db = std::make_unique<database>(config_.path);
    // Compiles every mapping, so a malformed registry fails here
    auto proc = std::make_unique<processor>(*db, schema_);
    if (config_.auto_migrate) {
        migrator(*db, proc->mapper()).migrate_all();
    }

    db_ = std::move(db);
    processor_ = std::move(proc);
    LOG_INFO("store", "Opened %s (%zu types)", config_.path.c_str(), schema_.types().size());
}

void store::close() {
    if (!db_) return;
    processor_.reset();
    db_.reset();
    LOG_INFO("store", "Closed %s", config_.path.c_str());
}

void store::reopen() {
    close();
    open();
}

void store::upgrade(schema_registry schema) {
    close();
    schema_ = std::move(schema);
    open();
}

processor& store::require_open() {
    if (!processor_) {
        throw operation_error("Store is closed");
    }
    return *processor_;
}

database& store::db() {
    require_open();
    return *db_;
}

int store::migrate() {
    auto& proc = require_open();
    return migrator(*db_, proc.mapper()).migrate_all();
}

std::vector<record> store::update(const std::vector<record_operation>& operations) {
    return require_open().update(operations);
}

std::vector<query_result> store::query(const std::vector<query_expression>& expressions) {
    return require_open().query(expressions);
}

nlohmann::json store::update_json(const std::string& text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw operation_error(std::string("Malformed operations: ") + e.what());
    }

    auto records = update(wire::operations_from_json(j));
    if (records.size() == 1) {
        return nlohmann::json(records.front());
    }
    return nlohmann::json(records);
}

nlohmann::json store::query_json(const std::string& text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error&) {
        throw query_expression_parse_error(text);
    }

    auto results = query(wire::expressions_from_json(j));
    if (results.size() == 1) {
        return wire::result_to_json(results.front());
    }
    auto out = nlohmann::json::array();
    for (const auto& result : results) {
        out.push_back(wire::result_to_json(result));
    }
    return out;
}

void store::clear_records(const std::string& type) {
    auto& proc = require_open();
    const auto& m = proc.mapper().mapping(type);
    db_->execute("DELETE FROM " + quote_identifier(m.table_name));
    LOG_DEBUG("store", "Cleared %s", m.table_name.c_str());
}

} // namespace trellis
