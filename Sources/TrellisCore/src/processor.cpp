#include "trellis/processor.hpp"
#include "trellis/errors.hpp"
#include "trellis/log.hpp"
#include <chrono>
#include <map>
#include <sstream>
#include <unordered_set>
#include <utility>

namespace trellis {

namespace {

column_value_t now_seconds() {
    return detail::to_column_value(std::chrono::system_clock::now());
}

const char* sql_operator(comparator op) {
    switch (op) {
        case comparator::equal: return "=";
        case comparator::gt: return ">";
        case comparator::lt: return "<";
        case comparator::gte: return ">=";
        case comparator::lte: return "<=";
    }
    return "=";
}

void check_target(const relational_mapping& owner, const relation_mapping& rel,
                  const record_identity& identity) {
    if (identity.type != rel.target_type) {
        throw operation_error("Relationship \"" + rel.relationship + "\" on type \"" + owner.type +
                              "\" targets \"" + rel.target_type + "\", got \"" + identity.type + "\"");
    }
}

std::vector<std::string> string_column(const std::vector<database::row_t>& rows, const std::string& column) {
    std::vector<std::string> values;
    values.reserve(rows.size());
    for (const auto& row : rows) {
        auto it = row.find(column);
        if (it == row.end()) continue;
        if (auto* s = std::get_if<std::string>(&it->second)) {
            values.push_back(*s);
        }
    }
    return values;
}

} // namespace

processor::processor(database& db, const schema_registry& schema)
    : db_(db), mapper_(schema), codec_(mapper_) {
    mapper_.build_all();
}

// ============================================================================
// Batches
// ============================================================================

std::vector<record> processor::update(const std::vector<record_operation>& operations) {
    std::vector<record> results;
    results.reserve(operations.size());

    transaction txn(db_, database::transaction_mode::immediate);
    try {
        for (const auto& op : operations) {
            LOG_DEBUG("processor", "%s %s:%s", operation_name(op),
                      operation_type(op).c_str(), operation_id(op).c_str());
            results.push_back(std::visit([this](const auto& o) { return process(o); }, op));
        }
        txn.commit();
    } catch (const std::exception& e) {
        LOG_WARN("processor", "Rolling back batch of %zu operation(s): %s", operations.size(), e.what());
        throw;
    }
    return results;
}

std::vector<query_result> processor::query(const std::vector<query_expression>& expressions) {
    std::vector<query_result> results;
    results.reserve(expressions.size());

    transaction txn(db_, database::transaction_mode::deferred);
    try {
        for (const auto& expr : expressions) {
            results.push_back(std::visit([this](const auto& e) { return process(e); }, expr));
        }
        txn.commit();
    } catch (const std::exception& e) {
        LOG_WARN("processor", "Query batch of %zu expression(s) failed: %s", expressions.size(), e.what());
        throw;
    }
    return results;
}

// ============================================================================
// Row access
// ============================================================================

std::optional<record> processor::fetch(const relational_mapping& m, const std::string& id) {
    auto rows = db_.query("SELECT * FROM " + quote_identifier(m.table_name) + " WHERE id = ?", {id});
    if (rows.empty()) {
        return std::nullopt;
    }
    return codec_.from_row(rows.front(), m.type);
}

record processor::require(const relational_mapping& m, const std::string& id) {
    auto r = fetch(m, id);
    if (!r) {
        throw record_not_found(m.type, id);
    }
    return std::move(*r);
}

bool processor::row_exists(const std::string& table, const std::string& id) {
    return !db_.query("SELECT 1 FROM " + quote_identifier(table) + " WHERE id = ? LIMIT 1", {id}).empty();
}

void processor::require_exists(const relational_mapping& m, const std::string& id) {
    if (!row_exists(m.table_name, id)) {
        throw record_not_found(m.type, id);
    }
}

const relation_mapping& processor::require_relation(const relational_mapping& m,
                                                    const std::string& name,
                                                    relationship_kind kind) {
    const auto* rel = m.relation(name);
    if (!rel) {
        throw operation_error("Unknown relationship \"" + name + "\" on type \"" + m.type + "\"");
    }
    if (rel->kind != kind) {
        throw operation_error("Relationship \"" + name + "\" on type \"" + m.type + "\" is " +
                              relationship_kind_name(rel->kind) + ", expected " + relationship_kind_name(kind));
    }
    return *rel;
}

// ============================================================================
// Relationship links
// ============================================================================

std::vector<std::string> processor::related_ids(const relational_mapping& m,
                                                const relation_mapping& rel,
                                                const std::string& owner_id) {
    switch (rel.strategy) {
        case relation_strategy::owned_foreign_key:
            return string_column(db_.query("SELECT " + quote_identifier(rel.foreign_key) + " FROM " +
                                           quote_identifier(m.table_name) + " WHERE id = ?", {owner_id}),
                                 rel.foreign_key);
        case relation_strategy::foreign_key_on_target:
            return string_column(db_.query("SELECT id FROM " + quote_identifier(rel.target_table) +
                                           " WHERE " + quote_identifier(rel.foreign_key) +
                                           " = ? ORDER BY rowid", {owner_id}),
                                 "id");
        case relation_strategy::join_table:
            return string_column(db_.query("SELECT " + quote_identifier(rel.related_column) + " FROM " +
                                           quote_identifier(rel.join_table) + " WHERE " +
                                           quote_identifier(rel.owner_column) + " = ? ORDER BY rowid",
                                           {owner_id}),
                                 rel.related_column);
    }
    return {};
}

void processor::link(const relation_mapping& rel, const std::string& owner_id,
                     const std::string& related_id) {
    const auto& target = mapper_.mapping(rel.target_type);
    switch (rel.strategy) {
        case relation_strategy::owned_foreign_key:
            throw operation_error("Relationship \"" + rel.relationship + "\" is single-valued");
        case relation_strategy::foreign_key_on_target: {
            std::vector<std::pair<std::string, column_value_t>> values;
            values.emplace_back(rel.foreign_key, owner_id);
            values.emplace_back("updated_at", now_seconds());
            if (db_.update(target.table_name, related_id, values) == 0) {
                throw record_not_found(target.type, related_id);
            }
            break;
        }
        case relation_strategy::join_table: {
            require_exists(target, related_id);
            auto existing = db_.query("SELECT 1 FROM " + quote_identifier(rel.join_table) + " WHERE " +
                                      quote_identifier(rel.owner_column) + " = ? AND " +
                                      quote_identifier(rel.related_column) + " = ? LIMIT 1",
                                      {owner_id, related_id});
            if (existing.empty()) {
                db_.insert(rel.join_table, {{rel.owner_column, owner_id}, {rel.related_column, related_id}});
            }
            break;
        }
    }
}

void processor::unlink(const relation_mapping& rel, const std::string& owner_id,
                       const std::string& related_id) {
    switch (rel.strategy) {
        case relation_strategy::owned_foreign_key:
            throw operation_error("Relationship \"" + rel.relationship + "\" is single-valued");
        case relation_strategy::foreign_key_on_target:
            db_.execute("UPDATE " + quote_identifier(rel.target_table) + " SET " +
                        quote_identifier(rel.foreign_key) + " = NULL, updated_at = ? WHERE id = ? AND " +
                        quote_identifier(rel.foreign_key) + " = ?",
                        {now_seconds(), related_id, owner_id});
            break;
        case relation_strategy::join_table:
            db_.execute("DELETE FROM " + quote_identifier(rel.join_table) + " WHERE " +
                        quote_identifier(rel.owner_column) + " = ? AND " +
                        quote_identifier(rel.related_column) + " = ?",
                        {owner_id, related_id});
            break;
    }
}

void processor::replace_related_set(const relational_mapping& m,
                                    const relation_mapping& rel,
                                    const std::string& owner_id,
                                    const std::vector<std::string>& requested) {
    auto current = related_ids(m, rel, owner_id);
    std::unordered_set<std::string> wanted(requested.begin(), requested.end());
    std::unordered_set<std::string> present(current.begin(), current.end());

    for (const auto& id : current) {
        if (wanted.count(id) == 0) {
            unlink(rel, owner_id, id);
        }
    }
    for (const auto& id : requested) {
        if (present.insert(id).second) {
            link(rel, owner_id, id);
        }
    }
}

// ============================================================================
// Write operations
// ============================================================================

record processor::process(const add_record_operation& op) {
    const auto& m = mapper_.mapping(op.record.type);
    auto row = codec_.to_row(op.record);

    std::vector<std::pair<std::string, column_value_t>> values;
    auto now = now_seconds();
    values.emplace_back("id", op.record.id);
    values.emplace_back("created_at", now);
    values.emplace_back("updated_at", now);
    for (auto& column : row.columns) {
        values.push_back(std::move(column));
    }
    for (const auto& [name, related] : row.to_one) {
        const auto& rel = *m.relation(name);
        if (related) {
            require_exists(mapper_.mapping(rel.target_type), *related);
            values.emplace_back(rel.foreign_key, *related);
        } else {
            values.emplace_back(rel.foreign_key, nullptr);
        }
    }
    db_.insert(m.table_name, values);

    // A new record has no links to remove
    for (const auto& [name, ids] : row.to_many) {
        const auto& rel = *m.relation(name);
        for (const auto& id : ids) {
            link(rel, op.record.id, id);
        }
    }
    return require(m, op.record.id);
}

record processor::process(const update_record_operation& op) {
    const auto& m = mapper_.mapping(op.record.type);
    require_exists(m, op.record.id);
    auto row = codec_.to_row(op.record);

    auto values = std::move(row.columns);
    for (const auto& [name, related] : row.to_one) {
        const auto& rel = *m.relation(name);
        if (related) {
            require_exists(mapper_.mapping(rel.target_type), *related);
            values.emplace_back(rel.foreign_key, *related);
        } else {
            values.emplace_back(rel.foreign_key, nullptr);
        }
    }
    values.emplace_back("updated_at", now_seconds());
    db_.update(m.table_name, op.record.id, values);

    for (const auto& [name, ids] : row.to_many) {
        replace_related_set(m, *m.relation(name), op.record.id, ids);
    }
    return require(m, op.record.id);
}

record processor::process(const remove_record_operation& op) {
    const auto& m = mapper_.mapping(op.record.type);
    auto removed = require(m, op.record.id);
    // References held by other rows are left in place
    db_.remove(m.table_name, op.record.id);
    return removed;
}

record processor::process(const replace_attribute_operation& op) {
    const auto& m = mapper_.mapping(op.record.type);
    const auto* column = m.attribute(op.attribute);
    if (!column) {
        throw operation_error("Unknown attribute \"" + op.attribute + "\" on type \"" + m.type + "\"");
    }
    if (column->reserved) {
        throw operation_error("Attribute \"" + op.attribute + "\" on type \"" + m.type +
                              "\" is assigned by the store");
    }

    std::vector<std::pair<std::string, column_value_t>> values;
    values.emplace_back(column->column, codec_.to_column(m, *column, op.value));
    values.emplace_back("updated_at", now_seconds());
    if (db_.update(m.table_name, op.record.id, values) == 0) {
        throw record_not_found(m.type, op.record.id);
    }
    return require(m, op.record.id);
}

record processor::process(const replace_related_record_operation& op) {
    const auto& m = mapper_.mapping(op.record.type);
    const auto& rel = require_relation(m, op.relationship, relationship_kind::has_one);
    require_exists(m, op.record.id);

    std::vector<std::pair<std::string, column_value_t>> values;
    if (op.related_record) {
        check_target(m, rel, *op.related_record);
        require_exists(mapper_.mapping(rel.target_type), op.related_record->id);
        values.emplace_back(rel.foreign_key, op.related_record->id);
    } else {
        values.emplace_back(rel.foreign_key, nullptr);
    }
    values.emplace_back("updated_at", now_seconds());
    db_.update(m.table_name, op.record.id, values);
    return require(m, op.record.id);
}

record processor::process(const replace_related_records_operation& op) {
    const auto& m = mapper_.mapping(op.record.type);
    const auto& rel = require_relation(m, op.relationship, relationship_kind::has_many);
    require_exists(m, op.record.id);

    std::vector<std::string> ids;
    ids.reserve(op.related_records.size());
    for (const auto& identity : op.related_records) {
        check_target(m, rel, identity);
        ids.push_back(identity.id);
    }
    replace_related_set(m, rel, op.record.id, ids);
    return require(m, op.record.id);
}

record processor::process(const add_to_related_records_operation& op) {
    const auto& m = mapper_.mapping(op.record.type);
    const auto& rel = require_relation(m, op.relationship, relationship_kind::has_many);
    require_exists(m, op.record.id);
    check_target(m, rel, op.related_record);

    link(rel, op.record.id, op.related_record.id);
    return require(m, op.record.id);
}

record processor::process(const remove_from_related_records_operation& op) {
    const auto& m = mapper_.mapping(op.record.type);
    const auto& rel = require_relation(m, op.relationship, relationship_kind::has_many);
    require_exists(m, op.record.id);
    check_target(m, rel, op.related_record);

    unlink(rel, op.record.id, op.related_record.id);
    return require(m, op.record.id);
}

// ============================================================================
// Query expressions
// ============================================================================

query_result processor::process(const find_record_expression& expr) {
    const auto& m = mapper_.mapping(expr.record.type);
    return std::optional<record>(require(m, expr.record.id));
}

query_result processor::process(const find_records_expression& expr) {
    if (expr.records) {
        return find_by_identities(*expr.records);
    }

    if (!expr.type.empty()) {
        return run_pipeline(mapper_.mapping(expr.type), "", {}, expr.filter, expr.sort, expr.page);
    }

    // Untyped scan: filters, sorts and pages are only meaningful per type
    if (!expr.filter.empty()) throw query_expression_parse_error(describe(expr.filter.front()));
    if (!expr.sort.empty()) throw query_expression_parse_error(describe(expr.sort.front()));
    if (expr.page) throw query_expression_parse_error(describe(*expr.page));

    std::vector<record> all;
    for (const auto& def : mapper_.schema().types()) {
        auto part = run_pipeline(mapper_.mapping(def.name), "", {}, {}, {}, std::nullopt);
        all.insert(all.end(), std::make_move_iterator(part.begin()), std::make_move_iterator(part.end()));
    }
    return all;
}

query_result processor::process(const find_related_record_expression& expr) {
    const auto& m = mapper_.mapping(expr.record.type);
    const auto& rel = require_relation(m, expr.relationship, relationship_kind::has_one);
    require_exists(m, expr.record.id);

    auto ids = related_ids(m, rel, expr.record.id);
    if (ids.empty()) {
        return std::optional<record>();
    }
    return fetch(mapper_.mapping(rel.target_type), ids.front());
}

query_result processor::process(const find_related_records_expression& expr) {
    const auto& m = mapper_.mapping(expr.record.type);
    const auto& rel = require_relation(m, expr.relationship, relationship_kind::has_many);
    require_exists(m, expr.record.id);

    const auto& target = mapper_.mapping(rel.target_type);
    std::string scope;
    if (rel.strategy == relation_strategy::foreign_key_on_target) {
        scope = quote_identifier(rel.foreign_key) + " = ?";
    } else {
        scope = "id IN (SELECT " + quote_identifier(rel.related_column) + " FROM " +
                quote_identifier(rel.join_table) + " WHERE " + quote_identifier(rel.owner_column) + " = ?)";
    }
    return run_pipeline(target, scope, {expr.record.id}, expr.filter, expr.sort, expr.page);
}

std::vector<record> processor::find_by_identities(const std::vector<record_identity>& identities) {
    std::map<std::string, std::vector<std::string>> ids_by_type;
    for (const auto& identity : identities) {
        ids_by_type[identity.type].push_back(identity.id);
    }

    std::map<std::pair<std::string, std::string>, record> found;
    for (const auto& [type, ids] : ids_by_type) {
        const auto& m = mapper_.mapping(type);

        std::ostringstream sql;
        sql << "SELECT * FROM " << quote_identifier(m.table_name) << " WHERE id IN (";
        std::vector<column_value_t> params;
        params.reserve(ids.size());
        for (size_t i = 0; i < ids.size(); ++i) {
            if (i > 0) sql << ", ";
            sql << "?";
            params.emplace_back(ids[i]);
        }
        sql << ")";

        for (const auto& row : db_.query(sql.str(), params)) {
            auto r = codec_.from_row(row, type);
            auto key = std::make_pair(type, r.id);
            found.emplace(std::move(key), std::move(r));
        }
    }

    // Input order; identities without a row are dropped
    std::vector<record> results;
    results.reserve(identities.size());
    for (const auto& identity : identities) {
        auto it = found.find({identity.type, identity.id});
        if (it != found.end()) {
            results.push_back(it->second);
        }
    }
    return results;
}

std::vector<record> processor::run_pipeline(const relational_mapping& m,
                                            const std::string& scope,
                                            std::vector<column_value_t> params,
                                            const std::vector<filter_specifier>& filters,
                                            const std::vector<sort_specifier>& sorts,
                                            const std::optional<page_specifier>& page) {
    std::vector<std::string> conditions;
    if (!scope.empty()) {
        conditions.push_back(scope);
    }

    for (const auto& f : filters) {
        if (f.kind != filter_kind::attribute) {
            throw query_expression_parse_error(describe(f));
        }
        const auto* column = m.attribute(f.attribute);
        if (!column) {
            throw query_expression_parse_error(describe(f));
        }
        if (std::holds_alternative<std::nullptr_t>(f.value)) {
            if (f.op != comparator::equal) {
                throw query_expression_parse_error(describe(f));
            }
            conditions.push_back(quote_identifier(column->column) + " IS NULL");
            continue;
        }

        column_value_t value;
        try {
            value = codec_.to_column(m, *column, f.value);
        } catch (const operation_error&) {
            throw query_expression_parse_error(describe(f));
        }
        conditions.push_back(quote_identifier(column->column) + " " + sql_operator(f.op) + " ?");
        params.push_back(std::move(value));
    }

    std::ostringstream sql;
    sql << "SELECT * FROM " << quote_identifier(m.table_name);
    for (size_t i = 0; i < conditions.size(); ++i) {
        sql << (i == 0 ? " WHERE " : " AND ") << conditions[i];
    }

    // Sort keys in the order given, insertion order breaks ties
    sql << " ORDER BY ";
    for (const auto& s : sorts) {
        const auto* column = s.kind == sort_kind::attribute ? m.attribute(s.attribute) : nullptr;
        if (!column) {
            throw query_expression_parse_error(describe(s));
        }
        sql << quote_identifier(column->column)
            << (s.order == sort_order::descending ? " DESC" : " ASC") << ", ";
    }
    sql << "rowid";

    if (page) {
        if (page->kind != page_kind::offset_limit ||
            (page->offset && *page->offset < 0) ||
            (page->limit && *page->limit < 0)) {
            throw query_expression_parse_error(describe(*page));
        }
        sql << " LIMIT ? OFFSET ?";
        params.emplace_back(page->limit.value_or(-1));
        params.emplace_back(page->offset.value_or(0));
    }

    LOG_DEBUG("processor", "%s", sql.str().c_str());

    std::vector<record> results;
    for (const auto& row : db_.query(sql.str(), params)) {
        results.push_back(codec_.from_row(row, m.type));
    }
    return results;
}

} // namespace trellis
