#pragma once

#include "codec.hpp"
#include "db.hpp"
#include "mapper.hpp"
#include "operations.hpp"
#include "query.hpp"
#include "schema.hpp"
#include <optional>
#include <string>
#include <vector>

namespace trellis {

/// Executes operation and query batches against one connection.
///
/// Each batch runs inside exactly one transaction, operations strictly in the
/// order given, every operation seeing the effects of the ones before it. The
/// first exception rolls the whole batch back and is rethrown unchanged.
///
/// All mappings are compiled in the constructor, so a malformed registry
/// raises schema_error here and never from inside a batch.
class processor {
public:
    processor(database& db, const schema_registry& schema);

    processor(const processor&) = delete;
    processor& operator=(const processor&) = delete;

    /// One result per operation: the target record re-read after the write
    /// (or, for removeRecord, as it was before deletion).
    std::vector<record> update(const std::vector<record_operation>& operations);

    /// One result per expression.
    std::vector<query_result> query(const std::vector<query_expression>& expressions);

    model_mapper& mapper() { return mapper_; }
    const record_codec& codec() const { return codec_; }

private:
    database& db_;
    model_mapper mapper_;
    record_codec codec_;

    // Write operations
    record process(const add_record_operation& op);
    record process(const update_record_operation& op);
    record process(const remove_record_operation& op);
    record process(const replace_attribute_operation& op);
    record process(const replace_related_record_operation& op);
    record process(const replace_related_records_operation& op);
    record process(const add_to_related_records_operation& op);
    record process(const remove_from_related_records_operation& op);

    // Query expressions
    query_result process(const find_record_expression& expr);
    query_result process(const find_records_expression& expr);
    query_result process(const find_related_record_expression& expr);
    query_result process(const find_related_records_expression& expr);

    // Row access
    std::optional<record> fetch(const relational_mapping& m, const std::string& id);
    record require(const relational_mapping& m, const std::string& id);
    void require_exists(const relational_mapping& m, const std::string& id);
    bool row_exists(const std::string& table, const std::string& id);

    const relation_mapping& require_relation(const relational_mapping& m,
                                             const std::string& name,
                                             relationship_kind kind);

    // Relationship links, by strategy
    std::vector<std::string> related_ids(const relational_mapping& m,
                                         const relation_mapping& rel,
                                         const std::string& owner_id);
    void link(const relation_mapping& rel, const std::string& owner_id, const std::string& related_id);
    void unlink(const relation_mapping& rel, const std::string& owner_id, const std::string& related_id);
    void replace_related_set(const relational_mapping& m,
                             const relation_mapping& rel,
                             const std::string& owner_id,
                             const std::vector<std::string>& requested);

    // filter -> sort -> page over `m`'s table, restricted by `scope`
    std::vector<record> run_pipeline(const relational_mapping& m,
                                     const std::string& scope,
                                     std::vector<column_value_t> params,
                                     const std::vector<filter_specifier>& filters,
                                     const std::vector<sort_specifier>& sorts,
                                     const std::optional<page_specifier>& page);
    std::vector<record> find_by_identities(const std::vector<record_identity>& identities);
};

} // namespace trellis
