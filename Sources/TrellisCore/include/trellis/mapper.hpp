#pragma once

#include "schema.hpp"
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace trellis {

enum class relation_strategy {
    owned_foreign_key,       // this table holds `<relationship>_id`
    foreign_key_on_target,   // the target table holds `<inverse>_id`
    join_table               // two-column link table shared by both sides
};

struct attribute_column {
    std::string attribute;
    std::string column;
    attribute_type type = attribute_type::string;
    bool reserved = false;   // maps onto created_at / updated_at
};

struct relation_mapping {
    std::string relationship;
    relationship_kind kind = relationship_kind::has_one;
    relation_strategy strategy = relation_strategy::owned_foreign_key;
    std::string target_type;
    std::string target_table;
    std::string inverse;

    // owned_foreign_key: column on this table.
    // foreign_key_on_target: column on target_table.
    std::string foreign_key;

    // join_table only
    std::string join_table;
    std::string owner_column;     // holds this record's id
    std::string related_column;   // holds the related record's id
};

/// Compiled relational encoding of one type.
struct relational_mapping {
    std::string type;
    std::string table_name;
    std::vector<attribute_column> attributes;
    std::vector<relation_mapping> relations;

    const attribute_column* attribute(const std::string& name) const;
    const relation_mapping* relation(const std::string& name) const;
};

/// Compiles and memoizes one relational_mapping per type.
///
/// Resolving a relationship only needs the kind of the inverse relationship on
/// the target, so a type reached again through a cycle while its own mapping is
/// under construction is skipped instead of rebuilt.
class model_mapper {
public:
    explicit model_mapper(const schema_registry& schema);

    model_mapper(const model_mapper&) = delete;
    model_mapper& operator=(const model_mapper&) = delete;

    /// Throws operation_error for an undeclared type, schema_error when the
    /// type's relationships are malformed.
    const relational_mapping& mapping(const std::string& type);

    /// Builds every registered type. Any schema_error surfaces here.
    void build_all();

    bool is_built(const std::string& type) const { return cache_.count(type) > 0; }

    const schema_registry& schema() const { return schema_; }

private:
    const schema_registry& schema_;
    std::unordered_map<std::string, std::unique_ptr<relational_mapping>> cache_;
    std::unordered_set<std::string> building_;

    void build(const type_definition& def);
    relation_mapping resolve_relation(const type_definition& def, const relationship_def& rel);
};

const char* relation_strategy_name(relation_strategy strategy);

} // namespace trellis
