#pragma once

#include "db.hpp"
#include "mapper.hpp"
#include "record.hpp"
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace trellis {

/// Flat relational form of a record payload. `id` and the reserved timestamp
/// columns are never part of `columns`.
struct row_data {
    std::vector<std::pair<std::string, column_value_t>> columns;
    std::map<std::string, std::optional<std::string>> to_one;    // relationship -> related id
    std::map<std::string, std::vector<std::string>> to_many;     // relationship -> related ids
};

/// Converts between abstract records and table rows of one type.
class record_codec {
public:
    explicit record_codec(model_mapper& mapper) : mapper_(mapper) {}

    /// Projects declared attributes only; undeclared keys are dropped.
    /// Relationship payloads are checked against the declared kind and target.
    row_data to_row(const record& r) const;

    /// Declared attributes that are present and non-null, coerced to their
    /// declared type. Single-valued relationships are embedded only when their
    /// key column is set; collections are never embedded.
    record from_row(const database::row_t& row, const std::string& type) const;

    /// Storage form of one attribute value. Throws operation_error when the
    /// value cannot represent the attribute's declared type.
    column_value_t to_column(const relational_mapping& mapping,
                             const attribute_column& column,
                             const attribute_value& value) const;

    attribute_value from_column(const attribute_column& column, const column_value_t& value) const;

private:
    model_mapper& mapper_;

    std::string related_id(const relation_mapping& rel, const relational_mapping& owner,
                           const record_identity& identity) const;
};

} // namespace trellis
