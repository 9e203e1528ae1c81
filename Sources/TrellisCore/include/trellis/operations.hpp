#pragma once

#include "record.hpp"
#include <string>
#include <variant>
#include <vector>

namespace trellis {

// ============================================================================
// Write operations. Each carries the target identity plus its payload.
// ============================================================================

struct add_record_operation {
    trellis::record record;
};

/// Attributes present are overwritten, omitted ones keep their stored value.
/// Relationships present replace the full related set.
struct update_record_operation {
    trellis::record record;
};

struct remove_record_operation {
    record_identity record;
};

struct replace_attribute_operation {
    record_identity record;
    std::string attribute;
    attribute_value value;
};

struct replace_related_record_operation {
    record_identity record;
    std::string relationship;
    std::optional<record_identity> related_record;
};

struct replace_related_records_operation {
    record_identity record;
    std::string relationship;
    std::vector<record_identity> related_records;
};

struct add_to_related_records_operation {
    record_identity record;
    std::string relationship;
    record_identity related_record;
};

struct remove_from_related_records_operation {
    record_identity record;
    std::string relationship;
    record_identity related_record;
};

using record_operation = std::variant<
    add_record_operation,
    update_record_operation,
    remove_record_operation,
    replace_attribute_operation,
    replace_related_record_operation,
    replace_related_records_operation,
    add_to_related_records_operation,
    remove_from_related_records_operation
>;

/// Identity targeted by an operation.
inline const std::string& operation_type(const record_operation& op) {
    return std::visit([](const auto& o) -> const std::string& { return o.record.type; }, op);
}

inline const std::string& operation_id(const record_operation& op) {
    return std::visit([](const auto& o) -> const std::string& { return o.record.id; }, op);
}

/// Wire name of an operation ("addRecord", "replaceAttribute", ...).
const char* operation_name(const record_operation& op);

} // namespace trellis
