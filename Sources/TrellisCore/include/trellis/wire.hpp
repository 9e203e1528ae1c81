#pragma once

#include "operations.hpp"
#include "query.hpp"
#include "record.hpp"
#include "schema.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// ============================================================================
// nlohmann::json ADL serialization for trellis types
// ============================================================================

namespace trellis {

void to_json(nlohmann::json& j, const record_identity& identity);
void from_json(const nlohmann::json& j, record_identity& identity);

/// {"type", "id", "attributes"?, "relationships"?: {name: {"data": ...}}}
void to_json(nlohmann::json& j, const record& r);
void from_json(const nlohmann::json& j, record& r);

} // namespace trellis

// timestamp_t is std::chrono::time_point, so ADL won't find functions in the trellis namespace.
namespace nlohmann {
template <>
struct adl_serializer<trellis::timestamp_t> {
    /// ISO-8601 UTC string
    static void to_json(json& j, const trellis::timestamp_t& t) {
        j = trellis::detail::format_timestamp(t);
    }
};
} // namespace nlohmann

namespace trellis::wire {

/// {"models": {type: {"attributes": {...}, "relationships": {...}}}}.
/// Types, attributes and relationships are registered in declaration order.
/// Throws schema_error on a malformed declaration.
schema_registry schema_from_json(const nlohmann::ordered_json& j);

nlohmann::json value_to_json(const attribute_value& value);
attribute_value value_from_json(const nlohmann::json& j);

/// Throws operation_error for an unknown "op" or a malformed payload.
record_operation operation_from_json(const nlohmann::json& j);
nlohmann::json operation_to_json(const record_operation& op);

/// Throws query_expression_parse_error for unknown ops, filter, sort or page
/// kinds and malformed payloads.
query_expression expression_from_json(const nlohmann::json& j);

nlohmann::json result_to_json(const query_result& result);

/// Accepts one object or an array of them.
std::vector<record_operation> operations_from_json(const nlohmann::json& j);
std::vector<query_expression> expressions_from_json(const nlohmann::json& j);

} // namespace trellis::wire
