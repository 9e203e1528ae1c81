#pragma once

#include "record.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace trellis {

// ============================================================================
// Filter / sort / page specifiers
// ============================================================================

enum class filter_kind {
    attribute,
    related_record,   // decoded from the wire, rejected by the pipeline
    related_records   // decoded from the wire, rejected by the pipeline
};

enum class comparator {
    equal,
    gt,
    lt,
    gte,
    lte
};

struct filter_specifier {
    filter_kind kind = filter_kind::attribute;
    std::string attribute;         // attribute filters
    comparator op = comparator::equal;
    attribute_value value;
    std::string relation;          // relation filters
    std::vector<record_identity> records;
};

enum class sort_kind {
    attribute
};

enum class sort_order {
    ascending,
    descending
};

struct sort_specifier {
    sort_kind kind = sort_kind::attribute;
    std::string attribute;
    sort_order order = sort_order::ascending;
};

enum class page_kind {
    offset_limit
};

struct page_specifier {
    page_kind kind = page_kind::offset_limit;
    std::optional<int64_t> offset;
    std::optional<int64_t> limit;
};

// ============================================================================
// Query expressions
// ============================================================================

struct find_record_expression {
    record_identity record;
};

/// Either every record of `type` run through filter -> sort -> page, or,
/// when `records` is set, a batch fetch by identity. An empty `type` with no
/// identity list scans every registered type.
struct find_records_expression {
    std::string type;
    std::optional<std::vector<record_identity>> records;
    std::vector<filter_specifier> filter;
    std::vector<sort_specifier> sort;
    std::optional<page_specifier> page;
};

struct find_related_record_expression {
    record_identity record;
    std::string relationship;
};

struct find_related_records_expression {
    record_identity record;
    std::string relationship;
    std::vector<filter_specifier> filter;
    std::vector<sort_specifier> sort;
    std::optional<page_specifier> page;
};

using query_expression = std::variant<
    find_record_expression,
    find_records_expression,
    find_related_record_expression,
    find_related_records_expression
>;

/// Result of one expression: a single (possibly absent) record, or a list.
using query_result = std::variant<std::optional<record>, std::vector<record>>;

/// Human-readable rendering used in parse errors, e.g. "filter{attribute:sequence gt}".
std::string describe(const filter_specifier& filter);
std::string describe(const sort_specifier& sort);
std::string describe(const page_specifier& page);

const char* comparator_name(comparator op);

} // namespace trellis
