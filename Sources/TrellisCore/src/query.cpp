#include "trellis/query.hpp"
#include "trellis/operations.hpp"
#include <sstream>

namespace trellis {

const char* comparator_name(comparator op) {
    switch (op) {
        case comparator::equal: return "equal";
        case comparator::gt: return "gt";
        case comparator::lt: return "lt";
        case comparator::gte: return "gte";
        case comparator::lte: return "lte";
    }
    return "equal";
}

std::string describe(const filter_specifier& filter) {
    std::ostringstream out;
    switch (filter.kind) {
        case filter_kind::attribute:
            out << "filter{attribute:" << filter.attribute << " " << comparator_name(filter.op) << "}";
            break;
        case filter_kind::related_record:
            out << "filter{relatedRecord:" << filter.relation << "}";
            break;
        case filter_kind::related_records:
            out << "filter{relatedRecords:" << filter.relation << "}";
            break;
    }
    return out.str();
}

std::string describe(const sort_specifier& sort) {
    return std::string("sort{attribute:") + sort.attribute +
           (sort.order == sort_order::descending ? " descending}" : " ascending}");
}

std::string describe(const page_specifier& page) {
    std::ostringstream out;
    out << "page{offsetLimit";
    if (page.offset) out << " offset:" << *page.offset;
    if (page.limit) out << " limit:" << *page.limit;
    out << "}";
    return out.str();
}

const char* operation_name(const record_operation& op) {
    static const char* const names[] = {
        "addRecord",
        "updateRecord",
        "removeRecord",
        "replaceAttribute",
        "replaceRelatedRecord",
        "replaceRelatedRecords",
        "addToRelatedRecords",
        "removeFromRelatedRecords",
    };
    return names[op.index()];
}

} // namespace trellis
