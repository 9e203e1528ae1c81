#include "trellis/wire.hpp"
#include "trellis/errors.hpp"
#include "trellis/log.hpp"

using json = nlohmann::json;
using ordered_json = nlohmann::ordered_json;

namespace trellis {

// ============================================================================
// Records
// ============================================================================

void to_json(json& j, const record_identity& identity) {
    j = json{{"type", identity.type}, {"id", identity.id}};
}

void from_json(const json& j, record_identity& identity) {
    identity.type = j.at("type").get<std::string>();
    identity.id = j.at("id").get<std::string>();
}

void to_json(json& j, const record& r) {
    j = json{{"type", r.type}, {"id", r.id}};
    if (r.attributes) {
        json attributes = json::object();
        for (const auto& [name, value] : *r.attributes) {
            attributes[name] = wire::value_to_json(value);
        }
        j["attributes"] = std::move(attributes);
    }
    if (r.relationships) {
        json relationships = json::object();
        for (const auto& [name, data] : *r.relationships) {
            json payload;
            if (const auto* one = std::get_if<to_one_data>(&data)) {
                payload = *one ? json(**one) : json(nullptr);
            } else {
                payload = json(std::get<to_many_data>(data));
            }
            relationships[name] = json{{"data", std::move(payload)}};
        }
        j["relationships"] = std::move(relationships);
    }
}

void from_json(const json& j, record& r) {
    r.type = j.at("type").get<std::string>();
    r.id = j.at("id").get<std::string>();

    if (auto it = j.find("attributes"); it != j.end() && it->is_object()) {
        attribute_map attributes;
        for (const auto& [name, value] : it->items()) {
            attributes[name] = wire::value_from_json(value);
        }
        r.attributes = std::move(attributes);
    }

    if (auto it = j.find("relationships"); it != j.end() && it->is_object()) {
        relationship_map relationships;
        for (const auto& [name, value] : it->items()) {
            const json& data = value.at("data");
            if (data.is_array()) {
                relationships[name] = data.get<to_many_data>();
            } else if (data.is_null()) {
                relationships[name] = to_one_data();
            } else {
                relationships[name] = to_one_data(data.get<record_identity>());
            }
        }
        r.relationships = std::move(relationships);
    }
}

} // namespace trellis

namespace trellis::wire {

namespace {

attribute_type parse_attribute_type(const std::string& name) {
    if (name == "string") return attribute_type::string;
    if (name == "number") return attribute_type::number;
    if (name == "boolean") return attribute_type::boolean;
    if (name == "date") return attribute_type::date;
    if (name == "datetime") return attribute_type::datetime;
    throw schema_error("Unknown attribute type \"" + name + "\"");
}

relationship_kind parse_relationship_kind(const std::string& name) {
    if (name == "hasOne") return relationship_kind::has_one;
    if (name == "hasMany") return relationship_kind::has_many;
    throw schema_error("Unknown relationship kind \"" + name + "\"");
}

relationship_def relationship_from_json(const std::string& name, const ordered_json& j) {
    relationship_def rel;
    rel.name = name;

    // Older declarations put the kind in "type" and the target in "model"
    const bool legacy = !j.contains("kind") && j.contains("model");
    rel.kind = parse_relationship_kind(legacy ? j.at("type").get<std::string>()
                                              : j.at("kind").get<std::string>());

    const ordered_json* target = nullptr;
    if (legacy) {
        target = &j.at("model");
    } else if (auto it = j.find("type"); it != j.end()) {
        target = &*it;
    }
    if (target) {
        if (target->is_array()) {
            rel.types = target->get<std::vector<std::string>>();
        } else if (target->is_string()) {
            rel.types.push_back(target->get<std::string>());
        }
    }

    if (auto it = j.find("inverse"); it != j.end() && it->is_string()) {
        rel.inverse = it->get<std::string>();
    }
    return rel;
}

comparator parse_comparator(const std::string& name, const json& context) {
    if (name == "equal") return comparator::equal;
    if (name == "gt") return comparator::gt;
    if (name == "lt") return comparator::lt;
    if (name == "gte") return comparator::gte;
    if (name == "lte") return comparator::lte;
    throw query_expression_parse_error(context.dump());
}

filter_specifier filter_from_json(const json& j) {
    filter_specifier f;
    const std::string kind = j.value("kind", "attribute");
    if (kind == "attribute") {
        f.kind = filter_kind::attribute;
        f.attribute = j.at("attribute").get<std::string>();
        f.op = parse_comparator(j.value("op", "equal"), j);
        if (auto it = j.find("value"); it != j.end()) {
            if (it->is_object() || it->is_array()) {
                throw query_expression_parse_error(j.dump());
            }
            f.value = value_from_json(*it);
        }
    } else if (kind == "relatedRecord" || kind == "relatedRecords") {
        f.kind = kind == "relatedRecord" ? filter_kind::related_record : filter_kind::related_records;
        f.relation = j.at("relation").get<std::string>();
        if (auto it = j.find("records"); it != j.end() && it->is_array()) {
            f.records = it->get<std::vector<record_identity>>();
        } else if (auto rec = j.find("record"); rec != j.end() && rec->is_object()) {
            f.records.push_back(rec->get<record_identity>());
        }
    } else {
        throw query_expression_parse_error(j.dump());
    }
    return f;
}

sort_specifier sort_from_json(const json& j) {
    sort_specifier s;
    if (j.is_string()) {
        // "name" ascending, "-name" descending
        auto text = j.get<std::string>();
        if (!text.empty() && text.front() == '-') {
            s.order = sort_order::descending;
            text.erase(0, 1);
        }
        s.attribute = text;
        return s;
    }

    if (j.value("kind", "attribute") != "attribute") {
        throw query_expression_parse_error(j.dump());
    }
    s.attribute = j.at("attribute").get<std::string>();
    const std::string order = j.value("order", "ascending");
    if (order == "descending") {
        s.order = sort_order::descending;
    } else if (order != "ascending") {
        throw query_expression_parse_error(j.dump());
    }
    return s;
}

page_specifier page_from_json(const json& j) {
    if (j.value("kind", "offsetLimit") != "offsetLimit") {
        throw query_expression_parse_error(j.dump());
    }
    page_specifier p;
    if (auto it = j.find("offset"); it != j.end() && !it->is_null()) p.offset = it->get<int64_t>();
    if (auto it = j.find("limit"); it != j.end() && !it->is_null()) p.limit = it->get<int64_t>();
    return p;
}

template<typename Expression>
void read_pipeline(const json& j, Expression& expr) {
    if (auto it = j.find("filter"); it != j.end()) {
        for (const auto& f : *it) expr.filter.push_back(filter_from_json(f));
    }
    if (auto it = j.find("sort"); it != j.end()) {
        for (const auto& s : *it) expr.sort.push_back(sort_from_json(s));
    }
    if (auto it = j.find("page"); it != j.end() && !it->is_null()) {
        expr.page = page_from_json(*it);
    }
}

record_operation decode_operation(const json& j) {
    const std::string op = j.at("op").get<std::string>();

    if (op == "addRecord") {
        return add_record_operation{j.at("record").get<record>()};
    }
    if (op == "updateRecord") {
        return update_record_operation{j.at("record").get<record>()};
    }
    if (op == "removeRecord") {
        return remove_record_operation{j.at("record").get<record_identity>()};
    }
    if (op == "replaceAttribute") {
        return replace_attribute_operation{
            j.at("record").get<record_identity>(),
            j.at("attribute").get<std::string>(),
            value_from_json(j.at("value"))};
    }
    if (op == "replaceRelatedRecord") {
        replace_related_record_operation o;
        o.record = j.at("record").get<record_identity>();
        o.relationship = j.at("relationship").get<std::string>();
        if (auto it = j.find("relatedRecord"); it != j.end() && !it->is_null()) {
            o.related_record = it->get<record_identity>();
        }
        return o;
    }
    if (op == "replaceRelatedRecords") {
        return replace_related_records_operation{
            j.at("record").get<record_identity>(),
            j.at("relationship").get<std::string>(),
            j.at("relatedRecords").get<std::vector<record_identity>>()};
    }
    if (op == "addToRelatedRecords") {
        return add_to_related_records_operation{
            j.at("record").get<record_identity>(),
            j.at("relationship").get<std::string>(),
            j.at("relatedRecord").get<record_identity>()};
    }
    if (op == "removeFromRelatedRecords") {
        return remove_from_related_records_operation{
            j.at("record").get<record_identity>(),
            j.at("relationship").get<std::string>(),
            j.at("relatedRecord").get<record_identity>()};
    }
    throw operation_error("Unknown operation " + op);
}

query_expression decode_expression(const json& j) {
    const std::string op = j.at("op").get<std::string>();

    if (op == "findRecord") {
        return find_record_expression{j.at("record").get<record_identity>()};
    }
    if (op == "findRecords") {
        find_records_expression expr;
        expr.type = j.value("type", "");
        if (auto it = j.find("records"); it != j.end() && !it->is_null()) {
            expr.records = it->get<std::vector<record_identity>>();
        }
        read_pipeline(j, expr);
        return expr;
    }
    if (op == "findRelatedRecord") {
        return find_related_record_expression{
            j.at("record").get<record_identity>(),
            j.at("relationship").get<std::string>()};
    }
    if (op == "findRelatedRecords") {
        find_related_records_expression expr;
        expr.record = j.at("record").get<record_identity>();
        expr.relationship = j.at("relationship").get<std::string>();
        read_pipeline(j, expr);
        return expr;
    }
    throw query_expression_parse_error(j.dump());
}

} // namespace

schema_registry schema_from_json(const ordered_json& j) {
    std::vector<type_definition> types;
    try {
        const ordered_json& models = j.contains("models") ? j.at("models") : j;
        for (const auto& [type_name, model] : models.items()) {
            type_definition def;
            def.name = type_name;
            if (auto it = model.find("attributes"); it != model.end()) {
                for (const auto& [attr_name, attr] : it->items()) {
                    def.attributes.push_back({attr_name, parse_attribute_type(attr.value("type", "string"))});
                }
            }
            if (auto it = model.find("relationships"); it != model.end()) {
                for (const auto& [rel_name, rel] : it->items()) {
                    def.relationships.push_back(relationship_from_json(rel_name, rel));
                }
            }
            types.push_back(std::move(def));
        }
    } catch (const ordered_json::exception& e) {
        throw schema_error(std::string("Malformed schema: ") + e.what());
    }
    return schema_registry(std::move(types));
}

json value_to_json(const attribute_value& value) {
    return std::visit([](const auto& v) -> json { return v; }, value);
}

attribute_value value_from_json(const json& j) {
    if (j.is_null()) return nullptr;
    if (j.is_boolean()) return j.get<bool>();
    if (j.is_number()) return j.get<double>();
    if (j.is_string()) return j.get<std::string>();
    throw operation_error("Unsupported attribute value: " + j.dump());
}

record_operation operation_from_json(const json& j) {
    try {
        return decode_operation(j);
    } catch (const json::exception& e) {
        LOG_WARN("wire", "Malformed operation %s: %s", j.dump().c_str(), e.what());
        throw operation_error(std::string("Malformed operation: ") + e.what());
    }
}

json operation_to_json(const record_operation& op) {
    json j = std::visit([](const auto& o) -> json {
        using T = std::decay_t<decltype(o)>;
        json out;
        if constexpr (std::is_same_v<T, add_record_operation> ||
                      std::is_same_v<T, update_record_operation>) {
            out["record"] = o.record;
        } else if constexpr (std::is_same_v<T, remove_record_operation>) {
            out["record"] = o.record;
        } else if constexpr (std::is_same_v<T, replace_attribute_operation>) {
            out["record"] = o.record;
            out["attribute"] = o.attribute;
            out["value"] = value_to_json(o.value);
        } else if constexpr (std::is_same_v<T, replace_related_record_operation>) {
            out["record"] = o.record;
            out["relationship"] = o.relationship;
            out["relatedRecord"] = o.related_record ? json(*o.related_record) : json(nullptr);
        } else if constexpr (std::is_same_v<T, replace_related_records_operation>) {
            out["record"] = o.record;
            out["relationship"] = o.relationship;
            out["relatedRecords"] = o.related_records;
        } else {
            out["record"] = o.record;
            out["relationship"] = o.relationship;
            out["relatedRecord"] = o.related_record;
        }
        return out;
    }, op);
    j["op"] = operation_name(op);
    return j;
}

query_expression expression_from_json(const json& j) {
    try {
        return decode_expression(j);
    } catch (const json::exception& e) {
        LOG_WARN("wire", "Malformed query expression %s: %s", j.dump().c_str(), e.what());
        throw query_expression_parse_error(j.dump());
    }
}

json result_to_json(const query_result& result) {
    if (const auto* one = std::get_if<std::optional<record>>(&result)) {
        return *one ? json(**one) : json(nullptr);
    }
    return json(std::get<std::vector<record>>(result));
}

std::vector<record_operation> operations_from_json(const json& j) {
    std::vector<record_operation> ops;
    if (j.is_array()) {
        for (const auto& item : j) ops.push_back(operation_from_json(item));
    } else {
        ops.push_back(operation_from_json(j));
    }
    return ops;
}

std::vector<query_expression> expressions_from_json(const json& j) {
    std::vector<query_expression> exprs;
    if (j.is_array()) {
        for (const auto& item : j) exprs.push_back(expression_from_json(item));
    } else {
        exprs.push_back(expression_from_json(j));
    }
    return exprs;
}

} // namespace trellis::wire
