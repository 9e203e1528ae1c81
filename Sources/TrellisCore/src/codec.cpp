#include "trellis/codec.hpp"
#include "trellis/errors.hpp"

namespace trellis {

namespace {

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

[[noreturn]] void type_mismatch(const relational_mapping& mapping, const attribute_column& column) {
    throw operation_error("Attribute \"" + column.attribute + "\" on type \"" + mapping.type +
                          "\" expects a " + attribute_type_name(column.type) + " value");
}

} // namespace

column_value_t record_codec::to_column(const relational_mapping& mapping,
                                       const attribute_column& column,
                                       const attribute_value& value) const {
    if (std::holds_alternative<std::nullptr_t>(value)) {
        return nullptr;
    }

    switch (column.type) {
        case attribute_type::string:
            if (auto* s = std::get_if<std::string>(&value)) return *s;
            break;
        case attribute_type::number:
            if (auto* d = std::get_if<double>(&value)) return *d;
            break;
        case attribute_type::boolean:
            if (auto* b = std::get_if<bool>(&value)) return detail::to_column_value(*b);
            break;
        case attribute_type::date:
            if (auto* s = std::get_if<std::string>(&value)) return *s;
            if (auto* t = std::get_if<timestamp_t>(&value)) {
                return detail::format_timestamp(*t).substr(0, 10);
            }
            break;
        case attribute_type::datetime:
            if (auto* t = std::get_if<timestamp_t>(&value)) return detail::to_column_value(*t);
            if (auto* d = std::get_if<double>(&value)) return *d;
            if (auto* s = std::get_if<std::string>(&value)) {
                if (auto parsed = detail::parse_timestamp(*s)) {
                    return detail::to_column_value(*parsed);
                }
            }
            break;
    }
    type_mismatch(mapping, column);
}

attribute_value record_codec::from_column(const attribute_column& column,
                                          const column_value_t& value) const {
    // Reserved timestamp columns are always stored as epoch seconds
    attribute_type type = column.reserved ? attribute_type::datetime : column.type;

    return std::visit(overloaded{
        [](std::nullptr_t) -> attribute_value { return nullptr; },
        [type](int64_t v) -> attribute_value {
            switch (type) {
                case attribute_type::boolean: return v == 1;
                case attribute_type::datetime: return detail::timestamp_from_seconds(static_cast<double>(v));
                case attribute_type::string:
                case attribute_type::date: return std::to_string(v);
                case attribute_type::number: break;
            }
            return static_cast<double>(v);
        },
        [type](double v) -> attribute_value {
            switch (type) {
                case attribute_type::boolean: return v == 1.0;
                case attribute_type::datetime: return detail::timestamp_from_seconds(v);
                default: break;
            }
            return v;
        },
        [type](const std::string& v) -> attribute_value {
            if (type == attribute_type::datetime) {
                if (auto parsed = detail::parse_timestamp(v)) return *parsed;
            }
            return v;
        },
    }, value);
}

std::string record_codec::related_id(const relation_mapping& rel, const relational_mapping& owner,
                                     const record_identity& identity) const {
    if (identity.type != rel.target_type) {
        throw operation_error("Relationship \"" + rel.relationship + "\" on type \"" + owner.type +
                              "\" targets \"" + rel.target_type + "\", got \"" + identity.type + "\"");
    }
    return identity.id;
}

row_data record_codec::to_row(const record& r) const {
    const auto& m = mapper_.mapping(r.type);
    row_data row;

    if (r.attributes) {
        for (const auto& [name, value] : *r.attributes) {
            const auto* col = m.attribute(name);
            if (!col || col->reserved) continue;
            row.columns.emplace_back(col->column, to_column(m, *col, value));
        }
    }

    if (r.relationships) {
        for (const auto& [name, data] : *r.relationships) {
            const auto* rel = m.relation(name);
            if (!rel) continue;

            if (rel->kind == relationship_kind::has_one) {
                const auto* one = std::get_if<to_one_data>(&data);
                if (!one) {
                    throw operation_error("Relationship \"" + name + "\" on type \"" + r.type +
                                          "\" is single-valued");
                }
                row.to_one[name] = *one ? std::optional<std::string>(related_id(*rel, m, **one))
                                        : std::nullopt;
            } else {
                const auto* many = std::get_if<to_many_data>(&data);
                if (!many) {
                    throw operation_error("Relationship \"" + name + "\" on type \"" + r.type +
                                          "\" is collection-valued");
                }
                auto& ids = row.to_many[name];
                for (const auto& identity : *many) {
                    ids.push_back(related_id(*rel, m, identity));
                }
            }
        }
    }
    return row;
}

record record_codec::from_row(const database::row_t& row, const std::string& type) const {
    const auto& m = mapper_.mapping(type);

    record r;
    r.type = type;
    if (auto it = row.find("id"); it != row.end()) {
        if (auto* id = std::get_if<std::string>(&it->second)) r.id = *id;
    }

    attribute_map attributes;
    for (const auto& col : m.attributes) {
        auto it = row.find(col.column);
        if (it == row.end() || std::holds_alternative<std::nullptr_t>(it->second)) continue;
        attributes[col.attribute] = from_column(col, it->second);
    }

    relationship_map relationships;
    for (const auto& rel : m.relations) {
        if (rel.strategy != relation_strategy::owned_foreign_key) continue;
        auto it = row.find(rel.foreign_key);
        if (it == row.end()) continue;
        if (auto* id = std::get_if<std::string>(&it->second)) {
            relationships[rel.relationship] = to_one_data(record_identity{rel.target_type, *id});
        }
    }

    if (!attributes.empty()) r.attributes = std::move(attributes);
    if (!relationships.empty()) r.relationships = std::move(relationships);
    return r;
}

} // namespace trellis
