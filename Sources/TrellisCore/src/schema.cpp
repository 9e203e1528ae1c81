#include "trellis/schema.hpp"
#include "trellis/errors.hpp"

namespace trellis {

const attribute_def* type_definition::attribute(const std::string& attr) const {
    for (const auto& a : attributes) {
        if (a.name == attr) return &a;
    }
    return nullptr;
}

const relationship_def* type_definition::relationship(const std::string& rel) const {
    for (const auto& r : relationships) {
        if (r.name == rel) return &r;
    }
    return nullptr;
}

schema_registry::schema_registry(std::vector<type_definition> types) : types_(std::move(types)) {
    for (size_t i = 0; i < types_.size(); ++i) {
        auto [_, inserted] = index_.emplace(types_[i].name, i);
        if (!inserted) {
            throw schema_error("Type \"" + types_[i].name + "\" is declared more than once");
        }
    }
}

const type_definition* schema_registry::get_type(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return nullptr;
    }
    return &types_[it->second];
}

const relationship_def* schema_registry::get_relationship(const std::string& type,
                                                          const std::string& name) const {
    const auto* def = get_type(type);
    return def ? def->relationship(name) : nullptr;
}

const char* attribute_type_name(attribute_type type) {
    switch (type) {
        case attribute_type::string: return "string";
        case attribute_type::number: return "number";
        case attribute_type::boolean: return "boolean";
        case attribute_type::date: return "date";
        case attribute_type::datetime: return "datetime";
    }
    return "string";
}

const char* relationship_kind_name(relationship_kind kind) {
    return kind == relationship_kind::has_one ? "hasOne" : "hasMany";
}

} // namespace trellis
