#include "trellis/mapper.hpp"
#include "trellis/errors.hpp"
#include "trellis/inflector.hpp"
#include "trellis/log.hpp"

namespace trellis {

const attribute_column* relational_mapping::attribute(const std::string& name) const {
    for (const auto& a : attributes) {
        if (a.attribute == name) return &a;
    }
    return nullptr;
}

const relation_mapping* relational_mapping::relation(const std::string& name) const {
    for (const auto& r : relations) {
        if (r.relationship == name) return &r;
    }
    return nullptr;
}

model_mapper::model_mapper(const schema_registry& schema) : schema_(schema) {}

const relational_mapping& model_mapper::mapping(const std::string& type) {
    auto it = cache_.find(type);
    if (it != cache_.end()) {
        return *it->second;
    }
    const auto* def = schema_.get_type(type);
    if (!def) {
        throw operation_error("Unknown record type: " + type);
    }
    build(*def);
    return *cache_.at(type);
}

void model_mapper::build_all() {
    for (const auto& def : schema_.types()) {
        if (!is_built(def.name)) {
            build(def);
        }
    }
}

void model_mapper::build(const type_definition& def) {
    building_.insert(def.name);
    try {
        auto m = std::make_unique<relational_mapping>();
        m->type = def.name;
        m->table_name = inflector::tableize(def.name);

        for (const auto& attr : def.attributes) {
            attribute_column col;
            col.attribute = attr.name;
            col.column = inflector::underscore(attr.name);
            col.type = attr.type;
            col.reserved = col.column == "created_at" || col.column == "updated_at";
            if (col.column == "id") {
                throw schema_error("Attribute \"" + attr.name + "\" on type \"" + def.name +
                                   "\" collides with the primary key column");
            }
            m->attributes.push_back(std::move(col));
        }

        for (const auto& rel : def.relationships) {
            m->relations.push_back(resolve_relation(def, rel));
            LOG_DEBUG("mapper", "  %s.%s -> %s (%s)", def.name.c_str(), rel.name.c_str(),
                      m->relations.back().target_table.c_str(),
                      relation_strategy_name(m->relations.back().strategy));
        }

        LOG_DEBUG("mapper", "Built mapping for %s -> %s (%zu attributes, %zu relations)",
                  def.name.c_str(), m->table_name.c_str(), m->attributes.size(), m->relations.size());
        cache_[def.name] = std::move(m);
        building_.erase(def.name);
    } catch (const schema_error& e) {
        building_.erase(def.name);
        LOG_ERROR("mapper", "%s", e.what());
        throw;
    }
}

relation_mapping model_mapper::resolve_relation(const type_definition& def,
                                                const relationship_def& rel) {
    const std::string where = "relationship \"" + rel.name + "\" on type \"" + def.name + "\"";
    if (rel.types.empty()) {
        throw schema_error("Missing target type for " + where);
    }
    if (rel.types.size() > 1) {
        throw schema_error("Polymorphic " + where + " is not supported");
    }
    if (rel.inverse.empty()) {
        throw schema_error("Missing inverse for " + where);
    }

    const auto* target = schema_.get_type(rel.types.front());
    if (!target) {
        throw schema_error("Unknown target type \"" + rel.types.front() + "\" for " + where);
    }
    const auto* inverse = target->relationship(rel.inverse);
    if (!inverse) {
        throw schema_error("Inverse \"" + rel.inverse + "\" of " + where +
                           " is not declared on type \"" + target->name + "\"");
    }

    // Only the inverse's kind is needed here; the target's mapping is built
    // eagerly unless it is already cached or currently under construction.
    if (!is_built(target->name) && building_.count(target->name) == 0) {
        build(*target);
    }

    relation_mapping r;
    r.relationship = rel.name;
    r.kind = rel.kind;
    r.target_type = target->name;
    r.target_table = inflector::tableize(target->name);
    r.inverse = rel.inverse;

    if (rel.kind == relationship_kind::has_one) {
        r.strategy = relation_strategy::owned_foreign_key;
        r.foreign_key = inflector::foreign_key(rel.name);
    } else if (inverse->kind == relationship_kind::has_one) {
        r.strategy = relation_strategy::foreign_key_on_target;
        r.foreign_key = inflector::foreign_key(rel.inverse);
    } else {
        r.strategy = relation_strategy::join_table;
        r.join_table = inflector::join_table_name(rel.name, rel.inverse);
        r.owner_column = inflector::foreign_key(rel.inverse);
        r.related_column = inflector::foreign_key(rel.name);
        if (r.owner_column == r.related_column) {
            throw schema_error("Join table for " + where + " would need two \"" +
                               r.owner_column + "\" columns");
        }
    }
    return r;
}

const char* relation_strategy_name(relation_strategy strategy) {
    switch (strategy) {
        case relation_strategy::owned_foreign_key: return "owned_foreign_key";
        case relation_strategy::foreign_key_on_target: return "foreign_key_on_target";
        case relation_strategy::join_table: return "join_table";
    }
    return "owned_foreign_key";
}

} // namespace trellis
