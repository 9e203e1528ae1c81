#include "trellis/migrator.hpp"
#include "trellis/log.hpp"

namespace trellis {

column_type migrator::storage_type(attribute_type type) {
    switch (type) {
        case attribute_type::string: return column_type::text;
        case attribute_type::number: return column_type::real;
        case attribute_type::boolean: return column_type::integer;
        case attribute_type::date: return column_type::text;      // "YYYY-MM-DD"
        case attribute_type::datetime: return column_type::real;  // epoch seconds
    }
    return column_type::text;
}

table_schema migrator::model_table_schema(const std::string& type) {
    const auto& m = mapper_.mapping(type);

    table_schema schema;
    schema.name = m.table_name;
    for (const auto& attr : m.attributes) {
        if (attr.reserved) continue;
        schema.columns.push_back({attr.column, storage_type(attr.type)});
    }
    for (const auto& rel : m.relations) {
        if (rel.strategy == relation_strategy::owned_foreign_key) {
            schema.columns.push_back({rel.foreign_key, column_type::text});
        }
    }
    return schema;
}

bool migrator::ensure_table(const std::string& type) {
    auto schema = model_table_schema(type);
    bool created = db_.ensure_table(schema);
    if (created) {
        LOG_INFO("migrate", "Created table %s for type %s (%zu columns)",
                 schema.name.c_str(), type.c_str(), schema.columns.size());
    }
    return created;
}

int migrator::ensure_join_tables(const std::string& type) {
    int created = 0;
    for (const auto& rel : mapper_.mapping(type).relations) {
        if (rel.strategy != relation_strategy::join_table) continue;

        table_schema schema;
        schema.name = rel.join_table;
        schema.is_link_table = true;
        // Sorted so both sides of the relationship produce the same definition
        if (rel.owner_column < rel.related_column) {
            schema.columns.push_back({rel.owner_column, column_type::text});
            schema.columns.push_back({rel.related_column, column_type::text});
        } else {
            schema.columns.push_back({rel.related_column, column_type::text});
            schema.columns.push_back({rel.owner_column, column_type::text});
        }

        if (db_.ensure_table(schema)) {
            LOG_INFO("migrate", "Created join table %s (%s.%s)",
                     schema.name.c_str(), type.c_str(), rel.relationship.c_str());
            ++created;
        }
    }
    return created;
}

int migrator::migrate_all() {
    int created = 0;
    const auto& types = mapper_.schema().types();
    for (const auto& def : types) {
        if (ensure_table(def.name)) ++created;
    }
    for (const auto& def : types) {
        created += ensure_join_tables(def.name);
    }
    LOG_DEBUG("migrate", "Migration finished, %d table(s) created", created);
    return created;
}

} // namespace trellis
