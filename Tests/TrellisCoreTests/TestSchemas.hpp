#pragma once

#include <TrellisCore.hpp>
#include <cassert>
#include <optional>
#include <string>
#include <vector>

namespace test_schemas {

using namespace trellis;
using namespace std::string_literals;

// ============================================================================
// Schemas
// ============================================================================

// author 1--* article *--* tag, declared over the wire
inline const char* blog_schema_json = R"({
    "models": {
        "author": {
            "attributes": {
                "firstName": {"type": "string"},
                "lastName": {"type": "string"}
            },
            "relationships": {
                "articles": {"kind": "hasMany", "type": "article", "inverse": "author"}
            }
        },
        "article": {
            "attributes": {
                "title": {"type": "string"},
                "publishedOn": {"type": "date"},
                "createdAt": {"type": "datetime"},
                "updatedAt": {"type": "datetime"}
            },
            "relationships": {
                "author": {"kind": "hasOne", "type": "author", "inverse": "articles"},
                "tags": {"kind": "hasMany", "type": "tag", "inverse": "articles"}
            }
        },
        "tag": {
            "attributes": {
                "name": {"type": "string"}
            },
            "relationships": {
                "articles": {"kind": "hasMany", "type": "article", "inverse": "tags"}
            }
        }
    }
})";

inline schema_registry blog_schema() {
    return wire::schema_from_json(nlohmann::ordered_json::parse(blog_schema_json));
}

// planet 1--* moon, declared in code
inline schema_registry solar_schema() {
    std::vector<type_definition> types;

    type_definition planet;
    planet.name = "planet";
    planet.attributes = {
        {"name", attribute_type::string},
        {"classification", attribute_type::string},
        {"sequence", attribute_type::number},
        {"atmosphere", attribute_type::boolean},
        {"discoveredAt", attribute_type::datetime},
    };
    planet.relationships = {
        {"moons", relationship_kind::has_many, {"moon"}, "planet"},
    };
    types.push_back(std::move(planet));

    type_definition moon;
    moon.name = "moon";
    moon.attributes = {
        {"name", attribute_type::string},
    };
    moon.relationships = {
        {"planet", relationship_kind::has_one, {"planet"}, "moons"},
    };
    types.push_back(std::move(moon));

    return schema_registry(std::move(types));
}

// ============================================================================
// Helpers
// ============================================================================

inline record make_record(const std::string& type, const std::string& id,
                          attribute_map attributes = {}, relationship_map relationships = {}) {
    record r;
    r.type = type;
    r.id = id;
    if (!attributes.empty()) r.attributes = std::move(attributes);
    if (!relationships.empty()) r.relationships = std::move(relationships);
    return r;
}

inline record make_planet(const std::string& id, const std::string& name,
                          const std::string& classification, double sequence) {
    return make_record("planet", id, {
        {"name", name},
        {"classification", classification},
        {"sequence", sequence},
    });
}

inline std::vector<record> as_list(const query_result& result) {
    return std::get<std::vector<record>>(result);
}

inline std::optional<record> as_one(const query_result& result) {
    return std::get<std::optional<record>>(result);
}

inline std::string string_attr(const record& r, const std::string& name) {
    const auto* value = r.attribute(name);
    assert(value != nullptr);
    return std::get<std::string>(*value);
}

inline double number_attr(const record& r, const std::string& name) {
    const auto* value = r.attribute(name);
    assert(value != nullptr);
    return std::get<double>(*value);
}

inline std::vector<std::string> names_of(const std::vector<record>& records) {
    std::vector<std::string> names;
    for (const auto& r : records) names.push_back(string_attr(r, "name"));
    return names;
}

inline int64_t count_rows(database& db, const std::string& table) {
    auto rows = db.query("SELECT COUNT(*) AS n FROM " + quote_identifier(table));
    return std::get<int64_t>(rows.front().at("n"));
}

} // namespace test_schemas
