#pragma once

#include "TestSchemas.hpp"
#include <cassert>
#include <iostream>

namespace mapper_tests {

using namespace trellis;
using namespace test_schemas;

// ============================================================================
// test_inflector — table, column and join table naming
// ============================================================================

void test_inflector() {
    std::cout << "  test_inflector..." << std::flush;

    assert(inflector::underscore("firstName") == "first_name");
    assert(inflector::underscore("publishedOn") == "published_on");
    assert(inflector::underscore("HTTPServer") == "http_server");
    assert(inflector::underscore("solar-system") == "solar_system");

    assert(inflector::tableize("planet") == "planets");
    assert(inflector::tableize("solarSystem") == "solar_systems");
    assert(inflector::tableize("category") == "categories");
    assert(inflector::tableize("box") == "boxes");
    assert(inflector::tableize("person") == "people");
    assert(inflector::tableize("species") == "species");
    assert(inflector::tableize("articles") == "articles");

    assert(inflector::foreign_key("author") == "author_id");
    assert(inflector::foreign_key("mainPlanet") == "main_planet_id");

    // Independent of which side asks
    assert(inflector::join_table_name("tags", "articles") == "articles_tags");
    assert(inflector::join_table_name("articles", "tags") == "articles_tags");

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_relation_strategies — one strategy per relationship shape
// ============================================================================

void test_relation_strategies() {
    std::cout << "  test_relation_strategies..." << std::flush;

    auto schema = blog_schema();
    model_mapper mapper(schema);

    const auto& article = mapper.mapping("article");
    assert(article.table_name == "articles");

    const auto* author = article.relation("author");
    assert(author != nullptr);
    assert(author->strategy == relation_strategy::owned_foreign_key);
    assert(author->foreign_key == "author_id");
    assert(author->target_table == "authors");

    const auto* tags = article.relation("tags");
    assert(tags != nullptr);
    assert(tags->strategy == relation_strategy::join_table);
    assert(tags->join_table == "articles_tags");
    assert(tags->owner_column == "articles_id");
    assert(tags->related_column == "tags_id");
    assert(std::string(relation_strategy_name(tags->strategy)) == "join_table");
    assert(std::string(relation_strategy_name(author->strategy)) == "owned_foreign_key");

    const auto& author_mapping = mapper.mapping("author");
    const auto* articles = author_mapping.relation("articles");
    assert(articles->strategy == relation_strategy::foreign_key_on_target);
    assert(std::string(relation_strategy_name(articles->strategy)) == "foreign_key_on_target");
    assert(articles->foreign_key == "author_id");
    assert(articles->target_table == "articles");

    // Both sides of the many-to-many agree on the table, with columns swapped
    const auto* tag_articles = mapper.mapping("tag").relation("articles");
    assert(tag_articles->strategy == relation_strategy::join_table);
    assert(tag_articles->join_table == tags->join_table);
    assert(tag_articles->owner_column == tags->related_column);
    assert(tag_articles->related_column == tags->owner_column);

    // Declared timestamps map onto the reserved columns
    const auto* created = article.attribute("createdAt");
    assert(created != nullptr && created->reserved && created->column == "created_at");
    const auto* published = article.attribute("publishedOn");
    assert(published != nullptr && !published->reserved && published->column == "published_on");

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_cyclic_mappings — each type compiled once, cycles terminate
// ============================================================================

void test_cyclic_mappings() {
    std::cout << "  test_cyclic_mappings..." << std::flush;

    auto schema = solar_schema();
    model_mapper mapper(schema);

    assert(!mapper.is_built("planet"));
    const auto& moon = mapper.mapping("moon");
    // moon -> planet -> moon: planet got built on the way, moon is not rebuilt
    assert(mapper.is_built("planet"));
    assert(mapper.is_built("moon"));
    assert(&mapper.mapping("moon") == &moon);

    // Self-referencing type
    type_definition employee;
    employee.name = "employee";
    employee.attributes = {{"name", attribute_type::string}};
    employee.relationships = {
        {"manager", relationship_kind::has_one, {"employee"}, "reports"},
        {"reports", relationship_kind::has_many, {"employee"}, "manager"},
    };
    std::vector<type_definition> types;
    types.push_back(employee);
    schema_registry self_schema(std::move(types));
    model_mapper self_mapper(self_schema);

    const auto& m = self_mapper.mapping("employee");
    assert(m.table_name == "employees");
    assert(m.relation("manager")->strategy == relation_strategy::owned_foreign_key);
    assert(m.relation("reports")->strategy == relation_strategy::foreign_key_on_target);
    assert(m.relation("reports")->foreign_key == "manager_id");
    assert(m.relation("reports")->target_table == "employees");

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_schema_errors — malformed registries are rejected at build time
// ============================================================================

static bool build_fails(std::vector<type_definition> types) {
    schema_registry schema(std::move(types));
    model_mapper mapper(schema);
    try {
        mapper.build_all();
    } catch (const schema_error&) {
        return true;
    }
    return false;
}

void test_schema_errors() {
    std::cout << "  test_schema_errors..." << std::flush;

    type_definition star{"star", {{"name", attribute_type::string}}, {}};

    // Missing inverse
    {
        type_definition planet{"planet", {}, {{"star", relationship_kind::has_one, {"star"}, ""}}};
        assert(build_fails({star, planet}));
    }
    // Missing target type
    {
        type_definition planet{"planet", {}, {{"star", relationship_kind::has_one, {}, "planets"}}};
        assert(build_fails({star, planet}));
    }
    // Polymorphic target
    {
        type_definition comet{"comet", {}, {}};
        type_definition planet{"planet", {}, {{"body", relationship_kind::has_one, {"star", "comet"}, "planets"}}};
        assert(build_fails({star, comet, planet}));
    }
    // Undeclared target type
    {
        type_definition planet{"planet", {}, {{"star", relationship_kind::has_one, {"galaxy"}, "planets"}}};
        assert(build_fails({star, planet}));
    }
    // Inverse not declared on the target
    {
        type_definition planet{"planet", {}, {{"star", relationship_kind::has_one, {"star"}, "planets"}}};
        assert(build_fails({star, planet}));
    }

    // Duplicate type names
    bool threw = false;
    try {
        schema_registry dup({star, star});
    } catch (const schema_error&) {
        threw = true;
    }
    assert(threw);

    // Opening a store compiles every mapping, so the error surfaces there
    threw = false;
    try {
        type_definition planet{"planet", {}, {{"star", relationship_kind::has_one, {"star"}, ""}}};
        std::vector<type_definition> types{star, planet};
        store s(schema_registry(std::move(types)));
    } catch (const schema_error&) {
        threw = true;
    }
    assert(threw);

    // Unknown types are an operation problem, not a schema problem
    auto schema = solar_schema();
    model_mapper mapper(schema);
    threw = false;
    try {
        mapper.mapping("comet");
    } catch (const operation_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_migration — tables, columns and idempotence
// ============================================================================

void test_migration() {
    std::cout << "  test_migration..." << std::flush;

    auto schema = blog_schema();
    database db(":memory:");
    model_mapper mapper(schema);
    migrator migrate(db, mapper);

    // authors, articles, tags + articles_tags
    assert(migrate.migrate_all() == 4);
    assert(migrate.migrate_all() == 0);

    auto articles = db.get_table_info("articles");
    assert(articles.size() == 6);
    assert(articles["id"] == "TEXT");
    assert(articles["created_at"] == "REAL");
    assert(articles["updated_at"] == "REAL");
    assert(articles["title"] == "TEXT");
    assert(articles["published_on"] == "TEXT");
    assert(articles["author_id"] == "TEXT");

    // hasMany with a hasOne inverse adds no column on the owner
    auto authors = db.get_table_info("authors");
    assert(authors.count("articles_id") == 0);
    assert(authors.count("first_name") == 1);

    auto link = db.get_table_info("articles_tags");
    assert(link.size() == 2);
    assert(link.count("articles_id") == 1);
    assert(link.count("tags_id") == 1);
    assert(link.count("id") == 0);

    // Storage types follow the declared attribute type
    auto solar = solar_schema();
    model_mapper solar_mapper(solar);
    migrator solar_migrate(db, solar_mapper);
    assert(solar_migrate.ensure_table("planet"));
    auto planets = db.get_table_info("planets");
    assert(planets["sequence"] == "REAL");
    assert(planets["atmosphere"] == "INTEGER");
    assert(planets["discovered_at"] == "REAL");

    // Existing tables are never altered
    db.execute("CREATE TABLE moons (id TEXT PRIMARY KEY NOT NULL)");
    assert(!solar_migrate.ensure_table("moon"));
    assert(db.get_table_info("moons").size() == 1);

    std::cout << " OK" << std::endl;
}

} // namespace mapper_tests
