#pragma once

#include "TestSchemas.hpp"
#include <cassert>
#include <chrono>
#include <iostream>

namespace wire_tests {

using namespace trellis;
using namespace test_schemas;
using json = nlohmann::json;

static int64_t millis_of(timestamp_t t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

// ============================================================================
// test_timestamps — ISO-8601 formatting and parsing
// ============================================================================

void test_timestamps() {
    std::cout << "  test_timestamps..." << std::flush;

    assert(detail::format_timestamp(detail::timestamp_from_seconds(0)) == "1970-01-01T00:00:00.000Z");

    auto t = detail::parse_timestamp("2021-03-04T10:11:12.345Z");
    assert(t.has_value());
    assert(millis_of(*t) == 1614852672345LL);
    assert(detail::format_timestamp(*t) == "2021-03-04T10:11:12.345Z");

    // Offsets are normalized to UTC
    auto offset = detail::parse_timestamp("2021-03-04T11:11:12.345+01:00");
    assert(offset.has_value() && *offset == *t);

    auto date_only = detail::parse_timestamp("2021-03-04");
    assert(date_only.has_value());
    assert(millis_of(*date_only) == 1614816000000LL);

    auto spaced = detail::parse_timestamp("2021-03-04 10:11:12");
    assert(spaced.has_value() && millis_of(*spaced) == 1614852672000LL);

    assert(!detail::parse_timestamp("yesterday").has_value());
    assert(!detail::parse_timestamp("2021-13-01").has_value());

    // Calendar dates are validated, not rolled over into the next month
    assert(!detail::parse_timestamp("2021-02-31").has_value());
    assert(!detail::parse_timestamp("2023-02-29T00:00:00Z").has_value());
    auto leap = detail::parse_timestamp("2024-02-29");
    assert(leap.has_value() && detail::format_timestamp(*leap) == "2024-02-29T00:00:00.000Z");
    auto before_epoch = detail::parse_timestamp("1969-12-31T23:59:59.500Z");
    assert(before_epoch.has_value() && millis_of(*before_epoch) == -500);
    assert(detail::format_timestamp(*before_epoch) == "1969-12-31T23:59:59.500Z");
    assert(!detail::parse_timestamp("2021-03-04T10:11:12Q").has_value());

    // Epoch seconds survive the REAL column round trip
    auto stored = std::get<double>(detail::to_column_value(*t));
    assert(detail::timestamp_from_seconds(stored) == *t);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_schema_json — registry declarations over the wire
// ============================================================================

void test_schema_json() {
    std::cout << "  test_schema_json..." << std::flush;

    auto schema = blog_schema();
    assert(schema.types().size() == 3);
    assert(schema.has_type("author") && schema.has_type("article") && schema.has_type("tag"));

    // Declaration order is kept for types and their members
    assert(schema.types()[0].name == "author");
    assert(schema.types()[1].name == "article");
    assert(schema.types()[2].name == "tag");
    const auto& article_attrs = schema.get_type("article")->attributes;
    assert(article_attrs.size() == 4);
    assert(article_attrs[0].name == "title" && article_attrs[1].name == "publishedOn");
    assert(schema.get_type("article")->relationships[0].name == "author");

    const auto* tags = schema.get_relationship("article", "tags");
    assert(tags != nullptr);
    assert(tags->kind == relationship_kind::has_many);
    assert(tags->types == std::vector<std::string>{"tag"});
    assert(tags->inverse == "articles");

    const auto* published = schema.get_type("article")->attribute("publishedOn");
    assert(published != nullptr && published->type == attribute_type::date);

    // Older declarations: kind in "type", target in "model"
    auto legacy = wire::schema_from_json(nlohmann::ordered_json::parse(R"({
        "models": {
            "planet": {"relationships": {"moons": {"type": "hasMany", "model": "moon", "inverse": "planet"}}},
            "moon": {"relationships": {"planet": {"type": "hasOne", "model": "planet", "inverse": "moons"}}}
        }
    })"));
    const auto* moons = legacy.get_relationship("planet", "moons");
    assert(moons->kind == relationship_kind::has_many);
    assert(moons->types == std::vector<std::string>{"moon"});

    // Multi-type targets load, and are rejected when mappings are built
    auto poly = wire::schema_from_json(nlohmann::ordered_json::parse(R"({
        "models": {
            "star": {"relationships": {"bodies": {"kind": "hasMany", "type": ["planet", "moon"], "inverse": "star"}}},
            "planet": {"relationships": {"star": {"kind": "hasOne", "type": "star", "inverse": "bodies"}}},
            "moon": {"relationships": {"star": {"kind": "hasOne", "type": "star", "inverse": "bodies"}}}
        }
    })"));
    assert(poly.get_relationship("star", "bodies")->types.size() == 2);
    model_mapper mapper(poly);
    bool threw = false;
    try {
        mapper.build_all();
    } catch (const schema_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        wire::schema_from_json(nlohmann::ordered_json::parse(R"({"models": {"planet": {"attributes": {"mass": {"type": "bigint"}}}}})"));
    } catch (const schema_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_record_json — record shape, relationship payloads
// ============================================================================

void test_record_json() {
    std::cout << "  test_record_json..." << std::flush;

    auto in = json::parse(R"({
        "type": "article",
        "id": "1",
        "attributes": {"title": "Article 1", "draft": true, "words": 1200, "summary": null},
        "relationships": {
            "author": {"data": {"type": "author", "id": "1"}},
            "editor": {"data": null},
            "tags": {"data": [{"type": "tag", "id": "a"}, {"type": "tag", "id": "b"}]}
        }
    })");
    auto r = in.get<record>();
    assert(r.type == "article" && r.id == "1");
    assert(std::get<std::string>(*r.attribute("title")) == "Article 1");
    assert(std::get<bool>(*r.attribute("draft")) == true);
    assert(std::get<double>(*r.attribute("words")) == 1200.0);
    assert(std::holds_alternative<std::nullptr_t>(*r.attribute("summary")));

    const auto& author = std::get<to_one_data>(*r.relationship("author"));
    assert(author.has_value() && author->type == "author" && author->id == "1");
    assert(!std::get<to_one_data>(*r.relationship("editor")).has_value());
    const auto& tags = std::get<to_many_data>(*r.relationship("tags"));
    assert(tags.size() == 2 && tags[1].id == "b");

    // Datetimes go out as ISO strings
    record out = make_record("article", "2", {
        {"createdAt", detail::timestamp_from_seconds(0)},
    });
    json j = out;
    assert(j["attributes"]["createdAt"] == "1970-01-01T00:00:00.000Z");
    assert(!j.contains("relationships"));

    // Unset attributes/relationships stay absent
    json bare = make_record("tag", "x");
    assert(bare == json::parse(R"({"type": "tag", "id": "x"})"));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_operation_json — every op name decodes to its operation
// ============================================================================

void test_operation_json() {
    std::cout << "  test_operation_json..." << std::flush;

    auto ops = wire::operations_from_json(json::parse(R"([
        {"op": "addRecord", "record": {"type": "planet", "id": "earth", "attributes": {"name": "Earth"}}},
        {"op": "updateRecord", "record": {"type": "planet", "id": "earth", "attributes": {"sequence": 3}}},
        {"op": "removeRecord", "record": {"type": "planet", "id": "earth"}},
        {"op": "replaceAttribute", "record": {"type": "planet", "id": "earth"}, "attribute": "name", "value": "Terra"},
        {"op": "replaceRelatedRecord", "record": {"type": "moon", "id": "luna"}, "relationship": "planet", "relatedRecord": null},
        {"op": "replaceRelatedRecords", "record": {"type": "planet", "id": "earth"}, "relationship": "moons",
         "relatedRecords": [{"type": "moon", "id": "luna"}]},
        {"op": "addToRelatedRecords", "record": {"type": "planet", "id": "earth"}, "relationship": "moons",
         "relatedRecord": {"type": "moon", "id": "luna"}},
        {"op": "removeFromRelatedRecords", "record": {"type": "planet", "id": "earth"}, "relationship": "moons",
         "relatedRecord": {"type": "moon", "id": "luna"}}
    ])"));
    assert(ops.size() == 8);
    for (size_t i = 0; i < ops.size(); ++i) {
        assert(ops[i].index() == i);
        assert(operation_type(ops[i]) == "planet" || operation_type(ops[i]) == "moon");
    }
    assert(std::string(operation_name(ops[3])) == "replaceAttribute");

    const auto& replace = std::get<replace_attribute_operation>(ops[3]);
    assert(replace.attribute == "name");
    assert(std::get<std::string>(replace.value) == "Terra");
    assert(!std::get<replace_related_record_operation>(ops[4]).related_record.has_value());
    assert(std::get<replace_related_records_operation>(ops[5]).related_records.size() == 1);

    // Encoding produces the same shape back
    auto encoded = wire::operation_to_json(ops[6]);
    assert(encoded["op"] == "addToRelatedRecords");
    assert(encoded["relatedRecord"]["id"] == "luna");

    bool threw = false;
    try {
        wire::operation_from_json(json::parse(R"({"op": "renameRecord", "record": {"type": "planet", "id": "1"}})"));
    } catch (const operation_error& e) {
        threw = std::string(e.what()) == "Unknown operation renameRecord";
    }
    assert(threw);

    threw = false;
    try {
        wire::operation_from_json(json::parse(R"({"op": "removeRecord"})"));
    } catch (const operation_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_expression_json — queries with filter/sort/page specifiers
// ============================================================================

static bool parse_rejected(const char* text) {
    try {
        wire::expression_from_json(json::parse(text));
    } catch (const query_expression_parse_error&) {
        return true;
    }
    return false;
}

void test_expression_json() {
    std::cout << "  test_expression_json..." << std::flush;

    auto expr = wire::expression_from_json(json::parse(R"({
        "op": "findRecords",
        "type": "planet",
        "filter": [{"kind": "attribute", "attribute": "sequence", "op": "gt", "value": 2}],
        "sort": ["classification", "-name", {"kind": "attribute", "attribute": "sequence", "order": "descending"}],
        "page": {"kind": "offsetLimit", "offset": 1, "limit": 2}
    })"));
    const auto& find = std::get<find_records_expression>(expr);
    assert(find.type == "planet");
    assert(!find.records.has_value());
    assert(find.filter.size() == 1);
    assert(find.filter[0].attribute == "sequence");
    assert(find.filter[0].op == comparator::gt);
    assert(std::get<double>(find.filter[0].value) == 2.0);
    assert(find.sort.size() == 3);
    assert(find.sort[0].attribute == "classification" && find.sort[0].order == sort_order::ascending);
    assert(find.sort[1].attribute == "name" && find.sort[1].order == sort_order::descending);
    assert(find.sort[2].order == sort_order::descending);
    assert(find.page.has_value() && *find.page->offset == 1 && *find.page->limit == 2);

    auto by_ids = wire::expression_from_json(json::parse(R"({
        "op": "findRecords", "records": [{"type": "planet", "id": "a"}, {"type": "moon", "id": "b"}]
    })"));
    assert(std::get<find_records_expression>(by_ids).records->size() == 2);

    auto related = wire::expression_from_json(json::parse(R"({
        "op": "findRelatedRecords", "record": {"type": "planet", "id": "a"}, "relationship": "moons"
    })"));
    assert(std::get<find_related_records_expression>(related).relationship == "moons");

    auto relation_filter = wire::expression_from_json(json::parse(R"({
        "op": "findRecords", "type": "article",
        "filter": [{"kind": "relatedRecords", "relation": "tags", "records": [{"type": "tag", "id": "a"}]}]
    })"));
    const auto& rf = std::get<find_records_expression>(relation_filter).filter[0];
    assert(rf.kind == filter_kind::related_records && rf.relation == "tags" && rf.records.size() == 1);

    assert(parse_rejected(R"({"op": "findRecords", "type": "planet",
                              "filter": [{"attribute": "name", "op": "like", "value": "E%"}]})"));
    assert(parse_rejected(R"({"op": "findRecords", "type": "planet",
                              "filter": [{"kind": "geo", "attribute": "name"}]})"));
    assert(parse_rejected(R"({"op": "findRecords", "type": "planet",
                              "sort": [{"kind": "relationship", "attribute": "moons"}]})"));
    assert(parse_rejected(R"({"op": "findRecords", "type": "planet", "page": {"kind": "cursor"}})"));
    assert(parse_rejected(R"({"op": "findEverything"})"));
    assert(parse_rejected(R"({"op": "findRecord"})"));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_codec — projection and coercion between records and rows
// ============================================================================

void test_codec() {
    std::cout << "  test_codec..." << std::flush;

    auto schema = solar_schema();
    model_mapper mapper(schema);
    record_codec codec(mapper);

    // Undeclared attributes and relationships are dropped
    auto row = codec.to_row(make_record("moon", "luna",
        {{"name", "Luna"s}, {"albedo", 0.12}},
        {{"planet", to_one_data(record_identity{"planet", "earth"})},
         {"orbiters", to_many_data{}}}));
    assert(row.columns.size() == 1);
    assert(row.columns[0].first == "name");
    assert(row.to_one.size() == 1 && row.to_one["planet"] == std::optional<std::string>("earth"));
    assert(row.to_many.empty());

    // Booleans and datetimes in storage form
    auto planet_row = codec.to_row(make_record("planet", "earth", {
        {"atmosphere", true},
        {"discoveredAt", "1970-01-02T00:00:00Z"s},
        {"sequence", 3.0},
    }));
    for (const auto& [column, value] : planet_row.columns) {
        if (column == "atmosphere") assert(std::get<int64_t>(value) == 1);
        if (column == "discovered_at") assert(std::get<double>(value) == 86400.0);
        if (column == "sequence") assert(std::get<double>(value) == 3.0);
    }

    // Wrong value type for the declared attribute
    bool threw = false;
    try {
        codec.to_row(make_record("planet", "earth", {{"sequence", "three"s}}));
    } catch (const operation_error&) {
        threw = true;
    }
    assert(threw);

    // Wrong relationship shape
    threw = false;
    try {
        codec.to_row(make_record("planet", "earth", {}, {{"moons", to_one_data()}}));
    } catch (const operation_error&) {
        threw = true;
    }
    assert(threw);

    // Rows back to records: coercion, key embedding, null omission
    database::row_t stored = {
        {"id", "earth"s},
        {"created_at", 10.5},
        {"updated_at", 11.0},
        {"name", "Earth"s},
        {"classification", nullptr},
        {"sequence", int64_t{3}},
        {"atmosphere", int64_t{1}},
        {"discovered_at", "1970-01-02T00:00:00Z"s},
    };
    auto earth = codec.from_row(stored, "planet");
    assert(earth.id == "earth");
    assert(earth.attribute("classification") == nullptr);
    assert(std::get<double>(*earth.attribute("sequence")) == 3.0);
    assert(std::get<bool>(*earth.attribute("atmosphere")) == true);
    assert(millis_of(std::get<timestamp_t>(*earth.attribute("discoveredAt"))) == 86400000LL);
    // Collections are never embedded
    assert(!earth.relationships.has_value());

    auto luna = codec.from_row({{"id", "luna"s}, {"name", "Luna"s}, {"planet_id", "earth"s}}, "moon");
    const auto& planet = std::get<to_one_data>(*luna.relationship("planet"));
    assert(planet.has_value() && *planet == (record_identity{"planet", "earth"}));

    auto orphan = codec.from_row({{"id", "phobos"s}, {"planet_id", nullptr}}, "moon");
    assert(!orphan.relationships.has_value());
    assert(!orphan.attributes.has_value());

    std::cout << " OK" << std::endl;
}

} // namespace wire_tests
