#pragma once

// TrellisCore - graph-shaped records over SQLite
//
// Usage:
//   #include <TrellisCore.hpp>
//
//   trellis::schema_registry schema({
//       {"planet", {{"name", trellis::attribute_type::string}},
//                  {{"moons", trellis::relationship_kind::has_many, {"moon"}, "planet"}}},
//       {"moon",   {{"name", trellis::attribute_type::string}},
//                  {{"planet", trellis::relationship_kind::has_one, {"planet"}, "moons"}}},
//   });
//   trellis::store store(std::move(schema));   // in-memory, tables created on open
//
//   trellis::record earth{"planet", "earth", trellis::attribute_map{{"name", std::string("Earth")}}, {}};
//   store.update({trellis::add_record_operation{earth}});
//
//   auto results = store.query({trellis::find_records_expression{"planet"}});

#include "trellis/types.hpp"
#include "trellis/log.hpp"
#include "trellis/errors.hpp"
#include "trellis/db.hpp"
#include "trellis/record.hpp"
#include "trellis/schema.hpp"
#include "trellis/inflector.hpp"
#include "trellis/mapper.hpp"
#include "trellis/migrator.hpp"
#include "trellis/codec.hpp"
#include "trellis/operations.hpp"
#include "trellis/query.hpp"
#include "trellis/processor.hpp"
#include "trellis/wire.hpp"
#include "trellis/store.hpp"
