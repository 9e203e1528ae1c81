#pragma once

#include "db.hpp"
#include "mapper.hpp"
#include <string>

namespace trellis {

/// Creates the tables implied by the model mapper. Existing tables are never
/// altered: a table that is already present is left exactly as it is.
class migrator {
public:
    migrator(database& db, model_mapper& mapper) : db_(db), mapper_(mapper) {}

    /// Creates the model table for `type` unless it exists. Returns true if created.
    bool ensure_table(const std::string& type);

    /// Creates the join tables used by `type`'s collection relationships.
    /// Returns the number of tables created.
    int ensure_join_tables(const std::string& type);

    /// All model tables first, then all join tables. Returns tables created.
    int migrate_all();

    /// Table definition the migrator would create for `type`.
    table_schema model_table_schema(const std::string& type);

    static column_type storage_type(attribute_type type);

private:
    database& db_;
    model_mapper& mapper_;
};

} // namespace trellis
