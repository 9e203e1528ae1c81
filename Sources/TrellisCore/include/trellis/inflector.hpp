#pragma once

#include <string>

// Naming convention shared by the mapper and the migration synthesizer.
//   table           tableize("blogPost")            -> "blog_posts"
//   column          underscore("firstName")         -> "first_name"
//   key column      foreign_key("author")           -> "author_id"
//   join table      join_table_name("tags", "articles") -> "articles_tags"
namespace trellis::inflector {

std::string underscore(const std::string& word);

/// English pluralization of the last underscore-separated segment.
std::string pluralize(const std::string& word);

std::string tableize(const std::string& type_name);

std::string foreign_key(const std::string& name);

/// Tableized names of both relationships, sorted and joined with '_', so
/// both sides of a many-to-many derive the same table.
std::string join_table_name(const std::string& relationship, const std::string& inverse);

} // namespace trellis::inflector
