#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace trellis {

enum class attribute_type {
    string,
    number,
    boolean,
    date,
    datetime
};

enum class relationship_kind {
    has_one,   // single-valued
    has_many   // collection-valued
};

struct attribute_def {
    std::string name;
    attribute_type type = attribute_type::string;
};

struct relationship_def {
    std::string name;
    relationship_kind kind = relationship_kind::has_one;
    std::vector<std::string> types;  // declared target type(s); exactly one is supported
    std::string inverse;
};

/// Declared shape of one record type.
struct type_definition {
    std::string name;
    std::vector<attribute_def> attributes;
    std::vector<relationship_def> relationships;

    const attribute_def* attribute(const std::string& attr) const;
    const relationship_def* relationship(const std::string& rel) const;
};

/// Immutable registry of type definitions, in declaration order.
class schema_registry {
public:
    schema_registry() = default;
    explicit schema_registry(std::vector<type_definition> types);

    const type_definition* get_type(const std::string& name) const;
    bool has_type(const std::string& name) const { return get_type(name) != nullptr; }

    /// Looks up a relationship on a type; nullptr when either is undeclared.
    const relationship_def* get_relationship(const std::string& type, const std::string& name) const;

    const std::vector<type_definition>& types() const { return types_; }

private:
    std::vector<type_definition> types_;
    std::unordered_map<std::string, size_t> index_;
};

const char* attribute_type_name(attribute_type type);
const char* relationship_kind_name(relationship_kind kind);

} // namespace trellis
