#pragma once

#include "types.hpp"
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace trellis {

struct record_identity {
    std::string type;
    std::string id;

    bool operator==(const record_identity&) const = default;
};

// Relationship payloads: a single-valued relationship carries one identity
// or null, a collection-valued one carries a list of identities.
using to_one_data = std::optional<record_identity>;
using to_many_data = std::vector<record_identity>;
using relationship_data = std::variant<to_one_data, to_many_data>;

using attribute_map = std::map<std::string, attribute_value>;
using relationship_map = std::map<std::string, relationship_data>;

/// Abstract record: a typed entity with a caller-assigned id.
/// `attributes` / `relationships` stay unset when the record carries none.
struct record {
    std::string type;
    std::string id;
    std::optional<attribute_map> attributes;
    std::optional<relationship_map> relationships;

    record_identity identity() const { return {type, id}; }

    const attribute_value* attribute(const std::string& name) const {
        if (!attributes) return nullptr;
        auto it = attributes->find(name);
        return it == attributes->end() ? nullptr : &it->second;
    }

    const relationship_data* relationship(const std::string& name) const {
        if (!relationships) return nullptr;
        auto it = relationships->find(name);
        return it == relationships->end() ? nullptr : &it->second;
    }

    bool operator==(const record&) const = default;
};

} // namespace trellis
