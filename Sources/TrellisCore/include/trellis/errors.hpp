#pragma once

#include <stdexcept>
#include <string>

namespace trellis {

/// Malformed type registry (missing inverse/target, multi-type target, ...).
/// Raised while mappings are built, never inside a batch.
class schema_error : public std::runtime_error {
public:
    explicit schema_error(const std::string& msg) : std::runtime_error(msg) {}
};

/// An operation or query addressed an identity with no stored row.
class record_not_found : public std::runtime_error {
public:
    record_not_found(const std::string& type, const std::string& id)
        : std::runtime_error("Record not found: " + type + ":" + id)
        , type_(type)
        , id_(id) {}

    const std::string& type() const noexcept { return type_; }
    const std::string& id() const noexcept { return id_; }

private:
    std::string type_;
    std::string id_;
};

/// A filter, sort or page specifier the query pipeline does not implement.
class query_expression_parse_error : public std::runtime_error {
public:
    explicit query_expression_parse_error(const std::string& specifier)
        : std::runtime_error("Query expression parse error: " + specifier)
        , specifier_(specifier) {}

    const std::string& specifier() const noexcept { return specifier_; }

private:
    std::string specifier_;
};

/// An operation or query names an undeclared type, attribute or relationship,
/// or uses a relationship of the wrong kind.
class operation_error : public std::runtime_error {
public:
    explicit operation_error(const std::string& msg) : std::runtime_error(msg) {}
};

} // namespace trellis
