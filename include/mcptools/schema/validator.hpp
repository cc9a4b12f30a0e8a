#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "mcptools/core/error.hpp"
#include "mcptools/core/types.hpp"

namespace mcptools::schema {

/// Primitive kind a tool parameter is declared with.
enum class FieldKind {
    String,
    Number,   // integer or floating point
    Integer,
    Boolean,
    Array,
    Object,
    Any,
};

/// Describes a single parameter for a tool.
struct FieldSpec {
    std::string name;
    FieldKind kind = FieldKind::String;
    std::string description;
    bool required = true;
    std::optional<json> default_value;
    std::optional<std::vector<std::string>> enum_values;
};

/// Ordered list of the fields a tool accepts. Declaration order is the
/// order in which fields are checked and listed.
struct ParameterSchema {
    std::vector<FieldSpec> fields;

    [[nodiscard]] auto find(std::string_view name) const -> const FieldSpec*;

    /// JSON Schema object form: {"type":"object","properties":{...},"required":[...]}.
    [[nodiscard]] auto to_json() const -> json;
};

/// JSON Schema type name of a kind ("string", "number", ...).
auto kind_name(FieldKind kind) -> std::string_view;

/// Kind name of a concrete JSON value, as used in TypeMismatch details.
auto value_kind_name(const json& value) -> std::string_view;

/// Whether `value` satisfies `kind`.
auto matches_kind(FieldKind kind, const json& value) -> bool;

/// Checks `arguments` against `schema`. Fields are checked in declaration
/// order and the first failure is returned:
///   MissingField  - detail is the field name
///   TypeMismatch  - detail is the field name, message names expected/actual
/// Undeclared fields are accepted. Never mutates `arguments`.
auto validate(const ParameterSchema& schema, const json& arguments) -> VoidResult;

} // namespace mcptools::schema
