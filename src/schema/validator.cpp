#include "mcptools/schema/validator.hpp"

namespace mcptools::schema {

namespace {

auto type_mismatch(std::string_view field, std::string_view expected,
                   std::string_view actual) -> Error {
    return make_error(ErrorCode::TypeMismatch,
                      "expected " + std::string(expected) + ", got " + std::string(actual),
                      std::string(field));
}

} // anonymous namespace

auto ParameterSchema::find(std::string_view name) const -> const FieldSpec* {
    for (const auto& field : fields) {
        if (field.name == name) return &field;
    }
    return nullptr;
}

auto ParameterSchema::to_json() const -> json {
    json schema;
    schema["type"] = "object";

    json properties = json::object();
    json required_params = json::array();

    for (const auto& field : fields) {
        json prop;
        if (field.kind != FieldKind::Any) {
            prop["type"] = kind_name(field.kind);
        }
        prop["description"] = field.description;

        if (field.default_value.has_value()) {
            prop["default"] = *field.default_value;
        }
        if (field.enum_values.has_value()) {
            prop["enum"] = *field.enum_values;
        }

        properties[field.name] = prop;

        if (field.required) {
            required_params.push_back(field.name);
        }
    }

    schema["properties"] = properties;
    if (!required_params.empty()) {
        schema["required"] = required_params;
    }
    return schema;
}

auto kind_name(FieldKind kind) -> std::string_view {
    switch (kind) {
        case FieldKind::String: return "string";
        case FieldKind::Number: return "number";
        case FieldKind::Integer: return "integer";
        case FieldKind::Boolean: return "boolean";
        case FieldKind::Array: return "array";
        case FieldKind::Object: return "object";
        case FieldKind::Any: return "any";
    }
    return "any";
}

auto value_kind_name(const json& value) -> std::string_view {
    if (value.is_null()) return "null";
    if (value.is_boolean()) return "boolean";
    if (value.is_number_integer()) return "integer";
    if (value.is_number()) return "number";
    if (value.is_string()) return "string";
    if (value.is_array()) return "array";
    if (value.is_object()) return "object";
    return "unknown";
}

auto matches_kind(FieldKind kind, const json& value) -> bool {
    switch (kind) {
        case FieldKind::String: return value.is_string();
        case FieldKind::Number: return value.is_number();
        case FieldKind::Integer: return value.is_number_integer();
        case FieldKind::Boolean: return value.is_boolean();
        case FieldKind::Array: return value.is_array();
        case FieldKind::Object: return value.is_object();
        case FieldKind::Any: return true;
    }
    return false;
}

auto validate(const ParameterSchema& schema, const json& arguments) -> VoidResult {
    if (arguments.is_null()) {
        // No arguments at all is the same as an empty object.
        return validate(schema, json::object());
    }
    if (!arguments.is_object()) {
        return std::unexpected(
            type_mismatch("arguments", "object", value_kind_name(arguments)));
    }

    for (const auto& field : schema.fields) {
        auto it = arguments.find(field.name);
        if (it == arguments.end() || it->is_null()) {
            if (field.required) {
                return std::unexpected(make_error(
                    ErrorCode::MissingField,
                    "missing required field", field.name));
            }
            continue;
        }

        if (!matches_kind(field.kind, *it)) {
            return std::unexpected(
                type_mismatch(field.name, kind_name(field.kind), value_kind_name(*it)));
        }
    }

    return {};
}

} // namespace mcptools::schema
