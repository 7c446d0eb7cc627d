// src/capability/schema.cpp
#include "agentflow/capability/schema.h"
#include <stdexcept>
#include <unordered_set>

namespace agentflow {

const char* to_string(FieldType type) {
    switch (type) {
        case FieldType::STRING: return "string";
        case FieldType::NUMBER: return "number";
        case FieldType::INTEGER: return "integer";
        case FieldType::BOOLEAN: return "boolean";
        case FieldType::ARRAY: return "array";
        case FieldType::OBJECT: return "object";
    }
    return "unknown";
}

FieldType parse_field_type(const std::string& name) {
    if (name == "string") return FieldType::STRING;
    if (name == "number") return FieldType::NUMBER;
    if (name == "integer") return FieldType::INTEGER;
    if (name == "boolean") return FieldType::BOOLEAN;
    if (name == "array") return FieldType::ARRAY;
    if (name == "object") return FieldType::OBJECT;
    throw std::invalid_argument("Unknown field type '" + name + "'");
}

namespace {

bool matches(FieldType type, const nlohmann::json& value) {
    switch (type) {
        case FieldType::STRING: return value.is_string();
        case FieldType::NUMBER: return value.is_number();
        case FieldType::INTEGER: return value.is_number_integer();
        case FieldType::BOOLEAN: return value.is_boolean();
        case FieldType::ARRAY: return value.is_array();
        case FieldType::OBJECT: return value.is_object();
    }
    return false;
}

} // namespace

FieldSchema::FieldSchema(std::vector<SchemaField> fields) : fields_(std::move(fields)) {
    std::unordered_set<std::string> seen;
    for (const auto& field : fields_) {
        if (field.name.empty()) {
            throw std::invalid_argument("Schema field name must not be empty");
        }
        if (!seen.insert(field.name).second) {
            throw std::invalid_argument("Duplicate schema field '" + field.name + "'");
        }
    }
}

FieldSchema FieldSchema::from_json(const nlohmann::json& j) {
    if (!j.contains("fields") || !j["fields"].is_array()) {
        throw std::invalid_argument("Schema description requires a 'fields' array");
    }
    std::vector<SchemaField> fields;
    for (const auto& f : j["fields"]) {
        SchemaField field;
        field.name = f.at("name").get<std::string>();
        field.type = parse_field_type(f.value("type", "string"));
        if (f.contains("description") && f["description"].is_string()) {
            field.description = f["description"].get<std::string>();
        }
        field.required = f.value("required", true);
        fields.push_back(std::move(field));
    }
    return FieldSchema(std::move(fields));
}

nlohmann::json FieldSchema::describe() const {
    nlohmann::json fields = nlohmann::json::array();
    for (const auto& field : fields_) {
        nlohmann::json f = {{"name", field.name},
                            {"type", to_string(field.type)},
                            {"required", field.required}};
        if (field.description) {
            f["description"] = *field.description;
        }
        fields.push_back(std::move(f));
    }
    return {{"type", "object"}, {"fields", std::move(fields)}};
}

std::optional<ValidationError> FieldSchema::validate(const nlohmann::json& value) const {
    if (!value.is_object()) {
        return ValidationError{"", std::string("expected an object, got ") + value.type_name()};
    }
    for (const auto& field : fields_) {
        auto it = value.find(field.name);
        if (it == value.end() || it->is_null()) {
            if (field.required) {
                return ValidationError{field.name, "required field is missing"};
            }
            continue;
        }
        if (!matches(field.type, *it)) {
            return ValidationError{field.name, std::string("expected ") + to_string(field.type) +
                                               ", got " + it->type_name()};
        }
    }
    return std::nullopt;
}

} // namespace agentflow
