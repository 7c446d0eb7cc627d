// agentflow/capability/schema.h
#ifndef AGENTFLOW_CAPABILITY_SCHEMA_H
#define AGENTFLOW_CAPABILITY_SCHEMA_H

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace agentflow {

struct ValidationError {
    std::string path;    // e.g. "items" or "" for the root value
    std::string message;

    std::string to_string() const { return path.empty() ? message : path + ": " + message; }
};

// 与具体 schema 库无关的接口：描述 + 校验
class Schema {
public:
    virtual ~Schema() = default;
    virtual nlohmann::json describe() const = 0;
    virtual std::optional<ValidationError> validate(const nlohmann::json& value) const = 0;
};

enum class FieldType : uint8_t {
    STRING,
    NUMBER,
    INTEGER,
    BOOLEAN,
    ARRAY,
    OBJECT
};

const char* to_string(FieldType type);
FieldType parse_field_type(const std::string& name); // throws std::invalid_argument

struct SchemaField {
    std::string name;
    FieldType type = FieldType::STRING;
    std::optional<std::string> description;
    bool required = true;
};

// Flat object schema: named fields with types and optional descriptions
class FieldSchema : public Schema {
public:
    explicit FieldSchema(std::vector<SchemaField> fields);

    // {"fields": [{"name": "...", "type": "string", "description": "...", "required": true}]}
    static FieldSchema from_json(const nlohmann::json& j);

    nlohmann::json describe() const override;
    std::optional<ValidationError> validate(const nlohmann::json& value) const override;

    const std::vector<SchemaField>& fields() const { return fields_; }

private:
    std::vector<SchemaField> fields_;
};

} // namespace agentflow

#endif // AGENTFLOW_CAPABILITY_SCHEMA_H
