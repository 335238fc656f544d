#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace mcprt {

using json = nlohmann::json;

/**
 * @brief Checks tool arguments against a JSON Schema subset
 *
 * Supported keywords: type (string or array of strings), properties,
 * required, additionalProperties (boolean), enum, items, oneOf,
 * minimum, maximum, minLength, maxLength. Unknown keywords are ignored.
 */
class SchemaValidator {
public:
    /**
     * @brief Validate a value against a schema
     * @param value Value to check
     * @param schema JSON schema (assumed well-formed, see check_schema)
     * @return Empty string if valid, description of the first violation otherwise
     */
    static std::string validate(const json& value, const json& schema);

    /**
     * @brief Verify that a tool input schema is usable
     *
     * The top level must be an object schema; keyword values must have the
     * types the validator expects.
     *
     * @return Empty string if usable, reason otherwise
     */
    static std::string check_schema(const json& schema);

    /// JSON Schema type name of a value ("integer" for integral numbers)
    static std::string type_name(const json& value);

private:
    static std::string validate_at(const json& value, const json& schema, const std::string& path);
    static std::string check_schema_at(const json& schema, const std::string& path);
    static bool type_matches(const json& value, const std::string& type);
};

} // namespace mcprt
