#include "SchemaValidator.hpp"
#include <algorithm>
#include <iterator>

namespace mcprt {

namespace {

std::string join_types(const json& types) {
    std::string out;
    for (const auto& t : types) {
        if (!out.empty()) {
            out += " or ";
        }
        out += t.get<std::string>();
    }
    return out;
}

// Length in code points; continuation bytes (10xxxxxx) are not counted
size_t utf8_length(const std::string& text) {
    return static_cast<size_t>(std::count_if(text.begin(), text.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    }));
}

} // namespace

std::string SchemaValidator::type_name(const json& value) {
    switch (value.type()) {
        case json::value_t::null:            return "null";
        case json::value_t::boolean:         return "boolean";
        case json::value_t::number_integer:
        case json::value_t::number_unsigned: return "integer";
        case json::value_t::number_float:    return "number";
        case json::value_t::string:          return "string";
        case json::value_t::array:           return "array";
        case json::value_t::object:          return "object";
        default:                             return "unknown";
    }
}

bool SchemaValidator::type_matches(const json& value, const std::string& type) {
    if (type == "string")  return value.is_string();
    if (type == "integer") return value.is_number_integer();
    if (type == "number")  return value.is_number();
    if (type == "boolean") return value.is_boolean();
    if (type == "object")  return value.is_object();
    if (type == "array")   return value.is_array();
    if (type == "null")    return value.is_null();
    return false;
}

std::string SchemaValidator::validate(const json& value, const json& schema) {
    return validate_at(value, schema, "arguments");
}

std::string SchemaValidator::validate_at(const json& value, const json& schema, const std::string& path) {
    if (schema.is_boolean() && !schema.get<bool>()) {
        return path + ": no value is allowed here";
    }
    if (!schema.is_object()) {
        return "";
    }

    auto type_it = schema.find("type");
    if (type_it != schema.end()) {
        json types = type_it->is_array() ? *type_it : json::array({*type_it});
        bool any = false;
        for (const auto& t : types) {
            if (type_matches(value, t.get<std::string>())) {
                any = true;
                break;
            }
        }
        if (!any) {
            return path + ": expected " + join_types(types) + ", got " + type_name(value);
        }
    }

    auto enum_it = schema.find("enum");
    if (enum_it != schema.end()) {
        bool found = false;
        for (const auto& option : *enum_it) {
            if (option == value) {
                found = true;
                break;
            }
        }
        if (!found) {
            return path + ": value " + value.dump() + " is not one of " + enum_it->dump();
        }
    }

    if (value.is_number()) {
        double number = value.get<double>();
        if (schema.contains("minimum") && number < schema["minimum"].get<double>()) {
            return path + ": must be >= " + schema["minimum"].dump();
        }
        if (schema.contains("maximum") && number > schema["maximum"].get<double>()) {
            return path + ": must be <= " + schema["maximum"].dump();
        }
    }

    if (value.is_string()) {
        size_t length = utf8_length(value.get_ref<const std::string&>());
        if (schema.contains("minLength") && length < schema["minLength"].get<size_t>()) {
            return path + ": shorter than " + schema["minLength"].dump() + " characters";
        }
        if (schema.contains("maxLength") && length > schema["maxLength"].get<size_t>()) {
            return path + ": longer than " + schema["maxLength"].dump() + " characters";
        }
    }

    if (value.is_object()) {
        auto required_it = schema.find("required");
        if (required_it != schema.end()) {
            for (const auto& req : *required_it) {
                const auto& field = req.get_ref<const std::string&>();
                if (!value.contains(field)) {
                    return path + ": missing required property '" + field + "'";
                }
            }
        }

        auto props_it = schema.find("properties");
        for (const auto& [key, item] : value.items()) {
            if (props_it != schema.end()) {
                auto prop_it = props_it->find(key);
                if (prop_it != props_it->end()) {
                    std::string err = validate_at(item, *prop_it, path + "." + key);
                    if (!err.empty()) {
                        return err;
                    }
                    continue;
                }
            }
            auto extra_it = schema.find("additionalProperties");
            if (extra_it == schema.end()) {
                continue;
            }
            if (extra_it->is_boolean() && !extra_it->get<bool>()) {
                return path + ": unexpected property '" + key + "'";
            }
            std::string err = validate_at(item, *extra_it, path + "." + key);
            if (!err.empty()) {
                return err;
            }
        }
    }

    if (value.is_array()) {
        auto items_it = schema.find("items");
        if (items_it != schema.end()) {
            for (size_t i = 0; i < value.size(); ++i) {
                std::string err = validate_at(value[i], *items_it, path + "[" + std::to_string(i) + "]");
                if (!err.empty()) {
                    return err;
                }
            }
        }
    }

    auto one_of_it = schema.find("oneOf");
    if (one_of_it != schema.end()) {
        size_t matches = 0;
        for (const auto& alternative : *one_of_it) {
            if (validate_at(value, alternative, path).empty()) {
                ++matches;
            }
        }
        if (matches != 1) {
            return path + ": must match exactly one schema in oneOf (matched " +
                   std::to_string(matches) + ")";
        }
    }

    return "";
}

std::string SchemaValidator::check_schema(const json& schema) {
    if (!schema.is_object()) {
        return "input schema must be a JSON object";
    }
    if (schema.contains("type") && schema["type"] != "object") {
        return "input schema must describe an object";
    }
    return check_schema_at(schema, "inputSchema");
}

std::string SchemaValidator::check_schema_at(const json& schema, const std::string& path) {
    if (schema.is_boolean()) {
        return "";
    }
    if (!schema.is_object()) {
        return path + " must be an object";
    }

    static const char* const known_types[] = {
        "string", "integer", "number", "boolean", "object", "array", "null"
    };

    if (auto it = schema.find("type"); it != schema.end()) {
        json types = it->is_array() ? *it : json::array({*it});
        if (types.empty()) {
            return path + ".type must not be empty";
        }
        for (const auto& t : types) {
            if (!t.is_string() ||
                std::find(std::begin(known_types), std::end(known_types), t.get<std::string>()) ==
                    std::end(known_types)) {
                return path + ".type has unsupported value " + t.dump();
            }
        }
    }

    if (auto it = schema.find("required"); it != schema.end()) {
        if (!it->is_array()) {
            return path + ".required must be an array";
        }
        for (const auto& r : *it) {
            if (!r.is_string()) {
                return path + ".required must contain only strings";
            }
        }
    }

    if (auto it = schema.find("properties"); it != schema.end()) {
        if (!it->is_object()) {
            return path + ".properties must be an object";
        }
        for (const auto& [key, prop] : it->items()) {
            std::string err = check_schema_at(prop, path + ".properties." + key);
            if (!err.empty()) {
                return err;
            }
        }
    }

    if (auto it = schema.find("items"); it != schema.end()) {
        std::string err = check_schema_at(*it, path + ".items");
        if (!err.empty()) {
            return err;
        }
    }

    if (auto it = schema.find("oneOf"); it != schema.end()) {
        if (!it->is_array() || it->empty()) {
            return path + ".oneOf must be a non-empty array";
        }
        for (size_t i = 0; i < it->size(); ++i) {
            std::string err = check_schema_at((*it)[i], path + ".oneOf[" + std::to_string(i) + "]");
            if (!err.empty()) {
                return err;
            }
        }
    }

    if (auto it = schema.find("enum"); it != schema.end() && !it->is_array()) {
        return path + ".enum must be an array";
    }

    for (const char* key : {"minimum", "maximum"}) {
        if (auto it = schema.find(key); it != schema.end() && !it->is_number()) {
            return path + "." + key + " must be a number";
        }
    }
    for (const char* key : {"minLength", "maxLength"}) {
        if (auto it = schema.find(key); it != schema.end() &&
            !(it->is_number_integer() && it->get<int64_t>() >= 0)) {
            return path + "." + key + " must be a non-negative integer";
        }
    }

    if (auto it = schema.find("additionalProperties"); it != schema.end()) {
        if (!it->is_boolean() && !it->is_object()) {
            return path + ".additionalProperties must be a boolean or a schema";
        }
        std::string err = check_schema_at(*it, path + ".additionalProperties");
        if (!err.empty()) {
            return err;
        }
    }

    return "";
}

} // namespace mcprt
