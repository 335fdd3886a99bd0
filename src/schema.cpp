#include "schema.hpp"

#include "errors.hpp"
#include "json_codec.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace stavily {

namespace {

bool matches_type(ParamType type, const Json& value) {
    switch (type) {
        case ParamType::String:
            return value.is_string();
        case ParamType::Integer:
            // Integer parameters are read back as int64_t
            if (value.is_number_unsigned()) {
                return value.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
            }
            if (value.is_number_integer()) {
                return true;
            }
            if (value.is_number_float()) {
                double d = value.get<double>();
                return std::isfinite(d) && std::floor(d) == d && d >= -9223372036854775808.0 &&
                       d < 9223372036854775808.0;
            }
            return false;
        case ParamType::Number:
            return value.is_number();
        case ParamType::Boolean:
            return value.is_boolean();
        case ParamType::Array:
            return value.is_array();
        case ParamType::Object:
            return value.is_object();
        case ParamType::StringOrArray:
            return value.is_string() || value.is_array();
    }
    return false;
}

std::optional<ParamType> parse_param_type(const Json& type) {
    if (type.is_array()) {
        bool has_string = false;
        bool has_array = false;
        for (const auto& item : type) {
            std::string name = codec::as_string(item);
            has_string = has_string || name == "string";
            has_array = has_array || name == "array";
        }
        if (has_string && has_array && type.size() == 2) {
            return ParamType::StringOrArray;
        }
        return std::nullopt;
    }

    std::string name = codec::as_string(type);
    if (name == "string") return ParamType::String;
    if (name == "integer") return ParamType::Integer;
    if (name == "number") return ParamType::Number;
    if (name == "boolean") return ParamType::Boolean;
    if (name == "array") return ParamType::Array;
    if (name == "object") return ParamType::Object;
    return std::nullopt;
}

} // namespace

const char* param_type_name(ParamType type) {
    switch (type) {
        case ParamType::String: return "string";
        case ParamType::Integer: return "integer";
        case ParamType::Number: return "number";
        case ParamType::Boolean: return "boolean";
        case ParamType::Array: return "array";
        case ParamType::Object: return "object";
        case ParamType::StringOrArray: return "string|array";
    }
    return "unknown";
}

ParameterSpec& ConfigSchema::add(const std::string& name, ParamType type, const std::string& description) {
    ParameterSpec spec;
    spec.name = name;
    spec.type = type;
    spec.description = description;
    parameters_.push_back(std::move(spec));
    return parameters_.back();
}

const ParameterSpec* ConfigSchema::find(const std::string& name) const {
    for (const auto& spec : parameters_) {
        if (spec.name == name) {
            return &spec;
        }
    }
    return nullptr;
}

Json ConfigSchema::apply(const Json& input) const {
    if (!input.is_null() && !input.is_object()) {
        throw PluginError::validation("expected an object");
    }

    Json result = input.is_null() ? Json::object() : input;
    std::vector<std::string> problems;

    for (const auto& spec : parameters_) {
        const Json* value = codec::find_key(result, spec.name);
        if (!value || value->is_null()) {
            if (spec.is_required) {
                problems.push_back("'" + spec.name + "' is required");
            } else if (spec.default_value) {
                result[spec.name] = *spec.default_value;
            }
            continue;
        }

        if (!matches_type(spec.type, *value)) {
            problems.push_back("'" + spec.name + "' must be of type " + param_type_name(spec.type));
            continue;
        }

        if (value->is_number()) {
            double number = value->get<double>();
            if (spec.minimum && number < *spec.minimum) {
                std::ostringstream oss;
                oss << "'" << spec.name << "' must be >= " << *spec.minimum;
                problems.push_back(oss.str());
            }
            if (spec.maximum && number > *spec.maximum) {
                std::ostringstream oss;
                oss << "'" << spec.name << "' must be <= " << *spec.maximum;
                problems.push_back(oss.str());
            }
        }

        if (spec.max_length && value->is_string() && value->get_ref<const std::string&>().size() > *spec.max_length) {
            problems.push_back("'" + spec.name + "' exceeds " + std::to_string(*spec.max_length) + " characters");
        }
    }

    if (!problems.empty()) {
        std::string message;
        for (const auto& problem : problems) {
            if (!message.empty()) {
                message += "; ";
            }
            message += problem;
        }
        throw PluginError::validation(message);
    }
    return result;
}

Json ConfigSchema::to_json() const {
    Json schema = Json::object();
    Json required = Json::array();

    for (const auto& spec : parameters_) {
        Json entry = Json::object();
        if (spec.type == ParamType::StringOrArray) {
            entry["type"] = Json::array({"string", "array"});
        } else {
            entry["type"] = param_type_name(spec.type);
        }
        entry["required"] = spec.is_required;
        entry["description"] = spec.description;
        if (spec.default_value) {
            entry["default"] = *spec.default_value;
        }
        if (spec.minimum) {
            entry["minimum"] = *spec.minimum;
        }
        if (spec.maximum) {
            entry["maximum"] = *spec.maximum;
        }
        if (spec.max_length) {
            entry["max_length"] = *spec.max_length;
        }
        schema[spec.name] = std::move(entry);
        if (spec.is_required) {
            required.push_back(spec.name);
        }
    }

    return Json{{"schema", schema}, {"required", required}, {"description", description_}};
}

ConfigSchema ConfigSchema::from_json(const Json& json) {
    const Json* schema = codec::find_key(json, "schema");
    if (!schema || !schema->is_object()) {
        throw std::invalid_argument("schema document has no 'schema' object");
    }

    ConfigSchema result(codec::as_string(json.value("description", Json()), ""));
    for (auto it = schema->begin(); it != schema->end(); ++it) {
        const Json& entry = it.value();
        if (!entry.is_object()) {
            throw std::invalid_argument("schema entry '" + it.key() + "' is not an object");
        }
        auto type = parse_param_type(entry.value("type", Json()));
        if (!type) {
            throw std::invalid_argument("schema entry '" + it.key() + "' has an unknown type");
        }

        auto& spec = result.add(it.key(), *type, codec::as_string(entry.value("description", Json()), ""));
        spec.is_required = codec::as_bool(entry.value("required", Json()), false);
        if (const Json* def = codec::find_key(entry, "default")) {
            spec.default_value = *def;
        }
        if (const Json* min = codec::find_key(entry, "minimum"); min && min->is_number()) {
            spec.minimum = min->get<double>();
        }
        if (const Json* max = codec::find_key(entry, "maximum"); max && max->is_number()) {
            spec.maximum = max->get<double>();
        }
        if (const Json* len = codec::find_key(entry, "max_length"); len && len->is_number_unsigned()) {
            spec.max_length = len->get<size_t>();
        }
    }

    // Top-level "required" list wins over per-entry flags
    if (const Json* required = codec::find_key(json, "required"); required && required->is_array()) {
        for (const auto& name : *required) {
            for (auto& spec : result.parameters_) {
                if (spec.name == codec::as_string(name)) {
                    spec.is_required = true;
                }
            }
        }
    }
    return result;
}

} // namespace stavily
