#pragma once

#include "protocol.hpp"

#include <optional>
#include <string>
#include <vector>

namespace stavily {

enum class ParamType {
    String,
    Integer,
    Number,
    Boolean,
    Array,
    Object,
    StringOrArray,
};

const char* param_type_name(ParamType type);

struct ParameterSpec {
    std::string name;
    ParamType type = ParamType::String;
    std::string description;
    bool is_required = false;
    std::optional<Json> default_value;
    std::optional<double> minimum;
    std::optional<double> maximum;
    std::optional<size_t> max_length;

    ParameterSpec& required() { is_required = true; return *this; }
    ParameterSpec& defaults_to(Json value) { default_value = std::move(value); return *this; }
    ParameterSpec& at_least(double value) { minimum = value; return *this; }
    ParameterSpec& at_most(double value) { maximum = value; return *this; }
    ParameterSpec& range(double lo, double hi) { minimum = lo; maximum = hi; return *this; }
    ParameterSpec& longest(size_t length) { max_length = length; return *this; }
};

/**
 * Declarative description of a configuration or parameter mapping.
 *
 * Serialized as
 *   {"schema": {name: {"type", "required", "description", "default", ...}},
 *    "required": [names], "description": text}
 * so the host can rebuild it with from_json() and validate before sending.
 */
class ConfigSchema {
public:
    ConfigSchema() = default;
    explicit ConfigSchema(std::string description) : description_(std::move(description)) {}

    /// Append a parameter; the returned reference is valid until the next add().
    ParameterSpec& add(const std::string& name, ParamType type, const std::string& description);

    const std::vector<ParameterSpec>& parameters() const { return parameters_; }
    const std::string& description() const { return description_; }
    const ParameterSpec* find(const std::string& name) const;

    /**
     * Validate input and return it with defaults filled in. Keys not in the
     * schema are kept as-is. Throws PluginError (ValidationError) listing every
     * problem found.
     */
    Json apply(const Json& input) const;

    Json to_json() const;

    /// Rebuild a schema from to_json() output. Throws std::invalid_argument.
    static ConfigSchema from_json(const Json& json);

private:
    std::string description_;
    std::vector<ParameterSpec> parameters_;
};

} // namespace stavily
