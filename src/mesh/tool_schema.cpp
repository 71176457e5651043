#include "mesh_base.hpp"
#include "mesh/tool_schema.hpp"

#include <fmt/ranges.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace mcpmesh::mesh
{

ToolSchema ToolSchema::from_json(const nlohmann::json &tool)
{
    if (!tool.is_object() || !tool.contains("name") || !tool["name"].is_string())
        throw std::invalid_argument("tool entry without a string 'name'");

    ToolSchema schema;
    schema.m_name = tool["name"].get<std::string>();
    if (auto it = tool.find("description"); it != tool.end() && it->is_string())
        schema.m_description = it->get<std::string>();

    schema.m_input_schema = tool.value("inputSchema", nlohmann::json::object());
    if (!schema.m_input_schema.is_object())
        schema.m_input_schema = nlohmann::json::object();

    std::vector<std::string> required;
    if (auto it = schema.m_input_schema.find("required");
        it != schema.m_input_schema.end() && it->is_array())
    {
        for (const auto &r : *it)
        {
            if (r.is_string())
                required.push_back(r.get<std::string>());
        }
    }

    if (auto props = schema.m_input_schema.find("properties");
        props != schema.m_input_schema.end() && props->is_object())
    {
        for (const auto &[pname, pschema] : props->items())
        {
            ToolParameter p;
            p.name = pname;
            p.required = std::find(required.begin(), required.end(), pname) != required.end();
            if (pschema.is_object())
            {
                if (auto t = pschema.find("type"); t != pschema.end())
                {
                    if (t->is_string())
                    {
                        p.types.push_back(t->get<std::string>());
                    }
                    else if (t->is_array())
                    {
                        for (const auto &tn : *t)
                        {
                            if (tn.is_string())
                                p.types.push_back(tn.get<std::string>());
                        }
                    }
                }
                if (auto d = pschema.find("description"); d != pschema.end() && d->is_string())
                    p.description = d->get<std::string>();
            }
            schema.m_params.push_back(std::move(p));
        }
    }

    // Required names without a property entry still have to be present.
    for (const auto &r : required)
    {
        const bool known = std::any_of(schema.m_params.begin(), schema.m_params.end(),
                                       [&](const ToolParameter &p) { return p.name == r; });
        if (!known)
            schema.m_params.push_back(ToolParameter{r, {}, true, {}});
    }

    std::string full = schema.m_description;
    if (!schema.m_params.empty())
    {
        full += full.empty() ? "Parameters:" : "\n\nParameters:";
        for (const auto &p : schema.m_params)
        {
            full += fmt::format("\n- {} ({}{}){}{}", p.name,
                                p.types.empty() ? "any" : fmt::format("{}", fmt::join(p.types, "|")),
                                p.required ? ", required" : "", p.description.empty() ? "" : ": ",
                                p.description);
        }
    }
    schema.m_full_description = std::move(full);
    return schema;
}

bool ToolSchema::matches_type(const nlohmann::json &value, const std::vector<std::string> &types)
{
    if (types.empty())
        return true;
    for (const auto &t : types)
    {
        if ((t == "string" && value.is_string()) || (t == "boolean" && value.is_boolean()) ||
            (t == "integer" && value.is_number_integer()) ||
            (t == "number" && value.is_number()) || (t == "array" && value.is_array()) ||
            (t == "object" && value.is_object()) || (t == "null" && value.is_null()))
        {
            return true;
        }
        // A float with an integral value is accepted as an integer.
        if (t == "integer" && value.is_number_float())
        {
            const double d = value.get<double>();
            if (std::isfinite(d) && std::floor(d) == d)
                return true;
        }
        if (t != "string" && t != "boolean" && t != "integer" && t != "number" && t != "array" &&
            t != "object" && t != "null")
        {
            return true; // unknown type names are not enforced
        }
    }
    return false;
}

std::optional<std::string> ToolSchema::validate(const nlohmann::json &arguments) const
{
    if (!arguments.is_null() && !arguments.is_object())
        return std::string("Error: arguments must be a JSON object");

    for (const auto &p : m_params)
    {
        const bool present = arguments.is_object() && arguments.contains(p.name);
        if (!present)
        {
            if (p.required)
                return fmt::format("Error: missing required parameter '{}'", p.name);
            continue;
        }
        if (!matches_type(arguments[p.name], p.types))
        {
            return fmt::format("Error: parameter '{}' must be of type {}", p.name,
                               fmt::join(p.types, " or "));
        }
    }
    return std::nullopt;
}

nlohmann::json ToolSchema::to_json() const
{
    return {{"name", m_name}, {"description", m_description}, {"inputSchema", m_input_schema}};
}

} // namespace mcpmesh::mesh
