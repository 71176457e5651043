#pragma once
/**
 * @file tool_schema.hpp
 * @brief Description of one tool discovered from a wrapped MCP process.
 *
 * Built once from a `tools/list` entry. The input schema is kept verbatim so it
 * can be republished unchanged; calls are checked against it structurally
 * (required parameters present, JSON types matching) and nothing more.
 */
#include "mesh_platform.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace mcpmesh::mesh
{

struct ToolParameter
{
    std::string name;
    /// JSON Schema type names; empty means any type.
    std::vector<std::string> types;
    bool required = false;
    std::string description;
};

class MCPMESH_UTILS_EXPORT ToolSchema
{
  public:
    /**
     * @brief Parses a `tools/list` entry `{name, description, inputSchema}`.
     * @throws std::invalid_argument if the entry has no string `name`.
     */
    static ToolSchema from_json(const nlohmann::json &tool);

    [[nodiscard]] const std::string &name() const noexcept { return m_name; }
    [[nodiscard]] const std::string &description() const noexcept { return m_description; }
    [[nodiscard]] const std::vector<ToolParameter> &parameters() const noexcept { return m_params; }
    [[nodiscard]] const nlohmann::json &input_schema() const noexcept { return m_input_schema; }

    /// @brief Description with a parameter summary appended, built at discovery time.
    [[nodiscard]] const std::string &full_description() const noexcept { return m_full_description; }

    /**
     * @brief Structural check of call arguments.
     * @return nullopt when valid, else a message such as
     *         `Error: missing required parameter 'path'`.
     */
    [[nodiscard]] std::optional<std::string> validate(const nlohmann::json &arguments) const;

    /// @brief The entry as republished in `tools/list`.
    [[nodiscard]] nlohmann::json to_json() const;

    /// @brief True if `value` has one of the JSON Schema `types` (empty: any).
    static bool matches_type(const nlohmann::json &value, const std::vector<std::string> &types);

  private:
    std::string m_name;
    std::string m_description;
    std::string m_full_description;
    nlohmann::json m_input_schema;
    std::vector<ToolParameter> m_params;
};

} // namespace mcpmesh::mesh

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
