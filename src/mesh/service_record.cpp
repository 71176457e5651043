#include "mesh_base.hpp"
#include "mesh/service_record.hpp"

#include <stdexcept>

namespace mcpmesh::mesh
{

const char *to_string(Transport transport) noexcept
{
    switch (transport)
    {
    case Transport::Stdio:
        return "stdio";
    case Transport::Http:
        return "http";
    case Transport::Sse:
        return "sse";
    }
    return "unknown";
}

std::optional<Transport> parse_transport(std::string_view text) noexcept
{
    const auto t = format_tools::trim(text);
    if (format_tools::iequals(t, "stdio"))
        return Transport::Stdio;
    if (format_tools::iequals(t, "http"))
        return Transport::Http;
    if (format_tools::iequals(t, "sse"))
        return Transport::Sse;
    return std::nullopt;
}

const char *transport_endpoint_path(Transport transport) noexcept
{
    switch (transport)
    {
    case Transport::Http:
        return "/mcp";
    case Transport::Sse:
        return "/sse";
    case Transport::Stdio:
        break;
    }
    return "";
}

std::string ServiceRecord::make_key(std::string_view name, Transport transport,
                                    std::optional<int> port)
{
    std::string k = fmt::format("{}-{}", name, to_string(transport));
    if (is_network_transport(transport) && port.has_value())
    {
        k += fmt::format("-{}", *port);
    }
    return k;
}

std::string ServiceRecord::key() const
{
    return make_key(name, transport, port);
}

void ServiceRecord::validate() const
{
    if (name.empty())
    {
        throw std::invalid_argument("ServiceRecord: name must not be empty");
    }
    if (is_network_transport(transport))
    {
        if (!port.has_value())
        {
            throw std::invalid_argument(
                fmt::format("ServiceRecord '{}': transport '{}' requires a port", name,
                            to_string(transport)));
        }
        if (*port < 1 || *port > 65535)
        {
            throw std::invalid_argument(
                fmt::format("ServiceRecord '{}': port {} out of range", name, *port));
        }
    }
}

void ServiceRecord::fill_defaults()
{
    if (server_type.empty())
        server_type = name;
    if (started_at.empty())
        started_at = format_tools::local_timestamp();
}

void to_json(nlohmann::json &j, const ServiceRecord &rec)
{
    j = nlohmann::json{
        {"name", rec.name},
        {"server_type", rec.server_type.empty() ? rec.name : rec.server_type},
        {"transport", to_string(rec.transport)},
        {"host", rec.host},
        {"port", rec.port ? nlohmann::json(*rec.port) : nlohmann::json(nullptr)},
        {"pid", rec.pid ? nlohmann::json(*rec.pid) : nlohmann::json(nullptr)},
        {"started_at", rec.started_at},
        {"source_path", rec.source_path},
    };
}

void from_json(const nlohmann::json &j, ServiceRecord &rec)
{
    rec.name = j.at("name").get<std::string>();
    rec.server_type = j.value("server_type", std::string{});
    if (rec.server_type.empty())
        rec.server_type = rec.name;

    const auto transport_text = j.value("transport", std::string{"sse"});
    const auto transport = parse_transport(transport_text);
    if (!transport)
    {
        throw std::invalid_argument(fmt::format("unknown transport '{}'", transport_text));
    }
    rec.transport = *transport;
    rec.host = j.value("host", std::string{"localhost"});

    rec.port.reset();
    if (j.contains("port") && !j.at("port").is_null())
        rec.port = j.at("port").get<int>();
    // Older writers stored a placeholder port of 0 for stdio records.
    if (rec.transport == Transport::Stdio && rec.port && *rec.port == 0)
        rec.port.reset();

    rec.pid.reset();
    if (j.contains("pid") && !j.at("pid").is_null())
        rec.pid = j.at("pid").get<uint64_t>();

    rec.started_at = j.value("started_at", std::string{});
    rec.source_path = j.value("source_path", std::string{});
}

} // namespace mcpmesh::mesh
