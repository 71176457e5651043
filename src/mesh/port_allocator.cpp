#include "mesh_service.hpp"
#include "mesh/port_allocator.hpp"

#include <set>
#include <stdexcept>

namespace mcpmesh::mesh
{

namespace
{
constexpr auto kPortProbeTimeout = std::chrono::milliseconds(1000);
constexpr int kMaxBatchProbes = 10000;
constexpr const char *kBindHost = "127.0.0.1";
} // namespace

int PortAllocator::get_available_port(int start, int max_attempts)
{
    for (int port = start; port < start + max_attempts && port <= 65535; ++port)
    {
        if (port >= 1 && platform::tcp_bind_probe(kBindHost, port))
        {
            LOGGER_DEBUG("PortAllocator: port {} is free", port);
            return port;
        }
    }
    throw std::runtime_error(fmt::format("Unable to find an available port in range {}-{}", start,
                                         start + max_attempts - 1));
}

bool PortAllocator::is_port_available(int port, const std::string &host)
{
    if (port < 1 || port > 65535)
    {
        LOGGER_WARN("PortAllocator: port {} is outside 1-65535", port);
        return false;
    }
    if (!platform::can_resolve_host(host))
    {
        LOGGER_DEBUG("PortAllocator: host '{}' does not resolve", host);
        return false;
    }
    return !platform::tcp_connect_probe(host, port, kPortProbeTimeout);
}

int PortAllocator::get_smart_port(const std::string &service_name, Transport transport, int start,
                                  int max_attempts, const std::string &host) const
{
    const auto records = m_registry.list_servers();

    const ServiceRecord *latest = nullptr;
    for (const auto &[key, rec] : records)
    {
        if ((rec.name != service_name && rec.server_type != service_name) ||
            rec.transport != transport || !rec.port)
        {
            continue;
        }
        // "%Y-%m-%d %H:%M:%S" compares chronologically as text.
        if (latest == nullptr || rec.started_at > latest->started_at)
            latest = &rec;
    }

    if (latest != nullptr)
    {
        const int previous = *latest->port;
        if (is_port_available(previous, host))
        {
            LOGGER_INFO("PortAllocator: '{}' reuses its previous port {}", service_name, previous);
            return previous;
        }
        LOGGER_WARN("PortAllocator: previous port {} of '{}' is occupied on {}; allocating a new one",
                    previous, service_name, host);
    }
    else
    {
        LOGGER_INFO("PortAllocator: no registry record for '{}'; allocating a new port",
                    service_name);
    }

    std::set<int> claimed;
    for (const auto &[key, rec] : records)
    {
        if (rec.port)
            claimed.insert(*rec.port);
    }

    for (int port = start; port < start + max_attempts && port <= 65535; ++port)
    {
        if (claimed.count(port) == 0 && is_port_available(port, host))
        {
            LOGGER_INFO("PortAllocator: allocated port {} for '{}' on {}", port, service_name, host);
            return port;
        }
    }

    LOGGER_WARN("PortAllocator: registry-aware allocation failed for '{}'; plain scan from {}",
                service_name, start);
    return get_available_port(start, 100);
}

std::vector<int> PortAllocator::get_available_ports(int count, int start, int gap)
{
    if (count < 0 || gap < 1)
    {
        throw std::invalid_argument("get_available_ports: count must be >= 0 and gap >= 1");
    }
    std::vector<int> ports;
    int port = start;
    for (int attempts = 0;
         static_cast<int>(ports.size()) < count && attempts < kMaxBatchProbes && port <= 65535;
         ++attempts)
    {
        if (port >= 1 && platform::tcp_bind_probe(kBindHost, port))
        {
            ports.push_back(port);
            port += gap;
        }
        else
        {
            ++port;
        }
    }
    if (static_cast<int>(ports.size()) < count)
    {
        throw std::runtime_error(fmt::format("Unable to get {} available ports, only found {}",
                                             count, ports.size()));
    }
    LOGGER_DEBUG("PortAllocator: batch allocated {} ports from {}", ports.size(), start);
    return ports;
}

} // namespace mcpmesh::mesh
