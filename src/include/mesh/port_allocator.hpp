#pragma once
/**
 * @file port_allocator.hpp
 * @brief TCP port selection for new service instances.
 *
 * `get_smart_port()` keeps client-visible addresses stable: a service restarted
 * on the same machine gets the port of its most recent registry record back,
 * as long as that port is free. New services skip every port any registry
 * record claims, so a stopped-but-registered service keeps its slot.
 */
#include "mesh/service_registry.hpp"

#include <string>
#include <vector>

namespace mcpmesh::mesh
{

class MCPMESH_UTILS_EXPORT PortAllocator
{
  public:
    explicit PortAllocator(const ServiceRegistry &registry) noexcept : m_registry(registry) {}

    /**
     * @brief First port in [start, start + max_attempts) that binds on 127.0.0.1.
     * @throws std::runtime_error when the range is exhausted.
     */
    static int get_available_port(int start = 8000, int max_attempts = 100);

    /**
     * @brief Registry-aware allocation.
     *
     * 1. The newest record (by `started_at`) whose name or server_type is
     *    `service_name` and whose transport matches: reuse its port if free.
     * 2. Otherwise the first free port from `start` not claimed by any record.
     * 3. Otherwise `get_available_port(start, 100)`.
     *
     * @throws std::runtime_error if even the fallback scan finds nothing.
     */
    int get_smart_port(const std::string &service_name, Transport transport, int start = 8000,
                       int max_attempts = 1000, const std::string &host = "localhost") const;

    /**
     * @brief True when nothing accepts connections on host:port.
     * @details Out-of-range ports and unresolvable hosts are never available.
     */
    static bool is_port_available(int port, const std::string &host = "localhost");

    /**
     * @brief `count` bindable ports, each at least `gap` above the previous one.
     * @throws std::runtime_error if fewer than `count` are found within 10000 probes.
     */
    static std::vector<int> get_available_ports(int count, int start = 8000, int gap = 1);

  private:
    const ServiceRegistry &m_registry;
};

} // namespace mcpmesh::mesh
