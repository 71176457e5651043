#pragma once
/**
 * @file mesh_core.hpp
 * @brief Layer 3: Service mesh modules built on mesh_service.
 *
 * Provides the whole mesh API:
 *   - Registry:    ServiceRegistry, ServiceRecord (the shared service directory)
 *   - Allocation:  PortAllocator
 *   - Supervision: ProcessSupervisor (start/stop/monitor managed tool servers)
 *   - Routing:     ProxyService, HttpForwarder, SessionTable
 *   - Bridging:    ExternalBridge, StdioRpcClient, ToolSchema
 *
 * Include this single header for everything a mesh executable needs.
 */
#include "mesh_service.hpp"

#include <nlohmann/json.hpp>

#include "mesh/mesh_config.hpp"
#include "mesh/service_record.hpp"
#include "mesh/service_registry.hpp"
#include "mesh/port_allocator.hpp"
#include "mesh/process_supervisor.hpp"
#include "mesh/session_table.hpp"
#include "mesh/http_forwarder.hpp"
#include "mesh/proxy_service.hpp"
#include "mesh/tool_schema.hpp"
#include "mesh/stdio_rpc_client.hpp"
#include "mesh/external_bridge.hpp"
