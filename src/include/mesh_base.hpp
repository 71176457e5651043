#pragma once
/**
 * @file mesh_base.hpp
 * @brief Layer 1: Basic modules built on mesh_platform.
 *
 * Provides format_tools, debug_info (MESH_PANIC / MESH_DEBUG), scope_guard and
 * module_def for lifecycle module registration. Include this when you need
 * formatting, debug utilities or RAII cleanup guards.
 */
#include "mesh_platform.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <fmt/chrono.h>

#include "utils/format_tools.hpp"
#include "utils/debug_info.hpp"
#include "utils/scope_guard.hpp"
#include "utils/module_def.hpp"
