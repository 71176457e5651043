#pragma once
/**
 * @file mesh_service.hpp
 * @brief Layer 2: Service modules built on mesh_base.
 *
 * Provides lifecycle management, the asynchronous logger, cross-process file
 * locking, atomic JSON persistence and backoff strategies for retry loops.
 */
#include "mesh_base.hpp"

#include "utils/backoff_strategy.hpp"
#include "utils/lifecycle.hpp"
#include "utils/logger.hpp"
#include "utils/lock_backend.hpp"
#include "utils/file_lock.hpp"
#include "utils/json_config.hpp"
