#pragma once
/**
 * @file backoff_strategy.hpp
 * @brief Header-only backoff strategies for retry loops.
 *
 * Each strategy is a small functor `void operator()(int attempt) const noexcept`
 * that sleeps between attempts. Callers choose one at compile time and tests can
 * inject NoBackoff or a tiny ConstantBackoff to keep runs fast.
 *
 * Uses in the mesh:
 * - ServiceRegistry writes: LinearBackoff (lock contention, `base * (attempt + 1)`)
 * - FileLock timed / non-blocking-with-timeout acquisition: ExponentialBackoff
 *   capped at the 20 ms poll interval
 */
#include <algorithm>
#include <chrono>
#include <thread>

namespace mcpmesh::utils
{

/**
 * @brief Linearly growing delay: `base * (attempt + 1)`.
 * @details With the registry default base of 500 ms, five attempts wait
 *          0.5 s, 1 s, 1.5 s, 2 s between tries.
 */
struct LinearBackoff
{
    std::chrono::milliseconds base;

    explicit LinearBackoff(std::chrono::milliseconds b = std::chrono::milliseconds(500)) : base(b) {}

    [[nodiscard]] std::chrono::milliseconds delay_for(int attempt) const noexcept
    {
        return base * (attempt + 1);
    }

    void operator()(int attempt) const noexcept { std::this_thread::sleep_for(delay_for(attempt)); }
};

/**
 * @brief Three-phase backoff for short polling loops.
 *
 * Attempts 0-3 only yield; 4-9 sleep 1 ms; from 10 on the sleep doubles every
 * attempt up to `cap`.
 */
struct ExponentialBackoff
{
    std::chrono::milliseconds cap;

    explicit ExponentialBackoff(std::chrono::milliseconds c = std::chrono::milliseconds(20)) : cap(c) {}

    void operator()(int attempt) const noexcept
    {
        if (attempt < 4)
        {
            std::this_thread::yield();
        }
        else if (attempt < 10)
        {
            std::this_thread::sleep_for(std::min(std::chrono::milliseconds(1), cap));
        }
        else
        {
            const int shift = std::min(attempt - 10, 16);
            std::this_thread::sleep_for(std::min(std::chrono::milliseconds(1LL << shift), cap));
        }
    }
};

/// @brief Fixed delay regardless of attempt.
struct ConstantBackoff
{
    std::chrono::milliseconds delay;

    explicit ConstantBackoff(std::chrono::milliseconds d = std::chrono::milliseconds(100)) : delay(d) {}

    void operator()(int /*attempt*/) const noexcept { std::this_thread::sleep_for(delay); }
};

/// @brief Does not wait at all. For tests only; in production it busy-spins.
struct NoBackoff
{
    void operator()(int /*attempt*/) const noexcept {}
};

/**
 * @brief Calls `attempt_fn(attempt)` up to `max_attempts` times until it returns true.
 *
 * The backoff runs between attempts, never after the last one.
 * @return True if some attempt succeeded.
 */
template <typename Fn, typename Backoff>
bool retry_with_backoff(int max_attempts, const Backoff &backoff, Fn &&attempt_fn)
{
    for (int attempt = 0; attempt < max_attempts; ++attempt)
    {
        if (attempt_fn(attempt))
        {
            return true;
        }
        if (attempt + 1 < max_attempts)
        {
            backoff(attempt);
        }
    }
    return false;
}

} // namespace mcpmesh::utils
