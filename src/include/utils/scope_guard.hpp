#pragma once

#include <concepts>
#include <functional>
#include <type_traits>
#include <utility>

namespace mcpmesh::basics
{

/**
 * @class ScopeGuard
 * @brief Runs a callable when the enclosing scope exits, unless dismissed.
 *
 * Used for rollback of partially applied state (a spawned child, a half-written
 * registry record, an open descriptor). Movable, not copyable; a moved-from guard
 * is inactive.
 *
 * The callable runs from a `noexcept` destructor, so it must not throw; an
 * exception escaping it terminates the program. Cleanup that can fail should
 * handle and log the failure itself.
 *
 * @code
 *  auto rollback = mcpmesh::basics::make_scope_guard([&] { registry.unregister_server(key); });
 *  if (!confirm_started())
 *      return false;   // rollback runs
 *  rollback.dismiss(); // keep the record
 * @endcode
 */
template <typename Callable>
requires std::invocable<Callable &>
class ScopeGuard
{
  public:
    static_assert(!std::is_reference_v<Callable>, "ScopeGuard cannot hold a reference to a callable.");

    explicit ScopeGuard(Callable fn) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(fn))
    {
    }

    ScopeGuard(ScopeGuard &&other) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(other.m_func)), m_active(other.m_active)
    {
        other.dismiss();
    }

    ~ScopeGuard() noexcept
    {
        if (m_active)
        {
            std::invoke(m_func);
        }
    }

    ScopeGuard(const ScopeGuard &) = delete;
    ScopeGuard &operator=(const ScopeGuard &) = delete;
    ScopeGuard &operator=(ScopeGuard &&) = delete;

    [[nodiscard]] explicit operator bool() const noexcept { return m_active; }

    constexpr void dismiss() noexcept { m_active = false; }

    /// Runs the callable now (if still active) and dismisses the guard.
    void invoke()
    {
        if (m_active)
        {
            m_active = false;
            std::invoke(m_func);
        }
    }

  private:
    Callable m_func;
    bool m_active{true};
};

template <typename F> auto make_scope_guard(F &&f) -> ScopeGuard<std::decay_t<F>>
{
    return ScopeGuard<std::decay_t<F>>(std::forward<F>(f));
}

} // namespace mcpmesh::basics
