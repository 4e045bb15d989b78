#pragma once

#include "coop/concepts/awaitable.hpp"
#include "coop/concepts/sequence.hpp"
#include "coop/deadline.hpp"
#include "coop/detail/task_self_deleting.hpp"
#include "coop/expected.hpp"
#include "coop/stop_reason.hpp"
#include "coop/stop_token.hpp"
#include "coop/task.hpp"

#include <atomic>
#include <concepts>
#include <exception>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace coop
{
namespace detail
{
/**
 * The race between an operation and a deadline. Both sides hold a reference, whichever side wins
 * try_decide() publishes the outcome and releases m_done to wake the awaiting caller.
 */
template<typename return_type>
struct until_state
{
    using value_type = std::conditional_t<std::is_void_v<return_type>, std::monostate, return_type>;

    auto try_decide() noexcept -> bool { return !m_decided.exchange(true, std::memory_order::acq_rel); }

    std::atomic<bool>         m_decided{false};
    stop_source               m_done{};
    std::optional<value_type> m_value{std::nullopt};
    std::exception_ptr        m_exception{nullptr};
    bool                      m_cancelled{false};
};

template<concepts::awaitable awaitable_type, typename return_type>
auto make_until_controller_task(awaitable_type a, std::shared_ptr<until_state<return_type>> state) -> task<void>
{
    try
    {
        if constexpr (std::is_void_v<return_type>)
        {
            co_await std::move(a);
            if (state->try_decide())
            {
                state->m_value.emplace();
                state->m_done.request_stop();
            }
        }
        else
        {
            auto result = co_await std::move(a);
            if (state->try_decide())
            {
                state->m_value.emplace(std::move(result));
                state->m_done.request_stop();
            }
        }
    }
    catch (...)
    {
        if (!state->try_decide())
        {
            // Nobody is waiting for this outcome anymore, let the detached task report it.
            throw;
        }
        state->m_exception = std::current_exception();
        state->m_done.request_stop();
    }
}

} // namespace detail

/**
 * Races the awaitable against the deadline and completes with whichever finishes first.
 *
 * The deadline is checked before anything else, if it has already resolved the awaitable is never
 * started. Otherwise the awaitable is started on a detached coroutine. If the deadline wins the
 * awaitable is no longer driven by the caller, it keeps running to its own completion and its
 * result is discarded. An awaitable that takes something when it completes, a channel receive for
 * example, takes it anyway, race a stoppable_operation instead so the request can be withdrawn.
 *
 * @return The awaitable's result, or the deadline's stop_reason if the deadline resolved first.
 * @throw Whatever the awaitable throws if it finished first.
 */
template<
    concepts::awaitable awaitable_type,
    typename return_type =
        std::remove_cvref_t<typename concepts::awaitable_traits<awaitable_type>::awaiter_return_type>>
[[nodiscard]] auto until(awaitable_type a, deadline d) -> task<expected<return_type, stop_reason>>
    requires std::move_constructible<awaitable_type>
{
    if (d.is_ready())
    {
        co_return unexpected<stop_reason>{d.reason()};
    }

    auto state = std::make_shared<detail::until_state<return_type>>();

    stop_callback on_deadline{
        d.token(),
        [state]() -> void
        {
            if (state->try_decide())
            {
                // Waking the caller can destroy this closure, nothing captured may be touched after
                // request_stop(), only the local reference keeps the state alive until it returns.
                auto keep_alive         = state;
                keep_alive->m_cancelled = true;
                keep_alive->m_done.request_stop();
            }
        }};

    if (!state->m_decided.load(std::memory_order::acquire))
    {
        auto controller = detail::make_task_self_deleting(
            detail::make_until_controller_task<awaitable_type, return_type>(std::move(a), state));
        controller.handle().resume();
    }

    co_await state->m_done.token();

    if (state->m_cancelled)
    {
        co_return unexpected<stop_reason>{d.reason()};
    }

    if (state->m_exception)
    {
        std::rethrow_exception(state->m_exception);
    }

    if constexpr (std::is_void_v<return_type>)
    {
        co_return expected<void, stop_reason>{};
    }
    else
    {
        co_return std::move(state->m_value.value());
    }
}

/**
 * Starts the operation with the deadline's token and completes when the operation does. The
 * operation observes the deadline itself, once it resolves a pending request is withdrawn without
 * consuming anything, so nothing is left running when this completes.
 *
 * The deadline is checked before anything else, if it has already resolved the operation is never
 * started. A result the operation already obtained is always delivered, even if the deadline
 * resolved in the meantime.
 *
 * @return The operation's result, std::nullopt if it completed without one (a closed channel for
 *         example), or the deadline's stop_reason if the request was withdrawn.
 */
template<concepts::stoppable_operation operation_type>
[[nodiscard]] auto until(operation_type make_operation, deadline d)
    -> task<expected<concepts::stoppable_operation_result_type<operation_type>, stop_reason>>
{
    if (d.is_ready())
    {
        co_return unexpected<stop_reason>{d.reason()};
    }

    concepts::stoppable_operation_result_type<operation_type> result = co_await make_operation(d.token());
    if (!result.has_value() && d.is_ready())
    {
        co_return unexpected<stop_reason>{d.reason()};
    }

    co_return std::move(result);
}

} // namespace coop
