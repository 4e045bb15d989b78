#pragma once

#include "coop/concepts/awaitable.hpp"

#include <atomic>
#include <condition_variable>
#include <coroutine>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace coop
{
namespace detail
{
class sync_wait_event
{
public:
    sync_wait_event() = default;
    sync_wait_event(const sync_wait_event&)                    = delete;
    sync_wait_event(sync_wait_event&&)                         = delete;
    auto operator=(const sync_wait_event&) -> sync_wait_event& = delete;
    auto operator=(sync_wait_event&&) -> sync_wait_event&      = delete;
    ~sync_wait_event()                                         = default;

    auto set() noexcept -> void;
    auto wait() noexcept -> void;

private:
    std::mutex              m_mutex;
    std::condition_variable m_cv;
    std::atomic<bool>       m_set{false};
};

class sync_wait_task;

/**
 * The promise of the coroutine sync_wait() drives. The result is written into the blocked caller's
 * frame, the promise only carries the completion event and any exception.
 */
class sync_wait_promise
{
public:
    /// Signals the blocked thread once the frame is suspended for good and safe to destroy.
    struct completion_notifier
    {
        auto await_ready() const noexcept -> bool { return false; }
        auto await_suspend(std::coroutine_handle<sync_wait_promise> coroutine) const noexcept -> void;
        auto await_resume() noexcept -> void {}
    };

    auto get_return_object() noexcept -> sync_wait_task;
    auto initial_suspend() noexcept -> std::suspend_always { return {}; }
    auto final_suspend() noexcept -> completion_notifier { return {}; }
    auto return_void() noexcept -> void {}
    auto unhandled_exception() noexcept -> void { m_exception = std::current_exception(); }

    auto start(sync_wait_event& event) -> void;
    auto rethrow_if_failed() const -> void;

private:
    sync_wait_event*   m_event{nullptr};
    std::exception_ptr m_exception{nullptr};
};

class sync_wait_task
{
public:
    using promise_type = sync_wait_promise;

    explicit sync_wait_task(std::coroutine_handle<sync_wait_promise> coroutine) noexcept : m_coroutine(coroutine) {}
    sync_wait_task(const sync_wait_task&) = delete;
    sync_wait_task(sync_wait_task&& other) noexcept : m_coroutine(std::exchange(other.m_coroutine, nullptr)) {}
    auto operator=(const sync_wait_task&) -> sync_wait_task& = delete;
    auto operator=(sync_wait_task&&) -> sync_wait_task&      = delete;
    ~sync_wait_task()
    {
        if (m_coroutine != nullptr)
        {
            m_coroutine.destroy();
        }
    }

    /**
     * Runs the awaitable to completion on whichever threads resume it and blocks until it is done.
     * @throw Whatever the awaitable threw.
     */
    auto run() -> void
    {
        sync_wait_event done{};
        m_coroutine.promise().start(done);
        done.wait();
        m_coroutine.promise().rethrow_if_failed();
    }

private:
    std::coroutine_handle<sync_wait_promise> m_coroutine{nullptr};
};

/**
 * Where sync_wait() keeps the result while the coroutine completes: nothing for void, the address
 * for an lvalue reference, otherwise the value itself.
 */
template<typename return_type>
using sync_wait_slot = std::conditional_t<
    std::is_void_v<return_type>,
    std::monostate,
    std::conditional_t<
        std::is_lvalue_reference_v<return_type>,
        std::remove_reference_t<return_type>*,
        std::optional<std::remove_cvref_t<return_type>>>>;

template<concepts::awaitable awaitable_type, typename return_type>
auto make_sync_wait_task(awaitable_type&& a, sync_wait_slot<return_type>& slot) -> sync_wait_task
{
    if constexpr (std::is_void_v<return_type>)
    {
        co_await std::forward<awaitable_type>(a);
    }
    else if constexpr (std::is_lvalue_reference_v<return_type>)
    {
        slot = std::addressof(co_await std::forward<awaitable_type>(a));
    }
    else
    {
        slot.emplace(co_await std::forward<awaitable_type>(a));
    }
}

} // namespace detail

/**
 * Blocks the calling thread until the given awaitable completes and returns its result. Any
 * exception thrown by the awaitable is rethrown on the calling thread.
 */
template<concepts::awaitable awaitable_type>
auto sync_wait(awaitable_type&& a) -> decltype(auto)
{
    using return_type = typename concepts::awaitable_traits<awaitable_type>::awaiter_return_type;

    detail::sync_wait_slot<return_type> slot{};
    detail::make_sync_wait_task<awaitable_type, return_type>(std::forward<awaitable_type>(a), slot).run();

    if constexpr (std::is_void_v<return_type>)
    {
        return;
    }
    else if constexpr (std::is_lvalue_reference_v<return_type>)
    {
        return static_cast<return_type>(*slot);
    }
    else
    {
        std::remove_cvref_t<return_type> result = std::move(slot.value());
        return result;
    }
}

} // namespace coop
