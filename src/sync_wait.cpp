#include "coop/sync_wait.hpp"

namespace coop::detail
{
auto sync_wait_event::set() noexcept -> void
{
    // The waiter destroys this event as soon as it can see the flag, notify before releasing the lock.
    std::lock_guard<std::mutex> lk{m_mutex};
    m_set.store(true, std::memory_order::release);
    m_cv.notify_all();
}

auto sync_wait_event::wait() noexcept -> void
{
    std::unique_lock<std::mutex> lk{m_mutex};
    m_cv.wait(lk, [this] { return m_set.load(std::memory_order::acquire); });
}

auto sync_wait_promise::completion_notifier::await_suspend(std::coroutine_handle<sync_wait_promise> coroutine) const noexcept
    -> void
{
    coroutine.promise().m_event->set();
}

auto sync_wait_promise::get_return_object() noexcept -> sync_wait_task
{
    return sync_wait_task{std::coroutine_handle<sync_wait_promise>::from_promise(*this)};
}

auto sync_wait_promise::start(sync_wait_event& event) -> void
{
    m_event = &event;
    std::coroutine_handle<sync_wait_promise>::from_promise(*this).resume();
}

auto sync_wait_promise::rethrow_if_failed() const -> void
{
    if (m_exception != nullptr)
    {
        std::rethrow_exception(m_exception);
    }
}

} // namespace coop::detail
