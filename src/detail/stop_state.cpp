#include "coop/detail/stop_state.hpp"

namespace coop::detail
{
auto stop_state::trigger() noexcept -> bool
{
    if (m_triggered.exchange(true, std::memory_order::acq_rel))
    {
        return false;
    }

    std::unique_lock<std::mutex> lk{m_mutex};
    m_triggering_thread = std::this_thread::get_id();

    while (!awaiter_list_empty(m_callbacks))
    {
        auto* callback = awaiter_list_pop_front(m_callbacks);

        bool removed_during_execute{false};
        callback->m_removed_during_execute = &removed_during_execute;

        lk.unlock();
        callback->execute();

        // The callback may have destroyed itself, it must not be touched if it said so.
        if (!removed_during_execute)
        {
            callback->m_removed_during_execute = nullptr;
            callback->m_execute_complete.store(true, std::memory_order::release);
            callback->m_execute_complete.notify_all();
        }
        lk.lock();
    }

    return true;
}

auto stop_state::try_register(stop_callback_base& callback) noexcept -> bool
{
    if (is_triggered())
    {
        return false;
    }

    std::scoped_lock lk{m_mutex};
    awaiter_list_push_back(m_callbacks, &callback);

    // A trigger that raced with the push has either drained the list already or is blocked on the
    // lock, either way it will not see this callback once it is unlinked here.
    if (is_triggered())
    {
        awaiter_list_erase(m_callbacks, &callback);
        return false;
    }

    return true;
}

auto stop_state::deregister(stop_callback_base& callback) noexcept -> void
{
    std::unique_lock<std::mutex> lk{m_mutex};
    if (awaiter_list_linked(m_callbacks, &callback))
    {
        awaiter_list_erase(m_callbacks, &callback);
        return;
    }

    // The callback has been popped by trigger(), it is running or has already run.
    auto triggering_thread = m_triggering_thread;
    lk.unlock();

    if (triggering_thread == std::this_thread::get_id())
    {
        if (callback.m_removed_during_execute != nullptr)
        {
            *callback.m_removed_during_execute = true;
        }
    }
    else
    {
        callback.m_execute_complete.wait(false, std::memory_order::acquire);
    }
}

} // namespace coop::detail
