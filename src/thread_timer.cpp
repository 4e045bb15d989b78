#include "coop/thread_timer.hpp"

#include <stdexcept>

namespace coop
{
thread_timer::thread_timer(options&& opts, private_constructor) : m_opts(std::move(opts))
{
}

auto thread_timer::make_unique(options opts) -> std::unique_ptr<thread_timer>
{
    auto t = std::make_unique<thread_timer>(std::move(opts), private_constructor{});

    // Spawn the timer thread once the timer is fully constructed.
    t->m_thread = std::thread([t = t.get()]() { t->process_timers(); });

    return t;
}

thread_timer::~thread_timer()
{
    shutdown();
}

auto thread_timer::schedule(time_point tp, callback_type callback) -> id
{
    std::unique_lock<std::mutex> lk{m_mutex};
    if (m_shutdown_requested.load(std::memory_order::acquire))
    {
        throw std::logic_error("coop::thread_timer is shutdown, unable to schedule new wakes.");
    }

    auto [timer_id, is_first] = m_timed_events.add(tp, std::move(callback));
    lk.unlock();

    // Only a new earliest wake changes how long the timer thread has to sleep.
    if (is_first)
    {
        m_cv.notify_one();
    }

    return timer_id;
}

auto thread_timer::cancel(id timer_id) -> bool
{
    std::scoped_lock lk{m_mutex};
    // Removing the earliest wake leaves the timer thread to wake up early and find nothing due.
    return m_timed_events.remove(timer_id).first;
}

auto thread_timer::shutdown() noexcept -> void
{
    // Only allow shutdown to occur once.
    if (m_shutdown_requested.exchange(true, std::memory_order::acq_rel) == false)
    {
        {
            std::scoped_lock lk{m_mutex};
            m_cv.notify_all();
        }

        if (m_thread.joinable() && std::this_thread::get_id() != m_thread.get_id())
        {
            m_thread.join();
        }
    }
}

auto thread_timer::size() const -> std::size_t
{
    std::scoped_lock lk{m_mutex};
    return m_timed_events.size();
}

auto thread_timer::process_timers() -> void
{
    if (m_opts.on_thread_start_functor != nullptr)
    {
        m_opts.on_thread_start_functor();
    }

    std::unique_lock<std::mutex> lk{m_mutex};
    while (!m_shutdown_requested.load(std::memory_order::acquire))
    {
        auto next = m_timed_events.next();
        if (!next.has_value())
        {
            m_cv.wait(lk);
            continue;
        }

        if (clock::now() < next.value())
        {
            m_cv.wait_until(lk, next.value());
            continue;
        }

        auto expired = m_timed_events.take_expired(clock::now());
        lk.unlock();

        // The callbacks may schedule or cancel wakes, never hold the lock while running them.
        for (auto& callback : expired)
        {
            callback();
        }

        lk.lock();
    }

    m_timed_events.clear();
    lk.unlock();

    if (m_opts.on_thread_stop_functor != nullptr)
    {
        m_opts.on_thread_stop_functor();
    }
}

} // namespace coop
