#include "coop/thread_pool.hpp"
#include "coop/detail/task_self_deleting.hpp"

#include <stdexcept>

namespace coop
{
thread_pool::thread_pool(options opts, private_constructor)
{
    m_workers.reserve(opts.thread_count);
}

auto thread_pool::make_unique(options opts) -> std::unique_ptr<thread_pool>
{
    auto tp = std::make_unique<thread_pool>(opts, private_constructor{});

    // The workers only start once the pool they reference is fully built.
    for (std::uint32_t i = 0; i < opts.thread_count; ++i)
    {
        tp->m_workers.emplace_back([tp = tp.get()]() { tp->run_worker(); });
    }

    return tp;
}

thread_pool::~thread_pool()
{
    shutdown();
}

auto thread_pool::schedule() -> schedule_operation
{
    if (is_shutdown())
    {
        throw std::runtime_error("coop::thread_pool is shutting down, unable to schedule new tasks.");
    }
    return schedule_operation{*this};
}

auto thread_pool::spawn(task<void>&& work) -> bool
{
    auto detached = detail::make_task_self_deleting(std::move(work));
    if (!enqueue(detached.handle()))
    {
        // Never started, the frame is still owned here.
        detached.handle().destroy();
        return false;
    }
    return true;
}

auto thread_pool::shutdown() noexcept -> void
{
    {
        std::scoped_lock lk{m_mutex};
        if (m_stopping.exchange(true, std::memory_order::acq_rel))
        {
            return;
        }
    }
    m_work_available.notify_all();

    for (auto& worker : m_workers)
    {
        if (worker.joinable() && worker.get_id() != std::this_thread::get_id())
        {
            worker.join();
        }
    }
}

auto thread_pool::enqueue(std::coroutine_handle<> coroutine) -> bool
{
    {
        std::scoped_lock lk{m_mutex};
        if (m_stopping.load(std::memory_order::acquire))
        {
            return false;
        }
        m_queue.emplace_back(coroutine);
    }
    m_work_available.notify_one();
    return true;
}

auto thread_pool::run_worker() -> void
{
    std::unique_lock<std::mutex> lk{m_mutex};
    while (true)
    {
        m_work_available.wait(lk, [this] { return !m_queue.empty() || m_stopping.load(std::memory_order::acquire); });

        // Stopping only ends the worker once everything queued before it has run.
        if (m_queue.empty())
        {
            return;
        }

        auto coroutine = m_queue.front();
        m_queue.pop_front();
        lk.unlock();
        coroutine.resume();
        lk.lock();
    }
}

} // namespace coop
