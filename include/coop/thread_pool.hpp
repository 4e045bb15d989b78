#pragma once

#include "coop/task.hpp"

#include <atomic>
#include <condition_variable>
#include <coroutine>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace coop
{
/**
 * A fixed set of worker threads resuming coroutines in FIFO order. Stoppable operations use it to
 * run on other threads than the one that requests stop.
 *
 * Shutting down, explicitly or by destruction, stops accepting work and finishes everything that
 * was already queued before the workers exit.
 */
class thread_pool
{
    struct private_constructor
    {
        explicit private_constructor() = default;
    };

public:
    /**
     * Moves the awaiting coroutine onto a worker. A coroutine that reaches a pool shutting down
     * in between continues inline.
     */
    class schedule_operation
    {
    public:
        explicit schedule_operation(thread_pool& tp) noexcept : m_thread_pool(tp) {}

        auto await_ready() const noexcept -> bool { return false; }
        auto await_suspend(std::coroutine_handle<> awaiting_coroutine) -> bool
        {
            return m_thread_pool.enqueue(awaiting_coroutine);
        }
        auto await_resume() noexcept -> void {}

    private:
        thread_pool& m_thread_pool;
    };

    struct options
    {
        /// The number of worker threads, the hardware concurrency by default.
        std::uint32_t thread_count = std::thread::hardware_concurrency();
    };

    /**
     * @see thread_pool::make_unique
     */
    thread_pool(options opts, private_constructor);

    static auto make_unique(options opts = options{.thread_count = std::thread::hardware_concurrency()})
        -> std::unique_ptr<thread_pool>;

    thread_pool(const thread_pool&)                    = delete;
    thread_pool(thread_pool&&)                         = delete;
    auto operator=(const thread_pool&) -> thread_pool& = delete;
    auto operator=(thread_pool&&) -> thread_pool&      = delete;
    ~thread_pool();

    auto thread_count() const noexcept -> std::size_t { return m_workers.size(); }

    /**
     * @throw std::runtime_error If the thread pool is shutting down.
     */
    [[nodiscard]] auto schedule() -> schedule_operation;

    /**
     * @return A task that runs the given task on a worker.
     */
    template<typename return_type>
    [[nodiscard]] auto schedule(task<return_type> work) -> task<return_type>
    {
        co_await schedule();
        co_return co_await std::move(work);
    }

    /**
     * Runs the task on a worker without anyone awaiting it, the frame is destroyed on completion.
     * @return False if the thread pool is shutting down, the task is destroyed without running.
     */
    auto spawn(task<void>&& work) -> bool;

    /**
     * Stops accepting work and blocks until the workers have drained the queue and exited.
     */
    auto shutdown() noexcept -> void;

    [[nodiscard]] auto is_shutdown() const noexcept -> bool { return m_stopping.load(std::memory_order::acquire); }

private:
    std::vector<std::thread>            m_workers{};
    std::mutex                          m_mutex{};
    std::condition_variable             m_work_available{};
    std::deque<std::coroutine_handle<>> m_queue{};
    std::atomic<bool>                   m_stopping{false};

    /// @return False if the pool is stopping and the coroutine was not queued.
    auto enqueue(std::coroutine_handle<> coroutine) -> bool;
    auto run_worker() -> void;
};

} // namespace coop
