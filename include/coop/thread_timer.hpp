#pragma once

#include "coop/detail/timed_events.hpp"
#include "coop/timer.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace coop
{
/**
 * A portable timer backend, a dedicated thread sleeps on a condition variable until the earliest
 * pending wake is due and runs the expired callbacks outside of the lock.
 *
 * Wakes still pending at shutdown are discarded without running.
 */
class thread_timer final : public timer
{
    struct private_constructor
    {
        explicit private_constructor() = default;
    };

public:
    struct options
    {
        /// Functor to call on the timer thread upon starting execution.
        std::function<void()> on_thread_start_functor = nullptr;
        /// Functor to call on the timer thread upon stopping execution.
        std::function<void()> on_thread_stop_functor = nullptr;
    };

    /**
     * @see thread_timer::make_unique
     */
    explicit thread_timer(options&& opts, private_constructor);

    static auto make_unique(options opts = options{.on_thread_start_functor = nullptr, .on_thread_stop_functor = nullptr})
        -> std::unique_ptr<thread_timer>;

    ~thread_timer() override;

    /**
     * @throw std::logic_error If the timer has been shutdown.
     */
    [[nodiscard]] auto schedule(time_point tp, callback_type callback) -> id override;

    auto cancel(id timer_id) -> bool override;

    /**
     * Stops the timer thread and discards any pending wakes. Blocks until the thread has exited.
     */
    auto shutdown() noexcept -> void;

    [[nodiscard]] auto is_shutdown() const -> bool { return m_shutdown_requested.load(std::memory_order::acquire); }

    /**
     * @return The number of pending wakes.
     */
    [[nodiscard]] auto size() const -> std::size_t;

private:
    options m_opts;

    mutable std::mutex      m_mutex;
    std::condition_variable m_cv;
    detail::timed_events    m_timed_events;

    std::atomic<bool> m_shutdown_requested{false};
    std::thread       m_thread;

    auto process_timers() -> void;
};

} // namespace coop
