#pragma once

#if defined(LIBCOOP_FEATURE_IO_TIMER)

    #include "coop/detail/timed_events.hpp"
    #include "coop/timer.hpp"

    #include <atomic>
    #include <chrono>
    #include <functional>
    #include <memory>
    #include <mutex>
    #include <thread>

namespace coop
{
/**
 * A Linux timer backend driven by the kernel, a dedicated thread waits in epoll on a timerfd that
 * is always armed to the earliest pending wake, and on an eventfd used to signal shutdown.
 *
 * Wakes still pending at shutdown are discarded without running.
 */
class io_timer final : public timer
{
    struct private_constructor
    {
        explicit private_constructor() = default;
    };

public:
    using fd_t = int;

    struct options
    {
        /// Functor to call on the event loop thread upon starting execution.
        std::function<void()> on_thread_start_functor = nullptr;
        /// Functor to call on the event loop thread upon stopping execution.
        std::function<void()> on_thread_stop_functor = nullptr;
    };

    /**
     * @see io_timer::make_unique
     * @throw std::runtime_error If the epoll, timerfd or eventfd descriptors cannot be created.
     */
    explicit io_timer(options&& opts, private_constructor);

    static auto make_unique(options opts = options{.on_thread_start_functor = nullptr, .on_thread_stop_functor = nullptr})
        -> std::unique_ptr<io_timer>;

    ~io_timer() override;

    /**
     * @throw std::logic_error If the timer has been shutdown.
     */
    [[nodiscard]] auto schedule(time_point tp, callback_type callback) -> id override;

    auto cancel(id timer_id) -> bool override;

    /**
     * Stops the event loop thread and discards any pending wakes. Blocks until the thread has exited.
     */
    auto shutdown() noexcept -> void;

    [[nodiscard]] auto is_shutdown() const -> bool { return m_shutdown_requested.load(std::memory_order::acquire); }

    [[nodiscard]] auto size() const -> std::size_t;

private:
    static constexpr std::size_t m_max_events = 4;

    options m_opts;

    fd_t m_epoll_fd{-1};
    fd_t m_timer_fd{-1};
    fd_t m_shutdown_fd{-1};

    /// Identifies the timerfd in epoll events.
    static constexpr std::uint64_t m_timer_tag{1};
    /// Identifies the shutdown eventfd in epoll events.
    static constexpr std::uint64_t m_shutdown_tag{2};

    mutable std::mutex   m_timed_events_mutex;
    detail::timed_events m_timed_events;

    std::atomic<bool> m_shutdown_requested{false};
    std::thread       m_thread;

    auto process_events() -> void;
    auto process_timeout_execute() -> void;
    /// Must be called with m_timed_events_mutex held.
    auto update_timeout(time_point now) -> void;
    auto close_fds() noexcept -> void;
};

} // namespace coop

#endif
