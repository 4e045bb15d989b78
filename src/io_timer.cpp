#include "coop/io_timer.hpp"

#if defined(LIBCOOP_FEATURE_IO_TIMER)

    #include <array>
    #include <cerrno>
    #include <cstring>
    #include <iostream>
    #include <stdexcept>
    #include <string>

    #include <sys/epoll.h>
    #include <sys/eventfd.h>
    #include <sys/timerfd.h>
    #include <unistd.h>

using namespace std::chrono_literals;

namespace coop
{
io_timer::io_timer(options&& opts, private_constructor)
    : m_opts(std::move(opts)),
      m_epoll_fd(::epoll_create1(EPOLL_CLOEXEC)),
      m_timer_fd(::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC)),
      m_shutdown_fd(::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC))
{
    if (m_epoll_fd == -1 || m_timer_fd == -1 || m_shutdown_fd == -1)
    {
        auto error = std::string{strerror(errno)};
        close_fds();
        throw std::runtime_error("Failed to create coop::io_timer descriptors errorno=[" + error + "].");
    }

    ::epoll_event timer_event{};
    timer_event.events   = EPOLLIN;
    timer_event.data.u64 = m_timer_tag;
    ::epoll_event shutdown_event{};
    shutdown_event.events   = EPOLLIN;
    shutdown_event.data.u64 = m_shutdown_tag;

    if (::epoll_ctl(m_epoll_fd, EPOLL_CTL_ADD, m_timer_fd, &timer_event) == -1 ||
        ::epoll_ctl(m_epoll_fd, EPOLL_CTL_ADD, m_shutdown_fd, &shutdown_event) == -1)
    {
        auto error = std::string{strerror(errno)};
        close_fds();
        throw std::runtime_error("Failed to register coop::io_timer descriptors for read events errorno=[" + error + "].");
    }
}

auto io_timer::make_unique(options opts) -> std::unique_ptr<io_timer>
{
    auto t = std::make_unique<io_timer>(std::move(opts), private_constructor{});

    // Spawn the event loop thread once the timer is fully constructed.
    t->m_thread = std::thread([t = t.get()]() { t->process_events(); });

    return t;
}

io_timer::~io_timer()
{
    shutdown();
    close_fds();
}

auto io_timer::schedule(time_point tp, callback_type callback) -> id
{
    std::scoped_lock lk{m_timed_events_mutex};
    if (m_shutdown_requested.load(std::memory_order::acquire))
    {
        throw std::logic_error("coop::io_timer is shutdown, unable to schedule new wakes.");
    }

    auto [timer_id, is_first] = m_timed_events.add(tp, std::move(callback));

    // If this wake was inserted as the earliest, re-arm the timerfd.
    if (is_first)
    {
        update_timeout(clock::now());
    }

    return timer_id;
}

auto io_timer::cancel(id timer_id) -> bool
{
    std::scoped_lock lk{m_timed_events_mutex};
    auto [removed, was_first] = m_timed_events.remove(timer_id);

    // Firing early would be harmless as nothing is due, but keep the timerfd exact.
    if (was_first)
    {
        update_timeout(clock::now());
    }

    return removed;
}

auto io_timer::shutdown() noexcept -> void
{
    // Only allow shutdown to occur once.
    if (m_shutdown_requested.exchange(true, std::memory_order::acq_rel) == false)
    {
        std::uint64_t value{1};
        if (::write(m_shutdown_fd, &value, sizeof(value)) == -1)
        {
            std::cerr << "Failed to signal coop::io_timer shutdown errorno=[" << std::string{strerror(errno)} << "].\n";
        }

        if (m_thread.joinable() && std::this_thread::get_id() != m_thread.get_id())
        {
            m_thread.join();
        }
    }
}

auto io_timer::size() const -> std::size_t
{
    std::scoped_lock lk{m_timed_events_mutex};
    return m_timed_events.size();
}

auto io_timer::process_events() -> void
{
    if (m_opts.on_thread_start_functor != nullptr)
    {
        m_opts.on_thread_start_functor();
    }

    auto ready_set = std::array<::epoll_event, m_max_events>{};
    while (!m_shutdown_requested.load(std::memory_order::acquire))
    {
        int num_ready = ::epoll_wait(m_epoll_fd, ready_set.data(), ready_set.size(), -1);
        if (num_ready == -1)
        {
            if (errno != EINTR)
            {
                std::cerr << "Failed to epoll_wait errorno=[" << std::string{strerror(errno)} << "].\n";
            }
            continue;
        }

        for (int i = 0; i < num_ready; ++i)
        {
            if (ready_set[i].data.u64 == m_timer_tag)
            {
                // Drain the expiration count, the timerfd is non blocking so a stale event reads EAGAIN.
                std::uint64_t expirations{0};
                if (::read(m_timer_fd, &expirations, sizeof(expirations)) == -1 && errno != EAGAIN)
                {
                    std::cerr << "Failed to read timerfd errorno=[" << std::string{strerror(errno)} << "].\n";
                }
                process_timeout_execute();
            }
            // The shutdown event only needs to break the wait, the loop condition handles it.
        }
    }

    {
        std::scoped_lock lk{m_timed_events_mutex};
        m_timed_events.clear();
    }

    if (m_opts.on_thread_stop_functor != nullptr)
    {
        m_opts.on_thread_stop_functor();
    }
}

auto io_timer::process_timeout_execute() -> void
{
    std::vector<callback_type> expired{};
    {
        std::scoped_lock lk{m_timed_events_mutex};
        expired = m_timed_events.take_expired(clock::now());

        // Re-arm to the next earliest wake, re-take now since the one above may be stale.
        update_timeout(clock::now());
    }

    for (auto& callback : expired)
    {
        callback();
    }
}

auto io_timer::update_timeout(time_point now) -> void
{
    itimerspec ts{};

    auto next = m_timed_events.next();
    if (next.has_value())
    {
        std::chrono::nanoseconds amount = next.value() - now;

        auto seconds = std::chrono::duration_cast<std::chrono::seconds>(amount);
        amount -= seconds;
        auto nanoseconds = std::chrono::duration_cast<std::chrono::nanoseconds>(amount);

        // Zero disarms a timerfd and negative values are an error, a wake that is already due fires
        // as soon as possible instead.
        if (seconds <= 0s)
        {
            seconds = 0s;
            if (nanoseconds <= 0ns)
            {
                nanoseconds = 1ns;
            }
        }

        ts.it_value.tv_sec  = seconds.count();
        ts.it_value.tv_nsec = nanoseconds.count();
    }
    // else leave it zeroed which disarms the timerfd.

    if (::timerfd_settime(m_timer_fd, 0, &ts, nullptr) == -1)
    {
        std::cerr << "Failed to set timerfd errorno=[" << std::string{strerror(errno)} << "].\n";
    }
}

auto io_timer::close_fds() noexcept -> void
{
    for (auto* fd : {&m_timer_fd, &m_shutdown_fd, &m_epoll_fd})
    {
        if (*fd != -1)
        {
            ::close(*fd);
            *fd = -1;
        }
    }
}

} // namespace coop

#endif
