#pragma once

#include "coop/detail/awaiter_list.hpp"

#include <atomic>
#include <mutex>
#include <thread>

namespace coop::detail
{
class stop_state;

/**
 * An entry in a stop_state's callback list. Owners derive from this and supply the function
 * that is invoked on the triggering thread when stop is requested.
 */
class stop_callback_base
{
public:
    using execute_type = void (*)(stop_callback_base*) noexcept;

    explicit stop_callback_base(execute_type execute) noexcept : m_execute(execute) {}
    stop_callback_base(const stop_callback_base&)                    = delete;
    stop_callback_base(stop_callback_base&&)                         = delete;
    auto operator=(const stop_callback_base&) -> stop_callback_base& = delete;
    auto operator=(stop_callback_base&&) -> stop_callback_base&      = delete;
    ~stop_callback_base()                                            = default;

    auto execute() noexcept -> void { m_execute(this); }

    stop_callback_base* m_next{nullptr};
    stop_callback_base* m_prev{nullptr};

private:
    friend stop_state;

    execute_type m_execute{nullptr};
    /// Set by the triggering thread while execute() runs, so a callback that deregisters itself
    /// from within its own execute() can report it.
    bool* m_removed_during_execute{nullptr};
    std::atomic<bool> m_execute_complete{false};
};

/**
 * The shared signal behind a stop_source and its stop_tokens. The flag only ever transitions from
 * not triggered to triggered, and every callback registered before the transition is executed
 * exactly once by the thread that performed it.
 */
class stop_state
{
public:
    stop_state() noexcept                          = default;
    stop_state(const stop_state&)                  = delete;
    stop_state(stop_state&&)                       = delete;
    auto operator=(const stop_state&) -> stop_state& = delete;
    auto operator=(stop_state&&) -> stop_state&    = delete;
    ~stop_state()                                  = default;

    auto is_triggered() const noexcept -> bool { return m_triggered.load(std::memory_order::acquire); }

    /**
     * Sets the flag and runs every registered callback on the calling thread.
     * @return True if this call performed the transition, false if it was already triggered.
     */
    auto trigger() noexcept -> bool;

    /**
     * Links the callback so it runs on trigger.
     * @return False if the state is already triggered, the callback is not linked and the caller
     *         must act as if it had been executed.
     */
    [[nodiscard]] auto try_register(stop_callback_base& callback) noexcept -> bool;

    /**
     * Unlinks a callback that was successfully registered. If the callback is executing on another
     * thread this blocks until it has returned, after which it is safe to destroy the callback.
     */
    auto deregister(stop_callback_base& callback) noexcept -> void;

private:
    std::atomic<bool>                 m_triggered{false};
    std::mutex                        m_mutex{};
    awaiter_list<stop_callback_base> m_callbacks{};
    std::thread::id                   m_triggering_thread{};
};

} // namespace coop::detail
