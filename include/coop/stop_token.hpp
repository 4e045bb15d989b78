#pragma once

#include "coop/detail/stop_state.hpp"

#include <coroutine>
#include <memory>
#include <type_traits>
#include <utility>

namespace coop
{
class stop_token;
class stop_source;

namespace detail
{
struct stop_token_access
{
    static auto state(const stop_token& token) noexcept -> const std::shared_ptr<stop_state>&;
    static auto make(std::shared_ptr<stop_state> state) noexcept -> stop_token;
};
} // namespace detail

/**
 * A cheap, copyable observer of a stop_source's signal. A token can be queried synchronously or
 * co_await'ed, awaiting suspends until stop is requested and resumes on the thread that requested
 * it. Every co_await is an independent registration and any number of coroutines may await the
 * same token, or copies of it, concurrently.
 *
 * A default constructed token is not associated with any source, stop is never requested on it
 * and awaiting it never resumes.
 */
class stop_token
{
public:
    struct awaiter : public detail::stop_callback_base
    {
        explicit awaiter(std::shared_ptr<detail::stop_state> state) noexcept
            : detail::stop_callback_base(&awaiter::on_stop),
              m_state(std::move(state))
        {
        }
        awaiter(const awaiter&)                    = delete;
        awaiter(awaiter&&)                         = delete;
        auto operator=(const awaiter&) -> awaiter& = delete;
        auto operator=(awaiter&&) -> awaiter&      = delete;

        ~awaiter()
        {
            // Also required after on_stop() ran, the resumed coroutine may destroy this awaiter
            // before the triggering thread is done with the registration.
            if (m_registered)
            {
                m_state->deregister(*this);
            }
        }

        auto await_ready() const noexcept -> bool { return m_state != nullptr && m_state->is_triggered(); }

        auto await_suspend(std::coroutine_handle<> awaiting_coroutine) noexcept -> bool
        {
            m_awaiting_coroutine = awaiting_coroutine;
            if (m_state == nullptr)
            {
                return true;
            }

            // Once registered the trigger may resume the coroutine, and destroy this awaiter, at any moment.
            m_registered = true;
            if (!m_state->try_register(*this))
            {
                m_registered = false;
                return false;
            }
            return true;
        }

        auto await_resume() noexcept -> void {}

    private:
        static auto on_stop(detail::stop_callback_base* base) noexcept -> void
        {
            static_cast<awaiter*>(base)->m_awaiting_coroutine.resume();
        }

        std::shared_ptr<detail::stop_state> m_state{nullptr};
        std::coroutine_handle<>             m_awaiting_coroutine{nullptr};
        bool                                m_registered{false};
    };

    stop_token() noexcept = default;

    /**
     * @return True if stop has been requested on the associated source.
     */
    auto stop_requested() const noexcept -> bool { return m_state != nullptr && m_state->is_triggered(); }

    /**
     * @return True if this token is associated with a source and can therefore ever observe stop.
     */
    auto stop_possible() const noexcept -> bool { return m_state != nullptr; }

    auto operator co_await() const noexcept -> awaiter { return awaiter{m_state}; }

    friend auto operator==(const stop_token& lhs, const stop_token& rhs) noexcept -> bool
    {
        return lhs.m_state == rhs.m_state;
    }

private:
    friend detail::stop_token_access;

    explicit stop_token(std::shared_ptr<detail::stop_state> state) noexcept : m_state(std::move(state)) {}

    std::shared_ptr<detail::stop_state> m_state{nullptr};
};

/**
 * The owning side of a stop signal. Stop is requested exactly once, either explicitly through
 * request_stop() or implicitly when the source is destroyed or assigned over. The source is
 * move only so there is always exactly one owner of the right to request stop.
 */
class stop_source
{
public:
    stop_source();
    stop_source(const stop_source&) = delete;
    stop_source(stop_source&& other) noexcept;
    auto operator=(const stop_source&) -> stop_source& = delete;
    auto operator=(stop_source&& other) noexcept -> stop_source&;
    ~stop_source();

    /**
     * @return A token observing this source. Tokens taken from a moved-from source are not
     *         associated with any source.
     */
    auto token() const noexcept -> stop_token;

    /**
     * Requests stop, every coroutine awaiting a token is resumed on the calling thread before
     * this returns. Further calls have no effect.
     * @return True if this call requested stop.
     */
    auto request_stop() noexcept -> bool;

    auto stop_requested() const noexcept -> bool { return m_state != nullptr && m_state->is_triggered(); }

private:
    std::shared_ptr<detail::stop_state> m_state{nullptr};
};

/**
 * Runs the given functor once stop is requested on the token, or immediately in the constructor
 * if it already has been. The functor runs on the thread that requested stop. Destroying the
 * stop_callback guarantees the functor is not running and will never run afterwards, unless it
 * is destroyed from within its own functor.
 */
template<typename callback_type>
class stop_callback : private detail::stop_callback_base
{
public:
    template<typename functor_type>
        requires std::is_constructible_v<callback_type, functor_type>
    stop_callback(const stop_token& token, functor_type&& functor)
        : detail::stop_callback_base(&stop_callback::on_stop),
          m_state(detail::stop_token_access::state(token)),
          m_callback(std::forward<functor_type>(functor))
    {
        if (m_state != nullptr)
        {
            m_registered = true;
            if (!m_state->try_register(*this))
            {
                m_registered = false;
                m_callback();
            }
        }
    }

    stop_callback(const stop_callback&)                    = delete;
    stop_callback(stop_callback&&)                         = delete;
    auto operator=(const stop_callback&) -> stop_callback& = delete;
    auto operator=(stop_callback&&) -> stop_callback&      = delete;

    ~stop_callback()
    {
        if (m_registered)
        {
            m_state->deregister(*this);
        }
    }

private:
    static auto on_stop(detail::stop_callback_base* base) noexcept -> void
    {
        static_cast<stop_callback*>(base)->m_callback();
    }

    std::shared_ptr<detail::stop_state> m_state{nullptr};
    callback_type                       m_callback;
    bool                                m_registered{false};
};

template<typename callback_type>
stop_callback(stop_token, callback_type) -> stop_callback<callback_type>;

} // namespace coop
