#pragma once

#include "coop/stop_reason.hpp"
#include "coop/stop_token.hpp"
#include "coop/time.hpp"
#include "coop/timer.hpp"

#include <chrono>
#include <memory>
#include <optional>

namespace coop
{
/**
 * The condition a race is run against, either a stop_token or a point in time. A deadline is
 * consumed by a single combinator and is move only, use clone() to derive an equivalent one.
 *
 * A time based deadline owns its own stop signal which the timer triggers once the instant is
 * reached. The timer must outlive every deadline created from it.
 */
class deadline
{
public:
    /**
     * A deadline that resolves when the token's source requests stop.
     */
    deadline(stop_token token) noexcept;

    /**
     * A deadline that resolves once the given duration has elapsed from now on the timer's clock.
     */
    template<typename rep_type, typename period_type>
    deadline(timer& t, std::chrono::duration<rep_type, period_type> amount)
        : deadline(t, t.now() + std::chrono::duration_cast<duration>(amount), std::chrono::duration_cast<duration>(amount))
    {
    }

    /**
     * A deadline that resolves once the timer's clock reaches the given instant.
     */
    deadline(timer& t, time_point tp);

    deadline(const deadline&) = delete;
    deadline(deadline&& other) noexcept;
    auto operator=(const deadline&) -> deadline& = delete;
    auto operator=(deadline&& other) noexcept -> deadline&;
    ~deadline();

    /**
     * Derives a fresh deadline with the same target. A duration based deadline is re-anchored at
     * now, an instant based or token based deadline targets the same condition.
     */
    [[nodiscard]] auto clone() const -> deadline;

    /**
     * @return True if the target condition has been reached.
     */
    auto is_ready() const noexcept -> bool { return m_token.stop_requested(); }

    /**
     * @return The signal combinators subscribe to.
     */
    auto token() const noexcept -> const stop_token& { return m_token; }

    /**
     * @return stop_reason::timed_out for time based deadlines, otherwise stop_reason::cancelled.
     */
    auto reason() const noexcept -> stop_reason
    {
        return m_timer != nullptr ? stop_reason::timed_out : stop_reason::cancelled;
    }

    /**
     * @return The instant a time based deadline fires at.
     */
    auto expires_at() const noexcept -> std::optional<time_point> { return m_expires_at; }

    auto operator co_await() const noexcept -> stop_token::awaiter { return m_token.operator co_await(); }

private:
    deadline(timer& t, time_point tp, std::optional<duration> amount);

    auto cancel_timer() noexcept -> void;

    stop_token                m_token{};
    timer*                    m_timer{nullptr};
    timer::id                 m_timer_id{0};
    std::optional<time_point> m_expires_at{std::nullopt};
    /// Set when built from a duration so clone() can re-anchor it.
    std::optional<duration> m_amount{std::nullopt};
};

} // namespace coop
