#pragma once

#include "coop/time.hpp"

#include <cstdint>
#include <functional>

namespace coop
{
/**
 * The capability a time based deadline needs from its environment: run a callback once a point
 * on the monotonic clock has been reached. Backends run callbacks on their own thread, so a
 * callback must be short and must not block.
 */
class timer
{
public:
    using id            = std::uint64_t;
    using callback_type = std::function<void()>;

    timer()                            = default;
    timer(const timer&)                = delete;
    timer(timer&&)                     = delete;
    auto operator=(const timer&) -> timer& = delete;
    auto operator=(timer&&) -> timer&  = delete;
    virtual ~timer()                   = default;

    /**
     * @return The current time as seen by this timer.
     */
    virtual auto now() const -> time_point { return clock::now(); }

    /**
     * Arms a single wake, the callback runs once at or after the given time point.
     * @return An id that can be passed to cancel().
     */
    [[nodiscard]] virtual auto schedule(time_point tp, callback_type callback) -> id = 0;

    /**
     * Disarms a pending wake.
     * @return True if the callback was removed before it ran, false if it already ran, is running
     *         or the id is unknown.
     */
    virtual auto cancel(id timer_id) -> bool = 0;
};

} // namespace coop
