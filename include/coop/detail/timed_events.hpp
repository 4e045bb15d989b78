#pragma once

#include "coop/time.hpp"
#include "coop/timer.hpp"

#include <map>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace coop::detail
{
/**
 * The pending wakes of a timer backend ordered by expiry. Not synchronized, the backend guards it
 * with its own mutex.
 */
class timed_events
{
public:
    /**
     * @return The id of the new wake and whether it became the earliest pending wake.
     */
    auto add(time_point tp, timer::callback_type callback) -> std::pair<timer::id, bool>;

    /**
     * @return Whether the wake was pending and whether it was the earliest pending wake.
     */
    auto remove(timer::id timer_id) -> std::pair<bool, bool>;

    /**
     * Removes and returns every callback whose time point is at or before now.
     */
    auto take_expired(time_point now) -> std::vector<timer::callback_type>;

    auto next() const -> std::optional<time_point>;

    auto size() const noexcept -> std::size_t { return m_events.size(); }
    auto empty() const noexcept -> bool { return m_events.empty(); }
    auto clear() -> void;

private:
    using events_type = std::multimap<time_point, std::pair<timer::id, timer::callback_type>>;

    events_type                                          m_events{};
    std::unordered_map<timer::id, events_type::iterator> m_positions{};
    timer::id                                            m_next_id{1};
};

} // namespace coop::detail
