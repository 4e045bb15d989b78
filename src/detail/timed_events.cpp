#include "coop/detail/timed_events.hpp"

namespace coop::detail
{
auto timed_events::add(time_point tp, timer::callback_type callback) -> std::pair<timer::id, bool>
{
    auto timer_id = m_next_id++;
    auto pos      = m_events.emplace(tp, std::make_pair(timer_id, std::move(callback)));
    m_positions.emplace(timer_id, pos);
    return {timer_id, pos == m_events.begin()};
}

auto timed_events::remove(timer::id timer_id) -> std::pair<bool, bool>
{
    auto found = m_positions.find(timer_id);
    if (found == m_positions.end())
    {
        return {false, false};
    }

    auto is_first = (found->second == m_events.begin());
    m_events.erase(found->second);
    m_positions.erase(found);
    return {true, is_first};
}

auto timed_events::take_expired(time_point now) -> std::vector<timer::callback_type>
{
    std::vector<timer::callback_type> expired{};
    while (!m_events.empty())
    {
        auto first = m_events.begin();
        if (first->first > now)
        {
            break;
        }

        auto& [timer_id, callback] = first->second;
        expired.emplace_back(std::move(callback));
        m_positions.erase(timer_id);
        m_events.erase(first);
    }
    return expired;
}

auto timed_events::next() const -> std::optional<time_point>
{
    if (m_events.empty())
    {
        return std::nullopt;
    }
    return m_events.begin()->first;
}

auto timed_events::clear() -> void
{
    m_events.clear();
    m_positions.clear();
}

} // namespace coop::detail
