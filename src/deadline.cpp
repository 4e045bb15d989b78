#include "coop/deadline.hpp"

#include <utility>

namespace coop
{
deadline::deadline(stop_token token) noexcept : m_token(std::move(token))
{
}

deadline::deadline(timer& t, time_point tp) : deadline(t, tp, std::nullopt)
{
}

deadline::deadline(timer& t, time_point tp, std::optional<duration> amount)
    : m_timer(&t),
      m_expires_at(tp),
      m_amount(amount)
{
    auto state = std::make_shared<detail::stop_state>();
    m_token    = detail::stop_token_access::make(state);

    // The wake holds its own reference, it may fire after this deadline is gone.
    m_timer_id = t.schedule(tp, [state = std::move(state)]() { state->trigger(); });
}

deadline::deadline(deadline&& other) noexcept
    : m_token(std::move(other.m_token)),
      m_timer(std::exchange(other.m_timer, nullptr)),
      m_timer_id(std::exchange(other.m_timer_id, 0)),
      m_expires_at(std::exchange(other.m_expires_at, std::nullopt)),
      m_amount(std::exchange(other.m_amount, std::nullopt))
{
}

auto deadline::operator=(deadline&& other) noexcept -> deadline&
{
    if (std::addressof(other) != this)
    {
        cancel_timer();
        m_token      = std::move(other.m_token);
        m_timer      = std::exchange(other.m_timer, nullptr);
        m_timer_id   = std::exchange(other.m_timer_id, 0);
        m_expires_at = std::exchange(other.m_expires_at, std::nullopt);
        m_amount     = std::exchange(other.m_amount, std::nullopt);
    }

    return *this;
}

deadline::~deadline()
{
    cancel_timer();
}

auto deadline::clone() const -> deadline
{
    if (m_timer == nullptr)
    {
        return deadline{m_token};
    }

    if (m_amount.has_value())
    {
        return deadline{*m_timer, m_timer->now() + m_amount.value(), m_amount};
    }

    return deadline{*m_timer, m_expires_at.value()};
}

auto deadline::cancel_timer() noexcept -> void
{
    if (m_timer != nullptr && !m_token.stop_requested())
    {
        m_timer->cancel(m_timer_id);
    }
    m_timer = nullptr;
}

} // namespace coop
