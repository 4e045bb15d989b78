#include "coop/stop_token.hpp"

namespace coop
{
namespace detail
{
auto stop_token_access::state(const stop_token& token) noexcept -> const std::shared_ptr<stop_state>&
{
    return token.m_state;
}

auto stop_token_access::make(std::shared_ptr<stop_state> state) noexcept -> stop_token
{
    return stop_token{std::move(state)};
}
} // namespace detail

stop_source::stop_source() : m_state(std::make_shared<detail::stop_state>())
{
}

stop_source::stop_source(stop_source&& other) noexcept : m_state(std::move(other.m_state))
{
}

auto stop_source::operator=(stop_source&& other) noexcept -> stop_source&
{
    if (std::addressof(other) != this)
    {
        // The signal being replaced loses its owner and is released like a destroyed source.
        request_stop();
        m_state = std::move(other.m_state);
    }

    return *this;
}

stop_source::~stop_source()
{
    request_stop();
}

auto stop_source::token() const noexcept -> stop_token
{
    return detail::stop_token_access::make(m_state);
}

auto stop_source::request_stop() noexcept -> bool
{
    if (m_state == nullptr)
    {
        return false;
    }
    return m_state->trigger();
}

} // namespace coop
