#pragma once

#include "coop/concepts/awaitable.hpp"
#include "coop/concepts/sequence.hpp"
#include "coop/deadline.hpp"
#include "coop/stop_reason.hpp"
#include "coop/task.hpp"

#include <cstdint>
#include <optional>
#include <utility>

namespace coop
{
/**
 * Passes a sequence's items through unchanged until the deadline resolves, then ends. The deadline
 * is checked before every item is requested, so an item that was produced before stop is observed
 * is always delivered.
 *
 * A stoppable_sequence is handed the deadline's token so a pending request is withdrawn as soon as
 * stop is requested. Any other sequence is only checked at item boundaries, a request already
 * issued is awaited to completion and its item delivered.
 *
 * The sequence_type may be a reference, the stop_stream then only borrows the sequence.
 */
template<concepts::sequence sequence_type>
class stop_stream
{
public:
    using value_type = concepts::sequence_value_type<sequence_type>;

    stop_stream(sequence_type sequence, deadline d)
        : m_sequence(std::forward<sequence_type>(sequence)),
          m_deadline(std::move(d))
    {
    }

    stop_stream(const stop_stream&)                    = delete;
    stop_stream(stop_stream&&)                         = default;
    auto operator=(const stop_stream&) -> stop_stream& = delete;
    auto operator=(stop_stream&&) -> stop_stream&      = delete;
    ~stop_stream()                                     = default;

    /**
     * @return The next item, or std::nullopt once the sequence ended or the deadline resolved. Once
     *         std::nullopt has been returned every further call returns it too.
     */
    [[nodiscard]] auto next() -> task<std::optional<value_type>>
    {
        if (m_state != state::running)
        {
            co_return std::nullopt;
        }

        if (m_deadline.is_ready())
        {
            m_state = state::stopped;
            co_return std::nullopt;
        }

        std::optional<value_type> item{std::nullopt};
        if constexpr (concepts::stoppable_sequence<sequence_type>)
        {
            item = co_await m_sequence.next(m_deadline.token());
        }
        else
        {
            item = co_await m_sequence.next();
        }

        if (!item.has_value())
        {
            m_state = m_deadline.is_ready() ? state::stopped : state::ended;
        }

        co_return item;
    }

    /**
     * @return True if the underlying sequence ran out of items.
     */
    auto ended() const noexcept -> bool { return m_state == state::ended; }

    /**
     * @return True if the stream was ended by its deadline.
     */
    auto stopped() const noexcept -> bool { return m_state == state::stopped; }

    /**
     * @return Why the deadline ended the stream, std::nullopt if it has not.
     */
    auto reason() const noexcept -> std::optional<stop_reason>
    {
        if (m_state == state::stopped)
        {
            return m_deadline.reason();
        }
        return std::nullopt;
    }

private:
    enum class state : std::uint8_t
    {
        running,
        ended,
        stopped
    };

    sequence_type m_sequence;
    deadline      m_deadline;
    state         m_state{state::running};
};

template<typename sequence_type>
stop_stream(sequence_type&&, deadline) -> stop_stream<sequence_type>;

/**
 * Borrows the sequence and ends it when the deadline resolves.
 */
template<concepts::sequence sequence_type>
[[nodiscard]] auto until(sequence_type& sequence, deadline d) -> stop_stream<sequence_type&>
    requires(!concepts::awaitable<sequence_type&>)
{
    return stop_stream<sequence_type&>{sequence, std::move(d)};
}

} // namespace coop
