#pragma once

#include "coop/detail/awaiter_list.hpp"
#include "coop/detail/stop_state.hpp"
#include "coop/expected.hpp"
#include "coop/stop_token.hpp"
#include "coop/task.hpp"

#include <coroutine>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace coop
{
namespace channel_result
{
enum class send : std::uint8_t
{
    /// The item was handed to a receiver or buffered.
    sent,
    /// The channel is closed, the item was not delivered.
    closed,
    /// try_send() only, the buffer is full.
    full
};

enum class recv : std::uint8_t
{
    /// The channel is closed and every buffered item has been received.
    closed,
    /// The token passed to recv() was stopped before an item was handed over.
    stopped,
    /// try_recv() only, there is no buffered item.
    empty
};

auto to_string(send result) -> const std::string&;
auto to_string(recv result) -> const std::string&;
} // namespace channel_result

/**
 * A bounded multi producer multi consumer channel. Senders suspend while the buffer is full and
 * receivers suspend while it is empty, an item is handed directly to a waiting receiver when there
 * is one.
 *
 * The channel is a stoppable sequence, next(token) withdraws a pending receive without consuming
 * an item when stop is requested on the token. Closing the channel wakes every waiter, items already
 * buffered remain receivable.
 */
template<typename element_type>
class channel
{
public:
    class send_operation
    {
    public:
        send_operation(channel& ch, element_type element) : m_channel(ch), m_element(std::move(element)) {}
        send_operation(const send_operation&)                    = delete;
        send_operation(send_operation&&)                         = delete;
        auto operator=(const send_operation&) -> send_operation& = delete;
        auto operator=(send_operation&&) -> send_operation&      = delete;
        ~send_operation()                                        = default;

        auto await_ready() -> bool
        {
            // The lock is released here if the send completes, otherwise in await_suspend().
            m_channel.m_mutex.lock();
            std::unique_lock<std::mutex> lk{m_channel.m_mutex, std::adopt_lock};

            if (m_channel.m_closed)
            {
                m_result = channel_result::send::closed;
                return true;
            }

            if (m_channel.try_send_locked(lk, m_element))
            {
                m_result = channel_result::send::sent;
                return true;
            }

            lk.release();
            return false;
        }

        auto await_suspend(std::coroutine_handle<> awaiting_coroutine) noexcept -> void
        {
            m_awaiting_coroutine = awaiting_coroutine;
            detail::awaiter_list_push_back(m_channel.m_producers, this);
            m_channel.m_mutex.unlock();
        }

        auto await_resume() noexcept -> channel_result::send { return m_result; }

        send_operation* m_next{nullptr};
        send_operation* m_prev{nullptr};

    private:
        friend channel;

        channel&                m_channel;
        element_type            m_element;
        std::coroutine_handle<> m_awaiting_coroutine{nullptr};
        channel_result::send    m_result{channel_result::send::closed};
    };

    class recv_operation
    {
    public:
        recv_operation(channel& ch, stop_token token)
            : m_channel(ch),
              m_state(detail::stop_token_access::state(token)),
              m_registration(*this)
        {
        }
        recv_operation(const recv_operation&)                    = delete;
        recv_operation(recv_operation&&)                         = delete;
        auto operator=(const recv_operation&) -> recv_operation& = delete;
        auto operator=(recv_operation&&) -> recv_operation&      = delete;

        ~recv_operation()
        {
            if (m_registered)
            {
                m_state->deregister(m_registration);
            }
        }

        auto await_ready() -> bool
        {
            // The lock is released here if the receive completes, otherwise in await_suspend().
            m_channel.m_mutex.lock();
            std::unique_lock<std::mutex> lk{m_channel.m_mutex, std::adopt_lock};

            // A stopped receive never consumes an item, even one that is already buffered.
            if (m_state != nullptr && m_state->is_triggered())
            {
                m_stopped = true;
                return true;
            }

            m_element = m_channel.try_recv_locked(lk);
            if (m_element.has_value() || m_channel.m_closed)
            {
                return true;
            }

            lk.release();
            return false;
        }

        auto await_suspend(std::coroutine_handle<> awaiting_coroutine) noexcept -> bool
        {
            m_awaiting_coroutine = awaiting_coroutine;
            detail::awaiter_list_push_back(m_channel.m_consumers, this);

            if (m_state != nullptr)
            {
                // Registering under the channel lock orders on_stop() after this operation is linked.
                m_registered = true;
                if (!m_state->try_register(m_registration))
                {
                    m_registered = false;
                    detail::awaiter_list_erase(m_channel.m_consumers, this);
                    m_stopped = true;
                    m_channel.m_mutex.unlock();
                    return false;
                }
            }

            m_channel.m_mutex.unlock();
            return true;
        }

        auto await_resume() -> expected<element_type, channel_result::recv>
        {
            if (m_element.has_value())
            {
                return std::move(m_element.value());
            }
            if (m_stopped)
            {
                return unexpected<channel_result::recv>{channel_result::recv::stopped};
            }
            return unexpected<channel_result::recv>{channel_result::recv::closed};
        }

        recv_operation* m_next{nullptr};
        recv_operation* m_prev{nullptr};

    private:
        friend channel;

        struct registration : public detail::stop_callback_base
        {
            explicit registration(recv_operation& operation) noexcept
                : detail::stop_callback_base(&recv_operation::on_stop),
                  m_operation(operation)
            {
            }

            recv_operation& m_operation;
        };

        /// Withdraws the pending receive unless an item or close already claimed it.
        static auto on_stop(detail::stop_callback_base* base) noexcept -> void
        {
            auto& self = static_cast<registration*>(base)->m_operation;

            std::unique_lock<std::mutex> lk{self.m_channel.m_mutex};
            if (!detail::awaiter_list_linked(self.m_channel.m_consumers, &self))
            {
                return;
            }

            detail::awaiter_list_erase(self.m_channel.m_consumers, &self);
            self.m_stopped = true;
            lk.unlock();

            self.m_awaiting_coroutine.resume();
        }

        channel&                            m_channel;
        std::shared_ptr<detail::stop_state> m_state{nullptr};
        registration                        m_registration;
        bool                                m_registered{false};
        std::coroutine_handle<>             m_awaiting_coroutine{nullptr};
        std::optional<element_type>         m_element{std::nullopt};
        bool                                m_stopped{false};
    };

    /**
     * @throw std::invalid_argument If capacity is zero.
     */
    explicit channel(std::size_t capacity) : m_capacity(capacity)
    {
        if (m_capacity == 0)
        {
            throw std::invalid_argument{"coop::channel capacity must be at least 1"};
        }
    }

    channel(const channel&)                    = delete;
    channel(channel&&)                         = delete;
    auto operator=(const channel&) -> channel& = delete;
    auto operator=(channel&&) -> channel&      = delete;

    ~channel() { close(); }

    /**
     * Sends the item, suspending while the buffer is full.
     * @return channel_result::send::sent, or channel_result::send::closed if the channel was closed
     *         before the item could be delivered.
     */
    [[nodiscard]] auto send(element_type element) -> task<channel_result::send>
    {
        co_return co_await send_operation{*this, std::move(element)};
    }

    /**
     * Sends the item only if that is possible without suspending.
     */
    auto try_send(element_type element) -> channel_result::send
    {
        std::unique_lock<std::mutex> lk{m_mutex};
        if (m_closed)
        {
            return channel_result::send::closed;
        }
        return try_send_locked(lk, element) ? channel_result::send::sent : channel_result::send::full;
    }

    /**
     * Receives the next item, suspending while the buffer is empty.
     */
    [[nodiscard]] auto recv() -> recv_operation { return recv_operation{*this, stop_token{}}; }

    /**
     * Receives the next item, the receive is withdrawn with channel_result::recv::stopped if stop is
     * requested on the token before an item is handed over.
     */
    [[nodiscard]] auto recv(const stop_token& token) -> recv_operation { return recv_operation{*this, token}; }

    auto try_recv() -> expected<element_type, channel_result::recv>
    {
        std::unique_lock<std::mutex> lk{m_mutex};
        auto element = try_recv_locked(lk);
        if (element.has_value())
        {
            return std::move(element.value());
        }
        if (m_closed)
        {
            return unexpected<channel_result::recv>{channel_result::recv::closed};
        }
        return unexpected<channel_result::recv>{channel_result::recv::empty};
    }

    /**
     * @return The next item, or std::nullopt once the channel is closed and drained.
     */
    [[nodiscard]] auto next() -> task<std::optional<element_type>>
    {
        auto result = co_await recv();
        if (result.has_value())
        {
            co_return std::move(result.value());
        }
        co_return std::nullopt;
    }

    /**
     * @return The next item, or std::nullopt once the channel is closed and drained or stop is
     *         requested on the token.
     */
    [[nodiscard]] auto next(stop_token token) -> task<std::optional<element_type>>
    {
        auto result = co_await recv(token);
        if (result.has_value())
        {
            co_return std::move(result.value());
        }
        co_return std::nullopt;
    }

    /**
     * Closes the channel and wakes every waiting sender and receiver. Further sends fail, receivers
     * drain the buffered items and then see channel_result::recv::closed.
     */
    auto close() -> void
    {
        std::unique_lock<std::mutex> lk{m_mutex};
        if (m_closed)
        {
            return;
        }
        m_closed = true;

        // Unlink every waiter under the lock, a concurrent on_stop() then finds its receive already claimed.
        std::vector<send_operation*> producers{};
        while (auto* producer = detail::awaiter_list_pop_front(m_producers))
        {
            producer->m_result = channel_result::send::closed;
            producers.emplace_back(producer);
        }

        std::vector<recv_operation*> consumers{};
        while (auto* consumer = detail::awaiter_list_pop_front(m_consumers))
        {
            consumers.emplace_back(consumer);
        }
        lk.unlock();

        for (auto* producer : producers)
        {
            producer->m_awaiting_coroutine.resume();
        }

        for (auto* consumer : consumers)
        {
            consumer->m_awaiting_coroutine.resume();
        }
    }

    auto is_closed() const -> bool
    {
        std::scoped_lock lk{m_mutex};
        return m_closed;
    }

    /**
     * @return The number of buffered items.
     */
    auto size() const -> std::size_t
    {
        std::scoped_lock lk{m_mutex};
        return m_buffer.size();
    }

    auto empty() const -> bool { return size() == 0; }

    auto capacity() const noexcept -> std::size_t { return m_capacity; }

private:
    std::size_t                          m_capacity;
    mutable std::mutex                   m_mutex{};
    std::deque<element_type>             m_buffer{};
    detail::awaiter_list<send_operation> m_producers{};
    detail::awaiter_list<recv_operation> m_consumers{};
    bool                                 m_closed{false};

    /**
     * Hands the element to a waiting receiver or buffers it. The lock is released if a receiver
     * has to be resumed. Requires the lock to be held and the channel open.
     * @return False if the buffer is full, the element is left untouched.
     */
    auto try_send_locked(std::unique_lock<std::mutex>& lk, element_type& element) -> bool
    {
        if (auto* consumer = detail::awaiter_list_pop_front(m_consumers); consumer != nullptr)
        {
            consumer->m_element.emplace(std::move(element));
            lk.unlock();
            consumer->m_awaiting_coroutine.resume();
            return true;
        }

        if (m_buffer.size() < m_capacity)
        {
            m_buffer.emplace_back(std::move(element));
            lk.unlock();
            return true;
        }

        return false;
    }

    /**
     * Takes the front buffered item and refills the slot from a waiting sender. The lock is released
     * if an item was taken. Requires the lock to be held.
     */
    auto try_recv_locked(std::unique_lock<std::mutex>& lk) -> std::optional<element_type>
    {
        if (m_buffer.empty())
        {
            return std::nullopt;
        }

        std::optional<element_type> element{std::move(m_buffer.front())};
        m_buffer.pop_front();

        auto* producer = detail::awaiter_list_pop_front(m_producers);
        if (producer != nullptr)
        {
            m_buffer.emplace_back(std::move(producer->m_element));
            producer->m_result = channel_result::send::sent;
        }
        lk.unlock();

        if (producer != nullptr)
        {
            producer->m_awaiting_coroutine.resume();
        }

        return element;
    }
};

} // namespace coop
