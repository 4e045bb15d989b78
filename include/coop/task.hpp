#pragma once

#include <coroutine>
#include <exception>
#include <memory>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace coop
{
template<typename return_type = void>
class task;

namespace detail
{
class promise_base
{
public:
    /// Hands control back to the awaiting coroutine, a task that was only resume()'ed returns to its caller.
    struct final_awaitable
    {
        auto await_ready() const noexcept -> bool { return false; }

        template<typename promise_type>
        auto await_suspend(std::coroutine_handle<promise_type> coroutine) noexcept -> std::coroutine_handle<>
        {
            auto continuation = coroutine.promise().m_continuation;
            return continuation != nullptr ? continuation : std::noop_coroutine();
        }

        auto await_resume() noexcept -> void {}
    };

    auto initial_suspend() noexcept -> std::suspend_always { return {}; }
    auto final_suspend() noexcept -> final_awaitable { return {}; }

    auto continuation(std::coroutine_handle<> awaiting_coroutine) noexcept -> void
    {
        m_continuation = awaiting_coroutine;
    }

protected:
    std::coroutine_handle<> m_continuation{nullptr};
};

template<typename return_type>
class promise final : public promise_base
{
    static_assert(!std::is_reference_v<return_type>, "coop::task does not return references");

public:
    promise() noexcept                         = default;
    promise(const promise&)                    = delete;
    promise(promise&&)                         = delete;
    auto operator=(const promise&) -> promise& = delete;
    auto operator=(promise&&) -> promise&      = delete;
    ~promise()                                 = default;

    auto get_return_object() noexcept -> task<return_type>;

    template<typename value_type>
        requires std::is_constructible_v<return_type, value_type&&>
    auto return_value(value_type&& value) -> void
    {
        m_outcome.template emplace<value_index>(std::forward<value_type>(value));
    }

    auto unhandled_exception() noexcept -> void
    {
        m_outcome.template emplace<exception_index>(std::current_exception());
    }

    /**
     * @throw The exception the coroutine exited with, or std::runtime_error if it has not completed.
     */
    auto result() & -> return_type&
    {
        check_outcome();
        return std::get<value_index>(m_outcome);
    }

    auto result() && -> return_type&&
    {
        check_outcome();
        return std::move(std::get<value_index>(m_outcome));
    }

private:
    static constexpr std::size_t value_index{1};
    static constexpr std::size_t exception_index{2};

    std::variant<std::monostate, return_type, std::exception_ptr> m_outcome{};

    auto check_outcome() const -> void
    {
        if (m_outcome.index() == exception_index)
        {
            std::rethrow_exception(std::get<exception_index>(m_outcome));
        }
        if (m_outcome.index() != value_index)
        {
            throw std::runtime_error{"coop::task has not completed, was it started?"};
        }
    }
};

template<>
class promise<void> final : public promise_base
{
public:
    promise() noexcept                         = default;
    promise(const promise&)                    = delete;
    promise(promise&&)                         = delete;
    auto operator=(const promise&) -> promise& = delete;
    auto operator=(promise&&) -> promise&      = delete;
    ~promise()                                 = default;

    auto get_return_object() noexcept -> task<void>;

    auto return_void() noexcept -> void {}

    auto unhandled_exception() noexcept -> void { m_exception = std::current_exception(); }

    auto result() const -> void
    {
        if (m_exception != nullptr)
        {
            std::rethrow_exception(m_exception);
        }
    }

private:
    std::exception_ptr m_exception{nullptr};
};

} // namespace detail

/**
 * A lazily started coroutine that owns its frame. The body does not run until the task is
 * co_await'ed, which starts it as a child of the awaiting coroutine, or resume()'ed by hand.
 */
template<typename return_type>
class [[nodiscard]] task
{
public:
    using promise_type     = detail::promise<return_type>;
    using coroutine_handle = std::coroutine_handle<promise_type>;

    template<bool move_result>
    struct awaiter
    {
        coroutine_handle m_coroutine;

        auto await_ready() const noexcept -> bool { return m_coroutine.done(); }

        auto await_suspend(std::coroutine_handle<> awaiting_coroutine) noexcept -> std::coroutine_handle<>
        {
            m_coroutine.promise().continuation(awaiting_coroutine);
            return m_coroutine;
        }

        auto await_resume() -> decltype(auto)
        {
            if constexpr (move_result)
            {
                return std::move(m_coroutine.promise()).result();
            }
            else
            {
                return m_coroutine.promise().result();
            }
        }
    };

    task() noexcept = default;
    explicit task(coroutine_handle coroutine) noexcept : m_coroutine(coroutine) {}
    task(const task&) = delete;
    task(task&& other) noexcept : m_coroutine(std::exchange(other.m_coroutine, nullptr)) {}
    auto operator=(const task&) -> task& = delete;
    auto operator=(task&& other) noexcept -> task&
    {
        if (std::addressof(other) != this)
        {
            destroy();
            m_coroutine = std::exchange(other.m_coroutine, nullptr);
        }
        return *this;
    }
    ~task() { destroy(); }

    /**
     * @return True once the body has run to completion, or if the task holds no coroutine.
     */
    auto is_ready() const noexcept -> bool { return m_coroutine == nullptr || m_coroutine.done(); }

    /**
     * Runs the body until its next suspension point.
     * @return True if the body has not completed yet.
     */
    auto resume() -> bool
    {
        if (!is_ready())
        {
            m_coroutine.resume();
        }
        return !is_ready();
    }

    /**
     * Destroys the coroutine frame, suspended or not.
     * @return False if there was no frame to destroy.
     */
    auto destroy() -> bool
    {
        if (m_coroutine == nullptr)
        {
            return false;
        }
        std::exchange(m_coroutine, nullptr).destroy();
        return true;
    }

    auto operator co_await() & noexcept -> awaiter<false> { return awaiter<false>{m_coroutine}; }
    auto operator co_await() && noexcept -> awaiter<true> { return awaiter<true>{m_coroutine}; }

    auto promise() -> promise_type& { return m_coroutine.promise(); }

    auto handle() const noexcept -> coroutine_handle { return m_coroutine; }

private:
    coroutine_handle m_coroutine{nullptr};
};

namespace detail
{
template<typename return_type>
inline auto promise<return_type>::get_return_object() noexcept -> task<return_type>
{
    return task<return_type>{std::coroutine_handle<promise<return_type>>::from_promise(*this)};
}

inline auto promise<void>::get_return_object() noexcept -> task<void>
{
    return task<void>{std::coroutine_handle<promise<void>>::from_promise(*this)};
}

} // namespace detail

} // namespace coop
