#pragma once

#include <concepts>
#include <coroutine>
#include <type_traits>
#include <utility>

namespace coop::concepts
{
/**
 * A type that satisfies the c++20 awaiter protocol:
 *      await_ready() -> bool
 *      await_suspend(std::coroutine_handle<>) -> void|bool|std::coroutine_handle<>
 *      await_resume() -> decltype(auto)
 */
// clang-format off
template<typename type>
concept awaiter = requires(type t, std::coroutine_handle<> c)
{
    { t.await_ready() } -> std::same_as<bool>;
    requires std::same_as<decltype(t.await_suspend(c)), void> ||
        std::same_as<decltype(t.await_suspend(c)), bool> ||
        std::same_as<decltype(t.await_suspend(c)), std::coroutine_handle<>>;
    { t.await_resume() };
};

/**
 * A type that can be co_await'ed, either through a member operator co_await() or because it is
 * itself an awaiter.
 */
template<typename type>
concept awaitable = awaiter<type> || requires(type t)
{
    { std::forward<type>(t).operator co_await() } -> awaiter;
};

namespace detail
{
/**
 * An entry of an intrusive doubly linked waiter list.
 */
template<typename type>
concept awaiter_list_entry = requires(type t)
{
    { t.m_next } -> std::same_as<type*&>;
    { t.m_prev } -> std::same_as<type*&>;
};
} // namespace detail
// clang-format on

template<awaitable awaitable_type>
auto get_awaiter(awaitable_type&& value) -> decltype(auto)
{
    if constexpr (awaiter<awaitable_type>)
    {
        return std::forward<awaitable_type>(value);
    }
    else
    {
        return std::forward<awaitable_type>(value).operator co_await();
    }
}

template<awaitable awaitable_type, typename = void>
struct awaitable_traits
{
};

template<awaitable awaitable_type>
struct awaitable_traits<awaitable_type>
{
    using awaiter_type        = std::remove_cvref_t<decltype(get_awaiter(std::declval<awaitable_type>()))>;
    using awaiter_return_type = decltype(std::declval<awaiter_type&>().await_resume());
};

} // namespace coop::concepts
