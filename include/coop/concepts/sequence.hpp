#pragma once

#include "coop/concepts/awaitable.hpp"
#include "coop/stop_token.hpp"

#include <optional>
#include <type_traits>
#include <utility>

namespace coop::concepts
{
namespace detail
{
template<typename type>
struct is_optional : std::false_type
{
};

template<typename type>
struct is_optional<std::optional<type>> : std::true_type
{
};
} // namespace detail

/**
 * An asynchronous source of items, next() is awaitable and yields the next item or std::nullopt
 * once the sequence has ended.
 */
// clang-format off
template<typename type>
concept sequence = requires(type& s)
{
    { s.next() } -> awaitable;
    requires detail::is_optional<std::remove_cvref_t<typename awaitable_traits<decltype(s.next())>::awaiter_return_type>>::value;
};

/**
 * A sequence whose pending next() request can be withdrawn, next(token) yields std::nullopt
 * without consuming an item when stop is requested while it is suspended.
 */
template<typename type>
concept stoppable_sequence = sequence<type> && requires(type& s, const stop_token& token)
{
    { s.next(token) } -> awaitable;
};

/**
 * A single request that can be withdrawn. Invoking it with a token starts the request, which
 * yields std::nullopt without consuming anything if stop is requested before it completes.
 */
template<typename type>
concept stoppable_operation = requires(type& f, const stop_token& token)
{
    { f(token) } -> awaitable;
    requires detail::is_optional<std::remove_cvref_t<typename awaitable_traits<decltype(f(token))>::awaiter_return_type>>::value;
};
// clang-format on

template<sequence sequence_type>
using sequence_value_type = typename std::remove_cvref_t<
    typename awaitable_traits<decltype(std::declval<sequence_type&>().next())>::awaiter_return_type>::value_type;

template<stoppable_operation operation_type>
using stoppable_operation_result_type = std::remove_cvref_t<typename awaitable_traits<
    decltype(std::declval<operation_type&>()(std::declval<const stop_token&>()))>::awaiter_return_type>;

} // namespace coop::concepts
