#include "coop/detail/task_self_deleting.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace coop::detail
{
auto promise_self_deleting::get_return_object() -> task_self_deleting
{
    return task_self_deleting{*this};
}

auto promise_self_deleting::initial_suspend() -> std::suspend_always
{
    return std::suspend_always{};
}

auto promise_self_deleting::final_suspend() noexcept -> std::suspend_never
{
    // By not suspending the coroutine frame is destroyed.
    return std::suspend_never{};
}

auto promise_self_deleting::return_void() noexcept -> void
{
}

auto promise_self_deleting::unhandled_exception() noexcept -> void
{
    // Nobody can observe the result of a detached task.
    try
    {
        std::rethrow_exception(std::current_exception());
    }
    catch (const std::exception& e)
    {
        std::cerr << "coop::detail::task_self_deleting unhandled exception: " << e.what() << "\n";
    }
    catch (...)
    {
        std::cerr << "coop::detail::task_self_deleting unhandled exception of unknown type\n";
    }
}

task_self_deleting::task_self_deleting(promise_self_deleting& promise) : m_promise(&promise)
{
}

task_self_deleting::task_self_deleting(task_self_deleting&& other) noexcept
    : m_promise(std::exchange(other.m_promise, nullptr))
{
}

auto task_self_deleting::operator=(task_self_deleting&& other) noexcept -> task_self_deleting&
{
    if (std::addressof(other) != this)
    {
        m_promise = std::exchange(other.m_promise, nullptr);
    }

    return *this;
}

auto make_task_self_deleting(coop::task<void> user_task) -> task_self_deleting
{
    co_await user_task;
    co_return;
}

} // namespace coop::detail
