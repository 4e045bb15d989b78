#pragma once

#include "coop/task.hpp"

#include <coroutine>

namespace coop::detail
{
class task_self_deleting;

class promise_self_deleting
{
public:
    promise_self_deleting()  = default;
    ~promise_self_deleting() = default;

    promise_self_deleting(const promise_self_deleting&)                    = delete;
    promise_self_deleting(promise_self_deleting&&)                         = delete;
    auto operator=(const promise_self_deleting&) -> promise_self_deleting& = delete;
    auto operator=(promise_self_deleting&&) -> promise_self_deleting&      = delete;

    auto get_return_object() -> task_self_deleting;
    auto initial_suspend() -> std::suspend_always;
    auto final_suspend() noexcept -> std::suspend_never;
    auto return_void() noexcept -> void;
    auto unhandled_exception() noexcept -> void;
};

/**
 * A detached coroutine that destroys its own frame upon completing. Nothing may hold on to the
 * task or its promise once it has been started.
 */
class task_self_deleting
{
public:
    using promise_type = promise_self_deleting;

    explicit task_self_deleting(promise_self_deleting& promise);
    ~task_self_deleting() = default;

    task_self_deleting(const task_self_deleting&) = delete;
    task_self_deleting(task_self_deleting&&) noexcept;
    auto operator=(const task_self_deleting&) -> task_self_deleting& = delete;
    auto operator=(task_self_deleting&&) noexcept -> task_self_deleting&;

    [[nodiscard]] auto handle() -> std::coroutine_handle<promise_self_deleting>
    {
        return std::coroutine_handle<promise_self_deleting>::from_promise(*m_promise);
    }

private:
    promise_self_deleting* m_promise{nullptr};
};

/**
 * Turns a coop::task<void> into a detached self deleting task, the task has not been started.
 */
auto make_task_self_deleting(coop::task<void> user_task) -> task_self_deleting;

} // namespace coop::detail
