#pragma once

#include "coop/concepts/awaitable.hpp"

namespace coop::detail
{
/**
 * An intrusive FIFO of waiters. The list is not synchronized, the owner must hold its own lock
 * around every call. An entry is linked in at most one list at a time.
 */
template<concepts::detail::awaiter_list_entry awaiter_type>
struct awaiter_list
{
    awaiter_type* m_head{nullptr};
    awaiter_type* m_tail{nullptr};
};

template<concepts::detail::awaiter_list_entry awaiter_type>
auto awaiter_list_empty(const awaiter_list<awaiter_type>& list) noexcept -> bool
{
    return list.m_head == nullptr;
}

template<concepts::detail::awaiter_list_entry awaiter_type>
auto awaiter_list_linked(const awaiter_list<awaiter_type>& list, const awaiter_type* entry) noexcept -> bool
{
    return entry->m_prev != nullptr || list.m_head == entry;
}

template<concepts::detail::awaiter_list_entry awaiter_type>
auto awaiter_list_push_back(awaiter_list<awaiter_type>& list, awaiter_type* to_enqueue) noexcept -> void
{
    to_enqueue->m_next = nullptr;
    to_enqueue->m_prev = list.m_tail;
    if (list.m_tail != nullptr)
    {
        list.m_tail->m_next = to_enqueue;
    }
    else
    {
        list.m_head = to_enqueue;
    }
    list.m_tail = to_enqueue;
}

template<concepts::detail::awaiter_list_entry awaiter_type>
auto awaiter_list_erase(awaiter_list<awaiter_type>& list, awaiter_type* entry) noexcept -> void
{
    if (entry->m_prev != nullptr)
    {
        entry->m_prev->m_next = entry->m_next;
    }
    else
    {
        list.m_head = entry->m_next;
    }

    if (entry->m_next != nullptr)
    {
        entry->m_next->m_prev = entry->m_prev;
    }
    else
    {
        list.m_tail = entry->m_prev;
    }

    entry->m_next = nullptr;
    entry->m_prev = nullptr;
}

template<concepts::detail::awaiter_list_entry awaiter_type>
auto awaiter_list_pop_front(awaiter_list<awaiter_type>& list) noexcept -> awaiter_type*
{
    awaiter_type* waiter = list.m_head;
    if (waiter != nullptr)
    {
        awaiter_list_erase(list, waiter);
    }
    return waiter;
}

} // namespace coop::detail
