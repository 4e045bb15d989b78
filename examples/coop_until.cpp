#include <coop/coop.hpp>

#include <chrono>
#include <iostream>
#include <string>
#include <thread>

using namespace std::chrono_literals;

int main()
{
    auto timer = coop::thread_timer::make_unique();
    auto tp    = coop::thread_pool::make_unique(coop::thread_pool::options{.thread_count = 2});

    auto make_slow_task = [](coop::thread_pool& tp, std::chrono::milliseconds work) -> coop::task<uint64_t>
    {
        co_await tp.schedule();
        std::this_thread::sleep_for(work);
        co_return work.count();
    };

    // The operation wins the race.
    auto fast = coop::sync_wait(coop::until(make_slow_task(*tp, 10ms), coop::deadline{*timer, 1s}));
    std::cout << "fast: " << (fast.has_value() ? std::to_string(fast.value()) : coop::to_string(fast.error())) << "\n";

    // The deadline wins the race, the operation is abandoned and finishes on its own.
    auto slow = coop::sync_wait(coop::until(make_slow_task(*tp, 300ms), coop::deadline{*timer, 50ms}));
    std::cout << "slow: " << (slow.has_value() ? std::to_string(slow.value()) : coop::to_string(slow.error())) << "\n";

    // Another thread cancels the operation.
    coop::stop_source source{};
    std::thread       canceller{[&source]()
                          {
                              std::this_thread::sleep_for(50ms);
                              source.request_stop();
                          }};

    auto cancelled = coop::sync_wait(coop::until(make_slow_task(*tp, 300ms), source.token()));
    std::cout << "cancelled: "
              << (cancelled.has_value() ? std::to_string(cancelled.value()) : coop::to_string(cancelled.error()))
              << "\n";

    canceller.join();

    // A receive that is handed the deadline's token is withdrawn on timeout, the item sent
    // afterwards stays in the channel.
    coop::channel<std::string> ch{1};
    auto recv_next = [&ch](const coop::stop_token& token) { return ch.next(token); };

    auto missed = coop::sync_wait(coop::until(recv_next, coop::deadline{*timer, 20ms}));
    std::cout << "missed: " << (missed.has_value() ? std::string{"received"} : coop::to_string(missed.error())) << "\n";

    if (ch.try_send("late") != coop::channel_result::send::sent)
    {
        return 1;
    }
    auto late = coop::sync_wait(coop::until(recv_next, coop::deadline{*timer, 20ms}));
    std::cout << "late: " << (late.has_value() && late->has_value() ? **late : std::string{"none"}) << "\n";

    tp->shutdown();
}
