#include "catch_extensions.hpp"

#include <coop/coop.hpp>

#include <atomic>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

TEST_CASE("until", "[until]")
{
    std::cerr << "[until]\n\n";
}

TEST_CASE("until operation completes first", "[until]")
{
    coop::stop_source source{};

    auto make_task = []() -> coop::task<std::string> { co_return "done"; };

    auto result = coop::sync_wait(coop::until(make_task(), source.token()));
    REQUIRE(result.has_value());
    REQUIRE(result.value() == "done");
}

TEST_CASE("until void operation completes first", "[until]")
{
    coop::stop_source source{};
    bool              ran{false};

    auto make_task = [](bool& ran) -> coop::task<void>
    {
        ran = true;
        co_return;
    };

    auto result = coop::sync_wait(coop::until(make_task(ran), source.token()));
    REQUIRE(result.has_value());
    REQUIRE(ran);
}

TEST_CASE("until already stopped never starts the operation", "[until]")
{
    coop::stop_source source{};
    source.request_stop();

    bool started{false};
    auto make_task = [](bool& started) -> coop::task<int>
    {
        started = true;
        co_return 1;
    };

    auto result = coop::sync_wait(coop::until(make_task(started), source.token()));
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error() == coop::stop_reason::cancelled);
    REQUIRE_FALSE(started);
}

TEST_CASE("until stop wins against a plain operation which is abandoned", "[until]")
{
    coop::stop_source blocker{};
    coop::stop_source source{};
    bool              finished{false};

    auto wait_forever = [](coop::stop_token token, bool& finished) -> coop::task<int>
    {
        co_await token;
        finished = true;
        co_return 1;
    };

    auto task = coop::until(wait_forever(blocker.token(), finished), source.token());
    task.resume();
    REQUIRE_FALSE(task.is_ready());

    source.request_stop();
    REQUIRE(task.is_ready());

    auto& result = task.promise().result();
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error() == coop::stop_reason::cancelled);

    // A plain operation cannot observe the stop, it finishes on its own and its result is discarded.
    REQUIRE_FALSE(finished);
    blocker.request_stop();
    REQUIRE(finished);
    REQUIRE(task.promise().result().error() == coop::stop_reason::cancelled);
}

TEST_CASE("until operation wins against a later stop", "[until]")
{
    coop::stop_source gate{};
    coop::stop_source source{};

    auto wait_for_gate = [](coop::stop_token token) -> coop::task<int>
    {
        co_await token;
        co_return 42;
    };

    auto task = coop::until(wait_for_gate(gate.token()), source.token());
    task.resume();
    REQUIRE_FALSE(task.is_ready());

    gate.request_stop();
    REQUIRE(task.is_ready());

    // A stop after the decision changes nothing.
    source.request_stop();
    REQUIRE(task.promise().result().has_value());
    REQUIRE(task.promise().result().value() == 42);
}

TEST_CASE("until rethrows the operation's exception", "[until]")
{
    coop::stop_source source{};

    auto make_task = []() -> coop::task<int>
    {
        throw std::runtime_error{"operation failed"};
        co_return 1;
    };

    REQUIRE_THROWS_AS(coop::sync_wait(coop::until(make_task(), source.token())), std::runtime_error);
}

TEST_CASE("until never completing operation times out after the duration", "[until]")
{
    auto              timer = coop::thread_timer::make_unique();
    coop::stop_source blocker{};

    auto wait_forever = [](coop::stop_token token) -> coop::task<void> { co_await token; };

    auto start   = coop::clock::now();
    auto result  = coop::sync_wait(coop::until(wait_forever(blocker.token()), coop::deadline{*timer, 200ms}));
    auto elapsed = coop::clock::now() - start;

    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error() == coop::stop_reason::timed_out);
    REQUIRE(elapsed >= 200ms);
    REQUIRE(elapsed < 200ms + 2s);

    // Let the abandoned operation run to completion.
    blocker.request_stop();
}

#ifdef LIBCOOP_FEATURE_IO_TIMER
TEST_CASE("until never completing operation times out on an io_timer", "[until]")
{
    auto              timer = coop::io_timer::make_unique();
    coop::stop_source blocker{};

    auto wait_forever = [](coop::stop_token token) -> coop::task<void> { co_await token; };

    auto start   = coop::clock::now();
    auto result  = coop::sync_wait(coop::until(wait_forever(blocker.token()), coop::deadline{*timer, 200ms}));
    auto elapsed = coop::clock::now() - start;

    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error() == coop::stop_reason::timed_out);
    REQUIRE(elapsed >= 200ms);
    REQUIRE(elapsed < 200ms + 2s);

    blocker.request_stop();
}
#endif

TEST_CASE("until operation on a thread pool finishes before a long deadline", "[until]")
{
    auto tp    = coop::thread_pool::make_unique(coop::thread_pool::options{.thread_count = 2});
    auto timer = coop::thread_timer::make_unique();

    auto make_task = [](coop::thread_pool& tp) -> coop::task<int>
    {
        co_await tp.schedule();
        co_return 7;
    };

    auto result = coop::sync_wait(coop::until(make_task(*tp), coop::deadline{*timer, 10s}));
    REQUIRE(result.has_value());
    REQUIRE(result.value() == 7);
    // The losing wake was cancelled with the deadline.
    REQUIRE(timer->size() == 0);
}

TEST_CASE("until exactly one outcome per race under contention", "[until]")
{
    constexpr std::size_t iterations = 200;

    auto tp    = coop::thread_pool::make_unique(coop::thread_pool::options{.thread_count = 4});
    auto timer = coop::thread_timer::make_unique();

    auto make_task = [](coop::thread_pool& tp, std::size_t i) -> coop::task<std::size_t>
    {
        co_await tp.schedule();
        co_return i;
    };

    std::size_t completed{0};
    std::size_t timed_out{0};
    for (std::size_t i = 0; i < iterations; ++i)
    {
        auto result = coop::sync_wait(coop::until(make_task(*tp, i), coop::deadline{*timer, 50us}));
        if (result.has_value())
        {
            REQUIRE(result.value() == i);
            ++completed;
        }
        else
        {
            REQUIRE(result.error() == coop::stop_reason::timed_out);
            ++timed_out;
        }
    }

    REQUIRE(completed + timed_out == iterations);
    tp->shutdown();
}

TEST_CASE("until stoppable operation completes with its item", "[until]")
{
    coop::channel<int> ch{4};
    coop::stop_source  source{};
    REQUIRE(ch.try_send(7) == coop::channel_result::send::sent);

    auto recv_next = [&ch](const coop::stop_token& token) { return ch.next(token); };

    auto result = coop::sync_wait(coop::until(recv_next, source.token()));
    REQUIRE(result.has_value());
    REQUIRE(result.value() == std::optional<int>{7});
}

TEST_CASE("until stoppable operation is withdrawn without consuming an item", "[until]")
{
    coop::channel<int> ch{4};
    coop::stop_source  source{};

    auto recv_next = [&ch](const coop::stop_token& token) { return ch.next(token); };

    auto task = coop::until(recv_next, source.token());
    task.resume();
    REQUIRE_FALSE(task.is_ready());

    source.request_stop();
    REQUIRE(task.is_ready());
    REQUIRE_FALSE(task.promise().result().has_value());
    REQUIRE(task.promise().result().error() == coop::stop_reason::cancelled);

    // Nothing is left waiting on the channel, the next item stays there.
    REQUIRE(ch.try_send(42) == coop::channel_result::send::sent);
    auto item = ch.try_recv();
    REQUIRE(item.has_value());
    REQUIRE(item.value() == 42);
}

TEST_CASE("until stoppable operation already stopped is never started", "[until]")
{
    coop::channel<int> ch{4};
    coop::stop_source  source{};
    REQUIRE(ch.try_send(1) == coop::channel_result::send::sent);
    source.request_stop();

    auto recv_next = [&ch](const coop::stop_token& token) { return ch.next(token); };

    auto result = coop::sync_wait(coop::until(recv_next, source.token()));
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error() == coop::stop_reason::cancelled);
    REQUIRE(ch.size() == 1);
}

TEST_CASE("until stoppable operation over a closed channel completes empty", "[until]")
{
    coop::channel<int> ch{4};
    coop::stop_source  source{};
    ch.close();

    auto recv_next = [&ch](const coop::stop_token& token) { return ch.next(token); };

    auto result = coop::sync_wait(coop::until(recv_next, source.token()));
    REQUIRE(result.has_value());
    REQUIRE_FALSE(result.value().has_value());
}

TEST_CASE("until stoppable operation times out and leaves later items", "[until]")
{
    auto               timer = coop::thread_timer::make_unique();
    coop::channel<int> ch{4};

    auto recv_next = [&ch](const coop::stop_token& token) { return ch.next(token); };

    auto result = coop::sync_wait(coop::until(recv_next, coop::deadline{*timer, 50ms}));
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error() == coop::stop_reason::timed_out);

    REQUIRE(ch.try_send(5) == coop::channel_result::send::sent);
    auto item = ch.try_recv();
    REQUIRE(item.has_value());
    REQUIRE(item.value() == 5);
}

TEST_CASE("until stoppable operation never loses an item under contention", "[until]")
{
    constexpr int item_count = 2'000;

    auto               timer = coop::thread_timer::make_unique();
    coop::channel<int> ch{16};

    std::thread producer{
        [&]()
        {
            for (int i = 1; i <= item_count; ++i)
            {
                auto sent = coop::sync_wait(ch.send(i));
                REQUIRE_THREAD_SAFE(sent == coop::channel_result::send::sent);
            }
        }};

    auto recv_next = [&ch](const coop::stop_token& token) { return ch.next(token); };

    std::vector<int> received{};
    auto             give_up = coop::clock::now() + 30s;
    while (received.size() < static_cast<std::size_t>(item_count) && coop::clock::now() < give_up)
    {
        auto result = coop::sync_wait(coop::until(recv_next, coop::deadline{*timer, 100us}));
        if (result.has_value())
        {
            REQUIRE(result.value().has_value());
            received.emplace_back(result.value().value());
        }
        else
        {
            REQUIRE(result.error() == coop::stop_reason::timed_out);
        }
    }

    // Unblock the producer if the loop gave up.
    ch.close();
    producer.join();

    // Every item sent is received exactly once and in order, a withdrawn receive takes nothing.
    REQUIRE(received.size() == static_cast<std::size_t>(item_count));
    for (std::size_t i = 0; i < received.size(); ++i)
    {
        REQUIRE(received[i] == static_cast<int>(i) + 1);
    }
    REQUIRE(ch.empty());
}
