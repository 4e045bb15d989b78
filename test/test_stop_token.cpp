#include "catch_extensions.hpp"

#include <coop/coop.hpp>

#include <atomic>
#include <chrono>
#include <iostream>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

TEST_CASE("stop_token", "[stop_token]")
{
    std::cerr << "[stop_token]\n\n";
}

TEST_CASE("stop_token default constructed is never stopped", "[stop_token]")
{
    coop::stop_token token{};
    REQUIRE_FALSE(token.stop_possible());
    REQUIRE_FALSE(token.stop_requested());

    auto waiter = [](coop::stop_token token) -> coop::task<void> { co_await token; }(token);
    waiter.resume();
    REQUIRE_FALSE(waiter.is_ready());
}

TEST_CASE("stop_source request_stop transitions exactly once", "[stop_token]")
{
    coop::stop_source source{};
    auto              token = source.token();

    REQUIRE(token.stop_possible());
    REQUIRE_FALSE(token.stop_requested());
    REQUIRE_FALSE(source.stop_requested());

    REQUIRE(source.request_stop());
    REQUIRE(token.stop_requested());
    REQUIRE(source.stop_requested());

    // Stop is never reset.
    REQUIRE_FALSE(source.request_stop());
    REQUIRE(token.stop_requested());
    REQUIRE(source.token().stop_requested());
}

TEST_CASE("stop_token already stopped completes without suspending", "[stop_token]")
{
    coop::stop_source source{};
    source.request_stop();

    auto waiter = [](coop::stop_token token) -> coop::task<bool>
    {
        co_await token;
        co_return token.stop_requested();
    };

    REQUIRE(coop::sync_wait(waiter(source.token())));
    // A token observed as stopped stays stopped for every later wait.
    REQUIRE(coop::sync_wait(waiter(source.token())));
}

TEST_CASE("stop_token waiter resumes on request_stop", "[stop_token]")
{
    coop::stop_source source{};

    auto waiter = [](coop::stop_token token) -> coop::task<void> { co_await token; }(source.token());
    waiter.resume();
    REQUIRE_FALSE(waiter.is_ready());

    source.request_stop();
    REQUIRE(waiter.is_ready());
}

TEST_CASE("stop_token copies share the signal", "[stop_token]")
{
    coop::stop_source source{};
    auto              a = source.token();
    auto              b = a;

    REQUIRE(a == b);
    REQUIRE(a == source.token());
    REQUIRE_FALSE(a == coop::stop_source{}.token());

    auto waiter_a = [](coop::stop_token token) -> coop::task<void> { co_await token; }(a);
    auto waiter_b = [](coop::stop_token token) -> coop::task<void> { co_await token; }(b);
    waiter_a.resume();
    waiter_b.resume();

    source.request_stop();
    REQUIRE(waiter_a.is_ready());
    REQUIRE(waiter_b.is_ready());
}

TEST_CASE("stop_source destructor requests stop", "[stop_token]")
{
    coop::stop_token token{};
    auto             waiter = [](coop::stop_token& token) -> coop::task<void> { co_await token; }(token);

    {
        coop::stop_source source{};
        token = source.token();
        waiter.resume();
        REQUIRE_FALSE(waiter.is_ready());
    }

    REQUIRE(token.stop_requested());
    REQUIRE(waiter.is_ready());
}

TEST_CASE("stop_source move assignment releases the replaced signal", "[stop_token]")
{
    coop::stop_source source{};
    auto              first = source.token();

    source = coop::stop_source{};
    REQUIRE(first.stop_requested());
    REQUIRE_FALSE(source.stop_requested());
    REQUIRE_FALSE(source.token() == first);
}

TEST_CASE("stop_source moved from owns nothing", "[stop_token]")
{
    coop::stop_source source{};
    auto              token = source.token();

    coop::stop_source owner{std::move(source)};
    REQUIRE_FALSE(token.stop_requested());
    REQUIRE_FALSE(source.token().stop_possible());
    REQUIRE_FALSE(source.request_stop());

    REQUIRE(owner.request_stop());
    REQUIRE(token.stop_requested());
}

TEST_CASE("stop_token waiter destroyed while suspended leaves no registration", "[stop_token]")
{
    coop::stop_source source{};

    auto waiter = [](coop::stop_token token) -> coop::task<void> { co_await token; }(source.token());
    waiter.resume();
    REQUIRE_FALSE(waiter.is_ready());
    waiter.destroy();

    // Must not resume the destroyed frame.
    REQUIRE(source.request_stop());
}

TEST_CASE("stop_callback runs on request_stop", "[stop_token]")
{
    coop::stop_source source{};
    int               calls{0};

    coop::stop_callback callback{source.token(), [&calls]() { ++calls; }};
    REQUIRE(calls == 0);

    source.request_stop();
    REQUIRE(calls == 1);

    source.request_stop();
    REQUIRE(calls == 1);
}

TEST_CASE("stop_callback runs inline when already stopped", "[stop_token]")
{
    coop::stop_source source{};
    source.request_stop();

    int                 calls{0};
    coop::stop_callback callback{source.token(), [&calls]() { ++calls; }};
    REQUIRE(calls == 1);
}

TEST_CASE("stop_callback destroyed before stop never runs", "[stop_token]")
{
    coop::stop_source source{};
    int               calls{0};

    {
        coop::stop_callback callback{source.token(), [&calls]() { ++calls; }};
    }

    source.request_stop();
    REQUIRE(calls == 0);
}

TEST_CASE("stop_callback on a default token never runs", "[stop_token]")
{
    int calls{0};
    {
        coop::stop_callback callback{coop::stop_token{}, [&calls]() { ++calls; }};
    }
    REQUIRE(calls == 0);
}

TEST_CASE("stop_token many waiters on a thread pool are all resumed", "[stop_token]")
{
    constexpr std::size_t waiter_count = 500;

    auto tp = coop::thread_pool::make_unique(coop::thread_pool::options{.thread_count = 4});

    coop::stop_source        source{};
    std::atomic<std::size_t> resumed{0};

    auto make_waiter =
        [](coop::thread_pool& tp, coop::stop_token token, std::atomic<std::size_t>& resumed) -> coop::task<void>
    {
        co_await tp.schedule();
        co_await token;
        resumed.fetch_add(1, std::memory_order::acq_rel);
    };

    for (std::size_t i = 0; i < waiter_count; ++i)
    {
        REQUIRE(tp->spawn(make_waiter(*tp, source.token(), resumed)));
    }

    // Some waiters register before the stop, some race it and some arrive after, none may be lost.
    std::this_thread::sleep_for(5ms);
    source.request_stop();

    auto give_up = std::chrono::steady_clock::now() + 10s;
    while (resumed.load(std::memory_order::acquire) < waiter_count && std::chrono::steady_clock::now() < give_up)
    {
        std::this_thread::sleep_for(1ms);
    }

    REQUIRE(resumed.load() == waiter_count);
    tp->shutdown();
    REQUIRE(tp->is_shutdown());
}

TEST_CASE("stop_token request_stop from many threads transitions once", "[stop_token]")
{
    constexpr std::size_t thread_count = 8;

    coop::stop_source        source{};
    std::atomic<std::size_t> transitions{0};
    std::atomic<std::size_t> callbacks{0};

    coop::stop_callback callback{source.token(), [&callbacks]() { callbacks.fetch_add(1); }};

    std::vector<std::thread> threads{};
    for (std::size_t i = 0; i < thread_count; ++i)
    {
        threads.emplace_back(
            [&]()
            {
                if (source.request_stop())
                {
                    transitions.fetch_add(1);
                }
            });
    }

    for (auto& t : threads)
    {
        t.join();
    }

    REQUIRE(transitions.load() == 1);
    REQUIRE(callbacks.load() == 1);
}
