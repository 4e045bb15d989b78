#include "catch_extensions.hpp"

#include <coop/coop.hpp>

#include <coroutine>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

TEST_CASE("task", "[task]")
{
    std::cerr << "[task]\n\n";
}

TEST_CASE("task does not run until resumed", "[task]")
{
    bool ran{false};
    auto t = [](bool& ran) -> coop::task<std::string>
    {
        ran = true;
        co_return "stopped";
    }(ran);

    REQUIRE_FALSE(ran);
    REQUIRE_FALSE(t.is_ready());
    REQUIRE_THROWS_AS(t.promise().result(), std::runtime_error);

    REQUIRE_FALSE(t.resume());
    REQUIRE(ran);
    REQUIRE(t.is_ready());
    REQUIRE(t.promise().result() == "stopped");
}

TEST_CASE("task rethrows the exception it exited with", "[task]")
{
    auto t = []() -> coop::task<int>
    {
        throw std::logic_error{"operation failed"};
        co_return 0;
    }();

    t.resume();
    REQUIRE(t.is_ready());
    REQUIRE_THROWS_WITH(t.promise().result(), "operation failed");

    auto v = []() -> coop::task<void>
    {
        throw std::logic_error{"void operation failed"};
        co_return;
    }();

    v.resume();
    REQUIRE_THROWS_AS(v.promise().result(), std::logic_error);
}

TEST_CASE("task awaited by another task resumes its parent", "[task]")
{
    auto outer = []() -> coop::task<int>
    {
        auto inner = [](int x) -> coop::task<int> { co_return x * 2; };

        auto first  = co_await inner(10);
        auto second = co_await inner(first);
        co_await std::suspend_always{};
        co_return second + 2;
    }();

    REQUIRE(outer.resume());
    REQUIRE_FALSE(outer.resume());
    REQUIRE(outer.promise().result() == 42);
}

TEST_CASE("task awaited as an rvalue moves its result out", "[task]")
{
    auto outer = []() -> coop::task<std::size_t>
    {
        auto make = []() -> coop::task<std::unique_ptr<std::string>>
        { co_return std::make_unique<std::string>("moved"); };

        auto owned = co_await make();
        co_return owned->size();
    }();

    outer.resume();
    REQUIRE(outer.is_ready());
    REQUIRE(outer.promise().result() == 5);
}

TEST_CASE("task awaited as an lvalue leaves its result in place", "[task]")
{
    auto outer = []() -> coop::task<bool>
    {
        auto inner = []() -> coop::task<std::string> { co_return "kept"; }();

        const auto& first = co_await inner;
        co_return first == "kept" && inner.promise().result() == "kept";
    }();

    outer.resume();
    REQUIRE(outer.promise().result());
}

TEST_CASE("task destroyed while suspended", "[task]")
{
    auto t = []() -> coop::task<int>
    {
        co_await std::suspend_always{};
        co_return 1;
    }();

    t.resume();
    REQUIRE_FALSE(t.is_ready());
    REQUIRE(t.destroy());
    REQUIRE(t.is_ready());
    REQUIRE_FALSE(t.destroy());
}

TEST_CASE("task move assignment destroys the previous frame", "[task]")
{
    auto make = [](int v) -> coop::task<int> { co_return v; };

    auto t = make(1);
    t      = make(2);
    t.resume();
    REQUIRE(t.promise().result() == 2);

    coop::task<int> empty{};
    REQUIRE(empty.is_ready());
    REQUIRE_FALSE(empty.resume());
}
