#include <coop/coop.hpp>

#include <chrono>
#include <iostream>
#include <thread>

using namespace std::chrono_literals;

int main()
{
    auto timer = coop::thread_timer::make_unique();
    auto tp    = coop::thread_pool::make_unique(coop::thread_pool::options{.thread_count = 2});

    coop::channel<uint64_t> ch{8};

    auto make_producer_task = [](coop::thread_pool& tp, coop::channel<uint64_t>& ch) -> coop::task<void>
    {
        co_await tp.schedule();

        for (uint64_t i = 1;; ++i)
        {
            if (co_await ch.send(i) != coop::channel_result::send::sent)
            {
                break; // The channel was closed, nobody is listening anymore.
            }
            std::this_thread::sleep_for(10ms);
        }
        co_return;
    };

    auto make_consumer_task = [](coop::stop_stream<coop::channel<uint64_t>&>& stream) -> coop::task<uint64_t>
    {
        uint64_t consumed{0};
        while (auto item = co_await stream.next())
        {
            std::cout << "consumed " << *item << "\n";
            ++consumed;
        }
        co_return consumed;
    };

    tp->spawn(make_producer_task(*tp, ch));

    // Consume for 100ms, the producer keeps going but the stream stops delivering.
    auto stream   = coop::until(ch, coop::deadline{*timer, 100ms});
    auto consumed = coop::sync_wait(make_consumer_task(stream));

    std::cout << "consumed " << consumed << " items before the stream "
              << (stream.stopped() ? "stopped" : "ended") << " reason="
              << coop::to_string(stream.reason().value_or(coop::stop_reason::cancelled)) << "\n";

    ch.close();
    tp->shutdown();
}
