#include <coop/coop.hpp>

#include <atomic>
#include <iostream>
#include <mutex>

int main()
{
    const size_t   producers_count = 3;
    const size_t   consumers_count = 2;
    const uint64_t iterations      = 5;

    auto tp = coop::thread_pool::make_unique(coop::thread_pool::options{.thread_count = 4});

    coop::channel<uint64_t> ch{2};
    coop::stop_source       producers_done{};
    std::atomic<size_t>     producers_remaining{producers_count};
    std::mutex              m{}; /// Just for making the console prints look nice.

    auto make_producer_task = [iterations](
                                  coop::thread_pool&       tp,
                                  coop::channel<uint64_t>& ch,
                                  std::atomic<size_t>&     remaining,
                                  coop::stop_source&       done) -> coop::task<void>
    {
        co_await tp.schedule();

        for (uint64_t i = 0; i < iterations; ++i)
        {
            co_await ch.send(i);
        }

        // The last producer to finish wakes up main.
        if (remaining.fetch_sub(1) == 1)
        {
            done.request_stop();
        }
        co_return;
    };

    auto make_consumer_task = [](coop::thread_pool& tp, coop::channel<uint64_t>& ch, std::mutex& m) -> coop::task<void>
    {
        co_await tp.schedule();

        while (auto item = co_await ch.next())
        {
            std::scoped_lock lk{m};
            std::cout << "consumed " << *item << "\n";
        }
        co_return;
    };

    for (size_t i = 0; i < consumers_count; ++i)
    {
        tp->spawn(make_consumer_task(*tp, ch, m));
    }
    for (size_t i = 0; i < producers_count; ++i)
    {
        tp->spawn(make_producer_task(*tp, ch, producers_remaining, producers_done));
    }

    coop::sync_wait(producers_done.token());

    // Consumers drain what is buffered and then see the channel closed.
    ch.close();
    tp->shutdown();
}
