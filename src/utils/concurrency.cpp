#include "ds/concurrency.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace ds {

void for_each_index_batched(std::size_t total,
                            int concurrency,
                            const std::function<void(std::size_t)>& fn)
{
    if (total == 0) return;

    if (concurrency <= 1)
    {
        for (std::size_t i = 0; i < total; ++i) fn(i);
        return;
    }

    std::atomic<bool> failed{false};
    std::mutex ex_mtx;
    std::exception_ptr first_ex = nullptr;

    auto safe_call = [&](std::size_t idx) {
        try {
            fn(idx);
        } catch (...) {
            std::scoped_lock lk(ex_mtx);
            if (!first_ex) first_ex = std::current_exception();
            failed.store(true, std::memory_order_relaxed);
        }
    };

    const std::size_t width = static_cast<std::size_t>(concurrency);
    std::size_t next = 0;
    while (next < total && !failed.load(std::memory_order_relaxed))
    {
        const std::size_t batch = std::min(width, total - next);
        std::vector<std::thread> threads;
        threads.reserve(batch);
        for (std::size_t i = 0; i < batch; ++i)
        {
            const std::size_t idx = next + i;
            threads.emplace_back([&, idx] { safe_call(idx); });
        }
        for (auto& th : threads) if (th.joinable()) th.join();
        next += batch;
    }

    if (first_ex) std::rethrow_exception(first_ex);
}

} // namespace ds
