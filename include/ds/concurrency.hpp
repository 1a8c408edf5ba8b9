#pragma once

#include <cstddef>
#include <functional>

namespace ds {

// Execute fn(index) for index = 0..total-1 with at most `concurrency` threads at a time.
// If concurrency <= 1, runs sequentially.
// All started tasks complete before returning. The first exception thrown by fn
// stops further batches from being scheduled and is rethrown after the join.
void for_each_index_batched(std::size_t total,
                            int concurrency,
                            const std::function<void(std::size_t)> &fn);

} // namespace ds
