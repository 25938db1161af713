#pragma once

#include <cstddef>
#include <functional>

namespace photomosaic::core {

// Runs fn(i) for i in [0, count) on up to `workers` threads that pull the next
// index from a shared counter. workers <= 1 runs inline. The first exception
// thrown by any call stops further indices from being handed out and is
// rethrown on the calling thread after all workers have joined.
void parallel_for_index(std::size_t count, int workers,
                        const std::function<void(std::size_t)>& fn);

} // namespace photomosaic::core
