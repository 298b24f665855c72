#pragma once

#include <functional>

namespace ridge_texture::core {

// Clamps the requested worker count to [1, min(cpu cores, task_count)].
int compute_worker_count(int requested, int task_count);

// Calls row_fn(y) for every y in [0, rows) from up to `workers` threads.
// Rows are handed out by an atomic counter; the first exception thrown by
// any worker is rethrown after all workers have joined.
void parallel_rows(int rows, int workers, const std::function<void(int)>& row_fn);

} // namespace ridge_texture::core
