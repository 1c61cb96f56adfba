#pragma once

#include <cstddef>
#include <functional>

namespace kdeflow::runtime {

/// Worker count for `work_items` independent tasks: `requested` (0 means
/// hardware concurrency), never more than the number of tasks, at least 1.
[[nodiscard]] auto resolve_thread_count(std::size_t requested, std::size_t work_items)
    -> std::size_t;

/// Run `body(i)` for every i in [0, n) on a fixed pool of `threads` workers.
///
/// Indices are handed out in increasing order. `body` returns false to cancel:
/// indices not yet handed out are skipped, indices already running finish.
/// Every index below the one that cancelled has therefore been run. An
/// exception thrown by `body` also cancels and is rethrown on the calling
/// thread once all workers have joined. Returns false if the run was cancelled.
auto parallel_for(std::size_t n, std::size_t threads,
                  const std::function<bool(std::size_t)>& body) -> bool;

}  // namespace kdeflow::runtime
