//
// Project ProtonKit - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef PROTON_PARALLEL_H_
#define PROTON_PARALLEL_H_

//! @cond
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>
//! @endcond

namespace proton {
/**
 * @brief Call `fn(i)` for every `i` in `[0, n)`.
 *
 * @param n The number of items.
 * @param num_threads The number of worker threads. 1 runs serially on the
 *        calling thread; 0 or negative uses the default concurrency.
 * @param fn The function to call. Calls on distinct indices may run
 *        concurrently and in any order.
 */
template <class Fn>
void parallel_for_each_index(int n, int num_threads, Fn &&fn) {
  if (n <= 0)
    return;

  if (num_threads == 1) {
    for (int i = 0; i < n; ++i)
      fn(i);
    return;
  }

  auto body = [&]() {
    tbb::parallel_for(tbb::blocked_range<int>(0, n),
                      [&](const tbb::blocked_range<int> &range) {
                        for (int i = range.begin(); i != range.end(); ++i)
                          fn(i);
                      });
  };

  if (num_threads <= 0) {
    body();
    return;
  }

  tbb::task_arena arena(num_threads);
  arena.execute(body);
}
}  // namespace proton

#endif /* PROTON_PARALLEL_H_ */
