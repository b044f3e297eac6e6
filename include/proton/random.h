//
// Project ProtonKit - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef PROTON_RANDOM_H_
#define PROTON_RANDOM_H_

//! @cond
#include <algorithm>
#include <random>
#include <vector>
//! @endcond

namespace proton {
namespace internal {
  // NOLINTNEXTLINE(*-global-variables)
  inline thread_local std::mt19937 rng {};

  template <typename NT>
  NT draw_uid(NT min, NT max) {
    return std::uniform_int_distribution<NT>(min, max - 1)(rng);
  }

  template <typename NT>
  NT draw_uid(NT max) {
    return draw_uid(static_cast<NT>(0), max);
  }

  /**
   * @brief Shuffle the range with the thread-local generator.
   * @note Fisher-Yates pass over draw_uid(); unlike std::shuffle, the number
   *       of draws is fixed by the length of the range.
   */
  template <class Iter>
  void shuffle(Iter begin, Iter end) {
    auto n = end - begin;
    for (decltype(n) i = n - 1; i > 0; --i) {
      auto j = draw_uid<decltype(n)>(i + 1);
      std::iter_swap(begin + i, begin + j);
    }
  }

  /**
   * @brief Seed the generator of the calling thread.
   * @param seed The seed. If negative, the generator is seeded from
   *        std::random_device.
   */
  extern void seed_thread(int seed);

  /**
   * @brief A random permutation of `0..n-1`.
   *
   * Reseeds the generator of the calling thread; the same seed always gives
   * the same permutation.
   */
  extern std::vector<int> shuffled_indices(int n, int seed);
}  // namespace internal
}  // namespace proton

#endif /* PROTON_RANDOM_H_ */
