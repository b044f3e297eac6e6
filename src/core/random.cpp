//
// Project ProtonKit - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "proton/random.h"

#include <cstdint>
#include <random>
#include <vector>

namespace proton {
namespace internal {
  void seed_thread(int seed) {
    if (seed >= 0) {
      std::seed_seq seq { static_cast<std::uint32_t>(seed) };
      rng.seed(seq);
      return;
    }

    std::random_device rd;
    std::seed_seq seq { rd(), rd(), rd(), rd(), rd(), rd(), rd(), rd() };
    rng.seed(seq);
  }

  std::vector<int> shuffled_indices(int n, int seed) {
    std::vector<int> ids(n);
    for (int i = 0; i < n; ++i)
      ids[i] = i;

    seed_thread(seed);
    shuffle(ids.begin(), ids.end());
    return ids;
  }
}  // namespace internal
}  // namespace proton
