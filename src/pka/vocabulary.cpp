//
// Project ProtonKit - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "proton/pka/vocabulary.h"

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

#include <absl/container/flat_hash_map.h>

#include "proton/core/molecule.h"

namespace proton {
namespace {
using namespace constants;  // NOLINT(google-build-using-namespace)

const absl::flat_hash_map<std::string, Vocabulary> &vocabulary_registry() {
  static const auto *const registry =
      new absl::flat_hash_map<std::string, Vocabulary> {
        {
            "v1",
            Vocabulary(
                // H, C, N, O, F, P, S, Cl, Br, I
                "v1", { 1, 6, 7, 8, 9, 15, 16, 17, 35, 53 },
                { -1, 0, 1 },
                { kTerminal, kSP, kSP2, kSP3 },
                { 0, 1, 2, 3 },
                { kSingleBond, kDoubleBond, kTripleBond, kAromaticBond }),
        },
        {
            "v2",
            Vocabulary(
                // v1 + B, Si, Se
                "v2", { 1, 5, 6, 7, 8, 9, 14, 15, 16, 17, 34, 35, 53 },
                { -2, -1, 0, 1, 2 },
                { kUnbound, kTerminal, kSP, kSP2, kSP3, kSP3D, kSP3D2 },
                { 0, 1, 2, 3, 4 },
                { kSingleBond, kDoubleBond, kTripleBond, kAromaticBond }),
        },
      };
  return *registry;
}
}  // namespace

const Vocabulary *find_vocabulary(std::string_view version) {
  const auto &registry = vocabulary_registry();
  auto it = registry.find(version);
  if (it == registry.end())
    return nullptr;
  return &it->second;
}

std::vector<std::string> vocabulary_versions() {
  std::vector<std::string> versions;
  for (const auto &[version, _]: vocabulary_registry())
    versions.push_back(version);
  std::sort(versions.begin(), versions.end());
  return versions;
}
}  // namespace proton
