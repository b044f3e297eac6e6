//
// Project ProtonKit - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "proton/pka/dedup.h"

#include <algorithm>
#include <vector>

#include <absl/log/absl_log.h>

#include "proton/core/canonical.h"

namespace proton {
bool ExclusionSet::add(const Molecule &mol) {
  return add_key(canonical_key(mol));
}

int deduplicate(std::vector<SiteRecord> &sites,
                const ExclusionSet &exclusion) {
  if (exclusion.empty())
    return 0;

  auto it = std::stable_partition(
      sites.begin(), sites.end(),
      [&](const SiteRecord &site) { return !is_excluded(site, exclusion); });

  const int removed = static_cast<int>(sites.end() - it);
  for (auto jt = it; jt != sites.end(); ++jt) {
    ABSL_LOG(INFO) << "Excluding site " << jt->site_id << " of "
                   << jt->source_id << ": parent molecule in reference set";
  }

  sites.erase(it, sites.end());
  return removed;
}
}  // namespace proton
