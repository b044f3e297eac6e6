//
// Project ProtonKit - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef PROTON_PKA_DEDUP_H_
#define PROTON_PKA_DEDUP_H_

//! @cond
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <absl/container/flat_hash_set.h>
//! @endcond

#include "proton/core/molecule.h"
#include "proton/pka/record.h"

namespace proton {
/**
 * @brief Set of molecule identities excluded from the training corpus.
 *
 * Identities are canonical_key() strings, so any drawing or protonation state
 * of a reference molecule excludes all records of that molecule.
 */
class ExclusionSet {
public:
  ExclusionSet() = default;

  /**
   * @brief Add a reference molecule.
   * @return Whether the molecule was not yet in the set.
   */
  bool add(const Molecule &mol);

  bool add_key(std::string key) { return keys_.insert(std::move(key)).second; }

  bool contains(std::string_view key) const { return keys_.contains(key); }

  bool empty() const { return keys_.empty(); }

  int size() const { return static_cast<int>(keys_.size()); }

private:
  absl::flat_hash_set<std::string> keys_;
};

inline bool is_excluded(const SiteRecord &site,
                        const ExclusionSet &exclusion) {
  return exclusion.contains(site.parent_key);
}

/**
 * @brief Remove the records whose parent molecule is in the exclusion set.
 *
 * @param sites The records. Order of the remaining records is preserved.
 * @param exclusion The exclusion set.
 * @return Number of records removed.
 */
extern int deduplicate(std::vector<SiteRecord> &sites,
                       const ExclusionSet &exclusion);
}  // namespace proton

#endif /* PROTON_PKA_DEDUP_H_ */
