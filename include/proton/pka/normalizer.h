//
// Project ProtonKit - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef PROTON_PKA_NORMALIZER_H_
#define PROTON_PKA_NORMALIZER_H_

//! @cond
#include <limits>
#include <string>
//! @endcond

#include "proton/eigen_config.h"
#include "proton/core/molecule.h"
#include "proton/pka/errors.h"
#include "proton/pka/record.h"

namespace proton {
struct NormalizerOptions {
  // Differences tolerated in a correspondence: charge of atoms other than
  // the reaction center, ring pi system membership, and bond class.
  int max_extra_deviations = 0;
  // Maximum number of assignments tried by the bijection search.
  int search_limit = 200000;
};

/**
 * @brief A protonated/deprotonated pair with resolved atom correspondence.
 *
 * Shared atoms are the atoms of the heavy-atom views (see HeavyAtomGraph) of
 * the two states. They are numbered 0..n-1 in the order of the protonated
 * state; shared atom `i` is atom `protonated_atoms[i]` of the protonated
 * state and atom `deprotonated_atoms[i]` of the deprotonated state.
 */
struct ReactionDraft {
  std::string source_id;
  int site_id = -1;
  std::string parent_key;
  double pka = std::numeric_limits<double>::quiet_NaN();
  std::string pka_type;

  // The state with one more hydrogen
  Molecule protonated;
  Molecule deprotonated;

  ArrayXi protonated_atoms;
  ArrayXi deprotonated_atoms;

  // Shared atom index of the reaction center
  int center = -1;
  // Atom index of the transferred hydrogen in the protonated state, or -1 if
  // the hydrogen is implicit
  int transferred_hydrogen = -1;
  // Whether the input pair was given in the opposite orientation
  bool swapped = false;
  // Number of tolerated extra differences in the correspondence
  int deviations = 0;

  int num_shared_atoms() const {
    return static_cast<int>(protonated_atoms.size());
  }
};

/**
 * @brief Resolve the atom correspondence of a single-site record.
 *
 * @param draft Receives the normalized pair. Unspecified on failure.
 * @param site The record.
 * @param options Search options.
 * @return CorrespondenceError::kNone on success, or the reason of failure.
 *
 * The states are oriented by hydrogen count: the state with one more hydrogen
 * becomes the protonated state, whatever the input labels are. The shared
 * atoms must match on element, ring membership and connectivity, and on
 * hydrogen count except for the one hydrogen moved from the reaction center.
 * Among all such bijections, the ones with the fewest other differences are
 * kept; the pair is rejected if they do not agree on a single reaction center
 * up to symmetry.
 */
extern CorrespondenceError normalize_pair(ReactionDraft &draft,
                                          const SiteRecord &site,
                                          const NormalizerOptions &options);

inline CorrespondenceError normalize_pair(ReactionDraft &draft,
                                          const SiteRecord &site) {
  return normalize_pair(draft, site, NormalizerOptions());
}
}  // namespace proton

#endif /* PROTON_PKA_NORMALIZER_H_ */
