//
// Project ProtonKit - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef PROTON_PKA_RECORD_H_
#define PROTON_PKA_RECORD_H_

//! @cond
#include <limits>
#include <optional>
#include <string>
#include <vector>
//! @endcond

#include "proton/core/molecule.h"

namespace proton {
/**
 * @brief One annotated ionizable site of a molecule.
 */
struct SiteAnnotation {
  // Ordinal of the site in its record
  int site_id = -1;
  // NaN if missing
  double pka = std::numeric_limits<double>::quiet_NaN();
  // Atom index of the reaction center in the protonated variant, or -1 if
  // unknown
  int reaction_center = -1;
  std::string pka_type;
  std::optional<Molecule> protonated;
  std::optional<Molecule> deprotonated;
};

struct MoleculeRecord {
  std::string source_id;
  Molecule mol;
  std::vector<SiteAnnotation> sites;
};

/**
 * @brief Counts of the input reading stage.
 */
struct ReadSummary {
  // Input blocks that failed to parse
  int unparsed = 0;
  // Records renamed because their source id was already taken
  int renamed = 0;
  // Reference blocks that failed to parse
  int unparsed_references = 0;
};

/**
 * @brief A record holding exactly one site, as emitted by split_records().
 */
struct SiteRecord {
  std::string source_id;
  int site_id = -1;
  // canonical_key() of the parent molecule
  std::string parent_key;
  double pka = std::numeric_limits<double>::quiet_NaN();
  int reaction_center = -1;
  std::string pka_type;
  Molecule protonated;
  Molecule deprotonated;
};
}  // namespace proton

#endif /* PROTON_PKA_RECORD_H_ */
