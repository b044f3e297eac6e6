//
// Project ProtonKit - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef PROTON_PKA_ORACLE_H_
#define PROTON_PKA_ORACLE_H_

//! @cond
#include <filesystem>
#include <vector>
//! @endcond

#include "proton/core/molecule.h"
#include "proton/pka/record.h"

namespace proton {
/**
 * @brief Source of protonation states and pKa values for a molecule.
 */
class ProtonationOracle {
public:
  ProtonationOracle() = default;
  ProtonationOracle(const ProtonationOracle &) = default;
  ProtonationOracle &operator=(const ProtonationOracle &) = default;
  ProtonationOracle(ProtonationOracle &&) noexcept = default;
  ProtonationOracle &operator=(ProtonationOracle &&) noexcept = default;
  virtual ~ProtonationOracle() noexcept = default;

  /**
   * @brief Predict the ionizable sites of a molecule.
   * @return The sites, in the order they should be emitted. A site that could
   *         not be fully resolved is still returned, with the missing fields
   *         left empty.
   */
  virtual std::vector<SiteAnnotation> predict(const Molecule &mol) const = 0;
};

/**
 * @brief Oracle reading sites from the SD data items of a predictor output.
 *
 * Recognized data items are `pKa`, `epik_atom` or `marvin_atom` (0-based atom
 * indices), and `pka_number` or `marvin_pKa_type`. Multiple sites are given as
 * comma or whitespace separated lists of the same length. The other
 * protonation state of each site is built with make_conjugate() at the
 * reference pH.
 */
class AnnotationOracle final: public ProtonationOracle {
public:
  explicit AnnotationOracle(double reference_ph = 7.4): ph_(reference_ph) { }

  std::vector<SiteAnnotation> predict(const Molecule &mol) const override;

  double reference_ph() const { return ph_; }

private:
  double ph_;
};

/**
 * @brief Build the conjugate acid or base of a molecule at one atom.
 *
 * @param conj Receives the conjugate. Unchanged on failure.
 * @param mol The molecule.
 * @param atom Index of the reaction center.
 * @param protonate If true, add a hydrogen and raise the formal charge by
 *        one; otherwise remove a hydrogen and lower the formal charge by one.
 * @return Whether the conjugate could be built.
 *
 * If the molecule has explicit hydrogens, the hydrogen is added or removed as
 * an explicit atom. An added hydrogen is appended to the end of the molecule.
 */
extern bool make_conjugate(Molecule &conj, const Molecule &mol, int atom,
                           bool protonate);

/**
 * @brief Read all molecules of an SD file into records.
 *
 * @param records Receives the records, appended in file order.
 * @param summary Counts of unparsed blocks and renamed records are added to
 *        it.
 * @param path The file.
 * @param oracle The oracle used to annotate each molecule.
 * @return Whether the file could be read. Blocks that fail to parse are
 *         logged, counted and skipped.
 *
 * Consecutive entries with the same source id are merged into one record. A
 * record whose source id is already used by an earlier record of `records`
 * (from this or a previous file) gets a `#<n>` suffix, so that source ids
 * are unique.
 */
extern bool read_records(std::vector<MoleculeRecord> &records,
                         ReadSummary &summary,
                         const std::filesystem::path &path,
                         const ProtonationOracle &oracle);
}  // namespace proton

#endif /* PROTON_PKA_ORACLE_H_ */
