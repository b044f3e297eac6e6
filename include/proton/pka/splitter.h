//
// Project ProtonKit - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef PROTON_PKA_SPLITTER_H_
#define PROTON_PKA_SPLITTER_H_

//! @cond
#include <vector>
//! @endcond

#include "proton/pka/errors.h"
#include "proton/pka/record.h"

namespace proton {
struct SplitSummary {
  int records = 0;
  int records_without_sites = 0;
  int below_min_sites = 0;
  int emitted = 0;
  ErrorCounts<SiteError> skipped;

  SplitSummary &operator+=(const SplitSummary &other) {
    records += other.records;
    records_without_sites += other.records_without_sites;
    below_min_sites += other.below_min_sites;
    emitted += other.emitted;
    skipped += other.skipped;
    return *this;
  }
};

/**
 * @brief Check that a site carries a pKa value and both protonation states.
 */
extern SiteError validate_site(const SiteAnnotation &site);

/**
 * @brief Split one record into single-site records.
 *
 * @param sites Receives the single-site records, appended in the order the
 *        sites appear in the record.
 * @param summary Updated with the counts of this record.
 * @param record The record.
 * @param min_sites_per_molecule If the record has fewer valid sites than
 *        this, no site is emitted.
 *
 * Invalid sites are skipped individually and counted by reason.
 */
extern void split_record(std::vector<SiteRecord> &sites, SplitSummary &summary,
                         const MoleculeRecord &record,
                         int min_sites_per_molecule = 1);

/**
 * @brief Split all records. See split_record().
 */
extern std::vector<SiteRecord>
split_records(const std::vector<MoleculeRecord> &records,
              SplitSummary &summary, int min_sites_per_molecule = 1);
}  // namespace proton

#endif /* PROTON_PKA_SPLITTER_H_ */
