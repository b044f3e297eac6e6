//
// Project ProtonKit - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef PROTON_PKA_PIPELINE_H_
#define PROTON_PKA_PIPELINE_H_

//! @cond
#include <string>
#include <vector>
//! @endcond

#include "proton/pka/dataset.h"
#include "proton/pka/dedup.h"
#include "proton/pka/errors.h"
#include "proton/pka/normalizer.h"
#include "proton/pka/record.h"
#include "proton/pka/splitter.h"

namespace proton {
struct PipelineConfig {
  int min_sites_per_molecule = 1;
  bool dedup_enabled = true;
  std::string vocabulary_version = "v1";
  double reference_ph = 7.4;
  // 0 to use all available cores
  int num_threads = 0;
  int search_limit = 200000;
  int max_extra_deviations = 0;

  NormalizerOptions normalizer_options() const {
    NormalizerOptions options;
    options.search_limit = search_limit;
    options.max_extra_deviations = max_extra_deviations;
    return options;
  }
};

struct RunReport {
  // Filled by the caller while reading; kept by run_pipeline()
  ReadSummary inputs;
  SplitSummary split;
  int excluded = 0;
  ErrorCounts<CorrespondenceError> correspondence;
  ErrorCounts<EncodingError> encoding;
  int samples = 0;
  IntegrityError integrity = IntegrityError::kNone;

  /**
   * @brief Human-readable multi-line summary of the run.
   */
  std::string summary() const;
};

/**
 * @brief Run all stages of the data preparation.
 *
 * @param dataset Receives the dataset. Unchanged on failure.
 * @param report Receives the counts of the run. The input counts
 *        (RunReport::inputs) are left as given.
 * @param records The input records.
 * @param exclusion Molecules to exclude. Ignored if deduplication is
 *        disabled in the configuration.
 * @param config The configuration.
 * @param pairs If not null, receives the normalized pairs of all samples in
 *        dataset order.
 * @return Whether the dataset was assembled. A false return means an unknown
 *         vocabulary version or a violated dataset invariant; rejected sites
 *         are only counted in the report.
 *
 * The order of the samples does not depend on the number of threads.
 */
extern bool run_pipeline(Dataset &dataset, RunReport &report,
                         const std::vector<MoleculeRecord> &records,
                         const ExclusionSet &exclusion,
                         const PipelineConfig &config,
                         std::vector<ReactionDraft> *pairs = nullptr);
}  // namespace proton

#endif /* PROTON_PKA_PIPELINE_H_ */
