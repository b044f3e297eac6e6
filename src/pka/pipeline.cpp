//
// Project ProtonKit - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "proton/pka/pipeline.h"

#include <string>
#include <utility>
#include <vector>

#include <absl/log/absl_log.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>
#include <absl/strings/str_join.h>

#include "proton/parallel.h"
#include "proton/pka/dataset.h"
#include "proton/pka/dedup.h"
#include "proton/pka/encoder.h"
#include "proton/pka/errors.h"
#include "proton/pka/normalizer.h"
#include "proton/pka/record.h"
#include "proton/pka/splitter.h"
#include "proton/pka/vocabulary.h"

namespace proton {
namespace {
template <class E>
void append_counts(std::string &out, const ErrorCounts<E> &counts) {
  counts.for_each([&](E err, int count) {
    if (count > 0)
      absl::StrAppendFormat(&out, "    %-28s %d\n", to_string(err), count);
  });
}

std::vector<SiteRecord> split_all(SplitSummary &summary,
                                  const std::vector<MoleculeRecord> &records,
                                  const PipelineConfig &config) {
  const int n = static_cast<int>(records.size());
  std::vector<std::vector<SiteRecord>> per_record(n);
  std::vector<SplitSummary> summaries(n);

  parallel_for_each_index(n, config.num_threads, [&](int i) {
    split_record(per_record[i], summaries[i], records[i],
                 config.min_sites_per_molecule);
  });

  std::vector<SiteRecord> sites;
  sites.reserve(n);
  for (int i = 0; i < n; ++i) {
    summary += summaries[i];
    for (SiteRecord &site: per_record[i])
      sites.push_back(std::move(site));
  }
  return sites;
}

struct SiteResult {
  CorrespondenceError correspondence = CorrespondenceError::kNone;
  EncodingError encoding = EncodingError::kNone;
  ReactionDraft draft;
  ReactionSample sample;

  bool ok() const {
    return correspondence == CorrespondenceError::kNone
           && encoding == EncodingError::kNone;
  }
};
}  // namespace

std::string RunReport::summary() const {
  std::string out;
  absl::StrAppendFormat(&out, "Unparsed input blocks:         %d\n",
                        inputs.unparsed);
  absl::StrAppendFormat(&out, "Unparsed reference blocks:     %d\n",
                        inputs.unparsed_references);
  absl::StrAppendFormat(&out, "Renamed duplicate source ids:  %d\n",
                        inputs.renamed);
  absl::StrAppendFormat(&out, "Records read:                  %d\n",
                        split.records);
  absl::StrAppendFormat(&out, "  without sites:               %d\n",
                        split.records_without_sites);
  absl::StrAppendFormat(&out, "  below minimum site count:    %d\n",
                        split.below_min_sites);
  absl::StrAppendFormat(&out, "Sites skipped:                 %d\n",
                        split.skipped.total());
  append_counts(out, split.skipped);
  absl::StrAppendFormat(&out, "Single-site records:           %d\n",
                        split.emitted);
  absl::StrAppendFormat(&out, "Excluded by reference set:     %d\n",
                        excluded);
  absl::StrAppendFormat(&out, "Correspondence failures:       %d\n",
                        correspondence.total());
  append_counts(out, correspondence);
  absl::StrAppendFormat(&out, "Encoding failures:             %d\n",
                        encoding.total());
  append_counts(out, encoding);
  absl::StrAppendFormat(&out, "Samples:                       %d\n", samples);
  if (integrity != IntegrityError::kNone)
    absl::StrAppend(&out, "Integrity error:               ",
                    to_string(integrity), "\n");
  return out;
}

bool run_pipeline(Dataset &dataset, RunReport &report,
                  const std::vector<MoleculeRecord> &records,
                  const ExclusionSet &exclusion, const PipelineConfig &config,
                  std::vector<ReactionDraft> *pairs) {
  const ReadSummary inputs = report.inputs;
  report = RunReport();
  report.inputs = inputs;

  const Vocabulary *vocab = find_vocabulary(config.vocabulary_version);
  if (vocab == nullptr) {
    ABSL_LOG(ERROR) << "Unknown vocabulary version "
                    << config.vocabulary_version << "; known versions: "
                    << absl::StrJoin(vocabulary_versions(), ", ");
    return false;
  }

  std::vector<SiteRecord> sites = split_all(report.split, records, config);
  ABSL_LOG(INFO) << "Split " << report.split.records << " records into "
                 << sites.size() << " single-site records";

  if (config.dedup_enabled) {
    report.excluded = deduplicate(sites, exclusion);
    ABSL_LOG(INFO) << "Excluded " << report.excluded
                   << " single-site records of " << exclusion.size()
                   << " reference molecules";
  }

  const NormalizerOptions options = config.normalizer_options();
  const int n = static_cast<int>(sites.size());
  std::vector<SiteResult> results(n);

  parallel_for_each_index(n, config.num_threads, [&](int i) {
    SiteResult &result = results[i];
    result.correspondence = normalize_pair(result.draft, sites[i], options);
    if (result.correspondence != CorrespondenceError::kNone)
      return;

    result.encoding = encode_reaction(result.sample, result.draft, *vocab);
  });

  std::vector<ReactionSample> samples;
  samples.reserve(n);
  if (pairs != nullptr)
    pairs->clear();

  for (SiteResult &result: results) {
    report.correspondence.add(result.correspondence);
    report.encoding.add(result.encoding);
    if (!result.ok())
      continue;

    samples.push_back(std::move(result.sample));
    if (pairs != nullptr)
      pairs->push_back(std::move(result.draft));
  }
  report.samples = static_cast<int>(samples.size());

  report.integrity = assemble_dataset(dataset, std::move(samples), *vocab);
  if (report.integrity != IntegrityError::kNone) {
    ABSL_LOG(ERROR) << "Dataset assembly failed: " << report.integrity;
    if (pairs != nullptr)
      pairs->clear();
    return false;
  }

  ABSL_LOG(INFO) << "Assembled " << dataset.size() << " samples";
  return true;
}
}  // namespace proton
