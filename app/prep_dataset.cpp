//
// Project ProtonKit - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <iostream>
#include <string>
#include <vector>

#include <absl/flags/flag.h>
#include <absl/flags/parse.h>
#include <absl/flags/usage.h>
#include <absl/log/absl_log.h>
#include <absl/log/flags.h>  // IWYU pragma: keep
#include <absl/log/initialize.h>
#include <absl/strings/str_cat.h>

#include "proton/core/molecule.h"
#include "proton/fmt/base.h"
#include "proton/fmt/sdf.h"
#include "proton/pka/dataset.h"
#include "proton/pka/dedup.h"
#include "proton/pka/oracle.h"
#include "proton/pka/pipeline.h"
#include "proton/pka/record.h"
#include "proton/pka/vocabulary.h"

// NOLINTBEGIN(*-global-variables)
ABSL_FLAG(std::vector<std::string>, input, {},
          "Annotated SD files of the training corpus (comma separated).");
ABSL_FLAG(std::vector<std::string>, reference, {},
          "Molecule files of the evaluation set to exclude (comma "
          "separated).");
ABSL_FLAG(bool, allow_unparsed_references, false,
          "Continue when some reference blocks cannot be parsed.");
ABSL_FLAG(std::string, output, "", "Path of the dataset to write.");
ABSL_FLAG(std::string, pairs_out, "",
          "If set, write the normalized pairs of all samples to this SD "
          "file.");
ABSL_FLAG(int, min_sites_per_molecule, 1,
          "Drop molecules with fewer valid sites than this.");
ABSL_FLAG(bool, dedup, true,
          "Exclude molecules of the reference set from the dataset.");
ABSL_FLAG(std::string, vocabulary, "v1", "Attribute vocabulary version.");
ABSL_FLAG(double, reference_ph, 7.4,
          "pH at which the input structures were drawn.");
ABSL_FLAG(int, threads, 0, "Number of worker threads; 0 uses all cores.");
ABSL_FLAG(int, search_limit, 200000,
          "Maximum number of assignments tried per atom correspondence.");
ABSL_FLAG(int, max_extra_deviations, 0,
          "Attribute differences tolerated in an atom correspondence besides "
          "the reaction center.");
ABSL_FLAG(double, split_ratio, 0,
          "If in (0, 1), also write train/validation index files next to the "
          "dataset.");
ABSL_FLAG(int, split_seed, 42, "Seed of the train/validation split.");
// NOLINTEND(*-global-variables)

namespace proton {
namespace {
bool write_pairs(const std::filesystem::path &path,
                 const std::vector<ReactionDraft> &pairs) {
  std::string out;
  for (const ReactionDraft &draft: pairs) {
    for (const Molecule *mol: { &draft.protonated, &draft.deprotonated }) {
      Molecule copy = *mol;
      copy.name() = absl::StrCat(draft.source_id, "_", draft.site_id,
                                 mol == &draft.protonated ? "_prot"
                                                          : "_deprot");
      copy.add_prop("pKa", absl::StrCat(draft.pka));
      copy.add_prop("reaction_center", absl::StrCat(draft.center));

      if (!write_sdf(out, copy)) {
        ABSL_LOG(WARNING) << "Cannot write pair " << copy.name();
        continue;
      }
    }
  }

  std::ofstream ofs(path);
  ofs << out;
  if (!ofs) {
    ABSL_LOG(ERROR) << "Failed to write " << path;
    return false;
  }
  return true;
}

bool write_indices(const std::filesystem::path &path,
                   const std::vector<int> &indices) {
  std::ofstream ofs(path);
  for (int i: indices)
    ofs << i << '\n';
  if (!ofs) {
    ABSL_LOG(ERROR) << "Failed to write " << path;
    return false;
  }
  return true;
}

bool write_split(const std::filesystem::path &output, const Dataset &dataset,
                 double ratio, int seed) {
  std::vector<int> train, validation;
  if (!split_dataset(train, validation, dataset.size(), ratio, seed))
    return false;

  std::filesystem::path train_path = output, validation_path = output;
  train_path += ".train";
  validation_path += ".valid";
  return write_indices(train_path, train)
         && write_indices(validation_path, validation);
}

int run(const PipelineConfig &config) {
  const std::vector<std::string> inputs = absl::GetFlag(FLAGS_input);
  const std::string output = absl::GetFlag(FLAGS_output);
  if (inputs.empty() || output.empty()) {
    ABSL_LOG(ERROR) << "Both --input and --output are required";
    return 1;
  }

  if (find_vocabulary(config.vocabulary_version) == nullptr) {
    ABSL_LOG(ERROR) << "Unknown vocabulary version "
                    << config.vocabulary_version;
    return 1;
  }

  const double split_ratio = absl::GetFlag(FLAGS_split_ratio);
  if (split_ratio != 0 && !(split_ratio > 0 && split_ratio < 1)) {
    ABSL_LOG(ERROR) << "--split_ratio must be in (0, 1)";
    return 1;
  }

  RunReport report;
  AnnotationOracle oracle(config.reference_ph);
  std::vector<MoleculeRecord> records;
  for (const std::string &input: inputs) {
    if (!read_records(records, report.inputs, input, oracle))
      return 1;
  }

  ExclusionSet exclusion;
  if (config.dedup_enabled) {
    std::vector<Molecule> refs;
    for (const std::string &ref: absl::GetFlag(FLAGS_reference)) {
      if (!read_molecules(refs, report.inputs.unparsed_references, ref))
        return 1;
    }

    if (report.inputs.unparsed_references > 0
        && !absl::GetFlag(FLAGS_allow_unparsed_references)) {
      ABSL_LOG(ERROR) << report.inputs.unparsed_references
                      << " reference blocks could not be parsed; pass "
                         "--allow_unparsed_references to continue without "
                         "them";
      return 1;
    }

    for (const Molecule &mol: refs)
      exclusion.add(mol);
  }

  const std::string pairs_out = absl::GetFlag(FLAGS_pairs_out);
  std::vector<ReactionDraft> pairs;

  Dataset dataset;
  const bool ok = run_pipeline(dataset, report, records, exclusion, config,
                               pairs_out.empty() ? nullptr : &pairs);
  std::cout << report.summary();
  if (!ok)
    return 1;

  if (!save_dataset(dataset, output))
    return 1;

  if (!pairs_out.empty() && !write_pairs(pairs_out, pairs))
    return 1;

  if (split_ratio > 0
      && !write_split(output, dataset, split_ratio,
                      absl::GetFlag(FLAGS_split_seed)))
    return 1;

  return 0;
}
}  // namespace
}  // namespace proton

int main(int argc, char *argv[]) {
  absl::SetProgramUsageMessage(
      "Prepare a pKa training dataset from annotated SD files.\n"
      "Usage: protonkit_prep --input=a.sdf,b.sdf --output=out.pkd "
      "[--reference=test.sdf]");
  absl::ParseCommandLine(argc, argv);
  absl::InitializeLog();

  proton::PipelineConfig config;
  config.min_sites_per_molecule =
      absl::GetFlag(FLAGS_min_sites_per_molecule);
  config.dedup_enabled = absl::GetFlag(FLAGS_dedup);
  config.vocabulary_version = absl::GetFlag(FLAGS_vocabulary);
  config.reference_ph = absl::GetFlag(FLAGS_reference_ph);
  config.num_threads = absl::GetFlag(FLAGS_threads);
  config.search_limit = absl::GetFlag(FLAGS_search_limit);
  config.max_extra_deviations = absl::GetFlag(FLAGS_max_extra_deviations);

  return proton::run(config);
}
