//
// Project ProtonKit - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef PROTON_PKA_DATASET_H_
#define PROTON_PKA_DATASET_H_

//! @cond
#include <filesystem>
#include <istream>
#include <string>
#include <utility>
#include <vector>

#include <absl/container/flat_hash_map.h>
//! @endcond

#include "proton/pka/encoder.h"
#include "proton/pka/errors.h"
#include "proton/pka/vocabulary.h"

namespace proton {
constexpr int kDatasetFormatVersion = 1;

/**
 * @brief An ordered, validated sequence of samples.
 */
class Dataset {
public:
  using const_iterator = std::vector<ReactionSample>::const_iterator;

  Dataset() = default;

  const std::string &vocabulary_version() const { return vocab_version_; }

  int size() const { return static_cast<int>(samples_.size()); }

  bool empty() const { return samples_.empty(); }

  const ReactionSample &operator[](int i) const { return samples_[i]; }

  const_iterator begin() const { return samples_.begin(); }
  const_iterator end() const { return samples_.end(); }

  const std::vector<ReactionSample> &samples() const { return samples_; }

private:
  friend IntegrityError assemble_dataset(Dataset &dataset,
                                         std::vector<ReactionSample> samples,
                                         const Vocabulary &vocab);

  std::string vocab_version_;
  std::vector<ReactionSample> samples_;
};

/**
 * @brief Check the shape of a sample's graph pair.
 *
 * The protonated graph must have exactly one more node (a hydrogen, last)
 * and one more edge (between the reaction center and that hydrogen) than the
 * deprotonated graph, and all edges must be stored once with `src < dst`.
 */
extern bool check_sample_shape(const ReactionSample &sample);

/**
 * @brief Check all dataset invariants.
 * @return The first violation found, or IntegrityError::kNone.
 */
extern IntegrityError check_integrity(const std::vector<ReactionSample> &samples,
                                      const Vocabulary &vocab);

/**
 * @brief Validate the samples and build a dataset.
 *
 * @param dataset Receives the dataset. Unchanged on failure.
 * @param samples The samples, in dataset order.
 * @param vocab The vocabulary the samples were encoded with.
 * @return IntegrityError::kNone on success, or the violated invariant.
 */
extern IntegrityError assemble_dataset(Dataset &dataset,
                                       std::vector<ReactionSample> samples,
                                       const Vocabulary &vocab);

/**
 * @brief Serialize a dataset.
 * @param out The string to append to.
 */
extern void write_dataset(std::string &out, const Dataset &dataset);

/**
 * @brief Deserialize and validate a dataset.
 * @param dataset Receives the dataset. Unchanged on failure.
 * @param is The stream to read from.
 * @return Whether the dataset could be read and passed validation.
 */
extern bool read_dataset(Dataset &dataset, std::istream &is);

/**
 * @brief Write a dataset to a file, atomically.
 *
 * The dataset is written to `<path>.tmp` first and renamed to `path` on
 * success, so a failed write never leaves a partial dataset at `path`.
 */
extern bool save_dataset(const Dataset &dataset,
                         const std::filesystem::path &path);

extern bool load_dataset(Dataset &dataset, const std::filesystem::path &path);

/**
 * @brief Randomly split sample indices into training and validation sets.
 *
 * @param train Receives round(size * ratio) indices.
 * @param validation Receives the remaining indices.
 * @param size Number of samples.
 * @param ratio Fraction of training samples. Must be in (0, 1).
 * @param seed Random seed; the same seed always gives the same split.
 * @return Whether the ratio is valid.
 */
extern bool split_dataset(std::vector<int> &train, std::vector<int> &validation,
                          int size, double ratio, int seed = 42);

/**
 * @brief Partition `0..n-1` into `k` consecutive slices.
 *
 * Each slice has `n / k` indices; the first `n % k` slices get one more.
 */
extern std::vector<std::vector<int>> slice_indices(int n, int k);

/**
 * @brief Select one slice for validation and the rest for training.
 * @return false if the fold is out of range.
 */
extern bool cross_validation_fold(std::vector<int> &train,
                                  std::vector<int> &validation,
                                  const std::vector<std::vector<int>> &slices,
                                  int fold);

/**
 * @brief Map each source molecule to the indices of its samples.
 */
extern absl::flat_hash_map<std::string, std::vector<int>>
provenance(const Dataset &dataset);
}  // namespace proton

#endif /* PROTON_PKA_DATASET_H_ */
