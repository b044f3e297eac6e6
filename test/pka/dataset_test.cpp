//
// Project ProtonKit - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "proton/pka/dataset.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <numeric>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <unistd.h>

#include <absl/log/absl_check.h>
#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_replace.h>

#include <gtest/gtest.h>

#include "test_utils.h"
#include "proton/core/canonical.h"
#include "proton/pka/encoder.h"
#include "proton/pka/errors.h"
#include "proton/pka/normalizer.h"
#include "proton/pka/record.h"
#include "proton/pka/vocabulary.h"

namespace proton {
namespace {
ReactionSample make_sample(const std::string &source_id, int site_id,
                           double pka) {
  SiteRecord site;
  site.source_id = source_id;
  site.site_id = site_id;
  site.protonated = internal::acetic_acid();
  site.deprotonated = internal::acetate();
  site.parent_key = canonical_key(site.protonated);
  site.pka = pka;
  site.pka_type = "acidic";
  site.reaction_center = 3;

  ReactionDraft draft;
  ABSL_CHECK(normalize_pair(draft, site) == CorrespondenceError::kNone);

  ReactionSample sample;
  ABSL_CHECK(encode_reaction(sample, draft, *find_vocabulary("v1"))
             == EncodingError::kNone);
  return sample;
}

std::vector<ReactionSample> make_samples() {
  return {
    make_sample("CHEMBL539", 0, 4.76),
    make_sample("CHEMBL539", 1, 1.25),
    make_sample("CHEMBL540", 0, 0.1 + 0.2),
  };
}

class DatasetTest: public ::testing::Test {
protected:
  void SetUp() override { vocab_ = find_vocabulary("v1"); }

  // NOLINTNEXTLINE(readability-identifier-naming)
  const Vocabulary *vocab_;
};

TEST_F(DatasetTest, SampleShape) {
  ReactionSample sample = make_sample("a", 0, 1.0);
  EXPECT_TRUE(check_sample_shape(sample));

  ReactionSample bad = sample;
  bad.protonated.nodes.pop_back();
  EXPECT_FALSE(check_sample_shape(bad));

  bad = sample;
  bad.protonated.edges.pop_back();
  EXPECT_FALSE(check_sample_shape(bad));

  bad = sample;
  std::swap(bad.deprotonated.edges[0].src, bad.deprotonated.edges[0].dst);
  EXPECT_FALSE(check_sample_shape(bad));

  // Hydrogen attached to a non-center atom
  bad = sample;
  bad.protonated.edges.back().src = 0;
  EXPECT_FALSE(check_sample_shape(bad));

  bad = sample;
  bad.center = 4;
  EXPECT_FALSE(check_sample_shape(bad));

  bad = sample;
  bad.protonated.nodes.back().atomic_number = 6;
  EXPECT_FALSE(check_sample_shape(bad));
}

TEST_F(DatasetTest, Assemble) {
  Dataset dataset;
  ASSERT_EQ(assemble_dataset(dataset, make_samples(), *vocab_),
            IntegrityError::kNone);
  EXPECT_EQ(dataset.size(), 3);
  EXPECT_EQ(dataset.vocabulary_version(), "v1");
  EXPECT_EQ(dataset[1].site_id, 1);
  EXPECT_DOUBLE_EQ(dataset[1].pka, 1.25);
}

TEST_F(DatasetTest, IntegrityViolations) {
  std::vector<ReactionSample> samples = make_samples();
  samples.push_back(make_sample("CHEMBL539", 1, 3.0));

  Dataset dataset;
  EXPECT_EQ(assemble_dataset(dataset, samples, *vocab_),
            IntegrityError::kDuplicateKey);
  EXPECT_TRUE(dataset.empty());

  samples = make_samples();
  samples[2].deprotonated.nodes.push_back(samples[2].deprotonated.nodes[0]);
  EXPECT_EQ(check_integrity(samples, *vocab_),
            IntegrityError::kShapeViolation);

  samples = make_samples();
  samples[0].deprotonated.nodes[0].formal_charge = 2;
  EXPECT_EQ(check_integrity(samples, *vocab_),
            IntegrityError::kVocabularyMismatch);

  EXPECT_EQ(check_integrity({}, *vocab_), IntegrityError::kNone);
}

TEST_F(DatasetTest, WriteAndRead) {
  Dataset dataset;
  ASSERT_EQ(assemble_dataset(dataset, make_samples(), *vocab_),
            IntegrityError::kNone);

  std::string data;
  write_dataset(data, dataset);
  EXPECT_TRUE(absl::StartsWith(data, "PROTONKIT-DATASET 1\nvocabulary v1\n"
                                     "samples 3\nsample\n"));
  EXPECT_TRUE(absl::StrContains(data, "\nedge 3 4 1 0\n"));

  std::istringstream iss(data);
  Dataset back;
  ASSERT_TRUE(read_dataset(back, iss));
  ASSERT_EQ(back.size(), 3);
  EXPECT_EQ(back.vocabulary_version(), "v1");

  for (int i = 0; i < 3; ++i) {
    const ReactionSample &a = dataset[i], &b = back[i];
    EXPECT_EQ(a.source_id, b.source_id);
    EXPECT_EQ(a.site_id, b.site_id);
    EXPECT_EQ(a.pka, b.pka);
    EXPECT_EQ(a.pka_type, b.pka_type);
    EXPECT_EQ(a.parent_key, b.parent_key);
    EXPECT_EQ(a.center, b.center);
    EXPECT_EQ(a.protonated.nodes, b.protonated.nodes);
    EXPECT_EQ(a.protonated.edges, b.protonated.edges);
    EXPECT_EQ(a.deprotonated.nodes, b.deprotonated.nodes);
    EXPECT_EQ(a.deprotonated.edges, b.deprotonated.edges);
    EXPECT_EQ(a.deprotonated.total_charge, b.deprotonated.total_charge);
  }
}

TEST_F(DatasetTest, ReadInvalid) {
  Dataset dataset;
  ASSERT_EQ(assemble_dataset(dataset, make_samples(), *vocab_),
            IntegrityError::kNone);

  std::string data;
  write_dataset(data, dataset);

  auto read = [](const std::string &str) {
    std::istringstream iss(str);
    Dataset result;
    return read_dataset(result, iss);
  };

  EXPECT_FALSE(read(""));
  EXPECT_FALSE(read(absl::StrReplaceAll(data, { { "DATASET 1", "DATASET 9" } })));
  EXPECT_FALSE(read(absl::StrReplaceAll(data, { { "vocabulary v1", "vocabulary v9" } })));
  EXPECT_FALSE(read(absl::StrReplaceAll(data, { { "samples 3", "samples 4" } })));
  EXPECT_FALSE(read(
      absl::StrReplaceAll(data, { { "samples 3", "samples 2000000000" } })));
  {
    std::string huge = data;
    const size_t pos = huge.find("\ngraph ") + 7;
    huge.replace(pos, huge.find(' ', pos) - pos, "2000000000");
    EXPECT_FALSE(read(huge));
  }
  EXPECT_FALSE(read(absl::StrReplaceAll(data, { { "edge 3 4 1 0", "edge 3 4 1" } })));
  EXPECT_FALSE(read(absl::StrReplaceAll(data, { { "edge 3 4 1 0", "edge 3 4 9 0" } })));
  EXPECT_FALSE(read(data.substr(0, data.size() / 2)));

  // Duplicate key is caught on read
  EXPECT_FALSE(read(absl::StrReplaceAll(data, { { "CHEMBL540", "CHEMBL539" } })));
}

TEST_F(DatasetTest, SaveAndLoad) {
  const std::filesystem::path path =
      std::filesystem::temp_directory_path()
      / absl::StrCat("proton_dataset_", ::getpid(), ".txt");

  Dataset dataset;
  ASSERT_EQ(assemble_dataset(dataset, make_samples(), *vocab_),
            IntegrityError::kNone);
  ASSERT_TRUE(save_dataset(dataset, path));

  std::filesystem::path tmp = path;
  tmp += ".tmp";
  EXPECT_FALSE(std::filesystem::exists(tmp));

  Dataset back;
  ASSERT_TRUE(load_dataset(back, path));
  EXPECT_EQ(back.size(), 3);

  std::error_code ec;
  std::filesystem::remove(path, ec);

  EXPECT_FALSE(load_dataset(back, path));
  EXPECT_FALSE(save_dataset(dataset, path / "not" / "a" / "dir"));
}

TEST(SplitDatasetTest, Deterministic) {
  std::vector<int> train, valid;
  ASSERT_TRUE(split_dataset(train, valid, 10, 0.8, 7));
  EXPECT_EQ(train.size(), 8);
  EXPECT_EQ(valid.size(), 2);

  std::vector<int> all = train;
  all.insert(all.end(), valid.begin(), valid.end());
  std::sort(all.begin(), all.end());
  std::vector<int> expected(10);
  std::iota(expected.begin(), expected.end(), 0);
  EXPECT_EQ(all, expected);

  std::vector<int> train2, valid2;
  ASSERT_TRUE(split_dataset(train2, valid2, 10, 0.8, 7));
  EXPECT_EQ(train, train2);
  EXPECT_EQ(valid, valid2);

  ASSERT_TRUE(split_dataset(train2, valid2, 7, 0.5));
  EXPECT_EQ(train2.size(), 4);
  EXPECT_EQ(valid2.size(), 3);

  EXPECT_FALSE(split_dataset(train2, valid2, 10, 0.0));
  EXPECT_FALSE(split_dataset(train2, valid2, 10, 1.0));
}

TEST(SliceIndicesTest, Remainder) {
  std::vector<std::vector<int>> slices = slice_indices(10, 3);
  ASSERT_EQ(slices.size(), 3);
  EXPECT_EQ(slices[0], (std::vector<int> { 0, 1, 2, 3 }));
  EXPECT_EQ(slices[1], (std::vector<int> { 4, 5, 6 }));
  EXPECT_EQ(slices[2], (std::vector<int> { 7, 8, 9 }));

  slices = slice_indices(2, 4);
  ASSERT_EQ(slices.size(), 4);
  EXPECT_EQ(slices[0].size(), 1);
  EXPECT_EQ(slices[1].size(), 1);
  EXPECT_TRUE(slices[2].empty());

  EXPECT_TRUE(slice_indices(5, 0).empty());
}

TEST(CrossValidationFoldTest, SelectFold) {
  std::vector<std::vector<int>> slices = slice_indices(10, 3);

  std::vector<int> train, valid;
  ASSERT_TRUE(cross_validation_fold(train, valid, slices, 1));
  EXPECT_EQ(valid, (std::vector<int> { 4, 5, 6 }));
  EXPECT_EQ(train, (std::vector<int> { 0, 1, 2, 3, 7, 8, 9 }));

  EXPECT_FALSE(cross_validation_fold(train, valid, slices, 3));
  EXPECT_FALSE(cross_validation_fold(train, valid, slices, -1));
}

TEST_F(DatasetTest, Provenance) {
  Dataset dataset;
  ASSERT_EQ(assemble_dataset(dataset, make_samples(), *vocab_),
            IntegrityError::kNone);

  auto prov = provenance(dataset);
  ASSERT_EQ(prov.size(), 2);
  EXPECT_EQ(prov["CHEMBL539"], (std::vector<int> { 0, 1 }));
  EXPECT_EQ(prov["CHEMBL540"], (std::vector<int> { 2 }));
}
}  // namespace
}  // namespace proton
