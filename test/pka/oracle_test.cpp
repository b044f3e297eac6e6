//
// Project ProtonKit - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "proton/pka/oracle.h"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

#include <unistd.h>

#include <absl/container/flat_hash_set.h>
#include <absl/strings/str_cat.h>

#include <gtest/gtest.h>

#include "test_utils.h"
#include "proton/core/molecule.h"
#include "proton/fmt/sdf.h"
#include "proton/pka/record.h"

namespace proton {
namespace {
TEST(MakeConjugateTest, ImplicitHydrogens) {
  Molecule acid = internal::acetic_acid();

  Molecule base;
  ASSERT_TRUE(make_conjugate(base, acid, 3, false));
  EXPECT_EQ(base.num_atoms(), 4);
  EXPECT_EQ(base.atom(3).formal_charge(), -1);
  EXPECT_EQ(base.atom(3).implicit_hydrogens(), 0);
  EXPECT_EQ(base.total_charge(), -1);

  Molecule reprotonated;
  ASSERT_TRUE(make_conjugate(reprotonated, base, 3, true));
  EXPECT_EQ(reprotonated.atom(3).formal_charge(), 0);
  EXPECT_EQ(reprotonated.atom(3).implicit_hydrogens(), 1);

  // No hydrogen left
  Molecule none;
  EXPECT_FALSE(make_conjugate(none, base, 3, false));
  EXPECT_TRUE(none.empty());

  EXPECT_FALSE(make_conjugate(none, acid, 4, false));
  EXPECT_FALSE(make_conjugate(none, acid, -1, true));
}

TEST(MakeConjugateTest, ExplicitHydrogens) {
  Molecule base = internal::read_first(internal::kAcetateExplicitHSdf);
  ASSERT_EQ(base.num_atoms(), 7);

  Molecule acid;
  ASSERT_TRUE(make_conjugate(acid, base, 0, true));
  ASSERT_EQ(acid.num_atoms(), 8);
  EXPECT_EQ(acid.atom(7).atomic_number(), 1);
  EXPECT_NE(acid.find_bond(0, 7), -1);
  EXPECT_EQ(acid.atom(0).formal_charge(), 0);
  EXPECT_EQ(acid.total_hydrogens(0), 1);

  // The added hydrogen is removed again
  Molecule back;
  ASSERT_TRUE(make_conjugate(back, acid, 0, false));
  EXPECT_EQ(back.num_atoms(), 7);
  EXPECT_EQ(back.total_hydrogens(0), 0);

  // Hydrogen atoms are not reaction centers
  EXPECT_FALSE(make_conjugate(back, base, 4, false));
}

TEST(AnnotationOracleTest, AcidAboveReferencePh) {
  Molecule acid = internal::acetic_acid();
  acid.add_prop("pKa", "8.2");

  AnnotationOracle oracle;
  std::vector<SiteAnnotation> sites = oracle.predict(acid);
  ASSERT_EQ(sites.size(), 1);

  const SiteAnnotation &site = sites[0];
  EXPECT_EQ(site.site_id, 0);
  EXPECT_DOUBLE_EQ(site.pka, 8.2);
  EXPECT_EQ(site.reaction_center, 3);
  EXPECT_EQ(site.pka_type, "acidic");

  ASSERT_TRUE(site.protonated);
  ASSERT_TRUE(site.deprotonated);
  EXPECT_EQ(site.protonated->total_charge(), 0);
  EXPECT_EQ(site.deprotonated->total_charge(), -1);
}

TEST(AnnotationOracleTest, BaseBelowReferencePh) {
  Molecule amine = internal::ethylamine();

  AnnotationOracle oracle(12.0);
  std::vector<SiteAnnotation> sites = oracle.predict(amine);
  ASSERT_EQ(sites.size(), 1);

  const SiteAnnotation &site = sites[0];
  EXPECT_DOUBLE_EQ(site.pka, 10.7);
  EXPECT_EQ(site.reaction_center, 2);
  EXPECT_TRUE(site.pka_type.empty());

  ASSERT_TRUE(site.protonated);
  ASSERT_TRUE(site.deprotonated);
  EXPECT_EQ(site.deprotonated->total_charge(), 0);
  EXPECT_EQ(site.protonated->total_charge(), 1);
  EXPECT_EQ(site.protonated->atom(2).implicit_hydrogens(), 3);
}

TEST(AnnotationOracleTest, MultipleSites) {
  Molecule mol = internal::acetic_acid();
  mol.add_prop("pKa", "4.76, 2.1,nan");
  mol.add_prop("marvin_atom", "3 2 0");
  mol.add_prop("marvin_pKa_type", "acidic,acidic,basic");

  AnnotationOracle oracle;
  std::vector<SiteAnnotation> sites = oracle.predict(mol);
  ASSERT_EQ(sites.size(), 3);

  EXPECT_EQ(sites[0].reaction_center, 3);
  EXPECT_TRUE(sites[0].protonated);
  EXPECT_TRUE(sites[0].deprotonated);

  // Carbonyl oxygen has no hydrogen, protonated at pH 7.4
  EXPECT_EQ(sites[1].reaction_center, 2);
  EXPECT_EQ(sites[1].pka_type, "acidic");
  EXPECT_TRUE(sites[1].deprotonated);
  ASSERT_TRUE(sites[1].protonated);
  EXPECT_EQ(sites[1].protonated->atom(2).formal_charge(), 1);

  EXPECT_TRUE(std::isnan(sites[2].pka));
  EXPECT_EQ(sites[2].pka_type, "basic");
  EXPECT_FALSE(sites[2].protonated);
  EXPECT_FALSE(sites[2].deprotonated);
}

TEST(AnnotationOracleTest, MissingAnnotation) {
  AnnotationOracle oracle;
  EXPECT_TRUE(oracle.predict(internal::acetate()).empty());

  // An invalid center leaves the conjugate unresolved
  Molecule mol = internal::acetic_acid();
  mol.add_prop("marvin_atom", "12");
  std::vector<SiteAnnotation> sites = oracle.predict(mol);
  ASSERT_EQ(sites.size(), 1);
  EXPECT_TRUE(sites[0].deprotonated);
  EXPECT_FALSE(sites[0].protonated);
}

class ReadRecordsTest: public ::testing::Test {
protected:
  void SetUp() override {
    path_ = std::filesystem::temp_directory_path()
            / absl::StrCat("proton_read_records_", ::getpid(), ".sdf");
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
  }

  void write(const std::string &data) {
    std::ofstream ofs(path_);
    ofs << data;
  }

  // NOLINTNEXTLINE(readability-identifier-naming)
  std::filesystem::path path_;
};

TEST_F(ReadRecordsTest, GroupConsecutiveEntries) {
  // Second site of acetic acid given as another entry with the same ID
  Molecule second = internal::acetic_acid();
  second.add_prop("pKa", "-6.1");
  second.add_prop("marvin_atom", "2");
  second.add_prop("marvin_pKa_type", "basic");
  std::string second_sdf;
  ASSERT_TRUE(write_sdf(second_sdf, second));

  Molecule anonymous = internal::ethylamine();
  anonymous.name().clear();
  anonymous.props().clear();
  std::string anonymous_sdf;
  ASSERT_TRUE(write_sdf(anonymous_sdf, anonymous));

  write(absl::StrCat(internal::kAceticAcidSdf, second_sdf,
                     internal::kEthylamineSdf, anonymous_sdf,
                     "truncated\n\n$$$$\n"));

  std::vector<MoleculeRecord> records;
  ReadSummary summary;
  AnnotationOracle oracle;
  ASSERT_TRUE(read_records(records, summary, path_, oracle));
  ASSERT_EQ(records.size(), 3);
  EXPECT_EQ(summary.unparsed, 1);
  EXPECT_EQ(summary.renamed, 0);

  EXPECT_EQ(records[0].source_id, "CHEMBL539");
  ASSERT_EQ(records[0].sites.size(), 2);
  EXPECT_EQ(records[0].sites[0].site_id, 0);
  EXPECT_EQ(records[0].sites[1].site_id, 1);
  EXPECT_EQ(records[0].sites[1].reaction_center, 2);
  EXPECT_EQ(records[0].sites[1].pka_type, "basic");

  EXPECT_EQ(records[1].source_id, "CHEMBL14449");
  EXPECT_EQ(records[1].sites.size(), 1);

  EXPECT_EQ(records[2].source_id, "record-3");
  EXPECT_TRUE(records[2].sites.empty());
}

TEST_F(ReadRecordsTest, UniqueSourceIds) {
  Molecule anonymous = internal::ethylamine();
  anonymous.name().clear();
  anonymous.props().clear();
  std::string anonymous_sdf;
  ASSERT_TRUE(write_sdf(anonymous_sdf, anonymous));

  // Same ID again after another entry
  write(absl::StrCat(internal::kAceticAcidSdf, internal::kEthylamineSdf,
                     internal::kAceticAcidSdf, anonymous_sdf));

  std::vector<MoleculeRecord> records;
  ReadSummary summary;
  AnnotationOracle oracle;
  ASSERT_TRUE(read_records(records, summary, path_, oracle));
  ASSERT_EQ(records.size(), 4);
  EXPECT_EQ(records[0].source_id, "CHEMBL539");
  EXPECT_EQ(records[2].source_id, "CHEMBL539#2");
  EXPECT_EQ(records[3].source_id, "record-3");
  EXPECT_EQ(summary.renamed, 1);

  // Second input file with the same entries
  ASSERT_TRUE(read_records(records, summary, path_, oracle));
  ASSERT_EQ(records.size(), 8);
  EXPECT_EQ(records[4].source_id, "CHEMBL539#3");
  EXPECT_EQ(records[5].source_id, "CHEMBL14449#2");
  EXPECT_EQ(records[6].source_id, "CHEMBL539#4");
  EXPECT_EQ(records[7].source_id, "record-3#2");
  EXPECT_EQ(summary.renamed, 5);
  EXPECT_EQ(summary.unparsed, 0);

  absl::flat_hash_set<std::string> ids;
  for (const MoleculeRecord &record: records)
    EXPECT_TRUE(ids.insert(record.source_id).second) << record.source_id;
}

TEST_F(ReadRecordsTest, MissingFile) {
  std::vector<MoleculeRecord> records;
  ReadSummary summary;
  AnnotationOracle oracle;
  EXPECT_FALSE(read_records(records, summary, path_, oracle));
  EXPECT_TRUE(records.empty());
}
}  // namespace
}  // namespace proton
