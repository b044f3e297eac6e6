//
// Project ProtonKit - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "proton/core/element.h"

#include <vector>

#include <gtest/gtest.h>

namespace {
using proton::Element;
using proton::PeriodicTable;

class PeriodicTableTest: public ::testing::Test {
public:
  // NOLINTNEXTLINE(*-ref-data-members,readability-identifier-naming)
  const PeriodicTable &table_ = proton::kPt;
};

TEST_F(PeriodicTableTest, AtomicNumberTest) {
  for (int i = 0; i < PeriodicTable::kElementCount_; ++i) {
    ASSERT_TRUE(table_.has_element(i));
    const Element &elem = *table_.find_element(i);
    EXPECT_EQ(elem.atomic_number(), i);
    EXPECT_EQ(&table_[i], &elem);
  }

  EXPECT_FALSE(table_.has_element(200));
  EXPECT_FALSE(table_.has_element(-1));
  EXPECT_EQ(table_.find_element(200), nullptr);
}

TEST_F(PeriodicTableTest, SymbolTest) {
  const Element *helium = table_.find_element("He");
  ASSERT_NE(helium, nullptr);
  EXPECT_EQ(helium->atomic_number(), 2);
  EXPECT_EQ(helium->symbol(), "He");

  EXPECT_EQ(table_.find_element("HE"), helium);
  EXPECT_EQ(table_.find_element("he"), helium);

  EXPECT_EQ(table_.find_element("c"), &table_[6]);
  EXPECT_EQ(table_.find_element("Cl"), &table_[17]);
  EXPECT_EQ(table_.find_element("*"), &table_[0]);

  EXPECT_EQ(table_.find_element("Aa"), nullptr);
  EXPECT_EQ(table_.find_element(""), nullptr);
}

TEST_F(PeriodicTableTest, PeriodTest) {
  for (int i = 1; i <= 2; ++i) {
    EXPECT_EQ(table_[i].period(), 1);
  }
  for (int i = 3; i <= 10; ++i) {
    EXPECT_EQ(table_[i].period(), 2);
  }
  for (int i = 11; i <= 18; ++i) {
    EXPECT_EQ(table_[i].period(), 3);
  }
  for (int i = 19; i <= 36; ++i) {
    EXPECT_EQ(table_[i].period(), 4);
  }
  for (int i = 37; i <= 54; ++i) {
    EXPECT_EQ(table_[i].period(), 5);
  }
  for (int i = 55; i <= 86; ++i) {
    EXPECT_EQ(table_[i].period(), 6);
  }
  for (int i = 87; i <= 118; ++i) {
    EXPECT_EQ(table_[i].period(), 7);
  }
}

TEST_F(PeriodicTableTest, GroupTest) {
  auto check_group_for = [&](int group, const std::vector<int> &zs) {
    for (int z: zs) {
      EXPECT_EQ(table_[z].group(), group) << z;
    }
  };

  check_group_for(1, { 1, 3, 11, 19, 37, 55, 87 });
  check_group_for(2, { 4, 12, 20, 38, 56, 88 });
  check_group_for(3, { 21, 39, 57, 64, 71, 89, 103 });
  check_group_for(4, { 22, 40, 72, 104 });
  check_group_for(12, { 30, 48, 80, 112 });
  check_group_for(13, { 5, 13, 31, 49, 81, 113 });
  check_group_for(14, { 6, 14, 32, 50, 82, 114 });
  check_group_for(15, { 7, 15, 33, 51, 83, 115 });
  check_group_for(16, { 8, 16, 34, 52, 84, 116 });
  check_group_for(17, { 9, 17, 35, 53, 85, 117 });
  check_group_for(18, { 2, 10, 18, 36, 54, 86, 118 });
}

TEST_F(PeriodicTableTest, ValenceElectronTest) {
  EXPECT_EQ(table_[1].valence_electrons(), 1);
  EXPECT_EQ(table_[2].valence_electrons(), 2);
  EXPECT_EQ(table_[5].valence_electrons(), 3);
  EXPECT_EQ(table_[6].valence_electrons(), 4);
  EXPECT_EQ(table_[7].valence_electrons(), 5);
  EXPECT_EQ(table_[8].valence_electrons(), 6);
  EXPECT_EQ(table_[9].valence_electrons(), 7);
  EXPECT_EQ(table_[10].valence_electrons(), 8);
  EXPECT_EQ(table_[15].valence_electrons(), 5);
  EXPECT_EQ(table_[16].valence_electrons(), 6);
  EXPECT_EQ(table_[35].valence_electrons(), 7);

  EXPECT_TRUE(table_[6].main_group());
  EXPECT_TRUE(table_[53].main_group());
  EXPECT_FALSE(table_[26].main_group());
  EXPECT_FALSE(table_[0].main_group());
}
}  // namespace
