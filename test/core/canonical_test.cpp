//
// Project ProtonKit - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "proton/core/canonical.h"

#include <algorithm>
#include <numeric>
#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "test_utils.h"
#include "proton/core/element.h"
#include "proton/core/molecule.h"

namespace proton {
namespace {
Molecule ethanol() {
  Molecule mol;
  mol.add_atom(AtomData(kPt[6]));
  mol.add_atom(AtomData(kPt[6]));
  mol.add_atom(AtomData(kPt[8]));
  mol.add_bond(0, 1, BondData(constants::kSingleBond));
  mol.add_bond(1, 2, BondData(constants::kSingleBond));
  mol.guess_hydrogens();
  mol.perceive();
  return mol;
}

Molecule dimethyl_ether() {
  Molecule mol;
  mol.add_atom(AtomData(kPt[6]));
  mol.add_atom(AtomData(kPt[8]));
  mol.add_atom(AtomData(kPt[6]));
  mol.add_bond(0, 1, BondData(constants::kSingleBond));
  mol.add_bond(1, 2, BondData(constants::kSingleBond));
  mol.guess_hydrogens();
  mol.perceive();
  return mol;
}

Molecule carbon_skeleton(int num_atoms,
                         const std::vector<std::pair<int, int>> &bonds) {
  Molecule mol;
  for (int i = 0; i < num_atoms; ++i)
    mol.add_atom(AtomData(kPt[6]));
  for (auto [src, dst]: bonds)
    mol.add_bond(src, dst, BondData(constants::kSingleBond));
  mol.guess_hydrogens();
  mol.perceive();
  return mol;
}

TEST(HeavyAtomGraphTest, FoldExplicitHydrogens) {
  Molecule mol = internal::read_first(internal::kAcetateExplicitHSdf);
  ASSERT_EQ(mol.num_atoms(), 7);

  HeavyAtomGraph graph(mol);
  ASSERT_EQ(graph.size(), 4);
  EXPECT_EQ(graph.node_id(4), -1);
  EXPECT_EQ(graph.node_id(3), 3);
  EXPECT_EQ(graph.atom_id(3), 3);
  EXPECT_EQ(graph.hydrogens(3), 3);
  EXPECT_EQ(graph.degree(3), 1);
  EXPECT_EQ(graph.hydrogens(0), 0);
  EXPECT_EQ(graph.last_explicit_hydrogen(3), 6);
  EXPECT_EQ(graph.last_explicit_hydrogen(0), -1);
}

TEST(RefineRanksTest, PathGraph) {
  // 0 - 1 - 2 - 3 - 4, all atoms alike
  LabeledAdjacency adj(5);
  for (int i = 0; i + 1 < 5; ++i) {
    adj[i].push_back({ i + 1, 1 });
    adj[i + 1].push_back({ i, 1 });
  }

  std::vector<int> ranks = refine_ranks(adj, std::vector<int>(5, 0));
  EXPECT_EQ(ranks[0], ranks[4]);
  EXPECT_EQ(ranks[1], ranks[3]);
  EXPECT_NE(ranks[0], ranks[1]);
  EXPECT_NE(ranks[1], ranks[2]);
  EXPECT_NE(ranks[0], ranks[2]);
}

TEST(CanonicalRanksTest, Permutation) {
  // Hexagon, all nodes alike
  LabeledAdjacency adj(6);
  for (int i = 0; i < 6; ++i) {
    adj[i].push_back({ (i + 1) % 6, 1 });
    adj[(i + 1) % 6].push_back({ i, 1 });
  }

  std::vector<int> ranks = canonical_ranks(adj, std::vector<int>(6, 0));
  std::sort(ranks.begin(), ranks.end());
  std::vector<int> expected(6);
  std::iota(expected.begin(), expected.end(), 0);
  EXPECT_EQ(ranks, expected);
}

TEST(CanonicalKeyTest, AtomOrderInvariant) {
  Molecule acid = internal::acetic_acid();
  Molecule base = internal::acetate();
  Molecule base_h = internal::read_first(internal::kAcetateExplicitHSdf);

  const std::string key = canonical_key(base);
  EXPECT_EQ(canonical_key(base_h), key);
  EXPECT_EQ(canonical_key(acid), key);
}

TEST(CanonicalKeyTest, DistinguishIsomers) {
  EXPECT_NE(canonical_key(ethanol()), canonical_key(dimethyl_ether()));
  EXPECT_NE(canonical_key(internal::acetic_acid()),
            canonical_key(internal::ethylamine()));
}

TEST(CanonicalKeyTest, KekuleAromaticEquivalence) {
  Molecule kekule = internal::phenol();
  Molecule aromatic = internal::phenol();
  for (int i = 0; i < 6; ++i)
    aromatic.bond(i).data.set_order(constants::kAromaticBond);
  aromatic.update_topology();

  EXPECT_EQ(canonical_key(kekule), canonical_key(aromatic));

  // Shifted double bonds give the same key
  Molecule shifted = internal::phenol();
  for (int i = 0; i < 6; ++i) {
    shifted.bond(i).data.set_order(i % 2 == 0 ? constants::kSingleBond
                                              : constants::kDoubleBond);
  }
  shifted.update_topology();
  EXPECT_EQ(canonical_key(kekule), canonical_key(shifted));
}
TEST(CanonicalKeyTest, RingMembership) {
  // Decalin and bicyclopentyl share atom invariants and refined colors
  Molecule decalin = carbon_skeleton(
      10, {
        { 0, 1 }, { 1, 2 }, { 2, 3 }, { 3, 4 }, { 4, 5 }, { 5, 0 }, { 0, 6 },
        { 6, 7 }, { 7, 8 }, { 8, 9 }, { 9, 5 }
      });
  Molecule bicyclopentyl = carbon_skeleton(
      10, {
        { 0, 1 }, { 1, 2 }, { 2, 3 }, { 3, 4 }, { 4, 0 }, { 5, 6 }, { 6, 7 },
        { 7, 8 }, { 8, 9 }, { 9, 5 }, { 0, 5 }
      });

  EXPECT_NE(canonical_key(decalin), canonical_key(bicyclopentyl));

  // Renumbered decalin
  Molecule renumbered = carbon_skeleton(
      10, {
        { 9, 8 }, { 8, 7 }, { 7, 6 }, { 6, 5 }, { 5, 4 }, { 4, 9 }, { 9, 3 },
        { 3, 2 }, { 2, 1 }, { 1, 0 }, { 0, 4 }
      });
  EXPECT_EQ(canonical_key(decalin), canonical_key(renumbered));
}

TEST(CanonicalKeyTest, RegularGraphs) {
  // Cyclohexane and two cyclopropanes are not split by color refinement
  Molecule cyclohexane = carbon_skeleton(
      6, {
        { 0, 1 }, { 1, 2 }, { 2, 3 }, { 3, 4 }, { 4, 5 }, { 5, 0 }
      });
  Molecule cyclopropanes = carbon_skeleton(
      6, {
        { 0, 1 }, { 1, 2 }, { 2, 0 }, { 3, 4 }, { 4, 5 }, { 5, 3 }
      });

  EXPECT_NE(canonical_key(cyclohexane), canonical_key(cyclopropanes));

  Molecule shuffled = carbon_skeleton(
      6, {
        { 0, 3 }, { 3, 1 }, { 1, 4 }, { 4, 2 }, { 2, 5 }, { 5, 0 }
      });
  EXPECT_EQ(canonical_key(cyclohexane), canonical_key(shuffled));
}
}  // namespace
}  // namespace proton
