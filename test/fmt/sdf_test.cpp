//
// Project ProtonKit - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "proton/fmt/sdf.h"

#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <unistd.h>

#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>

#include <gtest/gtest.h>

#include "fmt_test_common.h"
#include "test_utils.h"
#include "proton/core/element.h"
#include "proton/core/molecule.h"
#include "proton/core/property_map.h"
#include "proton/fmt/base.h"

namespace proton {
namespace {
using SDFTest = internal::StringFormatTest<SDFReader>;

TEST_F(SDFTest, BasicMolecule) {
  set_test_string(R"sdf(L-Alanine
  ABCDEFGH09071717443D
Exported
  6  5  0  0  1  0              3 V2000
   -0.6622    0.5342    0.0000 C   0  0  2  0  0  0
    0.6622   -0.3000    0.0000 C   0  0  0  0  0  0
   -0.7207    2.0817    0.0000 C   1  0  0  0  0  0
   -1.8622   -0.3695    0.0000 N   0  3  0  0  0  0
    0.6220   -1.8037    0.0000 O   0  0  0  0  0  0
    1.9464    0.4244    0.0000 O   0  5  0
  1  2  1  0  0  0
  1  3  1  1  0  0
  1  4  1  0  0  0
  2  5  2  0  0  0
  2  6  1  0  0  0
M  CHG  2   4   1   6  -1
M  ISO  1   3  13
M  END
> 25  <MELTING.POINT>
179.0 - 183.0

> 25  <DESCRIPTION>
PW(W)

$$$$
)sdf");

  PROTON_FMT_TEST_NEXT_MOL("L-Alanine", 6, 5);

  EXPECT_EQ(mol().atom(3).formal_charge(), 1);
  EXPECT_EQ(mol().atom(5).formal_charge(), -1);
  EXPECT_EQ(mol().total_charge(), 0);

  // Implicit hydrogens are guessed from valence
  EXPECT_EQ(mol().atom(0).implicit_hydrogens(), 1);
  EXPECT_EQ(mol().atom(2).implicit_hydrogens(), 3);
  EXPECT_EQ(mol().atom(3).implicit_hydrogens(), 3);
  EXPECT_EQ(mol().atom(4).implicit_hydrogens(), 0);
  EXPECT_EQ(mol().atom(5).implicit_hydrogens(), 0);

  ASSERT_TRUE(mol().has_coords());
  EXPECT_DOUBLE_EQ(mol().coords()(0, 5), 1.9464);
  EXPECT_DOUBLE_EQ(mol().coords()(1, 5), 0.4244);

  EXPECT_EQ(internal::get_key(mol().props(), "MELTING.POINT"),
            "179.0 - 183.0");
  EXPECT_EQ(internal::get_key(mol().props(), "DESCRIPTION"), "PW(W)");
  EXPECT_EQ(internal::get_key(mol().props(), "comment"), "Exported");
}

TEST_F(SDFTest, ExplicitHydrogensAndIsotopes) {
  set_test_string(R"sdf(water
  ProtonKit

  3  2  0  0  0  0  0  0  0  0999 V2000
    0.0000    0.0000    0.0000 O   0  0  0  0  0  0  0  0  0  0  0  0
    0.9572    0.0000    0.0000 H   0  0  0  0  0  0  0  0  0  0  0  0
   -0.2400    0.9266    0.0000 D   0  0  0  0  0  0  0  0  0  0  0  0
  1  2  1  0
  1  3  1  0
M  END
$$$$
)sdf");

  PROTON_FMT_TEST_NEXT_MOL("water", 3, 2);
  EXPECT_EQ(mol().atom(2).atomic_number(), 1);
  EXPECT_EQ(mol().atom(0).implicit_hydrogens(), 0);
  EXPECT_EQ(mol().total_hydrogens(0), 2);
  EXPECT_EQ(mol().count_heavy_atoms(), 1);
}

TEST_F(SDFTest, AromaticBonds) {
  set_test_string(R"sdf(pyridine
  ProtonKit

  6  6  0  0  0  0  0  0  0  0999 V2000
    1.2124    0.7000    0.0000 N   0  0  0  0  0  0  0  0  0  0  0  0
    1.2124   -0.7000    0.0000 C   0  0  0  0  0  0  0  0  0  0  0  0
    0.0000   -1.4000    0.0000 C   0  0  0  0  0  0  0  0  0  0  0  0
   -1.2124   -0.7000    0.0000 C   0  0  0  0  0  0  0  0  0  0  0  0
   -1.2124    0.7000    0.0000 C   0  0  0  0  0  0  0  0  0  0  0  0
    0.0000    1.4000    0.0000 C   0  0  0  0  0  0  0  0  0  0  0  0
  1  2  4  0
  2  3  4  0
  3  4  4  0
  4  5  4  0
  5  6  4  0
  6  1  4  0
M  END
$$$$
)sdf");

  PROTON_FMT_TEST_NEXT_MOL("pyridine", 6, 6);
  for (int i = 0; i < 6; ++i) {
    EXPECT_TRUE(mol().atom(i).is_aromatic()) << i;
    EXPECT_TRUE(mol().atom(i).is_ring_atom()) << i;
    EXPECT_EQ(mol().atom(i).hybridization(), constants::kSP2) << i;
    EXPECT_EQ(mol().bond(i).data.order(), constants::kAromaticBond) << i;
  }
  EXPECT_EQ(mol().atom(0).implicit_hydrogens(), 0);
  EXPECT_EQ(mol().atom(1).implicit_hydrogens(), 1);
}

TEST_F(SDFTest, InvalidBlocks) {
  set_test_string(R"sdf(V3000 molecule
  ProtonKit

  0  0  0     0  0            999 V3000
M  V30 BEGIN CTAB
M  V30 COUNTS 1 0 0 0 0
M  V30 END CTAB
M  END
$$$$
truncated

$$$$
unknown element
  ProtonKit

  1  0  0  0  0  0  0  0  0  0999 V2000
    0.0000    0.0000    0.0000 Qq  0  0  0  0  0  0  0  0  0  0  0  0
M  END
$$$$
)sdf");

  PROTON_FMT_TEST_PARSE_FAIL();
  PROTON_FMT_TEST_PARSE_FAIL();
  PROTON_FMT_TEST_PARSE_FAIL();
}

TEST(SDFWriteTest, WriteAndReadBack) {
  Molecule mol = internal::acetate();
  mol.add_prop("pKa", "4.76");

  std::string sdf = PROTON_WRITE_ONCE(write_sdf, mol);
  ASSERT_FALSE(sdf.empty());

  std::vector<std::string_view> lines = absl::StrSplit(sdf, '\n');
  ASSERT_GE(lines.size(), 11);
  EXPECT_EQ(lines[0], "acetate");
  EXPECT_TRUE(absl::StartsWith(lines[1], "   ProtonKit"));
  EXPECT_TRUE(absl::EndsWith(lines[1], "2D"));
  EXPECT_EQ(lines[3], "  4  3  0  0  0  0  0  0  0  0999 V2000");
  EXPECT_EQ(lines[8], "  1  2  1  0  0  0  0");
  EXPECT_EQ(lines[11], "M  CHG  1   4  -1");
  EXPECT_TRUE(absl::StrContains(sdf, "> <pKa>\n4.76\n\n$$$$\n"));

  Molecule back = internal::read_first(sdf);
  ASSERT_EQ(back.num_atoms(), 4);
  ASSERT_EQ(back.num_bonds(), 3);
  EXPECT_EQ(back.name(), "acetate");
  EXPECT_EQ(back.atom(3).formal_charge(), -1);
  EXPECT_EQ(back.atom(0).implicit_hydrogens(), 3);
  EXPECT_EQ(back.bond(1).data.order(), constants::kDoubleBond);
  EXPECT_EQ(internal::get_key(back.props(), "pKa"), "4.76");
}

TEST_F(SDFTest, ThreeDigitAtomCount) {
  std::string sdf = "wide\n  ProtonKit\n\n";
  absl::StrAppend(&sdf, "100  0  0  0  0  0  0  0  0  0999 V2000\n");
  for (int i = 0; i < 100; ++i)
    absl::StrAppend(&sdf, "    0.0000    0.0000    0.0000 C   0  0  0  0\n");
  absl::StrAppend(&sdf, "M  END\n$$$$\n");
  set_test_string(sdf);

  PROTON_FMT_TEST_NEXT_MOL("wide", 100, 0);
  EXPECT_EQ(mol().atom(99).implicit_hydrogens(), 4);
}

TEST(ReadMoleculesTest, CountUnparsedBlocks) {
  const std::filesystem::path path =
      std::filesystem::temp_directory_path()
      / absl::StrCat("proton_read_molecules_", ::getpid(), ".sdf");
  {
    std::ofstream ofs(path);
    ofs << internal::kAceticAcidSdf << "truncated\n\n$$$$\n"
        << internal::kEthylamineSdf;
  }

  std::vector<Molecule> mols;
  int unparsed = 0;
  EXPECT_TRUE(read_molecules(mols, unparsed, path));
  ASSERT_EQ(mols.size(), 2);
  EXPECT_EQ(mols[0].name(), "acetic acid");
  EXPECT_EQ(mols[1].name(), "ethylamine");
  EXPECT_EQ(unparsed, 1);

  std::error_code ec;
  std::filesystem::remove(path, ec);

  mols.clear();
  EXPECT_FALSE(read_molecules(mols, unparsed, path));
  EXPECT_FALSE(read_molecules(mols, unparsed, "molecules.pdb"));
  EXPECT_TRUE(mols.empty());
  EXPECT_EQ(unparsed, 1);
}

TEST(SDFWriteTest, TooManyAtoms) {
  Molecule mol;
  for (int i = 0; i < 1000; ++i)
    mol.add_atom(AtomData(kPt[6]));

  std::string sdf;
  EXPECT_FALSE(write_sdf(sdf, mol));
  EXPECT_TRUE(sdf.empty());
}
}  // namespace
}  // namespace proton
