//
// Project ProtonKit - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "proton/core/element.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include <absl/strings/ascii.h>

namespace proton {
namespace {
// clang-format off
constexpr std::string_view kSymbols[PeriodicTable::kElementCount_] = {
  "*",
  "H",  "He",
  "Li", "Be", "B",  "C",  "N",  "O",  "F",  "Ne",
  "Na", "Mg", "Al", "Si", "P",  "S",  "Cl", "Ar",
  "K",  "Ca", "Sc", "Ti", "V",  "Cr", "Mn", "Fe", "Co", "Ni", "Cu", "Zn",
  "Ga", "Ge", "As", "Se", "Br", "Kr",
  "Rb", "Sr", "Y",  "Zr", "Nb", "Mo", "Tc", "Ru", "Rh", "Pd", "Ag", "Cd",
  "In", "Sn", "Sb", "Te", "I",  "Xe",
  "Cs", "Ba", "La", "Ce", "Pr", "Nd", "Pm", "Sm", "Eu", "Gd", "Tb", "Dy",
  "Ho", "Er", "Tm", "Yb", "Lu", "Hf", "Ta", "W",  "Re", "Os", "Ir", "Pt",
  "Au", "Hg", "Tl", "Pb", "Bi", "Po", "At", "Rn",
  "Fr", "Ra", "Ac", "Th", "Pa", "U",  "Np", "Pu", "Am", "Cm", "Bk", "Cf",
  "Es", "Fm", "Md", "No", "Lr", "Rf", "Db", "Sg", "Bh", "Hs", "Mt", "Ds",
  "Rg", "Cn", "Nh", "Fl", "Mc", "Lv", "Ts", "Og",
};

// First atomic number of each period
constexpr int kPeriodStart[] = { 1, 3, 11, 19, 37, 55, 87, 119 };
// clang-format on

int period_of(int z) {
  int period = 0;
  while (z >= kPeriodStart[period + 1])
    ++period;
  return period + 1;
}

int group_of(int z, int period) {
  const int pos = z - kPeriodStart[period - 1] + 1;

  switch (period) {
  case 1:
    return pos == 1 ? 1 : 18;
  case 2:
  case 3:
    return pos <= 2 ? pos : pos + 10;
  case 4:
  case 5:
    return pos;
  default:
    break;
  }

  if (pos <= 2)
    return pos;
  // Lanthanides & actinides
  if (pos <= 17)
    return 3;
  return pos - 14;
}
}  // namespace

PeriodicTable::PeriodicTable() noexcept {
  size_t bufsz = 0;
  for (std::string_view symbol: kSymbols)
    bufsz += symbol.size() * 2;
  // string_views below point into the buffer, must not reallocate
  symbol_buf_.reserve(bufsz);

  elements_[0].symbol_ = kSymbols[0];
  symbol_to_element_.insert({ kSymbols[0], &elements_[0] });

  for (int z = 1; z < kElementCount_; ++z) {
    Element &elem = elements_[z];
    elem.atomic_number_ = z;
    elem.symbol_ = kSymbols[z];
    elem.period_ = static_cast<std::int16_t>(period_of(z));
    elem.group_ = static_cast<std::int16_t>(group_of(z, elem.period_));
    elem.main_group_ = elem.group_ <= 2 || elem.group_ >= 13;

    int valence = elem.group_;
    if (z == 2) {
      valence = 2;
    } else if (elem.group_ >= 13) {
      valence -= 10;
    }
    elem.valence_electrons_ = static_cast<std::int16_t>(valence);

    symbol_to_element_.insert({ elem.symbol_, &elem });

    if (elem.symbol_.size() == 1)
      continue;

    size_t begin = symbol_buf_.size();
    symbol_buf_.append(absl::AsciiStrToUpper(elem.symbol_));
    std::string_view upper(symbol_buf_.data() + begin, elem.symbol_.size());
    symbol_to_element_.insert({ upper, &elem });

    begin = symbol_buf_.size();
    symbol_buf_.append(absl::AsciiStrToLower(elem.symbol_));
    std::string_view lower(symbol_buf_.data() + begin, elem.symbol_.size());
    symbol_to_element_.insert({ lower, &elem });
  }

  // One-letter symbols in lowercase (aromatic-style input)
  for (int z = 1; z < kElementCount_; ++z) {
    const Element &elem = elements_[z];
    if (elem.symbol_.size() != 1)
      continue;

    size_t begin = symbol_buf_.size();
    symbol_buf_.push_back(absl::ascii_tolower(elem.symbol_[0]));
    symbol_to_element_.insert(
        { std::string_view(symbol_buf_.data() + begin, 1), &elem });
  }
}
}  // namespace proton
