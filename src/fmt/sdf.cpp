//
// Project ProtonKit - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "proton/fmt/sdf.h"

#include <istream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <absl/log/absl_log.h>
#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>
#include <absl/strings/str_split.h>
#include <absl/strings/strip.h>
#include <absl/time/clock.h>
#include <absl/time/time.h>
#include <boost/fusion/include/std_pair.hpp>
#include <boost/spirit/home/x3.hpp>

#include "proton/eigen_config.h"
#include "proton/core/element.h"
#include "proton/core/molecule.h"
#include "proton/core/property_map.h"
#include "proton/utils.h"

namespace proton {
bool SDFReader::getnext(std::vector<std::string> &block) {
  block.clear();

  std::string line;
  while (std::getline(*is_, line)) {
    if (absl::StripTrailingAsciiWhitespace(line) == "$$$$")
      break;

    block.push_back(std::move(line));
  }

  return !block.empty();
}

namespace {
namespace x3 = boost::spirit::x3;

using Iterator = std::vector<std::string>::const_iterator;

// NOLINTBEGIN(readability-identifier-naming)
namespace parser {
// The first two fields of the counts line are three columns wide and may
// touch each other (e.g. "100101").
const x3::uint_parser<unsigned int, 10, 1, 3> count3 = {};

const auto counts_line = *x3::omit[x3::blank] >> count3 >> *x3::omit[x3::blank]
                         >> count3;

const auto data_header_name =
    x3::omit[*(x3::char_ - '<')] >> '<' >> +(x3::char_ - '>') >> '>';

const auto int_list = *x3::omit[x3::blank] >> x3::int_ % +x3::blank;
}  // namespace parser
// NOLINTEND(readability-identifier-naming)

struct V2000Counts {
  int atoms;
  int bonds;
};

bool read_header(Molecule &mol, V2000Counts &counts, Iterator &it,
                 const Iterator end) {
  if (end - it < 4) {
    ABSL_LOG(WARNING) << "Header block is truncated";
    return false;
  }

  mol.name() = std::string(absl::StripAsciiWhitespace(*it++));
  if (auto stamp = absl::StripTrailingAsciiWhitespace(*it++); !stamp.empty())
    mol.add_prop("stamp", std::string(stamp));
  if (auto comment = absl::StripAsciiWhitespace(*it++); !comment.empty())
    mol.add_prop("comment", std::string(comment));

  std::string_view line = absl::StripTrailingAsciiWhitespace(*it++);
  if (!absl::EndsWith(line, "V2000")) {
    ABSL_LOG(WARNING) << "Only V2000 molfiles are supported: " << line;
    return false;
  }

  std::pair<unsigned int, unsigned int> parsed;
  if (!x3::parse(line.begin(), line.end(), parser::counts_line, parsed)) {
    ABSL_LOG(WARNING) << "Cannot parse counts line: " << line;
    return false;
  }

  counts = { static_cast<int>(parsed.first),
             static_cast<int>(parsed.second) };
  return true;
}

int charge_from_code(int code) {
  // 4 is a doublet radical
  if (code < 1 || code > 7 || code == 4)
    return 0;
  return 4 - code;
}

int code_from_charge(int charge) {
  const int code = 4 - charge;
  return code < 1 || code > 7 || code == 4 ? 0 : code;
}

/*
 * xxxxx.xxxxyyyyy.yyyyzzzzz.zzzz aaaddcccssshhhbbbvvvHHHrrriiimmmnnneee
 *
 * Only the position, symbol (aaa) and charge code (ccc) are read.
 */
bool read_atom_line(Molecule &mol, Vector3d &pos, std::string_view line) {
  for (int i = 0; i < 3; ++i) {
    if (!absl::SimpleAtod(column(line, i * 10, i * 10 + 10), &pos[i])) {
      ABSL_LOG(WARNING) << "Cannot parse atom position: " << line;
      return false;
    }
  }

  const std::string_view symbol = column(line, 31, 34);
  const Element *elem = kPt.find_element(symbol);
  // Deuterium and tritium are read as plain hydrogen
  if (elem == nullptr && (symbol == "D" || symbol == "T"))
    elem = &kPt[1];
  if (elem == nullptr) {
    ABSL_LOG(WARNING) << "Unknown element: " << symbol;
    return false;
  }

  AtomData data(*elem);
  if (int code; absl::SimpleAtoi(column(line, 36, 39), &code) && code != 0) {
    const int charge = charge_from_code(code);
    ABSL_LOG_IF(WARNING, charge == 0)
        << "Ignoring unknown charge code " << code;
    data.set_formal_charge(charge);
  }

  mol.add_atom(data);
  return true;
}

bool bond_from_type(BondData &data, int type) {
  switch (type) {
  case 1:
    data = BondData(constants::kSingleBond);
    return true;
  case 2:
    data = BondData(constants::kDoubleBond);
    return true;
  case 3:
    data = BondData(constants::kTripleBond);
    return true;
  case 4:
    data = BondData(constants::kAromaticBond);
    return true;
  default:
    return false;
  }
}

bool read_bond_line(Molecule &mol, std::string_view line) {
  int src, dst, type;
  if (!absl::SimpleAtoi(column(line, 0, 3), &src)
      || !absl::SimpleAtoi(column(line, 3, 6), &dst)
      || !absl::SimpleAtoi(column(line, 6, 9), &type)) {
    ABSL_LOG(WARNING) << "Cannot parse bond line: " << line;
    return false;
  }

  if (src < 1 || src > mol.num_atoms() || dst < 1 || dst > mol.num_atoms()
      || src == dst) {
    ABSL_LOG(WARNING) << "Invalid bond atoms: " << line;
    return false;
  }

  BondData data;
  if (!bond_from_type(data, type)) {
    ABSL_LOG(WARNING) << "Unsupported bond type " << type;
    return false;
  }

  if (!mol.add_bond(src - 1, dst - 1, data).second) {
    ABSL_LOG(WARNING) << "Duplicate bond " << src << " - " << dst;
    return false;
  }

  return true;
}

// "M  CHG  n aaa vvv ..." replaces the charges of the listed atoms.
void read_charges(Molecule &mol, std::string_view line) {
  std::vector<int> values;
  std::string_view data =
      line.size() > 9 ? line.substr(9) : std::string_view();
  if (!x3::parse(data.begin(), data.end(), parser::int_list, values)
      || values.size() % 2 != 0) {
    ABSL_LOG(WARNING) << "Cannot parse charge line: " << line;
    return;
  }

  for (size_t i = 0; i < values.size(); i += 2) {
    const int atom = values[i] - 1;
    if (atom < 0 || atom >= mol.num_atoms()) {
      ABSL_LOG(WARNING) << "Charge of unknown atom " << values[i];
      continue;
    }
    mol.atom(atom).set_formal_charge(values[i + 1]);
  }
}

// Returns the first line after the property block.
Iterator read_properties(Molecule &mol, Iterator it, const Iterator end) {
  bool charges_seen = false;

  for (; it < end; ++it) {
    std::string_view line = *it;
    if (absl::StartsWith(line, ">"))
      break;

    if (absl::StartsWith(line, "M  END")) {
      ++it;
      break;
    }

    if (absl::StartsWith(line, "M  CHG")) {
      // The first charge line resets the charges of the atom block
      if (!charges_seen) {
        for (int i = 0; i < mol.num_atoms(); ++i)
          mol.atom(i).set_formal_charge(0);
        charges_seen = true;
      }
      read_charges(mol, line);
    } else if (!absl::StripAsciiWhitespace(line).empty()) {
      ABSL_LOG(INFO) << "Ignoring property line: " << line;
    }
  }

  return it;
}

void read_data_items(Molecule &mol, Iterator it, const Iterator end) {
  while (it < end) {
    std::string_view line = *it++;
    if (!absl::StartsWith(line, ">")) {
      ABSL_LOG_IF(INFO, !absl::StripAsciiWhitespace(line).empty())
          << "Skipping unknown line: " << line;
      continue;
    }

    std::string key;
    if (!x3::parse(line.begin(), line.end(), parser::data_header_name, key)) {
      ABSL_LOG(INFO) << "Data header without a name: " << line;
      key = std::string(absl::StripAsciiWhitespace(line.substr(1)));
    }

    std::string value;
    for (; it < end; ++it) {
      std::string_view data = absl::StripTrailingAsciiWhitespace(*it);
      if (data.empty()) {
        ++it;
        break;
      }

      if (!value.empty())
        value.push_back('\n');
      absl::StrAppend(&value, data);
    }

    mol.add_prop(std::move(key), std::move(value));
  }
}
}  // namespace

Molecule read_sdf(const std::vector<std::string> &sdf) {
  Molecule mol;
  V2000Counts counts;

  auto it = sdf.begin();
  const auto end = sdf.end();
  if (!read_header(mol, counts, it, end)) {
    mol.clear();
    return mol;
  }

  if (end - it < counts.atoms + counts.bonds) {
    ABSL_LOG(WARNING) << "Expected " << counts.atoms << " atoms and "
                      << counts.bonds << " bonds, but the block has only "
                      << end - it << " lines left";
    mol.clear();
    return mol;
  }

  mol.reserve(counts.atoms);
  mol.reserve_bonds(counts.bonds);

  Matrix3Xd coords(3, counts.atoms);
  for (int i = 0; i < counts.atoms; ++i, ++it) {
    Vector3d pos;
    if (!read_atom_line(mol, pos, *it)) {
      mol.clear();
      return mol;
    }
    coords.col(i) = pos;
  }

  for (int i = 0; i < counts.bonds; ++i, ++it) {
    if (!read_bond_line(mol, *it)) {
      mol.clear();
      return mol;
    }
  }

  it = read_properties(mol, it, end);
  read_data_items(mol, it, end);

  if (!mol.has_explicit_hydrogens())
    mol.guess_hydrogens();
  mol.set_coords(std::move(coords));
  mol.perceive();

  return mol;
}

namespace {
int bond_type(constants::BondOrder order) {
  if (order == constants::kAromaticBond)
    return 4;
  return proton::clamp(static_cast<int>(order), 1, 3);
}

// One printable line, at most 80 columns
std::string header_line(std::string_view str) {
  std::string line(str.substr(0, str.find_first_of("\r\n")));
  if (line.size() > 80)
    line.resize(80);

  for (char &c: line) {
    if (!absl::ascii_isprint(c))
      c = '?';
  }
  if (absl::StartsWith(line, "$"))
    line[0] = '?';
  return line;
}

// Data values end at the first blank line, so blank lines are dropped
void append_data_item(std::string &out, std::string_view key,
                      std::string_view value) {
  std::string safe_key = header_line(key);
  for (char &c: safe_key) {
    if (c == '<' || c == '>')
      c = '?';
  }
  absl::StrAppend(&out, "> <", safe_key, ">\n");

  for (std::string_view line: absl::StrSplit(value, '\n')) {
    line = absl::StripTrailingAsciiWhitespace(line);
    if (line.empty())
      continue;
    absl::StrAppend(&out, line == "$$$$" ? std::string_view("?$$$") : line,
                    "\n");
  }
  out.push_back('\n');
}

void write_charges(std::string &out, const Molecule &mol) {
  std::vector<std::pair<int, int>> charges;
  for (int i = 0; i < mol.num_atoms(); ++i) {
    if (mol.atom(i).formal_charge() != 0)
      charges.push_back({ i + 1, mol.atom(i).formal_charge() });
  }

  // Eight entries per line
  for (size_t i = 0; i < charges.size(); i += 8) {
    const size_t n = proton::min(charges.size() - i, size_t { 8 });
    absl::StrAppendFormat(&out, "M  CHG%3d", n);
    for (size_t j = i; j < i + n; ++j)
      absl::StrAppendFormat(&out, " %3d %3d", charges[j].first,
                            charges[j].second);
    out.push_back('\n');
  }
}
}  // namespace

bool write_sdf(std::string &out, const Molecule &mol) {
  if (mol.num_atoms() > 999 || mol.num_bonds() > 999) {
    ABSL_LOG(ERROR) << "Cannot write " << mol.name()
                    << " as V2000: more than 999 atoms or bonds";
    return false;
  }

  const bool is_3d =
      mol.has_coords() && (mol.coords().row(2).array() != 0).any();
  absl::StrAppend(
      &out, header_line(mol.name()), "\n", "   ProtonKit",
      absl::FormatTime("%m%d%y%H%M", absl::Now(), absl::UTCTimeZone()),
      is_3d ? "3D" : "2D", "\n",
      header_line(internal::get_key(mol.props(), "comment")), "\n");
  absl::StrAppendFormat(&out, "%3d%3d  0  0  0  0  0  0  0  0999 V2000\n",
                        mol.num_atoms(), mol.num_bonds());

  for (int i = 0; i < mol.num_atoms(); ++i) {
    const Vector3d pos =
        mol.has_coords() ? Vector3d(mol.coords().col(i)) : Vector3d::Zero();
    const AtomData &data = mol.atom(i);
    absl::StrAppendFormat(
        &out, "%10.4f%10.4f%10.4f %-3s 0%3d  0  0  0  0  0  0  0  0  0  0\n",
        pos.x(), pos.y(), pos.z(), data.element_symbol(),
        code_from_charge(data.formal_charge()));
  }

  for (const Molecule::Bond &bond: mol.bonds()) {
    absl::StrAppendFormat(&out, "%3d%3d%3d  0  0  0  0\n", bond.src + 1,
                          bond.dst + 1, bond_type(bond.data.order()));
  }

  write_charges(out, mol);
  absl::StrAppend(&out, "M  END\n");

  for (const auto &[key, value]: mol.props()) {
    if (key != "stamp" && key != "comment")
      append_data_item(out, key, value);
  }

  absl::StrAppend(&out, "$$$$\n");
  return true;
}
}  // namespace proton
