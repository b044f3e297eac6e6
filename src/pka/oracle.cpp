//
// Project ProtonKit - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "proton/pka/oracle.h"

#include <cmath>
#include <initializer_list>
#include <limits>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <absl/container/flat_hash_set.h>
#include <absl/log/absl_log.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_replace.h>
#include <absl/strings/str_split.h>
#include <absl/strings/strip.h>

#include "proton/core/element.h"
#include "proton/core/molecule.h"
#include "proton/core/property_map.h"
#include "proton/fmt/base.h"
#include "proton/pka/record.h"
#include "proton/utils.h"

namespace proton {
namespace {
std::vector<std::string_view>
split_values(const internal::PropertyMap &props,
             std::initializer_list<std::string_view> keys) {
  auto it = internal::find_any_key(props, keys);
  if (it == props.end())
    return {};

  return absl::StrSplit(it->second, absl::ByAnyChar(",; \t\r\n"),
                        absl::SkipWhitespace());
}

int last_hydrogen_neighbor(const Molecule &mol, int atom) {
  int hydrogen = -1;
  for (const Molecule::Neighbor &nei: mol.neighbors(atom)) {
    if (mol.is_foldable_hydrogen(nei.dst))
      hydrogen = proton::max(hydrogen, nei.dst);
  }
  return hydrogen;
}
}  // namespace

bool make_conjugate(Molecule &conj, const Molecule &mol, const int atom,
                    const bool protonate) {
  if (atom < 0 || atom >= mol.num_atoms()) {
    ABSL_LOG(INFO) << "Reaction center " << atom << " out of range (molecule "
                   << "has " << mol.num_atoms() << " atoms)";
    return false;
  }

  if (mol.atom(atom).atomic_number() == 1 && mol.is_foldable_hydrogen(atom)) {
    ABSL_LOG(INFO) << "Reaction center " << atom << " is a hydrogen atom";
    return false;
  }

  Molecule result = mol;
  AtomData &center = result.atom(atom);

  if (protonate) {
    center.set_formal_charge(center.formal_charge() + 1);

    if (result.has_explicit_hydrogens()) {
      const int h = result.add_atom(AtomData(kPt[1]));
      result.add_bond(atom, h, BondData(constants::kSingleBond));
    } else {
      center.set_implicit_hydrogens(center.implicit_hydrogens() + 1);
    }
  } else {
    if (result.total_hydrogens(atom) == 0) {
      ABSL_LOG(INFO) << "No hydrogen to remove at reaction center " << atom;
      return false;
    }

    center.set_formal_charge(center.formal_charge() - 1);

    if (const int h = last_hydrogen_neighbor(result, atom); h >= 0) {
      result.erase_atom(h);
    } else {
      center.set_implicit_hydrogens(center.implicit_hydrogens() - 1);
    }
  }

  result.perceive();
  conj = std::move(result);
  return true;
}

std::vector<SiteAnnotation>
AnnotationOracle::predict(const Molecule &mol) const {
  const std::vector<std::string_view> pkas =
      split_values(mol.props(), { "pKa" });
  const std::vector<std::string_view> centers =
      split_values(mol.props(), { "epik_atom", "marvin_atom" });
  const std::vector<std::string_view> types =
      split_values(mol.props(), { "pka_number", "marvin_pKa_type" });

  const size_t num_sites = proton::max(pkas.size(), centers.size());
  ABSL_LOG_IF(WARNING, pkas.size() != centers.size())
      << "Inconsistent site annotation of " << mol.name() << ": "
      << pkas.size() << " pKa values, " << centers.size() << " atoms";

  std::vector<SiteAnnotation> sites(num_sites);
  for (size_t i = 0; i < num_sites; ++i) {
    SiteAnnotation &site = sites[i];
    site.site_id = static_cast<int>(i);

    if (i >= pkas.size() || !absl::SimpleAtod(pkas[i], &site.pka)
        || std::isnan(site.pka)) {
      site.pka = std::numeric_limits<double>::quiet_NaN();
    }

    if (i < types.size()) {
      site.pka_type = std::string(types[i]);
    } else if (types.size() == 1) {
      site.pka_type = std::string(types[0]);
    }

    int center = -1;
    if (i < centers.size() && !absl::SimpleAtoi(centers[i], &center)) {
      ABSL_LOG(WARNING) << "Invalid reaction center: " << centers[i];
      center = -1;
    }
    site.reaction_center = center;

    if (std::isnan(site.pka))
      continue;

    // Above the reference pH, the supplied structure is the acid
    Molecule conj;
    if (site.pka > ph_) {
      site.protonated = mol;
      if (make_conjugate(conj, mol, center, false))
        site.deprotonated = std::move(conj);
    } else {
      site.deprotonated = mol;
      if (make_conjugate(conj, mol, center, true))
        site.protonated = std::move(conj);
    }
  }

  return sites;
}

namespace {
std::string record_source_id(const Molecule &mol, size_t index) {
  std::string_view id = absl::StripAsciiWhitespace(
      internal::get_key(mol.props(), "ID"));
  if (id.empty())
    id = absl::StripAsciiWhitespace(mol.name());
  if (id.empty())
    return absl::StrCat("record-", index);

  return absl::StrReplaceAll(id, { { "\r", "" }, { "\n", " " } });
}
}  // namespace

bool read_records(std::vector<MoleculeRecord> &records,
                  ReadSummary &summary, const std::filesystem::path &path,
                  const ProtonationOracle &oracle) {
  std::vector<Molecule> mols;
  if (!read_molecules(mols, summary.unparsed, path))
    return false;

  absl::flat_hash_set<std::string> taken;
  for (const MoleculeRecord &record: records)
    taken.insert(record.source_id);

  // Consecutive entries of one molecule (same ID) form one record
  const size_t first = records.size();
  std::string last_id;
  for (size_t i = 0; i < mols.size(); ++i) {
    std::string id = record_source_id(mols[i], i);
    std::vector<SiteAnnotation> sites = oracle.predict(mols[i]);

    if (records.size() > first && id == last_id) {
      MoleculeRecord &prev = records.back();
      for (SiteAnnotation &site: sites) {
        site.site_id = static_cast<int>(prev.sites.size());
        prev.sites.push_back(std::move(site));
      }
      continue;
    }

    std::string source_id = id;
    for (int n = 2; taken.contains(source_id); ++n)
      source_id = absl::StrCat(id, "#", n);
    if (source_id != id) {
      ABSL_LOG(WARNING) << "Source id " << id << " of " << path
                        << " is already used; renamed to " << source_id;
      ++summary.renamed;
    }
    taken.insert(source_id);

    MoleculeRecord &record = records.emplace_back();
    record.source_id = std::move(source_id);
    record.mol = std::move(mols[i]);
    record.sites = std::move(sites);
    last_id = std::move(id);
  }

  ABSL_LOG(INFO) << "Read " << records.size() - first << " records from "
                 << path;
  return true;
}
}  // namespace proton
