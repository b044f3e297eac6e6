//
// Project ProtonKit - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "proton/core/molecule.h"

#include <algorithm>
#include <stack>
#include <utility>
#include <vector>

#include <absl/algorithm/container.h>
#include <absl/container/fixed_array.h>
#include <absl/log/absl_check.h>
#include <absl/log/absl_log.h>

#include "proton/core/element.h"
#include "proton/utils.h"

namespace proton {
void Molecule::clear() noexcept {
  atoms_.clear();
  bonds_.clear();
  adj_.clear();
  coords_.resize(3, 0);
  name_.clear();
  props_.clear();
  num_fragments_ = 0;
}

void Molecule::reserve(int num_atoms) {
  atoms_.reserve(num_atoms);
  adj_.reserve(num_atoms);
}

int Molecule::add_atom(const AtomData &data) {
  const int id = num_atoms();
  atoms_.push_back(data);
  adj_.emplace_back();

  if (coords_.cols() == id && id > 0) {
    coords_.conservativeResize(Eigen::NoChange, id + 1);
    coords_.col(id).setZero();
  }

  return id;
}

std::pair<int, bool> Molecule::add_bond(int src, int dst,
                                        const BondData &data) {
  ABSL_DCHECK(src >= 0 && src < num_atoms());
  ABSL_DCHECK(dst >= 0 && dst < num_atoms());

  if (ABSL_PREDICT_FALSE(src == dst))
    return { -1, false };

  if (int existing = find_bond(src, dst); existing >= 0)
    return { existing, false };

  const int id = num_bonds();
  bonds_.push_back({ src, dst, data });
  adj_[src].push_back({ dst, id });
  adj_[dst].push_back({ src, id });
  return { id, true };
}

void Molecule::erase_atom(int atom) {
  ABSL_DCHECK(atom >= 0 && atom < num_atoms());

  std::vector<Bond> kept;
  kept.reserve(bonds_.size());
  for (const Bond &b: bonds_) {
    if (b.src == atom || b.dst == atom)
      continue;

    Bond &nb = kept.emplace_back(b);
    nb.src -= value_if(nb.src > atom);
    nb.dst -= value_if(nb.dst > atom);
  }

  atoms_.erase(atoms_.begin() + atom);

  if (coords_.cols() == num_atoms() + 1) {
    const int tail = static_cast<int>(coords_.cols()) - atom - 1;
    if (tail > 0)
      coords_.middleCols(atom, tail) = coords_.rightCols(tail).eval();
    coords_.conservativeResize(Eigen::NoChange, coords_.cols() - 1);
  }

  bonds_.swap(kept);
  adj_.assign(atoms_.size(), {});
  for (int i = 0; i < num_bonds(); ++i) {
    adj_[bonds_[i].src].push_back({ bonds_[i].dst, i });
    adj_[bonds_[i].dst].push_back({ bonds_[i].src, i });
  }
}

int Molecule::find_bond(int src, int dst) const {
  // Adjacency lists are short, linear scan is fine
  for (const Neighbor &nei: adj_[src]) {
    if (nei.dst == dst)
      return nei.bid;
  }
  return -1;
}

bool Molecule::is_foldable_hydrogen(int atom) const {
  const AtomData &data = atoms_[atom];
  if (data.atomic_number() != 1 || data.formal_charge() != 0
      || degree(atom) != 1)
    return false;

  return atoms_[adj_[atom][0].dst].atomic_number() != 1;
}

int Molecule::explicit_hydrogens(int atom) const {
  return static_cast<int>(absl::c_count_if(adj_[atom], [&](Neighbor nei) {
    return is_foldable_hydrogen(nei.dst);
  }));
}

int Molecule::count_heavy_atoms() const {
  int count = 0;
  for (int i = 0; i < num_atoms(); ++i)
    count += value_if(!is_foldable_hydrogen(i));
  return count;
}

int Molecule::total_charge() const {
  int charge = 0;
  for (const AtomData &data: atoms_)
    charge += data.formal_charge();
  return charge;
}

bool Molecule::has_explicit_hydrogens() const {
  return absl::c_any_of(atoms_, [](const AtomData &data) {
    return data.atomic_number() == 1;
  });
}

namespace {
  /*
   * Update the ring information of the molecule, returns the number of
   * connected components
   */
  int find_rings_count_connected(
      std::vector<AtomData> &atoms, std::vector<Molecule::Bond> &bonds,
      const std::vector<std::vector<Molecule::Neighbor>> &adj) {
    const int n = static_cast<int>(atoms.size());
    absl::FixedArray<int> ids(n, -1), lows(ids), on_stack(n, 0);
    std::stack<int, std::vector<int>> stk;
    int id = 0;

    auto tarjan = [&](auto &self, const int curr, const int prev) -> void {
      ids[curr] = lows[curr] = id++;
      stk.push(curr);
      on_stack[curr] = 1;

      for (const Molecule::Neighbor &nei: adj[curr]) {
        const int next = nei.dst;
        if (next == prev) {
          continue;
        }

        if (ids[next] == -1) {
          // NOLINTNEXTLINE(readability-suspicious-call-argument)
          self(self, next, curr);

          lows[curr] = std::min(lows[curr], lows[next]);
          if (ids[curr] < lows[next]) {
            continue;
          }
        } else if (on_stack[next] != 0) {
          lows[curr] = std::min(lows[curr], ids[next]);
        }

        // If we get here, we have a ring bond (i.e, not a bridge)
        bonds[nei.bid].data.set_ring_bond(true);
        atoms[curr].set_ring_atom(true);
        atoms[next].set_ring_atom(true);
      }

      if (ids[curr] == lows[curr]) {
        int top;
        do {
          top = stk.top();
          stk.pop();
          on_stack[top] = 0;
          lows[top] = ids[curr];
        } while (top != curr);
      }
    };

    int num_connected = 0;
    for (int i = 0; i < n; ++i) {
      if (ids[i] == -1) {
        ++num_connected;
        tarjan(tarjan, i, -1);
      }
    }

    return num_connected;
  }
}  // namespace

void Molecule::update_topology() {
  for (AtomData &data: atoms_) {
    data.set_ring_atom(false);
  }

  for (Bond &bond: bonds_) {
    bond.data.set_ring_bond(false);
  }

  num_fragments_ = find_rings_count_connected(atoms_, bonds_, adj_);

  for (Bond &bond: bonds_) {
    const bool aromatic = bond.data.is_ring_bond()
                          && (bond.data.order() == constants::kAromaticBond
                              || bond.data.is_aromatic());
    bond.data.set_aromatic(aromatic);
    if (aromatic) {
      atoms_[bond.src].set_aromatic(true);
      atoms_[bond.dst].set_aromatic(true);
    }
  }

  // Fix non-ring aromaticity
  for (AtomData &data: atoms_) {
    if (!data.is_ring_atom()) {
      data.set_aromatic(false);
    }
  }
}

namespace internal {
  int sum_bond_order(const Molecule &mol, const int atom,
                     const int implicit_hydrogens) {
    int sum_order = implicit_hydrogens, num_aromatic = 0, num_multiple_bond = 0;

    for (const Molecule::Neighbor &nei: mol.neighbors(atom)) {
      const constants::BondOrder order = mol.bond(nei.bid).data.order();
      if (order == constants::kAromaticBond) {
        ++num_aromatic;
      } else {
        sum_order += proton::max(order, constants::kSingleBond);
        num_multiple_bond += value_if(order > constants::kSingleBond);
      }
    }

    if (num_aromatic == 0) {
      return sum_order;
    }

    if (num_aromatic == 1) {
      ABSL_LOG(INFO) << "Atom with single aromatic bond; assuming single bond "
                        "for bond order calculation";
      return sum_order + 1;
    }

    ABSL_LOG_IF(WARNING, num_aromatic > 3)
        << "Cannot correctly determine total bond order for aromatic atom "
           "with more than 3 aromatic bonds";

    // 2 aromatic bonds: 1.5 each (benzene); 3 aromatic bonds: 2, 1, 1
    // (naphthalene). Exocyclic multiple bonds take the double bond share.
    sum_order += num_aromatic + 1 - num_multiple_bond;
    return sum_order;
  }

  int nonbonding_electrons(const AtomData &data, const int total_valence) {
    // Must return negative values for chemically invalid combinations
    return data.element().valence_electrons() - total_valence
           - data.formal_charge();
  }

  int steric_number(const int total_degree, const int nb_electrons) {
    const int lone_pairs = nb_electrons / 2;
    return total_degree + lone_pairs + nb_electrons % 2;
  }

  constants::Hybridization from_degree(const int total_degree,
                                       const int nb_electrons) {
    int sn = steric_number(total_degree, nb_electrons);
    return static_cast<constants::Hybridization>(
        proton::min(sn, static_cast<int>(constants::kOtherHyb)));
  }
}  // namespace internal

void Molecule::guess_hydrogens() {
  for (int i = 0; i < num_atoms(); ++i) {
    AtomData &data = atoms_[i];
    if (data.atomic_number() <= 1 || !data.element().main_group()) {
      data.set_implicit_hydrogens(0);
      continue;
    }

    const Element *effective = effective_element(data);
    if (ABSL_PREDICT_FALSE(effective == nullptr)) {
      ABSL_LOG(WARNING)
          << "Unexpected atomic number & formal charge combination: "
          << data.atomic_number() << ", " << data.formal_charge();
      data.set_implicit_hydrogens(0);
      continue;
    }

    const int cv = internal::common_valence(*effective),
              sum_bo = internal::sum_bond_order(*this, i, 0);
    data.set_implicit_hydrogens(nonnegative(cv - sum_bo));
  }
}

void Molecule::assign_hybridization() {
  for (int i = 0; i < num_atoms(); ++i) {
    AtomData &data = atoms_[i];

    const int total_degree = degree(i) + data.implicit_hydrogens();
    if (total_degree == 0) {
      data.set_hybridization(constants::kUnbound);
      continue;
    }

    if (!data.element().main_group()) {
      data.set_hybridization(constants::kOtherHyb);
      continue;
    }

    const int sum_bo =
        internal::sum_bond_order(*this, i, data.implicit_hydrogens());
    const int nbe = internal::nonbonding_electrons(data, sum_bo);
    ABSL_LOG_IF(INFO, nbe < 0)
        << "Negative nonbonding electrons for atom " << i << " ("
        << data.element_symbol() << "): " << nbe;

    constants::Hybridization hyb =
        internal::from_degree(total_degree, nonnegative(nbe));
    // Lone pair participates in the aromatic system (e.g. pyrrole N)
    if (data.is_aromatic() && hyb > constants::kSP2)
      hyb = constants::kSP2;

    data.set_hybridization(hyb);
  }
}
}  // namespace proton
