//
// Project ProtonKit - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "proton/core/canonical.h"

#include <algorithm>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include <absl/algorithm/container.h>
#include <absl/log/absl_check.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

#include "proton/core/molecule.h"

namespace proton {
HeavyAtomGraph::HeavyAtomGraph(const Molecule &mol)
    : mol_(&mol), index_(ArrayXi::Constant(mol.num_atoms(), -1)) {
  for (int i = 0; i < mol.num_atoms(); ++i) {
    if (mol.is_foldable_hydrogen(i))
      continue;

    index_[i] = static_cast<int>(atoms_.size());
    atoms_.push_back(i);
  }

  hydrogens_.resize(atoms_.size());
  adj_.resize(atoms_.size());

  for (int node = 0; node < size(); ++node) {
    const int atom = atoms_[node];
    hydrogens_[node] = mol.atom(atom).implicit_hydrogens();

    for (const Molecule::Neighbor &nei: mol.neighbors(atom)) {
      const int dst = index_[nei.dst];
      if (dst < 0) {
        ++hydrogens_[node];
        continue;
      }

      adj_[node].push_back({ dst, nei.bid });
    }
  }
}

int HeavyAtomGraph::last_explicit_hydrogen(int node) const {
  int hydrogen = -1;
  for (const Molecule::Neighbor &nei: mol_->neighbors(atoms_[node])) {
    if (index_[nei.dst] < 0)
      hydrogen = proton::max(hydrogen, nei.dst);
  }
  return hydrogen;
}

namespace internal {
  bool ring_pi_atom(const Molecule &mol, int atom) {
    if (mol.atom(atom).is_aromatic())
      return true;

    return absl::c_any_of(mol.neighbors(atom), [&](Molecule::Neighbor nei) {
      const BondData &bd = mol.bond(nei.bid).data;
      return bd.is_ring_bond()
             && (bd.order() == constants::kDoubleBond
                 || bd.order() == constants::kAromaticBond);
    });
  }

  int bond_class(const Molecule &mol, int bid) {
    const Molecule::Bond &bond = mol.bond(bid);
    const constants::BondOrder order = bond.data.order();

    if (bond.data.is_aromatic() || order == constants::kAromaticBond)
      return kConjugatedRingBond;

    if (bond.data.is_ring_bond()
        && (order == constants::kSingleBond
            || order == constants::kDoubleBond)
        && ring_pi_atom(mol, bond.src) && ring_pi_atom(mol, bond.dst))
      return kConjugatedRingBond;

    return static_cast<int>(order);
  }
}  // namespace internal

std::vector<int> refine_ranks(const LabeledAdjacency &adj,
                              std::vector<int> ranks) {
  ABSL_DCHECK_EQ(adj.size(), ranks.size());

  using Signature = std::pair<int, std::vector<std::pair<int, int>>>;
  std::vector<Signature> sigs(ranks.size());

  std::vector<int> distinct(ranks);
  std::sort(distinct.begin(), distinct.end());
  int num_classes = static_cast<int>(
      std::unique(distinct.begin(), distinct.end()) - distinct.begin());

  while (true) {
    for (size_t i = 0; i < ranks.size(); ++i) {
      sigs[i].first = ranks[i];
      sigs[i].second.clear();
      for (auto [nei, label]: adj[i])
        sigs[i].second.push_back({ label, ranks[nei] });
      std::sort(sigs[i].second.begin(), sigs[i].second.end());
    }

    std::vector<int> next = internal::dense_ranks(sigs);
    const int next_classes =
        next.empty() ? 0 : *absl::c_max_element(next) + 1;
    if (next_classes <= num_classes)
      break;

    num_classes = next_classes;
    ranks.swap(next);
  }

  return ranks;
}

namespace {
  using Invariant = std::tuple<int, int, int>;

  // Upper bound of leaves explored while breaking ties; beyond this, only
  // the first member of each tied class is individualized.
  constexpr int kMaxCanonicalLeaves = 4096;

  int ring_label(const Molecule &mol, int bid) {
    return internal::bond_class(mol, bid) * 2
           + static_cast<int>(mol.bond(bid).data.is_ring_bond());
  }

  class CanonicalSearch {
  public:
    CanonicalSearch(const LabeledAdjacency &adj,
                    const std::vector<Invariant> &invariants)
        : adj_(&adj), invariants_(&invariants) { }

    void search(const std::vector<int> &ranks) {
      const int cell = first_tied_class(ranks);
      if (cell < 0) {
        std::vector<int> code = encode(ranks);
        if (best_.empty() || code < best_code_) {
          best_code_.swap(code);
          best_ = ranks;
        }
        ++leaves_;
        return;
      }

      bool first = true;
      for (int i = 0; i < static_cast<int>(ranks.size()); ++i) {
        if (ranks[i] != cell)
          continue;
        if (!first && leaves_ >= kMaxCanonicalLeaves)
          break;
        first = false;

        search(refine_ranks(*adj_, individualize(ranks, i)));
      }
    }

    const std::vector<int> &best() const { return best_; }

  private:
    static int first_tied_class(const std::vector<int> &ranks) {
      std::vector<int> counts(ranks.size(), 0);
      for (int r: ranks)
        ++counts[r];

      for (int r = 0; r < static_cast<int>(counts.size()); ++r) {
        if (counts[r] > 1)
          return r;
      }
      return -1;
    }

    static std::vector<int> individualize(const std::vector<int> &ranks,
                                          int node) {
      std::vector<int> split(ranks.size());
      for (int i = 0; i < static_cast<int>(ranks.size()); ++i) {
        split[i] = ranks[i] * 2
                   + static_cast<int>(ranks[i] == ranks[node] && i != node);
      }
      return internal::dense_ranks(split);
    }

    // Ranks must be a permutation.
    std::vector<int> encode(const std::vector<int> &ranks) const {
      std::vector<int> order(ranks.size());
      for (int i = 0; i < static_cast<int>(ranks.size()); ++i)
        order[ranks[i]] = i;

      std::vector<int> code;
      std::vector<std::pair<int, int>> nbrs;
      for (int node: order) {
        auto [z, hq, deg] = (*invariants_)[node];
        code.push_back(z);
        code.push_back(hq);
        code.push_back(deg);

        nbrs.clear();
        for (auto [nei, label]: (*adj_)[node])
          nbrs.push_back({ ranks[nei], label });
        std::sort(nbrs.begin(), nbrs.end());
        for (auto [rank, label]: nbrs) {
          code.push_back(rank);
          code.push_back(label);
        }
      }
      return code;
    }

    const LabeledAdjacency *adj_;
    const std::vector<Invariant> *invariants_;
    std::vector<int> best_;
    std::vector<int> best_code_;
    int leaves_ = 0;
  };
}  // namespace

std::vector<int> canonical_ranks(const LabeledAdjacency &adj,
                                 const std::vector<int> &ranks) {
  std::vector<Invariant> invariants(ranks.size());
  for (size_t i = 0; i < ranks.size(); ++i)
    invariants[i] = { ranks[i], 0, 0 };

  CanonicalSearch search(adj, invariants);
  search.search(refine_ranks(adj, ranks));
  return search.best();
}

std::string canonical_key(const Molecule &mol) {
  HeavyAtomGraph graph(mol);

  std::vector<Invariant> invariants(graph.size());
  LabeledAdjacency adj(graph.size());

  for (int i = 0; i < graph.size(); ++i) {
    const AtomData &data = graph.data(i);
    invariants[i] = { data.atomic_number(),
                      graph.hydrogens(i) - data.formal_charge(),
                      graph.degree(i) };

    for (const HeavyAtomGraph::Edge &edge: graph.edges(i))
      adj[i].push_back({ edge.dst, ring_label(mol, edge.bid) });
  }

  CanonicalSearch search(adj, invariants);
  search.search(refine_ranks(adj, internal::dense_ranks(invariants)));
  const std::vector<int> &ranks = search.best();

  std::vector<int> order(graph.size());
  for (int i = 0; i < graph.size(); ++i)
    order[ranks[i]] = i;

  std::vector<std::string> tokens;
  tokens.reserve(graph.size());
  std::vector<std::pair<int, int>> nbrs;
  for (int i: order) {
    nbrs.clear();
    for (auto [nei, label]: adj[i])
      nbrs.push_back({ ranks[nei], label });
    std::sort(nbrs.begin(), nbrs.end());

    auto [z, hq, deg] = invariants[i];
    std::string &token = tokens.emplace_back(absl::StrCat(z, ":", hq, "("));
    for (auto [rank, label]: nbrs) {
      const int cls = label / 2;
      absl::StrAppend(&token, rank,
                      cls == internal::kConjugatedRingBond
                          ? "~"
                          : absl::StrCat(label % 2 != 0 ? "@" : "-", cls));
    }
    token.push_back(')');
  }

  return absl::StrCat(graph.size(), "|", absl::StrJoin(tokens, ";"));
}
}  // namespace proton
