//
// Project ProtonKit - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef PROTON_CORE_CANONICAL_H_
#define PROTON_CORE_CANONICAL_H_

//! @cond
#include <algorithm>
#include <string>
#include <utility>
#include <vector>
//! @endcond

#include "proton/eigen_config.h"
#include "proton/core/molecule.h"

namespace proton {
/**
 * @brief Heavy-atom view of a molecule.
 *
 * Foldable hydrogens (see Molecule::is_foldable_hydrogen()) are removed from
 * the graph and counted on their heavy neighbor. All other atoms, including
 * hydrogens that cannot be folded, become nodes of the view. Nodes are
 * ordered by their index in the molecule.
 */
class HeavyAtomGraph {
public:
  struct Edge {
    int dst;
    int bid;
  };

  explicit HeavyAtomGraph(const Molecule &mol);

  const Molecule &mol() const { return *mol_; }

  int size() const { return static_cast<int>(atoms_.size()); }

  /**
   * @brief Get the molecule index of a node.
   */
  int atom_id(int node) const { return atoms_[node]; }

  /**
   * @brief Get the node index of a molecule atom.
   * @return The node index, or -1 if the atom is a folded hydrogen.
   */
  int node_id(int atom) const { return index_[atom]; }

  const AtomData &data(int node) const { return mol_->atom(atoms_[node]); }

  /**
   * @brief Total hydrogens of the node (implicit + folded explicit).
   */
  int hydrogens(int node) const { return hydrogens_[node]; }

  const std::vector<Edge> &edges(int node) const { return adj_[node]; }

  int degree(int node) const { return static_cast<int>(adj_[node].size()); }

  /**
   * @brief Find the explicit hydrogen atom bonded to the node, if any.
   * @return The molecule index of the last explicit hydrogen neighbor of the
   *         node, or -1 if the node has only implicit hydrogens.
   */
  int last_explicit_hydrogen(int node) const;

private:
  const Molecule *mol_;
  std::vector<int> atoms_;
  ArrayXi index_;
  std::vector<int> hydrogens_;
  std::vector<std::vector<Edge>> adj_;
};

namespace internal {
  /**
   * @brief Assign dense, order-preserving ranks to keys.
   * @return Rank of each key; equal keys get the same rank and ranks are
   *         numbered by the sorted order of the distinct keys.
   */
  template <class T>
  std::vector<int> dense_ranks(const std::vector<T> &keys) {
    std::vector<T> sorted(keys);
    std::sort(sorted.begin(), sorted.end());
    sorted.erase(std::unique(sorted.begin(), sorted.end()), sorted.end());

    std::vector<int> ranks(keys.size());
    for (size_t i = 0; i < keys.size(); ++i) {
      ranks[i] = static_cast<int>(
          std::lower_bound(sorted.begin(), sorted.end(), keys[i])
          - sorted.begin());
    }
    return ranks;
  }

  /**
   * @brief Whether the atom is aromatic or has a double bond in a ring.
   */
  extern bool ring_pi_atom(const Molecule &mol, int atom);

  /**
   * @brief Class of a bond for identity comparison.
   *
   * Aromatic bonds and ring bonds between two atoms that both participate in
   * a ring pi system share one class, so that Kekule and aromatic drawings of
   * the same ring compare equal. Other bonds are classified by their order.
   */
  extern int bond_class(const Molecule &mol, int bid);

  constexpr int kConjugatedRingBond = 10;
}  // namespace internal

using LabeledAdjacency = std::vector<std::vector<std::pair<int, int>>>;

/**
 * @brief Iteratively refine node ranks by neighborhood.
 *
 * @param adj Adjacency list; each entry is (neighbor, edge label).
 * @param ranks Initial ranks. Must be canonical (i.e., derived from sorted
 *        node invariants) for the result to be canonical.
 * @return Refined ranks. Two nodes share a rank iff they could not be
 *         distinguished by iterated (rank, sorted neighbor (label, rank))
 *         signatures.
 */
extern std::vector<int> refine_ranks(const LabeledAdjacency &adj,
                                     std::vector<int> ranks);

/**
 * @brief Compute a canonical node order of a labeled graph.
 *
 * Ties left by refine_ranks() are broken by individualizing each member of
 * the first tied class and refining again; the leaf with the smallest
 * encoded adjacency wins.
 *
 * @param adj Adjacency list; each entry is (neighbor, edge label).
 * @param ranks Initial ranks, derived from sorted node invariants.
 * @return A permutation; node i is placed at position result[i].
 */
extern std::vector<int> canonical_ranks(const LabeledAdjacency &adj,
                                        const std::vector<int> &ranks);

/**
 * @brief Compute a protonation-invariant canonical structure key.
 *
 * @param mol The molecule. Ring membership must be up to date
 *        (Molecule::update_topology()).
 * @return A string key, the canonically ordered heavy-atom adjacency with
 *         ring membership of each bond. Two molecules that differ only in
 *         atom order, in explicit vs implicit hydrogens, in Kekule vs
 *         aromatic ring drawing, or in the protonation state of their
 *         ionizable sites get the same key. Distinct heavy-atom graphs always
 *         get distinct keys.
 */
extern std::string canonical_key(const Molecule &mol);
}  // namespace proton

#endif /* PROTON_CORE_CANONICAL_H_ */
