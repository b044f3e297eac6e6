//
// Project ProtonKit - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef PROTON_PKA_VOCABULARY_H_
#define PROTON_PKA_VOCABULARY_H_

//! @cond
#include <string>
#include <string_view>
#include <utility>
#include <vector>
//! @endcond

#include "proton/core/molecule.h"

namespace proton {
/**
 * @brief Finite attribute sets used to encode graphs.
 *
 * Each attribute is encoded as its position in the corresponding list. A
 * vocabulary is immutable once created; use find_vocabulary() to get one of
 * the registered versions.
 */
class Vocabulary {
public:
  Vocabulary(std::string version, std::vector<int> elements,
             std::vector<int> formal_charges,
             std::vector<constants::Hybridization> hybridizations,
             std::vector<int> hydrogen_counts,
             std::vector<constants::BondOrder> bond_orders)
      : version_(std::move(version)), elements_(std::move(elements)),
        formal_charges_(std::move(formal_charges)),
        hybridizations_(std::move(hybridizations)),
        hydrogen_counts_(std::move(hydrogen_counts)),
        bond_orders_(std::move(bond_orders)) { }

  const std::string &version() const { return version_; }

  /**
   * @name Attribute lookup
   * @return Position of the value in the vocabulary, or -1 if the value is
   *         out of vocabulary.
   */
  ///@{
  int element_index(int atomic_number) const {
    return index_of(elements_, atomic_number);
  }

  int formal_charge_index(int charge) const {
    return index_of(formal_charges_, charge);
  }

  int hybridization_index(constants::Hybridization hyb) const {
    return index_of(hybridizations_, hyb);
  }

  int hydrogen_count_index(int count) const {
    return index_of(hydrogen_counts_, count);
  }

  int bond_order_index(constants::BondOrder order) const {
    return index_of(bond_orders_, order);
  }
  ///@}

  const std::vector<int> &elements() const { return elements_; }

  const std::vector<int> &formal_charges() const { return formal_charges_; }

  const std::vector<constants::Hybridization> &hybridizations() const {
    return hybridizations_;
  }

  const std::vector<int> &hydrogen_counts() const { return hydrogen_counts_; }

  const std::vector<constants::BondOrder> &bond_orders() const {
    return bond_orders_;
  }

  /**
   * @brief Width of a node feature row.
   *
   * Layout: element, formal charge, hybridization (one-hot), aromatic, ring
   * (binary), hydrogen count (one-hot), reaction center (binary).
   */
  int num_node_features() const {
    return static_cast<int>(elements_.size() + formal_charges_.size()
                            + hybridizations_.size() + hydrogen_counts_.size())
           + 3;
  }

  /**
   * @brief Width of an edge feature row.
   *
   * Layout: bond order (one-hot), ring (binary).
   */
  int num_edge_features() const {
    return static_cast<int>(bond_orders_.size()) + 1;
  }

private:
  template <class T>
  static int index_of(const std::vector<T> &values, T value) {
    for (int i = 0; i < static_cast<int>(values.size()); ++i) {
      if (values[i] == value)
        return i;
    }
    return -1;
  }

  std::string version_;
  std::vector<int> elements_;
  std::vector<int> formal_charges_;
  std::vector<constants::Hybridization> hybridizations_;
  std::vector<int> hydrogen_counts_;
  std::vector<constants::BondOrder> bond_orders_;
};

/**
 * @brief Find a registered vocabulary.
 * @param version The version string ("v1" or "v2").
 * @return The vocabulary, or nullptr if the version is unknown.
 */
extern const Vocabulary *find_vocabulary(std::string_view version);

/**
 * @brief List all registered vocabulary versions.
 */
extern std::vector<std::string> vocabulary_versions();
}  // namespace proton

#endif /* PROTON_PKA_VOCABULARY_H_ */
