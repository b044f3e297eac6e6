//
// Project ProtonKit - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//
#ifndef PROTON_CORE_MOLECULE_H_
#define PROTON_CORE_MOLECULE_H_

//! @cond
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <absl/base/optimization.h>
#include <absl/log/absl_check.h>
#include <Eigen/Dense>
//! @endcond

#include "proton/eigen_config.h"
#include "proton/core/element.h"
#include "proton/core/property_map.h"
#include "proton/utils.h"

namespace proton {
namespace constants {
  /**
   * @brief The hybridization state of an atom object.
   */
  enum Hybridization : int {
    kUnbound = 0,   // Unbound
    kTerminal = 1,  // Terminal
    kSP = 2,
    kSP2 = 3,
    kSP3 = 4,
    kSP3D = 5,
    kSP3D2 = 6,
    kOtherHyb = 7,  // Unknown/other
  };

  inline std::ostream &operator<<(std::ostream &os, Hybridization hyb) {
    switch (hyb) {
    case kUnbound:
      return os << "unbound";
    case kTerminal:
      return os << "terminal";
    case kSP:
      return os << "sp";
    case kSP2:
      return os << "sp2";
    case kSP3:
      return os << "sp3";
    case kSP3D:
      return os << "sp3d";
    case kSP3D2:
      return os << "sp3d2";
    case kOtherHyb:
      break;
    }

    return os << "other";
  }

  /**
   * @brief The bond order of a bond object.
   */
  enum BondOrder : int {
    kOtherBond = 0,
    kSingleBond = 1,
    kDoubleBond = 2,
    kTripleBond = 3,
    kQuadrupleBond = 4,
    kAromaticBond = 5,
  };

  inline std::ostream &operator<<(std::ostream &os, BondOrder bo) {
    switch (bo) {
    case kOtherBond:
      break;
    case kSingleBond:
      return os << "single";
    case kDoubleBond:
      return os << "double";
    case kTripleBond:
      return os << "triple";
    case kQuadrupleBond:
      return os << "quadruple";
    case kAromaticBond:
      return os << "aromatic";
    }

    return os << "other";
  }
}  // namespace constants

enum class AtomFlags : std::uint32_t {
  kAromatic = 0x1,
  kRing = 0x2,
};

class AtomData {
public:
  /**
   * @brief Creates a dummy atom with unknown hybridization.
   */
  AtomData(): AtomData(kPt[0]) { }

  explicit AtomData(const Element &element, int implicit_hydrogens = 0,
                    int formal_charge = 0,
                    constants::Hybridization hyb = constants::kOtherHyb,
                    bool is_aromatic = false, bool is_in_ring = false)
      : element_(&element), implicit_hydrogens_(implicit_hydrogens),
        formal_charge_(formal_charge), hyb_(hyb),
        flags_(static_cast<AtomFlags>(0)) {
    set_aromatic(is_aromatic);
    set_ring_atom(is_in_ring);
  }

  int atomic_number() const { return element().atomic_number(); }

  std::string_view element_symbol() const { return element().symbol(); }

  AtomData &set_element(const Element &element) {
    element_ = &element;
    return *this;
  }

  /**
   * @brief Set the element of the atom by atomic number.
   *
   * @param atomic_number The atomic number of the new element.
   * @return *this.
   *
   * @note When the atomic number is out of range, the behavior is undefined.
   */
  AtomData &set_element(int atomic_number) {
    set_element(kPt[atomic_number]);
    return *this;
  }

  const Element &element() const noexcept {
    // GCOV_EXCL_START
    ABSL_ASSUME(element_ != nullptr);
    // GCOV_EXCL_STOP
    return *element_;
  }

  AtomData &set_hybridization(constants::Hybridization hyb) {
    hyb_ = hyb;
    return *this;
  }

  constants::Hybridization hybridization() const { return hyb_; }

  /**
   * @brief Set the number of implicit hydrogen atoms.
   *
   * @param implicit_hydrogens The new number of implicit hydrogen atoms.
   * @return *this.
   *
   * @note If the number of implicit hydrogen atoms is negative, the behavior is
   *       undefined.
   */
  AtomData &set_implicit_hydrogens(int implicit_hydrogens) {
    ABSL_DCHECK(implicit_hydrogens >= 0);
    implicit_hydrogens_ = implicit_hydrogens;
    return *this;
  }

  int implicit_hydrogens() const { return implicit_hydrogens_; }

  AtomData &set_aromatic(bool is_aromatic) {
    internal::update_flag(flags_, is_aromatic, AtomFlags::kAromatic);
    return *this;
  }

  bool is_aromatic() const {
    return internal::check_flag(flags_, AtomFlags::kAromatic);
  }

  AtomData &set_ring_atom(bool is_ring_atom) {
    internal::update_flag(flags_, is_ring_atom, AtomFlags::kRing);
    return *this;
  }

  bool is_ring_atom() const {
    return internal::check_flag(flags_, AtomFlags::kRing);
  }

  AtomFlags flags() const { return flags_; }

  AtomData &set_formal_charge(int charge) {
    formal_charge_ = charge;
    return *this;
  }

  int formal_charge() const { return formal_charge_; }

private:
  friend bool operator==(const AtomData &lhs, const AtomData &rhs) noexcept;

  const Element *element_;
  int implicit_hydrogens_;
  int formal_charge_;
  constants::Hybridization hyb_;
  AtomFlags flags_;
};

inline bool operator==(const AtomData &lhs, const AtomData &rhs) noexcept {
  return lhs.element() == rhs.element()
         && lhs.hybridization() == rhs.hybridization()
         && lhs.flags_ == rhs.flags_
         && lhs.formal_charge() == rhs.formal_charge()
         && lhs.implicit_hydrogens() == rhs.implicit_hydrogens();
}

enum class BondFlags : std::uint32_t {
  kRing = 0x1,
  kAromatic = 0x2,
};

class BondData {
public:
  BondData(): BondData(constants::kOtherBond) { }

  explicit BondData(constants::BondOrder order)
      : order_(order), flags_(static_cast<BondFlags>(0)) { }

  constants::BondOrder order() const { return order_; }

  BondData &set_order(constants::BondOrder order) {
    order_ = order;
    return *this;
  }

  bool is_ring_bond() const {
    return internal::check_flag(flags_, BondFlags::kRing);
  }

  BondData &set_ring_bond(bool ring) {
    internal::update_flag(flags_, ring, BondFlags::kRing);
    return *this;
  }

  bool is_aromatic() const {
    return internal::check_flag(flags_, BondFlags::kAromatic);
  }

  BondData &set_aromatic(bool aromatic) {
    internal::update_flag(flags_, aromatic, BondFlags::kAromatic);
    return *this;
  }

  BondFlags flags() const { return flags_; }

private:
  constants::BondOrder order_;
  BondFlags flags_;
};

/**
 * @brief A molecule with explicit atoms, bonds and SD data items.
 *
 * Atoms and bonds are indexed contiguously from zero. Hydrogens may be stored
 * either as explicit atoms or as the implicit hydrogen count of their heavy
 * atom; total_hydrogens() reports the sum of both.
 */
class Molecule {
public:
  struct Bond {
    int src;
    int dst;
    BondData data;

    int other(int atom) const { return atom == src ? dst : src; }
  };

  struct Neighbor {
    int dst;
    int bid;
  };

  Molecule() = default;

  bool empty() const { return atoms_.empty(); }

  int num_atoms() const { return static_cast<int>(atoms_.size()); }

  int num_bonds() const { return static_cast<int>(bonds_.size()); }

  void clear() noexcept;

  void reserve(int num_atoms);

  void reserve_bonds(int num_bonds) { bonds_.reserve(num_bonds); }

  /**
   * @brief Add an atom to the molecule.
   * @param data The data of the new atom.
   * @return The index of the new atom.
   */
  int add_atom(const AtomData &data);

  /**
   * @brief Add a bond to the molecule.
   * @param src Index of the source atom.
   * @param dst Index of the destination atom.
   * @param data The data of the new bond.
   * @return A pair of (index of the bond, whether the bond was added). If the
   *         bond already exists, the index of the existing bond is returned.
   *         Self loops are rejected and return (-1, false).
   */
  std::pair<int, bool> add_bond(int src, int dst, const BondData &data);

  /**
   * @brief Remove an atom and all bonds incident to it.
   * @param atom Index of the atom to remove.
   * @note Indices of the atoms after \p atom are shifted by one. Bond indices
   *       are compacted while preserving their relative order.
   */
  void erase_atom(int atom);

  AtomData &atom(int i) { return atoms_[i]; }
  const AtomData &atom(int i) const { return atoms_[i]; }

  Bond &bond(int i) { return bonds_[i]; }
  const Bond &bond(int i) const { return bonds_[i]; }

  const std::vector<AtomData> &atoms() const { return atoms_; }

  const std::vector<Bond> &bonds() const { return bonds_; }

  const std::vector<Neighbor> &neighbors(int atom) const {
    return adj_[atom];
  }

  int degree(int atom) const { return static_cast<int>(adj_[atom].size()); }

  /**
   * @brief Find a bond between two atoms.
   * @return Index of the bond, or -1 if the atoms are not bonded.
   */
  int find_bond(int src, int dst) const;

  /**
   * @brief Test whether the atom is a hydrogen that can be folded into the
   *        hydrogen count of its heavy neighbor.
   * @return true if the atom is a neutral hydrogen bonded to exactly one
   *         non-hydrogen atom.
   */
  bool is_foldable_hydrogen(int atom) const;

  /**
   * @brief Count the explicit (foldable) hydrogen neighbors of an atom.
   */
  int explicit_hydrogens(int atom) const;

  /**
   * @brief Count all hydrogens of an atom.
   * @return Sum of implicit hydrogens and explicit hydrogen neighbors.
   */
  int total_hydrogens(int atom) const {
    return atoms_[atom].implicit_hydrogens() + explicit_hydrogens(atom);
  }

  /**
   * @brief Count the atoms of the molecule that are not foldable hydrogens.
   */
  int count_heavy_atoms() const;

  int total_charge() const;

  /**
   * @brief Whether the molecule carries any explicit hydrogen atom.
   */
  bool has_explicit_hydrogens() const;

  std::string &name() { return name_; }
  const std::string &name() const { return name_; }

  template <class KT, class VT>
  void add_prop(KT &&key, VT &&val) {
    internal::set_key(props_, std::forward<KT>(key), std::forward<VT>(val));
  }

  internal::PropertyMap &props() { return props_; }
  const internal::PropertyMap &props() const { return props_; }

  /**
   * @brief Get the coordinates of the atoms.
   * @return A 3 x N matrix, or a 3 x 0 matrix if the molecule has no
   *         coordinates.
   */
  const Matrix3Xd &coords() const { return coords_; }

  /**
   * @brief Set coordinates of the atoms.
   * @pre `coords.cols() == num_atoms()`
   */
  void set_coords(Matrix3Xd coords) {
    ABSL_DCHECK_EQ(coords.cols(), num_atoms());
    coords_ = std::move(coords);
  }

  bool has_coords() const {
    return coords_.cols() > 0 && coords_.cols() == num_atoms();
  }

  int num_fragments() const { return num_fragments_; }

  /**
   * @brief Update ring membership of atoms and bonds.
   *
   * Bonds that are not bridges are ring bonds. Aromatic flags are set from
   * aromatic bonds and cleared on atoms and bonds outside rings.
   */
  void update_topology();

  /**
   * @brief Assign implicit hydrogens of the heavy atoms.
   *
   * The implicit hydrogen count of each main-group atom is set to the common
   * valence of its effective element, minus the total bond order of the atom.
   */
  void guess_hydrogens();

  /**
   * @brief Assign hybridization of all atoms from their steric number.
   */
  void assign_hybridization();

  /**
   * @brief Run update_topology() and assign_hybridization().
   */
  void perceive() {
    update_topology();
    assign_hybridization();
  }

private:
  std::vector<AtomData> atoms_;
  std::vector<Bond> bonds_;
  std::vector<std::vector<Neighbor>> adj_;
  Matrix3Xd coords_ = Matrix3Xd(3, 0);
  std::string name_;
  internal::PropertyMap props_;
  int num_fragments_ = 0;
};

/* Utility functions */

namespace internal {
  inline int common_valence(const Element &effective) {
    const int val_electrons = effective.valence_electrons(),
              common_valence = val_electrons <= 4 ? val_electrons
                                                  : 8 - val_electrons;
    return common_valence;
  }

  /**
   * @brief Get the approximate total bond order of the atom.
   * @param mol The molecule.
   * @param atom Index of the atom.
   * @param implicit_hydrogens Number of implicit hydrogens to add to the total.
   * @return Total bond order of the atom. "Other" bonds count as single bonds.
   */
  extern int sum_bond_order(const Molecule &mol, int atom,
                            int implicit_hydrogens);

  extern int steric_number(int total_degree, int nb_electrons);

  extern constants::Hybridization from_degree(int total_degree,
                                              int nb_electrons);

  extern int nonbonding_electrons(const AtomData &data, int total_valence);
}  // namespace internal

/**
 * @brief Get "effective" element of the atom.
 * @param data Data of the atom.
 * @return "Effective" element of the atom: the returned element has atomic
 *         number of (original atomic number) - (formal charge). If the
 *         resulting atomic number is out of range, returns nullptr.
 */
inline const Element *effective_element(const AtomData &data) {
  const int effective_z = data.atomic_number() - data.formal_charge();
  return kPt.find_element(effective_z);
}
}  // namespace proton

#endif /* PROTON_CORE_MOLECULE_H_ */
