//
// Project ProtonKit - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef PROTON_CORE_ELEMENT_H_
#define PROTON_CORE_ELEMENT_H_

//! @cond
#include <cstdint>
#include <string>
#include <string_view>

#include <absl/container/flat_hash_map.h>
//! @endcond

namespace proton {
/**
 * @brief The class for element data.
 *
 * Only the properties required for valence and hybridization perception are
 * stored. Group numbers follow the IUPAC 1-18 convention; lanthanides and
 * actinides are assigned to group 3.
 */
class Element {
public:
  /**
   * @brief Get the atomic number of the element.
   * @return The atomic number. 0 is reserved for the dummy element.
   */
  constexpr int atomic_number() const noexcept { return atomic_number_; }

  /**
   * @brief Get the number of valence electrons of the element.
   * @return The number of valence electrons. For d-block elements, this is the
   *         group number.
   */
  constexpr int valence_electrons() const noexcept {
    return valence_electrons_;
  }

  constexpr int period() const noexcept { return period_; }

  constexpr int group() const noexcept { return group_; }

  /**
   * @brief Test whether the element is a main-group element.
   * @return true if the element is in group 1, 2, or 13-18 (hydrogen is a
   *         main-group element).
   */
  constexpr bool main_group() const noexcept { return main_group_; }

  /**
   * @brief Get the IUPAC Symbol of the element.
   * @return The IUPAC Symbol, in *Titlecase*.
   */
  constexpr std::string_view symbol() const noexcept { return symbol_; }

private:
  friend class PeriodicTable;

  Element() = default;

  int atomic_number_ = 0;
  std::int16_t valence_electrons_ = 0;
  std::int16_t period_ = 0;
  std::int16_t group_ = 0;
  bool main_group_ = false;
  std::string_view symbol_;
};

constexpr bool operator==(const Element &lhs, const Element &rhs) noexcept {
  return lhs.atomic_number() == rhs.atomic_number();
}

constexpr bool operator!=(const Element &lhs, const Element &rhs) noexcept {
  return lhs.atomic_number() != rhs.atomic_number();
}

/**
 * @brief The periodic table of elements.
 * @note You'd never want to create an instance of this class. Instead, use the
 *       `get()` function to access the singleton instance.
 */
class PeriodicTable final {
public:
  PeriodicTable(const PeriodicTable &) = delete;
  PeriodicTable(PeriodicTable &&) noexcept = delete;
  PeriodicTable &operator=(const PeriodicTable &) = delete;
  PeriodicTable &operator=(PeriodicTable &&) noexcept = delete;

  ~PeriodicTable() noexcept = default;

  /**
   * @brief Get the singleton instance of the periodic table.
   * @return const PeriodicTable & The singleton instance of the periodic table.
   */
  static const PeriodicTable &get() noexcept {
    static const PeriodicTable the_table;

    return the_table;
  }

  /**
   * @brief Get element with the given atomic number.
   *
   * @param atomic_number The atomic number of the element.
   * @return A const reference to the element.
   * @note The behavior is undefined if \p atomic_number is not in range
   *       [0, 118].
   */
  constexpr const Element &operator[](int atomic_number) const noexcept {
    return elements_[atomic_number];
  }

  /**
   * @brief Find element with the given atomic number.
   *
   * @param atomic_number The atomic number of the element.
   * @return A pointer to the element, or `nullptr` if no element with the given
   *         atomic number is known.
   */
  constexpr const Element *find_element(int atomic_number) const noexcept {
    return has_element(atomic_number) ? &elements_[atomic_number] : nullptr;
  }

  /**
   * @brief Find element with the given atomic symbol.
   *
   * @param symbol The atomic symbol of the element.
   * @return A pointer to the element, or `nullptr` if no element with the given
   *         symbol is known.
   * @note The symbol is case-sensitive, but supports three common cases:
   *       Titlecase, UPPERCASE, and lowercase.
   */
  const Element *find_element(std::string_view symbol) const noexcept {
    auto it = symbol_to_element_.find(symbol);
    return it != symbol_to_element_.end() ? it->second : nullptr;
  }

  constexpr static bool has_element(int atomic_number) noexcept {
    return static_cast<unsigned int>(atomic_number)
           < static_cast<unsigned int>(kElementCount_);
  }

  const Element *begin() const noexcept { return elements_; }
  const Element *end() const noexcept { return elements_ + kElementCount_; }

  // 118 elements + dummy
  // NOLINTNEXTLINE(readability-identifier-naming)
  constexpr static int kElementCount_ = 118 + 1;

private:
  PeriodicTable() noexcept;

  Element elements_[kElementCount_];
  std::string symbol_buf_;
  absl::flat_hash_map<std::string_view, const Element *> symbol_to_element_;
};

// NOLINTNEXTLINE(readability-identifier-naming)
static const PeriodicTable &kPt = PeriodicTable::get();
}  // namespace proton

#endif /* PROTON_CORE_ELEMENT_H_ */
