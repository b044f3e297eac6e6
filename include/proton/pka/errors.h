//
// Project ProtonKit - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef PROTON_PKA_ERRORS_H_
#define PROTON_PKA_ERRORS_H_

//! @cond
#include <array>
#include <ostream>
#include <string_view>
//! @endcond

#include "proton/meta.h"

namespace proton {
/**
 * @brief Reason a site is skipped by the record splitter.
 */
enum class SiteError : int {
  kNone = 0,
  kMissingPka,
  kMissingProtonated,
  kMissingDeprotonated,
  kEmptyVariant,
  kMaxValue = kEmptyVariant,
};

/**
 * @brief Reason the atom correspondence of a pair cannot be resolved.
 */
enum class CorrespondenceError : int {
  kNone = 0,
  kHeavyAtomCountMismatch,
  kHydrogenCountMismatch,
  kNoBijection,
  kAmbiguous,
  kExcessDifference,
  kSearchLimit,
  kCenterMismatch,
  kMaxValue = kCenterMismatch,
};

/**
 * @brief Attribute that could not be encoded with the vocabulary.
 */
enum class EncodingError : int {
  kNone = 0,
  kElement,
  kFormalCharge,
  kHybridization,
  kHydrogenCount,
  kBondOrder,
  kMaxValue = kBondOrder,
};

/**
 * @brief Violated dataset invariant. Always fatal.
 */
enum class IntegrityError : int {
  kNone = 0,
  kDuplicateKey,
  kShapeViolation,
  kVocabularyMismatch,
  kMaxValue = kVocabularyMismatch,
};

extern std::string_view to_string(SiteError err);
extern std::string_view to_string(CorrespondenceError err);
extern std::string_view to_string(EncodingError err);
extern std::string_view to_string(IntegrityError err);

inline std::ostream &operator<<(std::ostream &os, SiteError err) {
  return os << to_string(err);
}

inline std::ostream &operator<<(std::ostream &os, CorrespondenceError err) {
  return os << to_string(err);
}

inline std::ostream &operator<<(std::ostream &os, EncodingError err) {
  return os << to_string(err);
}

inline std::ostream &operator<<(std::ostream &os, IntegrityError err) {
  return os << to_string(err);
}

/**
 * @brief Per-reason counts of one error kind.
 *
 * @tparam E The error enum. Must define `kNone = 0` and `kMaxValue`.
 */
template <class E>
class ErrorCounts {
public:
  static constexpr int kSize =
      static_cast<internal::underlying_type_t<E>>(E::kMaxValue) + 1;

  void add(E err, int count = 1) { counts_[index(err)] += count; }

  int count(E err) const { return counts_[index(err)]; }

  /**
   * @brief Total count of all reasons except `E::kNone`.
   */
  int total() const {
    int sum = 0;
    for (int i = 1; i < kSize; ++i)
      sum += counts_[i];
    return sum;
  }

  ErrorCounts &operator+=(const ErrorCounts &other) {
    for (int i = 0; i < kSize; ++i)
      counts_[i] += other.counts_[i];
    return *this;
  }

  template <class Func>
  void for_each(Func &&func) const {
    for (int i = 1; i < kSize; ++i)
      func(static_cast<E>(i), counts_[i]);
  }

private:
  static int index(E err) { return static_cast<int>(err); }

  std::array<int, kSize> counts_ {};
};
}  // namespace proton

#endif /* PROTON_PKA_ERRORS_H_ */
