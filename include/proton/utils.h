//
// Project ProtonKit - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef PROTON_UTILS_H_
#define PROTON_UTILS_H_

//! @cond
#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <string_view>
#include <type_traits>

#include <absl/base/optimization.h>
#include <absl/strings/ascii.h>
//! @endcond

#include "proton/meta.h"

namespace proton {
template <class T, std::enable_if_t<std::is_trivially_copyable_v<T>, int> = 0>
constexpr T min(T a, T b) {
  return std::min(a, b);
}

template <class T, std::enable_if_t<std::is_trivially_copyable_v<T>, int> = 0>
constexpr T max(T a, T b) {
  return std::max(a, b);
}

template <class T, std::enable_if_t<std::is_trivially_copyable_v<T>, int> = 0>
constexpr T clamp(T v, T l, T h) {
  return std::clamp(v, l, h);
}

namespace internal {
  template <class E, class U = extract_if_enum_t<E>>
  constexpr bool check_flag(E flags, E flag) {
    return (static_cast<U>(flags) & static_cast<U>(flag)) != 0;
  }

  template <class E, class U = extract_if_enum_t<E>>
  constexpr E &update_flag(E &flags, bool cond, E flag) {
    U bits = static_cast<U>(flags) & static_cast<U>(~static_cast<U>(flag));
    if (cond)
      bits |= static_cast<U>(flag);
    flags = static_cast<E>(bits);
    return flags;
  }
}  // namespace internal

inline std::string_view extension_no_dot(const std::filesystem::path &ext) {
  const std::string_view ext_view = ext.native();
  if (ABSL_PREDICT_TRUE(!ext_view.empty()))
    return ext_view.substr(1);
  return ext_view;
}

/**
 * @brief Fixed-width field of a line, with surrounding whitespace removed.
 * @return The field in columns [begin, end), or an empty string if the line
 *         is shorter than `begin`.
 */
inline std::string_view column(std::string_view line, std::size_t begin,
                               std::size_t end) {
  if (ABSL_PREDICT_FALSE(begin >= line.size()))
    return {};
  return absl::StripAsciiWhitespace(line.substr(begin, end - begin));
}

template <class T = int, std::enable_if_t<std::is_arithmetic_v<T>, int> = 0>
constexpr T value_if(bool cond, T val = 1) {
  return static_cast<int>(cond) * val;
}

template <class Scalar, std::enable_if_t<std::is_signed_v<Scalar>, int> = 0>
constexpr Scalar nonnegative(Scalar x) {
  return proton::max(x, static_cast<Scalar>(0));
}
}  // namespace proton

#endif /* PROTON_UTILS_H_ */
