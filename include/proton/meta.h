//
// Project ProtonKit - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef PROTON_META_H_
#define PROTON_META_H_

//! @cond
#include <type_traits>
//! @endcond

namespace proton {
namespace internal {
  template <class T, bool = std::is_enum_v<T>>
  struct underlying_type {
    using type = T;
  };

  // Use of std::underlying_type_t on non-enum types is UB until C++20.
  template <class E>
  struct underlying_type<E, true> {
    using type = std::underlying_type_t<E>;
  };

  template <class T>
  using underlying_type_t = typename underlying_type<T>::type;

  template <class T, bool = std::is_enum_v<T>>
  struct extract_if_enum { };

  template <class T>
  struct extract_if_enum<T, true> {
    using type = std::underlying_type_t<T>;
  };

  template <class T>
  using extract_if_enum_t = typename extract_if_enum<T>::type;
}  // namespace internal
}  // namespace proton

#endif /* PROTON_META_H_ */
