//
// Project ProtonKit - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef PROTON_CORE_PROPERTY_MAP_H_
#define PROTON_CORE_PROPERTY_MAP_H_

//! @cond
#include <functional>
#include <initializer_list>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <boost/container/flat_map.hpp>
//! @endcond

namespace proton {
namespace internal {
  // SD data items keep insertion-independent (sorted) order
  using PropertyMap = boost::container::flat_map<
      std::string, std::string, std::less<>,
      std::vector<std::pair<std::string, std::string>>>;

  template <
      class PT,
      std::enable_if_t<std::is_same_v<PropertyMap, std::decay_t<PT>>, int> = 0>
  auto find_key(PT &props, std::string_view key) {
    return props.find(key);
  }

  template <
      class PT,
      std::enable_if_t<std::is_same_v<PropertyMap, std::decay_t<PT>>, int> = 0>
  bool has_key(PT &props, std::string_view key) {
    return find_key(props, key) != props.end();
  }

  template <
      class PT,
      std::enable_if_t<std::is_same_v<PropertyMap, std::decay_t<PT>>, int> = 0>
  std::string_view get_key(PT &props, std::string_view key) {
    auto it = find_key(props, key);
    if (it == props.end())
      return "";
    return it->second;
  }

  template <
      class PT, class ST,
      std::enable_if_t<std::is_same_v<PropertyMap, std::decay_t<PT>>, int> = 0>
  void set_key(PT &props, std::string_view key, ST &&value) {
    auto it = props.lower_bound(key);

    if (it != props.end() && it->first == key) {
      it->second = std::forward<ST>(value);
    } else {
      props.emplace_hint(it, key, std::forward<ST>(value));
    }
  }

  /**
   * @brief Find the first key present in the property map.
   * @param props The property map.
   * @param keys Candidate keys, in order of preference.
   * @return Iterator to the first matching entry, or `props.end()` if none of
   *         the keys is present.
   */
  template <
      class PT,
      std::enable_if_t<std::is_same_v<PropertyMap, std::decay_t<PT>>, int> = 0>
  auto find_any_key(PT &props, std::initializer_list<std::string_view> keys) {
    for (std::string_view key: keys) {
      auto it = find_key(props, key);
      if (it != props.end())
        return it;
    }
    return props.end();
  }
}  // namespace internal
}  // namespace proton

#endif /* PROTON_CORE_PROPERTY_MAP_H_ */
