#pragma once
// MIT License
// Copyright 2023--present acefit developers

/**
 * @brief Small ordered table keyed by group label.
 *
 * Groups are reported in the order they were first seen, which a hash map
 * does not give and an ordered map would replace with alphabetical order.
 */

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "acefit/errors.hpp"

namespace acefit {

/**
 * @class GroupedTable
 * @brief Label to value table that remembers insertion order.
 * @tparam T Value type, default constructible.
 */
template <typename T> class GroupedTable {
public:
  using value_type = std::pair<std::string, T>;

  /**
   * @brief Value of a label, created on first access.
   * @param label The group label.
   * @return Reference to the stored value.
   */
  T &operator[](const std::string &label) {
    if (T *found = find(label)) {
      return *found;
    }
    m_items.emplace_back(label, T{});
    return m_items.back().second;
  }

  T *find(std::string_view label) {
    for (auto &item : m_items) {
      if (item.first == label) {
        return &item.second;
      }
    }
    return nullptr;
  }

  const T *find(std::string_view label) const {
    return const_cast<GroupedTable *>(this)->find(label);
  }

  /**
   * @brief Value of an existing label.
   * @param label The group label.
   * @return Reference to the stored value.
   * @throws acefit::Error if the label is unknown.
   */
  const T &at(std::string_view label) const {
    if (const T *found = find(label)) {
      return *found;
    }
    throw Error("unknown group '" + std::string(label) + "'");
  }

  bool contains(std::string_view label) const {
    return find(label) != nullptr;
  }

  std::vector<std::string> labels() const {
    std::vector<std::string> out;
    out.reserve(m_items.size());
    for (const auto &item : m_items) {
      out.push_back(item.first);
    }
    return out;
  }

  const std::vector<value_type> &items() const { return m_items; }
  size_t size() const { return m_items.size(); }
  bool empty() const { return m_items.empty(); }

private:
  std::vector<value_type> m_items; //!< Entries in first-seen order.
};

} // namespace acefit
