//
// Project MolUtil - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef MOLUTIL_CORE_ELEMENT_H_
#define MOLUTIL_CORE_ELEMENT_H_

//! @cond
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

#include <absl/container/flat_hash_map.h>
//! @endcond

namespace molutil {
/**
 * @brief The class for element data.
 *
 * @section atwt-notes About the atomic weights
 *
 * If ranges are specified in the standard atomic weights table for an element,
 * the given value is taken from the abridged table. If no value is specified
 * for an element, the value given is the mass number of the longest-lived
 * isotope of the element. The dummy atom has zero weight.
 *
 * Values were taken from the following references:
 *   - https://ciaaw.org/atomic-weights.htm
 *   - https://ciaaw.org/abridged-atomic-weights.htm
 *   - https://ciaaw.org/radioactive-elements.htm
 */
class Element {
public:
  Element() = delete;
  ~Element() noexcept = default;

  /**
   * @brief Get the atomic number of the atom.
   * @return The atomic number.
   */
  constexpr int atomic_number() const noexcept { return atomic_number_; }

  /**
   * @brief Get the IUPAC Symbol of the atom.
   * @return The IUPAC Symbol.
   */
  constexpr std::string_view symbol() const noexcept { return symbol_; }

  /**
   * @brief Get the IUPAC Name of the atom.
   * @return The IUPAC Name, in *Titlecase*.
   */
  constexpr std::string_view name() const noexcept { return name_; }

  /**
   * @brief Get the atomic weight of the atom.
   * @return The IUPAC standard atomic weight. See \ref atwt-notes "notes" for
   *         more information.
   */
  constexpr double atomic_weight() const noexcept { return atomic_weight_; }

private:
  constexpr Element(int atomic_number, std::string_view symbol,
                    std::string_view name, double atomic_weight) noexcept
      : atomic_number_(atomic_number), symbol_(symbol), name_(name),
        atomic_weight_(atomic_weight) { }

  constexpr Element(const Element &) = default;
  constexpr Element(Element &&) noexcept = default;
  Element &operator=(const Element &) = default;
  Element &operator=(Element &&) = default;

  friend class PeriodicTable;

  int atomic_number_;
  std::string_view symbol_;
  std::string_view name_;
  double atomic_weight_;
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
  const Element *find_element(int atomic_number) const noexcept {
    return has_element(atomic_number) ? &(*this)[atomic_number] : nullptr;
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

  /**
   * @brief Find element with the given name.
   *
   * @param name The atomic name of the element.
   * @return A pointer to the element, or `nullptr` if no element with the given
   *         name is known.
   * @note The name is case-sensitive, but supports three common cases:
   *       Titlecase, UPPERCASE, and lowercase.
   */
  const Element *find_element_of_name(std::string_view name) const noexcept {
    auto it = name_to_element_.find(name);
    return it != name_to_element_.end() ? it->second : nullptr;
  }

  constexpr static bool has_element(int atomic_number) noexcept {
    return static_cast<unsigned int>(atomic_number)
           < static_cast<unsigned int>(kElementCount_);
  }

  bool has_element(std::string_view symbol) const noexcept {
    return symbol_to_element_.contains(symbol);
  }

  bool has_element_of_name(std::string_view name) const noexcept {
    return name_to_element_.contains(name);
  }

  const Element *begin() const noexcept { return elements_; }
  const Element *end() const noexcept { return elements_ + kElementCount_; }

  // 118 elements + dummy
  // NOLINTNEXTLINE(readability-identifier-naming)
  constexpr static int kElementCount_ = 118 + 1;

private:
  PeriodicTable() noexcept;

  template <std::size_t... I>
  explicit PeriodicTable(std::index_sequence<I...> /* unused */) noexcept;

  void register_names(const Element &elem);

  Element elements_[kElementCount_];
  absl::flat_hash_map<std::string, const Element *> symbol_to_element_;
  absl::flat_hash_map<std::string, const Element *> name_to_element_;
};

// NOLINTNEXTLINE(readability-identifier-naming)
static const PeriodicTable &kPt = PeriodicTable::get();
}  // namespace molutil

#endif /* MOLUTIL_CORE_ELEMENT_H_ */
