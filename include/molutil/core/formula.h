//
// Project MolUtil - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef MOLUTIL_CORE_FORMULA_H_
#define MOLUTIL_CORE_FORMULA_H_

//! @cond
#include <algorithm>
#include <functional>
#include <string>
#include <string_view>

#include <absl/base/attributes.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <boost/container/flat_map.hpp>
//! @endcond

#include "molutil/engine/structure.h"

namespace molutil {
/**
 * @brief An empirical formula: element symbols and (real) coefficients.
 *
 * Elements are kept sorted by symbol. Elements with zero coefficient are never
 * stored; setting a coefficient to zero removes the element.
 */
class EmpiricalFormula {
public:
  using Container = boost::container::flat_map<std::string, double, std::less<>>;
  using const_iterator = Container::const_iterator;

  EmpiricalFormula() = default;

  /**
   * @brief Parse a formula string such as `C6H12O6` or `C1.5H-2`.
   *
   * @param str The formula. Each element symbol is an uppercase letter
   *        optionally followed by a lowercase letter, and is followed by an
   *        optional coefficient (`-?[0-9]+(\.?[0-9]*)?(e[-+]?[0-9]*)?`).
   *        Repeated elements are summed.
   * @return The formula, or an InvalidArgument error if \p str is not a valid
   *         formula.
   */
  static absl::StatusOr<EmpiricalFormula> from_string(std::string_view str);

  /**
   * @brief Get the coefficient of an element.
   * @return The coefficient, or 0 if the element is not in the formula.
   */
  double operator[](std::string_view element) const {
    auto it = data_.find(element);
    return it != data_.end() ? it->second : 0.0;
  }

  /**
   * @brief Set the coefficient of an element.
   *
   * @param element The element symbol (one uppercase letter, optionally
   *        followed by one lowercase letter).
   * @param coefficient The coefficient. 0 removes the element.
   * @return InvalidArgument error if \p element is not a valid symbol.
   */
  ABSL_MUST_USE_RESULT absl::Status set(std::string_view element,
                                        double coefficient);

  bool contains(std::string_view element) const {
    return data_.find(element) != data_.end();
  }

  int size() const { return static_cast<int>(data_.size()); }

  bool empty() const { return data_.empty(); }

  const_iterator begin() const { return data_.begin(); }
  const_iterator end() const { return data_.end(); }

  /**
   * @brief Calculate the molecular weight.
   * @return The sum of the standard atomic weights, or a NotFound error if the
   *         formula contains an unknown element.
   */
  absl::StatusOr<double> molecular_weight() const;

  /**
   * @brief Format the formula.
   *
   * Elements are sorted by symbol. A coefficient of 1 is omitted, and integral
   * coefficients are written without a decimal point.
   */
  std::string to_string() const;

  EmpiricalFormula &operator+=(const EmpiricalFormula &other);
  EmpiricalFormula &operator-=(const EmpiricalFormula &other);
  EmpiricalFormula &operator*=(double quantity);
  EmpiricalFormula &operator/=(double quantity);

private:
  friend EmpiricalFormula formula_of(const Structure &mol);

  void add(std::string_view element, double coefficient);

  Container data_;
};

inline EmpiricalFormula operator+(EmpiricalFormula lhs,
                                  const EmpiricalFormula &rhs) {
  return lhs += rhs;
}

inline EmpiricalFormula operator-(EmpiricalFormula lhs,
                                  const EmpiricalFormula &rhs) {
  return lhs -= rhs;
}

inline EmpiricalFormula operator*(EmpiricalFormula lhs, double quantity) {
  return lhs *= quantity;
}

inline EmpiricalFormula operator*(double quantity, EmpiricalFormula rhs) {
  return rhs *= quantity;
}

inline EmpiricalFormula operator/(EmpiricalFormula lhs, double quantity) {
  return lhs /= quantity;
}

inline bool operator==(const EmpiricalFormula &lhs,
                       const EmpiricalFormula &rhs) {
  return lhs.size() == rhs.size()
         && std::equal(lhs.begin(), lhs.end(), rhs.begin());
}

inline bool operator!=(const EmpiricalFormula &lhs,
                       const EmpiricalFormula &rhs) {
  return !(lhs == rhs);
}

/**
 * @brief Calculate the empirical formula of a structure.
 *
 * Counts all atoms of the structure, and the implicit hydrogens attached to
 * them.
 */
extern EmpiricalFormula formula_of(const Structure &mol);
}  // namespace molutil

#endif /* MOLUTIL_CORE_FORMULA_H_ */
