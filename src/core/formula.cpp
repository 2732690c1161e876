//
// Project MolUtil - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "molutil/core/formula.h"

#include <string>
#include <string_view>

#include <absl/log/absl_log.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/ascii.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <boost/spirit/home/x3.hpp>

#include "molutil/core/element.h"
#include "molutil/engine/structure.h"
#include "molutil/utils.h"

namespace molutil {
namespace {
namespace x3 = boost::spirit::x3;

// NOLINTBEGIN(readability-identifier-naming)
namespace parser {
const auto symbol = x3::raw[x3::ascii::upper >> -x3::ascii::lower];

const auto coefficient =
    x3::raw[-x3::char_('-') >> +x3::digit                     //
            >> -(-x3::char_('.') >> *x3::digit)               //
            >> -(x3::char_('e') >> -x3::char_("+-") >> *x3::digit)];
}  // namespace parser
// NOLINTEND(readability-identifier-naming)

bool is_valid_symbol(std::string_view element) {
  if (element.empty() || element.size() > 2)
    return false;

  if (!absl::ascii_isupper(element[0]))
    return false;

  return element.size() == 1 || absl::ascii_islower(element[1]);
}
}  // namespace

absl::StatusOr<EmpiricalFormula>
EmpiricalFormula::from_string(std::string_view str) {
  EmpiricalFormula formula;

  std::string symbol;
  double coef;

  auto set_symbol = [&](auto &ctx) {
    const auto &range = x3::_attr(ctx);
    symbol.assign(range.begin(), range.end());
    coef = 1;
  };
  auto set_coefficient = [&](auto &ctx) {
    const auto &range = x3::_attr(ctx);
    x3::_pass(ctx) = absl::SimpleAtod(
        std::string_view(&*range.begin(), range.size()), &coef);
  };
  auto add_term = [&](auto & /* ctx */) { formula.add(symbol, coef); };

  const auto term = (parser::symbol[set_symbol]
                     >> -parser::coefficient[set_coefficient])[add_term];

  auto it = str.begin();
  const bool ok = x3::parse(it, str.end(), *term >> x3::eoi);
  if (!ok) {
    ABSL_LOG(WARNING) << "Invalid formula: " << str;
    return absl::InvalidArgumentError(
        absl::StrCat("\"", str, "\" is not a valid formula"));
  }

  return formula;
}

absl::Status EmpiricalFormula::set(std::string_view element,
                                   double coefficient) {
  if (!is_valid_symbol(element)) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Element must be a one or two letter symbol, got \"", element, "\""));
  }

  if (coefficient == 0) {
    data_.erase(std::string(element));
  } else {
    data_.insert_or_assign(std::string(element), coefficient);
  }

  return absl::OkStatus();
}

void EmpiricalFormula::add(std::string_view element, double coefficient) {
  auto it = data_.find(element);
  if (it == data_.end()) {
    if (coefficient != 0)
      data_.emplace(std::string(element), coefficient);
    return;
  }

  it->second += coefficient;
  if (it->second == 0)
    data_.erase(it);
}

absl::StatusOr<double> EmpiricalFormula::molecular_weight() const {
  double mw = 0;

  for (const auto &[element, coefficient]: data_) {
    const Element *elem = kPt.find_element(element);
    if (elem == nullptr) {
      return absl::NotFoundError(absl::StrCat("Unknown element: ", element));
    }

    mw += elem->atomic_weight() * coefficient;
  }

  return mw;
}

std::string EmpiricalFormula::to_string() const {
  std::string ret;

  for (const auto &[element, coefficient]: data_) {
    absl::StrAppend(&ret, element);

    if (coefficient == 1)
      continue;

    if (internal::is_integral(coefficient)) {
      absl::StrAppend(&ret, static_cast<long long>(coefficient));
    } else {
      absl::StrAppend(&ret, coefficient);
    }
  }

  return ret;
}

EmpiricalFormula &EmpiricalFormula::operator+=(const EmpiricalFormula &other) {
  for (const auto &[element, coefficient]: other.data_)
    add(element, coefficient);
  return *this;
}

EmpiricalFormula &EmpiricalFormula::operator-=(const EmpiricalFormula &other) {
  for (const auto &[element, coefficient]: other.data_)
    add(element, -coefficient);
  return *this;
}

EmpiricalFormula &EmpiricalFormula::operator*=(double quantity) {
  if (quantity == 0) {
    data_.clear();
    return *this;
  }

  for (auto &[_, coefficient]: data_)
    coefficient *= quantity;
  return *this;
}

EmpiricalFormula &EmpiricalFormula::operator/=(double quantity) {
  for (auto &[_, coefficient]: data_)
    coefficient /= quantity;
  return *this;
}

EmpiricalFormula formula_of(const Structure &mol) {
  EmpiricalFormula formula;

  int implicit_hydrogens = 0;
  for (int i = 0; i < mol.num_atoms(); ++i) {
    formula.add(mol.atom_symbol(i), 1);
    implicit_hydrogens += mol.implicit_hydrogens(i);
  }
  formula.add("H", implicit_hydrogens);

  return formula;
}
}  // namespace molutil
