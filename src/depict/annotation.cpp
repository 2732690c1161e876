//
// Project MolUtil - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "molutil/depict/annotation.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <absl/algorithm/container.h>
#include <absl/log/absl_log.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/ascii.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>
#include <absl/strings/str_split.h>
#include <absl/strings/string_view.h>

#include "molutil/core/color.h"
#include "molutil/engine/structure.h"

namespace molutil {
std::optional<int> try_resolve_atom(const Structure &mol, const AtomRef &ref) {
  if (ref.position < 1 || ref.position > mol.num_atoms()) {
    ABSL_VLOG(1) << "Atom position " << ref.position << " out of range [1, "
                 << mol.num_atoms() << "]; ignoring";
    return std::nullopt;
  }

  const int idx = ref.position - 1;
  if (mol.atom_symbol(idx) != ref.element) {
    ABSL_VLOG(1) << "Element mismatch at atom " << ref.position
                 << ": expected " << ref.element << ", got "
                 << mol.atom_symbol(idx) << "; ignoring";
    return std::nullopt;
  }

  return idx;
}

std::optional<std::pair<int, int>> try_resolve_bond(const Structure &mol,
                                                    const BondRef &ref) {
  std::optional<int> src = try_resolve_atom(mol, ref.src),
                     dst = try_resolve_atom(mol, ref.dst);
  if (!src || !dst)
    return std::nullopt;

  if (!mol.has_bond(*src, *dst)) {
    ABSL_VLOG(1) << "No bond between atoms " << ref.src.position << " and "
                 << ref.dst.position << "; ignoring";
    return std::nullopt;
  }

  return std::make_pair(*src, *dst);
}

void DepictionAnnotations::add_label(int atom, std::string text, Color color) {
  auto it = absl::c_find_if(
      labels_, [atom](const ResolvedLabel &label) { return label.atom == atom; });
  if (it != labels_.end()) {
    it->text = std::move(text);
    it->color = color;
    return;
  }

  labels_.push_back({ atom, std::move(text), color });
}

std::optional<Color> DepictionAnnotations::atom_color(int atom) const {
  const int set = atom_set(atom);
  if (set == 0)
    return std::nullopt;
  return atom_set_color(set);
}

std::optional<Color> DepictionAnnotations::bond_color(int src, int dst) const {
  const int set = bond_set(src, dst);
  if (set == 0)
    return std::nullopt;
  return bond_set_color(set);
}

DepictionAnnotations
resolve_annotations(const Structure &mol, const std::vector<AtomLabel> &labels,
                    const std::vector<AtomSet> &atom_sets,
                    const std::vector<BondSet> &bond_sets) {
  DepictionAnnotations annot(mol.num_atoms());

  for (const AtomLabel &label: labels) {
    if (label.text.empty())
      continue;

    std::optional<int> atom = try_resolve_atom(mol, label.atom);
    if (atom)
      annot.add_label(*atom, label.text, label.color);
  }

  for (const AtomSet &atom_set: atom_sets) {
    const int set = annot.add_atom_set(atom_set.color);

    for (const AtomRef &ref: atom_set.atoms) {
      std::optional<int> atom = try_resolve_atom(mol, ref);
      if (atom)
        annot.assign_atom(*atom, set);
    }
  }

  for (const BondSet &bond_set: bond_sets) {
    const int set = annot.add_bond_set(bond_set.color);

    for (const BondRef &ref: bond_set.bonds) {
      std::optional<std::pair<int, int>> bond = try_resolve_bond(mol, ref);
      if (bond)
        annot.assign_bond(bond->first, bond->second, set);
    }
  }

  return annot;
}

namespace {
absl::Status invalid_spec(std::string_view what, std::string_view str) {
  return absl::InvalidArgumentError(
      absl::StrCat("Invalid ", what, " \"", str, "\""));
}

absl::StatusOr<Color> parse_spec_color(std::string_view what,
                                       std::string_view str,
                                       std::string_view color) {
  std::optional<Color> ret = Color::parse(color);
  if (!ret)
    return invalid_spec(what, str);
  return *ret;
}

absl::StatusOr<BondRef> parse_bond_ref(std::string_view str) {
  std::vector<std::string_view> atoms = absl::StrSplit(str, '-');
  if (atoms.size() != 2)
    return invalid_spec("bond reference", str);

  absl::StatusOr<AtomRef> src = parse_atom_ref(atoms[0]);
  if (!src.ok())
    return src.status();

  absl::StatusOr<AtomRef> dst = parse_atom_ref(atoms[1]);
  if (!dst.ok())
    return dst.status();

  return BondRef { *std::move(src), *std::move(dst) };
}

// Splits "members@color"
absl::StatusOr<std::pair<std::vector<std::string_view>, Color>>
split_set(std::string_view what, std::string_view str) {
  const std::size_t at = str.rfind('@');
  if (at == std::string_view::npos)
    return invalid_spec(what, str);

  absl::StatusOr<Color> color =
      parse_spec_color(what, str, str.substr(at + 1));
  if (!color.ok())
    return color.status();

  std::vector<std::string_view> members =
      absl::StrSplit(str.substr(0, at), ',', absl::SkipWhitespace());
  return std::make_pair(std::move(members), *color);
}
}  // namespace

absl::StatusOr<AtomRef> parse_atom_ref(std::string_view str) {
  std::pair<std::string_view, std::string_view> parts =
      absl::StrSplit(str, absl::MaxSplits(':', 1));

  AtomRef ref;
  if (!absl::SimpleAtoi(parts.first, &ref.position))
    return invalid_spec("atom reference", str);

  ref.element = std::string(absl::StripAsciiWhitespace(parts.second));
  return ref;
}

absl::StatusOr<AtomLabel> parse_atom_label(std::string_view str) {
  std::vector<std::string_view> parts = absl::StrSplit(str, ':');
  if (parts.size() < 4)
    return invalid_spec("atom label", str);

  absl::StatusOr<Color> color = parse_spec_color("atom label", str,
                                                 parts.back());
  if (!color.ok())
    return color.status();

  AtomLabel label;
  if (!absl::SimpleAtoi(parts[0], &label.atom.position))
    return invalid_spec("atom label", str);

  label.atom.element = std::string(absl::StripAsciiWhitespace(parts[1]));
  label.text = absl::StrJoin(parts.begin() + 2, parts.end() - 1, ":");
  label.color = *color;
  return label;
}

absl::StatusOr<AtomSet> parse_atom_set(std::string_view str) {
  auto members = split_set("atom set", str);
  if (!members.ok())
    return members.status();

  AtomSet set;
  set.color = members->second;
  for (std::string_view member: members->first) {
    absl::StatusOr<AtomRef> ref = parse_atom_ref(member);
    if (!ref.ok())
      return ref.status();
    set.atoms.push_back(*std::move(ref));
  }
  return set;
}

absl::StatusOr<BondSet> parse_bond_set(std::string_view str) {
  auto members = split_set("bond set", str);
  if (!members.ok())
    return members.status();

  BondSet set;
  set.color = members->second;
  for (std::string_view member: members->first) {
    absl::StatusOr<BondRef> ref = parse_bond_ref(member);
    if (!ref.ok())
      return ref.status();
    set.bonds.push_back(*std::move(ref));
  }
  return set;
}
}  // namespace molutil
