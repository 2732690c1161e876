//
// Project MolUtil - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef MOLUTIL_DEPICT_ANNOTATION_H_
#define MOLUTIL_DEPICT_ANNOTATION_H_

//! @cond
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <absl/container/flat_hash_map.h>
#include <absl/status/statusor.h>
//! @endcond

#include "molutil/core/color.h"
#include "molutil/engine/structure.h"

namespace molutil {
/**
 * @brief A caller-supplied reference to an atom.
 *
 * The reference is only applied if the position is in range and the atom at
 * that position has the expected element symbol. This guards against stale
 * references when atom numbering changed between client and server.
 */
struct AtomRef {
  // 1-based
  int position;
  // Case-sensitive, compared against Structure::atom_symbol()
  std::string element;
};

struct BondRef {
  AtomRef src;
  AtomRef dst;
};

struct AtomLabel {
  AtomRef atom;
  std::string text;
  Color color;
};

struct AtomSet {
  std::vector<AtomRef> atoms;
  Color color;
};

struct BondSet {
  std::vector<BondRef> bonds;
  Color color;
};

/**
 * @brief Resolve an atom reference against a structure.
 *
 * @param mol The structure.
 * @param ref The reference to resolve.
 * @return The 0-based index of the atom, or `std::nullopt` if the position is
 *         out of range or the element symbol does not match.
 */
extern std::optional<int> try_resolve_atom(const Structure &mol,
                                           const AtomRef &ref);

/**
 * @brief Resolve a bond reference against a structure.
 *
 * @param mol The structure.
 * @param ref The reference to resolve.
 * @return The 0-based indices of the two atoms, in reference order, or
 *         `std::nullopt` if either atom reference fails to resolve or the atoms
 *         are not bonded.
 */
extern std::optional<std::pair<int, int>>
try_resolve_bond(const Structure &mol, const BondRef &ref);

struct ResolvedLabel {
  int atom;
  std::string text;
  Color color;
};

/**
 * @brief Annotations applied to a depiction, with all references resolved to
 *        0-based atom indices of a specific structure.
 *
 * Set ids are 1-based; id 0 means that the atom (or bond) is not a member of
 * any set. Every set has an explicit color, even if none of its members
 * resolved.
 */
class DepictionAnnotations {
public:
  DepictionAnnotations() = default;

  explicit DepictionAnnotations(int num_atoms): atom_sets_(num_atoms, 0) { }

  /**
   * @brief Attach a label to an atom. An existing label of the atom is
   *        replaced.
   */
  void add_label(int atom, std::string text, Color color);

  /**
   * @brief Declare a new atom set.
   * @return The 1-based id of the new set.
   */
  int add_atom_set(Color color) {
    atom_set_colors_.push_back(color);
    return static_cast<int>(atom_set_colors_.size());
  }

  /**
   * @brief Declare a new bond set.
   * @return The 1-based id of the new set.
   */
  int add_bond_set(Color color) {
    bond_set_colors_.push_back(color);
    return static_cast<int>(bond_set_colors_.size());
  }

  /**
   * @brief Assign an atom to a set. Overwrites any earlier assignment.
   * @pre \p set is an id returned by add_atom_set().
   */
  void assign_atom(int atom, int set) { atom_sets_[atom] = set; }

  /**
   * @brief Assign a bond to a set. Overwrites any earlier assignment.
   * @pre \p set is an id returned by add_bond_set().
   */
  void assign_bond(int src, int dst, int set) {
    bond_sets_.insert_or_assign(bond_key(src, dst), set);
  }

  const std::vector<ResolvedLabel> &labels() const { return labels_; }

  int num_atom_sets() const { return static_cast<int>(atom_set_colors_.size()); }

  int num_bond_sets() const { return static_cast<int>(bond_set_colors_.size()); }

  int atom_set(int atom) const {
    return atom >= 0 && atom < static_cast<int>(atom_sets_.size())
               ? atom_sets_[atom]
               : 0;
  }

  int bond_set(int src, int dst) const {
    auto it = bond_sets_.find(bond_key(src, dst));
    return it != bond_sets_.end() ? it->second : 0;
  }

  Color atom_set_color(int set) const { return atom_set_colors_[set - 1]; }

  Color bond_set_color(int set) const { return bond_set_colors_[set - 1]; }

  /**
   * @brief Get the color of an atom.
   * @return The color of the set the atom belongs to, or `std::nullopt` if the
   *         atom is not a member of any set.
   */
  std::optional<Color> atom_color(int atom) const;

  /**
   * @brief Get the color of a bond.
   * @return The color of the set the bond belongs to, or `std::nullopt` if the
   *         bond is not a member of any set.
   */
  std::optional<Color> bond_color(int src, int dst) const;

  bool empty() const {
    return labels_.empty() && atom_set_colors_.empty()
           && bond_set_colors_.empty();
  }

private:
  static std::pair<int, int> bond_key(int src, int dst) {
    return src < dst ? std::make_pair(src, dst) : std::make_pair(dst, src);
  }

  std::vector<ResolvedLabel> labels_;
  std::vector<int> atom_sets_;
  absl::flat_hash_map<std::pair<int, int>, int> bond_sets_;
  std::vector<Color> atom_set_colors_;
  std::vector<Color> bond_set_colors_;
};

/**
 * @brief Resolve caller-supplied annotations against a structure.
 *
 * @param mol The structure to annotate.
 * @param labels Atom labels. Labels with empty text are skipped.
 * @param atom_sets Atom sets; the i-th set (0-based) receives id i + 1.
 * @param bond_sets Bond sets; the i-th set (0-based) receives id i + 1.
 * @return The resolved annotations.
 *
 * References that fail to resolve are skipped silently (logged at verbosity
 * level 1). If an atom or bond is referenced by multiple sets, the last set
 * wins.
 */
extern DepictionAnnotations
resolve_annotations(const Structure &mol, const std::vector<AtomLabel> &labels,
                    const std::vector<AtomSet> &atom_sets,
                    const std::vector<BondSet> &bond_sets);

/**
 * @name Text representation
 *
 * Compact text forms of the annotation requests, used by the command-line
 * tool. An atom reference is written `position:element` (e.g. `3:C`), a bond
 * reference `position:element-position:element`. Colors are parsed with
 * Color::parse().
 *
 * All functions return an InvalidArgument error for malformed input.
 */
///@{

extern absl::StatusOr<AtomRef> parse_atom_ref(std::string_view str);

/**
 * @brief Parse an atom label, `position:element:text:color`.
 *
 * The text may contain colons; the color is always the last field.
 */
extern absl::StatusOr<AtomLabel> parse_atom_label(std::string_view str);

/**
 * @brief Parse an atom set, `ref,ref,...@color`.
 */
extern absl::StatusOr<AtomSet> parse_atom_set(std::string_view str);

/**
 * @brief Parse a bond set, `bond,bond,...@color`.
 */
extern absl::StatusOr<BondSet> parse_bond_set(std::string_view str);

///@}
}  // namespace molutil

#endif /* MOLUTIL_DEPICT_ANNOTATION_H_ */
