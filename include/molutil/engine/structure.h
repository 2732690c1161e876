//
// Project MolUtil - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef MOLUTIL_ENGINE_STRUCTURE_H_
#define MOLUTIL_ENGINE_STRUCTURE_H_

//! @cond
#include <string_view>
//! @endcond

namespace molutil {
/**
 * @brief A molecule parsed by a chemistry engine.
 *
 * The concrete representation is private to the engine that created it; this
 * interface only exposes what is needed to validate atom and bond references
 * and to count atoms. All atom indices are 0-based.
 *
 * A structure is owned by the operation that parsed it and is never shared
 * between calls.
 */
class Structure {
public:
  Structure() = default;
  Structure(const Structure &) = delete;
  Structure &operator=(const Structure &) = delete;
  Structure(Structure &&) noexcept = default;
  Structure &operator=(Structure &&) noexcept = default;
  virtual ~Structure() noexcept = default;

  /**
   * @brief Get the number of atoms in the structure.
   * @return The number of (explicit) atoms. Implicit hydrogens are not
   *         counted.
   */
  virtual int num_atoms() const = 0;

  /**
   * @brief Get the element symbol of an atom.
   * @param idx The 0-based index of the atom.
   * @return The IUPAC element symbol, e.g. `C` or `Cl`.
   * @pre `0 <= idx < num_atoms()`.
   */
  virtual std::string_view atom_symbol(int idx) const = 0;

  /**
   * @brief Test whether two atoms are directly bonded.
   * @pre Both indices are in range `[0, num_atoms())`.
   */
  virtual bool has_bond(int src, int dst) const = 0;

  /**
   * @brief Get the number of implicit hydrogens attached to an atom.
   * @pre `0 <= idx < num_atoms()`.
   */
  virtual int implicit_hydrogens(int idx) const = 0;

  /**
   * @brief Get the formal charge of an atom.
   * @pre `0 <= idx < num_atoms()`.
   */
  virtual int formal_charge(int idx) const = 0;

  bool empty() const { return num_atoms() == 0; }
};
}  // namespace molutil

#endif /* MOLUTIL_ENGINE_STRUCTURE_H_ */
