//
// Project MolUtil - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "molutil/depict/annotation.h"

#include <optional>
#include <utility>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <gtest/gtest.h>

#include "fake_engine.h"
#include "molutil/core/color.h"

namespace molutil {
namespace {
using internal::FakeStructure;

// Alanine heavy atoms: C1 C2 C3 N4 O5 O6
FakeStructure alanine() {
  return FakeStructure("ala",
                       {
                           { "C", 3 },
                           { "C", 1 },
                           { "C", 0 },
                           { "N", 2 },
                           { "O", 0 },
                           { "O", 1 },
                       },
                       { { 0, 1 }, { 1, 2 }, { 1, 3 }, { 2, 4 }, { 2, 5 } });
}

TEST(ResolveAtomTest, PositionAndElementMustMatch) {
  FakeStructure mol = alanine();

  EXPECT_EQ(try_resolve_atom(mol, { 1, "C" }), 0);
  EXPECT_EQ(try_resolve_atom(mol, { 4, "N" }), 3);
  EXPECT_EQ(try_resolve_atom(mol, { 6, "O" }), 5);

  EXPECT_EQ(try_resolve_atom(mol, { 4, "C" }), std::nullopt);
  EXPECT_EQ(try_resolve_atom(mol, { 4, "n" }), std::nullopt);
  EXPECT_EQ(try_resolve_atom(mol, { 0, "C" }), std::nullopt);
  EXPECT_EQ(try_resolve_atom(mol, { 7, "C" }), std::nullopt);
  EXPECT_EQ(try_resolve_atom(mol, { -1, "C" }), std::nullopt);
}

TEST(ResolveBondTest, AtomsMustBeBonded) {
  FakeStructure mol = alanine();

  EXPECT_EQ(try_resolve_bond(mol, { { 2, "C" }, { 3, "C" } }),
            std::make_pair(1, 2));
  EXPECT_EQ(try_resolve_bond(mol, { { 5, "O" }, { 3, "C" } }),
            std::make_pair(4, 2));

  EXPECT_EQ(try_resolve_bond(mol, { { 1, "C" }, { 3, "C" } }), std::nullopt);
  EXPECT_EQ(try_resolve_bond(mol, { { 2, "C" }, { 3, "O" } }), std::nullopt);
  EXPECT_EQ(try_resolve_bond(mol, { { 2, "C" }, { 30, "C" } }), std::nullopt);
}

TEST(DepictionAnnotationsTest, LabelsReplaceEarlierLabels) {
  DepictionAnnotations annot(3);
  annot.add_label(1, "A", Color(0xff0000));
  annot.add_label(2, "B", Color(0x00ff00));
  annot.add_label(1, "C", Color(0x0000ff));

  ASSERT_EQ(annot.labels().size(), 2);
  EXPECT_EQ(annot.labels()[0].atom, 1);
  EXPECT_EQ(annot.labels()[0].text, "C");
  EXPECT_EQ(annot.labels()[0].color, Color(0x0000ff));
  EXPECT_EQ(annot.labels()[1].atom, 2);
}

TEST(DepictionAnnotationsTest, SetMembership) {
  DepictionAnnotations annot(4);
  EXPECT_TRUE(annot.empty());

  const int first = annot.add_atom_set(Color(0xff0000)),
            second = annot.add_atom_set(Color(0x00ff00));
  EXPECT_EQ(first, 1);
  EXPECT_EQ(second, 2);
  EXPECT_FALSE(annot.empty());

  annot.assign_atom(0, first);
  annot.assign_atom(0, second);
  EXPECT_EQ(annot.atom_set(0), second);
  EXPECT_EQ(annot.atom_color(0), Color(0x00ff00));
  EXPECT_EQ(annot.atom_set(1), 0);
  EXPECT_EQ(annot.atom_color(1), std::nullopt);
  EXPECT_EQ(annot.atom_set(-1), 0);
  EXPECT_EQ(annot.atom_set(4), 0);
  EXPECT_EQ(annot.atom_color(-1), std::nullopt);

  const int bonds = annot.add_bond_set(Color(0xff00ff));
  annot.assign_bond(2, 1, bonds);
  EXPECT_EQ(annot.bond_set(1, 2), bonds);
  EXPECT_EQ(annot.bond_set(2, 1), bonds);
  EXPECT_EQ(annot.bond_color(1, 2), Color(0xff00ff));
  EXPECT_EQ(annot.bond_color(0, 1), std::nullopt);
}

TEST(ResolveAnnotationsTest, SkipsMismatchesAndEmptyLabels) {
  FakeStructure mol = alanine();

  const std::vector<AtomLabel> labels = {
    { { 1, "C" }, "A", Color(0xff0000) },
    { { 2, "C" }, "", Color(0x00ff00) },
    { { 4, "O" }, "N?", Color(0x0000ff) },
    { { 99, "C" }, "Z", Color(0x0000ff) },
  };

  DepictionAnnotations annot = resolve_annotations(mol, labels, {}, {});
  ASSERT_EQ(annot.labels().size(), 1);
  EXPECT_EQ(annot.labels()[0].atom, 0);
  EXPECT_EQ(annot.labels()[0].text, "A");
  EXPECT_EQ(annot.num_atom_sets(), 0);
  EXPECT_EQ(annot.num_bond_sets(), 0);
}

TEST(ResolveAnnotationsTest, LastSetWins) {
  FakeStructure mol = alanine();

  const std::vector<AtomSet> atom_sets = {
    { { { 1, "C" }, { 2, "C" } }, Color(0xff0000) },
    { { { 2, "C" }, { 5, "N" } }, Color(0x00ff00) },
    // No member resolves, but the set is still declared
    { { { 99, "C" } }, Color(0x0000ff) },
  };
  const std::vector<BondSet> bond_sets = {
    { { { { 2, "C" }, { 3, "C" } }, { { 3, "C" }, { 5, "O" } } },
      Color(0xff00ff) },
    { { { { 3, "C" }, { 6, "O" } }, { { 1, "C" }, { 6, "O" } } },
      Color(0xffff00) },
  };

  DepictionAnnotations annot =
      resolve_annotations(mol, {}, atom_sets, bond_sets);

  ASSERT_EQ(annot.num_atom_sets(), 3);
  EXPECT_EQ(annot.atom_set_color(3), Color(0x0000ff));
  EXPECT_EQ(annot.atom_set(0), 1);
  EXPECT_EQ(annot.atom_set(1), 2);
  EXPECT_EQ(annot.atom_set(4), 0);

  ASSERT_EQ(annot.num_bond_sets(), 2);
  EXPECT_EQ(annot.bond_set(1, 2), 1);
  EXPECT_EQ(annot.bond_set(2, 4), 1);
  EXPECT_EQ(annot.bond_set(2, 5), 2);
  EXPECT_EQ(annot.bond_set(0, 5), 0);
}

TEST(AnnotationTextTest, ParseAtomRef) {
  absl::StatusOr<AtomRef> ref = parse_atom_ref("12:Cl");
  ASSERT_TRUE(ref.ok()) << ref.status();
  EXPECT_EQ(ref->position, 12);
  EXPECT_EQ(ref->element, "Cl");

  EXPECT_FALSE(parse_atom_ref("C:12").ok());
  EXPECT_FALSE(parse_atom_ref("").ok());
}

TEST(AnnotationTextTest, ParseAtomLabel) {
  absl::StatusOr<AtomLabel> label = parse_atom_label("3:C:a:b:#00ff00");
  ASSERT_TRUE(label.ok()) << label.status();
  EXPECT_EQ(label->atom.position, 3);
  EXPECT_EQ(label->atom.element, "C");
  EXPECT_EQ(label->text, "a:b");
  EXPECT_EQ(label->color, Color(0x00ff00));

  EXPECT_FALSE(parse_atom_label("3:C:#00ff00").ok());
  EXPECT_FALSE(parse_atom_label("3:C:A:green").ok());
}

TEST(AnnotationTextTest, ParseSets) {
  absl::StatusOr<AtomSet> atoms = parse_atom_set("1:C, 2:C@0xff0000");
  ASSERT_TRUE(atoms.ok()) << atoms.status();
  ASSERT_EQ(atoms->atoms.size(), 2);
  EXPECT_EQ(atoms->atoms[1].position, 2);
  EXPECT_EQ(atoms->color, Color(0xff0000));

  absl::StatusOr<BondSet> bonds = parse_bond_set("2:C-3:C,3:C-5:O@16711935");
  ASSERT_TRUE(bonds.ok()) << bonds.status();
  ASSERT_EQ(bonds->bonds.size(), 2);
  EXPECT_EQ(bonds->bonds[1].src.position, 3);
  EXPECT_EQ(bonds->bonds[1].dst.element, "O");
  EXPECT_EQ(bonds->color, Color(0xff00ff));

  EXPECT_FALSE(parse_atom_set("1:C,2:C").ok());
  EXPECT_FALSE(parse_bond_set("2:C-3:C-4:C@#ffffff").ok());
  EXPECT_FALSE(parse_bond_set("2:C@#ffffff").ok());
}
}  // namespace
}  // namespace molutil
