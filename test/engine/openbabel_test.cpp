//
// Project MolUtil - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "molutil/engine/openbabel.h"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_format.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "molutil/core/color.h"
#include "molutil/core/formula.h"
#include "molutil/core/status.h"
#include "molutil/depict/depict.h"
#include "molutil/engine/engine.h"
#include "molutil/engine/structure.h"
#include "molutil/protonate/microspecies.h"

namespace molutil {
namespace {
using ::testing::HasSubstr;
using ::testing::Not;
using ::testing::StartsWith;

class OpenBabelTest: public ::testing::Test {
protected:
  static void SetUpTestSuite() {
    engine_ = EngineRegistry::find("openbabel");
    ASSERT_NE(engine_, nullptr);
  }

  // NOLINTNEXTLINE(*-identifier-naming)
  static const ChemistryEngine *engine_;
};

const ChemistryEngine *OpenBabelTest::engine_ = nullptr;

// Open Babel writes svg colors as rgb(r,g,b)
::testing::Matcher<const std::string &> HasColor(int r, int g, int b) {
  return ::testing::AnyOf(
      HasSubstr(absl::StrFormat("rgb(%d,%d,%d)", r, g, b)),
      HasSubstr(absl::StrFormat("#%02x%02x%02x", r, g, b)));
}

int count_substr(std::string_view str, std::string_view needle) {
  int count = 0;
  for (std::size_t pos = str.find(needle); pos != std::string_view::npos;
       pos = str.find(needle, pos + needle.size())) {
    ++count;
  }
  return count;
}

constexpr char kAlanine[] =
    "InChI=1S/C3H7NO2/c1-2(4)3(5)6/h2H,4H2,1H3,(H,5,6)/t2-/m0/s1";

TEST_F(OpenBabelTest, Registered) {
  EXPECT_EQ(engine_->name(), "openbabel");
  EXPECT_EQ(EngineRegistry::find("ob"), engine_);
}

TEST_F(OpenBabelTest, ParseAndInspect) {
  absl::StatusOr<std::unique_ptr<Structure>> mol =
      engine_->parse("CC(=O)[O-]", "smiles");
  ASSERT_TRUE(mol.ok()) << mol.status();

  const Structure &acetate = **mol;
  ASSERT_EQ(acetate.num_atoms(), 4);
  EXPECT_EQ(acetate.atom_symbol(0), "C");
  EXPECT_EQ(acetate.atom_symbol(3), "O");
  EXPECT_TRUE(acetate.has_bond(0, 1));
  EXPECT_FALSE(acetate.has_bond(0, 2));
  EXPECT_EQ(acetate.implicit_hydrogens(0), 3);
  EXPECT_EQ(acetate.formal_charge(3), -1);

  EXPECT_EQ(formula_of(acetate).to_string(), "C2H3O2");
}

TEST_F(OpenBabelTest, ParseErrors) {
  absl::StatusOr<std::unique_ptr<Structure>> mol =
      engine_->parse("CC(=O)O", "no-such-format");
  EXPECT_TRUE(is_parse_error(mol.status()));

  mol = engine_->parse("C2H5NO2", "inchi");
  EXPECT_TRUE(is_parse_error(mol.status()));

  mol = engine_->parse("", "smiles");
  EXPECT_TRUE(is_parse_error(mol.status()));
}

TEST_F(OpenBabelTest, MajorMicrospecies) {
  absl::StatusOr<std::string> result =
      compute_major_microspecies(*engine_, "CC(=O)O", "smiles", "smiles");
  ASSERT_TRUE(result.ok()) << result.status();
  EXPECT_THAT(*result, HasSubstr("[O-]"));
  EXPECT_THAT(*result, Not(HasSubstr("\n")));

  ProtonationConfig acidic;
  acidic.ph = 2;
  result = compute_major_microspecies(*engine_, "CC(=O)O", "smiles", "smiles",
                                      acidic);
  ASSERT_TRUE(result.ok()) << result.status();
  EXPECT_THAT(*result, Not(HasSubstr("[O-]")));
}

TEST_F(OpenBabelTest, KeepsOnlyInputHydrogens) {
  ProtonationConfig config;
  config.ph = 2;
  config.keep_explicit_hydrogens = true;

  absl::StatusOr<std::string> result = compute_major_microspecies(
      *engine_, "[H]OC(=O)C", "smiles", "smiles", config);
  ASSERT_TRUE(result.ok()) << result.status();
  EXPECT_EQ(count_substr(*result, "[H]"), 1) << *result;

  config.keep_explicit_hydrogens = false;
  result = compute_major_microspecies(*engine_, "[H]OC(=O)C", "smiles",
                                      "smiles", config);
  ASSERT_TRUE(result.ok()) << result.status();
  EXPECT_EQ(count_substr(*result, "[H]"), 0) << *result;
}

TEST_F(OpenBabelTest, MajorMicrospeciesInChI) {
  const std::vector<std::string> inputs = { kAlanine, kAlanine };
  absl::StatusOr<std::vector<std::string>> results =
      compute_major_microspecies_batch(*engine_, inputs, "inchi", "inchi");
  ASSERT_TRUE(results.ok()) << results.status();
  ASSERT_EQ(results->size(), 2);
  EXPECT_THAT((*results)[0], StartsWith("InChI=1S/C3H7NO2/"));
  EXPECT_EQ((*results)[0], (*results)[1]);

  const std::vector<std::string> invalid = { kAlanine, "C2H5NO2" };
  results =
      compute_major_microspecies_batch(*engine_, invalid, "inchi", "inchi");
  EXPECT_TRUE(is_parse_error(results.status()));
  EXPECT_THAT(results.status().message(), HasSubstr("structure 1: "));
}

TEST_F(OpenBabelTest, Convert) {
  absl::StatusOr<std::string> can =
      convert_structure(*engine_, "OC(=O)C", "smiles", "can");
  ASSERT_TRUE(can.ok()) << can.status();

  absl::StatusOr<std::string> again =
      convert_structure(*engine_, *can, "smiles", "can");
  ASSERT_TRUE(again.ok()) << again.status();
  EXPECT_EQ(*can, *again);
}

TEST_F(OpenBabelTest, DrawSvg) {
  DepictionRequest req;
  req.structure = kAlanine;
  req.format = "inchi";
  req.atom_labels = {
    { { 1, "C" }, "A", Color(0xff0000) },
    { { 99, "C" }, "Z", Color(0x0000ff) },
  };
  req.atom_sets = { { { { 4, "N" } }, Color(0x00ff00) } };
  req.bond_sets = {
    { { { { 2, "C" }, { 3, "C" } }, { { 3, "C" }, { 5, "O" } } },
      Color(0xff00ff) },
  };

  absl::StatusOr<RenderedImage> image = render_molecule(*engine_, req);
  ASSERT_TRUE(image.ok()) << image.status();
  EXPECT_TRUE(image->text);
  EXPECT_THAT(image->data, StartsWith("<?xml"));
  EXPECT_THAT(image->data, HasSubstr("<svg"));

  EXPECT_THAT(image->data, HasSubstr(">A<"));
  EXPECT_THAT(image->data, Not(HasSubstr(">Z<")));
  EXPECT_THAT(image->data, HasColor(0, 255, 0));
  EXPECT_THAT(image->data, HasColor(255, 0, 255));

  req.config.include_header = false;
  req.config.show_atom_numbers = true;
  image = render_molecule(*engine_, req);
  ASSERT_TRUE(image.ok()) << image.status();
  EXPECT_THAT(image->data, Not(HasSubstr("<?xml")));
  EXPECT_THAT(image->data, HasSubstr("<svg"));
}

TEST_F(OpenBabelTest, DrawWithoutAnnotations) {
  DepictionRequest req;
  req.structure = kAlanine;
  req.format = "inchi";

  absl::StatusOr<RenderedImage> image = render_molecule(*engine_, req);
  ASSERT_TRUE(image.ok()) << image.status();
  EXPECT_THAT(image->data, Not(HasSubstr(">A<")));
  EXPECT_THAT(image->data, Not(HasColor(255, 0, 0)));
  EXPECT_THAT(image->data, Not(HasColor(0, 255, 0)));
  EXPECT_THAT(image->data, Not(HasColor(255, 0, 255)));
}

TEST_F(OpenBabelTest, DrawBenzeneHeadless) {
  DepictionRequest req;
  req.structure = "c1ccccc1";
  req.format = "smiles";
  req.config.width = 300;
  req.config.height = 250;
  req.config.include_header = false;

  absl::StatusOr<RenderedImage> image = render_molecule(*engine_, req);
  ASSERT_TRUE(image.ok()) << image.status();
  EXPECT_EQ(image->format, "svg");
  EXPECT_THAT(image->data, Not(StartsWith("<?xml")));
  EXPECT_THAT(image->data, HasSubstr("width=\"300"));
  EXPECT_THAT(image->data, HasSubstr("height=\"250"));

  req.config.format = "png";
  image = render_molecule(*engine_, req);
  ASSERT_TRUE(image.ok()) << image.status();
  EXPECT_FALSE(image->text);
  EXPECT_THAT(image->data, StartsWith("\x89PNG"));
}

TEST_F(OpenBabelTest, DrawErrors) {
  DepictionRequest req;
  req.structure = "c1ccccc1";
  req.format = "smiles";
  req.config.format = "no-such-format";

  absl::StatusOr<RenderedImage> image = render_molecule(*engine_, req);
  EXPECT_FALSE(image.ok());

  req.structure = "C2H5NO2";
  req.format = "inchi";
  req.config.format = "svg";
  image = render_molecule(*engine_, req);
  EXPECT_TRUE(is_parse_error(image.status()));
}
}  // namespace
}  // namespace molutil
