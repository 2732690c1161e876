//
// Project MolUtil - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "molutil/core/formula.h"

#include <string_view>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <gtest/gtest.h>

#include "fake_engine.h"

namespace molutil {
namespace {
EmpiricalFormula parse_ok(std::string_view str) {
  absl::StatusOr<EmpiricalFormula> formula = EmpiricalFormula::from_string(str);
  EXPECT_TRUE(formula.ok()) << formula.status();
  return formula.ok() ? *formula : EmpiricalFormula();
}

TEST(EmpiricalFormulaTest, Parse) {
  EmpiricalFormula glucose = parse_ok("C6H12O6");
  EXPECT_EQ(glucose.size(), 3);
  EXPECT_EQ(glucose["C"], 6);
  EXPECT_EQ(glucose["H"], 12);
  EXPECT_EQ(glucose["O"], 6);
  EXPECT_EQ(glucose["N"], 0);
  EXPECT_FALSE(glucose.contains("N"));

  EmpiricalFormula f = parse_ok("HCl");
  EXPECT_EQ(f["H"], 1);
  EXPECT_EQ(f["Cl"], 1);

  f = parse_ok("C1.5H-2O0.5e1");
  EXPECT_EQ(f["C"], 1.5);
  EXPECT_EQ(f["H"], -2);
  EXPECT_EQ(f["O"], 5);

  f = parse_ok("CHCH");
  EXPECT_EQ(f["C"], 2);
  EXPECT_EQ(f["H"], 2);

  f = parse_ok("C2H-2H2");
  EXPECT_EQ(f.size(), 1);
  EXPECT_FALSE(f.contains("H"));

  EXPECT_TRUE(parse_ok("").empty());
}

TEST(EmpiricalFormulaTest, ParseInvalid) {
  for (const char *str: { "c6h12o6", "C6 H12", "(CH3)2", "1C", "C-", "Abc" }) {
    absl::StatusOr<EmpiricalFormula> f = EmpiricalFormula::from_string(str);
    EXPECT_TRUE(absl::IsInvalidArgument(f.status())) << str;
  }
}

TEST(EmpiricalFormulaTest, ToString) {
  EXPECT_EQ(parse_ok("H12C6O6").to_string(), "C6H12O6");
  EXPECT_EQ(parse_ok("NaCl").to_string(), "ClNa");
  EXPECT_EQ(parse_ok("C1.5H-2").to_string(), "C1.5H-2");
  EXPECT_EQ(EmpiricalFormula().to_string(), "");
}

TEST(EmpiricalFormulaTest, Set) {
  EmpiricalFormula f;
  ASSERT_TRUE(f.set("C", 2).ok());
  ASSERT_TRUE(f.set("Fe", 1).ok());
  EXPECT_EQ(f.to_string(), "C2Fe");

  ASSERT_TRUE(f.set("C", 0).ok());
  EXPECT_FALSE(f.contains("C"));

  EXPECT_TRUE(absl::IsInvalidArgument(f.set("c", 1)));
  EXPECT_TRUE(absl::IsInvalidArgument(f.set("Fee", 1)));
  EXPECT_TRUE(absl::IsInvalidArgument(f.set("", 1)));
}

TEST(EmpiricalFormulaTest, MolecularWeight) {
  absl::StatusOr<double> mw = parse_ok("C6H12O6").molecular_weight();
  ASSERT_TRUE(mw.ok()) << mw.status();
  EXPECT_NEAR(*mw, 180.156, 1e-2);

  mw = parse_ok("H2O").molecular_weight();
  ASSERT_TRUE(mw.ok()) << mw.status();
  EXPECT_NEAR(*mw, 18.015, 1e-2);

  mw = EmpiricalFormula().molecular_weight();
  ASSERT_TRUE(mw.ok()) << mw.status();
  EXPECT_EQ(*mw, 0);

  // Well-formed symbol of no element
  mw = parse_ok("CQ").molecular_weight();
  EXPECT_TRUE(absl::IsNotFound(mw.status()));
}

TEST(EmpiricalFormulaTest, Arithmetic) {
  const EmpiricalFormula water = parse_ok("H2O"), co2 = parse_ok("CO2");

  EXPECT_EQ((water + co2).to_string(), "CH2O3");
  EXPECT_EQ((water - water).size(), 0);
  EXPECT_EQ((co2 - water).to_string(), "CH-2O");
  EXPECT_EQ((water * 2).to_string(), "H4O2");
  EXPECT_EQ((2 * water).to_string(), "H4O2");
  EXPECT_EQ((water / 2).to_string(), "HO0.5");
  EXPECT_TRUE((water * 0).empty());

  EmpiricalFormula f = water;
  f += co2;
  f -= co2;
  EXPECT_EQ(f, water);
  EXPECT_NE(f, co2);
}

TEST(EmpiricalFormulaTest, FormulaOfStructure) {
  internal::FakeStructure mol("acetate",
                              {
                                  { "C", 3 },
                                  { "C", 0 },
                                  { "O", 0 },
                                  { "O", 0, -1 },
                              },
                              { { 0, 1 }, { 1, 2 }, { 1, 3 } });

  EmpiricalFormula f = formula_of(mol);
  EXPECT_EQ(f.to_string(), "C2H3O2");
}
}  // namespace
}  // namespace molutil
