//
// Project MolUtil - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "molutil/core/element.h"

#include <iterator>

#include <gtest/gtest.h>

namespace {
using molutil::Element;
using molutil::PeriodicTable;

class PeriodicTableTest: public ::testing::Test {
public:
  // NOLINTNEXTLINE(*-ref-data-members,readability-identifier-naming)
  const PeriodicTable &table_ = molutil::kPt;
};

TEST_F(PeriodicTableTest, AtomicNumberTest) {
  for (int i = 0; i < PeriodicTable::kElementCount_; ++i) {
    ASSERT_TRUE(table_.has_element(i));
    const Element &elem = *table_.find_element(i);
    EXPECT_EQ(elem.atomic_number(), i);
    EXPECT_EQ(&table_[i], &elem);
  }

  EXPECT_FALSE(table_.has_element(-1));
  EXPECT_FALSE(table_.has_element(119));
  EXPECT_EQ(table_.find_element(200), nullptr);

  EXPECT_EQ(std::distance(table_.begin(), table_.end()),
            PeriodicTable::kElementCount_);
}

TEST_F(PeriodicTableTest, SymbolTest) {
  ASSERT_TRUE(table_.has_element("He"));

  const Element &helium = *table_.find_element("He");
  EXPECT_EQ(helium.atomic_number(), 2);
  EXPECT_EQ(helium.symbol(), "He");
  EXPECT_EQ(helium.name(), "Helium");

  EXPECT_EQ(table_.find_element("HE"), &helium);
  EXPECT_EQ(table_.find_element("he"), &helium);

  EXPECT_FALSE(table_.has_element("Aa"));
  EXPECT_EQ(table_.find_element("Aa"), nullptr);
  EXPECT_EQ(table_.find_element(""), nullptr);
}

TEST_F(PeriodicTableTest, NameTest) {
  ASSERT_TRUE(table_.has_element_of_name("Helium"));

  const Element &helium = *table_.find_element_of_name("Helium");
  EXPECT_EQ(helium.atomic_number(), 2);

  EXPECT_EQ(table_.find_element_of_name("HELIUM"), &helium);
  EXPECT_EQ(table_.find_element_of_name("helium"), &helium);

  EXPECT_FALSE(table_.has_element_of_name("Random"));
  EXPECT_EQ(table_.find_element_of_name("Random"), nullptr);
}

TEST_F(PeriodicTableTest, DummyTest) {
  ASSERT_TRUE(table_.has_element("X"));
  ASSERT_TRUE(table_.has_element("*"));

  const Element *dummy = table_.find_element("X");
  EXPECT_EQ(dummy, table_.find_element("*"));
  EXPECT_EQ(dummy->atomic_number(), 0);
  EXPECT_EQ(dummy->atomic_weight(), 0);
}

TEST_F(PeriodicTableTest, SymbolsAreUnique) {
  for (const Element &elem: table_) {
    EXPECT_EQ(table_.find_element(elem.symbol()), &elem) << elem.symbol();
    EXPECT_EQ(table_.find_element_of_name(elem.name()), &elem) << elem.name();
  }
}

TEST_F(PeriodicTableTest, AtomicWeightTest) {
  EXPECT_NEAR(table_.find_element("H")->atomic_weight(), 1.008, 1e-3);
  EXPECT_NEAR(table_.find_element("C")->atomic_weight(), 12.011, 1e-3);
  EXPECT_NEAR(table_.find_element("O")->atomic_weight(), 15.999, 1e-3);

  for (int i = 2; i < PeriodicTable::kElementCount_; ++i) {
    EXPECT_GT(table_[i].atomic_weight(), table_[1].atomic_weight())
        << table_[i].symbol();
  }
}
}  // namespace
