/**
 * @file test_unit_system.cpp
 * @brief Unit tests for unit conversion into working units (Å, eV)
 */

#include <gtest/gtest.h>
#include "UnitSystem.hpp"
#include <algorithm>
#include <cmath>

using namespace DislocCore;

class UnitSystemTest : public ::testing::Test {
protected:
    UnitSystem units;
};

// ============================================================================
// Conversions
// ============================================================================

TEST_F(UnitSystemTest, LengthConversions) {
    EXPECT_DOUBLE_EQ(units.toBase(1.0, "nm"), 10.0);
    EXPECT_DOUBLE_EQ(units.toBase(250.0, "pm"), 2.5);
    EXPECT_NEAR(units.convert(1.0, "bohr", "A"), 0.52917721067, 1e-12);
    EXPECT_NEAR(units.convert(1.0, "m", "nm"), 1e9, 1e-3);
    EXPECT_DOUBLE_EQ(units.toBase(3.0, "Å"), 3.0);
}

TEST_F(UnitSystemTest, EnergyConversions) {
    EXPECT_DOUBLE_EQ(units.toBase(25.0, "meV"), 0.025);
    EXPECT_NEAR(units.convert(1.0, "Ha", "eV"), 27.21138602, 1e-10);
    EXPECT_NEAR(units.convert(2.0, "Ry", "Ha"), 1.0, 1e-8);
    EXPECT_NEAR(units.toBase(1.6021766208e-19, "J"), 1.0, 1e-12);
}

TEST_F(UnitSystemTest, ModulusConversions) {
    EXPECT_NEAR(units.toBase(Units::EV_PER_ANGSTROM3_IN_GPA, "GPa"), 1.0, 1e-12);
    EXPECT_NEAR(units.convert(1.0, "eV/A^3", "GPa"), 160.21766208, 1e-8);
    EXPECT_NEAR(units.convert(1.0, "GPa", "MPa"), 1000.0, 1e-9);
    EXPECT_NEAR(units.convert(10.0, "kbar", "GPa"), 1.0, 1e-12);
    EXPECT_NEAR(units.convert(1e9, "Pa", "GPa"), 1.0, 1e-12);
}

TEST_F(UnitSystemTest, SurfaceEnergyConversions) {
    EXPECT_NEAR(units.toBase(Units::EV_PER_ANGSTROM2_IN_MJ_PER_M2, "mJ/m^2"), 1.0, 1e-12);
    EXPECT_NEAR(units.convert(1.0, "J/m^2", "mJ/m^2"), 1000.0, 1e-9);

    // 140 mJ/m² is a typical Al unstable stacking fault energy
    EXPECT_NEAR(units.toBase(140.0, "mJ/m2"), 0.0087381, 1e-6);
}

TEST_F(UnitSystemTest, AngleConversions) {
    EXPECT_NEAR(units.toBase(180.0, "deg"), M_PI, 1e-14);
    EXPECT_NEAR(units.convert(M_PI / 2.0, "rad", "degrees"), 90.0, 1e-12);
}

TEST_F(UnitSystemTest, IncompatibleAndUnknownUnits) {
    EXPECT_THROW(units.convert(1.0, "GPa", "eV"), std::runtime_error);
    EXPECT_THROW(units.convert(1.0, "furlong", "A"), std::runtime_error);
    EXPECT_THROW(units.toBase(1.0, "psi"), std::runtime_error);
    EXPECT_THROW(units.getDimension("furlong"), std::runtime_error);

    EXPECT_TRUE(units.areCompatible("mJ/m^2", "eV/A^2"));
    EXPECT_FALSE(units.areCompatible("mJ/m^2", "GPa"));
}

// ============================================================================
// Parsing
// ============================================================================

TEST_F(UnitSystemTest, ParseValueWithUnit) {
    double value;
    std::string unit;

    ASSERT_TRUE(units.parseValueWithUnit("110 GPa", value, unit));
    EXPECT_DOUBLE_EQ(value, 110.0);
    EXPECT_EQ(unit, "GPa");

    ASSERT_TRUE(units.parseValueWithUnit("-2.5e-3 eV", value, unit));
    EXPECT_DOUBLE_EQ(value, -2.5e-3);
    EXPECT_EQ(unit, "eV");

    // "e" of "eV" is not an exponent
    ASSERT_TRUE(units.parseValueWithUnit("2.5eV", value, unit));
    EXPECT_DOUBLE_EQ(value, 2.5);
    EXPECT_EQ(unit, "eV");

    ASSERT_TRUE(units.parseValueWithUnit("  42  ", value, unit));
    EXPECT_DOUBLE_EQ(value, 42.0);
    EXPECT_TRUE(unit.empty());

    EXPECT_FALSE(units.parseValueWithUnit("GPa", value, unit));
    EXPECT_FALSE(units.parseValueWithUnit("", value, unit));
}

TEST_F(UnitSystemTest, ParseToBase) {
    EXPECT_NEAR(units.parseToBase("160.21766208", "GPa"), 1.0, 1e-12);
    EXPECT_NEAR(units.parseToBase("0.5 nm", "A"), 5.0, 1e-12);
    EXPECT_NEAR(units.parseToBase("1 eV/A^2", "mJ/m^2"), 1.0, 1e-12);

    EXPECT_THROW(units.parseToBase("3 eV", "GPa"), std::runtime_error);
    EXPECT_THROW(units.parseToBase("abc", "GPa"), std::runtime_error);
}

// ============================================================================
// Database
// ============================================================================

TEST_F(UnitSystemTest, Categories) {
    std::vector<std::string> categories = units.getCategories();
    for (const char* name : {"length", "energy", "pressure", "energy_per_area", "angle"}) {
        EXPECT_NE(std::find(categories.begin(), categories.end(), name), categories.end()) << name;
    }
    EXPECT_GE(units.getUnitsInCategory("pressure").size(), 6u);
    EXPECT_TRUE(units.getUnitsInCategory("viscosity").empty());
}

TEST_F(UnitSystemTest, Dimensions) {
    EXPECT_EQ(units.getDimension("GPa"), Dimension(-3, 1));
    EXPECT_EQ(units.getDimension("mJ/m^2"), Dimension(-2, 1));
    EXPECT_EQ(Dimension(-3, 1).toString(), "L^-3 E");
    EXPECT_EQ(Dimension(0, 0).toString(), "dimensionless");
}

TEST_F(UnitSystemTest, CustomUnitsAndAliases) {
    Unit kJ_mol("kilojoule per mole", "kJ/mol", Dimension(0, 1), 0.0103642688, "energy");
    units.addUnit(kJ_mol);
    EXPECT_NEAR(units.toBase(96.485, "kJ/mol"), 1.0, 1e-4);

    units.addAlias("GPa", "gigapascals");
    EXPECT_NEAR(units.toBase(1.0, "gigapascals"), 1.0 / Units::EV_PER_ANGSTROM3_IN_GPA, 1e-15);
    EXPECT_THROW(units.addAlias("furlong", "fl"), std::runtime_error);
}

TEST_F(UnitSystemTest, FormatAndGlobalHelpers) {
    EXPECT_EQ(units.formatValue(2.5, "A", 3), "2.5 A");
    EXPECT_NEAR(convertUnits(1.0, "nm", "A"), 10.0, 1e-12);
    EXPECT_NEAR(toWorkingUnits(1.0, "J/m^2"), 1000.0 / Units::EV_PER_ANGSTROM2_IN_MJ_PER_M2, 1e-15);
}
