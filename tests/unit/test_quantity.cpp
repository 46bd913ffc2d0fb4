/**
 * @file test_quantity.cpp
 * @brief Unit tests for quantity arithmetic, conversion and comparison
 */

#include <gtest/gtest.h>
#include "Quantity.hpp"
#include <cmath>
#include <sstream>

using namespace UREG;

class QuantityTest : public ::testing::Test {
protected:
    UnitRegistry registry;

    Quantity q(double magnitude, const std::string& units) const {
        return Quantity(magnitude, units, registry);
    }
};

// =============================================================================
// Construction and Conversion
// =============================================================================

TEST_F(QuantityTest, ConstructionCanonicalizesUnits) {
    Quantity length = q(2.5, "km");
    EXPECT_DOUBLE_EQ(length.magnitude(), 2.5);
    EXPECT_EQ(length.units(), UnitsContainer("kilometer"));
    EXPECT_EQ(length.dimensionality(), DimensionVector("[length]"));

    EXPECT_THROW(q(1.0, "blorp"), UndefinedUnitError);

    Quantity ratio(0.5, registry);
    EXPECT_TRUE(ratio.isDimensionless());
    EXPECT_TRUE(ratio.units().empty());
}

TEST_F(QuantityTest, Parse) {
    Quantity g = Quantity::parse("9.81 m/s^2", registry);
    EXPECT_DOUBLE_EQ(g.magnitude(), 9.81);
    EXPECT_EQ(g.units(), (UnitsContainer{{"meter", 1.0}, {"second", -2.0}}));

    Quantity cold = Quantity::parse("-40 degC", registry);
    EXPECT_DOUBLE_EQ(cold.magnitude(), -40.0);
    EXPECT_NEAR(cold.to("degF").magnitude(), -40.0, 1e-9);

    EXPECT_DOUBLE_EQ(Quantity::parse("1.5e3", registry).magnitude(), 1500.0);
    EXPECT_THROW(Quantity::parse("", registry), ExpressionSyntaxError);
    EXPECT_THROW(Quantity::parse("3 m /", registry), ExpressionSyntaxError);
}

TEST_F(QuantityTest, ToAndMagnitudeAs) {
    Quantity speed = q(36.0, "km/h");
    Quantity converted = speed.to("m/s");
    EXPECT_NEAR(converted.magnitude(), 10.0, 1e-12);
    EXPECT_EQ(converted.units(), (UnitsContainer{{"meter", 1.0}, {"second", -1.0}}));

    // The original is unchanged
    EXPECT_DOUBLE_EQ(speed.magnitude(), 36.0);

    EXPECT_NEAR(q(1.0, "atm").magnitudeAs("psi"), 14.695948775513449, 1e-9);
    EXPECT_THROW(speed.to("kg"), DimensionalityError);
}

TEST_F(QuantityTest, ToRootUnits) {
    Quantity force = q(1.0, "lbf").toRootUnits();
    EXPECT_NEAR(force.magnitude(), 4.4482216152605, 1e-9);
    EXPECT_EQ(force.units(), (UnitsContainer{{"kilogram", 1.0}, {"meter", 1.0}, {"second", -2.0}}));

    EXPECT_NEAR(q(25.0, "degC").toRootUnits().magnitude(), 298.15, 1e-12);
}

TEST_F(QuantityTest, ToWithContext) {
    ContextStack stack;
    stack.push(registry.getContext("sp"));
    Quantity energy = q(1.0, "Hz").to("J", stack);
    EXPECT_NEAR(energy.magnitude(), 6.62607015e-34, 1e-45);
}

TEST_F(QuantityTest, CompatibilityChecks) {
    Quantity length = q(1.0, "m");
    EXPECT_TRUE(length.isCompatibleWith(q(3.0, "ft")));
    EXPECT_FALSE(length.isCompatibleWith(q(3.0, "s")));
    EXPECT_TRUE(length.isCompatibleWith("mi"));
    EXPECT_FALSE(length.isCompatibleWith("Pa"));
}

// =============================================================================
// Linear Arithmetic
// =============================================================================

TEST_F(QuantityTest, AddSubtractConvertsRightOperand) {
    Quantity sum = q(1.0, "m") + q(50.0, "cm");
    EXPECT_DOUBLE_EQ(sum.magnitude(), 1.5);
    EXPECT_EQ(sum.units(), UnitsContainer("meter"));

    Quantity difference = q(1.0, "km") - q(250.0, "m");
    EXPECT_DOUBLE_EQ(difference.magnitude(), 0.75);
    EXPECT_EQ(difference.units(), UnitsContainer("kilometer"));

    EXPECT_THROW(q(1.0, "m") + q(1.0, "s"), DimensionalityError);
}

TEST_F(QuantityTest, MultiplyDivide) {
    Quantity work = q(2.0, "N") * q(3.0, "m");
    EXPECT_DOUBLE_EQ(work.magnitude(), 6.0);
    EXPECT_EQ(work.units(), (UnitsContainer{{"newton", 1.0}, {"meter", 1.0}}));
    EXPECT_NEAR(work.magnitudeAs("J"), 6.0, 1e-12);

    Quantity speed = q(100.0, "m") / q(20.0, "s");
    EXPECT_DOUBLE_EQ(speed.magnitude(), 5.0);
    EXPECT_EQ(speed.units(), (UnitsContainer{{"meter", 1.0}, {"second", -1.0}}));

    Quantity ratio = q(1.0, "m") / q(1.0, "km");
    EXPECT_TRUE(ratio.isDimensionless());
    EXPECT_NEAR(ratio.magnitudeAs("dimensionless"), 1e-3, 1e-15);
}

TEST_F(QuantityTest, ScalarOperations) {
    Quantity length = q(4.0, "m");
    EXPECT_DOUBLE_EQ((length * 2.0).magnitude(), 8.0);
    EXPECT_DOUBLE_EQ((2.0 * length).magnitude(), 8.0);
    EXPECT_DOUBLE_EQ((length / 2.0).magnitude(), 2.0);
    EXPECT_DOUBLE_EQ((-length).magnitude(), -4.0);

    Quantity inverse = 1.0 / length;
    EXPECT_DOUBLE_EQ(inverse.magnitude(), 0.25);
    EXPECT_EQ(inverse.units(), UnitsContainer("meter", -1.0));
}

TEST_F(QuantityTest, Power) {
    Quantity area = q(3.0, "m").pow(2.0);
    EXPECT_DOUBLE_EQ(area.magnitude(), 9.0);
    EXPECT_EQ(area.units(), UnitsContainer("meter", 2.0));

    Quantity side = area.pow(0.5);
    EXPECT_DOUBLE_EQ(side.magnitude(), 3.0);
    EXPECT_EQ(side.units(), UnitsContainer("meter"));
}

// =============================================================================
// Offset Units
// =============================================================================

TEST_F(QuantityTest, OffsetAdditionIsAmbiguous) {
    EXPECT_THROW(q(25.0, "degC") + q(10.0, "degC"), OffsetUnitCalculusError);
}

TEST_F(QuantityTest, OffsetDifferenceIsDelta) {
    Quantity difference = q(25.0, "degC") - q(10.0, "degC");
    EXPECT_DOUBLE_EQ(difference.magnitude(), 15.0);
    EXPECT_EQ(difference.units(), UnitsContainer("delta_degC"));

    Quantity mixed = q(25.0, "degC") - q(77.0, "degF");
    EXPECT_NEAR(mixed.magnitude(), 0.0, 1e-9);
    EXPECT_EQ(mixed.units(), UnitsContainer("delta_degC"));
}

TEST_F(QuantityTest, OffsetPlusDelta) {
    Quantity warmer = q(25.0, "degC") + q(5.0, "delta_degC");
    EXPECT_DOUBLE_EQ(warmer.magnitude(), 30.0);
    EXPECT_EQ(warmer.units(), UnitsContainer("degC"));

    Quantity cooler = q(10.0, "degC") - q(9.0, "delta_degF");
    EXPECT_NEAR(cooler.magnitude(), 5.0, 1e-12);

    Quantity reversed = q(10.0, "delta_degC") + q(25.0, "degC");
    EXPECT_DOUBLE_EQ(reversed.magnitude(), 35.0);
    EXPECT_EQ(reversed.units(), UnitsContainer("degC"));

    EXPECT_THROW(q(10.0, "delta_degC") - q(25.0, "degC"), OffsetUnitCalculusError);
}

TEST_F(QuantityTest, OnlyRegisteredCompanionsAreDeltaUnits) {
    registry.define(UnitDefinition::derived("delta_heat", "", UnitsContainer("kelvin"), 1.0));

    EXPECT_TRUE(registry.isDeltaUnit("delta_degC"));
    EXPECT_TRUE(registry.isDeltaUnit("delta_degF"));
    EXPECT_FALSE(registry.isDeltaUnit("delta_heat"));
    EXPECT_FALSE(registry.isDeltaUnit("kelvin"));
    EXPECT_FALSE(registry.isDeltaUnit("no_such_unit"));

    EXPECT_THROW(q(25.0, "degC") + q(1.0, "delta_heat"), OffsetUnitCalculusError);
    EXPECT_THROW(q(1.0, "delta_heat") + q(25.0, "degC"), OffsetUnitCalculusError);
}

TEST_F(QuantityTest, OffsetMultiplication) {
    EXPECT_THROW(q(10.0, "degC") * 2.0, OffsetUnitCalculusError);
    EXPECT_THROW(q(10.0, "degC") * q(1.0, "m"), OffsetUnitCalculusError);
    EXPECT_THROW(q(10.0, "degC").pow(2.0), OffsetUnitCalculusError);

    // Exponent one is a plain copy
    EXPECT_DOUBLE_EQ(q(10.0, "degC").pow(1.0).magnitude(), 10.0);

    // Delta units are ordinary multiplicative units
    Quantity gradient = q(10.0, "delta_degC") / q(2.0, "m");
    EXPECT_DOUBLE_EQ(gradient.magnitude(), 5.0);
}

TEST_F(QuantityTest, OffsetAutoconvert) {
    RegistryOptions options;
    options.autoconvert_offset_to_baseunit = true;
    UnitRegistry autoconvert(options);

    Quantity doubled = Quantity(10.0, "degC", autoconvert) * 2.0;
    EXPECT_NEAR(doubled.magnitude(), 566.3, 1e-9);
    EXPECT_EQ(doubled.units(), UnitsContainer("kelvin"));

    Quantity mixed = Quantity(5.0, "delta_degC", autoconvert) - Quantity(10.0, "degC", autoconvert);
    EXPECT_NEAR(mixed.magnitude(), 5.0 - 283.15, 1e-9);
    EXPECT_EQ(mixed.units(), UnitsContainer("kelvin"));
}

// =============================================================================
// Logarithmic Units
// =============================================================================

TEST_F(QuantityTest, LogarithmicArithmetic) {
    Quantity sum = q(10.0, "dB") + q(3.0, "dB");
    EXPECT_DOUBLE_EQ(sum.magnitude(), 13.0);
    EXPECT_EQ(sum.units(), UnitsContainer("decibel"));

    EXPECT_THROW(q(10.0, "dB") + q(1.0, "Np"), LogarithmicUnitCalculusError);

    Quantity scaled = q(10.0, "dB") * 2.0;
    EXPECT_DOUBLE_EQ(scaled.magnitude(), 20.0);
    EXPECT_EQ(scaled.units(), UnitsContainer("decibel"));
    EXPECT_DOUBLE_EQ((2.0 * q(10.0, "dB")).magnitude(), 20.0);

    EXPECT_THROW(q(10.0, "dB") * q(1.0, "m"), LogarithmicUnitCalculusError);
    EXPECT_THROW(2.0 / q(10.0, "dB"), LogarithmicUnitCalculusError);
    EXPECT_THROW(q(10.0, "dB").pow(2.0), LogarithmicUnitCalculusError);
}

TEST_F(QuantityTest, LogarithmicConversion) {
    EXPECT_NEAR(q(10.0, "dBm").magnitudeAs("mW"), 10.0, 1e-9);
    EXPECT_NEAR(q(100.0, "mW").magnitudeAs("dBm"), 20.0, 1e-9);
}

// =============================================================================
// Comparison
// =============================================================================

TEST_F(QuantityTest, Comparison) {
    EXPECT_TRUE(q(1.0, "km") > q(999.0, "m"));
    EXPECT_TRUE(q(1.0, "ft") < q(1.0, "m"));
    EXPECT_TRUE(q(1.0, "m") == q(100.0, "cm"));
    EXPECT_TRUE(q(1.0, "m") != q(1.0, "ft"));
    EXPECT_TRUE(q(12.0, "in") <= q(1.0, "ft") + q(1.0, "in"));
    EXPECT_TRUE(q(1.0, "h") >= q(59.0, "min"));

    EXPECT_THROW((void)(q(1.0, "m") < q(1.0, "s")), DimensionalityError);
}

TEST_F(QuantityTest, DifferentRegistriesCannotMix) {
    UnitRegistry other;
    Quantity a = q(1.0, "m");
    Quantity b(1.0, "m", other);
    EXPECT_THROW(a + b, std::invalid_argument);
    EXPECT_THROW(a * b, std::invalid_argument);
}

TEST_F(QuantityTest, Rendering) {
    EXPECT_EQ(q(1.5, "m").toString(), "1.5 meter");
    EXPECT_EQ(q(9.81, "m/s^2").toString(), "9.81 meter / second ** 2");

    std::stringstream ss;
    ss << q(2.0, "kg");
    EXPECT_EQ(ss.str(), "2 kilogram");
}
