/**
 * @file test_unit_expression.cpp
 * @brief Unit tests for the unit expression parser
 */

#include <gtest/gtest.h>
#include "UnitExpression.hpp"
#include "UnitErrors.hpp"

using namespace UREG;

TEST(UnitExpressionTest, SingleName) {
    ParsedUnitExpression parsed = parseUnitExpression("meter");
    EXPECT_DOUBLE_EQ(parsed.factor, 1.0);
    EXPECT_EQ(parsed.units, UnitsContainer("meter"));
}

TEST(UnitExpressionTest, ProductsAndQuotients) {
    ParsedUnitExpression parsed = parseUnitExpression("kg * m / s ** 2");
    UnitsContainer expected{{"kg", 1.0}, {"m", 1.0}, {"s", -2.0}};
    EXPECT_EQ(parsed.units, expected);
}

TEST(UnitExpressionTest, LeftAssociativeDivision) {
    // (J / kg) * K, not J / (kg * K)
    ParsedUnitExpression parsed = parseUnitExpression("J / kg * K");
    EXPECT_DOUBLE_EQ(parsed.units.exponent("K"), 1.0);
    EXPECT_DOUBLE_EQ(parsed.units.exponent("kg"), -1.0);

    ParsedUnitExpression grouped = parseUnitExpression("J / (kg * K)");
    EXPECT_DOUBLE_EQ(grouped.units.exponent("K"), -1.0);
}

TEST(UnitExpressionTest, CaretAndImplicitExponent) {
    EXPECT_EQ(parseUnitExpression("m^3").units, UnitsContainer("m", 3.0));
    EXPECT_EQ(parseUnitExpression("m3").units, UnitsContainer("m", 3.0));
    EXPECT_EQ(parseUnitExpression("cm2").units, UnitsContainer("cm", 2.0));

    // Digits after an underscore belong to the name
    EXPECT_EQ(parseUnitExpression("g_0").units, UnitsContainer("g_0"));
}

TEST(UnitExpressionTest, NegativeAndFractionalExponents) {
    EXPECT_EQ(parseUnitExpression("s ** -1").units, UnitsContainer("s", -1.0));
    EXPECT_EQ(parseUnitExpression("s^(-2)").units, UnitsContainer("s", -2.0));
    EXPECT_DOUBLE_EQ(parseUnitExpression("Hz ** (1/2)").units.exponent("Hz"), 0.5);
}

TEST(UnitExpressionTest, NumericFactors) {
    ParsedUnitExpression parsed = parseUnitExpression("9.81 m/s^2");
    EXPECT_DOUBLE_EQ(parsed.factor, 9.81);
    EXPECT_DOUBLE_EQ(parsed.units.exponent("s"), -2.0);

    EXPECT_DOUBLE_EQ(parseUnitExpression("1e-3 * meter ** 3").factor, 1e-3);
    EXPECT_DOUBLE_EQ(parseUnitExpression("2.5e3").factor, 2500.0);
    EXPECT_DOUBLE_EQ(parseUnitExpression("1 / 4").factor, 0.25);

    // Exponent applies to the factor too
    EXPECT_DOUBLE_EQ(parseUnitExpression("(10 m) ** 2").factor, 100.0);
}

TEST(UnitExpressionTest, ExponentLetterWithoutDigitsIsUnit) {
    ParsedUnitExpression parsed = parseUnitExpression("1 erg");
    EXPECT_DOUBLE_EQ(parsed.factor, 1.0);
    EXPECT_EQ(parsed.units, UnitsContainer("erg"));
}

TEST(UnitExpressionTest, JuxtapositionMultiplies) {
    ParsedUnitExpression parsed = parseUnitExpression("N m");
    EXPECT_EQ(parsed.units, (UnitsContainer{{"N", 1.0}, {"m", 1.0}}));
}

TEST(UnitExpressionTest, DimensionsKeepBrackets) {
    ParsedUnitExpression parsed = parseUnitExpression("[length] / [time]");
    EXPECT_DOUBLE_EQ(parsed.units.exponent("[length]"), 1.0);
    EXPECT_DOUBLE_EQ(parsed.units.exponent("[time]"), -1.0);
}

TEST(UnitExpressionTest, DimensionlessAndEmpty) {
    EXPECT_TRUE(parseUnitExpression("").units.empty());
    EXPECT_TRUE(parseUnitExpression("   ").units.empty());
    EXPECT_TRUE(parseUnitExpression("dimensionless").units.empty());
}

TEST(UnitExpressionTest, SyntaxErrors) {
    EXPECT_THROW(parseUnitExpression("m /"), ExpressionSyntaxError);
    EXPECT_THROW(parseUnitExpression("(m * s"), ExpressionSyntaxError);
    EXPECT_THROW(parseUnitExpression("m ** "), ExpressionSyntaxError);
    EXPECT_THROW(parseUnitExpression("m ** (1/0)"), ExpressionSyntaxError);
    EXPECT_THROW(parseUnitExpression("[length"), ExpressionSyntaxError);
    EXPECT_THROW(parseUnitExpression("m $ s"), ExpressionSyntaxError);
}

TEST(UnitExpressionTest, ErrorReportsPosition) {
    try {
        parseUnitExpression("m * )");
        FAIL() << "Expected ExpressionSyntaxError";
    } catch (const ExpressionSyntaxError& e) {
        EXPECT_EQ(e.expression(), "m * )");
        EXPECT_EQ(e.position(), 4u);
    }
}
