/**
 * @file test_dimensional_analysis.cpp
 * @brief Unit tests for dimensionless group discovery
 */

#include <gtest/gtest.h>
#include "DimensionalAnalysis.hpp"
#include <stdexcept>

using namespace UREG;

class DimensionalAnalysisTest : public ::testing::Test {
protected:
    UnitRegistry registry;
};

TEST_F(DimensionalAnalysisTest, SpeedTimeLength) {
    auto groups = piTheorem(NamedExpressions{{"V", "m / s"}, {"T", "s"}, {"L", "m"}}, registry);
    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(groups[0], (DimensionlessGroup{{"V", 1.0}, {"T", 1.0}, {"L", -1.0}}));
}

TEST_F(DimensionalAnalysisTest, Pendulum) {
    auto groups = piTheorem(NamedExpressions{{"T", "s"},
                                             {"L", "ft"},
                                             {"g", "m / s ** 2"},
                                             {"M", "lb"}},
                            registry);
    ASSERT_EQ(groups.size(), 1u);

    // Mass cannot enter any group
    EXPECT_EQ(groups[0], (DimensionlessGroup{{"T", 2.0}, {"g", 1.0}, {"L", -1.0}}));
    EXPECT_FALSE(groups[0].contains("M"));
}

TEST_F(DimensionalAnalysisTest, ReynoldsNumber) {
    auto groups = piTheorem(NamedExpressions{{"rho", "kg / m ** 3"},
                                             {"v", "m / s"},
                                             {"D", "m"},
                                             {"mu", "Pa * s"}},
                            registry);
    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(groups[0], (DimensionlessGroup{{"rho", 1.0}, {"v", 1.0}, {"D", 1.0}, {"mu", -1.0}}));
}

TEST_F(DimensionalAnalysisTest, DimensionExpressions) {
    auto groups = piTheorem(NamedExpressions{{"v", "[length] / [time]"},
                                             {"f", "[time] ** -1"},
                                             {"lambda", "[length]"}},
                            registry);
    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(groups[0], (DimensionlessGroup{{"v", 1.0}, {"f", -1.0}, {"lambda", -1.0}}));
}

TEST_F(DimensionalAnalysisTest, IndependentQuantitiesHaveNoGroups) {
    EXPECT_TRUE(piTheorem(NamedExpressions{{"L", "m"}, {"t", "s"}, {"m", "kg"}}, registry).empty());
    EXPECT_TRUE(piTheorem(NamedDimensions{}).empty());
}

TEST_F(DimensionalAnalysisTest, DimensionlessQuantityIsItsOwnGroup) {
    auto groups = piTheorem(NamedDimensions{{"angle", DimensionVector()},
                                            {"L", DimensionVector("[length]")}});
    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(groups[0], DimensionlessGroup("angle"));
}

TEST_F(DimensionalAnalysisTest, TwoGroups) {
    // Drag on a sphere: drag coefficient and Reynolds number
    const NamedExpressions quantities{{"F", "N"},
                                      {"rho", "kg / m ** 3"},
                                      {"v", "m / s"},
                                      {"D", "m"},
                                      {"mu", "Pa * s"}};
    auto groups = piTheorem(quantities, registry);
    ASSERT_EQ(groups.size(), 2u);

    for (const auto& group : groups) {
        DimensionVector total;
        for (const auto& quantity : quantities) {
            total = total * registry.getDimensionality(quantity.second)
                                .pow(group.exponent(quantity.first));
        }
        EXPECT_TRUE(total.empty()) << group;
    }
    EXPECT_NE(groups[0], groups[1]);
}

TEST_F(DimensionalAnalysisTest, InvalidInput) {
    EXPECT_THROW(piTheorem(NamedDimensions{{"L", DimensionVector("[length]")},
                                           {"L", DimensionVector("[time]")}}),
                 std::invalid_argument);
    EXPECT_THROW(piTheorem(NamedExpressions{{"x", "blorps"}}, registry), UndefinedUnitError);
}
