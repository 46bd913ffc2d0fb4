#ifndef DIMENSIONAL_ANALYSIS_HPP
#define DIMENSIONAL_ANALYSIS_HPP

#include "UnitRegistry.hpp"
#include "UnitsContainer.hpp"
#include <string>
#include <utility>
#include <vector>

namespace UREG {

using NamedDimensions = std::vector<std::pair<std::string, DimensionVector>>;
using NamedExpressions = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Independent dimensionless groups of a set of quantities
 *
 * Applies the Buckingham pi theorem: the exponent vectors of the groups
 * span the null space of the dimension matrix (one row per base dimension,
 * one column per quantity). Each group is scaled to the smallest integer
 * exponents and signed so that its first quantity, in input order, has a
 * positive exponent. A dimensionless input quantity forms a group on its
 * own.
 *
 * @throws std::invalid_argument on duplicate quantity names
 */
std::vector<DimensionlessGroup> piTheorem(const NamedDimensions& quantities);

/**
 * @brief Same, with each quantity given as a unit expression ("m / s") or
 *        a dimension expression ("[length] / [time]")
 * @throws UndefinedUnitError, ExpressionSyntaxError on malformed expressions
 */
std::vector<DimensionlessGroup> piTheorem(const NamedExpressions& quantities,
                                          const UnitRegistry& registry);

} // namespace UREG

#endif // DIMENSIONAL_ANALYSIS_HPP
