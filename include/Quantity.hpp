#ifndef QUANTITY_HPP
#define QUANTITY_HPP

#include "UnitRegistry.hpp"
#include <ostream>
#include <string>

namespace UREG {

/**
 * @brief Magnitude with units, interpreted by a registry
 *
 * Quantities are values: every operation returns a new quantity and leaves
 * its operands unchanged. The registry must outlive every quantity that
 * refers to it. Quantities from different registries cannot be combined.
 *
 * Rules for affine (offset) units such as degC:
 * - offset + offset                 -> OffsetUnitCalculusError
 * - offset - offset                 -> delta unit (degC - degC = delta_degC)
 * - offset +/- delta                -> offset unit
 * - delta + offset                  -> offset unit of the right operand
 * - offset * anything, pow(n != 1)  -> OffsetUnitCalculusError unless the
 *   registry autoconverts offset units to root units
 */
class Quantity {
public:
    Quantity(double magnitude, const UnitsContainer& units, const UnitRegistry& registry);
    Quantity(double magnitude, const std::string& units, const UnitRegistry& registry);

    /**
     * @brief Dimensionless quantity
     */
    Quantity(double magnitude, const UnitRegistry& registry);

    /**
     * @brief Parse "9.81 m/s^2" or "-40 degC"
     * @throws ExpressionSyntaxError, UndefinedUnitError
     */
    static Quantity parse(const std::string& text, const UnitRegistry& registry);

    double magnitude() const { return magnitude_; }
    const UnitsContainer& units() const { return units_; }
    const UnitRegistry& registry() const { return *registry_; }

    DimensionVector dimensionality() const;
    bool isDimensionless() const;
    bool isCompatibleWith(const Quantity& other) const;
    bool isCompatibleWith(const std::string& units) const;

    // =========================================================================
    // Conversion
    // =========================================================================

    Quantity to(const UnitsContainer& target, const ContextStack& contexts = ContextStack(),
                OffsetMode mode = OffsetMode::STRICT) const;
    Quantity to(const std::string& target, const ContextStack& contexts = ContextStack(),
                OffsetMode mode = OffsetMode::STRICT) const;

    double magnitudeAs(const std::string& target, const ContextStack& contexts = ContextStack(),
                       OffsetMode mode = OffsetMode::STRICT) const;

    Quantity toRootUnits() const;

    // =========================================================================
    // Arithmetic
    // =========================================================================

    Quantity operator+(const Quantity& other) const;
    Quantity operator-(const Quantity& other) const;
    Quantity operator*(const Quantity& other) const;
    Quantity operator/(const Quantity& other) const;

    Quantity operator*(double scalar) const;
    Quantity operator/(double scalar) const;
    Quantity operator-() const;

    Quantity pow(double exponent) const;

    // =========================================================================
    // Comparison (throws DimensionalityError on incompatible operands)
    // =========================================================================

    bool operator==(const Quantity& other) const;
    bool operator!=(const Quantity& other) const;
    bool operator<(const Quantity& other) const;
    bool operator<=(const Quantity& other) const;
    bool operator>(const Quantity& other) const;
    bool operator>=(const Quantity& other) const;

    std::string toString() const;

private:
    double magnitude_;
    UnitsContainer units_;
    const UnitRegistry* registry_;

    void checkSameRegistry(const Quantity& other) const;
    void checkDimensionality(const Quantity& other) const;
    double comparableMagnitude(const Quantity& other) const;

    Quantity addSubtract(const Quantity& other, bool subtract) const;
    Quantity multiplyDivide(const Quantity& other, bool divide) const;

    // Converts a lone affine unit to root units when the registry allows it
    Quantity forMultiplication() const;
};

Quantity operator*(double scalar, const Quantity& quantity);
Quantity operator/(double scalar, const Quantity& quantity);

std::ostream& operator<<(std::ostream& os, const Quantity& quantity);

} // namespace UREG

#endif // QUANTITY_HPP
