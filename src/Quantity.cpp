#include "Quantity.hpp"
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace UREG {

namespace {

bool hasOffset(const BaseFactor& factor) {
    return factor.offset != 0.0 || factor.offset_ambiguous;
}

bool hasLogarithm(const BaseFactor& factor) {
    return factor.logarithmic || factor.logarithmic_ambiguous;
}

bool isDeltaUnit(const UnitsContainer& units, const UnitRegistry& registry) {
    if (units.size() != 1 || units.begin()->second != 1.0) return false;
    return registry.isDeltaUnit(units.begin()->first);
}

} // namespace

// =============================================================================
// Construction
// =============================================================================

Quantity::Quantity(double magnitude, const UnitsContainer& units, const UnitRegistry& registry)
    : magnitude_(magnitude), units_(registry.parseUnits(units)), registry_(&registry) {}

Quantity::Quantity(double magnitude, const std::string& units, const UnitRegistry& registry)
    : magnitude_(magnitude), units_(registry.parseUnits(units)), registry_(&registry) {}

Quantity::Quantity(double magnitude, const UnitRegistry& registry)
    : magnitude_(magnitude), registry_(&registry) {}

Quantity Quantity::parse(const std::string& text, const UnitRegistry& registry) {
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        throw ExpressionSyntaxError(text, 0, "empty quantity");
    }

    double sign = 1.0;
    if (text[start] == '-' || text[start] == '+') {
        if (text[start] == '-') sign = -1.0;
        ++start;
    }

    ParsedUnitExpression parsed = registry.parseExpression(text.substr(start));
    return Quantity(sign * parsed.factor, parsed.units, registry);
}

DimensionVector Quantity::dimensionality() const {
    return registry_->getDimensionality(units_);
}

bool Quantity::isDimensionless() const {
    return dimensionality().empty();
}

bool Quantity::isCompatibleWith(const Quantity& other) const {
    checkSameRegistry(other);
    return dimensionality() == other.dimensionality();
}

bool Quantity::isCompatibleWith(const std::string& units) const {
    return dimensionality() == registry_->getDimensionality(units);
}

// =============================================================================
// Conversion
// =============================================================================

Quantity Quantity::to(const UnitsContainer& target, const ContextStack& contexts,
                      OffsetMode mode) const {
    UnitsContainer canonical = registry_->parseUnits(target);
    double value = registry_->convert(magnitude_, units_, canonical, contexts, mode);
    return Quantity(value, canonical, *registry_);
}

Quantity Quantity::to(const std::string& target, const ContextStack& contexts,
                      OffsetMode mode) const {
    return to(registry_->parseUnits(target), contexts, mode);
}

double Quantity::magnitudeAs(const std::string& target, const ContextStack& contexts,
                             OffsetMode mode) const {
    return to(target, contexts, mode).magnitude();
}

Quantity Quantity::toRootUnits() const {
    return to(registry_->getBaseFactor(units_).root_units);
}

// =============================================================================
// Arithmetic
// =============================================================================

Quantity Quantity::operator+(const Quantity& other) const {
    return addSubtract(other, false);
}

Quantity Quantity::operator-(const Quantity& other) const {
    return addSubtract(other, true);
}

Quantity Quantity::operator*(const Quantity& other) const {
    return multiplyDivide(other, false);
}

Quantity Quantity::operator/(const Quantity& other) const {
    return multiplyDivide(other, true);
}

Quantity Quantity::operator*(double scalar) const {
    return multiplyDivide(Quantity(scalar, *registry_), false);
}

Quantity Quantity::operator/(double scalar) const {
    return multiplyDivide(Quantity(scalar, *registry_), true);
}

Quantity Quantity::operator-() const {
    return Quantity(-magnitude_, units_, *registry_);
}

Quantity Quantity::addSubtract(const Quantity& other, bool subtract) const {
    checkSameRegistry(other);
    checkDimensionality(other);

    BaseFactor self_factor = registry_->getBaseFactor(units_);
    BaseFactor other_factor = registry_->getBaseFactor(other.units_);

    if (hasLogarithm(self_factor) || hasLogarithm(other_factor)) {
        if (units_ != other.units_) {
            throw LogarithmicUnitCalculusError(units_.toString(), other.units_.toString());
        }
        double value = subtract ? magnitude_ - other.magnitude_ : magnitude_ + other.magnitude_;
        return Quantity(value, units_, *registry_);
    }

    if (self_factor.offset_ambiguous || other_factor.offset_ambiguous) {
        throw OffsetUnitCalculusError(units_.toString(), other.units_.toString());
    }

    const bool self_offset = self_factor.offset != 0.0;
    const bool other_offset = other_factor.offset != 0.0;

    if (!self_offset && !other_offset) {
        double value = registry_->convert(other.magnitude_, other.units_, units_);
        return Quantity(subtract ? magnitude_ - value : magnitude_ + value, units_, *registry_);
    }

    if (self_offset && other_offset) {
        if (!subtract) {
            throw OffsetUnitCalculusError(units_.toString(), other.units_.toString());
        }
        // Difference of two absolute temperatures is a temperature interval
        double value = registry_->convert(other.magnitude_, other.units_, units_);
        UnitsContainer delta(registry_->deltaUnitName(units_.begin()->first));
        return Quantity(magnitude_ - value, delta, *registry_);
    }

    if (self_offset && isDeltaUnit(other.units_, *registry_)) {
        UnitsContainer delta(registry_->deltaUnitName(units_.begin()->first));
        double value = registry_->convert(other.magnitude_, other.units_, delta);
        return Quantity(subtract ? magnitude_ - value : magnitude_ + value, units_, *registry_);
    }

    if (other_offset && isDeltaUnit(units_, *registry_) && !subtract) {
        UnitsContainer delta(registry_->deltaUnitName(other.units_.begin()->first));
        double value = registry_->convert(magnitude_, units_, delta);
        return Quantity(value + other.magnitude_, other.units_, *registry_);
    }

    if (registry_->options().autoconvert_offset_to_baseunit) {
        return toRootUnits().addSubtract(other.toRootUnits(), subtract);
    }
    throw OffsetUnitCalculusError(units_.toString(), other.units_.toString());
}

Quantity Quantity::multiplyDivide(const Quantity& other, bool divide) const {
    checkSameRegistry(other);

    BaseFactor self_factor = registry_->getBaseFactor(units_);
    BaseFactor other_factor = registry_->getBaseFactor(other.units_);

    if (hasLogarithm(self_factor) || hasLogarithm(other_factor)) {
        // Only scaling by a plain number is defined
        bool scaled_self = hasLogarithm(self_factor) && other.units_.empty();
        bool scaled_other = hasLogarithm(other_factor) && units_.empty() && !divide;
        if (!scaled_self && !scaled_other) {
            throw LogarithmicUnitCalculusError(units_.toString(), other.units_.toString());
        }
        double value = divide ? magnitude_ / other.magnitude_ : magnitude_ * other.magnitude_;
        return Quantity(value, scaled_self ? units_ : other.units_, *registry_);
    }

    Quantity lhs = forMultiplication();
    Quantity rhs = other.forMultiplication();
    if (divide) {
        return Quantity(lhs.magnitude_ / rhs.magnitude_, lhs.units_ / rhs.units_, *registry_);
    }
    return Quantity(lhs.magnitude_ * rhs.magnitude_, lhs.units_ * rhs.units_, *registry_);
}

Quantity Quantity::forMultiplication() const {
    BaseFactor factor = registry_->getBaseFactor(units_);
    if (!hasOffset(factor)) {
        return *this;
    }
    if (registry_->options().autoconvert_offset_to_baseunit && !factor.offset_ambiguous) {
        return toRootUnits();
    }
    throw OffsetUnitCalculusError(units_.toString());
}

Quantity Quantity::pow(double exponent) const {
    if (exponent == 1.0) {
        return *this;
    }

    BaseFactor factor = registry_->getBaseFactor(units_);
    if (hasLogarithm(factor)) {
        throw LogarithmicUnitCalculusError(units_.toString());
    }

    Quantity base = forMultiplication();
    return Quantity(std::pow(base.magnitude_, exponent), base.units_.pow(exponent), *registry_);
}

Quantity operator*(double scalar, const Quantity& quantity) {
    return quantity * scalar;
}

Quantity operator/(double scalar, const Quantity& quantity) {
    return Quantity(scalar, quantity.registry()) / quantity;
}

// =============================================================================
// Comparison
// =============================================================================

bool Quantity::operator==(const Quantity& other) const {
    return magnitude_ == comparableMagnitude(other);
}

bool Quantity::operator!=(const Quantity& other) const {
    return !(*this == other);
}

bool Quantity::operator<(const Quantity& other) const {
    return magnitude_ < comparableMagnitude(other);
}

bool Quantity::operator<=(const Quantity& other) const {
    return magnitude_ <= comparableMagnitude(other);
}

bool Quantity::operator>(const Quantity& other) const {
    return magnitude_ > comparableMagnitude(other);
}

bool Quantity::operator>=(const Quantity& other) const {
    return magnitude_ >= comparableMagnitude(other);
}

double Quantity::comparableMagnitude(const Quantity& other) const {
    checkSameRegistry(other);
    checkDimensionality(other);
    return registry_->convert(other.magnitude_, other.units_, units_);
}

// =============================================================================
// Helpers
// =============================================================================

void Quantity::checkSameRegistry(const Quantity& other) const {
    if (registry_ != other.registry_) {
        throw std::invalid_argument("Cannot combine quantities from different unit registries");
    }
}

void Quantity::checkDimensionality(const Quantity& other) const {
    DimensionVector self_dim = dimensionality();
    DimensionVector other_dim = other.dimensionality();
    if (self_dim != other_dim) {
        throw DimensionalityError(units_.toString(), other.units_.toString(),
                                  self_dim.toString(), other_dim.toString());
    }
}

std::string Quantity::toString() const {
    std::stringstream ss;
    ss << magnitude_ << " " << units_.toString();
    return ss.str();
}

std::ostream& operator<<(std::ostream& os, const Quantity& quantity) {
    return os << quantity.toString();
}

} // namespace UREG
