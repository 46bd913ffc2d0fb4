#ifndef UNIT_DEFINITION_HPP
#define UNIT_DEFINITION_HPP

#include "UnitsContainer.hpp"
#include <set>
#include <string>
#include <vector>

namespace UREG {

enum class UnitKind {
    BASE,       ///< Defines a dimension (e.g. meter for [length])
    DERIVED,    ///< Scaled (and possibly offset) compound of other units
    PREFIXED    ///< Prefix applied to another unit, synthesized on resolution
};

/**
 * @brief Transform from a unit's value to its reference expression
 *
 * Linear/affine units:  reference = value * scale + offset
 * Logarithmic units:    reference = scale * log_base ^ (value / log_factor)
 *
 * The offset is expressed in the reference units, so degree Celsius is
 * kelvin with offset 273.15.
 */
struct Converter {
    double scale;
    double offset;
    bool logarithmic;
    double log_base;
    double log_factor;

    Converter(double s = 1.0, double o = 0.0)
        : scale(s), offset(o), logarithmic(false), log_base(10.0), log_factor(10.0) {}

    static Converter logarithmicScale(double scale, double log_base, double log_factor) {
        Converter c(scale, 0.0);
        c.logarithmic = true;
        c.log_base = log_base;
        c.log_factor = log_factor;
        return c;
    }

    bool isMultiplicative() const { return !logarithmic && offset == 0.0; }
    bool isOffset() const { return !logarithmic && offset != 0.0; }

    double toReference(double value) const;
    double fromReference(double value) const;
};

/**
 * @brief Defining record of a unit
 *
 * Produced by a definition loader (or the built-in default set) and
 * consumed by UnitRegistry::define. Immutable once registered.
 */
struct UnitDefinition {
    std::string name;                   // Canonical name (e.g., "meter")
    std::string symbol;                 // Short symbol (e.g., "m")
    std::vector<std::string> aliases;   // Alternative names/symbols
    UnitKind kind;
    std::string dimension;              // BASE only: "[length]", empty if dimensionless
    UnitsContainer reference;           // Empty for BASE units
    Converter converter;
    std::string category;               // Grouping for listings (e.g., "pressure")

    UnitDefinition() : kind(UnitKind::DERIVED) {}

    bool isBase() const { return kind == UnitKind::BASE; }
    bool isMultiplicative() const { return converter.isMultiplicative(); }
    bool isOffset() const { return converter.isOffset(); }
    bool isLogarithmic() const { return converter.logarithmic; }

    // Name, symbol and aliases, without empty entries or duplicates
    std::vector<std::string> allNames() const;

    /**
     * @brief Check structural validity of the record
     * @throws DefinitionSyntaxError
     */
    void validate() const;

    static UnitDefinition base(const std::string& name, const std::string& symbol,
                               const std::string& dimension,
                               const std::string& category = "",
                               const std::vector<std::string>& aliases = {});

    static UnitDefinition derived(const std::string& name, const std::string& symbol,
                                  const UnitsContainer& reference, double scale,
                                  const std::string& category = "",
                                  const std::vector<std::string>& aliases = {});

    static UnitDefinition offset(const std::string& name, const std::string& symbol,
                                 const UnitsContainer& reference, double scale, double offset,
                                 const std::string& category = "",
                                 const std::vector<std::string>& aliases = {});

    static UnitDefinition logarithmic(const std::string& name, const std::string& symbol,
                                      const UnitsContainer& reference, double scale,
                                      double log_base, double log_factor,
                                      const std::string& category = "",
                                      const std::vector<std::string>& aliases = {});
};

/**
 * @brief Multiplicative prefix such as kilo (k) = 1000
 */
struct PrefixDefinition {
    std::string name;
    std::string symbol;
    std::vector<std::string> aliases;
    double factor;
    std::set<std::string> allowed_units;   // Empty: combines with any unit

    PrefixDefinition() : factor(1.0) {}
    PrefixDefinition(const std::string& n, const std::string& s, double f,
                     const std::vector<std::string>& a = {})
        : name(n), symbol(s), aliases(a), factor(f) {}

    bool appliesTo(const std::string& unit_name) const {
        return allowed_units.empty() || allowed_units.count(unit_name) > 0;
    }

    std::vector<std::string> allNames() const;
    void validate() const;
};

/**
 * @brief Dimension record
 *
 * Base dimensions have an empty reference; derived dimensions such as
 * [velocity] reference base ones ({[length]: 1, [time]: -1}).
 */
struct DimensionDefinition {
    std::string name;
    DimensionVector reference;

    DimensionDefinition() = default;
    DimensionDefinition(const std::string& n, const DimensionVector& ref = DimensionVector())
        : name(n), reference(ref) {}

    bool isBase() const { return reference.empty(); }
    void validate() const;
};

// "[length]" style names
bool isDimensionName(const std::string& name);

} // namespace UREG

#endif // UNIT_DEFINITION_HPP
