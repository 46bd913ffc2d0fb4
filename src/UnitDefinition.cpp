#include "UnitDefinition.hpp"
#include "UnitErrors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace UREG {

// =============================================================================
// Converter
// =============================================================================

double Converter::toReference(double value) const {
    if (logarithmic) {
        return scale * std::pow(log_base, value / log_factor);
    }
    return value * scale + offset;
}

double Converter::fromReference(double value) const {
    if (logarithmic) {
        return log_factor * std::log(value / scale) / std::log(log_base);
    }
    return (value - offset) / scale;
}

// =============================================================================
// Helpers
// =============================================================================

namespace {

std::vector<std::string> collectNames(const std::string& name, const std::string& symbol,
                                      const std::vector<std::string>& aliases) {
    std::vector<std::string> names;
    auto add = [&names](const std::string& n) {
        if (!n.empty() && std::find(names.begin(), names.end(), n) == names.end()) {
            names.push_back(n);
        }
    };
    add(name);
    add(symbol);
    for (const auto& alias : aliases) add(alias);
    return names;
}

void checkIdentifier(const std::string& name, const std::string& what) {
    if (name.empty()) {
        throw DefinitionSyntaxError(what + " name is empty");
    }
    for (char c : name) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            throw DefinitionSyntaxError(what + " name '" + name + "' contains whitespace");
        }
    }
    if (std::isdigit(static_cast<unsigned char>(name[0]))) {
        throw DefinitionSyntaxError(what + " name '" + name + "' starts with a digit");
    }
}

} // namespace

bool isDimensionName(const std::string& name) {
    return name.size() > 2 && name.front() == '[' && name.back() == ']';
}

// =============================================================================
// UnitDefinition
// =============================================================================

std::vector<std::string> UnitDefinition::allNames() const {
    return collectNames(name, symbol, aliases);
}

void UnitDefinition::validate() const {
    checkIdentifier(name, "Unit");
    if (!symbol.empty()) {
        checkIdentifier(symbol, "Symbol of unit '" + name + "':");
    }
    for (const auto& alias : aliases) {
        checkIdentifier(alias, "Alias of unit '" + name + "':");
    }

    if (kind == UnitKind::BASE) {
        if (!dimension.empty() && !isDimensionName(dimension)) {
            throw DefinitionSyntaxError("dimension '" + dimension + "' of base unit '" + name +
                                        "' must be written as [name]");
        }
        if (!reference.empty()) {
            throw DefinitionSyntaxError("base unit '" + name + "' cannot have a reference");
        }
        if (!converter.isMultiplicative() || converter.scale != 1.0) {
            throw DefinitionSyntaxError("base unit '" + name + "' must have unit scale");
        }
        return;
    }

    if (!dimension.empty()) {
        throw DefinitionSyntaxError("derived unit '" + name + "' cannot declare a dimension");
    }
    for (const auto& entry : reference) {
        if (isDimensionName(entry.first)) {
            throw DefinitionSyntaxError("derived unit '" + name + "' references dimension " +
                                        entry.first + " instead of a unit");
        }
    }
    if (!std::isfinite(converter.scale) || converter.scale == 0.0) {
        throw DefinitionSyntaxError("scale of '" + name + "' must be finite and non-zero");
    }
    if (!std::isfinite(converter.offset)) {
        throw DefinitionSyntaxError("offset of '" + name + "' must be finite");
    }
    if (converter.logarithmic) {
        if (converter.scale <= 0.0) {
            throw DefinitionSyntaxError("logarithmic unit '" + name + "' needs a positive scale");
        }
        if (!(converter.log_base > 0.0) || converter.log_base == 1.0 ||
            !std::isfinite(converter.log_base)) {
            throw DefinitionSyntaxError("logarithmic unit '" + name + "' has invalid log base");
        }
        if (!std::isfinite(converter.log_factor) || converter.log_factor == 0.0) {
            throw DefinitionSyntaxError("logarithmic unit '" + name + "' has invalid log factor");
        }
    }
}

UnitDefinition UnitDefinition::base(const std::string& name, const std::string& symbol,
                                    const std::string& dimension, const std::string& category,
                                    const std::vector<std::string>& aliases) {
    UnitDefinition def;
    def.name = name;
    def.symbol = symbol;
    def.aliases = aliases;
    def.kind = UnitKind::BASE;
    def.dimension = dimension;
    def.category = category;
    return def;
}

UnitDefinition UnitDefinition::derived(const std::string& name, const std::string& symbol,
                                       const UnitsContainer& reference, double scale,
                                       const std::string& category,
                                       const std::vector<std::string>& aliases) {
    UnitDefinition def;
    def.name = name;
    def.symbol = symbol;
    def.aliases = aliases;
    def.kind = UnitKind::DERIVED;
    def.reference = reference;
    def.converter = Converter(scale);
    def.category = category;
    return def;
}

UnitDefinition UnitDefinition::offset(const std::string& name, const std::string& symbol,
                                      const UnitsContainer& reference, double scale,
                                      double offset, const std::string& category,
                                      const std::vector<std::string>& aliases) {
    UnitDefinition def = derived(name, symbol, reference, scale, category, aliases);
    def.converter.offset = offset;
    return def;
}

UnitDefinition UnitDefinition::logarithmic(const std::string& name, const std::string& symbol,
                                           const UnitsContainer& reference, double scale,
                                           double log_base, double log_factor,
                                           const std::string& category,
                                           const std::vector<std::string>& aliases) {
    UnitDefinition def = derived(name, symbol, reference, scale, category, aliases);
    def.converter = Converter::logarithmicScale(scale, log_base, log_factor);
    return def;
}

// =============================================================================
// PrefixDefinition / DimensionDefinition
// =============================================================================

std::vector<std::string> PrefixDefinition::allNames() const {
    return collectNames(name, symbol, aliases);
}

void PrefixDefinition::validate() const {
    checkIdentifier(name, "Prefix");
    if (!symbol.empty()) {
        checkIdentifier(symbol, "Symbol of prefix '" + name + "':");
    }
    if (!std::isfinite(factor) || factor == 0.0) {
        throw DefinitionSyntaxError("factor of prefix '" + name + "' must be finite and non-zero");
    }
}

void DimensionDefinition::validate() const {
    if (!isDimensionName(name)) {
        throw DefinitionSyntaxError("dimension '" + name + "' must be written as [name]");
    }
    for (const auto& entry : reference) {
        if (!isDimensionName(entry.first)) {
            throw DefinitionSyntaxError("dimension '" + name + "' references '" + entry.first +
                                        "', which is not a dimension");
        }
    }
}

} // namespace UREG
