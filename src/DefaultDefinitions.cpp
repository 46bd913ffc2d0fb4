#include "DefaultDefinitions.hpp"
#include "UnitRegistry.hpp"
#include <cmath>

namespace UREG {

namespace {

const double PI = 3.14159265358979323846;

// Define `name` as `scale * definition`, where definition may carry its
// own numeric factor ("12 * inch")
void addUnit(UnitRegistry& registry, const std::string& name, const std::string& symbol,
             double scale, const std::string& definition, const std::string& category,
             const std::vector<std::string>& aliases = {}) {
    ParsedUnitExpression parsed = registry.parseExpression(definition);
    registry.define(UnitDefinition::derived(name, symbol, parsed.units, scale * parsed.factor,
                                            category, aliases));
}

void addUnit(UnitRegistry& registry, const std::string& name, const std::string& symbol,
             const std::string& definition, const std::string& category,
             const std::vector<std::string>& aliases = {}) {
    addUnit(registry, name, symbol, 1.0, definition, category, aliases);
}

void addDimension(UnitRegistry& registry, const std::string& name, const std::string& definition) {
    ParsedUnitExpression parsed = parseUnitExpression(definition);
    registry.defineDimension(DimensionDefinition(name, DimensionVector(parsed.units.entries())));
}

// =============================================================================
// Base Units and Prefixes
// =============================================================================

void addBaseUnits(UnitRegistry& registry) {
    registry.define(UnitDefinition::base("meter", "m", "[length]", "length", {"metre"}));
    registry.define(UnitDefinition::base("kilogram", "kg", "[mass]", "mass"));
    registry.define(UnitDefinition::base("second", "s", "[time]", "time", {"sec"}));
    registry.define(UnitDefinition::base("kelvin", "K", "[temperature]", "temperature"));
    registry.define(UnitDefinition::base("ampere", "A", "[current]", "electrical", {"amp"}));
    registry.define(UnitDefinition::base("mole", "mol", "[substance]", "substance"));
    registry.define(UnitDefinition::base("candela", "cd", "[luminosity]", "luminosity"));
    registry.define(UnitDefinition::base("bit", "", "[information]", "information"));

    // Dimensionless base unit
    registry.define(UnitDefinition::base("radian", "rad", "", "angle"));
}

void addPrefixes(UnitRegistry& registry) {
    // SI
    registry.definePrefix(PrefixDefinition("yocto", "y", 1e-24));
    registry.definePrefix(PrefixDefinition("zepto", "z", 1e-21));
    registry.definePrefix(PrefixDefinition("atto", "a", 1e-18));
    registry.definePrefix(PrefixDefinition("femto", "f", 1e-15));
    registry.definePrefix(PrefixDefinition("pico", "p", 1e-12));
    registry.definePrefix(PrefixDefinition("nano", "n", 1e-9));
    registry.definePrefix(PrefixDefinition("micro", "µ", 1e-6, {"u", "μ"}));
    registry.definePrefix(PrefixDefinition("milli", "m", 1e-3));
    registry.definePrefix(PrefixDefinition("centi", "c", 1e-2));
    registry.definePrefix(PrefixDefinition("deci", "d", 1e-1));
    registry.definePrefix(PrefixDefinition("deca", "da", 1e1, {"deka"}));
    registry.definePrefix(PrefixDefinition("hecto", "h", 1e2));
    registry.definePrefix(PrefixDefinition("kilo", "k", 1e3));
    registry.definePrefix(PrefixDefinition("mega", "M", 1e6));
    registry.definePrefix(PrefixDefinition("giga", "G", 1e9));
    registry.definePrefix(PrefixDefinition("tera", "T", 1e12));
    registry.definePrefix(PrefixDefinition("peta", "P", 1e15));
    registry.definePrefix(PrefixDefinition("exa", "E", 1e18));
    registry.definePrefix(PrefixDefinition("zetta", "Z", 1e21));
    registry.definePrefix(PrefixDefinition("yotta", "Y", 1e24));

    // Binary
    registry.definePrefix(PrefixDefinition("kibi", "Ki", 1024.0));
    registry.definePrefix(PrefixDefinition("mebi", "Mi", std::pow(2.0, 20)));
    registry.definePrefix(PrefixDefinition("gibi", "Gi", std::pow(2.0, 30)));
    registry.definePrefix(PrefixDefinition("tebi", "Ti", std::pow(2.0, 40)));
    registry.definePrefix(PrefixDefinition("pebi", "Pi", std::pow(2.0, 50)));
}

void addDerivedDimensions(UnitRegistry& registry) {
    addDimension(registry, "[area]", "[length] ** 2");
    addDimension(registry, "[volume]", "[length] ** 3");
    addDimension(registry, "[frequency]", "1 / [time]");
    addDimension(registry, "[wavenumber]", "1 / [length]");
    addDimension(registry, "[velocity]", "[length] / [time]");
    addDimension(registry, "[acceleration]", "[velocity] / [time]");
    addDimension(registry, "[force]", "[mass] * [acceleration]");
    addDimension(registry, "[energy]", "[force] * [length]");
    addDimension(registry, "[power]", "[energy] / [time]");
    addDimension(registry, "[pressure]", "[force] / [area]");
    addDimension(registry, "[density]", "[mass] / [volume]");
    addDimension(registry, "[viscosity]", "[pressure] * [time]");
    addDimension(registry, "[charge]", "[current] * [time]");
    addDimension(registry, "[electric_potential]", "[energy] / [charge]");
}

// =============================================================================
// Length, Mass, Time
// =============================================================================

void addLengthUnits(UnitRegistry& registry) {
    // Imperial/US
    addUnit(registry, "inch", "in", 0.0254, "meter", "length", {"inches"});
    addUnit(registry, "foot", "ft", "12 * inch", "length", {"feet"});
    addUnit(registry, "yard", "yd", "3 * foot", "length");
    addUnit(registry, "mile", "mi", "5280 * foot", "length");
    addUnit(registry, "nautical_mile", "nmi", 1852.0, "meter", "length");

    // Scientific
    addUnit(registry, "angstrom", "Å", 1e-10, "meter", "length", {"angstroms"});
    addUnit(registry, "astronomical_unit", "au", 149597870700.0, "meter", "length");
    addUnit(registry, "light_year", "ly", 9460730472580800.0, "meter", "length",
            {"lightyear"});
    addUnit(registry, "parsec", "pc", 3.0856775814913673e16, "meter", "length");
}

void addMassUnits(UnitRegistry& registry) {
    addUnit(registry, "gram", "g", 1e-3, "kilogram", "mass", {"gramme"});
    addUnit(registry, "tonne", "t", 1000.0, "kilogram", "mass", {"metric_ton"});
    addUnit(registry, "pound", "lb", 0.45359237, "kilogram", "mass", {"lbm"});
    addUnit(registry, "ounce", "oz", 1.0 / 16.0, "pound", "mass");
    addUnit(registry, "slug", "", 14.593902937206364, "kilogram", "mass");
}

void addTimeUnits(UnitRegistry& registry) {
    addUnit(registry, "minute", "min", "60 * second", "time");
    addUnit(registry, "hour", "h", "60 * minute", "time", {"hr"});
    addUnit(registry, "day", "d", "24 * hour", "time");
    addUnit(registry, "week", "", "7 * day", "time");
    addUnit(registry, "year", "yr", "365.25 * day", "time", {"julian_year"});
}

// =============================================================================
// Temperature
// =============================================================================

void addTemperatureUnits(UnitRegistry& registry) {
    UnitsContainer kelvin = registry.parseUnits("kelvin");

    registry.define(UnitDefinition::offset("degC", "°C", kelvin, 1.0, 273.15, "temperature",
                                           {"celsius", "degree_Celsius"}));

    // 32 degF = 273.15 K
    registry.define(UnitDefinition::offset("degF", "°F", kelvin, 5.0 / 9.0,
                                           233.15 + 200.0 / 9.0, "temperature",
                                           {"fahrenheit", "degree_Fahrenheit"}));

    addUnit(registry, "degR", "°R", 5.0 / 9.0, "kelvin", "temperature",
            {"rankine", "degree_Rankine"});
}

// =============================================================================
// Area, Volume
// =============================================================================

void addAreaUnits(UnitRegistry& registry) {
    addUnit(registry, "hectare", "ha", "10000 * meter ** 2", "area");
    addUnit(registry, "acre", "ac", 4046.8564224, "meter ** 2", "area");
}

void addVolumeUnits(UnitRegistry& registry) {
    addUnit(registry, "liter", "L", "1e-3 * meter ** 3", "volume", {"l", "litre"});
    addUnit(registry, "gallon", "gal", "231 * inch ** 3", "volume");
    addUnit(registry, "barrel", "bbl", "42 * gallon", "volume");
}

// =============================================================================
// Mechanics
// =============================================================================

void addMechanicsUnits(UnitRegistry& registry) {
    addUnit(registry, "hertz", "Hz", "1 / second", "frequency");
    addUnit(registry, "newton", "N", "kilogram * meter / second ** 2", "force");
    addUnit(registry, "dyne", "dyn", "gram * centimeter / second ** 2", "force");
    addUnit(registry, "standard_gravity", "g_0", 9.80665, "meter / second ** 2",
            "acceleration", {"g_n"});
    addUnit(registry, "pound_force", "lbf", "pound * standard_gravity", "force");
}

void addEnergyUnits(UnitRegistry& registry) {
    addUnit(registry, "joule", "J", "newton * meter", "energy");
    addUnit(registry, "erg", "", "dyne * centimeter", "energy");
    addUnit(registry, "calorie", "cal", 4.184, "joule", "energy", {"thermochemical_calorie"});
    addUnit(registry, "watt_hour", "Wh", "3600 * joule", "energy");
    addUnit(registry, "british_thermal_unit", "BTU", 1055.05585262, "joule", "energy",
            {"Btu"});
}

void addPowerUnits(UnitRegistry& registry) {
    addUnit(registry, "watt", "W", "joule / second", "power");
    addUnit(registry, "horsepower", "hp", 745.69987158227022, "watt", "power");
}

void addPressureUnits(UnitRegistry& registry) {
    addUnit(registry, "pascal", "Pa", "newton / meter ** 2", "pressure");
    addUnit(registry, "bar", "", 1e5, "pascal", "pressure");
    addUnit(registry, "atmosphere", "atm", 101325.0, "pascal", "pressure",
            {"standard_atmosphere"});
    addUnit(registry, "psi", "", "pound_force / inch ** 2", "pressure");
    addUnit(registry, "torr", "Torr", 1.0 / 760.0, "atmosphere", "pressure");
}

// =============================================================================
// Electrical, Angle, Information
// =============================================================================

void addElectricalUnits(UnitRegistry& registry) {
    addUnit(registry, "coulomb", "C", "ampere * second", "electrical");
    addUnit(registry, "volt", "V", "joule / coulomb", "electrical");
    addUnit(registry, "ohm", "Ω", "volt / ampere", "electrical");
}

void addAngleUnits(UnitRegistry& registry) {
    addUnit(registry, "degree", "deg", PI / 180.0, "radian", "angle");
    addUnit(registry, "arcminute", "arcmin", 1.0 / 60.0, "degree", "angle");
    addUnit(registry, "arcsecond", "arcsec", 1.0 / 60.0, "arcminute", "angle");
    addUnit(registry, "revolution", "rev", 2.0 * PI, "radian", "angle", {"turn"});
}

void addInformationUnits(UnitRegistry& registry) {
    addUnit(registry, "byte", "B", "8 * bit", "information", {"octet"});
}

// =============================================================================
// Oilfield and Dimensionless
// =============================================================================

void addFieldUnits(UnitRegistry& registry) {
    addUnit(registry, "poise", "P", 0.1, "pascal * second", "viscosity");
    addUnit(registry, "darcy", "D", 9.869233e-13, "meter ** 2", "permeability");
    addUnit(registry, "percent", "", 0.01, "", "dimensionless");
    addUnit(registry, "ppm", "", 1e-6, "", "dimensionless");
}

// =============================================================================
// Physical Constants
// =============================================================================

void addConstants(UnitRegistry& registry) {
    addUnit(registry, "speed_of_light", "c", 299792458.0, "meter / second", "constants",
            {"c_0"});
    addUnit(registry, "planck_constant", "", 6.62607015e-34, "joule * second", "constants");
    addUnit(registry, "elementary_charge", "e", 1.602176634e-19, "coulomb", "constants");
    addUnit(registry, "boltzmann_constant", "k_B", 1.380649e-23, "joule / kelvin", "constants");
    addUnit(registry, "avogadro_constant", "N_A", 6.02214076e23, "1 / mole", "constants");

    // Needs the elementary charge
    addUnit(registry, "electron_volt", "eV", "elementary_charge * volt", "energy");
}

// =============================================================================
// Logarithmic Units
// =============================================================================

void addLogarithmicUnits(UnitRegistry& registry) {
    UnitsContainer dimensionless;
    UnitsContainer watt = registry.parseUnits("watt");

    registry.define(UnitDefinition::logarithmic("decibel", "dB", dimensionless, 1.0,
                                                10.0, 10.0, "logarithmic"));
    registry.define(UnitDefinition::logarithmic("bel", "", dimensionless, 1.0,
                                                10.0, 1.0, "logarithmic"));
    registry.define(UnitDefinition::logarithmic("neper", "Np", dimensionless, 1.0,
                                                std::exp(1.0), 0.5, "logarithmic"));
    registry.define(UnitDefinition::logarithmic("decibelmilliwatt", "dBm", watt, 1e-3,
                                                10.0, 10.0, "logarithmic"));
    registry.define(UnitDefinition::logarithmic("decibelwatt", "dBW", watt, 1.0,
                                                10.0, 10.0, "logarithmic"));
}

// Value of a constant unit in root units
double constantValue(const UnitRegistry& registry, const std::string& name) {
    return registry.getBaseFactor(registry.parseUnits(name)).scale;
}

} // namespace

void loadDefaultDefinitions(UnitRegistry& registry) {
    addBaseUnits(registry);
    addPrefixes(registry);
    addDerivedDimensions(registry);

    addLengthUnits(registry);
    addMassUnits(registry);
    addTimeUnits(registry);
    addTemperatureUnits(registry);
    addAreaUnits(registry);
    addVolumeUnits(registry);
    addMechanicsUnits(registry);
    addEnergyUnits(registry);
    addPowerUnits(registry);
    addPressureUnits(registry);
    addElectricalUnits(registry);
    addAngleUnits(registry);
    addInformationUnits(registry);
    addFieldUnits(registry);
    addConstants(registry);
    addLogarithmicUnits(registry);
}

void loadDefaultContexts(UnitRegistry& registry) {
    const DimensionVector length = registry.parseDimensions("[length]");
    const DimensionVector frequency = registry.parseDimensions("[frequency]");
    const DimensionVector wavenumber = registry.parseDimensions("[wavenumber]");
    const DimensionVector energy = registry.parseDimensions("[energy]");
    const DimensionVector temperature = registry.parseDimensions("[temperature]");

    // Spectroscopy: wavelength, frequency, energy and wavenumber of light in
    // a medium of refractive index n
    auto spectroscopy = std::make_shared<Context>("spectroscopy",
                                                  std::vector<std::string>{"sp"},
                                                  ContextParameters{{"n", 1.0}});

    TransformFunction inverse_with_c = [](const UnitRegistry& reg, double value,
                                          const ContextParameters& params) {
        return constantValue(reg, "speed_of_light") / (params.at("n") * value);
    };
    spectroscopy->addBidirectional(length, frequency, inverse_with_c, inverse_with_c);

    spectroscopy->addBidirectional(
        frequency, energy,
        [](const UnitRegistry& reg, double value, const ContextParameters&) {
            return constantValue(reg, "planck_constant") * value;
        },
        [](const UnitRegistry& reg, double value, const ContextParameters&) {
            return value / constantValue(reg, "planck_constant");
        });

    TransformFunction reciprocal = [](const UnitRegistry&, double value,
                                      const ContextParameters&) {
        return 1.0 / value;
    };
    spectroscopy->addBidirectional(wavenumber, length, reciprocal, reciprocal);

    registry.addContext(spectroscopy);

    // Boltzmann: thermal energy k_B * T
    auto boltzmann = std::make_shared<Context>("boltzmann");
    boltzmann->addBidirectional(
        temperature, energy,
        [](const UnitRegistry& reg, double value, const ContextParameters&) {
            return constantValue(reg, "boltzmann_constant") * value;
        },
        [](const UnitRegistry& reg, double value, const ContextParameters&) {
            return value / constantValue(reg, "boltzmann_constant");
        });

    registry.addContext(boltzmann);
}

} // namespace UREG
