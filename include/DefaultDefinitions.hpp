#ifndef DEFAULT_DEFINITIONS_HPP
#define DEFAULT_DEFINITIONS_HPP

namespace UREG {

class UnitRegistry;

/**
 * @brief Populate a registry with the built-in unit set
 *
 * Covers:
 * - SI base units, SI and binary prefixes, derived dimensions
 * - Metric, imperial/US and oilfield units
 * - Affine temperatures (degC, degF) and their delta units
 * - Physical constants as units (c, e, k_B, N_A, ...)
 * - Logarithmic units (dB, B, Np, dBm, dBW)
 */
void loadDefaultDefinitions(UnitRegistry& registry);

/**
 * @brief Register the "spectroscopy" (alias "sp") and "boltzmann" contexts
 *
 * Requires the default definitions to be loaded.
 */
void loadDefaultContexts(UnitRegistry& registry);

} // namespace UREG

#endif // DEFAULT_DEFINITIONS_HPP
