#ifndef CONFIG_READER_HPP
#define CONFIG_READER_HPP

#include "Context.hpp"
#include "Quantity.hpp"
#include "UnitRegistry.hpp"
#include <fstream>
#include <map>
#include <string>
#include <vector>

namespace UREG {

/**
 * @brief INI-style configuration reader with unit-aware accessors
 *
 * File format:
 * @code
 * # comment
 * [registry]
 * on_redefinition = warn
 * case_sensitive = true
 *
 * [contexts]
 * active = sp, boltzmann
 * sp.n = 1.33
 *
 * [well]
 * depth = 2.5 km
 * @endcode
 *
 * Values with units are interpreted by the registry given at construction,
 * or by the process-wide default registry.
 */
class ConfigReader {
public:
    ConfigReader();
    explicit ConfigReader(const UnitRegistry& registry);

    bool loadFile(const std::string& filename);

    // =========================================================================
    // Registry Configuration
    // =========================================================================

    /**
     * @brief Read [registry] into options
     *
     * Keys: on_redefinition (raise | warn | ignore),
     * autoconvert_offset_to_baseunit, case_sensitive, load_defaults.
     * Keys that are absent leave the corresponding option untouched.
     *
     * @return true if the [registry] section exists
     */
    bool parseRegistryOptions(RegistryOptions& options) const;

    /**
     * @brief Build the context stack named by [contexts]
     *
     * `active` lists context names or aliases, oldest first. Parameter
     * overrides are given as `<context>.<parameter> = value`, where
     * <context> is the name used in `active` or the canonical name.
     * Unknown contexts and parameters are skipped with a warning.
     */
    ContextStack buildContextStack(const UnitRegistry& registry) const;
    ContextStack buildContextStack() const;

    // =========================================================================
    // Value Accessors
    // =========================================================================

    std::string getString(const std::string& section, const std::string& key,
                         const std::string& default_val = "") const;
    int getInt(const std::string& section, const std::string& key,
              int default_val = 0) const;
    double getDouble(const std::string& section, const std::string& key,
                    double default_val = 0.0) const;
    bool getBool(const std::string& section, const std::string& key,
                bool default_val = false) const;

    // =========================================================================
    // Unit-Aware Value Accessors
    // =========================================================================

    /**
     * @brief Read a value such as "2.5 km" as a quantity
     * @param default_unit Units applied to a bare number
     * @throws std::out_of_range if the key is missing
     * @throws ExpressionSyntaxError, UndefinedUnitError on malformed values
     */
    Quantity getQuantity(const std::string& section, const std::string& key,
                         const std::string& default_unit = "") const;

    /**
     * @brief Get double value converted to target units
     * @param section Config section
     * @param key Config key
     * @param default_val Returned when the key is missing or cannot be converted
     * @param target_unit Units of the result; root units when empty. A bare
     *                    number is taken to be in these units already.
     */
    double getDoubleWithUnit(const std::string& section, const std::string& key,
                            double default_val = 0.0,
                            const std::string& target_unit = "") const;

    /**
     * @brief Comma separated values, each with optional units
     *
     * With an empty target, bare numbers are returned as written and values
     * with units in root units.
     */
    std::vector<double> getDoubleArrayWithUnit(const std::string& section,
                                               const std::string& key,
                                               const std::string& target_unit = "") const;

    // =========================================================================
    // Section/Key Query Methods
    // =========================================================================

    bool hasSection(const std::string& section) const;
    bool hasKey(const std::string& section, const std::string& key) const;

    // =========================================================================
    // Template Generation
    // =========================================================================

    static void generateTemplate(const std::string& filename);

private:
    std::map<std::string, std::map<std::string, std::string>> data;
    const UnitRegistry* registry_;

    void parseLine(const std::string& raw, int line_num, std::string& section);

    static std::string trim(const std::string& str);
    static std::vector<std::string> split(const std::string& str, char delim);

    // Value in target units, or in root units when target is empty
    double convertValue(const std::string& text, const std::string& target_unit) const;
};

} // namespace UREG

#endif // CONFIG_READER_HPP
