#ifndef UNIT_REGISTRY_HPP
#define UNIT_REGISTRY_HPP

#include "Context.hpp"
#include "UnitDefinition.hpp"
#include "UnitErrors.hpp"
#include "UnitExpression.hpp"
#include "UnitsContainer.hpp"
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace UREG {

/**
 * @brief What to do when a definition reuses a registered name
 */
enum class RedefinitionPolicy {
    RAISE,      ///< Throw RedefinitionError
    WARN,       ///< Replace and print a warning
    IGNORE      ///< Replace silently
};

/**
 * @brief Registry configuration
 */
struct RegistryOptions {
    RedefinitionPolicy on_redefinition;
    bool autoconvert_offset_to_baseunit;    // Multiply offset quantities via root units
    bool case_sensitive;
    bool load_defaults;                     // Populate with the built-in definitions

    RegistryOptions()
        : on_redefinition(RedefinitionPolicy::RAISE),
          autoconvert_offset_to_baseunit(false),
          case_sensitive(true),
          load_defaults(true) {}
};

/**
 * @brief How conversions treat affine units that appear ambiguously
 */
enum class OffsetMode {
    STRICT,     ///< Ambiguous offsets raise OffsetUnitCalculusError
    AS_DELTA    ///< Every offset is dropped (differences of temperature)
};

/**
 * @brief Reduction of a units container to root (base) units
 *
 * A value v in the container is v * scale + offset in root_units, or
 * scale * log_base ^ (v / log_factor) when the container is a single
 * logarithmic unit.
 */
struct BaseFactor {
    double scale;
    double offset;                  // Only for a single affine unit with exponent 1
    UnitsContainer root_units;
    bool offset_ambiguous;          // Affine unit in a compound or with exponent != 1
    bool logarithmic;
    double log_base;
    double log_factor;
    bool logarithmic_ambiguous;     // Logarithmic unit anywhere else

    BaseFactor()
        : scale(1.0), offset(0.0), offset_ambiguous(false), logarithmic(false),
          log_base(10.0), log_factor(10.0), logarithmic_ambiguous(false) {}

    double toRoot(double value) const;
    double fromRoot(double value) const;
};

/**
 * @brief Conversion from one units container to another
 *
 * Linear/affine conversions are `to = from * multiplier + adjustment`.
 * Logarithmic and context-bridged conversions carry a transform instead;
 * multiplier and adjustment are then unused.
 */
struct Conversion {
    double multiplier;
    double adjustment;
    std::function<double(double)> transform;

    Conversion() : multiplier(1.0), adjustment(0.0) {}

    static Conversion identity() { return Conversion(); }

    static Conversion affine(double multiplier, double adjustment) {
        Conversion c;
        c.multiplier = multiplier;
        c.adjustment = adjustment;
        return c;
    }

    static Conversion nonlinear(std::function<double(double)> fn) {
        Conversion c;
        c.transform = std::move(fn);
        return c;
    }

    bool isLinear() const { return !transform; }

    double apply(double value) const {
        return transform ? transform(value) : value * multiplier + adjustment;
    }

    std::vector<double> apply(const std::vector<double>& values) const;
};

/**
 * @brief Registry of units, prefixes, dimensions and contexts
 *
 * This class provides:
 * - Definition of units, prefixes, derived dimensions and contexts
 * - Resolution of names, symbols, aliases, prefixed and plural forms
 * - Dimensional analysis of compound units
 * - Linear, affine, logarithmic and context-bridged conversion factors
 *
 * Readers may run concurrently with each other. Definitions take an
 * exclusive lock and invalidate every cache.
 */
class UnitRegistry {
public:
    explicit UnitRegistry(const RegistryOptions& options = RegistryOptions());
    ~UnitRegistry() = default;

    UnitRegistry(const UnitRegistry&) = delete;
    UnitRegistry& operator=(const UnitRegistry&) = delete;

    const RegistryOptions& options() const { return options_; }

    // =========================================================================
    // Definitions
    // =========================================================================

    /**
     * @brief Register a unit
     *
     * Reference names are canonicalized on registration. Offset units get a
     * companion "delta_<name>" unit registered in the same step.
     *
     * @throws DefinitionSyntaxError if the record is malformed
     * @throws UndefinedUnitError if the reference names unknown units
     * @throws RedefinitionError on a name clash under RedefinitionPolicy::RAISE
     */
    void define(const UnitDefinition& definition);

    /**
     * @brief Replace an existing unit (its names may be reused)
     * @throws UndefinedUnitError if no unit with that name exists
     */
    void redefine(const UnitDefinition& definition);

    void definePrefix(const PrefixDefinition& prefix);

    /**
     * @brief Register a dimension; derived ones are expanded to base dimensions
     */
    void defineDimension(const DimensionDefinition& dimension);

    /**
     * @brief Add an alias to a registered unit
     */
    void addAlias(const std::string& unit_name, const std::string& alias);

    void addContext(std::shared_ptr<const Context> context);

    /**
     * @brief Look up a registered context by name or alias
     * @throws std::out_of_range if unknown
     */
    std::shared_ptr<const Context> getContext(const std::string& name) const;
    bool hasContext(const std::string& name) const;
    std::vector<std::string> getContextNames() const;

    // =========================================================================
    // Resolution
    // =========================================================================

    /**
     * @brief Resolve a name, symbol, alias, plural or prefixed form
     * @throws UndefinedUnitError
     */
    UnitDefinition resolve(const std::string& name) const;

    bool hasUnit(const std::string& name) const;

    /**
     * @brief Parse a unit expression into canonical unit names
     * @throws ExpressionSyntaxError, UndefinedUnitError
     */
    UnitsContainer parseUnits(const std::string& expression) const;

    /**
     * @brief Canonicalize the names of an externally built container
     * @throws UndefinedUnitError listing every unknown name
     */
    UnitsContainer parseUnits(const UnitsContainer& units) const;

    /**
     * @brief Parse an expression that may carry a numeric factor ("9.81 m/s^2")
     */
    ParsedUnitExpression parseExpression(const std::string& expression) const;

    /**
     * @brief Parse a dimension expression such as "[length] / [time]"
     * @return Dimension vector over base dimensions
     */
    DimensionVector parseDimensions(const std::string& expression) const;

    std::vector<std::string> getUnitNames() const;
    std::vector<UnitDefinition> getUnitsInCategory(const std::string& category) const;
    std::vector<std::string> getCategories() const;

    // =========================================================================
    // Dimensional Analysis
    // =========================================================================

    /**
     * @throws UndefinedUnitError, DefinitionCycleError
     */
    DimensionVector getDimensionality(const UnitsContainer& units) const;
    DimensionVector getDimensionality(const std::string& expression) const;

    BaseFactor getBaseFactor(const UnitsContainer& units) const;

    /**
     * @brief Multiplicative factor and root units (offsets ignored)
     */
    std::pair<double, UnitsContainer> getRootUnits(const UnitsContainer& units) const;

    /**
     * @brief True if both expressions resolve and share a dimensionality
     */
    bool areCompatible(const std::string& units1, const std::string& units2) const;

    bool isOffsetUnit(const std::string& name) const;

    // True for the delta companion registered alongside an offset unit
    bool isDeltaUnit(const std::string& name) const;

    /**
     * @brief Name of the delta unit paired with an offset unit
     * @throws std::invalid_argument if the unit is not an offset unit
     */
    std::string deltaUnitName(const std::string& name) const;

    // =========================================================================
    // Conversion
    // =========================================================================

    /**
     * @brief Compute the conversion between two units containers
     *
     * Contexts are consulted only when the dimensionalities differ.
     *
     * @throws DimensionalityError if no conversion path exists
     * @throws OffsetUnitCalculusError on ambiguous offsets in STRICT mode
     * @throws LogarithmicUnitCalculusError on ambiguous logarithmic units
     */
    Conversion getConversionFactor(const UnitsContainer& from, const UnitsContainer& to,
                                   const ContextStack& contexts = ContextStack(),
                                   OffsetMode mode = OffsetMode::STRICT) const;

    double convert(double value, const UnitsContainer& from, const UnitsContainer& to,
                   const ContextStack& contexts = ContextStack(),
                   OffsetMode mode = OffsetMode::STRICT) const;

    double convert(double value, const std::string& from, const std::string& to,
                   const ContextStack& contexts = ContextStack(),
                   OffsetMode mode = OffsetMode::STRICT) const;

    std::vector<double> convert(const std::vector<double>& values,
                                const std::string& from, const std::string& to,
                                const ContextStack& contexts = ContextStack(),
                                OffsetMode mode = OffsetMode::STRICT) const;

    /**
     * @brief Convert a value to root units (offsets applied)
     */
    double toBase(double value, const std::string& from) const;

    /**
     * @brief Convert a value expressed in root units to the given units
     */
    double fromBase(double value, const std::string& to) const;

private:
    using DefinitionPtr = std::shared_ptr<const UnitDefinition>;

    RegistryOptions options_;

    // Definition table (guarded by table_mutex_)
    std::map<std::string, DefinitionPtr> units_;                  // canonical name -> definition
    std::map<std::string, std::string> unit_names_;               // name/symbol/alias -> canonical
    std::map<std::string, std::string> lowercase_names_;          // lowercased token -> canonical
    std::map<std::string, PrefixDefinition> prefixes_;            // canonical name -> prefix
    std::map<std::string, std::string> prefix_names_;             // name/symbol/alias -> canonical
    std::vector<std::string> prefix_tokens_;                      // longest first
    std::map<std::string, DimensionDefinition> dimensions_;       // expanded to base dimensions
    std::map<std::string, std::string> base_units_;               // base dimension -> base unit
    std::map<std::string, std::string> delta_units_;              // delta unit -> offset unit
    std::vector<std::string> suffixes_;
    std::map<std::string, std::vector<std::string>> categories_;
    std::map<std::string, std::shared_ptr<const Context>> contexts_;
    std::map<std::string, std::string> context_names_;            // name/alias -> canonical

    // Memo caches (guarded by cache_mutex_; lock order is table then cache)
    mutable std::unordered_map<std::string, DefinitionPtr> resolution_cache_;
    mutable std::unordered_map<UnitsContainer, DimensionVector> dimensionality_cache_;
    mutable std::unordered_map<UnitsContainer, BaseFactor> base_factor_cache_;

    mutable std::shared_mutex table_mutex_;
    mutable std::shared_mutex cache_mutex_;

    // Definition helpers (exclusive table lock held)
    void defineLocked(const UnitDefinition& definition, bool replace);
    void handleRedefinition(const std::string& name, const std::string& definition_type) const;
    void checkNameClash(const std::string& token, const std::string& owner,
                        const std::map<std::string, std::string>& names,
                        const std::string& definition_type, bool replace) const;
    void removeUnitLocked(const std::string& canonical);
    void insertUnitLocked(const UnitDefinition& definition);
    UnitDefinition makeDeltaDefinition(const UnitDefinition& definition) const;
    void rebuildLowercaseIndex();
    void rebuildPrefixTokens();
    void clearCaches();

    // Query helpers (shared table lock held)
    DefinitionPtr resolveLocked(const std::string& name) const;
    DefinitionPtr lookupLocked(const std::string& name) const;
    DefinitionPtr requireLocked(const std::string& name) const;
    UnitsContainer canonicalizeLocked(const UnitsContainer& units) const;
    DimensionVector expandDimensionsLocked(const std::map<std::string, double>& dimensions) const;
    DimensionVector dimensionalityLocked(const UnitsContainer& units,
                                         std::vector<std::string>& visiting) const;
    BaseFactor baseFactorLocked(const UnitsContainer& units,
                                std::vector<std::string>& visiting) const;
    BaseFactor unitFactorLocked(const std::string& name,
                                std::vector<std::string>& visiting) const;
    Conversion conversionLocked(const UnitsContainer& from, const UnitsContainer& to,
                                const ContextStack& contexts, OffsetMode mode) const;
};

/**
 * @brief Process-wide registry loaded with the default definitions
 */
class RegistryManager {
public:
    static UnitRegistry& getInstance() {
        static UnitRegistry instance;
        return instance;
    }

private:
    RegistryManager() = default;
};

// Convenience functions for quick access
inline double convertUnits(double value, const std::string& from, const std::string& to) {
    return RegistryManager::getInstance().convert(value, from, to);
}

inline double toSI(double value, const std::string& unit) {
    return RegistryManager::getInstance().toBase(value, unit);
}

inline double fromSI(double value, const std::string& unit) {
    return RegistryManager::getInstance().fromBase(value, unit);
}

} // namespace UREG

#endif // UNIT_REGISTRY_HPP
