#include "UnitRegistry.hpp"
#include "DefaultDefinitions.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <deque>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace UREG {

namespace {

std::string toLowerCase(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

void checkToken(const std::string& token, const std::string& what) {
    if (token.empty()) {
        throw DefinitionSyntaxError(what + " is empty");
    }
    for (char c : token) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            throw DefinitionSyntaxError(what + " '" + token + "' contains whitespace");
        }
    }
}

Converter converterOf(const BaseFactor& factor) {
    if (factor.logarithmic) {
        return Converter::logarithmicScale(factor.scale, factor.log_base, factor.log_factor);
    }
    return Converter(factor.scale, factor.offset);
}

struct ContextHop {
    const ContextRule* rule;
    const ContextParameters* parameters;
};

// Breadth-first search over dimensionalities. Neighbours are visited in
// stack order (most recent context first), so the first rule found for an
// edge is the one that is used.
std::vector<ContextHop> findContextPath(const DimensionVector& source,
                                        const DimensionVector& destination,
                                        const ContextStack& contexts) {
    std::map<DimensionVector, std::pair<DimensionVector, ContextHop>> parent;
    std::set<DimensionVector> visited{source};
    std::deque<DimensionVector> queue{source};
    const auto entries = contexts.activeEntries();

    while (!queue.empty() && visited.count(destination) == 0) {
        DimensionVector node = queue.front();
        queue.pop_front();

        for (const ContextStack::Entry* entry : entries) {
            for (const ContextRule& rule : entry->context->rules()) {
                if (rule.source != node || visited.count(rule.destination) > 0) continue;
                visited.insert(rule.destination);
                parent.emplace(rule.destination,
                               std::make_pair(node, ContextHop{&rule, &entry->parameters}));
                queue.push_back(rule.destination);
            }
        }
    }

    std::vector<ContextHop> path;
    if (visited.count(destination) == 0) return path;

    DimensionVector node = destination;
    while (node != source) {
        const auto& step = parent.at(node);
        path.push_back(step.second);
        node = step.first;
    }
    std::reverse(path.begin(), path.end());
    return path;
}

} // namespace

// =============================================================================
// BaseFactor / Conversion
// =============================================================================

double BaseFactor::toRoot(double value) const {
    return converterOf(*this).toReference(value);
}

double BaseFactor::fromRoot(double value) const {
    return converterOf(*this).fromReference(value);
}

std::vector<double> Conversion::apply(const std::vector<double>& values) const {
    std::vector<double> result;
    result.reserve(values.size());
    for (double value : values) {
        result.push_back(apply(value));
    }
    return result;
}

// =============================================================================
// UnitRegistry Implementation
// =============================================================================

UnitRegistry::UnitRegistry(const RegistryOptions& options)
    : options_(options), suffixes_{"", "s"} {
    if (options_.load_defaults) {
        loadDefaultDefinitions(*this);
        loadDefaultContexts(*this);
    }
}

// =============================================================================
// Definitions
// =============================================================================

void UnitRegistry::define(const UnitDefinition& definition) {
    definition.validate();
    std::unique_lock<std::shared_mutex> lock(table_mutex_);
    defineLocked(definition, false);
}

void UnitRegistry::redefine(const UnitDefinition& definition) {
    definition.validate();
    std::unique_lock<std::shared_mutex> lock(table_mutex_);
    if (units_.count(definition.name) == 0) {
        throw UndefinedUnitError(definition.name);
    }
    defineLocked(definition, true);
}

void UnitRegistry::defineLocked(const UnitDefinition& definition, bool replace) {
    if (definition.kind == UnitKind::PREFIXED) {
        throw DefinitionSyntaxError("prefixed unit '" + definition.name +
                                    "' cannot be registered; define the prefix instead");
    }

    UnitDefinition record = definition;
    record.reference = canonicalizeLocked(definition.reference);

    std::vector<UnitDefinition> records{record};
    if (record.isOffset()) {
        records.push_back(makeDeltaDefinition(record));
    }

    // Validate everything before touching the table
    for (const auto& rec : records) {
        for (const auto& token : rec.allNames()) {
            checkNameClash(token, rec.name, unit_names_, "unit", replace);
        }
    }

    if (record.isBase() && !record.dimension.empty()) {
        auto dim = dimensions_.find(record.dimension);
        if (dim != dimensions_.end() && !dim->second.isBase()) {
            throw DefinitionSyntaxError("base unit '" + record.name + "' cannot define " +
                                        record.dimension + ", which is a derived dimension");
        }
        auto base = base_units_.find(record.dimension);
        if (base != base_units_.end() && base->second != record.name) {
            handleRedefinition(record.dimension, "base unit " + base->second);
        }
    }

    auto previous = units_.find(record.name);
    if (previous != units_.end() && previous->second->isOffset()) {
        removeUnitLocked("delta_" + record.name);
    }
    for (const auto& rec : records) {
        if (units_.count(rec.name) > 0) {
            removeUnitLocked(rec.name);
        }
        insertUnitLocked(rec);
    }
    if (records.size() > 1) {
        delta_units_[records.back().name] = record.name;
    }

    if (record.isBase() && !record.dimension.empty()) {
        dimensions_.emplace(record.dimension, DimensionDefinition(record.dimension));
        base_units_[record.dimension] = record.name;
    }

    rebuildLowercaseIndex();
    clearCaches();
}

void UnitRegistry::handleRedefinition(const std::string& name,
                                      const std::string& definition_type) const {
    switch (options_.on_redefinition) {
        case RedefinitionPolicy::RAISE:
            throw RedefinitionError(name, definition_type);
        case RedefinitionPolicy::WARN:
            std::cerr << "Warning: Redefining '" << name << "' (" << definition_type << ")"
                      << std::endl;
            break;
        case RedefinitionPolicy::IGNORE:
            break;
    }
}

void UnitRegistry::checkNameClash(const std::string& token, const std::string& owner,
                                  const std::map<std::string, std::string>& names,
                                  const std::string& definition_type, bool replace) const {
    auto it = names.find(token);
    if (it == names.end()) return;
    if (replace && it->second == owner) return;
    handleRedefinition(token, definition_type);
}

void UnitRegistry::removeUnitLocked(const std::string& canonical) {
    units_.erase(canonical);
    delta_units_.erase(canonical);

    for (auto it = unit_names_.begin(); it != unit_names_.end();) {
        if (it->second == canonical) {
            it = unit_names_.erase(it);
        } else {
            ++it;
        }
    }

    for (auto it = categories_.begin(); it != categories_.end();) {
        auto& names = it->second;
        names.erase(std::remove(names.begin(), names.end(), canonical), names.end());
        if (names.empty()) {
            it = categories_.erase(it);
        } else {
            ++it;
        }
    }

    for (auto it = base_units_.begin(); it != base_units_.end();) {
        if (it->second == canonical) {
            it = base_units_.erase(it);
        } else {
            ++it;
        }
    }
}

void UnitRegistry::insertUnitLocked(const UnitDefinition& definition) {
    units_[definition.name] = std::make_shared<const UnitDefinition>(definition);
    for (const auto& token : definition.allNames()) {
        unit_names_[token] = definition.name;
    }
    if (!definition.category.empty()) {
        auto& names = categories_[definition.category];
        if (std::find(names.begin(), names.end(), definition.name) == names.end()) {
            names.push_back(definition.name);
        }
    }
}

UnitDefinition UnitRegistry::makeDeltaDefinition(const UnitDefinition& definition) const {
    // Offset units in the reference become their own delta units
    UnitsContainer reference = definition.reference;
    for (const auto& entry : definition.reference) {
        DefinitionPtr ref = lookupLocked(entry.first);
        if (ref && ref->isOffset()) {
            reference = reference.renamed(entry.first, "delta_" + entry.first);
        }
    }

    std::vector<std::string> aliases;
    for (const auto& alias : definition.aliases) {
        aliases.push_back("delta_" + alias);
    }

    std::string symbol = definition.symbol.empty() ? "" : "Δ" + definition.symbol;
    return UnitDefinition::derived("delta_" + definition.name, symbol, reference,
                                   definition.converter.scale, definition.category, aliases);
}

void UnitRegistry::rebuildLowercaseIndex() {
    lowercase_names_.clear();
    for (const auto& entry : unit_names_) {
        std::string lower = toLowerCase(entry.first);
        if (lower == entry.first) {
            // An all-lowercase token wins over mixed-case ones
            lowercase_names_[lower] = entry.second;
        } else {
            lowercase_names_.emplace(lower, entry.second);
        }
    }
}

void UnitRegistry::definePrefix(const PrefixDefinition& prefix) {
    prefix.validate();
    std::unique_lock<std::shared_mutex> lock(table_mutex_);

    for (const auto& token : prefix.allNames()) {
        checkNameClash(token, prefix.name, prefix_names_, "prefix", false);
    }

    if (prefixes_.count(prefix.name) > 0) {
        for (auto it = prefix_names_.begin(); it != prefix_names_.end();) {
            if (it->second == prefix.name) {
                it = prefix_names_.erase(it);
            } else {
                ++it;
            }
        }
    }

    prefixes_[prefix.name] = prefix;
    for (const auto& token : prefix.allNames()) {
        prefix_names_[token] = prefix.name;
    }

    rebuildPrefixTokens();
    clearCaches();
}

void UnitRegistry::rebuildPrefixTokens() {
    prefix_tokens_.clear();
    for (const auto& entry : prefix_names_) {
        prefix_tokens_.push_back(entry.first);
    }
    std::sort(prefix_tokens_.begin(), prefix_tokens_.end(),
              [](const std::string& a, const std::string& b) {
                  if (a.size() != b.size()) return a.size() > b.size();
                  return a < b;
              });
}

void UnitRegistry::defineDimension(const DimensionDefinition& dimension) {
    dimension.validate();
    std::unique_lock<std::shared_mutex> lock(table_mutex_);

    if (dimensions_.count(dimension.name) > 0) {
        handleRedefinition(dimension.name, "dimension");
        if (base_units_.count(dimension.name) > 0 && !dimension.isBase()) {
            throw DefinitionSyntaxError("dimension " + dimension.name +
                                        " is defined by a base unit and cannot be derived");
        }
    }

    DimensionDefinition stored(dimension.name);
    if (!dimension.isBase()) {
        stored.reference = expandDimensionsLocked(dimension.reference.entries());
    }
    dimensions_[dimension.name] = stored;
    clearCaches();
}

void UnitRegistry::addAlias(const std::string& unit_name, const std::string& alias) {
    checkToken(alias, "Alias");
    std::unique_lock<std::shared_mutex> lock(table_mutex_);

    auto it = unit_names_.find(unit_name);
    if (it == unit_names_.end()) {
        throw UndefinedUnitError(unit_name);
    }
    const std::string canonical = it->second;
    checkNameClash(alias, canonical, unit_names_, "alias", false);

    UnitDefinition updated = *units_.at(canonical);
    updated.aliases.push_back(alias);
    units_[canonical] = std::make_shared<const UnitDefinition>(updated);
    unit_names_[alias] = canonical;

    rebuildLowercaseIndex();
    clearCaches();
}

void UnitRegistry::addContext(std::shared_ptr<const Context> context) {
    if (!context) {
        throw std::invalid_argument("Cannot register a null context");
    }
    std::unique_lock<std::shared_mutex> lock(table_mutex_);

    std::vector<std::string> tokens{context->name()};
    tokens.insert(tokens.end(), context->aliases().begin(), context->aliases().end());
    for (const auto& token : tokens) {
        checkNameClash(token, context->name(), context_names_, "context", false);
    }

    if (contexts_.count(context->name()) > 0) {
        for (auto it = context_names_.begin(); it != context_names_.end();) {
            if (it->second == context->name()) {
                it = context_names_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (const auto& token : tokens) {
        context_names_[token] = context->name();
    }
    contexts_[context->name()] = std::move(context);
}

std::shared_ptr<const Context> UnitRegistry::getContext(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(table_mutex_);
    auto it = context_names_.find(name);
    if (it == context_names_.end()) {
        throw std::out_of_range("Unknown context: " + name);
    }
    return contexts_.at(it->second);
}

bool UnitRegistry::hasContext(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(table_mutex_);
    return context_names_.count(name) > 0;
}

std::vector<std::string> UnitRegistry::getContextNames() const {
    std::shared_lock<std::shared_mutex> lock(table_mutex_);
    std::vector<std::string> result;
    for (const auto& entry : contexts_) {
        result.push_back(entry.first);
    }
    return result;
}

void UnitRegistry::clearCaches() {
    std::unique_lock<std::shared_mutex> lock(cache_mutex_);
    resolution_cache_.clear();
    dimensionality_cache_.clear();
    base_factor_cache_.clear();
}

// =============================================================================
// Resolution
// =============================================================================

UnitDefinition UnitRegistry::resolve(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(table_mutex_);
    return *requireLocked(name);
}

bool UnitRegistry::hasUnit(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(table_mutex_);
    return resolveLocked(name) != nullptr;
}

UnitRegistry::DefinitionPtr UnitRegistry::resolveLocked(const std::string& name) const {
    {
        std::shared_lock<std::shared_mutex> cache_lock(cache_mutex_);
        auto it = resolution_cache_.find(name);
        if (it != resolution_cache_.end()) return it->second;
    }

    DefinitionPtr found = lookupLocked(name);
    if (found) {
        std::unique_lock<std::shared_mutex> cache_lock(cache_mutex_);
        resolution_cache_.emplace(name, found);
    }
    return found;
}

UnitRegistry::DefinitionPtr UnitRegistry::lookupLocked(const std::string& name) const {
    auto exact = unit_names_.find(name);
    if (exact != unit_names_.end()) {
        return units_.at(exact->second);
    }

    // Candidates without a suffix come before suffixed ones; for each stem
    // the bare unit comes first, then prefixes from longest to shortest.
    for (const auto& suffix : suffixes_) {
        if (name.size() <= suffix.size()) continue;
        if (name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) continue;
        const std::string stem = name.substr(0, name.size() - suffix.size());

        if (!suffix.empty()) {
            auto it = unit_names_.find(stem);
            if (it != unit_names_.end()) return units_.at(it->second);
        }

        for (const auto& token : prefix_tokens_) {
            if (stem.size() <= token.size() || stem.compare(0, token.size(), token) != 0) {
                continue;
            }
            auto unit_it = unit_names_.find(stem.substr(token.size()));
            if (unit_it == unit_names_.end()) continue;

            const DefinitionPtr& unit = units_.at(unit_it->second);
            const PrefixDefinition& prefix = prefixes_.at(prefix_names_.at(token));
            if (!unit->isMultiplicative() || !prefix.appliesTo(unit->name)) continue;

            auto synthesized = std::make_shared<UnitDefinition>();
            synthesized->name = prefix.name + unit->name;
            if (!prefix.symbol.empty() && !unit->symbol.empty()) {
                synthesized->symbol = prefix.symbol + unit->symbol;
            }
            synthesized->kind = UnitKind::PREFIXED;
            synthesized->reference = UnitsContainer(unit->name);
            synthesized->converter = Converter(prefix.factor);
            synthesized->category = unit->category;
            return synthesized;
        }
    }

    if (!options_.case_sensitive) {
        auto it = lowercase_names_.find(toLowerCase(name));
        if (it != lowercase_names_.end()) return units_.at(it->second);
    }

    return nullptr;
}

UnitRegistry::DefinitionPtr UnitRegistry::requireLocked(const std::string& name) const {
    DefinitionPtr def = resolveLocked(name);
    if (!def) {
        throw UndefinedUnitError(name);
    }
    return def;
}

UnitsContainer UnitRegistry::canonicalizeLocked(const UnitsContainer& units) const {
    UnitsContainer::Storage canonical;
    std::vector<std::string> missing;
    for (const auto& entry : units) {
        DefinitionPtr def = resolveLocked(entry.first);
        if (!def) {
            missing.push_back(entry.first);
            continue;
        }
        canonical[def->name] += entry.second;
    }
    if (!missing.empty()) {
        throw UndefinedUnitError(missing);
    }
    return UnitsContainer(canonical);
}

UnitsContainer UnitRegistry::parseUnits(const std::string& expression) const {
    ParsedUnitExpression parsed = parseUnitExpression(expression);
    if (parsed.factor != 1.0) {
        throw ExpressionSyntaxError(expression, 0, "unit expression carries a numeric factor");
    }
    return parseUnits(parsed.units);
}

UnitsContainer UnitRegistry::parseUnits(const UnitsContainer& units) const {
    std::shared_lock<std::shared_mutex> lock(table_mutex_);
    return canonicalizeLocked(units);
}

ParsedUnitExpression UnitRegistry::parseExpression(const std::string& expression) const {
    ParsedUnitExpression parsed = parseUnitExpression(expression);
    parsed.units = parseUnits(parsed.units);
    return parsed;
}

DimensionVector UnitRegistry::parseDimensions(const std::string& expression) const {
    ParsedUnitExpression parsed = parseUnitExpression(expression);
    if (parsed.factor != 1.0) {
        throw ExpressionSyntaxError(expression, 0, "dimension expression carries a numeric factor");
    }
    std::shared_lock<std::shared_mutex> lock(table_mutex_);
    return expandDimensionsLocked(parsed.units.entries());
}

DimensionVector UnitRegistry::expandDimensionsLocked(
    const std::map<std::string, double>& dimensions) const {
    DimensionVector result;
    for (const auto& entry : dimensions) {
        auto it = dimensions_.find(entry.first);
        if (it == dimensions_.end()) {
            throw UndefinedUnitError(entry.first);
        }
        const DimensionDefinition& dim = it->second;
        DimensionVector expanded = dim.isBase() ? DimensionVector(dim.name) : dim.reference;
        result = result * expanded.pow(entry.second);
    }
    return result;
}

std::vector<std::string> UnitRegistry::getUnitNames() const {
    std::shared_lock<std::shared_mutex> lock(table_mutex_);
    std::vector<std::string> result;
    result.reserve(units_.size());
    for (const auto& entry : units_) {
        result.push_back(entry.first);
    }
    return result;
}

std::vector<UnitDefinition> UnitRegistry::getUnitsInCategory(const std::string& category) const {
    std::shared_lock<std::shared_mutex> lock(table_mutex_);
    std::vector<UnitDefinition> result;
    auto it = categories_.find(category);
    if (it != categories_.end()) {
        for (const auto& unit_name : it->second) {
            auto unit_it = units_.find(unit_name);
            if (unit_it != units_.end()) {
                result.push_back(*unit_it->second);
            }
        }
    }
    return result;
}

std::vector<std::string> UnitRegistry::getCategories() const {
    std::shared_lock<std::shared_mutex> lock(table_mutex_);
    std::vector<std::string> result;
    for (const auto& entry : categories_) {
        result.push_back(entry.first);
    }
    return result;
}

// =============================================================================
// Dimensional Analysis
// =============================================================================

DimensionVector UnitRegistry::getDimensionality(const UnitsContainer& units) const {
    std::shared_lock<std::shared_mutex> lock(table_mutex_);
    std::vector<std::string> visiting;
    return dimensionalityLocked(units, visiting);
}

DimensionVector UnitRegistry::getDimensionality(const std::string& expression) const {
    return getDimensionality(parseUnits(expression));
}

DimensionVector UnitRegistry::dimensionalityLocked(const UnitsContainer& units,
                                                   std::vector<std::string>& visiting) const {
    {
        std::shared_lock<std::shared_mutex> cache_lock(cache_mutex_);
        auto it = dimensionality_cache_.find(units);
        if (it != dimensionality_cache_.end()) return it->second;
    }

    DimensionVector result;
    for (const auto& entry : units) {
        DefinitionPtr def = requireLocked(entry.first);
        DimensionVector dim;
        if (def->isBase()) {
            if (!def->dimension.empty()) dim = DimensionVector(def->dimension);
        } else {
            auto seen = std::find(visiting.begin(), visiting.end(), def->name);
            if (seen != visiting.end()) {
                std::vector<std::string> chain(seen, visiting.end());
                chain.push_back(def->name);
                throw DefinitionCycleError(chain);
            }
            visiting.push_back(def->name);
            dim = dimensionalityLocked(def->reference, visiting);
            visiting.pop_back();
        }
        result = result * dim.pow(entry.second);
    }

    std::unique_lock<std::shared_mutex> cache_lock(cache_mutex_);
    dimensionality_cache_.emplace(units, result);
    return result;
}

BaseFactor UnitRegistry::getBaseFactor(const UnitsContainer& units) const {
    std::shared_lock<std::shared_mutex> lock(table_mutex_);
    std::vector<std::string> visiting;
    return baseFactorLocked(units, visiting);
}

std::pair<double, UnitsContainer> UnitRegistry::getRootUnits(const UnitsContainer& units) const {
    BaseFactor factor = getBaseFactor(units);
    return std::make_pair(factor.scale, factor.root_units);
}

BaseFactor UnitRegistry::baseFactorLocked(const UnitsContainer& units,
                                          std::vector<std::string>& visiting) const {
    {
        std::shared_lock<std::shared_mutex> cache_lock(cache_mutex_);
        auto it = base_factor_cache_.find(units);
        if (it != base_factor_cache_.end()) return it->second;
    }

    BaseFactor result;
    if (units.size() == 1 && units.begin()->second == 1.0) {
        result = unitFactorLocked(units.begin()->first, visiting);
    } else {
        for (const auto& entry : units) {
            BaseFactor unit = unitFactorLocked(entry.first, visiting);
            result.scale *= std::pow(unit.scale, entry.second);
            result.root_units = result.root_units * unit.root_units.pow(entry.second);
            if (unit.offset != 0.0 || unit.offset_ambiguous) {
                result.offset_ambiguous = true;
            }
            if (unit.logarithmic || unit.logarithmic_ambiguous) {
                result.logarithmic_ambiguous = true;
            }
        }
    }

    std::unique_lock<std::shared_mutex> cache_lock(cache_mutex_);
    base_factor_cache_.emplace(units, result);
    return result;
}

BaseFactor UnitRegistry::unitFactorLocked(const std::string& name,
                                          std::vector<std::string>& visiting) const {
    DefinitionPtr def = requireLocked(name);

    BaseFactor result;
    if (def->isBase()) {
        result.root_units = UnitsContainer(def->name);
        return result;
    }

    auto seen = std::find(visiting.begin(), visiting.end(), def->name);
    if (seen != visiting.end()) {
        std::vector<std::string> chain(seen, visiting.end());
        chain.push_back(def->name);
        throw DefinitionCycleError(chain);
    }
    visiting.push_back(def->name);
    BaseFactor reference = baseFactorLocked(def->reference, visiting);
    visiting.pop_back();

    const Converter& conv = def->converter;
    result.root_units = reference.root_units;
    result.offset_ambiguous = reference.offset_ambiguous;
    result.logarithmic_ambiguous = reference.logarithmic || reference.logarithmic_ambiguous;

    if (conv.logarithmic) {
        // Logarithmic units need a linear reference
        if (reference.offset != 0.0) result.logarithmic_ambiguous = true;
        result.logarithmic = true;
        result.scale = conv.scale * reference.scale;
        result.log_base = conv.log_base;
        result.log_factor = conv.log_factor;
    } else {
        // Affine chains compose: (v * s + o) * rs + ro
        result.scale = conv.scale * reference.scale;
        result.offset = conv.offset * reference.scale + reference.offset;
    }
    return result;
}

bool UnitRegistry::areCompatible(const std::string& units1, const std::string& units2) const {
    try {
        return getDimensionality(units1) == getDimensionality(units2);
    } catch (const UndefinedUnitError&) {
        return false;
    } catch (const ExpressionSyntaxError&) {
        return false;
    }
}

bool UnitRegistry::isOffsetUnit(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(table_mutex_);
    if (!resolveLocked(name)) return false;
    std::vector<std::string> visiting;
    return unitFactorLocked(name, visiting).offset != 0.0;
}

bool UnitRegistry::isDeltaUnit(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(table_mutex_);
    DefinitionPtr def = resolveLocked(name);
    return def && delta_units_.count(def->name) > 0;
}

std::string UnitRegistry::deltaUnitName(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(table_mutex_);
    DefinitionPtr def = requireLocked(name);
    if (!def->isOffset()) {
        throw std::invalid_argument("'" + name + "' is not an offset unit");
    }
    return "delta_" + def->name;
}

// =============================================================================
// Conversion
// =============================================================================

Conversion UnitRegistry::getConversionFactor(const UnitsContainer& from, const UnitsContainer& to,
                                             const ContextStack& contexts,
                                             OffsetMode mode) const {
    if (from == to) {
        return Conversion::identity();
    }
    std::shared_lock<std::shared_mutex> lock(table_mutex_);
    return conversionLocked(from, to, contexts, mode);
}

Conversion UnitRegistry::conversionLocked(const UnitsContainer& from, const UnitsContainer& to,
                                          const ContextStack& contexts,
                                          OffsetMode mode) const {
    std::vector<std::string> visiting;
    DimensionVector from_dim = dimensionalityLocked(from, visiting);
    DimensionVector to_dim = dimensionalityLocked(to, visiting);
    std::vector<ContextHop> path;
    if (from_dim != to_dim) {
        path = findContextPath(from_dim, to_dim, contexts);
        if (path.empty()) {
            throw DimensionalityError(from.toString(), to.toString(),
                                      from_dim.toString(), to_dim.toString());
        }
    }

    BaseFactor src = baseFactorLocked(from, visiting);
    BaseFactor dst = baseFactorLocked(to, visiting);

    if (src.logarithmic_ambiguous || dst.logarithmic_ambiguous) {
        throw LogarithmicUnitCalculusError(from.toString(), to.toString());
    }
    if (mode == OffsetMode::STRICT) {
        if (src.offset_ambiguous || dst.offset_ambiguous) {
            throw OffsetUnitCalculusError(from.toString(), to.toString());
        }
    } else {
        src.offset = 0.0;
        dst.offset = 0.0;
    }

    if (path.empty()) {
        if (!src.logarithmic && !dst.logarithmic) {
            return Conversion::affine(src.scale / dst.scale, (src.offset - dst.offset) / dst.scale);
        }
        return Conversion::nonlinear([src, dst](double value) {
            return dst.fromRoot(src.toRoot(value));
        });
    }

    // The stack may change after this call returns, so each hop keeps its
    // own copy of the transform and parameters.
    std::vector<std::pair<TransformFunction, ContextParameters>> hops;
    for (const auto& hop : path) {
        hops.emplace_back(hop.rule->transform, *hop.parameters);
    }
    const UnitRegistry* registry = this;
    return Conversion::nonlinear([registry, src, dst, hops](double value) {
        double root = src.toRoot(value);
        for (const auto& hop : hops) {
            root = hop.first(*registry, root, hop.second);
        }
        return dst.fromRoot(root);
    });
}

double UnitRegistry::convert(double value, const UnitsContainer& from, const UnitsContainer& to,
                             const ContextStack& contexts, OffsetMode mode) const {
    return getConversionFactor(from, to, contexts, mode).apply(value);
}

double UnitRegistry::convert(double value, const std::string& from, const std::string& to,
                             const ContextStack& contexts, OffsetMode mode) const {
    return convert(value, parseUnits(from), parseUnits(to), contexts, mode);
}

std::vector<double> UnitRegistry::convert(const std::vector<double>& values,
                                          const std::string& from, const std::string& to,
                                          const ContextStack& contexts,
                                          OffsetMode mode) const {
    Conversion conversion = getConversionFactor(parseUnits(from), parseUnits(to), contexts, mode);
    return conversion.apply(values);
}

double UnitRegistry::toBase(double value, const std::string& from) const {
    UnitsContainer units = parseUnits(from);
    return convert(value, units, getBaseFactor(units).root_units);
}

double UnitRegistry::fromBase(double value, const std::string& to) const {
    UnitsContainer units = parseUnits(to);
    return convert(value, getBaseFactor(units).root_units, units);
}

} // namespace UREG
