#ifndef UNITS_CONTAINER_HPP
#define UNITS_CONTAINER_HPP

#include <cmath>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <map>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>

namespace UREG {

// Exponents closer than this to an integer are snapped to it, and exponents
// closer than this to zero are dropped.
constexpr double EXPONENT_TOLERANCE = 1e-10;

inline double normalizeExponent(double exponent) {
    if (std::abs(exponent) < EXPONENT_TOLERANCE) return 0.0;
    double rounded = std::round(exponent);
    if (std::abs(exponent - rounded) < EXPONENT_TOLERANCE) return rounded;
    return exponent;
}

struct UnitNameTag {};
struct DimensionNameTag {};
struct QuantityNameTag {};

/**
 * @brief Immutable mapping name -> exponent in canonical (zero-free) form
 *
 * The same algebra serves two distinct types: UnitsContainer maps unit
 * names (the surface form of a compound unit), DimensionVector maps base
 * dimension names such as "[length]" (its physical kind). The tag keeps
 * the two from being mixed up.
 *
 * Entries are kept sorted by name so that equality, ordering and hashing
 * are purely structural.
 */
template <typename Tag>
class ExponentMap {
public:
    using Storage = std::map<std::string, double>;
    using const_iterator = Storage::const_iterator;

    ExponentMap() : hash_(0) {}

    explicit ExponentMap(const std::string& name, double exponent = 1.0) : hash_(0) {
        entries_[name] = exponent;
        canonicalize();
    }

    ExponentMap(std::initializer_list<std::pair<const std::string, double>> entries)
        : hash_(0) {
        for (const auto& entry : entries) {
            entries_[entry.first] += entry.second;
        }
        canonicalize();
    }

    explicit ExponentMap(const Storage& entries) : entries_(entries), hash_(0) {
        canonicalize();
    }

    // =========================================================================
    // Access
    // =========================================================================

    double exponent(const std::string& name) const {
        auto it = entries_.find(name);
        return it == entries_.end() ? 0.0 : it->second;
    }

    bool contains(const std::string& name) const { return entries_.count(name) > 0; }
    bool empty() const { return entries_.empty(); }
    size_t size() const { return entries_.size(); }

    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }
    const Storage& entries() const { return entries_; }

    // =========================================================================
    // Algebra (every operation returns a new map)
    // =========================================================================

    ExponentMap operator*(const ExponentMap& other) const {
        Storage combined = entries_;
        for (const auto& entry : other.entries_) {
            combined[entry.first] += entry.second;
        }
        return ExponentMap(combined);
    }

    ExponentMap operator/(const ExponentMap& other) const {
        Storage combined = entries_;
        for (const auto& entry : other.entries_) {
            combined[entry.first] -= entry.second;
        }
        return ExponentMap(combined);
    }

    ExponentMap pow(double power) const {
        Storage scaled;
        for (const auto& entry : entries_) {
            scaled[entry.first] = entry.second * power;
        }
        return ExponentMap(scaled);
    }

    ExponentMap inverse() const { return pow(-1.0); }

    // Add `exponent` to the entry for `name`
    ExponentMap with(const std::string& name, double exponent) const {
        Storage updated = entries_;
        updated[name] += exponent;
        return ExponentMap(updated);
    }

    ExponentMap without(const std::string& name) const {
        Storage updated = entries_;
        updated.erase(name);
        return ExponentMap(updated);
    }

    ExponentMap renamed(const std::string& old_name, const std::string& new_name) const {
        auto it = entries_.find(old_name);
        if (it == entries_.end()) return *this;
        Storage updated = entries_;
        double exponent = it->second;
        updated.erase(old_name);
        updated[new_name] += exponent;
        return ExponentMap(updated);
    }

    // =========================================================================
    // Comparison and hashing
    // =========================================================================

    bool operator==(const ExponentMap& other) const {
        return hash_ == other.hash_ && entries_ == other.entries_;
    }

    bool operator!=(const ExponentMap& other) const { return !(*this == other); }

    bool operator<(const ExponentMap& other) const { return entries_ < other.entries_; }

    size_t hash() const { return hash_; }

    /**
     * @brief Render as "meter / second ** 2" ("dimensionless" when empty)
     */
    std::string toString() const {
        if (entries_.empty()) return "dimensionless";

        std::stringstream numerator;
        std::stringstream denominator;
        int n_num = 0;
        int n_den = 0;
        for (const auto& entry : entries_) {
            if (entry.second > 0) {
                if (n_num++ > 0) numerator << " * ";
                writeTerm(numerator, entry.first, entry.second);
            } else {
                if (n_den++ > 0) denominator << " / ";
                writeTerm(denominator, entry.first, -entry.second);
            }
        }

        std::string result = n_num > 0 ? numerator.str() : "1";
        if (n_den > 0) result += " / " + denominator.str();
        return result;
    }

private:
    Storage entries_;
    size_t hash_;

    void canonicalize() {
        for (auto it = entries_.begin(); it != entries_.end();) {
            it->second = normalizeExponent(it->second);
            if (it->second == 0.0) {
                it = entries_.erase(it);
            } else {
                ++it;
            }
        }

        size_t seed = entries_.size();
        for (const auto& entry : entries_) {
            seed ^= std::hash<std::string>{}(entry.first) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
            seed ^= std::hash<double>{}(entry.second) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
        }
        hash_ = seed;
    }

    static void writeTerm(std::ostream& os, const std::string& name, double exponent) {
        os << name;
        if (exponent != 1.0) os << " ** " << exponent;
    }
};

template <typename Tag>
std::ostream& operator<<(std::ostream& os, const ExponentMap<Tag>& map) {
    return os << map.toString();
}

/// Compound unit expression: unit name -> exponent
using UnitsContainer = ExponentMap<UnitNameTag>;

/// Physical kind of a quantity: base dimension name -> exponent
using DimensionVector = ExponentMap<DimensionNameTag>;

/// Product of named quantities with no net dimension: quantity name -> exponent
using DimensionlessGroup = ExponentMap<QuantityNameTag>;

} // namespace UREG

namespace std {

template <typename Tag>
struct hash<UREG::ExponentMap<Tag>> {
    size_t operator()(const UREG::ExponentMap<Tag>& map) const { return map.hash(); }
};

} // namespace std

#endif // UNITS_CONTAINER_HPP
