#ifndef CONTEXT_HPP
#define CONTEXT_HPP

#include "UnitsContainer.hpp"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace UREG {

class UnitRegistry;

using ContextParameters = std::map<std::string, double>;

/**
 * @brief Transform applied by a context rule
 *
 * Receives the value expressed in root units of the source dimensionality
 * and returns the value in root units of the destination dimensionality.
 */
using TransformFunction =
    std::function<double(const UnitRegistry&, double, const ContextParameters&)>;

/**
 * @brief One directed bridging rule between two dimensionalities
 */
struct ContextRule {
    DimensionVector source;
    DimensionVector destination;
    TransformFunction transform;
};

/**
 * @brief Named set of bridging rules between otherwise incompatible
 *        dimensionalities (e.g., wavelength <-> frequency)
 *
 * A context is only consulted when the source and destination of a
 * conversion have different dimensionalities.
 */
class Context {
public:
    explicit Context(const std::string& name,
                     const std::vector<std::string>& aliases = {},
                     const ContextParameters& defaults = {});

    const std::string& name() const { return name_; }
    const std::vector<std::string>& aliases() const { return aliases_; }
    const ContextParameters& defaults() const { return defaults_; }
    const std::vector<ContextRule>& rules() const { return rules_; }

    /**
     * @brief Add a directed rule source -> destination
     * @throws std::invalid_argument if the rule maps a dimensionality onto itself
     */
    void addTransformation(const DimensionVector& source, const DimensionVector& destination,
                           TransformFunction transform);

    /**
     * @brief Add both directions at once
     */
    void addBidirectional(const DimensionVector& a, const DimensionVector& b,
                          TransformFunction forward, TransformFunction backward);

    // Rule for source -> destination, or nullptr
    const ContextRule* findRule(const DimensionVector& source,
                                const DimensionVector& destination) const;

private:
    std::string name_;
    std::vector<std::string> aliases_;
    ContextParameters defaults_;
    std::vector<ContextRule> rules_;
};

/**
 * @brief Stack of active contexts owned by the caller
 *
 * Each entry pairs a context with its effective parameters (defaults
 * overridden by the values given to push). Iteration runs from the most
 * recently pushed entry to the oldest.
 */
class ContextStack {
public:
    struct Entry {
        std::shared_ptr<const Context> context;
        ContextParameters parameters;
    };

    ContextStack() = default;

    /**
     * @brief Activate a context
     * @throws std::invalid_argument on null context or unknown parameter
     */
    void push(std::shared_ptr<const Context> context, const ContextParameters& overrides = {});

    /**
     * @brief Deactivate the most recently pushed context
     * @throws std::out_of_range if the stack is empty
     */
    void pop();

    bool empty() const { return entries_.empty(); }
    size_t size() const { return entries_.size(); }

    // Entries ordered most recent first
    std::vector<const Entry*> activeEntries() const;

    // Names of the active contexts, most recent first
    std::vector<std::string> activeNames() const;

private:
    std::vector<Entry> entries_;
};

/**
 * @brief RAII activation of a context on a stack
 *
 * Pushes on construction. On destruction the stack is restored to the
 * depth it had before the push, so contexts pushed later inside the scope
 * are removed as well.
 */
class ScopedContext {
public:
    ScopedContext(ContextStack& stack, std::shared_ptr<const Context> context,
                  const ContextParameters& overrides = {});
    ~ScopedContext();

    ScopedContext(const ScopedContext&) = delete;
    ScopedContext& operator=(const ScopedContext&) = delete;

private:
    ContextStack& stack_;
    size_t depth_;
};

/**
 * @brief Run `body` with `context` active on `stack`
 *
 * The context is popped when body returns or throws.
 */
template <typename Body>
auto withContext(ContextStack& stack, std::shared_ptr<const Context> context, Body&& body,
                 const ContextParameters& overrides = {}) -> decltype(body()) {
    ScopedContext guard(stack, std::move(context), overrides);
    return body();
}

} // namespace UREG

#endif // CONTEXT_HPP
