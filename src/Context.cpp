#include "Context.hpp"
#include <stdexcept>

namespace UREG {

// =============================================================================
// Context Implementation
// =============================================================================

Context::Context(const std::string& name, const std::vector<std::string>& aliases,
                 const ContextParameters& defaults)
    : name_(name), aliases_(aliases), defaults_(defaults) {
    if (name_.empty()) {
        throw std::invalid_argument("Context name cannot be empty");
    }
}

void Context::addTransformation(const DimensionVector& source,
                                const DimensionVector& destination,
                                TransformFunction transform) {
    if (source == destination) {
        throw std::invalid_argument("Context '" + name_ + "': rule maps " +
                                    source.toString() + " onto itself");
    }
    if (!transform) {
        throw std::invalid_argument("Context '" + name_ + "': empty transform for " +
                                    source.toString() + " -> " + destination.toString());
    }
    rules_.push_back(ContextRule{source, destination, std::move(transform)});
}

void Context::addBidirectional(const DimensionVector& a, const DimensionVector& b,
                               TransformFunction forward, TransformFunction backward) {
    addTransformation(a, b, std::move(forward));
    addTransformation(b, a, std::move(backward));
}

const ContextRule* Context::findRule(const DimensionVector& source,
                                     const DimensionVector& destination) const {
    for (const auto& rule : rules_) {
        if (rule.source == source && rule.destination == destination) {
            return &rule;
        }
    }
    return nullptr;
}

// =============================================================================
// ContextStack Implementation
// =============================================================================

void ContextStack::push(std::shared_ptr<const Context> context,
                        const ContextParameters& overrides) {
    if (!context) {
        throw std::invalid_argument("Cannot push a null context");
    }

    Entry entry;
    entry.parameters = context->defaults();
    for (const auto& param : overrides) {
        if (entry.parameters.count(param.first) == 0) {
            throw std::invalid_argument("Context '" + context->name() +
                                        "' has no parameter '" + param.first + "'");
        }
        entry.parameters[param.first] = param.second;
    }
    entry.context = std::move(context);
    entries_.push_back(std::move(entry));
}

void ContextStack::pop() {
    if (entries_.empty()) {
        throw std::out_of_range("Cannot pop from an empty context stack");
    }
    entries_.pop_back();
}

std::vector<const ContextStack::Entry*> ContextStack::activeEntries() const {
    std::vector<const Entry*> result;
    result.reserve(entries_.size());
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        result.push_back(&(*it));
    }
    return result;
}

std::vector<std::string> ContextStack::activeNames() const {
    std::vector<std::string> names;
    for (const Entry* entry : activeEntries()) {
        names.push_back(entry->context->name());
    }
    return names;
}

// =============================================================================
// ScopedContext Implementation
// =============================================================================

ScopedContext::ScopedContext(ContextStack& stack, std::shared_ptr<const Context> context,
                             const ContextParameters& overrides)
    : stack_(stack), depth_(stack.size()) {
    stack_.push(std::move(context), overrides);
}

ScopedContext::~ScopedContext() {
    while (stack_.size() > depth_) {
        stack_.pop();
    }
}

} // namespace UREG
