#include "UnitErrors.hpp"
#include <sstream>

namespace UREG {

// =============================================================================
// UndefinedUnitError
// =============================================================================

UndefinedUnitError::UndefinedUnitError(const std::string& name)
    : UndefinedUnitError(std::vector<std::string>{name}) {}

UndefinedUnitError::UndefinedUnitError(const std::vector<std::string>& names)
    : UnitError(buildMessage(names)), unit_names_(names) {}

std::string UndefinedUnitError::buildMessage(const std::vector<std::string>& names) {
    if (names.size() == 1) {
        return "'" + names.front() + "' is not defined in the unit registry";
    }
    std::stringstream ss;
    ss << "Units not defined in the unit registry:";
    for (size_t i = 0; i < names.size(); ++i) {
        ss << (i == 0 ? " '" : ", '") << names[i] << "'";
    }
    return ss.str();
}

// =============================================================================
// DimensionalityError
// =============================================================================

DimensionalityError::DimensionalityError(const std::string& units1, const std::string& units2,
                                         const std::string& dim1, const std::string& dim2,
                                         const std::string& extra_msg)
    : UnitError(buildMessage(units1, units2, dim1, dim2, extra_msg)),
      units1_(units1), units2_(units2), dim1_(dim1), dim2_(dim2) {}

std::string DimensionalityError::buildMessage(const std::string& units1, const std::string& units2,
                                              const std::string& dim1, const std::string& dim2,
                                              const std::string& extra_msg) {
    std::stringstream ss;
    ss << "Cannot convert from '" << units1 << "'";
    if (!dim1.empty()) ss << " (" << dim1 << ")";
    ss << " to '" << units2 << "'";
    if (!dim2.empty()) ss << " (" << dim2 << ")";
    if (!extra_msg.empty()) ss << extra_msg;
    return ss.str();
}

// =============================================================================
// RedefinitionError
// =============================================================================

RedefinitionError::RedefinitionError(const std::string& name, const std::string& definition_type)
    : UnitError("Cannot redefine '" + name + "' (" + definition_type + ")"),
      name_(name), definition_type_(definition_type) {}

// =============================================================================
// Non-multiplicative unit errors
// =============================================================================

OffsetUnitCalculusError::OffsetUnitCalculusError(const std::string& units1,
                                                 const std::string& units2,
                                                 const std::string& extra_msg)
    : UnitError("Ambiguous operation with offset unit (" + units1 +
                (units2.empty() ? std::string() : ", " + units2) + ")" + extra_msg) {}

LogarithmicUnitCalculusError::LogarithmicUnitCalculusError(const std::string& units1,
                                                           const std::string& units2,
                                                           const std::string& extra_msg)
    : UnitError("Ambiguous operation with logarithmic unit (" + units1 +
                (units2.empty() ? std::string() : ", " + units2) + ")" + extra_msg) {}

// =============================================================================
// DefinitionCycleError / ExpressionSyntaxError
// =============================================================================

namespace {

std::string joinChain(const std::vector<std::string>& chain) {
    std::stringstream ss;
    for (size_t i = 0; i < chain.size(); ++i) {
        if (i > 0) ss << " -> ";
        ss << chain[i];
    }
    return ss.str();
}

} // namespace

DefinitionCycleError::DefinitionCycleError(const std::vector<std::string>& chain)
    : UnitError("Cyclic unit definition: " + joinChain(chain)), chain_(chain) {}

ExpressionSyntaxError::ExpressionSyntaxError(const std::string& expression, size_t position,
                                             const std::string& msg)
    : UnitError("Cannot parse unit expression '" + expression + "' at position " +
                std::to_string(position) + ": " + msg),
      expression_(expression), position_(position) {}

} // namespace UREG
