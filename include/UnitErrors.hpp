#ifndef UNIT_ERRORS_HPP
#define UNIT_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <vector>

namespace UREG {

/**
 * @brief Base class of every error raised by the unit registry
 *
 * Derives from std::runtime_error so callers that only care about
 * "something went wrong with units" can catch a single type.
 */
class UnitError : public std::runtime_error {
public:
    explicit UnitError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief A unit, prefix or dimension name does not resolve in the registry
 */
class UndefinedUnitError : public UnitError {
public:
    explicit UndefinedUnitError(const std::string& name);
    explicit UndefinedUnitError(const std::vector<std::string>& names);

    const std::vector<std::string>& unitNames() const { return unit_names_; }

private:
    std::vector<std::string> unit_names_;

    static std::string buildMessage(const std::vector<std::string>& names);
};

/**
 * @brief Two unit expressions were required to share a dimensionality
 *
 * Carries the rendering of both sides so the message can be rebuilt by
 * callers that want a different layout.
 */
class DimensionalityError : public UnitError {
public:
    DimensionalityError(const std::string& units1, const std::string& units2,
                        const std::string& dim1 = "", const std::string& dim2 = "",
                        const std::string& extra_msg = "");

    const std::string& units1() const { return units1_; }
    const std::string& units2() const { return units2_; }
    const std::string& dim1() const { return dim1_; }
    const std::string& dim2() const { return dim2_; }

private:
    std::string units1_;
    std::string units2_;
    std::string dim1_;
    std::string dim2_;

    static std::string buildMessage(const std::string& units1, const std::string& units2,
                                    const std::string& dim1, const std::string& dim2,
                                    const std::string& extra_msg);
};

/**
 * @brief A definition reused a name, symbol or alias already registered
 */
class RedefinitionError : public UnitError {
public:
    RedefinitionError(const std::string& name, const std::string& definition_type);

    const std::string& name() const { return name_; }
    const std::string& definitionType() const { return definition_type_; }

private:
    std::string name_;
    std::string definition_type_;
};

/**
 * @brief Arithmetic or conversion on an affine unit whose offset is ambiguous
 */
class OffsetUnitCalculusError : public UnitError {
public:
    OffsetUnitCalculusError(const std::string& units1, const std::string& units2 = "",
                            const std::string& extra_msg = "");
};

/**
 * @brief Linear algebra attempted on a logarithmic unit
 */
class LogarithmicUnitCalculusError : public UnitError {
public:
    LogarithmicUnitCalculusError(const std::string& units1, const std::string& units2 = "",
                                 const std::string& extra_msg = "");
};

/**
 * @brief A definition record is structurally invalid
 */
class DefinitionSyntaxError : public UnitError {
public:
    explicit DefinitionSyntaxError(const std::string& msg)
        : UnitError("Invalid definition: " + msg) {}
};

/**
 * @brief A unit reduces through itself
 */
class DefinitionCycleError : public UnitError {
public:
    explicit DefinitionCycleError(const std::vector<std::string>& chain);

    const std::vector<std::string>& chain() const { return chain_; }

private:
    std::vector<std::string> chain_;
};

/**
 * @brief A unit expression string could not be tokenized or parsed
 */
class ExpressionSyntaxError : public UnitError {
public:
    ExpressionSyntaxError(const std::string& expression, size_t position,
                          const std::string& msg);

    const std::string& expression() const { return expression_; }
    size_t position() const { return position_; }

private:
    std::string expression_;
    size_t position_;
};

} // namespace UREG

#endif // UNIT_ERRORS_HPP
