#ifndef UNIT_EXPRESSION_HPP
#define UNIT_EXPRESSION_HPP

#include "UnitsContainer.hpp"
#include <string>

namespace UREG {

/**
 * @brief Raw result of parsing a unit expression
 *
 * Names are kept exactly as written; the registry canonicalizes them.
 */
struct ParsedUnitExpression {
    double factor;          // Product of numeric literals (e.g., 9.81 in "9.81 m/s^2")
    UnitsContainer units;   // Unit (or "[dimension]") names -> exponents

    ParsedUnitExpression() : factor(1.0) {}
};

/**
 * @brief Recursive descent parser for unit expressions
 *
 * Grammar:
 *   expression := term { ("*" | "/" | <juxtaposition>) term }
 *   term       := primary [ ("**" | "^") exponent ]
 *   primary    := number | name | "[" name "]" | "(" expression ")"
 *   exponent   := ["+" | "-"] number | "(" ["-"] number [ "/" number ] ")"
 *
 * Multiplication and division are left associative with equal precedence,
 * so "J / kg * K" is (J / kg) * K. A name ending in a letter followed by
 * digits carries an implicit exponent ("m3" is "m ** 3"). The word
 * "dimensionless" is the empty container.
 */
class UnitExpressionParser {
public:
    explicit UnitExpressionParser(const std::string& text);

    /**
     * @brief Parse the whole input
     * @throws ExpressionSyntaxError on malformed input
     */
    ParsedUnitExpression parse();

private:
    std::string text_;
    size_t pos_;

    ParsedUnitExpression parseExpression();
    ParsedUnitExpression parseTerm();
    ParsedUnitExpression parsePrimary();
    double parseExponent();
    double parseNumber();
    std::string parseName();

    void skipWhitespace();
    bool atEnd() const { return pos_ >= text_.size(); }
    char peek(size_t offset = 0) const;
    bool startsTerm() const;
    bool consume(const std::string& token);

    [[noreturn]] void fail(const std::string& msg) const;
};

/**
 * @brief Convenience wrapper around UnitExpressionParser
 */
ParsedUnitExpression parseUnitExpression(const std::string& text);

} // namespace UREG

#endif // UNIT_EXPRESSION_HPP
