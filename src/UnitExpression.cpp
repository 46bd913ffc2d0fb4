#include "UnitExpression.hpp"
#include "UnitErrors.hpp"
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace UREG {

namespace {

bool isNameStart(char c) {
    unsigned char uc = static_cast<unsigned char>(c);
    return std::isalpha(uc) || c == '_' || uc >= 0x80;
}

bool isNameChar(char c) {
    return isNameStart(c) || std::isdigit(static_cast<unsigned char>(c));
}

ParsedUnitExpression combine(const ParsedUnitExpression& lhs, const ParsedUnitExpression& rhs,
                             bool divide) {
    ParsedUnitExpression result;
    if (divide) {
        result.factor = lhs.factor / rhs.factor;
        result.units = lhs.units / rhs.units;
    } else {
        result.factor = lhs.factor * rhs.factor;
        result.units = lhs.units * rhs.units;
    }
    return result;
}

} // namespace

UnitExpressionParser::UnitExpressionParser(const std::string& text)
    : text_(text), pos_(0) {}

ParsedUnitExpression UnitExpressionParser::parse() {
    pos_ = 0;
    skipWhitespace();
    if (atEnd()) {
        // Empty expression is dimensionless
        return ParsedUnitExpression();
    }

    ParsedUnitExpression result = parseExpression();
    skipWhitespace();
    if (!atEnd()) {
        fail(std::string("unexpected character '") + text_[pos_] + "'");
    }
    return result;
}

// =============================================================================
// Grammar rules
// =============================================================================

ParsedUnitExpression UnitExpressionParser::parseExpression() {
    ParsedUnitExpression result = parseTerm();

    while (true) {
        skipWhitespace();
        if (atEnd() || peek() == ')') break;

        if (peek() == '*' && peek(1) != '*') {
            ++pos_;
            result = combine(result, parseTerm(), false);
        } else if (peek() == '/') {
            ++pos_;
            result = combine(result, parseTerm(), true);
        } else if (startsTerm()) {
            // Juxtaposition: "kg m" or "9.81 m"
            result = combine(result, parseTerm(), false);
        } else {
            break;
        }
    }
    return result;
}

ParsedUnitExpression UnitExpressionParser::parseTerm() {
    ParsedUnitExpression base = parsePrimary();

    skipWhitespace();
    if (consume("**") || consume("^")) {
        double exponent = parseExponent();
        ParsedUnitExpression result;
        result.factor = std::pow(base.factor, exponent);
        result.units = base.units.pow(exponent);
        return result;
    }
    return base;
}

ParsedUnitExpression UnitExpressionParser::parsePrimary() {
    skipWhitespace();
    if (atEnd()) {
        fail("expected a unit name, number or '('");
    }

    ParsedUnitExpression result;
    char c = peek();

    if (c == '(') {
        ++pos_;
        result = parseExpression();
        skipWhitespace();
        if (!consume(")")) {
            fail("missing ')'");
        }
        return result;
    }

    if (std::isdigit(static_cast<unsigned char>(c)) || c == '.') {
        result.factor = parseNumber();
        return result;
    }

    if (c == '[') {
        size_t start = pos_;
        ++pos_;
        parseName();
        if (!consume("]")) {
            fail("missing ']'");
        }
        result.units = UnitsContainer(text_.substr(start, pos_ - start));
        return result;
    }

    if (isNameStart(c)) {
        std::string name = parseName();

        // Trailing digits after a letter are an exponent: "cm3" -> cm ** 3,
        // while "g_0" stays a name
        size_t digits = name.size();
        while (digits > 0 && std::isdigit(static_cast<unsigned char>(name[digits - 1]))) {
            --digits;
        }
        double exponent = 1.0;
        if (digits < name.size() && std::isalpha(static_cast<unsigned char>(name[digits - 1]))) {
            exponent = std::atof(name.c_str() + digits);
            name = name.substr(0, digits);
        }

        if (name != "dimensionless") {
            result.units = UnitsContainer(name, exponent);
        }
        return result;
    }

    fail(std::string("unexpected character '") + c + "'");
}

double UnitExpressionParser::parseExponent() {
    skipWhitespace();

    if (consume("(")) {
        skipWhitespace();
        double sign = 1.0;
        if (consume("-")) sign = -1.0;
        else consume("+");
        skipWhitespace();
        double value = parseNumber();
        skipWhitespace();
        if (consume("/")) {
            skipWhitespace();
            double denominator = parseNumber();
            if (denominator == 0.0) {
                fail("zero denominator in exponent");
            }
            value /= denominator;
            skipWhitespace();
        }
        if (!consume(")")) {
            fail("missing ')' in exponent");
        }
        return sign * value;
    }

    double sign = 1.0;
    if (consume("-")) sign = -1.0;
    else consume("+");
    skipWhitespace();
    return sign * parseNumber();
}

double UnitExpressionParser::parseNumber() {
    size_t start = pos_;
    bool has_digits = false;

    while (!atEnd() && std::isdigit(static_cast<unsigned char>(peek()))) {
        ++pos_;
        has_digits = true;
    }
    if (!atEnd() && peek() == '.') {
        ++pos_;
        while (!atEnd() && std::isdigit(static_cast<unsigned char>(peek()))) {
            ++pos_;
            has_digits = true;
        }
    }
    if (!has_digits) {
        pos_ = start;
        fail("expected a number");
    }

    // Scientific notation only when digits follow, so "1 erg" stays a unit
    if (!atEnd() && (peek() == 'e' || peek() == 'E')) {
        size_t offset = 1;
        if (peek(1) == '+' || peek(1) == '-') offset = 2;
        if (std::isdigit(static_cast<unsigned char>(peek(offset)))) {
            pos_ += offset;
            while (!atEnd() && std::isdigit(static_cast<unsigned char>(peek()))) {
                ++pos_;
            }
        }
    }

    return std::strtod(text_.c_str() + start, nullptr);
}

std::string UnitExpressionParser::parseName() {
    size_t start = pos_;
    if (atEnd() || !isNameStart(peek())) {
        fail("expected a name");
    }
    while (!atEnd() && isNameChar(peek())) {
        ++pos_;
    }
    return text_.substr(start, pos_ - start);
}

// =============================================================================
// Lexical helpers
// =============================================================================

void UnitExpressionParser::skipWhitespace() {
    while (!atEnd() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
        ++pos_;
    }
}

char UnitExpressionParser::peek(size_t offset) const {
    return pos_ + offset < text_.size() ? text_[pos_ + offset] : '\0';
}

bool UnitExpressionParser::startsTerm() const {
    char c = peek();
    return c == '(' || c == '[' || c == '.' || isNameStart(c) ||
           std::isdigit(static_cast<unsigned char>(c));
}

bool UnitExpressionParser::consume(const std::string& token) {
    if (text_.compare(pos_, token.size(), token) == 0) {
        pos_ += token.size();
        return true;
    }
    return false;
}

void UnitExpressionParser::fail(const std::string& msg) const {
    throw ExpressionSyntaxError(text_, pos_, msg);
}

ParsedUnitExpression parseUnitExpression(const std::string& text) {
    UnitExpressionParser parser(text);
    return parser.parse();
}

} // namespace UREG
