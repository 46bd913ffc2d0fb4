#include "DimensionalAnalysis.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <numeric>
#include <set>
#include <stdexcept>

namespace UREG {

namespace {

const double PIVOT_TOLERANCE = 1e-10;
const int MAX_DENOMINATOR = 1000;

// Smallest integer multiple of v, or v unchanged if it has none with a
// denominator up to MAX_DENOMINATOR
std::vector<double> toIntegerExponents(const std::vector<double>& v) {
    for (int k = 1; k <= MAX_DENOMINATOR; ++k) {
        bool integral = true;
        for (double x : v) {
            if (std::abs(k * x - std::round(k * x)) > 1e-8) {
                integral = false;
                break;
            }
        }
        if (!integral) continue;

        long long divisor = 0;
        for (double x : v) {
            divisor = std::gcd(divisor, std::llabs(std::llround(k * x)));
        }
        std::vector<double> result;
        for (double x : v) {
            result.push_back(static_cast<double>(std::llround(k * x) / divisor));
        }
        return result;
    }
    return v;
}

} // namespace

std::vector<DimensionlessGroup> piTheorem(const NamedDimensions& quantities) {
    std::vector<std::string> names;
    std::set<std::string> dimension_set;
    for (const auto& quantity : quantities) {
        if (std::find(names.begin(), names.end(), quantity.first) != names.end()) {
            throw std::invalid_argument("Quantity '" + quantity.first + "' given twice");
        }
        names.push_back(quantity.first);
        for (const auto& entry : quantity.second) {
            dimension_set.insert(entry.first);
        }
    }
    std::vector<std::string> dimensions(dimension_set.begin(), dimension_set.end());

    const size_t n_rows = dimensions.size();
    const size_t n_cols = quantities.size();

    // Dimension matrix
    std::vector<std::vector<double>> matrix(n_rows, std::vector<double>(n_cols, 0.0));
    for (size_t i = 0; i < n_rows; ++i) {
        for (size_t j = 0; j < n_cols; ++j) {
            matrix[i][j] = quantities[j].second.exponent(dimensions[i]);
        }
    }

    // Reduced row echelon form with partial pivoting
    std::vector<size_t> pivot_cols;
    size_t row = 0;
    for (size_t col = 0; col < n_cols && row < n_rows; ++col) {
        size_t max_row = row;
        for (size_t k = row + 1; k < n_rows; ++k) {
            if (std::abs(matrix[k][col]) > std::abs(matrix[max_row][col])) {
                max_row = k;
            }
        }
        if (std::abs(matrix[max_row][col]) < PIVOT_TOLERANCE) continue;
        std::swap(matrix[row], matrix[max_row]);

        double pivot = matrix[row][col];
        for (size_t j = col; j < n_cols; ++j) {
            matrix[row][j] /= pivot;
        }
        for (size_t k = 0; k < n_rows; ++k) {
            if (k == row || std::abs(matrix[k][col]) < PIVOT_TOLERANCE) continue;
            double factor = matrix[k][col];
            for (size_t j = col; j < n_cols; ++j) {
                matrix[k][j] -= factor * matrix[row][j];
            }
        }
        pivot_cols.push_back(col);
        ++row;
    }

    // One null space vector per free column
    std::vector<DimensionlessGroup> groups;
    for (size_t free_col = 0; free_col < n_cols; ++free_col) {
        if (std::find(pivot_cols.begin(), pivot_cols.end(), free_col) != pivot_cols.end()) {
            continue;
        }
        std::vector<double> exponents(n_cols, 0.0);
        exponents[free_col] = 1.0;
        for (size_t r = 0; r < pivot_cols.size(); ++r) {
            exponents[pivot_cols[r]] = -matrix[r][free_col];
        }
        exponents = toIntegerExponents(exponents);

        auto first = std::find_if(exponents.begin(), exponents.end(),
                                  [](double x) { return std::abs(x) > PIVOT_TOLERANCE; });
        if (first != exponents.end() && *first < 0.0) {
            for (double& x : exponents) x = -x;
        }

        DimensionlessGroup::Storage entries;
        for (size_t j = 0; j < n_cols; ++j) {
            entries[names[j]] = exponents[j];
        }
        groups.emplace_back(entries);
    }
    return groups;
}

std::vector<DimensionlessGroup> piTheorem(const NamedExpressions& quantities,
                                          const UnitRegistry& registry) {
    NamedDimensions dimensions;
    for (const auto& quantity : quantities) {
        const std::string& expression = quantity.second;
        size_t start = expression.find_first_not_of(" \t");
        if (start != std::string::npos && expression[start] == '[') {
            dimensions.emplace_back(quantity.first, registry.parseDimensions(expression));
        } else {
            dimensions.emplace_back(quantity.first, registry.getDimensionality(expression));
        }
    }
    return piTheorem(dimensions);
}

} // namespace UREG
