#include "ConfigReader.hpp"
#include <iostream>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace UREG {

namespace {

std::string toLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(), ::tolower);
    return str;
}

} // namespace

ConfigReader::ConfigReader() : registry_(&RegistryManager::getInstance()) {}

ConfigReader::ConfigReader(const UnitRegistry& registry) : registry_(&registry) {}

bool ConfigReader::loadFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot open configuration file: " << filename << std::endl;
        return false;
    }

    std::string section;
    std::string line;
    for (int line_num = 1; std::getline(file, line); ++line_num) {
        parseLine(line, line_num, section);
    }
    return true;
}

void ConfigReader::parseLine(const std::string& raw, int line_num, std::string& section) {
    // '#' starts a comment anywhere, ';' only at the start of a line
    std::string line = trim(raw.substr(0, raw.find('#')));
    if (line.empty() || line.front() == ';') return;

    if (line.front() == '[') {
        if (line.back() != ']') {
            std::cerr << "Warning: Unterminated section header at line " << line_num << std::endl;
            return;
        }
        section = trim(line.substr(1, line.size() - 2));
        return;
    }

    size_t eq_pos = line.find('=');
    if (eq_pos == std::string::npos) {
        std::cerr << "Warning: Invalid line " << line_num << ": " << line << std::endl;
        return;
    }
    if (section.empty()) {
        std::cerr << "Warning: Key without section at line " << line_num << std::endl;
        return;
    }
    data[section][trim(line.substr(0, eq_pos))] = trim(line.substr(eq_pos + 1));
}

std::string ConfigReader::trim(const std::string& str) {
    const char* whitespace = " \t\r\n";
    size_t first = str.find_first_not_of(whitespace);
    if (first == std::string::npos) return "";
    return str.substr(first, str.find_last_not_of(whitespace) - first + 1);
}

std::vector<std::string> ConfigReader::split(const std::string& str, char delim) {
    std::vector<std::string> result;
    size_t begin = 0;
    while (begin <= str.size()) {
        size_t end = str.find(delim, begin);
        if (end == std::string::npos) end = str.size();
        std::string item = trim(str.substr(begin, end - begin));
        if (!item.empty()) result.push_back(item);
        begin = end + 1;
    }
    return result;
}

// =============================================================================
// Registry Configuration
// =============================================================================

bool ConfigReader::parseRegistryOptions(RegistryOptions& options) const {
    if (!hasSection("registry")) return false;

    if (hasKey("registry", "on_redefinition")) {
        std::string policy = toLower(getString("registry", "on_redefinition"));
        if (policy == "raise") {
            options.on_redefinition = RedefinitionPolicy::RAISE;
        } else if (policy == "warn") {
            options.on_redefinition = RedefinitionPolicy::WARN;
        } else if (policy == "ignore") {
            options.on_redefinition = RedefinitionPolicy::IGNORE;
        } else {
            std::cerr << "Warning: Unknown redefinition policy '" << policy
                      << "', expected raise, warn or ignore" << std::endl;
        }
    }

    options.autoconvert_offset_to_baseunit =
        getBool("registry", "autoconvert_offset_to_baseunit",
                options.autoconvert_offset_to_baseunit);
    options.case_sensitive = getBool("registry", "case_sensitive", options.case_sensitive);
    options.load_defaults = getBool("registry", "load_defaults", options.load_defaults);

    return true;
}

ContextStack ConfigReader::buildContextStack(const UnitRegistry& registry) const {
    ContextStack stack;
    std::string active = getString("contexts", "active");
    if (active.empty()) return stack;

    for (const auto& name : split(active, ',')) {
        if (!registry.hasContext(name)) {
            std::cerr << "Warning: Unknown context '" << name << "' in [contexts]" << std::endl;
            continue;
        }
        std::shared_ptr<const Context> context = registry.getContext(name);

        // Overrides may be keyed by the listed name or the canonical name
        ContextParameters overrides;
        auto section = data.find("contexts");
        for (const auto& entry : section->second) {
            size_t dot = entry.first.find('.');
            if (dot == std::string::npos) continue;

            std::string owner = entry.first.substr(0, dot);
            if (owner != name && owner != context->name()) continue;

            std::string param = entry.first.substr(dot + 1);
            if (context->defaults().count(param) == 0) {
                std::cerr << "Warning: Context '" << context->name()
                          << "' has no parameter '" << param << "'" << std::endl;
                continue;
            }
            overrides[param] = getDouble("contexts", entry.first, context->defaults().at(param));
        }

        stack.push(context, overrides);
    }

    return stack;
}

ContextStack ConfigReader::buildContextStack() const {
    return buildContextStack(*registry_);
}

// =============================================================================
// Value Accessors
// =============================================================================

std::string ConfigReader::getString(const std::string& section, const std::string& key,
                                   const std::string& default_val) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return default_val;

    auto key_it = sec_it->second.find(key);
    if (key_it == sec_it->second.end()) return default_val;

    return key_it->second;
}

int ConfigReader::getInt(const std::string& section, const std::string& key,
                        int default_val) const {
    double value = getDouble(section, key, default_val);
    if (value != std::floor(value)) {
        std::cerr << "Warning: [" << section << "]:" << key << " is not an integer" << std::endl;
        return default_val;
    }
    return static_cast<int>(value);
}

double ConfigReader::getDouble(const std::string& section, const std::string& key,
                               double default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    char* end = nullptr;
    double value = std::strtod(val.c_str(), &end);
    if (end != val.c_str() && *end == '\0') return value;

    std::cerr << "Warning: Cannot parse [" << section << "]:" << key
              << " = '" << val << "' as a number" << std::endl;
    return default_val;
}

bool ConfigReader::getBool(const std::string& section, const std::string& key,
                          bool default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    val = toLower(val);

    if (val == "true" || val == "yes" || val == "1" || val == "on") return true;
    if (val == "false" || val == "no" || val == "0" || val == "off") return false;

    return default_val;
}

// =============================================================================
// Unit-Aware Value Accessors
// =============================================================================

Quantity ConfigReader::getQuantity(const std::string& section, const std::string& key,
                                   const std::string& default_unit) const {
    if (!hasKey(section, key)) {
        throw std::out_of_range("Missing configuration value [" + section + "]:" + key);
    }

    Quantity value = Quantity::parse(getString(section, key), *registry_);
    if (value.units().empty() && !default_unit.empty()) {
        return Quantity(value.magnitude(), default_unit, *registry_);
    }
    return value;
}

double ConfigReader::convertValue(const std::string& text, const std::string& target_unit) const {
    Quantity value = Quantity::parse(text, *registry_);

    // A bare number is already expressed in the target units
    if (value.units().empty()) {
        return value.magnitude();
    }
    if (target_unit.empty()) {
        return value.toRootUnits().magnitude();
    }
    return value.magnitudeAs(target_unit);
}

double ConfigReader::getDoubleWithUnit(const std::string& section, const std::string& key,
                                       double default_val, const std::string& target_unit) const {
    std::string val = getString(section, key);
    if (val.empty()) {
        return default_val;
    }

    try {
        return convertValue(val, target_unit);
    } catch (const UnitError& e) {
        std::cerr << "Warning: Unit conversion error for [" << section
                  << "]:" << key << " - " << e.what() << std::endl;
        return default_val;
    }
}

std::vector<double> ConfigReader::getDoubleArrayWithUnit(const std::string& section,
                                                         const std::string& key,
                                                         const std::string& target_unit) const {
    std::vector<double> result;
    std::string val = getString(section, key);
    if (val.empty()) return result;

    auto tokens = split(val, ',');
    for (const auto& token : tokens) {
        try {
            result.push_back(convertValue(token, target_unit));
        } catch (const UnitError& e) {
            std::cerr << "Warning: Cannot convert '" << token << "': "
                      << e.what() << std::endl;
        }
    }

    return result;
}

// =============================================================================
// Section/Key Query Methods
// =============================================================================

bool ConfigReader::hasSection(const std::string& section) const {
    return data.find(section) != data.end();
}

bool ConfigReader::hasKey(const std::string& section, const std::string& key) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return false;
    return sec_it->second.find(key) != sec_it->second.end();
}

// =============================================================================
// Template Generation
// =============================================================================

void ConfigReader::generateTemplate(const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot write configuration template: " << filename << std::endl;
        return;
    }

    file << "# UREG Configuration File\n";
    file << "#\n";
    file << "# Lines starting with # or ; are comments\n";
    file << "# Format: key = value\n";
    file << "# Values may carry units, e.g. 'depth = 2.5 km'\n\n";

    file << "[registry]\n";
    file << "on_redefinition = raise               # raise, warn or ignore\n";
    file << "autoconvert_offset_to_baseunit = false\n";
    file << "case_sensitive = true\n";
    file << "load_defaults = true\n\n";

    file << "[contexts]\n";
    file << "# Contexts activated for conversions, oldest first\n";
    file << "active = spectroscopy\n";
    file << "# Parameter overrides: <context>.<parameter> = value\n";
    file << "spectroscopy.n = 1.0                  # Refractive index\n\n";

    file << "[values]\n";
    file << "length = 2.5 km\n";
    file << "temperature = 25 degC\n";
    file << "pressure = 14.7 psi\n";
    file << "wavelengths = 400 nm, 550 nm, 700 nm\n";
}

} // namespace UREG
