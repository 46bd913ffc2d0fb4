/**
 * @file test_config_reader.cpp
 * @brief Unit tests for ConfigReader class
 */

#include <gtest/gtest.h>
#include "ConfigReader.hpp"
#include <fstream>
#include <cstdio>

using namespace UREG;

class ConfigReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_config_file = "test_config_unit.config";

        std::ofstream config(test_config_file);
        config << "# Test configuration\n";
        config << "[registry]\n";
        config << "on_redefinition = Warn\n";
        config << "case_sensitive = false\n";
        config << "autoconvert_offset_to_baseunit = yes\n";
        config << "\n[contexts]\n";
        config << "active = sp, boltzmann\n";
        config << "sp.n = 1.5\n";
        config << "\n[values]\n";
        config << "count = 100\n";
        config << "ratio = 0.2\n";
        config << "enabled = true\n";
        config << "name = reservoir\n";
        config << "coefficients = 1.0, 2.5, -3.0\n";
        config << "depth = 2.5 km                # inline comment\n";
        config << "bare = 3\n";
        config << "temperature = 25 degC\n";
        config << "negative = -40 degF\n";
        config << "bad_unit = 5 blorps\n";
        config << "wavelengths = 400 nm, 0.55 um, 700 nm\n";
        config << "not_a_number = abc\n";
        config.close();
    }

    void TearDown() override {
        std::remove(test_config_file.c_str());
    }

    std::string test_config_file;
    UnitRegistry registry;
};

TEST_F(ConfigReaderTest, LoadConfigFile) {
    ConfigReader reader(registry);
    EXPECT_TRUE(reader.loadFile(test_config_file)) << "Should load config file successfully";
    EXPECT_TRUE(reader.hasSection("registry"));
    EXPECT_TRUE(reader.hasKey("values", "depth"));
    EXPECT_FALSE(reader.hasKey("values", "missing"));
    EXPECT_TRUE(reader.hasSection("contexts"));
    EXPECT_FALSE(reader.hasSection("wells"));
}

TEST_F(ConfigReaderTest, MissingFile) {
    ConfigReader reader(registry);
    testing::internal::CaptureStderr();
    EXPECT_FALSE(reader.loadFile("no_such_file.config"));
    std::string output = testing::internal::GetCapturedStderr();
    EXPECT_NE(output.find("Error"), std::string::npos);
}

TEST_F(ConfigReaderTest, ReadPlainValues) {
    ConfigReader reader(registry);
    reader.loadFile(test_config_file);

    EXPECT_EQ(reader.getInt("values", "count", 0), 100);
    EXPECT_DOUBLE_EQ(reader.getDouble("values", "ratio", 0.0), 0.2);
    EXPECT_TRUE(reader.getBool("values", "enabled", false));
    EXPECT_EQ(reader.getString("values", "name"), "reservoir");

    std::vector<double> coefficients = reader.getDoubleArrayWithUnit("values", "coefficients");
    ASSERT_EQ(coefficients.size(), 3u);
    EXPECT_DOUBLE_EQ(coefficients[1], 2.5);
    EXPECT_DOUBLE_EQ(coefficients[2], -3.0);
}

TEST_F(ConfigReaderTest, DefaultValues) {
    ConfigReader reader(registry);
    reader.loadFile(test_config_file);

    EXPECT_EQ(reader.getInt("values", "missing", 42), 42);
    EXPECT_DOUBLE_EQ(reader.getDouble("missing_section", "ratio", 1.5), 1.5);
    EXPECT_EQ(reader.getString("values", "missing", "fallback"), "fallback");

    testing::internal::CaptureStderr();
    EXPECT_EQ(reader.getInt("values", "not_a_number", 7), 7);
    EXPECT_EQ(reader.getInt("values", "ratio", 3), 3);
    EXPECT_DOUBLE_EQ(reader.getDouble("values", "depth", -1.0), -1.0);
    std::string output = testing::internal::GetCapturedStderr();
    EXPECT_NE(output.find("Warning"), std::string::npos);
}

TEST_F(ConfigReaderTest, InlineCommentsStripped) {
    ConfigReader reader(registry);
    reader.loadFile(test_config_file);
    EXPECT_EQ(reader.getString("values", "depth"), "2.5 km");
}

// =============================================================================
// Registry Configuration
// =============================================================================

TEST_F(ConfigReaderTest, ParseRegistryOptions) {
    ConfigReader reader(registry);
    reader.loadFile(test_config_file);

    RegistryOptions options;
    EXPECT_TRUE(reader.parseRegistryOptions(options));
    EXPECT_EQ(options.on_redefinition, RedefinitionPolicy::WARN);
    EXPECT_FALSE(options.case_sensitive);
    EXPECT_TRUE(options.autoconvert_offset_to_baseunit);
    EXPECT_TRUE(options.load_defaults);

    UnitRegistry configured(options);
    EXPECT_EQ(configured.resolve("Meter").name, "meter");
}

TEST_F(ConfigReaderTest, ParseRegistryOptionsWithoutSection) {
    ConfigReader reader(registry);
    RegistryOptions options;
    EXPECT_FALSE(reader.parseRegistryOptions(options));
    EXPECT_EQ(options.on_redefinition, RedefinitionPolicy::RAISE);
}

TEST_F(ConfigReaderTest, BuildContextStack) {
    ConfigReader reader(registry);
    reader.loadFile(test_config_file);

    ContextStack stack = reader.buildContextStack(registry);
    ASSERT_EQ(stack.size(), 2u);

    std::vector<std::string> names = stack.activeNames();
    EXPECT_EQ(names[0], "boltzmann");
    EXPECT_EQ(names[1], "spectroscopy");
    EXPECT_DOUBLE_EQ(stack.activeEntries()[1]->parameters.at("n"), 1.5);

    EXPECT_NEAR(registry.convert(1.0, "m", "Hz", stack), 299792458.0 / 1.5, 1e-3);
}

TEST_F(ConfigReaderTest, UnknownContextSkipped) {
    const std::string file = "test_config_contexts.config";
    {
        std::ofstream config(file);
        config << "[contexts]\n";
        config << "active = chemistry, spectroscopy\n";
        config << "spectroscopy.refraction = 2.0\n";
    }

    ConfigReader reader(registry);
    reader.loadFile(file);

    testing::internal::CaptureStderr();
    ContextStack stack = reader.buildContextStack(registry);
    std::string output = testing::internal::GetCapturedStderr();
    std::remove(file.c_str());

    ASSERT_EQ(stack.size(), 1u);
    EXPECT_EQ(stack.activeNames().front(), "spectroscopy");
    EXPECT_DOUBLE_EQ(stack.activeEntries().front()->parameters.at("n"), 1.0);
    EXPECT_NE(output.find("chemistry"), std::string::npos);
    EXPECT_NE(output.find("refraction"), std::string::npos);
}

// =============================================================================
// Unit-Aware Value Accessors
// =============================================================================

TEST_F(ConfigReaderTest, GetQuantity) {
    ConfigReader reader(registry);
    reader.loadFile(test_config_file);

    Quantity depth = reader.getQuantity("values", "depth");
    EXPECT_DOUBLE_EQ(depth.magnitude(), 2.5);
    EXPECT_EQ(depth.units(), UnitsContainer("kilometer"));

    Quantity bare = reader.getQuantity("values", "bare", "psi");
    EXPECT_DOUBLE_EQ(bare.magnitude(), 3.0);
    EXPECT_EQ(bare.units(), UnitsContainer("psi"));

    Quantity negative = reader.getQuantity("values", "negative");
    EXPECT_NEAR(negative.magnitudeAs("degC"), -40.0, 1e-9);

    EXPECT_THROW(reader.getQuantity("values", "missing"), std::out_of_range);
    EXPECT_THROW(reader.getQuantity("values", "bad_unit"), UndefinedUnitError);
}

TEST_F(ConfigReaderTest, GetDoubleWithUnit) {
    ConfigReader reader(registry);
    reader.loadFile(test_config_file);

    EXPECT_DOUBLE_EQ(reader.getDoubleWithUnit("values", "depth", 0.0, "m"), 2500.0);
    EXPECT_DOUBLE_EQ(reader.getDoubleWithUnit("values", "depth", 0.0), 2500.0);
    EXPECT_NEAR(reader.getDoubleWithUnit("values", "temperature", 0.0), 298.15, 1e-12);
    EXPECT_NEAR(reader.getDoubleWithUnit("values", "temperature", 0.0, "degF"), 77.0, 1e-9);

    // Bare numbers are taken to be in the target units
    EXPECT_DOUBLE_EQ(reader.getDoubleWithUnit("values", "bare", 0.0, "psi"), 3.0);

    EXPECT_DOUBLE_EQ(reader.getDoubleWithUnit("values", "missing", 12.0, "m"), 12.0);

    testing::internal::CaptureStderr();
    EXPECT_DOUBLE_EQ(reader.getDoubleWithUnit("values", "bad_unit", -1.0, "m"), -1.0);
    EXPECT_DOUBLE_EQ(reader.getDoubleWithUnit("values", "depth", -2.0, "s"), -2.0);
    std::string output = testing::internal::GetCapturedStderr();
    EXPECT_NE(output.find("Warning"), std::string::npos);
}

TEST_F(ConfigReaderTest, GetDoubleArrayWithUnit) {
    ConfigReader reader(registry);
    reader.loadFile(test_config_file);

    std::vector<double> wavelengths = reader.getDoubleArrayWithUnit("values", "wavelengths", "nm");
    ASSERT_EQ(wavelengths.size(), 3u);
    EXPECT_NEAR(wavelengths[0], 400.0, 1e-9);
    EXPECT_NEAR(wavelengths[1], 550.0, 1e-9);
    EXPECT_NEAR(wavelengths[2], 700.0, 1e-9);
}

TEST_F(ConfigReaderTest, DefaultRegistryUsedWithoutArgument) {
    ConfigReader reader;
    reader.loadFile(test_config_file);
    EXPECT_DOUBLE_EQ(reader.getDoubleWithUnit("values", "depth", 0.0, "m"), 2500.0);
    EXPECT_EQ(reader.buildContextStack().size(), 2u);
}

// =============================================================================
// Template Generation
// =============================================================================

TEST_F(ConfigReaderTest, GeneratedTemplateLoads) {
    const std::string file = "test_template.config";
    ConfigReader::generateTemplate(file);

    ConfigReader reader(registry);
    ASSERT_TRUE(reader.loadFile(file));
    std::remove(file.c_str());

    RegistryOptions options;
    EXPECT_TRUE(reader.parseRegistryOptions(options));
    EXPECT_EQ(options.on_redefinition, RedefinitionPolicy::RAISE);

    ContextStack stack = reader.buildContextStack(registry);
    ASSERT_EQ(stack.size(), 1u);
    EXPECT_EQ(stack.activeNames().front(), "spectroscopy");

    EXPECT_DOUBLE_EQ(reader.getDoubleWithUnit("values", "length", 0.0, "m"), 2500.0);
    EXPECT_EQ(reader.getDoubleArrayWithUnit("values", "wavelengths", "nm").size(), 3u);
}
