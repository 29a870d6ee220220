/**
 * @file test_config.cpp
 * @brief Unit tests for ConfigReader and simulation config loading
 */

#include <gtest/gtest.h>
#include "lenia/config.hpp"
#include "lenia/errors.hpp"
#include <cstdio>
#include <fstream>

using namespace lenia;

class ConfigReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_config_file = "test_config_unit.ini";
        std::ofstream config(test_config_file);
        config << "# two channels\n";
        config << "[simulation]\n";
        config << "height = 32\n";
        config << "width = 47          # rounded up to even\n";
        config << "dt = 0.25\n";
        config << "base_radius = 10\n";
        config << "channels = 2\n";
        config << "growth = soft\n";
        config << "steps = 40\n";
        config << "seed = 9\n";
        config << "\n[interaction]\n";
        config << "row0 = 0.0, 0.5\n";
        config << "row1 = -0.25, 0.0\n";
        config << "\n[kernel.10]\n";
        config << "rings = 1, 1/4\n";
        config << "mean = 0.2\n";
        config << "sigma = 0.0332\n";
        config << "height = 0.284\n";
        config << "r = 0.5\n";
        config << "source = 1\n";
        config << "destination = 0\n";
        config << "active = false\n";
        config << "\n[kernel.2]\n";
        config << "rings = 5/6, 1\n";
        config << "r = 0.8\n";
        config << "height = -0.4\n";
        config.close();
    }

    void TearDown() override {
        std::remove(test_config_file.c_str());
    }

    std::string test_config_file;
};

TEST_F(ConfigReaderTest, ReadsTypedValues) {
    ConfigReader reader;
    reader.load_file(test_config_file);

    EXPECT_EQ(reader.get_int("simulation", "height", 0), 32);
    EXPECT_DOUBLE_EQ(reader.get_double("simulation", "dt", 0.0), 0.25);
    EXPECT_EQ(reader.get_string("simulation", "growth"), "soft");
    EXPECT_FALSE(reader.get_bool("kernel.10", "active", true));
    EXPECT_TRUE(reader.has_key("interaction", "row1"));
    EXPECT_FALSE(reader.has_key("interaction", "row2"));
}

TEST_F(ConfigReaderTest, DefaultValues) {
    ConfigReader reader;
    reader.load_file(test_config_file);

    EXPECT_EQ(reader.get_int("simulation", "missing", 42), 42);
    EXPECT_DOUBLE_EQ(reader.get_double("nosection", "dt", 1.5), 1.5);
    EXPECT_EQ(reader.get_string("simulation", "missing", "x"), "x");
}

TEST_F(ConfigReaderTest, ArraysAcceptFractions) {
    ConfigReader reader;
    reader.load_file(test_config_file);

    const std::vector<double> rings = reader.get_double_array("kernel.2", "rings");
    ASSERT_EQ(rings.size(), 2u);
    EXPECT_DOUBLE_EQ(rings[0], 5.0 / 6.0);
    EXPECT_DOUBLE_EQ(rings[1], 1.0);
}

TEST_F(ConfigReaderTest, LoadsSimulationConfig) {
    const SimulationConfig cfg = load_simulation_config(test_config_file);

    EXPECT_EQ(cfg.shape, (GridShape{32, 48}));
    EXPECT_DOUBLE_EQ(cfg.dt, 0.25);
    EXPECT_EQ(cfg.channels, 2u);
    EXPECT_EQ(cfg.growth, GrowthKind::Soft);
    EXPECT_EQ(cfg.steps, 40u);
    EXPECT_EQ(cfg.seed, 9u);

    ASSERT_EQ(cfg.interaction.size(), 2u);
    EXPECT_DOUBLE_EQ(cfg.interaction.at(0, 1), 0.5);
    EXPECT_DOUBLE_EQ(cfg.interaction.at(1, 0), -0.25);

    // kernel.2 sorts before kernel.10
    ASSERT_EQ(cfg.kernels.size(), 2u);
    EXPECT_DOUBLE_EQ(cfg.kernels[0].radius, 8.0);
    EXPECT_DOUBLE_EQ(cfg.kernels[0].height, -0.4);
    EXPECT_DOUBLE_EQ(cfg.kernels[1].radius, 5.0);
    EXPECT_DOUBLE_EQ(cfg.kernels[1].rings[1], 0.25);
    EXPECT_EQ(cfg.kernels[1].source, 1u);
    EXPECT_EQ(cfg.kernels[1].destination, 0u);
    ASSERT_EQ(cfg.active.size(), 2u);
    EXPECT_TRUE(cfg.active[0]);
    EXPECT_FALSE(cfg.active[1]);
}

TEST(ConfigTest, MissingFileIsConfigurationError) {
    EXPECT_THROW(load_simulation_config("does_not_exist.ini"), ConfigurationError);
}

TEST(ConfigTest, MalformedValuesNameTheKey) {
    ConfigReader reader;
    reader.load_string("[simulation]\ndt = fast\n");
    try {
        reader.get_double("simulation", "dt", 0.5);
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_NE(std::string(e.what()).find("[simulation] dt"), std::string::npos);
    }
    EXPECT_THROW(reader.load_string("no section here\n"), ConfigurationError);
}

TEST(ConfigTest, RejectsBadKernels) {
    ConfigReader bad_channel;
    bad_channel.load_string("[simulation]\nchannels = 1\n[kernel.0]\nrings = 1\ndestination = 1\n");
    EXPECT_THROW(load_simulation_config(bad_channel), ConfigurationError);

    ConfigReader no_rings;
    no_rings.load_string("[kernel.0]\nr = 1\n");
    EXPECT_THROW(load_simulation_config(no_rings), ConfigurationError);

    ConfigReader zero_radius;
    zero_radius.load_string("[kernel.0]\nrings = 1\nr = 0\n");
    EXPECT_THROW(load_simulation_config(zero_radius), ConfigurationError);

    ConfigReader bad_growth;
    bad_growth.load_string("[simulation]\ngrowth = tanh\n");
    EXPECT_THROW(load_simulation_config(bad_growth), ConfigurationError);
}

TEST(ConfigTest, SeedMustBeNonNegative) {
    ConfigReader negative;
    negative.load_string("[simulation]\nseed = -1\n");
    EXPECT_THROW(load_simulation_config(negative), ConfigurationError);

    ConfigReader too_large;
    too_large.load_string("[simulation]\nseed = 4294967296\n");
    EXPECT_THROW(load_simulation_config(too_large), ConfigurationError);

    ConfigReader largest;
    largest.load_string("[simulation]\nseed = 4294967295\n");
    EXPECT_EQ(load_simulation_config(largest).seed, 4294967295u);
}

TEST(ConfigTest, ParseNumberHandlesFractions) {
    EXPECT_DOUBLE_EQ(parse_number("1/4"), 0.25);
    EXPECT_DOUBLE_EQ(parse_number(" 11 / 12 "), 11.0 / 12.0);
    EXPECT_DOUBLE_EQ(parse_number("-3e-2"), -0.03);
    EXPECT_THROW(parse_number("1/0"), ConfigurationError);
    EXPECT_THROW(parse_number("abc"), ConfigurationError);
    EXPECT_THROW(parse_number(""), ConfigurationError);
}

TEST(ConfigTest, DefaultConfigurationIsConsistent) {
    const SimulationConfig cfg = default_simulation_config();
    EXPECT_EQ(cfg.shape, (GridShape{384, 684}));
    EXPECT_DOUBLE_EQ(cfg.dt, 0.5);
    EXPECT_EQ(cfg.channels, 3u);
    ASSERT_EQ(cfg.kernels.size(), 25u);
    EXPECT_EQ(cfg.active.size(), 25u);
    EXPECT_DOUBLE_EQ(cfg.kernels[0].radius, 12.0 * 0.91);
    EXPECT_DOUBLE_EQ(cfg.kernels[17].height, -0.5);
    EXPECT_DOUBLE_EQ(cfg.interaction.at(1, 0), -0.2);
    for (const KernelDescriptor& d : cfg.kernels) {
        EXPECT_NO_THROW(validate_descriptor(d));
        EXPECT_LT(d.source, cfg.channels);
        EXPECT_LT(d.destination, cfg.channels);
    }
}
