/**
 * @file test_growth.cpp
 * @brief Unit tests for the growth function library
 */

#include <gtest/gtest.h>
#include "lenia/errors.hpp"
#include "lenia/growth.hpp"
#include <cmath>

using namespace lenia;

TEST(GrowthTest, GaussPeaksAtMean) {
    EXPECT_DOUBLE_EQ(gauss(0.3, 0.3, 0.1), 1.0);
    EXPECT_NEAR(gauss(0.4, 0.3, 0.1), std::exp(-0.5), 1e-12);
    EXPECT_NEAR(gauss(0.2, 0.3, 0.1), gauss(0.4, 0.3, 0.1), 1e-12);
}

TEST(GrowthTest, SigmoidIsHalfAtMean) {
    EXPECT_DOUBLE_EQ(sigmoid(0.5, 0.5, 0.1), 0.5);
    EXPECT_GT(sigmoid(0.9, 0.5, 0.1), 0.95);
    EXPECT_LT(sigmoid(0.1, 0.5, 0.1), 0.05);
}

TEST(GrowthTest, SinusoidalIsSquaredSine) {
    EXPECT_NEAR(sinusoidal(0.5, 0.5, 0.2), 0.0, 1e-12);
    EXPECT_NEAR(sinusoidal(0.6, 0.5, 0.2), 1.0, 1e-12);
}

TEST(GrowthTest, MultiPeakVariantsAddFixedPeaks) {
    EXPECT_NEAR(multi_peak(0.6, 0.15, 0.02), 1.0 + gauss(0.6, 0.15, 0.02), 1e-12);
    EXPECT_NEAR(soft(0.5, 0.15, 0.02), gauss(0.5, 0.15, 0.02) + 0.3, 1e-12);
    EXPECT_NEAR(multi_peak_soft(0.5, 0.15, 0.02), soft(0.5, 0.15, 0.02) + 0.3, 1e-12);
}

TEST(GrowthTest, RegistryRoundTripsNames) {
    for (const std::string& name : growth_kind_names()) {
        EXPECT_EQ(growth_kind_name(growth_kind_from_name(name)), name);
    }
    EXPECT_EQ(growth_kind_from_name("gauss"), GrowthKind::Gauss);
    EXPECT_EQ(growth_function(GrowthKind::Sigmoid), &sigmoid);
}

TEST(GrowthTest, UnknownNameIsConfigurationError) {
    EXPECT_THROW(growth_kind_from_name("tanh"), ConfigurationError);
}

TEST(GrowthTest, GridApplicationMatchesScalar) {
    Grid g(GridShape{4, 5});
    for (std::size_t i = 0; i < g.size(); ++i) g.data[i] = static_cast<double>(i) / g.size();

    const GrowthKind kinds[] = {GrowthKind::Gauss, GrowthKind::Sigmoid, GrowthKind::Sinusoidal,
                                GrowthKind::MultiPeak, GrowthKind::Soft, GrowthKind::MultiPeakSoft};
    for (GrowthKind kind : kinds) {
        const Grid out = apply_growth(kind, g, 0.3, 0.07);
        ASSERT_EQ(out.shape, g.shape);
        const GrowthFn fn = growth_function(kind);
        for (std::size_t i = 0; i < g.size(); ++i) {
            EXPECT_EQ(out.data[i], fn(g.data[i], 0.3, 0.07)) << growth_kind_name(kind) << " at " << i;
        }
    }
}

TEST(GrowthTest, GridApplicationRejectsBadParameters) {
    const Grid g(GridShape{2, 3}, 0.4);
    EXPECT_THROW(apply_growth(GrowthKind::Gauss, g, 0.5, 0.0), ConfigurationError);
    EXPECT_THROW(apply_growth(GrowthKind::Soft, g, 0.5, -0.1), ConfigurationError);
    EXPECT_THROW(apply_growth(GrowthKind::Sigmoid, g, 0.5, NAN), ConfigurationError);
    EXPECT_THROW(apply_growth(GrowthKind::Gauss, g, INFINITY, 0.15), ConfigurationError);
}
