#include <gtest/gtest.h>
#include "../src/physics/environment/standard_atmosphere.hpp"
#include <cmath>
#include <vector>

using namespace std_atmosphere::environment;

class StandardAtmosphereTest : public ::testing::Test {
protected:
    void SetUp() override {
        boundaries_ = {36151.725, 82344.678, 155347.756, 175346.171, 249000.304, 299515.564};
    }

    std::vector<double> boundaries_;
};

// Test layer table
TEST_F(StandardAtmosphereTest, SixContiguousLayers) {
    const auto& layers = StandardAtmosphere::layers();
    ASSERT_EQ(layers.size(), 6u);
    EXPECT_EQ(layers.front().base_altitude, 0.0);
    for (std::size_t i = 0; i < layers.size(); ++i) {
        EXPECT_EQ(layers[i].top_altitude, boundaries_[i]);
        if (i > 0) {
            EXPECT_EQ(layers[i].base_altitude, layers[i - 1].top_altitude);
        }
    }
    EXPECT_EQ(StandardAtmosphere::top_altitude(), 299515.564);
}

TEST_F(StandardAtmosphereTest, IsothermalLayers) {
    const auto& layers = StandardAtmosphere::layers();
    EXPECT_EQ(layers[0].temperature_law, TemperatureLaw::Linear);
    EXPECT_EQ(layers[1].temperature_law, TemperatureLaw::Constant);
    EXPECT_EQ(layers[2].temperature_law, TemperatureLaw::Linear);
    EXPECT_EQ(layers[3].temperature_law, TemperatureLaw::Constant);
    EXPECT_EQ(layers[4].temperature_law, TemperatureLaw::Linear);
    EXPECT_EQ(layers[5].temperature_law, TemperatureLaw::Constant);

    EXPECT_EQ(StandardAtmosphere::temperature(40000.0), 389.988);
    EXPECT_EQ(StandardAtmosphere::temperature(80000.0), 389.988);
    EXPECT_EQ(StandardAtmosphere::temperature(160000.0), 508.788);
    EXPECT_EQ(StandardAtmosphere::temperature(260000.0), 354.348);
}

// Test each layer in isolation
TEST_F(StandardAtmosphereTest, LayerFormulas) {
    const auto& layers = StandardAtmosphere::layers();

    EXPECT_NEAR(layers[0].temperature(10000.0), 518.0 - 0.003559996 * 10000.0, 1e-12);
    EXPECT_NEAR(layers[0].log_pressure(10000.0),
                7.657389 + 5.2561258 * std::log(1.0 - 6.8634634e-6 * 10000.0), 1e-12);

    EXPECT_NEAR(layers[1].log_pressure(50000.0), 6.158411 - 4.77916918e-5 * (50000.0 - 36151.725), 1e-12);

    EXPECT_NEAR(layers[2].temperature(100000.0), 389.988 + 0.0016273286 * (100000.0 - 82344.678), 1e-12);
    EXPECT_NEAR(layers[2].log_pressure(100000.0),
                3.950775 - 11.3882724 * std::log(1.0 + 4.17276598e-6 * (100000.0 - 82344.678)), 1e-12);

    EXPECT_NEAR(layers[3].log_pressure(165000.0), 0.922461 - 3.62635373e-5 * (165000.0 - 155347.756), 1e-12);

    EXPECT_NEAR(layers[4].temperature(200000.0), 508.788 - 0.0020968273 * (200000.0 - 175346.171), 1e-12);
    EXPECT_NEAR(layers[4].log_pressure(200000.0),
                0.197235 + 8.7602095 * std::log(1.0 - 4.12122002e-6 * (200000.0 - 175346.171)), 1e-12);

    EXPECT_NEAR(layers[5].log_pressure(270000.0), -2.971785 - 5.1533546650e-5 * (270000.0 - 249000.304), 1e-12);
}

// Test sea-level reference values
TEST_F(StandardAtmosphereTest, SeaLevel) {
    EXPECT_EQ(StandardAtmosphere::temperature(0.0), 518.0);
    EXPECT_NEAR(StandardAtmosphere::pressure(0.0), std::exp(7.657389), 1e-9);
    EXPECT_NEAR(StandardAtmosphere::pressure(0.0), 2116.22, 0.01);
}

// Test layer selection
TEST_F(StandardAtmosphereTest, LayerIndexUsesInclusiveLowerBound) {
    EXPECT_EQ(StandardAtmosphere::layer_index(0.0), 0u);
    EXPECT_EQ(StandardAtmosphere::layer_index(36151.724), 0u);
    for (std::size_t i = 0; i + 1 < boundaries_.size(); ++i) {
        EXPECT_EQ(StandardAtmosphere::layer_index(boundaries_[i]), i + 1);
    }
    EXPECT_EQ(StandardAtmosphere::layer_index(299515.564), 5u);
    EXPECT_EQ(StandardAtmosphere::layer_index(1.0e6), 5u);
    EXPECT_EQ(StandardAtmosphere::layer_index(-5000.0), 0u);
}

// Test continuity at the layer boundaries
TEST_F(StandardAtmosphereTest, PressureContinuousAtBoundaries) {
    const auto& layers = StandardAtmosphere::layers();
    for (std::size_t i = 0; i + 1 < layers.size(); ++i) {
        const double z = layers[i].top_altitude;
        const double below = std::exp(layers[i].log_pressure(z));
        const double above = std::exp(layers[i + 1].log_pressure(z));
        EXPECT_NEAR(below, above, 1e-3) << "boundary " << z;
        EXPECT_NEAR(StandardAtmosphere::pressure(z - 1e-6), StandardAtmosphere::pressure(z), 1e-3)
            << "boundary " << z;
    }
    const double top = StandardAtmosphere::top_altitude();
    EXPECT_NEAR(StandardAtmosphere::pressure(top - 1e-6), StandardAtmosphere::pressure(top), 1e-3);
}

TEST_F(StandardAtmosphereTest, TemperatureContinuousAboveTropopause) {
    const auto& layers = StandardAtmosphere::layers();
    for (std::size_t i = 1; i + 1 < layers.size(); ++i) {
        const double z = layers[i].top_altitude;
        EXPECT_NEAR(layers[i].temperature(z), layers[i + 1].temperature(z), 1e-3) << "boundary " << z;
    }
    const double top = StandardAtmosphere::top_altitude();
    EXPECT_EQ(StandardAtmosphere::temperature(top - 1e-6), StandardAtmosphere::temperature(top));
}

TEST_F(StandardAtmosphereTest, TropopauseTemperatureStepFromTable) {
    // Table C.1 carries a 0.688 R step at the tropopause
    const auto& layers = StandardAtmosphere::layers();
    const double z = layers[0].top_altitude;
    EXPECT_NEAR(layers[1].temperature(z) - layers[0].temperature(z), 0.688, 1e-3);
}

// Test extrapolation
TEST_F(StandardAtmosphereTest, ExtrapolatesAboveTopLayer) {
    EXPECT_TRUE(StandardAtmosphere::is_extrapolated(350000.0));
    EXPECT_FALSE(StandardAtmosphere::is_extrapolated(100000.0));

    EXPECT_EQ(StandardAtmosphere::temperature(350000.0), 354.348);
    const double p_top = StandardAtmosphere::pressure(299515.564);
    const double p_high = StandardAtmosphere::pressure(350000.0);
    EXPECT_TRUE(std::isfinite(p_high));
    EXPECT_GT(p_high, 0.0);
    EXPECT_LT(p_high, p_top);
    EXPECT_NEAR(std::log(p_high), -2.971785 - 5.1533546650e-5 * (350000.0 - 249000.304), 1e-12);
}

TEST_F(StandardAtmosphereTest, ExtrapolatesBelowSeaLevel) {
    EXPECT_TRUE(StandardAtmosphere::is_extrapolated(-1000.0));
    EXPECT_NEAR(StandardAtmosphere::temperature(-1000.0), 518.0 + 3.559996, 1e-9);
    EXPECT_GT(StandardAtmosphere::pressure(-1000.0), StandardAtmosphere::pressure(0.0));
}

TEST_F(StandardAtmosphereTest, TemperaturePositiveEverywhere) {
    for (double z = -10000.0; z <= 500000.0; z += 2500.0) {
        EXPECT_GT(StandardAtmosphere::temperature(z), 0.0) << z;
        EXPECT_GT(StandardAtmosphere::pressure(z), 0.0) << z;
    }
}
