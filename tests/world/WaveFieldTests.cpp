/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE WaveFieldTests
#include <boost/test/unit_test.hpp>

#include "managers/SettingsManager.hpp"
#include "world/WaveField.hpp"
#include <cmath>
#include <limits>
#include <vector>

using namespace Driftwood;

namespace {

std::vector<Vector3D> samplePoints() {
    std::vector<Vector3D> points;
    for (int x = -40; x <= 40; x += 7) {
        for (int z = -40; z <= 40; z += 9) {
            points.emplace_back(static_cast<float>(x) * 1.3f, 0.0f, static_cast<float>(z) * 0.7f);
        }
    }
    return points;
}

} // namespace

struct WaveFieldFixture {
    WaveFieldFixture() {
        WaveFieldConfig config;
        config.seed = 42;
        field = WaveField(config);
    }

    WaveField field;
};

BOOST_FIXTURE_TEST_SUITE(WaveFieldTestSuite, WaveFieldFixture)

BOOST_AUTO_TEST_CASE(TestInitCreatesRequestedComponents) {
    field.init(6, 1.0f, 1.0f, 7);
    BOOST_CHECK_EQUAL(field.getComponentCount(), 6u);
    BOOST_CHECK_EQUAL(field.getElapsedTime(), 0.0);

    for (size_t i = 0; i < field.getComponentCount(); ++i) {
        const auto& wave = field.getComponents()[i];
        BOOST_CHECK_GE(wave.wavelength, 1.0f);
        BOOST_CHECK_CLOSE(std::hypot(wave.dirX, wave.dirZ), 1.0f, 0.01f);
        // Amplitudes fall off with the component index
        BOOST_CHECK_LE(field.amplitude(i), 1.0f / static_cast<float>(i + 1) + 1e-6f);
        BOOST_CHECK_GT(field.amplitude(i), 0.0f);
    }
    BOOST_CHECK_EQUAL(field.amplitude(99), 0.0f);
}

BOOST_AUTO_TEST_CASE(TestSameSeedIsReproducible) {
    WaveField a;
    WaveField b;
    a.init(5, 0.8f, 1.0f, 1234);
    b.init(5, 0.8f, 1.0f, 1234);
    a.advance(3.25f);
    b.advance(3.25f);

    for (const auto& p : samplePoints()) {
        BOOST_CHECK_EQUAL(a.height(p), b.height(p));
    }

    WaveField c;
    c.init(5, 0.8f, 1.0f, 4321);
    c.advance(3.25f);
    bool anyDifferent = false;
    for (const auto& p : samplePoints()) {
        if (a.height(p) != c.height(p)) {
            anyDifferent = true;
            break;
        }
    }
    BOOST_CHECK(anyDifferent);
}

BOOST_AUTO_TEST_CASE(TestHeightBoundedByAmplitudeSum) {
    const float times[] = {0.0f, 0.5f, 17.0f, 250.0f};
    for (float storm : {0.0f, 0.5f, 1.0f}) {
        field.init(4, 0.6f, 1.0f, 42);
        field.setStormIntensity(storm);
        const float bound = field.amplitudeSum();
        for (float dt : times) {
            field.advance(dt);
            for (const auto& p : samplePoints()) {
                BOOST_CHECK_LE(std::fabs(field.height(p)), bound + 1e-4f);
            }
        }
    }
}

BOOST_AUTO_TEST_CASE(TestNormalIsUnitLength) {
    field.setStormIntensity(1.0f);
    for (float dt : {0.0f, 1.7f, 60.0f}) {
        field.advance(dt);
        for (const auto& p : samplePoints()) {
            Vector3D n = field.normal(p);
            BOOST_CHECK_CLOSE(n.length(), 1.0f, 0.01f);
            BOOST_CHECK_GT(n.getY(), 0.0f);
        }
    }
}

BOOST_AUTO_TEST_CASE(TestFlatSeaWithoutComponents) {
    field.init(0, 1.0f, 1.0f, 1);
    field.advance(5.0f);
    const Vector3D p(3.0f, 0.0f, -2.0f);
    BOOST_CHECK_EQUAL(field.height(p), 0.0f);
    BOOST_CHECK_EQUAL(field.amplitudeSum(), 0.0f);

    Vector3D n = field.normal(p);
    BOOST_CHECK_CLOSE(n.getY(), 1.0f, 0.001f);
    BOOST_CHECK_SMALL(n.getX(), 1e-6f);
    BOOST_CHECK_SMALL(n.getZ(), 1e-6f);
}

BOOST_AUTO_TEST_CASE(TestAdvanceIgnoresInvalidTimesteps) {
    field.advance(1.5f);
    field.advance(-2.0f);
    field.advance(std::numeric_limits<float>::quiet_NaN());
    field.advance(std::numeric_limits<float>::infinity());
    BOOST_CHECK_CLOSE(field.getElapsedTime(), 1.5, 0.0001);

    field.update(0.5f);
    BOOST_CHECK_CLOSE(field.getElapsedTime(), 2.0, 0.0001);
}

BOOST_AUTO_TEST_CASE(TestSurfaceChangesOverTime) {
    const Vector3D p(2.0f, 0.0f, 5.0f);
    const float before = field.height(p);
    field.advance(0.75f);
    BOOST_CHECK_NE(before, field.height(p));
}

BOOST_AUTO_TEST_CASE(TestLongSessionsStayFinite) {
    for (int i = 0; i < 1000; ++i) {
        field.advance(3600.0f);
    }
    const Vector3D p(10.0f, 0.0f, -10.0f);
    BOOST_CHECK(std::isfinite(field.height(p)));
    BOOST_CHECK(field.normal(p).isFinite());
    BOOST_CHECK(field.current(p).isFinite());
}

BOOST_AUTO_TEST_CASE(TestStormIntensityInterpolatesPresets) {
    SeaStatePreset calm{0.5f, 1.0f, 0.2f};
    SeaStatePreset storm{2.5f, 2.0f, 1.2f};
    field.setPresets(calm, storm);

    field.setStormIntensity(0.5f);
    BOOST_CHECK_CLOSE(field.getStormIntensity(), 0.5f, 0.001f);
    BOOST_CHECK_CLOSE(field.getBaseHeight(), 1.5f, 0.001f);
    BOOST_CHECK_CLOSE(field.getSpeedScale(), 1.5f, 0.001f);
    BOOST_CHECK_CLOSE(field.getCurrentStrength(), 0.7f, 0.001f);

    field.setStormIntensity(4.0f);
    BOOST_CHECK_EQUAL(field.getStormIntensity(), 1.0f);
    BOOST_CHECK_CLOSE(field.getBaseHeight(), 2.5f, 0.001f);

    field.setStormIntensity(-1.0f);
    BOOST_CHECK_EQUAL(field.getStormIntensity(), 0.0f);
    BOOST_CHECK_CLOSE(field.getBaseHeight(), 0.5f, 0.001f);

    // Non-finite requests leave the sea state alone
    field.setStormIntensity(std::numeric_limits<float>::quiet_NaN());
    BOOST_CHECK_EQUAL(field.getStormIntensity(), 0.0f);
}

BOOST_AUTO_TEST_CASE(TestStormRaisesAmplitudeBound) {
    const float calmBound = field.amplitudeSum();
    field.setStormIntensity(1.0f);
    BOOST_CHECK_GT(field.amplitudeSum(), calmBound);
}

BOOST_AUTO_TEST_CASE(TestCurrentStaysInWaterPlane) {
    field.advance(12.0f);
    for (const auto& p : samplePoints()) {
        BOOST_CHECK_EQUAL(field.current(p).getY(), 0.0f);
    }
}

BOOST_AUTO_TEST_CASE(TestCurrentWithoutTurbulenceIsPrevailingFlow) {
    field.setTurbulence(0.0f);
    field.setCurrentDirection(Vector3D(0.0f, 5.0f, 2.0f));
    field.advance(3.0f);

    Vector3D c = field.current(Vector3D(4.0f, 0.0f, 4.0f));
    BOOST_CHECK_SMALL(c.getX(), 1e-6f);
    BOOST_CHECK_CLOSE(c.getZ(), field.getCurrentStrength(), 0.001f);
}

BOOST_AUTO_TEST_CASE(TestConfigFromSettings) {
    auto& settings = SettingsManager::Instance();
    settings.clearAll();
    settings.set("ocean", "component_count", 3);
    settings.set("ocean", "seed", 99);
    settings.set("ocean", "base_height", 1.25f);

    WaveFieldConfig config = WaveFieldConfig::fromSettings(settings);
    BOOST_CHECK_EQUAL(config.componentCount, 3);
    BOOST_CHECK_EQUAL(config.seed, 99u);
    BOOST_CHECK_CLOSE(config.baseHeight, 1.25f, 0.001f);
    BOOST_CHECK_CLOSE(config.baseSpeed, 1.0f, 0.001f);

    WaveField configured(config);
    BOOST_CHECK_EQUAL(configured.getComponentCount(), 3u);
    BOOST_CHECK_CLOSE(configured.getBaseHeight(), 1.25f, 0.001f);
    settings.clearAll();
}

BOOST_AUTO_TEST_SUITE_END()
