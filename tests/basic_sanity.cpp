#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN

#include "doctest/doctest.h"

#include "common/Units.h"
#include "common/log.h"
#include "common/logging.h"
#include "sim/Equipment.h"

#include <cmath>
#include <string>

DOCTEST_TEST_CASE("default equipment is the 15 ft pull scraper")
{
    const sim::EquipmentParams params = sim::makeDefaultEquipment();
    DOCTEST_CHECK(params.binSize_m == doctest::Approx(0.6096));
    DOCTEST_CHECK(params.width_m == doctest::Approx(4.572));
    DOCTEST_CHECK(params.maxCutDepth_m == doctest::Approx(0.06096));
    DOCTEST_CHECK(params.swell == doctest::Approx(1.30));
    DOCTEST_CHECK(params.shrink == doctest::Approx(0.64));
    DOCTEST_CHECK(params.dumpTravel_m == doctest::Approx(5.0));
    DOCTEST_CHECK(params.widthInBins() == 8);
    DOCTEST_CHECK(params.binArea() == doctest::Approx(0.6096 * 0.6096));
}

DOCTEST_TEST_CASE("ensureValid clamps nonsense parameters")
{
    sim::EquipmentParams params;
    params.binSize_m = -1.0;
    params.width_m = 0.0;
    params.swell = -3.0;
    params.cubicYardsPerCubicMeter = 0.0;
    params.stripAngleDeg = std::nan("");
    params.ensureValid();

    DOCTEST_CHECK(params.binSize_m > 0.0);
    DOCTEST_CHECK(params.width_m > 0.0);
    DOCTEST_CHECK(params.swell == 0.0);
    DOCTEST_CHECK(params.cubicYardsPerCubicMeter == doctest::Approx(common::kCubicYardsPerCubicMeter));
    DOCTEST_CHECK(params.stripAngleDeg == 0.0);
    DOCTEST_CHECK(params.widthInBins() >= 1);

    sim::RunOptions options;
    options.notifyEvery = 0;
    options.ensureValid();
    DOCTEST_CHECK(options.notifyEvery == 1);
}

DOCTEST_TEST_CASE("unit conversions")
{
    DOCTEST_CHECK(common::toMeters(0.1, common::LengthUnit::Feet) == doctest::Approx(0.03048));
    DOCTEST_CHECK(common::fromMeters(0.3048, common::LengthUnit::Feet) == doctest::Approx(1.0));
    DOCTEST_CHECK(common::toCubicMeters(common::kCubicYardsPerCubicMeter, common::VolumeUnit::CubicYards) == doctest::Approx(1.0));
    DOCTEST_CHECK(common::lengthUnitFromString(QStringLiteral(" FT ")) == common::LengthUnit::Feet);
    DOCTEST_CHECK(common::lengthUnitFromString(QStringLiteral("furlong")) == common::LengthUnit::Meters);
    DOCTEST_CHECK(common::formatLength(0.3048, common::LengthUnit::Feet, 2) == QStringLiteral("1.00 ft"));
    DOCTEST_CHECK(sim::modeName(sim::EvolutionMode::Strip) == std::string("strip"));
}

DOCTEST_TEST_CASE("quiet logging hides per-trip sim chatter only")
{
    common::initLogging(false);
    using common::log::Category;
    DOCTEST_CHECK_FALSE(common::log::detail::categoryHandle(Category::Sim).isInfoEnabled());
    DOCTEST_CHECK(common::log::detail::categoryHandle(Category::Sim).isWarningEnabled());
    DOCTEST_CHECK(common::log::detail::categoryHandle(Category::Io).isInfoEnabled());
    DOCTEST_CHECK(common::log::detail::categoryHandle(Category::App).isInfoEnabled());
    LOG_WARN(Io, QStringLiteral("logging goes through the installed handler"));
}
