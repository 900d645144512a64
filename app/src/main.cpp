#include "app/TripLogObserver.h"

#include "common/Units.h"
#include "common/log.h"
#include "common/logging.h"
#include "grid/Binner.h"
#include "grid/Lattice.h"
#include "io/SampleReader.h"
#include "io/TripReader.h"
#include "sim/Equipment.h"
#include "sim/GradeCheck.h"
#include "sim/TripEngine.h"

#include <QtCore/QCommandLineParser>
#include <QtCore/QCoreApplication>
#include <QtCore/QStringList>

#include <utility>

namespace
{

constexpr int kExitOk = 0;
constexpr int kExitLoadError = 1;

void reportWarnings(const QStringList& warnings)
{
    for (const QString& warning : warnings)
    {
        LOG_WARN(Io, warning);
    }
}

void reportGrade(const sim::GradeReport& report, common::LengthUnit unit)
{
    using common::formatLength;
    using common::formatVolume;

    LOG_INFO(App, QStringLiteral("Grade check (tolerance %1): %2 bins, %3 above, %4 below, %5 within")
                      .arg(formatLength(report.tolerance_m, unit))
                      .arg(static_cast<qulonglong>(report.binCount))
                      .arg(static_cast<qulonglong>(report.aboveTolerance))
                      .arg(static_cast<qulonglong>(report.belowTolerance))
                      .arg(static_cast<qulonglong>(report.withinTolerance)));
    LOG_INFO(App, QStringLiteral("Remaining cut %1, remaining fill %2")
                      .arg(formatVolume(report.remainingCut_m3, common::VolumeUnit::CubicYards))
                      .arg(formatVolume(report.remainingFill_m3, common::VolumeUnit::CubicYards)));
    LOG_INFO(App, QStringLiteral("Deviation: max %1, mean %2")
                      .arg(formatLength(report.maxAbsDeviation_m, unit))
                      .arg(formatLength(report.meanAbsDeviation_m, unit)));
    if (report.minExisting_m && report.maxExisting_m)
    {
        LOG_INFO(App, QStringLiteral("Existing elevation range %1 .. %2")
                          .arg(formatLength(*report.minExisting_m, unit))
                          .arg(formatLength(*report.maxExisting_m, unit)));
    }
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("haulgrade"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Replays scraper haul trips over a surveyed field and reports the grade."));
    parser.addHelpOption();
    parser.addPositionalArgument(QStringLiteral("samples"), QStringLiteral("Survey CSV with Latitude, Longitude, Existing and Proposed columns."));
    parser.addPositionalArgument(QStringLiteral("trips"), QStringLiteral("Haul trip CSV."));

    const QCommandLineOption modeOption(QStringLiteral("mode"), QStringLiteral("Evolution mode: strip or blade."), QStringLiteral("mode"), QStringLiteral("blade"));
    const QCommandLineOption maxTripsOption(QStringLiteral("max-trips"), QStringLiteral("Replay at most N trips (0 = all)."), QStringLiteral("N"), QStringLiteral("0"));
    const QCommandLineOption everyOption(QStringLiteral("every"), QStringLiteral("Report progress every N trips."), QStringLiteral("N"), QStringLiteral("1"));
    const QCommandLineOption toleranceOption(QStringLiteral("tolerance-ft"), QStringLiteral("On-grade tolerance in feet."), QStringLiteral("F"), QStringLiteral("0.1"));
    const QCommandLineOption unitsOption(QStringLiteral("units"), QStringLiteral("Report lengths in m or ft."), QStringLiteral("unit"), QStringLiteral("m"));
    const QCommandLineOption verboseOption(QStringList{QStringLiteral("v"), QStringLiteral("verbose")}, QStringLiteral("Log every trip."));
    parser.addOptions({modeOption, maxTripsOption, everyOption, toleranceOption, unitsOption, verboseOption});
    parser.process(app);

    common::initLogging(parser.isSet(verboseOption));

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 2)
    {
        LOG_ERR(App, QStringLiteral("Expected a samples file and a trips file."));
        parser.showHelp(kExitLoadError);
    }

    const sim::EvolutionMode mode = parser.value(modeOption).compare(QStringLiteral("strip"), Qt::CaseInsensitive) == 0
                                        ? sim::EvolutionMode::Strip
                                        : sim::EvolutionMode::Blade;
    sim::RunOptions options;
    options.maxTrips = parser.value(maxTripsOption).toULongLong();
    options.notifyEvery = parser.value(everyOption).toULongLong();
    options.ensureValid();

    bool toleranceOk = false;
    double toleranceFt = parser.value(toleranceOption).toDouble(&toleranceOk);
    if (!toleranceOk || toleranceFt < 0.0)
    {
        LOG_WARN(App, QStringLiteral("Ignoring tolerance \"%1\"; using 0.1 ft").arg(parser.value(toleranceOption)));
        toleranceFt = 0.1;
    }
    const double tolerance_m = common::toMeters(toleranceFt, common::LengthUnit::Feet);
    const common::LengthUnit reportUnit = common::lengthUnitFromString(parser.value(unitsOption));

    QStringList warnings;
    io::SampleReader sampleReader;
    const bool samplesLoaded = sampleReader.loadFromFile(positional.at(0), warnings);
    reportWarnings(warnings);
    if (!samplesLoaded || sampleReader.samples().empty())
    {
        LOG_ERR(App, QStringLiteral("No usable samples in %1").arg(positional.at(0)));
        return kExitLoadError;
    }

    io::TripReader tripReader;
    const bool tripsLoaded = tripReader.loadFromFile(positional.at(1), warnings);
    reportWarnings(warnings);
    if (!tripsLoaded || tripReader.trips().empty())
    {
        LOG_ERR(App, QStringLiteral("No usable trips in %1").arg(positional.at(1)));
        return kExitLoadError;
    }

    const sim::EquipmentParams equipment = sim::makeDefaultEquipment();
    LOG_INFO(App, QStringLiteral("Equipment \"%1\": width %2, bin %3, mode %4")
                      .arg(QString::fromStdString(equipment.name))
                      .arg(common::formatLength(equipment.width_m, reportUnit))
                      .arg(common::formatLength(equipment.binSize_m, reportUnit))
                      .arg(QString::fromLatin1(sim::modeName(mode))));

    const auto anchor = grid::sampleCentroid(sampleReader.samples());
    if (!anchor)
    {
        LOG_ERR(App, QStringLiteral("Cannot anchor the local frame: no samples."));
        return kExitLoadError;
    }
    const geo::LocalFrame frame(*anchor);

    const grid::Binner binner(equipment.binSize_m);
    const grid::BinMap bins = binner.bin(sampleReader.samples(), frame);

    grid::Lattice lattice;
    if (!lattice.build(bins, frame, equipment.binSize_m))
    {
        LOG_ERR(App, QStringLiteral("No bin has both existing and proposed elevations."));
        return kExitLoadError;
    }

    sim::TripEngine engine(std::move(lattice), equipment, mode);
    app::TripLogObserver observer(reportUnit);
    const sim::RunSummary summary = engine.run(tripReader.trips(), options, &observer);

    LOG_INFO(App, QStringLiteral("Replayed %1 of %2 trips (%3 skipped); cut %4 m3 placed, %5 discarded; fill %6 m3 placed, %7 discarded")
                      .arg(static_cast<qulonglong>(summary.tripsApplied))
                      .arg(static_cast<qulonglong>(summary.tripsRequested))
                      .arg(static_cast<qulonglong>(summary.tripsSkipped))
                      .arg(summary.cutPlaced_m3, 0, 'f', 2)
                      .arg(summary.cutDiscarded_m3, 0, 'f', 2)
                      .arg(summary.fillPlaced_m3, 0, 'f', 2)
                      .arg(summary.fillDiscarded_m3, 0, 'f', 2));

    reportGrade(sim::assessGrade(engine.lattice(), tolerance_m), reportUnit);
    return kExitOk;
}
