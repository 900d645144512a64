#include "app/TripLogObserver.h"

#include "common/log.h"
#include "sim/GradeCheck.h"

#include <QtCore/QString>

namespace app
{

TripLogObserver::TripLogObserver(common::LengthUnit unit)
    : m_unit(unit)
{
}

void TripLogObserver::onInitialState(const grid::Lattice& lattice)
{
    const sim::GradeReport report = sim::assessGrade(lattice);
    LOG_INFO(App, QStringLiteral("Initial state: %1 bins, %2 need cut, %3 need fill, mean deviation %4")
                      .arg(static_cast<qulonglong>(report.binCount))
                      .arg(static_cast<qulonglong>(report.aboveTolerance))
                      .arg(static_cast<qulonglong>(report.belowTolerance))
                      .arg(common::formatLength(report.meanAbsDeviation_m, m_unit)));
}

void TripLogObserver::onTripApplied(const grid::Lattice& lattice, const sim::TripRecord& trip, const sim::TripOutcome& outcome)
{
    ++m_notifications;
    const sim::GradeReport report = sim::assessGrade(lattice);
    LOG_INFO(App, QStringLiteral("Trip %1 (%7 haul, %8 geometry): cut %2 m3 (%3 discarded), fill %4 m3 (%5 discarded); %6% of bins on grade")
                      .arg(trip.tripIndex)
                      .arg(outcome.cut.placed_m3, 0, 'f', 3)
                      .arg(outcome.cut.discarded_m3, 0, 'f', 3)
                      .arg(outcome.fill.placed_m3, 0, 'f', 3)
                      .arg(outcome.fill.discarded_m3, 0, 'f', 3)
                      .arg(report.withinFraction() * 100.0, 0, 'f', 1)
                      .arg(common::formatLength(outcome.haul_m, m_unit, 1))
                      .arg(outcome.detailedGeometry ? QStringLiteral("recorded") : QStringLiteral("derived")));
}

} // namespace app
