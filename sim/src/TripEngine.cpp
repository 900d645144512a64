#include "sim/TripEngine.h"

#include "common/log.h"

#include <QtCore/QString>

#include <algorithm>
#include <utility>

namespace sim
{

namespace
{

EquipmentParams validated(EquipmentParams params)
{
    params.ensureValid();
    return params;
}

} // namespace

TripEngine::TripEngine(grid::Lattice lattice, const EquipmentParams& params, EvolutionMode mode)
    : m_lattice(std::move(lattice))
    , m_params(validated(params))
    , m_mode(mode)
    , m_resolver(m_lattice, m_params)
{
    reset();
}

void TripEngine::reset()
{
    m_lattice.resetElevations();
    m_lastTripIndex.reset();
}

double TripEngine::cutCapacity(std::uint32_t index) const
{
    const grid::Bin& bin = m_lattice.bin(index);
    double depth = std::max(0.0, bin.zCur - bin.zProp);
    if (m_mode == EvolutionMode::Blade)
    {
        depth = std::min(m_params.maxCutDepth_m, depth);
    }
    return depth * m_lattice.binArea();
}

double TripEngine::fillCapacity(std::uint32_t index) const
{
    const grid::Bin& bin = m_lattice.bin(index);
    return std::max(0.0, bin.zProp - bin.zCur) * m_lattice.binArea();
}

double TripEngine::applyCut(std::uint32_t index, double volume_m3)
{
    grid::Bin& bin = m_lattice.bin(index);
    const double before = bin.zCur;
    bin.zCur = std::max(bin.zCur - volume_m3 / m_lattice.binArea(), bin.zProp);
    return std::max(0.0, before - bin.zCur) * m_lattice.binArea();
}

double TripEngine::applyFill(std::uint32_t index, double volume_m3)
{
    grid::Bin& bin = m_lattice.bin(index);
    const double before = bin.zCur;
    bin.zCur = std::min(bin.zCur + volume_m3 / m_lattice.binArea(), bin.zProp);
    return std::max(0.0, bin.zCur - before) * m_lattice.binArea();
}

DistributionResult TripEngine::distribute(const Footprint& footprint,
                                          double volume_m3,
                                          const std::optional<Profile>& profile,
                                          bool cut)
{
    const CapacityFn capacity = [this, cut](std::uint32_t index) {
        return cut ? cutCapacity(index) : fillCapacity(index);
    };
    const ApplyFn apply = [this, cut](std::uint32_t index, double volume) {
        return cut ? applyCut(index, volume) : applyFill(index, volume);
    };

    if (m_mode == EvolutionMode::Strip)
    {
        return VolumeDistributor::uniform(footprint, volume_m3, capacity, apply);
    }
    if (profile)
    {
        const VolumeDistributor::ProfileWeighting weighting{m_params.profileReferenceDepth_m,
                                                            m_params.minProfileWeight};
        return VolumeDistributor::profileWeighted(footprint, volume_m3, *profile, weighting, capacity, apply);
    }
    return VolumeDistributor::proportional(footprint, volume_m3, capacity, apply);
}

TripOutcome TripEngine::apply(const TripRecord& trip)
{
    TripOutcome outcome;
    outcome.tripIndex = trip.tripIndex;

    if (m_lastTripIndex && trip.tripIndex <= *m_lastTripIndex)
    {
        LOG_WARN(Sim, QStringLiteral("Trip %1 skipped: index does not follow trip %2")
                          .arg(trip.tripIndex)
                          .arg(*m_lastTripIndex));
        outcome.skipped = true;
        return outcome;
    }
    m_lastTripIndex = trip.tripIndex;

    outcome.bank_m3 = std::max(0.0, trip.bankCubicYards) / m_params.cubicYardsPerCubicMeter;
    outcome.loose_m3 = outcome.bank_m3 * m_params.swell;
    outcome.compacted_m3 = outcome.loose_m3 * m_params.shrink;
    outcome.haul_m = trip.haulDistance_m();
    outcome.detailedGeometry = trip.hasDetailedGeometry();

    // Footprints depend on geometry only, never on elevations.
    const Footprint cutFootprint = m_resolver.cutFootprint(trip, m_mode);
    const Footprint fillFootprint = m_resolver.fillFootprint(trip, m_mode);
    outcome.cutFootprintBins = cutFootprint.cells.size();
    outcome.fillFootprintBins = fillFootprint.cells.size();

    outcome.cut = distribute(cutFootprint, outcome.bank_m3, trip.cutProfile, true);
    outcome.fill = distribute(fillFootprint, outcome.compacted_m3, trip.fillProfile, false);

    LOG_INFO(Sim, QStringLiteral("Trip %1: cut %2/%3 m3 over %4 bins, fill %5/%6 m3 over %7 bins")
                      .arg(trip.tripIndex)
                      .arg(outcome.cut.placed_m3, 0, 'f', 3)
                      .arg(outcome.bank_m3, 0, 'f', 3)
                      .arg(static_cast<qulonglong>(outcome.cut.binsTouched))
                      .arg(outcome.fill.placed_m3, 0, 'f', 3)
                      .arg(outcome.compacted_m3, 0, 'f', 3)
                      .arg(static_cast<qulonglong>(outcome.fill.binsTouched)));
    return outcome;
}

RunSummary TripEngine::run(std::vector<TripRecord> trips, const RunOptions& options, TripObserver* observer)
{
    RunOptions opts = options;
    opts.ensureValid();

    sortByTripIndex(trips);
    if (opts.maxTrips > 0 && trips.size() > opts.maxTrips)
    {
        trips.resize(opts.maxTrips);
    }

    RunSummary summary;
    summary.tripsRequested = trips.size();

    LOG_INFO(Sim, QStringLiteral("Replaying %1 trips in %2 mode over %3 bins")
                      .arg(static_cast<qulonglong>(trips.size()))
                      .arg(QString::fromLatin1(modeName(m_mode)))
                      .arg(static_cast<qulonglong>(m_lattice.size())));

    if (observer)
    {
        observer->onInitialState(m_lattice);
    }

    for (std::size_t k = 0; k < trips.size(); ++k)
    {
        const TripRecord& trip = trips[k];
        const TripOutcome outcome = apply(trip);
        if (outcome.skipped)
        {
            ++summary.tripsSkipped;
            continue;
        }

        ++summary.tripsApplied;
        summary.cutPlaced_m3 += outcome.cut.placed_m3;
        summary.cutDiscarded_m3 += outcome.cut.discarded_m3;
        summary.fillPlaced_m3 += outcome.fill.placed_m3;
        summary.fillDiscarded_m3 += outcome.fill.discarded_m3;

        if (observer && ((k + 1) % opts.notifyEvery) == 0)
        {
            observer->onTripApplied(m_lattice, trip, outcome);
        }
    }

    LOG_INFO(Sim, QStringLiteral("Run finished: %1 applied, %2 skipped, cut %3 m3, fill %4 m3")
                      .arg(static_cast<qulonglong>(summary.tripsApplied))
                      .arg(static_cast<qulonglong>(summary.tripsSkipped))
                      .arg(summary.cutPlaced_m3, 0, 'f', 3)
                      .arg(summary.fillPlaced_m3, 0, 'f', 3));
    return summary;
}

} // namespace sim
