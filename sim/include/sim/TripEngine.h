#pragma once

#include "grid/Lattice.h"
#include "sim/Equipment.h"
#include "sim/FootprintResolver.h"
#include "sim/TripRecord.h"
#include "sim/VolumeDistributor.h"

#include <cstddef>
#include <optional>
#include <vector>

namespace sim
{

struct TripOutcome
{
    int tripIndex{0};
    double bank_m3{0.0};
    double loose_m3{0.0};
    double compacted_m3{0.0};
    DistributionResult cut{};
    DistributionResult fill{};
    std::size_t cutFootprintBins{0};
    std::size_t fillFootprintBins{0};
    double haul_m{0.0};
    bool detailedGeometry{false};
    bool skipped{false};
};

struct RunSummary
{
    std::size_t tripsRequested{0};
    std::size_t tripsApplied{0};
    std::size_t tripsSkipped{0};
    double cutPlaced_m3{0.0};
    double cutDiscarded_m3{0.0};
    double fillPlaced_m3{0.0};
    double fillDiscarded_m3{0.0};
};

class TripObserver
{
public:
    virtual ~TripObserver() = default;

    virtual void onInitialState(const grid::Lattice& lattice) = 0;
    virtual void onTripApplied(const grid::Lattice& lattice, const TripRecord& trip, const TripOutcome& outcome) = 0;
};

// Replays haul trips over a lattice it owns. Trips must arrive with strictly
// increasing indices; elevations never pass the proposed surface.
class TripEngine
{
public:
    TripEngine(grid::Lattice lattice, const EquipmentParams& params, EvolutionMode mode);

    TripEngine(const TripEngine&) = delete;
    TripEngine& operator=(const TripEngine&) = delete;

    TripOutcome apply(const TripRecord& trip);
    RunSummary run(std::vector<TripRecord> trips, const RunOptions& options, TripObserver* observer = nullptr);

    // Puts every bin back at its existing elevation and forgets the trip history.
    void reset();

    [[nodiscard]] const grid::Lattice& lattice() const noexcept { return m_lattice; }
    [[nodiscard]] const EquipmentParams& params() const noexcept { return m_params; }
    [[nodiscard]] EvolutionMode mode() const noexcept { return m_mode; }
    [[nodiscard]] std::optional<int> lastTripIndex() const noexcept { return m_lastTripIndex; }

private:
    [[nodiscard]] double cutCapacity(std::uint32_t index) const;
    [[nodiscard]] double fillCapacity(std::uint32_t index) const;
    double applyCut(std::uint32_t index, double volume_m3);
    double applyFill(std::uint32_t index, double volume_m3);

    DistributionResult distribute(const Footprint& footprint,
                                  double volume_m3,
                                  const std::optional<Profile>& profile,
                                  bool cut);

    grid::Lattice m_lattice;
    EquipmentParams m_params;
    EvolutionMode m_mode{EvolutionMode::Blade};
    FootprintResolver m_resolver;
    std::optional<int> m_lastTripIndex;
};

} // namespace sim
