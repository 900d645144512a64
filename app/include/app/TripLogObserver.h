#pragma once

#include "common/Units.h"
#include "sim/TripEngine.h"

#include <cstddef>

namespace app
{

// Reports replay progress through the app log category.
class TripLogObserver : public sim::TripObserver
{
public:
    explicit TripLogObserver(common::LengthUnit unit = common::LengthUnit::Meters);

    void onInitialState(const grid::Lattice& lattice) override;
    void onTripApplied(const grid::Lattice& lattice, const sim::TripRecord& trip, const sim::TripOutcome& outcome) override;

    [[nodiscard]] std::size_t notifications() const noexcept { return m_notifications; }

private:
    common::LengthUnit m_unit;
    std::size_t m_notifications{0};
};

} // namespace app
