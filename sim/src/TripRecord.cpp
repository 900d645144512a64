#include "sim/TripRecord.h"

#include <algorithm>

namespace sim
{

double TripRecord::haulDistance_m() const noexcept
{
    return geo::haversineDistance(start, end);
}

void sortByTripIndex(std::vector<TripRecord>& trips)
{
    std::stable_sort(trips.begin(), trips.end(), [](const TripRecord& lhs, const TripRecord& rhs) {
        return lhs.tripIndex < rhs.tripIndex;
    });
}

} // namespace sim
