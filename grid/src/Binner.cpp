#include "grid/Binner.h"

#include "common/Enforce.h"
#include "common/log.h"

#include <QtCore/QString>

#include <cmath>

namespace grid
{

std::optional<geo::GeoPoint> sampleCentroid(const std::vector<Sample>& samples)
{
    if (samples.empty())
    {
        return std::nullopt;
    }

    std::vector<geo::GeoPoint> points;
    points.reserve(samples.size());
    for (const Sample& sample : samples)
    {
        points.push_back(sample.position);
    }
    return geo::centroidOf(points);
}

Binner::Binner(double binSizeM)
    : m_binSize(binSizeM)
{
    ENFORCE_POSITIVE(binSizeM, "bin size must be positive");
}

BinKey Binner::keyFor(const glm::dvec2& xy) const noexcept
{
    return {static_cast<int>(std::floor(xy.x / m_binSize)), static_cast<int>(std::floor(xy.y / m_binSize))};
}

BinMap Binner::bin(const std::vector<Sample>& samples, const geo::LocalFrame& frame, Stats* stats) const
{
    BinMap bins;
    bins.reserve(samples.size() / 4 + 1);

    for (const Sample& sample : samples)
    {
        const glm::dvec2 xy = frame.toLocal(sample.position);
        const BinKey key = keyFor(xy);

        auto [it, inserted] = bins.try_emplace(key);
        Bin& bin = it->second;
        if (inserted)
        {
            bin.key = key;
        }

        Bin::Aggregate& agg = bin.aggregate;
        ++agg.sampleCount;
        agg.sumLat += sample.position.lat;
        agg.sumLon += sample.position.lon;
        if (sample.zExist)
        {
            ++agg.existCount;
            agg.sumExist += *sample.zExist;
        }
        if (sample.zProp)
        {
            ++agg.propCount;
            agg.sumProp += *sample.zProp;
        }
    }

    Stats local;
    local.sampleCount = samples.size();
    local.binCount = bins.size();

    for (auto& [key, bin] : bins)
    {
        const Bin::Aggregate& agg = bin.aggregate;
        const double count = static_cast<double>(agg.sampleCount);
        bin.latCenter = agg.sumLat / count;
        bin.lonCenter = agg.sumLon / count;
        bin.position = frame.toLocal(bin.latCenter, bin.lonCenter);

        if (agg.existCount > 0)
        {
            bin.zExistMean = agg.sumExist / static_cast<double>(agg.existCount);
        }
        if (agg.propCount > 0)
        {
            bin.zPropMean = agg.sumProp / static_cast<double>(agg.propCount);
        }

        if (bin.isEligible())
        {
            ++local.eligibleBins;
        }
        else if (bin.zExistMean)
        {
            ++local.existOnlyBins;
        }
        else if (bin.zPropMean)
        {
            ++local.propOnlyBins;
        }
    }

    LOG_INFO(Grid,
             QStringLiteral("Binner: %1 samples into %2 bins @ %3 m (eligible=%4, existing-only=%5, proposed-only=%6)")
                 .arg(static_cast<qulonglong>(local.sampleCount))
                 .arg(static_cast<qulonglong>(local.binCount))
                 .arg(m_binSize, 0, 'f', 4)
                 .arg(static_cast<qulonglong>(local.eligibleBins))
                 .arg(static_cast<qulonglong>(local.existOnlyBins))
                 .arg(static_cast<qulonglong>(local.propOnlyBins)));

    if (stats)
    {
        *stats = local;
    }
    return bins;
}

} // namespace grid
