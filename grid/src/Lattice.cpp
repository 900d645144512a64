#include "grid/Lattice.h"

#include "common/Enforce.h"
#include "common/log.h"

#include <QtCore/QString>

#include <algorithm>
#include <cmath>
#include <limits>

namespace grid
{

bool Lattice::build(const BinMap& grid, const geo::LocalFrame& frame, double binSizeM, BuildStats* stats)
{
    ENFORCE_POSITIVE(binSizeM, "bin size must be positive");

    m_bins.clear();
    m_faces.clear();
    m_indexByKey.clear();
    m_bounds = {};
    m_frame = frame;
    m_binSize = binSizeM;
    m_valid = false;

    m_bins.reserve(grid.size());
    for (const auto& [key, source] : grid)
    {
        if (!source.isEligible())
        {
            continue;
        }
        Bin bin = source;
        bin.zCur = *bin.zExistMean;
        bin.zProp = *bin.zPropMean;
        m_bins.push_back(bin);
    }

    if (m_bins.empty())
    {
        LOG_WARN(Grid, QStringLiteral("Lattice: none of %1 bins carry both existing and proposed elevations")
                           .arg(static_cast<qulonglong>(grid.size())));
        return false;
    }

    // Hash-map iteration order is unspecified; keep vertex order reproducible.
    std::sort(m_bins.begin(), m_bins.end(), [](const Bin& lhs, const Bin& rhs) { return lhs.key < rhs.key; });

    m_indexByKey.reserve(m_bins.size());
    m_bounds.minBx = std::numeric_limits<int>::max();
    m_bounds.minBy = std::numeric_limits<int>::max();
    m_bounds.maxBx = std::numeric_limits<int>::min();
    m_bounds.maxBy = std::numeric_limits<int>::min();

    for (std::size_t i = 0; i < m_bins.size(); ++i)
    {
        const BinKey& key = m_bins[i].key;
        m_indexByKey.emplace(key, static_cast<std::uint32_t>(i));
        m_bounds.minBx = std::min(m_bounds.minBx, key.bx);
        m_bounds.maxBx = std::max(m_bounds.maxBx, key.bx);
        m_bounds.minBy = std::min(m_bounds.minBy, key.by);
        m_bounds.maxBy = std::max(m_bounds.maxBy, key.by);
    }

    buildFaces();
    m_valid = true;

    LOG_INFO(Grid, QStringLiteral("Lattice: %1 bins, %2 faces, bounds bx=[%3,%4] by=[%5,%6]")
                       .arg(static_cast<qulonglong>(m_bins.size()))
                       .arg(static_cast<qulonglong>(m_faces.size()))
                       .arg(m_bounds.minBx)
                       .arg(m_bounds.maxBx)
                       .arg(m_bounds.minBy)
                       .arg(m_bounds.maxBy));

    if (stats)
    {
        stats->inputBins = grid.size();
        stats->eligibleBins = m_bins.size();
        stats->faceCount = m_faces.size();
    }
    return true;
}

void Lattice::resetElevations()
{
    for (Bin& bin : m_bins)
    {
        bin.zCur = bin.zExistMean.value_or(bin.zCur);
    }
}

void Lattice::buildFaces()
{
    // Each unit cell contributes its two triangles independently so that a
    // cell with one missing corner still yields one face.
    for (int bx = m_bounds.minBx; bx < m_bounds.maxBx; ++bx)
    {
        for (int by = m_bounds.minBy; by < m_bounds.maxBy; ++by)
        {
            const auto i00 = indexOf({bx, by});
            const auto i10 = indexOf({bx + 1, by});
            const auto i01 = indexOf({bx, by + 1});
            const auto i11 = indexOf({bx + 1, by + 1});

            if (i00 && i10 && i01)
            {
                m_faces.push_back({*i00, *i10, *i01});
            }
            if (i10 && i11 && i01)
            {
                m_faces.push_back({*i10, *i11, *i01});
            }
        }
    }
}

BinKey Lattice::keyFor(const glm::dvec2& xy) const noexcept
{
    return {static_cast<int>(std::floor(xy.x / m_binSize)), static_cast<int>(std::floor(xy.y / m_binSize))};
}

std::optional<std::uint32_t> Lattice::indexOf(const BinKey& key) const
{
    const auto it = m_indexByKey.find(key);
    if (it == m_indexByKey.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::uint32_t> Lattice::indexAt(const glm::dvec2& xy) const
{
    return indexOf(keyFor(xy));
}

std::optional<std::uint32_t> Lattice::nearestIndex(const glm::dvec2& xy) const
{
    if (m_bins.empty())
    {
        return std::nullopt;
    }

    const BinKey origin = keyFor(xy);

    // Rings closer than the lattice bounds are empty; start at the first one that can hold bins.
    const int gapX = std::max({0, m_bounds.minBx - origin.bx, origin.bx - m_bounds.maxBx});
    const int gapY = std::max({0, m_bounds.minBy - origin.by, origin.by - m_bounds.maxBy});
    const int firstRing = std::max(gapX, gapY);
    const int lastRing = std::max({std::abs(origin.bx - m_bounds.minBx),
                                   std::abs(origin.bx - m_bounds.maxBx),
                                   std::abs(origin.by - m_bounds.minBy),
                                   std::abs(origin.by - m_bounds.maxBy)});

    std::optional<std::uint32_t> best;
    double bestD2 = std::numeric_limits<double>::infinity();

    const auto consider = [&](int bx, int by) {
        const BinKey key{bx, by};
        if (!m_bounds.contains(key))
        {
            return;
        }
        const auto idx = indexOf(key);
        if (!idx)
        {
            return;
        }
        const glm::dvec2 d = m_bins[*idx].position - xy;
        const double d2 = d.x * d.x + d.y * d.y;
        if (d2 < bestD2 || (d2 == bestD2 && best && *idx < *best))
        {
            bestD2 = d2;
            best = idx;
        }
    };

    for (int r = firstRing; r <= lastRing; ++r)
    {
        if (r == 0)
        {
            consider(origin.bx, origin.by);
        }
        else
        {
            // Only the part of the ring that overlaps the bounds is walked.
            const int x0 = std::max(origin.bx - r, m_bounds.minBx);
            const int x1 = std::min(origin.bx + r, m_bounds.maxBx);
            const int y0 = std::max(origin.by - r + 1, m_bounds.minBy);
            const int y1 = std::min(origin.by + r - 1, m_bounds.maxBy);
            for (int bx = x0; bx <= x1; ++bx)
            {
                consider(bx, origin.by - r);
                consider(bx, origin.by + r);
            }
            for (int by = y0; by <= y1; ++by)
            {
                consider(origin.bx - r, by);
                consider(origin.bx + r, by);
            }
        }

        // Every bin beyond ring r sits at least r bin widths away from xy.
        if (best)
        {
            const double reach = static_cast<double>(r) * m_binSize;
            if (bestD2 <= reach * reach)
            {
                break;
            }
        }
    }

    return best;
}

std::optional<std::uint32_t> Lattice::locate(const glm::dvec2& xy) const
{
    if (const auto idx = indexAt(xy))
    {
        return idx;
    }
    return nearestIndex(xy);
}

} // namespace grid
