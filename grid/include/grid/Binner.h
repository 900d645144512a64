#pragma once

#include "geo/Projector.h"
#include "grid/Bin.h"
#include "grid/Sample.h"

#include <glm/vec2.hpp>

#include <unordered_map>
#include <vector>

namespace grid
{

using BinMap = std::unordered_map<BinKey, Bin, BinKeyHash>;

class Binner
{
public:
    struct Stats
    {
        std::size_t sampleCount{0};
        std::size_t binCount{0};
        std::size_t eligibleBins{0};
        std::size_t existOnlyBins{0};
        std::size_t propOnlyBins{0};
    };

    explicit Binner(double binSizeM);

    [[nodiscard]] double binSize() const noexcept { return m_binSize; }
    [[nodiscard]] BinKey keyFor(const glm::dvec2& xy) const noexcept;

    [[nodiscard]] BinMap bin(const std::vector<Sample>& samples,
                             const geo::LocalFrame& frame,
                             Stats* stats = nullptr) const;

private:
    double m_binSize{0.6096};
};

} // namespace grid
