#pragma once

#include "geo/Projector.h"
#include "grid/Bin.h"
#include "grid/Binner.h"

#include <glm/vec2.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

namespace grid
{

struct Face
{
    std::uint32_t a{0};
    std::uint32_t b{0};
    std::uint32_t c{0};
};

struct LatticeBounds
{
    int minBx{0};
    int maxBx{0};
    int minBy{0};
    int maxBy{0};

    [[nodiscard]] int width() const noexcept { return maxBx - minBx + 1; }
    [[nodiscard]] int height() const noexcept { return maxBy - minBy + 1; }
    [[nodiscard]] bool contains(const BinKey& key) const noexcept
    {
        return key.bx >= minBx && key.bx <= maxBx && key.by >= minBy && key.by <= maxBy;
    }
};

// Simulation-eligible bins with their triangulated connectivity. Topology is
// fixed once built; only Bin::zCur changes during a run.
class Lattice
{
public:
    struct BuildStats
    {
        std::size_t inputBins{0};
        std::size_t eligibleBins{0};
        std::size_t faceCount{0};
    };

    Lattice() = default;

    // Copies the eligible bins out of the grid; the grid itself is left untouched.
    bool build(const BinMap& grid, const geo::LocalFrame& frame, double binSizeM, BuildStats* stats = nullptr);

    // Every bin back at its existing elevation.
    void resetElevations();

    [[nodiscard]] bool isValid() const noexcept { return m_valid; }
    [[nodiscard]] bool empty() const noexcept { return m_bins.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return m_bins.size(); }

    [[nodiscard]] const std::vector<Bin>& bins() const noexcept { return m_bins; }
    [[nodiscard]] const Bin& bin(std::uint32_t index) const { return m_bins[index]; }
    [[nodiscard]] Bin& bin(std::uint32_t index) { return m_bins[index]; }
    [[nodiscard]] const std::vector<Face>& faces() const noexcept { return m_faces; }

    [[nodiscard]] const LatticeBounds& bounds() const noexcept { return m_bounds; }
    [[nodiscard]] const geo::LocalFrame& frame() const noexcept { return m_frame; }
    [[nodiscard]] double binSize() const noexcept { return m_binSize; }
    [[nodiscard]] double binArea() const noexcept { return m_binSize * m_binSize; }

    [[nodiscard]] BinKey keyFor(const glm::dvec2& xy) const noexcept;
    [[nodiscard]] std::optional<std::uint32_t> indexOf(const BinKey& key) const;
    [[nodiscard]] std::optional<std::uint32_t> indexAt(const glm::dvec2& xy) const;
    [[nodiscard]] std::optional<std::uint32_t> nearestIndex(const glm::dvec2& xy) const;

    // Containing bin when present, nearest bin otherwise.
    [[nodiscard]] std::optional<std::uint32_t> locate(const glm::dvec2& xy) const;

private:
    void buildFaces();

    std::vector<Bin> m_bins;
    std::vector<Face> m_faces;
    std::unordered_map<BinKey, std::uint32_t, BinKeyHash> m_indexByKey;
    LatticeBounds m_bounds{};
    geo::LocalFrame m_frame{};
    double m_binSize{0.6096};
    bool m_valid{false};
};

} // namespace grid
