#pragma once

#include <glm/vec2.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>

namespace grid
{

struct BinKey
{
    int bx{0};
    int by{0};

    friend bool operator==(const BinKey& lhs, const BinKey& rhs) noexcept
    {
        return lhs.bx == rhs.bx && lhs.by == rhs.by;
    }

    friend bool operator!=(const BinKey& lhs, const BinKey& rhs) noexcept
    {
        return !(lhs == rhs);
    }

    // Row-major order: by first, then bx.
    friend bool operator<(const BinKey& lhs, const BinKey& rhs) noexcept
    {
        return lhs.by != rhs.by ? lhs.by < rhs.by : lhs.bx < rhs.bx;
    }
};

struct BinKeyHash
{
    std::size_t operator()(const BinKey& key) const noexcept
    {
        const std::uint64_t packed = (static_cast<std::uint64_t>(static_cast<std::uint32_t>(key.bx)) << 32)
                                     | static_cast<std::uint64_t>(static_cast<std::uint32_t>(key.by));
        return std::hash<std::uint64_t>{}(packed);
    }
};

struct Bin
{
    // Running sums over the samples that fell into the cell.
    struct Aggregate
    {
        std::size_t sampleCount{0};
        double sumLat{0.0};
        double sumLon{0.0};
        std::size_t existCount{0};
        double sumExist{0.0};
        std::size_t propCount{0};
        double sumProp{0.0};
    };

    BinKey key{};
    Aggregate aggregate{};
    double latCenter{0.0};
    double lonCenter{0.0};
    glm::dvec2 position{0.0};
    std::optional<double> zExistMean;
    std::optional<double> zPropMean;
    double zCur{0.0};
    double zProp{0.0};

    [[nodiscard]] bool isEligible() const noexcept { return zExistMean.has_value() && zPropMean.has_value(); }
};

} // namespace grid
