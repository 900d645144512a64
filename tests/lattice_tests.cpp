#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"

#include "haulgrade_test_helpers.h"

#include "grid/Lattice.h"

#include <glm/geometric.hpp>

#include <cstdint>
#include <limits>
#include <random>
#include <set>
#include <tuple>
#include <vector>

using test_support::CellSpec;

namespace
{

std::set<std::tuple<std::uint32_t, std::uint32_t, std::uint32_t>> faceSet(const grid::Lattice& lattice)
{
    std::set<std::tuple<std::uint32_t, std::uint32_t, std::uint32_t>> faces;
    for (const grid::Face& f : lattice.faces())
    {
        faces.insert({f.a, f.b, f.c});
    }
    return faces;
}

std::uint32_t bruteNearest(const grid::Lattice& lattice, const glm::dvec2& xy)
{
    std::uint32_t best = 0;
    double bestD2 = std::numeric_limits<double>::infinity();
    for (std::uint32_t i = 0; i < lattice.size(); ++i)
    {
        const glm::dvec2 d = lattice.bin(i).position - xy;
        const double d2 = d.x * d.x + d.y * d.y;
        if (d2 < bestD2)
        {
            bestD2 = d2;
            best = i;
        }
    }
    return best;
}

} // namespace

TEST_CASE("Lattice keeps only bins with both elevations")
{
    const std::vector<CellSpec> cells = {
        {0, 0, 10.0, 8.0},
        {1, 0, 10.0, std::nullopt},
        {0, 1, std::nullopt, 8.0},
        {1, 1, 9.0, 9.5},
    };

    grid::Lattice::BuildStats stats;
    const geo::LocalFrame frame = test_support::originFrame();
    grid::Lattice lattice;
    REQUIRE(lattice.build(grid::Binner(1.0).bin(test_support::samplesFor(cells, 1.0), frame), frame, 1.0, &stats));

    CHECK(stats.inputBins == 4);
    CHECK(stats.eligibleBins == 2);
    CHECK(lattice.size() == 2);
    for (const grid::Bin& bin : lattice.bins())
    {
        CHECK(bin.zCur == doctest::Approx(*bin.zExistMean));
        CHECK(bin.zProp == doctest::Approx(*bin.zPropMean));
    }
}

TEST_CASE("Lattice build fails without eligible bins")
{
    const grid::Lattice lattice = test_support::makeLattice({{0, 0, 10.0, std::nullopt}, {1, 0, std::nullopt, 3.0}});
    CHECK_FALSE(lattice.isValid());
    CHECK(lattice.empty());
    CHECK(lattice.faces().empty());
}

TEST_CASE("Lattice orders vertices row by row")
{
    const grid::Lattice lattice = test_support::makeUniformLattice(3, 2, 10.0, 8.0);
    REQUIRE(lattice.size() == 6);
    CHECK(lattice.bin(0).key == grid::BinKey{0, 0});
    CHECK(lattice.bin(2).key == grid::BinKey{2, 0});
    CHECK(lattice.bin(3).key == grid::BinKey{0, 1});
    CHECK(*lattice.indexOf({1, 1}) == 4);
    CHECK_FALSE(lattice.indexOf({5, 5}).has_value());
}

TEST_CASE("A full unit cell yields two triangles")
{
    const grid::Lattice lattice = test_support::makeUniformLattice(2, 2, 10.0, 8.0);
    // Vertex order: 0=(0,0) 1=(1,0) 2=(0,1) 3=(1,1).
    const auto faces = faceSet(lattice);
    CHECK(faces.size() == 2);
    CHECK(faces.count({0, 1, 2}) == 1);
    CHECK(faces.count({1, 3, 2}) == 1);
}

TEST_CASE("A cell missing one corner still yields the other triangle")
{
    SUBCASE("missing (0,0)")
    {
        const grid::Lattice lattice = test_support::makeLattice({{1, 0, 1.0, 1.0}, {0, 1, 1.0, 1.0}, {1, 1, 1.0, 1.0}});
        REQUIRE(lattice.faces().size() == 1);
        const grid::Face& face = lattice.faces().front();
        CHECK(lattice.bin(face.a).key == grid::BinKey{1, 0});
        CHECK(lattice.bin(face.b).key == grid::BinKey{1, 1});
        CHECK(lattice.bin(face.c).key == grid::BinKey{0, 1});
    }
    SUBCASE("missing (1,1)")
    {
        const grid::Lattice lattice = test_support::makeLattice({{0, 0, 1.0, 1.0}, {1, 0, 1.0, 1.0}, {0, 1, 1.0, 1.0}});
        REQUIRE(lattice.faces().size() == 1);
        const grid::Face& face = lattice.faces().front();
        CHECK(lattice.bin(face.a).key == grid::BinKey{0, 0});
        CHECK(lattice.bin(face.b).key == grid::BinKey{1, 0});
        CHECK(lattice.bin(face.c).key == grid::BinKey{0, 1});
    }
    SUBCASE("missing (1,0) shares a corner with both triangles")
    {
        const grid::Lattice lattice = test_support::makeLattice({{0, 0, 1.0, 1.0}, {0, 1, 1.0, 1.0}, {1, 1, 1.0, 1.0}});
        CHECK(lattice.faces().empty());
    }
}

TEST_CASE("A 3x3 lattice has eight faces")
{
    const grid::Lattice lattice = test_support::makeUniformLattice(3, 3, 10.0, 8.0);
    CHECK(lattice.faces().size() == 8);
    CHECK(lattice.bounds().width() == 3);
    CHECK(lattice.bounds().height() == 3);
}

TEST_CASE("Nearest bin lookup")
{
    const grid::Lattice lattice = test_support::makeLattice({{0, 0, 1.0, 1.0}, {4, 0, 1.0, 1.0}, {2, 3, 1.0, 1.0}});
    REQUIRE(lattice.isValid());

    SUBCASE("inside an occupied cell")
    {
        const auto idx = lattice.locate({4.2, 0.9});
        REQUIRE(idx.has_value());
        CHECK(lattice.bin(*idx).key == grid::BinKey{4, 0});
    }
    SUBCASE("inside an empty cell")
    {
        CHECK_FALSE(lattice.indexAt({1.5, 0.5}).has_value());
        const auto idx = lattice.nearestIndex({1.2, 0.5});
        REQUIRE(idx.has_value());
        CHECK(lattice.bin(*idx).key == grid::BinKey{0, 0});
    }
    SUBCASE("far outside the bounds")
    {
        const auto idx = lattice.nearestIndex({100.0, 2.0});
        REQUIRE(idx.has_value());
        CHECK(lattice.bin(*idx).key == grid::BinKey{4, 0});

        const auto above = lattice.locate({2.5, 40.0});
        REQUIRE(above.has_value());
        CHECK(lattice.bin(*above).key == grid::BinKey{2, 3});
    }
}

TEST_CASE("Nearest bin matches a full scan, near and far")
{
    // A 40x40 site with every third column missing.
    std::vector<CellSpec> cells;
    for (int by = 0; by < 40; ++by)
    {
        for (int bx = 0; bx < 40; ++bx)
        {
            if (bx % 3 != 1)
            {
                cells.push_back({bx, by, 2.0, 1.0});
            }
        }
    }
    const grid::Lattice lattice = test_support::makeLattice(cells);
    REQUIRE(lattice.isValid());

    std::vector<glm::dvec2> queries{{4.4e6, 20.3}, {-4.4e6, -3.0e6}, {17.5, 4.4e6}, {1.5, 7.5}};
    std::mt19937 rng(7);
    std::uniform_real_distribution<double> coord(-60.0, 100.0);
    for (int i = 0; i < 200; ++i)
    {
        queries.push_back({coord(rng), coord(rng)});
    }

    for (const glm::dvec2& xy : queries)
    {
        const auto idx = lattice.nearestIndex(xy);
        REQUIRE(idx.has_value());
        const glm::dvec2 found = lattice.bin(*idx).position - xy;
        const glm::dvec2 expected = lattice.bin(bruteNearest(lattice, xy)).position - xy;
        CHECK(glm::dot(found, found) == doctest::Approx(glm::dot(expected, expected)));
    }
}

TEST_CASE("Reset restores existing elevations")
{
    grid::Lattice lattice = test_support::makeUniformLattice(2, 1, 10.0, 8.0);
    lattice.bin(0).zCur = 8.5;
    lattice.bin(1).zCur = 9.0;
    lattice.resetElevations();
    CHECK(lattice.bin(0).zCur == doctest::Approx(10.0));
    CHECK(lattice.bin(1).zCur == doctest::Approx(10.0));
}
