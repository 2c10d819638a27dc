#include "doctest/doctest.h"
#include "tinwarp/locate.hpp"

namespace {
    // Two triangles sharing the edge (10,0)-(0,10)
    std::vector<tinwarp::Triangle2> two_triangles() {
        return {tinwarp::Triangle2{tinwarp::Vec2{0, 0}, tinwarp::Vec2{10, 0}, tinwarp::Vec2{0, 10}},
                tinwarp::Triangle2{tinwarp::Vec2{10, 0}, tinwarp::Vec2{10, 10}, tinwarp::Vec2{0, 10}}};
    }

    std::vector<tinwarp::FeatureVertex> grid_vertices(int n, double step, double offset) {
        std::vector<tinwarp::FeatureVertex> out;
        std::int64_t id = 0;
        for (int i = 0; i < n; ++i)
            for (int j = 0; j < n; ++j)
                out.push_back(tinwarp::FeatureVertex{id++, {offset + i * step, offset + j * step, 0.0}});
        return out;
    }
} // namespace

TEST_CASE("Point in triangle") {
    tinwarp::Triangle2 ccw{tinwarp::Vec2{0, 0}, tinwarp::Vec2{10, 0}, tinwarp::Vec2{0, 10}};
    tinwarp::Triangle2 cw{tinwarp::Vec2{0, 0}, tinwarp::Vec2{0, 10}, tinwarp::Vec2{10, 0}};

    SUBCASE("Interior") {
        CHECK(tinwarp::contains(ccw, tinwarp::Vec2{2, 2}));
        CHECK(tinwarp::contains(cw, tinwarp::Vec2{2, 2}));
    }

    SUBCASE("Edges and corners count as inside") {
        CHECK(tinwarp::contains(ccw, tinwarp::Vec2{5, 0}));
        CHECK(tinwarp::contains(ccw, tinwarp::Vec2{5, 5}));
        CHECK(tinwarp::contains(ccw, tinwarp::Vec2{0, 0}));
        CHECK(tinwarp::contains(cw, tinwarp::Vec2{0, 10}));
    }

    SUBCASE("Exterior") {
        CHECK_FALSE(tinwarp::contains(ccw, tinwarp::Vec2{6, 6}));
        CHECK_FALSE(tinwarp::contains(ccw, tinwarp::Vec2{-1, 2}));
        CHECK_FALSE(tinwarp::contains(cw, tinwarp::Vec2{11, 0}));
    }
}

TEST_CASE("Locate returns the first containing triangle") {
    auto tris = two_triangles();

    CHECK(tinwarp::locate(tinwarp::Vec2{2, 2}, tris) == std::optional<std::size_t>{0});
    CHECK(tinwarp::locate(tinwarp::Vec2{8, 8}, tris) == std::optional<std::size_t>{1});
    CHECK_FALSE(tinwarp::locate(tinwarp::Vec2{20, 20}, tris).has_value());

    // On the shared edge both contain the point, the lower index wins
    CHECK(tinwarp::locate(tinwarp::Vec2{5, 5}, tris) == std::optional<std::size_t>{0});

    tinwarp::Locator locator(tris);
    CHECK(locator.locate(tinwarp::Vec2{5, 5}) == std::optional<std::size_t>{0});
    CHECK(locator.locate(tinwarp::Vec2{10, 0}) == std::optional<std::size_t>{0});
    CHECK(locator.locate(tinwarp::Vec2{10, 10}) == std::optional<std::size_t>{1});
}

TEST_CASE("Locator agrees with the linear scan") {
    auto tris = two_triangles();
    tinwarp::Locator locator(tris);

    for (const auto &v : grid_vertices(15, 1.0, -2.0)) {
        tinwarp::Vec2 p{v.position.x, v.position.y};
        CHECK(locator.locate(p) == tinwarp::locate(p, tris));
    }
}

TEST_CASE("Locate all keeps input order") {
    tinwarp::Locator locator(two_triangles());
    auto vertices = grid_vertices(12, 1.0, -1.0);

    auto located = locator.locate_all(vertices, 7);

    REQUIRE(located.size() == vertices.size());
    for (std::size_t i = 0; i < located.size(); ++i)
        CHECK(located[i].sequence == i);

    // Vertices with x = -1 or y = -1 fall outside the square [0, 10]
    CHECK(tinwarp::count_unlocated(located) == 12 * 12 - 11 * 11);
}

TEST_CASE("Locate all does not depend on the chunk size") {
    tinwarp::Locator locator(two_triangles());
    auto vertices = grid_vertices(20, 0.7, -1.5);

    auto reference = locator.locate_all(vertices, vertices.size());
    for (std::size_t chunk : {std::size_t{1}, std::size_t{3}, std::size_t{64}, std::size_t{100000}}) {
        auto located = locator.locate_all(vertices, chunk);
        REQUIRE(located.size() == reference.size());
        for (std::size_t i = 0; i < located.size(); ++i) {
            CHECK(located[i].sequence == reference[i].sequence);
            CHECK(located[i].triangle == reference[i].triangle);
        }
    }
}

TEST_CASE("Locate all is repeatable") {
    tinwarp::Locator locator(two_triangles());
    auto vertices = grid_vertices(10, 1.1, 0.0);

    auto first = locator.locate_all(vertices, 5);
    auto second = locator.locate_all(vertices, 5);
    REQUIRE(first.size() == second.size());
    for (std::size_t i = 0; i < first.size(); ++i)
        CHECK(first[i].triangle == second[i].triangle);
}

TEST_CASE("Locate all edge cases") {
    tinwarp::Locator locator(two_triangles());

    std::vector<tinwarp::FeatureVertex> none;
    CHECK(locator.locate_all(none, 10).empty());

    auto vertices = grid_vertices(2, 1.0, 1.0);
    CHECK_THROWS_AS(locator.locate_all(vertices, 0), std::invalid_argument);
}
