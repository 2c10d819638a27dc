#include "doctest/doctest.h"
#include "tinwarp/zcorrect.hpp"

namespace {
    tinwarp::Tin make_tin(const std::vector<std::array<double, 3>> &xyz) {
        tinwarp::Tin tin;
        for (std::size_t i = 0; i < xyz.size(); ++i)
            tin.points.push_back(tinwarp::GcpPoint{static_cast<std::int64_t>(i), {xyz[i][0], xyz[i][1], xyz[i][2]}});
        tin.triangles.push_back(tinwarp::Triangle{0, 1, 2});
        return tin;
    }
} // namespace

TEST_CASE("Line fit") {
    tinwarp::LinearFunction fn;
    REQUIRE(tinwarp::fit_line(0.0, 1.0, 2.0, 5.0, fn));
    CHECK(fn.a == doctest::Approx(2.0));
    CHECK(fn.b == doctest::Approx(1.0));
    CHECK(fn(1.0) == doctest::Approx(3.0));

    tinwarp::LinearFunction untouched{7.0, 8.0};
    CHECK_FALSE(tinwarp::fit_line(3.0, 1.0, 3.0, 5.0, untouched));
    CHECK(untouched.a == 7.0);
    CHECK(untouched.b == 8.0);
}

TEST_CASE("Sort by x is stable") {
    std::array<datapod::Point, 3> corners{datapod::Point{5, 1, 0}, datapod::Point{0, 2, 0}, datapod::Point{5, 3, 0}};
    auto sorted = tinwarp::sort_by_x(corners);

    CHECK(sorted[0].y == 2.0);
    CHECK(sorted[1].y == 1.0);
    CHECK(sorted[2].y == 3.0);
}

TEST_CASE("Z correction is exact at the triangle corners") {
    std::array<datapod::Point, 3> target{datapod::Point{10, 0, 0}, datapod::Point{0, 0, 0}, datapod::Point{5, 3, 0}};
    std::array<datapod::Point, 3> standard{datapod::Point{10, 0, 2}, datapod::Point{0, 0, 1},
                                           datapod::Point{5, 3, 4}};

    auto zc = tinwarp::solve_zcorrection(target, standard);

    CHECK_FALSE(zc.degenerate);
    CHECK(zc.split_x == 5.0);
    CHECK(zc.segment(0.0) == tinwarp::ZSegment::Left);
    CHECK(zc.segment(5.0) == tinwarp::ZSegment::Left);
    CHECK(zc.segment(5.5) == tinwarp::ZSegment::Right);

    CHECK(zc.delta(0.0, 0.0) == doctest::Approx(1.0));
    CHECK(zc.delta(5.0, 3.0) == doctest::Approx(4.0));
    CHECK(zc.delta(10.0, 0.0) == doctest::Approx(2.0));

    // Linear between the corners
    CHECK(zc.delta(2.5, 1.0) == doctest::Approx(2.5));
    CHECK(zc.delta(7.5, 1.0) == doctest::Approx(3.0));
}

TEST_CASE("Z correction along a vertical edge") {
    std::array<datapod::Point, 3> target{datapod::Point{0, 0, 0}, datapod::Point{0, 10, 0}, datapod::Point{10, 5, 0}};
    std::array<datapod::Point, 3> standard{datapod::Point{0, 0, 1}, datapod::Point{0, 10, 3},
                                           datapod::Point{10, 5, 6}};

    auto zc = tinwarp::solve_zcorrection(target, standard);

    CHECK(zc.degenerate);
    REQUIRE(zc.vertical.has_value());
    CHECK(zc.delta(0.0, 0.0) == doctest::Approx(1.0));
    CHECK(zc.delta(0.0, 10.0) == doctest::Approx(3.0));
    CHECK(zc.delta(0.0, 5.0) == doctest::Approx(2.0));
    CHECK(zc.delta(10.0, 5.0) == doctest::Approx(6.0));
    CHECK(zc.delta(5.0, 5.0) == doctest::Approx(4.5));

    // Within the tolerance of the edge still counts as on it
    double near = 0.5 * tinwarp::kVerticalEdgeTolerance;
    CHECK(zc.delta(near, 5.0) == doctest::Approx(2.0));
}

TEST_CASE("Correct z moves located vertices only") {
    auto target = make_tin({{0, 0, 0}, {5, 3, 0}, {10, 0, 0}});
    auto standard = make_tin({{0, 0, 1}, {5, 3, 4}, {10, 0, 2}});

    std::vector<tinwarp::FeatureVertex> vertices{{1, {0, 0, 10}}, {2, {5, 3, 10}}, {3, {10, 0, 0}}, {4, {50, 0, 9}}};
    std::vector<tinwarp::LocatedVertex> located{
        {0, std::size_t{0}}, {1, std::size_t{0}}, {2, std::size_t{0}}, {3, std::nullopt}};

    auto stats = tinwarp::correct_z(target, standard, vertices, located);

    CHECK(stats.corrected == 3);
    CHECK(stats.unlocated == 1);
    CHECK(stats.degenerate_triangles == 0);
    CHECK(vertices[0].position.z == doctest::Approx(11.0));
    CHECK(vertices[1].position.z == doctest::Approx(14.0));
    CHECK(vertices[2].position.z == doctest::Approx(2.0));
    CHECK(vertices[3].position.z == 9.0);

    // Planar coordinates are not touched
    CHECK(vertices[1].position.x == 5.0);
    CHECK(vertices[1].position.y == 3.0);
}

TEST_CASE("Correct z validates its inputs") {
    auto target = make_tin({{0, 0, 0}, {5, 3, 0}, {10, 0, 0}});
    auto standard = make_tin({{0, 0, 1}, {5, 3, 4}, {10, 0, 2}});

    std::vector<tinwarp::FeatureVertex> vertices{{1, {1, 1, 0}}};
    std::vector<tinwarp::LocatedVertex> none;
    CHECK_THROWS_AS(tinwarp::correct_z(target, standard, vertices, none), std::invalid_argument);

    std::vector<tinwarp::LocatedVertex> bad{{0, std::size_t{1}}};
    CHECK_THROWS_AS(tinwarp::correct_z(target, standard, vertices, bad), std::invalid_argument);
}
