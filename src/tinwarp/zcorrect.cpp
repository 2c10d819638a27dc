#include "tinwarp/zcorrect.hpp"

#include <algorithm>
#include <stdexcept>

namespace tinwarp {

    namespace {

        constexpr std::size_t kA = 0;
        constexpr std::size_t kB = 1;
        constexpr std::size_t kC = 2;

        std::array<datapod::Point, 3> corners_of(const Tin &tin, std::size_t tri) {
            return {tin.corner(tri, 0), tin.corner(tri, 1), tin.corner(tri, 2)};
        }

    } // namespace

    bool fit_line(double x0, double z0, double x1, double z1, LinearFunction &fn) {
        if (x0 == x1)
            return false;
        fn.a = (z1 - z0) / (x1 - x0);
        fn.b = z0 - fn.a * x0;
        return true;
    }

    std::array<datapod::Point, 3> sort_by_x(const std::array<datapod::Point, 3> &corners) {
        std::array<std::size_t, 3> order{0, 1, 2};
        std::stable_sort(order.begin(), order.end(),
                         [&](std::size_t lhs, std::size_t rhs) { return corners[lhs].x < corners[rhs].x; });
        return {corners[order[0]], corners[order[1]], corners[order[2]]};
    }

    ZCorrection solve_zcorrection(const std::array<datapod::Point, 3> &target,
                                  const std::array<datapod::Point, 3> &standard) {
        auto t = sort_by_x(target);
        auto s = sort_by_x(standard);

        ZCorrection zc;
        zc.split_x = t[kB].x;

        // Constant offset at B, used for a segment without a line
        LinearFunction at_b{0.0, s[kB].z - t[kB].z};

        LinearFunction target_ab, target_bc, standard_ab, standard_bc;
        bool ab = fit_line(t[kA].x, t[kA].z, t[kB].x, t[kB].z, target_ab) &&
                  fit_line(s[kA].x, s[kA].z, s[kB].x, s[kB].z, standard_ab);
        bool bc = fit_line(t[kB].x, t[kB].z, t[kC].x, t[kC].z, target_bc) &&
                  fit_line(s[kB].x, s[kB].z, s[kC].x, s[kC].z, standard_bc);

        zc.left = ab ? standard_ab - target_ab : at_b;
        zc.right = bc ? standard_bc - target_bc : at_b;
        zc.degenerate = !ab || !bc;

        auto edge = [&](std::size_t from, std::size_t to) {
            return VerticalEdge{t[to].x, t[from].y, s[from].z - t[from].z, t[to].y, s[to].z - t[to].z};
        };
        if (t[kA].x == t[kB].x) {
            zc.vertical = edge(kA, kB);
            if (bc)
                zc.left = zc.right;
        } else if (t[kB].x == t[kC].x) {
            zc.vertical = edge(kB, kC);
            if (ab)
                zc.right = zc.left;
        }
        return zc;
    }

    std::vector<ZCorrection> solve_zcorrections(const Tin &target, const Tin &standard) {
        if (target.size() != standard.size())
            throw std::invalid_argument("solve_zcorrections: networks differ in triangle count");

        std::vector<ZCorrection> out(target.size());

#pragma omp parallel for schedule(static)
        for (long long ti = 0; ti < static_cast<long long>(target.size()); ++ti) {
            const auto i = static_cast<std::size_t>(ti);
            out[i] = solve_zcorrection(corners_of(target, i), corners_of(standard, i));
        }
        return out;
    }

    ZStats correct_z(const Tin &target, const Tin &standard, std::vector<FeatureVertex> &vertices,
                     const std::vector<LocatedVertex> &located) {
        if (located.size() != vertices.size())
            throw std::invalid_argument("correct_z: location count does not match vertex count");
        for (const auto &lv : located) {
            if (lv.sequence >= vertices.size() || (lv.triangle && *lv.triangle >= target.size()))
                throw std::invalid_argument("correct_z: location does not belong to this network");
        }

        std::vector<ZCorrection> corrections = solve_zcorrections(target, standard);

        ZStats stats;
        stats.degenerate_triangles = static_cast<std::size_t>(std::count_if(
            corrections.begin(), corrections.end(), [](const ZCorrection &zc) { return zc.degenerate; }));

        std::size_t corrected = 0;
        std::size_t unlocated = 0;

#pragma omp parallel for schedule(static) reduction(+ : corrected, unlocated)
        for (long long li = 0; li < static_cast<long long>(located.size()); ++li) {
            const auto &lv = located[static_cast<std::size_t>(li)];
            if (!lv.triangle) {
                ++unlocated;
                continue;
            }
            auto &pos = vertices[lv.sequence].position;
            pos.z += corrections[*lv.triangle].delta(pos.x, pos.y);
            ++corrected;
        }

        stats.corrected = corrected;
        stats.unlocated = unlocated;
        return stats;
    }

} // namespace tinwarp
