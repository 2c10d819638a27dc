#include "tinwarp/formula.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

#include "tinwarp/utils/utils.hpp"

namespace tinwarp {

    TransformFormula solve_formula(const Triangle2 &target, const Triangle2 &standard) {
        TransformFormula f;

        // Vertex 0
        f.translation = standard[0] - target[0];
        Triangle2 work{target[0] + f.translation, target[1] + f.translation, target[2] + f.translation};
        f.pivot = work[0];

        // Vertex 1: rotate about the pivot, then scale so edge 0-1 matches
        Vec2 target_edge = target[1] - target[0];
        Vec2 standard_edge = standard[1] - standard[0];
        double target_angle = target_edge.angle();
        double standard_edge_angle = standard_edge.angle();

        f.rotation = Mat2::rotation(standard_edge_angle - target_angle);
        f.scale1 = standard_edge.norm() / target_edge.norm();
        if (target_edge.norm() == 0.0)
            f.degenerate = true;

        for (auto &v : work)
            v = (f.rotation * (v - f.pivot)) * f.scale1;

        // Vertex 2: lay edge 0-1 on the x axis and match height, then shear
        f.standard_angle = standard_edge_angle;
        Mat2 unrotate = Mat2::rotation(-standard_edge_angle);
        for (auto &v : work)
            v = unrotate * v;
        Vec2 standard_v2 = unrotate * (standard[2] - f.pivot);

        if (work[2].y == 0.0) {
            f.scale2 = 0.0;
            f.degenerate = true;
        } else {
            f.scale2 = standard_v2.y / work[2].y;
        }
        for (auto &v : work)
            v.y *= f.scale2;

        f.shear.target = std::atan2(work[2].x, work[2].y);
        f.shear.standard = std::atan2(standard_v2.x, standard_v2.y);
        return f;
    }

    Vec2 apply_formula(const Vec2 &p, const TransformFormula &formula) {
        Vec2 g = p + formula.translation;
        g = (formula.rotation * (g - formula.pivot)) * formula.scale1;
        g = Mat2::rotation(-formula.standard_angle) * g;
        g.y *= formula.scale2;
        g.x += g.y * (std::tan(formula.shear.standard) - std::tan(formula.shear.target));
        g = Mat2::rotation(formula.standard_angle) * g;
        return g + formula.pivot;
    }

    std::vector<TransformFormula> solve_formulas(const TinPair &tins, CoordinatePlane plane) {
        const std::size_t n = tins.target.size();
        std::vector<TransformFormula> formulas(n);

#pragma omp parallel for schedule(static)
        for (long long ti = 0; ti < static_cast<long long>(n); ++ti) {
            const auto i = static_cast<std::size_t>(ti);
            Triangle2 target = tins.target.plane_triangle(i, plane);
            Triangle2 standard = tins.standard.plane_triangle(i, plane);

            if (utils::same_triangle(target, standard)) {
                formulas[i].skipped = true;
                continue;
            }
            formulas[i] = solve_formula(target, standard);
        }
        return formulas;
    }

    TransformStats apply_transform(const TinPair &tins, std::vector<FeatureVertex> &vertices,
                                   const std::vector<LocatedVertex> &located, CoordinatePlane plane) {
        if (located.size() != vertices.size())
            throw std::invalid_argument("apply_transform: " + std::to_string(located.size()) +
                                        " locations for " + std::to_string(vertices.size()) + " vertices");
        for (const auto &lv : located) {
            if (lv.sequence >= vertices.size() || (lv.triangle && *lv.triangle >= tins.target.size()))
                throw std::invalid_argument("apply_transform: location does not belong to this network");
        }

        std::vector<TransformFormula> formulas = solve_formulas(tins, plane);

        TransformStats stats;
        for (const auto &f : formulas) {
            if (f.skipped)
                ++stats.skipped_triangles;
            else if (f.degenerate)
                ++stats.degenerate_triangles;
        }

        std::size_t transformed = 0;
        std::size_t unlocated = 0;

#pragma omp parallel for schedule(static) reduction(+ : transformed, unlocated)
        for (long long li = 0; li < static_cast<long long>(located.size()); ++li) {
            const auto &lv = located[static_cast<std::size_t>(li)];
            if (!lv.triangle) {
                ++unlocated;
                continue;
            }
            const auto &f = formulas[*lv.triangle];
            if (f.skipped)
                continue;

            auto &pos = vertices[lv.sequence].position;
            unproject(pos, apply_formula(project(pos, plane), f), plane);
            ++transformed;
        }

        stats.transformed = transformed;
        stats.unlocated = unlocated;
        return stats;
    }

} // namespace tinwarp
