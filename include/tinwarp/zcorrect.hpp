#pragma once

#include <array>
#include <cmath>
#include <cstddef>
#include <optional>
#include <vector>

#include <datapod/datapod.hpp>

#include "tinwarp/locate.hpp"
#include "tinwarp/tin.hpp"

namespace tinwarp {

    /**
     * @brief Side of the middle vertex B a vertex falls on
     */
    enum class ZSegment {
        Left,  ///< x <= B.x, uses the A-B line
        Right, ///< x > B.x, uses the B-C line
    };

    /**
     * @brief z = a * x + b
     */
    struct LinearFunction {
        double a = 0.0;
        double b = 0.0;

        double operator()(double x) const { return a * x + b; }

        LinearFunction operator-(const LinearFunction &o) const { return LinearFunction{a - o.a, b - o.b}; }
    };

    /**
     * @brief Line through (x0, z0) and (x1, z1)
     *
     * @return false when x0 == x1, fn is left untouched
     */
    bool fit_line(double x0, double z0, double x1, double z1, LinearFunction &fn);

    /**
     * @brief Triangle corners ordered by ascending x (A, B, C), ties keep corner order
     */
    std::array<datapod::Point, 3> sort_by_x(const std::array<datapod::Point, 3> &corners);

    /// Relative x tolerance for a vertex to count as lying on a vertical edge
    inline constexpr double kVerticalEdgeTolerance = 1e-9;

    /**
     * @brief Height offset along a target edge parallel to the z axis of the section (x constant)
     *
     * Interpolated by y between the offsets at the two end points.
     */
    struct VerticalEdge {
        double x = 0.0;
        double y0 = 0.0;
        double d0 = 0.0;
        double y1 = 0.0;
        double d1 = 0.0;

        double delta(double y) const {
            if (y0 == y1)
                return d0;
            double t = (y - y0) / (y1 - y0);
            return d0 + (d1 - d0) * t;
        }
    };

    /**
     * @brief Height offset of one triangle as two piecewise linear functions of x
     */
    struct ZCorrection {
        LinearFunction left;  ///< standard A-B minus target A-B
        LinearFunction right; ///< standard B-C minus target B-C
        double split_x = 0.0; ///< x of vertex B in the target triangle
        bool degenerate = false;
        std::optional<VerticalEdge> vertical; ///< Target edge A-B or B-C with equal x

        ZSegment segment(double x) const { return x <= split_x ? ZSegment::Left : ZSegment::Right; }

        /**
         * @brief Offset for a vertex at (x, y)
         *
         * y is only used on a vertical target edge.
         */
        double delta(double x, double y) const {
            if (vertical && std::abs(x - vertical->x) <= kVerticalEdgeTolerance * (1.0 + std::abs(vertical->x)))
                return vertical->delta(y);
            return segment(x) == ZSegment::Left ? left(x) : right(x);
        }
    };

    /**
     * @brief Height offset between a target and a standard triangle
     *
     * Both triangles are sorted by x independently. When a target segment has both end points
     * on the same x its offset is interpolated by y along that edge, and the other segment's
     * line covers the rest of the triangle. A segment without a line in the standard frame falls
     * back to the constant offset at B. Either case flags the correction degenerate.
     */
    ZCorrection solve_zcorrection(const std::array<datapod::Point, 3> &target,
                                  const std::array<datapod::Point, 3> &standard);

    std::vector<ZCorrection> solve_zcorrections(const Tin &target, const Tin &standard);

    struct ZStats {
        std::size_t corrected = 0;
        std::size_t unlocated = 0;
        std::size_t degenerate_triangles = 0;
    };

    /**
     * @brief Add the per-triangle height offset to every located vertex
     *
     * @param target Target network, planar coordinates in the frame of the vertices
     * @param standard Standard network
     * @param vertices Feature vertices, z modified in place
     * @param located Triangle of each vertex
     * @throws std::invalid_argument if located does not match vertices or the networks
     */
    ZStats correct_z(const Tin &target, const Tin &standard, std::vector<FeatureVertex> &vertices,
                     const std::vector<LocatedVertex> &located);

} // namespace tinwarp
