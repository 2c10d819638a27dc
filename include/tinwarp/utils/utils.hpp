#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

#include <datapod/datapod.hpp>

#include "tinwarp/types.hpp"

namespace tinwarp {

    namespace utils {

        /**
         * @brief Z component of the cross product (b - a) x (p - b)
         *
         * Positive when p lies to the left of the directed edge a->b.
         */
        inline double edge_cross(const Vec2 &a, const Vec2 &b, const Vec2 &p) {
            Vec2 ab = b - a;
            Vec2 bp = p - b;
            return ab.x * bp.y - ab.y * bp.x;
        }

        /**
         * @brief Twice the signed area of triangle abc (positive = CCW)
         */
        inline double orient(const Vec2 &a, const Vec2 &b, const Vec2 &c) {
            return (b.x - a.x) * (c.y - a.y) - (b.y - a.y) * (c.x - a.x);
        }

        /**
         * @brief Check if every point of the set lies on one line
         *
         * The tolerance is scaled with the extent of the set so that projected
         * coordinates in the 1e5 range are judged the same way as unit-scale ones.
         */
        inline bool all_colinear(const std::vector<Vec2> &pts) {
            if (pts.size() < 3)
                return true;

            double extent = 0.0;
            for (const auto &p : pts)
                extent = std::max({extent, std::abs(p.x - pts[0].x), std::abs(p.y - pts[0].y)});
            if (extent == 0.0)
                return true;

            // Farthest point from the first one anchors the reference line
            std::size_t far = 0;
            double far_d = 0.0;
            for (std::size_t i = 1; i < pts.size(); ++i) {
                double d = (pts[i] - pts[0]).norm();
                if (d > far_d) {
                    far_d = d;
                    far = i;
                }
            }

            double epsilon = 1e-12 * extent * extent;
            for (const auto &p : pts) {
                if (std::abs(orient(pts[0], pts[far], p)) > epsilon)
                    return false;
            }
            return true;
        }

        /**
         * @brief In-circle predicate for a CCW triangle abc
         *
         * @return Positive when d lies strictly inside the circumcircle of abc
         */
        inline double in_circle(const Vec2 &a, const Vec2 &b, const Vec2 &c, const Vec2 &d) {
            double adx = a.x - d.x, ady = a.y - d.y;
            double bdx = b.x - d.x, bdy = b.y - d.y;
            double cdx = c.x - d.x, cdy = c.y - d.y;

            double ad = adx * adx + ady * ady;
            double bd = bdx * bdx + bdy * bdy;
            double cd = cdx * cdx + cdy * cdy;

            return adx * (bdy * cd - bd * cdy) - ady * (bdx * cd - bd * cdx) + ad * (bdx * cdy - bdy * cdx);
        }

        /**
         * @brief Axis aligned box of a planar triangle, z collapsed to 0
         */
        inline datapod::AABB triangle_aabb(const Triangle2 &tri) {
            double min_x = std::min({tri[0].x, tri[1].x, tri[2].x});
            double min_y = std::min({tri[0].y, tri[1].y, tri[2].y});
            double max_x = std::max({tri[0].x, tri[1].x, tri[2].x});
            double max_y = std::max({tri[0].y, tri[1].y, tri[2].y});
            return datapod::AABB{datapod::Point{min_x, min_y, 0.0}, datapod::Point{max_x, max_y, 0.0}};
        }

        /**
         * @brief Bitwise comparison of two planar triangles
         */
        inline bool same_triangle(const Triangle2 &lhs, const Triangle2 &rhs) {
            return lhs[0] == rhs[0] && lhs[1] == rhs[1] && lhs[2] == rhs[2];
        }

    } // namespace utils

} // namespace tinwarp
