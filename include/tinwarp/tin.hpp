#pragma once

#include <cstddef>
#include <vector>

#include <datapod/datapod.hpp>

#include "tinwarp/types.hpp"

namespace tinwarp {

    /**
     * @brief Triangulated irregular network over a set of control points
     *
     * Triangles refer to the points by index. Two Tins built by build_tin() hold
     * the same triangle list, so triangle i of the target network and triangle i
     * of the standard network describe the same physical facet.
     */
    struct Tin {
        std::vector<GcpPoint> points;
        std::vector<Triangle> triangles;

        std::size_t size() const { return triangles.size(); }
        bool empty() const { return triangles.empty(); }

        /**
         * @brief Point at one corner of a triangle
         */
        const datapod::Point &corner(std::size_t tri, std::size_t corner) const {
            return points[triangles[tri][corner]].position;
        }

        /**
         * @brief The three corners of a triangle projected onto a plane
         */
        Triangle2 plane_triangle(std::size_t tri, CoordinatePlane plane) const {
            return Triangle2{project(corner(tri, 0), plane), project(corner(tri, 1), plane),
                             project(corner(tri, 2), plane)};
        }

        /**
         * @brief All triangles projected onto a plane, in triangle order
         */
        std::vector<Triangle2> plane_triangles(CoordinatePlane plane) const {
            std::vector<Triangle2> out;
            out.reserve(triangles.size());
            for (std::size_t i = 0; i < triangles.size(); ++i)
                out.push_back(plane_triangle(i, plane));
            return out;
        }
    };

    /**
     * @brief Target and standard networks sharing one topology
     */
    struct TinPair {
        Tin target;
        Tin standard;
    };

    /**
     * @brief Delaunay triangulation of a planar point set (Bowyer-Watson)
     *
     * Exact duplicates are inserted once. Triangles are returned counter-clockwise.
     *
     * @param pts Points to triangulate
     * @return Index triangles into pts
     * @throws ConstructionError if fewer than 3 points or all points are collinear
     */
    std::vector<Triangle> delaunay(const std::vector<Vec2> &pts);

    /**
     * @brief Build the shared TIN for a correction job
     *
     * The triangulation is computed on the XY coordinates of the standard points and the
     * same index triangles are applied to the target points.
     *
     * @param target_gcps Control points in the frame being corrected
     * @param standard_gcps Control points in the trusted frame, row aligned with target_gcps
     * @throws ConstructionError on size mismatch, fewer than 3 points or collinear standard points
     */
    TinPair build_tin(const std::vector<GcpPoint> &target_gcps, const std::vector<GcpPoint> &standard_gcps);

    /**
     * @brief Copy of a network with the planar (x, y) coordinates taken from another network
     *
     * Used by the vertical pass: heights stay those of @p heights while x and y follow
     * @p planar, matching features that were already moved by the XY pass.
     */
    Tin reseat_planar(const Tin &heights, const Tin &planar);

} // namespace tinwarp
