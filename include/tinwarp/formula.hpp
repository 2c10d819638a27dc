#pragma once

#include <cstddef>
#include <vector>

#include "tinwarp/locate.hpp"
#include "tinwarp/tin.hpp"
#include "tinwarp/types.hpp"

namespace tinwarp {

    /**
     * @brief Shear angles that bring the third vertex of each frame onto the y axis
     */
    struct ShearAngles {
        double target = 0.0;
        double standard = 0.0;
    };

    /**
     * @brief Per-triangle transform from the target triangle onto the standard triangle
     *
     * Applied as: translate, rotate and scale about the pivot, rotate edge 0-1 onto the
     * x axis, scale y, shear x, rotate back, move back to the pivot. A default constructed
     * formula is the identity.
     */
    struct TransformFormula {
        Vec2 translation;            ///< Moves target vertex 0 onto standard vertex 0
        Vec2 pivot;                  ///< Standard vertex 0, centre of rotation and scaling
        Mat2 rotation;               ///< Aligns target edge 0-1 with standard edge 0-1
        double scale1 = 1.0;         ///< Edge 0-1 length ratio
        double standard_angle = 0.0; ///< Direction of standard edge 0-1
        double scale2 = 1.0;         ///< Height ratio of vertex 2 over edge 0-1
        ShearAngles shear;
        bool skipped = false;        ///< Triangle identical in both frames, formula left as identity
        bool degenerate = false;     ///< Zero-length target edge 0-1 or zero-height target vertex 2
    };

    /**
     * @brief Derive the transform that maps a target triangle onto a standard triangle
     *
     * Degenerate target triangles still produce a formula (scale2 is 0 when vertex 2 has
     * no height over edge 0-1); the condition is flagged on the result.
     */
    TransformFormula solve_formula(const Triangle2 &target, const Triangle2 &standard);

    /**
     * @brief Map one planar point with a formula
     */
    Vec2 apply_formula(const Vec2 &p, const TransformFormula &formula);

    /**
     * @brief Formulas for every triangle of a network pair on one plane
     *
     * Triangles whose plane coordinates are bitwise identical in both frames are not solved
     * and come back with skipped set.
     */
    std::vector<TransformFormula> solve_formulas(const TinPair &tins, CoordinatePlane plane);

    struct TransformStats {
        std::size_t transformed = 0;          ///< Vertices moved by a formula
        std::size_t unlocated = 0;            ///< Vertices outside every triangle, left unchanged
        std::size_t skipped_triangles = 0;    ///< Triangles identical in both frames
        std::size_t degenerate_triangles = 0; ///< Triangles with a degenerate formula
    };

    /**
     * @brief Apply the per-triangle formulas to located feature vertices in place
     *
     * @param tins Target and standard networks
     * @param vertices Feature vertices, modified in place
     * @param located Triangle of each vertex as returned by Locator::locate_all()
     * @param plane Coordinate pair that is transformed
     * @throws std::invalid_argument if located does not match vertices
     */
    TransformStats apply_transform(const TinPair &tins, std::vector<FeatureVertex> &vertices,
                                   const std::vector<LocatedVertex> &located, CoordinatePlane plane);

} // namespace tinwarp
