#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include <datapod/datapod.hpp>

#include "tinwarp/types.hpp"

namespace tinwarp {

    /**
     * @brief Containing triangle of one feature vertex
     */
    struct LocatedVertex {
        std::size_t sequence = 0;               ///< Position of the vertex in the input sequence
        std::optional<std::size_t> triangle;    ///< Triangle index, empty when outside the network
    };

    /**
     * @brief Same-side test of a point against the three edges of a triangle
     *
     * The point is inside when the cross products of AB x BP, BC x CP and CA x AP
     * are all >= 0 or all <= 0, so points on an edge or a corner count as inside.
     */
    bool contains(const Triangle2 &tri, const Vec2 &p);

    /**
     * @brief Linear scan for the first triangle that contains a point
     *
     * @return Index of the first containing triangle in array order, or std::nullopt
     */
    std::optional<std::size_t> locate(const Vec2 &p, const std::vector<Triangle2> &triangles);

    /**
     * @brief Point locator over a fixed triangle list
     *
     * Candidates come from a bounding box R-tree and are tested in ascending triangle
     * order, so the answer is always the first containing triangle in array order.
     */
    class Locator {
      public:
        explicit Locator(std::vector<Triangle2> triangles);

        const std::vector<Triangle2> &triangles() const { return triangles_; }

        std::optional<std::size_t> locate(const Vec2 &p) const;

        /**
         * @brief Locate the XY position of every vertex
         *
         * The sequence is split into chunks of split_unit_number vertices that are
         * located independently (in parallel when OpenMP is available). Chunk results
         * are concatenated and sorted by sequence, so the output order never depends on
         * chunk completion order or on the chunk size.
         *
         * @param vertices Feature vertices
         * @param split_unit_number Chunk size, must be > 0
         * @return One entry per vertex, in input order
         * @throws std::invalid_argument if split_unit_number is 0
         */
        std::vector<LocatedVertex> locate_all(const std::vector<FeatureVertex> &vertices,
                                              std::size_t split_unit_number) const;

      private:
        std::vector<Triangle2> triangles_;
        datapod::RTree<std::size_t> rtree_;
    };

    /**
     * @brief Number of entries that fell outside every triangle
     */
    std::size_t count_unlocated(const std::vector<LocatedVertex> &located);

} // namespace tinwarp
