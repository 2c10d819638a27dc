#pragma once

#include <cstddef>
#include <vector>

#include "tinwarp/types.hpp"

namespace tinwarp {

    /**
     * @brief Column layout of GCP and feature tables
     *
     * Column 0 is the id, followed by 2 (x, y) or 3 (x, y, z) coordinate columns.
     * Feature tables may carry further attribute columns after the coordinates.
     */
    namespace column {
        constexpr std::size_t Id = 0;
        constexpr std::size_t X = 1;
        constexpr std::size_t Y = 2;
        constexpr std::size_t Z = 3;
    } // namespace column

    using Matrix = std::vector<std::vector<double>>;

    /**
     * @brief Read control points from an N x (1 + dims) table
     *
     * @param rows Table rows
     * @param dims Number of coordinate columns, 2 or 3
     * @throws std::invalid_argument on unsupported dims or short rows
     */
    std::vector<GcpPoint> gcps_from_matrix(const Matrix &rows, std::size_t dims);

    Matrix gcps_to_matrix(const std::vector<GcpPoint> &gcps, std::size_t dims);

    /**
     * @brief Feature vertices of a table plus the columns the correction does not touch
     */
    struct FeatureTable {
        std::size_t dims = 2;
        std::vector<FeatureVertex> vertices;
        Matrix trailing; ///< Attribute columns after the coordinates, one row per vertex

        /**
         * @brief Split an M x (1 + dims + K) table into vertices and trailing columns
         *
         * @throws std::invalid_argument on unsupported dims or short rows
         */
        static FeatureTable from_matrix(const Matrix &rows, std::size_t dims);

        /**
         * @brief Reassemble the table, same shape and row order as the input
         */
        Matrix to_matrix() const;
    };

} // namespace tinwarp
