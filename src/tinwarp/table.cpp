#include "tinwarp/table.hpp"

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace tinwarp {

    namespace {

        void check_dims(std::size_t dims) {
            if (dims != 2 && dims != 3)
                throw std::invalid_argument("coordinate dimension must be 2 or 3, got " + std::to_string(dims));
        }

        void check_row(const std::vector<double> &row, std::size_t index, std::size_t dims) {
            if (row.size() < 1 + dims)
                throw std::invalid_argument("row " + std::to_string(index) + " has " + std::to_string(row.size()) +
                                            " columns, expected at least " + std::to_string(1 + dims));
        }

        datapod::Point point_of(const std::vector<double> &row, std::size_t dims) {
            return datapod::Point{row[column::X], row[column::Y], dims == 3 ? row[column::Z] : 0.0};
        }

        void write_point(std::vector<double> &row, const datapod::Point &p, std::size_t dims) {
            row.push_back(p.x);
            row.push_back(p.y);
            if (dims == 3)
                row.push_back(p.z);
        }

    } // namespace

    std::vector<GcpPoint> gcps_from_matrix(const Matrix &rows, std::size_t dims) {
        check_dims(dims);

        std::vector<GcpPoint> out;
        out.reserve(rows.size());
        for (std::size_t i = 0; i < rows.size(); ++i) {
            check_row(rows[i], i, dims);
            out.push_back(GcpPoint{static_cast<std::int64_t>(rows[i][column::Id]), point_of(rows[i], dims)});
        }
        return out;
    }

    Matrix gcps_to_matrix(const std::vector<GcpPoint> &gcps, std::size_t dims) {
        check_dims(dims);

        Matrix out;
        out.reserve(gcps.size());
        for (const auto &g : gcps) {
            std::vector<double> row{static_cast<double>(g.id)};
            write_point(row, g.position, dims);
            out.push_back(std::move(row));
        }
        return out;
    }

    FeatureTable FeatureTable::from_matrix(const Matrix &rows, std::size_t dims) {
        check_dims(dims);

        FeatureTable table;
        table.dims = dims;
        table.vertices.reserve(rows.size());
        table.trailing.reserve(rows.size());

        for (std::size_t i = 0; i < rows.size(); ++i) {
            const auto &row = rows[i];
            check_row(row, i, dims);
            table.vertices.push_back(FeatureVertex{static_cast<std::int64_t>(row[column::Id]), point_of(row, dims)});
            table.trailing.emplace_back(row.begin() + static_cast<std::ptrdiff_t>(1 + dims), row.end());
        }
        return table;
    }

    Matrix FeatureTable::to_matrix() const {
        Matrix out;
        out.reserve(vertices.size());
        for (std::size_t i = 0; i < vertices.size(); ++i) {
            std::vector<double> row{static_cast<double>(vertices[i].id)};
            write_point(row, vertices[i].position, dims);
            if (i < trailing.size())
                row.insert(row.end(), trailing[i].begin(), trailing[i].end());
            out.push_back(std::move(row));
        }
        return out;
    }

} // namespace tinwarp
