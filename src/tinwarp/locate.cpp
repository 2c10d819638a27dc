#include "tinwarp/locate.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

#include "tinwarp/utils/utils.hpp"

namespace tinwarp {

    bool contains(const Triangle2 &tri, const Vec2 &p) {
        double ab_bp = utils::edge_cross(tri[0], tri[1], p);
        double bc_cp = utils::edge_cross(tri[1], tri[2], p);
        double ca_ap = utils::edge_cross(tri[2], tri[0], p);

        return (ab_bp >= 0.0 && bc_cp >= 0.0 && ca_ap >= 0.0) || (ab_bp <= 0.0 && bc_cp <= 0.0 && ca_ap <= 0.0);
    }

    std::optional<std::size_t> locate(const Vec2 &p, const std::vector<Triangle2> &triangles) {
        for (std::size_t i = 0; i < triangles.size(); ++i) {
            if (contains(triangles[i], p))
                return i;
        }
        return std::nullopt;
    }

    Locator::Locator(std::vector<Triangle2> triangles) : triangles_(std::move(triangles)) {
        for (std::size_t i = 0; i < triangles_.size(); ++i)
            rtree_.insert(utils::triangle_aabb(triangles_[i]), i);
    }

    std::optional<std::size_t> Locator::locate(const Vec2 &p) const {
        // Slightly padded query box so points on a box face are never dropped by the index
        double pad = 1e-9 * (1.0 + std::abs(p.x) + std::abs(p.y));
        datapod::AABB query{datapod::Point{p.x - pad, p.y - pad, -1.0}, datapod::Point{p.x + pad, p.y + pad, 1.0}};

        std::vector<std::size_t> candidates;
        for (const auto &entry : rtree_.query_intersects(query))
            candidates.push_back(entry.data);
        std::sort(candidates.begin(), candidates.end());

        for (std::size_t idx : candidates) {
            if (idx < triangles_.size() && contains(triangles_[idx], p))
                return idx;
        }
        return std::nullopt;
    }

    std::vector<LocatedVertex> Locator::locate_all(const std::vector<FeatureVertex> &vertices,
                                                   std::size_t split_unit_number) const {
        if (split_unit_number == 0)
            throw std::invalid_argument("split_unit_number must be greater than 0");

        const std::size_t total = vertices.size();
        const std::size_t chunk_count = (total + split_unit_number - 1) / split_unit_number;

        std::vector<std::vector<LocatedVertex>> chunks(chunk_count);

#pragma omp parallel for schedule(dynamic, 1)
        for (long long ci = 0; ci < static_cast<long long>(chunk_count); ++ci) {
            const std::size_t begin = static_cast<std::size_t>(ci) * split_unit_number;
            const std::size_t end = std::min(begin + split_unit_number, total);

            auto &out = chunks[static_cast<std::size_t>(ci)];
            out.reserve(end - begin);
            for (std::size_t i = begin; i < end; ++i) {
                Vec2 p = project(vertices[i].position, CoordinatePlane::XY);
                out.push_back(LocatedVertex{i, locate(p)});
            }
        }

        std::vector<LocatedVertex> located;
        located.reserve(total);
        for (auto &chunk : chunks)
            located.insert(located.end(), chunk.begin(), chunk.end());

        std::sort(located.begin(), located.end(),
                  [](const LocatedVertex &lhs, const LocatedVertex &rhs) { return lhs.sequence < rhs.sequence; });
        return located;
    }

    std::size_t count_unlocated(const std::vector<LocatedVertex> &located) {
        return static_cast<std::size_t>(std::count_if(located.begin(), located.end(),
                                                      [](const LocatedVertex &lv) { return !lv.triangle; }));
    }

} // namespace tinwarp
