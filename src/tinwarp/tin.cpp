#include "tinwarp/tin.hpp"

#include <algorithm>
#include <iostream>
#include <set>
#include <string>
#include <utility>

#include "tinwarp/utils/utils.hpp"

namespace tinwarp {

    namespace {

        struct Edge {
            std::size_t u;
            std::size_t v;
        };

        Triangle make_ccw(const std::vector<Vec2> &P, std::size_t a, std::size_t b, std::size_t c) {
            if (utils::orient(P[a], P[b], P[c]) < 0.0)
                std::swap(b, c);
            return Triangle{a, b, c};
        }

    } // namespace

    std::vector<Triangle> delaunay(const std::vector<Vec2> &pts) {
        if (pts.size() < 3)
            throw ConstructionError("triangulation needs at least 3 points, got " + std::to_string(pts.size()));
        if (utils::all_colinear(pts))
            throw ConstructionError("triangulation points are all collinear");

        std::vector<Vec2> P = pts;
        const std::size_t n0 = P.size();

        // Super triangle enclosing every input point
        Vec2 lo = P[0];
        Vec2 hi = P[0];
        for (const auto &p : P) {
            lo.x = std::min(lo.x, p.x);
            lo.y = std::min(lo.y, p.y);
            hi.x = std::max(hi.x, p.x);
            hi.y = std::max(hi.y, p.y);
        }
        Vec2 mid = (lo + hi) * 0.5;
        double d = std::max(hi.x - lo.x, hi.y - lo.y) * 1000.0 + 1.0;
        P.push_back(Vec2{mid.x - 2.0 * d, mid.y - d});
        P.push_back(Vec2{mid.x + 2.0 * d, mid.y - d});
        P.push_back(Vec2{mid.x, mid.y + 2.0 * d});

        std::vector<Triangle> T;
        T.push_back(make_ccw(P, n0, n0 + 1, n0 + 2));

        std::set<std::pair<double, double>> inserted;

        for (std::size_t ip = 0; ip < n0; ++ip) {
            const Vec2 &p = P[ip];
            if (!inserted.insert({p.x, p.y}).second) {
                std::cerr << "Warning: duplicate control point " << ip << " skipped in triangulation" << std::endl;
                continue;
            }

            // Triangles whose circumcircle strictly contains p
            std::vector<char> bad(T.size(), 0);
            std::vector<Edge> cavity;
            for (std::size_t t = 0; t < T.size(); ++t) {
                const auto &tr = T[t];
                if (utils::in_circle(P[tr.a], P[tr.b], P[tr.c], p) > 0.0) {
                    bad[t] = 1;
                    cavity.push_back({tr.a, tr.b});
                    cavity.push_back({tr.b, tr.c});
                    cavity.push_back({tr.c, tr.a});
                }
            }

            if (cavity.empty())
                continue;

            // Boundary of the cavity: edges not shared by two bad triangles
            std::vector<Edge> boundary;
            for (std::size_t i = 0; i < cavity.size(); ++i) {
                bool shared = false;
                for (std::size_t j = 0; j < cavity.size(); ++j) {
                    if (i != j && cavity[i].u == cavity[j].v && cavity[i].v == cavity[j].u) {
                        shared = true;
                        break;
                    }
                }
                if (!shared)
                    boundary.push_back(cavity[i]);
            }

            std::vector<Triangle> keep;
            keep.reserve(T.size() + boundary.size());
            for (std::size_t t = 0; t < T.size(); ++t) {
                if (!bad[t])
                    keep.push_back(T[t]);
            }
            for (const auto &e : boundary)
                keep.push_back(make_ccw(P, e.u, e.v, ip));
            T.swap(keep);
        }

        std::vector<Triangle> out;
        out.reserve(T.size());
        for (const auto &tr : T) {
            if (tr.a >= n0 || tr.b >= n0 || tr.c >= n0)
                continue;
            out.push_back(tr);
        }

        if (out.empty())
            throw ConstructionError("triangulation produced no triangles");
        return out;
    }

    TinPair build_tin(const std::vector<GcpPoint> &target_gcps, const std::vector<GcpPoint> &standard_gcps) {
        if (target_gcps.size() != standard_gcps.size())
            throw ConstructionError("control point sets differ in size: " + std::to_string(target_gcps.size()) +
                                    " target vs " + std::to_string(standard_gcps.size()) + " standard");

        std::vector<Vec2> standard_xy;
        standard_xy.reserve(standard_gcps.size());
        for (const auto &g : standard_gcps)
            standard_xy.push_back(project(g.position, CoordinatePlane::XY));

        std::vector<Triangle> triangles = delaunay(standard_xy);

        TinPair tins;
        tins.target.points = target_gcps;
        tins.target.triangles = triangles;
        tins.standard.points = standard_gcps;
        tins.standard.triangles = std::move(triangles);
        return tins;
    }

    Tin reseat_planar(const Tin &heights, const Tin &planar) {
        if (heights.points.size() != planar.points.size())
            throw std::invalid_argument("reseat_planar: networks differ in point count");

        Tin out = heights;
        for (std::size_t i = 0; i < out.points.size(); ++i) {
            out.points[i].position.x = planar.points[i].position.x;
            out.points[i].position.y = planar.points[i].position.y;
        }
        return out;
    }

} // namespace tinwarp
