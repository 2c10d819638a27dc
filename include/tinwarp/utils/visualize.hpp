#pragma once

#ifdef HAS_RERUN

#include <datapod/datapod.hpp>

#include "../tin.hpp"
#include "../types.hpp"
#include "rerun.hpp"
#include <array>
#include <iostream>
#include <memory>
#include <rerun/archetypes/geo_line_strings.hpp>
#include <rerun/components/geo_line_string.hpp>
#include <rerun/components/lat_lon.hpp>
#include <rerun/recording_stream.hpp>
#include <rerun/result.hpp>
#include <string>
#include <vector>

#include <concord/frame/convert.hpp>

namespace tinwarp {
    namespace visualize {

        /**
         * @brief Convert ENU point to WGS84 LatLon for geo visualization
         */
        inline rerun::LatLon enu_to_latlon(const datapod::Point &enu_pt, const datapod::Geo &datum) {
            concord::frame::ENU enu{enu_pt.x, enu_pt.y, enu_pt.z, datum};
            auto wgs = concord::frame::to_wgs(enu);
            return rerun::LatLon{float(wgs.latitude), float(wgs.longitude)};
        }

        /**
         * @brief Log every triangle of a network as a closed line strip
         *
         * @param tin Network to draw
         * @param rec Recording stream
         * @param path Entity path, all triangles logged together as one line strip batch
         * @param color Edge color
         */
        inline void show_tin(const Tin &tin, std::shared_ptr<rerun::RecordingStream> rec, const std::string &path,
                             rerun::Color color = rerun::Color(70, 120, 70)) {
            std::vector<rerun::components::LineStrip3D> strips;
            strips.reserve(tin.size());
            for (std::size_t i = 0; i < tin.size(); ++i) {
                std::vector<std::array<float, 3>> pts;
                for (std::size_t c = 0; c < 4; ++c) {
                    const auto &p = tin.corner(i, c % 3);
                    pts.push_back({float(p.x), float(p.y), float(p.z)});
                }
                strips.emplace_back(pts);
            }

            std::cout << "Visualizing " << path << " with " << tin.size() << " triangles" << std::endl;

            rec->log_static(path, rerun::LineStrips3D(strips).with_colors({{color}}).with_radii({{0.05f}}));
        }

        /**
         * @brief Log a network on the map view as well, coordinates taken as ENU around datum
         */
        inline void show_tin(const Tin &tin, std::shared_ptr<rerun::RecordingStream> rec, const std::string &path,
                             const datapod::Geo &datum, rerun::Color color = rerun::Color(70, 120, 70)) {
            show_tin(tin, rec, path, color);

            std::vector<rerun::components::GeoLineString> geo;
            geo.reserve(tin.size());
            for (std::size_t i = 0; i < tin.size(); ++i) {
                std::vector<rerun::LatLon> wgs_pts;
                for (std::size_t c = 0; c < 4; ++c)
                    wgs_pts.push_back(enu_to_latlon(tin.corner(i, c % 3), datum));
                geo.push_back(rerun::components::GeoLineString::from_lat_lon(wgs_pts));
            }

            rec->log_static(path, rerun::archetypes::GeoLineStrings(geo).with_colors({{color}}).with_radii({{0.5f}}));
        }

        inline void show_gcps(const std::vector<GcpPoint> &gcps, std::shared_ptr<rerun::RecordingStream> rec,
                              const std::string &path, rerun::Color color = rerun::Color(200, 60, 60)) {
            std::vector<rerun::Position3D> pts;
            pts.reserve(gcps.size());
            for (const auto &g : gcps)
                pts.push_back({float(g.position.x), float(g.position.y), float(g.position.z)});

            rec->log_static(path, rerun::Points3D(pts).with_colors({color}).with_radii({0.3f}));
        }

        /**
         * @brief Log feature vertices as points, in their current (corrected or not) position
         */
        inline void show_features(const std::vector<FeatureVertex> &vertices,
                                  std::shared_ptr<rerun::RecordingStream> rec, const std::string &path,
                                  rerun::Color color = rerun::Color(70, 70, 120)) {
            std::vector<rerun::Position3D> pts;
            pts.reserve(vertices.size());
            for (const auto &v : vertices)
                pts.push_back({float(v.position.x), float(v.position.y), float(v.position.z)});

            std::cout << "Visualizing " << path << " with " << pts.size() << " vertices" << std::endl;

            rec->log_static(path, rerun::Points3D(pts).with_colors({color}).with_radii({0.15f}));
        }

    } // namespace visualize
} // namespace tinwarp

#endif
