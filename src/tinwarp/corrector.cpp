#include "tinwarp/corrector.hpp"

#include <chrono>
#include <stdexcept>
#include <utility>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace tinwarp {

    namespace {

        using Clock = std::chrono::steady_clock;

        double elapsed_ms(Clock::time_point since) {
            return std::chrono::duration<double, std::milli>(Clock::now() - since).count();
        }

        TinPair build_timed(const std::vector<GcpPoint> &target_gcps, const std::vector<GcpPoint> &standard_gcps,
                            double &ms) {
            auto t0 = Clock::now();
            TinPair tins = build_tin(target_gcps, standard_gcps);
            ms = elapsed_ms(t0);
            return tins;
        }

    } // namespace

    CorrectMode parse_correct_mode(const std::string &value) {
        if (value == "2D")
            return CorrectMode::Planar2D;
        if (value == "3D")
            return CorrectMode::Vertical3D;
        throw std::invalid_argument("unknown correct mode '" + value + "', expected 2D or 3D");
    }

    void Config::validate() const {
        if (split_unit_number == 0)
            throw std::invalid_argument("split_unit_number must be greater than 0");
    }

    std::ostream &operator<<(std::ostream &os, const CorrectionReport &report) {
        os << "vertices=" << report.vertices << " triangles=" << report.triangles
           << " transformed=" << report.transformed << " unlocated=" << report.unlocated
           << " skipped_triangles=" << report.skipped_triangles
           << " degenerate_triangles=" << report.degenerate_triangles;
        if (report.z_corrected > 0 || report.degenerate_z_triangles > 0)
            os << " z_corrected=" << report.z_corrected << " degenerate_z_triangles=" << report.degenerate_z_triangles;
        return os;
    }

    Corrector::Corrector(std::vector<GcpPoint> target_gcps, std::vector<GcpPoint> standard_gcps, Config config)
        : tins_(build_timed(target_gcps, standard_gcps, tin_ms_)),
          locator_(tins_.target.plane_triangles(CoordinatePlane::XY)), config_(config) {
        config_.validate();

        if (config_.verbose) {
            std::cout << "[tinwarp] TIN built: " << tins_.target.size() << " triangles from "
                      << tins_.target.points.size() << " control points in " << tin_ms_ << " ms" << std::endl;
#ifdef _OPENMP
            std::cout << "[tinwarp] OpenMP max threads: " << omp_get_max_threads() << std::endl;
#endif
        }
    }

    void Corrector::set_split_unit_number(std::size_t split_unit_number) {
        Config next = config_;
        next.split_unit_number = split_unit_number;
        next.validate();
        config_ = next;
    }

    void Corrector::set_plane(CoordinatePlane plane) { config_.plane = plane; }

    void Corrector::set_mode(CorrectMode mode) { config_.mode = mode; }

    CorrectionReport Corrector::correct(std::vector<FeatureVertex> &vertices) const {
        return config_.mode == CorrectMode::Vertical3D ? correct_3d(vertices) : correct_2d(vertices);
    }

    CorrectionReport Corrector::run_2d(std::vector<FeatureVertex> &vertices, CoordinatePlane plane,
                                       std::vector<LocatedVertex> &located) const {
        CorrectionReport report;
        report.vertices = vertices.size();
        report.triangles = tins_.target.size();
        report.tin_ms = tin_ms_;

        auto t0 = Clock::now();
        located = locator_.locate_all(vertices, config_.split_unit_number);
        report.locate_ms = elapsed_ms(t0);

        t0 = Clock::now();
        TransformStats stats = apply_transform(tins_, vertices, located, plane);
        report.transform_ms = elapsed_ms(t0);

        report.transformed = stats.transformed;
        report.unlocated = stats.unlocated;
        report.skipped_triangles = stats.skipped_triangles;
        report.degenerate_triangles = stats.degenerate_triangles;

        if (config_.verbose) {
            std::cout << "[tinwarp] locate: " << report.locate_ms << " ms (" << config_.split_unit_number
                      << " vertices per chunk)" << std::endl;
            std::cout << "[tinwarp] transform " << to_string(plane) << ": " << report.transform_ms << " ms"
                      << std::endl;
        }
        return report;
    }

    CorrectionReport Corrector::correct_2d(std::vector<FeatureVertex> &vertices) const {
        std::vector<LocatedVertex> located;
        CorrectionReport report = run_2d(vertices, config_.plane, located);
        warn(report);
        return report;
    }

    CorrectionReport Corrector::correct_3d(std::vector<FeatureVertex> &vertices) const {
        std::vector<LocatedVertex> located;
        CorrectionReport report = run_2d(vertices, CoordinatePlane::XY, located);

        auto t0 = Clock::now();
        Tin target_heights = reseat_planar(tins_.target, tins_.standard);
        ZStats zstats = correct_z(target_heights, tins_.standard, vertices, located);
        report.zcorrect_ms = elapsed_ms(t0);

        report.z_corrected = zstats.corrected;
        report.degenerate_z_triangles = zstats.degenerate_triangles;

        if (config_.verbose)
            std::cout << "[tinwarp] z correction: " << report.zcorrect_ms << " ms" << std::endl;
        warn(report);
        return report;
    }

    Matrix Corrector::correct(const Matrix &rows, std::size_t dims, CorrectionReport *report) const {
        if (dims != 3 && (config_.mode == CorrectMode::Vertical3D || config_.plane == CoordinatePlane::XZ))
            throw std::invalid_argument("the configured job needs z coordinates, got " + std::to_string(dims) +
                                        " coordinate columns");

        FeatureTable table = FeatureTable::from_matrix(rows, dims);
        CorrectionReport r = correct(table.vertices);
        if (report)
            *report = r;
        return table.to_matrix();
    }

    void Corrector::warn(const CorrectionReport &report) const {
        if (report.unlocated > 0)
            std::cerr << "Warning: " << report.unlocated << " of " << report.vertices
                      << " vertices lie outside the TIN and were left unchanged" << std::endl;
        if (report.degenerate_triangles > 0)
            std::cerr << "Warning: " << report.degenerate_triangles
                      << " triangles have a degenerate target shape, their vertices may be misplaced" << std::endl;
        if (report.degenerate_z_triangles > 0)
            std::cerr << "Warning: " << report.degenerate_z_triangles
                      << " triangles have a vertical edge, height offset interpolated along it" << std::endl;
        if (config_.verbose)
            std::cout << "[tinwarp] " << report << std::endl;
    }

    CorrectionReport correct_2d(const std::vector<GcpPoint> &target_gcps, const std::vector<GcpPoint> &standard_gcps,
                                std::vector<FeatureVertex> &vertices, const Config &config) {
        Corrector corrector(target_gcps, standard_gcps, config);
        return corrector.correct_2d(vertices);
    }

    CorrectionReport correct_3d(const std::vector<GcpPoint> &target_gcps, const std::vector<GcpPoint> &standard_gcps,
                                std::vector<FeatureVertex> &vertices, const Config &config) {
        Corrector corrector(target_gcps, standard_gcps, config);
        return corrector.correct_3d(vertices);
    }

} // namespace tinwarp
