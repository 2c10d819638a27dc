#pragma once

#include <cstddef>
#include <iostream>
#include <string>
#include <vector>

#include "tinwarp/formula.hpp"
#include "tinwarp/locate.hpp"
#include "tinwarp/table.hpp"
#include "tinwarp/tin.hpp"
#include "tinwarp/types.hpp"
#include "tinwarp/zcorrect.hpp"

namespace tinwarp {

    /**
     * @brief Which correction job to run
     */
    enum class CorrectMode {
        Planar2D,   ///< Planar transform only
        Vertical3D, ///< XY transform followed by the height correction
    };

    /**
     * @brief Parse "2D" / "3D"
     *
     * @throws std::invalid_argument for any other value
     */
    CorrectMode parse_correct_mode(const std::string &value);

    struct Config {
        std::size_t split_unit_number = 100;       ///< Vertices per locate chunk, > 0
        CoordinatePlane plane = CoordinatePlane::XY; ///< Plane of the 2D job
        CorrectMode mode = CorrectMode::Planar2D;
        bool verbose = false;                      ///< Print stage timings to stdout

        /**
         * @throws std::invalid_argument if split_unit_number is 0
         */
        void validate() const;
    };

    /**
     * @brief What a correction job did
     */
    struct CorrectionReport {
        std::size_t vertices = 0;
        std::size_t triangles = 0;
        std::size_t transformed = 0;            ///< Vertices moved by the planar pass
        std::size_t unlocated = 0;              ///< Vertices outside the TIN, left unchanged
        std::size_t skipped_triangles = 0;      ///< Triangles identical in both frames
        std::size_t degenerate_triangles = 0;   ///< Triangles with a degenerate planar formula
        std::size_t z_corrected = 0;            ///< Vertices moved by the height pass
        std::size_t degenerate_z_triangles = 0; ///< Triangles with a vertical edge in the height pass

        double tin_ms = 0.0;
        double locate_ms = 0.0;
        double transform_ms = 0.0;
        double zcorrect_ms = 0.0;

        bool clean() const { return unlocated == 0 && degenerate_triangles == 0 && degenerate_z_triangles == 0; }
    };

    std::ostream &operator<<(std::ostream &os, const CorrectionReport &report);

    /**
     * @brief Rubber-sheet correction of feature geometry onto a set of control points
     *
     * The TIN is built once at construction from the standard control points and reused
     * for every call to correct(). A Corrector is immutable apart from its configuration,
     * so one instance can correct several feature sets.
     */
    class Corrector {
      public:
        /**
         * @brief Build the shared TIN
         *
         * @param target_gcps Control points in the frame being corrected
         * @param standard_gcps Control points in the trusted frame, row aligned with target_gcps
         * @param config Job configuration
         * @throws ConstructionError if the TIN cannot be built
         * @throws std::invalid_argument on invalid configuration
         */
        Corrector(std::vector<GcpPoint> target_gcps, std::vector<GcpPoint> standard_gcps, Config config = Config{});

        const TinPair &tins() const { return tins_; }
        const Locator &locator() const { return locator_; }
        const Config &config() const { return config_; }

        void set_split_unit_number(std::size_t split_unit_number);
        void set_plane(CoordinatePlane plane);
        void set_mode(CorrectMode mode);
        void set_verbose(bool verbose) { config_.verbose = verbose; }

        /**
         * @brief Run the configured job on feature vertices in place
         */
        CorrectionReport correct(std::vector<FeatureVertex> &vertices) const;

        /**
         * @brief Locate, then transform on the configured plane
         */
        CorrectionReport correct_2d(std::vector<FeatureVertex> &vertices) const;

        /**
         * @brief Locate, transform on XY, then correct heights
         *
         * The height pass uses the assignment of the locate step and a target network
         * whose x and y are those of the standard network, so a vertex sitting on a target
         * control point ends on the standard height of that point.
         */
        CorrectionReport correct_3d(std::vector<FeatureVertex> &vertices) const;

        /**
         * @brief Run the configured job on a feature table
         *
         * @param rows M x (1 + dims + K) feature table
         * @param dims Coordinate columns in rows, 2 or 3
         * @param report Optional report output
         * @return Table of the same shape and row order with corrected coordinates
         * @throws std::invalid_argument if the job needs z and dims is 2
         */
        Matrix correct(const Matrix &rows, std::size_t dims, CorrectionReport *report = nullptr) const;

      private:
        CorrectionReport run_2d(std::vector<FeatureVertex> &vertices, CoordinatePlane plane,
                                std::vector<LocatedVertex> &located) const;
        void warn(const CorrectionReport &report) const;

        double tin_ms_ = 0.0;
        TinPair tins_;
        Locator locator_;
        Config config_;
    };

    /**
     * @brief One-shot 2D job
     */
    CorrectionReport correct_2d(const std::vector<GcpPoint> &target_gcps, const std::vector<GcpPoint> &standard_gcps,
                                std::vector<FeatureVertex> &vertices, const Config &config = Config{});

    /**
     * @brief One-shot 3D job
     */
    CorrectionReport correct_3d(const std::vector<GcpPoint> &target_gcps, const std::vector<GcpPoint> &standard_gcps,
                                std::vector<FeatureVertex> &vertices, const Config &config = Config{});

} // namespace tinwarp
