#pragma once

#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <datapod/datapod.hpp>

namespace tinwarp {

    /**
     * @brief Thrown when a triangulation cannot be built from the control points
     */
    class ConstructionError : public std::runtime_error {
      public:
        explicit ConstructionError(const std::string &what) : std::runtime_error(what) {}
    };

    /**
     * @brief Coordinate pair the planar transform operates on
     */
    enum class CoordinatePlane {
        XY, ///< Horizontal correction
        XZ, ///< Vertical section correction
    };

    /**
     * @brief Ground control point, one row of a GCP table
     */
    struct GcpPoint {
        std::int64_t id = 0;
        datapod::Point position;
    };

    /**
     * @brief A vertex of a feature geometry to be corrected in place
     */
    struct FeatureVertex {
        std::int64_t id = 0;
        datapod::Point position;
    };

    /**
     * @brief Ordered triple of GCP indices
     */
    struct Triangle {
        std::size_t a = 0;
        std::size_t b = 0;
        std::size_t c = 0;

        std::size_t operator[](std::size_t corner) const { return corner == 0 ? a : (corner == 1 ? b : c); }
    };

    struct Vec2 {
        double x = 0.0;
        double y = 0.0;

        Vec2 operator+(const Vec2 &o) const { return Vec2{x + o.x, y + o.y}; }
        Vec2 operator-(const Vec2 &o) const { return Vec2{x - o.x, y - o.y}; }
        Vec2 operator*(double s) const { return Vec2{x * s, y * s}; }
        bool operator==(const Vec2 &o) const { return x == o.x && y == o.y; }
        bool operator!=(const Vec2 &o) const { return !(*this == o); }

        double norm() const { return std::sqrt(x * x + y * y); }
        double angle() const { return std::atan2(y, x); }
    };

    /**
     * @brief Row-major 2x2 matrix
     */
    struct Mat2 {
        std::array<double, 4> m{1.0, 0.0, 0.0, 1.0};

        static Mat2 rotation(double radians) {
            double c = std::cos(radians);
            double s = std::sin(radians);
            return Mat2{{c, -s, s, c}};
        }

        Vec2 operator*(const Vec2 &v) const { return Vec2{m[0] * v.x + m[1] * v.y, m[2] * v.x + m[3] * v.y}; }
    };

    using Triangle2 = std::array<Vec2, 3>;

    /**
     * @brief Project a point onto the coordinate pair selected by the plane
     */
    inline Vec2 project(const datapod::Point &p, CoordinatePlane plane) {
        return plane == CoordinatePlane::XY ? Vec2{p.x, p.y} : Vec2{p.x, p.z};
    }

    /**
     * @brief Write a planar result back into the matching coordinates of a point
     */
    inline void unproject(datapod::Point &p, const Vec2 &v, CoordinatePlane plane) {
        p.x = v.x;
        if (plane == CoordinatePlane::XY)
            p.y = v.y;
        else
            p.z = v.y;
    }

    inline const char *to_string(CoordinatePlane plane) { return plane == CoordinatePlane::XY ? "XY" : "XZ"; }

} // namespace tinwarp
