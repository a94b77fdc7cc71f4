/**
 * @file primitives.hpp
 * @brief Solid constructors: box, swept pipe and extruded footprint
 * @author GeoBIM Team
 * @version 0.1.0
 * @date 2026
 *
 * Every constructor returns a SolidGeometry holding both the parametric
 * description (what a serializer may emit as a swept/extruded solid) and a
 * closed, outward-oriented boundary representation. Degenerate input throws
 * InvalidGeometry.
 */

#pragma once

#include "geometry/brep.hpp"
#include <glm/glm.hpp>
#include <string>
#include <variant>
#include <vector>

namespace geobim::geometry {

/// Default number of vertices in a pipe cross-section
constexpr int DEFAULT_PIPE_SEGMENTS = 16;

/**
 * @brief Solid variant discriminator
 */
enum class SolidKind {
    Box,
    SweptPipe,
    ExtrudedSolid
};

[[nodiscard]] inline const char* solid_kind_name(SolidKind kind) {
    switch (kind) {
        case SolidKind::Box:           return "Box";
        case SolidKind::SweptPipe:     return "SweptPipe";
        case SolidKind::ExtrudedSolid: return "ExtrudedSolid";
    }
    return "Unknown";
}

/**
 * @brief Axis-aligned cuboid standing on its placement point
 */
struct Box {
    glm::dvec3 placement{0.0};  ///< Center of the bottom face
    double width = 0.0;         ///< Extent along X
    double depth = 0.0;         ///< Extent along Y
    double height = 0.0;        ///< Extent along +Z
};

/**
 * @brief Circular cross-section swept along a polyline
 */
struct SweptPipe {
    glm::dvec3 placement{0.0};              ///< First centerline vertex
    std::vector<glm::dvec3> centerline;     ///< Deduplicated centerline
    double radius = 0.0;                    ///< Cross-section radius
};

/**
 * @brief Footprint (outer minus inner rings) extruded along +Z
 */
struct ExtrudedSolid {
    glm::dvec3 placement{0.0};                      ///< (0, 0, base elevation)
    std::vector<glm::dvec2> outer_ring;             ///< CCW, implicitly closed
    std::vector<std::vector<glm::dvec2>> inner_rings; ///< CW, implicitly closed
    double height = 0.0;                            ///< Extrusion depth
};

using SolidShape = std::variant<Box, SweptPipe, ExtrudedSolid>;

/**
 * @brief Parametric solid plus its boundary representation
 */
struct SolidGeometry {
    SolidShape shape;
    Brep brep;

    [[nodiscard]] SolidKind kind() const {
        return static_cast<SolidKind>(shape.index());
    }

    [[nodiscard]] const glm::dvec3& placement() const {
        return std::visit([](const auto& s) -> const glm::dvec3& { return s.placement; }, shape);
    }
};

class SolidBuilder {
public:
    SolidBuilder() = default;

    /**
     * @brief Axis-aligned cuboid centered on `center` in XY, rising from center.z
     * @throws InvalidGeometry if any dimension is not positive
     */
    static SolidGeometry make_box(const glm::dvec3& center, double width, double depth, double height);

    /**
     * @brief Tube of circular cross-section along a polyline
     *
     * Consecutive segments share the mitered cross-section at each joint,
     * so the tube is continuous without duplicated joint vertices.
     *
     * @throws InvalidGeometry for fewer than 2 distinct vertices, radius <= 0
     *         or a centerline that folds back onto itself
     */
    static SolidGeometry make_swept_pipe(const std::vector<glm::dvec3>& centerline, double radius,
                                         int segments = DEFAULT_PIPE_SEGMENTS);

    /**
     * @brief Vertical extrusion of a possibly multiply-connected footprint
     *
     * Rings are closed implicitly. Self-intersecting rings, holes outside the
     * outer ring and degenerate holes are reported to `warnings` instead of
     * failing.
     *
     * @throws InvalidGeometry for fewer than 3 distinct outer vertices, a
     *         zero-area outer ring or height <= 0
     */
    static SolidGeometry make_extruded_solid(const std::vector<glm::dvec2>& outer_ring,
                                             const std::vector<std::vector<glm::dvec2>>& inner_rings,
                                             double height,
                                             double base_z = 0.0,
                                             std::vector<std::string>* warnings = nullptr);
};

} // namespace geobim::geometry
