#pragma once

#include <vector>
#include <limits>
#include <cstdint>
#include <cstddef>
#include <glm/glm.hpp>

namespace geobim::geometry {

/**
 * @brief Planar face of a boundary representation
 *
 * Loops index into Brep::vertices. The outer loop is counter-clockwise
 * when viewed from outside the solid, inner loops are clockwise.
 */
struct Face {
    std::vector<uint32_t> outer;
    std::vector<std::vector<uint32_t>> inner;
};

struct BoundingBox3D {
    glm::dvec3 min{std::numeric_limits<double>::max()};
    glm::dvec3 max{std::numeric_limits<double>::lowest()};

    void expand(const glm::dvec3& point) {
        min = glm::min(min, point);
        max = glm::max(max, point);
    }
};

/**
 * @brief Closed polyhedral solid
 *
 * Vertices are shared between faces, so adjacent faces reference the same
 * vertex indices along a common edge. `triangles` is a triangulation of all
 * faces (3 indices per triangle) with the same outward orientation; it is
 * used for volume and closedness checks and by consumers that need meshes.
 */
class Brep {
public:
    std::vector<glm::dvec3> vertices;
    std::vector<Face> faces;
    std::vector<uint32_t> triangles;
    BoundingBox3D bounds;

    bool is_valid() const {
        return !vertices.empty() && !faces.empty();
    }

    void compute_bounds() {
        bounds = BoundingBox3D{};
        for (const auto& v : vertices) {
            bounds.expand(v);
        }
    }

    /**
     * @brief Enclosed volume from the divergence theorem
     *
     * Positive for an outward-oriented closed shell.
     */
    [[nodiscard]] double volume() const;

    /**
     * @brief Number of directed triangle edges without an opposite twin
     *
     * Zero for a closed, consistently oriented (orientable) shell.
     */
    [[nodiscard]] size_t open_edge_count() const;

    /**
     * @brief Closed and consistently oriented
     */
    [[nodiscard]] bool is_closed() const { return is_valid() && open_edge_count() == 0; }

    /**
     * @brief Check that every face is planar within tolerance
     */
    [[nodiscard]] bool faces_planar(double tolerance = 1e-9) const;

    /**
     * @brief Append a quad face as two triangles
     */
    void add_quad(uint32_t a, uint32_t b, uint32_t c, uint32_t d);

    /**
     * @brief Append a convex face and fan-triangulate it
     */
    void add_convex_face(const std::vector<uint32_t>& loop);
};

} // namespace geobim::geometry
