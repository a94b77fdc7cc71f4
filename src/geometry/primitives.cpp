#include "geometry/primitives.hpp"
#include "geometry/polygon_utils.hpp"
#include "core/error.hpp"
#include <glm/gtc/constants.hpp>
#include <glm/gtx/quaternion.hpp>
#include <mapbox/earcut.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <cmath>

// Earcut adapter for glm::dvec2
namespace mapbox {
namespace util {

template <>
struct nth<0, glm::dvec2> {
    inline static double get(const glm::dvec2& t) { return t.x; }
};

template <>
struct nth<1, glm::dvec2> {
    inline static double get(const glm::dvec2& t) { return t.y; }
};

} // namespace util
} // namespace mapbox

namespace geobim::geometry {

static void require_positive(double value, const char* what) {
    if (!std::isfinite(value) || value <= 0.0) {
        throw InvalidGeometry(std::string(what) + " must be positive, got " + std::to_string(value));
    }
}

static bool all_finite(const glm::dvec3& p) {
    return std::isfinite(p.x) && std::isfinite(p.y) && std::isfinite(p.z);
}

static bool all_finite(const glm::dvec2& p) {
    return std::isfinite(p.x) && std::isfinite(p.y);
}

static void report(std::vector<std::string>* warnings, const std::string& message) {
    spdlog::warn("SolidBuilder: {}", message);
    if (warnings) {
        warnings->push_back(message);
    }
}

// ============================================================================
// Box
// ============================================================================

SolidGeometry SolidBuilder::make_box(const glm::dvec3& center, double width, double depth, double height) {
    require_positive(width, "Box width");
    require_positive(depth, "Box depth");
    require_positive(height, "Box height");
    if (!all_finite(center)) {
        throw InvalidGeometry("Box center is not finite");
    }

    SolidGeometry solid;
    solid.shape = Box{center, width, depth, height};

    Brep& brep = solid.brep;
    const double hw = width * 0.5;
    const double hd = depth * 0.5;

    // Bottom ring (0-3) then top ring (4-7), CCW seen from above
    const std::array<glm::dvec2, 4> corners = {
        glm::dvec2(center.x - hw, center.y - hd),
        glm::dvec2(center.x + hw, center.y - hd),
        glm::dvec2(center.x + hw, center.y + hd),
        glm::dvec2(center.x - hw, center.y + hd),
    };
    for (const auto& c : corners) {
        brep.vertices.emplace_back(c.x, c.y, center.z);
    }
    for (const auto& c : corners) {
        brep.vertices.emplace_back(c.x, c.y, center.z + height);
    }

    brep.add_quad(0, 3, 2, 1);  // bottom, facing -Z
    brep.add_quad(4, 5, 6, 7);  // top, facing +Z
    brep.add_quad(0, 1, 5, 4);  // -Y
    brep.add_quad(1, 2, 6, 5);  // +X
    brep.add_quad(2, 3, 7, 6);  // +Y
    brep.add_quad(3, 0, 4, 7);  // -X

    brep.compute_bounds();
    return solid;
}

// ============================================================================
// Swept pipe
// ============================================================================

SolidGeometry SolidBuilder::make_swept_pipe(const std::vector<glm::dvec3>& centerline, double radius,
                                            int segments) {
    if (centerline.size() < 2) {
        throw InvalidGeometry("Pipe centerline needs at least 2 vertices, got " +
                              std::to_string(centerline.size()));
    }
    require_positive(radius, "Pipe radius");
    if (segments < 3) {
        throw InvalidGeometry("Pipe cross-section needs at least 3 segments");
    }
    for (const auto& p : centerline) {
        if (!all_finite(p)) {
            throw InvalidGeometry("Pipe centerline contains non-finite coordinates");
        }
    }

    std::vector<glm::dvec3> points = remove_duplicate_vertices(centerline);
    if (points.size() < 2) {
        throw InvalidGeometry("Pipe centerline has zero length");
    }

    const size_t n = points.size();

    // Segment directions
    std::vector<glm::dvec3> dirs(n - 1);
    for (size_t i = 0; i + 1 < n; ++i) {
        dirs[i] = glm::normalize(points[i + 1] - points[i]);
    }

    for (size_t i = 1; i < dirs.size(); ++i) {
        if (glm::dot(dirs[i - 1], dirs[i]) < -1.0 + 1e-6) {
            throw InvalidGeometry("Pipe centerline folds back onto itself at vertex " + std::to_string(i));
        }
    }

    // Initial cross-section frame with u x v == direction
    glm::dvec3 ref = std::abs(dirs[0].z) < 0.9 ? glm::dvec3(0.0, 0.0, 1.0) : glm::dvec3(1.0, 0.0, 0.0);
    glm::dvec3 u = glm::normalize(glm::cross(ref, dirs[0]));
    glm::dvec3 v = glm::cross(dirs[0], u);

    SolidGeometry solid;
    solid.shape = SweptPipe{points.front(), points, radius};
    Brep& brep = solid.brep;
    brep.vertices.reserve(n * static_cast<size_t>(segments));

    const double step = 2.0 * glm::pi<double>() / static_cast<double>(segments);

    for (size_t k = 0; k < n; ++k) {
        const glm::dvec3& c = points[k];

        // Direction the cross-section is swept along when arriving at vertex k
        glm::dvec3 along = dirs[k == 0 ? 0 : k - 1];

        // Joints lie in the bisector plane of both segment directions
        glm::dvec3 plane_normal = along;
        if (k > 0 && k < n - 1) {
            plane_normal = glm::normalize(dirs[k - 1] + dirs[k]);
        }
        const double denom = glm::dot(along, plane_normal);

        for (int j = 0; j < segments; ++j) {
            double a = step * static_cast<double>(j);
            glm::dvec3 p = c + radius * (std::cos(a) * u + std::sin(a) * v);
            // Project along the sweep direction onto the joint plane
            double t = -glm::dot(p - c, plane_normal) / denom;
            brep.vertices.push_back(p + t * along);
        }

        // Parallel-transport the frame into the outgoing segment
        if (k > 0 && k < n - 1) {
            glm::dquat q = glm::rotation(dirs[k - 1], dirs[k]);
            u = glm::normalize(q * u);
            v = glm::normalize(q * v);
        }
    }

    const uint32_t seg = static_cast<uint32_t>(segments);
    auto ring_vertex = [seg](size_t ring, uint32_t j) {
        return static_cast<uint32_t>(ring) * seg + (j % seg);
    };

    // Start cap faces backwards, end cap forwards
    std::vector<uint32_t> start_cap;
    std::vector<uint32_t> end_cap;
    for (uint32_t j = 0; j < seg; ++j) {
        start_cap.push_back(ring_vertex(0, seg - 1 - j));
        end_cap.push_back(ring_vertex(n - 1, j));
    }
    brep.add_convex_face(start_cap);

    for (size_t k = 0; k + 1 < n; ++k) {
        for (uint32_t j = 0; j < seg; ++j) {
            brep.add_quad(ring_vertex(k, j), ring_vertex(k, j + 1),
                          ring_vertex(k + 1, j + 1), ring_vertex(k + 1, j));
        }
    }

    brep.add_convex_face(end_cap);

    brep.compute_bounds();
    return solid;
}

// ============================================================================
// Extruded solid
// ============================================================================

SolidGeometry SolidBuilder::make_extruded_solid(const std::vector<glm::dvec2>& outer_ring,
                                                const std::vector<std::vector<glm::dvec2>>& inner_rings,
                                                double height,
                                                double base_z,
                                                std::vector<std::string>* warnings) {
    require_positive(height, "Extrusion height");
    if (!std::isfinite(base_z)) {
        throw InvalidGeometry("Extrusion base elevation is not finite");
    }
    for (const auto& p : outer_ring) {
        if (!all_finite(p)) {
            throw InvalidGeometry("Outer ring contains non-finite coordinates");
        }
    }

    std::vector<glm::dvec2> outer = normalize_ring(outer_ring);
    if (outer.size() < 3) {
        throw InvalidGeometry("Outer ring needs at least 3 distinct vertices, got " +
                              std::to_string(outer.size()));
    }
    if (std::abs(polygon_area(outer)) < 1e-12) {
        throw InvalidGeometry("Outer ring has zero area");
    }

    if (ring_self_intersects(outer)) {
        report(warnings, "Outer ring is self-intersecting; solid may be non-manifold");
    }
    if (ensure_ccw(outer)) {
        spdlog::debug("SolidBuilder: Reversed clockwise outer ring");
    }

    std::vector<std::vector<glm::dvec2>> holes;
    for (size_t h = 0; h < inner_rings.size(); ++h) {
        const auto& raw = inner_rings[h];
        if (!std::all_of(raw.begin(), raw.end(), [](const glm::dvec2& p) { return all_finite(p); })) {
            report(warnings, "Inner ring " + std::to_string(h) + " contains non-finite coordinates; dropped");
            continue;
        }

        std::vector<glm::dvec2> hole = normalize_ring(raw);
        if (hole.size() < 3) {
            report(warnings, "Inner ring " + std::to_string(h) + " has fewer than 3 distinct vertices; dropped");
            continue;
        }
        if (std::abs(polygon_area(hole)) < 1e-12) {
            report(warnings, "Inner ring " + std::to_string(h) + " has zero area; dropped");
            continue;
        }
        if (ring_self_intersects(hole)) {
            report(warnings, "Inner ring " + std::to_string(h) + " is self-intersecting");
        }
        if (!point_in_ring(hole.front(), outer)) {
            report(warnings, "Inner ring " + std::to_string(h) + " lies outside the outer ring");
        }
        ensure_cw(hole);
        holes.push_back(std::move(hole));
    }

    SolidGeometry solid;
    solid.shape = ExtrudedSolid{glm::dvec3(0.0, 0.0, base_z), outer, holes, height};
    Brep& brep = solid.brep;

    // Prepare polygon for earcut (outer ring + holes)
    std::vector<std::vector<glm::dvec2>> polygon;
    polygon.push_back(outer);
    for (const auto& hole : holes) {
        polygon.push_back(hole);
    }

    // Flatten all polygon points; bottom vertex i, top vertex total + i
    std::vector<glm::dvec2> all_points;
    std::vector<uint32_t> ring_offsets;
    for (const auto& ring : polygon) {
        ring_offsets.push_back(static_cast<uint32_t>(all_points.size()));
        for (const auto& pt : ring) {
            all_points.push_back(pt);
        }
    }
    const uint32_t total = static_cast<uint32_t>(all_points.size());
    const double top_z = base_z + height;

    brep.vertices.reserve(2 * all_points.size());
    for (const auto& pt : all_points) {
        brep.vertices.emplace_back(pt.x, pt.y, base_z);
    }
    for (const auto& pt : all_points) {
        brep.vertices.emplace_back(pt.x, pt.y, top_z);
    }

    // === Walls ===
    for (size_t r = 0; r < polygon.size(); ++r) {
        const uint32_t offset = ring_offsets[r];
        const uint32_t count = static_cast<uint32_t>(polygon[r].size());
        for (uint32_t i = 0; i < count; ++i) {
            uint32_t b0 = offset + i;
            uint32_t b1 = offset + (i + 1) % count;
            brep.add_quad(b0, b1, total + b1, total + b0);
        }
    }

    // === Caps ===
    Face top;
    Face bottom;
    for (size_t r = 0; r < polygon.size(); ++r) {
        const uint32_t offset = ring_offsets[r];
        const uint32_t count = static_cast<uint32_t>(polygon[r].size());

        std::vector<uint32_t> top_loop;
        std::vector<uint32_t> bottom_loop;
        for (uint32_t i = 0; i < count; ++i) {
            top_loop.push_back(total + offset + i);
            bottom_loop.push_back(offset + (count - 1 - i));
        }

        if (r == 0) {
            top.outer = std::move(top_loop);
            bottom.outer = std::move(bottom_loop);
        } else {
            top.inner.push_back(std::move(top_loop));
            bottom.inner.push_back(std::move(bottom_loop));
        }
    }
    brep.faces.push_back(std::move(bottom));
    brep.faces.push_back(std::move(top));

    std::vector<uint32_t> cap_indices = mapbox::earcut<uint32_t>(polygon);

    double covered = 0.0;
    for (size_t i = 0; i + 2 < cap_indices.size(); i += 3) {
        uint32_t a = cap_indices[i];
        uint32_t b = cap_indices[i + 1];
        uint32_t c = cap_indices[i + 2];

        const glm::dvec2& pa = all_points[a];
        const glm::dvec2& pb = all_points[b];
        const glm::dvec2& pc = all_points[c];
        double signed_area = 0.5 * ((pb.x - pa.x) * (pc.y - pa.y) - (pb.y - pa.y) * (pc.x - pa.x));
        if (signed_area < 0.0) {
            std::swap(b, c);
        }
        covered += std::abs(signed_area);

        // Top counter-clockwise
        brep.triangles.push_back(total + a);
        brep.triangles.push_back(total + b);
        brep.triangles.push_back(total + c);

        // Bottom clockwise
        brep.triangles.push_back(a);
        brep.triangles.push_back(c);
        brep.triangles.push_back(b);
    }

    double expected = std::abs(polygon_area(outer));
    for (const auto& hole : holes) {
        expected -= std::abs(polygon_area(hole));
    }
    if (std::abs(covered - expected) > 1e-6 * std::max(1.0, std::abs(expected))) {
        report(warnings, "Footprint triangulation covers " + std::to_string(covered) +
                         " of expected area " + std::to_string(expected));
    }

    brep.compute_bounds();
    return solid;
}

} // namespace geobim::geometry
