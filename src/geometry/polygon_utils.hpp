/**
 * @file polygon_utils.hpp
 * @brief 2D ring and polyline utilities used by the solid constructors
 * @author GeoBIM Team
 * @version 0.1.0
 * @date 2026
 */

#pragma once

#include <glm/glm.hpp>
#include <vector>

namespace geobim::geometry {

/// Distance below which two vertices are treated as coincident
constexpr double VERTEX_EPSILON = 1e-9;

/**
 * @brief Calculate the signed area of a polygon
 * @param polygon Ordered list of vertices (implicitly closed)
 * @return Signed area (positive = CCW, negative = CW)
 *
 * Uses the shoelace formula.
 */
[[nodiscard]] double polygon_area(const std::vector<glm::dvec2>& polygon);

/**
 * @brief Check if a polygon has clockwise winding
 */
[[nodiscard]] bool is_clockwise(const std::vector<glm::dvec2>& polygon);

/**
 * @brief Ensure polygon has counter-clockwise winding (standard for outer rings)
 * @return true if the ring was reversed
 */
bool ensure_ccw(std::vector<glm::dvec2>& polygon);

/**
 * @brief Ensure polygon has clockwise winding (standard for inner rings/holes)
 * @return true if the ring was reversed
 */
bool ensure_cw(std::vector<glm::dvec2>& polygon);

/**
 * @brief Calculate the area centroid of a polygon
 *
 * Falls back to the vertex average for degenerate (zero-area) input.
 */
[[nodiscard]] glm::dvec2 centroid(const std::vector<glm::dvec2>& polygon);

/**
 * @brief Remove consecutive duplicate vertices and the closing vertex
 *
 * A ring given as first == last is returned implicitly closed.
 */
[[nodiscard]] std::vector<glm::dvec2> normalize_ring(const std::vector<glm::dvec2>& ring);

/**
 * @brief Remove consecutive duplicate vertices of a polyline
 */
[[nodiscard]] std::vector<glm::dvec3> remove_duplicate_vertices(const std::vector<glm::dvec3>& points);

/**
 * @brief Test whether two closed segments intersect (touching counts)
 */
[[nodiscard]] bool segments_intersect(const glm::dvec2& a0, const glm::dvec2& a1,
                                      const glm::dvec2& b0, const glm::dvec2& b1);

/**
 * @brief Test whether any two non-adjacent edges of an implicitly closed ring intersect
 *
 * O(n^2) in the number of edges.
 */
[[nodiscard]] bool ring_self_intersects(const std::vector<glm::dvec2>& ring);

/**
 * @brief Even-odd point in polygon test (implicitly closed ring)
 */
[[nodiscard]] bool point_in_ring(const glm::dvec2& point, const std::vector<glm::dvec2>& ring);

} // namespace geobim::geometry
