#include "geometry/polygon_utils.hpp"
#include <algorithm>
#include <cmath>

namespace geobim::geometry {

double polygon_area(const std::vector<glm::dvec2>& polygon) {
    if (polygon.size() < 3) return 0.0;

    // Shoelace formula
    double area = 0.0;
    size_t n = polygon.size();

    for (size_t i = 0; i < n; ++i) {
        size_t j = (i + 1) % n;
        area += polygon[i].x * polygon[j].y;
        area -= polygon[j].x * polygon[i].y;
    }

    return area / 2.0;
}

bool is_clockwise(const std::vector<glm::dvec2>& polygon) {
    return polygon_area(polygon) < 0.0;
}

bool ensure_ccw(std::vector<glm::dvec2>& polygon) {
    if (is_clockwise(polygon)) {
        std::reverse(polygon.begin(), polygon.end());
        return true;
    }
    return false;
}

bool ensure_cw(std::vector<glm::dvec2>& polygon) {
    if (!is_clockwise(polygon)) {
        std::reverse(polygon.begin(), polygon.end());
        return true;
    }
    return false;
}

glm::dvec2 centroid(const std::vector<glm::dvec2>& polygon) {
    if (polygon.empty()) return glm::dvec2(0.0);
    if (polygon.size() == 1) return polygon[0];
    if (polygon.size() == 2) return (polygon[0] + polygon[1]) / 2.0;

    double cx = 0.0;
    double cy = 0.0;
    double signed_area = 0.0;
    size_t n = polygon.size();

    for (size_t i = 0; i < n; ++i) {
        size_t j = (i + 1) % n;
        double cross = polygon[i].x * polygon[j].y - polygon[j].x * polygon[i].y;
        signed_area += cross;
        cx += (polygon[i].x + polygon[j].x) * cross;
        cy += (polygon[i].y + polygon[j].y) * cross;
    }

    signed_area /= 2.0;
    if (std::abs(signed_area) < 1e-10) {
        // Degenerate polygon, return simple average
        glm::dvec2 sum(0.0);
        for (const auto& p : polygon) sum += p;
        return sum / static_cast<double>(n);
    }

    cx /= (6.0 * signed_area);
    cy /= (6.0 * signed_area);

    return glm::dvec2(cx, cy);
}

std::vector<glm::dvec2> normalize_ring(const std::vector<glm::dvec2>& ring) {
    std::vector<glm::dvec2> result;
    result.reserve(ring.size());

    for (const auto& pt : ring) {
        if (!result.empty() && glm::length(pt - result.back()) < VERTEX_EPSILON) {
            continue;
        }
        result.push_back(pt);
    }

    // Drop explicit closing vertex
    while (result.size() > 1 && glm::length(result.front() - result.back()) < VERTEX_EPSILON) {
        result.pop_back();
    }

    return result;
}

std::vector<glm::dvec3> remove_duplicate_vertices(const std::vector<glm::dvec3>& points) {
    std::vector<glm::dvec3> result;
    result.reserve(points.size());

    for (const auto& pt : points) {
        if (!result.empty() && glm::length(pt - result.back()) < VERTEX_EPSILON) {
            continue;
        }
        result.push_back(pt);
    }
    return result;
}

static double orient(const glm::dvec2& a, const glm::dvec2& b, const glm::dvec2& c) {
    return (b.x - a.x) * (c.y - a.y) - (b.y - a.y) * (c.x - a.x);
}

static bool on_segment(const glm::dvec2& a, const glm::dvec2& b, const glm::dvec2& p) {
    return std::min(a.x, b.x) <= p.x && p.x <= std::max(a.x, b.x) &&
           std::min(a.y, b.y) <= p.y && p.y <= std::max(a.y, b.y);
}

bool segments_intersect(const glm::dvec2& a0, const glm::dvec2& a1,
                        const glm::dvec2& b0, const glm::dvec2& b1) {
    double d1 = orient(b0, b1, a0);
    double d2 = orient(b0, b1, a1);
    double d3 = orient(a0, a1, b0);
    double d4 = orient(a0, a1, b1);

    if (((d1 > 0 && d2 < 0) || (d1 < 0 && d2 > 0)) &&
        ((d3 > 0 && d4 < 0) || (d3 < 0 && d4 > 0))) {
        return true;
    }

    // Collinear / touching cases
    if (d1 == 0.0 && on_segment(b0, b1, a0)) return true;
    if (d2 == 0.0 && on_segment(b0, b1, a1)) return true;
    if (d3 == 0.0 && on_segment(a0, a1, b0)) return true;
    if (d4 == 0.0 && on_segment(a0, a1, b1)) return true;

    return false;
}

bool ring_self_intersects(const std::vector<glm::dvec2>& ring) {
    size_t n = ring.size();
    if (n < 4) return false;

    for (size_t i = 0; i < n; ++i) {
        const glm::dvec2& a0 = ring[i];
        const glm::dvec2& a1 = ring[(i + 1) % n];

        // Skip the edge itself and both neighbours
        for (size_t j = i + 2; j < n; ++j) {
            if (i == 0 && j == n - 1) continue;

            const glm::dvec2& b0 = ring[j];
            const glm::dvec2& b1 = ring[(j + 1) % n];
            if (segments_intersect(a0, a1, b0, b1)) {
                return true;
            }
        }
    }
    return false;
}

bool point_in_ring(const glm::dvec2& point, const std::vector<glm::dvec2>& ring) {
    bool inside = false;
    size_t n = ring.size();

    for (size_t i = 0, j = n - 1; i < n; j = i++) {
        const glm::dvec2& pi = ring[i];
        const glm::dvec2& pj = ring[j];
        if ((pi.y > point.y) != (pj.y > point.y)) {
            double x_cross = (pj.x - pi.x) * (point.y - pi.y) / (pj.y - pi.y) + pi.x;
            if (point.x < x_cross) {
                inside = !inside;
            }
        }
    }
    return inside;
}

} // namespace geobim::geometry
