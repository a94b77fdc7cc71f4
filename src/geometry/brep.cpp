#include "geometry/brep.hpp"
#include <cmath>
#include <map>
#include <utility>

namespace geobim::geometry {

// Newell's method; robust for non-convex planar loops
static glm::dvec3 loop_normal(const std::vector<glm::dvec3>& vertices,
                              const std::vector<uint32_t>& loop) {
    glm::dvec3 normal(0.0);
    for (size_t i = 0; i < loop.size(); ++i) {
        const glm::dvec3& p = vertices[loop[i]];
        const glm::dvec3& q = vertices[loop[(i + 1) % loop.size()]];
        normal.x += (p.y - q.y) * (p.z + q.z);
        normal.y += (p.z - q.z) * (p.x + q.x);
        normal.z += (p.x - q.x) * (p.y + q.y);
    }
    return normal;
}

double Brep::volume() const {
    double sum = 0.0;
    for (size_t i = 0; i + 2 < triangles.size(); i += 3) {
        const glm::dvec3& p0 = vertices[triangles[i]];
        const glm::dvec3& p1 = vertices[triangles[i + 1]];
        const glm::dvec3& p2 = vertices[triangles[i + 2]];
        sum += glm::dot(p0, glm::cross(p1, p2));
    }
    return sum / 6.0;
}

size_t Brep::open_edge_count() const {
    // Directed edge -> occurrence count
    std::map<std::pair<uint32_t, uint32_t>, int> edges;
    for (size_t i = 0; i + 2 < triangles.size(); i += 3) {
        for (size_t k = 0; k < 3; ++k) {
            uint32_t a = triangles[i + k];
            uint32_t b = triangles[i + (k + 1) % 3];
            edges[{a, b}]++;
        }
    }

    size_t open = 0;
    for (const auto& [edge, count] : edges) {
        auto twin = edges.find({edge.second, edge.first});
        int twin_count = twin != edges.end() ? twin->second : 0;
        if (count > twin_count) {
            open += static_cast<size_t>(count - twin_count);
        }
    }
    return open;
}

bool Brep::faces_planar(double tolerance) const {
    for (const auto& face : faces) {
        glm::dvec3 normal = loop_normal(vertices, face.outer);
        double len = glm::length(normal);
        if (len < 1e-15) return false;
        normal /= len;

        const glm::dvec3& origin = vertices[face.outer.front()];
        auto off_plane = [&](uint32_t idx) {
            return std::abs(glm::dot(vertices[idx] - origin, normal)) > tolerance;
        };

        for (uint32_t idx : face.outer) {
            if (off_plane(idx)) return false;
        }
        for (const auto& loop : face.inner) {
            for (uint32_t idx : loop) {
                if (off_plane(idx)) return false;
            }
        }
    }
    return true;
}

void Brep::add_quad(uint32_t a, uint32_t b, uint32_t c, uint32_t d) {
    faces.push_back(Face{{a, b, c, d}, {}});

    triangles.push_back(a);
    triangles.push_back(b);
    triangles.push_back(c);

    triangles.push_back(a);
    triangles.push_back(c);
    triangles.push_back(d);
}

void Brep::add_convex_face(const std::vector<uint32_t>& loop) {
    faces.push_back(Face{loop, {}});

    for (size_t i = 1; i + 1 < loop.size(); ++i) {
        triangles.push_back(loop[0]);
        triangles.push_back(loop[i]);
        triangles.push_back(loop[i + 1]);
    }
}

} // namespace geobim::geometry
