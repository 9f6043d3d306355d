/**
 * @file DebrisMesh.cpp
 * @brief Implementation of the indexed debris mesh
 */

#include "DebrisMesh.hpp"
#include <algorithm>
#include <stdexcept>

namespace debris {

namespace {

inline double squared_distance_3d(const Point3D& a, const Point3D& b) {
    double dx = a.x() - b.x();
    double dy = a.y() - b.y();
    double dz = a.z() - b.z();
    return dx * dx + dy * dy + dz * dz;
}

} // namespace

VertexId DebrisMesh::add_vertex(const Point3D& position) {
    VertexId vertex_id = static_cast<VertexId>(vertices_.size());
    vertices_.push_back(position);
    return vertex_id;
}

TriangleId DebrisMesh::add_triangle(const Triangle& triangle) {
    for (VertexId v : triangle.vertices) {
        if (v >= vertices_.size()) {
            throw std::out_of_range("Triangle references vertex " + std::to_string(v) +
                                    " but mesh has " + std::to_string(vertices_.size()) +
                                    " vertices");
        }
    }

    TriangleId triangle_id = static_cast<TriangleId>(triangles_.size());
    triangles_.push_back(triangle);

    for (int i = 0; i < 3; ++i) {
        edge_faces_[triangle.edge(i)]++;
    }

    return triangle_id;
}

TriangleId DebrisMesh::add_triangle(VertexId v0, VertexId v1, VertexId v2) {
    return add_triangle(Triangle(v0, v1, v2));
}

BoundingBox DebrisMesh::compute_bounding_box() const {
    BoundingBox bbox;
    if (vertices_.empty()) {
        return bbox;
    }

    auto minmax_x = std::minmax_element(vertices_.begin(), vertices_.end(),
        [](const Point3D& a, const Point3D& b) { return a.x() < b.x(); });
    auto minmax_y = std::minmax_element(vertices_.begin(), vertices_.end(),
        [](const Point3D& a, const Point3D& b) { return a.y() < b.y(); });
    auto minmax_z = std::minmax_element(vertices_.begin(), vertices_.end(),
        [](const Point3D& a, const Point3D& b) { return a.z() < b.z(); });

    bbox.min_x = minmax_x.first->x();
    bbox.max_x = minmax_x.second->x();
    bbox.min_y = minmax_y.first->y();
    bbox.max_y = minmax_y.second->y();
    bbox.min_z = minmax_z.first->z();
    bbox.max_z = minmax_z.second->z();
    return bbox;
}

Point3D DebrisMesh::compute_centroid() const {
    if (vertices_.empty()) {
        return Point3D();
    }

    double sx = 0.0, sy = 0.0, sz = 0.0;
    for (const auto& v : vertices_) {
        sx += v.x();
        sy += v.y();
        sz += v.z();
    }
    const double n = static_cast<double>(vertices_.size());
    return Point3D(sx / n, sy / n, sz / n);
}

MeshValidationResult DebrisMesh::validate_topology() const {
    MeshValidationResult result;

    // Closed 2-manifold: every edge shared by exactly two triangles
    for (const auto& entry : edge_faces_) {
        const size_t face_count = entry.second;
        if (face_count == 1) {
            result.boundary_edge_count++;
            result.is_watertight = false;
        } else if (face_count > 2) {
            result.num_non_manifold_edges++;
            result.is_manifold = false;
        }
    }

    result.num_degenerate_triangles = find_degenerate_triangles().size();
    result.num_duplicate_vertices = find_duplicate_vertices().size();

    result.euler_characteristic = static_cast<long>(vertices_.size()) -
                                  static_cast<long>(edge_faces_.size()) +
                                  static_cast<long>(triangles_.size());
    return result;
}

std::vector<TriangleId> DebrisMesh::find_degenerate_triangles(double min_area) const {
    std::vector<TriangleId> degenerate;
    for (size_t i = 0; i < triangles_.size(); ++i) {
        const auto& tri = triangles_[i];
        bool repeated = tri.vertices[0] == tri.vertices[1] ||
                        tri.vertices[1] == tri.vertices[2] ||
                        tri.vertices[0] == tri.vertices[2];
        if (repeated || compute_triangle_area(static_cast<TriangleId>(i)) < min_area) {
            degenerate.push_back(static_cast<TriangleId>(i));
        }
    }
    return degenerate;
}

std::vector<VertexId> DebrisMesh::find_duplicate_vertices(double tolerance) const {
    // Hull meshes are small; a quadratic scan is fine
    std::vector<VertexId> duplicates;
    const double tolerance_sq = tolerance * tolerance;

    for (size_t i = 0; i < vertices_.size(); ++i) {
        for (size_t j = 0; j < i; ++j) {
            if (squared_distance_3d(vertices_[i], vertices_[j]) <= tolerance_sq) {
                duplicates.push_back(static_cast<VertexId>(i));
                break;
            }
        }
    }
    return duplicates;
}

bool DebrisMesh::is_outward_oriented() const {
    if (triangles_.empty()) {
        return false;
    }

    const Point3D centroid = compute_centroid();
    for (size_t i = 0; i < triangles_.size(); ++i) {
        const auto& tri = triangles_[i];
        const Vector3D normal = compute_triangle_normal(static_cast<TriangleId>(i));
        const Vector3D to_face(centroid, vertices_[tri.vertices[0]]);
        if (normal.dot(to_face) <= 0.0) {
            return false;
        }
    }
    return true;
}

Vector3D DebrisMesh::compute_triangle_normal(TriangleId triangle_id) const {
    const auto& tri = triangles_.at(triangle_id);
    const Point3D& v0 = vertices_[tri.vertices[0]];
    const Point3D& v1 = vertices_[tri.vertices[1]];
    const Point3D& v2 = vertices_[tri.vertices[2]];

    Vector3D edge1(v0, v1);
    Vector3D edge2(v0, v2);
    Vector3D normal = edge1.cross(edge2);
    if (normal.length() <= 1e-12) {
        return Vector3D(0.0, 0.0, 0.0);
    }
    return normal.normalized();
}

double DebrisMesh::compute_triangle_area(TriangleId triangle_id) const {
    const auto& tri = triangles_.at(triangle_id);
    Vector3D edge1(vertices_[tri.vertices[0]], vertices_[tri.vertices[1]]);
    Vector3D edge2(vertices_[tri.vertices[0]], vertices_[tri.vertices[2]]);
    return 0.5 * edge1.cross(edge2).length();
}

double DebrisMesh::compute_surface_area() const {
    double area = 0.0;
    for (size_t i = 0; i < triangles_.size(); ++i) {
        area += compute_triangle_area(static_cast<TriangleId>(i));
    }
    return area;
}

void DebrisMesh::reserve(size_t vertex_count, size_t triangle_count) {
    vertices_.reserve(vertex_count);
    triangles_.reserve(triangle_count);
    edge_faces_.reserve(triangle_count * 3 / 2);
}

} // namespace debris
