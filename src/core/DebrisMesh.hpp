#pragma once

/**
 * @file DebrisMesh.hpp
 * @brief Indexed triangle mesh with topology validation, and the exportable handle
 */

#include "debris_generator.hpp"
#include <unordered_map>
#include <vector>

namespace debris {

/**
 * @brief Edge hash function for unordered containers
 */
struct EdgeHash {
    std::size_t operator()(const EdgeId& edge_id) const noexcept {
        return std::hash<EdgeId>{}(edge_id);
    }
};

/**
 * @brief Indexed triangle mesh of a debris fragment
 *
 * Features:
 * - Shared vertex storage
 * - Edge registry for manifold/watertight checks
 * - Per-face normals from vertex winding
 */
class DebrisMesh {
public:
    DebrisMesh() = default;

    // Mesh construction
    VertexId add_vertex(const Point3D& position);

    /**
     * @brief Append a triangle
     * @throws std::out_of_range if an index does not name an existing vertex
     */
    TriangleId add_triangle(const Triangle& triangle);
    TriangleId add_triangle(VertexId v0, VertexId v1, VertexId v2);

    // Accessors
    const Point3D& get_vertex(VertexId vertex_id) const { return vertices_.at(vertex_id); }

    const std::vector<Point3D>& vertices() const { return vertices_; }
    const std::vector<Triangle>& triangles() const { return triangles_; }

    size_t num_vertices() const { return vertices_.size(); }
    size_t num_triangles() const { return triangles_.size(); }
    size_t num_edges() const { return edge_faces_.size(); }
    bool empty() const { return triangles_.empty(); }

    // Spatial queries
    BoundingBox compute_bounding_box() const;
    Point3D compute_centroid() const;

    // Topology operations
    MeshValidationResult validate_topology() const;
    std::vector<TriangleId> find_degenerate_triangles(double min_area = 1e-12) const;
    std::vector<VertexId> find_duplicate_vertices(double tolerance = 1e-9) const;

    /**
     * @brief True if every face normal points away from the vertex centroid
     *
     * Sufficient for convex solids only.
     */
    bool is_outward_oriented() const;

    // Face geometry
    Vector3D compute_triangle_normal(TriangleId triangle_id) const;
    double compute_triangle_area(TriangleId triangle_id) const;
    double compute_surface_area() const;

    void reserve(size_t vertex_count, size_t triangle_count);

private:
    std::vector<Point3D> vertices_;
    std::vector<Triangle> triangles_;

    // Number of faces using each undirected edge
    std::unordered_map<EdgeId, size_t, EdgeHash> edge_faces_;
};

/**
 * @brief Exportable result of one generation request
 *
 * Only MeshAdapter creates handles, which guarantees every triangle index is
 * in range. Handles are plain values: copy or move them to keep the most
 * recent fragment around for a later export.
 */
class MeshHandle {
public:
    const DebrisMesh& mesh() const { return mesh_; }
    const std::vector<Point3D>& vertices() const { return mesh_.vertices(); }
    const std::vector<Triangle>& triangles() const { return mesh_.triangles(); }

    /// Max pairwise distance after scaling, in mm
    double achieved_characteristic_length() const { return achieved_characteristic_length_; }

    const GenerationParameters& parameters() const { return parameters_; }

    /// Points sampled before hull extraction
    size_t sampled_point_count() const { return sampled_point_count_; }

private:
    friend class MeshAdapter;

    MeshHandle(DebrisMesh mesh, double achieved_characteristic_length,
               const GenerationParameters& parameters, size_t sampled_point_count)
        : mesh_(std::move(mesh)),
          achieved_characteristic_length_(achieved_characteristic_length),
          parameters_(parameters),
          sampled_point_count_(sampled_point_count) {}

    DebrisMesh mesh_;
    double achieved_characteristic_length_ = 0.0;
    GenerationParameters parameters_;
    size_t sampled_point_count_ = 0;
};

} // namespace debris
