#pragma once

/**
 * @file debris_generator.hpp
 * @brief Main header for the random debris fragment generator
 *
 * Generates a random convex polyhedron approximating an irregular debris
 * fragment: perturbed sphere sampling, exact scaling to a characteristic
 * length, CGAL convex hull extraction and STL-ready mesh packaging.
 *
 * Copyright (c) 2025 The DebrisGenerator Authors
 * Licensed under the MIT License.
 */

#include <array>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

// Linear algebra
#include <Eigen/Dense>

#include "GenerationErrors.hpp"

namespace debris {

// ============================================================================
// Geometry Types
// ============================================================================

/**
 * @brief 3D point with x, y, z coordinates
 */
struct Point3D {
    double x_, y_, z_;

    Point3D() : x_(0), y_(0), z_(0) {}
    Point3D(double x, double y, double z) : x_(x), y_(y), z_(z) {}

    double x() const { return x_; }
    double y() const { return y_; }
    double z() const { return z_; }

    bool operator==(const Point3D& other) const {
        return x_ == other.x_ && y_ == other.y_ && z_ == other.z_;
    }

    Eigen::Vector3d to_eigen() const { return Eigen::Vector3d(x_, y_, z_); }
};

/**
 * @brief 3D vector for normals and directions
 */
struct Vector3D {
    double x_, y_, z_;

    Vector3D() : x_(0), y_(0), z_(1) {}  // Default to up vector
    Vector3D(double x, double y, double z) : x_(x), y_(y), z_(z) {}
    Vector3D(const Point3D& from, const Point3D& to)
        : x_(to.x() - from.x()), y_(to.y() - from.y()), z_(to.z() - from.z()) {}

    double x() const { return x_; }
    double y() const { return y_; }
    double z() const { return z_; }

    double dot(const Vector3D& other) const {
        return x_ * other.x_ + y_ * other.y_ + z_ * other.z_;
    }

    Vector3D cross(const Vector3D& other) const {
        return Vector3D(
            y_ * other.z_ - z_ * other.y_,
            z_ * other.x_ - x_ * other.z_,
            x_ * other.y_ - y_ * other.x_
        );
    }

    double length() const {
        return std::sqrt(x_ * x_ + y_ * y_ + z_ * z_);
    }

    Vector3D normalized() const {
        double len = length();
        return len > 0 ? Vector3D(x_ / len, y_ / len, z_ / len) : Vector3D(0, 0, 1);
    }
};

/**
 * @brief Unique identifiers for mesh components
 */
using VertexId = std::uint32_t;
using TriangleId = std::uint32_t;
using EdgeId = std::uint64_t; // Combined vertex IDs

/**
 * @brief Triangle defined by three vertex indices
 *
 * Vertices are ordered counter-clockwise when seen from outside the solid.
 */
struct Triangle {
    std::array<VertexId, 3> vertices{};

    Triangle() = default;
    Triangle(VertexId v0, VertexId v1, VertexId v2) : vertices{v0, v1, v2} {}

    EdgeId edge(int i) const {
        int next = (i + 1) % 3;
        return make_edge_id(vertices[i], vertices[next]);
    }

    bool operator==(const Triangle& other) const { return vertices == other.vertices; }

private:
    static EdgeId make_edge_id(VertexId a, VertexId b) {
        if (a > b) std::swap(a, b);
        return (static_cast<EdgeId>(a) << 32) | b;
    }
};

/**
 * @brief Axis-aligned 3D bounding box
 */
struct BoundingBox {
    double min_x = 0.0, min_y = 0.0, min_z = 0.0;
    double max_x = 0.0, max_y = 0.0, max_z = 0.0;

    double width() const { return max_x - min_x; }
    double depth() const { return max_y - min_y; }
    double height() const { return max_z - min_z; }
};

/**
 * @brief Ordered point sequence produced by the sampler and scaled in place
 */
using PointCloud = std::vector<Point3D>;

/**
 * @brief Seedable, caller-owned random source for generation
 */
using RandomEngine = std::mt19937_64;

// ============================================================================
// Generation Data Model
// ============================================================================

/**
 * @brief Parameters of one generation request
 *
 * Immutable once constructed. Construction does not validate; InputValidator
 * checks the documented ranges before any stage runs.
 */
class GenerationParameters {
public:
    static constexpr int min_vertex_count = 5;
    static constexpr int max_vertex_count = 20;
    static constexpr double min_characteristic_length_mm = 1.0;
    static constexpr double max_characteristic_length_mm = 100.0;
    static constexpr double min_irregularity = 0.0;
    static constexpr double max_irregularity = 1.0;

    GenerationParameters() = default;
    GenerationParameters(int vertex_count, double characteristic_length_mm, double irregularity)
        : vertex_count_(vertex_count),
          characteristic_length_mm_(characteristic_length_mm),
          irregularity_(irregularity) {}

    int vertex_count() const { return vertex_count_; }
    double characteristic_length_mm() const { return characteristic_length_mm_; }
    double irregularity() const { return irregularity_; }

private:
    int vertex_count_ = 10;
    double characteristic_length_mm_ = 10.0;
    double irregularity_ = 0.5;
};

/**
 * @brief Convex hull of a point cloud
 *
 * Every index in faces lies in [0, vertices.size()). source_indices[i] is the
 * position in the input cloud that hull vertex i was taken from.
 */
struct ConvexPolyhedron {
    std::vector<Point3D> vertices;
    std::vector<Triangle> faces;
    std::vector<std::size_t> source_indices;
};

/**
 * @brief Results from mesh validation operations
 */
struct MeshValidationResult {
    bool is_manifold = true;
    bool is_watertight = true;
    size_t num_non_manifold_edges = 0;
    size_t num_degenerate_triangles = 0;
    size_t num_duplicate_vertices = 0;
    size_t boundary_edge_count = 0;
    long euler_characteristic = 0;

    bool is_valid() const {
        return is_manifold && is_watertight &&
               num_degenerate_triangles == 0 &&
               num_duplicate_vertices == 0 &&
               euler_characteristic == 2;
    }
};

/**
 * @brief Timings and counts for a generation run
 */
struct PerformanceMetrics {
    std::chrono::microseconds sampling_time{0};
    std::chrono::microseconds scaling_time{0};
    std::chrono::microseconds hull_time{0};
    std::chrono::microseconds packaging_time{0};
    std::chrono::microseconds total_time{0};

    size_t points_sampled = 0;
    size_t hull_vertices = 0;
    size_t hull_faces = 0;
    double scale_factor = 1.0;

    size_t points_discarded() const { return points_sampled - hull_vertices; }
};

/**
 * @brief Run configuration for the command-line front end
 *
 * Defaults give a 10-vertex, 10 mm fragment with irregularity 0.5.
 */
struct DebrisConfig {
    // Generation parameters (validated later by InputValidator)
    int vertex_count = 10;
    double characteristic_length_mm = 10.0;
    double irregularity = 0.5;
    std::optional<std::uint64_t> seed;  // nullopt = seed from std::random_device

    // Caller retry policy for DegenerateGeometryError
    int max_attempts = 1;

    // Export
    bool export_enabled = true;
    std::string output_path = "debris.stl";
    bool ascii_stl = false;
    std::string solid_name = "debris";

    // Logging options
    int log_level = 3;  // 0=silent, 1=ERROR .. 6=TRACE
    std::optional<std::string> log_levels;  // facility form, e.g. "3,ConvexHullBuilder=6"
    std::optional<std::string> log_file;

    // Config file support
    std::optional<std::string> config_file;

    GenerationParameters to_parameters() const {
        return GenerationParameters(vertex_count, characteristic_length_mm, irregularity);
    }
};

class DebrisMesh;
class MeshHandle;

// ============================================================================
// Generator
// ============================================================================

/**
 * @brief Runs the sampler, normalizer, hull builder and mesh adapter in order
 *
 * Each call to generate() is independent; nothing from a previous call is
 * kept except the metrics and validation report of the last successful run.
 */
class DebrisGenerator {
public:
    explicit DebrisGenerator(const GenerationParameters& parameters);
    ~DebrisGenerator();

    DebrisGenerator(const DebrisGenerator&) = delete;
    DebrisGenerator& operator=(const DebrisGenerator&) = delete;

    /**
     * @brief Generate one fragment
     *
     * @param rng Random source; identical seeds give bit-identical meshes
     * @return Exportable mesh
     * @throws InvalidParameterError if the parameters are out of range
     * @throws DegenerateGeometryError if this draw cannot form a solid hull
     * @throws InsufficientPointsError if fewer than 4 points reach the hull
     */
    MeshHandle generate(RandomEngine& rng);

    const GenerationParameters& get_parameters() const;
    const PerformanceMetrics& get_metrics() const;
    const MeshValidationResult& get_validation_result() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief Utility function for one-shot generation
 */
MeshHandle generate_debris(const GenerationParameters& parameters, RandomEngine& rng);

} // namespace debris
