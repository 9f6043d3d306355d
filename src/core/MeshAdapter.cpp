/**
 * @file MeshAdapter.cpp
 * @brief Implementation of hull packaging
 */

#include "MeshAdapter.hpp"
#include <string>

namespace debris {

MeshAdapter::MeshAdapter()
    : logger_("MeshAdapter") {}

MeshHandle MeshAdapter::adapt(const ConvexPolyhedron& polyhedron,
                              double achieved_characteristic_length,
                              const GenerationParameters& parameters,
                              size_t sampled_point_count) const {
    if (polyhedron.faces.empty()) {
        throw DegenerateGeometryError("hull has no faces to package");
    }

    const size_t vertex_count = polyhedron.vertices.size();
    for (size_t f = 0; f < polyhedron.faces.size(); ++f) {
        for (VertexId v : polyhedron.faces[f].vertices) {
            if (v >= vertex_count) {
                const std::string message = "face " + std::to_string(f) + " references vertex " +
                                            std::to_string(v) + " of " +
                                            std::to_string(vertex_count);
                logger_.error(message);
                throw DegenerateGeometryError(message);
            }
        }
    }

    DebrisMesh mesh;
    mesh.reserve(vertex_count, polyhedron.faces.size());
    for (const auto& vertex : polyhedron.vertices) {
        mesh.add_vertex(vertex);
    }
    for (const auto& face : polyhedron.faces) {
        mesh.add_triangle(face);
    }

    logger_.debug("Packaged " + std::to_string(mesh.num_vertices()) + " vertices, " +
                  std::to_string(mesh.num_triangles()) + " triangles");

    return MeshHandle(std::move(mesh), achieved_characteristic_length,
                      parameters, sampled_point_count);
}

} // namespace debris
