/**
 * @file ConvexHullBuilder.cpp
 * @brief Implementation of CGAL-backed convex hull extraction
 */

#include "ConvexHullBuilder.hpp"
#include "ScaleNormalizer.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <map>
#include <sstream>

#include <CGAL/Exact_predicates_inexact_constructions_kernel.h>
#include <CGAL/Surface_mesh.h>
#include <CGAL/convex_hull_3.h>
#include <CGAL/boost/graph/helpers.h>
#include <CGAL/Polygon_mesh_processing/measure.h>

namespace debris {

namespace {

using Kernel = CGAL::Exact_predicates_inexact_constructions_kernel;
using CgalPoint = Kernel::Point_3;
using HullMesh = CGAL::Surface_mesh<CgalPoint>;

namespace PMP = CGAL::Polygon_mesh_processing;

std::vector<CgalPoint> to_cgal_points(const PointCloud& cloud) {
    std::vector<CgalPoint> points;
    points.reserve(cloud.size());
    for (const auto& p : cloud) {
        points.emplace_back(p.x(), p.y(), p.z());
    }
    return points;
}

int affine_dimension_of(const std::vector<CgalPoint>& points) {
    if (points.empty()) {
        return -1;
    }

    const CgalPoint& a = points.front();
    auto b_it = std::find_if(points.begin(), points.end(),
                             [&](const CgalPoint& p) { return p != a; });
    if (b_it == points.end()) {
        return 0;
    }
    const CgalPoint& b = *b_it;

    auto c_it = std::find_if(points.begin(), points.end(),
                             [&](const CgalPoint& p) { return !CGAL::collinear(a, b, p); });
    if (c_it == points.end()) {
        return 1;
    }
    const CgalPoint& c = *c_it;

    auto d_it = std::find_if(points.begin(), points.end(),
                             [&](const CgalPoint& p) { return !CGAL::coplanar(a, b, c, p); });
    if (d_it == points.end()) {
        return 2;
    }
    return 3;
}

} // namespace

ConvexHullBuilder::ConvexHullBuilder()
    : logger_("ConvexHullBuilder") {}

int ConvexHullBuilder::affine_dimension(const PointCloud& cloud) {
    return affine_dimension_of(to_cgal_points(cloud));
}

ConvexPolyhedron ConvexHullBuilder::build(const PointCloud& cloud) const {
    if (cloud.size() < 4) {
        logger_.error("Hull construction requested for " + std::to_string(cloud.size()) + " points");
        throw InsufficientPointsError(cloud.size());
    }

    const std::vector<CgalPoint> points = to_cgal_points(cloud);

    const int dimension = affine_dimension_of(points);
    if (dimension < 3) {
        static const char* const kinds[] = {"coincident", "collinear", "coplanar"};
        const std::string message = "all " + std::to_string(points.size()) + " points are " +
                                    kinds[std::max(dimension, 0)];
        logger_.warning(message);
        throw DegenerateGeometryError(message);
    }

    HullMesh hull;
    CGAL::convex_hull_3(points.begin(), points.end(), hull);

    logger_.debug("CGAL hull: " + std::to_string(hull.number_of_vertices()) + " vertices, " +
                  std::to_string(hull.number_of_faces()) + " faces");

    if (hull.number_of_faces() < 4 || !CGAL::is_closed(hull) || !CGAL::is_triangle_mesh(hull)) {
        const std::string message = "convex hull is not a closed triangulated solid (" +
                                    std::to_string(hull.number_of_faces()) + " faces)";
        logger_.warning(message);
        throw DegenerateGeometryError(message);
    }

    const double max_distance = ScaleNormalizer::max_pairwise_distance(cloud);
    const double volume = CGAL::to_double(PMP::volume(hull));
    const double reference = max_distance * max_distance * max_distance;
    if (!(volume > min_relative_volume * reference)) {
        std::ostringstream oss;
        oss << "convex hull encloses no measurable volume (" << volume
            << " for characteristic length " << max_distance << ")";
        logger_.warning(oss.str());
        throw DegenerateGeometryError(oss.str());
    }

    // First occurrence wins for duplicate input points
    std::map<CgalPoint, std::size_t> source_lookup;
    for (std::size_t i = 0; i < points.size(); ++i) {
        source_lookup.emplace(points[i], i);
    }

    ConvexPolyhedron polyhedron;
    polyhedron.vertices.reserve(hull.number_of_vertices());
    polyhedron.source_indices.reserve(hull.number_of_vertices());
    polyhedron.faces.reserve(hull.number_of_faces());

    std::map<HullMesh::Vertex_index, VertexId> vertex_ids;
    for (HullMesh::Vertex_index v : hull.vertices()) {
        const CgalPoint& p = hull.point(v);
        vertex_ids[v] = static_cast<VertexId>(polyhedron.vertices.size());
        polyhedron.vertices.emplace_back(CGAL::to_double(p.x()),
                                         CGAL::to_double(p.y()),
                                         CGAL::to_double(p.z()));

        auto source = source_lookup.find(p);
        if (source == source_lookup.end()) {
            throw DegenerateGeometryError("hull vertex does not match any input point");
        }
        polyhedron.source_indices.push_back(source->second);
    }

    for (HullMesh::Face_index f : hull.faces()) {
        std::array<VertexId, 3> corners{};
        int corner = 0;
        for (HullMesh::Vertex_index v : hull.vertices_around_face(hull.halfedge(f))) {
            corners[corner++] = vertex_ids.at(v);
        }
        polyhedron.faces.emplace_back(corners[0], corners[1], corners[2]);
    }

    logger_.detailed("Hull kept " + std::to_string(polyhedron.vertices.size()) + " of " +
                     std::to_string(cloud.size()) + " points, " +
                     std::to_string(polyhedron.faces.size()) + " faces");

    return polyhedron;
}

} // namespace debris
