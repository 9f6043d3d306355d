#include <catch2/catch.hpp>

#include "core/ConvexHullBuilder.hpp"
#include "core/ScaleNormalizer.hpp"
#include "core/SphericalSampler.hpp"

#include <algorithm>
#include <set>

using namespace debris;

namespace {

Point3D centroid_of(const std::vector<Point3D>& points) {
    double x = 0, y = 0, z = 0;
    for (const auto& p : points) {
        x += p.x();
        y += p.y();
        z += p.z();
    }
    const double n = static_cast<double>(points.size());
    return Point3D(x / n, y / n, z / n);
}

void require_outward_faces(const ConvexPolyhedron& hull) {
    const Point3D centroid = centroid_of(hull.vertices);
    for (const auto& face : hull.faces) {
        const Point3D& a = hull.vertices[face.vertices[0]];
        const Point3D& b = hull.vertices[face.vertices[1]];
        const Point3D& c = hull.vertices[face.vertices[2]];
        Vector3D normal = Vector3D(a, b).cross(Vector3D(a, c));
        REQUIRE(normal.dot(Vector3D(centroid, a)) > 0.0);
    }
}

} // namespace

TEST_CASE("Tetrahedron hull keeps all four points", "[ConvexHullBuilder]") {
    PointCloud cloud = {Point3D(0, 0, 0), Point3D(1, 0, 0), Point3D(0, 1, 0), Point3D(0, 0, 1)};
    ConvexPolyhedron hull = ConvexHullBuilder().build(cloud);

    REQUIRE(hull.vertices.size() == 4);
    REQUIRE(hull.faces.size() == 4);
    REQUIRE(hull.source_indices.size() == 4);

    std::set<std::size_t> sources(hull.source_indices.begin(), hull.source_indices.end());
    REQUIRE(sources == std::set<std::size_t>{0, 1, 2, 3});
    for (std::size_t i = 0; i < hull.vertices.size(); ++i) {
        REQUIRE(hull.vertices[i] == cloud[hull.source_indices[i]]);
    }

    require_outward_faces(hull);
}

TEST_CASE("Interior points are dropped from the hull", "[ConvexHullBuilder]") {
    PointCloud cloud;
    for (int x : {-1, 1}) {
        for (int y : {-1, 1}) {
            for (int z : {-1, 1}) {
                cloud.emplace_back(x, y, z);
            }
        }
    }
    cloud.emplace_back(0.0, 0.0, 0.0);
    cloud.emplace_back(0.2, -0.3, 0.1);

    ConvexPolyhedron hull = ConvexHullBuilder().build(cloud);

    REQUIRE(hull.vertices.size() == 8);
    REQUIRE(hull.faces.size() == 12);
    for (std::size_t source : hull.source_indices) {
        REQUIRE(source < 8);
    }
    for (const auto& face : hull.faces) {
        for (VertexId v : face.vertices) {
            REQUIRE(v < hull.vertices.size());
        }
    }
    require_outward_faces(hull);
}

TEST_CASE("Fewer than four points are rejected", "[ConvexHullBuilder]") {
    PointCloud cloud = {Point3D(0, 0, 0), Point3D(1, 0, 0), Point3D(0, 1, 0)};
    try {
        ConvexHullBuilder().build(cloud);
        FAIL("expected InsufficientPointsError");
    } catch (const InsufficientPointsError& e) {
        REQUIRE(e.point_count() == 3);
    }
}

TEST_CASE("Lower-dimensional clouds are degenerate", "[ConvexHullBuilder]") {
    ConvexHullBuilder builder;

    PointCloud coincident(5, Point3D(1, 2, 3));
    PointCloud collinear = {Point3D(0, 0, 0), Point3D(1, 1, 1), Point3D(2, 2, 2),
                            Point3D(-3, -3, -3), Point3D(0.5, 0.5, 0.5)};
    PointCloud coplanar = {Point3D(0, 0, 0), Point3D(1, 0, 0), Point3D(0, 1, 0),
                           Point3D(1, 1, 0), Point3D(0.3, 0.7, 0)};

    CHECK(ConvexHullBuilder::affine_dimension({}) == -1);
    CHECK(ConvexHullBuilder::affine_dimension(coincident) == 0);
    CHECK(ConvexHullBuilder::affine_dimension(collinear) == 1);
    CHECK(ConvexHullBuilder::affine_dimension(coplanar) == 2);

    CHECK_THROWS_AS(builder.build(coincident), DegenerateGeometryError);
    CHECK_THROWS_AS(builder.build(collinear), DegenerateGeometryError);
    CHECK_THROWS_AS(builder.build(coplanar), DegenerateGeometryError);
}

TEST_CASE("Points on a great circle are coplanar", "[ConvexHullBuilder]") {
    PointCloud circle;
    for (double theta : {0.0, 1.0, 2.5, 4.0}) {
        circle.push_back(SphericalSampler::spherical_to_cartesian(theta, 3.14159265358979323846 / 2.0));
    }
    REQUIRE_THROWS_AS(ConvexHullBuilder().build(circle), DegenerateGeometryError);
}

TEST_CASE("Four noiseless sphere points either form a hull or report degeneracy", "[ConvexHullBuilder]") {
    SphericalSampler sampler;
    ConvexHullBuilder builder;
    ScaleNormalizer normalizer(10.0);

    for (std::uint64_t seed = 0; seed < 50; ++seed) {
        RandomEngine rng(seed);
        PointCloud cloud = sampler.sample(4, 0.0, rng);
        normalizer.normalize(cloud);

        try {
            ConvexPolyhedron hull = builder.build(cloud);
            REQUIRE(hull.vertices.size() == 4);
            REQUIRE(hull.faces.size() == 4);
        } catch (const DegenerateGeometryError&) {
            SUCCEED("degenerate draw reported");
        }
    }
}
