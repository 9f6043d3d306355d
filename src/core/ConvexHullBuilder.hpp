/**
 * @file ConvexHullBuilder.hpp
 * @brief Convex hull extraction using CGAL
 *
 * Wraps CGAL::convex_hull_3 with exact predicates so near-coplanar and
 * duplicate points are handled robustly, and converts the result into an
 * indexed triangle list over the hull vertices only.
 */

#pragma once

#include "debris_generator.hpp"
#include "Logger.hpp"

namespace debris {

/**
 * @brief Computes the closed convex polyhedron spanned by a point cloud
 */
class ConvexHullBuilder {
public:
    /// Hulls whose volume is below this fraction of (max distance)^3 are rejected
    static constexpr double min_relative_volume = 1e-12;

    ConvexHullBuilder();

    /**
     * @brief Build the convex hull of a scaled point cloud
     *
     * Points that are not extreme are dropped, so the hull can have fewer
     * vertices than the cloud. Faces are oriented outward.
     *
     * @param cloud Scaled cloud with at least 4 points
     * @return Hull vertices, faces indexing into them, and source indices
     * @throws InsufficientPointsError if the cloud has fewer than 4 points
     * @throws DegenerateGeometryError if the points are collinear, coplanar
     *         or the hull is not a closed triangulated solid
     */
    ConvexPolyhedron build(const PointCloud& cloud) const;

    /**
     * @brief Dimension of the affine hull of the cloud (0 to 3)
     *
     * Uses exact orientation predicates; -1 for an empty cloud.
     */
    static int affine_dimension(const PointCloud& cloud);

private:
    mutable Logger logger_;
};

} // namespace debris
