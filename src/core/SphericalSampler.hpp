/**
 * @file SphericalSampler.hpp
 * @brief Seed point generation on a perturbed unit sphere
 */

#pragma once

#include "debris_generator.hpp"
#include "Logger.hpp"

namespace debris {

/**
 * @brief Produces the raw point cloud that gives a fragment its shape
 *
 * Each point is placed on the unit sphere from an azimuth drawn uniformly in
 * [0, 2*pi) and a polar angle drawn uniformly in [0, pi], then displaced on
 * each axis by Gaussian noise with standard deviation equal to the
 * irregularity.
 *
 * @note Drawing the polar angle uniformly (rather than its cosine) clusters
 *       points toward the poles. The generated shapes depend on this law, so
 *       it is kept as is; sampling cos(phi) uniformly would give an
 *       area-uniform distribution.
 */
class SphericalSampler {
public:
    SphericalSampler();

    /**
     * @brief Sample a perturbed sphere
     *
     * Draw order per point: theta, phi, then x/y/z noise. With zero
     * irregularity no noise is drawn.
     *
     * @param vertex_count Number of points to produce
     * @param irregularity Standard deviation of the per-axis noise
     * @param rng Caller-owned random source
     * @return vertex_count points in draw order
     */
    PointCloud sample(int vertex_count, double irregularity, RandomEngine& rng) const;

    /**
     * @brief Place a point on the unit sphere from spherical angles
     */
    static Point3D spherical_to_cartesian(double theta, double phi);

private:
    mutable Logger logger_;
};

} // namespace debris
