/**
 * @file ScaleNormalizer.hpp
 * @brief Isotropic scaling of a point cloud to a characteristic length
 *
 * The characteristic length of a shape is the largest pairwise distance
 * between its points. Scaling every coordinate by one positive factor scales
 * every distance by that factor, so the scaled cloud has exactly the requested
 * characteristic length (up to rounding).
 */

#pragma once

#include "debris_generator.hpp"
#include "Logger.hpp"
#include <Eigen/Dense>
#include <string>

namespace debris {

/**
 * @brief Result of a scaling calculation
 */
struct ScalingResult {
    double scale_factor;           // Applied factor (mm per unit)
    double raw_max_distance;       // Max pairwise distance before scaling
    double achieved_max_distance;  // Max pairwise distance after scaling (mm)
    std::string explanation;       // Detailed explanation of calculation

    ScalingResult(double scale, double raw, double achieved, const std::string& explain)
        : scale_factor(scale), raw_max_distance(raw),
          achieved_max_distance(achieved), explanation(explain) {}
};

/**
 * @brief Rescales a point cloud so its maximum pairwise distance matches a target
 */
class ScaleNormalizer {
public:
    explicit ScaleNormalizer(double characteristic_length_mm);

    /**
     * @brief Scale the cloud in place
     *
     * Point order is preserved.
     *
     * @param cloud Raw cloud; replaced by the scaled cloud
     * @return Scaling result with the achieved maximum distance
     * @throws DegenerateGeometryError if all points coincide
     */
    ScalingResult normalize(PointCloud& cloud) const;

    /**
     * @brief Full symmetric pairwise distance matrix with zero diagonal
     */
    static Eigen::MatrixXd distance_matrix(const PointCloud& cloud);

    /**
     * @brief Largest entry of distance_matrix(); 0 for fewer than two points
     */
    static double max_pairwise_distance(const PointCloud& cloud);

private:
    double characteristic_length_mm_;
    Logger logger_;
};

} // namespace debris
