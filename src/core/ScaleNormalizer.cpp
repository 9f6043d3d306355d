/**
 * @file ScaleNormalizer.cpp
 * @brief Implementation of characteristic-length scaling
 */

#include "ScaleNormalizer.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace debris {

ScaleNormalizer::ScaleNormalizer(double characteristic_length_mm)
    : characteristic_length_mm_(characteristic_length_mm), logger_("ScaleNormalizer") {}

Eigen::MatrixXd ScaleNormalizer::distance_matrix(const PointCloud& cloud) {
    const Eigen::Index n = static_cast<Eigen::Index>(cloud.size());

    Eigen::Matrix<double, Eigen::Dynamic, 3> points(n, 3);
    for (Eigen::Index i = 0; i < n; ++i) {
        points.row(i) = cloud[static_cast<size_t>(i)].to_eigen().transpose();
    }

    Eigen::MatrixXd distances = Eigen::MatrixXd::Zero(n, n);
    for (Eigen::Index i = 0; i < n; ++i) {
        for (Eigen::Index j = i + 1; j < n; ++j) {
            const double d = (points.row(i) - points.row(j)).norm();
            distances(i, j) = d;
            distances(j, i) = d;
        }
    }
    return distances;
}

double ScaleNormalizer::max_pairwise_distance(const PointCloud& cloud) {
    if (cloud.size() < 2) {
        return 0.0;
    }
    return distance_matrix(cloud).maxCoeff();
}

ScalingResult ScaleNormalizer::normalize(PointCloud& cloud) const {
    const double raw_max = max_pairwise_distance(cloud);

    if (!(raw_max > 0.0) || !std::isfinite(raw_max)) {
        std::ostringstream oss;
        oss << "maximum pairwise distance is " << raw_max << " across "
            << cloud.size() << " points; cannot scale to "
            << characteristic_length_mm_ << " mm";
        logger_.error(oss.str());
        throw DegenerateGeometryError(oss.str());
    }

    const double scale_factor = characteristic_length_mm_ / raw_max;

    for (auto& point : cloud) {
        point = Point3D(point.x() * scale_factor,
                        point.y() * scale_factor,
                        point.z() * scale_factor);
    }

    const double achieved = max_pairwise_distance(cloud);

    std::ostringstream explanation;
    explanation << std::setprecision(10);
    explanation << "Scaling " << cloud.size() << " points to characteristic length\n";
    explanation << "  Calculation: " << characteristic_length_mm_ << "mm / "
                << raw_max << " = " << scale_factor << " mm/unit\n";
    explanation << "  Result: max pairwise distance " << achieved << "mm";

    logger_.detailed(explanation.str());
    return ScalingResult(scale_factor, raw_max, achieved, explanation.str());
}

} // namespace debris
