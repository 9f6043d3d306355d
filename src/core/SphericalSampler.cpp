/**
 * @file SphericalSampler.cpp
 * @brief Implementation of perturbed sphere sampling
 */

#include "SphericalSampler.hpp"
#include <cmath>
#include <sstream>

namespace debris {

namespace {
constexpr double kPi = 3.14159265358979323846;
}

SphericalSampler::SphericalSampler()
    : logger_("SphericalSampler") {}

Point3D SphericalSampler::spherical_to_cartesian(double theta, double phi) {
    return Point3D(std::sin(phi) * std::cos(theta),
                   std::sin(phi) * std::sin(theta),
                   std::cos(phi));
}

PointCloud SphericalSampler::sample(int vertex_count, double irregularity, RandomEngine& rng) const {
    PointCloud cloud;
    if (vertex_count <= 0) {
        return cloud;
    }
    cloud.reserve(static_cast<size_t>(vertex_count));

    std::uniform_real_distribution<double> dist_theta(0.0, 2.0 * kPi);
    std::uniform_real_distribution<double> dist_phi(0.0, kPi);

    // normal_distribution requires a positive sigma
    const bool perturb = irregularity > 0.0;
    std::normal_distribution<double> noise(0.0, perturb ? irregularity : 1.0);

    for (int i = 0; i < vertex_count; ++i) {
        const double theta = dist_theta(rng);
        const double phi = dist_phi(rng);
        Point3D point = spherical_to_cartesian(theta, phi);

        if (perturb) {
            const double dx = noise(rng);
            const double dy = noise(rng);
            const double dz = noise(rng);
            point = Point3D(point.x() + dx, point.y() + dy, point.z() + dz);
        }

        if (logger_.shouldOutput(LogLevel::TRACE)) {
            std::ostringstream oss;
            oss << "Point " << i << ": theta=" << theta << " phi=" << phi
                << " -> (" << point.x() << ", " << point.y() << ", " << point.z() << ")";
            logger_.trace(oss.str());
        }

        cloud.push_back(point);
    }

    logger_.debug("Sampled " + std::to_string(cloud.size()) +
                  " points with irregularity " + std::to_string(irregularity));
    return cloud;
}

} // namespace debris
