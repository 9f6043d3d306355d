/**
 * @file DebrisGenerator.cpp
 * @brief Main implementation of the debris generation pipeline
 */

#include "debris_generator.hpp"
#include "DebrisMesh.hpp"
#include "Logger.hpp"
#include "InputValidator.hpp"
#include "SphericalSampler.hpp"
#include "ScaleNormalizer.hpp"
#include "ConvexHullBuilder.hpp"
#include "MeshAdapter.hpp"
#include <chrono>
#include <sstream>

namespace debris {

namespace {

using Clock = std::chrono::high_resolution_clock;

std::chrono::microseconds elapsed_since(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start);
}

} // namespace

// ============================================================================
// DebrisGenerator::Impl - Private implementation
// ============================================================================

class DebrisGenerator::Impl {
public:
    explicit Impl(const GenerationParameters& parameters)
        : parameters_(parameters),
          logger_("DebrisGenerator"),
          normalizer_(parameters.characteristic_length_mm()) {}

    MeshHandle generate(RandomEngine& rng) {
        auto start_time = Clock::now();

        PerformanceMetrics metrics;
        validation_result_ = {};

        // Reject out-of-range parameters before touching the random source
        InputValidator validator;
        auto validation = validator.validate(parameters_);
        if (validation.has_errors()) {
            logger_.error(validation.format_error_message());
            validation.throw_if_invalid();
        }

        logger_.detailed("Generating fragment: " + std::to_string(parameters_.vertex_count()) +
                         " points, " + std::to_string(parameters_.characteristic_length_mm()) +
                         " mm, irregularity " + std::to_string(parameters_.irregularity()));

        // Stage 1: sampling
        auto stage_start = Clock::now();
        PointCloud cloud = sampler_.sample(parameters_.vertex_count(), parameters_.irregularity(), rng);
        metrics.sampling_time = elapsed_since(stage_start);
        metrics.points_sampled = cloud.size();

        // Stage 2: scaling
        stage_start = Clock::now();
        ScalingResult scaling = normalizer_.normalize(cloud);
        metrics.scaling_time = elapsed_since(stage_start);
        metrics.scale_factor = scaling.scale_factor;

        // Stage 3: convex hull
        stage_start = Clock::now();
        ConvexPolyhedron hull = hull_builder_.build(cloud);
        metrics.hull_time = elapsed_since(stage_start);
        metrics.hull_vertices = hull.vertices.size();
        metrics.hull_faces = hull.faces.size();

        // Stage 4: packaging
        stage_start = Clock::now();
        MeshHandle handle = adapter_.adapt(hull, scaling.achieved_max_distance,
                                           parameters_, cloud.size());
        metrics.packaging_time = elapsed_since(stage_start);

        validation_result_ = handle.mesh().validate_topology();
        if (!validation_result_.is_valid()) {
            std::ostringstream oss;
            oss << "hull failed topology validation (boundary edges: "
                << validation_result_.boundary_edge_count
                << ", non-manifold edges: " << validation_result_.num_non_manifold_edges
                << ", degenerate triangles: " << validation_result_.num_degenerate_triangles
                << ", duplicate vertices: " << validation_result_.num_duplicate_vertices
                << ", Euler characteristic: " << validation_result_.euler_characteristic << ")";
            logger_.warning(oss.str());
            throw DegenerateGeometryError(oss.str());
        }

        metrics.total_time = elapsed_since(start_time);
        metrics_ = metrics;

        logger_.detailed("Hull: " + std::to_string(metrics_.hull_vertices) + " vertices (" +
                         std::to_string(metrics_.points_discarded()) + " interior points dropped), " +
                         std::to_string(metrics_.hull_faces) + " faces");
        logger_.debug("Total generation time: " + std::to_string(metrics_.total_time.count()) + "us");

        return handle;
    }

    const GenerationParameters& get_parameters() const { return parameters_; }
    const PerformanceMetrics& get_metrics() const { return metrics_; }
    const MeshValidationResult& get_validation_result() const { return validation_result_; }

private:
    GenerationParameters parameters_;
    Logger logger_;

    // Pipeline stages
    SphericalSampler sampler_;
    ScaleNormalizer normalizer_;
    ConvexHullBuilder hull_builder_;
    MeshAdapter adapter_;

    PerformanceMetrics metrics_;
    MeshValidationResult validation_result_;
};

// ============================================================================
// DebrisGenerator public interface
// ============================================================================

DebrisGenerator::DebrisGenerator(const GenerationParameters& parameters)
    : impl_(std::make_unique<Impl>(parameters)) {
}

DebrisGenerator::~DebrisGenerator() = default;

MeshHandle DebrisGenerator::generate(RandomEngine& rng) {
    return impl_->generate(rng);
}

const GenerationParameters& DebrisGenerator::get_parameters() const {
    return impl_->get_parameters();
}

const PerformanceMetrics& DebrisGenerator::get_metrics() const {
    return impl_->get_metrics();
}

const MeshValidationResult& DebrisGenerator::get_validation_result() const {
    return impl_->get_validation_result();
}

// ============================================================================
// Factory Functions
// ============================================================================

MeshHandle generate_debris(const GenerationParameters& parameters, RandomEngine& rng) {
    DebrisGenerator generator(parameters);
    return generator.generate(rng);
}

} // namespace debris
