/**
 * @file GenerationErrors.hpp
 * @brief Error taxonomy for debris generation and export
 *
 * Generation errors are terminal for the current attempt: no partial mesh is
 * ever returned. Export errors are reported separately because they are a
 * violation of the caller contract, not a failed random draw.
 */

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace debris {

/**
 * @brief Base class for every failure raised while generating a fragment
 */
class GenerationError : public std::runtime_error {
public:
    explicit GenerationError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief A generation parameter lies outside its documented range
 */
class InvalidParameterError : public GenerationError {
public:
    InvalidParameterError(const std::string& field, const std::string& bound,
                          const std::string& message)
        : GenerationError(message), field_(field), bound_(bound) {}

    /// Name of the offending field (e.g. "vertex_count")
    const std::string& field() const { return field_; }

    /// Human-readable range the field must satisfy (e.g. "[5, 20]")
    const std::string& bound() const { return bound_; }

private:
    std::string field_;
    std::string bound_;
};

/**
 * @brief The sampled points cannot form a solid polyhedron
 *
 * Raised for a zero maximum pairwise distance and for collinear, coplanar or
 * otherwise untriangulable point sets. Callers may retry with a fresh draw.
 */
class DegenerateGeometryError : public GenerationError {
public:
    explicit DegenerateGeometryError(const std::string& message)
        : GenerationError("Degenerate geometry: " + message) {}
};

/**
 * @brief Fewer than four points were handed to hull construction
 */
class InsufficientPointsError : public GenerationError {
public:
    explicit InsufficientPointsError(std::size_t point_count)
        : GenerationError("Convex hull needs at least 4 points, got " +
                          std::to_string(point_count)),
          point_count_(point_count) {}

    std::size_t point_count() const { return point_count_; }

private:
    std::size_t point_count_;
};

/**
 * @brief Failure while writing a mesh to disk
 */
class ExportError : public std::runtime_error {
public:
    explicit ExportError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Export was requested before any mesh had been generated
 */
class NoMeshGeneratedError : public ExportError {
public:
    NoMeshGeneratedError()
        : ExportError("No debris generated yet. Generate a fragment before exporting.") {}
};

} // namespace debris
