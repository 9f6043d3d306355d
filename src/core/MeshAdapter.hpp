/**
 * @file MeshAdapter.hpp
 * @brief Packages a convex polyhedron into an exportable mesh handle
 */

#pragma once

#include "debris_generator.hpp"
#include "DebrisMesh.hpp"
#include "Logger.hpp"

namespace debris {

/**
 * @brief Final generation stage: hull data to MeshHandle
 *
 * Performs no geometry beyond checking that every face index names a hull
 * vertex.
 */
class MeshAdapter {
public:
    MeshAdapter();

    /**
     * @brief Wrap hull vertices and faces into a handle
     *
     * @param polyhedron Output of ConvexHullBuilder
     * @param achieved_characteristic_length Max pairwise distance after scaling
     * @param parameters Parameters that produced the hull
     * @param sampled_point_count Size of the cloud the hull was built from
     * @throws DegenerateGeometryError if a face index is out of range or the
     *         polyhedron has no faces
     */
    MeshHandle adapt(const ConvexPolyhedron& polyhedron,
                     double achieved_characteristic_length,
                     const GenerationParameters& parameters,
                     size_t sampled_point_count) const;

private:
    mutable Logger logger_;
};

} // namespace debris
