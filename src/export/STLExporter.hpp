/**
 * @file STLExporter.hpp
 * @brief STL writer for debris meshes
 */

#pragma once

#include "debris_generator.hpp"
#include "core/DebrisMesh.hpp"
#include "core/Logger.hpp"
#include <cstdint>
#include <string>

namespace debris {

/**
 * @brief Writes a mesh as binary or ASCII STL
 *
 * Coordinates are written as generated (millimetres). Each facet carries the
 * unit normal of its vertex winding.
 */
class STLExporter {
public:
    struct Options {
        bool binary_format = true;
        std::string solid_name = "debris";
    };

    /// Size of a binary STL file header plus triangle count
    static constexpr std::uint64_t binary_header_bytes = 84;
    /// Size of one binary STL facet record
    static constexpr std::uint64_t binary_facet_bytes = 50;

    STLExporter();
    explicit STLExporter(const Options& options);

    /**
     * @brief Write the mesh to filename
     * @return false if the file could not be opened or written
     */
    bool export_mesh(const DebrisMesh& mesh, const std::string& filename) const;

    const Options& get_options() const { return options_; }

    /**
     * @brief Unit normal from the cross product of the ordered triangle edges
     *
     * Zero vector for a degenerate triangle.
     */
    static Vector3D facet_normal(const Point3D& v0, const Point3D& v1, const Point3D& v2);

private:
    bool write_ascii_stl(const DebrisMesh& mesh, const std::string& filename) const;
    bool write_binary_stl(const DebrisMesh& mesh, const std::string& filename) const;

    std::string solid_name() const;

    Options options_;
    mutable Logger logger_;
};

} // namespace debris
