/**
 * @file STLExporter.cpp
 * @brief Implementation of binary and ASCII STL output
 */

#include "STLExporter.hpp"
#include <algorithm>
#include <cstring>
#include <fstream>
#include <iomanip>

namespace debris {

STLExporter::STLExporter()
    : logger_("STLExporter") {}

STLExporter::STLExporter(const Options& options)
    : options_(options), logger_("STLExporter") {}

bool STLExporter::export_mesh(const DebrisMesh& mesh, const std::string& filename) const {
    logger_.debug("Writing " + std::to_string(mesh.num_triangles()) + " facets to " + filename +
                  (options_.binary_format ? " (binary)" : " (ASCII)"));

    if (options_.binary_format) {
        return write_binary_stl(mesh, filename);
    } else {
        return write_ascii_stl(mesh, filename);
    }
}

Vector3D STLExporter::facet_normal(const Point3D& v0, const Point3D& v1, const Point3D& v2) {
    Vector3D edge1(v0, v1);
    Vector3D edge2(v0, v2);
    Vector3D normal = edge1.cross(edge2);

    double length = normal.length();
    if (length > 1e-12) {
        return Vector3D(normal.x() / length, normal.y() / length, normal.z() / length);
    }
    return Vector3D(0.0, 0.0, 0.0);
}

std::string STLExporter::solid_name() const {
    return options_.solid_name.empty() ? "debris" : options_.solid_name;
}

bool STLExporter::write_ascii_stl(const DebrisMesh& mesh, const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        logger_.error("Cannot open " + filename + " for writing");
        return false;
    }

    file << std::fixed << std::setprecision(6);
    file << "solid " << solid_name() << "\n";

    for (const auto& triangle : mesh.triangles()) {
        const auto& v0 = mesh.get_vertex(triangle.vertices[0]);
        const auto& v1 = mesh.get_vertex(triangle.vertices[1]);
        const auto& v2 = mesh.get_vertex(triangle.vertices[2]);
        const Vector3D normal = facet_normal(v0, v1, v2);

        file << "  facet normal " << normal.x() << " " << normal.y() << " " << normal.z() << "\n";
        file << "    outer loop\n";
        file << "      vertex " << v0.x() << " " << v0.y() << " " << v0.z() << "\n";
        file << "      vertex " << v1.x() << " " << v1.y() << " " << v1.z() << "\n";
        file << "      vertex " << v2.x() << " " << v2.y() << " " << v2.z() << "\n";
        file << "    endloop\n";
        file << "  endfacet\n";
    }

    file << "endsolid " << solid_name() << std::endl;
    return static_cast<bool>(file);
}

bool STLExporter::write_binary_stl(const DebrisMesh& mesh, const std::string& filename) const {
    std::ofstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        logger_.error("Cannot open " + filename + " for writing");
        return false;
    }

    // Write 80-byte header; must not start with "solid"
    char header[80] = {0};
    std::string header_text = "Binary STL - debris fragment " + solid_name();
    std::strncpy(header, header_text.c_str(), std::min(header_text.length(), size_t(79)));
    file.write(header, 80);

    // Fields are written in host byte order; STL requires little-endian
    uint32_t triangle_count = static_cast<uint32_t>(mesh.num_triangles());
    file.write(reinterpret_cast<const char*>(&triangle_count), sizeof(uint32_t));

    for (const auto& triangle : mesh.triangles()) {
        const auto& v0 = mesh.get_vertex(triangle.vertices[0]);
        const auto& v1 = mesh.get_vertex(triangle.vertices[1]);
        const auto& v2 = mesh.get_vertex(triangle.vertices[2]);
        const Vector3D n = facet_normal(v0, v1, v2);

        // Normal (12 bytes)
        float normal[3] = {
            static_cast<float>(n.x()), static_cast<float>(n.y()), static_cast<float>(n.z())
        };
        file.write(reinterpret_cast<const char*>(normal), 12);

        // Vertices (36 bytes)
        float vertices[9] = {
            static_cast<float>(v0.x()), static_cast<float>(v0.y()), static_cast<float>(v0.z()),
            static_cast<float>(v1.x()), static_cast<float>(v1.y()), static_cast<float>(v1.z()),
            static_cast<float>(v2.x()), static_cast<float>(v2.y()), static_cast<float>(v2.z())
        };
        file.write(reinterpret_cast<const char*>(vertices), 36);

        // Attribute byte count (2 bytes)
        uint16_t attributes = 0;
        file.write(reinterpret_cast<const char*>(&attributes), 2);
    }

    return static_cast<bool>(file);
}

} // namespace debris
