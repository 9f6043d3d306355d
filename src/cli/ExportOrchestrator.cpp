/**
 * @file ExportOrchestrator.cpp
 * @brief Implementation of export orchestration
 *
 * Copyright (c) 2025 The DebrisGenerator Authors
 * Licensed under the MIT License.
 */

#include "ExportOrchestrator.hpp"
#include <chrono>
#include <filesystem>
#include <system_error>

namespace debris {

ExportOrchestrator::ExportOrchestrator(const ExportSettings& settings)
    : settings_(settings)
    , logger_("ExportOrchestrator")
{
    logger_.debug("Export orchestrator initialized");
}

ExportOrchestrator::~ExportOrchestrator() = default;

std::uintmax_t ExportOrchestrator::export_mesh(const std::optional<MeshHandle>& mesh) const {
    if (!mesh.has_value()) {
        throw NoMeshGeneratedError();
    }

    auto start_time = std::chrono::high_resolution_clock::now();

    const std::filesystem::path output_path(settings_.output_path);
    if (output_path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(output_path.parent_path(), ec);
        if (ec) {
            throw ExportError("Cannot create directory " + output_path.parent_path().string() +
                              ": " + ec.message());
        }
    }

    STLExporter::Options options;
    options.binary_format = !settings_.ascii_stl;
    options.solid_name = settings_.solid_name;

    STLExporter exporter(options);
    if (!exporter.export_mesh(mesh->mesh(), settings_.output_path)) {
        throw ExportError("Failed to write STL file " + settings_.output_path);
    }

    std::error_code ec;
    const std::uintmax_t bytes = std::filesystem::file_size(output_path, ec);
    if (ec) {
        throw ExportError("Cannot stat " + settings_.output_path + ": " + ec.message());
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::high_resolution_clock::now() - start_time);

    logger_.info("Exported " + std::to_string(mesh->triangles().size()) + " facets to " +
                 settings_.output_path + " (" + std::to_string(bytes) + " bytes, " +
                 (settings_.ascii_stl ? "ASCII" : "binary") + ")");
    logger_.detailed("Export time: " + std::to_string(elapsed.count()) + "ms");

    return bytes;
}

} // namespace debris
