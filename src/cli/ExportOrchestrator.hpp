/**
 * @file ExportOrchestrator.hpp
 * @brief Orchestrates export of the most recent debris fragment
 *
 * Keeps file output out of the generator: the caller owns the last
 * MeshHandle and passes it here explicitly.
 *
 * Copyright (c) 2025 The DebrisGenerator Authors
 * Licensed under the MIT License.
 */

#pragma once

#include "debris_generator.hpp"
#include "../core/DebrisMesh.hpp"
#include "../core/Logger.hpp"
#include "../export/STLExporter.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace debris {

/**
 * @brief Export settings taken from the run configuration
 */
struct ExportSettings {
    std::string output_path = "debris.stl";
    bool ascii_stl = false;
    std::string solid_name = "debris";

    static ExportSettings from_config(const DebrisConfig& config) {
        ExportSettings settings;
        settings.output_path = config.output_path;
        settings.ascii_stl = config.ascii_stl;
        settings.solid_name = config.solid_name;
        return settings;
    }
};

/**
 * @brief Writes the caller's current fragment as STL
 */
class ExportOrchestrator {
public:
    explicit ExportOrchestrator(const ExportSettings& settings);
    ~ExportOrchestrator();

    /**
     * @brief Export the fragment to the configured path
     *
     * Missing parent directories are created.
     *
     * @param mesh Most recent fragment, or nullopt if none was generated
     * @return Number of bytes written
     * @throws NoMeshGeneratedError if mesh is empty; nothing is written
     * @throws ExportError if the file cannot be written
     */
    std::uintmax_t export_mesh(const std::optional<MeshHandle>& mesh) const;

private:
    ExportSettings settings_;
    mutable Logger logger_;

    ExportOrchestrator(const ExportOrchestrator&) = delete;
    ExportOrchestrator& operator=(const ExportOrchestrator&) = delete;
    ExportOrchestrator(ExportOrchestrator&&) = delete;
    ExportOrchestrator& operator=(ExportOrchestrator&&) = delete;
};

} // namespace debris
