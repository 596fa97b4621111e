#pragma once

/// @file loader.hpp
/// @brief Reading and writing glTF documents with an external binary buffer

#include "types.hpp"
#include <keyfix/core/error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace keyfix_scene {

/// Output locations for a corrected scene
struct OutputPaths {
    std::filesystem::path metadata;
    std::filesystem::path binary;
};

/// Suffix appended to the input stem when no output path is given
inline constexpr const char* kDefaultOutputSuffix = "_fixed";

/// "<dir>/<stem><suffix>.gltf" and "<dir>/<stem><suffix>.bin" beside the input
[[nodiscard]] OutputPaths default_output_paths(
    const std::filesystem::path& input, const std::string& suffix = kDefaultOutputSuffix);

/// Output paths for an explicit metadata path; the binary gets the same stem
[[nodiscard]] OutputPaths output_paths_for(const std::filesystem::path& metadata);

/// Load a .gltf document and the binary file its first buffer references.
///
/// Fails with FormatError when the document is not valid JSON, misses the
/// accessors/bufferViews/buffers sections, does not hold exactly one buffer with an
/// external uri, or names a binary file that does not exist. Fails with IoError
/// when an existing file cannot be read.
[[nodiscard]] keyfix_core::Result<Scene> load_scene(const std::filesystem::path& metadata_path);

/// Build a Scene from an already parsed document and its buffer payload
[[nodiscard]] keyfix_core::Result<Scene> parse_scene(
    nlohmann::json document,
    std::vector<std::uint8_t> payload,
    const std::filesystem::path& source_path = {});

/// Merge modeled changes (repaired bounds, buffer uri and length) into scene.document
void sync_document(Scene& scene, const std::string& buffer_uri);

/// Write the scene document and its buffer.
///
/// The buffer uri is rewritten to point at output_binary relative to the metadata
/// file. Paths that resolve to either input file are refused.
[[nodiscard]] keyfix_core::Result<void> write_scene(
    Scene& scene,
    const std::filesystem::path& output_metadata,
    const std::filesystem::path& output_binary);

} // namespace keyfix_scene
