/// @file config.hpp
/// @brief Layered configuration for keyfix runs
///
/// Provides layered configuration with:
/// - Built-in defaults
/// - JSON configuration file loading
/// - Environment variables (KEYFIX_*)
/// - Command-line arguments (highest priority)

#pragma once

#include <keyfix/core/error.hpp>
#include <keyfix/repair/corruption.hpp>

#include <spdlog/common.h>

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace keyfix_config {

/// A configuration value
using ConfigValue = std::variant<
    bool,
    std::int64_t,
    double,
    std::string
>;

// =============================================================================
// Config Layer
// =============================================================================

/// Configuration layer priority (lower = higher priority)
enum class ConfigLayerPriority : std::int32_t {
    CommandLine = -1000,    ///< Command-line arguments (highest)
    Environment = -500,     ///< Environment variables
    File = 0,               ///< JSON configuration file
    Default = 1000,         ///< Built-in defaults (lowest)
};

/// A configuration layer
class ConfigLayer {
public:
    explicit ConfigLayer(const std::string& name, ConfigLayerPriority priority = ConfigLayerPriority::File)
        : m_name(name), m_priority(priority) {}

    [[nodiscard]] const std::string& name() const { return m_name; }

    [[nodiscard]] ConfigLayerPriority priority() const { return m_priority; }

    [[nodiscard]] bool contains(const std::string& key) const;

    [[nodiscard]] std::optional<ConfigValue> get(const std::string& key) const;

    void set(const std::string& key, ConfigValue value);

    bool remove(const std::string& key);

    [[nodiscard]] std::vector<std::string> keys() const;

    [[nodiscard]] std::size_t size() const { return m_values.size(); }

    [[nodiscard]] bool empty() const { return m_values.empty(); }

private:
    std::string m_name;
    ConfigLayerPriority m_priority;
    std::map<std::string, ConfigValue> m_values;
};

// =============================================================================
// Run Options
// =============================================================================

/// Everything a single repair run needs, resolved from the merged configuration
struct RunOptions {
    std::filesystem::path input;
    std::optional<std::filesystem::path> output_metadata;
    std::optional<std::filesystem::path> output_binary;
    std::string output_suffix;
    std::optional<std::filesystem::path> report_path;
    spdlog::level::level_enum log_level = spdlog::level::info;
    std::optional<std::filesystem::path> log_directory;
    keyfix_repair::RepairConfig repair;
};

// =============================================================================
// Config Manager
// =============================================================================

/// Layered configuration manager
class ConfigManager {
public:
    ConfigManager() = default;
    ~ConfigManager() = default;

    // Non-copyable
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    // =========================================================================
    // Layer Management
    // =========================================================================

    [[nodiscard]] ConfigLayer* get_layer(const std::string& name);
    [[nodiscard]] const ConfigLayer* get_layer(const std::string& name) const;

    [[nodiscard]] std::size_t layer_count() const;

    // =========================================================================
    // Value Access (Merged View)
    // =========================================================================

    [[nodiscard]] bool contains(const std::string& key) const;

    /// Get value from the highest priority layer that contains it
    [[nodiscard]] std::optional<ConfigValue> get(const std::string& key) const;

    [[nodiscard]] bool get_bool(const std::string& key, bool default_value = false) const;

    [[nodiscard]] std::int64_t get_int(const std::string& key, std::int64_t default_value = 0) const;

    [[nodiscard]] double get_float(const std::string& key, double default_value = 0.0) const;

    [[nodiscard]] std::string get_string(const std::string& key, const std::string& default_value = "") const;

    /// Set value in a layer, creating the layer if needed
    void set(const std::string& key, ConfigValue value, const std::string& layer_name = "file");

    // =========================================================================
    // Sources
    // =========================================================================

    /// Load a JSON file into a layer; nested objects flatten to dotted keys
    keyfix_core::Result<void> load_json(const std::filesystem::path& path, const std::string& layer_name = "file");

    /// Parse command-line arguments (argv[0] skipped)
    keyfix_core::Result<void> parse_args(int argc, char** argv);

    /// Parse command-line arguments from vector
    keyfix_core::Result<void> parse_args(const std::vector<std::string>& args);

    /// Arguments that were not options, in order
    [[nodiscard]] const std::vector<std::string>& positional() const { return m_positional; }

    /// Load KEYFIX_* environment variables
    void load_environment();

    // =========================================================================
    // Defaults
    // =========================================================================

    /// Create the default layers and fill in built-in defaults
    void setup_defaults();

    // =========================================================================
    // Conversion
    // =========================================================================

    /// Engine parameters from current values; fails with ValidationError
    [[nodiscard]] keyfix_core::Result<keyfix_repair::RepairConfig> build_repair_config() const;

    /// Full run options; positional[0] is the input, positional[1] the optional output
    [[nodiscard]] keyfix_core::Result<RunOptions> build_run_options() const;

private:
    /// Layers sorted by priority (highest to lowest); caller holds m_mutex
    [[nodiscard]] std::vector<const ConfigLayer*> sorted_layers() const;

    ConfigLayer* find_or_create_layer(const std::string& name, ConfigLayerPriority priority);

private:
    std::vector<std::unique_ptr<ConfigLayer>> m_layers;
    std::vector<std::string> m_positional;
    mutable std::mutex m_mutex;
};

/// Parse a command-line or environment string into the narrowest value type
[[nodiscard]] ConfigValue parse_value(const std::string& text);

// =============================================================================
// Config Keys (Constants)
// =============================================================================

namespace config_keys {

constexpr const char* REPAIR_FRAME_RATE = "repair.frame_rate";
constexpr const char* REPAIR_CORRUPTION_THRESHOLD = "repair.corruption_threshold";

constexpr const char* OUTPUT_METADATA_PATH = "output.metadata_path";
constexpr const char* OUTPUT_BINARY_PATH = "output.binary_path";
constexpr const char* OUTPUT_SUFFIX = "output.suffix";

constexpr const char* REPORT_PATH = "report.path";
constexpr const char* LOG_LEVEL = "log.level";
/// Directory for a rotating keyfix.log; empty disables file logging
constexpr const char* LOG_DIRECTORY = "log.directory";

/// Path of a JSON config file to merge below the command line
constexpr const char* CONFIG_FILE = "config";

} // namespace config_keys

} // namespace keyfix_config
