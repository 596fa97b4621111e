/// @file config.cpp
/// @brief Configuration system implementation for keyfix

#include <keyfix/config/config.hpp>
#include <keyfix/core/log.hpp>
#include <keyfix/scene/loader.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace keyfix_config {

// =============================================================================
// ConfigLayer
// =============================================================================

bool ConfigLayer::contains(const std::string& key) const {
    return m_values.find(key) != m_values.end();
}

std::optional<ConfigValue> ConfigLayer::get(const std::string& key) const {
    auto it = m_values.find(key);
    if (it != m_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

void ConfigLayer::set(const std::string& key, ConfigValue value) {
    m_values[key] = std::move(value);
}

bool ConfigLayer::remove(const std::string& key) {
    return m_values.erase(key) > 0;
}

std::vector<std::string> ConfigLayer::keys() const {
    std::vector<std::string> result;
    result.reserve(m_values.size());
    for (const auto& [key, _] : m_values) {
        result.push_back(key);
    }
    return result;
}

// =============================================================================
// Value Parsing
// =============================================================================

namespace {

std::optional<std::int64_t> parse_int(const std::string& text) {
    if (text.empty()) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(text.c_str(), &end, 10);
    if (errno != 0 || end != text.c_str() + text.size()) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(value);
}

std::optional<double> parse_double(const std::string& text) {
    if (text.empty()) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (errno != 0 || end != text.c_str() + text.size()) {
        return std::nullopt;
    }
    return value;
}

/// Numeric value of a key; present but not a number is a ValidationError
keyfix_core::Result<double> numeric_value(
    const std::optional<ConfigValue>& value, const std::string& key, double default_value) {
    if (!value) {
        return keyfix_core::Ok(default_value);
    }
    if (auto* v = std::get_if<double>(&*value)) {
        return keyfix_core::Ok(*v);
    }
    if (auto* v = std::get_if<std::int64_t>(&*value)) {
        return keyfix_core::Ok(static_cast<double>(*v));
    }
    if (auto* v = std::get_if<std::string>(&*value)) {
        if (auto parsed = parse_double(*v)) {
            return keyfix_core::Ok(*parsed);
        }
        return keyfix_core::Err<double>(keyfix_core::Error(keyfix_core::ErrorCode::ValidationError,
            key + " must be a number, got '" + *v + "'"));
    }
    return keyfix_core::Err<double>(keyfix_core::Error(keyfix_core::ErrorCode::ValidationError,
        key + " must be a number"));
}

/// Short option names accepted on the command line
const std::map<std::string, std::string>& option_aliases() {
    static const std::map<std::string, std::string> aliases = {
        {"frame-rate", config_keys::REPAIR_FRAME_RATE},
        {"fps", config_keys::REPAIR_FRAME_RATE},
        {"threshold", config_keys::REPAIR_CORRUPTION_THRESHOLD},
        {"output", config_keys::OUTPUT_METADATA_PATH},
        {"binary", config_keys::OUTPUT_BINARY_PATH},
        {"suffix", config_keys::OUTPUT_SUFFIX},
        {"report", config_keys::REPORT_PATH},
        {"log-level", config_keys::LOG_LEVEL},
        {"log-dir", config_keys::LOG_DIRECTORY},
        {"config", config_keys::CONFIG_FILE},
    };
    return aliases;
}

/// "--repair-frame-rate" -> "repair.frame_rate": first '-' separates the section
std::string option_to_key(const std::string& option) {
    auto alias = option_aliases().find(option);
    if (alias != option_aliases().end()) {
        return alias->second;
    }
    if (option.find('.') != std::string::npos) {
        return option;
    }
    std::string key = option;
    auto first = key.find('-');
    if (first != std::string::npos) {
        key[first] = '.';
        std::replace(key.begin() + static_cast<std::ptrdiff_t>(first) + 1, key.end(), '-', '_');
    }
    return key;
}

/// Flatten nested JSON objects into dotted keys
keyfix_core::Result<void> flatten_json(const nlohmann::json& j, const std::string& prefix, ConfigLayer& layer) {
    for (const auto& [name, value] : j.items()) {
        std::string key = prefix.empty() ? name : prefix + "." + name;
        if (value.is_object()) {
            auto nested = flatten_json(value, key, layer);
            if (!nested) {
                return nested;
            }
        } else if (value.is_boolean()) {
            layer.set(key, ConfigValue{value.get<bool>()});
        } else if (value.is_number_integer()) {
            layer.set(key, ConfigValue{value.get<std::int64_t>()});
        } else if (value.is_number_float()) {
            layer.set(key, ConfigValue{value.get<double>()});
        } else if (value.is_string()) {
            layer.set(key, ConfigValue{value.get<std::string>()});
        } else {
            return keyfix_core::Error(keyfix_core::ErrorCode::ParseError,
                "Unsupported value type for config key '" + key + "'");
        }
    }
    return keyfix_core::Ok();
}

} // anonymous namespace

ConfigValue parse_value(const std::string& text) {
    if (text == "true" || text == "false") {
        return ConfigValue{text == "true"};
    }
    if (auto i = parse_int(text)) {
        return ConfigValue{*i};
    }
    if (auto d = parse_double(text)) {
        return ConfigValue{*d};
    }
    return ConfigValue{text};
}

// =============================================================================
// ConfigManager
// =============================================================================

ConfigLayer* ConfigManager::get_layer(const std::string& name) {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto& layer : m_layers) {
        if (layer->name() == name) {
            return layer.get();
        }
    }
    return nullptr;
}

const ConfigLayer* ConfigManager::get_layer(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& layer : m_layers) {
        if (layer->name() == name) {
            return layer.get();
        }
    }
    return nullptr;
}

std::size_t ConfigManager::layer_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_layers.size();
}

ConfigLayer* ConfigManager::find_or_create_layer(const std::string& name, ConfigLayerPriority priority) {
    for (auto& layer : m_layers) {
        if (layer->name() == name) {
            return layer.get();
        }
    }
    m_layers.push_back(std::make_unique<ConfigLayer>(name, priority));
    return m_layers.back().get();
}

std::vector<const ConfigLayer*> ConfigManager::sorted_layers() const {
    std::vector<const ConfigLayer*> result;
    result.reserve(m_layers.size());
    for (const auto& layer : m_layers) {
        result.push_back(layer.get());
    }
    std::stable_sort(result.begin(), result.end(), [](const ConfigLayer* a, const ConfigLayer* b) {
        return static_cast<std::int32_t>(a->priority()) < static_cast<std::int32_t>(b->priority());
    });
    return result;
}

bool ConfigManager::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& layer : m_layers) {
        if (layer->contains(key)) {
            return true;
        }
    }
    return false;
}

std::optional<ConfigValue> ConfigManager::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto* layer : sorted_layers()) {
        auto value = layer->get(key);
        if (value) {
            return value;
        }
    }
    return std::nullopt;
}

bool ConfigManager::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    if (auto* v = std::get_if<bool>(&*value)) {
        return *v;
    }
    if (auto* v = std::get_if<std::string>(&*value)) {
        return *v == "true" || *v == "1" || *v == "yes";
    }
    if (auto* v = std::get_if<std::int64_t>(&*value)) {
        return *v != 0;
    }

    return default_value;
}

std::int64_t ConfigManager::get_int(const std::string& key, std::int64_t default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    if (auto* v = std::get_if<std::int64_t>(&*value)) {
        return *v;
    }
    if (auto* v = std::get_if<std::string>(&*value)) {
        return parse_int(*v).value_or(default_value);
    }
    if (auto* v = std::get_if<double>(&*value)) {
        return static_cast<std::int64_t>(*v);
    }
    if (auto* v = std::get_if<bool>(&*value)) {
        return *v ? 1 : 0;
    }

    return default_value;
}

double ConfigManager::get_float(const std::string& key, double default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    if (auto* v = std::get_if<double>(&*value)) {
        return *v;
    }
    if (auto* v = std::get_if<std::int64_t>(&*value)) {
        return static_cast<double>(*v);
    }
    if (auto* v = std::get_if<std::string>(&*value)) {
        return parse_double(*v).value_or(default_value);
    }

    return default_value;
}

std::string ConfigManager::get_string(const std::string& key, const std::string& default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    if (auto* v = std::get_if<std::string>(&*value)) {
        return *v;
    }
    if (auto* v = std::get_if<bool>(&*value)) {
        return *v ? "true" : "false";
    }
    if (auto* v = std::get_if<std::int64_t>(&*value)) {
        return std::to_string(*v);
    }
    if (auto* v = std::get_if<double>(&*value)) {
        std::ostringstream oss;
        oss << *v;
        return oss.str();
    }

    return default_value;
}

void ConfigManager::set(const std::string& key, ConfigValue value, const std::string& layer_name) {
    std::lock_guard<std::mutex> lock(m_mutex);
    find_or_create_layer(layer_name, ConfigLayerPriority::File)->set(key, std::move(value));
}

keyfix_core::Result<void> ConfigManager::load_json(const std::filesystem::path& path, const std::string& layer_name) {
    std::ifstream file(path);
    if (!file) {
        return keyfix_core::Error(keyfix_core::IoError::open_failed(path.string()));
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        return keyfix_core::Error(keyfix_core::ErrorCode::ParseError,
            "JSON parse error in " + path.string() + ": " + e.what());
    }

    if (!j.is_object()) {
        return keyfix_core::Error(keyfix_core::ErrorCode::ParseError,
            "Config file root must be an object: " + path.string());
    }

    ConfigLayer parsed(layer_name, ConfigLayerPriority::File);
    auto flattened = flatten_json(j, "", parsed);
    if (!flattened) {
        return flattened;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    ConfigLayer* layer = find_or_create_layer(layer_name, ConfigLayerPriority::File);
    for (const auto& key : parsed.keys()) {
        if (auto value = parsed.get(key)) {
            layer->set(key, std::move(*value));
        }
    }

    keyfix_core::config_logger()->debug("Loaded {} keys from {}", parsed.size(), path.string());
    return keyfix_core::Ok();
}

keyfix_core::Result<void> ConfigManager::parse_args(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parse_args(args);
}

keyfix_core::Result<void> ConfigManager::parse_args(const std::vector<std::string>& args) {
    std::lock_guard<std::mutex> lock(m_mutex);
    ConfigLayer* layer = find_or_create_layer("cmdline", ConfigLayerPriority::CommandLine);

    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];

        if (arg.starts_with("--")) {
            std::string key_value = arg.substr(2);
            auto eq_pos = key_value.find('=');

            std::string option;
            std::string value;

            if (eq_pos != std::string::npos) {
                option = key_value.substr(0, eq_pos);
                value = key_value.substr(eq_pos + 1);
            } else if (i + 1 < args.size() && !args[i + 1].starts_with("--")) {
                option = key_value;
                value = args[++i];
            } else {
                option = key_value;
                value = "true";
            }

            if (option.empty()) {
                return keyfix_core::Error(keyfix_core::ErrorCode::InvalidArgument, "Empty option name in '" + arg + "'");
            }

            std::string key = option_to_key(option);
            // Paths stay strings even when they look numeric
            if (key == config_keys::OUTPUT_METADATA_PATH || key == config_keys::OUTPUT_BINARY_PATH ||
                key == config_keys::OUTPUT_SUFFIX || key == config_keys::REPORT_PATH ||
                key == config_keys::LOG_DIRECTORY || key == config_keys::CONFIG_FILE) {
                layer->set(key, ConfigValue{value});
            } else {
                layer->set(key, parse_value(value));
            }
        } else if (arg.size() > 1 && arg[0] == '-' && !parse_double(arg)) {
            return keyfix_core::Error(keyfix_core::ErrorCode::InvalidArgument, "Unknown option: " + arg);
        } else {
            m_positional.push_back(arg);
        }
    }

    return keyfix_core::Ok();
}

void ConfigManager::load_environment() {
    static const std::vector<std::pair<std::string, std::string>> env_mappings = {
        {"KEYFIX_FRAME_RATE", config_keys::REPAIR_FRAME_RATE},
        {"KEYFIX_CORRUPTION_THRESHOLD", config_keys::REPAIR_CORRUPTION_THRESHOLD},
        {"KEYFIX_OUTPUT_SUFFIX", config_keys::OUTPUT_SUFFIX},
        {"KEYFIX_LOG_LEVEL", config_keys::LOG_LEVEL},
        {"KEYFIX_LOG_DIR", config_keys::LOG_DIRECTORY},
    };

    std::lock_guard<std::mutex> lock(m_mutex);
    ConfigLayer* layer = find_or_create_layer("environment", ConfigLayerPriority::Environment);

    for (const auto& [env_name, config_key] : env_mappings) {
        const char* value = std::getenv(env_name.c_str());
        if (value) {
            layer->set(config_key, ConfigValue{std::string(value)});
        }
    }
}

void ConfigManager::setup_defaults() {
    std::lock_guard<std::mutex> lock(m_mutex);
    find_or_create_layer("cmdline", ConfigLayerPriority::CommandLine);
    find_or_create_layer("environment", ConfigLayerPriority::Environment);
    find_or_create_layer("file", ConfigLayerPriority::File);
    ConfigLayer* defaults = find_or_create_layer("defaults", ConfigLayerPriority::Default);

    defaults->set(config_keys::REPAIR_FRAME_RATE, ConfigValue{keyfix_repair::kDefaultFrameRate});
    defaults->set(config_keys::REPAIR_CORRUPTION_THRESHOLD, ConfigValue{keyfix_repair::kDefaultCorruptionThreshold});
    defaults->set(config_keys::OUTPUT_SUFFIX, ConfigValue{std::string(keyfix_scene::kDefaultOutputSuffix)});
    defaults->set(config_keys::LOG_LEVEL, ConfigValue{std::string("info")});
}

keyfix_core::Result<keyfix_repair::RepairConfig> ConfigManager::build_repair_config() const {
    keyfix_repair::RepairConfig config;

    auto frame_rate = numeric_value(
        get(config_keys::REPAIR_FRAME_RATE), config_keys::REPAIR_FRAME_RATE, keyfix_repair::kDefaultFrameRate);
    if (!frame_rate) {
        return keyfix_core::Err<keyfix_repair::RepairConfig>(frame_rate.error());
    }
    auto threshold = numeric_value(get(config_keys::REPAIR_CORRUPTION_THRESHOLD),
        config_keys::REPAIR_CORRUPTION_THRESHOLD, keyfix_repair::kDefaultCorruptionThreshold);
    if (!threshold) {
        return keyfix_core::Err<keyfix_repair::RepairConfig>(threshold.error());
    }
    config.frame_rate = *frame_rate;
    config.corruption_threshold = *threshold;

    if (auto valid = config.validate(); !valid) {
        return keyfix_core::Err<keyfix_repair::RepairConfig>(valid.error());
    }
    return keyfix_core::Ok(config);
}

keyfix_core::Result<RunOptions> ConfigManager::build_run_options() const {
    RunOptions options;

    std::vector<std::string> positional;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        positional = m_positional;
    }
    if (positional.empty()) {
        return keyfix_core::Err<RunOptions>(
            keyfix_core::Error(keyfix_core::ErrorCode::InvalidArgument, "No input .gltf file given"));
    }
    if (positional.size() > 2) {
        return keyfix_core::Err<RunOptions>(
            keyfix_core::Error(keyfix_core::ErrorCode::InvalidArgument,
                "Unexpected argument: " + positional[2]));
    }
    options.input = positional[0];

    if (positional.size() > 1) {
        options.output_metadata = positional[1];
    } else if (contains(config_keys::OUTPUT_METADATA_PATH)) {
        options.output_metadata = get_string(config_keys::OUTPUT_METADATA_PATH);
    }
    if (contains(config_keys::OUTPUT_BINARY_PATH)) {
        options.output_binary = get_string(config_keys::OUTPUT_BINARY_PATH);
    }
    options.output_suffix = get_string(config_keys::OUTPUT_SUFFIX, keyfix_scene::kDefaultOutputSuffix);

    std::string report = get_string(config_keys::REPORT_PATH);
    if (!report.empty()) {
        options.report_path = report;
    }

    std::string level_name = get_string(config_keys::LOG_LEVEL, "info");
    auto level = keyfix_core::parse_log_level(level_name);
    if (!level) {
        return keyfix_core::Err<RunOptions>(
            keyfix_core::Error(keyfix_core::ErrorCode::ValidationError, "Unknown log level: " + level_name));
    }
    options.log_level = *level;

    std::string log_directory = get_string(config_keys::LOG_DIRECTORY);
    if (!log_directory.empty()) {
        options.log_directory = log_directory;
    }

    auto repair = build_repair_config();
    if (!repair) {
        return keyfix_core::Err<RunOptions>(repair.error());
    }
    options.repair = *repair;

    return keyfix_core::Ok(std::move(options));
}

} // namespace keyfix_config
