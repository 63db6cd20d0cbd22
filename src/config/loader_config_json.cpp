#include <config/loader_config_json.hpp>
#include <nlohmann/json.hpp>
#include <fstream>

namespace Slowosiec {

namespace {

size_t read_size(const nlohmann::json& json, const char* key, size_t fallback) {
    if (!json.contains(key)) return fallback;
    const auto& value = json[key];
    if (!value.is_number_unsigned()) {
        throw ConfigError(std::string("config key '") + key + "' must be a non-negative integer");
    }
    return value.get<size_t>();
}

LoaderConfig from_json(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw ConfigError("config must be a JSON object");
    }

    LoaderConfig config;

    if (json.contains("xml_path")) {
        if (!json["xml_path"].is_string()) throw ConfigError("config key 'xml_path' must be a string");
        config.xml_path = json["xml_path"].get<std::string>();
    }

    config.load.read_buffer_size = read_size(json, "read_buffer_size", config.load.read_buffer_size);
    if (config.load.read_buffer_size == 0 || config.load.read_buffer_size > XmlEventSource::MAX_BUFFER_SIZE) {
        throw ConfigError("config key 'read_buffer_size' must be between 1 and " +
                          std::to_string(XmlEventSource::MAX_BUFFER_SIZE));
    }
    config.load.progress_interval = read_size(json, "progress_interval", config.load.progress_interval);

    if (json.contains("quiet")) {
        if (!json["quiet"].is_boolean()) throw ConfigError("config key 'quiet' must be a boolean");
        config.quiet = json["quiet"].get<bool>();
    }

    return config;
}

} // namespace

LoaderConfig parse_loader_config_json(const std::string& text) {
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError(std::string("invalid config JSON: ") + e.what());
    }
    return from_json(json);
}

LoaderConfig load_loader_config_json(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Could not open config file: " + path.string());
    }
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("invalid config JSON in " + path.string() + ": " + e.what());
    }
    return from_json(json);
}

} // namespace Slowosiec
