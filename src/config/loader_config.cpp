#include <config/loader_config.hpp>
#include <parser/attribute_binder.hpp>
#include <utils/logger.hpp>
#include <cstdlib>

namespace Slowosiec {

namespace {

size_t size_from_env(const char* name, size_t fallback) {
    const char* value = std::getenv(name);
    if (!value) return fallback;
    Id parsed = 0;
    if (!parse_id(value, parsed)) {
        throw ConfigError(std::string(name) + " is not a non-negative integer: \"" + value + "\"");
    }
    return parsed;
}

} // namespace

LoaderConfig LoaderConfig::load_from_env() {
    LoaderConfig config;

    const char* xml_env = std::getenv("SLOWOSIEC_XML");
    if (xml_env && *xml_env) config.xml_path = xml_env;
    else throw ConfigError("SLOWOSIEC_XML environment variable is not set.");

    config.load.read_buffer_size = size_from_env("SLOWOSIEC_READ_BUFFER", config.load.read_buffer_size);
    if (config.load.read_buffer_size == 0 || config.load.read_buffer_size > XmlEventSource::MAX_BUFFER_SIZE) {
        throw ConfigError("SLOWOSIEC_READ_BUFFER must be between 1 and " +
                          std::to_string(XmlEventSource::MAX_BUFFER_SIZE));
    }
    config.load.progress_interval = size_from_env("SLOWOSIEC_PROGRESS", config.load.progress_interval);

    const char* quiet_env = std::getenv("SLOWOSIEC_QUIET");
    if (quiet_env) {
        std::string quiet = quiet_env;
        config.quiet = (quiet == "1" || quiet == "true");
    }

    return config;
}

void LoaderConfig::apply_logging() const {
    if (quiet) Logger::set_min_level(Logger::Level::Warning);
}

} // namespace Slowosiec
