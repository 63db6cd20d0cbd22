#pragma once

#include <config/loader_config.hpp>
#include <filesystem>

namespace Slowosiec {

/**
 * @brief Read a LoaderConfig from a JSON object.
 *
 * Keys: xml_path (string), read_buffer_size (positive integer),
 * progress_interval (integer, 0 = off), quiet (bool). Absent keys keep their
 * defaults; an unreadable file or a value of the wrong type is a ConfigError.
 */
LoaderConfig load_loader_config_json(const std::filesystem::path& path);

LoaderConfig parse_loader_config_json(const std::string& text);

} // namespace Slowosiec
