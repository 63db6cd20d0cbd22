#pragma once

#include <export.hpp>
#include <parser/wordnet_parser.hpp>
#include <stdexcept>
#include <string>

namespace Slowosiec {

class SLOWOSIEC_API ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Settings for loading a plWordNet dump.
 *
 * Environment variables:
 *   SLOWOSIEC_XML           path of the XML dump (required)
 *   SLOWOSIEC_READ_BUFFER   bytes per tokenizer read (default 65536)
 *   SLOWOSIEC_PROGRESS      entities between progress lines, 0 = off
 *   SLOWOSIEC_QUIET         "1" or "true" to log warnings and errors only
 */
struct SLOWOSIEC_API LoaderConfig {
    std::string xml_path;
    LoadOptions load;
    bool quiet = false;

    static LoaderConfig load_from_env();

    /// Raise the logger threshold if quiet is set.
    void apply_logging() const;
};

} // namespace Slowosiec
