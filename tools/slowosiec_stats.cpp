/**
 * @file slowosiec_stats.cpp
 * @brief Load a plWordNet dump and print its summary as JSON
 *
 * Usage:
 *   slowosiec_stats                 settings from SLOWOSIEC_* environment variables
 *   slowosiec_stats config.json     settings from a JSON config file
 *   slowosiec_stats dump.xml        load the given dump with default settings
 */

#include <config/loader_config.hpp>
#include <config/loader_config_json.hpp>
#include <parser/wordnet_parser.hpp>
#include <query/view_json.hpp>
#include <query/wordnet_query.hpp>
#include <utils/logger.hpp>
#include <utils/text.hpp>
#include <iostream>
#include <string>

using namespace Slowosiec;

static LoaderConfig resolve_config(int argc, char* argv[]) {
    if (argc < 2) return LoaderConfig::load_from_env();

    std::string arg = argv[1];
    if (ends_with(arg, ".json")) {
        return load_loader_config_json(arg);
    }
    LoaderConfig config;
    config.xml_path = arg;
    return config;
}

int main(int argc, char* argv[]) {
    try {
        LoaderConfig config = resolve_config(argc, argv);
        if (config.xml_path.empty()) {
            throw ConfigError("no XML path configured");
        }
        // stdout carries the JSON report; keep progress and summary lines off it
        Logger::set_min_level(Logger::Level::Warning);
        config.apply_logging();

        LexicalGraph graph = load_wordnet_file(config.xml_path, config.load);
        WordNetQuery query(graph);

        nlohmann::json out = query.metadata();
        out["polish_synsets"] = query.synsets_by_language(Language::PL).count();
        out["english_synsets"] = query.synsets_by_language(Language::EN).count();

        std::cout << out.dump(2) << std::endl;
        return 0;

    } catch (const std::exception& e) {
        Logger::error(std::string("FATAL: ") + e.what());
        return 1;
    }
}
