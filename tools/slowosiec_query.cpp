/**
 * @file slowosiec_query.cpp
 * @brief Look up entities of a plWordNet dump by id
 *
 * Usage: slowosiec_query <dump.xml> <command> <args...>
 *
 *   lu <id>                     lexical unit
 *   synset <id>                 synset with resolved members
 *   relation-type <id>          relation type
 *   synset-relations <type-id>  synset edges of one relation type
 *   lexical-relations <type-id> lexical edges of one relation type
 *   simple <synset-id>...       comma-joined member names
 *
 * Results are JSON (plain text for "simple"); unknown ids print null.
 */

#include <parser/attribute_binder.hpp>
#include <parser/wordnet_parser.hpp>
#include <query/view_json.hpp>
#include <query/wordnet_query.hpp>
#include <utils/logger.hpp>
#include <iostream>
#include <string>
#include <vector>

using namespace Slowosiec;

static void print_usage() {
    std::cerr << "Usage: slowosiec_query <dump.xml> <command> <args...>\n"
              << "Commands: lu <id> | synset <id> | relation-type <id> |\n"
              << "          synset-relations <type-id> | lexical-relations <type-id> |\n"
              << "          simple <synset-id>...\n";
}

static Id parse_id_arg(const std::string& arg) {
    Id id = 0;
    if (!parse_id(arg, id)) {
        throw std::invalid_argument("not an id: " + arg);
    }
    return id;
}

int main(int argc, char* argv[]) {
    if (argc < 4) {
        print_usage();
        return 1;
    }

    try {
        std::string path = argv[1];
        std::string command = argv[2];
        std::vector<Id> ids;
        for (int i = 3; i < argc; ++i) ids.push_back(parse_id_arg(argv[i]));

        Logger::set_min_level(Logger::Level::Warning);
        LexicalGraph graph = load_wordnet_file(path);
        WordNetQuery query(graph);

        if (command == "simple") {
            std::cout << query.synsets_to_simple(ids) << std::endl;
            return 0;
        }

        nlohmann::json out;
        if (command == "lu") {
            out = optional_to_json(query.get_lexical_unit(ids.front()));
        } else if (command == "synset") {
            out = optional_to_json(query.get_synset(ids.front()));
        } else if (command == "relation-type") {
            out = optional_to_json(query.get_relation_type(ids.front()));
        } else if (command == "synset-relations") {
            out = nlohmann::json::array();
            for (const auto& edge : query.synset_relation_views_by_type(ids.front())) out.push_back(edge);
        } else if (command == "lexical-relations") {
            out = nlohmann::json::array();
            for (const auto& edge : query.lexical_relation_views_by_type(ids.front())) out.push_back(edge);
        } else {
            print_usage();
            return 1;
        }

        std::cout << out.dump(2) << std::endl;
        return 0;

    } catch (const std::exception& e) {
        Logger::error(std::string("FATAL: ") + e.what());
        return 1;
    }
}
