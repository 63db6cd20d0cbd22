#include <query/view_json.hpp>
#include <string>

namespace Slowosiec {

namespace {

std::string str(std::string_view s) {
    return std::string(s);
}

} // namespace

void to_json(nlohmann::json& j, const Metadata& meta) {
    j = nlohmann::json{
        {"owner", str(meta.owner)},
        {"date", str(meta.date)},
        {"version", str(meta.version)},
        {"lexical_units", meta.lexical_units},
        {"synsets", meta.synsets},
        {"relation_types", meta.relation_types},
        {"lexical_relations", meta.lexical_relations},
        {"synset_relations", meta.synset_relations},
    };
}

void to_json(nlohmann::json& j, const LexicalUnitView& view) {
    j = nlohmann::json{
        {"id", view.id},
        {"name", str(view.name)},
        {"pos", str(view.pos)},
        {"tagcount", view.tagcount},
        {"domain", str(view.domain)},
        {"desc", str(view.desc)},
        {"workstate", str(view.workstate)},
        {"source", str(view.source)},
        {"variant", view.variant},
        {"language", str(language_code(view.language))},
    };
}

void to_json(nlohmann::json& j, const SynsetView& view) {
    j = nlohmann::json{
        {"id", view.id},
        {"workstate", str(view.workstate)},
        {"split", view.split},
        {"owner", str(view.owner)},
        {"definition", str(view.definition)},
        {"desc", str(view.desc)},
        {"abstract", view.is_abstract},
        {"lexical_units", view.lexical_units},
        {"language", str(language_code(view.language))},
    };
}

void to_json(nlohmann::json& j, const RelationTypeView& view) {
    j = nlohmann::json{
        {"id", view.id},
        {"type", str(view.type)},
        {"reverse", view.reverse},
        {"name", str(view.name)},
        {"description", str(view.description)},
        {"posstr", str(view.posstr)},
        {"display", str(view.display)},
        {"shortcut", str(view.shortcut)},
        {"autoreverse", view.autoreverse},
        {"pwn", str(view.pwn)},
    };
}

void to_json(nlohmann::json& j, const LexicalRelationView& view) {
    j = nlohmann::json{
        {"parent", optional_to_json(view.parent)},
        {"child", optional_to_json(view.child)},
        {"relation", optional_to_json(view.relation)},
        {"valid", view.valid},
        {"owner", str(view.owner)},
    };
}

void to_json(nlohmann::json& j, const SynsetRelationView& view) {
    j = nlohmann::json{
        {"parent", optional_to_json(view.parent)},
        {"child", optional_to_json(view.child)},
        {"relation", optional_to_json(view.relation)},
        {"valid", view.valid},
        {"owner", str(view.owner)},
    };
}

} // namespace Slowosiec
