#include <query/views.hpp>

namespace Slowosiec {

LexicalUnitView make_view(const LexicalUnit& unit) {
    LexicalUnitView view;
    view.id = unit.id;
    view.name = unit.name;
    view.pos = unit.pos;
    view.tagcount = unit.tagcount;
    view.domain = unit.domain;
    view.desc = unit.desc;
    view.workstate = unit.workstate;
    view.source = unit.source;
    view.variant = unit.variant;
    view.language = language_from_pos(unit.pos);
    return view;
}

SynsetView make_view(const LexicalGraph& graph, const Synset& synset) {
    SynsetView view;
    view.id = synset.id;
    view.workstate = synset.workstate;
    view.split = synset.split;
    view.owner = synset.owner;
    view.definition = synset.definition;
    view.desc = synset.desc;
    view.is_abstract = synset.is_abstract;

    view.lexical_units.reserve(synset.lexical_units.size());
    for (Id unit_id : synset.lexical_units) {
        if (const LexicalUnit* unit = graph.lexical_units().find(unit_id)) {
            view.lexical_units.push_back(make_view(*unit));
        }
    }
    view.language = view.lexical_units.empty() ? Language::PL : view.lexical_units.front().language;
    return view;
}

RelationTypeView make_view(const RelationType& type) {
    RelationTypeView view;
    view.id = type.id;
    view.type = type.type;
    view.reverse = type.reverse;
    view.name = type.name;
    view.description = type.description;
    view.posstr = type.posstr;
    view.display = type.display;
    view.shortcut = type.shortcut;
    view.autoreverse = type.autoreverse;
    view.pwn = type.pwn;
    return view;
}

namespace {

std::optional<RelationTypeView> resolve_relation_type(const LexicalGraph& graph, Id id) {
    if (const RelationType* type = graph.relation_types().find(id)) return make_view(*type);
    return std::nullopt;
}

std::optional<LexicalUnitView> resolve_lexical_unit(const LexicalGraph& graph, Id id) {
    if (const LexicalUnit* unit = graph.lexical_units().find(id)) return make_view(*unit);
    return std::nullopt;
}

std::optional<SynsetView> resolve_synset(const LexicalGraph& graph, Id id) {
    if (const Synset* synset = graph.synsets().find(id)) return make_view(graph, *synset);
    return std::nullopt;
}

} // namespace

LexicalRelationView make_view(const LexicalGraph& graph, const LexicalRelation& relation) {
    LexicalRelationView view;
    view.parent = resolve_lexical_unit(graph, relation.parent);
    view.child = resolve_lexical_unit(graph, relation.child);
    view.relation = resolve_relation_type(graph, relation.relation);
    view.valid = relation.valid;
    view.owner = relation.owner;
    return view;
}

SynsetRelationView make_view(const LexicalGraph& graph, const SynsetRelation& relation) {
    SynsetRelationView view;
    view.parent = resolve_synset(graph, relation.parent);
    view.child = resolve_synset(graph, relation.child);
    view.relation = resolve_relation_type(graph, relation.relation);
    view.valid = relation.valid;
    view.owner = relation.owner;
    return view;
}

} // namespace Slowosiec
