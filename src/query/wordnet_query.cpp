/**
 * @file wordnet_query.cpp
 * @brief WordNetQuery implementation
 */

#include <query/wordnet_query.hpp>

namespace Slowosiec {

namespace {

// "All members Polish" rule; members that do not resolve are ignored
Language partition_language(const LexicalGraph& graph, const Synset& synset) {
    for (Id unit_id : synset.lexical_units) {
        const LexicalUnit* unit = graph.lexical_units().find(unit_id);
        if (unit && unit->language != Language::PL) return Language::EN;
    }
    return Language::PL;
}

const std::vector<Id>& no_members() {
    static const std::vector<Id> empty;
    return empty;
}

} // namespace

bool projections::InLanguage::operator()(const Synset& synset) const {
    return partition_language(*graph, synset) == language;
}

std::optional<LexicalUnitView> WordNetQuery::get_lexical_unit(Id id) const {
    if (const LexicalUnit* unit = graph_->lexical_units().find(id)) return make_view(*unit);
    return std::nullopt;
}

std::optional<SynsetView> WordNetQuery::get_synset(Id id) const {
    if (const Synset* synset = graph_->synsets().find(id)) return make_view(*graph_, *synset);
    return std::nullopt;
}

std::optional<RelationTypeView> WordNetQuery::get_relation_type(Id id) const {
    if (const RelationType* type = graph_->relation_types().find(id)) return make_view(*type);
    return std::nullopt;
}

LexicalUnitRange WordNetQuery::lexical_units() const {
    const auto& units = graph_->lexical_units();
    return transform_range(units.begin(), units.end(), projections::ToLexicalUnitView{});
}

SynsetRange WordNetQuery::synsets() const {
    const auto& synsets = graph_->synsets();
    return transform_range(synsets.begin(), synsets.end(), projections::ToSynsetView{graph_});
}

RelationTypeRange WordNetQuery::relation_types() const {
    const auto& types = graph_->relation_types();
    return transform_range(types.begin(), types.end(), projections::ToRelationTypeView{});
}

LexicalRelationRange WordNetQuery::lexical_relations() const {
    const auto& relations = graph_->lexical_relations();
    return transform_range(relations.begin(), relations.end(), projections::ToLexicalRelationView{graph_});
}

SynsetRelationRange WordNetQuery::synset_relations() const {
    const auto& relations = graph_->synset_relations();
    return transform_range(relations.begin(), relations.end(), projections::ToSynsetRelationView{graph_});
}

Language WordNetQuery::classify_synset(const Synset& synset) const {
    return partition_language(*graph_, synset);
}

SynsetLanguageFilter WordNetQuery::synsets_by_language(Language language) const {
    const auto& synsets = graph_->synsets();
    return filter_range(synsets.begin(), synsets.end(), projections::InLanguage{graph_, language});
}

SynsetRelationFilter WordNetQuery::synset_relations_by_type(Id relation_type_id) const {
    const auto& relations = graph_->synset_relations();
    return filter_range(relations.begin(), relations.end(),
                        projections::HasRelationType<SynsetRelation>{relation_type_id});
}

LexicalRelationFilter WordNetQuery::lexical_relations_by_type(Id relation_type_id) const {
    const auto& relations = graph_->lexical_relations();
    return filter_range(relations.begin(), relations.end(),
                        projections::HasRelationType<LexicalRelation>{relation_type_id});
}

SynsetRelationViewFilter WordNetQuery::synset_relation_views_by_type(Id relation_type_id) const {
    auto edges = synset_relations_by_type(relation_type_id);
    return transform_range(edges.begin(), edges.end(), projections::ToSynsetRelationView{graph_});
}

LexicalRelationViewFilter WordNetQuery::lexical_relation_views_by_type(Id relation_type_id) const {
    auto edges = lexical_relations_by_type(relation_type_id);
    return transform_range(edges.begin(), edges.end(), projections::ToLexicalRelationView{graph_});
}

SynsetMemberRange WordNetQuery::lexical_units_for_synset(Id synset_id) const {
    const Synset* synset = graph_->synsets().find(synset_id);
    const std::vector<Id>& members = synset ? synset->lexical_units : no_members();

    auto resolved = filter_range(members.begin(), members.end(), projections::ResolvesToLexicalUnit{graph_});
    return transform_range(resolved.begin(), resolved.end(), projections::IdToLexicalUnitView{graph_});
}

std::vector<LexicalUnitView> WordNetQuery::lexical_units_for_synsets(const std::vector<Id>& synset_ids) const {
    std::vector<LexicalUnitView> units;
    for (Id synset_id : synset_ids) {
        for (auto unit : lexical_units_for_synset(synset_id)) {
            units.push_back(unit);
        }
    }
    return units;
}

std::string WordNetQuery::synset_to_simple(Id synset_id) const {
    std::string buffer;
    for (auto unit : lexical_units_for_synset(synset_id)) {
        if (!buffer.empty()) buffer.push_back(',');
        buffer.append(unit.name);
    }
    return buffer;
}

std::string WordNetQuery::synsets_to_simple(const std::vector<Id>& synset_ids) const {
    std::string buffer;
    for (Id synset_id : synset_ids) {
        std::string rendered = synset_to_simple(synset_id);
        if (rendered.empty()) continue;
        if (!buffer.empty()) buffer.push_back(',');
        buffer.append(rendered);
    }
    return buffer;
}

} // namespace Slowosiec
