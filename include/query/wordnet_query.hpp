/**
 * @file wordnet_query.hpp
 * @brief Read-only queries over a loaded LexicalGraph - lookups, partitions, filters
 */

#pragma once

#include <export.hpp>
#include <model/lexical_graph.hpp>
#include <query/view_range.hpp>
#include <query/views.hpp>
#include <optional>
#include <string>
#include <vector>

namespace Slowosiec {

// Projections and predicates used by the lazy ranges below. They hold a
// pointer to the graph, so ranges stay valid only as long as the graph.
namespace projections {

struct ToLexicalUnitView {
    LexicalUnitView operator()(const LexicalUnit& unit) const { return make_view(unit); }
};

struct ToRelationTypeView {
    RelationTypeView operator()(const RelationType& type) const { return make_view(type); }
};

struct ToSynsetView {
    const LexicalGraph* graph = nullptr;
    SynsetView operator()(const Synset& synset) const { return make_view(*graph, synset); }
};

struct ToLexicalRelationView {
    const LexicalGraph* graph = nullptr;
    LexicalRelationView operator()(const LexicalRelation& relation) const { return make_view(*graph, relation); }
};

struct ToSynsetRelationView {
    const LexicalGraph* graph = nullptr;
    SynsetRelationView operator()(const SynsetRelation& relation) const { return make_view(*graph, relation); }
};

struct ResolvesToLexicalUnit {
    const LexicalGraph* graph = nullptr;
    bool operator()(Id id) const { return graph->lexical_units().contains(id); }
};

// Only applied after ResolvesToLexicalUnit
struct IdToLexicalUnitView {
    const LexicalGraph* graph = nullptr;
    LexicalUnitView operator()(Id id) const { return make_view(*graph->lexical_units().find(id)); }
};

template <typename Edge>
struct HasRelationType {
    Id relation = 0;
    bool operator()(const Edge& edge) const { return edge.relation == relation; }
};

struct InLanguage {
    const LexicalGraph* graph = nullptr;
    Language language = Language::PL;
    bool operator()(const Synset& synset) const;
};

} // namespace projections

using LexicalUnitRange = LazyRange<TransformIterator<IndexedTable<LexicalUnit>::const_iterator,
                                                     projections::ToLexicalUnitView>>;
using SynsetRange = LazyRange<TransformIterator<IndexedTable<Synset>::const_iterator,
                                                projections::ToSynsetView>>;
using RelationTypeRange = LazyRange<TransformIterator<IndexedTable<RelationType>::const_iterator,
                                                      projections::ToRelationTypeView>>;
using LexicalRelationRange = LazyRange<TransformIterator<std::vector<LexicalRelation>::const_iterator,
                                                         projections::ToLexicalRelationView>>;
using SynsetRelationRange = LazyRange<TransformIterator<std::vector<SynsetRelation>::const_iterator,
                                                       projections::ToSynsetRelationView>>;

using SynsetLanguageFilter = LazyRange<FilterIterator<IndexedTable<Synset>::const_iterator,
                                                      projections::InLanguage>>;
using LexicalRelationFilter = LazyRange<FilterIterator<std::vector<LexicalRelation>::const_iterator,
                                                       projections::HasRelationType<LexicalRelation>>>;
using SynsetRelationFilter = LazyRange<FilterIterator<std::vector<SynsetRelation>::const_iterator,
                                                      projections::HasRelationType<SynsetRelation>>>;
using LexicalRelationViewFilter = LazyRange<TransformIterator<LexicalRelationFilter::iterator,
                                                             projections::ToLexicalRelationView>>;
using SynsetRelationViewFilter = LazyRange<TransformIterator<SynsetRelationFilter::iterator,
                                                            projections::ToSynsetRelationView>>;
using SynsetMemberRange = LazyRange<TransformIterator<FilterIterator<std::vector<Id>::const_iterator,
                                                                     projections::ResolvesToLexicalUnit>,
                                                      projections::IdToLexicalUnitView>>;

/**
 * @brief Read-only queries over a loaded graph.
 *
 * Every call builds its results from the immutable graph and writes nothing
 * back, so one instance may serve several threads. Ranges are lazy: each
 * iteration walks the graph again, in document order.
 */
class SLOWOSIEC_API WordNetQuery {
public:
    explicit WordNetQuery(const LexicalGraph& graph) : graph_(&graph) {}

    const LexicalGraph& graph() const { return *graph_; }
    Metadata metadata() const { return graph_->metadata(); }

    std::optional<LexicalUnitView> get_lexical_unit(Id id) const;
    std::optional<SynsetView> get_synset(Id id) const;
    std::optional<RelationTypeView> get_relation_type(Id id) const;

    LexicalUnitRange lexical_units() const;
    SynsetRange synsets() const;
    RelationTypeRange relation_types() const;
    LexicalRelationRange lexical_relations() const;
    SynsetRelationRange synset_relations() const;

    /**
     * @brief Language class of a synset for partitioning: Polish iff every
     * member that resolves is a Polish lexical unit.
     *
     * Differs from SynsetView::language, which follows the first member only.
     */
    Language classify_synset(const Synset& synset) const;

    /**
     * @brief Synsets whose classify_synset() equals @p language. The Polish
     * and English results partition all synsets.
     */
    SynsetLanguageFilter synsets_by_language(Language language) const;

    /// Stored edges whose relation type is @p relation_type_id, in document order.
    SynsetRelationFilter synset_relations_by_type(Id relation_type_id) const;
    LexicalRelationFilter lexical_relations_by_type(Id relation_type_id) const;

    /// Same edges as above, resolved into views.
    SynsetRelationViewFilter synset_relation_views_by_type(Id relation_type_id) const;
    LexicalRelationViewFilter lexical_relation_views_by_type(Id relation_type_id) const;

    /// Resolved members of one synset; empty for an unknown synset.
    SynsetMemberRange lexical_units_for_synset(Id synset_id) const;

    /// Resolved members of several synsets, concatenated in the given order.
    std::vector<LexicalUnitView> lexical_units_for_synsets(const std::vector<Id>& synset_ids) const;

    /**
     * @brief Comma-joined names of a synset's resolved members, e.g.
     * "kot,cat". Empty for an unknown synset.
     */
    std::string synset_to_simple(Id synset_id) const;

    /**
     * @brief synset_to_simple() of each id, comma-joined in the given order.
     * Unknown synsets and empty renderings are left out.
     */
    std::string synsets_to_simple(const std::vector<Id>& synset_ids) const;

private:
    const LexicalGraph* graph_;
};

} // namespace Slowosiec
