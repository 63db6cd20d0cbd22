/**
 * @file views.hpp
 * @brief Borrowed views that resolve ids into cross-referenced entities
 */

#pragma once

#include <export.hpp>
#include <model/lexical_graph.hpp>
#include <optional>
#include <string_view>
#include <vector>

namespace Slowosiec {

// Views are built per call and borrow every string from the graph.
// A view must not outlive the LexicalGraph it was made from.

struct LexicalUnitView {
    Id id = 0;
    std::string_view name;
    std::string_view pos;
    int32_t tagcount = 0;
    std::string_view domain;
    std::string_view desc;
    std::string_view workstate;
    std::string_view source;
    int32_t variant = 0;
    Language language = Language::PL;    // recomputed from pos
};

struct SynsetView {
    Id id = 0;
    std::string_view workstate;
    int32_t split = 0;
    std::string_view owner;
    std::string_view definition;
    std::string_view desc;
    bool is_abstract = false;
    std::vector<LexicalUnitView> lexical_units;   // dangling members dropped
    Language language = Language::PL;             // language of the first member
};

// Relation type tests are not part of the view.
struct RelationTypeView {
    Id id = 0;
    std::string_view type;
    Id reverse = 0;
    std::string_view name;
    std::string_view description;
    std::string_view posstr;
    std::string_view display;
    std::string_view shortcut;
    bool autoreverse = false;
    std::string_view pwn;
};

struct LexicalRelationView {
    std::optional<LexicalUnitView> parent;
    std::optional<LexicalUnitView> child;
    std::optional<RelationTypeView> relation;
    bool valid = false;
    std::string_view owner;
};

struct SynsetRelationView {
    std::optional<SynsetView> parent;
    std::optional<SynsetView> child;
    std::optional<RelationTypeView> relation;
    bool valid = false;
    std::string_view owner;
};

SLOWOSIEC_API LexicalUnitView make_view(const LexicalUnit& unit);

/**
 * @brief Resolve a synset's members through the graph.
 *
 * Member ids with no lexical unit are skipped. The view's language is the
 * language of the first resolved member, Polish when none resolves.
 */
SLOWOSIEC_API SynsetView make_view(const LexicalGraph& graph, const Synset& synset);

SLOWOSIEC_API RelationTypeView make_view(const RelationType& type);

/**
 * @brief Resolve the endpoints and the type of an edge. Ids that do not
 * resolve become empty optionals.
 */
SLOWOSIEC_API LexicalRelationView make_view(const LexicalGraph& graph, const LexicalRelation& relation);
SLOWOSIEC_API SynsetRelationView make_view(const LexicalGraph& graph, const SynsetRelation& relation);

} // namespace Slowosiec
