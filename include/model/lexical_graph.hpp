#pragma once

#include <export.hpp>
#include <model/entities.hpp>
#include <model/indexed_table.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace Slowosiec {

class GraphBuilder;

/**
 * @brief Summary of a loaded graph. Text fields borrow from the graph.
 */
struct Metadata {
    std::string_view owner;
    std::string_view date;
    std::string_view version;
    size_t lexical_units = 0;
    size_t synsets = 0;
    size_t relation_types = 0;
    size_t lexical_relations = 0;
    size_t synset_relations = 0;
};

/**
 * @brief The whole plWordNet graph as loaded from one XML document.
 *
 * Built once by the loader and read-only afterwards, so a const instance can
 * be shared between threads without locking. Node-like entities are keyed by
 * id and iterate in document order; relation edges are kept as plain lists,
 * duplicates included.
 */
class SLOWOSIEC_API LexicalGraph {
public:
    LexicalGraph() = default;
    LexicalGraph(LexicalGraph&&) = default;
    LexicalGraph& operator=(LexicalGraph&&) = default;
    LexicalGraph(const LexicalGraph&) = delete;
    LexicalGraph& operator=(const LexicalGraph&) = delete;

    const std::string& owner() const { return owner_; }
    const std::string& date() const { return date_; }
    const std::string& version() const { return version_; }

    const IndexedTable<LexicalUnit>& lexical_units() const { return lexical_units_; }
    const IndexedTable<Synset>& synsets() const { return synsets_; }
    const IndexedTable<RelationType>& relation_types() const { return relation_types_; }
    const std::vector<LexicalRelation>& lexical_relations() const { return lexical_relations_; }
    const std::vector<SynsetRelation>& synset_relations() const { return synset_relations_; }

    Metadata metadata() const;

private:
    friend class GraphBuilder;

    std::string owner_;
    std::string date_;
    std::string version_;

    IndexedTable<LexicalUnit> lexical_units_;
    IndexedTable<Synset> synsets_;
    IndexedTable<RelationType> relation_types_;
    std::vector<LexicalRelation> lexical_relations_;
    std::vector<SynsetRelation> synset_relations_;
};

} // namespace Slowosiec
