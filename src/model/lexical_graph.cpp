#include <model/lexical_graph.hpp>

namespace Slowosiec {

Metadata LexicalGraph::metadata() const {
    Metadata meta;
    meta.owner = owner_;
    meta.date = date_;
    meta.version = version_;
    meta.lexical_units = lexical_units_.size();
    meta.synsets = synsets_.size();
    meta.relation_types = relation_types_.size();
    meta.lexical_relations = lexical_relations_.size();
    meta.synset_relations = synset_relations_.size();
    return meta;
}

} // namespace Slowosiec
