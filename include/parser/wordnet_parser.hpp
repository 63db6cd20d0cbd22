/**
 * @file wordnet_parser.hpp
 * @brief plWordNet loader - state machine over XML events, builder and load entry points
 */

#pragma once

#include <export.hpp>
#include <model/lexical_graph.hpp>
#include <parser/xml_event_source.hpp>
#include <optional>
#include <string>
#include <variant>

namespace Slowosiec {

// Element names of the plWordNet XML dump
inline constexpr const char* TAG_ARRAY_LIST = "array-list";
inline constexpr const char* TAG_LEXICAL_UNIT = "lexical-unit";
inline constexpr const char* TAG_SYNSET = "synset";
inline constexpr const char* TAG_RELATION_TYPE = "relationtypes";
inline constexpr const char* TAG_RELATION_TYPE_TEST = "test";
inline constexpr const char* TAG_LEXICAL_RELATION = "lexicalrelations";
inline constexpr const char* TAG_SYNSET_RELATION = "synsetrelations";
inline constexpr const char* TAG_UNIT_ID = "unit-id";

/**
 * @brief Which container, if any, receives nested content.
 *
 * Synsets and relation types never nest inside each other, so one open
 * container is enough.
 */
struct Idle {};
struct InsideSynset { Id id; };
struct InsideRelationType { Id id; };

using ParsingContext = std::variant<Idle, InsideSynset, InsideRelationType>;

/**
 * @brief Accumulates entities while a document is being read.
 *
 * The only writer of a LexicalGraph. finish() hands the graph over; nothing
 * can modify it afterwards.
 */
class SLOWOSIEC_API GraphBuilder {
public:
    explicit GraphBuilder(size_t progress_interval = 0);

    bool has_root() const { return graph_.has_value(); }

    void begin(std::string owner, std::string date, std::string version);

    void add_lexical_unit(LexicalUnit unit);
    void add_synset(Synset synset);
    void append_synset_member(Id synset_id, Id unit_id);
    void add_relation_type(RelationType type);
    void append_relation_type_test(Id relation_type_id, RelationTypeTest test);
    void add_lexical_relation(LexicalRelation relation);
    void add_synset_relation(SynsetRelation relation);

    /**
     * @brief Release the completed graph.
     * @throws MissingRootError if no root element was seen
     */
    LexicalGraph finish();

private:
    LexicalGraph& graph();
    void count_entity();
    void warn_duplicate(const char* kind, Id id);

    std::optional<LexicalGraph> graph_;
    size_t progress_interval_;
    size_t entity_count_ = 0;
};

/**
 * @brief Advance the state machine by one event.
 *
 * Builds entities from Start/Empty elements, routes synset text and relation
 * type tests to the open container, and returns the next context.
 *
 * @throws InvalidAttributeValueError, UnexpectedElementError
 */
SLOWOSIEC_API ParsingContext step(const ParsingContext& context, const XmlEvent& event, GraphBuilder& builder);

struct LoadOptions {
    size_t read_buffer_size = XmlEventSource::DEFAULT_BUFFER_SIZE;
    size_t progress_interval = 100000;   // 0 disables progress lines
};

/**
 * @brief Consume a whole event stream in one pass and return the graph.
 *
 * No partial graph is ever returned: any ParseError aborts the load.
 */
SLOWOSIEC_API LexicalGraph load_wordnet(XmlEventSource& source, const LoadOptions& options = {});

SLOWOSIEC_API LexicalGraph load_wordnet_file(const std::string& path, const LoadOptions& options = {});

SLOWOSIEC_API LexicalGraph load_wordnet_string(std::string xml, const LoadOptions& options = {});

} // namespace Slowosiec
