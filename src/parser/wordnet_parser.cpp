/**
 * @file wordnet_parser.cpp
 * @brief plWordNet loader implementation
 */

#include <parser/wordnet_parser.hpp>
#include <parser/attribute_binder.hpp>
#include <parser/parse_error.hpp>
#include <utils/logger.hpp>
#include <utils/text.hpp>
#include <utils/time.hpp>
#include <cstring>
#include <iomanip>
#include <sstream>

namespace Slowosiec {

namespace {

struct RootAttributes {
    std::string owner;
    std::string date;
    std::string version;
};

// ─────────────────────────────────────────────
// Attribute tables
// ─────────────────────────────────────────────

const FieldTable<RootAttributes, 3> ROOT_FIELDS{{
    {"owner", &RootAttributes::owner},
    {"date", &RootAttributes::date},
    {"version", &RootAttributes::version},
}};

// "language" is deliberately absent: it is derived from pos
const FieldTable<LexicalUnit, 9> LEXICAL_UNIT_FIELDS{{
    {"id", &LexicalUnit::id},
    {"name", &LexicalUnit::name},
    {"pos", &LexicalUnit::pos},
    {"tagcount", &LexicalUnit::tagcount},
    {"domain", &LexicalUnit::domain},
    {"desc", &LexicalUnit::desc},
    {"workstate", &LexicalUnit::workstate},
    {"source", &LexicalUnit::source},
    {"variant", &LexicalUnit::variant},
}};

const FieldTable<Synset, 7> SYNSET_FIELDS{{
    {"id", &Synset::id},
    {"workstate", &Synset::workstate},
    {"split", &Synset::split},
    {"owner", &Synset::owner},
    {"definition", &Synset::definition},
    {"desc", &Synset::desc},
    {"abstract", &Synset::is_abstract},
}};

const FieldTable<RelationType, 10> RELATION_TYPE_FIELDS{{
    {"id", &RelationType::id},
    {"type", &RelationType::type},
    {"reverse", &RelationType::reverse},
    {"name", &RelationType::name},
    {"description", &RelationType::description},
    {"posstr", &RelationType::posstr},
    {"display", &RelationType::display},
    {"shortcut", &RelationType::shortcut},
    {"autoreverse", &RelationType::autoreverse},
    {"pwn", &RelationType::pwn},
}};

const FieldTable<RelationTypeTest, 2> RELATION_TYPE_TEST_FIELDS{{
    {"text", &RelationTypeTest::text},
    {"pos", &RelationTypeTest::pos},
}};

const FieldTable<LexicalRelation, 5> LEXICAL_RELATION_FIELDS{{
    {"parent", &LexicalRelation::parent},
    {"child", &LexicalRelation::child},
    {"relation", &LexicalRelation::relation},
    {"valid", &LexicalRelation::valid},
    {"owner", &LexicalRelation::owner},
}};

const FieldTable<SynsetRelation, 5> SYNSET_RELATION_FIELDS{{
    {"parent", &SynsetRelation::parent},
    {"child", &SynsetRelation::child},
    {"relation", &SynsetRelation::relation},
    {"valid", &SynsetRelation::valid},
    {"owner", &SynsetRelation::owner},
}};

bool is_tag(const XmlEvent& event, const char* tag) {
    return std::strcmp(event.name.c_str(), tag) == 0;
}

bool is_known_tag(const XmlEvent& event) {
    for (const char* tag : {TAG_ARRAY_LIST, TAG_LEXICAL_UNIT, TAG_SYNSET, TAG_RELATION_TYPE,
                            TAG_RELATION_TYPE_TEST, TAG_LEXICAL_RELATION, TAG_SYNSET_RELATION, TAG_UNIT_ID}) {
        if (is_tag(event, tag)) return true;
    }
    return false;
}

// ─────────────────────────────────────────────
// Transitions
// ─────────────────────────────────────────────

ParsingContext on_element(const ParsingContext& context, const XmlEvent& event, GraphBuilder& builder) {
    const bool opens = (event.type == XmlEventType::Start);

    if (is_tag(event, TAG_ARRAY_LIST)) {
        if (builder.has_root()) {
            throw UnexpectedElementError(event.name, "root container opened twice");
        }
        auto root = bind_attributes(event, ROOT_FIELDS);
        builder.begin(std::move(root.owner), std::move(root.date), std::move(root.version));
        return Idle{};
    }

    if (!is_known_tag(event)) {
        throw UnexpectedElementError(event.name, "unknown element");
    }
    // <unit-id> only wraps member ids; its text is handled by on_text
    if (is_tag(event, TAG_UNIT_ID)) {
        return context;
    }
    if (!builder.has_root()) {
        throw MissingRootError();
    }

    if (is_tag(event, TAG_LEXICAL_UNIT)) {
        auto unit = bind_attributes(event, LEXICAL_UNIT_FIELDS);
        unit.language = language_from_pos(unit.pos);
        builder.add_lexical_unit(std::move(unit));
        return context;
    }

    if (is_tag(event, TAG_SYNSET)) {
        auto synset = bind_attributes(event, SYNSET_FIELDS);
        Id id = synset.id;
        builder.add_synset(std::move(synset));
        if (opens) return InsideSynset{id};
        return context;
    }

    if (is_tag(event, TAG_RELATION_TYPE)) {
        auto type = bind_attributes(event, RELATION_TYPE_FIELDS);
        Id id = type.id;
        builder.add_relation_type(std::move(type));
        if (opens) return InsideRelationType{id};
        return context;
    }

    if (is_tag(event, TAG_RELATION_TYPE_TEST)) {
        const auto* owner = std::get_if<InsideRelationType>(&context);
        if (!owner) {
            throw UnexpectedElementError(event.name, "only valid inside <relationtypes>");
        }
        builder.append_relation_type_test(owner->id, bind_attributes(event, RELATION_TYPE_TEST_FIELDS));
        return context;
    }

    if (is_tag(event, TAG_LEXICAL_RELATION)) {
        builder.add_lexical_relation(bind_attributes(event, LEXICAL_RELATION_FIELDS));
        return context;
    }

    if (is_tag(event, TAG_SYNSET_RELATION)) {
        builder.add_synset_relation(bind_attributes(event, SYNSET_RELATION_FIELDS));
        return context;
    }

    return context;
}

void on_text(const ParsingContext& context, const XmlEvent& event, GraphBuilder& builder) {
    const auto* synset = std::get_if<InsideSynset>(&context);
    if (!synset) return;

    for (std::string_view token : split_whitespace(event.text)) {
        Id unit_id = 0;
        if (!parse_id(token, unit_id)) {
            throw InvalidAttributeValueError(TAG_SYNSET, TAG_UNIT_ID, std::string(token));
        }
        builder.append_synset_member(synset->id, unit_id);
    }
}

ParsingContext on_end(const ParsingContext& context, const XmlEvent& event) {
    if (is_tag(event, TAG_SYNSET) || is_tag(event, TAG_RELATION_TYPE)) {
        return Idle{};
    }
    if (!is_known_tag(event)) {
        throw UnexpectedElementError(event.name, "unknown element");
    }
    return context;
}

} // namespace

// ─────────────────────────────────────────────
// GraphBuilder
// ─────────────────────────────────────────────

GraphBuilder::GraphBuilder(size_t progress_interval) : progress_interval_(progress_interval) {}

void GraphBuilder::begin(std::string owner, std::string date, std::string version) {
    graph_.emplace();
    graph_->owner_ = std::move(owner);
    graph_->date_ = std::move(date);
    graph_->version_ = std::move(version);
    Logger::info("plWordNet " + graph_->version_ + " from " + graph_->owner_ + " (" + graph_->date_ + ")");
}

LexicalGraph& GraphBuilder::graph() {
    if (!graph_) throw MissingRootError();
    return *graph_;
}

void GraphBuilder::count_entity() {
    ++entity_count_;
    if (progress_interval_ > 0 && entity_count_ % progress_interval_ == 0) {
        Logger::bulk(std::to_string(entity_count_) + " entities read");
    }
}

void GraphBuilder::warn_duplicate(const char* kind, Id id) {
    Logger::warn(std::string("Duplicate ") + kind + " id " + std::to_string(id) + ", keeping the later record");
}

void GraphBuilder::add_lexical_unit(LexicalUnit unit) {
    Id id = unit.id;
    if (!graph().lexical_units_.insert_or_replace(std::move(unit))) warn_duplicate("lexical unit", id);
    count_entity();
}

void GraphBuilder::add_synset(Synset synset) {
    Id id = synset.id;
    if (!graph().synsets_.insert_or_replace(std::move(synset))) warn_duplicate("synset", id);
    count_entity();
}

void GraphBuilder::append_synset_member(Id synset_id, Id unit_id) {
    if (Synset* synset = graph().synsets_.find(synset_id)) {
        synset->lexical_units.push_back(unit_id);
    }
}

void GraphBuilder::add_relation_type(RelationType type) {
    Id id = type.id;
    if (!graph().relation_types_.insert_or_replace(std::move(type))) warn_duplicate("relation type", id);
    count_entity();
}

void GraphBuilder::append_relation_type_test(Id relation_type_id, RelationTypeTest test) {
    if (RelationType* type = graph().relation_types_.find(relation_type_id)) {
        type->tests.push_back(std::move(test));
    }
}

void GraphBuilder::add_lexical_relation(LexicalRelation relation) {
    graph().lexical_relations_.push_back(std::move(relation));
    count_entity();
}

void GraphBuilder::add_synset_relation(SynsetRelation relation) {
    graph().synset_relations_.push_back(std::move(relation));
    count_entity();
}

LexicalGraph GraphBuilder::finish() {
    LexicalGraph result = std::move(graph());
    graph_.reset();
    return result;
}

// ─────────────────────────────────────────────
// State machine driver
// ─────────────────────────────────────────────

ParsingContext step(const ParsingContext& context, const XmlEvent& event, GraphBuilder& builder) {
    switch (event.type) {
        case XmlEventType::Start:
        case XmlEventType::Empty:
            return on_element(context, event, builder);
        case XmlEventType::Text:
            on_text(context, event, builder);
            return context;
        case XmlEventType::End:
            return on_end(context, event);
        case XmlEventType::Eof:
            break;
    }
    return context;
}

LexicalGraph load_wordnet(XmlEventSource& source, const LoadOptions& options) {
    Timer timer;
    GraphBuilder builder(options.progress_interval);
    ParsingContext context = Idle{};

    while (true) {
        XmlEvent event = source.next();
        if (event.type == XmlEventType::Eof) break;
        context = step(context, event, builder);
    }

    LexicalGraph graph = builder.finish();

    auto meta = graph.metadata();
    std::ostringstream ss;
    ss << "Loaded plWordNet " << meta.version << ": "
       << meta.lexical_units << " lexical units, "
       << meta.synsets << " synsets, "
       << meta.relation_types << " relation types, "
       << meta.lexical_relations << " lexical relations, "
       << meta.synset_relations << " synset relations in "
       << std::fixed << std::setprecision(2) << timer.elapsed_sec() << "s";
    Logger::success(ss.str());

    return graph;
}

LexicalGraph load_wordnet_file(const std::string& path, const LoadOptions& options) {
    Logger::step("Loading plWordNet from " + path);
    auto source = XmlEventSource::from_file(path, options.read_buffer_size);
    return load_wordnet(source, options);
}

LexicalGraph load_wordnet_string(std::string xml, const LoadOptions& options) {
    auto source = XmlEventSource::from_string(std::move(xml), options.read_buffer_size);
    return load_wordnet(source, options);
}

} // namespace Slowosiec
