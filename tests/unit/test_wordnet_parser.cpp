/**
 * @file test_wordnet_parser.cpp
 * @brief Unit tests for the plWordNet loading state machine
 *
 * Exercises every transition of step() plus the structural and attribute
 * errors that abort a load. Documents are parsed from memory.
 */

#include <gtest/gtest.h>
#include <parser/parse_error.hpp>
#include <parser/wordnet_parser.hpp>
#include <test_documents.hpp>

using namespace Slowosiec;
using fixtures::SAMPLE_DOCUMENT;
using fixtures::wrap_in_root;

namespace {

XmlEvent make_event(XmlEventType type, const std::string& name, std::vector<XmlAttribute> attributes = {}) {
    XmlEvent ev;
    ev.type = type;
    ev.name = name;
    ev.attributes = std::move(attributes);
    return ev;
}

XmlEvent make_text(const std::string& text) {
    XmlEvent ev;
    ev.type = XmlEventType::Text;
    ev.text = text;
    return ev;
}

} // namespace

// ============================================================================
// step()
// ============================================================================

TEST(ParserStepTest, SynsetOpensAndClosesContext) {
    GraphBuilder builder;
    ParsingContext ctx = Idle{};

    ctx = step(ctx, make_event(XmlEventType::Start, TAG_ARRAY_LIST), builder);
    EXPECT_TRUE(std::holds_alternative<Idle>(ctx));

    ctx = step(ctx, make_event(XmlEventType::Start, TAG_SYNSET, {{"id", "10"}}), builder);
    ASSERT_TRUE(std::holds_alternative<InsideSynset>(ctx));
    EXPECT_EQ(std::get<InsideSynset>(ctx).id, 10u);

    ctx = step(ctx, make_text(" 4\n5 "), builder);
    ctx = step(ctx, make_event(XmlEventType::Start, TAG_UNIT_ID), builder);
    ctx = step(ctx, make_text("6"), builder);
    ctx = step(ctx, make_event(XmlEventType::End, TAG_UNIT_ID), builder);
    EXPECT_TRUE(std::holds_alternative<InsideSynset>(ctx));

    ctx = step(ctx, make_event(XmlEventType::End, TAG_SYNSET), builder);
    EXPECT_TRUE(std::holds_alternative<Idle>(ctx));

    // Text outside a synset is ignored
    ctx = step(ctx, make_text("99"), builder);

    LexicalGraph graph = builder.finish();
    const Synset* synset = graph.synsets().find(10);
    ASSERT_NE(synset, nullptr);
    EXPECT_EQ(synset->lexical_units, (std::vector<Id>{4, 5, 6}));
}

TEST(ParserStepTest, RelationTypeContextCollectsTests) {
    GraphBuilder builder;
    ParsingContext ctx = step(Idle{}, make_event(XmlEventType::Start, TAG_ARRAY_LIST), builder);

    ctx = step(ctx, make_event(XmlEventType::Start, TAG_RELATION_TYPE, {{"id", "5"}}), builder);
    ASSERT_TRUE(std::holds_alternative<InsideRelationType>(ctx));
    EXPECT_EQ(std::get<InsideRelationType>(ctx).id, 5u);

    ctx = step(ctx, make_event(XmlEventType::Empty, TAG_RELATION_TYPE_TEST, {{"text", "a"}, {"pos", "noun"}}), builder);
    ctx = step(ctx, make_event(XmlEventType::Empty, TAG_RELATION_TYPE_TEST, {{"text", "b"}}), builder);
    ctx = step(ctx, make_event(XmlEventType::End, TAG_RELATION_TYPE), builder);
    EXPECT_TRUE(std::holds_alternative<Idle>(ctx));

    LexicalGraph graph = builder.finish();
    const RelationType* type = graph.relation_types().find(5);
    ASSERT_NE(type, nullptr);
    ASSERT_EQ(type->tests.size(), 2u);
    EXPECT_EQ(type->tests[0].text, "a");
    EXPECT_EQ(type->tests[0].pos, "noun");
    EXPECT_EQ(type->tests[1].text, "b");
    EXPECT_EQ(type->tests[1].pos, "");
}

TEST(ParserStepTest, SelfClosingRelationTypeDoesNotOpenContext) {
    GraphBuilder builder;
    ParsingContext ctx = step(Idle{}, make_event(XmlEventType::Start, TAG_ARRAY_LIST), builder);
    ctx = step(ctx, make_event(XmlEventType::Empty, TAG_RELATION_TYPE, {{"id", "8"}}), builder);
    EXPECT_TRUE(std::holds_alternative<Idle>(ctx));

    EXPECT_THROW(step(ctx, make_event(XmlEventType::Empty, TAG_RELATION_TYPE_TEST), builder),
                 UnexpectedElementError);
}

TEST(ParserStepTest, TestInsideSynsetIsUnexpected) {
    GraphBuilder builder;
    ParsingContext ctx = step(Idle{}, make_event(XmlEventType::Start, TAG_ARRAY_LIST), builder);
    ctx = step(ctx, make_event(XmlEventType::Start, TAG_SYNSET, {{"id", "1"}}), builder);
    try {
        step(ctx, make_event(XmlEventType::Empty, TAG_RELATION_TYPE_TEST), builder);
        FAIL() << "expected UnexpectedElementError";
    } catch (const UnexpectedElementError& e) {
        EXPECT_EQ(e.kind(), ParseErrorKind::UnexpectedElement);
        EXPECT_EQ(e.tag(), "test");
    }
}

TEST(ParserStepTest, EofLeavesContextUnchanged) {
    GraphBuilder builder;
    ParsingContext ctx = InsideSynset{3};
    ctx = step(ctx, XmlEvent{}, builder);
    EXPECT_TRUE(std::holds_alternative<InsideSynset>(ctx));
}

// ============================================================================
// Whole documents
// ============================================================================

TEST(WordNetParserTest, LoadsSampleDocument) {
    LexicalGraph graph = load_wordnet_string(SAMPLE_DOCUMENT);

    EXPECT_EQ(graph.owner(), "plwordnet");
    EXPECT_EQ(graph.date(), "2023-03-01");
    EXPECT_EQ(graph.version(), "4.2");

    EXPECT_EQ(graph.lexical_units().size(), 3u);
    EXPECT_EQ(graph.synsets().size(), 2u);
    EXPECT_EQ(graph.relation_types().size(), 3u);
    EXPECT_EQ(graph.lexical_relations().size(), 2u);
    EXPECT_EQ(graph.synset_relations().size(), 3u);

    const LexicalUnit* kot = graph.lexical_units().find(1);
    ASSERT_NE(kot, nullptr);
    EXPECT_EQ(kot->name, "kot");
    EXPECT_EQ(kot->pos, "noun");
    EXPECT_EQ(kot->tagcount, 12);
    EXPECT_EQ(kot->domain, "zw");
    EXPECT_EQ(kot->desc, "zwierzę");
    EXPECT_EQ(kot->workstate, "Sprawdzone");
    EXPECT_EQ(kot->source, "P");
    EXPECT_EQ(kot->variant, 1);
    EXPECT_EQ(kot->language, Language::PL);

    EXPECT_EQ(graph.lexical_units().find(2)->language, Language::EN);

    const Synset* s100 = graph.synsets().find(100);
    ASSERT_NE(s100, nullptr);
    EXPECT_EQ(s100->workstate, "Sprawdzone");
    EXPECT_EQ(s100->split, 1);
    EXPECT_EQ(s100->owner, "anna");
    EXPECT_EQ(s100->definition, "kotowate");
    EXPECT_FALSE(s100->is_abstract);
    EXPECT_EQ(s100->lexical_units, (std::vector<Id>{1, 2}));

    const Synset* s101 = graph.synsets().find(101);
    ASSERT_NE(s101, nullptr);
    EXPECT_TRUE(s101->is_abstract);
    EXPECT_EQ(s101->lexical_units, (std::vector<Id>{3, 77}));

    const RelationType* hypo = graph.relation_types().find(5);
    ASSERT_NE(hypo, nullptr);
    EXPECT_EQ(hypo->type, "relacja synsetowa");
    EXPECT_EQ(hypo->reverse, 6u);
    EXPECT_EQ(hypo->name, "hiponimia");
    EXPECT_EQ(hypo->description, "hyponymy");
    EXPECT_EQ(hypo->posstr, "noun");
    EXPECT_EQ(hypo->display, "hipo");
    EXPECT_EQ(hypo->shortcut, "hipo");
    EXPECT_TRUE(hypo->autoreverse);
    EXPECT_EQ(hypo->pwn, "@~");
    EXPECT_EQ(hypo->tests.size(), 2u);

    EXPECT_EQ(graph.relation_types().find(7)->reverse, 0u);

    const auto& lex = graph.lexical_relations();
    EXPECT_EQ(lex[0].parent, 1u);
    EXPECT_EQ(lex[0].child, 2u);
    EXPECT_EQ(lex[0].relation, 7u);
    EXPECT_TRUE(lex[0].valid);
    EXPECT_EQ(lex[0].owner, "anna");
    EXPECT_FALSE(lex[1].valid);

    EXPECT_EQ(graph.synset_relations()[1].child, 999u);
}

TEST(WordNetParserTest, IterationFollowsDocumentOrder) {
    LexicalGraph graph = load_wordnet_string(wrap_in_root(
        R"(<lexical-unit id="30"/><lexical-unit id="10"/><lexical-unit id="20"/>)"));
    std::vector<Id> ids;
    for (const auto& unit : graph.lexical_units()) ids.push_back(unit.id);
    EXPECT_EQ(ids, (std::vector<Id>{30, 10, 20}));
}

TEST(WordNetParserTest, MapKeysMatchRecordIds) {
    LexicalGraph graph = load_wordnet_string(SAMPLE_DOCUMENT);
    for (const auto& unit : graph.lexical_units()) {
        EXPECT_EQ(graph.lexical_units().find(unit.id), &unit);
    }
    for (const auto& synset : graph.synsets()) {
        EXPECT_EQ(graph.synsets().find(synset.id), &synset);
    }
}

TEST(WordNetParserTest, MissingTagcountDefaultsToZero) {
    LexicalGraph graph = load_wordnet_string(wrap_in_root(R"(<lexical-unit id="1" name="kot" pos="noun"/>)"));
    EXPECT_EQ(graph.lexical_units().find(1)->tagcount, 0);
}

TEST(WordNetParserTest, InvalidTagcountAbortsLoad) {
    try {
        load_wordnet_string(wrap_in_root(R"(<lexical-unit id="1" tagcount="not-a-number"/>)"));
        FAIL() << "expected InvalidAttributeValueError";
    } catch (const InvalidAttributeValueError& e) {
        EXPECT_EQ(e.tag(), "lexical-unit");
        EXPECT_EQ(e.field(), "tagcount");
        EXPECT_EQ(e.raw_value(), "not-a-number");
    }
}

TEST(WordNetParserTest, LanguageAttributeInXmlIsIgnored) {
    LexicalGraph graph = load_wordnet_string(wrap_in_root(
        R"(<lexical-unit id="1" pos="noun" language="en"/><lexical-unit id="2" pos="adj pwn" language="pl"/>)"));
    EXPECT_EQ(graph.lexical_units().find(1)->language, Language::PL);
    EXPECT_EQ(graph.lexical_units().find(2)->language, Language::EN);
}

TEST(WordNetParserTest, NonNumericMemberIdAbortsLoad) {
    try {
        load_wordnet_string(wrap_in_root(R"(<synset id="1">12 x3</synset>)"));
        FAIL() << "expected InvalidAttributeValueError";
    } catch (const InvalidAttributeValueError& e) {
        EXPECT_EQ(e.tag(), "synset");
        EXPECT_EQ(e.field(), "unit-id");
        EXPECT_EQ(e.raw_value(), "x3");
    }
}

TEST(WordNetParserTest, DuplicateMembersAndRelationsAreKept) {
    LexicalGraph graph = load_wordnet_string(wrap_in_root(
        R"(<synset id="1">4 4 4</synset>)"
        R"(<synsetrelations parent="1" child="2" relation="3"/>)"
        R"(<synsetrelations parent="1" child="2" relation="3"/>)"));
    EXPECT_EQ(graph.synsets().find(1)->lexical_units, (std::vector<Id>{4, 4, 4}));
    EXPECT_EQ(graph.synset_relations().size(), 2u);
}

TEST(WordNetParserTest, DuplicateIdReplacesInPlace) {
    LexicalGraph graph = load_wordnet_string(wrap_in_root(
        R"(<lexical-unit id="1" name="a"/><lexical-unit id="2" name="b"/><lexical-unit id="1" name="c"/>)"));
    ASSERT_EQ(graph.lexical_units().size(), 2u);
    EXPECT_EQ(graph.lexical_units().find(1)->name, "c");
    EXPECT_EQ(graph.lexical_units().begin()->id, 1u);
}

TEST(WordNetParserTest, LeafElementsAcceptStartEndPair) {
    LexicalGraph graph = load_wordnet_string(wrap_in_root(
        R"(<lexical-unit id="1" name="kot"></lexical-unit><lexicalrelations parent="1" child="1" relation="2"></lexicalrelations>)"));
    EXPECT_EQ(graph.lexical_units().size(), 1u);
    EXPECT_EQ(graph.lexical_relations().size(), 1u);
}

TEST(WordNetParserTest, SelfClosingSynsetHasNoMembers) {
    LexicalGraph graph = load_wordnet_string(wrap_in_root(R"(<synset id="4"/> 7 8)"));
    ASSERT_NE(graph.synsets().find(4), nullptr);
    EXPECT_TRUE(graph.synsets().find(4)->lexical_units.empty());
}

TEST(WordNetParserTest, EmptyRootGivesEmptyGraph) {
    LexicalGraph graph = load_wordnet_string(R"(<array-list owner="o"/>)");
    EXPECT_EQ(graph.owner(), "o");
    EXPECT_EQ(graph.version(), "");
    EXPECT_TRUE(graph.lexical_units().empty());
    EXPECT_TRUE(graph.synset_relations().empty());
}

TEST(WordNetParserTest, ForeignRootElementFails) {
    try {
        load_wordnet_string("<?xml version=\"1.0\"?><!-- nothing here --><array-list-not/>");
        FAIL() << "expected UnexpectedElementError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.kind(), ParseErrorKind::UnexpectedElement);
    }
}

TEST(WordNetParserTest, FinishWithoutRootIsMissingRoot) {
    GraphBuilder builder;
    try {
        builder.finish();
        FAIL() << "expected MissingRootError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.kind(), ParseErrorKind::MissingRoot);
    }
}

TEST(WordNetParserTest, EntityWithoutRootIsMissingRoot) {
    GraphBuilder builder;
    EXPECT_THROW(builder.add_synset_relation(SynsetRelation{}), MissingRootError);
}

TEST(WordNetParserTest, UnknownElementFails) {
    try {
        load_wordnet_string(wrap_in_root(R"(<lexical-unit id="1"/><sense id="2"/>)"));
        FAIL() << "expected UnexpectedElementError";
    } catch (const UnexpectedElementError& e) {
        EXPECT_EQ(e.tag(), "sense");
    }
}

TEST(WordNetParserTest, EntityBeforeRootIsMissingRoot) {
    GraphBuilder builder;
    EXPECT_THROW(step(Idle{}, make_event(XmlEventType::Empty, TAG_LEXICAL_UNIT, {{"id", "1"}}), builder),
                 MissingRootError);
}

TEST(WordNetParserTest, DocumentWithoutRootIsMissingRoot) {
    // <unit-id> is a no-op anywhere, so only end of input can report the missing root
    try {
        load_wordnet_string("<unit-id>5</unit-id>");
        FAIL() << "expected MissingRootError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.kind(), ParseErrorKind::MissingRoot);
    }

    try {
        load_wordnet_string(R"(<lexical-unit id="1" name="kot" pos="noun"/>)");
        FAIL() << "expected MissingRootError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.kind(), ParseErrorKind::MissingRoot);
    }
}

TEST(WordNetParserTest, UnitIdBeforeRootIsIgnored) {
    GraphBuilder builder;
    ParsingContext ctx = step(Idle{}, make_event(XmlEventType::Start, TAG_UNIT_ID), builder);
    ctx = step(ctx, make_text("5"), builder);
    ctx = step(ctx, make_event(XmlEventType::End, TAG_UNIT_ID), builder);
    EXPECT_TRUE(std::holds_alternative<Idle>(ctx));
    EXPECT_FALSE(builder.has_root());
}

TEST(WordNetParserTest, NestedRootFails) {
    EXPECT_THROW(load_wordnet_string(wrap_in_root("<array-list/>")), UnexpectedElementError);
}

TEST(WordNetParserTest, MalformedXmlAbortsLoad) {
    EXPECT_THROW(load_wordnet_string(wrap_in_root(R"(<lexical-unit id="1">)")), MalformedXmlError);
}

TEST(WordNetParserTest, SmallReadBufferGivesSameGraph) {
    LoadOptions options;
    options.read_buffer_size = 7;
    options.progress_interval = 2;
    LexicalGraph graph = load_wordnet_string(SAMPLE_DOCUMENT, options);
    EXPECT_EQ(graph.synsets().find(100)->lexical_units, (std::vector<Id>{1, 2}));
    EXPECT_EQ(graph.synsets().find(101)->lexical_units, (std::vector<Id>{3, 77}));
    EXPECT_EQ(graph.lexical_units().find(1)->desc, "zwierzę");
}
