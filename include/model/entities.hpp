#pragma once

#include <model/language.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace Slowosiec {

using Id = std::size_t;

struct LexicalUnit {
    Id id = 0;
    std::string name;
    std::string pos;                     // part of speech, " pwn" suffix marks English
    int32_t tagcount = 0;
    std::string domain;
    std::string desc;
    std::string workstate;
    std::string source;
    int32_t variant = 0;

    // Derived from pos once at load time, never read from XML
    Language language = Language::PL;
};

struct Synset {
    Id id = 0;
    std::string workstate;
    int32_t split = 0;
    std::string owner;
    std::string definition;
    std::string desc;
    bool is_abstract = false;            // abstract

    // Member lexical unit ids in document order; may dangle
    std::vector<Id> lexical_units;
};

struct RelationTypeTest {
    std::string text;
    std::string pos;
};

struct RelationType {
    Id id = 0;
    std::string type;
    Id reverse = 0;                      // inverse relation type, 0 if none
    std::string name;
    std::string description;
    std::string posstr;
    std::string display;
    std::string shortcut;
    bool autoreverse = false;
    std::string pwn;                     // Princeton WordNet mapping tag

    std::vector<RelationTypeTest> tests;
};

struct LexicalRelation {
    Id parent = 0;
    Id child = 0;
    Id relation = 0;                     // RelationType id
    bool valid = false;
    std::string owner;
};

struct SynsetRelation {
    Id parent = 0;
    Id child = 0;
    Id relation = 0;                     // RelationType id
    bool valid = false;
    std::string owner;
};

} // namespace Slowosiec
