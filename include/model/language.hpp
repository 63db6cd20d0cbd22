#pragma once

#include <export.hpp>
#include <ostream>
#include <string_view>

namespace Slowosiec {

/**
 * @brief Language of a lexical unit or synset.
 *
 * English entries are the ones mapped from Princeton WordNet; their part of
 * speech carries the " pwn" suffix. Everything else is Polish.
 */
enum class Language {
    PL,
    EN
};

inline constexpr std::string_view PWN_POS_SUFFIX = " pwn";

/**
 * @brief Derive the language of a lexical unit from its part-of-speech tag.
 */
SLOWOSIEC_API Language language_from_pos(std::string_view pos);

/// "Polish" / "English"
SLOWOSIEC_API std::string_view to_string(Language lang);

/// "pl" / "en"
SLOWOSIEC_API std::string_view language_code(Language lang);

SLOWOSIEC_API std::ostream& operator<<(std::ostream& os, Language lang);

} // namespace Slowosiec
