#include <model/language.hpp>
#include <utils/text.hpp>

namespace Slowosiec {

Language language_from_pos(std::string_view pos) {
    return ends_with(pos, PWN_POS_SUFFIX) ? Language::EN : Language::PL;
}

std::string_view to_string(Language lang) {
    switch (lang) {
        case Language::PL: return "Polish";
        case Language::EN: return "English";
    }
    return "Polish";
}

std::string_view language_code(Language lang) {
    switch (lang) {
        case Language::PL: return "pl";
        case Language::EN: return "en";
    }
    return "pl";
}

std::ostream& operator<<(std::ostream& os, Language lang) {
    switch (lang) {
        case Language::PL: return os << "Language::PL";
        case Language::EN: return os << "Language::EN";
    }
    return os;
}

} // namespace Slowosiec
