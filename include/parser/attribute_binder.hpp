#pragma once

#include <export.hpp>
#include <model/entities.hpp>
#include <parser/xml_event_source.hpp>
#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace Slowosiec {

/**
 * @brief One row of a declarative attribute table: XML attribute name and the
 * record member it fills. The member's type selects the coercion.
 */
template <typename Record>
struct FieldBinding {
    using Target = std::variant<std::string Record::*,
                                Id Record::*,
                                int32_t Record::*,
                                bool Record::*>;

    const char* attribute;
    Target field;
};

template <typename Record, size_t N>
using FieldTable = std::array<FieldBinding<Record>, N>;

// Strict decimal parses; the whole input must be consumed.
SLOWOSIEC_API bool parse_id(std::string_view raw, Id& out);
SLOWOSIEC_API bool parse_int32(std::string_view raw, int32_t& out);

// Coercions used by bind_attributes. Numeric ones throw
// InvalidAttributeValueError naming @p tag and @p attribute.
SLOWOSIEC_API void assign_field(std::string& target, std::string_view tag, std::string_view attribute,
                                const std::string& raw);
SLOWOSIEC_API void assign_field(Id& target, std::string_view tag, std::string_view attribute,
                                const std::string& raw);
SLOWOSIEC_API void assign_field(int32_t& target, std::string_view tag, std::string_view attribute,
                                const std::string& raw);
SLOWOSIEC_API void assign_field(bool& target, std::string_view tag, std::string_view attribute,
                                const std::string& raw);

/**
 * @brief Build a record from an element's attributes.
 *
 * Absent attributes leave the member at its default (empty text, 0, false).
 * A present attribute that does not parse as its member's numeric type is a
 * hard failure. Booleans are true only for the literal "true". Attributes not
 * named in the table are ignored, and collection members stay empty.
 */
template <typename Record, size_t N>
Record bind_attributes(const XmlEvent& element, const FieldTable<Record, N>& table) {
    Record record{};
    for (const auto& binding : table) {
        const std::string* raw = element.attribute(binding.attribute);
        if (!raw) continue;
        std::visit([&](auto member) {
            assign_field(record.*member, element.name, binding.attribute, *raw);
        }, binding.field);
    }
    return record;
}

} // namespace Slowosiec
