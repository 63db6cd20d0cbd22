#include <parser/attribute_binder.hpp>
#include <parser/parse_error.hpp>
#include <charconv>

namespace Slowosiec {

namespace {

// from_chars rejects a leading '+', which the source data may carry
std::string_view strip_plus(std::string_view raw) {
    if (raw.size() > 1 && raw[0] == '+' && raw[1] != '-') raw.remove_prefix(1);
    return raw;
}

template <typename T>
bool parse_number(std::string_view raw, T& out) {
    raw = strip_plus(raw);
    if (raw.empty()) return false;
    T value{};
    auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), value);
    if (ec != std::errc() || ptr != raw.data() + raw.size()) return false;
    out = value;
    return true;
}

} // namespace

bool parse_id(std::string_view raw, Id& out) {
    return parse_number(raw, out);
}

bool parse_int32(std::string_view raw, int32_t& out) {
    return parse_number(raw, out);
}

void assign_field(std::string& target, std::string_view, std::string_view, const std::string& raw) {
    target = raw;
}

void assign_field(Id& target, std::string_view tag, std::string_view attribute, const std::string& raw) {
    if (!parse_id(raw, target)) {
        throw InvalidAttributeValueError(std::string(tag), std::string(attribute), raw);
    }
}

void assign_field(int32_t& target, std::string_view tag, std::string_view attribute, const std::string& raw) {
    if (!parse_int32(raw, target)) {
        throw InvalidAttributeValueError(std::string(tag), std::string(attribute), raw);
    }
}

void assign_field(bool& target, std::string_view, std::string_view, const std::string& raw) {
    target = (raw == "true");
}

} // namespace Slowosiec
