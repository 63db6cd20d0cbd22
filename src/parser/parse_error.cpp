#include <parser/parse_error.hpp>

namespace Slowosiec {

IoError::IoError(const std::string& path, const std::string& reason)
    : ParseError(ParseErrorKind::Io, "Cannot read " + path + ": " + reason),
      path_(path) {}

MalformedXmlError::MalformedXmlError(uint64_t line, uint64_t column, int64_t byte_offset,
                                     const std::string& reason)
    : ParseError(ParseErrorKind::MalformedXml,
                 "Malformed XML at line " + std::to_string(line) + ", column " + std::to_string(column) +
                 " (byte " + std::to_string(byte_offset) + "): " + reason),
      line_(line), column_(column), byte_offset_(byte_offset), reason_(reason) {}

InvalidAttributeValueError::InvalidAttributeValueError(const std::string& tag, const std::string& field,
                                                       const std::string& raw_value)
    : ParseError(ParseErrorKind::InvalidAttributeValue,
                 "Invalid value for <" + tag + "> " + field + ": \"" + raw_value + "\""),
      tag_(tag), field_(field), raw_value_(raw_value) {}

MissingRootError::MissingRootError()
    : ParseError(ParseErrorKind::MissingRoot, "No root <array-list> element opened before entity data or end of input") {}

UnexpectedElementError::UnexpectedElementError(const std::string& tag, const std::string& detail)
    : ParseError(ParseErrorKind::UnexpectedElement, "Unexpected element <" + tag + ">: " + detail),
      tag_(tag) {}

} // namespace Slowosiec
