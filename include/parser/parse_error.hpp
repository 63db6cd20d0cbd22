#pragma once

#include <export.hpp>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace Slowosiec {

enum class ParseErrorKind {
    Io,
    MalformedXml,
    InvalidAttributeValue,
    MissingRoot,
    UnexpectedElement
};

/**
 * @brief Base of every error that aborts a load.
 *
 * A load either returns a complete graph or throws one of these.
 */
class SLOWOSIEC_API ParseError : public std::runtime_error {
public:
    ParseError(ParseErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ParseErrorKind kind() const { return kind_; }

private:
    ParseErrorKind kind_;
};

/// Input could not be opened or read.
class SLOWOSIEC_API IoError : public ParseError {
public:
    IoError(const std::string& path, const std::string& reason);

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

/// The tokenizer rejected the document.
class SLOWOSIEC_API MalformedXmlError : public ParseError {
public:
    MalformedXmlError(uint64_t line, uint64_t column, int64_t byte_offset, const std::string& reason);

    uint64_t line() const { return line_; }
    uint64_t column() const { return column_; }
    int64_t byte_offset() const { return byte_offset_; }
    const std::string& reason() const { return reason_; }

private:
    uint64_t line_;
    uint64_t column_;
    int64_t byte_offset_;
    std::string reason_;
};

/// An attribute was present but could not be coerced to its declared type.
class SLOWOSIEC_API InvalidAttributeValueError : public ParseError {
public:
    InvalidAttributeValueError(const std::string& tag, const std::string& field, const std::string& raw_value);

    const std::string& tag() const { return tag_; }
    const std::string& field() const { return field_; }
    const std::string& raw_value() const { return raw_value_; }

private:
    std::string tag_;
    std::string field_;
    std::string raw_value_;
};

/// End of input without the root container.
class SLOWOSIEC_API MissingRootError : public ParseError {
public:
    MissingRootError();
};

/// An element appeared where no transition accepts it.
class SLOWOSIEC_API UnexpectedElementError : public ParseError {
public:
    UnexpectedElementError(const std::string& tag, const std::string& detail);

    const std::string& tag() const { return tag_; }

private:
    std::string tag_;
};

} // namespace Slowosiec
