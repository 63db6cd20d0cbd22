/**
 * @file xml_event_source.hpp
 * @brief Pull-style XML events over expat
 */

#pragma once

#include <export.hpp>
#include <climits>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace Slowosiec {

enum class XmlEventType {
    Start,      // <tag ...>
    Empty,      // <tag .../>
    Text,       // character data between tags, coalesced
    End,        // </tag>
    Eof
};

struct XmlAttribute {
    std::string name;
    std::string value;
};

struct XmlEvent {
    XmlEventType type = XmlEventType::Eof;
    std::string name;                       // Start / Empty / End
    std::vector<XmlAttribute> attributes;   // Start / Empty
    std::string text;                       // Text

    /**
     * @brief Value of the attribute with exactly this name, or nullptr.
     */
    const std::string* attribute(std::string_view key) const {
        for (const auto& attr : attributes) {
            if (attr.name == key) return &attr.value;
        }
        return nullptr;
    }
};

/**
 * @brief Pull-style XML event stream over expat.
 *
 * expat pushes callbacks while it consumes one input chunk; the callbacks are
 * queued and handed out one at a time by next(). Character data is coalesced
 * into a single Text event per run between tags, so a value is never split by
 * a chunk boundary. A self-closing element is reported as one Empty event.
 *
 * Errors: IoError when the input cannot be read, MalformedXmlError when expat
 * rejects the document. After a throw the source must not be used again.
 *
 * A source is single-pass; read the document again with a new source.
 */
class SLOWOSIEC_API XmlEventSource {
public:
    static constexpr size_t DEFAULT_BUFFER_SIZE = 65536;
    static constexpr size_t MAX_BUFFER_SIZE = INT_MAX;   // expat takes chunk lengths as int

    static XmlEventSource from_file(const std::string& path, size_t buffer_size = DEFAULT_BUFFER_SIZE);
    static XmlEventSource from_string(std::string xml, size_t buffer_size = DEFAULT_BUFFER_SIZE);

    XmlEventSource(XmlEventSource&&) noexcept;
    XmlEventSource& operator=(XmlEventSource&&) noexcept;
    ~XmlEventSource();

    /**
     * @brief Next event. Returns Eof once the input is exhausted, and keeps
     * returning Eof afterwards.
     */
    XmlEvent next();

private:
    struct Impl;
    explicit XmlEventSource(std::unique_ptr<Impl> impl);

    std::unique_ptr<Impl> impl_;
};

} // namespace Slowosiec
