#include <parser/xml_event_source.hpp>
#include <parser/parse_error.hpp>
#include <expat.h>
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <deque>
#include <exception>
#include <stdexcept>

namespace Slowosiec {

struct XmlEventSource::Impl {
    std::string path;                 // "<memory>" for in-memory input
    FILE* file = nullptr;
    std::string memory;
    size_t memory_pos = 0;

    XML_Parser parser = nullptr;
    std::vector<char> buffer;         // reused for every chunk

    std::deque<XmlEvent> pending;
    std::string text;                 // character data not yet flushed
    bool finished = false;

    // expat is C; exceptions from callbacks are parked here and rethrown
    std::exception_ptr pending_exception;

    explicit Impl(size_t buffer_size) {
        if (buffer_size == 0 || buffer_size > MAX_BUFFER_SIZE) {
            throw std::invalid_argument("XmlEventSource: buffer size out of range: " + std::to_string(buffer_size));
        }
        buffer.resize(buffer_size);

        parser = XML_ParserCreate(nullptr);
        if (!parser) {
            throw std::runtime_error("XmlEventSource: failed to create XML parser");
        }
        XML_SetUserData(parser, this);
        XML_SetElementHandler(parser, start_element_handler, end_element_handler);
        XML_SetCharacterDataHandler(parser, char_data_handler);
    }

    ~Impl() {
        if (parser) XML_ParserFree(parser);
        if (file) std::fclose(file);
    }

    void flush_text() {
        if (text.empty()) return;
        XmlEvent ev;
        ev.type = XmlEventType::Text;
        ev.text.swap(text);
        pending.push_back(std::move(ev));
    }

    void on_start_element(const char* name, const char** attrs) {
        flush_text();
        XmlEvent ev;
        ev.type = XmlEventType::Start;
        ev.name = name;
        for (size_t i = 0; attrs[i]; i += 2) {
            ev.attributes.push_back({attrs[i], attrs[i + 1]});
        }
        pending.push_back(std::move(ev));
    }

    void on_end_element(const char* name) {
        flush_text();
        // expat reports a zero-length end event for the closing half of <tag/>
        if (XML_GetCurrentByteCount(parser) == 0 && !pending.empty() &&
            pending.back().type == XmlEventType::Start && pending.back().name == name) {
            pending.back().type = XmlEventType::Empty;
            return;
        }
        XmlEvent ev;
        ev.type = XmlEventType::End;
        ev.name = name;
        pending.push_back(std::move(ev));
    }

    void on_char_data(const char* s, int len) {
        text.append(s, static_cast<size_t>(len));
    }

    static void XMLCALL start_element_handler(void* user_data, const char* name, const char** attrs) {
        auto* self = static_cast<Impl*>(user_data);
        if (self->pending_exception) return;
        try {
            self->on_start_element(name, attrs);
        } catch (...) {
            self->pending_exception = std::current_exception();
            XML_StopParser(self->parser, XML_FALSE);
        }
    }

    static void XMLCALL end_element_handler(void* user_data, const char* name) {
        auto* self = static_cast<Impl*>(user_data);
        if (self->pending_exception) return;
        try {
            self->on_end_element(name);
        } catch (...) {
            self->pending_exception = std::current_exception();
            XML_StopParser(self->parser, XML_FALSE);
        }
    }

    static void XMLCALL char_data_handler(void* user_data, const char* s, int len) {
        auto* self = static_cast<Impl*>(user_data);
        if (self->pending_exception) return;
        try {
            self->on_char_data(s, len);
        } catch (...) {
            self->pending_exception = std::current_exception();
            XML_StopParser(self->parser, XML_FALSE);
        }
    }

    size_t read_chunk() {
        if (file) {
            size_t n = std::fread(buffer.data(), 1, buffer.size(), file);
            if (n < buffer.size() && std::ferror(file)) {
                throw IoError(path, std::strerror(errno));
            }
            return n;
        }
        size_t n = std::min(buffer.size(), memory.size() - memory_pos);
        std::memcpy(buffer.data(), memory.data() + memory_pos, n);
        memory_pos += n;
        return n;
    }

    // Feed chunks to expat until at least one event is queued or input ends
    void fill() {
        while (pending.empty() && !finished) {
            size_t bytes_read = read_chunk();
            bool is_final = (bytes_read == 0);

            auto status = XML_Parse(parser, buffer.data(), static_cast<int>(bytes_read), is_final);

            if (pending_exception) {
                finished = true;
                std::rethrow_exception(pending_exception);
            }

            if (status == XML_STATUS_ERROR) {
                finished = true;
                throw MalformedXmlError(XML_GetCurrentLineNumber(parser),
                                        XML_GetCurrentColumnNumber(parser),
                                        XML_GetCurrentByteIndex(parser),
                                        XML_ErrorString(XML_GetErrorCode(parser)));
            }

            if (is_final) {
                flush_text();
                finished = true;
            }
        }
    }
};

XmlEventSource::XmlEventSource(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}

XmlEventSource::XmlEventSource(XmlEventSource&&) noexcept = default;
XmlEventSource& XmlEventSource::operator=(XmlEventSource&&) noexcept = default;
XmlEventSource::~XmlEventSource() = default;

XmlEventSource XmlEventSource::from_file(const std::string& path, size_t buffer_size) {
    auto impl = std::make_unique<Impl>(buffer_size);
    impl->path = path;
    impl->file = std::fopen(path.c_str(), "rb");
    if (!impl->file) {
        throw IoError(path, std::strerror(errno));
    }
    return XmlEventSource(std::move(impl));
}

XmlEventSource XmlEventSource::from_string(std::string xml, size_t buffer_size) {
    auto impl = std::make_unique<Impl>(buffer_size);
    impl->path = "<memory>";
    impl->memory = std::move(xml);
    return XmlEventSource(std::move(impl));
}

XmlEvent XmlEventSource::next() {
    impl_->fill();
    if (impl_->pending.empty()) {
        return XmlEvent{};
    }
    XmlEvent ev = std::move(impl_->pending.front());
    impl_->pending.pop_front();
    return ev;
}

} // namespace Slowosiec
