#include "gridcsv/types.hpp"
#include <libxml/encoding.h>
#include <libxml/parser.h>
#include <libxml/xmlstring.h>
#include <algorithm>
#include <cctype>
#include <map>
#include <mutex>

#ifdef LIBXML_ICONV_ENABLED
#include <cerrno>
#include <iconv.h>
#endif

namespace gridcsv {

namespace {

constexpr std::size_t CHUNK_SIZE = 16 * 1024;

void ensureLibxmlInitialized() {
    static std::once_flag once;
    std::call_once(once, [] { xmlInitParser(); });
}

std::string canonicalName(const std::string& name) {
    std::string upper;
    upper.reserve(name.size());
    for (char ch : name) {
        if (std::isspace(static_cast<unsigned char>(ch))) {
            continue;
        }
        upper.push_back(ch == '_' ? '-' : static_cast<char>(std::toupper(static_cast<unsigned char>(ch))));
    }

    static const std::map<std::string, std::string> ALIASES = {
        {"UTF8", "UTF-8"},
        {"UTF-16", "UTF-16LE"},
        {"UTF16", "UTF-16LE"},
        {"UNICODE", "UTF-16LE"},
        {"UTF16LE", "UTF-16LE"},
        {"UTF16BE", "UTF-16BE"},
        {"UTF-32", "UTF-32LE"},
        {"UTF32", "UTF-32LE"},
        {"UTF32LE", "UTF-32LE"},
        {"UTF32BE", "UTF-32BE"},
        {"LATIN1", "ISO-8859-1"},
        {"LATIN-1", "ISO-8859-1"},
        {"ISO8859-1", "ISO-8859-1"},
        {"US-ASCII", "ASCII"},
    };

    auto it = ALIASES.find(upper);
    return it != ALIASES.end() ? it->second : upper;
}

ByteVector preambleFor(const std::string& canonical) {
    if (canonical == "UTF-8") return {0xEF, 0xBB, 0xBF};
    if (canonical == "UTF-16LE") return {0xFF, 0xFE};
    if (canonical == "UTF-16BE") return {0xFE, 0xFF};
    if (canonical == "UTF-32LE") return {0xFF, 0xFE, 0x00, 0x00};
    if (canonical == "UTF-32BE") return {0x00, 0x00, 0xFE, 0xFF};
    return {};
}

// Registered built-in handlers are left alone by xmlCharEncCloseFunc;
// iconv backed ones are released
struct HandlerDeleter {
    void operator()(xmlCharEncodingHandler* handler) const {
        if (handler) {
            xmlCharEncCloseFunc(handler);
        }
    }
};

using HandlerPtr = std::unique_ptr<xmlCharEncodingHandler, HandlerDeleter>;

bool hasConverter(const xmlCharEncodingHandler* handler) {
    if (handler->output) {
        return true;
    }
#ifdef LIBXML_ICONV_ENABLED
    if (handler->iconv_out) {
        return true;
    }
#endif
    return false;
}

} // namespace

class TextEncoding::Impl {
public:
    // A null handler means UTF-8 pass-through
    Impl(std::string name, ByteVector preamble, HandlerPtr handler)
        : m_name(std::move(name))
        , m_preamble(std::move(preamble))
        , m_handler(std::move(handler))
        , m_buffer(CHUNK_SIZE * 4) {}

    const std::string& name() const {
        return m_name;
    }

    const ByteVector& preamble() const {
        return m_preamble;
    }

    void encodeAppend(std::string_view text, ByteVector& out) {
        if (!m_handler) {
            validateUtf8(text);
            out.insert(out.end(), text.begin(), text.end());
            return;
        }

        if (m_handler->output) {
            encodeWithHandler(text, out);
            return;
        }

#ifdef LIBXML_ICONV_ENABLED
        if (m_handler->iconv_out) {
            encodeWithIconv(text, out);
            return;
        }
#endif

        throw EncodingError("No output converter available for encoding " + m_name);
    }

private:
    void validateUtf8(std::string_view text) const {
        const auto* data = reinterpret_cast<const unsigned char*>(text.data());
        std::size_t pos = 0;

        while (pos < text.size()) {
            if (data[pos] < 0x80) {
                ++pos;
                continue;
            }

            int len = static_cast<int>(std::min<std::size_t>(text.size() - pos, 4));
            if (xmlGetUTF8Char(data + pos, &len) < 0 || len <= 0) {
                throw EncodingError("Invalid UTF-8 sequence at byte offset " + std::to_string(pos));
            }
            pos += static_cast<std::size_t>(len);
        }
    }

    void encodeWithHandler(std::string_view text, ByteVector& out) {
        const auto* data = reinterpret_cast<const unsigned char*>(text.data());
        std::size_t offset = 0;

        while (offset < text.size()) {
            int inLen = static_cast<int>(std::min(text.size() - offset, CHUNK_SIZE));
            int outLen = static_cast<int>(m_buffer.size());

            int ret = m_handler->output(m_buffer.data(), &outLen, data + offset, &inLen);

            if (ret == -2) {
                std::size_t failedAt = offset + static_cast<std::size_t>(std::max(inLen, 0));
                throw EncodingError("Character at byte offset " + std::to_string(failedAt) +
                                    " cannot be encoded as " + m_name);
            }

            // A chunk may end inside a multi-byte sequence; the remainder is
            // picked up by the next call. No progress means truncated input.
            if (inLen <= 0 || outLen < 0) {
                throw EncodingError("Incomplete UTF-8 sequence at byte offset " + std::to_string(offset));
            }

            out.insert(out.end(), m_buffer.begin(), m_buffer.begin() + outLen);
            offset += static_cast<std::size_t>(inLen);
        }
    }

#ifdef LIBXML_ICONV_ENABLED
    void encodeWithIconv(std::string_view text, ByteVector& out) {
        iconv_t cd = m_handler->iconv_out;
        constexpr std::size_t ICONV_ERROR = static_cast<std::size_t>(-1);

        // Reset shift state left by a previous call
        iconv(cd, nullptr, nullptr, nullptr, nullptr);

        char* in = const_cast<char*>(text.data());
        std::size_t inLeft = text.size();

        while (inLeft > 0) {
            char* outPtr = reinterpret_cast<char*>(m_buffer.data());
            std::size_t outLeft = m_buffer.size();

            std::size_t ret = iconv(cd, &in, &inLeft, &outPtr, &outLeft);
            out.insert(out.end(), m_buffer.data(), reinterpret_cast<unsigned char*>(outPtr));

            if (ret == ICONV_ERROR) {
                if (errno == E2BIG) {
                    continue;
                }
                std::size_t failedAt = text.size() - inLeft;
                if (errno == EILSEQ) {
                    throw EncodingError("Character at byte offset " + std::to_string(failedAt) +
                                        " cannot be encoded as " + m_name);
                }
                throw EncodingError("Incomplete UTF-8 sequence at byte offset " + std::to_string(failedAt));
            }
        }

        char* outPtr = reinterpret_cast<char*>(m_buffer.data());
        std::size_t outLeft = m_buffer.size();
        if (iconv(cd, nullptr, nullptr, &outPtr, &outLeft) == ICONV_ERROR) {
            throw EncodingError("Failed to finish conversion to " + m_name);
        }
        out.insert(out.end(), m_buffer.data(), reinterpret_cast<unsigned char*>(outPtr));
    }
#endif

    std::string m_name;
    ByteVector m_preamble;
    HandlerPtr m_handler;
    std::vector<unsigned char> m_buffer;
};

// TextEncoding implementation

TextEncoding::TextEncoding(std::unique_ptr<Impl> impl) : m_impl(std::move(impl)) {}

TextEncoding::~TextEncoding() = default;

TextEncoding::TextEncoding(TextEncoding&&) noexcept = default;

TextEncoding& TextEncoding::operator=(TextEncoding&&) noexcept = default;

TextEncoding TextEncoding::utf8() {
    return fromName("UTF-8", true);
}

TextEncoding TextEncoding::utf8NoBom() {
    return fromName("UTF-8", false);
}

TextEncoding TextEncoding::utf16le() {
    return fromName("UTF-16LE", true);
}

TextEncoding TextEncoding::utf16be() {
    return fromName("UTF-16BE", true);
}

TextEncoding TextEncoding::latin1() {
    return fromName("ISO-8859-1", true);
}

TextEncoding TextEncoding::ascii() {
    return fromName("ASCII", true);
}

TextEncoding TextEncoding::fromName(const std::string& name, bool emitPreamble) {
    std::string canonical = canonicalName(name);
    if (canonical.empty()) {
        throw EncodingError("Encoding name is empty");
    }

    ByteVector preamble = emitPreamble ? preambleFor(canonical) : ByteVector{};

    if (canonical == "UTF-8") {
        return TextEncoding(std::make_unique<Impl>(canonical, std::move(preamble), nullptr));
    }

    ensureLibxmlInitialized();
    HandlerPtr handler(xmlFindCharEncodingHandler(canonical.c_str()));
    if (!handler) {
        throw EncodingError("Unsupported encoding: " + name);
    }
    if (!hasConverter(handler.get())) {
        throw EncodingError("Encoding cannot be used for output: " + name);
    }

    return TextEncoding(std::make_unique<Impl>(canonical, std::move(preamble), std::move(handler)));
}

const std::string& TextEncoding::name() const {
    return m_impl->name();
}

const ByteVector& TextEncoding::preamble() const {
    return m_impl->preamble();
}

ByteVector TextEncoding::encode(std::string_view text) const {
    ByteVector out;
    out.reserve(text.size());
    m_impl->encodeAppend(text, out);
    return out;
}

void TextEncoding::encodeAppend(std::string_view text, ByteVector& out) const {
    m_impl->encodeAppend(text, out);
}

} // namespace gridcsv
