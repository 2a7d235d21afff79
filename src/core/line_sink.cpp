#include "gridcsv/core.hpp"

namespace gridcsv::core {

// StreamLineSink implementation

StreamLineSink::StreamLineSink(std::ostream& out,
                               const TextEncoding& encoding,
                               CsvOptions::Newline newline)
    : m_out(out)
    , m_encoding(encoding)
    , m_terminator(newline == CsvOptions::Newline::CRLF ? "\r\n" : "\n") {}

void StreamLineSink::writeLine(std::string_view line) {
    writePreamble();

    // Terminator is encoded with the line so multi-byte encodings stay aligned
    m_buffer.clear();
    m_encoding.encodeAppend(line, m_buffer);
    m_encoding.encodeAppend(m_terminator, m_buffer);
    writeBytes(m_buffer);

    ++m_linesWritten;
}

void StreamLineSink::flush() {
    writePreamble();
    m_out.flush();
    if (!m_out) {
        throw IoError("Failed to flush CSV output");
    }
}

void StreamLineSink::writePreamble() {
    if (m_preambleWritten) {
        return;
    }
    m_preambleWritten = true;
    writeBytes(m_encoding.preamble());
}

void StreamLineSink::writeBytes(const ByteVector& bytes) {
    if (bytes.empty()) {
        return;
    }

    m_out.write(reinterpret_cast<const char*>(bytes.data()),
                static_cast<std::streamsize>(bytes.size()));
    if (!m_out) {
        throw IoError("Failed to write CSV output after " + std::to_string(m_linesWritten) + " lines");
    }
}

// FileLineSink implementation

FileLineSink::FileLineSink(const std::string& path,
                           const TextEncoding& encoding,
                           CsvOptions::Newline newline)
    : m_path(path)
    , m_file(path, std::ios::binary | std::ios::out | std::ios::trunc)
    , m_sink(m_file, encoding, newline) {
    if (!m_file.is_open()) {
        throw IoError("Failed to open file for writing: " + path);
    }
}

void FileLineSink::writeLine(std::string_view line) {
    m_sink.writeLine(line);
}

void FileLineSink::flush() {
    m_sink.flush();
}

} // namespace gridcsv::core
