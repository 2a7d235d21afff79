#include "gridcsv.hpp"
#include "gridcsv/core.hpp"

namespace gridcsv {

class CsvExport::Impl {
public:
    core::Table table;

    // All three output surfaces drain the same generator
    template <typename LineHandler>
    void forEachLine(const CsvOptions& options, LineHandler&& handler) const {
        core::CsvLineGenerator generator(table, options);
        while (auto line = generator.next()) {
            handler(*line);
        }
    }
};

// CellProxy implementation

CsvExport::CellProxy& CsvExport::CellProxy::operator=(CellValue value) {
    m_owner.setCell(m_column, std::move(value));
    return *this;
}

// CsvExport implementation

CsvExport::CsvExport() : m_impl(std::make_unique<Impl>()) {}

CsvExport::~CsvExport() = default;

CsvExport::CsvExport(CsvExport&&) noexcept = default;

CsvExport& CsvExport::operator=(CsvExport&&) noexcept = default;

void CsvExport::addRow() {
    m_impl->table.addRow();
}

void CsvExport::setCell(const std::string& column, CellValue value) {
    m_impl->table.setCell(column, std::move(value));
}

CsvExport::CellProxy CsvExport::operator[](const std::string& column) {
    return CellProxy(*this, column);
}

std::size_t CsvExport::rowCount() const {
    return m_impl->table.rowCount();
}

std::size_t CsvExport::columnCount() const {
    return m_impl->table.columnCount();
}

const std::vector<std::string>& CsvExport::columns() const {
    return m_impl->table.columns().names();
}

const CellValue& CsvExport::cell(std::size_t row, const std::string& column) const {
    return m_impl->table.cell(row, column);
}

const core::Table& CsvExport::table() const {
    return m_impl->table;
}

void CsvExport::clear() {
    m_impl->table.clear();
}

core::CsvLineGenerator CsvExport::lines(const CsvOptions& options) const {
    return core::CsvLineGenerator(m_impl->table, options);
}

std::string CsvExport::exportText(const CsvOptions& options) const {
    const std::string terminator = options.terminator();
    std::string result;

    m_impl->forEachLine(options, [&](const std::string& line) {
        result.append(line);
        result.append(terminator);
    });

    return result;
}

void CsvExport::exportToSink(LineSink& sink, const CsvOptions& options) const {
    m_impl->forEachLine(options, [&](const std::string& line) {
        sink.writeLine(line);
    });
    sink.flush();
}

void CsvExport::exportToStream(std::ostream& out,
                               const TextEncoding& encoding,
                               const CsvOptions& options) const {
    core::StreamLineSink sink(out, encoding, options.newline);
    exportToSink(sink, options);
}

void CsvExport::exportToFile(const std::string& path, const CsvOptions& options) const {
    exportToFile(path, TextEncoding::utf8(), options);
}

void CsvExport::exportToFile(const std::string& path,
                             const TextEncoding& encoding,
                             const CsvOptions& options) const {
    // Validate before the file is created or truncated
    options.validate();

    core::FileLineSink sink(path, encoding, options.newline);
    exportToSink(sink, options);
}

ByteVector CsvExport::exportToBytes() const {
    return exportToBytes(TextEncoding::utf8());
}

ByteVector CsvExport::exportToBytes(const TextEncoding& encoding, const CsvOptions& options) const {
    std::string text = exportText(options);

    ByteVector result(encoding.preamble());
    encoding.encodeAppend(text, result);
    return result;
}

} // namespace gridcsv
