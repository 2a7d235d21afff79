#pragma once

#include "gridcsv/types.hpp"

#include <cstddef>
#include <fstream>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace gridcsv::core {

// Insertion ordered set of column names
class ColumnRegistry {
public:
    // Returns the index of the name, appending it when first seen
    std::size_t add(const std::string& name);

    bool contains(const std::string& name) const;
    std::optional<std::size_t> indexOf(const std::string& name) const;

    const std::vector<std::string>& names() const { return m_names; }
    std::size_t size() const { return m_names.size(); }
    bool empty() const { return m_names.empty(); }
    void clear();

private:
    std::vector<std::string> m_names;
    std::unordered_map<std::string, std::size_t> m_index;
};

// Sparse row: only the cells that were set are stored
struct RowData {
    std::unordered_map<std::string, CellValue> cells;

    const CellValue* findCell(const std::string& column) const;
    CellValue* findCell(const std::string& column);
};

class Table {
public:
    // Appends an empty row that becomes the target of setCell
    void addRow();

    // Throws std::out_of_range when no row has been added yet
    void setCell(const std::string& column, CellValue value);

    bool hasCurrentRow() const { return !m_rows.empty(); }
    std::size_t rowCount() const { return m_rows.size(); }
    std::size_t columnCount() const { return m_columns.size(); }

    const ColumnRegistry& columns() const { return m_columns; }
    const std::vector<RowData>& rows() const { return m_rows; }
    const RowData& row(std::size_t index) const;

    // Null for a cell the row never set
    const CellValue& cell(std::size_t row, const std::string& column) const;

    void clear();

private:
    ColumnRegistry m_columns;
    std::vector<RowData> m_rows;
};

// Converts cell values to escaped CSV fields
class CellFormatter {
public:
    static std::string formatCell(const CellValue& value,
                                  char delimiter = ',',
                                  std::size_t truncateLength = EXCEL_TRUNCATE_LENGTH,
                                  std::size_t maxCellLength = EXCEL_MAX_CELL_LENGTH);

    // Canonical text of a value before escaping
    static std::string toText(const CellValue& value);

    // Quoting and length capping applied to already converted text.
    // Both limits are in cellLength() units.
    static std::string escapeText(std::string text,
                                  char delimiter,
                                  std::size_t truncateLength = EXCEL_TRUNCATE_LENGTH,
                                  std::size_t maxCellLength = EXCEL_MAX_CELL_LENGTH);

    // Length in UTF-16 code units, the unit spreadsheet cell limits count
    static std::size_t cellLength(std::string_view text);

    static bool needsQuoting(std::string_view text, char delimiter);
    static std::string formatNumber(double number);
};

// Lazy, forward-only producer of CSV lines (no terminators).
// Borrows the table, which must outlive the generator. Each line reflects
// the table at the moment it is pulled.
class CsvLineGenerator {
public:
    CsvLineGenerator(const Table& table, const CsvOptions& options);

    // Next line, or nullopt once the sequence is exhausted
    std::optional<std::string> next();

    bool done() const { return m_stage == Stage::Done; }
    std::size_t linesProduced() const { return m_linesProduced; }

private:
    enum class Stage { SeparatorHint, Header, Rows, Done };

    std::string buildHeaderLine() const;
    std::string buildRowLine(const RowData& row) const;

    const Table* m_table;
    CsvOptions m_options;
    Stage m_stage;
    std::size_t m_rowIndex = 0;
    std::size_t m_linesProduced = 0;
};

// Writes encoded lines to an output stream. The encoding preamble goes out
// before the first line, or on flush when no line was written.
class StreamLineSink : public LineSink {
public:
    StreamLineSink(std::ostream& out,
                   const TextEncoding& encoding,
                   CsvOptions::Newline newline = CsvOptions::Newline::CRLF);

    void writeLine(std::string_view line) override;
    void flush() override;

    std::size_t linesWritten() const { return m_linesWritten; }

private:
    void writePreamble();
    void writeBytes(const ByteVector& bytes);

    std::ostream& m_out;
    const TextEncoding& m_encoding;
    std::string m_terminator;
    bool m_preambleWritten = false;
    std::size_t m_linesWritten = 0;
    ByteVector m_buffer;
};

// StreamLineSink over a file it owns. Existing files are truncated.
class FileLineSink : public LineSink {
public:
    FileLineSink(const std::string& path,
                 const TextEncoding& encoding,
                 CsvOptions::Newline newline = CsvOptions::Newline::CRLF);

    void writeLine(std::string_view line) override;
    void flush() override;

    const std::string& path() const { return m_path; }

private:
    std::string m_path;
    std::ofstream m_file;
    StreamLineSink m_sink;
};

} // namespace gridcsv::core
