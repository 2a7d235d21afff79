#pragma once

#include "gridcsv/types.hpp"
#include "gridcsv/core.hpp"

#include <memory>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace gridcsv {

/**
 * Builds a table row by row and exports it as CSV.
 *
 *   CsvExport csv;
 *   csv.addRow();
 *   csv["Region"] = "New York, USA";
 *   csv["Sales"] = 100000;
 *   csv["Date Opened"] = DateTime::fromComponents(2003, 12, 31);
 *
 *   std::string text = csv.exportText();
 *   csv.exportToFile("report.csv");
 *   ByteVector bytes = csv.exportToBytes();
 *
 * Columns are ordered by first use. Not thread safe: populate and export
 * from one thread, or serialize access externally.
 */
class CsvExport {
public:
    // Result of operator[]; assigning to it sets the cell on the current row
    class CellProxy {
    public:
        CellProxy& operator=(CellValue value);

    private:
        friend class CsvExport;
        CellProxy(CsvExport& owner, std::string column)
            : m_owner(owner), m_column(std::move(column)) {}

        CsvExport& m_owner;
        std::string m_column;
    };

    CsvExport();
    ~CsvExport();

    CsvExport(CsvExport&&) noexcept;
    CsvExport& operator=(CsvExport&&) noexcept;

    // Call before setting any cell of a new row
    void addRow();

    // Throws std::out_of_range when addRow() was never called
    void setCell(const std::string& column, CellValue value);

    CellProxy operator[](const std::string& column);

    // Adds one row per record. The extractor maps a record to its
    // (name, value) fields and is called once per record, in order.
    template <typename Range, typename Extractor>
    void addRows(const Range& records, Extractor&& extractor) {
        for (const auto& record : records) {
            addRow();
            for (auto& field : extractor(record)) {
                setCell(field.first, std::move(field.second));
            }
        }
    }

    std::size_t rowCount() const;
    std::size_t columnCount() const;
    const std::vector<std::string>& columns() const;
    const CellValue& cell(std::size_t row, const std::string& column) const;
    const core::Table& table() const;
    void clear();

    // Lines on demand. The generator borrows this exporter's table.
    core::CsvLineGenerator lines(const CsvOptions& options = CsvOptions{}) const;

    std::string exportText(const CsvOptions& options = CsvOptions{}) const;

    // Streams lines into the sink without building the whole text
    void exportToSink(LineSink& sink, const CsvOptions& options = CsvOptions{}) const;

    void exportToStream(std::ostream& out,
                        const TextEncoding& encoding,
                        const CsvOptions& options = CsvOptions{}) const;

    // UTF-8 with byte order mark
    void exportToFile(const std::string& path,
                      const CsvOptions& options = CsvOptions{}) const;

    void exportToFile(const std::string& path,
                      const TextEncoding& encoding,
                      const CsvOptions& options = CsvOptions{}) const;

    // UTF-8 with byte order mark, default options
    ByteVector exportToBytes() const;

    // Encoding preamble followed by the encoded text
    ByteVector exportToBytes(const TextEncoding& encoding,
                             const CsvOptions& options = CsvOptions{}) const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace gridcsv
