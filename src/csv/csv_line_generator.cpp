#include "gridcsv/core.hpp"

namespace gridcsv::core {

CsvLineGenerator::CsvLineGenerator(const Table& table, const CsvOptions& options)
    : m_table(&table)
    , m_options(options)
    , m_stage(Stage::SeparatorHint) {
    m_options.validate();
}

std::optional<std::string> CsvLineGenerator::next() {
    // Stages fall through when disabled, so each call yields at most one line
    switch (m_stage) {
        case Stage::SeparatorHint:
            m_stage = Stage::Header;
            if (m_options.includeSeparatorHint) {
                ++m_linesProduced;
                return std::string("sep=") + m_options.delimiter;
            }
            [[fallthrough]];

        case Stage::Header:
            m_stage = Stage::Rows;
            if (m_options.includeHeader) {
                ++m_linesProduced;
                return buildHeaderLine();
            }
            [[fallthrough]];

        case Stage::Rows:
            if (m_rowIndex < m_table->rowCount()) {
                ++m_linesProduced;
                return buildRowLine(m_table->rows()[m_rowIndex++]);
            }
            m_stage = Stage::Done;
            [[fallthrough]];

        case Stage::Done:
        default:
            return std::nullopt;
    }
}

std::string CsvLineGenerator::buildHeaderLine() const {
    std::string line;
    bool firstField = true;

    for (const auto& name : m_table->columns().names()) {
        if (!firstField) {
            line.push_back(m_options.delimiter);
        }
        firstField = false;

        if (m_options.escapeHeader) {
            line.append(CellFormatter::escapeText(name, m_options.delimiter,
                                                  m_options.truncateLength,
                                                  m_options.maxCellLength));
        } else {
            line.append(name);
        }
    }

    return line;
}

std::string CsvLineGenerator::buildRowLine(const RowData& row) const {
    std::string line;
    bool firstField = true;

    // Columns the row never set read as null
    for (const auto& column : m_table->columns().names()) {
        if (!firstField) {
            line.push_back(m_options.delimiter);
        }
        firstField = false;

        const CellValue* cell = row.findCell(column);
        if (cell) {
            line.append(CellFormatter::formatCell(*cell, m_options.delimiter,
                                                  m_options.truncateLength,
                                                  m_options.maxCellLength));
        }
    }

    return line;
}

} // namespace gridcsv::core
