#include "gridcsv/core.hpp"
#include <stdexcept>

namespace gridcsv::core {

// ColumnRegistry implementation
std::size_t ColumnRegistry::add(const std::string& name) {
    auto it = m_index.find(name);
    if (it != m_index.end()) {
        return it->second;
    }

    std::size_t index = m_names.size();
    m_names.push_back(name);
    m_index.emplace(name, index);
    return index;
}

bool ColumnRegistry::contains(const std::string& name) const {
    return m_index.find(name) != m_index.end();
}

std::optional<std::size_t> ColumnRegistry::indexOf(const std::string& name) const {
    auto it = m_index.find(name);
    if (it == m_index.end()) {
        return std::nullopt;
    }
    return it->second;
}

void ColumnRegistry::clear() {
    m_names.clear();
    m_index.clear();
}

// RowData implementation
const CellValue* RowData::findCell(const std::string& column) const {
    auto it = cells.find(column);
    return it != cells.end() ? &it->second : nullptr;
}

CellValue* RowData::findCell(const std::string& column) {
    auto it = cells.find(column);
    return it != cells.end() ? &it->second : nullptr;
}

// Table implementation
void Table::addRow() {
    m_rows.emplace_back();
}

void Table::setCell(const std::string& column, CellValue value) {
    if (m_rows.empty()) {
        throw std::out_of_range("Cannot set cell '" + column + "': call addRow() first");
    }

    m_columns.add(column);
    m_rows.back().cells[column] = std::move(value);
}

const RowData& Table::row(std::size_t index) const {
    if (index >= m_rows.size()) {
        throw std::out_of_range("Row index " + std::to_string(index) + " out of range");
    }
    return m_rows[index];
}

const CellValue& Table::cell(std::size_t row, const std::string& column) const {
    static const CellValue NULL_CELL;

    const CellValue* found = this->row(row).findCell(column);
    return found ? *found : NULL_CELL;
}

void Table::clear() {
    m_columns.clear();
    m_rows.clear();
}

} // namespace gridcsv::core
