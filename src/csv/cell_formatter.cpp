#include "gridcsv/core.hpp"
#include <charconv>
#include <cmath>
#include <system_error>

namespace gridcsv::core {

namespace {

// UTF-16 code units taken by the UTF-8 sequence this byte starts.
// Continuation bytes count nothing.
std::size_t utf16Units(unsigned char byte) {
    if ((byte & 0xC0) == 0x80) {
        return 0;
    }
    return byte >= 0xF0 ? 2 : 1;
}

// Byte length of the longest prefix within limit code units. Never splits a
// UTF-8 sequence or a surrogate pair.
std::size_t prefixBytes(std::string_view text, std::size_t limit) {
    std::size_t units = 0;
    for (std::size_t pos = 0; pos < text.size(); ++pos) {
        std::size_t width = utf16Units(static_cast<unsigned char>(text[pos]));
        if (width == 0) {
            continue;
        }
        if (units + width > limit) {
            return pos;
        }
        units += width;
    }
    return text.size();
}

} // namespace

std::string CellFormatter::formatCell(const CellValue& value,
                                      char delimiter,
                                      std::size_t truncateLength,
                                      std::size_t maxCellLength) {
    // Null needs no quoting
    if (value.isNull()) {
        return "";
    }
    return escapeText(toText(value), delimiter, truncateLength, maxCellLength);
}

std::string CellFormatter::toText(const CellValue& value) {
    switch (value.type()) {
        case CellType::Null:
            return "";

        case CellType::Boolean:
            return std::get<bool>(value.value) ? "True" : "False";

        case CellType::Integer:
            return std::to_string(std::get<std::int64_t>(value.value));

        case CellType::Unsigned:
            return std::to_string(std::get<std::uint64_t>(value.value));

        case CellType::Number:
            return formatNumber(std::get<double>(value.value));

        case CellType::DateTime:
            return std::get<DateTime>(value.value).toString();

        case CellType::String:
        default:
            return std::get<std::string>(value.value);
    }
}

std::string CellFormatter::escapeText(std::string text,
                                      char delimiter,
                                      std::size_t truncateLength,
                                      std::size_t maxCellLength) {
    if (needsQuoting(text, delimiter)) {
        std::string quoted;
        quoted.reserve(text.size() + 2);
        quoted.push_back('"');
        for (char ch : text) {
            if (ch == '"') {
                quoted.push_back('"');
            }
            quoted.push_back(ch);
        }
        quoted.push_back('"');
        text = std::move(quoted);
    }

    // Excel rejects very long cells; keep the quoting balanced where possible
    std::size_t length = cellLength(text);
    if (length > truncateLength) {
        bool endsWithQuote = text.back() == '"';
        text.resize(prefixBytes(text, truncateLength));
        length = cellLength(text);
        if (endsWithQuote) {
            text.push_back('"');
            ++length;
        }
    }

    // Hard ceiling wins over the rebalancing above
    if (length > maxCellLength) {
        text.resize(prefixBytes(text, maxCellLength));
    }

    return text;
}

std::size_t CellFormatter::cellLength(std::string_view text) {
    std::size_t units = 0;
    for (char ch : text) {
        units += utf16Units(static_cast<unsigned char>(ch));
    }
    return units;
}

bool CellFormatter::needsQuoting(std::string_view text, char delimiter) {
    for (char ch : text) {
        if (ch == delimiter || ch == '"' || ch == '\n' || ch == '\r') {
            return true;
        }
    }
    return false;
}

std::string CellFormatter::formatNumber(double number) {
    if (std::isnan(number)) return "NaN";
    if (std::isinf(number)) return number > 0 ? "Infinity" : "-Infinity";
    if (number == 0.0) return std::signbit(number) ? "-0" : "0";

    // Integral values print without fraction or exponent
    if (number == std::floor(number) && std::abs(number) < 1e15) {
        return std::to_string(static_cast<long long>(number));
    }

    double magnitude = std::abs(number);
    std::chars_format format = (magnitude >= 1e-4 && magnitude < 1e15)
        ? std::chars_format::fixed
        : std::chars_format::scientific;

    // Shortest representation that round-trips
    char buffer[64];
    auto [ptr, ec] = std::to_chars(buffer, buffer + sizeof(buffer), number, format);
    if (ec != std::errc{}) {
        throw GridCsvError("Failed to format number");
    }

    // Exponent is written "E+XX" / "E-XX"
    std::string result(buffer, ptr);
    std::size_t exponent = result.find('e');
    if (exponent != std::string::npos) {
        result[exponent] = 'E';
    }
    return result;
}

} // namespace gridcsv::core
