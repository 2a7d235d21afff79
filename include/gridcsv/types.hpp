#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace gridcsv {

// Spreadsheet cell length limits
constexpr std::size_t EXCEL_TRUNCATE_LENGTH = 30000;
constexpr std::size_t EXCEL_MAX_CELL_LENGTH = 32767;

using ByteVector = std::vector<uint8_t>;

// Base class for all library errors
class GridCsvError : public std::runtime_error {
public:
    explicit GridCsvError(const std::string& message) : std::runtime_error(message) {}
};

// Unknown encoding or text the target encoding cannot represent
class EncodingError : public GridCsvError {
public:
    explicit EncodingError(const std::string& message) : GridCsvError(message) {}
};

// Destination could not be opened or written
class IoError : public GridCsvError {
public:
    explicit IoError(const std::string& message) : GridCsvError(message) {}
};

// Calendar date and time of day, seconds resolution, no time zone
struct DateTime {
    int year = 1;
    int month = 1;
    int day = 1;
    int hour = 0;
    int minute = 0;
    int second = 0;

    // Throws GridCsvError when a component is out of range
    static DateTime fromComponents(int year, int month, int day,
                                   int hour = 0, int minute = 0, int second = 0);

    // UTC calendar time of the given instant, fractional seconds dropped
    static DateTime fromTimePoint(std::chrono::system_clock::time_point timePoint);

    bool isMidnight() const {
        return hour == 0 && minute == 0 && second == 0;
    }

    // "YYYY-MM-DD" at midnight, "YYYY-MM-DD HH:MM:SS" otherwise
    std::string toString() const;

    bool operator==(const DateTime& other) const {
        return year == other.year && month == other.month && day == other.day &&
               hour == other.hour && minute == other.minute && second == other.second;
    }
    bool operator!=(const DateTime& other) const { return !(*this == other); }
};

enum class CellType {
    Null,
    Boolean,
    Integer,
    Unsigned,
    Number,
    String,
    DateTime
};

// Dynamically typed cell value. A default constructed value is null.
struct CellValue {
    using Storage = std::variant<std::monostate, bool, std::int64_t, std::uint64_t,
                                 double, std::string, DateTime>;

    Storage value;

    CellValue() = default;
    CellValue(std::nullptr_t) {}
    CellValue(const char* text) {
        if (text) {
            value = std::string(text);
        }
    }
    CellValue(std::string text) : value(std::move(text)) {}
    CellValue(std::string_view text) : value(std::string(text)) {}
    CellValue(char ch) : value(std::string(1, ch)) {}
    CellValue(bool flag) : value(flag) {}
    CellValue(const DateTime& dateTime) : value(dateTime) {}
    CellValue(std::chrono::system_clock::time_point timePoint)
        : value(DateTime::fromTimePoint(timePoint)) {}

    template <typename T,
              std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool> &&
                               !std::is_same_v<T, char>, int> = 0>
    CellValue(T number) {
        if constexpr (std::is_signed_v<T>) {
            value = static_cast<std::int64_t>(number);
        } else {
            value = static_cast<std::uint64_t>(number);
        }
    }

    template <typename T, std::enable_if_t<std::is_floating_point_v<T>, int> = 0>
    CellValue(T number) : value(static_cast<double>(number)) {}

    // An empty optional is the null sentinel
    template <typename T>
    CellValue(const std::optional<T>& maybe) {
        if (maybe.has_value()) {
            *this = CellValue(*maybe);
        }
    }

    CellType type() const;

    bool isNull() const { return std::holds_alternative<std::monostate>(value); }
    bool isString() const { return std::holds_alternative<std::string>(value); }
    bool isDateTime() const { return std::holds_alternative<DateTime>(value); }
    bool isNumeric() const {
        return std::holds_alternative<std::int64_t>(value) ||
               std::holds_alternative<std::uint64_t>(value) ||
               std::holds_alternative<double>(value);
    }

    bool operator==(const CellValue& other) const { return value == other.value; }
    bool operator!=(const CellValue& other) const { return !(*this == other); }
};

using Field = std::pair<std::string, CellValue>;
using FieldList = std::vector<Field>;

// Per-export formatting options
struct CsvOptions {
    enum class Newline { LF, CRLF };

    char delimiter = ',';
    bool includeHeader = true;
    bool includeSeparatorHint = false;   // emit "sep=<delimiter>" first
    Newline newline = Newline::CRLF;
    bool escapeHeader = false;           // quote header names like data cells
    std::size_t truncateLength = EXCEL_TRUNCATE_LENGTH;
    std::size_t maxCellLength = EXCEL_MAX_CELL_LENGTH;

    // Throws GridCsvError for an unusable combination
    void validate() const;

    const char* terminator() const {
        return newline == Newline::CRLF ? "\r\n" : "\n";
    }
};

// Converts UTF-8 text to a target character encoding using libxml2's
// encoding handlers. Not safe for concurrent use of one instance.
class TextEncoding {
public:
    static TextEncoding utf8();        // with byte order mark
    static TextEncoding utf8NoBom();
    static TextEncoding utf16le();
    static TextEncoding utf16be();
    static TextEncoding latin1();
    static TextEncoding ascii();

    // Any encoding name libxml2 can convert to. "UTF-16" is little endian.
    static TextEncoding fromName(const std::string& name, bool emitPreamble = true);

    ~TextEncoding();
    TextEncoding(TextEncoding&&) noexcept;
    TextEncoding& operator=(TextEncoding&&) noexcept;

    const std::string& name() const;
    const ByteVector& preamble() const;

    // Throws EncodingError for malformed UTF-8 or an unrepresentable character
    ByteVector encode(std::string_view text) const;
    void encodeAppend(std::string_view text, ByteVector& out) const;

private:
    class Impl;
    explicit TextEncoding(std::unique_ptr<Impl> impl);
    std::unique_ptr<Impl> m_impl;
};

// Destination for produced lines, written in order without terminators
class LineSink {
public:
    virtual ~LineSink() = default;
    virtual void writeLine(std::string_view line) = 0;
    virtual void flush() {}
};

} // namespace gridcsv
