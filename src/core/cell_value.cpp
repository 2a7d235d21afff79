#include "gridcsv/types.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace gridcsv {

namespace {

bool isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) {
    static const int DAYS[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && isLeapYear(year)) {
        return 29;
    }
    return DAYS[month - 1];
}

} // namespace

// DateTime implementation
DateTime DateTime::fromComponents(int year, int month, int day,
                                  int hour, int minute, int second) {
    if (year < 1 || year > 9999) {
        throw GridCsvError("Year out of range: " + std::to_string(year));
    }
    if (month < 1 || month > 12) {
        throw GridCsvError("Month out of range: " + std::to_string(month));
    }
    if (day < 1 || day > daysInMonth(year, month)) {
        throw GridCsvError("Day out of range: " + std::to_string(day));
    }
    if (hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 || second > 59) {
        throw GridCsvError("Time of day out of range: " + std::to_string(hour) + ":" +
                           std::to_string(minute) + ":" + std::to_string(second));
    }

    DateTime result;
    result.year = year;
    result.month = month;
    result.day = day;
    result.hour = hour;
    result.minute = minute;
    result.second = second;
    return result;
}

DateTime DateTime::fromTimePoint(std::chrono::system_clock::time_point timePoint) {
    auto wholeSeconds = std::chrono::floor<std::chrono::seconds>(timePoint);
    time_t timeT = std::chrono::system_clock::to_time_t(wholeSeconds);

    std::tm* tm = std::gmtime(&timeT);
    if (!tm) {
        throw GridCsvError("Time point cannot be represented as a calendar date");
    }

    return fromComponents(tm->tm_year + 1900, tm->tm_mon + 1, tm->tm_mday,
                          tm->tm_hour, tm->tm_min, tm->tm_sec);
}

std::string DateTime::toString() const {
    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(4) << year << '-'
        << std::setw(2) << month << '-'
        << std::setw(2) << day;

    if (!isMidnight()) {
        oss << ' '
            << std::setw(2) << hour << ':'
            << std::setw(2) << minute << ':'
            << std::setw(2) << second;
    }

    return oss.str();
}

// CellValue implementation
CellType CellValue::type() const {
    switch (value.index()) {
        case 1: return CellType::Boolean;
        case 2: return CellType::Integer;
        case 3: return CellType::Unsigned;
        case 4: return CellType::Number;
        case 5: return CellType::String;
        case 6: return CellType::DateTime;
        case 0:
        default:
            return CellType::Null;
    }
}

// CsvOptions implementation
void CsvOptions::validate() const {
    if (delimiter == '"' || delimiter == '\r' || delimiter == '\n' || delimiter == '\0') {
        throw GridCsvError("Unsupported delimiter character");
    }
    if (maxCellLength == 0) {
        throw GridCsvError("Maximum cell length must be positive");
    }
    if (truncateLength > maxCellLength) {
        throw GridCsvError("Truncate length " + std::to_string(truncateLength) +
                           " exceeds maximum cell length " + std::to_string(maxCellLength));
    }
}

} // namespace gridcsv
