#include "io/WasteDataReader.h"
#include "core/Parameters.h"
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace landgem {

namespace {

struct CsvTable {
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> rows;
    std::vector<int> lineNumbers;
};

std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\r\"");
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(" \t\r\"");
    return s.substr(first, last - first + 1);
}

std::vector<std::string> splitFields(const std::string& line) {
    std::vector<std::string> fields;
    std::istringstream ls(line);
    std::string field;
    while (std::getline(ls, field, ',')) {
        fields.push_back(trim(field));
    }
    return fields;
}

CsvTable parseCsv(const std::string& content) {
    CsvTable table;
    std::istringstream iss(content);
    std::string line;
    int lineNum = 0;

    while (std::getline(iss, line)) {
        ++lineNum;
        size_t first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos || line[first] == '#') continue;

        if (table.header.empty()) {
            table.header = splitFields(line);
        } else {
            table.rows.push_back(splitFields(line));
            table.lineNumbers.push_back(lineNum);
        }
    }
    if (table.header.empty()) {
        throw std::runtime_error("Waste data: missing header row");
    }
    return table;
}

size_t columnIndex(const CsvTable& table, const std::string& column) {
    for (size_t i = 0; i < table.header.size(); ++i) {
        if (table.header[i] == column) return i;
    }
    throw std::runtime_error("Waste data: column '" + column + "' not found");
}

const std::string& cell(const CsvTable& table, size_t row, size_t col) {
    if (col >= table.rows[row].size()) {
        throw std::runtime_error("Waste data parse error at line "
            + std::to_string(table.lineNumbers[row]) + ": missing column");
    }
    return table.rows[row][col];
}

int parseYear(const CsvTable& table, size_t row, size_t col) {
    const std::string& s = cell(table, row, col);
    char* end = nullptr;
    // years are integral but spreadsheets often export "2010.0"
    double v = std::strtod(s.c_str(), &end);
    if (s.empty() || *end != '\0' || !(v > -1e6 && v < 1e6)
        || v != static_cast<double>(static_cast<int>(v))) {
        throw std::runtime_error("Waste data parse error at line "
            + std::to_string(table.lineNumbers[row]) + ": invalid year '" + s + "'");
    }
    return static_cast<int>(v);
}

double parseAmount(const CsvTable& table, size_t row, size_t col) {
    const std::string& s = cell(table, row, col);
    char* end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    // strtod also accepts "nan" and "inf"
    if (s.empty() || *end != '\0' || !std::isfinite(v)) {
        throw std::runtime_error("Waste data parse error at line "
            + std::to_string(table.lineNumbers[row]) + ": invalid amount '" + s + "'");
    }
    return v;
}

WasteHistory extract(const CsvTable& table, size_t yearCol, size_t amountCol) {
    std::vector<int> years;
    std::vector<double> amounts;
    for (size_t r = 0; r < table.rows.size(); ++r) {
        years.push_back(parseYear(table, r, yearCol));
        amounts.push_back(parseAmount(table, r, amountCol));
    }
    validateWasteData(years, amounts);
    return WasteHistory(years, amounts);
}

std::string readFile(const std::string& filepath) {
    std::ifstream f(filepath);
    if (!f.is_open()) throw std::runtime_error("Cannot open waste data file: " + filepath);
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

} // namespace

WasteHistory WasteDataReader::readFromString(const std::string& content,
                                             const std::string& yearColumn,
                                             const std::string& amountColumn) {
    CsvTable table = parseCsv(content);
    return extract(table, columnIndex(table, yearColumn), columnIndex(table, amountColumn));
}

WasteHistory WasteDataReader::readFromFile(const std::string& filepath,
                                           const std::string& yearColumn,
                                           const std::string& amountColumn) {
    return readFromString(readFile(filepath), yearColumn, amountColumn);
}

std::map<std::string, WasteHistory> WasteDataReader::readMultiStreamFromString(
    const std::string& content, const std::map<std::string, std::string>& streamColumns)
{
    CsvTable table = parseCsv(content);
    size_t yearCol = columnIndex(table, "year");

    std::map<std::string, WasteHistory> result;
    for (const auto& [stream, column] : streamColumns) {
        result.emplace(stream, extract(table, yearCol, columnIndex(table, column)));
    }
    return result;
}

std::map<std::string, WasteHistory> WasteDataReader::readMultiStreamFromFile(
    const std::string& filepath, const std::map<std::string, std::string>& streamColumns)
{
    return readMultiStreamFromString(readFile(filepath), streamColumns);
}

} // namespace landgem
