#pragma once
#include "core/WasteHistory.h"
#include <map>
#include <string>

namespace landgem {

// Comma-separated waste acceptance reader.
// First non-comment line is the header; '#' lines and blank lines are skipped.
// Data is checked with validateWasteData before it is returned.
class WasteDataReader {
public:
    static WasteHistory readFromString(const std::string& content,
                                       const std::string& yearColumn = "year",
                                       const std::string& amountColumn = "waste_mg");
    static WasteHistory readFromFile(const std::string& filepath,
                                     const std::string& yearColumn = "year",
                                     const std::string& amountColumn = "waste_mg");

    // streamColumns: stream name -> amount column; all streams share the "year" column
    static std::map<std::string, WasteHistory> readMultiStreamFromString(
        const std::string& content, const std::map<std::string, std::string>& streamColumns);
    static std::map<std::string, WasteHistory> readMultiStreamFromFile(
        const std::string& filepath, const std::map<std::string, std::string>& streamColumns);
};

} // namespace landgem
