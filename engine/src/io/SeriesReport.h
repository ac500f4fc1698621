#pragma once
#include "core/EmissionsResult.h"
#include "core/MultiStreamModel.h"
#include <string>
#include <vector>

namespace landgem {

class SeriesReport {
public:
    // Column names in output order for this series:
    //   year, ch4_generation_rate, total_gas_rate, co2_rate,
    //   [ch4_collected_rate, total_gas_collected_rate]   (collection > 0)
    //   [nmoc_rate]                                      (NMOC requested and configured)
    //   cumulative_ch4, cumulative_total_gas
    static std::vector<std::string> columns(const EmissionsSeries& series);

    static std::string formatText(const EmissionsSeries& series);
    static std::string formatCsv(const EmissionsSeries& series);

    static std::string formatMultiStreamText(const MultiStreamTable& table);
    static std::string formatMultiStreamCsv(const MultiStreamTable& table);

    // Write csv text to path, optionally preceded by a '#' metadata header
    static void writeCsv(const std::string& path, const std::string& csv,
                         bool includeMetadata = true);
};

} // namespace landgem
