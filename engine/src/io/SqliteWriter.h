#pragma once

#include <string>
#include <vector>
#include <memory>

#ifdef LANDGEM_HAS_SQLITE3

#include "core/EmissionsResult.h"
#include "core/MultiStreamModel.h"
#include "core/SingleStreamModel.h"

namespace landgem {

// Tables:
//   metadata(key, value)
//   emissions(year, ch4, total_gas, co2, ch4_collected, gas_collected, nmoc,
//             cumulative_ch4, cumulative_total_gas)
//   stream_emissions(year, stream, ch4)
// All inserts happen in one transaction committed by finalize().
class SqliteWriter {
public:
    explicit SqliteWriter(const std::string& filename);
    ~SqliteWriter();

    void writeMetadata(const std::string& key, const std::string& value);
    void writeModel(const SingleStreamModel& model);
    void writeModel(const MultiStreamModel& model);
    void writeSeries(const EmissionsSeries& series);
    void writeMultiStreamTable(const MultiStreamTable& table);
    void finalize();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace landgem

#endif // LANDGEM_HAS_SQLITE3
