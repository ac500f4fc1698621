#pragma once

#ifdef LANDGEM_HAS_HDF5

#include "core/EmissionsResult.h"
#include "core/MultiStreamModel.h"
#include "core/SingleStreamModel.h"
#include <string>

namespace landgem {

// HDF5 output writer for emission series
// Requires HDF5 C library + HighFive header-only wrapper
class Hdf5Writer {
public:
    // /metadata attributes, then one dataset per report column
    static void writeSeries(const std::string& filepath,
                            const SingleStreamModel& model,
                            const EmissionsSeries& series);

    // /metadata attributes, combined columns, /streams/<name>/ch4 per stream
    static void writeMultiStream(const std::string& filepath,
                                 const MultiStreamModel& model,
                                 const MultiStreamTable& table);
};

} // namespace landgem

#endif // LANDGEM_HAS_HDF5
