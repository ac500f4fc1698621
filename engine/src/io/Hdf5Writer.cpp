#ifdef LANDGEM_HAS_HDF5

#include "io/Hdf5Writer.h"
#include <highfive/H5File.hpp>
#include <highfive/H5DataSet.hpp>
#include <highfive/H5DataSpace.hpp>
#include <vector>

namespace landgem {

void Hdf5Writer::writeSeries(const std::string& filepath,
                             const SingleStreamModel& model,
                             const EmissionsSeries& series) {
    HighFive::File file(filepath, HighFive::File::Overwrite);

    auto meta = file.createGroup("metadata");
    meta.createAttribute("k", model.k());
    meta.createAttribute("L0", model.L0());
    meta.createAttribute("methaneContent", model.methaneContent());
    meta.createAttribute("collectionEfficiency", series.collectionEfficiency());
    meta.createAttribute("yearCount", static_cast<int>(series.size()));

    const size_t n = series.size();
    std::vector<int> years(n);
    std::vector<double> ch4(n), gas(n), co2(n), cumCh4(n), cumGas(n);
    std::vector<double> ch4Coll(n), gasColl(n), nmoc(n);

    for (size_t i = 0; i < n; ++i) {
        const auto& row = series.rows()[i];
        years[i] = row.year;
        ch4[i] = row.emissions.ch4;
        gas[i] = row.emissions.totalGas;
        co2[i] = row.emissions.co2;
        ch4Coll[i] = row.emissions.ch4Collected;
        gasColl[i] = row.emissions.gasCollected;
        nmoc[i] = row.emissions.nmoc.value_or(0.0);
        cumCh4[i] = row.cumulativeCh4;
        cumGas[i] = row.cumulativeGas;
    }

    file.createDataSet("year", years);
    file.createDataSet("ch4_generation_rate", ch4);
    file.createDataSet("total_gas_rate", gas);
    file.createDataSet("co2_rate", co2);
    if (series.hasCollection()) {
        file.createDataSet("ch4_collected_rate", ch4Coll);
        file.createDataSet("total_gas_collected_rate", gasColl);
    }
    if (series.hasNmoc()) {
        file.createDataSet("nmoc_rate", nmoc);
    }
    file.createDataSet("cumulative_ch4", cumCh4);
    file.createDataSet("cumulative_total_gas", cumGas);
}

void Hdf5Writer::writeMultiStream(const std::string& filepath,
                                  const MultiStreamModel& model,
                                  const MultiStreamTable& table) {
    HighFive::File file(filepath, HighFive::File::Overwrite);

    auto meta = file.createGroup("metadata");
    meta.createAttribute("k", model.k());
    meta.createAttribute("methaneContent", model.compositionParameters().methaneContent);
    meta.createAttribute("streamCount", static_cast<int>(table.streamNames.size()));
    file.createDataSet("streamNames", table.streamNames);

    const size_t n = table.rows.size();
    std::vector<int> years(n);
    std::vector<double> ch4(n), gas(n), co2(n), cum(n);
    for (size_t i = 0; i < n; ++i) {
        years[i] = table.rows[i].year;
        ch4[i] = table.rows[i].ch4;
        gas[i] = table.rows[i].totalGas;
        co2[i] = table.rows[i].co2;
        cum[i] = table.rows[i].cumulativeCh4;
    }
    file.createDataSet("year", years);
    file.createDataSet("total_ch4_rate", ch4);
    file.createDataSet("total_gas_rate", gas);
    file.createDataSet("total_co2_rate", co2);
    file.createDataSet("cumulative_ch4", cum);

    auto streamsGrp = file.createGroup("streams");
    for (const auto& name : table.streamNames) {
        std::vector<double> values(n, 0.0);
        for (size_t i = 0; i < n; ++i) {
            auto it = table.rows[i].streamCh4.find(name);
            if (it != table.rows[i].streamCh4.end()) values[i] = it->second;
        }
        auto grp = streamsGrp.createGroup(name);
        grp.createAttribute("L0", model.hasStream(name) ? model.getStream(name).L0() : 0.0);
        grp.createDataSet("ch4", values);
    }
}

} // namespace landgem

#endif // LANDGEM_HAS_HDF5
