#include "io/ScenarioRunner.h"
#include "io/SeriesReport.h"
#include "io/SqliteWriter.h"
#include "io/Hdf5Writer.h"
#include "core/SingleStreamModel.h"
#include "utils/Logging.h"
#include <stdexcept>

namespace landgem {

static void checkBackends(const OutputConfig& out) {
#ifndef LANDGEM_HAS_SQLITE3
    if (!out.sqlitePath.empty()) {
        throw std::runtime_error("SQLite output requested but landgem was built without SQLite3");
    }
#endif
#ifndef LANDGEM_HAS_HDF5
    if (!out.hdf5Path.empty()) {
        throw std::runtime_error("HDF5 output requested but landgem was built without HDF5");
    }
#endif
    (void)out;
}

static RunResult runSingle(const Scenario& sc) {
    SingleStreamModel model(sc.decay, sc.composition);
    LOG_INFO("running {}", model.describe());

    RunResult res;
    res.warnings = model.warnings();
    res.series = model.calculateTimeSeries(sc.waste, sc.projectionYears,
                                           sc.collectionEfficiency, sc.includeNmoc);
    res.report = SeriesReport::formatText(res.series);

    const auto& out = sc.output;
    if (!out.csvPath.empty()) {
        SeriesReport::writeCsv(out.csvPath, SeriesReport::formatCsv(res.series));
        LOG_INFO("wrote {}", out.csvPath);
    }
#ifdef LANDGEM_HAS_SQLITE3
    if (!out.sqlitePath.empty()) {
        SqliteWriter db(out.sqlitePath);
        db.writeMetadata("scenario", sc.name);
        db.writeModel(model);
        db.writeSeries(res.series);
        db.finalize();
        LOG_INFO("wrote {}", out.sqlitePath);
    }
#endif
#ifdef LANDGEM_HAS_HDF5
    if (!out.hdf5Path.empty()) {
        Hdf5Writer::writeSeries(out.hdf5Path, model, res.series);
        LOG_INFO("wrote {}", out.hdf5Path);
    }
#endif
    return res;
}

static RunResult runMulti(const Scenario& sc) {
    MultiStreamModel model(sc.decay.k, sc.composition);
    std::map<std::string, WasteHistory> wasteData;
    for (const auto& s : sc.streams) {
        model.addStream(s.name, s.L0);
        wasteData[s.name] = s.history;
    }
    LOG_INFO("running {}", model.describe());

    RunResult res;
    res.multiStream = true;
    for (const auto& name : model.streamNames()) {
        for (const auto& w : model.getStream(name).warnings()) {
            res.warnings.push_back(name + ": " + w);
        }
    }
    res.table = model.calculateTimeSeriesMultiStream(wasteData, sc.projectionYears,
                                                     sc.collectionEfficiency);
    res.report = SeriesReport::formatMultiStreamText(res.table);

    const auto& out = sc.output;
    if (!out.csvPath.empty()) {
        SeriesReport::writeCsv(out.csvPath, SeriesReport::formatMultiStreamCsv(res.table));
        LOG_INFO("wrote {}", out.csvPath);
    }
#ifdef LANDGEM_HAS_SQLITE3
    if (!out.sqlitePath.empty()) {
        SqliteWriter db(out.sqlitePath);
        db.writeMetadata("scenario", sc.name);
        db.writeModel(model);
        db.writeMultiStreamTable(res.table);
        db.finalize();
        LOG_INFO("wrote {}", out.sqlitePath);
    }
#endif
#ifdef LANDGEM_HAS_HDF5
    if (!out.hdf5Path.empty()) {
        Hdf5Writer::writeMultiStream(out.hdf5Path, model, res.table);
        LOG_INFO("wrote {}", out.hdf5Path);
    }
#endif
    return res;
}

RunResult runScenario(const Scenario& scenario) {
    checkBackends(scenario.output);
    return scenario.isMultiStream() ? runMulti(scenario) : runSingle(scenario);
}

} // namespace landgem
