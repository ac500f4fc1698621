#pragma once
#include "io/ScenarioReader.h"
#include "core/EmissionsResult.h"
#include "core/MultiStreamModel.h"
#include <string>

namespace landgem {

struct RunResult {
    bool multiStream = false;
    EmissionsSeries series;          // single-stream runs
    MultiStreamTable table;          // multi-stream runs
    std::string report;              // text report
    std::vector<std::string> warnings;
};

// Build the model a scenario describes, run it over the projection years and
// write every configured output (csv, sqlite, hdf5).
// Throws std::runtime_error when an output was requested but its back-end
// was not compiled in.
RunResult runScenario(const Scenario& scenario);

} // namespace landgem
