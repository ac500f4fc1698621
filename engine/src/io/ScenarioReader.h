#pragma once

#include "core/Parameters.h"
#include "core/WasteHistory.h"
#include <string>
#include <vector>

namespace landgem {

struct StreamInput {
    std::string name;
    double L0;             // m³/Mg
    WasteHistory history;
};

struct OutputConfig {
    std::string csvPath;       // empty = not written
    std::string sqlitePath;
    std::string hdf5Path;
    std::string logLevel = "warn";
};

// Everything needed for one model run
struct Scenario {
    std::string name;
    std::string preset;                  // empty if parameters were given explicitly
    DecayParameters decay{0.0, 0.0};
    CompositionParameters composition;
    WasteHistory waste;                  // single-stream input
    std::vector<StreamInput> streams;    // multi-stream input (shares decay.k)
    std::vector<int> projectionYears;
    double collectionEfficiency = 0.0;
    bool includeNmoc = false;
    OutputConfig output;

    bool isMultiStream() const { return !streams.empty(); }
};

// Reads a scenario from YAML (JSON documents are accepted too).
// Relative waste-file paths are resolved against baseDir.
class ScenarioReader {
public:
    static Scenario readFromFile(const std::string& filepath);
    static Scenario readFromString(const std::string& text, const std::string& baseDir = "");
};

} // namespace landgem
