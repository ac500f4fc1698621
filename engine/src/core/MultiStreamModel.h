#pragma once
#include "core/SingleStreamModel.h"
#include <map>
#include <string>
#include <vector>

namespace landgem {

// Combined result for one year plus each stream's own result
struct MultiStreamResult {
    EmissionsResult combined;
    std::map<std::string, EmissionsResult> streams;
};

struct MultiStreamRow {
    int year;
    double ch4;                                  // combined CH4 (m³/year)
    double totalGas;                             // combined LFG (m³/year)
    double co2;                                  // combined CO2 (m³/year)
    std::map<std::string, double> streamCh4;     // per-stream CH4 (m³/year)
    double cumulativeCh4;                        // m³, running sum in supplied year order
};

struct MultiStreamTable {
    std::vector<std::string> streamNames;        // column order for per-stream values
    std::vector<MultiStreamRow> rows;
};

// Several waste categories sharing k and gas composition, each with its own L0.
// Not internally synchronized: do not add streams while another thread calculates.
class MultiStreamModel {
public:
    MultiStreamModel(double k, const CompositionParameters& composition = CompositionParameters());
    MultiStreamModel(double k, double methaneContent,
                     std::optional<double> nmocConcentration = std::nullopt);

    // Register (or replace) a stream. Throws ParameterError if the resulting
    // single-stream parameters are invalid; the registry is left unchanged.
    void addStream(const std::string& name, double L0);

    bool hasStream(const std::string& name) const { return streams_.count(name) > 0; }
    const SingleStreamModel& getStream(const std::string& name) const;
    std::vector<std::string> streamNames() const;
    size_t streamCount() const { return streams_.size(); }

    double k() const { return k_; }
    const CompositionParameters& compositionParameters() const { return composition_; }

    // Throws InputShapeError if a supplied stream name is not registered
    MultiStreamResult calculateMultiStream(const std::map<std::string, WasteHistory>& wasteData,
                                           int calculationYear,
                                           double collectionEfficiency = 0.0,
                                           bool includeNmoc = false) const;

    MultiStreamTable calculateTimeSeriesMultiStream(const std::map<std::string, WasteHistory>& wasteData,
                                                    const std::vector<int>& projectionYears,
                                                    double collectionEfficiency = 0.0) const;

    std::string describe() const;

private:
    double k_;
    CompositionParameters composition_;
    std::map<std::string, SingleStreamModel> streams_;
};

} // namespace landgem
