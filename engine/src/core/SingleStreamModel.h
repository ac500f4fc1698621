#pragma once
#include "core/Parameters.h"
#include "core/EmissionsResult.h"
#include "core/WasteHistory.h"
#include <string>
#include <vector>

namespace landgem {

// Landfill gas model for one waste stream.
// Holds only parameters; waste data is supplied on every call.
class SingleStreamModel {
public:
    // Throws ParameterError when k, L0 or methane content is outside its hard
    // domain. Atypical-but-valid values are logged and kept in warnings().
    SingleStreamModel(const DecayParameters& decay,
                      const CompositionParameters& composition = CompositionParameters());

    SingleStreamModel(double k, double L0, double methaneContent = 0.50,
                      std::optional<double> nmocConcentration = std::nullopt);

    double k() const { return decay_.k; }
    double L0() const { return decay_.L0; }
    double methaneContent() const { return composition_.methaneContent; }
    const std::optional<double>& nmocConcentration() const { return composition_.nmocConcentration; }
    const DecayParameters& decayParameters() const { return decay_; }
    const CompositionParameters& compositionParameters() const { return composition_; }

    const std::vector<std::string>& warnings() const { return warnings_; }

    // Emissions for a single year.
    // Throws InputShapeError if collectionEfficiency is outside [0,1].
    EmissionsResult calculateEmissions(const WasteHistory& history,
                                       int calculationYear,
                                       double collectionEfficiency = 0.0,
                                       bool includeNmoc = false) const;

    // Same, from parallel year/amount sequences (InputShapeError on length mismatch)
    EmissionsResult calculateEmissions(const std::vector<int>& years,
                                       const std::vector<double>& amounts,
                                       int calculationYear,
                                       double collectionEfficiency = 0.0,
                                       bool includeNmoc = false) const;

    // One result per projection year, in the order given, with running
    // cumulative CH4 and LFG over that same order
    EmissionsSeries calculateTimeSeries(const WasteHistory& history,
                                        const std::vector<int>& projectionYears,
                                        double collectionEfficiency = 0.0,
                                        bool includeNmoc = false) const;

    EmissionsSeries calculateTimeSeries(const std::vector<int>& years,
                                        const std::vector<double>& amounts,
                                        const std::vector<int>& projectionYears,
                                        double collectionEfficiency = 0.0,
                                        bool includeNmoc = false) const;

    // Delegates to landgem::wasteInPlace
    double wasteInPlace(const WasteHistory& history, int calculationYear,
                        double decayFraction = 0.0) const;

    // NMOC mass rate (Mg/year) for a given LFG rate; 0 if no concentration configured
    double nmocRate(double totalGasRate) const;

    std::string describe() const;

private:
    DecayParameters decay_;
    CompositionParameters composition_;
    std::vector<std::string> warnings_;

    bool nmocConfigured() const;
};

} // namespace landgem
