#pragma once
#include <optional>
#include <string>
#include <vector>

namespace landgem {

// Hard limits: outside these, construction fails
constexpr double K_MAX = 1.0;            // 1/year
constexpr double L0_MAX = 500.0;         // m³/Mg

// Typical methane fraction of landfill gas; outside this only warns
constexpr double METHANE_TYPICAL_MIN = 0.4;
constexpr double METHANE_TYPICAL_MAX = 0.6;

struct DecayParameters {
    double k;    // methane generation rate constant (1/year)
    double L0;   // potential methane generation capacity (m³/Mg)
};

struct CompositionParameters {
    double methaneContent = 0.50;                // CH4 volume fraction of LFG
    std::optional<double> nmocConcentration;     // ppm as hexane

    CompositionParameters() = default;
    explicit CompositionParameters(double ch4, std::optional<double> nmoc = std::nullopt)
        : methaneContent(ch4), nmocConcentration(nmoc) {}
};

// Check k/L0/methane content against the hard domains.
// Throws ParameterError on the first violation; returns soft warnings
// (already logged) for values that are valid but atypical.
std::vector<std::string> validateParameters(const DecayParameters& decay,
                                            const CompositionParameters& composition);

// Check acceptance data the way an importer must before handing it over:
// non-empty, equal lengths, non-negative amounts, non-decreasing years.
// Throws InputShapeError; returns a warning (already logged) for duplicate years.
std::vector<std::string> validateWasteData(const std::vector<int>& years,
                                           const std::vector<double>& amounts);

} // namespace landgem
