#include "core/Parameters.h"
#include "core/Errors.h"
#include "utils/Logging.h"
#include <cmath>
#include <sstream>

namespace landgem {

static std::string fmtValue(double v) {
    std::ostringstream oss;
    oss << v;
    return oss.str();
}

std::vector<std::string> validateParameters(const DecayParameters& decay,
                                            const CompositionParameters& composition) {
    std::vector<std::string> warnings;

    if (!(decay.k > 0.0)) {
        throw ParameterError("k must be positive, got " + fmtValue(decay.k));
    }
    if (decay.k > K_MAX) {
        throw ParameterError("k unusually high (>1.0), got " + fmtValue(decay.k)
            + ". Check units (1/year)");
    }
    if (!(decay.L0 > 0.0)) {
        throw ParameterError("L0 must be positive, got " + fmtValue(decay.L0));
    }
    if (decay.L0 > L0_MAX) {
        throw ParameterError("L0 unusually high (>500), got " + fmtValue(decay.L0)
            + ". Check units (m3/Mg)");
    }

    double ch4 = composition.methaneContent;
    if (!(ch4 > 0.0 && ch4 < 1.0)) {
        throw ParameterError("methane content must be between 0 and 1, got " + fmtValue(ch4));
    }
    if (composition.nmocConcentration
        && !(*composition.nmocConcentration >= 0.0 && std::isfinite(*composition.nmocConcentration))) {
        throw ParameterError("NMOC concentration must be finite and non-negative, got "
            + fmtValue(*composition.nmocConcentration));
    }

    if (ch4 < METHANE_TYPICAL_MIN || ch4 > METHANE_TYPICAL_MAX) {
        warnings.push_back("methane content " + fmtValue(ch4) + " outside typical range (0.4-0.6)");
    }

    for (const auto& w : warnings) {
        LOG_WARN(w);
    }
    return warnings;
}

std::vector<std::string> validateWasteData(const std::vector<int>& years,
                                           const std::vector<double>& amounts) {
    std::vector<std::string> warnings;

    if (years.empty()) {
        throw InputShapeError("waste years is empty");
    }
    if (years.size() != amounts.size()) {
        throw InputShapeError("waste years and amounts must have same length: "
            + std::to_string(years.size()) + " != " + std::to_string(amounts.size()));
    }
    for (size_t i = 0; i < amounts.size(); ++i) {
        if (!(amounts[i] >= 0.0) || !std::isfinite(amounts[i])) {
            throw InputShapeError("waste amounts must be finite and non-negative (year "
                + std::to_string(years[i]) + ": " + fmtValue(amounts[i]) + ")");
        }
    }

    bool duplicate = false;
    for (size_t i = 1; i < years.size(); ++i) {
        if (years[i] < years[i - 1]) {
            throw InputShapeError("waste years must be in ascending order ("
                + std::to_string(years[i - 1]) + " then " + std::to_string(years[i]) + ")");
        }
        if (years[i] == years[i - 1]) duplicate = true;
    }

    if (duplicate) {
        warnings.push_back("Duplicate years found in waste years");
        LOG_WARN(warnings.back());
    }
    return warnings;
}

} // namespace landgem
