#include "core/SingleStreamModel.h"
#include "core/DecayIntegrator.h"
#include "core/Errors.h"
#include "utils/Logging.h"
#include <sstream>

namespace landgem {

SingleStreamModel::SingleStreamModel(const DecayParameters& decay,
                                     const CompositionParameters& composition)
    : decay_(decay), composition_(composition)
{
    warnings_ = validateParameters(decay_, composition_);
}

SingleStreamModel::SingleStreamModel(double k, double L0, double methaneContent,
                                     std::optional<double> nmocConcentration)
    : SingleStreamModel(DecayParameters{k, L0},
                        CompositionParameters(methaneContent, nmocConcentration))
{
}

// A zero concentration counts as not configured: the NMOC column is omitted
bool SingleStreamModel::nmocConfigured() const {
    return composition_.nmocConcentration && *composition_.nmocConcentration != 0.0;
}

double SingleStreamModel::nmocRate(double totalGasRate) const {
    if (!nmocConfigured()) return 0.0;
    return (*composition_.nmocConcentration * (MW_HEXANE / MW_METHANE) * totalGasRate)
        / NMOC_CONVERSION;
}

EmissionsResult SingleStreamModel::calculateEmissions(const WasteHistory& history,
                                                      int calculationYear,
                                                      double collectionEfficiency,
                                                      bool includeNmoc) const
{
    if (!(collectionEfficiency >= 0.0 && collectionEfficiency <= 1.0)) {
        std::ostringstream oss;
        oss << "collection efficiency must be between 0 and 1, got " << collectionEfficiency;
        throw InputShapeError(oss.str());
    }

    EmissionsResult r;
    r.ch4 = generationRate(history, calculationYear, decay_.k, decay_.L0);
    r.totalGas = r.ch4 / composition_.methaneContent;
    r.co2 = r.totalGas * (1.0 - composition_.methaneContent);
    r.ch4Collected = r.ch4 * collectionEfficiency;
    r.gasCollected = r.totalGas * collectionEfficiency;

    if (includeNmoc && nmocConfigured()) {
        r.nmoc = nmocRate(r.totalGas);
    }

    LOG_DEBUG("year {}: CH4 {:.6g} m3/yr, LFG {:.6g} m3/yr", calculationYear, r.ch4, r.totalGas);
    return r;
}

EmissionsResult SingleStreamModel::calculateEmissions(const std::vector<int>& years,
                                                      const std::vector<double>& amounts,
                                                      int calculationYear,
                                                      double collectionEfficiency,
                                                      bool includeNmoc) const
{
    return calculateEmissions(WasteHistory(years, amounts), calculationYear,
                              collectionEfficiency, includeNmoc);
}

EmissionsSeries SingleStreamModel::calculateTimeSeries(const WasteHistory& history,
                                                       const std::vector<int>& projectionYears,
                                                       double collectionEfficiency,
                                                       bool includeNmoc) const
{
    EmissionsSeries series(collectionEfficiency, includeNmoc && nmocConfigured());
    for (int year : projectionYears) {
        series.append(year, calculateEmissions(history, year, collectionEfficiency, includeNmoc));
    }
    return series;
}

EmissionsSeries SingleStreamModel::calculateTimeSeries(const std::vector<int>& years,
                                                       const std::vector<double>& amounts,
                                                       const std::vector<int>& projectionYears,
                                                       double collectionEfficiency,
                                                       bool includeNmoc) const
{
    return calculateTimeSeries(WasteHistory(years, amounts), projectionYears,
                               collectionEfficiency, includeNmoc);
}

double SingleStreamModel::wasteInPlace(const WasteHistory& history, int calculationYear,
                                       double decayFraction) const
{
    return landgem::wasteInPlace(history, calculationYear, decayFraction);
}

std::string SingleStreamModel::describe() const {
    std::ostringstream oss;
    oss << "SingleStreamModel(k=" << decay_.k << ", L0=" << decay_.L0
        << ", methane_content=" << composition_.methaneContent << ", nmoc_concentration=";
    if (composition_.nmocConcentration) {
        oss << *composition_.nmocConcentration;
    } else {
        oss << "none";
    }
    oss << ")";
    return oss.str();
}

} // namespace landgem
