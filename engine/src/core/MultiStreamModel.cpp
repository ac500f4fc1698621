#include "core/MultiStreamModel.h"
#include "core/Errors.h"
#include "utils/Logging.h"
#include <sstream>

namespace landgem {

MultiStreamModel::MultiStreamModel(double k, const CompositionParameters& composition)
    : k_(k), composition_(composition)
{
}

MultiStreamModel::MultiStreamModel(double k, double methaneContent,
                                   std::optional<double> nmocConcentration)
    : MultiStreamModel(k, CompositionParameters(methaneContent, nmocConcentration))
{
}

void MultiStreamModel::addStream(const std::string& name, double L0) {
    SingleStreamModel model(DecayParameters{k_, L0}, composition_);
    auto it = streams_.find(name);
    if (it != streams_.end()) {
        LOG_DEBUG("replacing stream '{}'", name);
        it->second = std::move(model);
    } else {
        streams_.emplace(name, std::move(model));
    }
}

const SingleStreamModel& MultiStreamModel::getStream(const std::string& name) const {
    auto it = streams_.find(name);
    if (it == streams_.end()) {
        throw InputShapeError("Stream '" + name + "' not defined");
    }
    return it->second;
}

std::vector<std::string> MultiStreamModel::streamNames() const {
    std::vector<std::string> names;
    names.reserve(streams_.size());
    for (const auto& [name, model] : streams_) names.push_back(name);
    return names;
}

MultiStreamResult MultiStreamModel::calculateMultiStream(
    const std::map<std::string, WasteHistory>& wasteData,
    int calculationYear,
    double collectionEfficiency,
    bool includeNmoc) const
{
    // Resolve every name first so an unknown stream fails before any work
    for (const auto& entry : wasteData) {
        getStream(entry.first);
    }

    MultiStreamResult result;
    EmissionsResult& total = result.combined;
    double nmocSum = 0.0;

    for (const auto& [name, history] : wasteData) {
        EmissionsResult r = getStream(name).calculateEmissions(
            history, calculationYear, collectionEfficiency, includeNmoc);

        total.ch4 += r.ch4;
        total.totalGas += r.totalGas;
        total.co2 += r.co2;
        total.ch4Collected += r.ch4Collected;
        total.gasCollected += r.gasCollected;
        nmocSum += r.nmoc.value_or(0.0);

        result.streams.emplace(name, r);
    }

    if (includeNmoc && composition_.nmocConcentration && *composition_.nmocConcentration != 0.0) {
        total.nmoc = nmocSum;
    }
    return result;
}

MultiStreamTable MultiStreamModel::calculateTimeSeriesMultiStream(
    const std::map<std::string, WasteHistory>& wasteData,
    const std::vector<int>& projectionYears,
    double collectionEfficiency) const
{
    MultiStreamTable table;
    for (const auto& entry : wasteData) table.streamNames.push_back(entry.first);

    double cumulative = 0.0;
    for (int year : projectionYears) {
        MultiStreamResult yr = calculateMultiStream(wasteData, year, collectionEfficiency);

        MultiStreamRow row;
        row.year = year;
        row.ch4 = yr.combined.ch4;
        row.totalGas = yr.combined.totalGas;
        row.co2 = yr.combined.co2;
        for (const auto& [name, r] : yr.streams) {
            row.streamCh4[name] = r.ch4;
        }
        cumulative += row.ch4;
        row.cumulativeCh4 = cumulative;
        table.rows.push_back(std::move(row));
    }
    return table;
}

std::string MultiStreamModel::describe() const {
    std::ostringstream oss;
    oss << "MultiStreamModel(k=" << k_ << ", streams=[";
    bool first = true;
    for (const auto& entry : streams_) {
        if (!first) oss << ", ";
        oss << entry.first;
        first = false;
    }
    oss << "])";
    return oss.str();
}

} // namespace landgem
