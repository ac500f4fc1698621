#include "core/EmissionsResult.h"
#include "core/Errors.h"

namespace landgem {

void EmissionsSeries::append(int year, const EmissionsResult& emissions) {
    double prevCh4 = rows_.empty() ? 0.0 : rows_.back().cumulativeCh4;
    double prevGas = rows_.empty() ? 0.0 : rows_.back().cumulativeGas;
    rows_.push_back({year, emissions, prevCh4 + emissions.ch4, prevGas + emissions.totalGas});
}

const SeriesRow& EmissionsSeries::at(int year) const {
    for (const auto& row : rows_) {
        if (row.year == year) return row;
    }
    throw LookupError("Year " + std::to_string(year) + " not found in data");
}

GasComposition EmissionsSeries::compositionAt(int year) const {
    const auto& e = at(year).emissions;
    double sum = e.ch4 + e.co2;
    return {e.ch4, e.co2, sum > 0.0 ? e.ch4 / sum : 0.0};
}

const SeriesRow& EmissionsSeries::peak() const {
    if (rows_.empty()) {
        throw LookupError("Empty emissions series has no peak");
    }
    const SeriesRow* best = &rows_.front();
    for (const auto& row : rows_) {
        if (row.emissions.ch4 > best->emissions.ch4) best = &row;
    }
    return *best;
}

} // namespace landgem
