#include "core/WasteHistory.h"
#include "core/Errors.h"
#include <string>

namespace landgem {

WasteHistory::WasteHistory(const std::vector<int>& years, const std::vector<double>& amounts) {
    if (years.size() != amounts.size()) {
        throw InputShapeError("waste years and amounts must have same length: "
            + std::to_string(years.size()) + " != " + std::to_string(amounts.size()));
    }
    records_.reserve(years.size());
    for (size_t i = 0; i < years.size(); ++i) {
        records_.push_back({years[i], amounts[i]});
    }
}

std::vector<int> WasteHistory::years() const {
    std::vector<int> out;
    out.reserve(records_.size());
    for (const auto& r : records_) out.push_back(r.year);
    return out;
}

std::vector<double> WasteHistory::amounts() const {
    std::vector<double> out;
    out.reserve(records_.size());
    for (const auto& r : records_) out.push_back(r.mass);
    return out;
}

double WasteHistory::totalMass() const {
    double total = 0.0;
    for (const auto& r : records_) total += r.mass;
    return total;
}

double wasteInPlace(const WasteHistory& history, int calculationYear, double decayFraction) {
    double total = 0.0;
    for (const auto& r : history.records()) {
        if (r.year <= calculationYear) {
            total += r.mass;
        }
    }
    return total * (1.0 - decayFraction);
}

} // namespace landgem
