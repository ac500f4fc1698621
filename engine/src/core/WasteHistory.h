#pragma once
#include <vector>
#include <cstddef>

namespace landgem {

// One annual cohort: waste accepted during a calendar year
struct WasteRecord {
    int year;       // acceptance year
    double mass;    // Mg
};

// Waste-acceptance history, cohorts in the order supplied by the caller.
// Years are expected non-decreasing and masses non-negative; that is the
// importer's contract (see validateWasteData), not re-checked here.
class WasteHistory {
public:
    WasteHistory() = default;

    // Build from parallel sequences; throws InputShapeError on length mismatch
    WasteHistory(const std::vector<int>& years, const std::vector<double>& amounts);

    void add(int year, double mass) { records_.push_back({year, mass}); }

    const std::vector<WasteRecord>& records() const { return records_; }
    size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }

    std::vector<int> years() const;
    std::vector<double> amounts() const;

    // Sum of all cohort masses regardless of year (Mg)
    double totalMass() const;

private:
    std::vector<WasteRecord> records_;
};

// Waste in place at calculationYear (Mg): mass of all cohorts accepted in or
// before that year, scaled by (1 - decayFraction).
// decayFraction is not range-checked; values outside [0,1] give a negative or
// super-unity scaling and are the caller's responsibility.
double wasteInPlace(const WasteHistory& history, int calculationYear, double decayFraction = 0.0);

} // namespace landgem
