#pragma once
#include <optional>
#include <string>
#include <vector>

namespace landgem {

// Conversion of NMOC concentration (ppm as hexane) and LFG volume (m³/year)
// to an NMOC mass rate (Mg/year):
//   NMOC = C_ppm * (MW_hexane / MW_methane) * Q_LFG / 3.6e9
constexpr double MW_HEXANE = 86.18;     // g/mol
constexpr double MW_METHANE = 16.04;    // g/mol
constexpr double NMOC_CONVERSION = 3.6e9;

// Generation rates for one calculation year
struct EmissionsResult {
    double ch4 = 0.0;              // methane generation (m³/year)
    double totalGas = 0.0;         // total landfill gas (m³/year)
    double co2 = 0.0;              // carbon dioxide (m³/year)
    double ch4Collected = 0.0;     // collected methane (m³/year)
    double gasCollected = 0.0;     // collected LFG (m³/year)
    std::optional<double> nmoc;    // NMOC (Mg/year); absent unless requested and configured
};

struct SeriesRow {
    int year;
    EmissionsResult emissions;
    double cumulativeCh4;          // m³, running sum in supplied year order
    double cumulativeGas;          // m³
};

// Gas split for one year (input for a composition chart)
struct GasComposition {
    double ch4;            // m³/year
    double co2;            // m³/year
    double ch4Fraction;    // ch4 / (ch4 + co2), 0 when nothing is generated
};

// Results over a caller-supplied list of years, in that order
class EmissionsSeries {
public:
    EmissionsSeries() = default;
    EmissionsSeries(double collectionEfficiency, bool nmocIncluded)
        : collectionEfficiency_(collectionEfficiency), nmocIncluded_(nmocIncluded) {}

    void append(int year, const EmissionsResult& emissions);

    const std::vector<SeriesRow>& rows() const { return rows_; }
    size_t size() const { return rows_.size(); }
    bool empty() const { return rows_.empty(); }

    // Collected columns are reported only when collection is enabled
    bool hasCollection() const { return collectionEfficiency_ > 0.0; }
    double collectionEfficiency() const { return collectionEfficiency_; }
    bool hasNmoc() const { return nmocIncluded_; }

    // First row for year; throws LookupError if absent
    const SeriesRow& at(int year) const;

    // Throws LookupError if year absent
    GasComposition compositionAt(int year) const;

    // Row with the highest methane rate (first on ties); throws LookupError if empty
    const SeriesRow& peak() const;

    double totalCh4() const { return rows_.empty() ? 0.0 : rows_.back().cumulativeCh4; }
    double totalGas() const { return rows_.empty() ? 0.0 : rows_.back().cumulativeGas; }

private:
    double collectionEfficiency_ = 0.0;
    bool nmocIncluded_ = false;
    std::vector<SeriesRow> rows_;
};

} // namespace landgem
