#include "core/DecayIntegrator.h"
#include "core/Errors.h"
#include <cmath>
#include <string>

namespace landgem {

// Same slice sum as generationRate for one cohort; keep the two in sync
double cohortGenerationRate(const WasteRecord& cohort, int calculationYear, double k, double L0) {
    if (cohort.year > calculationYear) return 0.0;

    double sliceCapacity = k * L0 * cohort.mass / SLICES_PER_YEAR;
    double elapsed = static_cast<double>(calculationYear - cohort.year);
    double rate = 0.0;

    // j = 0.0, 0.1, ..., 0.9 computed from the integer index so the slice
    // offsets do not drift with repeated addition
    for (int s = 0; s < SLICES_PER_YEAR; ++s) {
        double j = s * SLICE_WIDTH;
        double age = elapsed + (1.0 - j);
        rate += sliceCapacity * std::exp(-k * age);
    }
    return rate;
}

double generationRate(const WasteHistory& history, int calculationYear, double k, double L0) {
    double total = 0.0;
    for (const auto& cohort : history.records()) {
        if (cohort.year > calculationYear) continue;  // future waste

        double sliceCapacity = k * L0 * cohort.mass / SLICES_PER_YEAR;
        double elapsed = static_cast<double>(calculationYear - cohort.year);
        for (int s = 0; s < SLICES_PER_YEAR; ++s) {
            double j = s * SLICE_WIDTH;
            total += sliceCapacity * std::exp(-k * (elapsed + (1.0 - j)));
        }
    }
    return total;
}

double kFromHalfLife(double halfLifeYears) {
    if (!(halfLifeYears > 0.0)) {
        throw ParameterError("half-life must be positive, got " + std::to_string(halfLifeYears));
    }
    return std::log(2.0) / halfLifeYears;
}

double halfLifeFromK(double k) {
    if (!(k > 0.0)) {
        throw ParameterError("k must be positive, got " + std::to_string(k));
    }
    return std::log(2.0) / k;
}

} // namespace landgem
