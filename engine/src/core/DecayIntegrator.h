#pragma once
#include "core/WasteHistory.h"

namespace landgem {

// First-order decay methane generation (EPA LandGEM):
//
//   Q_CH4 = Σ_i Σ_{j=0.0..0.9} (k * L0 * M_i / 10) * exp(-k * t_ij)
//   t_ij  = calculationYear - Y_i + (1 - j)
//
// Each annual cohort is spread over ten 0.1-year slices. The slice count is
// part of the published model; changing it changes the reference outputs.
constexpr int SLICES_PER_YEAR = 10;
constexpr double SLICE_WIDTH = 1.0 / SLICES_PER_YEAR;  // year

// Methane generation rate in calculationYear (m³/year).
// Cohorts accepted after calculationYear contribute nothing. k in 1/year,
// L0 in m³/Mg; neither is validated here.
double generationRate(const WasteHistory& history, int calculationYear, double k, double L0);

// Contribution of a single cohort, same kinetics as generationRate
double cohortGenerationRate(const WasteRecord& cohort, int calculationYear, double k, double L0);

// k = ln(2) / halfLife; throws ParameterError unless halfLife > 0
double kFromHalfLife(double halfLifeYears);

// halfLife = ln(2) / k; throws ParameterError unless k > 0
double halfLifeFromK(double k);

} // namespace landgem
