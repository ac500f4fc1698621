#pragma once
#include "core/Parameters.h"
#include <string>
#include <vector>

namespace landgem {

// Named EPA default parameter bundle
struct ParameterPreset {
    const char* name;
    double k;                    // 1/year
    double L0;                   // m³/Mg
    double methaneContent;
    double nmocConcentration;    // ppm as hexane

    DecayParameters decay() const { return {k, L0}; }
    CompositionParameters composition() const {
        return CompositionParameters(methaneContent, nmocConcentration);
    }
};

// Clean Air Act defaults (conservative, regulatory)
constexpr ParameterPreset CAA_CONVENTIONAL{"caa_conventional", 0.05, 170.0, 0.50, 4000.0};
constexpr ParameterPreset CAA_ARID{"caa_arid", 0.02, 170.0, 0.50, 4000.0};  // < 25 in/yr precipitation
constexpr ParameterPreset CAA_WET{"caa_wet", 0.7, 170.0, 0.50, 4000.0};     // wet / bioreactor

// Inventory defaults (average conditions)
constexpr ParameterPreset INVENTORY_CONVENTIONAL{"inventory_conventional", 0.04, 100.0, 0.50, 600.0};
constexpr ParameterPreset INVENTORY_CONVENTIONAL_CODISPOSAL{"inventory_conventional_codisposal", 0.04, 100.0, 0.50, 2400.0};
constexpr ParameterPreset INVENTORY_ARID{"inventory_arid", 0.02, 100.0, 0.50, 600.0};
constexpr ParameterPreset INVENTORY_ARID_CODISPOSAL{"inventory_arid_codisposal", 0.02, 100.0, 0.50, 2400.0};
constexpr ParameterPreset INVENTORY_WET{"inventory_wet", 0.7, 96.0, 0.50, 600.0};
constexpr ParameterPreset INVENTORY_WET_CODISPOSAL{"inventory_wet_codisposal", 0.7, 96.0, 0.50, 2400.0};

// All presets in declaration order
const std::vector<ParameterPreset>& allPresets();

// Throws LookupError for an unknown name
const ParameterPreset& lookupPreset(const std::string& name);

} // namespace landgem
