#include "core/DefaultParameters.h"
#include "core/Errors.h"

namespace landgem {

const std::vector<ParameterPreset>& allPresets() {
    static const std::vector<ParameterPreset> presets = {
        CAA_CONVENTIONAL,
        CAA_ARID,
        CAA_WET,
        INVENTORY_CONVENTIONAL,
        INVENTORY_CONVENTIONAL_CODISPOSAL,
        INVENTORY_ARID,
        INVENTORY_ARID_CODISPOSAL,
        INVENTORY_WET,
        INVENTORY_WET_CODISPOSAL,
    };
    return presets;
}

const ParameterPreset& lookupPreset(const std::string& name) {
    for (const auto& p : allPresets()) {
        if (name == p.name) return p;
    }
    throw LookupError("Unknown parameter preset: " + name);
}

} // namespace landgem
