#include "io/ScenarioReader.h"
#include "core/DecayIntegrator.h"
#include "core/DefaultParameters.h"
#include "io/WasteDataReader.h"
#include "utils/Logging.h"
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace landgem {

namespace {

YAML::Node require(const YAML::Node& parent, const std::string& key, const std::string& where) {
    YAML::Node n = parent[key];
    if (!n) {
        throw std::runtime_error("Scenario: missing required key '" + key + "' in " + where);
    }
    return n;
}

std::string resolvePath(const std::string& path, const std::string& baseDir) {
    if (path.empty() || path[0] == '/' || baseDir.empty()) return path;
    return baseDir + "/" + path;
}

WasteHistory readInlineOrFile(const YAML::Node& node, const std::string& where,
                              const std::string& baseDir, const std::string& defaultAmountColumn) {
    if (node["file"]) {
        std::string year = node["year_column"] ? node["year_column"].as<std::string>() : "year";
        std::string amount = node["amount_column"] ? node["amount_column"].as<std::string>()
            : (node["column"] ? node["column"].as<std::string>() : defaultAmountColumn);
        return WasteDataReader::readFromFile(
            resolvePath(node["file"].as<std::string>(), baseDir), year, amount);
    }
    auto years = require(node, "years", where).as<std::vector<int>>();
    auto amounts = require(node, "amounts", where).as<std::vector<double>>();
    validateWasteData(years, amounts);
    return WasteHistory(years, amounts);
}

void readParameters(const YAML::Node& root, Scenario& sc) {
    YAML::Node p = require(root, "parameters", "scenario");

    if (p["preset"]) {
        sc.preset = p["preset"].as<std::string>();
        const ParameterPreset& preset = lookupPreset(sc.preset);
        sc.decay = preset.decay();
        sc.composition = preset.composition();
    } else {
        sc.composition = CompositionParameters();
    }

    if (p["half_life"]) {
        sc.decay.k = kFromHalfLife(p["half_life"].as<double>());
    }
    if (p["k"]) sc.decay.k = p["k"].as<double>();
    if (p["L0"]) sc.decay.L0 = p["L0"].as<double>();
    if (p["methane_content"]) sc.composition.methaneContent = p["methane_content"].as<double>();
    if (p["nmoc_concentration"]) {
        if (p["nmoc_concentration"].IsNull()) {
            sc.composition.nmocConcentration.reset();
        } else {
            sc.composition.nmocConcentration = p["nmoc_concentration"].as<double>();
        }
    }

    if (sc.preset.empty() && !p["k"] && !p["half_life"]) {
        throw std::runtime_error("Scenario: parameters need 'preset', 'k' or 'half_life'");
    }
}

std::vector<int> readProjection(const YAML::Node& root) {
    YAML::Node proj = require(root, "projection", "scenario");
    if (proj["years"]) {
        return proj["years"].as<std::vector<int>>();
    }
    int start = require(proj, "start", "projection").as<int>();
    int end = require(proj, "end", "projection").as<int>();
    if (end < start) {
        throw std::runtime_error("Scenario: projection end " + std::to_string(end)
            + " precedes start " + std::to_string(start));
    }
    std::vector<int> years;
    // long long so end == INT_MAX terminates
    for (long long y = start; y <= end; ++y) years.push_back(static_cast<int>(y));
    return years;
}

} // namespace

Scenario ScenarioReader::readFromString(const std::string& text, const std::string& baseDir) {
    YAML::Node root = YAML::Load(text);
    if (!root.IsMap()) {
        throw std::runtime_error("Scenario: top level must be a mapping");
    }

    Scenario sc;
    sc.name = root["name"] ? root["name"].as<std::string>() : "scenario";
    readParameters(root, sc);

    if (root["streams"]) {
        for (const auto& s : root["streams"]) {
            StreamInput in;
            in.name = require(s, "name", "stream").as<std::string>();
            in.L0 = require(s, "L0", "stream '" + in.name + "'").as<double>();
            in.history = readInlineOrFile(s, "stream '" + in.name + "'", baseDir, in.name);
            sc.streams.push_back(std::move(in));
        }
    } else {
        sc.waste = readInlineOrFile(require(root, "waste", "scenario"), "waste", baseDir, "waste_mg");
    }

    sc.projectionYears = readProjection(root);
    if (root["collection_efficiency"]) sc.collectionEfficiency = root["collection_efficiency"].as<double>();
    if (root["include_nmoc"]) sc.includeNmoc = root["include_nmoc"].as<bool>();

    if (YAML::Node out = root["output"]) {
        if (out["csv"]) sc.output.csvPath = out["csv"].as<std::string>();
        if (out["sqlite"]) sc.output.sqlitePath = out["sqlite"].as<std::string>();
        if (out["hdf5"]) sc.output.hdf5Path = out["hdf5"].as<std::string>();
        if (out["log_level"]) sc.output.logLevel = out["log_level"].as<std::string>();
    }

    LOG_INFO("scenario '{}': {} stream(s), {} projection years", sc.name,
             sc.isMultiStream() ? sc.streams.size() : 1, sc.projectionYears.size());
    return sc;
}

Scenario ScenarioReader::readFromFile(const std::string& filepath) {
    std::string baseDir;
    size_t pos = filepath.find_last_of('/');
    if (pos != std::string::npos) baseDir = filepath.substr(0, pos);

    std::ifstream f(filepath);
    if (!f.is_open()) throw std::runtime_error("Cannot open scenario file: " + filepath);
    std::ostringstream ss;
    ss << f.rdbuf();
    return readFromString(ss.str(), baseDir);
}

} // namespace landgem
