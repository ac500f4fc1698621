#include "io/SeriesReport.h"
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace landgem {

std::vector<std::string> SeriesReport::columns(const EmissionsSeries& series) {
    std::vector<std::string> cols = {"year", "ch4_generation_rate", "total_gas_rate", "co2_rate"};
    if (series.hasCollection()) {
        cols.push_back("ch4_collected_rate");
        cols.push_back("total_gas_collected_rate");
    }
    if (series.hasNmoc()) {
        cols.push_back("nmoc_rate");
    }
    cols.push_back("cumulative_ch4");
    cols.push_back("cumulative_total_gas");
    return cols;
}

std::string SeriesReport::formatCsv(const EmissionsSeries& series) {
    std::ostringstream oss;
    auto cols = columns(series);
    for (size_t i = 0; i < cols.size(); ++i) {
        oss << (i ? "," : "") << cols[i];
    }
    oss << "\n";

    oss << std::setprecision(10);
    for (const auto& row : series.rows()) {
        const auto& e = row.emissions;
        oss << row.year << ","
            << e.ch4 << ","
            << e.totalGas << ","
            << e.co2;
        if (series.hasCollection()) {
            oss << "," << e.ch4Collected << "," << e.gasCollected;
        }
        if (series.hasNmoc()) {
            oss << "," << e.nmoc.value_or(0.0);
        }
        oss << "," << row.cumulativeCh4 << "," << row.cumulativeGas << "\n";
    }
    return oss.str();
}

std::string SeriesReport::formatText(const EmissionsSeries& series) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1);
    oss << "=== Landfill Gas Generation Report ===\n\n";

    oss << std::left << std::setw(6) << "Year" << std::right
        << std::setw(16) << "CH4(m3/yr)"
        << std::setw(16) << "LFG(m3/yr)"
        << std::setw(16) << "CO2(m3/yr)";
    if (series.hasCollection()) {
        oss << std::setw(16) << "CH4coll(m3/yr)"
            << std::setw(16) << "LFGcoll(m3/yr)";
    }
    if (series.hasNmoc()) {
        oss << std::setw(14) << "NMOC(Mg/yr)";
    }
    oss << std::setw(18) << "CumCH4(m3)" << "\n";

    int width = 6 + 16 * 3 + 18 + (series.hasCollection() ? 32 : 0) + (series.hasNmoc() ? 14 : 0);
    oss << std::string(width, '-') << "\n";

    for (const auto& row : series.rows()) {
        const auto& e = row.emissions;
        oss << std::left << std::setw(6) << row.year << std::right
            << std::setw(16) << e.ch4
            << std::setw(16) << e.totalGas
            << std::setw(16) << e.co2;
        if (series.hasCollection()) {
            oss << std::setw(16) << e.ch4Collected
                << std::setw(16) << e.gasCollected;
        }
        if (series.hasNmoc()) {
            oss << std::setw(14) << std::setprecision(4) << e.nmoc.value_or(0.0)
                << std::setprecision(1);
        }
        oss << std::setw(18) << row.cumulativeCh4 << "\n";
    }

    if (!series.empty()) {
        const auto& pk = series.peak();
        oss << "\nPeak methane year:  " << pk.year << "\n";
        oss << "Peak methane:       " << pk.emissions.ch4 << " m3/yr\n";
        oss << "Total methane:      " << series.totalCh4() << " m3\n";
        oss << "Total LFG:          " << series.totalGas() << " m3\n";
    }
    return oss.str();
}

std::string SeriesReport::formatMultiStreamCsv(const MultiStreamTable& table) {
    std::ostringstream oss;
    oss << "year,total_ch4_rate,total_gas_rate,total_co2_rate";
    for (const auto& name : table.streamNames) {
        oss << "," << name << "_ch4_rate";
    }
    oss << ",cumulative_ch4\n";

    oss << std::setprecision(10);
    for (const auto& row : table.rows) {
        oss << row.year << "," << row.ch4 << "," << row.totalGas << "," << row.co2;
        for (const auto& name : table.streamNames) {
            auto it = row.streamCh4.find(name);
            oss << "," << (it != row.streamCh4.end() ? it->second : 0.0);
        }
        oss << "," << row.cumulativeCh4 << "\n";
    }
    return oss.str();
}

std::string SeriesReport::formatMultiStreamText(const MultiStreamTable& table) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1);
    oss << "=== Multi-Stream Landfill Gas Report ===\n\n";

    oss << std::left << std::setw(6) << "Year" << std::right
        << std::setw(16) << "CH4(m3/yr)"
        << std::setw(16) << "LFG(m3/yr)";
    for (const auto& name : table.streamNames) {
        oss << std::setw(16) << name;
    }
    oss << std::setw(18) << "CumCH4(m3)" << "\n";
    oss << std::string(6 + 32 + 16 * table.streamNames.size() + 18, '-') << "\n";

    for (const auto& row : table.rows) {
        oss << std::left << std::setw(6) << row.year << std::right
            << std::setw(16) << row.ch4
            << std::setw(16) << row.totalGas;
        for (const auto& name : table.streamNames) {
            auto it = row.streamCh4.find(name);
            oss << std::setw(16) << (it != row.streamCh4.end() ? it->second : 0.0);
        }
        oss << std::setw(18) << row.cumulativeCh4 << "\n";
    }
    return oss.str();
}

void SeriesReport::writeCsv(const std::string& path, const std::string& csv, bool includeMetadata) {
    std::ofstream out(path);
    if (!out) throw std::runtime_error("Cannot open " + path + " for writing");

    if (includeMetadata) {
        std::time_t now = std::time(nullptr);
        char stamp[32];
        std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", std::localtime(&now));
        out << "# LandGEM Emissions Data\n";
        out << "# Generated: " << stamp << "\n";
        out << "#\n";
    }
    out << csv;
    if (!out) throw std::runtime_error("Write failed: " + path);
}

} // namespace landgem
