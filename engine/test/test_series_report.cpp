#include <gtest/gtest.h>
#include "io/SeriesReport.h"
#include "core/SingleStreamModel.h"
#include "core/MultiStreamModel.h"
#include <algorithm>
#include <sstream>

using namespace landgem;

static std::vector<std::string> lines(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) out.push_back(line);
    return out;
}

static std::vector<std::string> fields(const std::string& line) {
    std::vector<std::string> out;
    std::istringstream iss(line);
    std::string f;
    while (std::getline(iss, f, ',')) out.push_back(f);
    return out;
}

// ── Column selection ─────────────────────────────────────────────────

TEST(SeriesReport, BaseColumns) {
    SingleStreamModel m(0.05, 170.0, 0.5, 4000.0);
    auto s = m.calculateTimeSeries(WasteHistory({2020}, {5000.0}), {2021});
    EXPECT_EQ(SeriesReport::columns(s),
              (std::vector<std::string>{"year", "ch4_generation_rate", "total_gas_rate", "co2_rate",
                                        "cumulative_ch4", "cumulative_total_gas"}));
}

TEST(SeriesReport, AllColumns) {
    SingleStreamModel m(0.05, 170.0, 0.5, 4000.0);
    auto s = m.calculateTimeSeries(WasteHistory({2020}, {5000.0}), {2021}, 0.8, true);
    EXPECT_EQ(SeriesReport::columns(s),
              (std::vector<std::string>{"year", "ch4_generation_rate", "total_gas_rate", "co2_rate",
                                        "ch4_collected_rate", "total_gas_collected_rate", "nmoc_rate",
                                        "cumulative_ch4", "cumulative_total_gas"}));
}

TEST(SeriesReport, NmocColumnNeedsConcentration) {
    SingleStreamModel m(0.05, 170.0, 0.5);
    auto s = m.calculateTimeSeries(WasteHistory({2020}, {5000.0}), {2021}, 0.0, true);
    auto cols = SeriesReport::columns(s);
    EXPECT_EQ(std::find(cols.begin(), cols.end(), "nmoc_rate"), cols.end());
}

// ── CSV ──────────────────────────────────────────────────────────────

TEST(SeriesReport, CsvRowsMatchSeries) {
    SingleStreamModel m(0.04, 100.0, 0.5, 600.0);
    WasteHistory h({2010, 2011, 2012}, {1000.0, 1100.0, 1200.0});
    auto s = m.calculateTimeSeries(h, {2012, 2013, 2014}, 0.5, true);

    auto ls = lines(SeriesReport::formatCsv(s));
    ASSERT_EQ(ls.size(), 4u);
    auto header = fields(ls[0]);
    ASSERT_EQ(header.size(), 9u);

    for (size_t i = 0; i < s.size(); ++i) {
        auto f = fields(ls[i + 1]);
        ASSERT_EQ(f.size(), header.size());
        const auto& row = s.rows()[i];
        EXPECT_EQ(std::stoi(f[0]), row.year);
        EXPECT_NEAR(std::stod(f[1]), row.emissions.ch4, 1e-9 * row.emissions.ch4);
        EXPECT_NEAR(std::stod(f[4]), row.emissions.ch4Collected, 1e-9 * row.emissions.ch4);
        EXPECT_NEAR(std::stod(f[6]), *row.emissions.nmoc, 1e-9 * *row.emissions.nmoc);
        EXPECT_NEAR(std::stod(f[7]), row.cumulativeCh4, 1e-9 * row.cumulativeCh4);
        EXPECT_NEAR(std::stod(f[8]), row.cumulativeGas, 1e-9 * row.cumulativeGas);
    }
}

TEST(SeriesReport, MultiStreamCsv) {
    MultiStreamModel m(0.05);
    m.addStream("msw", 170.0);
    m.addStream("organic", 200.0);
    std::map<std::string, WasteHistory> data;
    data["msw"] = WasteHistory({2020}, {5000.0});
    data["organic"] = WasteHistory({2020}, {1000.0});

    auto t = m.calculateTimeSeriesMultiStream(data, {2021, 2022});
    auto ls = lines(SeriesReport::formatMultiStreamCsv(t));
    ASSERT_EQ(ls.size(), 3u);
    EXPECT_EQ(ls[0], "year,total_ch4_rate,total_gas_rate,total_co2_rate,msw_ch4_rate,organic_ch4_rate,cumulative_ch4");

    auto f = fields(ls[2]);
    ASSERT_EQ(f.size(), 7u);
    EXPECT_EQ(f[0], "2022");
    EXPECT_NEAR(std::stod(f[6]), t.rows[1].cumulativeCh4, 1e-9 * t.rows[1].cumulativeCh4);
    EXPECT_NEAR(std::stod(f[5]), t.rows[1].streamCh4.at("organic"), 1e-9 * t.rows[1].ch4);
}

// ── Text ─────────────────────────────────────────────────────────────

TEST(SeriesReport, TextReportSummary) {
    SingleStreamModel m(0.05, 170.0);
    WasteHistory h({2020, 2021}, {5000.0, 6000.0});
    auto s = m.calculateTimeSeries(h, {2020, 2021, 2022, 2023}, 0.5);
    std::string text = SeriesReport::formatText(s);

    EXPECT_NE(text.find("=== Landfill Gas Generation Report ==="), std::string::npos);
    EXPECT_NE(text.find("CH4coll(m3/yr)"), std::string::npos);
    EXPECT_EQ(text.find("NMOC"), std::string::npos);
    EXPECT_NE(text.find("Peak methane year:  2021"), std::string::npos);
}

TEST(SeriesReport, TextReportEmptySeries) {
    EmissionsSeries empty;
    std::string text = SeriesReport::formatText(empty);
    EXPECT_EQ(text.find("Peak"), std::string::npos);
}

TEST(SeriesReport, WriteCsvBadPathThrows) {
    EXPECT_THROW(SeriesReport::writeCsv("/nonexistent/dir/out.csv", "year\n"), std::runtime_error);
}
