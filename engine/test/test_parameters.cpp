#include <gtest/gtest.h>
#include "core/DefaultParameters.h"
#include "core/Parameters.h"
#include "core/SingleStreamModel.h"
#include "core/Errors.h"
#include "utils/Logging.h"
#include <limits>
#include <set>

using namespace landgem;

// ── Presets ──────────────────────────────────────────────────────────

TEST(DefaultParameters, NinePresetsWithUniqueNames) {
    const auto& presets = allPresets();
    ASSERT_EQ(presets.size(), 9u);
    std::set<std::string> names;
    for (const auto& p : presets) names.insert(p.name);
    EXPECT_EQ(names.size(), 9u);
    EXPECT_STREQ(presets.front().name, "caa_conventional");
}

TEST(DefaultParameters, LookupKnownValues) {
    const auto& caa = lookupPreset("caa_conventional");
    EXPECT_DOUBLE_EQ(caa.k, 0.05);
    EXPECT_DOUBLE_EQ(caa.L0, 170.0);
    EXPECT_DOUBLE_EQ(caa.methaneContent, 0.50);
    EXPECT_DOUBLE_EQ(caa.nmocConcentration, 4000.0);

    const auto& wet = lookupPreset("inventory_wet_codisposal");
    EXPECT_DOUBLE_EQ(wet.k, 0.7);
    EXPECT_DOUBLE_EQ(wet.L0, 96.0);
    EXPECT_DOUBLE_EQ(wet.nmocConcentration, 2400.0);

    EXPECT_DOUBLE_EQ(lookupPreset("caa_arid").k, 0.02);
    EXPECT_DOUBLE_EQ(lookupPreset("inventory_conventional").nmocConcentration, 600.0);
}

TEST(DefaultParameters, UnknownPresetThrows) {
    EXPECT_THROW(lookupPreset("caa_tropical"), LookupError);
}

TEST(DefaultParameters, EveryPresetBuildsAModel) {
    for (const auto& p : allPresets()) {
        SingleStreamModel m(p.decay(), p.composition());
        EXPECT_TRUE(m.warnings().empty()) << p.name;
        EXPECT_TRUE(m.nmocConcentration().has_value()) << p.name;
    }
}

// ── validateParameters ───────────────────────────────────────────────

TEST(ValidateParameters, HardFailures) {
    CompositionParameters ok(0.5);
    EXPECT_THROW(validateParameters({0.0, 170.0}, ok), ParameterError);
    EXPECT_THROW(validateParameters({1.5, 170.0}, ok), ParameterError);
    EXPECT_THROW(validateParameters({0.05, 0.0}, ok), ParameterError);
    EXPECT_THROW(validateParameters({0.05, 600.0}, ok), ParameterError);
    EXPECT_THROW(validateParameters({0.05, 170.0}, CompositionParameters(0.0)), ParameterError);
    EXPECT_THROW(validateParameters({0.05, 170.0}, CompositionParameters(1.0)), ParameterError);
    EXPECT_THROW(validateParameters({0.05, 170.0}, CompositionParameters(1.5)), ParameterError);
}

TEST(ValidateParameters, NonFiniteNmocConcentrationRejected) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();
    EXPECT_THROW(validateParameters({0.05, 170.0}, CompositionParameters(0.5, nan)), ParameterError);
    EXPECT_THROW(validateParameters({0.05, 170.0}, CompositionParameters(0.5, inf)), ParameterError);
    EXPECT_THROW(SingleStreamModel(0.05, 170.0, 0.5, nan), ParameterError);
    EXPECT_NO_THROW(SingleStreamModel(0.05, 170.0, 0.5, 0.0));
}

TEST(ValidateParameters, ErrorMessageNamesParameter) {
    try {
        validateParameters({0.05, 600.0}, CompositionParameters(0.5));
        FAIL() << "expected ParameterError";
    } catch (const ParameterError& e) {
        EXPECT_NE(std::string(e.what()).find("L0"), std::string::npos);
    }
}

TEST(ValidateParameters, ErrorsAreStandardExceptions) {
    EXPECT_THROW(validateParameters({0.0, 170.0}, CompositionParameters(0.5)), std::invalid_argument);
    EXPECT_THROW(lookupPreset("nope"), std::out_of_range);
}

// ── validateWasteData ────────────────────────────────────────────────

TEST(ValidateWasteData, AcceptsOrderedData) {
    auto w = validateWasteData({2010, 2011, 2012}, {1.0, 0.0, 2.0});
    EXPECT_TRUE(w.empty());
}

TEST(ValidateWasteData, Rejections) {
    EXPECT_THROW(validateWasteData({}, {}), InputShapeError);
    EXPECT_THROW(validateWasteData({2010, 2011}, {1.0}), InputShapeError);
    EXPECT_THROW(validateWasteData({2010, 2011}, {1.0, -2.0}), InputShapeError);
    EXPECT_THROW(validateWasteData({2011, 2010}, {1.0, 2.0}), InputShapeError);
}

TEST(ValidateWasteData, NonFiniteAmountsRejected) {
    std::vector<int> years{2010, 2011};
    std::vector<double> withNan{std::numeric_limits<double>::quiet_NaN(), 1000.0};
    std::vector<double> withInf{1000.0, std::numeric_limits<double>::infinity()};
    EXPECT_THROW(validateWasteData(years, withNan), InputShapeError);
    EXPECT_THROW(validateWasteData(years, withInf), InputShapeError);
}

TEST(ValidateWasteData, DuplicateYearsWarnOnly) {
    auto w = validateWasteData({2010, 2010, 2011}, {1.0, 2.0, 3.0});
    ASSERT_EQ(w.size(), 1u);
    EXPECT_NE(w[0].find("Duplicate"), std::string::npos);
}

// ── Logging ──────────────────────────────────────────────────────────

TEST(Logging, PackLogMsgUsesBasename) {
    EXPECT_EQ(packLogMsg("/a/b/Model.cpp", 42, "hello"), "[Model.cpp:42] hello");
    EXPECT_EQ(packLogMsg("Model.cpp", 7, "x"), "[Model.cpp:7] x");
}

TEST(Logging, IsLogLevel) {
    EXPECT_TRUE(isLogLevel("debug"));
    EXPECT_TRUE(isLogLevel("warn"));
    EXPECT_TRUE(isLogLevel("off"));
    EXPECT_FALSE(isLogLevel("loud"));
    EXPECT_FALSE(isLogLevel(""));
}

TEST(Logging, InitRejectsUnknownLevel) {
    EXPECT_NO_THROW(initLogging("off"));
    EXPECT_THROW(initLogging("loud"), std::invalid_argument);
    EXPECT_NO_THROW(initLogging("warn"));
}
