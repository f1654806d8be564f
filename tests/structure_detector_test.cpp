// structure_detector_test.cpp — fractal swings, BOS / ChoCH classification

#include <gtest/gtest.h>

#include "structure/structure_detector.hpp"
#include "test_bar_helpers.hpp"

#include <cmath>
#include <stdexcept>
#include <vector>

namespace {

using test_helpers::M5_NS;
using test_helpers::RTH_OPEN_NS;

struct Hlc {
    double high;
    double low;
    double close;
};

std::vector<Bar> bars_from(const std::vector<Hlc>& rows) {
    std::vector<Bar> bars;
    for (size_t i = 0; i < rows.size(); ++i) {
        bars.push_back(test_helpers::make_bar(rows[i].close, rows[i].high, rows[i].low,
                                              rows[i].close,
                                              RTH_OPEN_NS + static_cast<uint64_t>(i) * M5_NS));
    }
    return bars;
}

// Swing high at index 2 (105), broken upward at index 5.
const std::vector<Hlc> BULL_BREAK = {
    {101.0, 99.0, 100.0},
    {102.0, 99.5, 101.0},
    {105.0, 100.0, 104.0},
    {103.0, 100.5, 102.0},
    {102.5, 99.8, 101.0},
    {106.0, 101.0, 105.5},
};

// BULL_BREAK mirrored around 100: swing low at index 2 (95), broken down at index 5.
const std::vector<Hlc> BEAR_BREAK = {
    {101.0, 99.0, 100.0},
    {100.5, 98.0, 99.0},
    {100.0, 95.0, 96.0},
    {99.5, 97.0, 98.0},
    {100.2, 97.5, 99.0},
    {99.0, 94.0, 94.5},
};

}  // namespace

class StructureDetectorTest : public ::testing::Test {
protected:
    StructureDetector det{StructureConfig{}};

    void feed(const std::vector<Bar>& bars) {
        for (const auto& b : bars) det.update(b);
    }
};

TEST_F(StructureDetectorTest, StartsNeutralWithoutLevels) {
    const auto& st = det.state();
    EXPECT_EQ(st.direction, StructureDirection::NEUTRAL);
    EXPECT_EQ(st.last_break, BreakType::NONE);
    EXPECT_FALSE(st.has_levels());
    EXPECT_TRUE(std::isnan(det.upper_fractal()));
    EXPECT_TRUE(std::isnan(det.lower_fractal()));
}

TEST_F(StructureDetectorTest, SwingHighConfirmedAfterFractalBars) {
    auto bars = bars_from(BULL_BREAK);
    for (int i = 0; i < 4; ++i) det.update(bars[i]);
    EXPECT_TRUE(std::isnan(det.upper_fractal()));

    det.update(bars[4]);
    EXPECT_DOUBLE_EQ(det.upper_fractal(), 105.0);
    EXPECT_EQ(det.state().direction, StructureDirection::NEUTRAL);
}

TEST_F(StructureDetectorTest, EqualHighsDoNotFormSwing) {
    feed(bars_from({{101.0, 99.0, 100.0},
                    {105.0, 99.5, 101.0},
                    {105.0, 100.0, 104.0},
                    {103.0, 100.5, 102.0},
                    {102.5, 100.8, 101.0}}));
    EXPECT_TRUE(std::isnan(det.upper_fractal()));
}

TEST_F(StructureDetectorTest, FirstBreakFromNeutralIsChoch) {
    feed(bars_from(BULL_BREAK));
    const auto& st = det.state();
    EXPECT_EQ(st.direction, StructureDirection::BULL);
    EXPECT_EQ(st.last_break, BreakType::CHOCH);
    EXPECT_TRUE(st.broke_this_bar);
    EXPECT_EQ(st.break_direction, StructureDirection::BULL);
    EXPECT_TRUE(std::isnan(det.upper_fractal()));  // consumed

    // No lower swing yet: the broken level is the reversal level.
    EXPECT_DOUBLE_EQ(st.strong_level, 105.0);
    EXPECT_DOUBLE_EQ(st.weak_level, 106.0);
}

TEST_F(StructureDetectorTest, BreakFlagLastsOneBar) {
    feed(bars_from(BULL_BREAK));
    det.update(test_helpers::make_bar(105.5, 106.5, 105.0, 106.0, RTH_OPEN_NS + 6 * M5_NS));
    EXPECT_FALSE(det.state().broke_this_bar);
    EXPECT_EQ(det.state().last_break, BreakType::CHOCH);
    EXPECT_EQ(det.state().direction, StructureDirection::BULL);
    EXPECT_DOUBLE_EQ(det.state().weak_level, 106.5);
}

TEST_F(StructureDetectorTest, SecondBreakSameDirectionIsBos) {
    auto rows = BULL_BREAK;
    rows.push_back({107.0, 105.0, 106.5});
    rows.push_back({108.0, 106.0, 107.5});
    rows.push_back({107.5, 106.2, 107.0});
    rows.push_back({107.0, 106.5, 106.8});
    auto bars = bars_from(rows);
    feed(bars);
    EXPECT_DOUBLE_EQ(det.upper_fractal(), 108.0);
    EXPECT_DOUBLE_EQ(det.state().strong_level, 99.8);  // swing low at index 4

    det.update(test_helpers::make_bar(106.8, 109.0, 107.0, 108.5,
                                      RTH_OPEN_NS + 10 * M5_NS));
    const auto& st = det.state();
    EXPECT_TRUE(st.broke_this_bar);
    EXPECT_EQ(st.last_break, BreakType::BOS);
    EXPECT_EQ(st.direction, StructureDirection::BULL);
    EXPECT_FALSE(st.choch_against(StructureDirection::BULL));
}

TEST_F(StructureDetectorTest, OppositeBreakIsChoch) {
    auto rows = BULL_BREAK;
    rows.push_back({105.0, 104.0, 104.5});
    rows.push_back({104.0, 99.0, 99.5});
    feed(bars_from(rows));

    const auto& st = det.state();
    EXPECT_EQ(st.direction, StructureDirection::BEAR);
    EXPECT_EQ(st.last_break, BreakType::CHOCH);
    EXPECT_EQ(st.break_direction, StructureDirection::BEAR);
    EXPECT_TRUE(st.choch_against(StructureDirection::BULL));
    EXPECT_FALSE(st.choch_against(StructureDirection::BEAR));
    EXPECT_FALSE(st.choch_against(StructureDirection::NEUTRAL));

    EXPECT_DOUBLE_EQ(st.weak_level, 99.0);
    EXPECT_DOUBLE_EQ(st.strong_level, 106.0);  // swing high at index 5
}

TEST_F(StructureDetectorTest, StrongLevelIsBrokenLevelUntilOppositeSwingConfirms) {
    auto rows = BULL_BREAK;
    rows.push_back({107.0, 105.0, 106.5});
    auto bars = bars_from(rows);
    for (int i = 0; i < 6; ++i) det.update(bars[i]);
    ASSERT_EQ(det.state().direction, StructureDirection::BULL);
    EXPECT_TRUE(std::isnan(det.lower_fractal()));
    EXPECT_DOUBLE_EQ(det.state().strong_level, 105.0);

    // Bar 6 confirms the swing low at index 4, which takes over.
    det.update(bars[6]);
    EXPECT_DOUBLE_EQ(det.lower_fractal(), 99.8);
    EXPECT_DOUBLE_EQ(det.state().strong_level, 99.8);
    EXPECT_DOUBLE_EQ(det.state().weak_level, 107.0);
}

TEST_F(StructureDetectorTest, BearishStrongLevelFallsBackToBrokenLow) {
    feed(bars_from(BEAR_BREAK));
    const auto& st = det.state();
    EXPECT_EQ(st.direction, StructureDirection::BEAR);
    EXPECT_EQ(st.last_break, BreakType::CHOCH);
    EXPECT_TRUE(std::isnan(det.upper_fractal()));
    EXPECT_DOUBLE_EQ(st.strong_level, 95.0);
    EXPECT_DOUBLE_EQ(st.weak_level, 94.0);
}

TEST_F(StructureDetectorTest, BarsSeenCountsEveryUpdate) {
    feed(bars_from(BULL_BREAK));
    EXPECT_EQ(det.state().bars_seen, 6);
}

TEST_F(StructureDetectorTest, ResetClearsEverything) {
    feed(bars_from(BULL_BREAK));
    det.reset();
    EXPECT_EQ(det.state().direction, StructureDirection::NEUTRAL);
    EXPECT_EQ(det.state().bars_seen, 0);
    EXPECT_FALSE(det.state().has_levels());
}

TEST_F(StructureDetectorTest, LargerFractalNeedsMoreBars) {
    StructureDetector wide(StructureConfig{3});
    auto bars = bars_from(BULL_BREAK);
    for (const auto& b : bars) wide.update(b);
    // Index 2 has only two bars on its left side.
    EXPECT_EQ(wide.state().direction, StructureDirection::NEUTRAL);
    EXPECT_TRUE(std::isnan(wide.upper_fractal()));
}

TEST(StructureConfigTest, RejectsZeroFractalBars) {
    StructureConfig cfg;
    cfg.fractal_bars = 0;
    EXPECT_THROW(cfg.validate(), std::invalid_argument);
    EXPECT_THROW(StructureDetector{cfg}, std::invalid_argument);
}

TEST(StructureConfigTest, WindowSize) {
    StructureConfig cfg;
    EXPECT_EQ(cfg.window(), 5);
}
