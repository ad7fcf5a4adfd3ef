#include <gtest/gtest.h>
#include <limits>
#include <stdexcept>
#include <string>

#include <wiggle/thresholds.hpp>

using namespace wiggle;

// Returns the validation message, or "" if `t` is valid.
static std::string validation_error(const Thresholds& t)
{
    try
    {
        t.validate();
    }
    catch (const std::invalid_argument& e)
    {
        return e.what();
    }
    return "";
}

// ─── Validation ─────────────────────────────────────────────────────────────

TEST(Thresholds, DefaultsAreValid)
{
    EXPECT_NO_THROW(Thresholds{}.validate());
}

TEST(Thresholds, DefaultsMatchMediumPreset)
{
    EXPECT_EQ(Thresholds{}, thresholds_for(Sensitivity::Medium));
}

TEST(Thresholds, RatioMustExceedOne)
{
    Thresholds t;
    t.wiggle_ratio_threshold = 1.0;
    auto msg = validation_error(t);
    EXPECT_NE(msg.find("wiggle_ratio_threshold"), std::string::npos) << msg;

    t.wiggle_ratio_threshold = 1.0001;
    EXPECT_TRUE(validation_error(t).empty());
}

TEST(Thresholds, WindowMustBePositive)
{
    Thresholds t;
    t.time_window = 0.0;
    EXPECT_NE(validation_error(t).find("time_window"), std::string::npos);
    t.time_window = -0.5;
    EXPECT_NE(validation_error(t).find("time_window"), std::string::npos);
    t.time_window = std::numeric_limits<double>::infinity();
    EXPECT_NE(validation_error(t).find("time_window"), std::string::npos);
}

TEST(Thresholds, DirectionChangesAtLeastOne)
{
    Thresholds t;
    t.min_direction_changes = 0;
    EXPECT_NE(validation_error(t).find("min_direction_changes"), std::string::npos);
    t.min_direction_changes = 1;
    EXPECT_TRUE(validation_error(t).empty());
}

TEST(Thresholds, DistancesNonNegative)
{
    Thresholds t;
    t.min_movement_px = -1.0;
    EXPECT_NE(validation_error(t).find("min_movement_px"), std::string::npos);

    t = Thresholds{};
    t.min_total_distance_px = -0.1;
    EXPECT_NE(validation_error(t).find("min_total_distance_px"), std::string::npos);

    t = Thresholds{};
    t.min_movement_px = 0.0;
    t.min_total_distance_px = 0.0;
    EXPECT_TRUE(validation_error(t).empty());
}

TEST(Thresholds, NanRejected)
{
    Thresholds t;
    t.min_movement_px = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(t.validate(), std::invalid_argument);
}

// ─── Presets ────────────────────────────────────────────────────────────────

TEST(Thresholds, PresetValues)
{
    auto low = thresholds_for(Sensitivity::Low);
    EXPECT_EQ(low.min_direction_changes, 5);
    EXPECT_DOUBLE_EQ(low.wiggle_ratio_threshold, 4.0);
    EXPECT_DOUBLE_EQ(low.min_total_distance_px, 150.0);

    auto medium = thresholds_for(Sensitivity::Medium);
    EXPECT_EQ(medium.min_direction_changes, 3);
    EXPECT_DOUBLE_EQ(medium.wiggle_ratio_threshold, 3.0);
    EXPECT_DOUBLE_EQ(medium.min_total_distance_px, 100.0);

    auto high = thresholds_for(Sensitivity::High);
    EXPECT_EQ(high.min_direction_changes, 2);
    EXPECT_DOUBLE_EQ(high.wiggle_ratio_threshold, 2.0);
    EXPECT_DOUBLE_EQ(high.min_total_distance_px, 50.0);
}

TEST(Thresholds, PresetKeepsWindowAndMovement)
{
    Thresholds base;
    base.time_window = 1.25;
    base.min_movement_px = 12.0;
    auto t = thresholds_for(Sensitivity::Low, base);
    EXPECT_DOUBLE_EQ(t.time_window, 1.25);
    EXPECT_DOUBLE_EQ(t.min_movement_px, 12.0);
    EXPECT_EQ(t.min_direction_changes, 5);
}

TEST(Thresholds, PresetsAreValid)
{
    for (auto s : {Sensitivity::Low, Sensitivity::Medium, Sensitivity::High})
        EXPECT_NO_THROW(thresholds_for(s).validate()) << to_string(s);
}

TEST(Thresholds, SensitivityNames)
{
    EXPECT_EQ(sensitivity_from_string("low"), Sensitivity::Low);
    EXPECT_EQ(sensitivity_from_string("MEDIUM"), Sensitivity::Medium);
    EXPECT_EQ(sensitivity_from_string("High"), Sensitivity::High);
    EXPECT_FALSE(sensitivity_from_string("extreme").has_value());
    EXPECT_FALSE(sensitivity_from_string("").has_value());

    for (auto s : {Sensitivity::Low, Sensitivity::Medium, Sensitivity::High})
        EXPECT_EQ(sensitivity_from_string(to_string(s)), s);
}

// ─── Limits ─────────────────────────────────────────────────────────────────

TEST(Thresholds, ClampToLimits)
{
    Thresholds wild{10.0, 0, 0.5, 0.0, 9000.0};
    auto t = clamp_to_limits(wild);
    EXPECT_DOUBLE_EQ(t.time_window, 2.0);
    EXPECT_EQ(t.min_direction_changes, 1);
    EXPECT_DOUBLE_EQ(t.wiggle_ratio_threshold, 1.5);
    EXPECT_DOUBLE_EQ(t.min_movement_px, 1.0);
    EXPECT_DOUBLE_EQ(t.min_total_distance_px, 500.0);
    EXPECT_NO_THROW(t.validate());
}

TEST(Thresholds, ClampLeavesInRangeValuesAlone)
{
    Thresholds t;
    EXPECT_EQ(clamp_to_limits(t), t);
}

TEST(Thresholds, CustomLimits)
{
    ThresholdLimits limits;
    limits.max_direction_changes = 4;
    Thresholds t;
    t.min_direction_changes = 8;
    EXPECT_EQ(clamp_to_limits(t, limits).min_direction_changes, 4);
}
