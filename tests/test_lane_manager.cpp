#include <gtest/gtest.h>

#include "devices/lane_manager.hpp"

using namespace vmc;

TEST(LaneManager, StartsOnFirstLane)
{
    LaneManager lanes;
    EXPECT_EQ(lanes.current_lane(), 1);
    EXPECT_EQ(lanes.next_lane(), 1);

    auto report = lanes.status_report();
    EXPECT_EQ(report.usable_lanes, 8);
    EXPECT_EQ(report.lanes.size(), 8u);
}

TEST(LaneManager, StaysOnLaneBelowThreshold)
{
    LaneManager lanes;
    for (int i = 0; i < 9; ++i) {
        EXPECT_EQ(lanes.next_lane(), 1);
        lanes.record_success(1, 1200);
    }
    EXPECT_EQ(lanes.next_lane(), 1);
}

TEST(LaneManager, RotatesAfterTenSuccesses)
{
    LaneManager lanes;
    for (int i = 0; i < LaneManager::LOAD_BALANCE_THRESHOLD; ++i) {
        lanes.record_success(lanes.next_lane(), 1000);
    }
    EXPECT_EQ(lanes.next_lane(), 2);
    EXPECT_EQ(lanes.status_report().total_dispenses, 10);
}

TEST(LaneManager, ThreeFailuresTakeLaneOutOfRotation)
{
    LaneManager lanes;
    lanes.record_failure(1, 0x02, "Motor failure in slot 1");
    lanes.record_failure(1, 0x02, "Motor failure in slot 1");
    EXPECT_EQ(lanes.next_lane(), 1);

    lanes.record_failure(1, 0x02, "Motor failure in slot 1");
    EXPECT_EQ(lanes.status_report().lanes[0].status, LaneStatus::FAILED);
    EXPECT_EQ(lanes.next_lane(), 2);
}

TEST(LaneManager, SuccessResetsFailureCount)
{
    LaneManager lanes;
    lanes.record_failure(1, std::nullopt, "timeout");
    lanes.record_failure(1, std::nullopt, "timeout");
    lanes.record_success(1, 900);
    lanes.record_failure(1, std::nullopt, "timeout");

    auto info = lanes.status_report().lanes[0];
    EXPECT_EQ(info.failure_count, 1);
    EXPECT_TRUE(info.usable);
}

TEST(LaneManager, OpticalFaultMarksLaneEmpty)
{
    LaneManager lanes;
    lanes.record_failure(1, 0x03, "Optical sensor failure in slot 1");

    auto info = lanes.status_report().lanes[0];
    EXPECT_EQ(info.status, LaneStatus::EMPTY);
    EXPECT_FALSE(info.usable);
    EXPECT_EQ(lanes.next_lane(), 2);
}

TEST(LaneManager, FallbackLanesOrderedByFailures)
{
    LaneManager lanes;
    lanes.record_failure(2, std::nullopt, "timeout");
    lanes.record_failure(2, std::nullopt, "timeout");
    lanes.record_failure(3, std::nullopt, "timeout");
    lanes.disable_lane(4);

    auto fallback = lanes.fallback_lanes(1);
    EXPECT_EQ(fallback, (std::vector<int>{5, 6, 7}));
}

TEST(LaneManager, FallbackKeepsLanesWithFailures)
{
    LaneManager lanes({1, 2, 3});
    lanes.record_failure(3, std::nullopt, "timeout");

    EXPECT_EQ(lanes.fallback_lanes(1), (std::vector<int>{2, 3}));
}

TEST(LaneManager, ResetLaneRestoresIt)
{
    LaneManager lanes;
    lanes.record_failure(1, 0x03, "empty");
    ASSERT_FALSE(lanes.status_report().lanes[0].usable);

    lanes.reset_lane(1);
    auto info = lanes.status_report().lanes[0];
    EXPECT_TRUE(info.usable);
    EXPECT_EQ(info.failure_count, 0);
}

TEST(LaneManager, ResetAllReturnsToFirstLane)
{
    LaneManager lanes;
    lanes.record_failure(1, 0x03, "empty");
    EXPECT_EQ(lanes.next_lane(), 2);
    lanes.record_success(2, 800);

    lanes.reset_all();
    auto report = lanes.status_report();
    EXPECT_EQ(report.current_lane, 1);
    EXPECT_EQ(report.total_dispenses, 0);
    EXPECT_EQ(report.usable_lanes, 8);
}

TEST(LaneManager, NoUsableLaneKeepsCurrent)
{
    LaneManager lanes({1, 2});
    lanes.record_failure(1, 0x03, "empty");
    lanes.record_failure(2, 0x03, "empty");

    EXPECT_EQ(lanes.next_lane(), 1);
    EXPECT_EQ(lanes.status_report().usable_lanes, 0);
}

TEST(LaneManager, UnknownLaneIsIgnored)
{
    LaneManager lanes;
    lanes.record_failure(42, 0x02, "motor");
    lanes.record_success(42, 100);
    EXPECT_EQ(lanes.status_report().total_dispenses, 0);
}

TEST(LaneManager, ReportText)
{
    LaneManager lanes({1, 2});
    lanes.disable_lane(2);
    std::string text = lanes.status_report().to_string();
    EXPECT_NE(text.find("Usable Lanes: 1/2"), std::string::npos);
    EXPECT_NE(text.find("Lane 2: Disabled"), std::string::npos);
}
