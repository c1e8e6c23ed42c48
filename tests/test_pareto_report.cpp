#include <gtest/gtest.h>
#include <report/pareto_report.hpp>

using namespace widepath::report;

namespace {

const char* SAMPLE_REPORT = R"(Loading graph from nodes_264346.txt
Source: 1024
Destination: 88731
Departure Time: 480 minutes (08:00)
Budget: 95.5 minutes

--- Pareto Path #1 ---
Wideness Score: 87.25%
Right Turns: 3
Sharp Turns: 0
Travel Time: 41.20 minutes

--- Pareto Path #2 ---
Wideness Score: 92.10%
Right Turns: 7
Sharp Turns: 1
Travel Time: 55.75 minutes
Source: 5
)";

}  // namespace

TEST(ParetoReport, ParsesHeaderFieldsAndPaths) {
    ParetoReport report = parse_pareto_report(SAMPLE_REPORT);

    ASSERT_TRUE(report.has_pair());
    EXPECT_EQ(*report.source, 1024);
    EXPECT_EQ(*report.destination, 88731);
    EXPECT_DOUBLE_EQ(*report.departure_minutes, 480.0);
    EXPECT_EQ(*report.departure_clock, "08:00");
    EXPECT_DOUBLE_EQ(*report.budget_minutes, 95.5);

    EXPECT_EQ(report.path_headers, 2u);
    ASSERT_EQ(report.paths.size(), 2u);
    EXPECT_EQ(report.paths[0].number, 1);
    EXPECT_DOUBLE_EQ(report.paths[0].wideness_percent, 87.25);
    EXPECT_EQ(report.paths[0].right_turns, 3);
    EXPECT_EQ(report.paths[0].sharp_turns, 0);
    EXPECT_DOUBLE_EQ(report.paths[0].travel_minutes, 41.2);
    EXPECT_EQ(report.paths[1].right_turns, 7);
    EXPECT_EQ(report.paths[1].sharp_turns, 1);
}

TEST(ParetoReport, IncompleteBlockCountsHeaderOnly) {
    ParetoReport report = parse_pareto_report(
        "Source: 1\nDestination: 2\n"
        "--- Pareto Path #1 ---\n"
        "Wideness Score: 50%\n"
        "Budget: 30 minutes\n"
        "--- Pareto Path #2 ---\n"
        "Wideness Score: 60%\nRight Turns: 1\nSharp Turns: 2\nTravel Time: 12 minutes\n");

    EXPECT_EQ(report.path_headers, 2u);
    ASSERT_EQ(report.paths.size(), 1u);
    EXPECT_EQ(report.paths[0].number, 2);
    EXPECT_DOUBLE_EQ(*report.budget_minutes, 30.0);
}

TEST(ParetoReport, NoPair) {
    ParetoReport report = parse_pareto_report("Destination: 9\nnothing else\n");
    EXPECT_FALSE(report.has_pair());
    EXPECT_EQ(format_pareto_summary(report), "No valid pair found in report.\n");
}

TEST(ParetoReport, SummaryListsPaths) {
    std::string summary = format_pareto_summary(parse_pareto_report(SAMPLE_REPORT));
    EXPECT_NE(summary.find("Source node:       1024"), std::string::npos);
    EXPECT_NE(summary.find("Departure time:    08:00"), std::string::npos);
    EXPECT_NE(summary.find("Budget:            95.5 minutes"), std::string::npos);
    EXPECT_NE(summary.find("Pareto routes:     2"), std::string::npos);
    EXPECT_NE(summary.find("87.25%"), std::string::npos);
    EXPECT_NE(summary.find("55.75 min"), std::string::npos);
}
