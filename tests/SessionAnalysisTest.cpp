/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include <gtest/gtest.h>

#include "session/SessionAnalysis.hpp"

namespace
{
    const AbnormalFinding *findMetric(const SessionAnalysis &analysis, const std::string &metric)
    {
        for (const AbnormalFinding &finding : analysis.findings)
        {
            if (finding.metric == metric) return &finding;
        }
        return nullptr;
    }

    bool startsWith(const std::string &text, const std::string &prefix)
    {
        return text.compare(0, prefix.size(), prefix) == 0;
    }
}

TEST(SessionAnalysisTest, EmptySessionIsAllNormal)
{
    SessionAnalysisEngine engine;
    const SessionAnalysis analysis = engine.Analyze(SessionSummary());

    EXPECT_EQ(analysis.totalEvaluated, 0);
    EXPECT_TRUE(analysis.findings.empty());
    EXPECT_EQ(analysis.NormalPercentage(), 100);
    EXPECT_EQ(analysis.overallSeverity, Severity::Normal);
    EXPECT_TRUE(startsWith(analysis.overallAssessment, "All 0 evaluated metrics are within normal clinical ranges."));
}

TEST(SessionAnalysisTest, HealthySession)
{
    SessionSummary summary;
    summary.averageCvaDeg = 52.0;
    summary.averageSvaCm = 1.0;
    summary.averageWalkingSpeedMPS = 1.2;
    summary.averageCadenceSPM = 112.0;
    summary.averageRebaScore = 2.4;

    SessionAnalysisEngine engine;
    const SessionAnalysis analysis = engine.Analyze(summary);
    EXPECT_EQ(analysis.totalEvaluated, 5);
    EXPECT_EQ(analysis.normalCount, 5);
    EXPECT_EQ(analysis.NormalPercentage(), 100);
    EXPECT_TRUE(startsWith(analysis.overallAssessment, "All 5 evaluated metrics are within normal clinical ranges."));
}

TEST(SessionAnalysisTest, FindingsAreRankedBySeverityThenName)
{
    SessionSummary summary;
    summary.averageCvaDeg = 35.0;          // moderate
    summary.averageCadenceSPM = 140.0;     // mild
    summary.averageSwayVelocityMMS = 30.0; // severe
    summary.averageWalkingSpeedMPS = 0.0;  // standing, not evaluated
    summary.tug = TugResult{12.0, FallRiskLevel::Moderate, ""};

    SessionAnalysisEngine engine;
    const SessionAnalysis analysis = engine.Analyze(summary);

    EXPECT_EQ(analysis.totalEvaluated, 4);
    EXPECT_EQ(analysis.normalCount, 0);
    EXPECT_EQ(analysis.NormalPercentage(), 0);
    ASSERT_EQ(analysis.findings.size(), 4u);
    EXPECT_EQ(analysis.findings[0].metric, "Sway Velocity");
    EXPECT_EQ(analysis.findings[1].metric, "Craniovertebral Angle (CVA)");
    EXPECT_EQ(analysis.findings[2].metric, "Cadence");
    EXPECT_EQ(analysis.findings[3].metric, "Timed Up & Go");
    EXPECT_EQ(analysis.overallSeverity, Severity::Severe);

    EXPECT_EQ(analysis.findings[1].value, "35.0 deg");
    EXPECT_EQ(analysis.findings[1].normalRange, "49-56 deg");
    EXPECT_FALSE(analysis.findings[1].likelyCauses.empty());
    EXPECT_FALSE(analysis.findings[1].recommendation.empty());

    EXPECT_TRUE(startsWith(analysis.overallAssessment, "Out of 4 metrics evaluated, 4 fall outside normal ranges; 1 "
                                                       "require attention; 1 are moderately abnormal."));
}

TEST(SessionAnalysisTest, MildOnlySessionText)
{
    SessionSummary summary;
    summary.averageCadenceSPM = 90.0;
    summary.averageCvaDeg = 50.0;

    SessionAnalysisEngine engine;
    const SessionAnalysis analysis = engine.Analyze(summary);
    ASSERT_EQ(analysis.findings.size(), 1u);
    EXPECT_EQ(analysis.findings[0].severity, Severity::Mild);
    EXPECT_EQ(analysis.findings[0].value, "90 SPM");
    EXPECT_EQ(analysis.overallSeverity, Severity::Mild);
    EXPECT_EQ(analysis.NormalPercentage(), 50);
    EXPECT_TRUE(startsWith(analysis.overallAssessment,
                           "Out of 2 metrics evaluated, 1 fall outside normal ranges; 1 show mild deviation."));
}

TEST(SessionAnalysisTest, ErgonomicScoreIsRounded)
{
    SessionAnalysisEngine engine;

    SessionSummary low;
    low.averageRebaScore = 3.4;
    EXPECT_TRUE(engine.Analyze(low).findings.empty());

    SessionSummary medium;
    medium.averageRebaScore = 6.6;
    const SessionAnalysis moderate = engine.Analyze(medium);
    ASSERT_EQ(moderate.findings.size(), 1u);
    EXPECT_EQ(moderate.findings[0].severity, Severity::Moderate);
    EXPECT_EQ(moderate.findings[0].value, "7/15");

    SessionSummary high;
    high.averageRebaScore = 7.6;
    ASSERT_EQ(engine.Analyze(high).findings.size(), 1u);
    EXPECT_EQ(engine.Analyze(high).findings[0].severity, Severity::Severe);
}

TEST(SessionAnalysisTest, CompositeAssessments)
{
    SessionSummary summary;
    FallRiskAssessment fallRisk;
    fallRisk.compositeScore = 40.0;
    fallRisk.riskLevel = FallRiskLevel::Moderate;
    summary.fallRisk = fallRisk;
    FatigueAssessment fatigue;
    fatigue.fatigueIndex = 30.0;
    summary.fatigue = fatigue;
    FrailtyResult frailty;
    frailty.friedScore = 3;
    summary.frailty = frailty;

    SessionAnalysisEngine engine;
    const SessionAnalysis analysis = engine.Analyze(summary);
    EXPECT_EQ(analysis.totalEvaluated, 3);

    const AbnormalFinding *risk = findMetric(analysis, "Fall Risk");
    ASSERT_NE(risk, nullptr);
    EXPECT_EQ(risk->severity, Severity::Moderate);
    EXPECT_EQ(risk->value, "40/100 (Moderate)");

    const AbnormalFinding *tired = findMetric(analysis, "Fatigue Index");
    ASSERT_NE(tired, nullptr);
    EXPECT_EQ(tired->severity, Severity::Mild);

    const AbnormalFinding *frail = findMetric(analysis, "Frailty (Fried)");
    ASSERT_NE(frail, nullptr);
    EXPECT_EQ(frail->severity, Severity::Severe);
    EXPECT_EQ(frail->value, "3/5 (Frail)");
    EXPECT_EQ(analysis.findings.front().metric, "Frailty (Fried)");
}

TEST(SessionAnalysisTest, RobustScreeningIsNotEvaluated)
{
    SessionSummary summary;
    summary.frailty = FrailtyResult();

    SessionAnalysisEngine engine;
    EXPECT_EQ(engine.Analyze(summary).totalEvaluated, 0);
}

TEST(SessionAnalysisTest, TimedUpAndGoBands)
{
    SessionAnalysisEngine engine;
    const auto severityOf = [&engine](const double seconds) {
        SessionSummary summary;
        summary.tug = TugResult{seconds, FallRiskLevel::Low, ""};
        const SessionAnalysis analysis = engine.Analyze(summary);
        return analysis.findings.empty() ? Severity::Normal : analysis.findings[0].severity;
    };

    EXPECT_EQ(severityOf(10.0), Severity::Normal);
    EXPECT_EQ(severityOf(13.5), Severity::Mild);
    EXPECT_EQ(severityOf(14.0), Severity::Severe);
}

TEST(SessionAnalysisTest, LateralLeanReportsDirection)
{
    SessionSummary summary;
    summary.averageLateralLeanDeg = -4.0;

    SessionAnalysisEngine engine;
    const SessionAnalysis analysis = engine.Analyze(summary);
    ASSERT_EQ(analysis.findings.size(), 1u);
    EXPECT_EQ(analysis.findings[0].value, "4.0 deg left");
}
