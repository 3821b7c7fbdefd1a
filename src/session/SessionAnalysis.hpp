/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */
#pragma once

#include <string>
#include <vector>

#include "clinical/Severity.hpp"
#include "session/SessionSummary.hpp"

/// @brief One metric outside its normal range
struct AbnormalFinding
{
    std::string metric;
    std::string value;
    std::string normalRange;
    Severity severity;
    std::vector<std::string> likelyCauses;
    std::string recommendation;
};

struct SessionAnalysis
{
    std::string overallAssessment;
    std::vector<AbnormalFinding> findings; // severe first, then by metric name
    int normalCount{0};
    int totalEvaluated{0};
    Severity overallSeverity{Severity::Normal};

    /// @brief Share of evaluated metrics in the normal range, 100 when nothing was evaluated
    int NormalPercentage() const;
};

/// @brief Evaluates a finalized session against the clinical ranges and ranks the deviations
class SessionAnalysisEngine
{
private:
    struct Tally
    {
        std::vector<AbnormalFinding> findings;
        int normal{0};
        int total{0};

        void Add(const Severity severity, AbnormalFinding finding);
    };

    static void evaluatePosture(const SessionSummary &summary, Tally &tally);
    static void evaluateGait(const SessionSummary &summary, Tally &tally);
    static void evaluateBalance(const SessionSummary &summary, Tally &tally);
    static void evaluateRisk(const SessionSummary &summary, Tally &tally);
    static void evaluateClinicalTests(const SessionSummary &summary, Tally &tally);

    static std::string overallAssessment(const std::vector<AbnormalFinding> &findings, const int totalEvaluated);

public:
    SessionAnalysisEngine(){};
    ~SessionAnalysisEngine(){};

    SessionAnalysis Analyze(const SessionSummary &summary) const;
};
