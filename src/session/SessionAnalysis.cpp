/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "SessionAnalysis.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <utility>

#include "clinical/ClinicalThresholds.hpp"
#include "utils/StringUtil.hpp"

int SessionAnalysis::NormalPercentage() const
{
    if (totalEvaluated <= 0) return 100;
    return static_cast<int>(static_cast<double>(normalCount) / totalEvaluated * 100.0);
}

void SessionAnalysisEngine::Tally::Add(const Severity severity, AbnormalFinding finding)
{
    total++;
    if (severity == Severity::Normal)
    {
        normal++;
        return;
    }
    finding.severity = severity;
    findings.push_back(std::move(finding));
}

void SessionAnalysisEngine::evaluatePosture(const SessionSummary &summary, Tally &tally)
{
    if (summary.averageCvaDeg)
    {
        const double cva = *summary.averageCvaDeg;
        tally.Add(PostureThresholds::CvaSeverity(cva),
                  {"Craniovertebral Angle (CVA)",
                   StringUtil::Fixed(cva, 1) + " deg",
                   "49-56 deg",
                   Severity::Normal,
                   {"Prolonged screen use or desk work with head forward", "Weakness of deep cervical flexor muscles",
                    "Tight upper trapezius and suboccipital muscles", "Poor workstation ergonomics (monitor too low)"},
                   "Chin tucks and cervical retraction exercises strengthen deep neck flexors and restore "
                   "head-over-shoulders alignment."});
    }

    if (summary.averageSvaCm)
    {
        const double sva = *summary.averageSvaCm;
        tally.Add(PostureThresholds::SvaSeverity(sva),
                  {"Sagittal Vertical Axis (SVA)",
                   StringUtil::Fixed(sva, 1) + " cm",
                   "< 5 cm",
                   Severity::Normal,
                   {"Tight hip flexors pulling pelvis into anterior tilt", "Weak spinal extensor muscles (erector spinae)",
                    "Degenerative disc changes reducing lordosis", "Compensatory forward lean from flexion contracture"},
                   "Strengthen back extensors with prone exercises and stretch hip flexors to restore sagittal "
                   "balance."});
    }

    if (summary.averageTrunkLeanDeg)
    {
        const double trunk = *summary.averageTrunkLeanDeg;
        tally.Add(PostureThresholds::TrunkForwardSeverity(trunk),
                  {"Trunk Forward Lean",
                   StringUtil::Fixed(trunk, 1) + " deg",
                   "< 5 deg",
                   Severity::Normal,
                   {"Weak core and gluteal muscles", "Tight hip flexors (iliopsoas)",
                    "Compensatory leaning due to balance deficits", "Habitual slouching during standing or walking"},
                   "Core stabilization, hip flexor stretching and postural awareness training can reduce forward "
                   "lean."});
    }

    if (summary.averageLateralLeanDeg)
    {
        const double lateral = *summary.averageLateralLeanDeg;
        const std::string direction = lateral > 0.0 ? "right" : "left";
        tally.Add(PostureThresholds::LateralLeanSeverity(lateral),
                  {"Lateral Trunk Lean",
                   StringUtil::Fixed(std::abs(lateral), 1) + " deg " + direction,
                   "< 2 deg",
                   Severity::Normal,
                   {"Hip abductor weakness (Trendelenburg pattern)", "Leg length discrepancy",
                    "Unilateral pain avoidance (antalgic lean)", "Scoliotic curvature or habitual asymmetric posture"},
                   "Strengthen hip abductors bilaterally and practice symmetrical weight-bearing."});
    }

    if (summary.averageKyphosisDeg)
    {
        const double kyphosis = *summary.averageKyphosisDeg;
        const bool excessive = kyphosis > 45.0;
        AbnormalFinding finding{"Thoracic Kyphosis", StringUtil::Fixed(kyphosis, 1) + " deg", "20-45 deg",
                                Severity::Normal, {}, ""};
        if (excessive)
        {
            finding.likelyCauses = {"Prolonged seated posture with rounded shoulders",
                                    "Tight pectoral muscles pulling shoulders forward",
                                    "Weak lower trapezius and rhomboid muscles",
                                    "Age-related spinal changes or osteoporotic compression"};
            finding.recommendation =
                "Thoracic extension exercises and pectoral stretching can reduce excessive rounding.";
        }
        else
        {
            finding.likelyCauses = {"Flat-back posture or military posture pattern", "Reduced thoracic mobility",
                                    "Excess erector spinae activation"};
            finding.recommendation = "Spinal mobility exercises (cat-cow) can restore normal thoracic curvature.";
        }
        tally.Add(PostureThresholds::KyphosisSeverity(kyphosis), finding);
    }

    if (summary.averageLordosisDeg)
    {
        const double lordosis = *summary.averageLordosisDeg;
        const bool excessive = lordosis > 60.0;
        AbnormalFinding finding{"Lumbar Lordosis", StringUtil::Fixed(lordosis, 1) + " deg", "40-60 deg",
                                Severity::Normal, {}, ""};
        if (excessive)
        {
            finding.likelyCauses = {"Tight hip flexors increasing anterior pelvic tilt",
                                    "Weak abdominals (especially transverse abdominis)",
                                    "Pregnancy or increased abdominal mass", "Kyphotic-lordotic postural pattern"};
            finding.recommendation = "Strengthen core muscles and stretch hip flexors to reduce anterior pelvic tilt.";
        }
        else
        {
            finding.likelyCauses = {"Tight hamstrings pulling pelvis into posterior tilt", "Flat-back postural pattern",
                                    "Disc pathology reducing lumbar curve", "Excessive core bracing or guarding"};
            finding.recommendation = "Stretch hamstrings and practice pelvic neutral positioning exercises.";
        }
        tally.Add(PostureThresholds::LordosisSeverity(lordosis), finding);
    }

    if (summary.averageCoronalDeviationCm)
    {
        const double coronal = *summary.averageCoronalDeviationCm;
        tally.Add(PostureThresholds::ScoliosisSeverity(coronal),
                  {"Coronal Spine Deviation",
                   StringUtil::Fixed(coronal, 1) + " cm",
                   "< 1 cm",
                   Severity::Normal,
                   {"Structural or functional scoliosis", "Muscle guarding from unilateral pain",
                    "Leg length discrepancy affecting spinal alignment", "Neuromuscular asymmetry"},
                   "Consult a healthcare provider. Core stabilization and symmetry exercises may help functional "
                   "causes."});
    }

    if (summary.averageShoulderAsymmetryCm)
    {
        const double shoulder = *summary.averageShoulderAsymmetryCm;
        tally.Add(PostureThresholds::ShoulderSeverity(shoulder),
                  {"Shoulder Asymmetry",
                   StringUtil::Fixed(shoulder, 1) + " cm",
                   "< 1.5 cm",
                   Severity::Normal,
                   {"Dominant-side muscle hypertrophy or overuse", "Carrying bags or children on one side",
                    "Scoliosis or vertebral rotation", "Unilateral upper trapezius tightness or weakness"},
                   "Balanced shoulder blade exercises and avoid habitual asymmetric loading."});
    }

    if (summary.averagePelvicObliquityDeg)
    {
        const double pelvic = *summary.averagePelvicObliquityDeg;
        tally.Add(PostureThresholds::PelvicSeverity(pelvic),
                  {"Pelvic Obliquity",
                   StringUtil::Fixed(std::abs(pelvic), 1) + " deg",
                   "< 1 deg",
                   Severity::Normal,
                   {"Gluteus medius weakness on the higher side", "Functional or anatomical leg length discrepancy",
                    "Habitual standing on one leg", "Hip joint pathology (labral tear, OA)"},
                   "Hip stabilization exercises (clam shells, lateral band walks) and symmetrical weight-bearing."});
    }
}

void SessionAnalysisEngine::evaluateGait(const SessionSummary &summary, Tally &tally)
{
    if (summary.averageWalkingSpeedMPS && *summary.averageWalkingSpeedMPS > 0.0)
    {
        const double speed = *summary.averageWalkingSpeedMPS;
        tally.Add(GaitThresholds::SpeedSeverity(speed),
                  {"Walking Speed",
                   StringUtil::Fixed(speed, 2) + " m/s",
                   ">= 1.0 m/s",
                   Severity::Normal,
                   {"Reduced lower extremity strength", "Fear of falling or balance insecurity",
                    "Pain-limited gait (joint or muscular)", "Deconditioning from reduced physical activity"},
                   "Lower body strengthening (sit-to-stands, heel raises) and walking interval training."});
    }

    if (summary.gait.stepAsymmetryPercent)
    {
        const double asymmetry = *summary.gait.stepAsymmetryPercent;
        tally.Add(GaitThresholds::SymmetrySeverity(asymmetry),
                  {"Gait Asymmetry",
                   StringUtil::Fixed(asymmetry, 1) + "%",
                   "< 10%",
                   Severity::Normal,
                   {"Unilateral lower extremity weakness", "Pain avoidance on one side (antalgic gait)",
                    "Leg length discrepancy", "Hip or knee joint pathology"},
                   "Single-leg strengthening and balance training on the weaker side to restore step symmetry."});
    }

    if (summary.averageCadenceSPM)
    {
        // out of range cadence is always a mild finding
        const double cadence = *summary.averageCadenceSPM;
        const bool inRange =
            cadence >= GaitThresholds::CADENCE_NORMAL_MIN && cadence <= GaitThresholds::CADENCE_NORMAL_MAX;
        const bool isLow = cadence < GaitThresholds::CADENCE_NORMAL_MIN;
        AbnormalFinding finding{"Cadence", StringUtil::Fixed(cadence, 0) + " SPM", "100-130 SPM", Severity::Normal,
                                {}, ""};
        if (isLow)
        {
            finding.likelyCauses = {"Guarded or cautious gait pattern", "Pain during walking",
                                    "Reduced mobility or stiffness", "Fear of falling"};
            finding.recommendation = "Focus on comfortable walking with natural arm swing.";
        }
        else
        {
            finding.likelyCauses = {"Short stride length compensated by rapid stepping", "Shuffling gait pattern",
                                    "Parkinsonian gait characteristics"};
            finding.recommendation = "Work on increasing stride length via hip flexor stretching.";
        }
        tally.Add(inRange ? Severity::Normal : Severity::Mild, finding);
    }
}

void SessionAnalysisEngine::evaluateBalance(const SessionSummary &summary, Tally &tally)
{
    if (!summary.averageSwayVelocityMMS) return;

    const double sway = *summary.averageSwayVelocityMMS;
    tally.Add(sway > BalanceThresholds::SWAY_VELOCITY_FALL_RISK ? Severity::Severe : Severity::Normal,
              {"Sway Velocity",
               StringUtil::Fixed(sway, 1) + " mm/s",
               "< 25 mm/s",
               Severity::Normal,
               {"Vestibular dysfunction", "Peripheral neuropathy (reduced proprioception)",
                "Ankle strategy impairment", "Visual dependence for balance"},
               "Balance training (tandem walking, single-leg stance) and healthcare evaluation recommended."});
}

void SessionAnalysisEngine::evaluateRisk(const SessionSummary &summary, Tally &tally)
{
    if (summary.fallRisk)
    {
        const FallRiskAssessment &fallRisk = *summary.fallRisk;
        Severity severity = Severity::Severe;
        if (fallRisk.riskLevel == FallRiskLevel::Low)
            severity = Severity::Normal;
        else if (fallRisk.riskLevel == FallRiskLevel::Moderate)
            severity = Severity::Moderate;

        std::string level = ClinicalTypeUtil::ToString(fallRisk.riskLevel);
        level[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(level[0])));
        tally.Add(severity,
                  {"Fall Risk",
                   StringUtil::Fixed(fallRisk.compositeScore, 0) + "/100 (" + level + ")",
                   "Low (< 30)",
                   Severity::Normal,
                   {"Reduced gait speed, increased sway and asymmetry", "Muscle weakness in lower extremities",
                    "Medication effects (sedatives, antihypertensives)",
                    "Environmental hazards (loose rugs, poor lighting)"},
                   "Prioritize balance and strength exercises. Review medications and home safety with your "
                   "provider."});
    }

    if (summary.fatigue)
    {
        const double fatigue = summary.fatigue->fatigueIndex;
        Severity severity = Severity::Severe;
        if (fatigue < 25.0)
            severity = Severity::Normal;
        else if (fatigue < 50.0)
            severity = Severity::Mild;
        else if (fatigue < 75.0)
            severity = Severity::Moderate;

        tally.Add(severity,
                  {"Fatigue Index",
                   StringUtil::Fixed(fatigue, 0) + "/100",
                   "< 25",
                   Severity::Normal,
                   {"Weak postural stabilizer muscles", "Deconditioning or low fitness baseline",
                    "Session duration exceeding endurance capacity", "Sleep deprivation or systemic fatigue"},
                   "Build postural endurance gradually. Diaphragmatic breathing reduces compensatory tension."});
    }

    if (summary.averageRebaScore)
    {
        const int reba = static_cast<int>(std::lround(*summary.averageRebaScore));
        Severity severity = Severity::Severe;
        if (reba <= 3)
            severity = Severity::Normal;
        else if (reba <= 7)
            severity = Severity::Moderate;

        tally.Add(severity,
                  {"REBA Score (Ergonomic Risk)",
                   std::to_string(reba) + "/15",
                   "1-3 (Low risk)",
                   Severity::Normal,
                   {"Sustained awkward postures during daily activities",
                    "Poor workstation setup (desk, chair, monitor height)", "Repetitive movements without microbreaks",
                    "Heavy or asymmetric loads"},
                   "Take microbreaks every 30 minutes and review workstation ergonomics."});
    }

    evaluateClinicalTests(summary, tally);
}

void SessionAnalysisEngine::evaluateClinicalTests(const SessionSummary &summary, Tally &tally)
{
    if (summary.tug)
    {
        const double tug = summary.tug->timeSec;
        Severity severity = Severity::Severe;
        if (tug <= 10.0)
            severity = Severity::Normal;
        else if (tug <= GaitThresholds::TUG_FALL_RISK)
            severity = Severity::Mild;

        tally.Add(severity, {"Timed Up & Go",
                             StringUtil::Fixed(tug, 1) + " sec",
                             "< 10 sec",
                             Severity::Normal,
                             {"Reduced lower extremity strength", "Balance impairment during transitions",
                              "Decreased gait speed", "Cognitive or dual-task interference"},
                             "Practice sit-to-stand transitions and turning drills."});
    }

    // a robust screening is not counted as an evaluated metric
    if (summary.frailty && summary.frailty->friedScore > 0)
    {
        const int fried = summary.frailty->friedScore;
        const bool preFrail = fried <= 2;
        tally.Add(preFrail ? Severity::Mild : Severity::Severe,
                  {"Frailty (Fried)",
                   std::to_string(fried) + "/5 (" + (preFrail ? "Pre-frail" : "Frail") + ")",
                   "0 (Robust)",
                   Severity::Normal,
                   {"Unintentional weight loss or sarcopenia", "Reduced physical activity and endurance",
                    "Slow walking speed and weak grip strength", "Chronic fatigue or exhaustion"},
                   "Multi-component exercise program (strength + balance + endurance) and nutritional assessment "
                   "recommended."});
    }
}

std::string SessionAnalysisEngine::overallAssessment(const std::vector<AbnormalFinding> &findings,
                                                     const int totalEvaluated)
{
    if (findings.empty())
    {
        return "All " + std::to_string(totalEvaluated) +
               " evaluated metrics are within normal clinical ranges. Your posture and gait parameters look "
               "healthy, keep up the good work!";
    }

    int severeCount = 0;
    int moderateCount = 0;
    int mildCount = 0;
    for (const AbnormalFinding &finding : findings)
    {
        if (finding.severity == Severity::Severe)
            severeCount++;
        else if (finding.severity == Severity::Moderate)
            moderateCount++;
        else if (finding.severity == Severity::Mild)
            mildCount++;
    }

    std::string text = "Out of " + std::to_string(totalEvaluated) + " metrics evaluated, " +
                       std::to_string(findings.size()) + " fall outside normal ranges";
    if (severeCount > 0) text += "; " + std::to_string(severeCount) + " require attention";
    if (moderateCount > 0) text += "; " + std::to_string(moderateCount) + " are moderately abnormal";
    if (mildCount > 0 && severeCount == 0 && moderateCount == 0)
    {
        text += "; " + std::to_string(mildCount) + " show mild deviation";
    }
    text += ".";

    if (severeCount > 0)
    {
        text += " We recommend discussing these findings with your healthcare provider and following the "
                "corrective exercises below.";
    }
    else if (moderateCount > 0)
    {
        text += " The recommended exercises below can help address these areas. Monitor your progress over the "
                "coming weeks.";
    }
    else
    {
        text += " These are minor deviations that may improve with consistent exercise and body awareness.";
    }
    return text;
}

SessionAnalysis SessionAnalysisEngine::Analyze(const SessionSummary &summary) const
{
    Tally tally;
    evaluatePosture(summary, tally);
    evaluateGait(summary, tally);
    evaluateBalance(summary, tally);
    evaluateRisk(summary, tally);

    std::sort(tally.findings.begin(), tally.findings.end(), [](const AbnormalFinding &a, const AbnormalFinding &b) {
        if (a.severity != b.severity) return SeverityUtil::Ordinal(a.severity) > SeverityUtil::Ordinal(b.severity);
        return a.metric < b.metric;
    });

    SessionAnalysis analysis;
    analysis.findings = tally.findings;
    analysis.normalCount = tally.normal;
    analysis.totalEvaluated = tally.total;
    analysis.overallSeverity = analysis.findings.empty() ? Severity::Normal : analysis.findings.front().severity;
    analysis.overallAssessment = overallAssessment(analysis.findings, analysis.totalEvaluated);
    return analysis;
}
