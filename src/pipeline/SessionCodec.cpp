/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "SessionCodec.hpp"

#include <iostream>
#include <string>

#include "clinical/ClinicalTypes.hpp"

using json = nlohmann::json;

namespace
{
    // absent values are written as null
    template <class T> void put(json &j, const std::string &key, const std::optional<T> &value)
    {
        j[key] = value ? json(*value) : json(nullptr);
    }

    template <class T> std::optional<T> get(const json &j, const std::string &key)
    {
        if (!j.contains(key) || j[key].is_null()) return std::nullopt;
        return j[key].get<T>();
    }

    json vec3(const cv::Vec3d &v) { return json::array({v[0], v[1], v[2]}); }

    cv::Vec3d vec3(const json &j) { return cv::Vec3d(j.at(0).get<double>(), j.at(1).get<double>(), j.at(2).get<double>()); }

    json frameToJson(const BodyFrame &frame)
    {
        json j;
        j["timestamp"] = frame.timestamp;
        j["joints"] = SessionCodec::JointsToJson(frame.joints);
        j["trunkLeanDeg"] = frame.trunkLeanDeg;
        j["lateralLeanDeg"] = frame.lateralLeanDeg;
        j["craniovertebralAngleDeg"] = frame.craniovertebralAngleDeg;
        j["sagittalVerticalAxisCm"] = frame.sagittalVerticalAxisCm;
        put(j, "shoulderAsymmetryCm", frame.shoulderAsymmetryCm);
        put(j, "shoulderTiltDeg", frame.shoulderTiltDeg);
        put(j, "shoulderProtractionCm", frame.shoulderProtractionCm);
        put(j, "pelvicObliquityDeg", frame.pelvicObliquityDeg);
        put(j, "thoracicKyphosisDeg", frame.thoracicKyphosisDeg);
        put(j, "lumbarLordosisDeg", frame.lumbarLordosisDeg);
        put(j, "cervicalLordosisDeg", frame.cervicalLordosisDeg);
        put(j, "coronalSpineDeviationCm", frame.coronalSpineDeviationCm);
        j["posturalType"] = frame.posturalType ? json(ClinicalTypeUtil::ToString(*frame.posturalType)) : json(nullptr);
        put(j, "nyprScore", frame.nyprScore);
        j["postureScore"] = frame.postureScore;
        j["cadenceSPM"] = frame.cadenceSPM;
        j["avgStrideLengthM"] = frame.avgStrideLengthM;
        j["walkingSpeedMPS"] = frame.walkingSpeedMPS;
        put(j, "stepWidthCm", frame.stepWidthCm);
        put(j, "hipFlexionLeftDeg", frame.hipFlexionLeftDeg);
        put(j, "hipFlexionRightDeg", frame.hipFlexionRightDeg);
        put(j, "kneeFlexionLeftDeg", frame.kneeFlexionLeftDeg);
        put(j, "kneeFlexionRightDeg", frame.kneeFlexionRightDeg);
        put(j, "pelvicTiltDeg", frame.pelvicTiltDeg);
        put(j, "trunkRotationDeg", frame.trunkRotationDeg);
        put(j, "armSwingLeftDeg", frame.armSwingLeftDeg);
        put(j, "armSwingRightDeg", frame.armSwingRightDeg);
        put(j, "swayVelocityMMS", frame.swayVelocityMMS);
        put(j, "rebaScore", frame.rebaScore);
        put(j, "imuCadenceSPM", frame.imuCadenceSPM);
        return j;
    }

    BodyFrame frameFromJson(const json &j)
    {
        BodyFrame frame;
        frame.timestamp = j.at("timestamp").get<double>();
        frame.joints = SessionCodec::JointsFromJson(j.at("joints"));
        frame.trunkLeanDeg = j.value("trunkLeanDeg", 0.0);
        frame.lateralLeanDeg = j.value("lateralLeanDeg", 0.0);
        frame.craniovertebralAngleDeg = j.value("craniovertebralAngleDeg", 52.0);
        frame.sagittalVerticalAxisCm = j.value("sagittalVerticalAxisCm", 0.0);
        frame.shoulderAsymmetryCm = get<double>(j, "shoulderAsymmetryCm");
        frame.shoulderTiltDeg = get<double>(j, "shoulderTiltDeg");
        frame.shoulderProtractionCm = get<double>(j, "shoulderProtractionCm");
        frame.pelvicObliquityDeg = get<double>(j, "pelvicObliquityDeg");
        frame.thoracicKyphosisDeg = get<double>(j, "thoracicKyphosisDeg");
        frame.lumbarLordosisDeg = get<double>(j, "lumbarLordosisDeg");
        frame.cervicalLordosisDeg = get<double>(j, "cervicalLordosisDeg");
        frame.coronalSpineDeviationCm = get<double>(j, "coronalSpineDeviationCm");
        PosturalType type;
        if (j.contains("posturalType") && j["posturalType"].is_string() &&
            ClinicalTypeUtil::FromString(j["posturalType"].get<std::string>(), type))
        {
            frame.posturalType = type;
        }
        frame.nyprScore = get<int>(j, "nyprScore");
        frame.postureScore = j.value("postureScore", 0.0);
        frame.cadenceSPM = j.value("cadenceSPM", 0.0);
        frame.avgStrideLengthM = j.value("avgStrideLengthM", 0.0);
        frame.walkingSpeedMPS = j.value("walkingSpeedMPS", 0.0);
        frame.stepWidthCm = get<double>(j, "stepWidthCm");
        frame.hipFlexionLeftDeg = get<double>(j, "hipFlexionLeftDeg");
        frame.hipFlexionRightDeg = get<double>(j, "hipFlexionRightDeg");
        frame.kneeFlexionLeftDeg = get<double>(j, "kneeFlexionLeftDeg");
        frame.kneeFlexionRightDeg = get<double>(j, "kneeFlexionRightDeg");
        frame.pelvicTiltDeg = get<double>(j, "pelvicTiltDeg");
        frame.trunkRotationDeg = get<double>(j, "trunkRotationDeg");
        frame.armSwingLeftDeg = get<double>(j, "armSwingLeftDeg");
        frame.armSwingRightDeg = get<double>(j, "armSwingRightDeg");
        frame.swayVelocityMMS = get<double>(j, "swayVelocityMMS");
        frame.rebaScore = get<int>(j, "rebaScore");
        frame.imuCadenceSPM = get<double>(j, "imuCadenceSPM");
        return frame;
    }

    json stepToJson(const StepEvent &step)
    {
        json j;
        j["timestamp"] = step.timestamp;
        j["foot"] = step.foot == Foot::Left ? "left" : "right";
        j["positionX"] = step.positionX;
        j["positionZ"] = step.positionZ;
        put(j, "strideLengthM", step.strideLengthM);
        put(j, "stepLengthM", step.stepLengthM);
        put(j, "stepWidthCm", step.stepWidthCm);
        put(j, "stanceTimeSec", step.stanceTimeSec);
        put(j, "swingTimeSec", step.swingTimeSec);
        put(j, "impactVelocity", step.impactVelocity);
        put(j, "footClearanceM", step.footClearanceM);
        put(j, "imuConfidence", step.imuConfidence);
        j["lowConfidence"] = step.lowConfidence;
        return j;
    }

    StepEvent stepFromJson(const json &j)
    {
        StepEvent step;
        step.timestamp = j.at("timestamp").get<double>();
        step.foot = j.value("foot", std::string("left")) == "right" ? Foot::Right : Foot::Left;
        step.positionX = j.value("positionX", 0.0);
        step.positionZ = j.value("positionZ", 0.0);
        step.strideLengthM = get<double>(j, "strideLengthM");
        step.stepLengthM = get<double>(j, "stepLengthM");
        step.stepWidthCm = get<double>(j, "stepWidthCm");
        step.stanceTimeSec = get<double>(j, "stanceTimeSec");
        step.swingTimeSec = get<double>(j, "swingTimeSec");
        step.impactVelocity = get<double>(j, "impactVelocity");
        step.footClearanceM = get<double>(j, "footClearanceM");
        step.imuConfidence = get<double>(j, "imuConfidence");
        step.lowConfidence = j.value("lowConfidence", false);
        return step;
    }

    json motionToJson(const MotionSample &sample)
    {
        json j;
        j["timestamp"] = sample.timestamp;
        j["attitude"] = json::array({sample.roll, sample.pitch, sample.yaw});
        j["userAcceleration"] = vec3(sample.userAcceleration);
        j["gravity"] = vec3(sample.gravity);
        j["rotationRate"] = vec3(sample.rotationRate);
        return j;
    }

    MotionSample motionFromJson(const json &j)
    {
        MotionSample sample;
        sample.timestamp = j.at("timestamp").get<double>();
        const json &attitude = j.at("attitude");
        sample.roll = attitude.at(0).get<double>();
        sample.pitch = attitude.at(1).get<double>();
        sample.yaw = attitude.at(2).get<double>();
        sample.userAcceleration = vec3(j.at("userAcceleration"));
        sample.gravity = vec3(j.at("gravity"));
        sample.rotationRate = vec3(j.at("rotationRate"));
        return sample;
    }

    template <class T> std::vector<uint8_t> encode(const std::vector<T> &items, json (*toJson)(const T &))
    {
        json array = json::array();
        for (const T &item : items) array.push_back(toJson(item));
        return json::to_cbor(array);
    }

    template <class T> bool decode(const std::vector<uint8_t> &blob, std::vector<T> &items, T (*fromJson)(const json &))
    {
        items.clear();
        try
        {
            const json array = json::from_cbor(blob);
            if (!array.is_array()) return false;
            for (const json &item : array) items.push_back(fromJson(item));
        }
        catch (const json::exception &e)
        {
            std::cerr << "Failed to decode session blob: " << e.what() << std::endl;
            items.clear();
            return false;
        }
        return true;
    }

    json fallRiskToJson(const FallRiskAssessment &assessment)
    {
        json factors = json::array();
        for (const FallRiskFactor &factor : assessment.factors)
        {
            factors.push_back({{"name", factor.name},
                               {"value", factor.value},
                               {"threshold", factor.threshold},
                               {"isElevated", factor.isElevated},
                               {"weight", factor.weight},
                               {"subScore", factor.subScore}});
        }
        return {{"score", assessment.compositeScore},
                {"level", ClinicalTypeUtil::ToString(assessment.riskLevel)},
                {"riskFactorCount", assessment.riskFactorCount},
                {"factors", factors}};
    }

    json gaitPatternToJson(const GaitPatternResult &result)
    {
        json scores;
        for (const auto &score : result.patternScores) scores[ClinicalTypeUtil::ToString(score.first)] = score.second;
        return {{"pattern", ClinicalTypeUtil::ToString(result.primaryPattern)},
                {"confidence", result.confidence},
                {"scores", scores},
                {"flags", result.flags}};
    }

    json crossedToJson(const CrossedSyndromeResult &result)
    {
        json detected = json::array();
        for (const CrossedSyndromeType type : result.detectedSyndromes) detected.push_back(ClinicalTypeUtil::ToString(type));
        return {{"upperCrossedScore", result.upperCrossedScore},
                {"lowerCrossedScore", result.lowerCrossedScore},
                {"detected", detected},
                {"upperFactors", result.upperFactors},
                {"lowerFactors", result.lowerFactors}};
    }

    json painRiskToJson(const PainRiskAssessment &assessment)
    {
        json regions = json::array();
        for (const PainRiskAlert &alert : assessment.alerts)
        {
            regions.push_back({{"region", ClinicalTypeUtil::ToString(alert.region)},
                               {"riskScore", alert.riskScore},
                               {"severity", SeverityUtil::ToString(alert.severity)},
                               {"factors", alert.factors},
                               {"recommendation", alert.recommendation}});
        }
        return {{"overallRiskScore", assessment.overallRiskScore}, {"regions", regions}};
    }

    json frailtyToJson(const FrailtyResult &result)
    {
        json criteria = json::array();
        for (const FrailtyCriterion &criterion : result.criteria)
        {
            json item = {{"name", criterion.name}, {"isMet", criterion.isMet}};
            put(item, "value", criterion.value);
            put(item, "threshold", criterion.threshold);
            criteria.push_back(item);
        }
        return {{"friedScore", result.friedScore},
                {"classification", ClinicalTypeUtil::ToString(result.classification)},
                {"criteria", criteria},
                {"interpretation", result.interpretation}};
    }

    json gaitSummaryToJson(const GaitSessionSummary &gait)
    {
        json j;
        j["stepCount"] = gait.stepCount;
        put(j, "stanceLeftPercent", gait.stanceLeftPercent);
        put(j, "stanceRightPercent", gait.stanceRightPercent);
        put(j, "doubleSupportPercent", gait.doubleSupportPercent);
        put(j, "strideTimeCVPercent", gait.strideTimeCVPercent);
        put(j, "stepWidthMeanCm", gait.stepWidthMeanCm);
        put(j, "stepWidthSDCm", gait.stepWidthSDCm);
        put(j, "stepLengthLeftM", gait.stepLengthLeftM);
        put(j, "stepLengthRightM", gait.stepLengthRightM);
        put(j, "stepAsymmetryPercent", gait.stepAsymmetryPercent);
        put(j, "footClearanceM", gait.footClearanceM);
        put(j, "strideLengthM", gait.strideLengthM);
        return j;
    }
}

json SessionCodec::JointsToJson(const JointMap &joints)
{
    json j = json::object();
    for (const auto &joint : joints)
    {
        j[JointNameUtil::ToString(joint.first)] = json::array({joint.second.x, joint.second.y, joint.second.z});
    }
    return j;
}

JointMap SessionCodec::JointsFromJson(const json &j)
{
    JointMap joints;
    if (!j.is_object()) return joints;

    for (auto it = j.begin(); it != j.end(); ++it)
    {
        JointName name;
        if (!JointNameUtil::FromString(it.key(), name)) continue;
        const json &position = it.value();
        if (!position.is_array() || position.size() != 3) continue;
        joints[name] = cv::Point3d(position[0].get<double>(), position[1].get<double>(), position[2].get<double>());
    }
    return joints;
}

MotionSample SessionCodec::MotionFromJson(const json &j)
{
    return motionFromJson(j);
}

json SessionCodec::SummaryToJson(const SessionSummary &summary)
{
    json j;
    j["date"] = summary.date;
    j["startTimestamp"] = summary.startTimestamp;
    j["durationSec"] = summary.durationSec;
    j["frameCount"] = summary.frameCount;

    json posture;
    put(posture, "averageTrunkLeanDeg", summary.averageTrunkLeanDeg);
    put(posture, "averageLateralLeanDeg", summary.averageLateralLeanDeg);
    put(posture, "averageCvaDeg", summary.averageCvaDeg);
    put(posture, "averageSvaCm", summary.averageSvaCm);
    put(posture, "averageShoulderAsymmetryCm", summary.averageShoulderAsymmetryCm);
    put(posture, "averagePelvicObliquityDeg", summary.averagePelvicObliquityDeg);
    put(posture, "averageKyphosisDeg", summary.averageKyphosisDeg);
    put(posture, "averageLordosisDeg", summary.averageLordosisDeg);
    put(posture, "averageCoronalDeviationCm", summary.averageCoronalDeviationCm);
    posture["peakTrunkLeanDeg"] = summary.peakTrunkLeanDeg;
    posture["peakLateralLeanDeg"] = summary.peakLateralLeanDeg;
    put(posture, "postureScore", summary.postureScore);
    put(posture, "nyprScore", summary.nyprScore);
    posture["kendallType"] = summary.kendallType ? json(ClinicalTypeUtil::ToString(*summary.kendallType)) : json(nullptr);
    j["posture"] = posture;

    json gait = gaitSummaryToJson(summary.gait);
    put(gait, "averageCadenceSPM", summary.averageCadenceSPM);
    put(gait, "averageStrideLengthM", summary.averageStrideLengthM);
    put(gait, "averageWalkingSpeedMPS", summary.averageWalkingSpeedMPS);
    j["gait"] = gait;

    j["fallRisk"] = summary.fallRisk ? fallRiskToJson(*summary.fallRisk) : json(nullptr);
    if (summary.fatigue)
    {
        j["fatigue"] = {{"fatigueIndex", summary.fatigue->fatigueIndex},
                        {"isFatigued", summary.fatigue->isFatigued},
                        {"postureVariabilitySD", summary.fatigue->postureVariabilitySD},
                        {"postureTrendSlope", summary.fatigue->postureTrendSlope},
                        {"postureTrendR2", summary.fatigue->postureTrendR2}};
    }
    else
    {
        j["fatigue"] = nullptr;
    }

    json reba;
    put(reba, "average", summary.averageRebaScore);
    put(reba, "peak", summary.peakRebaScore);
    j["reba"] = reba;

    j["gaitPattern"] = summary.gaitPattern ? gaitPatternToJson(*summary.gaitPattern) : json(nullptr);
    j["crossedSyndrome"] = summary.crossedSyndrome ? crossedToJson(*summary.crossedSyndrome) : json(nullptr);
    j["painRisk"] = summary.painRisk ? painRiskToJson(*summary.painRisk) : json(nullptr);

    if (summary.smoothness)
    {
        j["smoothness"] = {{"sparc", summary.smoothness->sparcScore},
                           {"harmonicRatioAP", summary.smoothness->harmonicRatioAP},
                           {"harmonicRatioML", summary.smoothness->harmonicRatioML},
                           {"normalizedJerk", summary.smoothness->normalizedJerk}};
    }
    else
    {
        j["smoothness"] = nullptr;
    }

    j["frailty"] = summary.frailty ? frailtyToJson(*summary.frailty) : json(nullptr);

    if (summary.cardio)
    {
        j["cardio"] = {{"estimatedMET", summary.cardio->estimatedMET},
                       {"intensity", ClinicalTypeUtil::ToString(summary.cardio->intensity)},
                       {"walkRatio", summary.cardio->walkRatio},
                       {"costOfTransport", summary.cardio->costOfTransportProxy}};
        put(j["cardio"], "predictedSixMinuteWalkM", summary.predictedSixMinuteWalkM);
    }
    else
    {
        j["cardio"] = nullptr;
    }

    if (summary.tug)
    {
        j["tug"] = {{"timeSec", summary.tug->timeSec},
                    {"fallRisk", ClinicalTypeUtil::ToString(summary.tug->fallRisk)},
                    {"mobilityLevel", summary.tug->mobilityLevel}};
    }
    else
    {
        j["tug"] = nullptr;
    }

    json distance;
    put(distance, "distanceM", summary.distanceM);
    distance["source"] = DistanceSourceUtil::ToString(summary.distanceSource);
    distance["skeletonStepCount"] = summary.skeletonStepCount;
    distance["imuStepCount"] = summary.imuStepCount;
    put(distance, "pedometerStepCount", summary.pedometerStepCount);
    distance["lowConfidenceStepCount"] = summary.lowConfidenceStepCount;
    j["distance"] = distance;

    json balance;
    put(balance, "averageSwayVelocityMMS", summary.averageSwayVelocityMMS);
    if (summary.romberg)
    {
        balance["romberg"] = {{"eyesOpenSwayVelocity", summary.romberg->eyesOpenSwayVelocity},
                              {"eyesClosedSwayVelocity", summary.romberg->eyesClosedSwayVelocity},
                              {"velocityRatio", summary.romberg->velocityRatio},
                              {"areaRatio", summary.romberg->areaRatio}};
    }
    j["balance"] = balance;

    if (summary.rom)
    {
        j["rom"] = {{"hipRomLeftDeg", summary.rom->hipRomLeftDeg},
                    {"hipRomRightDeg", summary.rom->hipRomRightDeg},
                    {"kneeRomLeftDeg", summary.rom->kneeRomLeftDeg},
                    {"kneeRomRightDeg", summary.rom->kneeRomRightDeg},
                    {"trunkRotationRangeDeg", summary.rom->trunkRotationRangeDeg},
                    {"pelvicTiltRangeDeg", summary.rom->pelvicTiltRangeDeg},
                    {"armSwingAsymmetryPercent", summary.rom->armSwingAsymmetryPercent}};
    }
    else
    {
        j["rom"] = nullptr;
    }
    return j;
}

json SessionCodec::AnalysisToJson(const SessionAnalysis &analysis)
{
    json findings = json::array();
    for (const AbnormalFinding &finding : analysis.findings)
    {
        findings.push_back({{"metric", finding.metric},
                            {"value", finding.value},
                            {"normalRange", finding.normalRange},
                            {"severity", SeverityUtil::ToString(finding.severity)},
                            {"likelyCauses", finding.likelyCauses},
                            {"recommendation", finding.recommendation}});
    }
    return {{"overallAssessment", analysis.overallAssessment},
            {"overallSeverity", SeverityUtil::ToString(analysis.overallSeverity)},
            {"normalCount", analysis.normalCount},
            {"totalEvaluated", analysis.totalEvaluated},
            {"findings", findings}};
}

std::vector<uint8_t> SessionCodec::EncodeFrames(const std::vector<BodyFrame> &frames)
{
    return encode<BodyFrame>(frames, frameToJson);
}

std::vector<uint8_t> SessionCodec::EncodeSteps(const std::vector<StepEvent> &steps)
{
    return encode<StepEvent>(steps, stepToJson);
}

std::vector<uint8_t> SessionCodec::EncodeMotion(const std::vector<MotionSample> &samples)
{
    return encode<MotionSample>(samples, motionToJson);
}

bool SessionCodec::DecodeFrames(const std::vector<uint8_t> &blob, std::vector<BodyFrame> &frames)
{
    return decode<BodyFrame>(blob, frames, frameFromJson);
}

bool SessionCodec::DecodeSteps(const std::vector<uint8_t> &blob, std::vector<StepEvent> &steps)
{
    return decode<StepEvent>(blob, steps, stepFromJson);
}

bool SessionCodec::DecodeMotion(const std::vector<uint8_t> &blob, std::vector<MotionSample> &samples)
{
    return decode<MotionSample>(blob, samples, motionFromJson);
}
