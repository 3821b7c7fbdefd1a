/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "LiveMetrics.hpp"

void LiveMetrics::UpdatePosture(const PostureAssessment &assessment)
{
    PostureAssessment merged = assessment;
    if (posture) merged.metrics.FillMissing(posture->metrics);
    posture = merged;
}

void LiveMetrics::UpdateRom(const RomMetrics &metrics)
{
    RomMetrics merged = metrics;
    if (rom) merged.FillMissing(*rom);
    rom = merged;
}

BodyFrame LiveMetrics::ToBodyFrame(const JointFrame &frame) const
{
    BodyFrame body;
    body.timestamp = frame.timestamp;
    body.joints = frame.joints;

    if (posture)
    {
        const PostureMetrics &metrics = posture->metrics;
        body.trunkLeanDeg = metrics.trunkLeanDeg;
        body.lateralLeanDeg = metrics.lateralLeanDeg;
        body.craniovertebralAngleDeg = metrics.craniovertebralAngleDeg;
        body.sagittalVerticalAxisCm = metrics.sagittalVerticalAxisCm;
        body.shoulderAsymmetryCm = metrics.shoulderAsymmetryCm;
        body.shoulderTiltDeg = metrics.shoulderTiltDeg;
        body.shoulderProtractionCm = metrics.shoulderProtractionCm;
        body.pelvicObliquityDeg = metrics.pelvicObliquityDeg;
        body.thoracicKyphosisDeg = metrics.thoracicKyphosisDeg;
        body.lumbarLordosisDeg = metrics.lumbarLordosisDeg;
        body.cervicalLordosisDeg = metrics.cervicalLordosisDeg;
        body.coronalSpineDeviationCm = metrics.coronalSpineDeviationCm;
        body.posturalType = posture->posturalType;
        body.nyprScore = posture->nyprScore;
        body.postureScore = posture->score.compositeScore;
        body.pelvicTiltDeg = metrics.pelvicTiltDeg;
    }

    body.cadenceSPM = gait.cadenceSPM;
    body.avgStrideLengthM = gait.avgStrideLengthM;
    body.walkingSpeedMPS = gait.walkingSpeedMPS;
    if (gait.stepDetected) body.stepWidthCm = gait.stepDetected->stepWidthCm;

    if (rom)
    {
        body.hipFlexionLeftDeg = rom->hipFlexionLeftDeg;
        body.hipFlexionRightDeg = rom->hipFlexionRightDeg;
        body.kneeFlexionLeftDeg = rom->kneeFlexionLeftDeg;
        body.kneeFlexionRightDeg = rom->kneeFlexionRightDeg;
        if (rom->pelvicTiltDeg) body.pelvicTiltDeg = rom->pelvicTiltDeg;
        body.trunkRotationDeg = rom->trunkRotationDeg;
        body.armSwingLeftDeg = rom->armSwingLeftDeg;
        body.armSwingRightDeg = rom->armSwingRightDeg;
    }

    if (balance) body.swayVelocityMMS = balance->swayVelocityMMS;
    if (reba) body.rebaScore = reba->score;
    body.imuCadenceSPM = imuCadenceSPM;
    return body;
}
