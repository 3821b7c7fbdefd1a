/// @brief This file defines the domain objects shared by the whole project.
/*
 * (c) 2021 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */
#pragma once

#include <opencv2/core.hpp>

#include <array>
#include <map>
#include <optional>
#include <string>
#include <vector>

/// @brief Skeleton joints delivered by the body tracker
enum class JointName
{
    Root,
    Hips,
    Spine1,
    Spine2,
    Spine3,
    Spine4,
    Spine5,
    Spine6,
    Spine7,
    Neck1,
    Neck2,
    Neck3,
    Neck4,
    Head,
    LeftShoulder,
    LeftArm,
    LeftForearm,
    LeftHand,
    RightShoulder,
    RightArm,
    RightForearm,
    RightHand,
    LeftUpLeg,
    LeftLeg,
    LeftFoot,
    LeftToeEnd,
    RightUpLeg,
    RightLeg,
    RightFoot,
    RightToeEnd,
};

const size_t NUM_JOINTS = 30;

/// @brief Joint positions in metres. y is up, z is anterior, x is the subject's right.
using JointMap = std::map<JointName, cv::Point3d>;

namespace JointNameUtil
{
    const std::array<JointName, NUM_JOINTS> &AllJoints();

    /// @brief Serialization key of the joint (e.g. "left_upLeg_joint")
    std::string ToString(const JointName joint);

    /// @retval false when the key is unknown
    bool FromString(const std::string &key, JointName &joint);

    /// @brief Bone segments drawn between joints
    const std::vector<std::pair<JointName, JointName>> &SkeletonSegments();
}

/// @brief One body tracker sample
struct JointFrame
{
    double timestamp;
    JointMap joints;

    JointFrame() : timestamp(0.0){};
    JointFrame(const double timestamp, const JointMap &joints) : timestamp(timestamp), joints(joints){};

    bool Has(const JointName joint) const { return joints.find(joint) != joints.end(); }

    /// @retval nullptr when the joint is occluded
    const cv::Point3d *Find(const JointName joint) const
    {
        const auto it = joints.find(joint);
        return it == joints.end() ? nullptr : &it->second;
    }
};

/// @brief One inertial sample. Accelerations are in g with gravity removed.
struct MotionSample
{
    double timestamp{0.0};
    double roll{0.0};
    double pitch{0.0};
    double yaw{0.0};
    cv::Vec3d userAcceleration{0.0, 0.0, 0.0};
    cv::Vec3d gravity{0.0, 0.0, 0.0};
    cv::Vec3d rotationRate{0.0, 0.0, 0.0};
};

enum class Foot
{
    Left,
    Right,
};

/// @brief Foot strike detected by the gait analyzer
struct StepEvent
{
    double timestamp{0.0};
    Foot foot{Foot::Left};
    double positionX{0.0};
    double positionZ{0.0};
    std::optional<double> strideLengthM;
    std::optional<double> stepLengthM;
    std::optional<double> stepWidthCm;
    std::optional<double> stanceTimeSec;
    std::optional<double> swingTimeSec;
    std::optional<double> impactVelocity;
    std::optional<double> footClearanceM;
    std::optional<double> imuConfidence; // 0-1, only when motion samples were available
    bool lowConfidence{false};
};

/// @brief Cumulative snapshot of the pedometer-like service
struct PedometerSnapshot
{
    double timestamp{0.0};
    double distanceM{0.0};
    int stepCount{0};
    std::optional<double> cadenceSPM;
    int floorsAscended{0};
    int floorsDescended{0};
};

enum class PosturalType
{
    Ideal,
    KyphosisLordosis,
    FlatBack,
    SwayBack,
};

/// @brief One recorded instant. Throttled values are copied from the last run of their analyzer,
/// a value whose joints are occluded keeps its last measurement. Values never measured in the session are absent.
struct BodyFrame
{
    double timestamp{0.0};
    JointMap joints;

    // posture
    double trunkLeanDeg{0.0};
    double lateralLeanDeg{0.0};
    double craniovertebralAngleDeg{52.0};
    double sagittalVerticalAxisCm{0.0};
    std::optional<double> shoulderAsymmetryCm;
    std::optional<double> shoulderTiltDeg;
    std::optional<double> shoulderProtractionCm;
    std::optional<double> pelvicObliquityDeg;
    std::optional<double> thoracicKyphosisDeg;
    std::optional<double> lumbarLordosisDeg;
    std::optional<double> cervicalLordosisDeg;
    std::optional<double> coronalSpineDeviationCm;
    std::optional<PosturalType> posturalType;
    std::optional<int> nyprScore;
    double postureScore{0.0};

    // gait
    double cadenceSPM{0.0};
    double avgStrideLengthM{0.0};
    double walkingSpeedMPS{0.0};
    std::optional<double> stepWidthCm;

    // range of motion
    std::optional<double> hipFlexionLeftDeg;
    std::optional<double> hipFlexionRightDeg;
    std::optional<double> kneeFlexionLeftDeg;
    std::optional<double> kneeFlexionRightDeg;
    std::optional<double> pelvicTiltDeg;
    std::optional<double> trunkRotationDeg;
    std::optional<double> armSwingLeftDeg;
    std::optional<double> armSwingRightDeg;

    // balance, ergonomics and inertial cadence
    std::optional<double> swayVelocityMMS;
    std::optional<int> rebaScore;
    std::optional<double> imuCadenceSPM;
};
