/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "Types.hpp"

namespace
{
    const std::array<const char *, NUM_JOINTS> JOINT_KEYS = {
        "root",
        "hips_joint",
        "spine_1_joint",
        "spine_2_joint",
        "spine_3_joint",
        "spine_4_joint",
        "spine_5_joint",
        "spine_6_joint",
        "spine_7_joint",
        "neck_1_joint",
        "neck_2_joint",
        "neck_3_joint",
        "neck_4_joint",
        "head_joint",
        "left_shoulder_1_joint",
        "left_arm_joint",
        "left_forearm_joint",
        "left_hand_joint",
        "right_shoulder_1_joint",
        "right_arm_joint",
        "right_forearm_joint",
        "right_hand_joint",
        "left_upLeg_joint",
        "left_leg_joint",
        "left_foot_joint",
        "left_toeEnd_joint",
        "right_upLeg_joint",
        "right_leg_joint",
        "right_foot_joint",
        "right_toeEnd_joint",
    };
}

const std::array<JointName, NUM_JOINTS> &JointNameUtil::AllJoints()
{
    static const std::array<JointName, NUM_JOINTS> joints = [] {
        std::array<JointName, NUM_JOINTS> ret{};
        for (size_t i = 0; i < NUM_JOINTS; i++)
        {
            ret[i] = static_cast<JointName>(i);
        }
        return ret;
    }();
    return joints;
}

std::string JointNameUtil::ToString(const JointName joint)
{
    const size_t index = static_cast<size_t>(joint);
    if (index >= NUM_JOINTS) return "unknown";
    return JOINT_KEYS[index];
}

bool JointNameUtil::FromString(const std::string &key, JointName &joint)
{
    for (size_t i = 0; i < NUM_JOINTS; i++)
    {
        if (key == JOINT_KEYS[i])
        {
            joint = static_cast<JointName>(i);
            return true;
        }
    }
    return false;
}

const std::vector<std::pair<JointName, JointName>> &JointNameUtil::SkeletonSegments()
{
    using J = JointName;
    static const std::vector<std::pair<J, J>> segments = {
        // spine
        {J::Root, J::Spine1},
        {J::Spine1, J::Spine3},
        {J::Spine3, J::Spine5},
        {J::Spine5, J::Spine7},
        {J::Spine7, J::Neck1},
        {J::Neck1, J::Head},
        // arms
        {J::Spine7, J::LeftShoulder},
        {J::LeftShoulder, J::LeftArm},
        {J::LeftArm, J::LeftForearm},
        {J::LeftForearm, J::LeftHand},
        {J::Spine7, J::RightShoulder},
        {J::RightShoulder, J::RightArm},
        {J::RightArm, J::RightForearm},
        {J::RightForearm, J::RightHand},
        // legs
        {J::Root, J::LeftUpLeg},
        {J::LeftUpLeg, J::LeftLeg},
        {J::LeftLeg, J::LeftFoot},
        {J::LeftFoot, J::LeftToeEnd},
        {J::Root, J::RightUpLeg},
        {J::RightUpLeg, J::RightLeg},
        {J::RightLeg, J::RightFoot},
        {J::RightFoot, J::RightToeEnd},
    };
    return segments;
}
