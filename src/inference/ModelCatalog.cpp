/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "ModelCatalog.hpp"

std::string ModelCatalog::Name(const ModelId id)
{
    switch (id)
    {
    case ModelId::GaitPatternClassifier:
        return "GaitPatternClassifier";
    case ModelId::PostureScorer:
        return "PostureScorer";
    case ModelId::FallRiskPredictor:
    default:
        return "FallRiskPredictor";
    }
}

size_t ModelCatalog::FeatureCount(const ModelId id)
{
    switch (id)
    {
    case ModelId::GaitPatternClassifier:
        return 14;
    case ModelId::PostureScorer:
        return 9;
    case ModelId::FallRiskPredictor:
    default:
        return 8;
    }
}

std::string ModelCatalog::OutputName(const ModelId id)
{
    switch (id)
    {
    case ModelId::GaitPatternClassifier:
        return "classProbability";
    case ModelId::PostureScorer:
        return "compositeScore";
    case ModelId::FallRiskPredictor:
    default:
        return "riskScore";
    }
}
