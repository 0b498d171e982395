/*
 * PhishGuard - Offline Phishing URL Classification Engine
 * Copyright (C) 2026 PhishGuard Contributors
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#include <gtest/gtest.h>

#include "TestHelpers.hpp"
#include "Model/Predictor.hpp"

using namespace PhishGuard;
using namespace PhishGuard::Model;
using Testing::ConstantModel;
using Testing::StandardMetadata;

namespace {

const std::vector<double> kZeros(Features::FEATURE_COUNT, 0.0);

}  // namespace

TEST(PredictorTest, RiskBands) {
    Predictor predictor(ConstantModel(0.0), StandardMetadata(0.70));

    EXPECT_EQ(predictor.ClassifyProbability(0.95), RiskLevel::Phishing);
    EXPECT_EQ(predictor.ClassifyProbability(0.70), RiskLevel::Phishing);
    EXPECT_EQ(predictor.ClassifyProbability(0.69), RiskLevel::Suspicious);
    EXPECT_EQ(predictor.ClassifyProbability(0.51), RiskLevel::Suspicious);
    EXPECT_EQ(predictor.ClassifyProbability(0.49), RiskLevel::Safe);
    EXPECT_EQ(predictor.ClassifyProbability(0.0), RiskLevel::Safe);
}

TEST(PredictorTest, CustomSuspiciousMargin) {
    Predictor predictor(ConstantModel(0.0), StandardMetadata(0.80), 0.05);
    EXPECT_EQ(predictor.ClassifyProbability(0.76), RiskLevel::Suspicious);
    EXPECT_EQ(predictor.ClassifyProbability(0.74), RiskLevel::Safe);
}

TEST(PredictorTest, ConfidenceForPhishing) {
    Predictor predictor(ConstantModel(3.0), StandardMetadata());
    const auto r = predictor.PredictWithConfidence(kZeros);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->level, RiskLevel::Phishing);
    EXPECT_NEAR(r->probability, 0.952574, 1e-6);
    EXPECT_DOUBLE_EQ(r->confidence, r->probability);
    EXPECT_DOUBLE_EQ(r->threshold, 0.70);
}

TEST(PredictorTest, ConfidenceForSafe) {
    Predictor predictor(ConstantModel(-2.0), StandardMetadata());
    const auto r = predictor.PredictWithConfidence(kZeros);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->level, RiskLevel::Safe);
    EXPECT_NEAR(r->confidence, 1.0 - 0.119203, 1e-6);
}

TEST(PredictorTest, ConfidenceForSuspiciousIsProbability) {
    Predictor predictor(ConstantModel(0.2), StandardMetadata());
    const auto r = predictor.PredictWithConfidence(kZeros);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->level, RiskLevel::Suspicious);
    EXPECT_DOUBLE_EQ(r->confidence, r->probability);
}

TEST(PredictorTest, WrongLengthPropagatesError) {
    Predictor predictor(ConstantModel(0.0), StandardMetadata());
    Core::Error err;
    EXPECT_FALSE(predictor.PredictWithConfidence({ 1.0, 2.0 }, &err).has_value());
    EXPECT_EQ(err.kind, Core::ErrorKind::InvalidInput);
}

TEST(PredictorTest, BatchStopsAtFirstFailure) {
    Predictor predictor(ConstantModel(0.0), StandardMetadata());

    const auto ok = predictor.PredictBatch({ kZeros, kZeros, kZeros });
    ASSERT_TRUE(ok.has_value());
    ASSERT_EQ(ok->size(), 3u);
    EXPECT_DOUBLE_EQ((*ok)[2], 0.5);

    Core::Error err;
    EXPECT_FALSE(predictor.PredictBatch({ kZeros, { 1.0 } }, &err).has_value());
    EXPECT_TRUE(err.hasError());
}

TEST(PredictorTest, NoModelIsNotInitialized) {
    Predictor predictor(nullptr, StandardMetadata());
    Core::Error err;
    EXPECT_FALSE(predictor.Predict(kZeros, &err).has_value());
    EXPECT_EQ(err.kind, Core::ErrorKind::NotInitialized);
    EXPECT_EQ(predictor.GetInfo()["loaded"], false);
}

TEST(PredictorTest, InfoSummary) {
    Predictor predictor(ConstantModel(0.0), StandardMetadata(0.65));
    const auto info = predictor.GetInfo();
    EXPECT_EQ(info["loaded"], true);
    EXPECT_EQ(info["version"], "test");
    EXPECT_EQ(info["numTrees"], 1);
    EXPECT_DOUBLE_EQ(info["threshold"].get<double>(), 0.65);
}

TEST(PredictorTest, RiskLevelNames) {
    EXPECT_EQ(GetRiskLevelName(RiskLevel::Safe), "SAFE");
    EXPECT_EQ(GetRiskLevelName(RiskLevel::Suspicious), "SUSPICIOUS");
    EXPECT_EQ(GetRiskLevelName(RiskLevel::Phishing), "PHISHING");
    EXPECT_EQ(GetRiskLevelName(RiskLevel::Unknown), "UNKNOWN");
}
