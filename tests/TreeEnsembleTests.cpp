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

#include <cmath>
#include <limits>
#include <random>

#include "TestHelpers.hpp"
#include "Model/ModelLoader.hpp"
#include "Model/TreeEnsemble.hpp"

using namespace PhishGuard;
using namespace PhishGuard::Model;

namespace {

// Root splits on feature 0 < 5.0; left leaf -1.0, right leaf +1.0
Tree StumpOnFeatureZero() {
    Tree t;
    t.nodes.emplace_back(SplitNode{ 0, 5.0, 1, 2 });
    t.nodes.emplace_back(LeafNode{ -1.0 });
    t.nodes.emplace_back(LeafNode{ 1.0 });
    return t;
}

std::vector<double> MakeVector(double first) {
    std::vector<double> v(Features::FEATURE_COUNT, 0.0);
    v[0] = first;
    return v;
}

}  // namespace

TEST(TreeEnsembleTest, SigmoidValues) {
    EXPECT_DOUBLE_EQ(TreeEnsembleModel::Sigmoid(0.0), 0.5);
    EXPECT_NEAR(TreeEnsembleModel::Sigmoid(3.0), 0.952574, 1e-6);
    EXPECT_NEAR(TreeEnsembleModel::Sigmoid(-2.0), 0.119203, 1e-6);
    EXPECT_NEAR(TreeEnsembleModel::Sigmoid(-1000.0), 0.0, 1e-12);
    EXPECT_NEAR(TreeEnsembleModel::Sigmoid(1000.0), 1.0, 1e-12);
}

TEST(TreeEnsembleTest, SplitUsesStrictLessThan) {
    std::vector<Tree> trees{ StumpOnFeatureZero() };
    TreeEnsembleModel model(std::move(trees), 0.0, Features::FEATURE_COUNT);

    EXPECT_DOUBLE_EQ(*model.PredictRaw(MakeVector(4.999)), -1.0);
    EXPECT_DOUBLE_EQ(*model.PredictRaw(MakeVector(5.0)), 1.0);
    EXPECT_DOUBLE_EQ(*model.PredictRaw(MakeVector(7.0)), 1.0);
}

TEST(TreeEnsembleTest, NaNGoesRight) {
    std::vector<Tree> trees{ StumpOnFeatureZero() };
    TreeEnsembleModel model(std::move(trees), 0.0, Features::FEATURE_COUNT);

    EXPECT_DOUBLE_EQ(*model.PredictRaw(MakeVector(std::numeric_limits<double>::quiet_NaN())), 1.0);
}

TEST(TreeEnsembleTest, SumsTreesAndBaseScore) {
    std::vector<Tree> trees{ StumpOnFeatureZero(), StumpOnFeatureZero() };
    Tree leaf;
    leaf.nodes.emplace_back(LeafNode{ 0.25 });
    trees.push_back(leaf);

    TreeEnsembleModel model(std::move(trees), 0.5, Features::FEATURE_COUNT);
    EXPECT_EQ(model.GetNumTrees(), 3u);
    EXPECT_DOUBLE_EQ(*model.PredictRaw(MakeVector(10.0)), 0.5 + 1.0 + 1.0 + 0.25);
    EXPECT_DOUBLE_EQ(*model.Predict(MakeVector(0.0)),
                     TreeEnsembleModel::Sigmoid(0.5 - 1.0 - 1.0 + 0.25));
}

TEST(TreeEnsembleTest, WrongFeatureCountIsRejected) {
    auto model = Testing::ConstantModel(1.0);
    Core::Error err;
    EXPECT_FALSE(model->Predict(std::vector<double>(13, 0.0), &err).has_value());
    EXPECT_EQ(err.kind, Core::ErrorKind::InvalidInput);
    EXPECT_FALSE(model->PredictRaw({}).has_value());
}

TEST(TreeEnsembleTest, PredictionIsPure) {
    auto model = Testing::ConstantModel(0.7);
    const std::vector<double> v(Features::FEATURE_COUNT, 1.0);
    const double first = *model->Predict(v);
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(*model->Predict(v), first);
    }
}

TEST(TreeEnsembleTest, CyclicTreeContributesZero) {
    Tree cyclic;
    cyclic.nodes.emplace_back(SplitNode{ 0, 5.0, 1, 1 });
    cyclic.nodes.emplace_back(SplitNode{ 0, 5.0, 0, 0 });

    Tree leaf;
    leaf.nodes.emplace_back(LeafNode{ 2.0 });

    std::vector<Tree> trees{ cyclic, leaf };
    TreeEnsembleModel model(std::move(trees), 0.0, Features::FEATURE_COUNT);

    EXPECT_DOUBLE_EQ(*model.PredictRaw(MakeVector(1.0)), 2.0);
    EXPECT_EQ(model.GetAnomalyCount(), 1u);
}

TEST(TreeEnsembleTest, DanglingChildContributesZero) {
    Tree broken;
    broken.nodes.emplace_back(SplitNode{ 0, 5.0, 1, 9 });
    broken.nodes.emplace_back(LeafNode{ -1.0 });

    std::vector<Tree> trees{ broken };
    TreeEnsembleModel model(std::move(trees), 0.0, Features::FEATURE_COUNT);

    EXPECT_DOUBLE_EQ(*model.PredictRaw(MakeVector(1.0)), -1.0);
    EXPECT_DOUBLE_EQ(*model.PredictRaw(MakeVector(9.0)), 0.0);
    EXPECT_EQ(model.GetAnomalyCount(), 1u);
}

TEST(TreeEnsembleTest, SummaryJson) {
    auto model = Testing::ConstantModel(0.0);
    const auto j = model->ToJson();
    EXPECT_EQ(j["numTrees"], 1);
    EXPECT_EQ(j["numFeatures"], Features::FEATURE_COUNT);
    EXPECT_EQ(j["anomalies"], 0);
}

TEST(TreeEnsembleTest, RandomVectorsStayInUnitInterval) {
    Core::Error err;
    auto model = ModelLoader::LoadModelFromFile(Testing::DataPath("test_model.json"), &err);
    ASSERT_NE(model, nullptr) << err.ToString();

    const double specials[] = {
        std::numeric_limits<double>::quiet_NaN(),
        std::numeric_limits<double>::infinity(),
        -std::numeric_limits<double>::infinity(),
        std::numeric_limits<double>::max(),
        std::numeric_limits<double>::lowest(),
        0.0,
        -0.0
    };

    std::mt19937 rng(20240611u);
    std::uniform_real_distribution<double> wide(-1e6, 1e6);
    std::uniform_int_distribution<int> pick(0, 9);
    std::uniform_int_distribution<size_t> special(0, std::size(specials) - 1);

    for (int round = 0; round < 2000; ++round) {
        std::vector<double> v(Features::FEATURE_COUNT);
        for (auto& x : v) {
            x = pick(rng) < 3 ? specials[special(rng)] : wide(rng);
        }
        const auto p = model->Predict(v);
        ASSERT_TRUE(p.has_value()) << "round " << round;
        ASSERT_TRUE(std::isfinite(*p)) << "round " << round;
        ASSERT_GE(*p, 0.0) << "round " << round;
        ASSERT_LE(*p, 1.0) << "round " << round;
    }
    EXPECT_EQ(model->GetAnomalyCount(), 0u);
}
