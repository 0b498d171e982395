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
#include "TreeEnsemble.hpp"

#include <cmath>
#include <string>
#include <utility>

#include "../Utils/Logger.hpp"

namespace PhishGuard {
namespace Model {

TreeEnsembleModel::TreeEnsembleModel(std::vector<Tree> trees, double baseScore, size_t numFeatures)
    : m_trees(std::move(trees))
    , m_baseScore(baseScore)
    , m_numFeatures(numFeatures) {
}

std::optional<double> TreeEnsembleModel::PredictRaw(const std::vector<double>& features,
                                                    Core::Error* err) const {
    if (features.size() != m_numFeatures) {
        Core::SetError(err, Core::ErrorKind::InvalidInput,
            "Expected " + std::to_string(m_numFeatures) + " features, got " + std::to_string(features.size()));
        return std::nullopt;
    }

    double score = m_baseScore;
    for (size_t i = 0; i < m_trees.size(); ++i) {
        score += EvaluateTree(i, features);
    }
    return score;
}

std::optional<double> TreeEnsembleModel::Predict(const std::vector<double>& features,
                                                 Core::Error* err) const {
    const auto raw = PredictRaw(features, err);
    if (!raw) {
        return std::nullopt;
    }
    return Sigmoid(*raw);
}

double TreeEnsembleModel::Sigmoid(double score) noexcept {
    return 1.0 / (1.0 + std::exp(-score));
}

double TreeEnsembleModel::EvaluateTree(size_t treeIndex, const std::vector<double>& features) const {
    const auto& nodes = m_trees[treeIndex].nodes;
    size_t index = 0;

    // A valid walk visits each node at most once
    for (size_t steps = 0; steps <= nodes.size(); ++steps) {
        if (index >= nodes.size()) {
            break;
        }

        const TreeNode& node = nodes[index];
        if (const auto* leaf = std::get_if<LeafNode>(&node)) {
            return leaf->weight;
        }

        const auto& split = std::get<SplitNode>(node);
        if (split.featureIndex >= features.size()) {
            break;
        }

        // NaN compares false and therefore goes right
        index = (features[split.featureIndex] < split.threshold) ? split.left : split.right;
    }

    m_anomalyCount.fetch_add(1, std::memory_order_relaxed);
    PG_LOG_ERROR("Model", "Tree %zu walk aborted at node %zu, contributing 0", treeIndex, index);
    return 0.0;
}

nlohmann::json TreeEnsembleModel::ToJson() const {
    return nlohmann::json{
        { "numTrees", m_trees.size() },
        { "numFeatures", m_numFeatures },
        { "baseScore", m_baseScore },
        { "anomalies", GetAnomalyCount() }
    };
}

}  // namespace Model
}  // namespace PhishGuard
