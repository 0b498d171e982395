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
#pragma once
/**
 * ============================================================================
 * PhishGuard - TREE ENSEMBLE MODEL
 * ============================================================================
 *
 * @file TreeEnsemble.hpp
 * @brief Additive binary-tree ensemble with sigmoid output.
 *
 * Nodes are resolved into a tagged variant once, at load time (see
 * ModelLoader). Evaluation never reinterprets the serialized arrays.
 *
 * Split rule: go left iff features[f] < threshold. Equality and NaN go right.
 *
 * A tree walk that leaves the node array or exceeds the node count
 * contributes 0 and bumps the anomaly counter. Load-time validation makes
 * this unreachable for models produced by ModelLoader.
 * ============================================================================
 */

#include <atomic>
#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "../Core/ErrorCodes.hpp"

namespace PhishGuard {
namespace Model {

// ============================================================================
// NODE TYPES
// ============================================================================

struct LeafNode {
    double weight = 0.0;
};

struct SplitNode {
    uint32_t featureIndex = 0;
    double threshold = 0.0;
    uint32_t left = 0;
    uint32_t right = 0;
};

using TreeNode = std::variant<LeafNode, SplitNode>;

/// @brief One tree; node 0 is the root
struct Tree {
    std::vector<TreeNode> nodes;
};

// ============================================================================
// MODEL
// ============================================================================

class TreeEnsembleModel {
public:
    TreeEnsembleModel(std::vector<Tree> trees, double baseScore, size_t numFeatures);

    TreeEnsembleModel(const TreeEnsembleModel&) = delete;
    TreeEnsembleModel& operator=(const TreeEnsembleModel&) = delete;

    /**
     * @brief Sum of tree outputs plus base score.
     * @return std::nullopt with InvalidInput when the vector length is wrong
     */
    [[nodiscard]] std::optional<double> PredictRaw(const std::vector<double>& features,
                                                   Core::Error* err = nullptr) const;

    /// @brief Sigmoid(PredictRaw)
    [[nodiscard]] std::optional<double> Predict(const std::vector<double>& features,
                                                Core::Error* err = nullptr) const;

    [[nodiscard]] static double Sigmoid(double score) noexcept;

    [[nodiscard]] size_t GetNumTrees() const noexcept { return m_trees.size(); }
    [[nodiscard]] size_t GetNumFeatures() const noexcept { return m_numFeatures; }
    [[nodiscard]] double GetBaseScore() const noexcept { return m_baseScore; }
    [[nodiscard]] const std::vector<Tree>& GetTrees() const noexcept { return m_trees; }

    /// @brief Number of tree walks aborted since construction
    [[nodiscard]] uint64_t GetAnomalyCount() const noexcept {
        return m_anomalyCount.load(std::memory_order_relaxed);
    }

    [[nodiscard]] nlohmann::json ToJson() const;

private:
    [[nodiscard]] double EvaluateTree(size_t treeIndex, const std::vector<double>& features) const;

    std::vector<Tree> m_trees;
    double m_baseScore = 0.5;
    size_t m_numFeatures = 0;
    mutable std::atomic<uint64_t> m_anomalyCount{ 0 };
};

}  // namespace Model
}  // namespace PhishGuard
