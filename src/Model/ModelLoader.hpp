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
 * PhishGuard - MODEL LOADER
 * ============================================================================
 *
 * @file ModelLoader.hpp
 * @brief Loads tree ensemble artifacts and their metadata, and validates the
 *        feature contract between them and the extractor.
 *
 * Accepted model documents:
 * - XGBoost JSON dump:
 *     learner.gradient_booster.model.trees[]
 *     learner.learner_model_param.{base_score, num_feature}
 * - Flat document: { trees[], base_score, num_feature }
 *
 * Each tree carries parallel arrays of equal length:
 *   left_children, right_children, split_indices, split_conditions, base_weights
 * A node is a leaf when both children are -1; its weight is base_weights[i].
 * ============================================================================
 */

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../Core/ErrorCodes.hpp"
#include "TreeEnsemble.hpp"

namespace PhishGuard {
namespace Model {

inline constexpr double DEFAULT_BASE_SCORE = 0.5;
inline constexpr double DEFAULT_RECOMMENDED_THRESHOLD = 0.70;

/**
 * @brief Model metadata document.
 */
struct ModelMetadata {
    std::string version;
    std::vector<std::string> featureNames;
    double recommendedThreshold = DEFAULT_RECOMMENDED_THRESHOLD;
    std::string entropy;    ///< Entropy convention id; empty when absent

    [[nodiscard]] nlohmann::json ToJson() const;
};

class ModelLoader final {
public:
    ModelLoader() = delete;

    /**
     * @brief Build a model from a parsed document.
     * @return nullptr with ModelFormatError on structural problems
     */
    [[nodiscard]] static std::shared_ptr<const TreeEnsembleModel> LoadModelFromJson(
        const nlohmann::json& doc, Core::Error* err = nullptr);

    /// @brief ModelLoadError when unreadable or not JSON, otherwise as LoadModelFromJson
    [[nodiscard]] static std::shared_ptr<const TreeEnsembleModel> LoadModelFromFile(
        const std::filesystem::path& path, Core::Error* err = nullptr);

    /// @brief ModelLoadError when feature_names or recommended_threshold is missing
    [[nodiscard]] static std::optional<ModelMetadata> LoadMetadataFromJson(
        const nlohmann::json& doc, Core::Error* err = nullptr);

    [[nodiscard]] static std::optional<ModelMetadata> LoadMetadataFromFile(
        const std::filesystem::path& path, Core::Error* err = nullptr);

    /**
     * @brief Check model and metadata against Features::FEATURE_NAMES.
     *
     * FeatureCountMismatch when either count differs; FeatureOrderMismatch
     * when the names differ in order or the entropy convention is foreign.
     */
    [[nodiscard]] static bool ValidateFeatureContract(const TreeEnsembleModel& model,
                                                      const ModelMetadata& metadata,
                                                      Core::Error* err = nullptr);

    /**
     * @brief Parse base_score given as a number or as a string like "[3.3873945E-1]".
     */
    [[nodiscard]] static std::optional<double> ParseBaseScore(const nlohmann::json& value);
};

}  // namespace Model
}  // namespace PhishGuard
