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
 * @file Predictor.hpp
 * @brief Probability + risk level from a feature vector.
 *
 * Level bands around the metadata's recommended threshold T:
 *   p >= T                  PHISHING
 *   T - margin <= p < T     SUSPICIOUS
 *   p < T - margin          SAFE
 */

#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "../Core/ErrorCodes.hpp"
#include "ModelLoader.hpp"
#include "TreeEnsemble.hpp"

namespace PhishGuard {
namespace Model {

inline constexpr double DEFAULT_SUSPICIOUS_MARGIN = 0.20;

enum class RiskLevel : uint8_t {
    Safe = 0,
    Suspicious,
    Phishing,
    Unknown
};

/// @brief "SAFE", "SUSPICIOUS", "PHISHING", "UNKNOWN"
[[nodiscard]] std::string_view GetRiskLevelName(RiskLevel level) noexcept;

struct PredictionResult {
    double probability = 0.0;
    double confidence = 0.0;       ///< p when level != Safe, else 1 - p
    RiskLevel level = RiskLevel::Unknown;
    double threshold = DEFAULT_RECOMMENDED_THRESHOLD;
};

class Predictor {
public:
    Predictor(std::shared_ptr<const TreeEnsembleModel> model, ModelMetadata metadata,
              double suspiciousMargin = DEFAULT_SUSPICIOUS_MARGIN);

    [[nodiscard]] std::optional<double> Predict(const std::vector<double>& features,
                                                Core::Error* err = nullptr) const;

    [[nodiscard]] std::optional<PredictionResult> PredictWithConfidence(const std::vector<double>& features,
                                                                        Core::Error* err = nullptr) const;

    /// @brief Stops at the first failing vector
    [[nodiscard]] std::optional<std::vector<double>> PredictBatch(
        const std::vector<std::vector<double>>& batch, Core::Error* err = nullptr) const;

    /// @brief Band a probability against the recommended threshold
    [[nodiscard]] RiskLevel ClassifyProbability(double probability) const noexcept;

    [[nodiscard]] double GetThreshold() const noexcept { return m_metadata.recommendedThreshold; }
    [[nodiscard]] const ModelMetadata& GetMetadata() const noexcept { return m_metadata; }
    [[nodiscard]] const TreeEnsembleModel& GetModel() const noexcept { return *m_model; }

    /// @brief Model + metadata summary
    [[nodiscard]] nlohmann::json GetInfo() const;

private:
    std::shared_ptr<const TreeEnsembleModel> m_model;
    ModelMetadata m_metadata;
    double m_suspiciousMargin;
};

}  // namespace Model
}  // namespace PhishGuard
